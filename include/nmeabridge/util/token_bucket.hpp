#pragma once

#include "../core/types.hpp"

namespace nmeabridge {
    namespace util {

        // ─── Token bucket rate limiter ───────────────────────────────────────────────
        // Time is passed in by the caller so the limiter stays deterministic.
        class TokenBucket {
            u32 capacity_ = 1;
            u32 refill_ms_ = 1000; // one token per refill period
            f64 tokens_ = 1.0;
            u64 last_ms_ = 0;
            bool primed_ = false;

            void refill(u64 now_ms) noexcept {
                if (!primed_) {
                    primed_ = true;
                    last_ms_ = now_ms;
                    return;
                }
                if (now_ms <= last_ms_ || refill_ms_ == 0)
                    return;
                tokens_ += static_cast<f64>(now_ms - last_ms_) / static_cast<f64>(refill_ms_);
                if (tokens_ > capacity_)
                    tokens_ = capacity_;
                last_ms_ = now_ms;
            }

          public:
            TokenBucket() = default;
            TokenBucket(u32 capacity, u32 refill_ms)
                : capacity_(capacity), refill_ms_(refill_ms), tokens_(static_cast<f64>(capacity)) {}

            bool try_acquire(u64 now_ms) noexcept {
                refill(now_ms);
                if (tokens_ >= 1.0) {
                    tokens_ -= 1.0;
                    return true;
                }
                return false;
            }

            f64 available(u64 now_ms) noexcept {
                refill(now_ms);
                return tokens_;
            }

            void reset() noexcept {
                tokens_ = capacity_;
                primed_ = false;
            }

            u32 capacity() const noexcept { return capacity_; }
        };

    } // namespace util
    using namespace util;
} // namespace nmeabridge
