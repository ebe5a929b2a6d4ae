#pragma once

#include "../core/types.hpp"
#include <chrono>

namespace nmeabridge {
    namespace util {

        // ─── Periodic timer driven by elapsed time ──────────────────────────────────
        // update() reports how many intervals expired, so a large step that covers
        // several periods is not collapsed into one firing.
        class Timer {
            u32 interval_ms_ = 0;
            u64 elapsed_ms_ = 0;
            bool running_ = false;

          public:
            Timer() = default;
            explicit Timer(u32 interval_ms) : interval_ms_(interval_ms) {}

            // Hz to period; 0 Hz means never fire
            static Timer from_rate(f64 hz) {
                if (hz <= 0.0)
                    return Timer(0);
                u32 ms = static_cast<u32>(1000.0 / hz + 0.5);
                return Timer(ms == 0 ? 1 : ms);
            }

            void set_interval(u32 ms) noexcept { interval_ms_ = ms; }
            u32 interval() const noexcept { return interval_ms_; }

            void start() noexcept {
                running_ = true;
                elapsed_ms_ = 0;
            }
            void stop() noexcept { running_ = false; }
            void reset() noexcept { elapsed_ms_ = 0; }
            bool running() const noexcept { return running_; }

            u32 update(u64 delta_ms) noexcept {
                if (!running_ || interval_ms_ == 0)
                    return 0;
                elapsed_ms_ += delta_ms;
                u32 fired = static_cast<u32>(elapsed_ms_ / interval_ms_);
                elapsed_ms_ %= interval_ms_;
                return fired;
            }

            u64 elapsed() const noexcept { return elapsed_ms_; }
        };

        // ─── One-shot timeout ─────────────────────────────────────────────────────────
        class Timeout {
            u32 timeout_ms_ = 0;
            u64 elapsed_ms_ = 0;
            bool active_ = false;

          public:
            Timeout() = default;
            explicit Timeout(u32 timeout_ms) : timeout_ms_(timeout_ms) {}

            void start(u32 timeout_ms) noexcept {
                timeout_ms_ = timeout_ms;
                elapsed_ms_ = 0;
                active_ = true;
            }

            void cancel() noexcept { active_ = false; }

            // True exactly once, on the update that crosses the deadline
            bool update(u64 delta_ms) noexcept {
                if (!active_)
                    return false;
                elapsed_ms_ += delta_ms;
                if (elapsed_ms_ >= timeout_ms_) {
                    active_ = false;
                    return true;
                }
                return false;
            }

            bool active() const noexcept { return active_; }
            u32 remaining() const noexcept {
                if (!active_ || elapsed_ms_ >= timeout_ms_)
                    return 0;
                return static_cast<u32>(timeout_ms_ - elapsed_ms_);
            }
        };

        // ─── Wall clock helpers ───────────────────────────────────────────────────────
        inline u64 monotonic_ms() noexcept {
            return static_cast<u64>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now().time_since_epoch())
                                        .count());
        }

        inline u64 epoch_ms() noexcept {
            return static_cast<u64>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
        }

    } // namespace util
    using namespace util;
} // namespace nmeabridge
