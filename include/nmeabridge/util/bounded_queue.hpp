#pragma once

#include "../core/types.hpp"
#include <chrono>
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <mutex>

namespace nmeabridge {
    namespace util {

        enum class OverflowPolicy : u8 { DropOldest, Reject };

        enum class PushResult : u8 { Queued, DroppedOldest, Rejected, Closed };

        // ─── Bounded multi-producer queue with a blocking consumer ──────────────────
        // push() never blocks. A full queue either evicts its oldest entry or
        // rejects the new one, according to the policy. Storage is a fixed ring.
        template <typename T> class BoundedQueue {
            mutable std::mutex mtx_;
            std::condition_variable cv_;
            dp::Vector<T> ring_;
            usize head_ = 0;
            usize count_ = 0;
            usize capacity_;
            OverflowPolicy policy_;
            u64 dropped_ = 0;
            bool closed_ = false;

            // Caller holds mtx_ and count_ > 0
            T take_front() {
                T item = std::move(ring_[head_]);
                ring_[head_] = T{};
                head_ = (head_ + 1) % capacity_;
                --count_;
                return item;
            }

          public:
            explicit BoundedQueue(usize capacity, OverflowPolicy policy = OverflowPolicy::DropOldest)
                : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {
                ring_.resize(capacity_);
            }

            PushResult push(T item) {
                PushResult res = PushResult::Queued;
                {
                    std::lock_guard<std::mutex> lock(mtx_);
                    if (closed_)
                        return PushResult::Closed;
                    if (count_ >= capacity_) {
                        ++dropped_;
                        if (policy_ == OverflowPolicy::Reject)
                            return PushResult::Rejected;
                        take_front();
                        res = PushResult::DroppedOldest;
                    }
                    ring_[(head_ + count_) % capacity_] = std::move(item);
                    ++count_;
                }
                cv_.notify_one();
                return res;
            }

            // Waits up to timeout; empty optional on timeout or when closed and drained
            dp::Optional<T> pop(std::chrono::milliseconds timeout) {
                std::unique_lock<std::mutex> lock(mtx_);
                cv_.wait_for(lock, timeout, [this] { return closed_ || count_ > 0; });
                if (count_ == 0)
                    return dp::nullopt;
                return take_front();
            }

            dp::Optional<T> try_pop() {
                std::lock_guard<std::mutex> lock(mtx_);
                if (count_ == 0)
                    return dp::nullopt;
                return take_front();
            }

            void close() {
                {
                    std::lock_guard<std::mutex> lock(mtx_);
                    closed_ = true;
                }
                cv_.notify_all();
            }

            void clear() {
                std::lock_guard<std::mutex> lock(mtx_);
                while (count_ > 0)
                    take_front();
            }

            bool closed() const {
                std::lock_guard<std::mutex> lock(mtx_);
                return closed_;
            }
            usize size() const {
                std::lock_guard<std::mutex> lock(mtx_);
                return count_;
            }
            u64 dropped() const {
                std::lock_guard<std::mutex> lock(mtx_);
                return dropped_;
            }
            usize capacity() const noexcept { return capacity_; }
            OverflowPolicy policy() const noexcept { return policy_; }
        };

    } // namespace util
    using namespace util;
} // namespace nmeabridge
