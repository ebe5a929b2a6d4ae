#pragma once

#include "../core/types.hpp"
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <mutex>
#include <utility>

namespace nmeabridge {
    namespace util {

        // ─── Multi-producer, single-consumer mailbox ─────────────────────────────────
        // The owning task drains it once per tick; producers never wait on the owner.
        template <typename Msg> class Mailbox {
            mutable std::mutex mtx_;
            std::condition_variable cv_;
            dp::Vector<Msg> pending_;

          public:
            void post(Msg msg) {
                {
                    std::lock_guard<std::mutex> lock(mtx_);
                    pending_.push_back(std::move(msg));
                }
                cv_.notify_one();
            }

            dp::Vector<Msg> drain() {
                std::lock_guard<std::mutex> lock(mtx_);
                dp::Vector<Msg> out = std::move(pending_);
                pending_.clear();
                return out;
            }

            // Sleeps until a message arrives or the deadline passes
            template <typename Duration> void wait_for(Duration d) {
                std::unique_lock<std::mutex> lock(mtx_);
                cv_.wait_for(lock, d, [this] { return !pending_.empty(); });
            }

            void wake() { cv_.notify_all(); }

            usize size() const {
                std::lock_guard<std::mutex> lock(mtx_);
                return pending_.size();
            }
        };

    } // namespace util
    using namespace util;
} // namespace nmeabridge
