#pragma once

#include "../core/packet.hpp"
#include "../core/types.hpp"
#include "../util/timer.hpp"
#include <atomic>
#include <functional>
#include <mutex>

namespace nmeabridge::net {

    // ─── Broadcast channel ──────────────────────────────────────────────────────
    // One publisher (the engine task), many subscribers. Sinks must not block:
    // they push into a bounded per-connection queue and return.
    class Broadcast {
      public:
        using SubscriberId = u64;
        using Sink = std::function<void(const PacketPtr &)>;

      private:
        struct Subscriber {
            SubscriberId id = 0;
            Sink sink;
        };

        mutable std::mutex mtx_;
        dp::Vector<Subscriber> subscribers_;
        SubscriberId next_id_ = 1;
        std::atomic<u64> published_{0};
        std::atomic<u64> last_broadcast_ms_{0};

      public:
        SubscriberId subscribe(Sink sink) {
            std::lock_guard<std::mutex> lock(mtx_);
            SubscriberId id = next_id_++;
            subscribers_.push_back({id, std::move(sink)});
            return id;
        }

        bool unsubscribe(SubscriberId id) {
            std::lock_guard<std::mutex> lock(mtx_);
            for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
                if (it->id == id) {
                    subscribers_.erase(it);
                    return true;
                }
            }
            return false;
        }

        // Returns the number of sinks reached
        usize publish(const PacketPtr &packet) {
            std::lock_guard<std::mutex> lock(mtx_);
            for (const auto &s : subscribers_)
                s.sink(packet);
            published_++;
            last_broadcast_ms_ = epoch_ms();
            return subscribers_.size();
        }

        usize subscriber_count() const {
            std::lock_guard<std::mutex> lock(mtx_);
            return subscribers_.size();
        }
        u64 published() const noexcept { return published_; }
        u64 last_broadcast_ms() const noexcept { return last_broadcast_ms_; }
    };

} // namespace nmeabridge::net
