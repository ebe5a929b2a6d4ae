#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>
#include <utility>

namespace nmeabridge {
    namespace util {

        // ─── Listener token for unsubscription ────────────────────────────────────────
        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Type-safe event dispatcher ──────────────────────────────────────────────
        // Listeners removed while the event is dispatching are dropped after the
        // dispatch completes. Not thread-safe: an Event belongs to the task that emits it.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = 0;
                std::function<void(Args...)> fn;
                bool once = false;
                bool pending_remove = false;
            };

            dp::Vector<Listener> listeners_;
            ListenerToken next_token_ = 1;
            bool dispatching_ = false;

          public:
            ListenerToken subscribe(std::function<void(Args...)> fn) {
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn), false, false});
                return token;
            }

            // Listener is removed after its first invocation
            ListenerToken subscribe_once(std::function<void(Args...)> fn) {
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn), true, false});
                return token;
            }

            bool unsubscribe(ListenerToken token) {
                for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
                    if (it->token == token && !it->pending_remove) {
                        if (dispatching_) {
                            it->pending_remove = true;
                        } else {
                            listeners_.erase(it);
                        }
                        return true;
                    }
                }
                return false;
            }

            // Returns the number of listeners invoked
            usize emit(Args... args) {
                dispatching_ = true;
                usize invoked = 0;
                // Index loop: listeners may subscribe during dispatch
                for (usize i = 0; i < listeners_.size(); ++i) {
                    if (listeners_[i].pending_remove || !listeners_[i].fn)
                        continue;
                    if (listeners_[i].once)
                        listeners_[i].pending_remove = true;
                    auto fn = listeners_[i].fn;
                    fn(args...);
                    ++invoked;
                }
                dispatching_ = false;

                for (auto it = listeners_.begin(); it != listeners_.end();) {
                    if (it->pending_remove) {
                        it = listeners_.erase(it);
                    } else {
                        ++it;
                    }
                }
                return invoked;
            }

            usize count() const noexcept {
                usize active = 0;
                for (const auto &l : listeners_) {
                    if (!l.pending_remove)
                        active++;
                }
                return active;
            }

            void clear() { listeners_.clear(); }

            ListenerToken operator+=(std::function<void(Args...)> fn) { return subscribe(std::move(fn)); }
        };

    } // namespace util
    using namespace util;
} // namespace nmeabridge
