#pragma once

#include "../core/error.hpp"
#include "event.hpp"
#include <initializer_list>
#include <utility>

namespace nmeabridge {
    namespace util {

        // ─── State machine with an explicit transition table ─────────────────────────
        // Transitions not listed in the table are rejected. An empty table allows
        // every transition.
        template <typename StateEnum> class StateMachine {
            StateEnum state_;
            dp::Vector<std::pair<StateEnum, StateEnum>> allowed_;

          public:
            explicit StateMachine(StateEnum initial) : state_(initial) {}
            StateMachine(StateEnum initial, std::initializer_list<std::pair<StateEnum, StateEnum>> allowed)
                : state_(initial), allowed_(allowed) {}

            StateEnum state() const noexcept { return state_; }
            bool is(StateEnum s) const noexcept { return state_ == s; }

            bool can_transition(StateEnum to) const noexcept {
                if (to == state_ || allowed_.empty())
                    return true;
                for (const auto &[from, next] : allowed_) {
                    if (from == state_ && next == to)
                        return true;
                }
                return false;
            }

            Result<void> transition(StateEnum to) {
                if (!can_transition(to)) {
                    return Result<void>::err(Error::invalid_state(
                        "illegal transition " + dp::String(std::to_string(static_cast<u32>(state_))) + " -> " +
                        dp::String(std::to_string(static_cast<u32>(to)))));
                }
                if (to != state_) {
                    StateEnum old = state_;
                    state_ = to;
                    on_transition.emit(old, to);
                }
                return {};
            }

            Event<StateEnum, StateEnum> on_transition; // (from, to)
        };

    } // namespace util
    using namespace util;
} // namespace nmeabridge
