#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../util/token_bucket.hpp"
#include <cctype>
#include <cmath>
#include <echo/echo.hpp>
#include <utility>

namespace nmeabridge::control {

    // ─── Autopilot modes ─────────────────────────────────────────────────────────
    enum class AutopilotMode : u8 { Off = 0, Standby, Auto, Wind, Track };

    inline const char *to_string(AutopilotMode m) noexcept {
        switch (m) {
        case AutopilotMode::Off:
            return "off";
        case AutopilotMode::Standby:
            return "standby";
        case AutopilotMode::Auto:
            return "auto";
        case AutopilotMode::Wind:
            return "wind";
        case AutopilotMode::Track:
            return "track";
        }
        return "unknown";
    }

    inline dp::Optional<AutopilotMode> autopilot_mode_from_string(const dp::String &s) {
        dp::String lower;
        for (char c : s)
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lower == "off")
            return AutopilotMode::Off;
        if (lower == "standby")
            return AutopilotMode::Standby;
        if (lower == "auto")
            return AutopilotMode::Auto;
        if (lower == "wind")
            return AutopilotMode::Wind;
        if (lower == "track")
            return AutopilotMode::Track;
        return dp::nullopt;
    }

    inline bool is_engaged(AutopilotMode m) noexcept {
        return m == AutopilotMode::Auto || m == AutopilotMode::Wind || m == AutopilotMode::Track;
    }

    // ─── Autopilot command state ─────────────────────────────────────────────────
    struct AutopilotCommandState {
        AutopilotMode mode = AutopilotMode::Standby;
        f64 target_heading_deg = 0.0;
        u64 last_command_ms = 0;
        u64 accepted_commands = 0;
        u64 rejected_commands = 0;

        bool engaged() const noexcept { return is_engaged(mode); }
    };

    // ─── Decoded commands ────────────────────────────────────────────────────────
    enum class CommandKind : u8 { SetMode, SetHeading, AdjustHeading, Disengage, ToggleEngage };

    struct AutopilotCommand {
        CommandKind kind = CommandKind::SetMode;
        AutopilotMode mode = AutopilotMode::Standby;
        f64 value = 0.0; // heading or delta, degrees

        static AutopilotCommand set_mode(AutopilotMode m) { return {CommandKind::SetMode, m, 0.0}; }
        static AutopilotCommand set_heading(f64 deg) { return {CommandKind::SetHeading, AutopilotMode::Auto, deg}; }
        static AutopilotCommand adjust(f64 delta) { return {CommandKind::AdjustHeading, AutopilotMode::Auto, delta}; }
        static AutopilotCommand disengage() { return {CommandKind::Disengage, AutopilotMode::Standby, 0.0}; }
        static AutopilotCommand toggle() { return {CommandKind::ToggleEngage, AutopilotMode::Auto, 0.0}; }
    };

    struct CommandOutcome {
        bool accepted = false;
        dp::String reason;

        static CommandOutcome ack() { return {true, ""}; }
        static CommandOutcome nak(dp::String why) { return {false, std::move(why)}; }
    };

    inline f64 normalize_heading(f64 deg) noexcept {
        f64 r = std::fmod(deg, 360.0);
        if (r < 0.0)
            r += 360.0;
        if (r >= 360.0)
            r = 0.0;
        return r;
    }

    // ─── Autopilot controller ────────────────────────────────────────────────────
    // Single mutation point for AutopilotCommandState. Owned by the scenario
    // engine and only called from the engine task.
    class AutopilotController {
        AutopilotCommandState state_;
        TokenBucket bucket_{COMMAND_BUCKET_CAPACITY, COMMAND_REFILL_MS};

      public:
        AutopilotController() = default;
        AutopilotController(u32 burst, u32 refill_ms) : bucket_(burst, refill_ms) {}

        const AutopilotCommandState &state() const noexcept { return state_; }

        // current_heading seeds the target when engaging without one
        CommandOutcome apply(const AutopilotCommand &cmd, u64 now_ms, f64 current_heading_deg) {
            if (cmd.kind == CommandKind::SetHeading && (!std::isfinite(cmd.value) || cmd.value < 0.0 ||
                                                        cmd.value >= 360.0)) {
                state_.rejected_commands++;
                return CommandOutcome::nak("heading out of range");
            }
            if (cmd.kind == CommandKind::AdjustHeading && (!std::isfinite(cmd.value) || std::fabs(cmd.value) > 180.0)) {
                state_.rejected_commands++;
                return CommandOutcome::nak("heading out of range");
            }

            if (cmd.kind == CommandKind::Disengage) {
                state_.mode = AutopilotMode::Standby;
                state_.last_command_ms = now_ms;
                state_.accepted_commands++;
                echo::category("nmeabridge.autopilot").info("disengaged");
                return CommandOutcome::ack();
            }

            if (!bucket_.try_acquire(now_ms)) {
                state_.rejected_commands++;
                echo::category("nmeabridge.autopilot").debug("command rate limited");
                return CommandOutcome::nak("rate limited");
            }

            switch (cmd.kind) {
            case CommandKind::SetMode:
                if (is_engaged(cmd.mode) && !state_.engaged())
                    state_.target_heading_deg = normalize_heading(current_heading_deg);
                state_.mode = cmd.mode;
                break;
            case CommandKind::SetHeading:
                state_.target_heading_deg = cmd.value;
                if (!state_.engaged())
                    state_.mode = AutopilotMode::Auto;
                break;
            case CommandKind::AdjustHeading:
                if (!state_.engaged())
                    state_.target_heading_deg = normalize_heading(current_heading_deg);
                state_.target_heading_deg = normalize_heading(state_.target_heading_deg + cmd.value);
                break;
            case CommandKind::ToggleEngage:
                if (state_.engaged()) {
                    state_.mode = AutopilotMode::Standby;
                } else {
                    state_.target_heading_deg = normalize_heading(current_heading_deg);
                    state_.mode = AutopilotMode::Auto;
                }
                break;
            case CommandKind::Disengage:
                break;
            }
            state_.last_command_ms = now_ms;
            state_.accepted_commands++;
            echo::category("nmeabridge.autopilot")
                .info("mode=", to_string(state_.mode), " target=", state_.target_heading_deg);
            return CommandOutcome::ack();
        }

        // Scenario transitions bypass the limiter
        void force_mode(AutopilotMode m, f64 current_heading_deg) {
            if (is_engaged(m) && !state_.engaged())
                state_.target_heading_deg = normalize_heading(current_heading_deg);
            state_.mode = m;
        }

        void force_target(f64 heading_deg) { state_.target_heading_deg = normalize_heading(heading_deg); }

        void reset() {
            state_ = AutopilotCommandState{};
            bucket_.reset();
        }
    };

} // namespace nmeabridge::control
