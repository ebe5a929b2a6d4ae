#pragma once

#include "../nmea/sentence.hpp"
#include "autopilot.hpp"
#include <cmath>
#include <cstdlib>
#include <limits>
#include <datapod/datapod.hpp>

namespace nmeabridge::control {

    // ─── Command frame formats ──────────────────────────────────────────────────
    // v1:     $PNBAP,1,<seq>,MODE,<mode>*hh | HDG,<deg> | ADJ,<+/-deg> | DISENGAGE
    // legacy: $PCDIN,01F112,...*hh toggles engagement, $PCDIN,01F113,...*hh adds 1 degree
    // Replies: $PNBAK,<version>,<seq>,ACK*hh or $PNBAK,<version>,<seq>,NAK,<reason>*hh
    enum class CommandFormat : u8 { V1, Legacy, Any };

    inline const char *to_string(CommandFormat f) noexcept {
        switch (f) {
        case CommandFormat::V1:
            return "v1";
        case CommandFormat::Legacy:
            return "legacy";
        case CommandFormat::Any:
            return "any";
        }
        return "unknown";
    }

    inline dp::Optional<CommandFormat> command_format_from_string(const dp::String &s) {
        if (s == "v1")
            return CommandFormat::V1;
        if (s == "legacy")
            return CommandFormat::Legacy;
        if (s == "any")
            return CommandFormat::Any;
        return dp::nullopt;
    }

    inline constexpr const char *COMMAND_TAG = "PNBAP";
    inline constexpr const char *REPLY_TAG = "PNBAK";
    inline constexpr const char *LEGACY_TAG = "PCDIN";
    inline constexpr const char *LEGACY_TOGGLE_PGN = "01F112";
    inline constexpr const char *LEGACY_ADJUST_PGN = "01F113";

    struct CommandFrame {
        u8 version = 1;
        u32 seq = 0;
        dp::Optional<AutopilotCommand> command;
        dp::String error;

        bool ok() const noexcept { return command.has_value(); }

        static CommandFrame fail(u8 version, u32 seq, dp::String why) {
            CommandFrame f;
            f.version = version;
            f.seq = seq;
            f.error = std::move(why);
            return f;
        }
    };

    // Strict decimal number, optional sign
    inline dp::Optional<f64> parse_number(const dp::String &s) {
        if (s.empty())
            return dp::nullopt;
        char *end = nullptr;
        f64 v = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0' || !std::isfinite(v))
            return dp::nullopt;
        return v;
    }

    // Whole number in u32 range; checked before any conversion
    inline dp::Optional<u32> parse_seq(const dp::String &s) {
        auto n = parse_number(s);
        if (!n || *n < 0.0 || *n > static_cast<f64>(std::numeric_limits<u32>::max()) || std::floor(*n) != *n)
            return dp::nullopt;
        return static_cast<u32>(*n);
    }

    inline bool is_command_line(const dp::String &line) {
        dp::String s = nmea::strip_line_end(line);
        return s.rfind(dp::String("$") + COMMAND_TAG, 0) == 0 || s.rfind(dp::String("$") + LEGACY_TAG, 0) == 0;
    }

    inline CommandFrame decode_legacy(const dp::Vector<dp::String> &fields) {
        if (fields.size() < 2)
            return CommandFrame::fail(0, 0, "malformed command");
        if (fields[1] == LEGACY_TOGGLE_PGN) {
            CommandFrame f;
            f.version = 0;
            f.command = AutopilotCommand::toggle();
            return f;
        }
        if (fields[1] == LEGACY_ADJUST_PGN) {
            CommandFrame f;
            f.version = 0;
            f.command = AutopilotCommand::adjust(1.0);
            return f;
        }
        return CommandFrame::fail(0, 0, "unknown command");
    }

    inline CommandFrame decode_v1(const dp::Vector<dp::String> &fields) {
        if (fields.size() < 4)
            return CommandFrame::fail(1, 0, "malformed command");
        auto seq_num = parse_seq(fields[2]);
        if (!seq_num)
            return CommandFrame::fail(1, 0, "malformed command");
        u32 seq = *seq_num;
        if (fields[1] != "1")
            return CommandFrame::fail(1, seq, "unsupported version");

        const dp::String &verb = fields[3];
        CommandFrame f;
        f.version = 1;
        f.seq = seq;
        if (verb == "MODE") {
            if (fields.size() != 5)
                return CommandFrame::fail(1, seq, "malformed command");
            auto mode = autopilot_mode_from_string(fields[4]);
            if (!mode)
                return CommandFrame::fail(1, seq, "unknown mode");
            f.command = AutopilotCommand::set_mode(*mode);
        } else if (verb == "HDG") {
            if (fields.size() != 5)
                return CommandFrame::fail(1, seq, "malformed command");
            auto deg = parse_number(fields[4]);
            if (!deg)
                return CommandFrame::fail(1, seq, "malformed command");
            if (*deg < 0.0 || *deg >= 360.0)
                return CommandFrame::fail(1, seq, "heading out of range");
            f.command = AutopilotCommand::set_heading(*deg);
        } else if (verb == "ADJ") {
            if (fields.size() != 5)
                return CommandFrame::fail(1, seq, "malformed command");
            auto delta = parse_number(fields[4]);
            if (!delta)
                return CommandFrame::fail(1, seq, "malformed command");
            if (*delta < -180.0 || *delta > 180.0)
                return CommandFrame::fail(1, seq, "heading out of range");
            f.command = AutopilotCommand::adjust(*delta);
        } else if (verb == "DISENGAGE") {
            if (fields.size() != 4)
                return CommandFrame::fail(1, seq, "malformed command");
            f.command = AutopilotCommand::disengage();
        } else {
            return CommandFrame::fail(1, seq, "unknown command");
        }
        return f;
    }

    // ─── Decode one command line ────────────────────────────────────────────────
    inline CommandFrame decode_command(const dp::String &line, CommandFormat format = CommandFormat::Any) {
        dp::String s = nmea::strip_line_end(line);
        bool legacy = s.rfind(dp::String("$") + LEGACY_TAG, 0) == 0;
        bool v1 = s.rfind(dp::String("$") + COMMAND_TAG, 0) == 0;
        u8 version = legacy ? 0 : 1;

        if (!legacy && !v1)
            return CommandFrame::fail(1, 0, "malformed command");
        if ((legacy && format == CommandFormat::V1) || (v1 && format == CommandFormat::Legacy))
            return CommandFrame::fail(version, 0, "unsupported version");

        auto valid = nmea::validate(s);
        if (valid.is_err()) {
            bool cs = valid.error().message.find("checksum mismatch") != dp::String::npos;
            // Sequence number is still echoed when the frame is otherwise readable
            u32 seq = 0;
            if (v1) {
                auto fields = nmea::split_fields(s);
                if (fields.size() > 2) {
                    seq = parse_seq(fields[2]).value_or(0);
                }
            }
            return CommandFrame::fail(version, seq, cs ? "checksum mismatch" : "malformed command");
        }

        auto fields = nmea::split_fields(s);
        return legacy ? decode_legacy(fields) : decode_v1(fields);
    }

    // ─── Encoding ───────────────────────────────────────────────────────────────
    inline dp::String encode_reply(u8 version, u32 seq, const CommandOutcome &outcome) {
        dp::String body = dp::String(REPLY_TAG) + "," + dp::String(std::to_string(version)) + "," +
                          dp::String(std::to_string(seq));
        if (outcome.accepted) {
            body += ",ACK";
        } else {
            dp::String reason;
            // Reasons travel inside a sentence field
            for (char c : outcome.reason)
                reason += (c == ',' || c == '*' || c == '$') ? ' ' : c;
            body += ",NAK," + reason;
        }
        return nmea::build(body);
    }

    // Toggle exists only in the legacy encapsulation
    inline dp::String encode_command(u32 seq, const AutopilotCommand &cmd) {
        if (cmd.kind == CommandKind::ToggleEngage)
            return nmea::build(dp::String(LEGACY_TAG) + "," + LEGACY_TOGGLE_PGN);
        dp::String body = dp::String(COMMAND_TAG) + ",1," + dp::String(std::to_string(seq)) + ",";
        switch (cmd.kind) {
        case CommandKind::SetMode:
            body += "MODE," + dp::String(to_string(cmd.mode));
            break;
        case CommandKind::SetHeading:
            body += "HDG," + nmea::fixed(cmd.value, 1);
            break;
        case CommandKind::AdjustHeading:
            body += "ADJ," + dp::String(cmd.value >= 0.0 ? "+" : "") + nmea::fixed(cmd.value, 1);
            break;
        case CommandKind::Disengage:
        case CommandKind::ToggleEngage:
            body += "DISENGAGE";
            break;
        }
        return nmea::build(body);
    }

    // ─── Free-form command words (JSON clients, control API) ────────────────────
    // "auto"/"engage", "standby"/"disengage", "off", "wind", "track",
    // "+N"/"-N" adjust, "heading N" or a bare number sets the target.
    inline Result<AutopilotCommand> parse_command_word(const dp::String &word) {
        dp::String w;
        for (char c : word)
            w += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        while (!w.empty() && w.back() == ' ')
            w.pop_back();

        if (w == "engage" || w == "auto")
            return Result<AutopilotCommand>::ok(AutopilotCommand::set_mode(AutopilotMode::Auto));
        if (w == "disengage" || w == "standby")
            return Result<AutopilotCommand>::ok(AutopilotCommand::disengage());
        if (auto m = autopilot_mode_from_string(w))
            return Result<AutopilotCommand>::ok(AutopilotCommand::set_mode(*m));
        if (!w.empty() && (w[0] == '+' || w[0] == '-')) {
            auto d = parse_number(w);
            if (!d)
                return Result<AutopilotCommand>::err(Error::invalid_command("malformed command"));
            return Result<AutopilotCommand>::ok(AutopilotCommand::adjust(*d));
        }
        dp::String num = w;
        if (w.rfind("heading", 0) == 0) {
            num = w.substr(7);
            while (!num.empty() && (num[0] == ' ' || num[0] == ':'))
                num.erase(0, 1);
        }
        auto h = parse_number(num);
        if (!h)
            return Result<AutopilotCommand>::err(Error::invalid_command("unknown command"));
        if (*h < 0.0 || *h >= 360.0)
            return Result<AutopilotCommand>::err(Error::invalid_command("heading out of range"));
        return Result<AutopilotCommand>::ok(AutopilotCommand::set_heading(*h));
    }

} // namespace nmeabridge::control
