#pragma once

#include "../net/server.hpp"
#include "../scenario/engine.hpp"
#include "command.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <echo/echo.hpp>
#include <nlohmann/json.hpp>

namespace nmeabridge::control {

    struct CommandConfig {
        CommandFormat format = CommandFormat::Any;
        u32 apply_timeout_ms = 2000;

        CommandConfig &accept(CommandFormat f) {
            format = f;
            return *this;
        }
        CommandConfig &timeout(u32 ms) {
            apply_timeout_ms = ms;
            return *this;
        }
    };

    struct CommandStats {
        u64 received = 0;
        u64 acked = 0;
        u64 naked = 0;
        u64 ignored = 0;
    };

    // ─── Command channel ────────────────────────────────────────────────────────
    // Decoding and validation run on the caller's read task. Valid commands are
    // applied on the engine task, which owns the autopilot state and the rate
    // limiter; the outcome comes back as the reply.
    class CommandChannel {
        CommandConfig config_;
        scenario::ScenarioEngine &engine_;
        std::atomic<u64> received_{0};
        std::atomic<u64> acked_{0};
        std::atomic<u64> naked_{0};
        std::atomic<u64> ignored_{0};

        static constexpr u8 CLAIM_PENDING = 0;
        static constexpr u8 CLAIM_APPLIED = 1;
        static constexpr u8 CLAIM_WITHDRAWN = 2;

        void count(const CommandOutcome &o) {
            if (o.accepted)
                acked_++;
            else
                naked_++;
        }

      public:
        CommandChannel(scenario::ScenarioEngine &engine, CommandConfig config = {})
            : config_(config), engine_(engine) {}

        const CommandConfig &config() const noexcept { return config_; }
        void set_format(CommandFormat f) noexcept { config_.format = f; }

        CommandStats stats() const {
            return CommandStats{received_.load(), acked_.load(), naked_.load(), ignored_.load()};
        }

        // Blocks until the engine task has applied the command. A command the
        // engine has not picked up by the timeout is withdrawn and never applied;
        // one it already claimed is waited for, so the reply matches the state.
        CommandOutcome submit(const AutopilotCommand &cmd) {
            auto claim = std::make_shared<std::atomic<u8>>(CLAIM_PENDING);
            auto fut = engine_.call([cmd, claim](scenario::ScenarioEngine &e) {
                u8 expected = CLAIM_PENDING;
                if (!claim->compare_exchange_strong(expected, CLAIM_APPLIED))
                    return CommandOutcome::nak("engine busy");
                return e.apply_command(cmd);
            });
            if (fut.wait_for(std::chrono::milliseconds(config_.apply_timeout_ms)) != std::future_status::ready) {
                u8 expected = CLAIM_PENDING;
                if (claim->compare_exchange_strong(expected, CLAIM_WITHDRAWN)) {
                    echo::category("nmeabridge.command").warn("engine did not apply command in time");
                    return CommandOutcome::nak("engine busy");
                }
            }
            return fut.get();
        }

        // Reply sentence for a command frame; empty when the line is not one
        dp::Optional<dp::String> handle_frame(const dp::String &line) {
            if (!is_command_line(line)) {
                ignored_++;
                return dp::nullopt;
            }
            received_++;
            auto frame = decode_command(line, config_.format);
            CommandOutcome outcome = frame.ok() ? submit(*frame.command) : CommandOutcome::nak(frame.error);
            count(outcome);
            if (outcome.accepted) {
                echo::category("nmeabridge.command").debug("seq ", frame.seq, " accepted");
            } else {
                echo::category("nmeabridge.command").info("seq ", frame.seq, " rejected: ", outcome.reason);
            }
            return encode_reply(frame.version, frame.seq, outcome);
        }

        // JSON form used by WebSocket clients: {"type":"autopilot-command","command":"..."}
        dp::Optional<dp::String> handle_json(const dp::String &text) {
            auto j = nlohmann::json::parse(text, nullptr, false);
            if (j.is_discarded() || !j.is_object()) {
                ignored_++;
                return dp::nullopt;
            }
            if (!j.contains("type") || j["type"] != "autopilot-command") {
                ignored_++;
                return dp::nullopt;
            }
            received_++;
            nlohmann::json reply = {{"type", "autopilot-ack"}};
            if (j.contains("id"))
                reply["id"] = j["id"];

            CommandOutcome outcome;
            if (!j.contains("command") || !j["command"].is_string()) {
                outcome = CommandOutcome::nak("malformed command");
            } else {
                auto cmd = parse_command_word(dp::String(j["command"].get<std::string>()));
                outcome = cmd.is_ok() ? submit(cmd.value()) : CommandOutcome::nak(cmd.error().message);
            }
            count(outcome);
            reply["accepted"] = outcome.accepted;
            if (!outcome.accepted)
                reply["reason"] = std::string(outcome.reason.c_str());
            return dp::String(reply.dump());
        }

        // Line handler for the protocol servers
        void on_line(net::ClientConnection &conn, const dp::String &line) {
            dp::Optional<dp::String> reply;
            if (!line.empty() && line[0] == '{')
                reply = handle_json(line);
            else
                reply = handle_frame(line);
            if (!reply) {
                echo::category("nmeabridge.command").trace("client ", conn.id(), ": ignoring ", line);
                return;
            }
            if (!conn.command_mode()) {
                conn.enter_command_mode();
                echo::category("nmeabridge.command").info("client ", conn.id(), " entered command mode");
            }
            bool json = line[0] == '{';
            conn.reply(json && conn.kind() == net::ConnectionKind::Tcp ? *reply + "\r\n" : *reply);
        }

        net::LineHandler line_handler() {
            return [this](net::ClientConnection &conn, const dp::String &line) { on_line(conn, line); };
        }
    };

} // namespace nmeabridge::control
