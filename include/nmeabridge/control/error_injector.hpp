#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../net/server.hpp"
#include "../util/timer.hpp"
#include <cctype>
#include <cstdlib>
#include <echo/echo.hpp>

namespace nmeabridge::control {

    enum class FaultKind : u8 { Checksum = 0, Timeout, Disconnect, HighLatency };

    inline const char *to_string(FaultKind k) noexcept {
        switch (k) {
        case FaultKind::Checksum:
            return "checksum";
        case FaultKind::Timeout:
            return "timeout";
        case FaultKind::Disconnect:
            return "disconnect";
        case FaultKind::HighLatency:
            return "high_latency";
        }
        return "unknown";
    }

    // Accepts the older names too: connection, malformed, corrupt, delay, latency, slow
    inline dp::Optional<FaultKind> fault_from_string(const dp::String &s) {
        dp::String k;
        for (char c : s)
            k += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (k == "checksum" || k == "malformed" || k == "corrupt")
            return FaultKind::Checksum;
        if (k == "timeout" || k == "delay")
            return FaultKind::Timeout;
        if (k == "disconnect" || k == "connection")
            return FaultKind::Disconnect;
        if (k == "high_latency" || k == "latency" || k == "slow")
            return FaultKind::HighLatency;
        return dp::nullopt;
    }

    struct FaultRequest {
        FaultKind kind = FaultKind::Checksum;
        u32 duration_ms = DEFAULT_ERROR_DURATION_MS;
        u32 latency_ms = DEFAULT_FAULT_LATENCY_MS; // high_latency only
        dp::Optional<dp::String> target; // "tcp", "websocket" or a connection id
    };

    struct FaultReport {
        FaultKind kind = FaultKind::Checksum;
        usize affected = 0;
        u64 until_ms = 0;
    };

    // ─── Error injection ────────────────────────────────────────────────────────
    // Checksum corruption, output suppression and added latency are time-boxed
    // per connection; disconnect closes the chosen connections at once.
    class ErrorInjector {
        net::StreamServer *tcp_ = nullptr;
        net::StreamServer *ws_ = nullptr;
        u64 injected_ = 0;

        static dp::Optional<ConnectionId> parse_id(const dp::String &s) {
            if (s.empty())
                return dp::nullopt;
            char *end = nullptr;
            unsigned long long v = std::strtoull(s.c_str(), &end, 10);
            if (*end != '\0')
                return dp::nullopt;
            return static_cast<ConnectionId>(v);
        }

        Result<dp::Vector<net::ConnectionPtr>> select(const dp::Optional<dp::String> &target) const {
            dp::Vector<net::ConnectionPtr> out;
            auto add = [&out](net::StreamServer *srv) {
                if (!srv)
                    return;
                for (auto &c : srv->connections())
                    out.push_back(c);
            };
            if (!target || target->empty() || *target == "all") {
                add(tcp_);
                add(ws_);
            } else if (*target == "tcp") {
                add(tcp_);
            } else if (*target == "websocket" || *target == "ws") {
                add(ws_);
            } else if (auto id = parse_id(*target)) {
                for (auto *srv : {tcp_, ws_}) {
                    if (!srv)
                        continue;
                    for (auto &c : srv->connections()) {
                        if (c->id() == *id)
                            out.push_back(c);
                    }
                }
                if (out.empty())
                    return Result<dp::Vector<net::ConnectionPtr>>::err(
                        Error::not_found("connection " + *target + " not found"));
            } else {
                return Result<dp::Vector<net::ConnectionPtr>>::err(
                    Error::invalid_argument("unknown target '" + *target + "'"));
            }
            return Result<dp::Vector<net::ConnectionPtr>>::ok(std::move(out));
        }

      public:
        ErrorInjector(net::StreamServer *tcp, net::StreamServer *ws) : tcp_(tcp), ws_(ws) {}

        u64 injected() const noexcept { return injected_; }

        Result<FaultReport> inject(const FaultRequest &req) {
            if (req.duration_ms == 0 && req.kind != FaultKind::Disconnect)
                return Result<FaultReport>::err(Error::invalid_argument("duration_ms must be positive"));
            if (req.kind == FaultKind::HighLatency && (req.latency_ms == 0 || req.latency_ms > MAX_FAULT_LATENCY_MS))
                return Result<FaultReport>::err(Error::invalid_argument("latency_ms out of range"));
            auto targets = select(req.target);
            if (targets.is_err())
                return Result<FaultReport>::err(targets.error());

            FaultReport rep;
            rep.kind = req.kind;
            rep.until_ms = req.kind == FaultKind::Disconnect ? epoch_ms() : epoch_ms() + req.duration_ms;
            for (auto &c : targets.value()) {
                switch (req.kind) {
                case FaultKind::Checksum:
                    c->corrupt_checksums_until(rep.until_ms);
                    break;
                case FaultKind::Timeout:
                    c->suppress_output_until(rep.until_ms);
                    break;
                case FaultKind::Disconnect:
                    c->close();
                    break;
                case FaultKind::HighLatency:
                    c->delay_output_until(rep.until_ms, req.latency_ms);
                    break;
                }
                rep.affected++;
            }
            injected_++;
            echo::category("nmeabridge.faults")
                .warn("injected ", to_string(req.kind), " on ", rep.affected, " connection(s)",
                      req.kind == FaultKind::Disconnect ? dp::String("")
                                                        : " for " + dp::String(std::to_string(req.duration_ms)) + "ms");
            return Result<FaultReport>::ok(rep);
        }
    };

} // namespace nmeabridge::control
