#pragma once

#include "../control/command.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../util/bounded_queue.hpp"
#include <cstdlib>
#include <functional>

namespace nmeabridge::app {

    enum class RunMode : u8 { Idle = 0, Live, File, Scenario, Validate, Help };

    inline const char *to_string(RunMode m) noexcept {
        switch (m) {
        case RunMode::Idle:
            return "idle";
        case RunMode::Live:
            return "live";
        case RunMode::File:
            return "file";
        case RunMode::Scenario:
            return "scenario";
        case RunMode::Validate:
            return "validate";
        case RunMode::Help:
            return "help";
        }
        return "unknown";
    }

    enum class Verbosity : u8 { Quiet = 0, Normal, Verbose };

    // ─── Bridge configuration ───────────────────────────────────────────────────
    struct BridgeConfig {
        RunMode mode = RunMode::Idle;
        dp::String scenario;
        dp::String file_path;
        dp::String live_host;
        u16 live_port = 0;
        dp::String validate_path;
        f64 rate = 10.0;
        dp::Optional<bool> loop;
        f64 speed = 1.0;

        BridgeMode bridge_mode = BridgeMode::Nmea0183;
        dp::String bind_address = "0.0.0.0";
        u16 tcp_port = DEFAULT_TCP_PORT;
        u16 ws_port = DEFAULT_WS_PORT;
        u16 api_port = DEFAULT_API_PORT;
        usize max_clients = DEFAULT_MAX_CLIENTS;
        usize queue_capacity = DEFAULT_QUEUE_CAPACITY;
        OverflowPolicy overflow = OverflowPolicy::DropOldest;
        control::CommandFormat command_format = control::CommandFormat::Any;

        dp::Vector<dp::String> scenario_dirs;
        dp::Optional<dp::String> record_path;
        u32 flush_ms = DEFAULT_FLUSH_MS;
        u64 seed = DEFAULT_SEED;
        dp::Optional<dp::String> can_interface;
        Verbosity verbosity = Verbosity::Normal;

        BridgeConfig &run_scenario(dp::String name) {
            mode = RunMode::Scenario;
            scenario = std::move(name);
            return *this;
        }
        BridgeConfig &run_file(dp::String path, f64 lines_per_s = 10.0) {
            mode = RunMode::File;
            file_path = std::move(path);
            rate = lines_per_s;
            return *this;
        }
        BridgeConfig &run_live(dp::String host, u16 port) {
            mode = RunMode::Live;
            live_host = std::move(host);
            live_port = port;
            return *this;
        }
        BridgeConfig &looping(bool l = true) {
            loop = l;
            return *this;
        }
        BridgeConfig &at_speed(f64 s) {
            speed = s;
            return *this;
        }
        BridgeConfig &protocol(BridgeMode m) {
            bridge_mode = m;
            return *this;
        }
        BridgeConfig &bind(dp::String addr) {
            bind_address = std::move(addr);
            return *this;
        }
        BridgeConfig &ports(u16 tcp, u16 ws, u16 api) {
            tcp_port = tcp;
            ws_port = ws;
            api_port = api;
            return *this;
        }
        BridgeConfig &clients(usize n) {
            max_clients = n;
            return *this;
        }
        BridgeConfig &backpressure(OverflowPolicy p) {
            overflow = p;
            return *this;
        }
        BridgeConfig &commands(control::CommandFormat f) {
            command_format = f;
            return *this;
        }
        BridgeConfig &scenario_dir(dp::String dir) {
            scenario_dirs.push_back(std::move(dir));
            return *this;
        }
        BridgeConfig &record_to(dp::String path) {
            record_path = std::move(path);
            return *this;
        }
        BridgeConfig &session_seed(u64 s) {
            seed = s;
            return *this;
        }
        BridgeConfig &mirror_can(dp::String iface) {
            can_interface = std::move(iface);
            return *this;
        }
    };

    inline const char *USAGE = R"(usage:
  bridge --scenario <name> [--loop] [--speed=<n>]
  bridge --file <path> [--rate=<n>] [--loop] [--speed=<n>]
  bridge --live <host> <port>
  bridge --validate <path>
  bridge                      (idle; load scenarios through the control API)

options:
  --bridge-mode=<nmea0183|nmea2000|hybrid>   output protocol (default nmea0183)
  --tcp-port=<n> --ws-port=<n> --api-port=<n> listener ports (2000, 8080, 9090)
  --bind=<addr>                               listen address (0.0.0.0)
  --max-clients=<n>                           per server (50)
  --backpressure=<drop-oldest|disconnect>     full client queue policy
  --command-format=<v1|legacy|any>            accepted autopilot command frames
  --scenario-dir=<dir>                        scenario search path, repeatable
  --record=<path>                             record the session from startup
  --seed=<n>                                  generator seed
  --can=<iface>                               mirror NMEA 2000 frames to SocketCAN
  -v, --verbose                               periodic traffic summary
  -q, --quiet                                 no banner
  -h, --help

environment: NMEABRIDGE_TCP_PORT, NMEABRIDGE_WS_PORT, NMEABRIDGE_API_PORT
)";

    namespace detail {
        inline Result<u64> parse_uint(const dp::String &opt, const dp::String &v, u64 max) {
            if (v.empty())
                return Result<u64>::err(Error::invalid_argument(opt + " needs a value"));
            char *end = nullptr;
            unsigned long long n = std::strtoull(v.c_str(), &end, 10);
            if (*end != '\0' || v[0] == '-' || n > max)
                return Result<u64>::err(Error::invalid_argument("invalid value for " + opt + ": " + v));
            return Result<u64>::ok(static_cast<u64>(n));
        }

        inline Result<f64> parse_positive(const dp::String &opt, const dp::String &v) {
            char *end = nullptr;
            f64 n = std::strtod(v.c_str(), &end);
            if (v.empty() || *end != '\0' || !(n > 0.0))
                return Result<f64>::err(Error::invalid_argument("invalid value for " + opt + ": " + v));
            return Result<f64>::ok(n);
        }

        inline Result<u16> parse_port(const dp::String &opt, const dp::String &v) {
            auto n = parse_uint(opt, v, 65535);
            if (n.is_err())
                return Result<u16>::err(n.error());
            return Result<u16>::ok(static_cast<u16>(n.value()));
        }
    } // namespace detail

    using EnvLookup = std::function<const char *(const char *)>;

    // Defaults, then environment, then the command line
    inline Result<BridgeConfig> parse_args(int argc, const char *const argv[],
                                           const EnvLookup &env = [](const char *k) { return std::getenv(k); }) {
        using R = Result<BridgeConfig>;
        BridgeConfig cfg;

        struct EnvPort {
            const char *name;
            u16 *target;
        };
        for (auto [name, target] : {EnvPort{"NMEABRIDGE_TCP_PORT", &cfg.tcp_port},
                                    EnvPort{"NMEABRIDGE_WS_PORT", &cfg.ws_port},
                                    EnvPort{"NMEABRIDGE_API_PORT", &cfg.api_port}}) {
            const char *v = env ? env(name) : nullptr;
            if (!v || !*v)
                continue;
            auto p = detail::parse_port(name, v);
            if (p.is_err())
                return R::err(p.error());
            *target = p.value();
        }

        dp::Vector<dp::String> args;
        for (int i = 1; i < argc; ++i)
            args.push_back(argv[i]);

        bool mode_set = false;
        auto set_mode = [&](RunMode m) -> Result<void> {
            if (mode_set)
                return Result<void>::err(Error::invalid_argument("only one of --scenario, --file, --live, --validate"));
            mode_set = true;
            cfg.mode = m;
            return {};
        };

        for (usize i = 0; i < args.size(); ++i) {
            dp::String arg = args[i];
            dp::String key = arg;
            dp::Optional<dp::String> inline_value;
            usize eq = arg.find('=');
            if (arg.rfind("--", 0) == 0 && eq != dp::String::npos) {
                key = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }
            // --opt=value or --opt value
            auto value = [&]() -> Result<dp::String> {
                if (inline_value)
                    return Result<dp::String>::ok(*inline_value);
                if (i + 1 >= args.size() || args[i + 1].rfind("--", 0) == 0)
                    return Result<dp::String>::err(Error::invalid_argument(key + " needs a value"));
                return Result<dp::String>::ok(args[++i]);
            };

            if (key == "-h" || key == "--help") {
                cfg.mode = RunMode::Help;
                return R::ok(cfg);
            } else if (key == "-v" || key == "--verbose") {
                cfg.verbosity = Verbosity::Verbose;
            } else if (key == "-q" || key == "--quiet") {
                cfg.verbosity = Verbosity::Quiet;
            } else if (key == "--loop") {
                cfg.loop = true;
            } else if (key == "--scenario") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                auto m = set_mode(RunMode::Scenario);
                if (m.is_err())
                    return R::err(m.error());
                cfg.scenario = v.value();
            } else if (key == "--file") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                auto m = set_mode(RunMode::File);
                if (m.is_err())
                    return R::err(m.error());
                cfg.file_path = v.value();
            } else if (key == "--validate") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                auto m = set_mode(RunMode::Validate);
                if (m.is_err())
                    return R::err(m.error());
                cfg.validate_path = v.value();
            } else if (key == "--live") {
                if (i + 2 >= args.size())
                    return R::err(Error::invalid_argument("--live needs <host> <port>"));
                auto m = set_mode(RunMode::Live);
                if (m.is_err())
                    return R::err(m.error());
                cfg.live_host = args[++i];
                auto p = detail::parse_port("--live port", args[++i]);
                if (p.is_err())
                    return R::err(p.error());
                if (p.value() == 0)
                    return R::err(Error::invalid_argument("--live port must be non-zero"));
                cfg.live_port = p.value();
            } else if (key == "--rate" || key == "--speed") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                auto n = detail::parse_positive(key, v.value());
                if (n.is_err())
                    return R::err(n.error());
                (key == "--rate" ? cfg.rate : cfg.speed) = n.value();
            } else if (key == "--bridge-mode") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                auto m = bridge_mode_from_string(v.value());
                if (!m)
                    return R::err(Error::invalid_argument("unknown bridge mode: " + v.value()));
                cfg.bridge_mode = *m;
            } else if (key == "--tcp-port" || key == "--ws-port" || key == "--api-port") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                auto p = detail::parse_port(key, v.value());
                if (p.is_err())
                    return R::err(p.error());
                (key == "--tcp-port" ? cfg.tcp_port : key == "--ws-port" ? cfg.ws_port : cfg.api_port) = p.value();
            } else if (key == "--bind") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                cfg.bind_address = v.value();
            } else if (key == "--max-clients") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                auto n = detail::parse_uint(key, v.value(), 100000);
                if (n.is_err())
                    return R::err(n.error());
                if (n.value() == 0)
                    return R::err(Error::invalid_argument("--max-clients must be positive"));
                cfg.max_clients = static_cast<usize>(n.value());
            } else if (key == "--backpressure") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                if (v.value() == "drop-oldest")
                    cfg.overflow = OverflowPolicy::DropOldest;
                else if (v.value() == "disconnect")
                    cfg.overflow = OverflowPolicy::Reject;
                else
                    return R::err(Error::invalid_argument("unknown backpressure policy: " + v.value()));
            } else if (key == "--command-format") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                auto f = control::command_format_from_string(v.value());
                if (!f)
                    return R::err(Error::invalid_argument("unknown command format: " + v.value()));
                cfg.command_format = *f;
            } else if (key == "--scenario-dir") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                cfg.scenario_dirs.push_back(v.value());
            } else if (key == "--record") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                cfg.record_path = v.value();
            } else if (key == "--seed") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                auto n = detail::parse_uint(key, v.value(), ~0ULL);
                if (n.is_err())
                    return R::err(n.error());
                cfg.seed = n.value();
            } else if (key == "--can") {
                auto v = value();
                if (v.is_err())
                    return R::err(v.error());
                cfg.can_interface = v.value();
            } else {
                return R::err(Error::invalid_argument("unknown option: " + arg));
            }
        }
        return R::ok(cfg);
    }

} // namespace nmeabridge::app
