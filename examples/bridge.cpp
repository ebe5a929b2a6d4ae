#include <nmeabridge.hpp>
#include <echo/echo.hpp>
#include <atomic>
#include <csignal>
#include <cstdio>

using namespace nmeabridge;

static std::atomic<bool> running{true};
void signal_handler(int) { running = false; }

static int validate(const dp::String &path) {
    auto def = scenario::load_scenario_file(path);
    if (def.is_err()) {
        echo::error("invalid: ", def.error().message);
        return 1;
    }
    const auto &d = def.value();
    echo::info("valid: ", d.name, " (", d.category, ") ", d.duration_s, "s, ", d.events.size(), " events, ",
               d.checkpoints().size(), " checkpoints");
    return 0;
}

int main(int argc, char *argv[]) {
    auto parsed = app::parse_args(argc, argv);
    if (parsed.is_err()) {
        echo::error(parsed.error().message);
        std::fputs("try 'bridge --help'\n", stderr);
        return 1;
    }
    auto cfg = std::move(parsed.value());

    if (cfg.mode == app::RunMode::Help) {
        std::fputs(app::USAGE, stdout);
        return 0;
    }
    if (cfg.mode == app::RunMode::Validate)
        return validate(cfg.validate_path);

    app::Bridge bridge(cfg);
    auto started = bridge.start();
    if (started.is_err()) {
        echo::error("startup failed: ", started.error().message);
        return app::exit_code(started.error());
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    if (cfg.verbosity != app::Verbosity::Quiet)
        echo::info("bridge running... (Ctrl+C to stop)");

    bridge.run(running);
    bridge.stop();
    return 0;
}
