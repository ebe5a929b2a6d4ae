#pragma once

#include "../control/api.hpp"
#include "../control/command_channel.hpp"
#include "../control/error_injector.hpp"
#include "../net/broadcast.hpp"
#include "../net/can_mirror.hpp"
#include "../net/http_server.hpp"
#include "../net/live_source.hpp"
#include "../net/tcp_server.hpp"
#include "../net/ws_server.hpp"
#include "../scenario/engine.hpp"
#include "../scenario/library.hpp"
#include "../session/player.hpp"
#include "../session/recorder.hpp"
#include "config.hpp"
#include <atomic>
#include <chrono>
#include <cstring>
#include <echo/echo.hpp>
#include <memory>
#include <thread>

namespace nmeabridge::app {

    // Exit status for a failed startup
    inline int exit_code(const Error &e) noexcept { return e.code == ErrorCode::BindFailed ? 2 : 1; }

    // ─── Bridge ─────────────────────────────────────────────────────────────────
    // Wires the engine to the broadcast channel, the servers to the command
    // channel and everything to the control API.
    class Bridge {
        BridgeConfig cfg_;
        scenario::ScenarioLibrary library_;
        net::Broadcast broadcast_;
        scenario::ScenarioEngine engine_;
        control::CommandChannel commands_;
        net::TcpServer tcp_;
        net::WebSocketServer ws_;
        session::SessionRecorder recorder_;
        control::ErrorInjector faults_;
        control::ControlApi api_;
        net::HttpServer http_;
        std::unique_ptr<net::CanMirror> can_;
        bool started_ = false;

        static net::ServerConfig server_config(const BridgeConfig &c, u16 port) {
            return net::ServerConfig{}
                .bind(c.bind_address)
                .listen_on(port)
                .clients(c.max_clients)
                .queue(c.queue_capacity, c.overflow);
        }

        static control::ApiContext api_context(Bridge &b) {
            control::ApiContext ctx;
            ctx.engine = &b.engine_;
            ctx.library = &b.library_;
            ctx.commands = &b.commands_;
            ctx.faults = &b.faults_;
            ctx.recorder = &b.recorder_;
            ctx.tcp = &b.tcp_;
            ctx.ws = &b.ws_;
            ctx.broadcast = &b.broadcast_;
            ctx.bridge_mode = b.cfg_.bridge_mode;
            return ctx;
        }

        Result<std::unique_ptr<scenario::FrameSource>> initial_source() {
            using R = Result<std::unique_ptr<scenario::FrameSource>>;
            switch (cfg_.mode) {
            case RunMode::Live:
                return R::ok(std::make_unique<net::LiveSource>(cfg_.live_host, cfg_.live_port));
            case RunMode::File: {
                auto data = session::read_file(cfg_.file_path);
                if (data.is_err())
                    return R::err(data.error());
                const Bytes &bytes = data.value();
                bool loop = cfg_.loop.value_or(false);
                if (bytes.size() >= 4 && std::memcmp(bytes.data(), session::RECORDING_MAGIC, 4) == 0) {
                    auto rec = session::decode_recording(bytes);
                    if (rec.is_err())
                        return R::err(rec.error());
                    return R::ok(std::make_unique<session::ReplaySource>(cfg_.file_path, std::move(rec.value()), loop));
                }
                auto src = session::TextLogSource::parse(cfg_.file_path, dp::String(bytes.begin(), bytes.end()),
                                                         cfg_.rate, loop);
                if (src.is_err())
                    return R::err(src.error());
                return R::ok(std::move(src.value()));
            }
            default:
                return R::ok(nullptr);
            }
        }

        void banner() const {
            if (cfg_.verbosity == Verbosity::Quiet)
                return;
            echo::box("NMEA BRIDGE SIMULATOR");
            echo::info("mode: ", to_string(cfg_.mode), "  protocol: ", to_string(cfg_.bridge_mode));
            echo::info("tcp://", cfg_.bind_address, ":", tcp_.port());
            echo::info("ws://", cfg_.bind_address, ":", ws_.port());
            echo::info("http://", cfg_.bind_address, ":", http_.port(), "/api/health");
            if (can_)
                echo::info("can: ", *cfg_.can_interface);
        }

        void summary() const {
            auto st = engine_.status();
            auto cs = commands_.stats();
            echo::info("[", scenario::to_string(st.state), "] t=", st.virtual_ms, "ms loops=", st.loop_count,
                       " packets=", st.packets, " clients tcp=", tcp_.connection_count(), " ws=",
                       ws_.connection_count(), " dropped=", tcp_.dropped() + ws_.dropped(), " commands ack/nak=",
                       cs.acked, "/", cs.naked);
        }

      public:
        explicit Bridge(BridgeConfig cfg)
            : cfg_(std::move(cfg)), engine_(scenario::EngineConfig{}.mode(cfg_.bridge_mode).session_seed(cfg_.seed),
                                             &library_),
              commands_(engine_, control::CommandConfig{}.accept(cfg_.command_format)),
              tcp_(server_config(cfg_, cfg_.tcp_port), broadcast_), ws_(server_config(cfg_, cfg_.ws_port), broadcast_),
              recorder_(broadcast_, session::RecorderConfig{}.flush_every(cfg_.flush_ms)), faults_(&tcp_, &ws_),
              api_(api_context(*this)), http_(cfg_.bind_address, cfg_.api_port,
                                              [this](const net::HttpRequest &req) { return api_.handle(req); }) {
            for (const auto &dir : cfg_.scenario_dirs)
                library_.add_directory(dir);
            tcp_.set_line_handler(commands_.line_handler());
            ws_.set_line_handler(commands_.line_handler());
            ws_.set_default_mode(cfg_.bridge_mode == BridgeMode::Nmea2000 ? net::ws::PayloadMode::Binary
                                                                          : net::ws::PayloadMode::Text);
            engine_.on_packet.subscribe([this](PacketPtr p) { broadcast_.publish(p); });
            engine_.on_frames.subscribe([this](const dp::Vector<nmea::Frame> &frames) {
                if (can_)
                    can_->mirror(frames);
            });
        }

        ~Bridge() { stop(); }

        Bridge(const Bridge &) = delete;
        Bridge &operator=(const Bridge &) = delete;

        scenario::ScenarioEngine &engine() noexcept { return engine_; }
        net::TcpServer &tcp() noexcept { return tcp_; }
        net::WebSocketServer &ws() noexcept { return ws_; }
        net::HttpServer &http() noexcept { return http_; }
        control::ControlApi &api() noexcept { return api_; }
        const BridgeConfig &config() const noexcept { return cfg_; }

        // Binds every listener before anything is published; no degraded start
        Result<void> start() {
            if (started_)
                return {};
            for (auto *step : {static_cast<net::StreamServer *>(&tcp_), static_cast<net::StreamServer *>(&ws_)}) {
                auto r = step->start();
                if (r.is_err()) {
                    stop();
                    return r;
                }
            }
            auto h = http_.start();
            if (h.is_err()) {
                stop();
                return h;
            }

            if (cfg_.can_interface) {
                auto c = net::CanMirror::open(*cfg_.can_interface);
                if (c.is_err()) {
                    stop();
                    return Result<void>::err(c.error());
                }
                can_ = std::move(c.value());
            }

            auto src = initial_source();
            if (src.is_err()) {
                echo::error(src.error().message);
                stop();
                return Result<void>::err(src.error());
            }
            scenario::RunOptions opts;
            opts.loop = cfg_.loop;
            opts.speed = cfg_.speed;
            if (cfg_.mode == RunMode::Scenario) {
                auto r = engine_.load(cfg_.scenario, opts);
                if (r.is_err()) {
                    stop();
                    return r;
                }
            } else if (src.value()) {
                auto r = engine_.run(std::move(src.value()), opts);
                if (r.is_err()) {
                    stop();
                    return r;
                }
            }

            if (cfg_.record_path) {
                auto r = recorder_.start(cfg_.record_path, to_string(cfg_.bridge_mode));
                if (r.is_err()) {
                    stop();
                    return Result<void>::err(r.error());
                }
            }

            engine_.start();
            started_ = true;
            banner();
            return {};
        }

        // Runs until the flag drops; the servers outlive finished scenarios
        void run(const std::atomic<bool> &running) {
            using clock = std::chrono::steady_clock;
            auto next_summary = clock::now() + std::chrono::seconds(5);
            while (running) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                if (cfg_.verbosity == Verbosity::Verbose && clock::now() >= next_summary) {
                    summary();
                    next_summary += std::chrono::seconds(5);
                }
            }
        }

        // Idempotent
        void stop() {
            http_.stop();
            engine_.shutdown();
            auto s = engine_.stop();
            if (s.is_err())
                echo::error(s.error().message);
            auto r = recorder_.stop();
            if (r.is_err())
                echo::error(r.error().message);
            ws_.stop();
            tcp_.stop();
            if (started_)
                echo::info("bridge stopped");
            started_ = false;
        }
    };

} // namespace nmeabridge::app
