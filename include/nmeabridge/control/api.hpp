#pragma once

#include "../core/error.hpp"
#include "../net/broadcast.hpp"
#include "../net/http.hpp"
#include "../net/server.hpp"
#include "../nmea/sentence.hpp"
#include "../scenario/engine.hpp"
#include "../scenario/library.hpp"
#include "../session/player.hpp"
#include "../session/recorder.hpp"
#include "command_channel.hpp"
#include "error_injector.hpp"
#include <cstring>
#include <echo/echo.hpp>
#include <functional>
#include <limits>
#include <nlohmann/json.hpp>

namespace nmeabridge::control {

    using json = nlohmann::json;

    inline u16 http_status(const Error &e) noexcept {
        switch (e.code) {
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::InvalidState:
            return 409;
        default:
            break;
        }
        return classify(e.code) == ErrorClass::Validation ? 400 : 500;
    }

    inline net::HttpResponse error_response(const Error &e) { return net::HttpResponse::error(http_status(e), e.message); }

    inline std::string str(const dp::String &s) { return std::string(s.c_str()); }

    // Everything the control API reaches; null members disable their routes
    struct ApiContext {
        scenario::ScenarioEngine *engine = nullptr;
        const scenario::ScenarioLibrary *library = nullptr;
        CommandChannel *commands = nullptr;
        ErrorInjector *faults = nullptr;
        session::SessionRecorder *recorder = nullptr;
        net::StreamServer *tcp = nullptr;
        net::StreamServer *ws = nullptr;
        net::Broadcast *broadcast = nullptr;
        BridgeMode bridge_mode = BridgeMode::Nmea0183;
        u64 started_ms = 0;
    };

    // ─── Control API ────────────────────────────────────────────────────────────
    // Route table over JSON bodies. handle() has no socket dependency so the
    // routes can be driven directly.
    class ControlApi {
        ApiContext ctx_;

        static Result<json> body_of(const net::HttpRequest &req) {
            if (req.body.empty())
                return Result<json>::ok(json::object());
            auto j = json::parse(req.body.c_str(), nullptr, false);
            if (j.is_discarded() || !j.is_object())
                return Result<json>::err(Error::invalid_argument("request body must be a JSON object"));
            return Result<json>::ok(std::move(j));
        }

        static Result<scenario::RunOptions> run_options(const json &b) {
            scenario::RunOptions opts;
            if (b.contains("loop")) {
                if (!b["loop"].is_boolean())
                    return Result<scenario::RunOptions>::err(Error::invalid_argument("loop must be a boolean"));
                opts.loop = b["loop"].get<bool>();
            }
            if (b.contains("speed")) {
                if (!b["speed"].is_number())
                    return Result<scenario::RunOptions>::err(Error::invalid_argument("speed must be a number"));
                opts.speed = b["speed"].get<f64>();
            }
            return Result<scenario::RunOptions>::ok(opts);
        }

        // Runs fn on the engine task and waits for its Result<void>
        template <typename Fn> Result<void> on_engine(Fn fn) {
            auto fut = ctx_.engine->call(std::move(fn));
            if (fut.wait_for(std::chrono::seconds(5)) != std::future_status::ready)
                return Result<void>::err(Error::timeout("engine did not respond"));
            return fut.get();
        }

        u64 uptime_ms() const { return monotonic_ms() - ctx_.started_ms; }

        json connections_json() const {
            return {{"tcp", ctx_.tcp ? ctx_.tcp->connection_count() : 0},
                    {"ws", ctx_.ws ? ctx_.ws->connection_count() : 0}};
        }

        static json autopilot_json(const AutopilotCommandState &ap) {
            return {{"mode", to_string(ap.mode)},
                    {"engaged", ap.engaged()},
                    {"targetHeading", ap.target_heading_deg},
                    {"acceptedCommands", ap.accepted_commands},
                    {"rejectedCommands", ap.rejected_commands}};
        }

        json status_json() const {
            auto st = ctx_.engine->status();
            json j = {{"scenario", st.source_name.empty() ? json(nullptr) : json(str(st.source_name))},
                      {"source", str(st.source_kind)},
                      {"state", scenario::to_string(st.state)},
                      {"virtualMs", st.virtual_ms},
                      {"durationMs", st.duration_ms},
                      {"loopCount", st.loop_count},
                      {"loop", st.loop},
                      {"speed", st.speed},
                      {"bridgeMode", to_string(ctx_.bridge_mode)},
                      {"ticks", st.ticks},
                      {"packets", st.packets},
                      {"autopilot", autopilot_json(st.autopilot)},
                      {"connections", connections_json()}};
            j["lastCheckpoint"] = st.last_checkpoint ? json(str(*st.last_checkpoint)) : json(nullptr);
            if (!st.last_error.empty())
                j["lastError"] = str(st.last_error);
            j["lastBroadcastMs"] = {{"tcp", ctx_.tcp ? ctx_.tcp->last_broadcast_ms() : 0},
                                    {"ws", ctx_.ws ? ctx_.ws->last_broadcast_ms() : 0}};
            return j;
        }

        static json connection_json(const net::ConnectionInfo &c) {
            return {{"id", c.id},
                    {"kind", net::to_string(c.kind)},
                    {"address", str(c.address)},
                    {"connectedAt", c.connected_at_ms},
                    {"lastActivity", c.last_activity_ms},
                    {"commandMode", c.command_mode},
                    {"format", str(c.format)},
                    {"sent", c.sent},
                    {"queued", c.queued},
                    {"dropped", c.dropped}};
        }

        // ─── Handlers ───────────────────────────────────────────────────────────
        net::HttpResponse health() const {
            return net::HttpResponse::json(
                200, json{{"status", "ok"}, {"uptimeMs", uptime_ms()}, {"connections", connections_json()}});
        }

        net::HttpResponse start_scenario(const json &b) {
            if (!b.contains("name") || !b["name"].is_string() || b["name"].get<std::string>().empty())
                return net::HttpResponse::error(400, "scenario name is required");
            auto opts = run_options(b);
            if (opts.is_err())
                return error_response(opts.error());
            dp::String name(b["name"].get<std::string>());
            auto o = opts.value();
            auto r = on_engine([name, o](scenario::ScenarioEngine &e) { return e.load(name, o); });
            if (r.is_err())
                return error_response(r.error());
            echo::category("nmeabridge.api").info("scenario ", name, " started");
            json j = status_json();
            j["status"] = "started";
            return net::HttpResponse::json(200, j);
        }

        // The name in the path must match the active source, when one is running
        net::HttpResponse scenario_action(const dp::String &name, const dp::String &action, const json &b) {
            auto st = ctx_.engine->status();
            bool active = st.state == scenario::EngineState::Running || st.state == scenario::EngineState::Looping ||
                          st.state == scenario::EngineState::Paused;
            if (active && name != "current" && name != st.source_name)
                return net::HttpResponse::error(404, "scenario '" + name + "' is not active");

            std::function<Result<void>(scenario::ScenarioEngine &)> op;
            if (action == "stop") {
                op = [](scenario::ScenarioEngine &e) { return e.stop(); };
            } else if (action == "pause") {
                op = [](scenario::ScenarioEngine &e) { return e.pause(); };
            } else if (action == "resume") {
                op = [](scenario::ScenarioEngine &e) { return e.resume(); };
            } else if (action == "checkpoint") {
                if (!b.contains("checkpoint") || !b["checkpoint"].is_string())
                    return net::HttpResponse::error(400, "checkpoint name is required");
                dp::String cp(b["checkpoint"].get<std::string>());
                op = [cp](scenario::ScenarioEngine &e) { return e.seek(cp); };
            } else {
                return net::HttpResponse::error(404, "unknown scenario action '" + action + "'");
            }
            auto r = on_engine(op);
            if (r.is_err())
                return error_response(r.error());
            json j = status_json();
            j["status"] = str(action);
            return net::HttpResponse::json(200, j);
        }

        net::HttpResponse inject(const json &b) {
            dp::String sentence;
            for (const char *field : {"sentence", "data"}) {
                if (b.contains(field) && b[field].is_string()) {
                    sentence = dp::String(b[field].get<std::string>());
                    break;
                }
            }
            sentence = nmea::strip_line_end(net::trim(sentence));
            if (sentence.empty())
                return net::HttpResponse::error(400, "NMEA sentence is required (sentence or data)");
            auto v = nmea::validate(sentence);
            if (v.is_err())
                return error_response(v.error());
            auto packet = make_packet(Packet::text(sentence + "\r\n"));
            auto r = on_engine([packet](scenario::ScenarioEngine &e) -> Result<void> {
                e.inject(packet);
                return {};
            });
            if (r.is_err())
                return error_response(r.error());
            echo::category("nmeabridge.api").info("injected ", nmea::sentence_type(sentence));
            return net::HttpResponse::json(200, json{{"success", true}, {"sentence", str(sentence)}});
        }

        static dp::Optional<u32> u32_field(const json &v) {
            if (!v.is_number_unsigned() || v.get<u64>() > std::numeric_limits<u32>::max())
                return dp::nullopt;
            return static_cast<u32>(v.get<u64>());
        }

        net::HttpResponse simulate_error(const json &b) {
            if (!ctx_.faults)
                return net::HttpResponse::error(409, "error simulation unavailable");
            if (!b.contains("type") || !b["type"].is_string())
                return net::HttpResponse::error(400, "error type is required");
            auto kind = fault_from_string(dp::String(b["type"].get<std::string>()));
            if (!kind)
                return net::HttpResponse::error(400,
                                                "invalid error type; use checksum, timeout, disconnect or high_latency");
            FaultRequest req;
            req.kind = *kind;
            if (b.contains("duration_ms")) {
                auto ms = u32_field(b["duration_ms"]);
                if (!ms)
                    return net::HttpResponse::error(400, "duration_ms must be a positive integer");
                req.duration_ms = *ms;
            }
            if (b.contains("latency_ms")) {
                auto ms = u32_field(b["latency_ms"]);
                if (!ms)
                    return net::HttpResponse::error(400, "latency_ms must be a positive integer");
                req.latency_ms = *ms;
            }
            if (b.contains("target")) {
                if (b["target"].is_string())
                    req.target = dp::String(b["target"].get<std::string>());
                else if (b["target"].is_number_unsigned())
                    req.target = dp::String(std::to_string(b["target"].get<u64>()));
                else
                    return net::HttpResponse::error(400, "target must be tcp, websocket or a connection id");
            }
            auto r = ctx_.faults->inject(req);
            if (r.is_err())
                return error_response(r.error());
            return net::HttpResponse::json(200, json{{"success", true},
                                                     {"type", to_string(r.value().kind)},
                                                     {"affected", r.value().affected},
                                                     {"durationMs", req.duration_ms},
                                                     {"untilMs", r.value().until_ms}});
        }

        net::HttpResponse clients() const {
            json list = json::array();
            for (auto *srv : {ctx_.tcp, ctx_.ws}) {
                if (!srv)
                    continue;
                for (const auto &c : srv->connection_info())
                    list.push_back(connection_json(c));
            }
            return net::HttpResponse::json(200, json{{"clients", list}, {"count", list.size()}});
        }

        static json recorder_json(const session::RecorderStatus &s) {
            return {{"recording", s.recording}, {"path", str(s.path)},       {"entries", s.entries},
                    {"bytesWritten", s.bytes_written}, {"startedAt", s.started_at_ms}, {"elapsedMs", s.elapsed_ms}};
        }

        net::HttpResponse session_route(const dp::String &action, const json &b) {
            if (!ctx_.recorder)
                return net::HttpResponse::error(409, "session recording unavailable");
            if (action == "status")
                return net::HttpResponse::json(200, recorder_json(ctx_.recorder->status()));
            if (action == "start") {
                dp::Optional<dp::String> path;
                if (b.contains("path")) {
                    if (!b["path"].is_string())
                        return net::HttpResponse::error(400, "path must be a string");
                    path = dp::String(b["path"].get<std::string>());
                }
                auto r = ctx_.recorder->start(path, to_string(ctx_.bridge_mode));
                if (r.is_err())
                    return error_response(r.error());
                return net::HttpResponse::json(200, recorder_json(ctx_.recorder->status()));
            }
            if (action == "stop") {
                auto r = ctx_.recorder->stop();
                if (r.is_err())
                    return error_response(r.error());
                return net::HttpResponse::json(200, recorder_json(ctx_.recorder->status()));
            }
            return net::HttpResponse::error(404, "unknown session action '" + action + "'");
        }

        net::HttpResponse playback(const json &b) {
            if (!b.contains("path") || !b["path"].is_string())
                return net::HttpResponse::error(400, "path is required");
            auto opts = run_options(b);
            if (opts.is_err())
                return error_response(opts.error());
            dp::String path(b["path"].get<std::string>());
            bool loop = opts.value().loop.value_or(false);

            auto data = session::read_file(path);
            if (data.is_err())
                return error_response(Error::not_found(data.error().message));
            const Bytes &bytes = data.value();
            bool binary = bytes.size() >= 4 && std::memcmp(bytes.data(), session::RECORDING_MAGIC, 4) == 0;

            std::shared_ptr<std::unique_ptr<scenario::FrameSource>> holder;
            if (binary) {
                auto rec = session::decode_recording(bytes);
                if (rec.is_err())
                    return error_response(rec.error());
                holder = std::make_shared<std::unique_ptr<scenario::FrameSource>>(
                    std::make_unique<session::ReplaySource>(path, std::move(rec.value()), loop));
            } else {
                f64 rate = 10.0;
                if (b.contains("rate")) {
                    if (!b["rate"].is_number())
                        return net::HttpResponse::error(400, "rate must be a number");
                    rate = b["rate"].get<f64>();
                }
                auto src = session::TextLogSource::parse(path, dp::String(bytes.begin(), bytes.end()), rate, loop);
                if (src.is_err())
                    return error_response(src.error());
                holder = std::make_shared<std::unique_ptr<scenario::FrameSource>>(std::move(src.value()));
            }
            auto o = opts.value();
            auto r = on_engine([holder, o](scenario::ScenarioEngine &e) { return e.run(std::move(*holder), o); });
            if (r.is_err())
                return error_response(r.error());
            json j = status_json();
            j["status"] = "playing";
            return net::HttpResponse::json(200, j);
        }

        net::HttpResponse metrics() const {
            auto st = ctx_.engine->status();
            json j = {{"uptimeMs", uptime_ms()},
                      {"ticks", st.ticks},
                      {"packetsGenerated", st.packets},
                      {"broadcasts", ctx_.broadcast ? ctx_.broadcast->published() : 0},
                      {"connections", connections_json()}};
            j["tcp"] = {{"accepted", ctx_.tcp ? ctx_.tcp->accepted() : 0},
                        {"refused", ctx_.tcp ? ctx_.tcp->refused() : 0},
                        {"dropped", ctx_.tcp ? ctx_.tcp->dropped() : 0}};
            j["ws"] = {{"accepted", ctx_.ws ? ctx_.ws->accepted() : 0},
                       {"refused", ctx_.ws ? ctx_.ws->refused() : 0},
                       {"dropped", ctx_.ws ? ctx_.ws->dropped() : 0}};
            if (ctx_.commands) {
                auto cs = ctx_.commands->stats();
                j["commands"] = {
                    {"received", cs.received}, {"acked", cs.acked}, {"naked", cs.naked}, {"ignored", cs.ignored}};
            }
            j["faultsInjected"] = ctx_.faults ? ctx_.faults->injected() : 0;
            if (ctx_.recorder)
                j["recorder"] = recorder_json(ctx_.recorder->status());
            return net::HttpResponse::json(200, j);
        }

        net::HttpResponse autopilot(const json &b) {
            if (!ctx_.commands)
                return net::HttpResponse::error(409, "command channel unavailable");
            if (!b.contains("command") || !b["command"].is_string())
                return net::HttpResponse::error(400, "command is required");
            auto cmd = parse_command_word(dp::String(b["command"].get<std::string>()));
            if (cmd.is_err())
                return error_response(cmd.error());
            auto outcome = ctx_.commands->submit(cmd.value());
            json j = {{"accepted", outcome.accepted}, {"autopilot", autopilot_json(ctx_.engine->status().autopilot)}};
            if (!outcome.accepted)
                j["reason"] = str(outcome.reason);
            return net::HttpResponse::json(200, j);
        }

        static dp::Vector<dp::String> segments(const dp::String &path) {
            dp::Vector<dp::String> out;
            usize pos = 0;
            while (pos < path.size()) {
                usize slash = path.find('/', pos);
                if (slash == dp::String::npos)
                    slash = path.size();
                if (slash > pos)
                    out.push_back(path.substr(pos, slash - pos));
                pos = slash + 1;
            }
            return out;
        }

      public:
        explicit ControlApi(ApiContext ctx) : ctx_(ctx) {
            if (ctx_.started_ms == 0)
                ctx_.started_ms = monotonic_ms();
        }

        net::HttpResponse handle(const net::HttpRequest &req) {
            if (!ctx_.engine)
                return net::HttpResponse::error(500, "no engine");
            auto seg = segments(req.path);
            if (seg.size() < 2 || seg[0] != "api")
                return net::HttpResponse::error(404, "not found: " + req.path);

            const bool get = req.method == "GET";
            const bool post = req.method == "POST";
            json b = json::object();
            if (post) {
                auto parsed = body_of(req);
                if (parsed.is_err())
                    return error_response(parsed.error());
                b = std::move(parsed.value());
            }
            const dp::String &r = seg[1];

            if (seg.size() == 2) {
                if (get && r == "health")
                    return health();
                if (get && r == "status")
                    return net::HttpResponse::json(200, status_json());
                if (get && r == "metrics")
                    return metrics();
                if (get && r == "scenarios") {
                    json list = ctx_.library ? ctx_.library->list() : json::array();
                    return net::HttpResponse::json(200, json{{"scenarios", list}, {"count", list.size()}});
                }
                if (post && r == "scenarios")
                    return start_scenario(b);
                if (post && r == "inject-data")
                    return inject(b);
                if (post && r == "simulate-error")
                    return simulate_error(b);
                if (post && r == "playback")
                    return playback(b);
                if (post && r == "autopilot")
                    return autopilot(b);
            } else if (seg.size() == 3) {
                if (r == "scenarios" && post && seg[2] == "start")
                    return start_scenario(b);
                if (r == "scenarios" && post && seg[2] == "stop")
                    return scenario_action("current", "stop", b);
                if (r == "clients" && get && seg[2] == "connected")
                    return clients();
                if (r == "session" && ((get && seg[2] == "status") || (post && seg[2] != "status")))
                    return session_route(seg[2], b);
            } else if (seg.size() == 4 && r == "scenarios" && post) {
                return scenario_action(seg[2], seg[3], b);
            }
            if (!get && !post)
                return net::HttpResponse::error(405, "method not allowed");
            return net::HttpResponse::error(404, "not found: " + req.method + " " + req.path);
        }
    };

} // namespace nmeabridge::control
