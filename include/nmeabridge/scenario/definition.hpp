#pragma once

#include "../control/autopilot.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../nmea/group.hpp"
#include "../telemetry/generator.hpp"
#include "../telemetry/pattern.hpp"
#include "../telemetry/record.hpp"
#include <datapod/datapod.hpp>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

namespace nmeabridge::scenario {

    using json = nlohmann::json;

    // ─── State transitions carried by events ────────────────────────────────────
    enum class TransitionKind : u8 { EngageAutopilot, DisengageAutopilot, SetMode, SetHeading, GpsDropout, GpsRestore };

    struct Transition {
        TransitionKind kind = TransitionKind::EngageAutopilot;
        control::AutopilotMode mode = control::AutopilotMode::Auto;
        f64 value = 0.0;
    };

    struct ScenarioEvent {
        f64 at_s = 0.0;
        dp::String description;
        dp::Vector<std::pair<telemetry::ChannelKey, telemetry::PatternSpec>> patterns;
        dp::Vector<telemetry::ChannelKey> cleared;
        dp::Vector<Transition> transitions;
        dp::Optional<dp::String> checkpoint;

        VirtualMs at_ms() const noexcept { return static_cast<VirtualMs>(at_s * 1000.0 + 0.5); }
    };

    // ─── Scenario definition ────────────────────────────────────────────────────
    struct ScenarioDefinition {
        dp::String name;
        dp::String description;
        dp::String category = "custom";
        f64 duration_s = 60.0;
        bool loop = false;
        dp::Optional<u64> seed;
        u32 tick_ms = DEFAULT_TICK_MS;
        dp::Optional<BridgeMode> bridge_mode;
        dp::Vector<std::pair<nmea::Group, f64>> timing; // Hz per group; absent means every tick
        telemetry::VesselProfile vessel;
        dp::Vector<ScenarioEvent> events;

        VirtualMs duration_ms() const noexcept { return static_cast<VirtualMs>(duration_s * 1000.0 + 0.5); }

        dp::Vector<dp::String> checkpoints() const {
            dp::Vector<dp::String> out;
            for (const auto &e : events) {
                if (e.checkpoint)
                    out.push_back(*e.checkpoint);
            }
            return out;
        }

        dp::Optional<VirtualMs> checkpoint_time(const dp::String &name) const {
            for (const auto &e : events) {
                if (e.checkpoint && *e.checkpoint == name)
                    return e.at_ms();
            }
            return dp::nullopt;
        }

        Result<void> validate() const {
            if (name.empty())
                return Result<void>::err(Error::invalid_scenario("scenario name is empty"));
            if (!(duration_s > 0.0))
                return Result<void>::err(Error::invalid_scenario("duration must be positive"));
            if (tick_ms == 0)
                return Result<void>::err(Error::invalid_scenario("tick_ms must be positive"));
            if (!(vessel.origin_lat >= -90.0 && vessel.origin_lat <= 90.0) ||
                !(vessel.origin_lon >= -180.0 && vessel.origin_lon <= 180.0))
                return Result<void>::err(Error::invalid_scenario("vessel origin out of range"));
            for (const auto &[group, hz] : timing) {
                if (!(hz >= 0.0))
                    return Result<void>::err(Error::invalid_scenario(dp::String("negative rate for group ") +
                                                                     nmea::to_string(group)));
            }
            f64 prev = 0.0;
            dp::Vector<dp::String> seen;
            for (usize i = 0; i < events.size(); ++i) {
                const auto &e = events[i];
                dp::String where = "event " + dp::String(std::to_string(i));
                if (!(e.at_s >= 0.0))
                    return Result<void>::err(Error::invalid_scenario(where + ": negative trigger time"));
                if (e.at_s < prev)
                    return Result<void>::err(Error::invalid_scenario(where + ": event times must be non-decreasing"));
                if (e.at_s > duration_s)
                    return Result<void>::err(Error::invalid_scenario(where + ": trigger time beyond duration"));
                prev = e.at_s;
                for (const auto &[key, spec] : e.patterns) {
                    auto v = spec.validate();
                    if (v.is_err()) {
                        return Result<void>::err(
                            Error::invalid_pattern(where + ": " + telemetry::mnemonic(key) + ": " + v.error().message));
                    }
                }
                for (const auto &t : e.transitions) {
                    if (t.kind == TransitionKind::SetHeading && !(t.value >= 0.0 && t.value < 360.0))
                        return Result<void>::err(Error::invalid_scenario(where + ": heading out of range"));
                }
                if (e.checkpoint) {
                    for (const auto &s : seen) {
                        if (s == *e.checkpoint)
                            return Result<void>::err(
                                Error::invalid_scenario(where + ": duplicate checkpoint " + *e.checkpoint));
                    }
                    seen.push_back(*e.checkpoint);
                }
            }
            return {};
        }
    };

    // ─── JSON parsing ───────────────────────────────────────────────────────────
    namespace detail {

        inline dp::String str(const json &j) { return dp::String(j.get<std::string>()); }

        inline Result<f64> number(const json &obj, const char *field, const dp::String &where,
                                  dp::Optional<f64> fallback = dp::nullopt) {
            auto it = obj.find(field);
            if (it == obj.end()) {
                if (fallback)
                    return Result<f64>::ok(*fallback);
                return Result<f64>::err(Error::invalid_scenario(where + ": missing '" + field + "'"));
            }
            if (!it->is_number())
                return Result<f64>::err(Error::invalid_scenario(where + ": '" + field + "' must be a number"));
            return Result<f64>::ok(it->get<f64>());
        }

        inline Result<telemetry::PatternSpec> pattern(const json &j, const dp::String &where) {
            using telemetry::PatternSpec;
            if (j.is_number())
                return Result<PatternSpec>::ok(PatternSpec::constant(j.get<f64>()));
            if (!j.is_object())
                return Result<PatternSpec>::err(Error::invalid_pattern(where + ": pattern must be an object"));
            auto type_it = j.find("type");
            if (type_it == j.end() || !type_it->is_string())
                return Result<PatternSpec>::err(Error::invalid_pattern(where + ": pattern 'type' missing"));
            dp::String type = detail::str(*type_it);

            PatternSpec spec;
            if (type == "constant" || type == "override") {
                auto v = number(j, "value", where);
                if (v.is_err())
                    return Result<PatternSpec>::err(v.error());
                spec = PatternSpec::constant(v.value());
            } else if (type == "sine") {
                auto a = number(j, "amplitude", where);
                auto p = number(j, "period", where);
                auto ph = number(j, "phase", where, 0.0);
                auto o = number(j, "offset", where, 0.0);
                for (auto *r : {&a, &p, &ph, &o}) {
                    if (r->is_err())
                        return Result<PatternSpec>::err(r->error());
                }
                spec = PatternSpec::sine(a.value(), p.value(), ph.value(), o.value());
            } else if (type == "gaussian") {
                auto m = number(j, "mean", where);
                auto s = number(j, "stddev", where);
                if (m.is_err())
                    return Result<PatternSpec>::err(m.error());
                if (s.is_err())
                    return Result<PatternSpec>::err(s.error());
                spec = PatternSpec::gaussian(m.value(), s.value());
            } else if (type == "random_walk") {
                auto st = number(j, "step", where);
                auto lo = number(j, "min", where);
                auto hi = number(j, "max", where);
                for (auto *r : {&st, &lo, &hi}) {
                    if (r->is_err())
                        return Result<PatternSpec>::err(r->error());
                }
                spec = PatternSpec::random_walk(st.value(), lo.value(), hi.value());
                if (j.contains("start")) {
                    auto s0 = number(j, "start", where);
                    if (s0.is_err())
                        return Result<PatternSpec>::err(s0.error());
                    spec.starting_at(s0.value());
                }
            } else if (type == "linear") {
                auto s0 = number(j, "start", where);
                auto r = number(j, "rate", where);
                if (s0.is_err())
                    return Result<PatternSpec>::err(s0.error());
                if (r.is_err())
                    return Result<PatternSpec>::err(r.error());
                spec = PatternSpec::linear(s0.value(), r.value());
            } else {
                return Result<PatternSpec>::err(Error::invalid_pattern(where + ": unknown pattern type '" + type + "'"));
            }

            auto v = spec.validate();
            if (v.is_err())
                return Result<PatternSpec>::err(Error::invalid_pattern(where + ": " + v.error().message));
            return Result<PatternSpec>::ok(spec);
        }

        inline Result<Transition> transition(const json &j, const dp::String &where) {
            dp::String type;
            if (j.is_string()) {
                type = detail::str(j);
            } else if (j.is_object() && j.contains("type") && j["type"].is_string()) {
                type = detail::str(j["type"]);
            } else {
                return Result<Transition>::err(Error::invalid_scenario(where + ": transition needs a 'type'"));
            }

            Transition t;
            if (type == "engage_autopilot") {
                t.kind = TransitionKind::EngageAutopilot;
                if (j.is_object() && j.contains("heading")) {
                    auto h = number(j, "heading", where);
                    if (h.is_err())
                        return Result<Transition>::err(h.error());
                    t.value = h.value();
                    t.kind = TransitionKind::SetHeading;
                }
            } else if (type == "disengage_autopilot") {
                t.kind = TransitionKind::DisengageAutopilot;
            } else if (type == "set_mode") {
                if (!j.is_object() || !j.contains("mode") || !j["mode"].is_string())
                    return Result<Transition>::err(Error::invalid_scenario(where + ": set_mode needs 'mode'"));
                auto m = control::autopilot_mode_from_string(detail::str(j["mode"]));
                if (!m)
                    return Result<Transition>::err(Error::invalid_scenario(where + ": unknown autopilot mode"));
                t.kind = TransitionKind::SetMode;
                t.mode = *m;
            } else if (type == "set_heading") {
                if (!j.is_object())
                    return Result<Transition>::err(Error::invalid_scenario(where + ": set_heading needs 'value'"));
                auto h = number(j, "value", where);
                if (h.is_err())
                    return Result<Transition>::err(h.error());
                t.kind = TransitionKind::SetHeading;
                t.value = h.value();
            } else if (type == "gps_dropout") {
                t.kind = TransitionKind::GpsDropout;
            } else if (type == "gps_restore") {
                t.kind = TransitionKind::GpsRestore;
            } else {
                return Result<Transition>::err(Error::invalid_scenario(where + ": unknown transition '" + type + "'"));
            }
            return Result<Transition>::ok(t);
        }

        inline Result<dp::Vector<InstanceId>> instance_list(const json &j, const dp::String &where) {
            dp::Vector<InstanceId> out;
            if (j.is_number_unsigned() || j.is_number_integer()) {
                i64 n = j.get<i64>();
                if (n < 0 || n > MAX_INSTANCE + 1)
                    return Result<dp::Vector<InstanceId>>::err(Error::invalid_scenario(where + ": bad instance count"));
                for (i64 i = 0; i < n; ++i)
                    out.push_back(static_cast<InstanceId>(i));
                return Result<dp::Vector<InstanceId>>::ok(std::move(out));
            }
            if (!j.is_array())
                return Result<dp::Vector<InstanceId>>::err(
                    Error::invalid_scenario(where + ": expected a count or a list of instance ids"));
            for (const auto &v : j) {
                if (!v.is_number_integer() || v.get<i64>() < 0 || v.get<i64>() > MAX_INSTANCE)
                    return Result<dp::Vector<InstanceId>>::err(
                        Error::invalid_scenario(where + ": instance ids must be integers in [0, 252]"));
                out.push_back(static_cast<InstanceId>(v.get<i64>()));
            }
            return Result<dp::Vector<InstanceId>>::ok(std::move(out));
        }

    } // namespace detail

    inline Result<ScenarioDefinition> parse_scenario(const json &j) {
        using R = Result<ScenarioDefinition>;
        if (!j.is_object())
            return R::err(Error::invalid_scenario("scenario must be a JSON object"));

        ScenarioDefinition def;
        if (!j.contains("name") || !j["name"].is_string())
            return R::err(Error::invalid_scenario("scenario 'name' missing"));
        def.name = detail::str(j["name"]);
        if (j.contains("description") && j["description"].is_string())
            def.description = detail::str(j["description"]);
        if (j.contains("category") && j["category"].is_string())
            def.category = detail::str(j["category"]);

        auto dur = detail::number(j, "duration", "scenario");
        if (dur.is_err())
            return R::err(dur.error());
        def.duration_s = dur.value();

        if (j.contains("loop")) {
            if (!j["loop"].is_boolean())
                return R::err(Error::invalid_scenario("'loop' must be a boolean"));
            def.loop = j["loop"].get<bool>();
        }
        if (j.contains("seed")) {
            if (!j["seed"].is_number_unsigned())
                return R::err(Error::invalid_scenario("'seed' must be an unsigned integer"));
            def.seed = j["seed"].get<u64>();
        }
        if (j.contains("tick_ms")) {
            if (!j["tick_ms"].is_number_unsigned())
                return R::err(Error::invalid_scenario("'tick_ms' must be an unsigned integer"));
            if (j["tick_ms"].get<u64>() > std::numeric_limits<u32>::max())
                return R::err(Error::invalid_scenario("'tick_ms' out of range"));
            def.tick_ms = static_cast<u32>(j["tick_ms"].get<u64>());
        }
        if (j.contains("bridge_mode")) {
            if (!j["bridge_mode"].is_string())
                return R::err(Error::invalid_scenario("'bridge_mode' must be a string"));
            auto m = bridge_mode_from_string(detail::str(j["bridge_mode"]));
            if (!m)
                return R::err(Error::invalid_scenario("unknown bridge_mode"));
            def.bridge_mode = *m;
        }
        if (j.contains("timing")) {
            if (!j["timing"].is_object())
                return R::err(Error::invalid_scenario("'timing' must be an object"));
            for (const auto &[key, val] : j["timing"].items()) {
                auto g = nmea::group_from_string(key);
                if (!g)
                    return R::err(Error::invalid_scenario("unknown timing group '" + dp::String(key) + "'"));
                if (!val.is_number())
                    return R::err(Error::invalid_scenario("timing rate must be a number"));
                def.timing.push_back({*g, val.get<f64>()});
            }
        }
        if (j.contains("vessel")) {
            const auto &v = j["vessel"];
            if (!v.is_object())
                return R::err(Error::invalid_scenario("'vessel' must be an object"));
            for (const char *field : {"engines", "batteries", "tanks"}) {
                if (!v.contains(field))
                    continue;
                auto ids = detail::instance_list(v[field], dp::String("vessel.") + field);
                if (ids.is_err())
                    return R::err(ids.error());
                dp::String f = field;
                if (f == "engines")
                    def.vessel.engines = ids.value();
                else if (f == "batteries")
                    def.vessel.batteries = ids.value();
                else
                    def.vessel.tanks = ids.value();
            }
            if (v.contains("origin")) {
                auto lat = detail::number(v["origin"], "lat", "vessel.origin");
                auto lon = detail::number(v["origin"], "lon", "vessel.origin");
                if (lat.is_err())
                    return R::err(lat.error());
                if (lon.is_err())
                    return R::err(lon.error());
                def.vessel.origin(lat.value(), lon.value());
            }
        }

        if (j.contains("events")) {
            if (!j["events"].is_array())
                return R::err(Error::invalid_scenario("'events' must be an array"));
            usize idx = 0;
            for (const auto &ej : j["events"]) {
                dp::String where = "event " + dp::String(std::to_string(idx++));
                if (!ej.is_object())
                    return R::err(Error::invalid_scenario(where + ": must be an object"));
                ScenarioEvent ev;
                auto at = detail::number(ej, "at", where);
                if (at.is_err())
                    return R::err(at.error());
                ev.at_s = at.value();
                if (ej.contains("description") && ej["description"].is_string())
                    ev.description = detail::str(ej["description"]);
                if (ej.contains("checkpoint")) {
                    if (!ej["checkpoint"].is_string())
                        return R::err(Error::invalid_scenario(where + ": checkpoint must be a string"));
                    ev.checkpoint = detail::str(ej["checkpoint"]);
                }
                if (ej.contains("patterns")) {
                    if (!ej["patterns"].is_object())
                        return R::err(Error::invalid_scenario(where + ": 'patterns' must be an object"));
                    for (const auto &[chan, pj] : ej["patterns"].items()) {
                        auto key = telemetry::parse_channel_key(chan);
                        if (!key)
                            return R::err(Error::invalid_scenario(where + ": unknown channel '" + dp::String(chan) + "'"));
                        if (pj.is_null()) {
                            ev.cleared.push_back(*key);
                            continue;
                        }
                        auto spec = detail::pattern(pj, where + " " + dp::String(chan));
                        if (spec.is_err())
                            return R::err(spec.error());
                        ev.patterns.push_back({*key, spec.value()});
                    }
                }
                if (ej.contains("transitions")) {
                    if (!ej["transitions"].is_array())
                        return R::err(Error::invalid_scenario(where + ": 'transitions' must be an array"));
                    for (const auto &tj : ej["transitions"]) {
                        auto t = detail::transition(tj, where);
                        if (t.is_err())
                            return R::err(t.error());
                        ev.transitions.push_back(t.value());
                    }
                }
                def.events.push_back(std::move(ev));
            }
        }

        auto valid = def.validate();
        if (valid.is_err())
            return R::err(valid.error());
        return R::ok(std::move(def));
    }

    inline Result<ScenarioDefinition> parse_scenario_text(const dp::String &text) {
        json j = json::parse(text.begin(), text.end(), nullptr, false);
        if (j.is_discarded())
            return Result<ScenarioDefinition>::err(Error::invalid_scenario("malformed JSON"));
        return parse_scenario(j);
    }

    inline Result<ScenarioDefinition> load_scenario_file(const dp::String &path) {
        std::ifstream in(path.c_str());
        if (!in)
            return Result<ScenarioDefinition>::err(Error::not_found("cannot open scenario file " + path));
        std::stringstream ss;
        ss << in.rdbuf();
        auto res = parse_scenario_text(dp::String(ss.str()));
        if (res.is_err())
            return Result<ScenarioDefinition>::err(Error(res.error().code, path + ": " + res.error().message));
        return res;
    }

    // Summary used by listings
    inline json summary(const ScenarioDefinition &def) {
        json j;
        j["name"] = std::string(def.name.c_str());
        j["description"] = std::string(def.description.c_str());
        j["category"] = std::string(def.category.c_str());
        j["duration"] = def.duration_s;
        j["loop"] = def.loop;
        json cps = json::array();
        for (const auto &c : def.checkpoints())
            cps.push_back(std::string(c.c_str()));
        j["checkpoints"] = cps;
        return j;
    }

} // namespace nmeabridge::scenario
