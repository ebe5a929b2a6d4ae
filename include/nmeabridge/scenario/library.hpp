#pragma once

#include "definition.hpp"
#include <echo/echo.hpp>
#include <filesystem>
#include <system_error>

namespace nmeabridge::scenario {

    // ─── Built-in scenarios ─────────────────────────────────────────────────────
    namespace builtin {

        inline constexpr const char *BASIC_NAVIGATION = R"({
  "name": "basic-navigation",
  "category": "navigation",
  "description": "Vessel accelerates from rest, then holds a steady southerly course",
  "duration": 35,
  "events": [
    { "at": 0, "checkpoint": "init",
      "patterns": {
        "SOG": { "type": "linear", "start": 0.0, "rate": 1.3 },
        "STW": { "type": "linear", "start": 0.0, "rate": 1.25 },
        "HDG": { "type": "constant", "value": 180.0 },
        "DEPTH": { "type": "random_walk", "step": 0.1, "min": 10.0, "max": 14.0, "start": 12.0 } } },
    { "at": 5, "checkpoint": "steady",
      "patterns": {
        "SOG": { "type": "gaussian", "mean": 6.5, "stddev": 0.15 },
        "STW": { "type": "gaussian", "mean": 6.2, "stddev": 0.15 },
        "HDG": { "type": "sine", "amplitude": 3.0, "period": 60.0, "offset": 180.0 } } }
  ]
})";

        inline constexpr const char *COASTAL_SAILING = R"({
  "name": "coastal-sailing",
  "category": "navigation",
  "description": "Coastal passage under sail with shoaling depth, building wind and a GPS dropout",
  "duration": 70,
  "timing": { "gps": 1, "depth": 2, "wind": 5 },
  "events": [
    { "at": 0, "checkpoint": "departure",
      "patterns": {
        "SOG": { "type": "gaussian", "mean": 5.5, "stddev": 0.3 },
        "HDG": { "type": "sine", "amplitude": 8.0, "period": 45.0, "offset": 75.0 },
        "AWA": { "type": "sine", "amplitude": 6.0, "period": 30.0, "offset": 40.0 },
        "AWS": { "type": "gaussian", "mean": 10.0, "stddev": 1.0 },
        "DEPTH": { "type": "random_walk", "step": 0.3, "min": 15.0, "max": 40.0, "start": 30.0 } } },
    { "at": 10, "checkpoint": "coastal",
      "patterns": {
        "AWS": { "type": "linear", "start": 10.0, "rate": 0.15 },
        "DEPTH": { "type": "random_walk", "step": 0.2, "min": 4.0, "max": 15.0, "start": 12.0 } } },
    { "at": 40, "description": "GPS antenna shadowed", "transitions": [ "gps_dropout" ] },
    { "at": 45, "checkpoint": "recovered", "transitions": [ "gps_restore" ] }
  ]
})";

        inline constexpr const char *AUTOPILOT_ENGAGEMENT = R"({
  "name": "autopilot-engagement",
  "category": "autopilot",
  "description": "Manual steering, autopilot engagement, course changes and disengagement",
  "duration": 40,
  "timing": { "autopilot": 1 },
  "events": [
    { "at": 0, "checkpoint": "manual",
      "patterns": {
        "HDG": { "type": "random_walk", "step": 1.5, "min": 240.0, "max": 300.0, "start": 265.0 },
        "SOG": { "type": "gaussian", "mean": 7.0, "stddev": 0.2 } },
      "transitions": [ "disengage_autopilot" ] },
    { "at": 10, "checkpoint": "engaged", "transitions": [ { "type": "engage_autopilot", "heading": 270.0 } ] },
    { "at": 20, "transitions": [ { "type": "set_heading", "value": 300.0 } ] },
    { "at": 30, "checkpoint": "wind-mode", "transitions": [ { "type": "set_mode", "mode": "wind" } ] },
    { "at": 36, "transitions": [ "disengage_autopilot" ] }
  ]
})";

        inline constexpr const char *MULTI_EQUIPMENT_DETECTION = R"({
  "name": "multi-equipment-detection",
  "category": "equipment",
  "description": "Twin engines, three batteries and four tanks for instance detection",
  "duration": 70,
  "vessel": { "engines": [0, 1], "batteries": [0, 1, 2], "tanks": [0, 1, 2, 3] },
  "events": [
    { "at": 0, "checkpoint": "idle",
      "patterns": {
        "ENGINE_RPM[0]": { "type": "gaussian", "mean": 750.0, "stddev": 10.0 },
        "ENGINE_RPM[1]": { "type": "gaussian", "mean": 760.0, "stddev": 10.0 },
        "TANK_LEVEL[0]": { "type": "constant", "value": 80.0 },
        "TANK_LEVEL[1]": { "type": "constant", "value": 65.0 },
        "TANK_LEVEL[2]": { "type": "constant", "value": 40.0 },
        "TANK_LEVEL[3]": { "type": "constant", "value": 15.0 } } },
    { "at": 10, "checkpoint": "cruise",
      "patterns": {
        "ENGINE_RPM[0]": { "type": "gaussian", "mean": 2200.0, "stddev": 25.0 },
        "ENGINE_RPM[1]": { "type": "gaussian", "mean": 2150.0, "stddev": 25.0 },
        "TANK_LEVEL[0]": { "type": "linear", "start": 80.0, "rate": -0.05 },
        "TANK_LEVEL[1]": { "type": "linear", "start": 65.0, "rate": -0.05 } } },
    { "at": 40, "checkpoint": "single-engine",
      "patterns": { "ENGINE_RPM[1]": { "type": "constant", "value": 0.0 } } }
  ]
})";

        inline constexpr const char *ELECTRICAL_WIDGET_VALIDATION = R"({
  "name": "electrical-widget-validation",
  "category": "electrical",
  "description": "House, start and thruster batteries through charge and discharge cycles",
  "duration": 60,
  "vessel": { "engines": [0], "batteries": [0, 1, 2], "tanks": [0] },
  "events": [
    { "at": 0, "checkpoint": "charging",
      "patterns": {
        "BATTERY_VOLTAGE[0]": { "type": "linear", "start": 12.4, "rate": 0.02 },
        "BATTERY_CURRENT[0]": { "type": "gaussian", "mean": 25.0, "stddev": 1.5 },
        "BATTERY_VOLTAGE[1]": { "type": "constant", "value": 12.8 },
        "BATTERY_CURRENT[1]": { "type": "constant", "value": 0.5 },
        "BATTERY_VOLTAGE[2]": { "type": "sine", "amplitude": 0.3, "period": 20.0, "offset": 24.6 },
        "BATTERY_CURRENT[2]": { "type": "constant", "value": 0.0 } } },
    { "at": 30, "checkpoint": "discharging",
      "patterns": {
        "BATTERY_VOLTAGE[0]": { "type": "linear", "start": 13.0, "rate": -0.03 },
        "BATTERY_CURRENT[0]": { "type": "gaussian", "mean": -18.0, "stddev": 2.0 },
        "BATTERY_CURRENT[2]": { "type": "sine", "amplitude": 150.0, "period": 10.0, "offset": -150.0 } } }
  ]
})";

        inline const dp::Vector<const char *> &all() {
            static const dp::Vector<const char *> table = {BASIC_NAVIGATION, COASTAL_SAILING, AUTOPILOT_ENGAGEMENT,
                                                          MULTI_EQUIPMENT_DETECTION, ELECTRICAL_WIDGET_VALIDATION};
            return table;
        }

    } // namespace builtin

    // ─── Scenario library: built-ins plus scenario directories ─────────────────
    // A file "<dir>/<name>.json" or "<dir>/<category>/<name>.json" takes
    // precedence over a built-in of the same name.
    class ScenarioLibrary {
        dp::Vector<dp::String> directories_;

        static bool valid_name(const dp::String &name) {
            if (name.empty() || name.size() > 128)
                return false;
            for (char c : name) {
                bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
                          c == '_' || c == '.';
                if (!ok)
                    return false;
            }
            return name.find("..") == dp::String::npos;
        }

        dp::Optional<dp::String> find_file(const dp::String &name) const {
            namespace fs = std::filesystem;
            std::error_code ec;
            for (const auto &dir : directories_) {
                fs::path direct = fs::path(dir.c_str()) / (std::string(name.c_str()) + ".json");
                if (fs::is_regular_file(direct, ec))
                    return dp::String(direct.string());
                for (fs::directory_iterator it(dir.c_str(), ec), end; !ec && it != end; it.increment(ec)) {
                    if (!it->is_directory(ec))
                        continue;
                    fs::path nested = it->path() / (std::string(name.c_str()) + ".json");
                    if (fs::is_regular_file(nested, ec))
                        return dp::String(nested.string());
                }
            }
            return dp::nullopt;
        }

      public:
        ScenarioLibrary &add_directory(const dp::String &dir) {
            directories_.push_back(dir);
            return *this;
        }

        const dp::Vector<dp::String> &directories() const noexcept { return directories_; }

        dp::Vector<dp::String> builtin_names() const {
            dp::Vector<dp::String> out;
            for (const char *text : builtin::all()) {
                auto def = parse_scenario_text(text);
                if (def.is_ok())
                    out.push_back(def.value().name);
            }
            return out;
        }

        Result<ScenarioDefinition> find(const dp::String &name) const {
            if (!valid_name(name))
                return Result<ScenarioDefinition>::err(Error::invalid_argument("invalid scenario name '" + name + "'"));
            if (auto path = find_file(name)) {
                echo::category("nmeabridge.scenario").debug("loading ", *path);
                return load_scenario_file(*path);
            }
            for (const char *text : builtin::all()) {
                auto def = parse_scenario_text(text);
                if (def.is_err()) {
                    echo::category("nmeabridge.scenario").error("built-in scenario invalid: ", def.error().message);
                    continue;
                }
                if (def.value().name == name)
                    return def;
            }
            return Result<ScenarioDefinition>::err(Error::not_found("scenario '" + name + "' not found"));
        }

        // Every loadable scenario; files that fail to parse are reported with their error
        json list() const {
            namespace fs = std::filesystem;
            json out = json::array();
            dp::Vector<dp::String> names;
            std::error_code ec;
            for (const auto &dir : directories_) {
                for (fs::recursive_directory_iterator it(dir.c_str(), ec), end; !ec && it != end; it.increment(ec)) {
                    if (it.depth() > 1 || !it->is_regular_file(ec) || it->path().extension() != ".json")
                        continue;
                    auto def = load_scenario_file(dp::String(it->path().string()));
                    if (def.is_err()) {
                        json bad;
                        bad["file"] = it->path().string();
                        bad["error"] = std::string(def.error().message.c_str());
                        out.push_back(bad);
                        continue;
                    }
                    json s = summary(def.value());
                    s["source"] = "file";
                    names.push_back(def.value().name);
                    out.push_back(s);
                }
            }
            for (const char *text : builtin::all()) {
                auto def = parse_scenario_text(text);
                if (def.is_err())
                    continue;
                bool shadowed = false;
                for (const auto &n : names)
                    shadowed = shadowed || n == def.value().name;
                if (shadowed)
                    continue;
                json s = summary(def.value());
                s["source"] = "builtin";
                out.push_back(s);
            }
            return out;
        }
    };

} // namespace nmeabridge::scenario
