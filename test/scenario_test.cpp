#include <doctest/doctest.h>
#include <nmeabridge/scenario/library.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>

using namespace nmeabridge;
using namespace nmeabridge::scenario;

namespace {
    const char *MINIMAL = R"({
  "name": "harbour-exit",
  "duration": 20,
  "loop": true,
  "seed": 42,
  "timing": { "gps": 1, "depth": 0.5 },
  "vessel": { "engines": 2, "tanks": [1, 4] },
  "events": [
    { "at": 0, "checkpoint": "moored",
      "patterns": { "SOG": 0.0, "ENGINE_RPM[1]": { "type": "constant", "value": 700 } } },
    { "at": 5, "checkpoint": "underway",
      "patterns": { "SOG": { "type": "linear", "start": 0, "rate": 0.5 }, "ENGINE_RPM[1]": null },
      "transitions": [ { "type": "engage_autopilot", "heading": 90 }, "gps_dropout" ] }
  ]
})";

    struct TempDir {
        std::filesystem::path path;
        TempDir() {
            path = std::filesystem::temp_directory_path() /
                   ("nmeabridge_scenarios_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
            std::filesystem::create_directories(path / "custom");
        }
        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
        void write(const std::string &rel, const std::string &text) const {
            std::ofstream out(path / rel);
            out << text;
        }
    };
} // namespace

TEST_CASE("Scenario parsing") {
    auto r = parse_scenario_text(MINIMAL);
    REQUIRE(r.is_ok());
    const auto &def = r.value();
    CHECK(def.name == "harbour-exit");
    CHECK(def.category == "custom");
    CHECK(def.duration_ms() == 20'000);
    CHECK(def.loop);
    CHECK(def.seed.value_or(0) == 42);
    CHECK(def.timing.size() == 2);
    CHECK(def.vessel.engines.size() == 2);
    CHECK(def.vessel.tanks[1] == 4);
    REQUIRE(def.events.size() == 2);
    CHECK(def.events[0].patterns.size() == 2);
    CHECK(def.events[1].cleared.size() == 1);
    REQUIRE(def.events[1].transitions.size() == 2);
    CHECK(def.events[1].transitions[0].kind == TransitionKind::SetHeading);
    CHECK(def.events[1].transitions[0].value == doctest::Approx(90.0));
    CHECK(def.events[1].transitions[1].kind == TransitionKind::GpsDropout);
    CHECK(def.checkpoints().size() == 2);
    CHECK(def.checkpoint_time("underway").value_or(0) == 5000);
    CHECK_FALSE(def.checkpoint_time("anchored").has_value());
}

TEST_CASE("Scenario validation errors") {
    auto code = [](const char *text) {
        auto r = parse_scenario_text(text);
        return r.is_err() ? r.error().code : ErrorCode::Ok;
    };
    CHECK(code("{ not json") == ErrorCode::InvalidScenario);
    CHECK(code(R"({"duration": 10})") == ErrorCode::InvalidScenario);
    CHECK(code(R"({"name": "x", "duration": 0})") == ErrorCode::InvalidScenario);
    CHECK(code(R"({"name": "x", "duration": 10, "events": [{"at": 11}]})") == ErrorCode::InvalidScenario);
    CHECK(code(R"({"name": "x", "duration": 10, "events": [{"at": 5}, {"at": 2}]})") == ErrorCode::InvalidScenario);
    CHECK(code(R"({"name": "x", "duration": 10, "events": [{"at": 0, "patterns": {"WARP": 1}}]})") ==
          ErrorCode::InvalidScenario);
    CHECK(code(R"({"name": "x", "duration": 10,
                   "events": [{"at": 0, "patterns": {"SOG": {"type": "sine", "amplitude": 1, "period": 0}}}]})") ==
          ErrorCode::InvalidPattern);
    CHECK(code(R"({"name": "x", "duration": 10,
                   "events": [{"at": 0, "patterns": {"SOG": {"type": "zigzag"}}}]})") == ErrorCode::InvalidPattern);
    CHECK(code(R"({"name": "x", "duration": 10,
                   "events": [{"at": 0, "checkpoint": "a"}, {"at": 1, "checkpoint": "a"}]})") ==
          ErrorCode::InvalidScenario);
    CHECK(code(R"({"name": "x", "duration": 10, "timing": {"radar": 1}})") == ErrorCode::InvalidScenario);
    CHECK(code(R"({"name": "x", "duration": 10, "tick_ms": 4294967296})") == ErrorCode::InvalidScenario);
    CHECK(code(R"({"name": "x", "duration": 10, "tick_ms": 4294967295})") == ErrorCode::Ok);
    CHECK(code(R"({"name": "x", "duration": 10, "vessel": {"origin": {"lat": 91.0, "lon": 0.0}}})") ==
          ErrorCode::InvalidScenario);
    CHECK(code(R"({"name": "x", "duration": 10, "vessel": {"origin": {"lat": 10.0, "lon": -180.5}}})") ==
          ErrorCode::InvalidScenario);
    CHECK(code(R"({"name": "x", "duration": 10, "vessel": {"origin": {"lat": -90.0, "lon": 180.0}}})") ==
          ErrorCode::Ok);
}

TEST_CASE("Built-in scenarios") {
    ScenarioLibrary lib;
    auto names = lib.builtin_names();
    CHECK(names.size() == builtin::all().size());
    for (const auto &n : names) {
        auto def = lib.find(n);
        REQUIRE(def.is_ok());
        CHECK(def.value().validate().is_ok());
    }
    CHECK(lib.find("autopilot-engagement").is_ok());
    CHECK(lib.find("atlantis").error().code == ErrorCode::NotFound);
    CHECK(lib.find("../etc/passwd").error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Scenario directories") {
    TempDir dir;
    dir.write("custom/harbour-exit.json", MINIMAL);
    dir.write("broken.json", "{ \"name\": 1 }");
    dir.write("basic-navigation.json", R"({"name": "basic-navigation", "duration": 3})");

    ScenarioLibrary lib;
    lib.add_directory(dp::String(dir.path.string()));

    SUBCASE("nested category directory") {
        auto def = lib.find("harbour-exit");
        REQUIRE(def.is_ok());
        CHECK(def.value().duration_s == doctest::Approx(20.0));
    }

    SUBCASE("files shadow built-ins") {
        auto def = lib.find("basic-navigation");
        REQUIRE(def.is_ok());
        CHECK(def.value().duration_s == doctest::Approx(3.0));
    }

    SUBCASE("listing reports broken files") {
        auto list = lib.list();
        usize broken = 0, basic = 0;
        for (const auto &e : list) {
            if (e.contains("error"))
                broken++;
            else if (e["name"] == "basic-navigation")
                basic++;
        }
        CHECK(broken == 1);
        CHECK(basic == 1);
    }

    SUBCASE("file validation") {
        auto ok = load_scenario_file(dp::String((dir.path / "custom" / "harbour-exit.json").string()));
        CHECK(ok.is_ok());
        auto missing = load_scenario_file(dp::String((dir.path / "nope.json").string()));
        CHECK(missing.error().code == ErrorCode::NotFound);
    }
}
