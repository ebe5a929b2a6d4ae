#include <doctest/doctest.h>
#include <nmeabridge/nmea/sentence.hpp>
#include <nmeabridge/scenario/engine.hpp>
#include <nmeabridge/session/player.hpp>
#include <nmeabridge/session/recorder.hpp>
#include <cstdio>
#include <filesystem>
#include <memory>

using namespace nmeabridge;
using namespace nmeabridge::session;

namespace {
    dp::String temp_file(const char *name) {
        return dp::String((std::filesystem::temp_directory_path() / name).string());
    }

    Bytes sample_recording(usize n) {
        RecordingHeader h;
        h.source_mode = "nmea0183";
        h.start_epoch_ms = 1'700'000'000'000ULL;
        Bytes out = encode_header(h);
        for (usize i = 0; i < n; ++i) {
            RecordingEntry e;
            e.offset_ms = static_cast<u32>(i * 100);
            e.kind = PacketKind::Text;
            dp::String s = nmea::build("IIMTW," + dp::String(std::to_string(10 + i)) + ".0,C");
            e.bytes.assign(s.begin(), s.end());
            encode_entry(out, e);
        }
        return out;
    }
} // namespace

TEST_CASE("Recording decode") {
    SUBCASE("header and entries") {
        auto rec = decode_recording(sample_recording(3));
        REQUIRE(rec.is_ok());
        CHECK(rec.value().header.source_mode == "nmea0183");
        CHECK(rec.value().header.start_epoch_ms == 1'700'000'000'000ULL);
        CHECK(rec.value().entries.size() == 3);
        CHECK(rec.value().duration_ms() == 200);
        CHECK_FALSE(rec.value().truncated);
    }

    SUBCASE("truncated trailing entry is dropped") {
        Bytes data = sample_recording(3);
        data.resize(data.size() - 5);
        auto rec = decode_recording(data);
        REQUIRE(rec.is_ok());
        CHECK(rec.value().entries.size() == 2);
        CHECK(rec.value().truncated);
    }

    SUBCASE("bad magic") {
        Bytes data = sample_recording(1);
        data[0] = 'X';
        CHECK(decode_recording(data).error().code == ErrorCode::InvalidRecording);
    }

    SUBCASE("unknown entry kind") {
        Bytes data = sample_recording(1);
        RecordingEntry e;
        e.bytes = {1, 2, 3};
        encode_entry(data, e);
        data[data.size() - 3 - 4 - 1] = 7;
        CHECK(decode_recording(data).is_err());
    }
}

TEST_CASE("Session recorder captures the broadcast") {
    net::Broadcast broadcast;
    SessionRecorder recorder(broadcast, RecorderConfig{}.flush_every(20));
    u64 now = 0;
    recorder.set_clock([&] { return now; });
    dp::String path = temp_file("nmeabridge_recorder_test.nbrc");

    auto started = recorder.start(path, "hybrid");
    REQUIRE(started.is_ok());
    CHECK(started.value() == path);
    CHECK(recorder.recording());
    CHECK(recorder.start(path, "hybrid").error().code == ErrorCode::InvalidState);

    dp::String line = nmea::build("IIHDG,45.0,,,,");
    broadcast.publish(make_packet(Packet::text(line)));
    now = 250;
    broadcast.publish(make_packet(Packet::binary({0x09, 0xF1, 0x12, 0x2A, 0x01, 0x00})));
    CHECK(recorder.status().entries == 2);

    CHECK(recorder.stop().is_ok());
    CHECK(recorder.stop().is_ok());
    CHECK_FALSE(recorder.recording());
    CHECK(broadcast.subscriber_count() == 0);

    auto rec = load_recording(path);
    REQUIRE(rec.is_ok());
    CHECK(rec.value().header.source_mode == "hybrid");
    REQUIRE(rec.value().entries.size() == 2);
    CHECK(rec.value().entries[0].kind == PacketKind::Text);
    CHECK(rec.value().entries[1].kind == PacketKind::Binary);
    CHECK(rec.value().entries[1].offset_ms == 250);
    std::remove(path.c_str());
}

TEST_CASE("Recorder refuses an unwritable path") {
    net::Broadcast broadcast;
    SessionRecorder recorder(broadcast);
    auto r = recorder.start(dp::String("/nonexistent-dir/x.nbrc"), "nmea0183");
    CHECK(r.error().code == ErrorCode::IoError);
    CHECK_FALSE(recorder.recording());
}

TEST_CASE("Replay emits entries at their offsets") {
    auto rec = decode_recording(sample_recording(5));
    REQUIRE(rec.is_ok());
    ReplaySource src("sample", std::move(rec.value()));
    REQUIRE(src.start(0).is_ok());
    CHECK(src.duration_ms() == 401);
    CHECK(src.advance(0, 150).size() == 2);
    CHECK(src.advance(150, 300).size() == 1);
    CHECK(src.advance(300, 401).size() == 2);
    CHECK(src.advance(401, 1000).empty());
}

TEST_CASE("Replay through the engine") {
    auto rec = decode_recording(sample_recording(5));
    REQUIRE(rec.is_ok());
    scenario::ScenarioEngine engine;
    dp::Vector<dp::String> seen;
    engine.on_packet.subscribe([&](PacketPtr p) { seen.push_back(p->as_text()); });

    scenario::RunOptions opts;
    opts.speed = 2.0;
    REQUIRE(engine.run(std::make_unique<ReplaySource>("sample", std::move(rec.value())), opts).is_ok());
    for (i32 i = 0; i < 30; ++i)
        engine.update(10);
    CHECK(engine.state() == scenario::EngineState::Stopped);
    REQUIRE(seen.size() == 5);
    CHECK(seen[0].find("IIMTW,10.0") != dp::String::npos);
    CHECK(seen[4].find("IIMTW,14.0") != dp::String::npos);
}

TEST_CASE("Recorded engine output replays byte for byte") {
    auto def = scenario::parse_scenario_text(R"({
      "name": "harbour",
      "duration": 3,
      "events": [
        { "at": 0, "patterns": { "HDG": 90.0, "SOG": 4.5 } },
        { "at": 1.5, "patterns": { "HDG": 120.0 } }
      ]
    })");
    REQUIRE(def.is_ok());

    // Record two seconds of scenario output off the broadcast
    net::Broadcast broadcast;
    SessionRecorder recorder(broadcast);
    u64 now = 0;
    recorder.set_clock([&] { return now; });
    dp::String path = temp_file("nmeabridge_roundtrip.nbrc");
    REQUIRE(recorder.start(path, "nmea0183").is_ok());

    scenario::ScenarioEngine source_engine;
    source_engine.on_packet.subscribe([&](PacketPtr p) { broadcast.publish(p); });
    REQUIRE(source_engine.load(def.value()).is_ok());
    for (i32 i = 0; i < 20; ++i) {
        now += 100;
        source_engine.update(100);
    }
    REQUIRE(recorder.stop().is_ok());

    auto rec = load_recording(path);
    REQUIRE(rec.is_ok());
    const auto entries = rec.value().entries;
    REQUIRE(entries.size() > 10);

    for (f64 speed : {1.0, 2.0}) {
        CAPTURE(speed);
        auto copy = load_recording(path);
        REQUIRE(copy.is_ok());
        scenario::ScenarioEngine player;
        u64 wall = 0;
        dp::Vector<Bytes> bytes;
        dp::Vector<u64> at;
        player.on_packet.subscribe([&](PacketPtr p) {
            bytes.push_back(p->bytes);
            at.push_back(wall);
        });

        scenario::RunOptions opts;
        opts.speed = speed;
        REQUIRE(player.run(std::make_unique<ReplaySource>("harbour", std::move(copy.value())), opts).is_ok());
        for (i32 i = 0; i < 400 && player.state() != scenario::EngineState::Stopped; ++i) {
            wall += REPLAY_TICK_MS;
            player.update(REPLAY_TICK_MS);
        }
        CHECK(player.state() == scenario::EngineState::Stopped);

        REQUIRE(bytes.size() == entries.size());
        for (usize i = 0; i < entries.size(); ++i) {
            CHECK(bytes[i] == entries[i].bytes);
            // Emitted on the first tick whose virtual time passes the scaled offset
            f64 due = static_cast<f64>(entries[i].offset_ms) / speed;
            CHECK(static_cast<f64>(at[i]) > due - 1e-9);
            CHECK(static_cast<f64>(at[i]) <= due + REPLAY_TICK_MS);
        }
    }
    std::remove(path.c_str());
}

TEST_CASE("Text log source") {
    dp::String good = nmea::build("IIDBT,32.8,f,10.0,M,5.4,F");
    dp::String text = good + "garbage line\n" + nmea::corrupt_checksum(good) + "\n" + good + "\n";

    SUBCASE("invalid lines are skipped") {
        auto src = TextLogSource::parse("log", text, 10.0, false);
        REQUIRE(src.is_ok());
        CHECK(src.value()->size() == 2);
        CHECK(src.value()->duration_ms() == 200);
        REQUIRE(src.value()->start(0).is_ok());
        auto out = src.value()->advance(0, 100);
        REQUIRE(out.size() == 1);
        CHECK(out[0].as_text() == good);
    }

    SUBCASE("nothing valid is an error") {
        CHECK(TextLogSource::parse("log", "junk\n", 10.0, false).is_err());
        CHECK(TextLogSource::parse("log", text, 0.0, false).is_err());
    }
}
