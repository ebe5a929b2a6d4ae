#include <doctest/doctest.h>
#include <nmeabridge/nmea/codec.hpp>
#include <nmeabridge/telemetry/generator.hpp>

using namespace nmeabridge;
using namespace nmeabridge::nmea;
using telemetry::Channel;

namespace {
    telemetry::TelemetryRecord sample_record() {
        telemetry::DataGenerator gen(11, telemetry::VesselProfile{}.engine_instances({0, 1}).tank_instances({0, 3}));
        control::AutopilotCommandState ap;
        return gen.tick(1000, 1000, ap);
    }

    usize count_type(const dp::Vector<Packet> &packets, const char *type) {
        usize n = 0;
        for (const auto &p : packets) {
            if (p.kind == PacketKind::Text && sentence_type(p.as_text()) == type)
                n++;
        }
        return n;
    }
} // namespace

TEST_CASE("Every emitted sentence carries a valid checksum") {
    telemetry::DataGenerator gen(2024);
    BridgeCodec codec(BridgeMode::Nmea0183);
    codec.set_epoch_ms(1'700'000'000'000ULL);
    control::AutopilotCommandState ap;
    ap.mode = control::AutopilotMode::Auto;
    ap.target_heading_deg = 200.0;

    for (VirtualMs t = 0; t < 60'000; t += 100) {
        auto rec = gen.tick(t, t, ap);
        auto out = codec.encode(rec, ap, GroupMask::all(), t / 100);
        CHECK_FALSE(out.packets.empty());
        for (const auto &p : out.packets) {
            REQUIRE(p.kind == PacketKind::Text);
            dp::String s = p.as_text();
            CHECK(validate(s).is_ok());
            CHECK(s.substr(s.size() - 2) == "\r\n");
        }
    }
}

TEST_CASE("One sentence per instance") {
    BridgeCodec codec(BridgeMode::Nmea0183);
    control::AutopilotCommandState ap;
    auto out = codec.encode(sample_record(), ap, GroupMask{}.set(Group::Engine), 1);
    CHECK(count_type(out.packets, "RPM") == 2);
    CHECK(out.packets[0].as_text().find("IIRPM,E,0,") != dp::String::npos);

    auto tanks = codec.encode(sample_record(), ap, GroupMask{}.set(Group::Tank), 1);
    REQUIRE(tanks.packets.size() == 2);
    CHECK(tanks.packets[1].as_text().find("TANK#3") != dp::String::npos);
}

TEST_CASE("Missing fields drop only the affected sentence") {
    BridgeCodec codec(BridgeMode::Nmea0183);
    control::AutopilotCommandState ap;
    auto rec = sample_record();
    rec.erase({Channel::DEPTH, 0});
    auto out = codec.encode(rec, ap, GroupMask{}.set(Group::Depth), 1);
    CHECK(count_type(out.packets, "DBT") == 0);
    CHECK(count_type(out.packets, "MTW") == 1);
    CHECK(codec.dropped() == 1);
}

TEST_CASE("GPS dropout reports no fix") {
    BridgeCodec codec(BridgeMode::Nmea0183);
    control::AutopilotCommandState ap;
    auto rec = sample_record();
    rec.set({Channel::GPS_FIX, 0}, 0.0);
    auto out = codec.encode(rec, ap, GroupMask{}.set(Group::Gps), 1);
    bool saw_void_rmc = false;
    for (const auto &p : out.packets) {
        dp::String s = p.as_text();
        if (sentence_type(s) == "RMC")
            saw_void_rmc = split_fields(s)[2] == "V";
        if (sentence_type(s) == "GGA")
            CHECK(split_fields(s)[6] == "0");
    }
    CHECK(saw_void_rmc);
}

TEST_CASE("Bridge modes") {
    control::AutopilotCommandState ap;
    auto rec = sample_record();

    SUBCASE("nmea2000 emits binary frames only") {
        BridgeCodec codec(BridgeMode::Nmea2000);
        auto out = codec.encode(rec, ap, GroupMask::all(), 1);
        CHECK_FALSE(out.frames.empty());
        CHECK(out.packets.size() == out.frames.size());
        for (const auto &p : out.packets)
            CHECK(p.kind == PacketKind::Binary);
    }

    SUBCASE("hybrid puts sentences before frames") {
        BridgeCodec codec(BridgeMode::Hybrid);
        auto out = codec.encode(rec, ap, GroupMask::all(), 1);
        REQUIRE_FALSE(out.packets.empty());
        bool seen_binary = false;
        for (const auto &p : out.packets) {
            if (p.kind == PacketKind::Binary)
                seen_binary = true;
            else
                CHECK_FALSE(seen_binary);
        }
        CHECK(seen_binary);
    }

    SUBCASE("empty group mask encodes nothing") {
        BridgeCodec codec(BridgeMode::Hybrid);
        auto out = codec.encode(rec, ap, GroupMask{}, 1);
        CHECK(out.packets.empty());
    }
}

TEST_CASE("Engine dynamic parameters use fast packet") {
    Nmea2000Encoder enc;
    control::AutopilotCommandState ap;
    auto frames = enc.encode(sample_record(), ap, GroupMask{}.set(Group::Engine));
    usize rapid = 0, dynamic = 0;
    for (const auto &f : frames) {
        if (f.pgn() == PGN_ENGINE_RAPID)
            rapid++;
        if (f.pgn() == PGN_ENGINE_DYNAMIC)
            dynamic++;
    }
    CHECK(rapid == 2);
    CHECK(dynamic == 8); // 26 bytes = 4 frames per engine
}
