#include <doctest/doctest.h>
#include <nmeabridge/nmea/definitions.hpp>
#include <nmeabridge/nmea/fast_packet.hpp>

using namespace nmeabridge;
using namespace nmeabridge::nmea;

TEST_CASE("Fast packet split") {
    FastPacketSender fp;

    SUBCASE("multi-frame message") {
        Bytes data(26, 0xAA);
        auto result = fp.split(PGN_ENGINE_DYNAMIC, data, SIMULATOR_SOURCE_ADDRESS);
        REQUIRE(result.is_ok());
        auto &frames = result.value();
        // 6 + 7 + 7 + 7 = 27 >= 26
        CHECK(frames.size() == 4);
        CHECK((frames[0].data[0] & 0x1F) == 0);
        CHECK(frames[0].data[1] == 26);
        CHECK(frames[0].data[2] == 0xAA);
        CHECK((frames[3].data[0] & 0x1F) == 3);
        CHECK(frames[3].data[7] == 0xFF); // padding
        for (const auto &f : frames) {
            CHECK(f.pgn() == PGN_ENGINE_DYNAMIC);
            CHECK(f.source() == SIMULATOR_SOURCE_ADDRESS);
        }
    }

    SUBCASE("sequence counter advances per message") {
        Bytes data(10, 0x01);
        auto a = fp.split(PGN_HEADING_TRACK_CONTROL, data, 1);
        auto b = fp.split(PGN_HEADING_TRACK_CONTROL, data, 1);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        CHECK((a.value()[0].data[0] >> 5) != (b.value()[0].data[0] >> 5));
    }

    SUBCASE("rejects single-frame payloads") {
        Bytes data(8);
        CHECK(fp.split(PGN_ENGINE_DYNAMIC, data, 1).is_err());
    }

    SUBCASE("rejects oversize payloads") {
        Bytes data(FAST_PACKET_MAX_DATA + 1);
        auto r = fp.split(PGN_ENGINE_DYNAMIC, data, 1);
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::BufferOverflow);
    }
}

TEST_CASE("Fast packet reassembly") {
    FastPacketSender tx;
    Bytes original(40);
    for (usize i = 0; i < original.size(); ++i)
        original[i] = static_cast<u8>(i);
    auto frames = tx.split(PGN_HEADING_TRACK_CONTROL, original, 0x30).value();

    SUBCASE("in order") {
        FastPacketAssembler rx;
        dp::Optional<Bytes> out;
        for (const auto &f : frames)
            out = rx.feed(f);
        REQUIRE(out.has_value());
        REQUIRE(out->size() == original.size());
        for (usize i = 0; i < original.size(); ++i)
            CHECK((*out)[i] == original[i]);
        CHECK(rx.pending() == 0);
    }

    SUBCASE("missing frame aborts the session") {
        FastPacketAssembler rx;
        dp::Optional<Bytes> out;
        for (usize i = 0; i < frames.size(); ++i) {
            if (i == 2)
                continue;
            out = rx.feed(frames[i]);
        }
        CHECK_FALSE(out.has_value());
        CHECK(rx.pending() == 0);
    }
}

TEST_CASE("Identifier") {
    SUBCASE("PDU2 PGN keeps its group extension") {
        auto id = Identifier::encode(Priority::Normal, PGN_WATER_DEPTH, 42);
        CHECK(id.pgn() == PGN_WATER_DEPTH);
        CHECK(id.source() == 42);
        CHECK(id.priority() == Priority::Normal);
    }

    SUBCASE("wire frame") {
        Frame f;
        f.id = Identifier::encode(Priority::Default, PGN_VESSEL_HEADING, SIMULATOR_SOURCE_ADDRESS);
        f.data[0] = 0x12;
        auto wire = to_wire(f);
        CHECK(wire.size() == 13);
        CHECK(wire[4] == 8);
        auto back = from_wire(wire);
        REQUIRE(back.has_value());
        CHECK(back->id == f.id);
        CHECK(back->data[0] == 0x12);
        wire.pop_back();
        CHECK_FALSE(from_wire(wire).has_value());
    }
}
