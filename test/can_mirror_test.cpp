#include <doctest/doctest.h>
#include <nmeabridge/net/can_mirror.hpp>
#include <nmeabridge/nmea/definitions.hpp>
#include <nmeabridge/nmea/fast_packet.hpp>
#include <wirebit/link.hpp>
#include <cstring>

using namespace nmeabridge;
using namespace nmeabridge::nmea;

// Records every transmitted frame; no hardware needed
class MockLink : public wirebit::Link {
    dp::Vector<wirebit::Frame> tx_log_;
    bool fail_ = false;

  public:
    wirebit::Result<wirebit::Unit, wirebit::Error> send(const wirebit::Frame &frame) override {
        if (fail_)
            return wirebit::Result<wirebit::Unit, wirebit::Error>::err(wirebit::Error::timeout("bus off"));
        tx_log_.push_back(frame);
        return wirebit::Result<wirebit::Unit, wirebit::Error>::ok(wirebit::Unit{});
    }

    wirebit::Result<wirebit::Frame, wirebit::Error> recv() override {
        return wirebit::Result<wirebit::Frame, wirebit::Error>::err(wirebit::Error::timeout("empty"));
    }

    bool can_send() const override { return !fail_; }
    bool can_recv() const override { return false; }
    wirebit::String name() const override { return "mock_vcan0"; }

    void set_failing(bool f) { fail_ = f; }

    dp::Vector<can_frame> transmitted() const {
        dp::Vector<can_frame> out;
        for (const auto &f : tx_log_) {
            if (f.payload.size() == sizeof(can_frame)) {
                can_frame cf;
                std::memcpy(&cf, f.payload.data(), sizeof(can_frame));
                out.push_back(cf);
            }
        }
        return out;
    }
};

TEST_CASE("CAN frame conversion") {
    Frame f;
    f.id = Identifier::encode(Priority::High, PGN_VESSEL_HEADING, 0x23);
    f.data = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    f.length = 8;

    auto cf = net::CanMirror::to_can_frame(f);
    CHECK((cf.can_id & CAN_EFF_FLAG) != 0);
    CHECK((cf.can_id & CAN_EFF_MASK) == f.id.raw);
    CHECK(cf.can_dlc == 8);
    CHECK(cf.data[0] == 0x01);
    CHECK(cf.data[7] == 0x08);
}

TEST_CASE("CAN mirror") {
    auto link = std::make_shared<MockLink>();
    net::CanMirror mirror(link);

    SUBCASE("single frames") {
        Frame f;
        f.id = Identifier::encode(Priority::Default, PGN_WATER_DEPTH, 0x23);
        f.length = 8;
        CHECK(mirror.mirror({f, f}) == 2);
        CHECK(mirror.sent() == 2);

        auto tx = link->transmitted();
        REQUIRE(tx.size() == 2);
        CHECK((tx[0].can_id & CAN_EFF_MASK) == f.id.raw);
    }

    SUBCASE("fast packet sequence in order") {
        Bytes payload(26);
        for (usize i = 0; i < payload.size(); ++i)
            payload[i] = static_cast<u8>(i);
        FastPacketSender fp;
        auto frames = fp.split(PGN_ENGINE_DYNAMIC, payload, SIMULATOR_SOURCE_ADDRESS);
        REQUIRE(frames.is_ok());
        REQUIRE(frames.value().size() == 4);

        CHECK(mirror.mirror(frames.value()) == 4);
        auto tx = link->transmitted();
        REQUIRE(tx.size() == 4);
        for (usize i = 0; i < 4; ++i)
            CHECK((tx[i].data[0] & 0x1F) == i);
        CHECK(tx[0].data[1] == 26);
    }

    SUBCASE("send failures are counted") {
        link->set_failing(true);
        Frame f;
        f.id = Identifier::encode(Priority::Default, PGN_RUDDER, 0x23);
        CHECK(mirror.mirror({f}) == 0);
        CHECK(mirror.failed() == 1);
        CHECK(mirror.sent() == 0);
    }
}
