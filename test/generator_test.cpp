#include <doctest/doctest.h>
#include <nmeabridge/telemetry/generator.hpp>

using namespace nmeabridge;
using namespace nmeabridge::telemetry;

TEST_CASE("Generated values stay in range") {
    DataGenerator gen(1234, VesselProfile{}.engine_instances({0, 1}).battery_instances({0, 1, 2}));
    CHECK(gen.set_pattern({Channel::SOG, 0}, PatternSpec::linear(0.0, 5.0)).is_ok());
    CHECK(gen.set_pattern({Channel::DEPTH, 0}, PatternSpec::gaussian(1.0, 10.0)).is_ok());
    control::AutopilotCommandState ap;

    // Ten minutes at 10 Hz
    for (VirtualMs t = 0; t <= 600'000; t += 100) {
        auto rec = gen.tick(t, t, ap);
        for (const auto &[packed, value] : rec.values) {
            auto key = ChannelKey::unpack(packed);
            const auto &ci = info(key.channel);
            CHECK(value >= ci.min);
            if (ci.wraps)
                CHECK(value < ci.max);
            else
                CHECK(value <= ci.max);
        }
    }
    CHECK(gen.adjusted_values() > 0);
}

TEST_CASE("Instances are independent") {
    VesselProfile twin = VesselProfile{}.engine_instances({0, 1});
    VesselProfile single = VesselProfile{}.engine_instances({0});
    DataGenerator a(77, twin);
    DataGenerator b(77, single);
    control::AutopilotCommandState ap;

    for (VirtualMs t = 0; t < 100'000; t += 100) {
        auto ra = a.tick(t, t, ap);
        auto rb = b.tick(t, t, ap);
        CHECK(*ra.get(ChannelKey{Channel::ENGINE_RPM, 0}) == *rb.get(ChannelKey{Channel::ENGINE_RPM, 0}));
        CHECK(ra.has({Channel::ENGINE_RPM, 1}));
        CHECK_FALSE(rb.has({Channel::ENGINE_RPM, 1}));
    }
}

TEST_CASE("Same seed reproduces the same stream") {
    DataGenerator a(5), b(5);
    control::AutopilotCommandState ap;
    for (VirtualMs t = 0; t < 5'000; t += 100) {
        auto ra = a.tick(t, t, ap);
        auto rb = b.tick(t, t, ap);
        for (auto c : {Channel::SOG, Channel::DEPTH, Channel::HDG, Channel::AWS, Channel::LAT})
            CHECK(*ra.get(c) == *rb.get(c));
    }
}

TEST_CASE("Engaged autopilot steers at the turn-rate limit") {
    DataGenerator gen(1);
    CHECK(gen.set_pattern({Channel::HDG, 0}, PatternSpec::constant(90.0)).is_ok());
    control::AutopilotCommandState ap;
    gen.tick(0, 0, ap);

    ap.mode = control::AutopilotMode::Auto;
    ap.target_heading_deg = 120.0;
    auto rec = gen.tick(1000, 1000, ap);
    CHECK(*rec.get(Channel::HDG) == doctest::Approx(90.0 + MAX_TURN_RATE_DEG_S));
    CHECK(*rec.get(Channel::RUDDER) == doctest::Approx(20.0));

    for (VirtualMs t = 2000; t <= 5000; t += 1000)
        rec = gen.tick(t, t, ap);
    CHECK(*rec.get(Channel::HDG) == doctest::Approx(120.0));
    CHECK(*rec.get(Channel::RUDDER) == doctest::Approx(0.0));
}

TEST_CASE("GPS dropout clears the fix") {
    DataGenerator gen(3);
    control::AutopilotCommandState ap;
    CHECK(gen.tick(0, 0, ap).gps_fix());
    gen.set_gps_dropout(true);
    CHECK_FALSE(gen.tick(100, 100, ap).gps_fix());
    gen.set_gps_dropout(false);
    CHECK(gen.tick(200, 200, ap).gps_fix());
}

TEST_CASE("Dead reckoning moves the vessel") {
    DataGenerator gen(9);
    CHECK(gen.set_pattern({Channel::SOG, 0}, PatternSpec::constant(10.0)).is_ok());
    CHECK(gen.set_pattern({Channel::HDG, 0}, PatternSpec::constant(0.0)).is_ok());
    control::AutopilotCommandState ap;
    auto first = gen.tick(0, 0, ap);
    auto later = gen.tick(60'000, 60'000, ap);
    CHECK(*later.get(Channel::LAT) > *first.get(Channel::LAT));
    CHECK(*later.get(Channel::LON) == doctest::Approx(*first.get(Channel::LON)));
}
