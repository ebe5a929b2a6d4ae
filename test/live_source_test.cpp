#include <doctest/doctest.h>
#include <nmeabridge/net/live_source.hpp>
#include <nmeabridge/net/tcp_server.hpp>

#include <chrono>
#include <thread>

using namespace nmeabridge;
using namespace nmeabridge::net;

TEST_CASE("Live source republishes valid upstream sentences") {
    Broadcast upstream_feed;
    TcpServer upstream(ServerConfig{}.bind("127.0.0.1").listen_on(0), upstream_feed);
    REQUIRE(upstream.start().is_ok());

    LiveSource live("127.0.0.1", upstream.port());
    CHECK(live.kind() == "live");
    REQUIRE(live.start(0).is_ok());
    for (int i = 0; i < 300 && !(live.connected() && upstream.connection_count() == 1); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    REQUIRE(live.connected());
    REQUIRE(upstream.connection_count() == 1);
    for (int i = 0; i < 100 && !upstream.connections()[0]->ready(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    auto good = nmea::build("IIDBT,32.8,f,10.0,M,5.4,F");
    upstream_feed.publish(make_packet(Packet::text(good)));
    upstream_feed.publish(make_packet(Packet::text(nmea::corrupt_checksum(good))));
    upstream_feed.publish(make_packet(Packet::text("garbage\r\n")));

    for (int i = 0; i < 300 && live.received() + live.rejected() < 3; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    CHECK(live.received() == 1);
    CHECK(live.rejected() == 2);

    auto packets = live.advance(0, 100);
    REQUIRE(packets.size() == 1);
    CHECK(packets[0].as_text() == good);
    CHECK(live.advance(100, 200).empty());

    live.stop();
    CHECK_FALSE(live.connected());
    upstream.stop();
}

TEST_CASE("Live source needs an endpoint") {
    LiveSource live("", 0);
    CHECK(live.start(0).is_err());
}
