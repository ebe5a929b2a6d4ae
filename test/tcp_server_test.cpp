#include <doctest/doctest.h>
#include <nmeabridge/net/tcp_server.hpp>
#include <nmeabridge/net/ws_server.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace nmeabridge;
using namespace nmeabridge::net;

namespace {

    template <typename Pred> bool wait_for(Pred pred, int timeout_ms = 2000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    // Reads until the accumulated text contains needle
    dp::String read_until(const Socket &s, const dp::String &needle, int timeout_ms = 2000) {
        dp::String got;
        u8 buf[512];
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (got.find(needle) == dp::String::npos && std::chrono::steady_clock::now() < deadline) {
            auto r = s.recv(buf, sizeof(buf), 50);
            if (r.is_err()) {
                if (r.error().code == ErrorCode::Timeout)
                    continue;
                break;
            }
            got.append(reinterpret_cast<const char *>(buf), r.value());
        }
        return got;
    }

    bool peer_closed(const Socket &s, int timeout_ms = 2000) {
        u8 buf[256];
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            auto r = s.recv(buf, sizeof(buf), 50);
            if (r.is_err() && r.error().code != ErrorCode::Timeout)
                return true;
        }
        return false;
    }

} // namespace

TEST_CASE("TCP server") {
    Broadcast broadcast;
    TcpServer server(ServerConfig{}.bind("127.0.0.1").listen_on(0).clients(2), broadcast);
    REQUIRE(server.start().is_ok());
    REQUIRE(server.port() != 0);

    SUBCASE("broadcast reaches connected client") {
        auto client = Socket::connect("127.0.0.1", server.port());
        REQUIRE(client.is_ok());
        REQUIRE(wait_for([&] { return server.connection_count() == 1; }));
        REQUIRE(wait_for([&] { return server.connections()[0]->ready(); }));

        broadcast.publish(make_packet(Packet::text("$IIHDT,90.0,T*1C\r\n")));
        auto got = read_until(client.value(), "\r\n");
        CHECK(got == "$IIHDT,90.0,T*1C\r\n");
        CHECK(server.accepted() == 1);
    }

    SUBCASE("inbound lines reach the line handler") {
        server.set_line_handler([](ClientConnection &conn, const dp::String &line) {
            conn.enter_command_mode();
            conn.reply("echo:" + line + "\r\n");
        });
        auto client = Socket::connect("127.0.0.1", server.port());
        REQUIRE(client.is_ok());
        REQUIRE(client.value().send_all(dp::String("$CCCMD,STATUS\r\n")).is_ok());
        auto got = read_until(client.value(), "\r\n");
        CHECK(got == "echo:$CCCMD,STATUS\r\n");
        REQUIRE(server.connection_info().size() == 1);
        CHECK(server.connection_info()[0].command_mode);
    }

    SUBCASE("client limit refuses extra connections") {
        auto a = Socket::connect("127.0.0.1", server.port());
        auto b = Socket::connect("127.0.0.1", server.port());
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        REQUIRE(wait_for([&] { return server.connection_count() == 2; }));

        auto c = Socket::connect("127.0.0.1", server.port());
        REQUIRE(c.is_ok());
        CHECK(peer_closed(c.value()));
        CHECK(server.refused() == 1);
        CHECK(server.connection_count() == 2);
    }

    SUBCASE("disconnect by id") {
        auto client = Socket::connect("127.0.0.1", server.port());
        REQUIRE(client.is_ok());
        REQUIRE(wait_for([&] { return server.connection_count() == 1; }));
        auto id = server.connection_info()[0].id;
        CHECK(server.disconnect(id));
        CHECK(peer_closed(client.value()));
        CHECK(wait_for([&] { return server.connection_count() == 0; }));
        CHECK_FALSE(server.disconnect(id));
    }

    SUBCASE("stop is idempotent and closes clients") {
        auto client = Socket::connect("127.0.0.1", server.port());
        REQUIRE(client.is_ok());
        REQUIRE(wait_for([&] { return server.connection_count() == 1; }));
        server.stop();
        server.stop();
        CHECK_FALSE(server.running());
        CHECK(peer_closed(client.value()));
        CHECK(broadcast.subscriber_count() == 0);
    }

    server.stop();
}

TEST_CASE("A stalled client does not slow the others") {
    Broadcast broadcast;
    TcpServer server(ServerConfig{}.bind("127.0.0.1").listen_on(0).clients(2).queue(64), broadcast);
    REQUIRE(server.start().is_ok());

    // Never read from: its socket buffer fills and its queue overflows
    auto stalled = Socket::connect("127.0.0.1", server.port());
    REQUIRE(stalled.is_ok());
    auto healthy = Socket::connect("127.0.0.1", server.port());
    REQUIRE(healthy.is_ok());
    REQUIRE(wait_for([&] { return server.connection_count() == 2; }));
    REQUIRE(wait_for([&] {
        auto conns = server.connections();
        return std::all_of(conns.begin(), conns.end(), [](const auto &c) { return c->ready(); });
    }));

    std::atomic<bool> saw_end{false};
    std::thread reader([&] {
        dp::String tail;
        u8 buf[4096];
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
        while (!saw_end && std::chrono::steady_clock::now() < deadline) {
            auto r = healthy.value().recv(buf, sizeof(buf), 50);
            if (r.is_err()) {
                if (r.error().code == ErrorCode::Timeout)
                    continue;
                break;
            }
            tail.append(reinterpret_cast<const char *>(buf), r.value());
            if (tail.find("$END") != dp::String::npos)
                saw_end = true;
            if (tail.size() > 64)
                tail = tail.substr(tail.size() - 16);
        }
    });

    dp::String filler;
    for (i32 i = 0; i < 4000; ++i)
        filler += static_cast<char>('A' + i % 26);
    dp::String line = "$PNBFL," + filler + "\r\n";

    i64 worst_us = 0;
    for (i32 i = 0; i < 5000; ++i) {
        auto packet = make_packet(Packet::text(line));
        auto t0 = std::chrono::steady_clock::now();
        broadcast.publish(packet);
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - t0).count();
        worst_us = std::max<i64>(worst_us, us);
    }
    broadcast.publish(make_packet(Packet::text("$END\r\n")));
    reader.join();

    CHECK(saw_end);
    CHECK(worst_us < 5000);
    CHECK(server.connection_count() == 2);
    u64 dropped = 0;
    for (const auto &info : server.connection_info())
        dropped += info.dropped;
    CHECK(dropped > 0);
    server.stop();
}

TEST_CASE("TCP server bind failure") {
    Broadcast broadcast;
    TcpServer first(ServerConfig{}.bind("127.0.0.1").listen_on(0), broadcast);
    REQUIRE(first.start().is_ok());

    TcpServer second(ServerConfig{}.bind("127.0.0.1").listen_on(first.port()), broadcast);
    auto r = second.start();
    REQUIRE(r.is_err());
    CHECK(r.error().code == ErrorCode::BindFailed);
    CHECK(r.error().error_class() == ErrorClass::Fatal);
}

TEST_CASE("Client connection backpressure") {
    SUBCASE("drop oldest keeps the newest packets") {
        ClientConnection conn(1, ConnectionKind::Tcp, "test", Socket(), 2, OverflowPolicy::DropOldest);
        conn.mark_ready();
        CHECK(conn.offer(make_packet(Packet::text("a"))) == PushResult::Queued);
        CHECK(conn.offer(make_packet(Packet::text("b"))) == PushResult::Queued);
        CHECK(conn.offer(make_packet(Packet::text("c"))) == PushResult::DroppedOldest);
        CHECK(conn.queued() == 2);
        CHECK(conn.dropped() == 1);
        CHECK_FALSE(conn.closed());
    }

    SUBCASE("reject closes the connection") {
        ClientConnection conn(2, ConnectionKind::Tcp, "test", Socket(), 1, OverflowPolicy::Reject);
        conn.mark_ready();
        CHECK(conn.offer(make_packet(Packet::text("a"))) == PushResult::Queued);
        CHECK(conn.offer(make_packet(Packet::text("b"))) == PushResult::Rejected);
        CHECK(conn.closed());
        CHECK(conn.offer(make_packet(Packet::text("c"))) == PushResult::Closed);
    }

    SUBCASE("nothing is queued before the connection is ready") {
        ClientConnection conn(3, ConnectionKind::Tcp, "test", Socket(), 4);
        conn.offer(make_packet(Packet::text("a")));
        CHECK(conn.queued() == 0);
    }

    SUBCASE("payload filter skips other kinds") {
        ClientConnection conn(4, ConnectionKind::WebSocket, "test", Socket(), 4);
        conn.set_filter(PayloadFilter::TextOnly, "text");
        conn.mark_ready();
        conn.offer(make_packet(Packet::binary(Bytes{1, 2, 3})));
        conn.offer(make_packet(Packet::text("$X")));
        CHECK(conn.queued() == 1);
        CHECK(conn.info().format == "text");
    }
}

TEST_CASE("WebSocket server delivers the negotiated payload kind") {
    Broadcast broadcast;
    WebSocketServer server(ServerConfig{}.bind("127.0.0.1").listen_on(0), broadcast);
    REQUIRE(server.start().is_ok());

    auto client = Socket::connect("127.0.0.1", server.port());
    REQUIRE(client.is_ok());
    REQUIRE(client.value()
                .send_all(dp::String("GET /?format=binary HTTP/1.1\r\nHost: localhost\r\nUpgrade: websocket\r\n"
                                     "Connection: Upgrade\r\nSec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
                                     "Sec-WebSocket-Version: 13\r\n\r\n"))
                .is_ok());
    auto head = read_until(client.value(), "\r\n\r\n");
    CHECK(head.find("101 Switching Protocols") != dp::String::npos);
    CHECK(head.find("s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") != dp::String::npos);
    REQUIRE(wait_for([&] {
        auto conns = server.connections();
        return conns.size() == 1 && conns[0]->ready();
    }));

    broadcast.publish(make_packet(Packet::text("$IIHDT,90.0,T*1C\r\n")));
    broadcast.publish(make_packet(Packet::binary(Bytes{0x09, 0xF1, 0x12, 0x01, 0x01, 0xAA})));

    ws::FrameDecoder decoder(false);
    dp::Optional<ws::Message> msg;
    u8 buf[256];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!msg && std::chrono::steady_clock::now() < deadline) {
        auto r = client.value().recv(buf, sizeof(buf), 50);
        if (r.is_ok())
            decoder.feed(buf, r.value());
        auto next = decoder.next();
        REQUIRE(next.is_ok());
        msg = next.value();
    }
    REQUIRE(msg.has_value());
    CHECK(msg->opcode == ws::Opcode::Binary);
    REQUIRE(msg->payload.size() == 6);
    CHECK(msg->payload[5] == 0xAA);

    server.stop();
}
