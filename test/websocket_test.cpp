#include <doctest/doctest.h>
#include <nmeabridge/net/websocket.hpp>

using namespace nmeabridge;
using namespace nmeabridge::net;

namespace {

    // Client frames carry a mask
    Bytes masked_frame(ws::Opcode op, const dp::String &text, bool fin = true) {
        const u8 mask[4] = {0x37, 0xFA, 0x21, 0x3D};
        Bytes out;
        out.push_back(static_cast<u8>((fin ? 0x80 : 0x00) | static_cast<u8>(op)));
        if (text.size() < 126) {
            out.push_back(static_cast<u8>(0x80 | text.size()));
        } else {
            out.push_back(0x80 | 126);
            out.push_back(static_cast<u8>(text.size() >> 8));
            out.push_back(static_cast<u8>(text.size() & 0xFF));
        }
        for (u8 m : mask)
            out.push_back(m);
        for (usize i = 0; i < text.size(); ++i)
            out.push_back(static_cast<u8>(text[i]) ^ mask[i % 4]);
        return out;
    }

    void feed(ws::FrameDecoder &d, const Bytes &b) { d.feed(b.data(), b.size()); }

    HttpRequest upgrade_request(bool with_upgrade = true, bool with_key = true) {
        HttpRequest req;
        req.method = "GET";
        req.path = "/";
        req.headers["connection"] = "Upgrade";
        if (with_upgrade)
            req.headers["upgrade"] = "websocket";
        if (with_key)
            req.headers["sec-websocket-key"] = "dGhlIHNhbXBsZSBub25jZQ==";
        return req;
    }

} // namespace

TEST_CASE("WebSocket accept key") {
    CHECK(ws::accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_CASE("WebSocket handshake") {
    SUBCASE("valid upgrade") {
        auto req = upgrade_request();
        auto neg = ws::negotiate(req, ws::PayloadMode::Text);
        auto resp = ws::handshake_response(req, neg);
        REQUIRE(resp.is_ok());
        CHECK(resp.value().status == 101);

        auto text = ws::serialize_upgrade(resp.value());
        CHECK(text.find("HTTP/1.1 101 Switching Protocols\r\n") == 0);
        CHECK(text.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n") != dp::String::npos);
        CHECK(text.find("Sec-WebSocket-Protocol") == dp::String::npos);
        CHECK(text.size() >= 4);
        CHECK(text.substr(text.size() - 4) == "\r\n\r\n");
    }

    SUBCASE("missing key") {
        auto req = upgrade_request(true, false);
        auto resp = ws::handshake_response(req, ws::negotiate(req, ws::PayloadMode::Text));
        CHECK(resp.is_err());
    }

    SUBCASE("not an upgrade") {
        auto req = upgrade_request(false, true);
        CHECK(ws::handshake_response(req, ws::negotiate(req, ws::PayloadMode::Text)).is_err());
    }

    SUBCASE("POST rejected") {
        auto req = upgrade_request();
        req.method = "POST";
        CHECK(ws::handshake_response(req, ws::negotiate(req, ws::PayloadMode::Text)).is_err());
    }
}

TEST_CASE("WebSocket payload negotiation") {
    auto req = upgrade_request();

    SUBCASE("fallback when nothing requested") {
        CHECK(ws::negotiate(req, ws::PayloadMode::Binary).mode == ws::PayloadMode::Binary);
        CHECK_FALSE(ws::negotiate(req, ws::PayloadMode::Binary).subprotocol.has_value());
    }

    SUBCASE("subprotocol selects binary and is echoed") {
        req.headers["sec-websocket-protocol"] = "chat, NMEA2000";
        auto neg = ws::negotiate(req, ws::PayloadMode::Text);
        CHECK(neg.mode == ws::PayloadMode::Binary);
        REQUIRE(neg.subprotocol.has_value());
        CHECK(*neg.subprotocol == "nmea2000");

        auto resp = ws::handshake_response(req, neg);
        REQUIRE(resp.is_ok());
        CHECK(ws::serialize_upgrade(resp.value()).find("Sec-WebSocket-Protocol: nmea2000") != dp::String::npos);
    }

    SUBCASE("query parameter") {
        req.query["format"] = "binary";
        CHECK(ws::negotiate(req, ws::PayloadMode::Text).mode == ws::PayloadMode::Binary);
    }

    SUBCASE("subprotocol wins over query") {
        req.query["format"] = "binary";
        req.headers["sec-websocket-protocol"] = "nmea0183";
        CHECK(ws::negotiate(req, ws::PayloadMode::Binary).mode == ws::PayloadMode::Text);
    }
}

TEST_CASE("WebSocket server frame encoding") {
    SUBCASE("short text") {
        auto f = ws::encode_frame(ws::Opcode::Text, dp::String("hi"));
        REQUIRE(f.size() == 4);
        CHECK(f[0] == 0x81);
        CHECK(f[1] == 0x02);
        CHECK(f[2] == 'h');
        CHECK(f[3] == 'i');
    }

    SUBCASE("16-bit length") {
        Bytes payload(300, 0xAB);
        auto f = ws::encode_frame(ws::Opcode::Binary, payload);
        REQUIRE(f.size() == 304);
        CHECK(f[0] == 0x82);
        CHECK(f[1] == 126);
        CHECK(f[2] == 0x01);
        CHECK(f[3] == 0x2C);
    }

    SUBCASE("64-bit length") {
        Bytes payload(70000, 0x00);
        auto f = ws::encode_frame(ws::Opcode::Binary, payload);
        REQUIRE(f.size() == 70010);
        CHECK(f[1] == 127);
        CHECK(f[7] == 0x01);
        CHECK(f[8] == 0x11);
        CHECK(f[9] == 0x70);
    }

    SUBCASE("close frame carries status") {
        auto f = ws::close_frame(1002);
        REQUIRE(f.size() == 4);
        CHECK(f[0] == 0x88);
        CHECK(f[2] == 0x03);
        CHECK(f[3] == 0xEA);
    }
}

TEST_CASE("WebSocket frame decoder") {
    ws::FrameDecoder d;

    SUBCASE("masked text message") {
        feed(d, masked_frame(ws::Opcode::Text, "$CCCMD,STATUS"));
        auto m = d.next();
        REQUIRE(m.is_ok());
        REQUIRE(m.value().has_value());
        CHECK(m.value()->opcode == ws::Opcode::Text);
        CHECK(m.value()->text() == "$CCCMD,STATUS");
        CHECK(d.buffered() == 0);
    }

    SUBCASE("partial input waits for more bytes") {
        auto frame = masked_frame(ws::Opcode::Text, "hello");
        d.feed(frame.data(), 4);
        auto m = d.next();
        REQUIRE(m.is_ok());
        CHECK_FALSE(m.value().has_value());
        d.feed(frame.data() + 4, frame.size() - 4);
        m = d.next();
        REQUIRE(m.is_ok());
        REQUIRE(m.value().has_value());
        CHECK(m.value()->text() == "hello");
    }

    SUBCASE("extended length") {
        dp::String text(200, 'x');
        feed(d, masked_frame(ws::Opcode::Text, text));
        auto m = d.next();
        REQUIRE(m.is_ok());
        REQUIRE(m.value().has_value());
        CHECK(m.value()->payload.size() == 200);
    }

    SUBCASE("fragments reassembled around a ping") {
        feed(d, masked_frame(ws::Opcode::Text, "$CCCMD,", false));
        feed(d, masked_frame(ws::Opcode::Ping, "p"));
        feed(d, masked_frame(ws::Opcode::Continuation, "STATUS"));

        auto ping = d.next();
        REQUIRE(ping.is_ok());
        REQUIRE(ping.value().has_value());
        CHECK(ping.value()->opcode == ws::Opcode::Ping);
        CHECK(ping.value()->text() == "p");

        auto msg = d.next();
        REQUIRE(msg.is_ok());
        REQUIRE(msg.value().has_value());
        CHECK(msg.value()->opcode == ws::Opcode::Text);
        CHECK(msg.value()->text() == "$CCCMD,STATUS");
    }

    SUBCASE("two messages in one read") {
        auto a = masked_frame(ws::Opcode::Text, "one");
        auto b = masked_frame(ws::Opcode::Text, "two");
        a.insert(a.end(), b.begin(), b.end());
        feed(d, a);
        CHECK(d.next().value()->text() == "one");
        CHECK(d.next().value()->text() == "two");
        CHECK_FALSE(d.next().value().has_value());
    }

    SUBCASE("unmasked client frame rejected") {
        feed(d, ws::encode_frame(ws::Opcode::Text, dp::String("x")));
        CHECK(d.next().is_err());
    }

    SUBCASE("unmasked frames accepted when masking is not required") {
        ws::FrameDecoder client(false);
        auto f = ws::encode_frame(ws::Opcode::Binary, Bytes{1, 2, 3});
        client.feed(f.data(), f.size());
        auto m = client.next();
        REQUIRE(m.is_ok());
        REQUIRE(m.value().has_value());
        CHECK(m.value()->opcode == ws::Opcode::Binary);
        CHECK(m.value()->payload.size() == 3);
    }

    SUBCASE("continuation without start") {
        feed(d, masked_frame(ws::Opcode::Continuation, "x"));
        CHECK(d.next().is_err());
    }

    SUBCASE("fragmented control frame") {
        feed(d, masked_frame(ws::Opcode::Ping, "x", false));
        CHECK(d.next().is_err());
    }

    SUBCASE("reserved bits") {
        auto f = masked_frame(ws::Opcode::Text, "x");
        f[0] |= 0x40;
        feed(d, f);
        CHECK(d.next().is_err());
    }

    SUBCASE("oversize message") {
        Bytes header = {0x82, 0x80 | 127, 0, 0, 0, 0, 0x10, 0, 0, 0, 1, 2, 3, 4};
        feed(d, header);
        auto m = d.next();
        REQUIRE(m.is_err());
        CHECK(m.error().code == ErrorCode::BufferOverflow);
    }
}
