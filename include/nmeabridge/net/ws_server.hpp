#pragma once

#include "server.hpp"
#include "websocket.hpp"

namespace nmeabridge::net {

    // ─── WebSocket server ───────────────────────────────────────────────────────
    // Sentences go out as text frames, NMEA 2000 wire frames as binary frames.
    // Each client receives only the payload kind it negotiated.
    class WebSocketServer : public StreamServer {
        std::atomic<ws::PayloadMode> default_mode_{ws::PayloadMode::Text};

        void dispatch_text(ClientConnection &conn, const dp::String &text) {
            if (!on_line_)
                return;
            if (!text.empty() && text[0] == '{') {
                on_line_(conn, text);
                return;
            }
            usize pos = 0;
            while (pos < text.size()) {
                usize eol = text.find('\n', pos);
                if (eol == dp::String::npos)
                    eol = text.size();
                dp::String line = trim(text.substr(pos, eol - pos));
                if (!line.empty())
                    on_line_(conn, line);
                pos = eol + 1;
            }
        }

      protected:
        ConnectionKind kind() const noexcept override { return ConnectionKind::WebSocket; }
        const char *log_category() const noexcept override { return "nmeabridge.ws"; }

        void serve(ClientConnection &conn) override {
            dp::String leftover;
            auto req = read_request(conn.socket(), 5000, &leftover);
            if (req.is_err()) {
                echo::category("nmeabridge.ws").warn("client ", conn.id(), ": handshake failed: ", req.error().message);
                return;
            }
            auto neg = ws::negotiate(req.value(), default_mode_.load());
            auto resp = ws::handshake_response(req.value(), neg);
            if (resp.is_err()) {
                auto bad = HttpResponse::error(400, resp.error().message);
                auto w = conn.socket().send_all(serialize(bad));
                if (w.is_err())
                    echo::category("nmeabridge.ws").debug("client ", conn.id(), ": ", w.error().message);
                echo::category("nmeabridge.ws").warn("client ", conn.id(), ": ", resp.error().message);
                return;
            }
            auto sent = conn.write(Bytes(serialize_upgrade_bytes(resp.value())));
            if (sent.is_err()) {
                echo::category("nmeabridge.ws").warn("client ", conn.id(), ": ", sent.error().message);
                return;
            }

            conn.set_framer([](const Packet &p) {
                return ws::encode_frame(p.kind == PacketKind::Text ? ws::Opcode::Text : ws::Opcode::Binary, p.bytes);
            });
            conn.set_filter(neg.mode == ws::PayloadMode::Text ? PayloadFilter::TextOnly : PayloadFilter::BinaryOnly,
                            ws::to_string(neg.mode));
            conn.mark_ready();
            echo::category("nmeabridge.ws").info("client ", conn.id(), " upgraded, ", ws::to_string(neg.mode), " frames");

            ws::FrameDecoder decoder;
            if (!leftover.empty())
                decoder.feed(reinterpret_cast<const u8 *>(leftover.data()), leftover.size());
            u8 buf[2048];
            while (running_ && !conn.closed()) {
                while (true) {
                    auto msg = decoder.next();
                    if (msg.is_err()) {
                        echo::category("nmeabridge.ws").warn("client ", conn.id(), ": protocol error: ", msg.error().message);
                        auto w = conn.write(ws::close_frame(1002));
                        if (w.is_err())
                            echo::category("nmeabridge.ws").debug("client ", conn.id(), ": ", w.error().message);
                        return;
                    }
                    if (!msg.value())
                        break;
                    const ws::Message &m = *msg.value();
                    conn.touch();
                    switch (m.opcode) {
                    case ws::Opcode::Ping: {
                        auto w = conn.write(ws::encode_frame(ws::Opcode::Pong, m.payload));
                        if (w.is_err())
                            return;
                        break;
                    }
                    case ws::Opcode::Close: {
                        auto w = conn.write(ws::encode_frame(ws::Opcode::Close, m.payload));
                        if (w.is_err())
                            echo::category("nmeabridge.ws").debug("client ", conn.id(), ": ", w.error().message);
                        echo::category("nmeabridge.ws").info("client ", conn.id(), " closed the connection");
                        return;
                    }
                    case ws::Opcode::Text:
                        dispatch_text(conn, m.text());
                        break;
                    case ws::Opcode::Binary:
                        echo::category("nmeabridge.ws").debug("client ", conn.id(), ": ignoring ", m.payload.size(), " byte binary message");
                        break;
                    default:
                        break;
                    }
                }

                auto r = conn.socket().recv(buf, sizeof(buf), 200);
                if (r.is_err()) {
                    if (r.error().code == ErrorCode::Timeout)
                        continue;
                    if (r.error().code != ErrorCode::Disconnected)
                        echo::category("nmeabridge.ws").warn("client ", conn.id(), ": ", r.error().message);
                    return;
                }
                decoder.feed(buf, r.value());
            }
            if (conn.closed()) {
                auto w = conn.write(ws::close_frame(1001));
                if (w.is_err())
                    echo::category("nmeabridge.ws").debug("client ", conn.id(), ": ", w.error().message);
            }
        }

        static Bytes serialize_upgrade_bytes(const HttpResponse &r) {
            dp::String s = ws::serialize_upgrade(r);
            return Bytes(s.begin(), s.end());
        }

      public:
        using StreamServer::StreamServer;
        ~WebSocketServer() override { stop(); }

        // Mode for clients that negotiate neither a subprotocol nor ?format=
        void set_default_mode(ws::PayloadMode m) noexcept { default_mode_ = m; }
        ws::PayloadMode default_mode() const noexcept { return default_mode_; }
    };

} // namespace nmeabridge::net
