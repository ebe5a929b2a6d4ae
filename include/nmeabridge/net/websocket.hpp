#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "http.hpp"
#include <datapod/datapod.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace nmeabridge::net::ws {

    inline constexpr const char *HANDSHAKE_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    inline constexpr usize MAX_MESSAGE = 1 << 20;

    enum class Opcode : u8 { Continuation = 0x0, Text = 0x1, Binary = 0x2, Close = 0x8, Ping = 0x9, Pong = 0xA };

    inline bool is_control(Opcode op) noexcept { return (static_cast<u8>(op) & 0x08) != 0; }

    // ─── Handshake ──────────────────────────────────────────────────────────────
    // Sec-WebSocket-Accept = base64(sha1(key + GUID))
    inline dp::String accept_key(const dp::String &client_key) {
        dp::String material = client_key + HANDSHAKE_GUID;
        unsigned char digest[SHA_DIGEST_LENGTH];
        SHA1(reinterpret_cast<const unsigned char *>(material.data()), material.size(), digest);
        unsigned char encoded[4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1];
        int n = EVP_EncodeBlock(encoded, digest, SHA_DIGEST_LENGTH);
        return dp::String(reinterpret_cast<const char *>(encoded), static_cast<usize>(n));
    }

    enum class PayloadMode : u8 { Text = 0, Binary };

    inline const char *to_string(PayloadMode m) noexcept { return m == PayloadMode::Text ? "text" : "binary"; }

    struct Negotiated {
        PayloadMode mode = PayloadMode::Text;
        dp::Optional<dp::String> subprotocol;
    };

    // Sec-WebSocket-Protocol nmea0183|nmea2000 wins over ?format=text|binary;
    // otherwise the fallback applies
    inline Negotiated negotiate(const HttpRequest &req, PayloadMode fallback) {
        Negotiated n;
        n.mode = fallback;
        if (auto protos = req.header("sec-websocket-protocol")) {
            usize pos = 0;
            while (pos <= protos->size()) {
                usize comma = protos->find(',', pos);
                if (comma == dp::String::npos)
                    comma = protos->size();
                dp::String p = to_lower(trim(protos->substr(pos, comma - pos)));
                if (p == "nmea0183") {
                    n.mode = PayloadMode::Text;
                    n.subprotocol = dp::String("nmea0183");
                    return n;
                }
                if (p == "nmea2000") {
                    n.mode = PayloadMode::Binary;
                    n.subprotocol = dp::String("nmea2000");
                    return n;
                }
                pos = comma + 1;
            }
        }
        if (auto fmt = req.param("format")) {
            dp::String f = to_lower(*fmt);
            if (f == "text")
                n.mode = PayloadMode::Text;
            else if (f == "binary")
                n.mode = PayloadMode::Binary;
        }
        return n;
    }

    inline Result<HttpResponse> handshake_response(const HttpRequest &req, const Negotiated &neg) {
        if (req.method != "GET")
            return Result<HttpResponse>::err(Error::invalid_argument("websocket upgrade requires GET"));
        auto upgrade = req.header("upgrade");
        if (!upgrade || to_lower(*upgrade) != "websocket")
            return Result<HttpResponse>::err(Error::invalid_argument("missing Upgrade: websocket"));
        auto key = req.header("sec-websocket-key");
        if (!key || key->empty())
            return Result<HttpResponse>::err(Error::invalid_argument("missing Sec-WebSocket-Key"));

        HttpResponse r;
        r.status = 101;
        r.content_type.clear();
        r.headers.push_back({"Upgrade", "websocket"});
        r.headers.push_back({"Sec-WebSocket-Accept", accept_key(*key)});
        if (neg.subprotocol)
            r.headers.push_back({"Sec-WebSocket-Protocol", *neg.subprotocol});
        return Result<HttpResponse>::ok(std::move(r));
    }

    // 101 responses carry no body and keep the connection open
    inline dp::String serialize_upgrade(const HttpResponse &r) {
        dp::String out = "HTTP/1.1 101 Switching Protocols\r\nConnection: Upgrade\r\n";
        for (const auto &[k, v] : r.headers)
            out += k + ": " + v + "\r\n";
        out += "\r\n";
        return out;
    }

    // ─── Framing ────────────────────────────────────────────────────────────────
    // Server frames are never masked
    inline Bytes encode_frame(Opcode op, const u8 *data, usize len, bool fin = true) {
        Bytes out;
        out.reserve(len + 10);
        out.push_back(static_cast<u8>((fin ? 0x80 : 0x00) | (static_cast<u8>(op) & 0x0F)));
        if (len < 126) {
            out.push_back(static_cast<u8>(len));
        } else if (len <= 0xFFFF) {
            out.push_back(126);
            out.push_back(static_cast<u8>((len >> 8) & 0xFF));
            out.push_back(static_cast<u8>(len & 0xFF));
        } else {
            out.push_back(127);
            for (int i = 7; i >= 0; --i)
                out.push_back(static_cast<u8>((static_cast<u64>(len) >> (8 * i)) & 0xFF));
        }
        out.insert(out.end(), data, data + len);
        return out;
    }

    inline Bytes encode_frame(Opcode op, const Bytes &payload) { return encode_frame(op, payload.data(), payload.size()); }
    inline Bytes encode_frame(Opcode op, const dp::String &payload) {
        return encode_frame(op, reinterpret_cast<const u8 *>(payload.data()), payload.size());
    }

    // Close payload: 2-byte status code
    inline Bytes close_frame(u16 code = 1000) {
        u8 body[2] = {static_cast<u8>(code >> 8), static_cast<u8>(code & 0xFF)};
        return encode_frame(Opcode::Close, body, 2);
    }

    // Unmasks the payload in place
    inline void apply_mask(Bytes &payload, const u8 mask[4]) {
        for (usize i = 0; i < payload.size(); ++i)
            payload[i] ^= mask[i % 4];
    }

    struct Message {
        Opcode opcode = Opcode::Text;
        Bytes payload;

        dp::String text() const { return dp::String(payload.begin(), payload.end()); }
    };

    // ─── Incremental frame decoder ──────────────────────────────────────────────
    // Feed raw bytes, then pop complete messages. Fragmented data messages are
    // reassembled; control frames may arrive between fragments.
    class FrameDecoder {
        Bytes buf_;
        bool require_mask_ = true;
        bool in_fragment_ = false;
        Opcode fragment_op_ = Opcode::Text;
        Bytes fragment_;

      public:
        explicit FrameDecoder(bool require_mask = true) : require_mask_(require_mask) {}

        void feed(const u8 *data, usize len) { buf_.insert(buf_.end(), data, data + len); }

        usize buffered() const noexcept { return buf_.size(); }

        // Empty optional when more bytes are needed
        Result<dp::Optional<Message>> next() {
            while (true) {
                if (buf_.size() < 2)
                    return Result<dp::Optional<Message>>::ok(dp::nullopt);
                u8 b0 = buf_[0];
                u8 b1 = buf_[1];
                bool fin = (b0 & 0x80) != 0;
                if (b0 & 0x70)
                    return Result<dp::Optional<Message>>::err(Error::invalid_argument("reserved bits set"));
                auto op = static_cast<Opcode>(b0 & 0x0F);
                bool masked = (b1 & 0x80) != 0;
                if (require_mask_ && !masked)
                    return Result<dp::Optional<Message>>::err(Error::invalid_argument("client frame not masked"));

                usize pos = 2;
                u64 len = b1 & 0x7F;
                if (len == 126) {
                    if (buf_.size() < pos + 2)
                        return Result<dp::Optional<Message>>::ok(dp::nullopt);
                    len = (static_cast<u64>(buf_[2]) << 8) | buf_[3];
                    pos += 2;
                } else if (len == 127) {
                    if (buf_.size() < pos + 8)
                        return Result<dp::Optional<Message>>::ok(dp::nullopt);
                    len = 0;
                    for (usize i = 0; i < 8; ++i)
                        len = (len << 8) | buf_[pos + i];
                    pos += 8;
                }
                if (len > MAX_MESSAGE)
                    return Result<dp::Optional<Message>>::err(Error::buffer_overflow());
                if (is_control(op) && (len > 125 || !fin))
                    return Result<dp::Optional<Message>>::err(Error::invalid_argument("invalid control frame"));

                u8 mask[4] = {0, 0, 0, 0};
                if (masked) {
                    if (buf_.size() < pos + 4)
                        return Result<dp::Optional<Message>>::ok(dp::nullopt);
                    for (usize i = 0; i < 4; ++i)
                        mask[i] = buf_[pos + i];
                    pos += 4;
                }
                if (buf_.size() < pos + len)
                    return Result<dp::Optional<Message>>::ok(dp::nullopt);

                Bytes payload(buf_.begin() + static_cast<isize>(pos), buf_.begin() + static_cast<isize>(pos + len));
                buf_.erase(buf_.begin(), buf_.begin() + static_cast<isize>(pos + len));
                if (masked)
                    apply_mask(payload, mask);

                if (is_control(op)) {
                    Message m;
                    m.opcode = op;
                    m.payload = std::move(payload);
                    return Result<dp::Optional<Message>>::ok(std::move(m));
                }

                if (op == Opcode::Continuation) {
                    if (!in_fragment_)
                        return Result<dp::Optional<Message>>::err(Error::invalid_argument("unexpected continuation"));
                    if (fragment_.size() + payload.size() > MAX_MESSAGE)
                        return Result<dp::Optional<Message>>::err(Error::buffer_overflow());
                    fragment_.insert(fragment_.end(), payload.begin(), payload.end());
                } else {
                    if (in_fragment_)
                        return Result<dp::Optional<Message>>::err(Error::invalid_argument("interleaved data frame"));
                    fragment_op_ = op;
                    fragment_ = std::move(payload);
                }
                if (!fin) {
                    in_fragment_ = true;
                    continue;
                }
                in_fragment_ = false;
                Message m;
                m.opcode = fragment_op_;
                m.payload = std::move(fragment_);
                fragment_.clear();
                return Result<dp::Optional<Message>>::ok(std::move(m));
            }
        }
    };

} // namespace nmeabridge::net::ws
