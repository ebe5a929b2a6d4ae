#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <memory>
#include <string>

namespace nmeabridge {

    // ─── Encoded wire unit ───────────────────────────────────────────────────────
    // Text packets carry one NMEA 0183 sentence including CRLF. Binary packets
    // carry one NMEA 2000 wire frame.
    enum class PacketKind : u8 { Text = 0, Binary = 1 };

    struct Packet {
        PacketKind kind = PacketKind::Text;
        Bytes bytes;
        u64 tick = 0;

        static Packet text(const dp::String &s, u64 tick = 0) {
            Packet p;
            p.kind = PacketKind::Text;
            p.bytes.assign(s.begin(), s.end());
            p.tick = tick;
            return p;
        }

        static Packet binary(Bytes b, u64 tick = 0) {
            Packet p;
            p.kind = PacketKind::Binary;
            p.bytes = std::move(b);
            p.tick = tick;
            return p;
        }

        dp::String as_text() const { return dp::String(bytes.begin(), bytes.end()); }
    };

    using PacketPtr = std::shared_ptr<const Packet>;

    inline PacketPtr make_packet(Packet p) { return std::make_shared<const Packet>(std::move(p)); }

} // namespace nmeabridge
