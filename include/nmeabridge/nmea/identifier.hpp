#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace nmeabridge::nmea {

    // ─── CAN Identifier (29-bit extended ID) ────────────────────────────────────
    // Layout: [Priority:3][Reserved:1][DataPage:1][PDU Format:8][PDU Specific:8][Source:8]
    struct Identifier {
        u32 raw = 0;

        constexpr Identifier() = default;
        constexpr explicit Identifier(u32 id) : raw(id & 0x1FFFFFFF) {}

        constexpr Priority priority() const noexcept { return static_cast<Priority>((raw >> 26) & 0x07); }
        constexpr u8 pdu_format() const noexcept { return static_cast<u8>((raw >> 16) & 0xFF); }
        constexpr u8 pdu_specific() const noexcept { return static_cast<u8>((raw >> 8) & 0xFF); }
        constexpr Address source() const noexcept { return static_cast<Address>(raw & 0xFF); }

        constexpr PGN pgn() const noexcept {
            PGN base = (raw >> 8) & 0x3FF00;
            // PDU2 PGNs include the group extension
            return pdu_format() >= 240 ? base | pdu_specific() : base;
        }

        static constexpr Identifier encode(Priority prio, PGN pgn, Address src,
                                           Address dst = BROADCAST_ADDRESS) noexcept {
            u32 pf = (pgn >> 8) & 0xFF;
            u32 id = (static_cast<u32>(prio) & 0x07) << 26;
            id |= (pgn & 0x30000) << 8; // EDP and DP
            id |= pf << 16;
            id |= (pf < 240 ? static_cast<u32>(dst) : (pgn & 0xFF)) << 8;
            id |= src;
            return Identifier(id);
        }

        constexpr bool operator==(const Identifier &o) const noexcept { return raw == o.raw; }
    };

    // ─── Single CAN frame ───────────────────────────────────────────────────────
    struct Frame {
        Identifier id;
        dp::Array<u8, 8> data = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
        u8 length = 8;

        PGN pgn() const noexcept { return id.pgn(); }
        Address source() const noexcept { return id.source(); }
    };

    // ─── Bridge wire frame: [CAN id u32 BE][length u8][data] ────────────────────
    inline Bytes to_wire(const Frame &f) {
        Bytes out;
        out.reserve(5 + f.length);
        out.push_back(static_cast<u8>((f.id.raw >> 24) & 0xFF));
        out.push_back(static_cast<u8>((f.id.raw >> 16) & 0xFF));
        out.push_back(static_cast<u8>((f.id.raw >> 8) & 0xFF));
        out.push_back(static_cast<u8>(f.id.raw & 0xFF));
        out.push_back(f.length);
        for (u8 i = 0; i < f.length; ++i)
            out.push_back(f.data[i]);
        return out;
    }

    inline dp::Optional<Frame> from_wire(const Bytes &b) {
        if (b.size() < 5)
            return dp::nullopt;
        u8 len = b[4];
        if (len > 8 || b.size() != static_cast<usize>(5 + len))
            return dp::nullopt;
        Frame f;
        f.id = Identifier((static_cast<u32>(b[0]) << 24) | (static_cast<u32>(b[1]) << 16) |
                          (static_cast<u32>(b[2]) << 8) | b[3]);
        f.length = len;
        for (u8 i = 0; i < len; ++i)
            f.data[i] = b[5 + i];
        return f;
    }

} // namespace nmeabridge::nmea
