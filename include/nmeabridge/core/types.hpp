#pragma once

#include <datapod/datapod.hpp>

namespace nmeabridge {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Domain-specific types ───────────────────────────────────────────────────
    using PGN = u32;
    using Address = u8;
    using InstanceId = u8;
    using ConnectionId = u64;
    using Bytes = dp::Vector<u8>;

    // Milliseconds on the scenario's virtual clock
    using VirtualMs = u64;

    // ─── Priority (3-bit field in CAN identifier) ────────────────────────────────
    enum class Priority : u8 {
        Highest = 0,
        High = 1,
        AboveNormal = 2,
        Normal = 3,
        BelowNormal = 4,
        Low = 5,
        Default = 6,
        Lowest = 7
    };

    // ─── Wire format carried by a bridge stream ──────────────────────────────────
    enum class BridgeMode : u8 { Nmea0183 = 0, Nmea2000 = 1, Hybrid = 2 };

    inline const char *to_string(BridgeMode m) noexcept {
        switch (m) {
        case BridgeMode::Nmea0183:
            return "nmea0183";
        case BridgeMode::Nmea2000:
            return "nmea2000";
        case BridgeMode::Hybrid:
            return "hybrid";
        }
        return "unknown";
    }

    inline dp::Optional<BridgeMode> bridge_mode_from_string(const dp::String &s) {
        if (s == "nmea0183")
            return BridgeMode::Nmea0183;
        if (s == "nmea2000")
            return BridgeMode::Nmea2000;
        if (s == "hybrid")
            return BridgeMode::Hybrid;
        return dp::nullopt;
    }

} // namespace nmeabridge
