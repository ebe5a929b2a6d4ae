#pragma once

#include "../core/packet.hpp"
#include "encoder0183.hpp"
#include "encoder2000.hpp"

namespace nmeabridge::nmea {

    // ─── Encoded output of one tick ─────────────────────────────────────────────
    struct TickOutput {
        dp::Vector<Packet> packets; // wire order
        dp::Vector<Frame> frames;   // raw CAN frames, for the CAN mirror
    };

    // ─── Bridge codec: record -> wire packets for the configured mode ───────────
    // In hybrid mode the 0183 sentences of a tick precede its 2000 frames.
    class BridgeCodec {
        BridgeMode mode_;
        Nmea0183Encoder enc0183_;
        Nmea2000Encoder enc2000_;

      public:
        explicit BridgeCodec(BridgeMode mode = BridgeMode::Nmea0183, Address source = SIMULATOR_SOURCE_ADDRESS)
            : mode_(mode), enc2000_(source) {}

        BridgeMode mode() const noexcept { return mode_; }
        void set_mode(BridgeMode m) noexcept { mode_ = m; }

        void set_epoch_ms(u64 ms) noexcept {
            enc0183_.set_epoch_ms(ms);
            enc2000_.set_epoch_ms(ms);
        }

        u64 dropped() const noexcept { return enc0183_.dropped() + enc2000_.dropped(); }

        TickOutput encode(const telemetry::TelemetryRecord &rec, const control::AutopilotCommandState &ap,
                          GroupMask groups, u64 tick) {
            TickOutput out;
            if (groups.empty())
                return out;
            if (mode_ == BridgeMode::Nmea0183 || mode_ == BridgeMode::Hybrid) {
                for (const auto &s : enc0183_.encode(rec, ap, groups))
                    out.packets.push_back(Packet::text(s, tick));
            }
            if (mode_ == BridgeMode::Nmea2000 || mode_ == BridgeMode::Hybrid) {
                out.frames = enc2000_.encode(rec, ap, groups);
                for (const auto &f : out.frames)
                    out.packets.push_back(Packet::binary(to_wire(f), tick));
            }
            return out;
        }
    };

} // namespace nmeabridge::nmea
