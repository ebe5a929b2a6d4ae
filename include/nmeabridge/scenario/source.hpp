#pragma once

#include "../core/error.hpp"
#include "../core/packet.hpp"
#include "../nmea/identifier.hpp"
#include <datapod/datapod.hpp>

namespace nmeabridge::scenario {

    // ─── Frame source ───────────────────────────────────────────────────────────
    // What the scenario engine runs: a generated scenario, a recording replay, a
    // plain-text log or a live passthrough. The engine owns the virtual clock and
    // asks the source for the packets that fall into [from, to).
    class FrameSource {
      public:
        virtual ~FrameSource() = default;

        virtual dp::String name() const = 0;
        virtual dp::String kind() const = 0;

        // 0 means unbounded
        virtual VirtualMs duration_ms() const = 0;
        virtual bool loops() const = 0;

        // Preferred engine tick for this source
        virtual u32 tick_ms() const { return DEFAULT_TICK_MS; }

        virtual Result<void> start(u64 epoch_ms) = 0;

        // Packets for virtual time in [from, to), in wire order
        virtual dp::Vector<Packet> advance(VirtualMs from, VirtualMs to) = 0;

        // CAN frames produced by the last advance(), for the CAN mirror
        virtual dp::Vector<nmea::Frame> take_frames() { return {}; }

        // The virtual clock wrapped to zero
        virtual void rewind() = 0;

        virtual Result<VirtualMs> seek(const dp::String &) {
            return Result<VirtualMs>::err(Error::invalid_state(kind() + " source has no checkpoints"));
        }

        virtual dp::Optional<dp::String> last_checkpoint() const { return dp::nullopt; }

        // Most recent vessel heading, when the source knows it
        virtual dp::Optional<f64> heading() const { return dp::nullopt; }

        virtual void stop() {}
    };

} // namespace nmeabridge::scenario
