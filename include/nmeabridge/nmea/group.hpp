#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace nmeabridge::nmea {

    // ─── Sentence groups ────────────────────────────────────────────────────────
    // Emission order within a tick follows the enum order.
    enum class Group : u8 { Engine = 0, Battery, Tank, Depth, Speed, Wind, Heading, Gps, Autopilot };

    inline constexpr u8 GROUP_COUNT = static_cast<u8>(Group::Autopilot) + 1;

    inline const char *to_string(Group g) noexcept {
        switch (g) {
        case Group::Engine:
            return "engine";
        case Group::Battery:
            return "battery";
        case Group::Tank:
            return "tank";
        case Group::Depth:
            return "depth";
        case Group::Speed:
            return "speed";
        case Group::Wind:
            return "wind";
        case Group::Heading:
            return "heading";
        case Group::Gps:
            return "gps";
        case Group::Autopilot:
            return "autopilot";
        }
        return "unknown";
    }

    inline dp::Optional<Group> group_from_string(const dp::String &s) {
        for (u8 i = 0; i < GROUP_COUNT; ++i) {
            if (s == to_string(static_cast<Group>(i)))
                return static_cast<Group>(i);
        }
        return dp::nullopt;
    }

    // ─── Set of groups due on a tick ────────────────────────────────────────────
    class GroupMask {
        u16 bits_ = 0;

      public:
        constexpr GroupMask() = default;
        static constexpr GroupMask all() noexcept {
            GroupMask m;
            m.bits_ = static_cast<u16>((1u << GROUP_COUNT) - 1);
            return m;
        }

        constexpr GroupMask &set(Group g) noexcept {
            bits_ |= static_cast<u16>(1u << static_cast<u8>(g));
            return *this;
        }
        constexpr GroupMask &clear(Group g) noexcept {
            bits_ &= static_cast<u16>(~(1u << static_cast<u8>(g)));
            return *this;
        }
        constexpr bool has(Group g) const noexcept { return bits_ & (1u << static_cast<u8>(g)); }
        constexpr bool empty() const noexcept { return bits_ == 0; }
    };

} // namespace nmeabridge::nmea
