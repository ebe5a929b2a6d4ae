#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <datapod/datapod.hpp>
#include <string>

namespace nmeabridge::telemetry {

    // ─── Instrument channels ─────────────────────────────────────────────────────
    // Units: speeds in knots, angles in degrees, depth in metres, temperatures in
    // Celsius, pressure in kPa, voltage in volts, current in amps, levels in percent.
    enum class Channel : u8 {
        SOG = 0,
        COG,
        STW,
        HDG,
        DEPTH,
        WATER_TEMP,
        AWA,
        AWS,
        LAT,
        LON,
        GPS_FIX,
        RUDDER,
        ENGINE_RPM,
        ENGINE_TEMP,
        ENGINE_OIL_PRESSURE,
        BATTERY_VOLTAGE,
        BATTERY_CURRENT,
        TANK_LEVEL,
    };

    inline constexpr f64 KNOTS_TO_MPS = 0.514444;

    inline constexpr u8 CHANNEL_COUNT = static_cast<u8>(Channel::TANK_LEVEL) + 1;

    struct ChannelInfo {
        Channel channel;
        const char *mnemonic;
        bool instanced;
        f64 min;
        f64 max;
        bool wraps; // angular: wrapped into [min, max) instead of clamped
    };

    inline constexpr ChannelInfo CHANNEL_TABLE[CHANNEL_COUNT] = {
        {Channel::SOG, "SOG", false, 0.0, 60.0, false},
        {Channel::COG, "COG", false, 0.0, 360.0, true},
        {Channel::STW, "STW", false, 0.0, 60.0, false},
        {Channel::HDG, "HDG", false, 0.0, 360.0, true},
        {Channel::DEPTH, "DEPTH", false, 0.0, 2000.0, false},
        {Channel::WATER_TEMP, "WATER_TEMP", false, -5.0, 45.0, false},
        {Channel::AWA, "AWA", false, 0.0, 360.0, true},
        {Channel::AWS, "AWS", false, 0.0, 150.0, false},
        {Channel::LAT, "LAT", false, -90.0, 90.0, false},
        {Channel::LON, "LON", false, -180.0, 180.0, true},
        {Channel::GPS_FIX, "GPS_FIX", false, 0.0, 1.0, false},
        {Channel::RUDDER, "RUDDER", false, -MAX_RUDDER_DEG, MAX_RUDDER_DEG, false},
        {Channel::ENGINE_RPM, "ENGINE_RPM", true, 0.0, 10000.0, false},
        {Channel::ENGINE_TEMP, "ENGINE_TEMP", true, -20.0, 150.0, false},
        {Channel::ENGINE_OIL_PRESSURE, "ENGINE_OIL_PRESSURE", true, 0.0, 1000.0, false},
        {Channel::BATTERY_VOLTAGE, "BATTERY_VOLTAGE", true, 0.0, 60.0, false},
        {Channel::BATTERY_CURRENT, "BATTERY_CURRENT", true, -1000.0, 1000.0, false},
        {Channel::TANK_LEVEL, "TANK_LEVEL", true, 0.0, 100.0, false},
    };

    inline const ChannelInfo &info(Channel c) noexcept { return CHANNEL_TABLE[static_cast<u8>(c)]; }

    // ─── Channel key: channel plus instance id ──────────────────────────────────
    struct ChannelKey {
        Channel channel = Channel::SOG;
        InstanceId instance = 0;

        constexpr u32 packed() const noexcept { return (static_cast<u32>(channel) << 8) | instance; }
        static constexpr ChannelKey unpack(u32 v) noexcept {
            return {static_cast<Channel>((v >> 8) & 0xFF), static_cast<InstanceId>(v & 0xFF)};
        }

        constexpr bool operator==(const ChannelKey &o) const noexcept {
            return channel == o.channel && instance == o.instance;
        }
        constexpr bool operator<(const ChannelKey &o) const noexcept { return packed() < o.packed(); }
    };

    inline dp::String mnemonic(const ChannelKey &key) {
        const auto &ci = info(key.channel);
        dp::String out = ci.mnemonic;
        if (ci.instanced) {
            out += "[";
            out += dp::String(std::to_string(key.instance));
            out += "]";
        }
        return out;
    }

    // "ENGINE_RPM[1]", "ENGINE_RPM" (instance 0), "SOG"
    inline dp::Optional<ChannelKey> parse_channel_key(const dp::String &text) {
        dp::String name = text;
        InstanceId instance = 0;
        auto open = text.find('[');
        if (open != dp::String::npos) {
            auto close = text.find(']', open);
            if (close == dp::String::npos || close != text.size() - 1 || close == open + 1)
                return dp::nullopt;
            dp::String digits = text.substr(open + 1, close - open - 1);
            for (char c : digits) {
                if (c < '0' || c > '9')
                    return dp::nullopt;
            }
            long v = std::strtol(digits.c_str(), nullptr, 10);
            if (v < 0 || v > MAX_INSTANCE)
                return dp::nullopt;
            instance = static_cast<InstanceId>(v);
            name = text.substr(0, open);
        }
        for (const auto &ci : CHANNEL_TABLE) {
            if (name == ci.mnemonic) {
                if (!ci.instanced && open != dp::String::npos)
                    return dp::nullopt;
                return ChannelKey{ci.channel, instance};
            }
        }
        return dp::nullopt;
    }

    // ─── Range enforcement ───────────────────────────────────────────────────────
    inline f64 wrap_into(f64 v, f64 lo, f64 hi) noexcept {
        f64 span = hi - lo;
        f64 r = std::fmod(v - lo, span);
        if (r < 0.0)
            r += span;
        // fmod can return span itself for tiny negative inputs
        if (r >= span)
            r = 0.0;
        return lo + r;
    }

    // Returns the in-range value; sets adjusted when clamping changed it
    inline f64 enforce_range(Channel c, f64 v, bool &adjusted) noexcept {
        const auto &ci = info(c);
        adjusted = false;
        if (!std::isfinite(v)) {
            adjusted = true;
            return ci.min;
        }
        if (ci.wraps)
            return wrap_into(v, ci.min, ci.max);
        if (v < ci.min) {
            adjusted = true;
            return ci.min;
        }
        if (v > ci.max) {
            adjusted = true;
            return ci.max;
        }
        return v;
    }

    // ─── Telemetry record ────────────────────────────────────────────────────────
    struct TelemetryRecord {
        VirtualMs timestamp_ms = 0;
        dp::Map<u32, f64> values;

        void set(ChannelKey key, f64 v) { values[key.packed()] = v; }

        dp::Optional<f64> get(ChannelKey key) const {
            auto it = values.find(key.packed());
            if (it == values.end())
                return dp::nullopt;
            return it->second;
        }

        dp::Optional<f64> get(Channel c) const { return get(ChannelKey{c, 0}); }

        bool has(ChannelKey key) const { return values.find(key.packed()) != values.end(); }

        void erase(ChannelKey key) { values.erase(key.packed()); }

        // Instances present for an instanced channel, ascending
        dp::Vector<InstanceId> instances(Channel c) const {
            dp::Vector<InstanceId> out;
            for (const auto &[packed, v] : values) {
                auto key = ChannelKey::unpack(packed);
                if (key.channel == c)
                    out.push_back(key.instance);
            }
            std::sort(out.begin(), out.end());
            return out;
        }

        bool gps_fix() const {
            auto f = get(Channel::GPS_FIX);
            return f.has_value() && *f >= 0.5;
        }
    };

} // namespace nmeabridge::telemetry
