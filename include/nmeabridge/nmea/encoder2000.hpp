#pragma once

#include "../control/autopilot.hpp"
#include "../telemetry/record.hpp"
#include "definitions.hpp"
#include "fast_packet.hpp"
#include "group.hpp"
#include "sentence.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <limits>

namespace nmeabridge::nmea {

    // ─── Little-endian payload writer ───────────────────────────────────────────
    class PayloadWriter {
        Bytes data_;

      public:
        explicit PayloadWriter(usize reserve = 8) { data_.reserve(reserve); }

        PayloadWriter &u8v(u8 v) {
            data_.push_back(v);
            return *this;
        }
        PayloadWriter &u16v(u16 v) {
            data_.push_back(static_cast<u8>(v & 0xFF));
            data_.push_back(static_cast<u8>((v >> 8) & 0xFF));
            return *this;
        }
        PayloadWriter &i16v(i16 v) { return u16v(static_cast<u16>(v)); }
        PayloadWriter &u32v(u32 v) {
            for (int i = 0; i < 4; ++i)
                data_.push_back(static_cast<u8>((v >> (8 * i)) & 0xFF));
            return *this;
        }
        PayloadWriter &i32v(i32 v) { return u32v(static_cast<u32>(v)); }
        PayloadWriter &pad(usize total) {
            while (data_.size() < total)
                data_.push_back(0xFF);
            return *this;
        }

        Bytes take() { return std::move(data_); }
    };

    // Scaled value with saturation to the field width; invalid inputs become "not available"
    template <typename T> T scaled(f64 v, f64 resolution) {
        constexpr f64 lo = static_cast<f64>(std::numeric_limits<T>::min());
        constexpr f64 hi = static_cast<f64>(std::numeric_limits<T>::max()) - 2.0; // top values are reserved
        if (!std::isfinite(v))
            return std::numeric_limits<T>::max();
        f64 r = std::round(v / resolution);
        if (r < lo)
            r = lo;
        if (r > hi)
            r = hi;
        return static_cast<T>(r);
    }

    // ─── NMEA 2000 encoder ──────────────────────────────────────────────────────
    // Produces CAN frames from a TelemetryRecord. Payloads longer than 8 bytes are
    // split with the fast packet protocol. All frames use the simulator's source
    // address.
    class Nmea2000Encoder {
        Address source_ = SIMULATOR_SOURCE_ADDRESS;
        u8 sid_ = 0;
        u64 epoch_ms_ = 0;
        u64 dropped_ = 0;
        FastPacketSender fast_;

        using Channel = telemetry::Channel;
        using ChannelKey = telemetry::ChannelKey;
        using TelemetryRecord = telemetry::TelemetryRecord;

        static f64 at(const TelemetryRecord &rec, ChannelKey k) { return rec.get(k).value_or(0.0); }
        static f64 rad(f64 deg) { return deg * DEG_TO_RAD; }

        void single(PGN pgn, Bytes data, dp::Vector<Frame> &out, Priority prio = Priority::Default) {
            Frame f;
            f.id = Identifier::encode(prio, pgn, source_);
            f.length = 8;
            for (usize i = 0; i < 8; ++i)
                f.data[i] = i < data.size() ? data[i] : 0xFF;
            out.push_back(f);
        }

        void multi(PGN pgn, const Bytes &data, dp::Vector<Frame> &out) {
            auto res = fast_.split(pgn, data, source_);
            if (res.is_err()) {
                dropped_++;
                echo::category("nmeabridge.encoder").warn("fast packet pgn=", pgn, ": ", res.error().message);
                return;
            }
            for (const auto &f : res.value())
                out.push_back(f);
        }

        bool require(const TelemetryRecord &rec, ChannelKey k, PGN pgn) {
            if (rec.has(k))
                return true;
            dropped_++;
            echo::category("nmeabridge.encoder").warn("dropping pgn ", pgn, ": missing ", telemetry::mnemonic(k));
            return false;
        }

        void engine(const TelemetryRecord &rec, dp::Vector<Frame> &out) {
            for (auto id : rec.instances(Channel::ENGINE_RPM)) {
                ChannelKey rpm{Channel::ENGINE_RPM, id};
                single(PGN_ENGINE_RAPID,
                       PayloadWriter()
                           .u8v(id)
                           .u16v(scaled<u16>(at(rec, rpm), RPM_RESOLUTION))
                           .u16v(0xFFFF) // boost pressure
                           .u8v(0x7F)    // tilt/trim
                           .pad(8)
                           .take(),
                       out, Priority::Normal);

                ChannelKey temp{Channel::ENGINE_TEMP, id};
                ChannelKey oil{Channel::ENGINE_OIL_PRESSURE, id};
                if (!rec.has(temp) && !rec.has(oil))
                    continue;
                if (!require(rec, temp, PGN_ENGINE_DYNAMIC) || !require(rec, oil, PGN_ENGINE_DYNAMIC))
                    continue;
                multi(PGN_ENGINE_DYNAMIC,
                      PayloadWriter(26)
                          .u8v(id)
                          .u16v(scaled<u16>(at(rec, oil) * 1000.0, PRESSURE_HPA_RESOLUTION))
                          .u16v(0xFFFF) // oil temperature
                          .u16v(scaled<u16>(at(rec, temp) + KELVIN_OFFSET, TEMPERATURE_RESOLUTION))
                          .i16v(0x7FFF) // alternator potential
                          .i16v(0x7FFF) // fuel rate
                          .u32v(0xFFFFFFFF) // total engine hours
                          .u16v(0xFFFF) // coolant pressure
                          .u16v(0xFFFF) // fuel pressure
                          .u8v(0xFF)    // reserved
                          .u16v(0x0000) // discrete status 1
                          .u16v(0x0000) // discrete status 2
                          .u8v(0x7F)    // percent engine load
                          .u8v(0x7F)    // percent engine torque
                          .take(),
                      out);
            }
        }

        void battery(const TelemetryRecord &rec, dp::Vector<Frame> &out) {
            for (auto id : rec.instances(Channel::BATTERY_VOLTAGE)) {
                ChannelKey v{Channel::BATTERY_VOLTAGE, id};
                ChannelKey a{Channel::BATTERY_CURRENT, id};
                single(PGN_BATTERY_STATUS,
                       PayloadWriter()
                           .u8v(id)
                           .u16v(scaled<u16>(at(rec, v), VOLTAGE_RESOLUTION))
                           .i16v(rec.has(a) ? scaled<i16>(at(rec, a), CURRENT_RESOLUTION) : i16(0x7FFF))
                           .u16v(0xFFFF) // battery temperature
                           .u8v(sid_)
                           .take(),
                       out);
            }
        }

        void tank(const TelemetryRecord &rec, dp::Vector<Frame> &out) {
            for (auto id : rec.instances(Channel::TANK_LEVEL)) {
                ChannelKey k{Channel::TANK_LEVEL, id};
                single(PGN_FLUID_LEVEL,
                       PayloadWriter()
                           .u8v(static_cast<u8>((id & 0x0F) | (static_cast<u8>(FluidType::Fuel) << 4)))
                           .i16v(scaled<i16>(at(rec, k), FLUID_LEVEL_RESOLUTION))
                           .u32v(0xFFFFFFFF) // capacity
                           .pad(8)
                           .take(),
                       out);
            }
        }

        void depth(const TelemetryRecord &rec, dp::Vector<Frame> &out) {
            ChannelKey d{Channel::DEPTH, 0};
            if (require(rec, d, PGN_WATER_DEPTH)) {
                single(PGN_WATER_DEPTH,
                       PayloadWriter()
                           .u8v(sid_)
                           .u32v(scaled<u32>(at(rec, d), DEPTH_RESOLUTION))
                           .i16v(0) // transducer offset
                           .u8v(0xFF)
                           .take(),
                       out, Priority::Normal);
            }
            ChannelKey t{Channel::WATER_TEMP, 0};
            if (require(rec, t, PGN_ENVIRONMENTAL)) {
                single(PGN_ENVIRONMENTAL,
                       PayloadWriter()
                           .u8v(sid_)
                           .u16v(scaled<u16>(at(rec, t) + KELVIN_OFFSET, TEMPERATURE_RESOLUTION))
                           .u16v(0xFFFF) // outside temperature
                           .u16v(0xFFFF) // atmospheric pressure
                           .pad(8)
                           .take(),
                       out, Priority::Default);
            }
        }

        void speed(const TelemetryRecord &rec, dp::Vector<Frame> &out) {
            ChannelKey stw{Channel::STW, 0};
            ChannelKey sog{Channel::SOG, 0};
            ChannelKey cog{Channel::COG, 0};
            if (require(rec, stw, PGN_SPEED_WATER)) {
                single(PGN_SPEED_WATER,
                       PayloadWriter()
                           .u8v(sid_)
                           .u16v(scaled<u16>(at(rec, stw) * telemetry::KNOTS_TO_MPS, SPEED_RESOLUTION))
                           .u16v(0xFFFF) // ground referenced
                           .u8v(0x00)    // paddle wheel
                           .pad(8)
                           .take(),
                       out, Priority::Low);
            }
            if (require(rec, sog, PGN_COG_SOG_RAPID) && require(rec, cog, PGN_COG_SOG_RAPID)) {
                single(PGN_COG_SOG_RAPID,
                       PayloadWriter()
                           .u8v(sid_)
                           .u8v(static_cast<u8>(HeadingReference::True) | 0xFC)
                           .u16v(scaled<u16>(rad(at(rec, cog)), ANGLE_RESOLUTION))
                           .u16v(scaled<u16>(at(rec, sog) * telemetry::KNOTS_TO_MPS, SPEED_RESOLUTION))
                           .pad(8)
                           .take(),
                       out, Priority::High);
            }
        }

        void wind(const TelemetryRecord &rec, dp::Vector<Frame> &out) {
            ChannelKey awa{Channel::AWA, 0};
            ChannelKey aws{Channel::AWS, 0};
            if (require(rec, awa, PGN_WIND_DATA) && require(rec, aws, PGN_WIND_DATA)) {
                single(PGN_WIND_DATA,
                       PayloadWriter()
                           .u8v(sid_)
                           .u16v(scaled<u16>(at(rec, aws) * telemetry::KNOTS_TO_MPS, SPEED_RESOLUTION))
                           .u16v(scaled<u16>(rad(at(rec, awa)), ANGLE_RESOLUTION))
                           .u8v(static_cast<u8>(WindReference::Apparent) | 0xF8)
                           .pad(8)
                           .take(),
                       out, Priority::High);
            }
        }

        void heading(const TelemetryRecord &rec, dp::Vector<Frame> &out) {
            ChannelKey hdg{Channel::HDG, 0};
            if (require(rec, hdg, PGN_VESSEL_HEADING)) {
                single(PGN_VESSEL_HEADING,
                       PayloadWriter()
                           .u8v(sid_)
                           .u16v(scaled<u16>(rad(at(rec, hdg)), ANGLE_RESOLUTION))
                           .i16v(0x7FFF) // deviation
                           .i16v(0x7FFF) // variation
                           .u8v(static_cast<u8>(HeadingReference::True) | 0xFC)
                           .take(),
                       out, Priority::High);
            }
        }

        void gps(const TelemetryRecord &rec, dp::Vector<Frame> &out) {
            UtcTime t = to_utc(epoch_ms_ + rec.timestamp_ms);
            single(PGN_SYSTEM_TIME,
                   PayloadWriter()
                       .u8v(sid_)
                       .u8v(static_cast<u8>(TimeSource::GPS) | 0xF0)
                       .u16v(static_cast<u16>(t.days_since_epoch))
                       .u32v(static_cast<u32>(t.seconds_of_day * 10000.0))
                       .take(),
                   out, Priority::Normal);

            ChannelKey lat{Channel::LAT, 0};
            ChannelKey lon{Channel::LON, 0};
            bool fix = rec.gps_fix() && rec.has(lat) && rec.has(lon);
            // No fix: position fields carry "not available"
            single(PGN_POSITION_RAPID,
                   PayloadWriter()
                       .i32v(fix ? scaled<i32>(at(rec, lat), LAT_LON_RESOLUTION) : 0x7FFFFFFF)
                       .i32v(fix ? scaled<i32>(at(rec, lon), LAT_LON_RESOLUTION) : 0x7FFFFFFF)
                       .take(),
                   out, Priority::High);
        }

        void autopilot(const TelemetryRecord &rec, const control::AutopilotCommandState &ap,
                       dp::Vector<Frame> &out) {
            ChannelKey rudder{Channel::RUDDER, 0};
            if (rec.has(rudder)) {
                i16 pos = scaled<i16>(rad(at(rec, rudder)), ANGLE_RESOLUTION);
                single(PGN_RUDDER,
                       PayloadWriter()
                           .u8v(0)    // instance
                           .u8v(0xF8) // direction order: none
                           .i16v(0x7FFF)
                           .i16v(pos)
                           .pad(8)
                           .take(),
                       out, Priority::AboveNormal);
            }

            SteeringMode mode = SteeringMode::Unavailable;
            switch (ap.mode) {
            case control::AutopilotMode::Off:
                mode = SteeringMode::Unavailable;
                break;
            case control::AutopilotMode::Standby:
                mode = SteeringMode::MainSteering;
                break;
            case control::AutopilotMode::Auto:
                mode = SteeringMode::HeadingStandalone;
                break;
            case control::AutopilotMode::Wind:
                mode = SteeringMode::HeadingControl;
                break;
            case control::AutopilotMode::Track:
                mode = SteeringMode::TrackControl;
                break;
            }
            ChannelKey hdg{Channel::HDG, 0};
            multi(PGN_HEADING_TRACK_CONTROL,
                  PayloadWriter(21)
                      .u8v(0xFF) // limit status bits
                      .u8v(static_cast<u8>(static_cast<u8>(mode) | 0xF8))
                      .u8v(0xFF) // turn mode, heading reference
                      .u8v(0xFF) // commanded rudder direction
                      .i16v(0x7FFF)
                      .u16v(scaled<u16>(rad(ap.target_heading_deg), ANGLE_RESOLUTION))
                      .u16v(0xFFFF) // track
                      .u16v(scaled<u16>(rad(MAX_RUDDER_DEG), ANGLE_RESOLUTION))
                      .u16v(0xFFFF) // off-heading limit
                      .i16v(0x7FFF) // radius of turn order
                      .i16v(0x7FFF) // rate of turn order
                      .i16v(0x7FFF) // off-track limit
                      .u16v(rec.has(hdg) ? scaled<u16>(rad(at(rec, hdg)), ANGLE_RESOLUTION) : u16(0xFFFF))
                      .take(),
                  out);
        }

      public:
        explicit Nmea2000Encoder(Address source = SIMULATOR_SOURCE_ADDRESS) : source_(source) {}

        void set_epoch_ms(u64 ms) noexcept { epoch_ms_ = ms; }
        Address source() const noexcept { return source_; }
        u64 dropped() const noexcept { return dropped_; }

        dp::Vector<Frame> encode(const TelemetryRecord &rec, const control::AutopilotCommandState &ap,
                                 GroupMask groups = GroupMask::all()) {
            dp::Vector<Frame> out;
            if (groups.has(Group::Engine))
                engine(rec, out);
            if (groups.has(Group::Battery))
                battery(rec, out);
            if (groups.has(Group::Tank))
                tank(rec, out);
            if (groups.has(Group::Depth))
                depth(rec, out);
            if (groups.has(Group::Speed))
                speed(rec, out);
            if (groups.has(Group::Wind))
                wind(rec, out);
            if (groups.has(Group::Heading))
                heading(rec, out);
            if (groups.has(Group::Gps))
                gps(rec, out);
            if (groups.has(Group::Autopilot))
                autopilot(rec, ap, out);
            sid_ = static_cast<u8>((sid_ + 1) % 253);
            return out;
        }
    };

} // namespace nmeabridge::nmea
