#pragma once

#include "../control/autopilot.hpp"
#include "../telemetry/record.hpp"
#include "group.hpp"
#include "sentence.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <initializer_list>

namespace nmeabridge::nmea {

    using telemetry::Channel;
    using telemetry::ChannelKey;
    using telemetry::TelemetryRecord;

    inline constexpr f64 METRES_TO_FEET = 3.28084;
    inline constexpr f64 METRES_TO_FATHOMS = 0.546807;
    inline constexpr f64 KNOTS_TO_KMH = 1.852;

    // ─── NMEA 0183 encoder ──────────────────────────────────────────────────────
    // Turns one TelemetryRecord into sentences, one per engine/battery/tank
    // instance. A sentence whose required fields are missing from the record is
    // skipped and counted; the rest of the tick is still encoded.
    class Nmea0183Encoder {
        u64 epoch_ms_ = 0;
        u64 dropped_ = 0;

        // All keys present, or the sentence is dropped
        bool require(const TelemetryRecord &rec, std::initializer_list<ChannelKey> keys, const char *sentence) {
            for (const auto &k : keys) {
                if (!rec.has(k)) {
                    dropped_++;
                    echo::category("nmeabridge.encoder")
                        .warn("dropping ", sentence, ": missing ", telemetry::mnemonic(k));
                    return false;
                }
            }
            return true;
        }

        static f64 at(const TelemetryRecord &rec, ChannelKey k) { return rec.get(k).value_or(0.0); }

        void engine(const TelemetryRecord &rec, dp::Vector<dp::String> &out) {
            for (auto id : rec.instances(Channel::ENGINE_RPM)) {
                ChannelKey rpm{Channel::ENGINE_RPM, id};
                if (require(rec, {rpm}, "RPM")) {
                    out.push_back(build("IIRPM,E," + dp::String(std::to_string(id)) + "," + fixed(at(rec, rpm), 1) +
                                        ",,A"));
                }
                ChannelKey temp{Channel::ENGINE_TEMP, id};
                ChannelKey oil{Channel::ENGINE_OIL_PRESSURE, id};
                if (rec.has(temp) || rec.has(oil)) {
                    if (require(rec, {temp, oil}, "XDR engine")) {
                        dp::String n = dp::String(std::to_string(id));
                        out.push_back(build("IIXDR,C," + fixed(at(rec, temp), 1) + ",C,ENGINE#" + n + ",P," +
                                            fixed(at(rec, oil) / 100.0, 2) + ",B,ENGINEOIL#" + n));
                    }
                }
            }
        }

        void battery(const TelemetryRecord &rec, dp::Vector<dp::String> &out) {
            for (auto id : rec.instances(Channel::BATTERY_VOLTAGE)) {
                ChannelKey v{Channel::BATTERY_VOLTAGE, id};
                ChannelKey a{Channel::BATTERY_CURRENT, id};
                dp::String n = dp::String(std::to_string(id));
                if (rec.has(a)) {
                    out.push_back(build("IIXDR,U," + fixed(at(rec, v), 2) + ",V,BATTERY#" + n + ",I," +
                                        fixed(at(rec, a), 1) + ",A,BATTERY#" + n));
                } else {
                    out.push_back(build("IIXDR,U," + fixed(at(rec, v), 2) + ",V,BATTERY#" + n));
                }
            }
        }

        void tank(const TelemetryRecord &rec, dp::Vector<dp::String> &out) {
            for (auto id : rec.instances(Channel::TANK_LEVEL)) {
                ChannelKey k{Channel::TANK_LEVEL, id};
                out.push_back(
                    build("IIXDR,V," + fixed(at(rec, k), 1) + ",P,TANK#" + dp::String(std::to_string(id))));
            }
        }

        void depth(const TelemetryRecord &rec, dp::Vector<dp::String> &out) {
            ChannelKey d{Channel::DEPTH, 0};
            if (require(rec, {d}, "DBT")) {
                f64 m = at(rec, d);
                out.push_back(build("IIDBT," + fixed(m * METRES_TO_FEET, 1) + ",f," + fixed(m, 1) + ",M," +
                                    fixed(m * METRES_TO_FATHOMS, 1) + ",F"));
            }
            ChannelKey t{Channel::WATER_TEMP, 0};
            if (require(rec, {t}, "MTW")) {
                out.push_back(build("IIMTW," + fixed(at(rec, t), 1) + ",C"));
            }
        }

        void speed(const TelemetryRecord &rec, dp::Vector<dp::String> &out) {
            ChannelKey hdg{Channel::HDG, 0};
            ChannelKey stw{Channel::STW, 0};
            if (require(rec, {hdg, stw}, "VHW")) {
                f64 s = at(rec, stw);
                out.push_back(build("IIVHW," + fixed(at(rec, hdg), 1) + ",T,,M," + fixed(s, 1) + ",N," +
                                    fixed(s * KNOTS_TO_KMH, 1) + ",K"));
            }
            ChannelKey cog{Channel::COG, 0};
            ChannelKey sog{Channel::SOG, 0};
            if (require(rec, {cog, sog}, "VTG")) {
                f64 s = at(rec, sog);
                out.push_back(build("IIVTG," + fixed(at(rec, cog), 1) + ",T,,M," + fixed(s, 1) + ",N," +
                                    fixed(s * KNOTS_TO_KMH, 1) + ",K,A"));
            }
        }

        void wind(const TelemetryRecord &rec, dp::Vector<dp::String> &out) {
            ChannelKey awa{Channel::AWA, 0};
            ChannelKey aws{Channel::AWS, 0};
            if (require(rec, {awa, aws}, "MWV")) {
                out.push_back(build("IIMWV," + fixed(at(rec, awa), 1) + ",R," + fixed(at(rec, aws), 1) + ",N,A"));
            }
        }

        void heading(const TelemetryRecord &rec, dp::Vector<dp::String> &out) {
            ChannelKey hdg{Channel::HDG, 0};
            if (require(rec, {hdg}, "HDG")) {
                out.push_back(build("IIHDG," + fixed(at(rec, hdg), 1) + ",,,,"));
            }
        }

        void gps(const TelemetryRecord &rec, dp::Vector<dp::String> &out) {
            UtcTime t = to_utc(epoch_ms_ + rec.timestamp_ms);
            dp::String time = hhmmss(t);
            bool fix = rec.gps_fix();
            ChannelKey lat{Channel::LAT, 0};
            ChannelKey lon{Channel::LON, 0};

            if (fix) {
                if (require(rec, {lat, lon}, "GGA")) {
                    auto [la, ns] = format_lat(at(rec, lat));
                    auto [lo, ew] = format_lon(at(rec, lon));
                    out.push_back(build("GPGGA," + time + "," + la + "," + ns + "," + lo + "," + ew +
                                        ",1,08,0.9,0.0,M,0.0,M,,"));
                }
            } else {
                out.push_back(build("GPGGA," + time + ",,,,,0,00,,,M,,M,,"));
            }

            ChannelKey sog{Channel::SOG, 0};
            ChannelKey cog{Channel::COG, 0};
            if (fix) {
                if (require(rec, {lat, lon, sog, cog}, "RMC")) {
                    auto [la, ns] = format_lat(at(rec, lat));
                    auto [lo, ew] = format_lon(at(rec, lon));
                    out.push_back(build("GPRMC," + time + ",A," + la + "," + ns + "," + lo + "," + ew + "," +
                                        fixed(at(rec, sog), 1) + "," + fixed(at(rec, cog), 1) + "," + ddmmyy(t) +
                                        ",,,A"));
                }
            } else {
                out.push_back(build("GPRMC," + time + ",V,,,,,,," + ddmmyy(t) + ",,,N"));
            }

            char date[32];
            std::snprintf(date, sizeof(date), ",%02u,%02u,%04d,00,00", t.day, t.month, t.year);
            out.push_back(build("GPZDA," + time + dp::String(date)));
        }

        void autopilot(const TelemetryRecord &rec, const control::AutopilotCommandState &ap,
                       dp::Vector<dp::String> &out) {
            ChannelKey rudder{Channel::RUDDER, 0};
            if (rec.has(rudder)) {
                out.push_back(build("IIRSA," + fixed(at(rec, rudder), 1) + ",A,,V"));
            }
            ChannelKey hdg{Channel::HDG, 0};
            out.push_back(build("PNBAS,1," + dp::String(control::to_string(ap.mode)) + "," +
                                fixed(ap.target_heading_deg, 1) + "," + fixed(at(rec, hdg), 1)));
        }

      public:
        // Added to record timestamps for UTC fields
        void set_epoch_ms(u64 ms) noexcept { epoch_ms_ = ms; }
        u64 epoch_ms() const noexcept { return epoch_ms_; }

        u64 dropped() const noexcept { return dropped_; }

        dp::Vector<dp::String> encode(const TelemetryRecord &rec, const control::AutopilotCommandState &ap,
                                      GroupMask groups = GroupMask::all()) {
            dp::Vector<dp::String> out;
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
            return out;
        }
    };

} // namespace nmeabridge::nmea
