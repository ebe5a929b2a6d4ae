#pragma once

#include "../control/autopilot.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "pattern.hpp"
#include "record.hpp"
#include <cmath>
#include <concord/concord.hpp>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace nmeabridge::telemetry {

    inline constexpr f64 EARTH_RADIUS_M = 6371000.0;

    // ─── Vessel profile ──────────────────────────────────────────────────────────
    // Equipment fitted to the simulated boat and its starting position.
    struct VesselProfile {
        dp::Vector<InstanceId> engines = {0};
        dp::Vector<InstanceId> batteries = {0};
        dp::Vector<InstanceId> tanks = {0};
        f64 origin_lat = 50.8010;
        f64 origin_lon = -1.2900;

        VesselProfile &engine_instances(dp::Vector<InstanceId> ids) {
            engines = std::move(ids);
            return *this;
        }
        VesselProfile &battery_instances(dp::Vector<InstanceId> ids) {
            batteries = std::move(ids);
            return *this;
        }
        VesselProfile &tank_instances(dp::Vector<InstanceId> ids) {
            tanks = std::move(ids);
            return *this;
        }
        VesselProfile &origin(f64 lat, f64 lon) {
            origin_lat = lat;
            origin_lon = lon;
            return *this;
        }
    };

    // ─── Data generator ──────────────────────────────────────────────────────────
    // Produces one TelemetryRecord per tick from per-channel patterns. Every
    // channel owns an RNG derived from the session seed and its channel key, so
    // the output of one channel never depends on which other channels exist.
    class DataGenerator {
        struct ChannelPattern {
            PatternSpec spec;
            PatternState state;
        };

        u64 seed_;
        VesselProfile profile_;
        dp::Map<u32, ChannelPattern> patterns_;
        concord::earth::WGS position_;
        f64 steered_heading_ = 0.0;
        f64 last_heading_ = 0.0;
        bool steering_ = false;
        bool have_heading_ = false;
        VirtualMs last_t_ = 0;
        VirtualMs last_stamp_ = 0;
        bool gps_dropout_ = false;
        u64 adjusted_values_ = 0;

        u64 channel_seed(ChannelKey key) const noexcept { return mix_seed(seed_ ^ mix_seed(key.packed() + 1)); }

        static f64 heading_error(f64 from, f64 to) noexcept {
            f64 d = std::fmod(to - from + 540.0, 360.0) - 180.0;
            return d;
        }

      public:
        explicit DataGenerator(u64 seed = DEFAULT_SEED, VesselProfile profile = {})
            : seed_(seed), profile_(std::move(profile)),
              position_(profile_.origin_lat, profile_.origin_lon, 0.0) {
            apply_defaults();
        }

        // Free-running defaults for every fitted instrument
        void apply_defaults() {
            patterns_.clear();
            auto put = [this](ChannelKey k, PatternSpec p) { patterns_[k.packed()] = {p, PatternState(channel_seed(k))}; };
            put({Channel::HDG, 0}, PatternSpec::sine(5.0, 120.0, 0.0, 45.0));
            put({Channel::SOG, 0}, PatternSpec::gaussian(6.5, 0.2));
            put({Channel::STW, 0}, PatternSpec::gaussian(6.2, 0.2));
            put({Channel::DEPTH, 0}, PatternSpec::random_walk(0.2, 5.0, 30.0).starting_at(12.0));
            put({Channel::WATER_TEMP, 0}, PatternSpec::sine(0.5, 600.0, 0.0, 18.0));
            put({Channel::AWA, 0}, PatternSpec::sine(10.0, 90.0, 0.0, 45.0));
            put({Channel::AWS, 0}, PatternSpec::gaussian(12.0, 1.5));
            for (auto id : profile_.engines) {
                put({Channel::ENGINE_RPM, id}, PatternSpec::gaussian(1800.0 + 50.0 * id, 20.0));
                put({Channel::ENGINE_TEMP, id}, PatternSpec::gaussian(82.0, 0.5));
                put({Channel::ENGINE_OIL_PRESSURE, id}, PatternSpec::gaussian(350.0, 5.0));
            }
            for (auto id : profile_.batteries) {
                put({Channel::BATTERY_VOLTAGE, id}, PatternSpec::gaussian(12.6, 0.05));
                put({Channel::BATTERY_CURRENT, id}, PatternSpec::gaussian(-5.0, 1.0));
            }
            for (auto id : profile_.tanks) {
                put({Channel::TANK_LEVEL, id}, PatternSpec::linear(75.0, -0.01));
            }
        }

        Result<void> set_pattern(ChannelKey key, const PatternSpec &spec) {
            auto v = spec.validate();
            if (v.is_err()) {
                return Result<void>::err(Error::invalid_pattern(mnemonic(key) + ": " + v.error().message));
            }
            patterns_[key.packed()] = {spec, PatternState(channel_seed(key))};
            return {};
        }

        void clear_pattern(ChannelKey key) { patterns_.erase(key.packed()); }

        bool has_pattern(ChannelKey key) const { return patterns_.find(key.packed()) != patterns_.end(); }

        void set_gps_dropout(bool on) {
            if (on != gps_dropout_)
                echo::category("nmeabridge.generator").info("gps dropout ", on ? "started" : "ended");
            gps_dropout_ = on;
        }
        bool gps_dropout() const noexcept { return gps_dropout_; }

        void set_seed(u64 seed) {
            seed_ = seed;
            reset();
        }
        u64 seed() const noexcept { return seed_; }

        const VesselProfile &profile() const noexcept { return profile_; }
        void set_profile(VesselProfile profile) {
            profile_ = std::move(profile);
            apply_defaults();
            reset();
        }

        // Releases accumulators: walks, RNG streams, position and steering
        void reset() {
            for (auto &[packed, cp] : patterns_) {
                cp.state = PatternState(channel_seed(ChannelKey::unpack(packed)));
            }
            position_ = concord::earth::WGS(profile_.origin_lat, profile_.origin_lon, 0.0);
            steering_ = false;
            have_heading_ = false;
            last_t_ = 0;
            gps_dropout_ = false;
        }

        // Virtual clock wrapped to zero (loop); accumulators are kept
        void rewind() noexcept { last_t_ = 0; }

        u64 adjusted_values() const noexcept { return adjusted_values_; }
        const concord::earth::WGS &position() const noexcept { return position_; }

        // scenario_t drives the patterns; session_t stamps the record
        TelemetryRecord tick(VirtualMs scenario_t, VirtualMs session_t, const control::AutopilotCommandState &ap) {
            TelemetryRecord rec;
            rec.timestamp_ms = session_t < last_stamp_ ? last_stamp_ : session_t;
            last_stamp_ = rec.timestamp_ms;

            f64 t_s = static_cast<f64>(scenario_t) / 1000.0;
            f64 dt_s = static_cast<f64>(scenario_t >= last_t_ ? scenario_t - last_t_ : scenario_t) / 1000.0;
            last_t_ = scenario_t;

            for (auto &[packed, cp] : patterns_) {
                rec.set(ChannelKey::unpack(packed), evaluate(cp.spec, t_s, cp.state));
            }

            // Heading: pattern-driven, or steered toward the target when engaged
            f64 pattern_heading = rec.get(Channel::HDG).value_or(last_heading_);
            if (ap.engaged()) {
                if (!steering_) {
                    steered_heading_ = have_heading_ ? last_heading_ : pattern_heading;
                    steering_ = true;
                }
                f64 err = heading_error(steered_heading_, ap.target_heading_deg);
                f64 max_step = MAX_TURN_RATE_DEG_S * dt_s;
                f64 step = err > max_step ? max_step : (err < -max_step ? -max_step : err);
                steered_heading_ = wrap_into(steered_heading_ + step, 0.0, 360.0);
                rec.set({Channel::HDG, 0}, steered_heading_);
                f64 remaining = heading_error(steered_heading_, ap.target_heading_deg);
                rec.set({Channel::RUDDER, 0},
                        remaining > MAX_RUDDER_DEG ? MAX_RUDDER_DEG
                                                   : (remaining < -MAX_RUDDER_DEG ? -MAX_RUDDER_DEG : remaining));
                rec.set({Channel::COG, 0}, steered_heading_);
            } else {
                steering_ = false;
                rec.set({Channel::HDG, 0}, pattern_heading);
                if (!rec.has({Channel::RUDDER, 0}))
                    rec.set({Channel::RUDDER, 0}, 0.0);
                if (!rec.has({Channel::COG, 0}))
                    rec.set({Channel::COG, 0}, pattern_heading);
            }

            // Range enforcement
            for (auto &[packed, value] : rec.values) {
                auto key = ChannelKey::unpack(packed);
                bool adjusted = false;
                f64 raw = value;
                value = enforce_range(key.channel, value, adjusted);
                if (adjusted) {
                    adjusted_values_++;
                    echo::category("nmeabridge.generator").warn("clamped ", mnemonic(key), " ", raw, " -> ", value);
                }
            }

            last_heading_ = *rec.get(Channel::HDG);
            have_heading_ = true;

            // Position: explicit patterns win over dead reckoning
            if (!rec.has({Channel::LAT, 0}) || !rec.has({Channel::LON, 0})) {
                f64 sog = rec.get(Channel::SOG).value_or(0.0);
                f64 cog = rec.get(Channel::COG).value_or(last_heading_) * M_PI / 180.0;
                f64 dist = sog * KNOTS_TO_MPS * dt_s;
                f64 lat = position_.latitude + (dist * std::cos(cog) / EARTH_RADIUS_M) * 180.0 / M_PI;
                f64 coslat = std::cos(position_.latitude * M_PI / 180.0);
                if (std::fabs(coslat) < 1e-9)
                    coslat = 1e-9;
                f64 lon = position_.longitude + (dist * std::sin(cog) / (EARTH_RADIUS_M * coslat)) * 180.0 / M_PI;
                bool adj = false;
                lat = enforce_range(Channel::LAT, lat, adj);
                lon = enforce_range(Channel::LON, lon, adj);
                position_ = concord::earth::WGS(lat, lon, 0.0);
            } else {
                position_ = concord::earth::WGS(*rec.get(Channel::LAT), *rec.get(Channel::LON), 0.0);
            }
            rec.set({Channel::LAT, 0}, position_.latitude);
            rec.set({Channel::LON, 0}, position_.longitude);
            rec.set({Channel::GPS_FIX, 0}, gps_dropout_ ? 0.0 : 1.0);
            return rec;
        }
    };

} // namespace nmeabridge::telemetry
