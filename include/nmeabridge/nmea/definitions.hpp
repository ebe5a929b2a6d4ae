#pragma once

// ─── NMEA 2000 definitions used by the bridge ──────────────────────────────────
// PGN numbers, field resolutions and enumerations for the messages the
// simulator emits.
// ─────────────────────────────────────────────────────────────────────────────────

#include "../core/types.hpp"

namespace nmeabridge::nmea {

    // ═════════════════════════════════════════════════════════════════════════════
    // PGN NUMBERS
    // ═════════════════════════════════════════════════════════════════════════════

    inline constexpr PGN PGN_SYSTEM_TIME = 126992;
    inline constexpr PGN PGN_HEADING_TRACK_CONTROL = 127237; // fast packet
    inline constexpr PGN PGN_RUDDER = 127245;
    inline constexpr PGN PGN_VESSEL_HEADING = 127250;
    inline constexpr PGN PGN_ENGINE_RAPID = 127488;
    inline constexpr PGN PGN_ENGINE_DYNAMIC = 127489; // fast packet
    inline constexpr PGN PGN_FLUID_LEVEL = 127505;
    inline constexpr PGN PGN_BATTERY_STATUS = 127508;
    inline constexpr PGN PGN_SPEED_WATER = 128259;
    inline constexpr PGN PGN_WATER_DEPTH = 128267;
    inline constexpr PGN PGN_POSITION_RAPID = 129025;
    inline constexpr PGN PGN_COG_SOG_RAPID = 129026;
    inline constexpr PGN PGN_WIND_DATA = 130306;
    inline constexpr PGN PGN_ENVIRONMENTAL = 130310;

    inline bool is_fast_packet_pgn(PGN pgn) noexcept {
        return pgn == PGN_HEADING_TRACK_CONTROL || pgn == PGN_ENGINE_DYNAMIC;
    }

    // ═════════════════════════════════════════════════════════════════════════════
    // RESOLUTION CONSTANTS
    // ═════════════════════════════════════════════════════════════════════════════

    inline constexpr f64 LAT_LON_RESOLUTION = 1.0e-7;    // degrees per bit
    inline constexpr f64 SPEED_RESOLUTION = 0.01;        // m/s per bit
    inline constexpr f64 ANGLE_RESOLUTION = 0.0001;      // radians per bit
    inline constexpr f64 TEMPERATURE_RESOLUTION = 0.01;  // Kelvin per bit
    inline constexpr f64 PRESSURE_HPA_RESOLUTION = 100.0; // Pa per bit
    inline constexpr f64 RPM_RESOLUTION = 0.25;          // RPM per bit
    inline constexpr f64 DEPTH_RESOLUTION = 0.01;        // metres per bit
    inline constexpr f64 VOLTAGE_RESOLUTION = 0.01;      // volts per bit
    inline constexpr f64 CURRENT_RESOLUTION = 0.1;       // amps per bit
    inline constexpr f64 FLUID_LEVEL_RESOLUTION = 0.004; // percent per bit
    inline constexpr f64 FLUID_CAPACITY_RESOLUTION = 0.1; // litres per bit
    inline constexpr f64 KELVIN_OFFSET = 273.15;
    inline constexpr f64 DEG_TO_RAD = 0.017453292519943295;

    // ═════════════════════════════════════════════════════════════════════════════
    // ENUMERATIONS
    // ═════════════════════════════════════════════════════════════════════════════

    enum class HeadingReference : u8 { True = 0, Magnetic = 1, Error = 2, Unavailable = 3 };

    enum class WindReference : u8 { TrueNorth = 0, Magnetic = 1, Apparent = 2, TrueBoat = 3, TrueWater = 4 };

    enum class FluidType : u8 { Fuel = 0, Water = 1, GrayWater = 2, LiveWell = 3, Oil = 4, BlackWater = 5 };

    enum class SteeringMode : u8 {
        MainSteering = 0,
        NonFollowUp = 1,
        FollowUp = 2,
        HeadingStandalone = 3,
        HeadingControl = 4,
        TrackControl = 5,
        Unavailable = 7
    };

    enum class TimeSource : u8 { GPS = 0, GLONASS = 1, RadioStation = 2, LocalCesium = 3 };

} // namespace nmeabridge::nmea
