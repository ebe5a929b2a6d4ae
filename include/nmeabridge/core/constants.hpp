#pragma once

#include "types.hpp"

namespace nmeabridge {

    // ─── Default ports ───────────────────────────────────────────────────────────
    inline constexpr u16 DEFAULT_TCP_PORT = 2000;
    inline constexpr u16 DEFAULT_WS_PORT = 8080;
    inline constexpr u16 DEFAULT_API_PORT = 9090;

    // ─── Connection limits ───────────────────────────────────────────────────────
    inline constexpr usize DEFAULT_QUEUE_CAPACITY = 1000;
    inline constexpr usize DEFAULT_MAX_CLIENTS = 50;
    inline constexpr usize MAX_LINE_LENGTH = 512;
    inline constexpr usize MAX_HTTP_REQUEST = 65536;

    // ─── Simulation ──────────────────────────────────────────────────────────────
    inline constexpr u32 DEFAULT_TICK_MS = 100;
    inline constexpr f64 MAX_TURN_RATE_DEG_S = 10.0;
    inline constexpr f64 MAX_RUDDER_DEG = 35.0;
    inline constexpr InstanceId MAX_INSTANCE = 252;
    inline constexpr u64 DEFAULT_SEED = 0x4E4D4541ULL;

    // ─── Command channel ─────────────────────────────────────────────────────────
    inline constexpr u32 COMMAND_BUCKET_CAPACITY = 1;
    inline constexpr u32 COMMAND_REFILL_MS = 1000;
    inline constexpr u32 DEFAULT_ERROR_DURATION_MS = 5000;
    inline constexpr u32 DEFAULT_FAULT_LATENCY_MS = 300;
    inline constexpr u32 MAX_FAULT_LATENCY_MS = 10000;

    // ─── NMEA 2000 ───────────────────────────────────────────────────────────────
    inline constexpr Address SIMULATOR_SOURCE_ADDRESS = 42;
    inline constexpr Address BROADCAST_ADDRESS = 0xFF;
    inline constexpr u8 CAN_DATA_LENGTH = 8;
    inline constexpr u32 FAST_PACKET_MAX_DATA = 223;

    // ─── Session recording ───────────────────────────────────────────────────────
    inline constexpr u16 RECORDING_VERSION = 1;
    inline constexpr u32 DEFAULT_FLUSH_MS = 1000;

} // namespace nmeabridge
