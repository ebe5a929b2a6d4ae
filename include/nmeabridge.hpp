#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "nmeabridge/core/constants.hpp"
#include "nmeabridge/core/error.hpp"
#include "nmeabridge/core/packet.hpp"
#include "nmeabridge/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "nmeabridge/util/bounded_queue.hpp"
#include "nmeabridge/util/event.hpp"
#include "nmeabridge/util/mailbox.hpp"
#include "nmeabridge/util/state_machine.hpp"
#include "nmeabridge/util/timer.hpp"
#include "nmeabridge/util/token_bucket.hpp"

// ─── Telemetry ───────────────────────────────────────────────────────────────
#include "nmeabridge/telemetry/generator.hpp"
#include "nmeabridge/telemetry/pattern.hpp"
#include "nmeabridge/telemetry/record.hpp"

// ─── NMEA 0183 / 2000 ────────────────────────────────────────────────────────
#include "nmeabridge/nmea/codec.hpp"
#include "nmeabridge/nmea/definitions.hpp"
#include "nmeabridge/nmea/encoder0183.hpp"
#include "nmeabridge/nmea/encoder2000.hpp"
#include "nmeabridge/nmea/fast_packet.hpp"
#include "nmeabridge/nmea/group.hpp"
#include "nmeabridge/nmea/identifier.hpp"
#include "nmeabridge/nmea/sentence.hpp"

// ─── Control ─────────────────────────────────────────────────────────────────
#include "nmeabridge/control/api.hpp"
#include "nmeabridge/control/autopilot.hpp"
#include "nmeabridge/control/command.hpp"
#include "nmeabridge/control/command_channel.hpp"
#include "nmeabridge/control/error_injector.hpp"

// ─── Scenario ────────────────────────────────────────────────────────────────
#include "nmeabridge/scenario/definition.hpp"
#include "nmeabridge/scenario/engine.hpp"
#include "nmeabridge/scenario/generated_source.hpp"
#include "nmeabridge/scenario/library.hpp"
#include "nmeabridge/scenario/source.hpp"

// ─── Session ─────────────────────────────────────────────────────────────────
#include "nmeabridge/session/player.hpp"
#include "nmeabridge/session/recorder.hpp"
#include "nmeabridge/session/recording.hpp"

// ─── Network ─────────────────────────────────────────────────────────────────
#include "nmeabridge/net/broadcast.hpp"
#include "nmeabridge/net/can_mirror.hpp"
#include "nmeabridge/net/connection.hpp"
#include "nmeabridge/net/http.hpp"
#include "nmeabridge/net/http_server.hpp"
#include "nmeabridge/net/live_source.hpp"
#include "nmeabridge/net/server.hpp"
#include "nmeabridge/net/socket.hpp"
#include "nmeabridge/net/tcp_server.hpp"
#include "nmeabridge/net/websocket.hpp"
#include "nmeabridge/net/ws_server.hpp"

// ─── Application ─────────────────────────────────────────────────────────────
#include "nmeabridge/app/bridge.hpp"
#include "nmeabridge/app/config.hpp"
