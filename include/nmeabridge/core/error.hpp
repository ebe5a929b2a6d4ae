#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace nmeabridge {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        InvalidScenario,
        InvalidPattern,
        InvalidSentence,
        InvalidCommand,
        InvalidRecording,
        InvalidArgument,
        RateLimited,
        InvalidState,
        NotFound,
        BindFailed,
        SocketError,
        Disconnected,
        IoError,
        Timeout,
        BufferOverflow,
    };

    // ─── Error classes ───────────────────────────────────────────────────────────
    enum class ErrorClass : u8 { None, Validation, Transport, Generation, Fatal };

    inline ErrorClass classify(ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::Ok:
            return ErrorClass::None;
        case ErrorCode::InvalidScenario:
        case ErrorCode::InvalidPattern:
        case ErrorCode::InvalidSentence:
        case ErrorCode::InvalidCommand:
        case ErrorCode::InvalidRecording:
        case ErrorCode::InvalidArgument:
        case ErrorCode::RateLimited:
        case ErrorCode::InvalidState:
        case ErrorCode::NotFound:
            return ErrorClass::Validation;
        case ErrorCode::SocketError:
        case ErrorCode::Disconnected:
        case ErrorCode::Timeout:
        case ErrorCode::BufferOverflow:
        case ErrorCode::IoError:
            return ErrorClass::Transport;
        case ErrorCode::BindFailed:
            return ErrorClass::Fatal;
        }
        return ErrorClass::Fatal;
    }

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        ErrorClass error_class() const noexcept { return classify(code); }

        static Error invalid_scenario(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidScenario, std::move(msg));
        }
        static Error invalid_pattern(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidPattern, std::move(msg));
        }
        static Error invalid_sentence(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidSentence, std::move(msg));
        }
        static Error invalid_command(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidCommand, std::move(msg));
        }
        static Error invalid_recording(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidRecording, std::move(msg));
        }
        static Error invalid_argument(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidArgument, std::move(msg));
        }
        static Error rate_limited() noexcept { return Error(ErrorCode::RateLimited, "rate limited"); }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
        static Error not_found(dp::String msg = "") noexcept { return Error(ErrorCode::NotFound, std::move(msg)); }
        static Error bind_failed(u16 port, dp::String msg = "") noexcept {
            return Error(ErrorCode::BindFailed,
                         "bind failed on port " + dp::String(std::to_string(port)) + (msg.empty() ? "" : ": ") + msg);
        }
        static Error socket_error(dp::String msg = "") noexcept {
            return Error(ErrorCode::SocketError, std::move(msg));
        }
        static Error disconnected() noexcept { return Error(ErrorCode::Disconnected, "peer disconnected"); }
        static Error io_error(dp::String msg = "") noexcept { return Error(ErrorCode::IoError, std::move(msg)); }
        static Error timeout(dp::String msg = "") noexcept { return Error(ErrorCode::Timeout, std::move(msg)); }
        static Error buffer_overflow() noexcept { return Error(ErrorCode::BufferOverflow, "buffer overflow"); }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace nmeabridge
