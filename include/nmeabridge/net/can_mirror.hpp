#pragma once

#include "../core/error.hpp"
#include "../nmea/identifier.hpp"
#include <atomic>
#include <echo/echo.hpp>
#include <memory>
#include <wirebit/can/can_endpoint.hpp>
#include <wirebit/can/socketcan_link.hpp>

namespace nmeabridge::net {

    // ─── CAN mirror ─────────────────────────────────────────────────────────────
    // Writes every generated NMEA 2000 frame to a CAN link as well, so real N2K
    // tooling on a (v)can interface sees the same traffic as the TCP clients.
    class CanMirror {
        std::shared_ptr<wirebit::Link> link_;
        wirebit::CanEndpoint endpoint_;
        std::atomic<u64> sent_{0};
        std::atomic<u64> failed_{0};

      public:
        explicit CanMirror(std::shared_ptr<wirebit::Link> link, u32 bitrate = 250000)
            : link_(link), endpoint_(link, wirebit::CanConfig{.bitrate = bitrate}, 1) {}

        static Result<std::unique_ptr<CanMirror>> open(const dp::String &interface_name) {
            auto link_result = wirebit::SocketCanLink::create({.interface_name = interface_name,
                                                               .create_if_missing = true});
            if (!link_result.is_ok()) {
                return Result<std::unique_ptr<CanMirror>>::err(
                    Error::socket_error("cannot open CAN interface " + interface_name + ": " +
                                        link_result.error().message));
            }
            auto link = std::make_shared<wirebit::SocketCanLink>(std::move(link_result.value()));
            echo::category("nmeabridge.can").info("mirroring NMEA 2000 frames to ", interface_name);
            return Result<std::unique_ptr<CanMirror>>::ok(std::make_unique<CanMirror>(link));
        }

        static can_frame to_can_frame(const nmea::Frame &frame) {
            can_frame cf = {};
            cf.can_id = frame.id.raw | CAN_EFF_FLAG;
            cf.can_dlc = frame.length;
            for (u8 i = 0; i < frame.length && i < 8; ++i)
                cf.data[i] = frame.data[i];
            return cf;
        }

        usize mirror(const dp::Vector<nmea::Frame> &frames) {
            usize ok = 0;
            for (const auto &f : frames) {
                auto r = endpoint_.send_can(to_can_frame(f));
                if (r.is_ok()) {
                    sent_++;
                    ok++;
                } else {
                    failed_++;
                    echo::category("nmeabridge.can").debug("send_can failed for pgn ", f.pgn());
                }
            }
            return ok;
        }

        u64 sent() const noexcept { return sent_; }
        u64 failed() const noexcept { return failed_; }
        const wirebit::Link &link() const noexcept { return *link_; }
    };

} // namespace nmeabridge::net
