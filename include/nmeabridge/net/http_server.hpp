#pragma once

#include "../core/error.hpp"
#include "http.hpp"
#include "socket.hpp"
#include <atomic>
#include <echo/echo.hpp>
#include <functional>
#include <thread>

namespace nmeabridge::net {

    // ─── HTTP listener ──────────────────────────────────────────────────────────
    // One request per connection, handled on the accept task. Control traffic is
    // light; data clients never go through here.
    class HttpServer {
      public:
        using Handler = std::function<HttpResponse(const HttpRequest &)>;

      private:
        dp::String bind_address_;
        u16 port_;
        u16 bound_port_ = 0;
        Handler handler_;
        Socket listener_;
        std::thread thread_;
        std::atomic<bool> running_{false};
        std::atomic<u64> requests_{0};

        void serve_one(Socket client, const dp::String &peer) {
            auto req = read_request(client, 2000);
            HttpResponse resp;
            if (req.is_err()) {
                if (req.error().code == ErrorCode::Disconnected || req.error().code == ErrorCode::Timeout)
                    return;
                resp = HttpResponse::error(400, req.error().message);
            } else {
                requests_++;
                resp = handler_(req.value());
                echo::category("nmeabridge.api")
                    .debug(peer, " ", req.value().method, " ", req.value().target, " -> ", resp.status);
            }
            auto w = client.send_all(serialize(resp));
            if (w.is_err())
                echo::category("nmeabridge.api").debug(peer, ": ", w.error().message);
        }

        void accept_loop() {
            while (running_) {
                dp::String peer;
                auto r = listener_.accept(100, &peer);
                if (r.is_err()) {
                    if (running_)
                        echo::category("nmeabridge.api").error(r.error().message);
                    continue;
                }
                if (!r.value().valid())
                    continue;
                serve_one(std::move(r.value()), peer);
            }
        }

      public:
        HttpServer(dp::String bind_address, u16 port, Handler handler)
            : bind_address_(std::move(bind_address)), port_(port), handler_(std::move(handler)) {}

        ~HttpServer() { stop(); }

        HttpServer(const HttpServer &) = delete;
        HttpServer &operator=(const HttpServer &) = delete;

        Result<void> start() {
            if (running_)
                return {};
            auto l = Socket::listen(bind_address_, port_);
            if (l.is_err()) {
                echo::category("nmeabridge.api").error(l.error().message);
                return Result<void>::err(l.error());
            }
            listener_ = std::move(l.value());
            bound_port_ = listener_.local_port();
            running_ = true;
            thread_ = std::thread([this] { accept_loop(); });
            echo::category("nmeabridge.api").info("control API on ", bind_address_, ":", bound_port_);
            return {};
        }

        void stop() {
            if (!running_.exchange(false))
                return;
            if (thread_.joinable())
                thread_.join();
            listener_.close();
        }

        bool running() const noexcept { return running_; }
        u16 port() const noexcept { return bound_port_; }
        u64 requests() const noexcept { return requests_; }
    };

} // namespace nmeabridge::net
