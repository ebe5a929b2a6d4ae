#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "broadcast.hpp"
#include "connection.hpp"
#include "socket.hpp"
#include <atomic>
#include <echo/echo.hpp>
#include <functional>
#include <mutex>
#include <thread>

namespace nmeabridge::net {

    struct ServerConfig {
        dp::String bind_address = "0.0.0.0";
        u16 port = 0;
        usize max_clients = DEFAULT_MAX_CLIENTS;
        usize queue_capacity = DEFAULT_QUEUE_CAPACITY;
        OverflowPolicy overflow = OverflowPolicy::DropOldest;

        ServerConfig &bind(dp::String addr) {
            bind_address = std::move(addr);
            return *this;
        }
        ServerConfig &listen_on(u16 p) {
            port = p;
            return *this;
        }
        ServerConfig &clients(usize n) {
            max_clients = n;
            return *this;
        }
        ServerConfig &queue(usize capacity, OverflowPolicy policy = OverflowPolicy::DropOldest) {
            queue_capacity = capacity;
            overflow = policy;
            return *this;
        }
    };

    // Complete inbound text unit (a line or a WebSocket text message)
    using LineHandler = std::function<void(ClientConnection &, const dp::String &)>;

    // ─── Stream server base ─────────────────────────────────────────────────────
    // Owns the listener, the accept task and the connection set. Subclasses
    // provide the per-connection read loop, which runs on the connection's read
    // task and calls mark_ready() once the peer may receive broadcast data.
    class StreamServer {
      protected:
        ServerConfig config_;
        Broadcast &broadcast_;
        LineHandler on_line_;
        Socket listener_;
        u16 bound_port_ = 0;
        std::thread accept_thread_;
        std::atomic<bool> running_{false};
        Broadcast::SubscriberId sub_ = 0;

        mutable std::mutex conns_mtx_;
        dp::Vector<ConnectionPtr> conns_;
        std::atomic<u64> last_broadcast_ms_{0};
        std::atomic<u64> accepted_{0};
        std::atomic<u64> refused_{0};

        virtual ConnectionKind kind() const noexcept = 0;
        virtual const char *log_category() const noexcept = 0;
        virtual void serve(ClientConnection &conn) = 0;

        void fan_out(const PacketPtr &p) {
            std::lock_guard<std::mutex> lock(conns_mtx_);
            for (auto &c : conns_)
                c->offer(p);
            last_broadcast_ms_ = epoch_ms();
        }

        // Closed connections are joined outside the lock
        void reap() {
            dp::Vector<ConnectionPtr> dead;
            {
                std::lock_guard<std::mutex> lock(conns_mtx_);
                for (auto it = conns_.begin(); it != conns_.end();) {
                    if ((*it)->closed()) {
                        dead.push_back(*it);
                        it = conns_.erase(it);
                    } else {
                        ++it;
                    }
                }
            }
            for (auto &c : dead) {
                c->join();
                echo::category(log_category()).info("client ", c->id(), " (", c->address(), ") removed");
            }
        }

        void accept_loop() {
            while (running_) {
                dp::String peer;
                auto r = listener_.accept(100, &peer);
                reap();
                if (r.is_err()) {
                    if (running_)
                        echo::category(log_category()).error(r.error().message);
                    continue;
                }
                if (!r.value().valid())
                    continue;

                if (connection_count() >= config_.max_clients) {
                    refused_++;
                    echo::category(log_category())
                        .warn("client limit ", config_.max_clients, " reached, refusing ", peer);
                    continue; // socket closes on scope exit
                }

                auto conn = std::make_shared<ClientConnection>(next_connection_id(), kind(), peer,
                                                               std::move(r.value()), config_.queue_capacity,
                                                               config_.overflow);
                {
                    std::lock_guard<std::mutex> lock(conns_mtx_);
                    conns_.push_back(conn);
                }
                accepted_++;
                echo::category(log_category()).info("client ", conn->id(), " connected from ", peer);
                conn->start([this](ClientConnection &c) { serve(c); });
            }
        }

      public:
        StreamServer(ServerConfig config, Broadcast &broadcast, LineHandler on_line = {})
            : config_(std::move(config)), broadcast_(broadcast), on_line_(std::move(on_line)) {}

        virtual ~StreamServer() = default;

        StreamServer(const StreamServer &) = delete;
        StreamServer &operator=(const StreamServer &) = delete;

        void set_line_handler(LineHandler h) { on_line_ = std::move(h); }

        Result<void> start() {
            if (running_)
                return {};
            auto l = Socket::listen(config_.bind_address, config_.port);
            if (l.is_err()) {
                echo::category(log_category()).error(l.error().message);
                return Result<void>::err(l.error());
            }
            listener_ = std::move(l.value());
            bound_port_ = listener_.local_port();
            running_ = true;
            sub_ = broadcast_.subscribe([this](const PacketPtr &p) { fan_out(p); });
            accept_thread_ = std::thread([this] { accept_loop(); });
            echo::category(log_category()).info("listening on ", config_.bind_address, ":", bound_port_);
            return {};
        }

        // Idempotent
        void stop() {
            if (!running_.exchange(false))
                return;
            broadcast_.unsubscribe(sub_);
            if (accept_thread_.joinable())
                accept_thread_.join();
            dp::Vector<ConnectionPtr> all;
            {
                std::lock_guard<std::mutex> lock(conns_mtx_);
                all.swap(conns_);
            }
            for (auto &c : all)
                c->close();
            for (auto &c : all)
                c->join();
            listener_.close();
            echo::category(log_category()).info("stopped");
        }

        bool running() const noexcept { return running_; }
        u16 port() const noexcept { return bound_port_; }
        u64 last_broadcast_ms() const noexcept { return last_broadcast_ms_; }
        u64 accepted() const noexcept { return accepted_; }
        u64 refused() const noexcept { return refused_; }

        usize connection_count() const {
            std::lock_guard<std::mutex> lock(conns_mtx_);
            usize n = 0;
            for (const auto &c : conns_)
                n += c->closed() ? 0 : 1;
            return n;
        }

        dp::Vector<ConnectionPtr> connections() const {
            std::lock_guard<std::mutex> lock(conns_mtx_);
            dp::Vector<ConnectionPtr> out;
            for (const auto &c : conns_) {
                if (!c->closed())
                    out.push_back(c);
            }
            return out;
        }

        dp::Vector<ConnectionInfo> connection_info() const {
            dp::Vector<ConnectionInfo> out;
            for (const auto &c : connections())
                out.push_back(c->info());
            return out;
        }

        u64 dropped() const {
            u64 total = 0;
            for (const auto &c : connections())
                total += c->dropped();
            return total;
        }

        bool disconnect(ConnectionId id) {
            for (auto &c : connections()) {
                if (c->id() == id) {
                    c->close();
                    return true;
                }
            }
            return false;
        }

        usize disconnect_all() {
            auto all = connections();
            for (auto &c : all)
                c->close();
            return all.size();
        }
    };

} // namespace nmeabridge::net
