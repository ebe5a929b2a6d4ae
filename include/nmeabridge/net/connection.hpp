#pragma once

#include "../core/constants.hpp"
#include "../core/packet.hpp"
#include "../nmea/sentence.hpp"
#include "../util/bounded_queue.hpp"
#include "../util/timer.hpp"
#include "socket.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <echo/echo.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace nmeabridge::net {

    enum class ConnectionKind : u8 { Tcp = 0, WebSocket };

    inline const char *to_string(ConnectionKind k) noexcept {
        return k == ConnectionKind::Tcp ? "tcp" : "websocket";
    }

    // Which packet kinds a connection receives from the broadcast
    enum class PayloadFilter : u8 { All = 0, TextOnly, BinaryOnly };

    struct ConnectionInfo {
        ConnectionId id = 0;
        ConnectionKind kind = ConnectionKind::Tcp;
        dp::String address;
        u64 connected_at_ms = 0;
        u64 last_activity_ms = 0;
        bool command_mode = false;
        u64 sent = 0;
        u64 dropped = 0;
        usize queued = 0;
        dp::String format;
    };

    // ─── One client connection ──────────────────────────────────────────────────
    // A read task and a write task that meet only at the outbound queue. The
    // broadcast side calls offer(), which never blocks; a stalled peer only
    // stalls its own writer.
    class ClientConnection {
      public:
        using Framer = std::function<Bytes(const Packet &)>;
        using Reader = std::function<void(ClientConnection &)>;

      private:
        ConnectionId id_;
        ConnectionKind kind_;
        dp::String address_;
        Socket socket_;
        // Enqueue time rides along for the added-latency fault
        struct Outbound {
            PacketPtr packet;
            u64 queued_ms = 0;
        };

        BoundedQueue<Outbound> queue_;
        Framer framer_;
        PayloadFilter filter_ = PayloadFilter::All;
        dp::String format_;

        std::mutex write_mtx_;
        std::thread reader_;
        std::thread writer_;
        std::atomic<bool> closed_{false};
        std::atomic<bool> ready_{false};
        std::atomic<bool> command_mode_{false};
        std::atomic<u64> connected_at_{0};
        std::atomic<u64> last_activity_{0};
        std::atomic<u64> sent_{0};
        std::atomic<u64> corrupt_until_{0};
        std::atomic<u64> suppress_until_{0};
        std::atomic<u64> delay_until_{0};
        std::atomic<u32> delay_ms_{0};

        // Holds an outbound packet until queued_ms + delay; false once closed
        bool hold(u64 queued_ms) {
            u64 release = queued_ms + delay_ms_;
            while (!closed_) {
                u64 now = epoch_ms();
                if (now >= release)
                    return true;
                std::this_thread::sleep_for(std::chrono::milliseconds(std::min<u64>(release - now, 50)));
            }
            return false;
        }

        void write_loop() {
            while (!closed_) {
                auto item = queue_.pop(std::chrono::milliseconds(100));
                if (!item)
                    continue;
                const PacketPtr &p = item->packet;
                u64 now = epoch_ms();
                if (now < suppress_until_)
                    continue;
                if (now < delay_until_ && !hold(item->queued_ms))
                    return;
                bool corrupt = p->kind == PacketKind::Text && now < corrupt_until_;
                auto r = corrupt ? write(framer_(Packet::text(nmea::corrupt_checksum(p->as_text()), p->tick)))
                                 : write(framer_(*p));
                if (r.is_err()) {
                    echo::category("nmeabridge.net").debug("connection ", id_, " write failed: ", r.error().message);
                    close();
                    return;
                }
                sent_++;
            }
        }

      public:
        ClientConnection(ConnectionId id, ConnectionKind kind, dp::String address, Socket socket,
                         usize queue_capacity = DEFAULT_QUEUE_CAPACITY,
                         OverflowPolicy policy = OverflowPolicy::DropOldest)
            : id_(id), kind_(kind), address_(std::move(address)), socket_(std::move(socket)),
              queue_(queue_capacity, policy), framer_([](const Packet &p) { return p.bytes; }) {
            connected_at_ = epoch_ms();
            last_activity_ = connected_at_.load();
        }

        ~ClientConnection() {
            close();
            join();
        }

        ClientConnection(const ClientConnection &) = delete;
        ClientConnection &operator=(const ClientConnection &) = delete;

        ConnectionId id() const noexcept { return id_; }
        ConnectionKind kind() const noexcept { return kind_; }
        const dp::String &address() const noexcept { return address_; }
        const Socket &socket() const noexcept { return socket_; }
        bool closed() const noexcept { return closed_; }
        bool ready() const noexcept { return ready_; }
        // Broadcast data flows only after this; framer and filter must be set first
        void mark_ready() noexcept { ready_ = true; }
        bool command_mode() const noexcept { return command_mode_; }
        void enter_command_mode() noexcept { command_mode_ = true; }
        u64 dropped() const { return queue_.dropped(); }
        u64 sent() const noexcept { return sent_; }
        usize queued() const { return queue_.size(); }

        // Set before mark_ready()
        void set_framer(Framer f) { framer_ = std::move(f); }
        void set_filter(PayloadFilter f, dp::String format) {
            filter_ = f;
            format_ = std::move(format);
        }

        void touch() noexcept { last_activity_ = epoch_ms(); }

        void start(Reader reader) {
            writer_ = std::thread([this] { write_loop(); });
            reader_ = std::thread([this, reader = std::move(reader)] {
                reader(*this);
                close();
            });
        }

        // Broadcast side; packets the peer did not negotiate are skipped
        PushResult offer(const PacketPtr &p) {
            if (closed_)
                return PushResult::Closed;
            if (!ready_)
                return PushResult::Queued;
            if ((filter_ == PayloadFilter::TextOnly && p->kind != PacketKind::Text) ||
                (filter_ == PayloadFilter::BinaryOnly && p->kind != PacketKind::Binary))
                return PushResult::Queued;
            auto r = queue_.push(Outbound{p, epoch_ms()});
            if (r == PushResult::Rejected) {
                echo::category("nmeabridge.net").warn("connection ", id_, " backpressure, disconnecting");
                close();
            }
            return r;
        }

        // Replies share the outbound queue so they stay ordered with data
        PushResult reply(const dp::String &line) {
            if (closed_)
                return PushResult::Closed;
            return queue_.push(Outbound{make_packet(Packet::text(line)), epoch_ms()});
        }

        // Direct write for control traffic, serialized with the writer task
        Result<void> write(const Bytes &bytes) {
            std::lock_guard<std::mutex> lock(write_mtx_);
            return socket_.send_all(bytes);
        }

        void corrupt_checksums_until(u64 epoch) noexcept { corrupt_until_ = epoch; }
        void suppress_output_until(u64 epoch) noexcept { suppress_until_ = epoch; }
        void delay_output_until(u64 epoch, u32 latency_ms) noexcept {
            delay_ms_ = latency_ms;
            delay_until_ = epoch;
        }

        void close() {
            if (closed_.exchange(true))
                return;
            queue_.close();
            socket_.shutdown();
            echo::category("nmeabridge.net").debug(to_string(kind_), " connection ", id_, " closed");
        }

        // Not callable from the connection's own tasks
        void join() {
            auto self = std::this_thread::get_id();
            if (reader_.joinable() && reader_.get_id() != self)
                reader_.join();
            if (writer_.joinable() && writer_.get_id() != self)
                writer_.join();
        }

        ConnectionInfo info() const {
            ConnectionInfo i;
            i.id = id_;
            i.kind = kind_;
            i.address = address_;
            i.connected_at_ms = connected_at_;
            i.last_activity_ms = last_activity_;
            i.command_mode = command_mode_;
            i.sent = sent_;
            i.dropped = queue_.dropped();
            i.queued = queue_.size();
            i.format = format_;
            return i;
        }
    };

    using ConnectionPtr = std::shared_ptr<ClientConnection>;

    inline ConnectionId next_connection_id() {
        static std::atomic<ConnectionId> next{1};
        return next++;
    }

} // namespace nmeabridge::net
