#pragma once

#include "../core/constants.hpp"
#include "../nmea/sentence.hpp"
#include "../scenario/source.hpp"
#include "../util/timer.hpp"
#include "socket.hpp"
#include <atomic>
#include <echo/echo.hpp>
#include <mutex>
#include <thread>

namespace nmeabridge::net {

    inline constexpr u32 LIVE_RECONNECT_MS = 2000;

    // ─── Live passthrough ───────────────────────────────────────────────────────
    // Reads sentences from an upstream NMEA TCP bridge and republishes them on
    // the next engine tick. Lines failing validation are dropped. A lost upstream
    // is retried until the source is stopped.
    class LiveSource : public scenario::FrameSource {
        dp::String host_;
        u16 port_;
        Socket socket_;
        std::thread reader_;
        std::atomic<bool> running_{false};
        std::atomic<bool> connected_{false};
        std::atomic<u64> received_{0};
        std::atomic<u64> rejected_{0};
        std::mutex mtx_;
        dp::Vector<dp::String> inbox_;
        u64 tick_ = 0;

        void accept_line(const dp::String &raw) {
            dp::String line = nmea::strip_line_end(raw);
            if (line.empty())
                return;
            if (nmea::validate(line).is_err()) {
                rejected_++;
                echo::category("nmeabridge.live").trace("dropping invalid line: ", line);
                return;
            }
            received_++;
            std::lock_guard<std::mutex> lock(mtx_);
            inbox_.push_back(line);
        }

        // Reconnect backoff, cut short by stop()
        void backoff(u32 ms) {
            Timeout wait;
            wait.start(ms);
            while (running_ && !wait.update(100))
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        void read_loop() {
            u8 buf[2048];
            dp::String line;
            while (running_) {
                if (!connected_) {
                    auto s = Socket::connect(host_, port_);
                    if (s.is_err()) {
                        echo::category("nmeabridge.live").warn(s.error().message, ", retrying");
                        backoff(LIVE_RECONNECT_MS);
                        continue;
                    }
                    {
                        std::lock_guard<std::mutex> lock(mtx_);
                        socket_ = std::move(s.value());
                    }
                    connected_ = true;
                    line.clear();
                    echo::category("nmeabridge.live").info("connected to ", host_, ":", port_);
                }
                auto r = socket_.recv(buf, sizeof(buf), 200);
                if (r.is_err()) {
                    if (r.error().code == ErrorCode::Timeout)
                        continue;
                    echo::category("nmeabridge.live").warn("upstream lost: ", r.error().message);
                    connected_ = false;
                    {
                        std::lock_guard<std::mutex> lock(mtx_);
                        socket_.close();
                    }
                    backoff(LIVE_RECONNECT_MS);
                    continue;
                }
                for (usize i = 0; i < r.value(); ++i) {
                    char c = static_cast<char>(buf[i]);
                    if (c == '\n') {
                        accept_line(line);
                        line.clear();
                    } else if (line.size() < MAX_LINE_LENGTH) {
                        line += c;
                    }
                }
            }
        }

      public:
        LiveSource(dp::String host, u16 port) : host_(std::move(host)), port_(port) {}
        ~LiveSource() override { stop(); }

        dp::String name() const override { return host_ + ":" + dp::String(std::to_string(port_)); }
        dp::String kind() const override { return "live"; }
        VirtualMs duration_ms() const override { return 0; }
        bool loops() const override { return false; }

        bool connected() const noexcept { return connected_; }
        u64 received() const noexcept { return received_; }
        u64 rejected() const noexcept { return rejected_; }

        Result<void> start(u64) override {
            if (running_)
                return {};
            if (host_.empty() || port_ == 0)
                return Result<void>::err(Error::invalid_argument("live mode needs a host and a port"));
            running_ = true;
            reader_ = std::thread([this] { read_loop(); });
            return {};
        }

        dp::Vector<Packet> advance(VirtualMs, VirtualMs) override {
            dp::Vector<dp::String> lines;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                lines.swap(inbox_);
            }
            dp::Vector<Packet> out;
            for (const auto &l : lines)
                out.push_back(Packet::text(l + "\r\n", tick_));
            tick_++;
            return out;
        }

        void rewind() override {}

        void stop() override {
            if (!running_.exchange(false))
                return;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                socket_.shutdown();
            }
            if (reader_.joinable())
                reader_.join();
            socket_.close();
            connected_ = false;
            echo::category("nmeabridge.live").info("disconnected from ", host_, ":", port_);
        }
    };

} // namespace nmeabridge::net
