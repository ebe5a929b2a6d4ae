#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../net/broadcast.hpp"
#include "../util/timer.hpp"
#include "recording.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <echo/echo.hpp>
#include <functional>
#include <mutex>
#include <thread>

namespace nmeabridge::session {

    struct RecorderConfig {
        u32 flush_ms = DEFAULT_FLUSH_MS;
        dp::String directory = ".";

        RecorderConfig &flush_every(u32 ms) {
            flush_ms = ms;
            return *this;
        }
        RecorderConfig &in(dp::String dir) {
            directory = std::move(dir);
            return *this;
        }
    };

    struct RecorderStatus {
        bool recording = false;
        dp::String path;
        u64 entries = 0;
        u64 bytes_written = 0;
        u64 started_at_ms = 0;
        u64 elapsed_ms = 0;
    };

    // ─── Session recorder ───────────────────────────────────────────────────────
    // Taps the broadcast channel. The tap only appends to an in-memory buffer;
    // a flusher thread writes it out every flush period and on stop.
    class SessionRecorder {
        RecorderConfig config_;
        net::Broadcast &broadcast_;
        std::function<u64()> clock_ = [] { return monotonic_ms(); };

        mutable std::mutex mtx_;
        std::condition_variable cv_;
        std::FILE *file_ = nullptr;
        Bytes pending_;
        net::Broadcast::SubscriberId sub_ = 0;
        dp::String path_;
        u64 start_mono_ = 0;
        u64 started_at_ms_ = 0;
        u64 entries_ = 0;
        u64 bytes_written_ = 0;
        bool active_ = false;
        std::thread flusher_;

        // Caller holds mtx_
        Result<void> flush_locked() {
            if (!file_ || pending_.empty())
                return {};
            usize n = std::fwrite(pending_.data(), 1, pending_.size(), file_);
            if (n != pending_.size() || std::fflush(file_) != 0) {
                return Result<void>::err(Error::io_error("write failed: " + path_));
            }
            bytes_written_ += n;
            pending_.clear();
            return {};
        }

        void flush_loop() {
            std::unique_lock<std::mutex> lock(mtx_);
            while (active_) {
                cv_.wait_for(lock, std::chrono::milliseconds(config_.flush_ms), [this] { return !active_; });
                auto r = flush_locked();
                if (r.is_err())
                    echo::category("nmeabridge.recorder").error(r.error().message);
            }
        }

        void tap(const PacketPtr &p) {
            std::lock_guard<std::mutex> lock(mtx_);
            if (!active_)
                return;
            RecordingEntry e;
            e.offset_ms = static_cast<u32>(clock_() - start_mono_);
            e.kind = p->kind;
            e.bytes = p->bytes;
            encode_entry(pending_, e);
            entries_++;
        }

      public:
        SessionRecorder(net::Broadcast &broadcast, RecorderConfig config = {})
            : config_(std::move(config)), broadcast_(broadcast) {}

        ~SessionRecorder() {
            auto r = stop();
            if (r.is_err())
                echo::category("nmeabridge.recorder").error(r.error().message);
        }

        SessionRecorder(const SessionRecorder &) = delete;
        SessionRecorder &operator=(const SessionRecorder &) = delete;

        void set_clock(std::function<u64()> clock) { clock_ = std::move(clock); }

        // Default file name is derived from the wall clock
        dp::String default_path() const {
            return config_.directory + "/session-" + dp::String(std::to_string(epoch_ms())) + ".nbrc";
        }

        Result<dp::String> start(dp::Optional<dp::String> path, const dp::String &source_mode) {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                if (active_)
                    return Result<dp::String>::err(Error::invalid_state("already recording to " + path_));
                dp::String target = path ? *path : default_path();
                std::FILE *f = std::fopen(target.c_str(), "wb");
                if (!f)
                    return Result<dp::String>::err(Error::io_error("cannot create " + target));

                file_ = f;
                path_ = target;
                entries_ = 0;
                bytes_written_ = 0;
                start_mono_ = clock_();
                started_at_ms_ = epoch_ms();
                RecordingHeader h;
                h.source_mode = source_mode;
                h.start_epoch_ms = started_at_ms_;
                pending_ = encode_header(h);
                auto r = flush_locked();
                if (r.is_err()) {
                    std::fclose(file_);
                    file_ = nullptr;
                    return Result<dp::String>::err(r.error());
                }
                active_ = true;
            }
            // The broadcast lock is taken before ours on publish; never nest them the other way
            sub_ = broadcast_.subscribe([this](const PacketPtr &p) { tap(p); });
            flusher_ = std::thread([this] { flush_loop(); });
            echo::category("nmeabridge.recorder").info("recording to ", path_);
            return Result<dp::String>::ok(path_);
        }

        // Stopping a stopped recorder succeeds
        Result<void> stop() {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                if (!active_)
                    return {};
                active_ = false;
            }
            broadcast_.unsubscribe(sub_);
            cv_.notify_all();
            if (flusher_.joinable())
                flusher_.join();

            std::lock_guard<std::mutex> lock(mtx_);
            auto r = flush_locked();
            std::fclose(file_);
            file_ = nullptr;
            echo::category("nmeabridge.recorder").info("recording stopped: ", entries_, " entries in ", path_);
            return r;
        }

        // Writes buffered entries now
        Result<void> flush() {
            std::lock_guard<std::mutex> lock(mtx_);
            return flush_locked();
        }

        RecorderStatus status() const {
            std::lock_guard<std::mutex> lock(mtx_);
            RecorderStatus s;
            s.recording = active_;
            s.path = path_;
            s.entries = entries_;
            s.bytes_written = bytes_written_;
            s.started_at_ms = started_at_ms_;
            s.elapsed_ms = active_ ? clock_() - start_mono_ : 0;
            return s;
        }

        bool recording() const {
            std::lock_guard<std::mutex> lock(mtx_);
            return active_;
        }
    };

} // namespace nmeabridge::session
