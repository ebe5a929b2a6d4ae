#pragma once

#include "../core/constants.hpp"
#include "../nmea/identifier.hpp"
#include "../nmea/sentence.hpp"
#include "../scenario/source.hpp"
#include "recording.hpp"
#include <echo/echo.hpp>
#include <memory>

namespace nmeabridge::session {

    inline constexpr u32 REPLAY_TICK_MS = 10;

    // ─── Recording replay ───────────────────────────────────────────────────────
    // Entries come out at their recorded offsets on the engine's virtual clock,
    // so the engine's speed multiplier scales the timing.
    class ReplaySource : public scenario::FrameSource {
        dp::String name_;
        Recording recording_;
        bool loop_ = false;
        usize cursor_ = 0;
        u64 tick_ = 0;
        dp::Vector<nmea::Frame> frames_;

      public:
        ReplaySource(dp::String name, Recording recording, bool loop = false)
            : name_(std::move(name)), recording_(std::move(recording)), loop_(loop) {}

        static Result<std::unique_ptr<ReplaySource>> open(const dp::String &path, bool loop = false) {
            auto rec = load_recording(path);
            if (rec.is_err())
                return Result<std::unique_ptr<ReplaySource>>::err(rec.error());
            return Result<std::unique_ptr<ReplaySource>>::ok(
                std::make_unique<ReplaySource>(path, std::move(rec.value()), loop));
        }

        dp::String name() const override { return name_; }
        dp::String kind() const override { return "replay"; }
        // One past the last offset, so the final entry is emitted before a wrap
        VirtualMs duration_ms() const override {
            return recording_.entries.empty() ? 1 : static_cast<VirtualMs>(recording_.duration_ms()) + 1;
        }
        bool loops() const override { return loop_; }
        u32 tick_ms() const override { return REPLAY_TICK_MS; }

        const Recording &recording() const noexcept { return recording_; }

        Result<void> start(u64) override {
            cursor_ = 0;
            tick_ = 0;
            echo::category("nmeabridge.player")
                .info("replaying ", name_, ": ", recording_.entries.size(), " entries, source mode ",
                      recording_.header.source_mode);
            return {};
        }

        dp::Vector<Packet> advance(VirtualMs from, VirtualMs to) override {
            dp::Vector<Packet> out;
            frames_.clear();
            while (cursor_ < recording_.entries.size()) {
                const auto &e = recording_.entries[cursor_];
                if (e.offset_ms >= to)
                    break;
                if (e.offset_ms >= from) {
                    if (e.kind == PacketKind::Binary) {
                        out.push_back(Packet::binary(e.bytes, tick_));
                        if (auto f = nmea::from_wire(e.bytes))
                            frames_.push_back(*f);
                    } else {
                        Packet p;
                        p.kind = PacketKind::Text;
                        p.bytes = e.bytes;
                        p.tick = tick_;
                        out.push_back(std::move(p));
                    }
                }
                cursor_++;
            }
            tick_++;
            return out;
        }

        dp::Vector<nmea::Frame> take_frames() override { return std::move(frames_); }

        void rewind() override { cursor_ = 0; }
    };

    // ─── Plain-text NMEA log replay ─────────────────────────────────────────────
    // One sentence per line at a fixed rate. Lines failing checksum validation
    // are skipped.
    class TextLogSource : public scenario::FrameSource {
        dp::String name_;
        dp::Vector<dp::String> lines_;
        f64 rate_ = 10.0;
        bool loop_ = false;
        usize cursor_ = 0;
        u64 tick_ = 0;

        VirtualMs offset_of(usize i) const { return static_cast<VirtualMs>(static_cast<f64>(i) * 1000.0 / rate_); }

      public:
        TextLogSource(dp::String name, dp::Vector<dp::String> lines, f64 rate, bool loop)
            : name_(std::move(name)), lines_(std::move(lines)), rate_(rate), loop_(loop) {}

        static Result<std::unique_ptr<TextLogSource>> parse(const dp::String &name, const dp::String &text, f64 rate,
                                                            bool loop) {
            if (!(rate > 0.0))
                return Result<std::unique_ptr<TextLogSource>>::err(Error::invalid_argument("rate must be positive"));
            dp::Vector<dp::String> lines;
            usize skipped = 0;
            usize start = 0;
            while (start < text.size()) {
                usize end = text.find('\n', start);
                if (end == dp::String::npos)
                    end = text.size();
                dp::String line = nmea::strip_line_end(text.substr(start, end - start));
                start = end + 1;
                if (line.empty())
                    continue;
                if (nmea::validate(line).is_err()) {
                    skipped++;
                    continue;
                }
                lines.push_back(line);
            }
            if (skipped > 0)
                echo::category("nmeabridge.player").warn(name, ": skipped ", skipped, " invalid lines");
            if (lines.empty())
                return Result<std::unique_ptr<TextLogSource>>::err(
                    Error::invalid_recording(name + ": no valid sentences"));
            return Result<std::unique_ptr<TextLogSource>>::ok(
                std::make_unique<TextLogSource>(name, std::move(lines), rate, loop));
        }

        static Result<std::unique_ptr<TextLogSource>> open(const dp::String &path, f64 rate, bool loop) {
            auto data = read_file(path);
            if (data.is_err())
                return Result<std::unique_ptr<TextLogSource>>::err(data.error());
            return parse(path, dp::String(data.value().begin(), data.value().end()), rate, loop);
        }

        dp::String name() const override { return name_; }
        dp::String kind() const override { return "file"; }
        VirtualMs duration_ms() const override { return offset_of(lines_.size()); }
        bool loops() const override { return loop_; }
        u32 tick_ms() const override { return REPLAY_TICK_MS; }

        usize size() const noexcept { return lines_.size(); }

        Result<void> start(u64) override {
            cursor_ = 0;
            tick_ = 0;
            echo::category("nmeabridge.player").info("playing ", name_, ": ", lines_.size(), " sentences at ", rate_,
                                                      "/s");
            return {};
        }

        dp::Vector<Packet> advance(VirtualMs from, VirtualMs to) override {
            dp::Vector<Packet> out;
            while (cursor_ < lines_.size()) {
                VirtualMs at = offset_of(cursor_);
                if (at >= to)
                    break;
                if (at >= from)
                    out.push_back(Packet::text(lines_[cursor_] + "\r\n", tick_));
                cursor_++;
            }
            tick_++;
            return out;
        }

        void rewind() override { cursor_ = 0; }
    };

} // namespace nmeabridge::session
