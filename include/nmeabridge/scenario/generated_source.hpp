#pragma once

#include "../control/autopilot.hpp"
#include "../nmea/codec.hpp"
#include "../telemetry/generator.hpp"
#include "../util/timer.hpp"
#include "definition.hpp"
#include "source.hpp"
#include <echo/echo.hpp>

namespace nmeabridge::scenario {

    // ─── Generated scenario source ──────────────────────────────────────────────
    // Applies scenario events as virtual time passes them, runs the generator
    // once per tick and encodes the sentence groups that are due.
    class GeneratedSource : public FrameSource {
        ScenarioDefinition def_;
        control::AutopilotController &autopilot_;
        telemetry::DataGenerator generator_;
        nmea::BridgeCodec codec_;
        dp::Array<Timer, nmea::GROUP_COUNT> group_timers_;
        usize next_event_ = 0;
        VirtualMs session_base_ = 0;
        u64 tick_ = 0;
        dp::Optional<dp::String> last_checkpoint_;
        dp::Vector<nmea::Frame> frames_;
        bool first_tick_ = true;
        f64 last_heading_ = 0.0;
        VirtualMs last_session_t_ = 0;

        void apply_event(const ScenarioEvent &ev) {
            for (const auto &key : ev.cleared)
                generator_.clear_pattern(key);
            for (const auto &[key, spec] : ev.patterns) {
                auto r = generator_.set_pattern(key, spec);
                if (r.is_err())
                    echo::category("nmeabridge.scenario").warn(r.error().message);
            }
            f64 heading = last_heading_;
            for (const auto &t : ev.transitions) {
                switch (t.kind) {
                case TransitionKind::EngageAutopilot:
                    autopilot_.force_mode(control::AutopilotMode::Auto, heading);
                    break;
                case TransitionKind::DisengageAutopilot:
                    autopilot_.force_mode(control::AutopilotMode::Standby, heading);
                    break;
                case TransitionKind::SetMode:
                    autopilot_.force_mode(t.mode, heading);
                    break;
                case TransitionKind::SetHeading:
                    autopilot_.force_mode(control::AutopilotMode::Auto, heading);
                    autopilot_.force_target(t.value);
                    break;
                case TransitionKind::GpsDropout:
                    generator_.set_gps_dropout(true);
                    break;
                case TransitionKind::GpsRestore:
                    generator_.set_gps_dropout(false);
                    break;
                }
            }
            if (ev.checkpoint) {
                last_checkpoint_ = ev.checkpoint;
                echo::category("nmeabridge.scenario").info(def_.name, ": checkpoint ", *ev.checkpoint);
            }
            if (!ev.description.empty())
                echo::category("nmeabridge.scenario").debug(def_.name, ": ", ev.description);
        }

        void apply_events_through(VirtualMs t) {
            while (next_event_ < def_.events.size() && def_.events[next_event_].at_ms() <= t) {
                apply_event(def_.events[next_event_]);
                next_event_++;
            }
        }

        void reset_timers() {
            for (u8 i = 0; i < nmea::GROUP_COUNT; ++i) {
                group_timers_[i] = Timer(def_.tick_ms);
                for (const auto &[group, hz] : def_.timing) {
                    if (static_cast<u8>(group) == i)
                        group_timers_[i] = Timer::from_rate(hz);
                }
                group_timers_[i].start();
            }
            first_tick_ = true;
        }

        nmea::GroupMask due_groups() {
            nmea::GroupMask mask;
            for (u8 i = 0; i < nmea::GROUP_COUNT; ++i) {
                u32 fired = first_tick_ ? 1 : group_timers_[i].update(def_.tick_ms);
                if (fired > 0 && group_timers_[i].interval() > 0)
                    mask.set(static_cast<nmea::Group>(i));
            }
            first_tick_ = false;
            return mask;
        }

      public:
        GeneratedSource(ScenarioDefinition def, control::AutopilotController &autopilot, BridgeMode mode, u64 seed)
            : def_(std::move(def)), autopilot_(autopilot),
              generator_(def_.seed.value_or(seed), def_.vessel), codec_(def_.bridge_mode.value_or(mode)) {
            reset_timers();
        }

        dp::String name() const override { return def_.name; }
        dp::String kind() const override { return "scenario"; }
        VirtualMs duration_ms() const override { return def_.duration_ms(); }
        bool loops() const override { return def_.loop; }
        u32 tick_ms() const override { return def_.tick_ms; }

        const ScenarioDefinition &definition() const noexcept { return def_; }
        const telemetry::DataGenerator &generator() const noexcept { return generator_; }
        BridgeMode bridge_mode() const noexcept { return codec_.mode(); }
        u64 dropped_sentences() const noexcept { return codec_.dropped(); }

        void set_loop(bool loop) { def_.loop = loop; }

        Result<void> start(u64 epoch_ms) override {
            codec_.set_epoch_ms(epoch_ms);
            generator_.apply_defaults();
            generator_.reset();
            next_event_ = 0;
            session_base_ = 0;
            last_session_t_ = 0;
            tick_ = 0;
            last_checkpoint_ = dp::nullopt;
            reset_timers();
            echo::category("nmeabridge.scenario")
                .info("starting ", def_.name, " duration=", def_.duration_s, "s mode=", to_string(codec_.mode()));
            return {};
        }

        dp::Vector<Packet> advance(VirtualMs from, VirtualMs to) override {
            dp::Vector<Packet> out;
            frames_.clear();
            VirtualMs tick = def_.tick_ms;
            for (VirtualMs t = ((from + tick - 1) / tick) * tick; t < to; t += tick) {
                apply_events_through(t);
                last_session_t_ = session_base_ + t;
                auto rec = generator_.tick(t, last_session_t_, autopilot_.state());
                last_heading_ = rec.get(telemetry::Channel::HDG).value_or(last_heading_);
                auto encoded = codec_.encode(rec, autopilot_.state(), due_groups(), tick_++);
                for (auto &p : encoded.packets)
                    out.push_back(std::move(p));
                for (const auto &f : encoded.frames)
                    frames_.push_back(f);
            }
            return out;
        }

        dp::Vector<nmea::Frame> take_frames() override { return std::move(frames_); }

        void rewind() override {
            session_base_ += def_.duration_ms();
            next_event_ = 0;
            generator_.rewind();
        }

        // Accumulators are released and every event up to the checkpoint re-applied
        Result<VirtualMs> seek(const dp::String &checkpoint) override {
            auto at = def_.checkpoint_time(checkpoint);
            if (!at)
                return Result<VirtualMs>::err(Error::not_found("checkpoint '" + checkpoint + "' not found"));
            generator_.apply_defaults();
            generator_.reset();
            autopilot_.reset();
            next_event_ = 0;
            reset_timers();
            apply_events_through(*at);
            // Record timestamps keep increasing across the jump
            VirtualMs floor = last_session_t_ + def_.tick_ms;
            if (session_base_ + *at < floor)
                session_base_ = floor - *at;
            echo::category("nmeabridge.scenario").info(def_.name, ": seek to ", checkpoint, " at ", *at, "ms");
            return Result<VirtualMs>::ok(*at);
        }

        dp::Optional<dp::String> last_checkpoint() const override { return last_checkpoint_; }
        dp::Optional<f64> heading() const override { return last_heading_; }
    };

} // namespace nmeabridge::scenario
