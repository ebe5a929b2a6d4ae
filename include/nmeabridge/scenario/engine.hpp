#pragma once

#include "../control/autopilot.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/packet.hpp"
#include "../util/event.hpp"
#include "../util/mailbox.hpp"
#include "../util/state_machine.hpp"
#include "../util/timer.hpp"
#include "generated_source.hpp"
#include "library.hpp"
#include "source.hpp"
#include <atomic>
#include <chrono>
#include <echo/echo.hpp>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace nmeabridge::scenario {

    // ─── Engine states ──────────────────────────────────────────────────────────
    enum class EngineState : u8 { Idle = 0, Loading, Running, Looping, Paused, Stopped };

    inline const char *to_string(EngineState s) noexcept {
        switch (s) {
        case EngineState::Idle:
            return "idle";
        case EngineState::Loading:
            return "loading";
        case EngineState::Running:
            return "running";
        case EngineState::Looping:
            return "looping";
        case EngineState::Paused:
            return "paused";
        case EngineState::Stopped:
            return "stopped";
        }
        return "unknown";
    }

    // ─── Engine configuration ───────────────────────────────────────────────────
    struct EngineConfig {
        u32 tick_ms = DEFAULT_TICK_MS;
        BridgeMode bridge_mode = BridgeMode::Nmea0183;
        u64 seed = DEFAULT_SEED;
        u32 command_burst = COMMAND_BUCKET_CAPACITY;
        u32 command_refill_ms = COMMAND_REFILL_MS;

        EngineConfig &tick(u32 ms) {
            tick_ms = ms;
            return *this;
        }
        EngineConfig &mode(BridgeMode m) {
            bridge_mode = m;
            return *this;
        }
        EngineConfig &session_seed(u64 s) {
            seed = s;
            return *this;
        }
        EngineConfig &command_rate(u32 burst, u32 refill_ms) {
            command_burst = burst;
            command_refill_ms = refill_ms;
            return *this;
        }
    };

    struct RunOptions {
        dp::Optional<bool> loop;
        f64 speed = 1.0;
    };

    // ─── Status snapshot (readable from any thread) ─────────────────────────────
    struct EngineStatus {
        EngineState state = EngineState::Idle;
        dp::String source_name;
        dp::String source_kind;
        VirtualMs virtual_ms = 0;
        VirtualMs duration_ms = 0;
        u32 loop_count = 0;
        f64 speed = 1.0;
        bool loop = false;
        dp::Optional<dp::String> last_checkpoint;
        dp::String last_error;
        u64 ticks = 0;
        u64 packets = 0;
        control::AutopilotCommandState autopilot;
    };

    // ─── Scenario engine ────────────────────────────────────────────────────────
    // Owns the virtual clock, the active frame source and the autopilot state.
    // Other tasks reach it only through post()/call(); the closures run on the
    // engine task in arrival order. Without a running task the engine can be
    // driven directly with update().
    class ScenarioEngine {
        using Message = std::function<void(ScenarioEngine &)>;

        EngineConfig config_;
        const ScenarioLibrary *library_ = nullptr;
        StateMachine<EngineState> sm_;
        control::AutopilotController autopilot_;
        std::unique_ptr<FrameSource> source_;
        VirtualMs virtual_ms_ = 0;
        f64 carry_ms_ = 0.0;
        f64 speed_ = 1.0;
        bool loop_ = false;
        u32 loop_count_ = 0;
        EngineState resume_state_ = EngineState::Running;
        dp::String last_error_;
        u64 ticks_ = 0;
        u64 packets_ = 0;
        std::function<u64()> clock_ = [] { return monotonic_ms(); };

        Mailbox<Message> mailbox_;
        std::recursive_mutex inline_mtx_;
        std::thread thread_;
        std::atomic<bool> stop_flag_{false};
        std::atomic<bool> running_{false};
        std::mutex post_mtx_; // orders post() against the task stopping
        std::thread::id engine_thread_id_;

        mutable std::mutex status_mtx_;
        EngineStatus snapshot_;

        static StateMachine<EngineState> make_state_machine() {
            using S = EngineState;
            return StateMachine<S>(S::Idle, {{S::Idle, S::Loading},
                                             {S::Stopped, S::Loading},
                                             {S::Loading, S::Running},
                                             {S::Loading, S::Stopped},
                                             {S::Running, S::Looping},
                                             {S::Running, S::Paused},
                                             {S::Running, S::Stopped},
                                             {S::Looping, S::Paused},
                                             {S::Looping, S::Stopped},
                                             {S::Paused, S::Running},
                                             {S::Paused, S::Looping},
                                             {S::Paused, S::Stopped}});
        }

        void publish_snapshot() {
            EngineStatus s;
            s.state = sm_.state();
            if (source_) {
                s.source_name = source_->name();
                s.source_kind = source_->kind();
                s.duration_ms = source_->duration_ms();
                s.last_checkpoint = source_->last_checkpoint();
            } else {
                s.source_name = last_source_name_;
                s.source_kind = last_source_kind_;
            }
            s.virtual_ms = virtual_ms_;
            s.loop_count = loop_count_;
            s.speed = speed_;
            s.loop = loop_;
            s.last_error = last_error_;
            s.ticks = ticks_;
            s.packets = packets_;
            s.autopilot = autopilot_.state();
            std::lock_guard<std::mutex> lock(status_mtx_);
            snapshot_ = std::move(s);
        }

        void emit_range(VirtualMs from, VirtualMs to) {
            if (to <= from || !source_)
                return;
            auto packets = source_->advance(from, to);
            auto frames = source_->take_frames();
            for (auto &p : packets) {
                packets_++;
                on_packet.emit(make_packet(std::move(p)));
            }
            if (!frames.empty())
                on_frames.emit(frames);
        }

        void finish(const char *why) {
            echo::category("nmeabridge.engine").info("scenario ", source_ ? source_->name() : dp::String(""), " ", why);
            release_source();
            settle(EngineState::Stopped);
        }

        void settle(EngineState to) {
            auto r = sm_.transition(to);
            if (r.is_err())
                echo::category("nmeabridge.engine").error(r.error().message);
        }

        void release_source() {
            if (source_) {
                last_source_name_ = source_->name();
                last_source_kind_ = source_->kind();
                source_->stop();
                source_.reset();
            }
        }

        dp::String last_source_name_;
        dp::String last_source_kind_;

      public:
        explicit ScenarioEngine(EngineConfig config = {}, const ScenarioLibrary *library = nullptr)
            : config_(config), library_(library), sm_(make_state_machine()),
              autopilot_(config.command_burst, config.command_refill_ms) {
            sm_.on_transition.subscribe([this](EngineState from, EngineState to) {
                echo::category("nmeabridge.engine").debug("state ", to_string(from), " -> ", to_string(to));
                on_state.emit(from, to);
            });
            publish_snapshot();
        }

        ~ScenarioEngine() { shutdown(); }

        ScenarioEngine(const ScenarioEngine &) = delete;
        ScenarioEngine &operator=(const ScenarioEngine &) = delete;

        // Publication and lifecycle events, raised on the engine task
        Event<PacketPtr> on_packet;
        Event<const dp::Vector<nmea::Frame> &> on_frames;
        Event<EngineState, EngineState> on_state;
        Event<u32> on_loop;

        const EngineConfig &config() const noexcept { return config_; }
        EngineState state() const noexcept { return sm_.state(); }
        VirtualMs virtual_ms() const noexcept { return virtual_ms_; }
        u32 loop_count() const noexcept { return loop_count_; }
        const control::AutopilotCommandState &autopilot() const noexcept { return autopilot_.state(); }
        FrameSource *source() noexcept { return source_.get(); }

        // Replaces the wall clock used for command timestamps
        void set_clock(std::function<u64()> clock) { clock_ = std::move(clock); }

        EngineStatus status() const {
            std::lock_guard<std::mutex> lock(status_mtx_);
            return snapshot_;
        }

        // ─── Lifecycle (engine task) ────────────────────────────────────────────
        Result<void> run(std::unique_ptr<FrameSource> source, RunOptions opts = {}) {
            if (sm_.is(EngineState::Running) || sm_.is(EngineState::Looping) || sm_.is(EngineState::Paused)) {
                return Result<void>::err(Error::invalid_state("a scenario is active; stop it first"));
            }
            auto t = sm_.transition(EngineState::Loading);
            if (t.is_err())
                return t;
            if (!(opts.speed > 0.0) || opts.speed > 1000.0) {
                last_error_ = "speed must be in (0, 1000]";
                settle(EngineState::Stopped);
                publish_snapshot();
                return Result<void>::err(Error::invalid_argument(last_error_));
            }
            auto started = source->start(epoch_ms());
            if (started.is_err()) {
                last_error_ = started.error().message;
                echo::category("nmeabridge.engine").error("load failed: ", last_error_);
                settle(EngineState::Stopped);
                publish_snapshot();
                return started;
            }
            source_ = std::move(source);
            loop_ = opts.loop.value_or(source_->loops());
            speed_ = opts.speed;
            virtual_ms_ = 0;
            carry_ms_ = 0.0;
            loop_count_ = 0;
            last_error_.clear();
            autopilot_.reset();
            echo::category("nmeabridge.engine")
                .info("running ", source_->kind(), " ", source_->name(), " speed=", speed_, " loop=", loop_);
            auto r = sm_.transition(EngineState::Running);
            publish_snapshot();
            return r;
        }

        // Load through the scenario library; parse and validation failures end in Stopped
        Result<void> load(const dp::String &name, RunOptions opts = {}) {
            if (sm_.is(EngineState::Running) || sm_.is(EngineState::Looping) || sm_.is(EngineState::Paused)) {
                return Result<void>::err(Error::invalid_state("a scenario is active; stop it first"));
            }
            if (!library_)
                return Result<void>::err(Error::invalid_state("no scenario library configured"));
            auto def = library_->find(name);
            if (def.is_err()) {
                settle(EngineState::Loading);
                settle(EngineState::Stopped);
                last_error_ = def.error().message;
                echo::category("nmeabridge.engine").error("load failed: ", last_error_);
                publish_snapshot();
                return Result<void>::err(def.error());
            }
            return load(std::move(def.value()), opts);
        }

        Result<void> load(ScenarioDefinition def, RunOptions opts = {}) {
            auto v = def.validate();
            if (v.is_err()) {
                settle(EngineState::Loading);
                settle(EngineState::Stopped);
                last_error_ = v.error().message;
                publish_snapshot();
                return v;
            }
            auto src = std::make_unique<GeneratedSource>(std::move(def), autopilot_, config_.bridge_mode, config_.seed);
            return run(std::move(src), opts);
        }

        // Idempotent: stopping an idle or stopped engine succeeds
        Result<void> stop() {
            if (sm_.is(EngineState::Idle) || sm_.is(EngineState::Stopped)) {
                return {};
            }
            finish("stopped");
            publish_snapshot();
            return {};
        }

        Result<void> pause() {
            if (sm_.is(EngineState::Paused))
                return {};
            if (!sm_.is(EngineState::Running) && !sm_.is(EngineState::Looping))
                return Result<void>::err(Error::invalid_state("nothing is running"));
            resume_state_ = sm_.state();
            auto r = sm_.transition(EngineState::Paused);
            publish_snapshot();
            return r;
        }

        Result<void> resume() {
            if (sm_.is(EngineState::Running) || sm_.is(EngineState::Looping))
                return {};
            if (!sm_.is(EngineState::Paused))
                return Result<void>::err(Error::invalid_state("not paused"));
            auto r = sm_.transition(resume_state_);
            publish_snapshot();
            return r;
        }

        Result<void> seek(const dp::String &checkpoint) {
            if (!source_)
                return Result<void>::err(Error::invalid_state("nothing is running"));
            auto at = source_->seek(checkpoint);
            if (at.is_err())
                return Result<void>::err(at.error());
            virtual_ms_ = at.value();
            carry_ms_ = 0.0;
            publish_snapshot();
            return {};
        }

        // ─── Commands (engine task) ─────────────────────────────────────────────
        control::CommandOutcome apply_command(const control::AutopilotCommand &cmd) {
            f64 heading = source_ ? source_->heading().value_or(0.0) : 0.0;
            auto outcome = autopilot_.apply(cmd, clock_(), heading);
            publish_snapshot();
            return outcome;
        }

        // Out-of-band packet, published in order with tick output
        void inject(PacketPtr packet) {
            packets_++;
            on_packet.emit(std::move(packet));
        }

        // ─── Tick ───────────────────────────────────────────────────────────────
        // Drains the mailbox, then advances the virtual clock by elapsed wall time
        // times the speed multiplier and publishes what the source produced.
        void update(u64 elapsed_ms) {
            std::lock_guard<std::recursive_mutex> lock(inline_mtx_);
            for (auto &msg : mailbox_.drain())
                msg(*this);

            if (!source_ || !(sm_.is(EngineState::Running) || sm_.is(EngineState::Looping))) {
                publish_snapshot();
                return;
            }

            f64 advance = static_cast<f64>(elapsed_ms) * speed_ + carry_ms_;
            VirtualMs step = static_cast<VirtualMs>(advance);
            carry_ms_ = advance - static_cast<f64>(step);
            VirtualMs target = virtual_ms_ + step;
            VirtualMs duration = source_->duration_ms();

            while (source_ && duration > 0 && target >= duration) {
                emit_range(virtual_ms_, duration);
                if (!loop_) {
                    virtual_ms_ = duration;
                    finish("completed");
                    publish_snapshot();
                    return;
                }
                target -= duration;
                virtual_ms_ = 0;
                loop_count_++;
                source_->rewind();
                if (sm_.is(EngineState::Running))
                    settle(EngineState::Looping);
                echo::category("nmeabridge.engine").info(source_->name(), " loop ", loop_count_);
                on_loop.emit(loop_count_);
            }
            emit_range(virtual_ms_, target);
            virtual_ms_ = target;
            ticks_++;
            publish_snapshot();
        }

        // ─── Message passing ────────────────────────────────────────────────────
        // Without a running task the message runs inline, serialized with update()
        void post(Message msg) {
            {
                std::lock_guard<std::mutex> lock(post_mtx_);
                if (running_) {
                    mailbox_.post(std::move(msg));
                    return;
                }
            }
            std::lock_guard<std::recursive_mutex> lock(inline_mtx_);
            msg(*this);
        }

        // Runs fn on the engine task and returns its result through a future
        template <typename Fn> auto call(Fn fn) -> std::future<decltype(fn(std::declval<ScenarioEngine &>()))> {
            using R = decltype(fn(std::declval<ScenarioEngine &>()));
            auto promise = std::make_shared<std::promise<R>>();
            auto fut = promise->get_future();
            post([promise, fn = std::move(fn)](ScenarioEngine &e) mutable {
                if constexpr (std::is_void_v<R>) {
                    fn(e);
                    promise->set_value();
                } else {
                    promise->set_value(fn(e));
                }
            });
            return fut;
        }

        // ─── Engine task ────────────────────────────────────────────────────────
        void start() {
            std::lock_guard<std::mutex> lock(post_mtx_);
            if (running_.exchange(true))
                return;
            stop_flag_ = false;
            thread_ = std::thread([this] { loop(); });
        }

        // Cooperative: the task exits within one tick period
        void shutdown() {
            if (!running_)
                return;
            stop_flag_ = true;
            mailbox_.wake();
            if (thread_.joinable())
                thread_.join();
            // Anything queued before the flag drops runs here; later posts run inline
            dp::Vector<Message> late;
            {
                std::lock_guard<std::mutex> lock(post_mtx_);
                running_ = false;
                late = mailbox_.drain();
            }
            std::lock_guard<std::recursive_mutex> lock(inline_mtx_);
            for (auto &msg : late)
                msg(*this);
        }

        bool task_running() const noexcept { return running_; }

      private:
        u64 epoch_ms_override_ = 0;

        u64 epoch_ms() const { return epoch_ms_override_ ? epoch_ms_override_ : util::epoch_ms(); }

        void loop() {
            using clock = std::chrono::steady_clock;
            auto last = clock::now();
            while (!stop_flag_) {
                u32 tick = source_ ? source_->tick_ms() : config_.tick_ms;
                auto deadline = last + std::chrono::milliseconds(tick);
                while (!stop_flag_ && clock::now() < deadline) {
                    mailbox_.wait_for(deadline - clock::now());
                    for (auto &msg : mailbox_.drain())
                        msg(*this);
                }
                if (stop_flag_)
                    break;
                auto now = clock::now();
                u64 elapsed = static_cast<u64>(std::chrono::duration_cast<std::chrono::milliseconds>(now - last).count());
                last += std::chrono::milliseconds(elapsed);
                update(elapsed);
            }
        }

      public:
        // Fixed epoch for UTC fields, for reproducible output
        void set_epoch_ms(u64 ms) noexcept { epoch_ms_override_ = ms; }
    };

} // namespace nmeabridge::scenario
