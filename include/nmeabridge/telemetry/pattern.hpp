#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <cmath>
#include <random>

namespace nmeabridge::telemetry {

    // ─── Data patterns ───────────────────────────────────────────────────────────
    // Closed set of signal shapes. Evaluation is a pure function of time, the
    // pattern's parameters and its accumulated state (walk position and RNG).
    enum class PatternKind : u8 { Constant, Sine, Gaussian, RandomWalk, Linear };

    inline const char *to_string(PatternKind k) noexcept {
        switch (k) {
        case PatternKind::Constant:
            return "constant";
        case PatternKind::Sine:
            return "sine";
        case PatternKind::Gaussian:
            return "gaussian";
        case PatternKind::RandomWalk:
            return "random_walk";
        case PatternKind::Linear:
            return "linear";
        }
        return "unknown";
    }

    struct PatternSpec {
        PatternKind kind = PatternKind::Constant;
        f64 value = 0.0;     // constant
        f64 amplitude = 0.0; // sine
        f64 period_s = 1.0;  // sine
        f64 phase = 0.0;     // sine, radians
        f64 offset = 0.0;    // sine
        f64 mean = 0.0;      // gaussian
        f64 stddev = 0.0;    // gaussian
        f64 step = 0.0;      // random_walk, max change per evaluation
        f64 min = 0.0;       // random_walk
        f64 max = 0.0;       // random_walk
        f64 start = 0.0;     // random_walk initial position, linear value at t=0
        f64 rate = 0.0;      // linear, units per second
        bool has_start = false;

        static PatternSpec constant(f64 v) {
            PatternSpec p;
            p.kind = PatternKind::Constant;
            p.value = v;
            return p;
        }
        static PatternSpec sine(f64 amplitude, f64 period_s, f64 phase, f64 offset) {
            PatternSpec p;
            p.kind = PatternKind::Sine;
            p.amplitude = amplitude;
            p.period_s = period_s;
            p.phase = phase;
            p.offset = offset;
            return p;
        }
        static PatternSpec gaussian(f64 mean, f64 stddev) {
            PatternSpec p;
            p.kind = PatternKind::Gaussian;
            p.mean = mean;
            p.stddev = stddev;
            return p;
        }
        static PatternSpec random_walk(f64 step, f64 min, f64 max) {
            PatternSpec p;
            p.kind = PatternKind::RandomWalk;
            p.step = step;
            p.min = min;
            p.max = max;
            return p;
        }
        static PatternSpec linear(f64 start, f64 rate) {
            PatternSpec p;
            p.kind = PatternKind::Linear;
            p.start = start;
            p.rate = rate;
            p.has_start = true;
            return p;
        }

        PatternSpec &starting_at(f64 v) {
            start = v;
            has_start = true;
            return *this;
        }

        Result<void> validate() const {
            auto finite = [](f64 v) { return std::isfinite(v); };
            switch (kind) {
            case PatternKind::Constant:
                if (!finite(value))
                    return Result<void>::err(Error::invalid_pattern("constant value must be finite"));
                break;
            case PatternKind::Sine:
                if (!finite(amplitude) || !finite(phase) || !finite(offset) || !finite(period_s))
                    return Result<void>::err(Error::invalid_pattern("sine parameters must be finite"));
                if (period_s <= 0.0)
                    return Result<void>::err(Error::invalid_pattern("sine period must be positive"));
                if (amplitude < 0.0)
                    return Result<void>::err(Error::invalid_pattern("sine amplitude must not be negative"));
                break;
            case PatternKind::Gaussian:
                if (!finite(mean) || !finite(stddev))
                    return Result<void>::err(Error::invalid_pattern("gaussian parameters must be finite"));
                if (stddev < 0.0)
                    return Result<void>::err(Error::invalid_pattern("gaussian stddev must not be negative"));
                break;
            case PatternKind::RandomWalk:
                if (!finite(step) || !finite(min) || !finite(max))
                    return Result<void>::err(Error::invalid_pattern("random_walk parameters must be finite"));
                if (step < 0.0)
                    return Result<void>::err(Error::invalid_pattern("random_walk step must not be negative"));
                if (min > max)
                    return Result<void>::err(Error::invalid_pattern("random_walk min exceeds max"));
                if (has_start && (start < min || start > max))
                    return Result<void>::err(Error::invalid_pattern("random_walk start outside [min, max]"));
                break;
            case PatternKind::Linear:
                if (!finite(start) || !finite(rate))
                    return Result<void>::err(Error::invalid_pattern("linear parameters must be finite"));
                break;
            }
            return {};
        }
    };

    // ─── Accumulated pattern state ───────────────────────────────────────────────
    struct PatternState {
        std::mt19937_64 rng;
        f64 walk = 0.0;
        bool walk_initialized = false;

        PatternState() = default;
        explicit PatternState(u64 seed) : rng(seed) {}
    };

    inline f64 evaluate(const PatternSpec &p, f64 t_s, PatternState &st) {
        switch (p.kind) {
        case PatternKind::Constant:
            return p.value;
        case PatternKind::Sine:
            return p.offset + p.amplitude * std::sin(2.0 * M_PI * t_s / p.period_s + p.phase);
        case PatternKind::Gaussian: {
            if (p.stddev == 0.0)
                return p.mean;
            std::normal_distribution<f64> dist(p.mean, p.stddev);
            return dist(st.rng);
        }
        case PatternKind::RandomWalk: {
            if (!st.walk_initialized) {
                st.walk = p.has_start ? p.start : (p.min + p.max) / 2.0;
                st.walk_initialized = true;
                return st.walk;
            }
            if (p.step > 0.0) {
                std::uniform_real_distribution<f64> dist(-p.step, p.step);
                st.walk += dist(st.rng);
            }
            if (st.walk < p.min)
                st.walk = p.min;
            if (st.walk > p.max)
                st.walk = p.max;
            return st.walk;
        }
        case PatternKind::Linear:
            return p.start + p.rate * t_s;
        }
        return 0.0;
    }

    // splitmix64 step, used to derive independent per-channel seeds
    inline u64 mix_seed(u64 x) noexcept {
        x += 0x9E3779B97F4A7C15ULL;
        x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
        x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
        return x ^ (x >> 31);
    }

} // namespace nmeabridge::telemetry
