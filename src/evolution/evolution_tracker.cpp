/// @file src/evolution/evolution_tracker.cpp
/// @brief EvolutionTracker — snapshot history, transitions, attractors, cycles.

#include "triad/evolution.hpp"
#include "triad/history.hpp"
#include "triad/metrics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <deque>
#include <stdexcept>
#include <utility>

namespace triad::evolution {

using metrics::VectorMetrics;
using history::HistoryAnalytics;

// ─── Enum names ───────────────────────────────────────────────────────────────

const char* to_string(TransitionKind k) noexcept {
    switch (k) {
        case TransitionKind::None:            return "None";
        case TransitionKind::Emergence:       return "Emergence";
        case TransitionKind::Collapse:        return "Collapse";
        case TransitionKind::Amplification:   return "Amplification";
        case TransitionKind::PhaseTransition: return "PhaseTransition";
    }
    return "Unknown";
}

const char* to_string(Trend t) noexcept {
    switch (t) {
        case Trend::Improving: return "Improving";
        case Trend::Degrading: return "Degrading";
        case Trend::Stable:    return "Stable";
        case Trend::Chaotic:   return "Chaotic";
    }
    return "Unknown";
}

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

void require_tolerance(const char* where, double tolerance) {
    if (!std::isfinite(tolerance) || tolerance < 0.0) {
        throw std::invalid_argument(fmt::format(
            "{}: tolerance must be finite and >= 0, got {}", where, tolerance));
    }
}

void require_unit_interval(const char* name, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw std::invalid_argument(fmt::format(
            "TrackerConfig: {} must be in [0, 1], got {}", name, value));
    }
}

void validate(const TrackerConfig& cfg) {
    require_unit_interval("collapse_threshold", cfg.collapse_threshold);
    require_unit_interval("emergence_threshold", cfg.emergence_threshold);
    require_unit_interval("amplification_ceiling", cfg.amplification_ceiling);

    if (cfg.collapse_threshold > cfg.emergence_threshold) {
        throw std::invalid_argument(fmt::format(
            "TrackerConfig: collapse_threshold ({}) exceeds emergence_threshold ({})",
            cfg.collapse_threshold, cfg.emergence_threshold));
    }
    if (!std::isfinite(cfg.phase_jump_threshold) || cfg.phase_jump_threshold < 0.0) {
        throw std::invalid_argument(fmt::format(
            "TrackerConfig: phase_jump_threshold must be finite and >= 0, got {}",
            cfg.phase_jump_threshold));
    }
    require_tolerance("TrackerConfig.attractor_tolerance", cfg.attractor_tolerance);
    require_tolerance("TrackerConfig.cycle_tolerance", cfg.cycle_tolerance);

    if (cfg.attractor_min_duration == 0) {
        throw std::invalid_argument("TrackerConfig: attractor_min_duration must be >= 1");
    }
    if (cfg.cycle_window < constants::MIN_CYCLE_PERIOD) {
        throw std::invalid_argument(fmt::format(
            "TrackerConfig: cycle_window must be >= {}, got {}",
            constants::MIN_CYCLE_PERIOD, cfg.cycle_window));
    }
}

/// Sliding-window extremum of one component. Indices are kept in a deque
/// whose values are monotone, so front() is the extremum of the window.
class MonotonicWindow {
public:
    explicit MonotonicWindow(bool track_max) noexcept : track_max_(track_max) {}

    void push(std::size_t index, double value) {
        while (!items_.empty() && dominated(items_.back().second, value)) {
            items_.pop_back();
        }
        items_.emplace_back(index, value);
    }

    void evict_before(std::size_t left) {
        while (!items_.empty() && items_.front().first < left) {
            items_.pop_front();
        }
    }

    [[nodiscard]] double front() const noexcept { return items_.front().second; }

private:
    [[nodiscard]] bool dominated(double old_value, double new_value) const noexcept {
        return track_max_ ? old_value <= new_value : old_value >= new_value;
    }

    bool track_max_;
    std::deque<std::pair<std::size_t, double>> items_;
};

/// Make room for one more element, growing geometrically.
template <typename T>
void reserve_one_more(std::vector<T>& v) {
    if (v.size() == v.capacity()) {
        v.reserve(std::max<std::size_t>(16, 2 * v.capacity()));
    }
}

double component(const TriadicVector& v, int i) noexcept {
    return i == 0 ? v.a : (i == 1 ? v.b : v.c);
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

EvolutionTracker::EvolutionTracker(TrackerConfig config, SequenceSource sequence)
    : config_(config), sequence_(std::move(sequence)) {
    validate(config_);
}

// ─── record ───────────────────────────────────────────────────────────────────

const Snapshot& EvolutionTracker::record(double a, double b, double c) {
    return record(TriadicVector{a, b, c});
}

const Snapshot& EvolutionTracker::record(const TriadicVector& state) {
    const std::uint64_t seq = sequence_ ? sequence_() : next_sequence_;
    return record(state, seq);
}

const Snapshot& EvolutionTracker::record(const TriadicVector& state,
                                         std::uint64_t sequence) {
    if (!state.is_finite()) {
        throw std::invalid_argument(fmt::format(
            "EvolutionTracker::record: state ({}, {}, {}) is not finite",
            state.a, state.b, state.c));
    }
    if (!history_.empty() && sequence <= history_.back().sequence) {
        throw std::invalid_argument(fmt::format(
            "EvolutionTracker::record: sequence {} is not after {}",
            sequence, history_.back().sequence));
    }

    const Snapshot snap{state, sequence};

    // Everything that can throw happens before the first append, so a
    // failed record() changes nothing.
    reserve_one_more(history_);
    std::optional<Transition> transition;
    if (!history_.empty()) {
        const Snapshot& prev = history_.back();
        transition = Transition{
            .from      = prev,
            .to        = snap,
            .magnitude = VectorMetrics::distance(prev.state, snap.state),
            .kind      = classify_transition(prev.state, snap.state, config_),
        };
        reserve_one_more(transitions_);

        if (transition->kind != TransitionKind::None) {
            reserve_one_more(events_);
            if (config_.verbose) {
                fmt::print(stderr,
                           "[triad] {} at seq {}: ({:.4f}, {:.4f}, {:.4f}) -> "
                           "({:.4f}, {:.4f}, {:.4f})  |d|={:.4f}\n",
                           to_string(transition->kind), sequence,
                           prev.state.a, prev.state.b, prev.state.c,
                           state.a, state.b, state.c, transition->magnitude);
            }
        }
    }

    if (transition) {
        transitions_.push_back(*transition);
        if (transition->kind != TransitionKind::None) {
            events_.push_back(*transition);
        }
    }
    history_.push_back(snap);
    next_sequence_ = std::max(next_sequence_, sequence + 1);
    return history_.back();
}

// ─── classify_transition ──────────────────────────────────────────────────────

TransitionKind
EvolutionTracker::classify_transition(const TriadicVector& prev,
                                      const TriadicVector& curr,
                                      const TrackerConfig& config) noexcept {
    const double low  = config.collapse_threshold;
    const double high = config.emergence_threshold;

    const double s_prev = VectorMetrics::strength(prev);
    const double s_curr = VectorMetrics::strength(curr);

    if (s_prev > high && s_curr < low) {
        return TransitionKind::Collapse;
    }
    if (s_prev < low && s_curr > high) {
        return TransitionKind::Emergence;
    }
    if (VectorMetrics::distance(prev, curr) > config.phase_jump_threshold) {
        return TransitionKind::PhaseTransition;
    }

    const bool all_grew = std::abs(curr.a) > std::abs(prev.a) &&
                          std::abs(curr.b) > std::abs(prev.b) &&
                          std::abs(curr.c) > std::abs(prev.c);
    const auto in_band = [&](double s) {
        return s >= low && s <= config.amplification_ceiling;
    };
    if (all_grew && in_band(s_prev) && in_band(s_curr)) {
        return TransitionKind::Amplification;
    }

    return TransitionKind::None;
}

// ─── detect_attractor ─────────────────────────────────────────────────────────

std::optional<TriadicVector>
EvolutionTracker::detect_attractor(double tolerance, std::size_t min_duration) const {
    require_tolerance("detect_attractor", tolerance);
    if (min_duration == 0) {
        throw std::invalid_argument("detect_attractor: min_duration must be >= 1");
    }

    std::array<MonotonicWindow, TRIAD_DIM> hi{MonotonicWindow{true},
                                              MonotonicWindow{true},
                                              MonotonicWindow{true}};
    std::array<MonotonicWindow, TRIAD_DIM> lo{MonotonicWindow{false},
                                              MonotonicWindow{false},
                                              MonotonicWindow{false}};

    const auto within = [&]() {
        for (int i = 0; i < TRIAD_DIM; ++i) {
            if (!(hi[i].front() - lo[i].front() <= tolerance)) {
                return false;
            }
        }
        return true;
    };

    std::size_t left = 0;
    std::size_t best_left = 0;
    std::size_t best_len = 0;

    for (std::size_t right = 0; right < history_.size(); ++right) {
        const TriadicVector& v = history_[right].state;

        for (int i = 0; i < TRIAD_DIM; ++i) {
            hi[i].push(right, component(v, i));
            lo[i].push(right, component(v, i));
        }

        // The single sample [right, right] always satisfies the bound, so
        // this loop terminates with left <= right.
        while (!within()) {
            ++left;
            for (int i = 0; i < TRIAD_DIM; ++i) {
                hi[i].evict_before(left);
                lo[i].evict_before(left);
            }
        }

        const std::size_t len = right - left + 1;
        if (len >= best_len) {
            best_len = len;
            best_left = left;
        }
    }

    if (best_len < min_duration) {
        return std::nullopt;
    }

    Vec3 sum = Vec3::Zero();
    for (std::size_t k = best_left; k < best_left + best_len; ++k) {
        sum += history_[k].state.to_eigen();
    }
    return TriadicVector::from_eigen(sum / static_cast<double>(best_len));
}

// ─── detect_cycle ─────────────────────────────────────────────────────────────

std::optional<std::size_t>
EvolutionTracker::detect_cycle(std::size_t window, double tolerance) const {
    if (window < constants::MIN_CYCLE_PERIOD) {
        throw std::invalid_argument(fmt::format(
            "detect_cycle: window must be >= {}, got {}",
            constants::MIN_CYCLE_PERIOD, window));
    }
    require_tolerance("detect_cycle", tolerance);

    const auto recent = trajectory(window);
    const std::size_t len = recent.size();

    for (std::size_t p = constants::MIN_CYCLE_PERIOD; p <= window && 2 * p <= len; ++p) {
        bool periodic = true;
        for (std::size_t i = 0; i + p < len && periodic; ++i) {
            periodic = VectorMetrics::distance(recent[i].state, recent[i + p].state)
                       <= tolerance;
        }
        if (periodic) {
            return p;
        }
    }
    return std::nullopt;
}

// ─── coherence_trend ──────────────────────────────────────────────────────────

Trend EvolutionTracker::coherence_trend() const {
    if (history_.size() < constants::MIN_TREND_SAMPLES) {
        return Trend::Stable;
    }

    const auto s = HistoryAnalytics::strength_series(states());
    const double n = static_cast<double>(s.size());
    const double slope = HistoryAnalytics::slope(s);

    double mean = 0.0;
    for (double x : s) mean += x;
    mean /= n;
    const double x_mean = (n - 1.0) / 2.0;
    const double intercept = mean - slope * x_mean;

    double residual_ss = 0.0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const double r = s[i] - (intercept + slope * static_cast<double>(i));
        residual_ss += r * r;
    }

    if (residual_ss / n > constants::CHAOTIC_RESIDUAL_VARIANCE) {
        return Trend::Chaotic;
    }
    if (slope > constants::TREND_SLOPE_EPSILON) {
        return Trend::Improving;
    }
    if (slope < -constants::TREND_SLOPE_EPSILON) {
        return Trend::Degrading;
    }
    return Trend::Stable;
}

// ─── History views ────────────────────────────────────────────────────────────

std::span<const Snapshot> EvolutionTracker::trajectory(std::size_t window) const noexcept {
    const std::size_t n = std::min(window, history_.size());
    return std::span<const Snapshot>(history_).last(n);
}

std::vector<TriadicVector> EvolutionTracker::states() const {
    std::vector<TriadicVector> out;
    out.reserve(history_.size());
    for (const auto& s : history_) {
        out.push_back(s.state);
    }
    return out;
}

double EvolutionTracker::stability() const {
    return HistoryAnalytics::stability(states());
}

bool EvolutionTracker::decay_detected(double threshold) const {
    return HistoryAnalytics::decay_detected(states(), threshold);
}

// ─── report / reset ───────────────────────────────────────────────────────────

TrackerReport EvolutionTracker::report() const {
    TrackerReport r{
        .total_snapshots   = history_.size(),
        .total_transitions = transitions_.size(),
        .current           = std::nullopt,
        .current_strength  = 0.0,
        .current_balance   = 0.0,
        .trend             = coherence_trend(),
        .attractor         = detect_attractor(config_.attractor_tolerance,
                                              config_.attractor_min_duration),
        .cycle_length      = detect_cycle(config_.cycle_window, config_.cycle_tolerance),
        .critical_events   = events_,
        .transition_counts = {},
    };

    if (!history_.empty()) {
        r.current          = history_.back();
        r.current_strength = VectorMetrics::strength(history_.back().state);
        r.current_balance  = VectorMetrics::balance(history_.back().state);
    }
    for (const auto& t : transitions_) {
        ++r.transition_counts[static_cast<std::size_t>(t.kind)];
    }
    return r;
}

void EvolutionTracker::reset() noexcept {
    history_.clear();
    transitions_.clear();
    events_.clear();
    next_sequence_ = 0;
}

std::string TrackerReport::to_string() const {
    std::string out = fmt::format(
        "snapshots={}  transitions={}  events={}  strength={:.4f}  balance={:.4f}  trend={}",
        total_snapshots, total_transitions, critical_events.size(),
        current_strength, current_balance, evolution::to_string(trend));

    if (attractor) {
        out += fmt::format("  attractor=({:.4f}, {:.4f}, {:.4f})",
                           attractor->a, attractor->b, attractor->c);
    }
    if (cycle_length) {
        out += fmt::format("  cycle={}", *cycle_length);
    }

    for (std::size_t k = 1; k < TRANSITION_KIND_COUNT; ++k) {
        if (transition_counts[k] > 0) {
            out += fmt::format("  {}={}",
                               evolution::to_string(static_cast<TransitionKind>(k)),
                               transition_counts[k]);
        }
    }
    return out;
}

}  // namespace triad::evolution
