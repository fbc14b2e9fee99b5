#pragma once

/// @file include/triad/evolution.hpp
/// @brief EvolutionTracker — history of one entity's triadic state over time.
///
/// # Module: Evolution Tracker
///
/// ## Responsibility
/// Append timestamped snapshots of a single entity, classify each adjacent
/// transition, and detect recurring structure in the history:
///   - attractors: long runs confined to a small box
///   - cycles:     the history repeating itself with a fixed period
///   - trend:      the direction and regularity of the strength series
///
/// ## Usage
/// ```cpp
/// EvolutionTracker tracker;
/// tracker.record(1.0, 1.0, 1.0);
/// tracker.record(1.1, 1.0, 1.2);
/// fmt::print("{}\n", tracker.report().to_string());
/// ```
///
/// ## Guarantees
/// - History is append-only and strictly ordered by sequence number
/// - Every recorded state is finite
/// - A rejected record() leaves every cached structure untouched
/// - Transitions and critical events are cached, never recomputed
///
/// ## Edge Cases
/// - Empty tracker: trend is Stable, no attractor, no cycle, no current state
/// - Fewer than 3 samples: trend is Stable

#include "triad/types.hpp"
#include "triad/constants.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace triad::evolution {

// ─── Snapshot / Transition ────────────────────────────────────────────────────

/// One recorded state with its sequence number.
struct Snapshot {
    TriadicVector state;
    std::uint64_t sequence;

    friend bool operator==(const Snapshot&, const Snapshot&) = default;
};

/// Qualitative character of a transition between adjacent snapshots.
enum class TransitionKind {
    None,             ///< Nothing notable
    Emergence,        ///< Weak → strong
    Collapse,         ///< Strong → weak
    Amplification,    ///< Every component grew in magnitude within the strength band
    PhaseTransition,  ///< Large jump in state space
};

[[nodiscard]] const char* to_string(TransitionKind k) noexcept;

/// Number of TransitionKind enumerators.
static constexpr std::size_t TRANSITION_KIND_COUNT = 5;

struct Transition {
    Snapshot from;
    Snapshot to;
    double magnitude;     ///< Euclidean distance between the two states
    TransitionKind kind;
};

/// Direction of the strength series.
enum class Trend {
    Improving,
    Degrading,
    Stable,
    Chaotic,
};

[[nodiscard]] const char* to_string(Trend t) noexcept;

// ─── TrackerConfig ────────────────────────────────────────────────────────────

/// Thresholds for transition classification and structure detection.
struct TrackerConfig {
    /// Strength below this is "collapsed" (the low threshold).
    double collapse_threshold = constants::DEFAULT_COLLAPSE_THRESHOLD;

    /// Strength above this is "established" (the high threshold).
    double emergence_threshold = constants::DEFAULT_EMERGENCE_THRESHOLD;

    /// Euclidean step size above which a transition is a phase transition.
    double phase_jump_threshold = constants::DEFAULT_PHASE_JUMP_THRESHOLD;

    /// Upper edge of the strength band for amplification.
    double amplification_ceiling = constants::DEFAULT_AMPLIFICATION_CEILING;

    double      attractor_tolerance    = constants::DEFAULT_ATTRACTOR_TOLERANCE;
    std::size_t attractor_min_duration = constants::DEFAULT_ATTRACTOR_MIN_DURATION;
    std::size_t cycle_window           = constants::DEFAULT_CYCLE_WINDOW;
    double      cycle_tolerance        = constants::DEFAULT_CYCLE_TOLERANCE;

    /// Print every critical event to stderr.
    bool verbose = false;
};

// ─── TrackerReport ────────────────────────────────────────────────────────────

struct TrackerReport {
    std::size_t total_snapshots;
    std::size_t total_transitions;
    std::optional<Snapshot> current;
    double current_strength;   ///< 0.0 when empty
    double current_balance;    ///< 0.0 when empty
    Trend trend;
    std::optional<TriadicVector> attractor;
    std::optional<std::size_t> cycle_length;
    std::vector<Transition> critical_events;  ///< every non-None transition, in order

    /// Count per TransitionKind, indexed by the enumerator's value.
    std::array<std::size_t, TRANSITION_KIND_COUNT> transition_counts;

    [[nodiscard]] std::string to_string() const;
};

// ─── EvolutionTracker ─────────────────────────────────────────────────────────

class EvolutionTracker {
public:
    /// Produces the sequence number of the next implicitly numbered snapshot.
    using SequenceSource = std::function<std::uint64_t()>;

    /// @throws std::invalid_argument if `config` is inconsistent
    ///         (thresholds not finite, low > high, zero durations, ...).
    explicit EvolutionTracker(TrackerConfig config = {},
                              SequenceSource sequence = {});

    /// Record a state numbered by the sequence source.
    ///
    /// @throws std::invalid_argument if the state has a non-finite component,
    ///         or the source yields a sequence that is not strictly greater
    ///         than the last recorded one.
    const Snapshot& record(double a, double b, double c);
    const Snapshot& record(const TriadicVector& state);

    /// Record a state with an explicit sequence number.
    ///
    /// @throws std::invalid_argument if the state has a non-finite component,
    ///         or `sequence` is not strictly greater than the last recorded one.
    const Snapshot& record(const TriadicVector& state, std::uint64_t sequence);

    /// Classify the transition prev → curr. Rules are applied in priority
    /// order: Collapse, Emergence, PhaseTransition, Amplification, None.
    [[nodiscard]] static TransitionKind
    classify_transition(const TriadicVector& prev,
                        const TriadicVector& curr,
                        const TrackerConfig& config) noexcept;

    /// Mean of the longest run whose per-component range is within
    /// `tolerance`, if that run has at least `min_duration` samples.
    ///
    /// Ties between equally long runs go to the most recent one.
    ///
    /// @throws std::invalid_argument if tolerance is negative or not finite,
    ///         or min_duration == 0.
    [[nodiscard]] std::optional<TriadicVector>
    detect_attractor(double tolerance, std::size_t min_duration) const;

    /// Smallest period p in [2, window] such that the last min(window, size)
    /// samples contain at least two full periods and every sample is within
    /// `tolerance` of the sample p steps later.
    ///
    /// @throws std::invalid_argument if window < 2, or tolerance is negative
    ///         or not finite.
    [[nodiscard]] std::optional<std::size_t>
    detect_cycle(std::size_t window, double tolerance) const;

    /// Trend of the full strength series.
    [[nodiscard]] Trend coherence_trend() const;

    /// The last `window` snapshots (all of them if fewer).
    [[nodiscard]] std::span<const Snapshot> trajectory(std::size_t window) const noexcept;

    /// HistoryAnalytics::stability over the recorded states.
    [[nodiscard]] double stability() const;

    /// HistoryAnalytics::decay_detected over the recorded states.
    [[nodiscard]] bool
    decay_detected(double threshold = constants::DEFAULT_DECAY_THRESHOLD) const;

    /// Summary using the configured attractor and cycle parameters.
    [[nodiscard]] TrackerReport report() const;

    /// Clear history, transitions and events; restart the internal counter.
    void reset() noexcept;

    [[nodiscard]] const std::vector<Snapshot>&   history() const noexcept { return history_; }
    [[nodiscard]] const std::vector<Transition>& transitions() const noexcept { return transitions_; }
    [[nodiscard]] const std::vector<Transition>& critical_events() const noexcept { return events_; }
    [[nodiscard]] std::size_t size() const noexcept { return history_.size(); }
    [[nodiscard]] bool empty() const noexcept { return history_.empty(); }
    [[nodiscard]] const TrackerConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::vector<TriadicVector> states() const;

    TrackerConfig config_;
    SequenceSource sequence_;
    std::uint64_t next_sequence_ = 0;

    std::vector<Snapshot>   history_;
    std::vector<Transition> transitions_;
    std::vector<Transition> events_;
};

} // namespace triad::evolution
