#pragma once

/// @file include/triad/constants.hpp
/// @brief Numerical constants and configuration defaults for triad.
///
/// Every threshold used by a classification rule lives here. They are fixed
/// defaults, overridable through the per-component config structs.

#include <cstddef>

namespace triad::constants {

// ─── VectorMetrics ────────────────────────────────────────────────────────────

/// Gain k in strength = 1 − exp(−k·abc). With k = 2, (1,1,1) maps to ≈ 0.865.
static constexpr double STRENGTH_GAIN = 2.0;

/// Weights of the aggregate health score. They sum to 1.
static constexpr double HEALTH_WEIGHT_STRENGTH  = 0.4;
static constexpr double HEALTH_WEIGHT_BALANCE   = 0.3;
static constexpr double HEALTH_WEIGHT_ORDER     = 0.2;  ///< applied to (1 − entropy)
static constexpr double HEALTH_WEIGHT_STABILITY = 0.1;

// ─── HistoryAnalytics ─────────────────────────────────────────────────────────

/// stability = exp(−gain · variance(strength)).
static constexpr double STABILITY_VARIANCE_GAIN = 5.0;

/// Returned by stability() when fewer than two samples are available.
static constexpr double NEUTRAL_STABILITY = 1.0;

/// Minimum regression slope magnitude (strength per step) that counts as decay.
static constexpr double DEFAULT_DECAY_THRESHOLD = 0.1;

/// Minimum number of samples for any regression-based trend rule.
static constexpr std::size_t MIN_TREND_SAMPLES = 3;

/// Default look-back for strength forecasts.
static constexpr std::size_t DEFAULT_FORECAST_WINDOW = 5;

/// Forecast levels that raise collapse / degradation warnings.
static constexpr double FORECAST_COLLAPSE_LEVEL     = 0.3;
static constexpr double FORECAST_DEGRADATION_LEVEL  = 0.5;

// ─── EvolutionTracker ─────────────────────────────────────────────────────────

/// Strength below this is "collapsed".
static constexpr double DEFAULT_COLLAPSE_THRESHOLD = 0.1;

/// Strength above this is "established".
static constexpr double DEFAULT_EMERGENCE_THRESHOLD = 0.5;

/// Euclidean step size above which a transition is a phase transition.
static constexpr double DEFAULT_PHASE_JUMP_THRESHOLD = 2.0;

/// Upper edge of the strength band in which growth counts as amplification.
static constexpr double DEFAULT_AMPLIFICATION_CEILING = 0.95;

static constexpr double      DEFAULT_ATTRACTOR_TOLERANCE    = 0.1;
static constexpr std::size_t DEFAULT_ATTRACTOR_MIN_DURATION = 5;
static constexpr std::size_t DEFAULT_CYCLE_WINDOW           = 20;
static constexpr double      DEFAULT_CYCLE_TOLERANCE        = 0.15;

/// Shortest period detect_cycle() will report.
static constexpr std::size_t MIN_CYCLE_PERIOD = 2;

/// Residual variance (about the strength regression line) above which the
/// trend is chaotic.
static constexpr double CHAOTIC_RESIDUAL_VARIANCE = 0.01;

/// Slopes with magnitude at or below this are "stable".
static constexpr double TREND_SLOPE_EPSILON = 1e-3;

// ─── InteractionField ─────────────────────────────────────────────────────────

/// Field coherence returned when fewer than two entities exist.
static constexpr double TRIVIAL_FIELD_COHERENCE = 1.0;

static constexpr double DEFAULT_CLUSTER_THRESHOLD           = 0.7;
static constexpr double DEFAULT_PHASE_COHERENCE_THRESHOLD   = 0.8;
static constexpr double DEFAULT_PHASE_EMERGENCE_THRESHOLD   = 0.6;

/// Minimum population for a collective phase transition.
static constexpr std::size_t MIN_PHASE_POPULATION = 2;

} // namespace triad::constants
