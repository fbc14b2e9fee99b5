#pragma once

/// @file include/triad/history.hpp
/// @brief HistoryAnalytics — trend statistics over an ordered state history.
///
/// # Module: History Analytics
///
/// ## Responsibility
/// Reduce a time-ordered sequence of triadic states to stability, slope and
/// short-horizon forecast statistics of the strength series.
///
/// ## Formulas
///   slope      = Σ(i − ī)(sᵢ − s̄) / Σ(i − ī)²        (least squares on index)
///   stability  = exp(−5 · Var(s))                     (population variance)
///   decay      = slope < −threshold                   (n ≥ 3)
///
/// ## Edge Cases
/// - Fewer than two samples: stability is 1.0 and slope is 0.0.
/// - Fewer than three samples: decay is never reported, forecast is nullopt.
/// - Invalid parameters (zero window, negative threshold) throw
///   std::invalid_argument.
///
/// ## Guarantees
/// - Stateless; the input span is never modified.

#include "triad/types.hpp"
#include "triad/constants.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace triad::history {

/// Linear extrapolation of the strength series.
struct StrengthForecast {
    double current;                    ///< Latest observed strength
    double slope;                      ///< Regression slope over the window
    std::vector<double> predictions;   ///< One value per step ahead, in [0, 1]
    bool collapse_predicted;           ///< Any prediction < 0.3
    bool degradation_predicted;        ///< Any prediction < 0.5

    [[nodiscard]] std::string to_string() const;
};

class HistoryAnalytics {
public:
    HistoryAnalytics() = delete;

    /// Strength of every state, in order.
    [[nodiscard]] static std::vector<double>
    strength_series(std::span<const TriadicVector> history);

    /// Least-squares slope of `values` against their index. 0.0 for n < 2.
    [[nodiscard]] static double slope(std::span<const double> values) noexcept;

    /// exp(−5 · variance of strength); 1.0 when fewer than two samples.
    [[nodiscard]] static double
    stability(std::span<const TriadicVector> history) noexcept;

    /// stability() over the last `window` samples only.
    ///
    /// @throws std::invalid_argument if window == 0.
    [[nodiscard]] static double
    windowed_stability(std::span<const TriadicVector> history, std::size_t window);

    /// True if there are ≥ 3 samples and the strength slope is below
    /// −threshold.
    ///
    /// @throws std::invalid_argument if threshold is negative or not finite.
    [[nodiscard]] static bool
    decay_detected(std::span<const TriadicVector> history,
                   double threshold = constants::DEFAULT_DECAY_THRESHOLD);

    /// Extrapolate the strength trend of the last `window` samples.
    ///
    /// @return std::nullopt if fewer than three samples exist.
    /// @throws std::invalid_argument if steps_ahead == 0 or window < 2.
    [[nodiscard]] static std::optional<StrengthForecast>
    forecast(std::span<const TriadicVector> history,
             std::size_t steps_ahead,
             std::size_t window = constants::DEFAULT_FORECAST_WINDOW);
};

} // namespace triad::history
