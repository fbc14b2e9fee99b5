/// @file src/history/history_analytics.cpp
/// @brief HistoryAnalytics — strength regression, stability and forecasts.

#include "triad/history.hpp"
#include "triad/metrics.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace triad::history {

namespace {

std::span<const TriadicVector> tail(std::span<const TriadicVector> history,
                                    std::size_t window) noexcept {
    const std::size_t n = std::min(window, history.size());
    return history.subspan(history.size() - n, n);
}

}  // namespace

// ─── strength_series ──────────────────────────────────────────────────────────

std::vector<double>
HistoryAnalytics::strength_series(std::span<const TriadicVector> history) {
    std::vector<double> out;
    out.reserve(history.size());
    for (const auto& v : history) {
        out.push_back(metrics::VectorMetrics::strength(v));
    }
    return out;
}

// ─── slope ────────────────────────────────────────────────────────────────────

double HistoryAnalytics::slope(std::span<const double> values) noexcept {
    const std::size_t n = values.size();
    if (n < 2) {
        return 0.0;
    }

    const double x_mean = static_cast<double>(n - 1) / 2.0;
    double y_mean = 0.0;
    for (double y : values) y_mean += y;
    y_mean /= static_cast<double>(n);

    double sxy = 0.0;
    double sxx = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - x_mean;
        sxy += dx * (values[i] - y_mean);
        sxx += dx * dx;
    }
    return sxx > 0.0 ? sxy / sxx : 0.0;
}

// ─── stability ────────────────────────────────────────────────────────────────

double HistoryAnalytics::stability(std::span<const TriadicVector> history) noexcept {
    if (history.size() < 2) {
        return constants::NEUTRAL_STABILITY;
    }

    // Strengths are in [0, 1] so the variance is at most 0.25.
    double mean = 0.0;
    for (const auto& v : history) mean += metrics::VectorMetrics::strength(v);
    mean /= static_cast<double>(history.size());

    double ss = 0.0;
    for (const auto& v : history) {
        const double d = metrics::VectorMetrics::strength(v) - mean;
        ss += d * d;
    }
    const double variance = ss / static_cast<double>(history.size());

    return std::exp(-constants::STABILITY_VARIANCE_GAIN * variance);
}

double HistoryAnalytics::windowed_stability(std::span<const TriadicVector> history,
                                            std::size_t window) {
    if (window == 0) {
        throw std::invalid_argument("windowed_stability: window must be >= 1");
    }
    return stability(tail(history, window));
}

// ─── decay_detected ───────────────────────────────────────────────────────────

bool HistoryAnalytics::decay_detected(std::span<const TriadicVector> history,
                                      double threshold) {
    if (!std::isfinite(threshold) || threshold < 0.0) {
        throw std::invalid_argument(fmt::format(
            "decay_detected: threshold must be finite and >= 0, got {}", threshold));
    }
    if (history.size() < constants::MIN_TREND_SAMPLES) {
        return false;
    }
    const auto series = strength_series(history);
    return slope(series) < -threshold;
}

// ─── forecast ─────────────────────────────────────────────────────────────────

std::optional<StrengthForecast>
HistoryAnalytics::forecast(std::span<const TriadicVector> history,
                           std::size_t steps_ahead,
                           std::size_t window) {
    if (steps_ahead == 0) {
        throw std::invalid_argument("forecast: steps_ahead must be >= 1");
    }
    if (window < 2) {
        throw std::invalid_argument(fmt::format(
            "forecast: window must be >= 2, got {}", window));
    }
    if (history.size() < constants::MIN_TREND_SAMPLES) {
        return std::nullopt;
    }

    const auto series = strength_series(tail(history, window));

    StrengthForecast f{
        .current               = series.back(),
        .slope                 = slope(series),
        .predictions           = {},
        .collapse_predicted    = false,
        .degradation_predicted = false,
    };

    f.predictions.reserve(steps_ahead);
    for (std::size_t k = 1; k <= steps_ahead; ++k) {
        const double p = std::clamp(
            f.current + f.slope * static_cast<double>(k), 0.0, 1.0);
        f.predictions.push_back(p);
        f.collapse_predicted    |= p < constants::FORECAST_COLLAPSE_LEVEL;
        f.degradation_predicted |= p < constants::FORECAST_DEGRADATION_LEVEL;
    }

    return f;
}

std::string StrengthForecast::to_string() const {
    return fmt::format(
        "current={:.4f}  slope={:+.4f}  horizon={}  final={:.4f}  "
        "collapse={}  degradation={}",
        current, slope, predictions.size(),
        predictions.empty() ? current : predictions.back(),
        collapse_predicted ? "yes" : "no",
        degradation_predicted ? "yes" : "no");
}

}  // namespace triad::history
