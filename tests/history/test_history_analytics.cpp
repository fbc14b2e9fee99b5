/// @file tests/history/test_history_analytics.cpp
/// @brief Tests for HistoryAnalytics — slope, stability, decay, forecast.

#include "triad/history.hpp"
#include "triad/metrics.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace triad;
using namespace triad::history;

namespace {

// ─── Fixtures ─────────────────────────────────────────────────────────────────

std::vector<TriadicVector> constant_history(std::size_t n) {
    return std::vector<TriadicVector>(n, TriadicVector{1.0, 1.0, 1.0});
}

/// Strength falls from ≈ 0.86 to ≈ 0.002 over three samples.
std::vector<TriadicVector> decaying_history() {
    return {{1.0, 1.0, 1.0}, {0.5, 0.5, 0.5}, {0.1, 0.1, 0.1}};
}

/// Strength alternates between ≈ 0.86 and 0.
std::vector<TriadicVector> oscillating_history(std::size_t n) {
    std::vector<TriadicVector> h;
    for (std::size_t i = 0; i < n; ++i) {
        h.push_back(i % 2 == 0 ? TriadicVector{1.0, 1.0, 1.0}
                               : TriadicVector{0.0, 0.0, 0.0});
    }
    return h;
}

}  // anonymous namespace

// ─── strength_series / slope ──────────────────────────────────────────────────

TEST(HistoryAnalyticsSeries, OneStrengthPerSample) {
    const auto h = decaying_history();
    const auto s = HistoryAnalytics::strength_series(h);
    ASSERT_EQ(s.size(), h.size());
    for (std::size_t i = 0; i < h.size(); ++i) {
        EXPECT_EQ(s[i], metrics::VectorMetrics::strength(h[i]));
    }
}

TEST(HistoryAnalyticsSlope, LinearSeries) {
    const std::vector<double> ys{1.0, 2.0, 3.0, 4.0};
    EXPECT_NEAR(HistoryAnalytics::slope(ys), 1.0, 1e-12);
}

TEST(HistoryAnalyticsSlope, ConstantSeriesIsFlat) {
    const std::vector<double> ys{0.4, 0.4, 0.4};
    EXPECT_EQ(HistoryAnalytics::slope(ys), 0.0);
}

TEST(HistoryAnalyticsSlope, TooFewSamplesIsZero) {
    EXPECT_EQ(HistoryAnalytics::slope(std::vector<double>{}), 0.0);
    EXPECT_EQ(HistoryAnalytics::slope(std::vector<double>{0.7}), 0.0);
}

// ─── stability ────────────────────────────────────────────────────────────────

TEST(HistoryAnalyticsStability, InsufficientDataIsStable) {
    EXPECT_EQ(HistoryAnalytics::stability({}), 1.0);
    EXPECT_EQ(HistoryAnalytics::stability(constant_history(1)), 1.0);
}

TEST(HistoryAnalyticsStability, ConstantHistoryIsFullyStable) {
    EXPECT_DOUBLE_EQ(HistoryAnalytics::stability(constant_history(10)), 1.0);
}

TEST(HistoryAnalyticsStability, OscillationLowersStability) {
    const double s = HistoryAnalytics::stability(oscillating_history(10));
    EXPECT_LT(s, 1.0);
    EXPECT_GT(s, 0.0);
}

TEST(HistoryAnalyticsStability, RepeatedCallsAreIdentical) {
    const auto h = oscillating_history(7);
    EXPECT_EQ(HistoryAnalytics::stability(h), HistoryAnalytics::stability(h));
}

TEST(HistoryAnalyticsStability, WindowRestrictsToTail) {
    auto h = oscillating_history(6);
    const auto tail = constant_history(4);
    h.insert(h.end(), tail.begin(), tail.end());

    EXPECT_DOUBLE_EQ(HistoryAnalytics::windowed_stability(h, 4), 1.0);
    EXPECT_LT(HistoryAnalytics::windowed_stability(h, 10), 1.0);
    EXPECT_EQ(HistoryAnalytics::windowed_stability(h, 100),
              HistoryAnalytics::stability(h));
}

TEST(HistoryAnalyticsStability, ZeroWindowThrows) {
    EXPECT_THROW((void)HistoryAnalytics::windowed_stability(constant_history(3), 0),
                 std::invalid_argument);
}

// ─── decay_detected ───────────────────────────────────────────────────────────

TEST(HistoryAnalyticsDecay, FallingStrengthIsDecay) {
    EXPECT_TRUE(HistoryAnalytics::decay_detected(decaying_history()));
}

TEST(HistoryAnalyticsDecay, NeedsThreeSamples) {
    const std::vector<TriadicVector> h{{1.0, 1.0, 1.0}, {0.1, 0.1, 0.1}};
    EXPECT_FALSE(HistoryAnalytics::decay_detected(h));
}

TEST(HistoryAnalyticsDecay, StableHistoryIsNotDecay) {
    EXPECT_FALSE(HistoryAnalytics::decay_detected(constant_history(8)));
}

TEST(HistoryAnalyticsDecay, ThresholdControlsSensitivity) {
    // Slope is about −0.43 per sample.
    EXPECT_TRUE(HistoryAnalytics::decay_detected(decaying_history(), 0.4));
    EXPECT_FALSE(HistoryAnalytics::decay_detected(decaying_history(), 0.5));
}

TEST(HistoryAnalyticsDecay, InvalidThresholdThrows) {
    EXPECT_THROW((void)HistoryAnalytics::decay_detected(decaying_history(), -0.1),
                 std::invalid_argument);
    EXPECT_THROW((void)HistoryAnalytics::decay_detected(
                     decaying_history(), std::numeric_limits<double>::quiet_NaN()),
                 std::invalid_argument);
}

// ─── forecast ─────────────────────────────────────────────────────────────────

TEST(HistoryAnalyticsForecast, TooFewSamplesIsNullopt) {
    EXPECT_FALSE(HistoryAnalytics::forecast(constant_history(2), 3).has_value());
}

TEST(HistoryAnalyticsForecast, FlatHistoryPredictsNoChange) {
    const auto f = HistoryAnalytics::forecast(constant_history(6), 4);
    ASSERT_TRUE(f.has_value());
    ASSERT_EQ(f->predictions.size(), 4u);
    for (double p : f->predictions) {
        EXPECT_NEAR(p, f->current, 1e-12);
    }
    EXPECT_FALSE(f->collapse_predicted);
    EXPECT_FALSE(f->degradation_predicted);
}

TEST(HistoryAnalyticsForecast, DecayPredictsCollapse) {
    const auto f = HistoryAnalytics::forecast(decaying_history(), 3);
    ASSERT_TRUE(f.has_value());
    EXPECT_LT(f->slope, 0.0);
    EXPECT_TRUE(f->collapse_predicted);
    EXPECT_TRUE(f->degradation_predicted);
    for (double p : f->predictions) {
        EXPECT_GE(p, 0.0);
        EXPECT_LE(p, 1.0);
    }
}

TEST(HistoryAnalyticsForecast, InvalidArgumentsThrow) {
    EXPECT_THROW((void)HistoryAnalytics::forecast(constant_history(5), 0),
                 std::invalid_argument);
    EXPECT_THROW((void)HistoryAnalytics::forecast(constant_history(5), 2, 1),
                 std::invalid_argument);
}

TEST(HistoryAnalyticsForecast, ToStringReportsHorizon) {
    const auto f = HistoryAnalytics::forecast(constant_history(5), 7);
    ASSERT_TRUE(f.has_value());
    EXPECT_NE(f->to_string().find("horizon=7"), std::string::npos);
}
