/// @file src/metrics/vector_metrics.cpp
/// @brief VectorMetrics — strength, balance, entropy, alignment, diagnostic.

#include "triad/metrics.hpp"
#include "triad/history.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace triad::metrics {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Largest absolute component, or 0 for the zero / non-finite vector.
[[nodiscard]] double max_magnitude(const Vec3& v) noexcept {
    const double m = v.cwiseAbs().maxCoeff();
    return std::isfinite(m) ? m : 0.0;
}

/// Map NaN to 0 so downstream arithmetic stays finite.
[[nodiscard]] double finite_or_zero(double x) noexcept {
    return std::isnan(x) ? 0.0 : x;
}

}  // namespace

// ─── strength ─────────────────────────────────────────────────────────────────

double VectorMetrics::strength(double a, double b, double c) noexcept {
    const double product = a * b * c;

    // Covers p ≤ 0 and NaN (all comparisons with NaN are false).
    if (!(product > 0.0)) {
        return 0.0;
    }
    if (std::isinf(product)) {
        return 1.0;
    }

    // 1 − exp(−k·p) via expm1 so that denormal products stay strictly
    // positive instead of rounding to zero.
    const double s = -std::expm1(-constants::STRENGTH_GAIN * product);
    return std::clamp(s, 0.0, 1.0);
}

double VectorMetrics::strength(const TriadicVector& v) noexcept {
    return strength(v.a, v.b, v.c);
}

// ─── balance ──────────────────────────────────────────────────────────────────

double VectorMetrics::balance(double a, double b, double c) noexcept {
    if (!std::isfinite(a) || !std::isfinite(b) || !std::isfinite(c)) {
        return 0.0;
    }

    // Rescale by the largest magnitude: CV is scale-invariant and this keeps
    // the squares below overflow for components near DBL_MAX.
    const Vec3 raw = Vec3(a, b, c).cwiseAbs();
    const double scale = max_magnitude(raw);
    if (scale <= 0.0) {
        return 0.0;
    }
    const Vec3 x = raw / scale;

    const double mean = x.mean();
    const double variance = (x.array() - mean).square().mean();
    const double cv = std::sqrt(variance) / mean;

    return std::clamp(1.0 / (1.0 + cv), 0.0, 1.0);
}

double VectorMetrics::balance(const TriadicVector& v) noexcept {
    return balance(v.a, v.b, v.c);
}

// ─── entropy ──────────────────────────────────────────────────────────────────

double VectorMetrics::entropy(double a, double b, double c) noexcept {
    const Vec3 mass(std::max(finite_or_zero(a), 0.0),
                    std::max(finite_or_zero(b), 0.0),
                    std::max(finite_or_zero(c), 0.0));

    // Rescale first so the sum of three near-DBL_MAX values cannot overflow.
    const double scale = max_magnitude(mass);
    if (scale <= 0.0) {
        return 0.0;
    }
    const Vec3 w = mass / scale;
    const double total = w.sum();

    double h = 0.0;
    for (int i = 0; i < TRIAD_DIM; ++i) {
        const double q = w(i) / total;
        if (q > 0.0) {
            h -= q * std::log(q);
        }
    }

    return std::clamp(h / std::log(3.0), 0.0, 1.0);
}

double VectorMetrics::entropy(const TriadicVector& v) noexcept {
    return entropy(v.a, v.b, v.c);
}

// ─── alignment ────────────────────────────────────────────────────────────────

double VectorMetrics::alignment(const TriadicVector& v1,
                                const TriadicVector& v2) noexcept {
    if (!v1.is_finite() || !v2.is_finite()) {
        return 0.0;
    }

    const Vec3 x = v1.to_eigen();
    const Vec3 y = v2.to_eigen();

    const double sx = max_magnitude(x);
    const double sy = max_magnitude(y);
    if (sx <= 0.0 || sy <= 0.0) {
        return 0.0;
    }

    // Cosine is invariant to positive rescaling of either argument.
    const Vec3 u = x / sx;
    const Vec3 w = y / sy;

    const double denom = std::sqrt(u.squaredNorm() * w.squaredNorm());
    if (denom <= 0.0) {
        return 0.0;
    }
    return std::clamp(u.dot(w) / denom, -1.0, 1.0);
}

// ─── distance ─────────────────────────────────────────────────────────────────

double VectorMetrics::distance(const TriadicVector& v1,
                               const TriadicVector& v2) noexcept {
    // stableNorm avoids intermediate overflow for large differences.
    return (v2.to_eigen() - v1.to_eigen()).stableNorm();
}

// ─── is_coherent / continuity ─────────────────────────────────────────────────

bool VectorMetrics::is_coherent(double a, double b, double c) noexcept {
    return std::isfinite(a) && std::isfinite(b) && std::isfinite(c) &&
           a != 0.0 && b != 0.0 && c != 0.0;
}

bool VectorMetrics::is_coherent(const TriadicVector& v) noexcept {
    return is_coherent(v.a, v.b, v.c);
}

bool VectorMetrics::continuity(const TriadicVector& prev,
                               const TriadicVector& curr) noexcept {
    return is_coherent(prev) && is_coherent(curr);
}

// ─── diagnostic ───────────────────────────────────────────────────────────────

Diagnostic VectorMetrics::diagnostic(double a, double b, double c,
                                     std::span<const TriadicVector> history) {
    Diagnostic d{
        .strength       = strength(a, b, c),
        .balance        = balance(a, b, c),
        .entropy        = entropy(a, b, c),
        .stability      = std::nullopt,
        .decay_detected = std::nullopt,
        .health_score   = 0.0,
    };

    if (!history.empty()) {
        d.stability      = history::HistoryAnalytics::stability(history);
        d.decay_detected = history::HistoryAnalytics::decay_detected(history);
    }

    d.health_score =
        constants::HEALTH_WEIGHT_STRENGTH  * d.strength +
        constants::HEALTH_WEIGHT_BALANCE   * d.balance +
        constants::HEALTH_WEIGHT_ORDER     * (1.0 - d.entropy) +
        constants::HEALTH_WEIGHT_STABILITY * d.stability.value_or(constants::NEUTRAL_STABILITY);

    return d;
}

std::string Diagnostic::to_string() const {
    std::string out = fmt::format(
        "strength={:.4f}  balance={:.4f}  entropy={:.4f}",
        strength, balance, entropy);
    if (stability) {
        out += fmt::format("  stability={:.4f}", *stability);
    }
    if (decay_detected) {
        out += fmt::format("  decay={}", *decay_detected ? "yes" : "no");
    }
    out += fmt::format("  health={:.4f}", health_score);
    return out;
}

}  // namespace triad::metrics
