#pragma once

/// @file include/triad/metrics.hpp
/// @brief VectorMetrics — scalar diagnostics of one or two triadic vectors.
///
/// # Module: Vector Metrics
///
/// ## Responsibility
/// Reduce a triadic vector (a, b, c) to scalar quality measures:
///   - strength:  saturating function of the product a·b·c
///   - balance:   how equal the three magnitudes are
///   - entropy:   Shannon entropy of the normalised component distribution
///   - alignment: cosine similarity between two vectors
/// and bundle them into a single Diagnostic with an aggregate health score.
///
/// ## Formulas
///   strength  = 1 − exp(−k·p),  p = a·b·c,  k = STRENGTH_GAIN   (p > 0)
///             = 0                                              (p ≤ 0)
///   balance   = 1 / (1 + σ/μ)   over |a|, |b|, |c| (population σ)
///   entropy   = −Σ qᵢ ln qᵢ / ln 3,  qᵢ = max(xᵢ,0) / Σ max(xⱼ,0)
///   alignment = (v₁·v₂) / (‖v₁‖‖v₂‖)
///
/// ## Edge Cases
/// - Zero, negative and huge components never raise and never yield NaN/Inf.
/// - balance of the zero vector is 0.0; entropy with no positive mass is 0.0.
/// - alignment against a zero vector is 0.0.
///
/// ## Guarantees
/// - All scalar metrics are `noexcept` and pure
/// - Thread-safe: VectorMetrics is stateless

#include "triad/types.hpp"
#include "triad/constants.hpp"

#include <optional>
#include <span>
#include <string>

namespace triad::metrics {

// ─── Diagnostic ───────────────────────────────────────────────────────────────

/// Full metric bundle for one state, optionally in the context of a history.
struct Diagnostic {
    double strength;                     ///< [0, 1]
    double balance;                      ///< [0, 1]
    double entropy;                      ///< [0, 1], normalised by ln 3
    std::optional<double> stability;     ///< Present iff a history was given
    std::optional<bool> decay_detected;  ///< Present iff a history was given
    double health_score;                 ///< Weighted mean, see constants.hpp

    /// One-line summary.
    [[nodiscard]] std::string to_string() const;
};

// ─── VectorMetrics ────────────────────────────────────────────────────────────

/// Stateless metric functions over triadic vectors.
class VectorMetrics {
public:
    VectorMetrics() = delete;

    /// Saturating strength of the component product, in [0, 1].
    ///
    /// Exactly 0 iff a·b·c ≤ 0 (or NaN); monotone non-decreasing in the
    /// product; 1.0 when the product overflows to +∞.
    [[nodiscard]] static double strength(double a, double b, double c) noexcept;
    [[nodiscard]] static double strength(const TriadicVector& v) noexcept;

    /// Scale-invariant evenness of the component magnitudes, in [0, 1].
    [[nodiscard]] static double balance(double a, double b, double c) noexcept;
    [[nodiscard]] static double balance(const TriadicVector& v) noexcept;

    /// Normalised Shannon entropy of the positive parts, in [0, 1].
    [[nodiscard]] static double entropy(double a, double b, double c) noexcept;
    [[nodiscard]] static double entropy(const TriadicVector& v) noexcept;

    /// Cosine similarity in [-1, 1]; 0.0 when either vector has zero length.
    [[nodiscard]] static double alignment(const TriadicVector& v1,
                                          const TriadicVector& v2) noexcept;

    /// Euclidean distance between two states.
    [[nodiscard]] static double distance(const TriadicVector& v1,
                                         const TriadicVector& v2) noexcept;

    /// True if every component is finite and non-zero.
    [[nodiscard]] static bool is_coherent(double a, double b, double c) noexcept;
    [[nodiscard]] static bool is_coherent(const TriadicVector& v) noexcept;

    /// True if both endpoints of a transition are coherent.
    [[nodiscard]] static bool continuity(const TriadicVector& prev,
                                         const TriadicVector& curr) noexcept;

    /// Bundle strength, balance and entropy, plus stability and decay when a
    /// non-empty `history` is supplied.
    ///
    /// health = 0.4·strength + 0.3·balance + 0.2·(1 − entropy) + 0.1·stability
    /// where stability defaults to 1.0 without a history.
    [[nodiscard]] static Diagnostic
    diagnostic(double a, double b, double c,
               std::span<const TriadicVector> history = {});
};

} // namespace triad::metrics
