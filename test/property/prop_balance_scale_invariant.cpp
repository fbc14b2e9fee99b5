/**
 * @file  prop_balance_scale_invariant.cpp
 * @brief Property: ∀ k > 0: balance(k·a, k·b, k·c) == balance(a, b, c)
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_balance_scale_invariant
 *
 * Mathematical basis:
 *   balance = 1 / (1 + σ/μ) over |a|, |b|, |c|.  Both σ and μ scale
 *   linearly with k, so their ratio (the coefficient of variation) is
 *   invariant.  Entropy of the positive parts is invariant for the same
 *   reason: normalisation divides k out.
 *
 * A failure would indicate overflow in the squared deviations (the
 * implementation rescales by the largest magnitude first) or an
 * accidental dependence on absolute magnitude.
 */

#include <rapidcheck.h>
#include <cmath>

#include "triad/metrics.hpp"

using triad::metrics::VectorMetrics;

int main() {
    // ── Property 1: balance is scale invariant ───────────────────────────────
    rc::check(
        "balance_scale_invariant: balance(k*v) == balance(v) to 1e-9",
        []() {
            const double a = *rc::gen::inRange(-10000, 10000) / 100.0;
            const double b = *rc::gen::inRange(-10000, 10000) / 100.0;
            const double c = *rc::gen::inRange(-10000, 10000) / 100.0;
            const double k = *rc::gen::inRange(1, 1000000) / 1000.0;

            const double base   = VectorMetrics::balance(a, b, c);
            const double scaled = VectorMetrics::balance(k * a, k * b, k * c);
            RC_ASSERT(std::abs(base - scaled) < 1e-9);
            RC_ASSERT(base >= 0.0);
            RC_ASSERT(base <= 1.0);
        }
    );

    // ── Property 2: entropy is scale invariant ───────────────────────────────
    rc::check(
        "balance_scale_invariant: entropy(k*v) == entropy(v) to 1e-9",
        []() {
            const double a = *rc::gen::inRange(-10000, 10000) / 100.0;
            const double b = *rc::gen::inRange(-10000, 10000) / 100.0;
            const double c = *rc::gen::inRange(-10000, 10000) / 100.0;
            const double k = *rc::gen::inRange(1, 1000000) / 1000.0;

            RC_ASSERT(std::abs(VectorMetrics::entropy(a, b, c) -
                               VectorMetrics::entropy(k * a, k * b, k * c)) < 1e-9);
        }
    );

    // ── Property 3: equal magnitudes are perfectly balanced ──────────────────
    rc::check(
        "balance_scale_invariant: balance(k, k, k) == 1 for k != 0",
        [](double k) {
            RC_PRE(std::isfinite(k) && k != 0.0);
            RC_ASSERT(VectorMetrics::balance(k, k, k) == 1.0);
        }
    );

    return 0;
}
