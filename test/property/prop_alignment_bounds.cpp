/**
 * @file  prop_alignment_bounds.cpp
 * @brief Property: alignment is a symmetric cosine in [−1, 1] with
 *        alignment(v, v) = 1 and alignment(v, −v) = −1 for v ≠ 0.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_alignment_bounds
 *
 * Mathematical basis:
 *   By Cauchy–Schwarz |v·w| ≤ ‖v‖‖w‖, with equality iff v ∥ w.
 *   Rescaling each argument by its largest component keeps the cosine
 *   unchanged and keeps ‖v‖² finite for components near DBL_MAX.
 */

#include <rapidcheck.h>
#include <cmath>

#include "triad/metrics.hpp"

using triad::TriadicVector;
using triad::metrics::VectorMetrics;

int main() {
    // ── Property 1: bounded and symmetric ────────────────────────────────────
    rc::check(
        "alignment_bounds: -1 <= alignment(v, w) == alignment(w, v) <= 1",
        [](double a, double b, double c, double x, double y, double z) {
            const TriadicVector v{a, b, c};
            const TriadicVector w{x, y, z};

            const double vw = VectorMetrics::alignment(v, w);
            RC_ASSERT(std::isfinite(vw));
            RC_ASSERT(vw >= -1.0);
            RC_ASSERT(vw <= 1.0);
            RC_ASSERT(vw == VectorMetrics::alignment(w, v));
        }
    );

    // ── Property 2: self and opposite ────────────────────────────────────────
    rc::check(
        "alignment_bounds: alignment(v, v) == 1 and alignment(v, -v) == -1",
        [](double a, double b, double c) {
            RC_PRE(std::isfinite(a) && std::isfinite(b) && std::isfinite(c));
            RC_PRE(a != 0.0 || b != 0.0 || c != 0.0);

            const TriadicVector v{a, b, c};
            const TriadicVector neg{-a, -b, -c};
            RC_ASSERT(std::abs(VectorMetrics::alignment(v, v) - 1.0) < 1e-12);
            RC_ASSERT(std::abs(VectorMetrics::alignment(v, neg) + 1.0) < 1e-12);
        }
    );

    return 0;
}
