/**
 * @file  fuzz_metrics.cpp
 * @brief libFuzzer target for VectorMetrics and the diagnostic bundle
 *
 * Build:
 *   cmake -DTRIAD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_metrics
 *
 * Run for 60 seconds:
 *   ./fuzz_metrics -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any component values including
 *      NaN, ±Inf, ±0.0, subnormals.
 *   2. strength, balance and entropy are always in [0, 1].
 *   3. alignment is always in [−1, 1] and symmetric.
 *   4. health_score is finite for finite input.
 *
 * Fuzzer strategy:
 *   Input bytes → 6 doubles → two TriadicVectors; any remaining whole
 *   triples form the history passed to diagnostic().
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <cmath>
#include <vector>

#include "triad/metrics.hpp"

using namespace triad;
using triad::metrics::VectorMetrics;

namespace {

TriadicVector read_vector(const uint8_t* data) {
    TriadicVector v{};
    __builtin_memcpy(&v.a, data + 0 * sizeof(double), sizeof(double));
    __builtin_memcpy(&v.b, data + 1 * sizeof(double), sizeof(double));
    __builtin_memcpy(&v.c, data + 2 * sizeof(double), sizeof(double));
    return v;
}

bool in_unit(double x) { return x >= 0.0 && x <= 1.0; }

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    constexpr size_t kTriple = 3 * sizeof(double);
    if (size < 2 * kTriple) {
        return 0;
    }

    const TriadicVector v = read_vector(data);
    const TriadicVector w = read_vector(data + kTriple);

    // ── Test 1: scalar metrics stay in range ──────────────────────────────────
    assert(in_unit(VectorMetrics::strength(v)));
    assert(in_unit(VectorMetrics::balance(v)));
    assert(in_unit(VectorMetrics::entropy(v)));

    // ── Test 2: alignment bounded and symmetric ───────────────────────────────
    const double al = VectorMetrics::alignment(v, w);
    assert(al >= -1.0 && al <= 1.0);
    assert(al == VectorMetrics::alignment(w, v));

    // ── Test 3: diagnostic over the trailing history ──────────────────────────
    std::vector<TriadicVector> history;
    for (size_t off = 2 * kTriple; off + kTriple <= size; off += kTriple) {
        history.push_back(read_vector(data + off));
    }
    const auto d = VectorMetrics::diagnostic(v.a, v.b, v.c, history);
    assert(d.stability.has_value() == !history.empty());
    if (d.stability) {
        assert(in_unit(*d.stability));
    }
    if (v.is_finite()) {
        assert(std::isfinite(d.health_score));
    }

    return 0;
}
