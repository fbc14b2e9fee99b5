/**
 * @file  fuzz_tracker.cpp
 * @brief libFuzzer target for EvolutionTracker recording and structure detection
 *
 * Build:
 *   cmake -DTRIAD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_tracker
 *
 * Run for 60 seconds:
 *   ./fuzz_tracker -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any sequence of states; non-finite
 *      states are rejected with std::invalid_argument.
 *   2. transitions().size() == size() − 1 for a non-empty tracker.
 *   3. critical_events() never contains a None transition.
 *   4. A detected cycle length lies in [2, window].
 *   5. report() agrees with the accessors.
 *
 * Fuzzer strategy:
 *   Input bytes → consecutive 3-double states, recorded in order with the
 *   internal sequence counter.  The first byte selects the cycle window.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <numeric>
#include <stdexcept>

#include "triad/evolution.hpp"

using namespace triad;
using namespace triad::evolution;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) {
        return 0;
    }
    const std::size_t window = 2 + data[0] % 30;
    ++data;
    --size;

    EvolutionTracker tracker;
    constexpr size_t kTriple = 3 * sizeof(double);
    for (size_t off = 0; off + kTriple <= size; off += kTriple) {
        TriadicVector v{};
        __builtin_memcpy(&v.a, data + off + 0 * sizeof(double), sizeof(double));
        __builtin_memcpy(&v.b, data + off + 1 * sizeof(double), sizeof(double));
        __builtin_memcpy(&v.c, data + off + 2 * sizeof(double), sizeof(double));
        if (v.is_finite()) {
            tracker.record(v);
            continue;
        }
        // Non-finite states are rejected and leave the tracker unchanged.
        const std::size_t before = tracker.size();
        bool rejected = false;
        try {
            tracker.record(v);
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        assert(rejected && tracker.size() == before);
    }

    // ── Test 1: cached structures are consistent ──────────────────────────────
    if (!tracker.empty()) {
        assert(tracker.transitions().size() == tracker.size() - 1);
    }
    for (const auto& t : tracker.critical_events()) {
        assert(t.kind != TransitionKind::None);
    }

    // ── Test 2: detectors never throw for valid parameters ────────────────────
    const auto cycle = tracker.detect_cycle(window, 0.1);
    if (cycle) {
        assert(*cycle >= 2 && *cycle <= window);
    }
    (void)tracker.detect_attractor(0.1, 3);
    (void)tracker.coherence_trend();

    // ── Test 3: report matches accessors ──────────────────────────────────────
    const auto r = tracker.report();
    assert(r.total_snapshots == tracker.size());
    assert(r.critical_events.size() == tracker.critical_events().size());
    assert(std::accumulate(r.transition_counts.begin(), r.transition_counts.end(),
                           std::size_t{0}) == r.total_transitions);

    return 0;
}
