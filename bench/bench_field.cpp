/**
 * @file  bench/bench_field.cpp
 * @brief Google Benchmark suite for the O(n²) field operations and the cascade.
 *
 * Benchmarks
 * ----------
 *   BM_FieldCoherence      — mean pairwise alignment
 *   BM_DetectClusters      — connected components over the alignment graph
 *   BM_CascadeStep         — one synchronous coupling step
 *   BM_TrackerRecord       — amortised cost of record() with classification
 *   BM_DetectAttractor     — two-pointer sweep over a long history
 *
 * Build (CMake):
 *   cmake -DTRIAD_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_field
 *   ./build/bench_field --benchmark_format=json
 *
 * Throughput units: items/second (entities or snapshots processed).
 */

#include "benchmark/benchmark.h"

#include "triad/cascade.hpp"
#include "triad/evolution.hpp"
#include "triad/field.hpp"

#include <cmath>
#include <cstddef>
#include <string>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Deterministic field of N entities spread over a cone around (1, 1, 1).
static triad::field::InteractionField make_field(std::size_t n) {
    triad::field::InteractionField f;
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        f.add("e" + std::to_string(i),
              {1.0 + 0.3 * std::sin(t), 1.0 + 0.3 * std::cos(t), 1.0 + 0.1 * std::sin(2.0 * t)});
    }
    return f;
}

// ── Field benchmarks ───────────────────────────────────────────────────────────

static void BM_FieldCoherence(benchmark::State& state) {
    const auto f = make_field(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(f.field_coherence());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_FieldCoherence)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

static void BM_DetectClusters(benchmark::State& state) {
    const auto f = make_field(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto clusters = f.detect_clusters(0.99);
        benchmark::DoNotOptimize(clusters.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_DetectClusters)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

static void BM_CascadeStep(benchmark::State& state) {
    const triad::cascade::CascadeSimulator sim;
    for (auto _ : state) {
        state.PauseTiming();
        auto f = make_field(static_cast<std::size_t>(state.range(0)));
        state.ResumeTiming();
        auto reports = sim.run(f, 1, 0.5);
        benchmark::DoNotOptimize(reports.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_CascadeStep)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

// ── Tracker benchmarks ─────────────────────────────────────────────────────────

static void BM_TrackerRecord(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        triad::evolution::EvolutionTracker tracker;
        for (std::size_t i = 0; i < n; ++i) {
            const double t = static_cast<double>(i) * 0.1;
            tracker.record(1.0 + std::sin(t), 1.0 + std::cos(t), 1.0);
        }
        benchmark::DoNotOptimize(tracker.size());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_TrackerRecord)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

static void BM_DetectAttractor(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    triad::evolution::EvolutionTracker tracker;
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) * 0.05;
        tracker.record(1.0 + 0.2 * std::sin(t), 1.0, 1.0 + 0.2 * std::cos(t));
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(tracker.detect_attractor(0.1, 5));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_DetectAttractor)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
