/// @file tests/cascade/test_cascade_simulator.cpp
/// @brief Tests for CascadeSimulator — argument validation, update rule, convergence.

#include "triad/cascade.hpp"
#include "triad/field.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace triad;
using namespace triad::cascade;
using triad::field::InteractionField;

namespace {

/// Two perfectly aligned entities of different magnitude.
InteractionField aligned_pair() {
    InteractionField f;
    f.add("lo", {1.0, 1.0, 1.0});
    f.add("hi", {2.0, 2.0, 2.0});
    return f;
}

InteractionField mixed_field() {
    InteractionField f;
    f.add("a", {1.0, 0.2, 0.3});
    f.add("b", {0.4, 1.1, 0.2});
    f.add("c", {0.9, 0.8, 1.2});
    f.add("d", {0.3, 0.2, 1.4});
    return f;
}

void expect_same_states(const InteractionField& x, const InteractionField& y) {
    const auto ex = x.entities();
    const auto ey = y.entities();
    ASSERT_EQ(ex.size(), ey.size());
    for (std::size_t i = 0; i < ex.size(); ++i) {
        EXPECT_EQ(ex[i], ey[i]);
    }
}

}  // anonymous namespace

// ─── Argument validation ──────────────────────────────────────────────────────

TEST(CascadeSimulatorArgs, ZeroStepsIsNoOp) {
    InteractionField f = mixed_field();
    const InteractionField before = f;
    const auto reports = CascadeSimulator{}.run(f, 0, 0.5);
    EXPECT_TRUE(reports.empty());
    expect_same_states(f, before);
}

TEST(CascadeSimulatorArgs, InvalidArgumentsThrowAndLeaveField) {
    InteractionField f = mixed_field();
    const InteractionField before = f;
    CascadeSimulator sim;

    EXPECT_THROW((void)sim.run(f, -1, 0.5), std::invalid_argument);
    EXPECT_THROW((void)sim.run(f, 3, 1.5), std::invalid_argument);
    EXPECT_THROW((void)sim.run(f, 3, -0.1), std::invalid_argument);
    EXPECT_THROW((void)sim.run(f, 3, std::numeric_limits<double>::quiet_NaN()),
                 std::invalid_argument);
    expect_same_states(f, before);
}

TEST(CascadeSimulatorArgs, NonPositiveToleranceIsRejected) {
    EXPECT_THROW(CascadeSimulator{CascadeConfig{.convergence_tolerance = 0.0}},
                 std::invalid_argument);
    EXPECT_THROW(CascadeSimulator{CascadeConfig{.convergence_tolerance = -1e-3}},
                 std::invalid_argument);
}

// ─── Update rule ──────────────────────────────────────────────────────────────

TEST(CascadeSimulatorStep, AlignedPairMeetsAtCollectiveInOneStep) {
    InteractionField f = aligned_pair();
    const auto reports = CascadeSimulator{}.run(f, 1, 1.0);
    ASSERT_EQ(reports.size(), 1u);

    EXPECT_EQ(*f.get("lo"), (TriadicVector{1.5, 1.5, 1.5}));
    EXPECT_EQ(*f.get("hi"), (TriadicVector{1.5, 1.5, 1.5}));
    EXPECT_NEAR(reports[0].max_displacement, std::sqrt(0.75), 1e-12);
    EXPECT_EQ(reports[0].step, 1u);
}

TEST(CascadeSimulatorStep, PartialCouplingMovesProportionally) {
    InteractionField f = aligned_pair();
    (void)CascadeSimulator{}.run(f, 1, 0.5);
    EXPECT_NEAR(f.get("lo")->a, 1.25, 1e-12);
    EXPECT_NEAR(f.get("hi")->a, 1.75, 1e-12);
}

TEST(CascadeSimulatorStep, ZeroCouplingLeavesStates) {
    InteractionField f = mixed_field();
    const InteractionField before = f;
    const auto reports = CascadeSimulator{}.run(f, 4, 0.0);
    ASSERT_EQ(reports.size(), 4u);
    for (const auto& r : reports) {
        EXPECT_EQ(r.max_displacement, 0.0);
    }
    expect_same_states(f, before);
}

TEST(CascadeSimulatorStep, LoneEntityIsNotPulled) {
    InteractionField f;
    f.add("solo", {0.3, 2.0, 5.0});
    const auto reports = CascadeSimulator{}.run(f, 3, 1.0);
    ASSERT_EQ(reports.size(), 3u);
    EXPECT_EQ(*f.get("solo"), (TriadicVector{0.3, 2.0, 5.0}));
}

TEST(CascadeSimulatorStep, AntiAlignedEntitiesAreNotPulled) {
    InteractionField f;
    f.add("p", {1.0, 1.0, 1.0});
    f.add("q", {-1.0, -1.0, -1.0});
    (void)CascadeSimulator{}.run(f, 2, 1.0);
    EXPECT_EQ(*f.get("p"), (TriadicVector{1.0, 1.0, 1.0}));
    EXPECT_EQ(*f.get("q"), (TriadicVector{-1.0, -1.0, -1.0}));
}

TEST(CascadeSimulatorStep, EmptyFieldReportsEachStep) {
    InteractionField f;
    const auto reports = CascadeSimulator{}.run(f, 2, 0.5);
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_FALSE(reports[0].collective.has_value());
    EXPECT_EQ(reports[1].step, 2u);
}

// ─── Convergence / determinism ────────────────────────────────────────────────

TEST(CascadeSimulatorRun, RunsEveryStepWithoutTolerance) {
    InteractionField f = aligned_pair();
    const auto reports = CascadeSimulator{}.run(f, 5, 1.0);
    EXPECT_EQ(reports.size(), 5u);
    EXPECT_EQ(reports.back().max_displacement, 0.0);
}

TEST(CascadeSimulatorRun, StopsEarlyOnceConverged) {
    InteractionField f = aligned_pair();
    CascadeSimulator sim{CascadeConfig{.convergence_tolerance = 1e-9}};
    const auto reports = sim.run(f, 10, 1.0);

    // Step 1 merges the pair, step 2 moves nothing and ends the run.
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[1].step, 2u);
    EXPECT_EQ(reports[1].max_displacement, 0.0);
}

TEST(CascadeSimulatorRun, LargeStepBudgetStopsAtConvergence) {
    InteractionField f;
    f.add("p", {1.00, 1.0, 1.0});
    f.add("q", {1.01, 1.0, 1.0});
    CascadeSimulator sim{CascadeConfig{.convergence_tolerance = 1e-3}};
    const auto reports = sim.run(f, std::numeric_limits<int>::max(), 0.5);

    ASSERT_FALSE(reports.empty());
    EXPECT_LT(reports.size(), 10u);
    EXPECT_LT(reports.back().max_displacement, 1e-3);
}

TEST(CascadeSimulatorStep, HugeOpposedComponentsStayFinite) {
    const double big = std::numeric_limits<double>::max();
    InteractionField f;
    f.add("p",  {big, 1.0, 1.0});
    f.add("q1", {-big, 1.0, 1.0});
    f.add("q2", {-big, 1.0, 1.0});
    f.add("q3", {-big, 1.0, 1.0});

    // collective.a = -big/2, so collective - p overflows; p has weight 0.
    const auto reports = CascadeSimulator{}.run(f, 1, 1.0);
    ASSERT_EQ(reports.size(), 1u);
    for (const auto& e : f.entities()) {
        EXPECT_TRUE(e.state.is_finite()) << e.id;
    }
    EXPECT_EQ(*f.get("p"), (TriadicVector{big, 1.0, 1.0}));
    EXPECT_TRUE(std::isfinite(reports[0].max_displacement));
}

TEST(CascadeSimulatorRun, CouplingContractsTowardCollective) {
    InteractionField f = mixed_field();
    (void)CascadeSimulator{}.run(f, 30, 0.5);

    const auto end = *f.collective_state();
    for (const auto& e : f.entities()) {
        const double dx = e.state.a - end.a;
        const double dy = e.state.b - end.b;
        const double dz = e.state.c - end.c;
        EXPECT_LT(std::sqrt(dx * dx + dy * dy + dz * dz), 0.05) << e.id;
    }
    EXPECT_GT(f.field_coherence(), 0.99);
}

TEST(CascadeSimulatorRun, Deterministic) {
    InteractionField f1 = mixed_field();
    InteractionField f2 = mixed_field();
    const auto r1 = CascadeSimulator{}.run(f1, 6, 0.3);
    const auto r2 = CascadeSimulator{}.run(f2, 6, 0.3);

    ASSERT_EQ(r1.size(), r2.size());
    for (std::size_t i = 0; i < r1.size(); ++i) {
        EXPECT_EQ(r1[i].max_displacement, r2[i].max_displacement);
        EXPECT_EQ(r1[i].field_coherence, r2[i].field_coherence);
        EXPECT_EQ(r1[i].collective, r2[i].collective);
    }
    expect_same_states(f1, f2);
}

TEST(CascadeSimulatorRun, StepReportToString) {
    InteractionField f = aligned_pair();
    const auto reports = CascadeSimulator{}.run(f, 1, 1.0);
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_NE(reports[0].to_string().find("step=1"), std::string::npos);
}
