#pragma once

/// @file include/triad/cascade.hpp
/// @brief CascadeSimulator — iterated coupling of a field toward its collective state.
///
/// # Module: Cascade Simulator
///
/// ## Responsibility
/// Evolve every entity of an InteractionField toward the field's collective
/// state, each entity pulled in proportion to how well it already aligns
/// with the rest of the population.
///
/// ## Update Rule (one step)
///   c   = column mean of the N×3 state matrix X
///   wᵢ  = clamp(mean_{j≠i} alignment(xᵢ, xⱼ), 0, 1)      (0 when N = 1)
///   xᵢ' = xᵢ + κ · wᵢ · (c − xᵢ)
/// All rows are computed from the same snapshot, then written back together.
///
/// ## Guarantees
/// - Deterministic: identical inputs produce identical reports and states
/// - Invalid arguments throw before the field is touched
/// - Runs exactly `steps` iterations unless a convergence tolerance is configured

#include "triad/field.hpp"
#include "triad/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace triad::cascade {

/// Field metrics after one simulation step.
struct StepReport {
    std::size_t step;             ///< 1-based
    double field_coherence;
    double emergence_potential;
    bool phase_transition;
    std::optional<TriadicVector> collective;
    double max_displacement;      ///< Largest Euclidean move of any entity this step

    [[nodiscard]] std::string to_string() const;
};

struct CascadeConfig {
    /// Stop early once max_displacement falls below this. Unset: run every step.
    std::optional<double> convergence_tolerance;

    /// Print each step report to stderr.
    bool verbose = false;
};

class CascadeSimulator {
public:
    /// @throws std::invalid_argument if the convergence tolerance is set and
    ///         not a positive finite number.
    explicit CascadeSimulator(CascadeConfig config = {});

    /// Run up to `steps` coupling iterations on `field` in place.
    ///
    /// @param coupling_strength κ in [0, 1]; 0 leaves every state unchanged.
    /// @return One report per executed step.
    /// @throws std::invalid_argument if steps < 0 or coupling_strength is
    ///         outside [0, 1] or not finite. The field is unchanged.
    std::vector<StepReport> run(field::InteractionField& field,
                                int steps,
                                double coupling_strength) const;

    [[nodiscard]] const CascadeConfig& config() const noexcept { return config_; }

private:
    CascadeConfig config_;
};

} // namespace triad::cascade
