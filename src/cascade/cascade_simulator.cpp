/// @file src/cascade/cascade_simulator.cpp
/// @brief CascadeSimulator — synchronous alignment-weighted coupling.

#include "triad/cascade.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace triad::cascade {

// ─── Construction ─────────────────────────────────────────────────────────────

CascadeSimulator::CascadeSimulator(CascadeConfig config) : config_(config) {
    if (config_.convergence_tolerance) {
        const double tol = *config_.convergence_tolerance;
        if (!std::isfinite(tol) || tol <= 0.0) {
            throw std::invalid_argument(fmt::format(
                "CascadeConfig: convergence_tolerance must be positive and finite, got {}",
                tol));
        }
    }
}

// ─── run ──────────────────────────────────────────────────────────────────────

std::vector<StepReport> CascadeSimulator::run(field::InteractionField& field,
                                              int steps,
                                              double coupling_strength) const {
    if (steps < 0) {
        throw std::invalid_argument(fmt::format(
            "CascadeSimulator::run: steps must be >= 0, got {}", steps));
    }
    if (!std::isfinite(coupling_strength) ||
        coupling_strength < 0.0 || coupling_strength > 1.0) {
        throw std::invalid_argument(fmt::format(
            "CascadeSimulator::run: coupling_strength must be in [0, 1], got {}",
            coupling_strength));
    }

    // Not reserved up front: with a tolerance, `steps` is only an upper bound.
    std::vector<StepReport> reports;

    for (int step = 1; step <= steps; ++step) {
        const auto members = field.entities();
        const auto n = static_cast<Eigen::Index>(members.size());

        // Snapshot: every row below is computed from this matrix only.
        StateMatrix X(n, TRIAD_DIM);
        for (Eigen::Index i = 0; i < n; ++i) {
            X.row(i) = members[i].state.to_eigen().transpose();
        }

        double max_displacement = 0.0;
        if (n > 0) {
            const Eigen::RowVector3d collective =
                (X / static_cast<double>(n)).colwise().sum();

            // Mean alignment of each entity to the others; the diagonal is
            // excluded. A lone entity has no peers and is not pulled.
            Eigen::VectorXd weight = Eigen::VectorXd::Zero(n);
            if (n > 1) {
                const Eigen::MatrixXd align = field.alignment_matrix();
                const Eigen::VectorXd others = align.rowwise().sum() - align.diagonal();
                weight = (others / static_cast<double>(n - 1)).cwiseMax(0.0).cwiseMin(1.0);
            }

            // x' = (1 - k·w)·x + k·w·collective. The convex form keeps every
            // row finite, so no update below can be rejected part way through.
            const Eigen::ArrayXd pull = coupling_strength * weight.array();
            StateMatrix next = X;
            next.array().colwise() *= 1.0 - pull;
            StateMatrix target = collective.replicate(n, 1);
            target.array().colwise() *= pull;
            next += target;

            max_displacement = (next - X).rowwise().stableNorm().maxCoeff();

            // Every id comes from this step's snapshot, so each update hits.
            for (Eigen::Index i = 0; i < n; ++i) {
                const Vec3 row = next.row(i).transpose();
                field.update(members[i].id, TriadicVector::from_eigen(row));
            }
        }

        StepReport report{
            .step                = static_cast<std::size_t>(step),
            .field_coherence     = field.field_coherence(),
            .emergence_potential = field.emergence_potential(),
            .phase_transition    = field.phase_transition_check(),
            .collective          = field.collective_state(),
            .max_displacement    = max_displacement,
        };

        if (config_.verbose) {
            fmt::print(stderr, "[triad] cascade {}\n", report.to_string());
        }
        reports.push_back(report);

        if (config_.convergence_tolerance &&
            max_displacement < *config_.convergence_tolerance) {
            break;
        }
    }

    return reports;
}

std::string StepReport::to_string() const {
    std::string out = fmt::format(
        "step={}  coherence={:+.4f}  potential={:.4f}  phase={}  moved={:.6f}",
        step, field_coherence, emergence_potential,
        phase_transition ? "yes" : "no", max_displacement);
    if (collective) {
        out += fmt::format("  collective=({:.4f}, {:.4f}, {:.4f})",
                           collective->a, collective->b, collective->c);
    }
    return out;
}

}  // namespace triad::cascade
