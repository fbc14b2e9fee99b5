#pragma once

/// @file include/triad/types.hpp
/// @brief Shared primitive types for the triad state-analysis library.
///
/// Every module includes this file. It defines the triadic value type and the
/// Eigen aliases used wherever the library does linear algebra over states.

#include <Eigen/Dense>

#include <cmath>
#include <cstdint>

namespace triad {

/// Number of components in a triadic state.
static constexpr int TRIAD_DIM = 3;

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// A triadic state as a column vector [a, b, c].
using Vec3 = Eigen::Vector<double, TRIAD_DIM>;

/// A population of states, one entity per row.
using StateMatrix = Eigen::Matrix<double, Eigen::Dynamic, TRIAD_DIM>;

// ─── TriadicVector ────────────────────────────────────────────────────────────

/// Three independent real-valued components describing one entity at one
/// point in time. Unconstrained in sign; metric functions are total over all
/// finite values.
struct TriadicVector {
    double a;
    double b;
    double c;

    /// True if all three components are finite.
    [[nodiscard]] bool is_finite() const noexcept {
        return std::isfinite(a) && std::isfinite(b) && std::isfinite(c);
    }

    [[nodiscard]] Vec3 to_eigen() const noexcept { return Vec3(a, b, c); }

    [[nodiscard]] static TriadicVector from_eigen(const Vec3& v) noexcept {
        return TriadicVector{v(0), v(1), v(2)};
    }

    friend bool operator==(const TriadicVector&, const TriadicVector&) = default;
};

} // namespace triad
