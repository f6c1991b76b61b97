/**
 * @file types.hpp
 * @brief Core type definitions for aqopt
 *
 * This file defines the fundamental types used throughout aqopt,
 * including scalar types, array types, method enums and result types.
 */

#pragma once

#include <Eigen/Core>
#include <cstdint>
#include <vector>
#include <functional>
#include <string>

namespace aqopt {

// ============================================================================
// Scalar Types
// ============================================================================

using Real = double;
using Index = int64_t;
using Size = size_t;

// ============================================================================
// Array Types (Eigen-based)
// ============================================================================

// Dense vectors
using Vector = Eigen::VectorXd;

// Dense matrices
using Matrix = Eigen::MatrixXd;

// Fixed-size vectors for coordinates
using Vec2 = Eigen::Vector2d;

// ============================================================================
// Method Enums
// ============================================================================

/**
 * @brief Single-well drawdown kernel
 */
enum class DrawdownMethod {
    Theis,              ///< s = Q/(4πT) W(u), exact transient solution
    CooperJacob,        ///< s = Q/(4πT) ln(2.25Tt/(r²S)), valid for u < 0.01
};

/**
 * @brief Pumping allocation formulation
 */
enum class AllocationMethod {
    Linear,             ///< LP on Cooper-Jacob response coefficients
    Nonlinear,          ///< SQP with the Theis kernel in the constraints
};

/**
 * @brief How a constraint point expresses its limit
 */
enum class LimitKind {
    MinHead,            ///< h0 - s >= h_min
    MaxDrawdown,        ///< s <= s_max
};

/**
 * @brief Outcome of an optimizer invocation
 */
enum class OptimizationStatus {
    Optimal,            ///< Converged, all constraints satisfied
    Infeasible,         ///< Constraints conflict with rate bounds
    NonConvergence,     ///< Iteration or time budget exhausted
    SolverError,        ///< Backend reported a numerical failure
};

// ============================================================================
// Function Types for Callbacks
// ============================================================================

/// Scalar objective f(x)
using ObjectiveFunc = std::function<Real(const Vector& x)>;

/// Gradient of a scalar objective: g = ∇f(x)
using GradientFunc = std::function<void(const Vector& x, Vector& grad)>;

/// Inequality constraints c(x) >= 0
using ConstraintFunc = std::function<void(const Vector& x, Vector& c)>;

/// Constraint Jacobian J = ∂c/∂x (rows = constraints)
using ConstraintJacobianFunc = std::function<void(const Vector& x, Matrix& jacobian)>;

/// Convergence callback: called each iteration with (iter, measure); return false to stop
using ConvergenceCallback = std::function<bool(Index iter, Real norm)>;

// ============================================================================
// Result Types
// ============================================================================

/**
 * @brief Result of a solve operation
 */
struct SolveResult {
    bool converged = false;
    Index iterations = 0;
    Real final_residual = 0.0;
    Real solve_time_ms = 0.0;
    std::string message;
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    constexpr Real PI = 3.14159265358979323846;
    constexpr Real EULER_GAMMA = 0.57721566490153286061;  ///< Euler-Mascheroni
    constexpr Real EPSILON = 1e-15;                        ///< Numerical zero
    constexpr Real DEFAULT_WELL_RADIUS = 0.1;              ///< Distance floor [L]
    constexpr Real COOPER_JACOB_U_LIMIT = 0.01;            ///< Jacob applicability bound
}

} // namespace aqopt
