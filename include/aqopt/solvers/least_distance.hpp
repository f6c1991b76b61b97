/**
 * @file least_distance.hpp
 * @brief Dense convex QP subproblems via least-distance programming
 *
 * The SQP step subproblem
 *
 *   min ½ dᵀB d + gᵀd   s.t.   C d >= e,   B symmetric positive definite
 *
 * is turned into a least-distance program with the substitution
 * z = Lᵀd + L⁻¹g (B = LLᵀ):
 *
 *   min ½ ‖z‖²   s.t.   (C L⁻ᵀ) z >= e + C B⁻¹ g
 *
 * which is solved exactly by Lawson-Hanson non-negative least squares
 * on the (n+1) × m system [ (CL⁻ᵀ)ᵀ ; fᵀ ] u ≈ (0, …, 0, 1).
 * A zero NNLS residual means the constraints are incompatible.
 *
 * Intended for the small dense systems of well-field allocation
 * (tens of variables and constraints).
 */

#pragma once

#include "../core/types.hpp"
#include <Eigen/Cholesky>
#include <Eigen/QR>
#include <string>

namespace aqopt {

/**
 * @brief Result of a non-negative least squares solve
 */
struct NNLSResult {
    Vector x;                       ///< Solution, x >= 0
    Real residual_norm = 0.0;       ///< ‖A x - b‖
    Index iterations = 0;
    bool converged = false;
};

/**
 * @brief Lawson-Hanson NNLS: min ‖A x - b‖ s.t. x >= 0
 */
NNLSResult nnls(const Matrix& A, const Vector& b,
                Index max_iterations = 0, Real tolerance = 1e-12);

/**
 * @brief Result of a QP subproblem
 */
struct QPResult {
    Vector d;                       ///< Step
    Vector multipliers;             ///< One per row of C, >= 0
    bool feasible = false;          ///< False if C d >= e has no solution
    bool converged = false;         ///< NNLS finished within its budget
    Index iterations = 0;
    std::string message;
};

class LeastDistanceSolver {
public:
    LeastDistanceSolver() = default;

    /**
     * @brief Solve min ½dᵀBd + gᵀd s.t. C d >= e
     *
     * B is regularized with a diagonal shift if it is not numerically
     * positive definite.
     */
    QPResult solve(const Matrix& B, const Vector& g,
                   const Matrix& C, const Vector& e);

    Index max_iterations = 0;       ///< 0 = 3 × number of constraints
    Real tolerance = 1e-12;

    /// True if the last factorization needed a diagonal shift
    bool regularized() const { return regularized_; }

private:
    Eigen::LLT<Matrix> llt_;
    bool regularized_ = false;

    bool factorize(const Matrix& B);
};

} // namespace aqopt
