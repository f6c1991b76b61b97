/**
 * @file sqp.hpp
 * @brief Sequential quadratic programming for small constrained problems
 *
 * Solves
 *
 *   min f(x)   s.t.   c(x) >= 0,   lower <= x <= upper
 *
 * Each iteration solves the QP subproblem
 *
 *   min ½ dᵀB d + ∇f ᵀd   s.t.   c + J d >= 0,   lower - x <= d <= upper - x
 *
 * with LeastDistanceSolver, then backtracks on the L1 merit function
 * φ(x) = f(x) + μ Σ max(0, -c_j(x)). B is a damped BFGS approximation
 * of the Lagrangian Hessian.
 *
 * Features:
 * - Finite-difference gradient and constraint Jacobian fallback
 * - Relaxation of incompatible linearized constraints
 * - Best-candidate tracking when the iteration budget runs out
 */

#pragma once

#include "../core/types.hpp"
#include "least_distance.hpp"
#include <vector>

namespace aqopt {

/**
 * @brief Configuration for the SQP solver
 */
struct SQPConfig {
    Index max_iterations = 100;
    Real tolerance = 1e-6;              // ‖d‖∞ at convergence
    Real constraint_tolerance = 1e-6;   // Σ max(0, -c_j) at convergence

    // Line search
    Real line_search_alpha = 1e-4;      // Armijo condition parameter
    Real line_search_beta = 0.5;        // Backtracking factor
    Index max_line_search_iters = 20;

    Real fd_epsilon = 1e-7;             // Finite-difference step

    bool verbose = false;
    ConvergenceCallback callback = nullptr;
};

/**
 * @brief Problem definition for SQPSolver
 *
 * gradient and constraint_jacobian may be left empty, in which case
 * forward differences are used. Bounds default to unbounded when empty.
 */
struct NonlinearProblem {
    Index n_vars = 0;
    ObjectiveFunc objective;
    GradientFunc gradient;

    Index n_constraints = 0;
    ConstraintFunc constraints;
    ConstraintJacobianFunc constraint_jacobian;

    Vector lower;
    Vector upper;

    /// Throws InvalidParameter on missing callbacks or bad bounds
    void validate() const;
};

/**
 * @brief SQP solver with damped BFGS and L1 merit line search
 */
class SQPSolver {
public:
    SQPSolver() = default;
    explicit SQPSolver(const SQPConfig& config);

    /**
     * @brief Minimize the problem starting from x
     *
     * @param problem Objective, constraints and bounds
     * @param x Initial guess (projected onto the bounds), updated to the
     *          solution or, without convergence, the best candidate seen
     * @return Solve result; final_residual is the constraint violation
     */
    SolveResult solve(const NonlinearProblem& problem, Vector& x);

    // Configuration access
    SQPConfig& config() { return config_; }
    const SQPConfig& config() const { return config_; }

    // Statistics from last solve
    OptimizationStatus status() const { return last_status_; }
    Index iterations() const { return last_iterations_; }
    Real objective() const { return last_objective_; }
    Real constraint_violation() const { return last_violation_; }
    const Vector& multipliers() const { return multipliers_; }
    const std::vector<Real>& step_history() const { return step_history_; }

private:
    SQPConfig config_;
    LeastDistanceSolver qp_;

    // State
    OptimizationStatus last_status_ = OptimizationStatus::SolverError;
    Index last_iterations_ = 0;
    Real last_objective_ = 0.0;
    Real last_violation_ = 0.0;
    Vector multipliers_;
    std::vector<Real> step_history_;

    // Derivatives
    void compute_gradient(const NonlinearProblem& problem, const Vector& x,
                          Real f, Vector& grad) const;
    void compute_jacobian(const NonlinearProblem& problem, const Vector& x,
                          const Vector& c, Matrix& jacobian) const;

    // QP subproblem with relaxation of incompatible constraints
    QPResult solve_subproblem(const NonlinearProblem& problem,
                              const Vector& x, const Matrix& B,
                              const Vector& grad, const Vector& c,
                              const Matrix& jacobian, bool& relaxed);

    // Line search on the L1 merit function
    Real line_search(const NonlinearProblem& problem, const Vector& x,
                     const Vector& direction, Real merit0, Real slope,
                     Real mu, Vector& x_new, Real& f_new, Vector& c_new) const;

    // Evaluation helpers
    void evaluate_constraints(const NonlinearProblem& problem,
                              const Vector& x, Vector& c) const;
    static Real violation(const Vector& c);
    void project(const NonlinearProblem& problem, Vector& x) const;

    // Damped BFGS update of B
    static void update_hessian(Matrix& B, const Vector& s, Vector y);
};

} // namespace aqopt
