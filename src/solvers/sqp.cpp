/**
 * @file sqp.cpp
 * @brief SQP solver implementation
 */

#include "aqopt/solvers/sqp.hpp"
#include "aqopt/core/errors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>

namespace aqopt {

namespace {

constexpr Real INF = std::numeric_limits<Real>::infinity();

Real lower_bound(const NonlinearProblem& p, Index i) {
    return p.lower.size() > 0 ? p.lower(i) : -INF;
}

Real upper_bound(const NonlinearProblem& p, Index i) {
    return p.upper.size() > 0 ? p.upper(i) : INF;
}

double elapsed_ms(std::chrono::high_resolution_clock::time_point start) {
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

} // namespace

// ============================================================================
// NonlinearProblem
// ============================================================================

void NonlinearProblem::validate() const {
    if (n_vars < 1) {
        throw InvalidParameter("Nonlinear problem needs at least one variable");
    }
    if (!objective) {
        throw InvalidParameter("Nonlinear problem has no objective");
    }
    if (n_constraints < 0) {
        throw InvalidParameter("Constraint count must be non-negative");
    }
    if (n_constraints > 0 && !constraints) {
        throw InvalidParameter("Constraint count given without a constraint function");
    }
    if ((lower.size() != 0 && lower.size() != n_vars) ||
        (upper.size() != 0 && upper.size() != n_vars)) {
        throw InvalidParameter("Bound vectors do not match variable count");
    }
    if (lower.size() > 0 && upper.size() > 0) {
        for (Index i = 0; i < n_vars; ++i) {
            if (lower(i) > upper(i)) {
                throw InvalidParameter("Lower bound exceeds upper bound for variable " +
                                       std::to_string(i));
            }
        }
    }
}

// ============================================================================
// SQPSolver
// ============================================================================

SQPSolver::SQPSolver(const SQPConfig& config)
    : config_(config) {}

SolveResult SQPSolver::solve(const NonlinearProblem& problem, Vector& x) {
    auto start_time = std::chrono::high_resolution_clock::now();

    problem.validate();
    if (x.size() != problem.n_vars) {
        throw InvalidParameter("Initial guess does not match variable count");
    }

    const Index n = problem.n_vars;
    const Index m = problem.n_constraints;

    step_history_.clear();
    multipliers_ = Vector::Zero(m);
    last_iterations_ = 0;

    auto finish = [&](OptimizationStatus status, bool converged, Index iters,
                      Real f, Real viol, const std::string& message) {
        last_status_ = status;
        last_iterations_ = iters;
        last_objective_ = f;
        last_violation_ = viol;
        return SolveResult{converged, iters, viol, elapsed_ms(start_time), message};
    };

    project(problem, x);

    Real f = problem.objective(x);
    Vector c;
    evaluate_constraints(problem, x, c);
    if (!std::isfinite(f) || !c.allFinite()) {
        return finish(OptimizationStatus::SolverError, false, 0, f, INF,
                      "Objective or constraints not finite at the initial point");
    }

    Vector grad(n);
    Matrix jac(m, n);
    compute_gradient(problem, x, f, grad);
    compute_jacobian(problem, x, c, jac);

    Matrix B = Matrix::Identity(n, n);
    Real mu = 0.0;
    Real viol = violation(c);

    // Best candidate: feasible with lowest f, otherwise least violation
    Vector best_x = x;
    Real best_f = f;
    Real best_viol = viol;
    auto consider = [&](const Vector& xc, Real fc, Real vc) {
        bool feasible = vc <= config_.constraint_tolerance;
        bool best_feasible = best_viol <= config_.constraint_tolerance;
        if ((feasible && (!best_feasible || fc < best_f)) ||
            (!feasible && !best_feasible && vc < best_viol)) {
            best_x = xc;
            best_f = fc;
            best_viol = vc;
        }
    };

    if (config_.verbose) {
        std::cerr << "SQP iter 0: f = " << f << ", violation = " << viol << "\n";
    }

    for (Index iter = 0; iter < config_.max_iterations; ++iter) {
        bool relaxed = false;
        QPResult qp = solve_subproblem(problem, x, B, grad, c, jac, relaxed);
        if (!qp.feasible) {
            x = best_x;
            return finish(OptimizationStatus::SolverError, false, iter + 1, best_f, best_viol,
                          "QP subproblem failed: " + qp.message);
        }

        const Vector& d = qp.d;
        Real step_norm = d.lpNorm<Eigen::Infinity>();
        step_history_.push_back(step_norm);
        if (m > 0) {
            multipliers_ = qp.multipliers.head(m);
        }

        // Stationary point of the (possibly relaxed) subproblem
        if (step_norm <= config_.tolerance) {
            if (viol <= config_.constraint_tolerance) {
                return finish(OptimizationStatus::Optimal, true, iter + 1, f, viol,
                              "Converged in " + std::to_string(iter + 1) + " iterations");
            }
            if (relaxed) {
                return finish(OptimizationStatus::Infeasible, false, iter + 1, f, viol,
                              "Constraints cannot be satisfied within the bounds");
            }
        }

        // Penalty parameter must dominate the multipliers
        if (m > 0) {
            Real lambda_max = multipliers_.cwiseAbs().maxCoeff();
            mu = std::max(mu, 1.5 * lambda_max + 1e-3);
        }

        Vector c_lin = c + jac * d;
        Real slope = grad.dot(d) + mu * (violation(c_lin) - viol);
        if (slope >= 0.0) {
            slope = -std::max(d.squaredNorm(), constants::EPSILON);
        }

        Real merit0 = f + mu * viol;
        Vector x_new(n);
        Real f_new = f;
        Vector c_new;
        Real alpha = line_search(problem, x, d, merit0, slope, mu, x_new, f_new, c_new);

        if (!std::isfinite(f_new) || !c_new.allFinite()) {
            x = best_x;
            return finish(OptimizationStatus::SolverError, false, iter + 1, best_f, best_viol,
                          "Objective or constraints not finite along the search direction");
        }

        Vector grad_new(n);
        Matrix jac_new(m, n);
        compute_gradient(problem, x_new, f_new, grad_new);
        compute_jacobian(problem, x_new, c_new, jac_new);

        // Lagrangian gradients ∇f - Jᵀλ
        Vector s = x_new - x;
        Vector y = (grad_new - jac_new.transpose() * multipliers_) -
                   (grad - jac.transpose() * multipliers_);
        update_hessian(B, s, y);

        x = x_new;
        f = f_new;
        c = c_new;
        grad = grad_new;
        jac = jac_new;
        viol = violation(c);
        consider(x, f, viol);

        if (config_.verbose) {
            std::cerr << "SQP iter " << (iter + 1) << ": f = " << f
                      << ", violation = " << viol
                      << ", |d| = " << step_norm
                      << " (alpha=" << alpha << ")\n";
        }

        if (config_.callback) {
            if (!config_.callback(iter + 1, step_norm)) {
                x = best_x;
                return finish(OptimizationStatus::NonConvergence, false, iter + 1,
                              best_f, best_viol, "Cancelled by callback");
            }
        }
    }

    x = best_x;
    return finish(OptimizationStatus::NonConvergence, false, config_.max_iterations,
                  best_f, best_viol,
                  "Maximum iterations reached (" + std::to_string(config_.max_iterations) +
                  "); returning best candidate");
}

QPResult SQPSolver::solve_subproblem(const NonlinearProblem& problem,
                                     const Vector& x, const Matrix& B,
                                     const Vector& grad, const Vector& c,
                                     const Matrix& jacobian, bool& relaxed) {
    const Index n = problem.n_vars;
    const Index m = problem.n_constraints;

    // Rows: linearized constraints, then finite lower and upper bounds
    Index n_rows = m;
    for (Index i = 0; i < n; ++i) {
        if (std::isfinite(lower_bound(problem, i))) ++n_rows;
        if (std::isfinite(upper_bound(problem, i))) ++n_rows;
    }

    Matrix C = Matrix::Zero(n_rows, n);
    Vector e(n_rows);
    C.topRows(m) = jacobian;
    Index row = m;
    for (Index i = 0; i < n; ++i) {
        Real lo = lower_bound(problem, i);
        Real hi = upper_bound(problem, i);
        if (std::isfinite(lo)) {
            C(row, i) = 1.0;
            e(row++) = lo - x(i);
        }
        if (std::isfinite(hi)) {
            C(row, i) = -1.0;
            e(row++) = x(i) - hi;
        }
    }

    // Shrink the demanded correction of violated constraints until the
    // subproblem is compatible; at zero the step d = 0 is always feasible
    static const Real relaxation[] = {1.0, 0.5, 0.25, 0.1, 0.0};
    relaxed = false;
    QPResult qp;
    for (Real theta : relaxation) {
        for (Index j = 0; j < m; ++j) {
            e(j) = c(j) < 0.0 ? -theta * c(j) : -c(j);
        }
        qp = qp_.solve(B, grad, C, e);
        if (qp.feasible) return qp;
        relaxed = true;
        if (config_.verbose) {
            std::cerr << "SQP: relaxing linearized constraints (theta=" << theta << ")\n";
        }
    }
    return qp;
}

Real SQPSolver::line_search(const NonlinearProblem& problem, const Vector& x,
                            const Vector& direction, Real merit0, Real slope,
                            Real mu, Vector& x_new, Real& f_new, Vector& c_new) const {
    Real alpha = 1.0;

    for (Index k = 0; k < config_.max_line_search_iters; ++k) {
        x_new = x + alpha * direction;
        project(problem, x_new);
        f_new = problem.objective(x_new);
        evaluate_constraints(problem, x_new, c_new);
        Real merit = f_new + mu * violation(c_new);

        // Armijo condition
        if (std::isfinite(merit) && merit <= merit0 + config_.line_search_alpha * alpha * slope) {
            return alpha;
        }

        if (k + 1 < config_.max_line_search_iters) {
            alpha *= config_.line_search_beta;
        }
    }

    return alpha;
}

void SQPSolver::compute_gradient(const NonlinearProblem& problem, const Vector& x,
                                 Real f, Vector& grad) const {
    if (problem.gradient) {
        problem.gradient(x, grad);
        return;
    }

    const Index n = x.size();
    grad.resize(n);
    Vector x_pert = x;
    for (Index j = 0; j < n; ++j) {
        Real eps = config_.fd_epsilon * std::max(std::abs(x(j)), 1.0);
        // Backward difference at an upper bound
        if (x(j) + eps > upper_bound(problem, j)) eps = -eps;
        x_pert(j) += eps;
        grad(j) = (problem.objective(x_pert) - f) / eps;
        x_pert(j) = x(j);
    }
}

void SQPSolver::compute_jacobian(const NonlinearProblem& problem, const Vector& x,
                                 const Vector& c, Matrix& jacobian) const {
    const Index n = x.size();
    const Index m = problem.n_constraints;
    if (m == 0) {
        jacobian.resize(0, n);
        return;
    }
    if (problem.constraint_jacobian) {
        problem.constraint_jacobian(x, jacobian);
        return;
    }

    jacobian.resize(m, n);
    Vector x_pert = x;
    Vector c_pert(m);
    for (Index j = 0; j < n; ++j) {
        Real eps = config_.fd_epsilon * std::max(std::abs(x(j)), 1.0);
        if (x(j) + eps > upper_bound(problem, j)) eps = -eps;
        x_pert(j) += eps;
        problem.constraints(x_pert, c_pert);
        x_pert(j) = x(j);
        jacobian.col(j) = (c_pert - c) / eps;
    }
}

void SQPSolver::evaluate_constraints(const NonlinearProblem& problem,
                                     const Vector& x, Vector& c) const {
    c.resize(problem.n_constraints);
    if (problem.n_constraints > 0) {
        problem.constraints(x, c);
    }
}

Real SQPSolver::violation(const Vector& c) {
    Real v = 0.0;
    for (Index j = 0; j < c.size(); ++j) {
        if (c(j) < 0.0) v -= c(j);
    }
    return v;
}

void SQPSolver::project(const NonlinearProblem& problem, Vector& x) const {
    for (Index i = 0; i < x.size(); ++i) {
        x(i) = std::clamp(x(i), lower_bound(problem, i), upper_bound(problem, i));
    }
}

void SQPSolver::update_hessian(Matrix& B, const Vector& s, Vector y) {
    Vector Bs = B * s;
    Real sBs = s.dot(Bs);
    if (sBs <= constants::EPSILON) return;

    // Powell damping keeps B positive definite
    Real sy = s.dot(y);
    if (sy < 0.2 * sBs) {
        Real theta = 0.8 * sBs / (sBs - sy);
        y = theta * y + (1.0 - theta) * Bs;
        sy = s.dot(y);
    }
    if (sy <= constants::EPSILON) return;

    B += (y * y.transpose()) / sy - (Bs * Bs.transpose()) / sBs;
}

} // namespace aqopt
