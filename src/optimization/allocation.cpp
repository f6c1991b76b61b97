/**
 * @file allocation.cpp
 * @brief Linear (lp_solve) and nonlinear (SQP) pumping allocation
 */

#include "aqopt/optimization/allocation.hpp"
#include "aqopt/analysis/superposition.hpp"
#include "aqopt/physics/well_functions.hpp"
#include "aqopt/solvers/linear_program.hpp"
#include "aqopt/solvers/sqp.hpp"
#include "aqopt/core/config.hpp"
#include "aqopt/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace aqopt {

namespace {

Vector allowable_drawdowns(const std::vector<ConstraintPoint>& points, Real h0) {
    Vector b(static_cast<Index>(points.size()));
    for (Size j = 0; j < points.size(); ++j) {
        b(j) = points[j].allowable_drawdown(h0);
    }
    return b;
}

std::vector<ConstraintPoint> min_head_points(const std::vector<Vec2>& coords,
                                             const Vector& h_min) {
    if (static_cast<Index>(coords.size()) != h_min.size()) {
        throw InvalidParameter("Need one minimum head per constraint point");
    }
    std::vector<ConstraintPoint> points;
    points.reserve(coords.size());
    for (Size j = 0; j < coords.size(); ++j) {
        points.push_back(ConstraintPoint::from_min_head(
            coords[j].x(), coords[j].y(), h_min(j), "P" + std::to_string(j + 1)));
    }
    return points;
}

WellField field_from_locations(const std::vector<Vec2>& locations) {
    WellField field;
    for (const auto& p : locations) {
        field.add_well(PumpingWell(p.x(), p.y(), 0.0));
    }
    return field;
}

OptimizationStatus status_from_lp(LPStatus status) {
    switch (status) {
        case LPStatus::Optimal:    return OptimizationStatus::Optimal;
        case LPStatus::Infeasible: return OptimizationStatus::Infeasible;
        case LPStatus::Suboptimal:
        case LPStatus::Timeout:    return OptimizationStatus::NonConvergence;
        default:                   return OptimizationStatus::SolverError;
    }
}

} // namespace

// ============================================================================
// OptimizationResult
// ============================================================================

void OptimizationResult::print(std::ostream& os) const {
    os << "Allocation (" << config_io::to_string(method) << "): "
       << config_io::to_string(status)
       << (authoritative ? "" : " [non-authoritative]") << "\n";
    os << "  " << message << "\n";
    if (rates.size() == 0) return;

    os << std::fixed << std::setprecision(2);
    os << "  Total rate: " << total_rate << "\n";
    for (Index i = 0; i < rates.size(); ++i) {
        os << "  Q[" << i << "] = " << rates(i) << "\n";
    }
    for (Index j = 0; j < heads.size(); ++j) {
        os << "  point " << j << ": h = " << heads(j)
           << " (Theis " << theis_heads(j) << "), s = " << drawdowns(j) << "\n";
    }
    os << std::defaultfloat;
}

// ============================================================================
// AllocationOptimizer
// ============================================================================

AllocationOptimizer::AllocationOptimizer(const AllocationConfig& config)
    : config_(config) {}

void AllocationOptimizer::check_inputs(const WellField& field, const Vector& Q_max,
                                       const std::vector<ConstraintPoint>& points,
                                       const AquiferParameters& params,
                                       Real h0, Real t) const {
    params.validate();
    if (field.empty()) {
        throw InvalidParameter("Allocation requires at least one well");
    }
    if (points.empty()) {
        throw InvalidParameter("Allocation requires at least one constraint point");
    }
    if (Q_max.size() != field.size()) {
        throw InvalidParameter("Q_max has " + std::to_string(Q_max.size()) +
                               " entries for " + std::to_string(field.size()) + " wells");
    }
    for (Index i = 0; i < Q_max.size(); ++i) {
        if (!std::isfinite(Q_max(i)) || Q_max(i) < 0.0) {
            throw InvalidParameter("Q_max must be finite and non-negative for well " +
                                   field.well(i).name());
        }
    }
    if (!std::isfinite(h0)) {
        throw InvalidParameter("Initial head must be finite");
    }
    if (!(t > 0.0) || !std::isfinite(t)) {
        throw InvalidParameter("Time must be positive, got t = " + std::to_string(t));
    }
    for (const auto& p : points) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.limit)) {
            throw InvalidParameter("Constraint point " + p.name + " is not finite");
        }
    }
}

OptimizationResult AllocationOptimizer::optimize(AllocationMethod method,
                                                 const WellField& field,
                                                 const Vector& Q_max,
                                                 const std::vector<ConstraintPoint>& points,
                                                 const AquiferParameters& params,
                                                 Real h0, Real t) const {
    check_inputs(field, Q_max, points, params, h0, t);

    OptimizationResult result = method == AllocationMethod::Linear
        ? solve_linear(field, Q_max, points, params, h0, t)
        : solve_nonlinear(field, Q_max, points, params, h0, t);

    result.method = method;
    result.max_u = max_theis_u(field, points, params, t);
    if (result.rates.size() > 0) {
        result.total_rate = result.rates.sum();
        evaluate_heads(result, field, points, params, h0, t);
    }
    return result;
}

OptimizationResult AllocationOptimizer::optimize(AllocationMethod method,
                                                 const std::vector<Vec2>& well_locations,
                                                 Real T, Real S, Real h0,
                                                 const Vector& h_min,
                                                 const Vector& Q_max,
                                                 const std::vector<Vec2>& constraint_points,
                                                 Real t) const {
    AquiferParameters params(T, S);
    params.validate();
    if (well_locations.empty()) {
        throw InvalidParameter("Allocation requires at least one well");
    }
    return optimize(method, field_from_locations(well_locations), Q_max,
                    min_head_points(constraint_points, h_min), params, h0, t);
}

OptimizationResult AllocationOptimizer::optimize(AllocationMethod method,
                                                 const std::vector<Vec2>& well_locations,
                                                 Real T, Real S, Real h0, Real h_min,
                                                 const Vector& Q_max,
                                                 const std::vector<Vec2>& constraint_points,
                                                 Real t) const {
    Vector h = Vector::Constant(static_cast<Index>(constraint_points.size()), h_min);
    return optimize(method, well_locations, T, S, h0, h, Q_max, constraint_points, t);
}

OptimizationResult AllocationOptimizer::solve_linear(const WellField& field,
                                                     const Vector& Q_max,
                                                     const std::vector<ConstraintPoint>& points,
                                                     const AquiferParameters& params,
                                                     Real h0, Real t) const {
    OptimizationResult result;
    const Index n = field.size();

    SuperpositionEngine engine(params, DrawdownMethod::CooperJacob);
    Matrix A = engine.response_matrix(field, points, t);
    Vector b = allowable_drawdowns(points, h0);

    LinearProgram lp(n);
    lp.set_objective(Vector::Ones(n), true);
    lp.add_constraints(A, b);
    lp.set_bounds(Vector::Zero(n), Q_max);

    LPConfig lp_config;
    lp_config.timeout_seconds = config_.lp_timeout;
    lp_config.verbose = config_.verbose;
    LPSolution solution = lp.solve(lp_config);

    result.status = status_from_lp(solution.status);
    result.success = result.status == OptimizationStatus::Optimal;
    result.authoritative = result.success;
    result.iterations = solution.iterations;

    if (result.status == OptimizationStatus::Optimal ||
        (result.status == OptimizationStatus::NonConvergence && solution.x.size() == n)) {
        result.rates = solution.x.cwiseMax(0.0).cwiseMin(Q_max);
    }

    switch (result.status) {
        case OptimizationStatus::Optimal:
            result.message = "Converged in " + std::to_string(solution.iterations) +
                             " iterations (linear program)";
            break;
        case OptimizationStatus::Infeasible:
            result.message = "Infeasible: minimum heads cannot be met within the rate bounds (" +
                             solution.message + ")";
            break;
        case OptimizationStatus::NonConvergence:
            result.message = "Linear program stopped early (" + solution.message + ")";
            break;
        case OptimizationStatus::SolverError:
            result.message = "Linear program failed (" + solution.message + ")";
            break;
    }

    result.max_u = max_theis_u(field, points, params, t);
    if (result.max_u > constants::COOPER_JACOB_U_LIMIT && config_.warn_cooper_jacob) {
        std::ostringstream note;
        note << "Cooper-Jacob approximation used outside u < "
             << constants::COOPER_JACOB_U_LIMIT << " (max u = " << result.max_u << ")";
        std::cerr << "aqopt warning: " << note.str() << "\n";
        result.message += "; " + note.str();
    }
    return result;
}

OptimizationResult AllocationOptimizer::solve_nonlinear(const WellField& field,
                                                        const Vector& Q_max,
                                                        const std::vector<ConstraintPoint>& points,
                                                        const AquiferParameters& params,
                                                        Real h0, Real t) const {
    OptimizationResult result;
    const Index n = field.size();
    const Index m = static_cast<Index>(points.size());

    SuperpositionEngine engine(params, DrawdownMethod::Theis);
    std::vector<WellSource> sources = SuperpositionEngine::sources(field);
    Vector px(m), py(m);
    for (Index j = 0; j < m; ++j) {
        px(j) = points[j].x;
        py(j) = points[j].y;
    }

    // Decision variables x = Q / Q_max in [0, 1]; a zero bound pins x at 0
    Vector scale(n), upper(n);
    for (Index i = 0; i < n; ++i) {
        scale(i) = Q_max(i) > 0.0 ? Q_max(i) : 1.0;
        upper(i) = Q_max(i) > 0.0 ? 1.0 : 0.0;
    }
    const Real total_scale = std::max(Q_max.sum(), 1.0);

    // Drawdown is non-negative and grows with every Q_i, so the region is
    // empty exactly when Q = 0 already violates a constraint
    Vector b = allowable_drawdowns(points, h0);
    for (Index j = 0; j < m; ++j) {
        if (b(j) < 0.0) {
            result.status = OptimizationStatus::Infeasible;
            const std::string label = points[j].name.empty()
                ? "point " + std::to_string(j) : points[j].name;
            result.message = "Infeasible: undisturbed head at " + label +
                             " is already below its minimum";
            return result;
        }
    }
    Vector c_scale = b.cwiseAbs().cwiseMax(1.0);

    // Theis drawdown is linear in Q, so the unit response is the exact Jacobian
    Matrix unit = engine.response_matrix(field, points, t);

    NonlinearProblem problem;
    problem.n_vars = n;
    problem.objective = [&](const Vector& x) {
        return -scale.cwiseProduct(x).sum() / total_scale;
    };
    problem.gradient = [&](const Vector&, Vector& grad) {
        grad = -scale / total_scale;
    };
    problem.n_constraints = m;
    problem.constraints = [&](const Vector& x, Vector& c) {
        for (Index i = 0; i < n; ++i) {
            sources[i].Q = scale(i) * x(i);
        }
        Vector s = engine.drawdown(sources, px, py, t);
        c = (b - s).cwiseQuotient(c_scale);
    };
    Vector c_inv = c_scale.cwiseInverse();
    problem.constraint_jacobian = [&](const Vector&, Matrix& jac) {
        jac = c_inv.asDiagonal() * unit * scale.asDiagonal();
        jac *= -1.0;
    };
    problem.lower = Vector::Zero(n);
    problem.upper = upper;

    SQPConfig sqp_config;
    sqp_config.max_iterations = config_.max_iterations;
    sqp_config.tolerance = config_.tolerance;
    sqp_config.constraint_tolerance = config_.constraint_tolerance;
    sqp_config.verbose = config_.verbose;

    SQPSolver solver(sqp_config);
    Vector x = 0.5 * upper;
    SolveResult solve = solver.solve(problem, x);

    result.status = solver.status();
    result.success = result.status == OptimizationStatus::Optimal;
    result.authoritative = result.success;
    result.iterations = solve.iterations;

    switch (result.status) {
        case OptimizationStatus::Optimal:
            result.rates = scale.cwiseProduct(x).cwiseMax(0.0).cwiseMin(Q_max);
            result.message = "Converged in " + std::to_string(solve.iterations) +
                             " iterations (SQP, Theis)";
            break;
        case OptimizationStatus::NonConvergence:
            result.rates = scale.cwiseProduct(x).cwiseMax(0.0).cwiseMin(Q_max);
            result.message = "Did not converge: " + solve.message +
                             " (constraint violation " + std::to_string(solve.final_residual) + ")";
            break;
        case OptimizationStatus::Infeasible:
            result.message = "Infeasible: minimum heads cannot be met within the rate bounds (" +
                             solve.message + ")";
            break;
        case OptimizationStatus::SolverError:
            result.message = "SQP failed: " + solve.message;
            break;
    }
    return result;
}

void AllocationOptimizer::evaluate_heads(OptimizationResult& result, const WellField& field,
                                         const std::vector<ConstraintPoint>& points,
                                         const AquiferParameters& params,
                                         Real h0, Real t) const {
    WellField pumped = field;
    pumped.set_rates(result.rates);

    const Index m = static_cast<Index>(points.size());
    Vector px(m), py(m);
    for (Index j = 0; j < m; ++j) {
        px(j) = points[j].x;
        py(j) = points[j].y;
    }

    DrawdownMethod kernel = result.method == AllocationMethod::Linear
        ? DrawdownMethod::CooperJacob
        : DrawdownMethod::Theis;
    result.drawdowns = pumped.compute_total_drawdown(px, py, t, params, kernel);
    result.heads = Vector::Constant(m, h0) - result.drawdowns;

    Vector s_theis = kernel == DrawdownMethod::Theis
        ? result.drawdowns
        : pumped.compute_total_drawdown(px, py, t, params, DrawdownMethod::Theis);
    result.theis_heads = Vector::Constant(m, h0) - s_theis;
}

ReferenceCase AllocationOptimizer::unconstrained(const WellField& field,
                                                 const Vector& Q_max,
                                                 const std::vector<ConstraintPoint>& points,
                                                 const AquiferParameters& params,
                                                 Real h0, Real t,
                                                 DrawdownMethod method) const {
    check_inputs(field, Q_max, points, params, h0, t);

    ReferenceCase ref;
    ref.rates = Q_max;
    ref.total_rate = Q_max.sum();

    WellField pumped = field;
    pumped.set_rates(Q_max);

    const Index m = static_cast<Index>(points.size());
    Vector px(m), py(m);
    for (Index j = 0; j < m; ++j) {
        px(j) = points[j].x;
        py(j) = points[j].y;
    }
    ref.heads = Vector::Constant(m, h0) - pumped.compute_total_drawdown(px, py, t, params, method);

    ref.margins.resize(m);
    for (Index j = 0; j < m; ++j) {
        ref.margins(j) = ref.heads(j) - points[j].required_head(h0);
        if (ref.margins(j) < 0.0) ++ref.n_violated;
    }
    return ref;
}

Real max_theis_u(const WellField& field, const std::vector<ConstraintPoint>& points,
                 const AquiferParameters& params, Real t) {
    Real u_max = 0.0;
    for (const auto& w : field.wells()) {
        for (const auto& p : points) {
            u_max = std::max(u_max, theis_u(w.distance_to(p.x, p.y), t, params.T, params.S));
        }
    }
    return u_max;
}

} // namespace aqopt
