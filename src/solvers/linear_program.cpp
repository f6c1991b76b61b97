/**
 * @file linear_program.cpp
 * @brief lp_solve backend for LinearProgram
 */

#include "aqopt/solvers/linear_program.hpp"
#include "aqopt/core/errors.hpp"
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

// lp_solve pollutes the macro namespace (TRUE, LE, NORMAL, ...); keep it last
#include <lp_lib.h>

namespace aqopt {

namespace {

struct LprecDeleter {
    void operator()(lprec* lp) const { if (lp) delete_lp(lp); }
};

using LprecPtr = std::unique_ptr<lprec, LprecDeleter>;

LPStatus map_status(int code) {
    switch (code) {
        case OPTIMAL:    return LPStatus::Optimal;
        case PRESOLVED:  return LPStatus::Optimal;
        case SUBOPTIMAL: return LPStatus::Suboptimal;
        case INFEASIBLE: return LPStatus::Infeasible;
        case UNBOUNDED:  return LPStatus::Unbounded;
        case DEGENERATE: return LPStatus::Degenerate;
        case NUMFAILURE: return LPStatus::NumericalFailure;
        case TIMEOUT:    return LPStatus::Timeout;
        case NOMEMORY:   return LPStatus::OutOfMemory;
        default:         return LPStatus::Error;
    }
}

REAL to_lp_bound(lprec* lp, Real v) {
    if (std::isinf(v)) {
        return v > 0 ? get_infinite(lp) : -get_infinite(lp);
    }
    return static_cast<REAL>(v);
}

} // namespace

LinearProgram::LinearProgram(Index n_vars)
    : n_vars_(n_vars) {
    if (n_vars < 1) {
        throw InvalidParameter("Linear program needs at least one variable");
    }
    c_ = Vector::Zero(n_vars);
    A_.resize(0, n_vars);
    b_.resize(0);
    lower_ = Vector::Zero(n_vars);
    upper_ = Vector::Constant(n_vars, std::numeric_limits<Real>::infinity());
}

void LinearProgram::set_objective(const Vector& c, bool maximize) {
    if (c.size() != n_vars_) {
        throw InvalidParameter("Objective size does not match variable count");
    }
    c_ = c;
    maximize_ = maximize;
}

void LinearProgram::add_constraints(const Matrix& A, const Vector& b) {
    if (A.cols() != n_vars_ || A.rows() != b.size()) {
        throw InvalidParameter("Constraint block dimensions are inconsistent");
    }
    Matrix A_new(A_.rows() + A.rows(), n_vars_);
    A_new << A_, A;
    Vector b_new(b_.size() + b.size());
    b_new << b_, b;
    A_ = std::move(A_new);
    b_ = std::move(b_new);
}

void LinearProgram::set_bounds(const Vector& lower, const Vector& upper) {
    if (lower.size() != n_vars_ || upper.size() != n_vars_) {
        throw InvalidParameter("Bound vectors do not match variable count");
    }
    for (Index i = 0; i < n_vars_; ++i) {
        if (lower(i) > upper(i)) {
            throw InvalidParameter("Lower bound exceeds upper bound for variable " +
                                   std::to_string(i));
        }
    }
    lower_ = lower;
    upper_ = upper;
}

LPSolution LinearProgram::solve(const LPConfig& config) const {
    LPSolution result;

    LprecPtr lp(make_lp(0, static_cast<int>(n_vars_)));
    if (!lp) {
        result.status = LPStatus::OutOfMemory;
        result.message = "lp_solve could not allocate the model";
        return result;
    }

    set_verbose(lp.get(), config.verbose ? NORMAL : NEUTRAL);
    if (config.timeout_seconds > 0) {
        set_timeout(lp.get(), config.timeout_seconds);
    }

    // lp_solve columns are 1-based
    std::vector<int> colno(n_vars_);
    std::vector<REAL> row(n_vars_);
    for (Index i = 0; i < n_vars_; ++i) {
        colno[i] = static_cast<int>(i + 1);
    }

    set_add_rowmode(lp.get(), TRUE);

    for (Index i = 0; i < n_vars_; ++i) row[i] = c_(i);
    if (!set_obj_fnex(lp.get(), static_cast<int>(n_vars_), row.data(), colno.data())) {
        result.message = "lp_solve rejected the objective function";
        return result;
    }

    for (Index j = 0; j < A_.rows(); ++j) {
        for (Index i = 0; i < n_vars_; ++i) row[i] = A_(j, i);
        if (!add_constraintex(lp.get(), static_cast<int>(n_vars_), row.data(),
                              colno.data(), LE, b_(j))) {
            result.message = "lp_solve rejected constraint row " + std::to_string(j);
            return result;
        }
    }

    set_add_rowmode(lp.get(), FALSE);

    for (Index i = 0; i < n_vars_; ++i) {
        ::set_bounds(lp.get(), static_cast<int>(i + 1),
                     to_lp_bound(lp.get(), lower_(i)),
                     to_lp_bound(lp.get(), upper_(i)));
    }

    if (maximize_) {
        set_maxim(lp.get());
    } else {
        set_minim(lp.get());
    }

    // Global lp_solve entry points are hidden by the members of the same name
    int code = ::solve(lp.get());
    result.status = map_status(code);
    result.iterations = static_cast<Index>(get_total_iter(lp.get()));

    if (result.status == LPStatus::Optimal || result.status == LPStatus::Suboptimal) {
        std::vector<REAL> vars(n_vars_);
        get_variables(lp.get(), vars.data());
        result.x.resize(n_vars_);
        for (Index i = 0; i < n_vars_; ++i) result.x(i) = vars[i];
        result.objective = get_objective(lp.get());
    }

    result.message = "lp_solve: " + to_string(result.status) +
                     " after " + std::to_string(result.iterations) + " iterations";
    return result;
}

std::string to_string(LPStatus status) {
    switch (status) {
        case LPStatus::Optimal: return "optimal";
        case LPStatus::Suboptimal: return "suboptimal";
        case LPStatus::Infeasible: return "infeasible";
        case LPStatus::Unbounded: return "unbounded";
        case LPStatus::Degenerate: return "degenerate";
        case LPStatus::NumericalFailure: return "numerical failure";
        case LPStatus::Timeout: return "timeout";
        case LPStatus::OutOfMemory: return "out of memory";
        case LPStatus::Error: return "error";
    }
    return "unknown";
}

} // namespace aqopt
