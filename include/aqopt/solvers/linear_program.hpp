/**
 * @file linear_program.hpp
 * @brief Dense linear programs solved with lp_solve
 *
 * Solves
 *
 *   max (or min) cᵀx   s.t.   A x <= b,   lower <= x <= upper
 *
 * The lp_solve model is built and destroyed inside solve(), so a
 * LinearProgram is a plain value and can be solved repeatedly.
 */

#pragma once

#include "../core/types.hpp"
#include <string>

namespace aqopt {

/**
 * @brief lp_solve return codes relevant to callers
 */
enum class LPStatus {
    Optimal,
    Suboptimal,         ///< Stopped early (break at first / break at value)
    Infeasible,
    Unbounded,
    Degenerate,
    NumericalFailure,
    Timeout,
    OutOfMemory,
    Error,
};

struct LPConfig {
    long timeout_seconds = 0;       ///< 0 = no limit
    bool verbose = false;           ///< lp_solve NORMAL instead of NEUTRAL output
};

struct LPSolution {
    LPStatus status = LPStatus::Error;
    Vector x;                       ///< Decision variables (empty unless feasible)
    Real objective = 0.0;
    Index iterations = 0;
    std::string message;

    bool success() const { return status == LPStatus::Optimal; }
};

class LinearProgram {
public:
    /// Program over n decision variables, default bounds 0 <= x < inf
    explicit LinearProgram(Index n_vars);

    Index n_vars() const { return n_vars_; }
    Index n_constraints() const { return A_.rows(); }

    /// Objective coefficients c; maximize if requested, else minimize
    void set_objective(const Vector& c, bool maximize);

    /// Append rows A x <= b
    void add_constraints(const Matrix& A, const Vector& b);

    /// Per-variable bounds; use +inf for an open upper bound
    void set_bounds(const Vector& lower, const Vector& upper);

    LPSolution solve(const LPConfig& config = LPConfig()) const;

private:
    Index n_vars_;
    Vector c_;
    bool maximize_ = false;
    Matrix A_;
    Vector b_;
    Vector lower_;
    Vector upper_;
};

/// Human-readable status name
std::string to_string(LPStatus status);

} // namespace aqopt
