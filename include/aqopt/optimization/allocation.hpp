/**
 * @file allocation.hpp
 * @brief Optimal pumping-rate allocation under minimum-head constraints
 *
 * Finds Q ∈ ℝⁿ maximizing Σ Q_i subject to
 *
 *   0 <= Q_i <= Q_max_i
 *   h0 - s_total(p_j, t) >= h_min_j     for every constraint point j
 *
 * Two formulations:
 * - Linear:    Cooper-Jacob drawdown is linear in Q, so the constraint
 *              set is A·Q <= h0 - h_min with A(j,i) = ln(2.25Tt/(r²S))/(4πT).
 *              Solved as one linear program (lp_solve).
 * - Nonlinear: the Theis kernel is evaluated inside the constraint
 *              function and the program is solved by SQP from Q_max/2.
 *
 * Invalid input throws InvalidParameter. Infeasibility and
 * non-convergence are reported in OptimizationResult.
 */

#pragma once

#include "../core/types.hpp"
#include "../physics/aquifer.hpp"
#include "../wells/pumping_well.hpp"
#include "../wells/well_field.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace aqopt {

/**
 * @brief Solver budget and diagnostics for AllocationOptimizer
 */
struct AllocationConfig {
    Index max_iterations = 100;         ///< SQP iterations
    Real tolerance = 1e-6;              ///< SQP step tolerance (scaled rates)
    Real constraint_tolerance = 1e-6;   ///< Scaled constraint violation
    long lp_timeout = 0;                ///< lp_solve wall clock [s], 0 = none
    bool verbose = false;
    bool warn_cooper_jacob = true;      ///< Warn when the linear method sees u > 0.01
};

/**
 * @brief Outcome of one allocation run
 *
 * rates, drawdowns and heads are empty when status is Infeasible or
 * SolverError. With NonConvergence they hold the best candidate found,
 * and authoritative is false.
 */
struct OptimizationResult {
    AllocationMethod method = AllocationMethod::Linear;
    OptimizationStatus status = OptimizationStatus::SolverError;
    bool success = false;
    bool authoritative = false;

    Vector rates;                   ///< Q* per well
    Real total_rate = 0.0;          ///< Σ Q*, the objective value
    Vector drawdowns;               ///< Per constraint point, requested kernel
    Vector heads;                   ///< h0 - drawdowns
    Vector theis_heads;             ///< Per constraint point, Theis verification

    Index iterations = 0;
    Real max_u = 0.0;               ///< Largest r²S/(4Tt) over well/point pairs
    std::string message;

    void print(std::ostream& os) const;
};

/**
 * @brief Every well at Q_max, for comparison with an optimized allocation
 */
struct ReferenceCase {
    Vector rates;
    Real total_rate = 0.0;
    Vector heads;
    Vector margins;                 ///< heads - required heads, < 0 means violated
    Index n_violated = 0;
};

class AllocationOptimizer {
public:
    AllocationOptimizer() = default;
    explicit AllocationOptimizer(const AllocationConfig& config);

    AllocationConfig& config() { return config_; }
    const AllocationConfig& config() const { return config_; }

    /**
     * @brief Optimize rates for a well field
     *
     * The field's current rates are ignored; it supplies geometry only.
     *
     * @param method Linear (Cooper-Jacob LP) or Nonlinear (Theis SQP)
     * @param field Well locations and radii, at least one well
     * @param Q_max Upper rate bound per well, >= 0
     * @param points Constraint points, at least one
     * @param params Aquifer T and S
     * @param h0 Undisturbed head
     * @param t Time at which the constraints apply, > 0
     */
    OptimizationResult optimize(AllocationMethod method,
                                const WellField& field,
                                const Vector& Q_max,
                                const std::vector<ConstraintPoint>& points,
                                const AquiferParameters& params,
                                Real h0, Real t) const;

    /**
     * @brief Coordinate form with one minimum head per point
     */
    OptimizationResult optimize(AllocationMethod method,
                                const std::vector<Vec2>& well_locations,
                                Real T, Real S, Real h0,
                                const Vector& h_min,
                                const Vector& Q_max,
                                const std::vector<Vec2>& constraint_points,
                                Real t) const;

    /**
     * @brief Coordinate form with a common minimum head
     */
    OptimizationResult optimize(AllocationMethod method,
                                const std::vector<Vec2>& well_locations,
                                Real T, Real S, Real h0, Real h_min,
                                const Vector& Q_max,
                                const std::vector<Vec2>& constraint_points,
                                Real t) const;

    /**
     * @brief Heads at the constraint points with every well at Q_max
     */
    ReferenceCase unconstrained(const WellField& field,
                                const Vector& Q_max,
                                const std::vector<ConstraintPoint>& points,
                                const AquiferParameters& params,
                                Real h0, Real t,
                                DrawdownMethod method = DrawdownMethod::Theis) const;

private:
    AllocationConfig config_;

    void check_inputs(const WellField& field, const Vector& Q_max,
                      const std::vector<ConstraintPoint>& points,
                      const AquiferParameters& params, Real h0, Real t) const;

    OptimizationResult solve_linear(const WellField& field, const Vector& Q_max,
                                    const std::vector<ConstraintPoint>& points,
                                    const AquiferParameters& params,
                                    Real h0, Real t) const;

    OptimizationResult solve_nonlinear(const WellField& field, const Vector& Q_max,
                                       const std::vector<ConstraintPoint>& points,
                                       const AquiferParameters& params,
                                       Real h0, Real t) const;

    // Fill drawdowns, heads and theis_heads from result.rates
    void evaluate_heads(OptimizationResult& result, const WellField& field,
                        const std::vector<ConstraintPoint>& points,
                        const AquiferParameters& params, Real h0, Real t) const;
};

/// Largest Theis argument u over all well/point pairs (distance floored at r_well)
Real max_theis_u(const WellField& field, const std::vector<ConstraintPoint>& points,
                 const AquiferParameters& params, Real t);

} // namespace aqopt
