/**
 * @file siting.hpp
 * @brief Well siting by bounded random search
 *
 * Places n wells inside a rectangle so that a fixed total demand,
 * split among them, violates the minimum-head constraints as little
 * as possible:
 *
 *   violation = Σ_j max(0, h_min_j - h_j)
 *
 * Heads come from Cooper-Jacob superposition. Candidates are sampled
 * uniformly; the best one seen is kept and worse ones are never
 * accepted. The search always spends its full budget.
 *
 * The random engine is supplied by the caller. Candidates are drawn
 * serially in batches and only their evaluation runs in parallel, so
 * a given seed yields the same result for any thread count.
 */

#pragma once

#include "../core/types.hpp"
#include "../physics/aquifer.hpp"
#include "../wells/pumping_well.hpp"
#include <iosfwd>
#include <random>
#include <string>
#include <vector>

namespace aqopt {

/**
 * @brief Axis-aligned rectangle in which wells may be placed
 */
struct FeasibleRegion {
    Real x_min = 0.0;
    Real x_max = 0.0;
    Real y_min = 0.0;
    Real y_max = 0.0;

    FeasibleRegion() = default;
    FeasibleRegion(Real x0, Real x1, Real y0, Real y1)
        : x_min(x0), x_max(x1), y_min(y0), y_max(y1) {}

    /// Throws InvalidParameter unless finite with x_min < x_max, y_min < y_max
    void validate() const;

    bool contains(Real x, Real y) const {
        return x >= x_min && x <= x_max && y >= y_min && y <= y_max;
    }
};

struct SitingOptions {
    Index max_iterations = 1000;            ///< Candidates evaluated
    Index batch_size = 64;                  ///< Candidates drawn per parallel batch
    Real feasibility_tolerance = 1e-9;      ///< violation below this is feasible
    Real well_radius = constants::DEFAULT_WELL_RADIUS;
    Vector weights;                         ///< Demand split; empty = even
    bool verbose = false;
};

struct SitingResult {
    std::vector<Vec2> locations;    ///< Best well coordinates
    Vector rates;                   ///< Demand share per well
    Real violation = 0.0;           ///< Σ max(0, h_min - h) at the best candidate
    bool feasible = false;          ///< violation < feasibility_tolerance
    Index iterations = 0;           ///< Candidates evaluated
    Index improvements = 0;         ///< Times the best candidate changed
    Vector heads;                   ///< Cooper-Jacob heads at the constraint points
    Vector theis_heads;             ///< Theis heads at the constraint points
    std::string message;

    void print(std::ostream& os) const;
};

class SitingOptimizer {
public:
    SitingOptimizer() = default;
    explicit SitingOptimizer(const SitingOptions& options);

    SitingOptions& options() { return options_; }
    const SitingOptions& options() const { return options_; }

    /**
     * @brief Search well locations for a fixed total demand
     *
     * @param n_wells Number of wells to place, >= 1
     * @param region Rectangle the wells must lie in
     * @param total_demand Σ Q to split among the wells, >= 0
     * @param params Aquifer T and S
     * @param h0 Undisturbed head
     * @param points Constraint points, at least one
     * @param t Evaluation time, > 0
     * @param rng Random engine, advanced by the search
     */
    SitingResult search(Index n_wells, const FeasibleRegion& region,
                        Real total_demand, const AquiferParameters& params,
                        Real h0, const std::vector<ConstraintPoint>& points,
                        Real t, std::mt19937_64& rng) const;

    /**
     * @brief Coordinate form with a common minimum head and explicit budget
     */
    SitingResult search(Index n_wells, const FeasibleRegion& region,
                        Real total_demand, Real T, Real S, Real h0, Real h_min,
                        const std::vector<Vec2>& constraint_points,
                        Real t, Index max_iter, std::mt19937_64& rng) const;

    /// Per-well rates: even split, or proportional to options().weights
    Vector split_demand(Index n_wells, Real total_demand) const;

    /**
     * @brief Constraint violation of one layout
     *
     * @param locations Well coordinates
     * @param rates Rate per well
     */
    Real violation(const std::vector<Vec2>& locations, const Vector& rates,
                   const AquiferParameters& params, Real h0,
                   const std::vector<ConstraintPoint>& points, Real t) const;

private:
    SitingOptions options_;

    Real evaluate(const AquiferModel& model, const Real* xy, const Vector& rates,
                  Index n_wells, const std::vector<ConstraintPoint>& points,
                  const Vector& allowable, Real t) const;
};

} // namespace aqopt
