/**
 * @file aqopt.hpp
 * @brief Main aqopt header and the Planner facade
 *
 * aqopt computes transient drawdown of pumping wells in a confined
 * aquifer and optimizes their pumping rates and locations under
 * minimum-head constraints. The Planner ties a Config to the
 * optimizers and provides a clean API for:
 * - Rate allocation (Cooper-Jacob LP or Theis SQP)
 * - Comparison with every well at its maximum rate
 * - Well siting by seeded random search
 * - Drawdown maps of an allocation
 */

#pragma once

// Core includes
#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/config.hpp"

// Physics includes
#include "physics/well_functions.hpp"
#include "physics/aquifer.hpp"

// Well includes
#include "wells/pumping_well.hpp"
#include "wells/well_field.hpp"

// Analysis includes
#include "analysis/superposition.hpp"
#include "analysis/drawdown_curves.hpp"

// Solver includes
#include "solvers/linear_program.hpp"
#include "solvers/least_distance.hpp"
#include "solvers/sqp.hpp"

// Optimization includes
#include "optimization/allocation.hpp"
#include "optimization/siting.hpp"

#include <iosfwd>
#include <random>
#include <string>

namespace aqopt {

/**
 * @brief One planning run over a configured well field
 *
 * Example usage:
 * @code
 * auto planner = Planner::from_config("wellfield.cfg");
 *
 * OptimizationResult result = planner.allocate();
 * if (result.success) {
 *     std::cout << "Total extraction: " << result.total_rate << "\n";
 * }
 *
 * std::mt19937_64 rng(7);
 * SitingResult layout = planner.site(rng);
 * @endcode
 */
class Planner {
public:
    /// Validates the configuration
    explicit Planner(Config config);

    // ========================================================================
    // Factory Methods
    // ========================================================================

    static Planner from_config(const std::string& config_file);
    static Planner from_config(const Config& config);

    // ========================================================================
    // Accessors
    // ========================================================================

    const Config& config() const { return config_; }
    const WellField& well_field() const { return field_; }
    const AquiferParameters& aquifer() const { return params_; }
    Real initial_head() const { return config_.aquifer.initial_head; }
    Real time() const { return config_.simulation.time; }

    // ========================================================================
    // Runs
    // ========================================================================

    /// Allocation with the configured method
    OptimizationResult allocate() const;
    OptimizationResult allocate(AllocationMethod method) const;

    /// Every well at q_max, heads with the configured drawdown method
    ReferenceCase reference_case() const;

    /// Siting with an engine seeded from siting.seed
    SitingResult site() const;

    /// Siting with a caller-owned engine
    SitingResult site(std::mt19937_64& rng) const;

    /**
     * @brief Drawdown over a grid for the given rates (rows = y)
     */
    Matrix drawdown_map(const Vector& rates, const Vector& xs, const Vector& ys) const;

    /**
     * @brief Run both allocations, the reference case and (if enabled)
     *        siting, and write a plain-text report
     */
    void print_report(std::ostream& os) const;

private:
    Config config_;
    WellField field_;
    AquiferParameters params_;
};

} // namespace aqopt
