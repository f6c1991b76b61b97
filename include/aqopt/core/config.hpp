/**
 * @file config.hpp
 * @brief Run configuration for aqopt
 *
 * Defines the typed configuration of one planning run:
 * - Aquifer parameters and undisturbed head
 * - Evaluation time and method choices
 * - Candidate wells and constraint points
 * - Solver budgets and diagnostics
 * - Optional well-siting search
 *
 * Files use a sectioned "key: value" text format:
 *
 *   aquifer:
 *     transmissivity: 500
 *     storativity: 0.0002
 *     initial_head: 50
 *   wells:
 *     W1: 0, 0, 1500          # x, y, q_max[, r_well]
 *   constraints:
 *     P1: 250, 200, 45        # x, y, h_min
 *     P2: 400, 400, 5, drawdown
 */

#pragma once

#include "types.hpp"
#include "../physics/aquifer.hpp"
#include "../wells/pumping_well.hpp"
#include "../wells/well_field.hpp"
#include "../optimization/allocation.hpp"
#include "../optimization/siting.hpp"
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace aqopt {

/**
 * @brief Aquifer section
 */
struct AquiferConfig {
    Real transmissivity = 500.0;    ///< T [L²/T]
    Real storativity = 2e-4;        ///< S [-]
    Real initial_head = 50.0;       ///< h0 [L]

    AquiferParameters parameters() const { return {transmissivity, storativity}; }
};

/**
 * @brief Simulation section
 */
struct SimulationConfig {
    Real time = 100.0;              ///< Time at which heads are constrained [T]
    AllocationMethod allocation_method = AllocationMethod::Linear;
    DrawdownMethod drawdown_method = DrawdownMethod::Theis;    ///< For reports and grids
    Real well_radius = constants::DEFAULT_WELL_RADIUS;          ///< Default r_well
};

/**
 * @brief One candidate well: location and rate bound
 */
struct WellSpec {
    std::string name;
    Real x = 0.0;
    Real y = 0.0;
    Real q_max = 0.0;
    Real r_well = 0.0;              ///< 0 = simulation.well_radius
};

/**
 * @brief Solver section
 */
struct SolverConfig {
    Index max_iterations = 100;
    Real tolerance = 1e-6;
    Real constraint_tolerance = 1e-6;
    long lp_timeout = 0;            ///< [s], 0 = no limit
    bool verbose = false;
    bool warn_cooper_jacob = true;

    AllocationConfig allocation() const;
};

/**
 * @brief Siting section; n_wells = 0 disables the search
 */
struct SitingConfig {
    Index n_wells = 0;
    Real x_min = 0.0;
    Real x_max = 0.0;
    Real y_min = 0.0;
    Real y_max = 0.0;
    Real total_demand = 0.0;
    Index max_iterations = 1000;
    std::uint64_t seed = 42;
    Real feasibility_tolerance = 1e-9;

    bool enabled() const { return n_wells > 0; }
    FeasibleRegion region() const { return {x_min, x_max, y_min, y_max}; }
    SitingOptions options(Real well_radius, bool verbose) const;
};

/**
 * @brief Complete configuration
 */
class Config {
public:
    Config() = default;

    // Load from a config file
    static Config from_file(const std::filesystem::path& filepath);

    // Parse config text
    static Config from_string(const std::string& text);

    // Save to a config file
    void to_file(const std::filesystem::path& filepath) const;

    // Serialize in the file format
    std::string to_string() const;

    /// Throws InvalidParameter naming the first out-of-range field
    void validate() const;

    /// Four wells and three constraint points in a T = 500, S = 2e-4 aquifer
    static Config default_scenario();

    // Sub-configurations
    AquiferConfig aquifer;
    SimulationConfig simulation;
    std::vector<WellSpec> wells;
    std::vector<ConstraintPoint> constraints;
    SolverConfig solver;
    SitingConfig siting;

    // Derived objects
    WellField well_field() const;
    Vector q_max() const;

    void print_summary(std::ostream& os) const;

private:
    void validate_aquifer() const;
    void validate_wells() const;
    void validate_constraints() const;
    void validate_solver() const;
    void validate_siting() const;
};

// ============================================================================
// Parser Helpers
// ============================================================================

namespace config_io {

/// Parse a number; throws InvalidParameter naming the key
Real parse_real(const std::string& value, const std::string& key);
Index parse_index(const std::string& value, const std::string& key);
bool parse_bool(const std::string& value, const std::string& key);

/// Split "a, b, c" into trimmed fields
std::vector<std::string> split_fields(const std::string& value);

/// Convert enum to string
std::string to_string(AllocationMethod am);
std::string to_string(DrawdownMethod dm);
std::string to_string(LimitKind lk);
std::string to_string(OptimizationStatus os);

/// Convert string to enum
AllocationMethod allocation_method_from_string(const std::string& s);
DrawdownMethod drawdown_method_from_string(const std::string& s);
LimitKind limit_kind_from_string(const std::string& s);

} // namespace config_io

} // namespace aqopt
