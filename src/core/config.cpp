/**
 * @file config.cpp
 * @brief Configuration parsing and validation
 */

#include "aqopt/core/config.hpp"
#include "aqopt/core/errors.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace aqopt {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool finite_positive(Real v) {
    return std::isfinite(v) && v > 0.0;
}

} // namespace

// ============================================================================
// Sections
// ============================================================================

AllocationConfig SolverConfig::allocation() const {
    AllocationConfig config;
    config.max_iterations = max_iterations;
    config.tolerance = tolerance;
    config.constraint_tolerance = constraint_tolerance;
    config.lp_timeout = lp_timeout;
    config.verbose = verbose;
    config.warn_cooper_jacob = warn_cooper_jacob;
    return config;
}

SitingOptions SitingConfig::options(Real well_radius, bool verbose) const {
    SitingOptions opts;
    opts.max_iterations = max_iterations;
    opts.feasibility_tolerance = feasibility_tolerance;
    opts.well_radius = well_radius;
    opts.verbose = verbose;
    return opts;
}

// ============================================================================
// Config
// ============================================================================

Config Config::from_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filepath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

Config Config::from_string(const std::string& text) {
    Config config;
    std::istringstream in(text);
    std::string line;
    std::string current_section;
    Index line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;

        // Strip comments
        auto comment_pos = line.find('#');
        if (comment_pos != std::string::npos) {
            line = line.substr(0, comment_pos);
        }
        line = trim(line);
        if (line.empty()) continue;

        auto colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            throw InvalidParameter("Config line " + std::to_string(line_no) +
                                   ": expected 'key: value', got '" + line + "'");
        }
        std::string key = trim(line.substr(0, colon_pos));
        std::string value = trim(line.substr(colon_pos + 1));

        // Section headers (lines ending with ':' and no value)
        if (value.empty()) {
            if (key != "aquifer" && key != "simulation" && key != "wells" &&
                key != "constraints" && key != "solver" && key != "siting") {
                throw InvalidParameter("Unknown config section: " + key);
            }
            current_section = key;
            continue;
        }

        const std::string where = current_section + "." + key;

        // Parse based on section
        if (current_section == "aquifer") {
            if (key == "transmissivity")
                config.aquifer.transmissivity = config_io::parse_real(value, where);
            else if (key == "storativity")
                config.aquifer.storativity = config_io::parse_real(value, where);
            else if (key == "initial_head")
                config.aquifer.initial_head = config_io::parse_real(value, where);
            else
                throw InvalidParameter("Unknown config key: " + where);
        } else if (current_section == "simulation") {
            if (key == "time")
                config.simulation.time = config_io::parse_real(value, where);
            else if (key == "allocation_method")
                config.simulation.allocation_method = config_io::allocation_method_from_string(value);
            else if (key == "drawdown_method")
                config.simulation.drawdown_method = config_io::drawdown_method_from_string(value);
            else if (key == "well_radius")
                config.simulation.well_radius = config_io::parse_real(value, where);
            else
                throw InvalidParameter("Unknown config key: " + where);
        } else if (current_section == "wells") {
            auto fields = config_io::split_fields(value);
            if (fields.size() != 3 && fields.size() != 4) {
                throw InvalidParameter("Well " + key + " needs 'x, y, q_max[, r_well]'");
            }
            WellSpec well;
            well.name = key;
            well.x = config_io::parse_real(fields[0], where + ".x");
            well.y = config_io::parse_real(fields[1], where + ".y");
            well.q_max = config_io::parse_real(fields[2], where + ".q_max");
            if (fields.size() == 4) {
                well.r_well = config_io::parse_real(fields[3], where + ".r_well");
            }
            config.wells.push_back(well);
        } else if (current_section == "constraints") {
            auto fields = config_io::split_fields(value);
            if (fields.size() != 3 && fields.size() != 4) {
                throw InvalidParameter("Constraint " + key + " needs 'x, y, limit[, head|drawdown]'");
            }
            ConstraintPoint point;
            point.name = key;
            point.x = config_io::parse_real(fields[0], where + ".x");
            point.y = config_io::parse_real(fields[1], where + ".y");
            point.limit = config_io::parse_real(fields[2], where + ".limit");
            point.kind = fields.size() == 4
                ? config_io::limit_kind_from_string(fields[3])
                : LimitKind::MinHead;
            config.constraints.push_back(point);
        } else if (current_section == "solver") {
            if (key == "max_iterations")
                config.solver.max_iterations = config_io::parse_index(value, where);
            else if (key == "tolerance")
                config.solver.tolerance = config_io::parse_real(value, where);
            else if (key == "constraint_tolerance")
                config.solver.constraint_tolerance = config_io::parse_real(value, where);
            else if (key == "lp_timeout")
                config.solver.lp_timeout = static_cast<long>(config_io::parse_index(value, where));
            else if (key == "verbose")
                config.solver.verbose = config_io::parse_bool(value, where);
            else if (key == "warn_cooper_jacob")
                config.solver.warn_cooper_jacob = config_io::parse_bool(value, where);
            else
                throw InvalidParameter("Unknown config key: " + where);
        } else if (current_section == "siting") {
            if (key == "n_wells")
                config.siting.n_wells = config_io::parse_index(value, where);
            else if (key == "x_min")
                config.siting.x_min = config_io::parse_real(value, where);
            else if (key == "x_max")
                config.siting.x_max = config_io::parse_real(value, where);
            else if (key == "y_min")
                config.siting.y_min = config_io::parse_real(value, where);
            else if (key == "y_max")
                config.siting.y_max = config_io::parse_real(value, where);
            else if (key == "total_demand")
                config.siting.total_demand = config_io::parse_real(value, where);
            else if (key == "max_iterations")
                config.siting.max_iterations = config_io::parse_index(value, where);
            else if (key == "seed")
                config.siting.seed = static_cast<std::uint64_t>(config_io::parse_index(value, where));
            else if (key == "feasibility_tolerance")
                config.siting.feasibility_tolerance = config_io::parse_real(value, where);
            else
                throw InvalidParameter("Unknown config key: " + where);
        } else {
            throw InvalidParameter("Config key outside a section: " + key);
        }
    }

    return config;
}

void Config::to_file(const std::filesystem::path& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write config file: " + filepath.string());
    }
    file << to_string();
}

std::string Config::to_string() const {
    std::ostringstream file;
    file << std::setprecision(15);

    file << "# aqopt configuration\n\n";

    file << "aquifer:\n";
    file << "  transmissivity: " << aquifer.transmissivity << "\n";
    file << "  storativity: " << aquifer.storativity << "\n";
    file << "  initial_head: " << aquifer.initial_head << "\n\n";

    file << "simulation:\n";
    file << "  time: " << simulation.time << "\n";
    file << "  allocation_method: " << config_io::to_string(simulation.allocation_method) << "\n";
    file << "  drawdown_method: " << config_io::to_string(simulation.drawdown_method) << "\n";
    file << "  well_radius: " << simulation.well_radius << "\n\n";

    file << "wells:\n";
    for (const auto& w : wells) {
        file << "  " << w.name << ": " << w.x << ", " << w.y << ", " << w.q_max;
        if (w.r_well > 0.0) file << ", " << w.r_well;
        file << "\n";
    }
    file << "\n";

    file << "constraints:\n";
    for (const auto& p : constraints) {
        file << "  " << p.name << ": " << p.x << ", " << p.y << ", " << p.limit
             << (p.kind == LimitKind::MaxDrawdown ? ", drawdown" : "") << "\n";
    }
    file << "\n";

    file << "solver:\n";
    file << "  max_iterations: " << solver.max_iterations << "\n";
    file << "  tolerance: " << solver.tolerance << "\n";
    file << "  constraint_tolerance: " << solver.constraint_tolerance << "\n";
    file << "  lp_timeout: " << solver.lp_timeout << "\n";
    file << "  verbose: " << (solver.verbose ? "true" : "false") << "\n";
    file << "  warn_cooper_jacob: " << (solver.warn_cooper_jacob ? "true" : "false") << "\n\n";

    file << "siting:\n";
    file << "  n_wells: " << siting.n_wells << "\n";
    file << "  x_min: " << siting.x_min << "\n";
    file << "  x_max: " << siting.x_max << "\n";
    file << "  y_min: " << siting.y_min << "\n";
    file << "  y_max: " << siting.y_max << "\n";
    file << "  total_demand: " << siting.total_demand << "\n";
    file << "  max_iterations: " << siting.max_iterations << "\n";
    file << "  seed: " << siting.seed << "\n";
    file << "  feasibility_tolerance: " << siting.feasibility_tolerance << "\n";

    return file.str();
}

void Config::validate() const {
    validate_aquifer();
    validate_wells();
    validate_constraints();
    validate_solver();
    validate_siting();
}

void Config::validate_aquifer() const {
    if (!finite_positive(aquifer.transmissivity)) {
        throw InvalidParameter("aquifer.transmissivity must be > 0");
    }
    if (!finite_positive(aquifer.storativity) || aquifer.storativity >= 1.0) {
        throw InvalidParameter("aquifer.storativity must be in (0, 1)");
    }
    if (!std::isfinite(aquifer.initial_head)) {
        throw InvalidParameter("aquifer.initial_head must be finite");
    }
    if (!finite_positive(simulation.time)) {
        throw InvalidParameter("simulation.time must be > 0");
    }
    if (!finite_positive(simulation.well_radius)) {
        throw InvalidParameter("simulation.well_radius must be > 0");
    }
}

void Config::validate_wells() const {
    if (wells.empty()) {
        throw InvalidParameter("wells: at least one well is required");
    }
    for (Size i = 0; i < wells.size(); ++i) {
        const auto& w = wells[i];
        if (w.name.empty()) {
            throw InvalidParameter("wells: entry " + std::to_string(i) + " has no name");
        }
        for (Size k = 0; k < i; ++k) {
            if (wells[k].name == w.name) {
                throw InvalidParameter("wells: duplicate name " + w.name);
            }
        }
        if (!std::isfinite(w.x) || !std::isfinite(w.y)) {
            throw InvalidParameter("wells." + w.name + ": coordinates must be finite");
        }
        if (!std::isfinite(w.q_max) || w.q_max < 0.0) {
            throw InvalidParameter("wells." + w.name + ": q_max must be >= 0");
        }
        if (!std::isfinite(w.r_well) || w.r_well < 0.0) {
            throw InvalidParameter("wells." + w.name + ": r_well must be >= 0");
        }
    }
}

void Config::validate_constraints() const {
    if (constraints.empty()) {
        throw InvalidParameter("constraints: at least one constraint point is required");
    }
    for (const auto& p : constraints) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.limit)) {
            throw InvalidParameter("constraints." + p.name + ": values must be finite");
        }
        if (p.kind == LimitKind::MaxDrawdown && p.limit < 0.0) {
            throw InvalidParameter("constraints." + p.name + ": drawdown limit must be >= 0");
        }
    }
}

void Config::validate_solver() const {
    if (solver.max_iterations < 1) {
        throw InvalidParameter("solver.max_iterations must be >= 1");
    }
    if (!finite_positive(solver.tolerance)) {
        throw InvalidParameter("solver.tolerance must be > 0");
    }
    if (!finite_positive(solver.constraint_tolerance)) {
        throw InvalidParameter("solver.constraint_tolerance must be > 0");
    }
    if (solver.lp_timeout < 0) {
        throw InvalidParameter("solver.lp_timeout must be >= 0");
    }
}

void Config::validate_siting() const {
    if (siting.n_wells < 0) {
        throw InvalidParameter("siting.n_wells must be >= 0");
    }
    if (!siting.enabled()) return;

    if (!(siting.x_min < siting.x_max) || !(siting.y_min < siting.y_max)) {
        throw InvalidParameter("siting: feasible region is empty");
    }
    if (!std::isfinite(siting.total_demand) || siting.total_demand < 0.0) {
        throw InvalidParameter("siting.total_demand must be >= 0");
    }
    if (siting.max_iterations < 1) {
        throw InvalidParameter("siting.max_iterations must be >= 1");
    }
    if (!(siting.feasibility_tolerance >= 0.0)) {
        throw InvalidParameter("siting.feasibility_tolerance must be >= 0");
    }
}

Config Config::default_scenario() {
    Config config;
    config.aquifer = {500.0, 2e-4, 50.0};
    config.simulation.time = 100.0;

    config.wells = {
        {"W1", 0.0, 0.0, 1500.0, 0.0},
        {"W2", 500.0, 0.0, 1500.0, 0.0},
        {"W3", 250.0, 433.0, 1500.0, 0.0},
        {"W4", 500.0, 866.0, 1500.0, 0.0},
    };
    config.constraints = {
        ConstraintPoint::from_min_head(250.0, 200.0, 45.0, "P1"),
        ConstraintPoint::from_min_head(400.0, 400.0, 45.0, "P2"),
        ConstraintPoint::from_min_head(250.0, 650.0, 45.0, "P3"),
    };

    config.siting.n_wells = 3;
    config.siting.x_min = -500.0;
    config.siting.x_max = 1500.0;
    config.siting.y_min = -500.0;
    config.siting.y_max = 1500.0;
    config.siting.total_demand = 3000.0;
    config.siting.max_iterations = 2000;
    return config;
}

WellField Config::well_field() const {
    WellField field("configured");
    for (const auto& w : wells) {
        Real r = w.r_well > 0.0 ? w.r_well : simulation.well_radius;
        field.add_well(PumpingWell(w.x, w.y, 0.0, w.name, r));
    }
    return field;
}

Vector Config::q_max() const {
    Vector q(static_cast<Index>(wells.size()));
    for (Size i = 0; i < wells.size(); ++i) {
        q(static_cast<Index>(i)) = wells[i].q_max;
    }
    return q;
}

void Config::print_summary(std::ostream& os) const {
    os << "=== aqopt Configuration ===\n";
    os << "Aquifer:\n";
    os << "  T:          " << aquifer.transmissivity << "\n";
    os << "  S:          " << aquifer.storativity << "\n";
    os << "  h0:         " << aquifer.initial_head << "\n";
    os << "Simulation:\n";
    os << "  Time:       " << simulation.time << "\n";
    os << "  Allocation: " << config_io::to_string(simulation.allocation_method) << "\n";
    os << "  Drawdown:   " << config_io::to_string(simulation.drawdown_method) << "\n";
    os << "Wells:        " << wells.size() << "\n";
    for (const auto& w : wells) {
        os << "  " << w.name << " (" << w.x << ", " << w.y << ") q_max = " << w.q_max << "\n";
    }
    os << "Constraints:  " << constraints.size() << "\n";
    for (const auto& p : constraints) {
        os << "  " << p.name << " (" << p.x << ", " << p.y << ") "
           << (p.kind == LimitKind::MinHead ? "h_min = " : "s_max = ") << p.limit << "\n";
    }
    if (siting.enabled()) {
        os << "Siting:       " << siting.n_wells << " wells, demand " << siting.total_demand
           << ", region [" << siting.x_min << ", " << siting.x_max << "] x ["
           << siting.y_min << ", " << siting.y_max << "]\n";
    }
    os << "===========================\n";
}

// ============================================================================
// config_io helpers
// ============================================================================

namespace config_io {

Real parse_real(const std::string& value, const std::string& key) {
    std::string v = trim(value);
    std::size_t pos = 0;
    Real result = 0.0;
    try {
        result = std::stod(v, &pos);
    } catch (const std::exception&) {
        throw InvalidParameter("Invalid number for " + key + ": '" + value + "'");
    }
    if (pos != v.size()) {
        throw InvalidParameter("Invalid number for " + key + ": '" + value + "'");
    }
    return result;
}

Index parse_index(const std::string& value, const std::string& key) {
    std::string v = trim(value);
    std::size_t pos = 0;
    long long result = 0;
    try {
        result = std::stoll(v, &pos);
    } catch (const std::exception&) {
        throw InvalidParameter("Invalid integer for " + key + ": '" + value + "'");
    }
    if (pos != v.size()) {
        throw InvalidParameter("Invalid integer for " + key + ": '" + value + "'");
    }
    return static_cast<Index>(result);
}

bool parse_bool(const std::string& value, const std::string& key) {
    std::string v = trim(value);
    if (v == "true" || v == "1" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "no") return false;
    throw InvalidParameter("Invalid boolean for " + key + ": '" + value + "'");
}

std::vector<std::string> split_fields(const std::string& value) {
    std::vector<std::string> fields;
    std::istringstream in(value);
    std::string field;
    while (std::getline(in, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

std::string to_string(AllocationMethod am) {
    switch (am) {
        case AllocationMethod::Linear: return "Linear";
        case AllocationMethod::Nonlinear: return "Nonlinear";
        default: return "Unknown";
    }
}

std::string to_string(DrawdownMethod dm) {
    switch (dm) {
        case DrawdownMethod::Theis: return "Theis";
        case DrawdownMethod::CooperJacob: return "CooperJacob";
        default: return "Unknown";
    }
}

std::string to_string(LimitKind lk) {
    switch (lk) {
        case LimitKind::MinHead: return "MinHead";
        case LimitKind::MaxDrawdown: return "MaxDrawdown";
        default: return "Unknown";
    }
}

std::string to_string(OptimizationStatus os) {
    switch (os) {
        case OptimizationStatus::Optimal: return "Optimal";
        case OptimizationStatus::Infeasible: return "Infeasible";
        case OptimizationStatus::NonConvergence: return "NonConvergence";
        case OptimizationStatus::SolverError: return "SolverError";
        default: return "Unknown";
    }
}

// String to enum converters

AllocationMethod allocation_method_from_string(const std::string& s) {
    if (s == "Linear") return AllocationMethod::Linear;
    if (s == "Nonlinear") return AllocationMethod::Nonlinear;
    throw InvalidParameter("Unknown allocation method: " + s);
}

DrawdownMethod drawdown_method_from_string(const std::string& s) {
    if (s == "Theis") return DrawdownMethod::Theis;
    if (s == "CooperJacob") return DrawdownMethod::CooperJacob;
    throw InvalidParameter("Unknown drawdown method: " + s);
}

LimitKind limit_kind_from_string(const std::string& s) {
    if (s == "MinHead" || s == "head") return LimitKind::MinHead;
    if (s == "MaxDrawdown" || s == "drawdown") return LimitKind::MaxDrawdown;
    throw InvalidParameter("Unknown limit kind: " + s);
}

} // namespace config_io

} // namespace aqopt
