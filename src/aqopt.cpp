/**
 * @file aqopt.cpp
 * @brief Planner implementation
 */

#include "aqopt/aqopt.hpp"
#include <iomanip>
#include <ostream>

namespace aqopt {

Planner::Planner(Config config)
    : config_(std::move(config)) {
    config_.validate();
    field_ = config_.well_field();
    params_ = config_.aquifer.parameters();
}

Planner Planner::from_config(const std::string& config_file) {
    return Planner(Config::from_file(config_file));
}

Planner Planner::from_config(const Config& config) {
    return Planner(config);
}

OptimizationResult Planner::allocate() const {
    return allocate(config_.simulation.allocation_method);
}

OptimizationResult Planner::allocate(AllocationMethod method) const {
    AllocationOptimizer optimizer(config_.solver.allocation());
    return optimizer.optimize(method, field_, config_.q_max(), config_.constraints,
                              params_, initial_head(), time());
}

ReferenceCase Planner::reference_case() const {
    AllocationOptimizer optimizer(config_.solver.allocation());
    return optimizer.unconstrained(field_, config_.q_max(), config_.constraints,
                                   params_, initial_head(), time(),
                                   config_.simulation.drawdown_method);
}

SitingResult Planner::site() const {
    std::mt19937_64 rng(config_.siting.seed);
    return site(rng);
}

SitingResult Planner::site(std::mt19937_64& rng) const {
    if (!config_.siting.enabled()) {
        throw InvalidParameter("Siting is not configured (siting.n_wells = 0)");
    }
    SitingOptimizer optimizer(config_.siting.options(config_.simulation.well_radius,
                                                     config_.solver.verbose));
    return optimizer.search(config_.siting.n_wells, config_.siting.region(),
                            config_.siting.total_demand, params_, initial_head(),
                            config_.constraints, time(), rng);
}

Matrix Planner::drawdown_map(const Vector& rates, const Vector& xs, const Vector& ys) const {
    WellField pumped = field_;
    pumped.set_rates(rates);
    return drawdown_grid(pumped, xs, ys, time(), params_, config_.simulation.drawdown_method);
}

void Planner::print_report(std::ostream& os) const {
    config_.print_summary(os);
    os << "\n";

    ReferenceCase ref = reference_case();
    os << "Unconstrained (all wells at q_max): total " << ref.total_rate
       << ", " << ref.n_violated << " of " << ref.heads.size() << " constraints violated\n";
    for (Index j = 0; j < ref.heads.size(); ++j) {
        os << "  " << config_.constraints[j].name << ": h = " << ref.heads(j)
           << " (margin " << ref.margins(j) << ")\n";
    }
    os << "\n";

    OptimizationResult linear = allocate(AllocationMethod::Linear);
    linear.print(os);
    os << "\n";

    OptimizationResult nonlinear = allocate(AllocationMethod::Nonlinear);
    nonlinear.print(os);

    if (linear.success && nonlinear.success && linear.total_rate > 0.0) {
        Real diff = 100.0 * (nonlinear.total_rate - linear.total_rate) / linear.total_rate;
        os << "Nonlinear vs linear total: " << std::fixed << std::setprecision(2)
           << diff << " %\n" << std::defaultfloat;
    }

    if (config_.siting.enabled()) {
        os << "\n";
        site().print(os);
    }
}

} // namespace aqopt
