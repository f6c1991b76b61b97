/**
 * @file siting.cpp
 * @brief Random-search well siting
 */

#include "aqopt/optimization/siting.hpp"
#include "aqopt/analysis/superposition.hpp"
#include "aqopt/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace aqopt {

namespace {

void check_points(const std::vector<ConstraintPoint>& points) {
    if (points.empty()) {
        throw InvalidParameter("Siting requires at least one constraint point");
    }
    for (const auto& p : points) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.limit)) {
            throw InvalidParameter("Constraint point coordinates and limits must be finite");
        }
    }
}

} // namespace

// ============================================================================
// FeasibleRegion / SitingResult
// ============================================================================

void FeasibleRegion::validate() const {
    if (!std::isfinite(x_min) || !std::isfinite(x_max) ||
        !std::isfinite(y_min) || !std::isfinite(y_max)) {
        throw InvalidParameter("Feasible region bounds must be finite");
    }
    if (!(x_min < x_max) || !(y_min < y_max)) {
        throw InvalidParameter("Feasible region is empty");
    }
}

void SitingResult::print(std::ostream& os) const {
    os << "Siting: " << (feasible ? "feasible" : "infeasible")
       << " (violation = " << violation << ")\n";
    os << "  " << message << "\n";
    os << std::fixed << std::setprecision(2);
    for (Size i = 0; i < locations.size(); ++i) {
        os << "  well " << i << ": (" << locations[i].x() << ", " << locations[i].y()
           << "), Q = " << rates(static_cast<Index>(i)) << "\n";
    }
    for (Index j = 0; j < heads.size(); ++j) {
        os << "  point " << j << ": h = " << heads(j)
           << " (Theis " << theis_heads(j) << ")\n";
    }
    os << std::defaultfloat;
}

// ============================================================================
// SitingOptimizer
// ============================================================================

SitingOptimizer::SitingOptimizer(const SitingOptions& options)
    : options_(options) {}

Vector SitingOptimizer::split_demand(Index n_wells, Real total_demand) const {
    if (n_wells < 1) {
        throw InvalidParameter("Siting requires at least one well");
    }
    if (!std::isfinite(total_demand) || total_demand < 0.0) {
        throw InvalidParameter("Total demand must be finite and non-negative");
    }
    if (options_.weights.size() == 0) {
        return Vector::Constant(n_wells, total_demand / static_cast<Real>(n_wells));
    }
    if (options_.weights.size() != n_wells) {
        throw InvalidParameter("Need one demand weight per well");
    }
    if (!options_.weights.allFinite() || (options_.weights.array() < 0.0).any()) {
        throw InvalidParameter("Demand weights must be finite and non-negative");
    }
    Real sum = options_.weights.sum();
    if (!(sum > 0.0)) {
        throw InvalidParameter("Demand weights sum to zero");
    }
    return options_.weights * (total_demand / sum);
}

Real SitingOptimizer::evaluate(const AquiferModel& model, const Real* xy,
                               const Vector& rates, Index n_wells,
                               const std::vector<ConstraintPoint>& points,
                               const Vector& allowable, Real t) const {
    Real total = 0.0;
    for (Size j = 0; j < points.size(); ++j) {
        Real s = 0.0;
        for (Index i = 0; i < n_wells; ++i) {
            Real r = std::max(std::hypot(points[j].x - xy[2 * i], points[j].y - xy[2 * i + 1]),
                              options_.well_radius);
            s += model.cooper_jacob(r, t, rates(i));
        }
        // h_min - h = s - (h0 - h_min)
        total += std::max(0.0, s - allowable(static_cast<Index>(j)));
    }
    return total;
}

Real SitingOptimizer::violation(const std::vector<Vec2>& locations, const Vector& rates,
                                const AquiferParameters& params, Real h0,
                                const std::vector<ConstraintPoint>& points, Real t) const {
    AquiferModel model(params);
    if (locations.empty() || static_cast<Index>(locations.size()) != rates.size()) {
        throw InvalidParameter("Need one rate per well location");
    }
    if (!(t > 0.0)) {
        throw InvalidParameter("Time must be positive");
    }
    check_points(points);
    const Index n = rates.size();
    std::vector<Real> xy(2 * n);
    for (Index i = 0; i < n; ++i) {
        xy[2 * i] = locations[i].x();
        xy[2 * i + 1] = locations[i].y();
    }
    Vector allowable(static_cast<Index>(points.size()));
    for (Size j = 0; j < points.size(); ++j) {
        allowable(static_cast<Index>(j)) = points[j].allowable_drawdown(h0);
    }
    return evaluate(model, xy.data(), rates, n, points, allowable, t);
}

SitingResult SitingOptimizer::search(Index n_wells, const FeasibleRegion& region,
                                     Real total_demand, const AquiferParameters& params,
                                     Real h0, const std::vector<ConstraintPoint>& points,
                                     Real t, std::mt19937_64& rng) const {
    AquiferModel model(params);
    region.validate();
    check_points(points);
    if (!std::isfinite(h0)) {
        throw InvalidParameter("Initial head must be finite");
    }
    if (!(t > 0.0) || !std::isfinite(t)) {
        throw InvalidParameter("Time must be positive, got t = " + std::to_string(t));
    }
    if (options_.max_iterations < 1 || options_.batch_size < 1) {
        throw InvalidParameter("Siting budget and batch size must be >= 1");
    }
    if (!(options_.well_radius > 0.0)) {
        throw InvalidParameter("Well radius must be positive");
    }
    Vector rates = split_demand(n_wells, total_demand);

    const Index m = static_cast<Index>(points.size());
    Vector allowable(m);
    for (Index j = 0; j < m; ++j) {
        allowable(j) = points[j].allowable_drawdown(h0);
    }

    std::uniform_real_distribution<Real> ux(region.x_min, region.x_max);
    std::uniform_real_distribution<Real> uy(region.y_min, region.y_max);

    SitingResult result;
    result.rates = rates;
    std::vector<Real> best_xy(2 * n_wells, 0.0);
    Real best = std::numeric_limits<Real>::infinity();

    const Index stride = 2 * n_wells;
    std::vector<Real> batch_xy;
    std::vector<Real> batch_violation;

    Index done = 0;
    while (done < options_.max_iterations) {
        const Index batch = std::min(options_.batch_size, options_.max_iterations - done);
        batch_xy.resize(batch * stride);
        batch_violation.assign(batch, 0.0);

        // Draw serially so the sequence depends only on the engine state
        for (Index k = 0; k < batch; ++k) {
            for (Index i = 0; i < n_wells; ++i) {
                batch_xy[k * stride + 2 * i] = ux(rng);
                batch_xy[k * stride + 2 * i + 1] = uy(rng);
            }
        }

        ParallelError error;
        #pragma omp parallel for schedule(static)
        for (Index k = 0; k < batch; ++k) {
            try {
                batch_violation[k] = evaluate(model, &batch_xy[k * stride], rates,
                                              n_wells, points, allowable, t);
            } catch (...) {
                error.capture(k);
            }
        }
        error.rethrow();

        // Strict improvement: the earliest candidate wins ties
        for (Index k = 0; k < batch; ++k) {
            if (batch_violation[k] < best) {
                best = batch_violation[k];
                std::copy(batch_xy.begin() + k * stride,
                          batch_xy.begin() + (k + 1) * stride, best_xy.begin());
                ++result.improvements;
            }
        }
        done += batch;

        if (options_.verbose) {
            std::cerr << "Siting: " << done << " candidates, best violation = " << best << "\n";
        }
    }

    result.iterations = done;
    result.violation = best;
    result.feasible = best < options_.feasibility_tolerance;
    result.locations.reserve(n_wells);
    for (Index i = 0; i < n_wells; ++i) {
        result.locations.emplace_back(best_xy[2 * i], best_xy[2 * i + 1]);
    }

    // Heads at the best layout, with the Theis check alongside
    std::vector<WellSource> sources(n_wells);
    for (Index i = 0; i < n_wells; ++i) {
        sources[i] = WellSource{best_xy[2 * i], best_xy[2 * i + 1], rates(i), options_.well_radius};
    }
    Vector px(m), py(m);
    for (Index j = 0; j < m; ++j) {
        px(j) = points[j].x;
        py(j) = points[j].y;
    }
    SuperpositionEngine cj(params, DrawdownMethod::CooperJacob);
    SuperpositionEngine theis(params, DrawdownMethod::Theis);
    result.heads = Vector::Constant(m, h0) - cj.drawdown(sources, px, py, t);
    result.theis_heads = Vector::Constant(m, h0) - theis.drawdown(sources, px, py, t);

    std::ostringstream msg;
    msg << "Best of " << done << " candidates: violation = " << best
        << (result.feasible ? " (feasible)" : " (infeasible)")
        << ", " << result.improvements << " improvements";
    result.message = msg.str();
    return result;
}

SitingResult SitingOptimizer::search(Index n_wells, const FeasibleRegion& region,
                                     Real total_demand, Real T, Real S, Real h0, Real h_min,
                                     const std::vector<Vec2>& constraint_points,
                                     Real t, Index max_iter, std::mt19937_64& rng) const {
    std::vector<ConstraintPoint> points;
    points.reserve(constraint_points.size());
    for (Size j = 0; j < constraint_points.size(); ++j) {
        points.push_back(ConstraintPoint::from_min_head(
            constraint_points[j].x(), constraint_points[j].y(), h_min,
            "P" + std::to_string(j + 1)));
    }

    SitingOptimizer bounded(options_);
    bounded.options_.max_iterations = max_iter;
    return bounded.search(n_wells, region, total_demand, AquiferParameters(T, S),
                          h0, points, t, rng);
}

} // namespace aqopt
