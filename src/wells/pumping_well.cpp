/**
 * @file pumping_well.cpp
 * @brief PumpingWell and ConstraintPoint
 */

#include "aqopt/wells/pumping_well.hpp"
#include "aqopt/physics/well_functions.hpp"
#include "aqopt/core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace aqopt {

// ============================================================================
// PumpingWell
// ============================================================================

PumpingWell::PumpingWell(Real x, Real y, Real Q, std::string name, Real r_well)
    : x_(x), y_(y), Q_(Q), r_well_(r_well), name_(std::move(name)) {
    if (!std::isfinite(x) || !std::isfinite(y)) {
        throw InvalidParameter("Well coordinates must be finite");
    }
    if (!std::isfinite(Q)) {
        throw InvalidParameter("Well rate must be finite");
    }
    if (!(r_well > 0.0) || !std::isfinite(r_well)) {
        throw InvalidParameter("Well radius must be positive, got " + std::to_string(r_well));
    }
}

void PumpingWell::set_rate(Real Q) {
    if (!std::isfinite(Q)) {
        throw InvalidParameter("Well rate must be finite");
    }
    Q_ = Q;
}

Real PumpingWell::distance_to(Real x, Real y) const {
    return std::max(std::hypot(x - x_, y - y_), r_well_);
}

Real PumpingWell::compute_drawdown(Real x, Real y, Real t,
                                   const AquiferParameters& params,
                                   DrawdownMethod method) const {
    return drawdown(method, distance_to(x, y), t, Q_, params.T, params.S);
}

Vector PumpingWell::compute_drawdown(const Vector& xs, const Vector& ys, Real t,
                                     const AquiferParameters& params,
                                     DrawdownMethod method) const {
    if (xs.size() != ys.size()) {
        throw InvalidParameter("Observation x and y arrays differ in length");
    }
    Vector s(xs.size());
    for (Index k = 0; k < xs.size(); ++k) {
        s(k) = compute_drawdown(xs(k), ys(k), t, params, method);
    }
    return s;
}

// ============================================================================
// ConstraintPoint
// ============================================================================

ConstraintPoint ConstraintPoint::from_min_head(Real x, Real y, Real h_min, std::string name) {
    return {x, y, h_min, LimitKind::MinHead, std::move(name)};
}

ConstraintPoint ConstraintPoint::from_max_drawdown(Real x, Real y, Real s_max, std::string name) {
    return {x, y, s_max, LimitKind::MaxDrawdown, std::move(name)};
}

Real ConstraintPoint::allowable_drawdown(Real h0) const {
    return kind == LimitKind::MinHead ? h0 - limit : limit;
}

Real ConstraintPoint::required_head(Real h0) const {
    return kind == LimitKind::MinHead ? limit : h0 - limit;
}

} // namespace aqopt
