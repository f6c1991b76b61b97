/**
 * @file drawdown_curves.cpp
 * @brief Distance/time curves, drawdown grids, interference and sensitivity
 */

#include "aqopt/analysis/drawdown_curves.hpp"
#include "aqopt/analysis/superposition.hpp"
#include "aqopt/physics/well_functions.hpp"
#include "aqopt/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <iomanip>
#include <ostream>

namespace aqopt {

Vector distance_drawdown_curve(const Vector& radii, Real t, Real Q,
                               const AquiferParameters& params,
                               DrawdownMethod method, Real r_well) {
    params.validate();
    if (!(r_well > 0.0)) {
        throw InvalidParameter("Well radius must be positive");
    }
    Vector s(radii.size());
    for (Index k = 0; k < radii.size(); ++k) {
        Real r = std::max(radii(k), r_well);
        s(k) = drawdown(method, r, t, Q, params.T, params.S);
    }
    return s;
}

Vector time_drawdown_curve(Real r, const Vector& times, Real Q,
                           const AquiferParameters& params,
                           DrawdownMethod method) {
    params.validate();
    Vector s(times.size());
    for (Index k = 0; k < times.size(); ++k) {
        s(k) = drawdown(method, r, times(k), Q, params.T, params.S);
    }
    return s;
}

Vector log_space(Real lo, Real hi, Index n) {
    if (!(lo > 0.0) || !(hi > 0.0) || n < 1) {
        throw InvalidParameter("log_space requires lo > 0, hi > 0 and n >= 1");
    }
    Vector v(n);
    if (n == 1) {
        v(0) = lo;
        return v;
    }
    Real a = std::log10(lo);
    Real b = std::log10(hi);
    for (Index k = 0; k < n; ++k) {
        v(k) = std::pow(10.0, a + (b - a) * static_cast<Real>(k) / static_cast<Real>(n - 1));
    }
    return v;
}

Matrix drawdown_grid(const WellField& field, const Vector& xs, const Vector& ys,
                     Real t, const AquiferParameters& params,
                     DrawdownMethod method) {
    const Index nx = xs.size();
    const Index ny = ys.size();

    // Flatten row-major (y outer) and evaluate in one superposition pass
    Vector px(nx * ny), py(nx * ny);
    for (Index j = 0; j < ny; ++j) {
        for (Index i = 0; i < nx; ++i) {
            px(j * nx + i) = xs(i);
            py(j * nx + i) = ys(j);
        }
    }

    SuperpositionEngine engine(params, method);
    Vector s = engine.drawdown(field, px, py, t);

    Matrix grid(ny, nx);
    for (Index j = 0; j < ny; ++j) {
        for (Index i = 0; i < nx; ++i) {
            grid(j, i) = s(j * nx + i);
        }
    }
    return grid;
}

Real radius_of_influence(const WellField& field, const Vector& xs, const Vector& ys,
                         const Matrix& s, Real threshold) {
    if (s.rows() != ys.size() || s.cols() != xs.size()) {
        throw InvalidParameter("Drawdown grid does not match the coordinate arrays");
    }
    if (field.size() == 0) {
        throw InvalidParameter("Radius of influence requires at least one well");
    }
    Real radius = 0.0;
    for (Index j = 0; j < ys.size(); ++j) {
        for (Index i = 0; i < xs.size(); ++i) {
            if (s(j, i) <= threshold) continue;
            Real nearest = std::numeric_limits<Real>::infinity();
            for (const auto& w : field.wells()) {
                nearest = std::min(nearest, std::hypot(xs(i) - w.x(), ys(j) - w.y()));
            }
            radius = std::max(radius, nearest);
        }
    }
    return radius;
}

Real interference_coefficient(const WellField& field, Index reference_well,
                              Real x, Real y, Real t,
                              const AquiferParameters& params,
                              DrawdownMethod method) {
    const PumpingWell& ref = field.well(reference_well);
    Real s_single = ref.compute_drawdown(x, y, t, params, method);
    if (std::abs(s_single) < constants::EPSILON) {
        throw NumericalDomainError("Reference well causes no drawdown at the point");
    }
    Real s_total = field.compute_total_drawdown(x, y, t, params, method);
    return s_total / s_single;
}

std::vector<Real> SensitivityResult::percent_change(const std::vector<Real>& series) const {
    std::vector<Real> out(series.size());
    for (Size k = 0; k < series.size(); ++k) {
        out[k] = 100.0 * (series[k] - base_drawdown) / base_drawdown;
    }
    return out;
}

void SensitivityResult::print(std::ostream& os) const {
    auto pQ = percent_change(drawdown_Q);
    auto pT = percent_change(drawdown_T);
    auto pS = percent_change(drawdown_S);
    os << "Sensitivity (base s = " << base_drawdown << ")\n";
    os << "  factor      dQ [%]      dT [%]      dS [%]\n";
    os << std::fixed << std::setprecision(2);
    for (Size k = 0; k < factors.size(); ++k) {
        os << std::setw(8) << factors[k]
           << std::setw(12) << pQ[k]
           << std::setw(12) << pT[k]
           << std::setw(12) << pS[k] << "\n";
    }
    os << std::defaultfloat;
}

SensitivityResult drawdown_sensitivity(Real r, Real t, Real Q,
                                       const AquiferParameters& params,
                                       const std::vector<Real>& factors) {
    params.validate();
    SensitivityResult result;
    result.factors = factors;
    result.base_drawdown = theis_solution(r, t, Q, params.T, params.S);

    for (Real f : factors) {
        if (!(f > 0.0)) {
            throw InvalidParameter("Sensitivity factors must be positive");
        }
        result.drawdown_Q.push_back(theis_solution(r, t, Q * f, params.T, params.S));
        result.drawdown_T.push_back(theis_solution(r, t, Q, params.T * f, params.S));
        result.drawdown_S.push_back(theis_solution(r, t, Q, params.T, params.S * f));
    }
    return result;
}

} // namespace aqopt
