/**
 * @file superposition.cpp
 * @brief Multi-well drawdown by superposition
 */

#include "aqopt/analysis/superposition.hpp"
#include "aqopt/physics/well_functions.hpp"
#include "aqopt/core/errors.hpp"
#include <algorithm>
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace aqopt {

SuperpositionEngine::SuperpositionEngine(const AquiferParameters& params,
                                         DrawdownMethod method)
    : model_(params), method_(method) {}

void SuperpositionEngine::check_inputs(const std::vector<WellSource>& wells,
                                       const Vector& xs, const Vector& ys,
                                       Real t) const {
    if (wells.empty()) {
        throw InvalidParameter("Superposition requires at least one well");
    }
    if (xs.size() != ys.size()) {
        throw InvalidParameter("Observation x and y arrays differ in length");
    }
    if (!(t > 0.0) || !std::isfinite(t)) {
        throw NumericalDomainError("Elapsed time must be positive, got t = " + std::to_string(t));
    }
    for (const auto& w : wells) {
        if (!std::isfinite(w.x) || !std::isfinite(w.y) || !std::isfinite(w.Q)) {
            throw InvalidParameter("Well coordinates and rates must be finite");
        }
        if (!(w.r_well > 0.0)) {
            throw InvalidParameter("Well radius must be positive");
        }
    }
    if (!xs.allFinite() || !ys.allFinite()) {
        throw InvalidParameter("Observation coordinates must be finite");
    }
}

Real SuperpositionEngine::drawdown(const std::vector<WellSource>& wells,
                                   Real x, Real y, Real t) const {
    Vector xs(1), ys(1);
    xs << x;
    ys << y;
    return drawdown(wells, xs, ys, t)(0);
}

Vector SuperpositionEngine::drawdown(const std::vector<WellSource>& wells,
                                     const Vector& xs, const Vector& ys,
                                     Real t) const {
    check_inputs(wells, xs, ys, t);

    const Index n_points = xs.size();
    const Index n_wells = static_cast<Index>(wells.size());
    Vector s = Vector::Zero(n_points);

    ParallelError error;
    #pragma omp parallel for
    for (Index k = 0; k < n_points; ++k) {
        try {
            Real total = 0.0;
            for (Index i = 0; i < n_wells; ++i) {
                const WellSource& w = wells[i];
                Real r = std::max(std::hypot(xs(k) - w.x, ys(k) - w.y), w.r_well);
                total += model_.drawdown(r, t, w.Q, method_);
            }
            s(k) = total;
        } catch (...) {
            error.capture(k);
        }
    }
    error.rethrow();
    return s;
}

Vector SuperpositionEngine::drawdown(const WellField& field,
                                     const Vector& xs, const Vector& ys,
                                     Real t) const {
    return drawdown(sources(field), xs, ys, t);
}

Vector SuperpositionEngine::drawdown_history(const std::vector<WellSource>& wells,
                                             Real x, Real y,
                                             const Vector& times) const {
    Vector s(times.size());
    Vector xs(1), ys(1);
    xs << x;
    ys << y;
    for (Index k = 0; k < times.size(); ++k) {
        s(k) = drawdown(wells, xs, ys, times(k))(0);
    }
    return s;
}

Matrix SuperpositionEngine::response_matrix(const Vector& well_x, const Vector& well_y,
                                            const Vector& well_r,
                                            const Vector& xs, const Vector& ys,
                                            Real t) const {
    if (well_x.size() != well_y.size() || well_x.size() != well_r.size()) {
        throw InvalidParameter("Well coordinate and radius arrays differ in length");
    }
    std::vector<WellSource> wells(well_x.size());
    for (Index i = 0; i < well_x.size(); ++i) {
        wells[i] = {well_x(i), well_y(i), 1.0, well_r(i)};
    }
    check_inputs(wells, xs, ys, t);

    const Index n_points = xs.size();
    const Index n_wells = well_x.size();
    Matrix A(n_points, n_wells);

    ParallelError error;
    #pragma omp parallel for
    for (Index j = 0; j < n_points; ++j) {
        try {
            for (Index i = 0; i < n_wells; ++i) {
                Real r = std::max(std::hypot(xs(j) - well_x(i), ys(j) - well_y(i)), well_r(i));
                A(j, i) = model_.unit_drawdown(r, t, method_);
            }
        } catch (...) {
            error.capture(j);
        }
    }
    error.rethrow();
    return A;
}

Matrix SuperpositionEngine::response_matrix(const WellField& field,
                                            const std::vector<ConstraintPoint>& points,
                                            Real t) const {
    Vector xs(points.size()), ys(points.size());
    for (Size j = 0; j < points.size(); ++j) {
        xs(j) = points[j].x;
        ys(j) = points[j].y;
    }
    return response_matrix(field.x(), field.y(), field.radii(), xs, ys, t);
}

std::vector<WellSource> SuperpositionEngine::sources(const WellField& field) {
    std::vector<WellSource> out;
    out.reserve(field.size());
    for (const auto& w : field.wells()) {
        out.push_back({w.x(), w.y(), w.rate(), w.radius()});
    }
    return out;
}

Vector superpose(const std::vector<WellSource>& wells,
                 const Vector& xs, const Vector& ys, Real t,
                 const AquiferParameters& params, DrawdownMethod method) {
    SuperpositionEngine engine(params, method);
    return engine.drawdown(wells, xs, ys, t);
}

} // namespace aqopt
