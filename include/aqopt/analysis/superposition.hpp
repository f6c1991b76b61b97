/**
 * @file superposition.hpp
 * @brief Linear superposition of single-well drawdown fields
 *
 * The confined-aquifer diffusion equation is linear in Q, so the
 * drawdown of n wells is the sum of the single-well solutions:
 *
 *   s_total(p, t) = Σ_i Q_i · k(|p - w_i|, t)
 *
 * where k is the per-unit-rate Theis or Cooper-Jacob kernel. Each
 * well's distance is floored at its radius (r = max(|p - w_i|, r_well)).
 *
 * The engine does NOT check the Cooper-Jacob bound u < 0.01. Callers
 * choosing CooperJacob are responsible for applicability.
 */

#pragma once

#include "../core/types.hpp"
#include "../physics/aquifer.hpp"
#include "../wells/pumping_well.hpp"
#include "../wells/well_field.hpp"
#include <vector>

namespace aqopt {

/**
 * @brief Minimal well description for superposition: (x, y, Q, r_well)
 */
struct WellSource {
    Real x = 0.0;
    Real y = 0.0;
    Real Q = 0.0;
    Real r_well = constants::DEFAULT_WELL_RADIUS;
};

class SuperpositionEngine {
public:
    SuperpositionEngine(const AquiferParameters& params, DrawdownMethod method);

    const AquiferModel& aquifer() const { return model_; }
    DrawdownMethod method() const { return method_; }

    /// Total drawdown at one point
    Real drawdown(const std::vector<WellSource>& wells, Real x, Real y, Real t) const;

    /// Total drawdown at each (xs(k), ys(k))
    Vector drawdown(const std::vector<WellSource>& wells,
                    const Vector& xs, const Vector& ys, Real t) const;

    Vector drawdown(const WellField& field,
                    const Vector& xs, const Vector& ys, Real t) const;

    /// Total drawdown at one point over a series of times
    Vector drawdown_history(const std::vector<WellSource>& wells,
                            Real x, Real y, const Vector& times) const;

    /**
     * @brief Unit response matrix A(j, i)
     *
     * Drawdown at point j per unit rate of well i, so that
     * s = A · Q for any rate vector Q.
     */
    Matrix response_matrix(const Vector& well_x, const Vector& well_y,
                           const Vector& well_r,
                           const Vector& xs, const Vector& ys, Real t) const;

    Matrix response_matrix(const WellField& field,
                           const std::vector<ConstraintPoint>& points, Real t) const;

    /// Convert a WellField into superposition sources
    static std::vector<WellSource> sources(const WellField& field);

private:
    AquiferModel model_;
    DrawdownMethod method_;

    void check_inputs(const std::vector<WellSource>& wells,
                      const Vector& xs, const Vector& ys, Real t) const;
};

/**
 * @brief Free-function form: superposed drawdown of (x_i, y_i, Q_i) wells
 */
Vector superpose(const std::vector<WellSource>& wells,
                 const Vector& xs, const Vector& ys, Real t,
                 const AquiferParameters& params, DrawdownMethod method);

} // namespace aqopt
