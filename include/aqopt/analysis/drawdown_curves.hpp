/**
 * @file drawdown_curves.hpp
 * @brief Pumping-test style analyses built on the drawdown kernels
 *
 * - Distance-drawdown s(r) at fixed t and time-drawdown s(t) at fixed r
 * - Drawdown over a rectilinear grid and the resulting radius of influence
 * - Well interference coefficient
 * - One-at-a-time sensitivity of drawdown to Q, T and S
 */

#pragma once

#include "../core/types.hpp"
#include "../physics/aquifer.hpp"
#include "../wells/well_field.hpp"
#include <iosfwd>
#include <vector>

namespace aqopt {

/// s(r) for one well at fixed time; radii below r_well are floored
Vector distance_drawdown_curve(const Vector& radii, Real t, Real Q,
                               const AquiferParameters& params,
                               DrawdownMethod method = DrawdownMethod::Theis,
                               Real r_well = constants::DEFAULT_WELL_RADIUS);

/// s(t) for one well at fixed distance
Vector time_drawdown_curve(Real r, const Vector& times, Real Q,
                           const AquiferParameters& params,
                           DrawdownMethod method = DrawdownMethod::Theis);

/// n values spaced evenly in log10 between lo and hi (both > 0)
Vector log_space(Real lo, Real hi, Index n);

/**
 * @brief Total drawdown of a field on the grid xs × ys
 *
 * @return Matrix with rows indexed by y and columns by x
 */
Matrix drawdown_grid(const WellField& field, const Vector& xs, const Vector& ys,
                     Real t, const AquiferParameters& params,
                     DrawdownMethod method = DrawdownMethod::Theis);

/**
 * @brief Largest distance from a grid node with s > threshold to its nearest well
 *
 * Returns 0 when no node exceeds the threshold. Throws InvalidParameter
 * when the field has no wells.
 */
Real radius_of_influence(const WellField& field, const Vector& xs, const Vector& ys,
                         const Matrix& s, Real threshold);

/**
 * @brief Interference coefficient at (x, y)
 *
 * Ratio of the superposed drawdown of the whole field to the drawdown of
 * the reference well alone. Values > 1 measure the contribution of
 * neighbouring wells.
 */
Real interference_coefficient(const WellField& field, Index reference_well,
                              Real x, Real y, Real t,
                              const AquiferParameters& params,
                              DrawdownMethod method = DrawdownMethod::Theis);

/**
 * @brief One-at-a-time sensitivity of Theis drawdown at (r, t)
 */
struct SensitivityResult {
    Real base_drawdown = 0.0;
    std::vector<Real> factors;
    std::vector<Real> drawdown_Q;   ///< Q scaled by factor
    std::vector<Real> drawdown_T;   ///< T scaled by factor
    std::vector<Real> drawdown_S;   ///< S scaled by factor

    /// Percent change relative to base, for one of the series above
    std::vector<Real> percent_change(const std::vector<Real>& series) const;

    void print(std::ostream& os) const;
};

/**
 * @brief Scale Q, T and S in turn by each factor
 *
 * Factors scaling S to 1 or above throw InvalidParameter.
 */
SensitivityResult drawdown_sensitivity(Real r, Real t, Real Q,
                                       const AquiferParameters& params,
                                       const std::vector<Real>& factors);

} // namespace aqopt
