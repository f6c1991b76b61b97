/**
 * @file pumping_well.hpp
 * @brief A single pumping well and the constraint points it affects
 */

#pragma once

#include "../core/types.hpp"
#include "../physics/aquifer.hpp"
#include <string>

namespace aqopt {

/**
 * @brief Fully penetrating well pumping at a constant rate
 *
 * Sign convention: Q > 0 is extraction, Q < 0 injection.
 * The well radius doubles as the distance floor applied when the
 * observation point lies inside the well bore.
 */
class PumpingWell {
public:
    PumpingWell(Real x, Real y, Real Q,
                std::string name = "",
                Real r_well = constants::DEFAULT_WELL_RADIUS);

    Real x() const { return x_; }
    Real y() const { return y_; }
    Vec2 position() const { return Vec2(x_, y_); }
    Real rate() const { return Q_; }
    Real radius() const { return r_well_; }
    const std::string& name() const { return name_; }

    /// Update the pumping rate (used between optimizer runs)
    void set_rate(Real Q);
    void set_name(std::string name) { name_ = std::move(name); }

    /// Distance to (x, y), floored at the well radius
    Real distance_to(Real x, Real y) const;

    /**
     * @brief Drawdown this well alone causes at (x, y) after time t
     */
    Real compute_drawdown(Real x, Real y, Real t,
                          const AquiferParameters& params,
                          DrawdownMethod method = DrawdownMethod::Theis) const;

    /// Vectorized over observation points
    Vector compute_drawdown(const Vector& xs, const Vector& ys, Real t,
                            const AquiferParameters& params,
                            DrawdownMethod method = DrawdownMethod::Theis) const;

private:
    Real x_;
    Real y_;
    Real Q_;
    Real r_well_;
    std::string name_;
};

/**
 * @brief Location with a minimum-head (or maximum-drawdown) requirement
 *
 * h_min and s_max are interchangeable given the undisturbed head h0:
 * s_max = h0 - h_min.
 */
struct ConstraintPoint {
    Real x = 0.0;
    Real y = 0.0;
    Real limit = 0.0;               ///< h_min or s_max depending on kind
    LimitKind kind = LimitKind::MinHead;
    std::string name;

    static ConstraintPoint from_min_head(Real x, Real y, Real h_min,
                                         std::string name = "");
    static ConstraintPoint from_max_drawdown(Real x, Real y, Real s_max,
                                             std::string name = "");

    /// Largest drawdown the point tolerates: h0 - h_min, or s_max
    Real allowable_drawdown(Real h0) const;

    /// Lowest acceptable head: h_min, or h0 - s_max
    Real required_head(Real h0) const;
};

} // namespace aqopt
