/**
 * @file well_field.hpp
 * @brief Ordered collection of pumping wells
 *
 * A WellField owns its wells but no aquifer state; the same field can
 * be evaluated against any AquiferParameters. Well names are unique
 * within a field. Wells added without a name are called W1, W2, ...
 */

#pragma once

#include "pumping_well.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace aqopt {

class WellField {
public:
    WellField() = default;
    explicit WellField(std::string name) : name_(std::move(name)) {}

    // ========================================================================
    // Membership
    // ========================================================================

    /// Add a well; throws InvalidParameter on a duplicate name
    void add_well(PumpingWell well);

    /// Remove by name; throws InvalidParameter if absent
    void remove_well(const std::string& name);

    /// Remove by position
    void remove_well(Index i);

    Index size() const { return static_cast<Index>(wells_.size()); }
    bool empty() const { return wells_.empty(); }

    const PumpingWell& well(Index i) const;
    PumpingWell& well(Index i);
    const std::vector<PumpingWell>& wells() const { return wells_; }

    /// Position of the named well, or -1
    Index index_of(const std::string& name) const;

    const std::string& name() const { return name_; }

    // ========================================================================
    // Rates and geometry (for vectorized consumers)
    // ========================================================================

    /// Σ Q_i
    Real total_rate() const;

    Vector x() const;
    Vector y() const;
    Vector rates() const;
    Vector radii() const;

    /// Assign all rates at once; size must match
    void set_rates(const Vector& Q);

    // ========================================================================
    // Drawdown
    // ========================================================================

    /**
     * @brief Superposed drawdown of every member well
     *
     * Thin wrapper over SuperpositionEngine.
     *
     * @throws InvalidParameter if the field is empty
     */
    Vector compute_total_drawdown(const Vector& xs, const Vector& ys, Real t,
                                  const AquiferParameters& params,
                                  DrawdownMethod method = DrawdownMethod::Theis) const;

    Real compute_total_drawdown(Real x, Real y, Real t,
                                const AquiferParameters& params,
                                DrawdownMethod method = DrawdownMethod::Theis) const;

    void print(std::ostream& os) const;

private:
    std::string name_;
    std::vector<PumpingWell> wells_;
};

} // namespace aqopt
