/**
 * @file aquifer.hpp
 * @brief Aquifer parameters and the analytical aquifer model
 *
 * The aquifer is confined, homogeneous, isotropic and of infinite
 * areal extent. Two scalars describe it completely:
 *   T = transmissivity [L²/T]
 *   S = storativity [-]
 */

#pragma once

#include "../core/types.hpp"
#include <iosfwd>

namespace aqopt {

/**
 * @brief Transmissivity and storativity of a confined aquifer
 */
struct AquiferParameters {
    Real T = 0.0;                   ///< Transmissivity [L²/T], > 0
    Real S = 0.0;                   ///< Storativity [-], 0 < S < 1

    AquiferParameters() = default;
    AquiferParameters(Real transmissivity, Real storativity)
        : T(transmissivity), S(storativity) {}

    /// Throws InvalidParameter unless T > 0 and 0 < S < 1
    void validate() const;

    /// Hydraulic diffusivity T/S [L²/T]
    Real diffusivity() const { return T / S; }

    void print(std::ostream& os) const;
};

/**
 * @brief Immutable aquifer with the drawdown kernels bound to its T and S
 *
 * The parameters are validated once at construction.
 */
class AquiferModel {
public:
    explicit AquiferModel(const AquiferParameters& params);
    AquiferModel(Real T, Real S);

    const AquiferParameters& parameters() const { return params_; }
    Real transmissivity() const { return params_.T; }
    Real storativity() const { return params_.S; }

    /// Drawdown at distance r and time t for rate Q
    Real drawdown(Real r, Real t, Real Q, DrawdownMethod method) const;

    /// Drawdown per unit pumping rate (the superposition coefficient)
    Real unit_drawdown(Real r, Real t, DrawdownMethod method) const;

    Real theis(Real r, Real t, Real Q) const;
    Real cooper_jacob(Real r, Real t, Real Q) const;

    /// Steady-state drawdown with radius of influence R
    Real thiem(Real r, Real Q, Real R) const;

    /// Theis argument u = r²S/(4Tt)
    Real u(Real r, Real t) const;

    bool cooper_jacob_valid(Real r, Real t) const;
    Real cooper_jacob_min_time(Real r) const;

private:
    AquiferParameters params_;
};

} // namespace aqopt
