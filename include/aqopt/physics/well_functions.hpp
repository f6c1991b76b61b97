/**
 * @file well_functions.hpp
 * @brief Analytical drawdown kernels for a confined aquifer
 *
 * Closed-form solutions of the radial diffusion equation
 *
 *   S ∂s/∂t = T (∂²s/∂r² + (1/r) ∂s/∂r)
 *
 * for a fully penetrating well pumping at constant rate Q from a
 * homogeneous, isotropic aquifer of infinite extent:
 *
 *   Theis:         s = Q/(4πT) · W(u),            u = r²S/(4Tt)
 *   Cooper-Jacob:  s = Q/(4πT) · ln(2.25Tt/(r²S)), valid for u < 0.01
 *   Thiem:         s = Q/(2πT) · ln(R/r),          steady state
 *
 * All functions are pure. Non-physical aquifer parameters throw
 * InvalidParameter; arguments outside the kernel's domain (u <= 0,
 * t <= 0, r <= 0) throw NumericalDomainError. None of the kernels
 * apply a distance floor: callers substitute the well radius at r = 0.
 */

#pragma once

#include "../core/types.hpp"

namespace aqopt {

/**
 * @brief Theis well function W(u) = E1(u) = ∫_u^∞ e^(-y)/y dy
 *
 * Power series for u <= 1, continued fraction (modified Lentz) above.
 * Relative accuracy is near machine precision over 1e-10 <= u <= 700;
 * beyond that e^(-u) underflows and W returns 0.
 *
 * @throws NumericalDomainError if u <= 0 or u is not finite
 */
Real theis_well_function(Real u);

/**
 * @brief Small-u (Jacob) approximation W(u) ≈ -γ - ln(u)
 *
 * @throws NumericalDomainError if u <= 0
 */
Real jacob_well_function(Real u);

/// Theis argument u = r²S/(4Tt)
Real theis_u(Real r, Real t, Real T, Real S);

/**
 * @brief Theis drawdown s(r, t) = Q/(4πT) · W(r²S/(4Tt))
 *
 * @param r Distance from the well [L], must be > 0
 * @param t Time since pumping started [T], must be > 0
 * @param Q Pumping rate [L³/T], positive = extraction
 * @param T Transmissivity [L²/T]
 * @param S Storativity [-]
 */
Real theis_solution(Real r, Real t, Real Q, Real T, Real S);

/**
 * @brief Cooper-Jacob drawdown s = Q/(4πT) · ln(2.25Tt/(r²S))
 *
 * The applicability bound u < 0.01 is NOT checked; that is the
 * caller's contract. Beyond r = sqrt(2.25Tt/S) the logarithm turns
 * negative and the drawdown is clamped to 0.
 */
Real cooper_jacob_solution(Real r, Real t, Real Q, Real T, Real S);

/**
 * @brief Thiem steady-state drawdown s = Q/(2πT) · ln(R/r)
 *
 * @param R Radius of influence [L], must be > 0; s = 0 for r >= R
 */
Real thiem_solution(Real r, Real Q, Real T, Real R);

/// Thiem head h = h0 - s
Real thiem_head(Real r, Real Q, Real T, Real R, Real h0);

/// Time after which u < 0.01 at distance r: t = 25 r² S / T
Real cooper_jacob_min_time(Real r, Real T, Real S);

/// True if u(r, t) < 0.01
bool cooper_jacob_valid(Real r, Real t, Real T, Real S);

/// Dispatch to the Theis or Cooper-Jacob kernel
Real drawdown(DrawdownMethod method, Real r, Real t, Real Q, Real T, Real S);

} // namespace aqopt
