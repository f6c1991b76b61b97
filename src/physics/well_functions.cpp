/**
 * @file well_functions.cpp
 * @brief Theis, Cooper-Jacob and Thiem kernels
 */

#include "aqopt/physics/well_functions.hpp"
#include "aqopt/core/errors.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace aqopt {

namespace {

constexpr Index MAX_SERIES_TERMS = 200;
constexpr Index MAX_FRACTION_TERMS = 200;
constexpr Real SERIES_EPS = 1e-17;
constexpr Real FRACTION_EPS = 1e-16;
constexpr Real FPMIN = 1e-300;

void check_aquifer(Real T, Real S) {
    if (!(T > 0.0) || !std::isfinite(T)) {
        throw InvalidParameter("Transmissivity must be positive, got T = " + std::to_string(T));
    }
    if (!(S > 0.0 && S < 1.0)) {
        throw InvalidParameter("Storativity must satisfy 0 < S < 1, got S = " + std::to_string(S));
    }
}

void check_radius(Real r) {
    if (!(r > 0.0) || !std::isfinite(r)) {
        throw NumericalDomainError("Radial distance must be positive, got r = " + std::to_string(r));
    }
}

void check_time(Real t) {
    if (!(t > 0.0) || !std::isfinite(t)) {
        throw NumericalDomainError("Elapsed time must be positive, got t = " + std::to_string(t));
    }
}

// E1(u) = -γ - ln(u) - Σ_{k>=1} (-u)^k / (k·k!)
Real e1_series(Real u) {
    Real sum = 0.0;
    Real power = 1.0;  // (-u)^k / k!
    for (Index k = 1; k <= MAX_SERIES_TERMS; ++k) {
        power *= -u / static_cast<Real>(k);
        Real term = power / static_cast<Real>(k);
        sum += term;
        if (std::abs(term) < SERIES_EPS * std::abs(sum)) break;
    }
    return -constants::EULER_GAMMA - std::log(u) - sum;
}

// E1(u) = e^(-u) · 1/(u+1- 1/(u+3- 4/(u+5- ...))), modified Lentz
Real e1_continued_fraction(Real u) {
    Real b = u + 1.0;
    Real c = 1.0 / FPMIN;
    Real d = 1.0 / b;
    Real h = d;
    for (Index i = 1; i <= MAX_FRACTION_TERMS; ++i) {
        Real a = -static_cast<Real>(i * i);
        b += 2.0;
        d = 1.0 / (a * d + b);
        c = b + a / c;
        Real del = c * d;
        h *= del;
        if (std::abs(del - 1.0) < FRACTION_EPS) break;
    }
    return h * std::exp(-u);
}

} // namespace

Real theis_well_function(Real u) {
    if (!(u > 0.0) || !std::isfinite(u)) {
        throw NumericalDomainError("Well function requires u > 0, got u = " + std::to_string(u));
    }
    if (u <= 1.0) {
        return e1_series(u);
    }
    return e1_continued_fraction(u);
}

Real jacob_well_function(Real u) {
    if (!(u > 0.0) || !std::isfinite(u)) {
        throw NumericalDomainError("Well function requires u > 0, got u = " + std::to_string(u));
    }
    return -constants::EULER_GAMMA - std::log(u);
}

Real theis_u(Real r, Real t, Real T, Real S) {
    check_aquifer(T, S);
    check_radius(r);
    check_time(t);
    return r * r * S / (4.0 * T * t);
}

Real theis_solution(Real r, Real t, Real Q, Real T, Real S) {
    Real u = theis_u(r, t, T, S);
    return Q / (4.0 * constants::PI * T) * theis_well_function(u);
}

Real cooper_jacob_solution(Real r, Real t, Real Q, Real T, Real S) {
    check_aquifer(T, S);
    check_radius(r);
    check_time(t);
    Real log_term = std::log(2.25 * T * t / (r * r * S));
    if (log_term <= 0.0) return 0.0;
    return Q / (4.0 * constants::PI * T) * log_term;
}

Real thiem_solution(Real r, Real Q, Real T, Real R) {
    if (!(T > 0.0) || !std::isfinite(T)) {
        throw InvalidParameter("Transmissivity must be positive, got T = " + std::to_string(T));
    }
    if (!(R > 0.0) || !std::isfinite(R)) {
        throw InvalidParameter("Radius of influence must be positive, got R = " + std::to_string(R));
    }
    check_radius(r);
    if (r >= R) return 0.0;
    return Q / (2.0 * constants::PI * T) * std::log(R / r);
}

Real thiem_head(Real r, Real Q, Real T, Real R, Real h0) {
    return h0 - thiem_solution(r, Q, T, R);
}

Real cooper_jacob_min_time(Real r, Real T, Real S) {
    check_aquifer(T, S);
    check_radius(r);
    return r * r * S / (4.0 * T * constants::COOPER_JACOB_U_LIMIT);
}

bool cooper_jacob_valid(Real r, Real t, Real T, Real S) {
    return theis_u(r, t, T, S) < constants::COOPER_JACOB_U_LIMIT;
}

Real drawdown(DrawdownMethod method, Real r, Real t, Real Q, Real T, Real S) {
    switch (method) {
        case DrawdownMethod::Theis:
            return theis_solution(r, t, Q, T, S);
        case DrawdownMethod::CooperJacob:
            return cooper_jacob_solution(r, t, Q, T, S);
    }
    throw InvalidParameter("Unknown drawdown method");
}

} // namespace aqopt
