/**
 * @file aquifer.cpp
 * @brief AquiferParameters validation and AquiferModel
 */

#include "aqopt/physics/aquifer.hpp"
#include "aqopt/physics/well_functions.hpp"
#include "aqopt/core/errors.hpp"
#include <cmath>
#include <ostream>
#include <string>

namespace aqopt {

// ============================================================================
// AquiferParameters
// ============================================================================

void AquiferParameters::validate() const {
    if (!(T > 0.0) || !std::isfinite(T)) {
        throw InvalidParameter("Transmissivity must be positive, got T = " + std::to_string(T));
    }
    if (!(S > 0.0 && S < 1.0)) {
        throw InvalidParameter("Storativity must satisfy 0 < S < 1, got S = " + std::to_string(S));
    }
}

void AquiferParameters::print(std::ostream& os) const {
    os << "Aquifer:\n";
    os << "  Transmissivity T: " << T << "\n";
    os << "  Storativity S:    " << S << "\n";
}

// ============================================================================
// AquiferModel
// ============================================================================

AquiferModel::AquiferModel(const AquiferParameters& params)
    : params_(params) {
    params_.validate();
}

AquiferModel::AquiferModel(Real T, Real S)
    : AquiferModel(AquiferParameters(T, S)) {}

Real AquiferModel::drawdown(Real r, Real t, Real Q, DrawdownMethod method) const {
    return aqopt::drawdown(method, r, t, Q, params_.T, params_.S);
}

Real AquiferModel::unit_drawdown(Real r, Real t, DrawdownMethod method) const {
    return aqopt::drawdown(method, r, t, 1.0, params_.T, params_.S);
}

Real AquiferModel::theis(Real r, Real t, Real Q) const {
    return theis_solution(r, t, Q, params_.T, params_.S);
}

Real AquiferModel::cooper_jacob(Real r, Real t, Real Q) const {
    return cooper_jacob_solution(r, t, Q, params_.T, params_.S);
}

Real AquiferModel::thiem(Real r, Real Q, Real R) const {
    return thiem_solution(r, Q, params_.T, R);
}

Real AquiferModel::u(Real r, Real t) const {
    return theis_u(r, t, params_.T, params_.S);
}

bool AquiferModel::cooper_jacob_valid(Real r, Real t) const {
    return aqopt::cooper_jacob_valid(r, t, params_.T, params_.S);
}

Real AquiferModel::cooper_jacob_min_time(Real r) const {
    return aqopt::cooper_jacob_min_time(r, params_.T, params_.S);
}

} // namespace aqopt
