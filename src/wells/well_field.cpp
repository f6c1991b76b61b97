/**
 * @file well_field.cpp
 * @brief WellField membership, rate arrays and drawdown
 */

#include "aqopt/wells/well_field.hpp"
#include "aqopt/analysis/superposition.hpp"
#include "aqopt/core/errors.hpp"
#include <ostream>

namespace aqopt {

void WellField::add_well(PumpingWell well) {
    if (well.name().empty()) {
        Index k = size() + 1;
        while (index_of("W" + std::to_string(k)) >= 0) ++k;
        well.set_name("W" + std::to_string(k));
    }
    if (index_of(well.name()) >= 0) {
        throw InvalidParameter("Duplicate well name in field: " + well.name());
    }
    wells_.push_back(std::move(well));
}

void WellField::remove_well(const std::string& name) {
    Index i = index_of(name);
    if (i < 0) {
        throw InvalidParameter("No well named " + name);
    }
    wells_.erase(wells_.begin() + i);
}

void WellField::remove_well(Index i) {
    if (i < 0 || i >= size()) {
        throw InvalidParameter("Well index out of range: " + std::to_string(i));
    }
    wells_.erase(wells_.begin() + i);
}

const PumpingWell& WellField::well(Index i) const {
    if (i < 0 || i >= size()) {
        throw InvalidParameter("Well index out of range: " + std::to_string(i));
    }
    return wells_[i];
}

PumpingWell& WellField::well(Index i) {
    if (i < 0 || i >= size()) {
        throw InvalidParameter("Well index out of range: " + std::to_string(i));
    }
    return wells_[i];
}

Index WellField::index_of(const std::string& name) const {
    for (Index i = 0; i < size(); ++i) {
        if (wells_[i].name() == name) return i;
    }
    return -1;
}

Real WellField::total_rate() const {
    Real total = 0.0;
    for (const auto& w : wells_) total += w.rate();
    return total;
}

Vector WellField::x() const {
    Vector v(size());
    for (Index i = 0; i < size(); ++i) v(i) = wells_[i].x();
    return v;
}

Vector WellField::y() const {
    Vector v(size());
    for (Index i = 0; i < size(); ++i) v(i) = wells_[i].y();
    return v;
}

Vector WellField::rates() const {
    Vector v(size());
    for (Index i = 0; i < size(); ++i) v(i) = wells_[i].rate();
    return v;
}

Vector WellField::radii() const {
    Vector v(size());
    for (Index i = 0; i < size(); ++i) v(i) = wells_[i].radius();
    return v;
}

void WellField::set_rates(const Vector& Q) {
    if (Q.size() != size()) {
        throw InvalidParameter("Rate vector size " + std::to_string(Q.size()) +
                               " does not match well count " + std::to_string(size()));
    }
    for (Index i = 0; i < size(); ++i) {
        wells_[i].set_rate(Q(i));
    }
}

Vector WellField::compute_total_drawdown(const Vector& xs, const Vector& ys, Real t,
                                         const AquiferParameters& params,
                                         DrawdownMethod method) const {
    SuperpositionEngine engine(params, method);
    return engine.drawdown(*this, xs, ys, t);
}

Real WellField::compute_total_drawdown(Real x, Real y, Real t,
                                       const AquiferParameters& params,
                                       DrawdownMethod method) const {
    Vector xs(1), ys(1);
    xs << x;
    ys << y;
    return compute_total_drawdown(xs, ys, t, params, method)(0);
}

void WellField::print(std::ostream& os) const {
    os << "Well field" << (name_.empty() ? "" : " '" + name_ + "'")
       << ": " << size() << " wells, total Q = " << total_rate() << "\n";
    for (const auto& w : wells_) {
        os << "  " << w.name() << " (" << w.x() << ", " << w.y() << ")"
           << " Q = " << w.rate() << "\n";
    }
}

} // namespace aqopt
