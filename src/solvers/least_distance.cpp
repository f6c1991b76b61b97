/**
 * @file least_distance.cpp
 * @brief Lawson-Hanson NNLS and the LDP form of the SQP subproblem
 */

#include "aqopt/solvers/least_distance.hpp"
#include "aqopt/core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace aqopt {

// ============================================================================
// NNLS
// ============================================================================

namespace {

/// Least squares on the passive columns of A
Vector passive_solve(const Matrix& A, const Vector& b, const std::vector<bool>& passive) {
    std::vector<Index> cols;
    for (Index j = 0; j < static_cast<Index>(passive.size()); ++j) {
        if (passive[j]) cols.push_back(j);
    }
    Matrix Ap(A.rows(), static_cast<Index>(cols.size()));
    for (Size k = 0; k < cols.size(); ++k) {
        Ap.col(k) = A.col(cols[k]);
    }
    Vector zp = Ap.colPivHouseholderQr().solve(b);

    Vector z = Vector::Zero(A.cols());
    for (Size k = 0; k < cols.size(); ++k) {
        z(cols[k]) = zp(k);
    }
    return z;
}

} // namespace

NNLSResult nnls(const Matrix& A, const Vector& b, Index max_iterations, Real tolerance) {
    if (A.rows() != b.size()) {
        throw InvalidParameter("NNLS: matrix rows do not match right-hand side");
    }
    const Index n = A.cols();
    if (max_iterations <= 0) {
        max_iterations = std::max<Index>(3 * n, 30);
    }

    NNLSResult result;
    result.x = Vector::Zero(n);
    Vector& x = result.x;

    std::vector<bool> passive(n, false);
    std::vector<bool> excluded(n, false);
    const Real w_tol = tolerance * (1.0 + A.norm() * b.norm());

    Vector w = A.transpose() * (b - A * x);

    while (true) {
        // Most violated dual variable outside the passive set
        Index t = -1;
        Real w_max = w_tol;
        for (Index j = 0; j < n; ++j) {
            if (!passive[j] && !excluded[j] && w(j) > w_max) {
                w_max = w(j);
                t = j;
            }
        }
        if (t < 0) {
            result.converged = true;
            break;
        }
        passive[t] = true;

        bool first_pass = true;
        bool budget_exhausted = false;
        while (true) {
            if (++result.iterations > max_iterations) {
                budget_exhausted = true;
                break;
            }

            Vector z = passive_solve(A, b, passive);

            // Roundoff can make the entering coefficient non-positive
            if (first_pass && z(t) <= 0.0) {
                passive[t] = false;
                excluded[t] = true;
                break;
            }
            first_pass = false;

            bool all_positive = true;
            for (Index j = 0; j < n; ++j) {
                if (passive[j] && z(j) <= 0.0) {
                    all_positive = false;
                    break;
                }
            }
            if (all_positive) {
                x = z;
                std::fill(excluded.begin(), excluded.end(), false);
                break;
            }

            // Step back to the boundary of the feasible region
            Real alpha = 1.0;
            for (Index j = 0; j < n; ++j) {
                if (passive[j] && z(j) <= 0.0) {
                    alpha = std::min(alpha, x(j) / (x(j) - z(j)));
                }
            }
            x += alpha * (z - x);

            for (Index j = 0; j < n; ++j) {
                if (passive[j] && x(j) <= tolerance) {
                    x(j) = 0.0;
                    passive[j] = false;
                }
            }
        }

        if (budget_exhausted) break;
        w = A.transpose() * (b - A * x);
    }

    result.residual_norm = (A * x - b).norm();
    return result;
}

// ============================================================================
// LeastDistanceSolver
// ============================================================================

bool LeastDistanceSolver::factorize(const Matrix& B) {
    regularized_ = false;
    llt_.compute(B);
    if (llt_.info() == Eigen::Success) return true;

    Real shift = 1e-10 * std::max<Real>(1.0, B.diagonal().cwiseAbs().maxCoeff());
    for (int attempt = 0; attempt < 12; ++attempt) {
        Matrix Bs = B;
        Bs.diagonal().array() += shift;
        llt_.compute(Bs);
        if (llt_.info() == Eigen::Success) {
            regularized_ = true;
            return true;
        }
        shift *= 10.0;
    }
    return false;
}

QPResult LeastDistanceSolver::solve(const Matrix& B, const Vector& g,
                                    const Matrix& C, const Vector& e) {
    const Index n = g.size();
    const Index m = C.rows();
    if (B.rows() != n || B.cols() != n || C.cols() != n || e.size() != m) {
        throw InvalidParameter("QP subproblem dimensions are inconsistent");
    }

    QPResult result;
    if (!factorize(B)) {
        result.message = "Hessian approximation is not positive definite";
        return result;
    }

    const auto L = llt_.matrixL();
    Vector Linv_g = L.solve(g);
    Vector Binv_g = llt_.solve(g);

    // No constraints: unconstrained Newton step
    if (m == 0) {
        result.d = -Binv_g;
        result.multipliers.resize(0);
        result.feasible = true;
        result.converged = true;
        result.message = "Unconstrained step";
        return result;
    }

    // Eᵀ = L⁻¹Cᵀ (n × m), f = e + C B⁻¹ g
    Matrix Et = L.solve(C.transpose());
    Vector f = e + C * Binv_g;

    Matrix F(n + 1, m);
    F.topRows(n) = Et;
    F.row(n) = f.transpose();
    Vector rhs = Vector::Zero(n + 1);
    rhs(n) = 1.0;

    NNLSResult ls = nnls(F, rhs, max_iterations, tolerance);
    result.iterations = ls.iterations;
    result.converged = ls.converged;

    Real fac = 1.0 - f.dot(ls.x);
    if (ls.residual_norm <= 1e-12 || fac <= 1e-12) {
        result.feasible = false;
        result.message = "Linearized constraints are incompatible";
        return result;
    }

    result.feasible = true;
    result.multipliers = ls.x / fac;
    Vector z = Et * result.multipliers;
    result.d = llt_.matrixU().solve(z - Linv_g);
    result.message = ls.converged ? "QP solved" : "QP iteration budget exhausted";
    return result;
}

} // namespace aqopt
