#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <aqopt/aqopt.hpp>
#include <limits>

using namespace aqopt;
using Catch::Approx;

TEST_CASE("LinearProgram maximization", "[lp]") {
    // max 3x + 2y  s.t.  x + y <= 4,  x + 3y <= 6,  0 <= x <= 3
    LinearProgram lp(2);
    Vector c(2);
    c << 3.0, 2.0;
    lp.set_objective(c, true);

    Matrix A(2, 2);
    A << 1.0, 1.0,
         1.0, 3.0;
    Vector b(2);
    b << 4.0, 6.0;
    lp.add_constraints(A, b);

    Vector lower = Vector::Zero(2);
    Vector upper(2);
    upper << 3.0, std::numeric_limits<Real>::infinity();
    lp.set_bounds(lower, upper);

    REQUIRE(lp.n_vars() == 2);
    REQUIRE(lp.n_constraints() == 2);

    LPSolution sol = lp.solve();
    REQUIRE(sol.success());
    REQUIRE(sol.x.size() == 2);
    REQUIRE(sol.x(0) == Approx(3.0));
    REQUIRE(sol.x(1) == Approx(1.0));
    REQUIRE(sol.objective == Approx(11.0));
}

TEST_CASE("LinearProgram minimization", "[lp]") {
    // min x + 2y  s.t.  x + y >= 2 written as -x - y <= -2
    LinearProgram lp(2);
    Vector c(2);
    c << 1.0, 2.0;
    lp.set_objective(c, false);

    Matrix A(1, 2);
    A << -1.0, -1.0;
    Vector b(1);
    b << -2.0;
    lp.add_constraints(A, b);

    LPSolution sol = lp.solve();
    REQUIRE(sol.status == LPStatus::Optimal);
    REQUIRE(sol.x(0) == Approx(2.0));
    REQUIRE(sol.x(1) == Approx(0.0).margin(1e-9));
    REQUIRE(sol.objective == Approx(2.0));
}

TEST_CASE("LinearProgram infeasible and unbounded", "[lp]") {
    SECTION("Row conflicts with bounds") {
        LinearProgram lp(1);
        Vector c(1);
        c << 1.0;
        lp.set_objective(c, true);

        Matrix A(1, 1);
        A << -1.0;
        Vector b(1);
        b << -5.0;
        lp.add_constraints(A, b);

        Vector lower = Vector::Zero(1);
        Vector upper = Vector::Constant(1, 3.0);
        lp.set_bounds(lower, upper);

        LPSolution sol = lp.solve();
        REQUIRE(sol.status == LPStatus::Infeasible);
        REQUIRE_FALSE(sol.success());
        REQUIRE(sol.x.size() == 0);
    }

    SECTION("Open upper bound") {
        LinearProgram lp(1);
        Vector c(1);
        c << 1.0;
        lp.set_objective(c, true);

        LPSolution sol = lp.solve();
        REQUIRE(sol.status == LPStatus::Unbounded);
    }
}

TEST_CASE("LinearProgram argument checks", "[lp]") {
    REQUIRE_THROWS_AS(LinearProgram(0), InvalidParameter);

    LinearProgram lp(2);
    REQUIRE_THROWS_AS(lp.set_objective(Vector::Ones(3), true), InvalidParameter);
    REQUIRE_THROWS_AS(lp.add_constraints(Matrix::Ones(1, 3), Vector::Ones(1)),
                      InvalidParameter);
    REQUIRE_THROWS_AS(lp.set_bounds(Vector::Constant(2, 2.0), Vector::Ones(2)),
                      InvalidParameter);

    REQUIRE(to_string(LPStatus::Optimal) == "optimal");
    REQUIRE(to_string(LPStatus::Infeasible) == "infeasible");
}
