/**
 * @file test_well_functions.cpp
 * @brief Theis, Cooper-Jacob and Thiem kernels against tabulated values
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <aqopt/aqopt.hpp>
#include <cmath>
#include <limits>

using namespace aqopt;
using Catch::Approx;

TEST_CASE("Theis well function matches E1", "[well_functions]") {
    // Exponential integral E1(u), tabulated
    REQUIRE(theis_well_function(1e-6) == Approx(13.238295893062489).epsilon(1e-10));
    REQUIRE(theis_well_function(0.001) == Approx(6.331539364136149).epsilon(1e-10));
    REQUIRE(theis_well_function(0.01) == Approx(4.037929576538114).epsilon(1e-10));
    REQUIRE(theis_well_function(0.1) == Approx(1.8229239584193904).epsilon(1e-10));
    REQUIRE(theis_well_function(1.0) == Approx(0.21938393439552029).epsilon(1e-10));
    REQUIRE(theis_well_function(2.0) == Approx(0.04890051070806112).epsilon(1e-9));
    REQUIRE(theis_well_function(10.0) == Approx(4.156968929685324e-06).epsilon(1e-9));

    SECTION("Series and continued fraction agree at the switch") {
        Real below = theis_well_function(1.0 - 1e-9);
        Real above = theis_well_function(1.0 + 1e-9);
        REQUIRE(below == Approx(above).epsilon(1e-7));
    }

    SECTION("Strictly decreasing in u") {
        Real prev = theis_well_function(1e-8);
        for (Real u : {1e-6, 1e-4, 1e-2, 0.5, 1.5, 5.0, 20.0}) {
            Real w = theis_well_function(u);
            REQUIRE(w < prev);
            REQUIRE(w > 0.0);
            prev = w;
        }
    }

    SECTION("Non-positive or non-finite u is rejected") {
        REQUIRE_THROWS_AS(theis_well_function(0.0), NumericalDomainError);
        REQUIRE_THROWS_AS(theis_well_function(-1.0), NumericalDomainError);
        REQUIRE_THROWS_AS(theis_well_function(std::numeric_limits<Real>::quiet_NaN()),
                          NumericalDomainError);
        REQUIRE_THROWS_AS(jacob_well_function(0.0), NumericalDomainError);
    }
}

TEST_CASE("Single well drawdown", "[well_functions]") {
    const Real T = 500.0, S = 2e-4, Q = 1000.0, r = 100.0, t = 1.0;

    SECTION("Theis argument") {
        REQUIRE(theis_u(r, t, T, S) == Approx(0.001));
    }

    SECTION("Theis and Cooper-Jacob at u = 0.001") {
        Real s_theis = theis_solution(r, t, Q, T, S);
        Real s_cj = cooper_jacob_solution(r, t, Q, T, S);
        REQUIRE(s_theis == Approx(1.007695787).epsilon(1e-8));
        REQUIRE(s_cj == Approx(1.007831351).epsilon(1e-8));
        REQUIRE(std::abs(s_cj - s_theis) / s_theis < 0.02);
    }

    SECTION("Cooper-Jacob approaches Theis for small u") {
        for (Real time : {1.0, 10.0, 100.0}) {
            Real s_theis = theis_solution(r, time, Q, T, S);
            Real s_cj = cooper_jacob_solution(r, time, Q, T, S);
            REQUIRE(theis_u(r, time, T, S) < 0.01);
            REQUIRE(std::abs(s_cj - s_theis) / s_theis < 0.01);
        }
    }

    SECTION("Drawdown is linear in Q") {
        REQUIRE(theis_solution(r, t, 2.0 * Q, T, S) ==
                Approx(2.0 * theis_solution(r, t, Q, T, S)));
        REQUIRE(theis_solution(r, t, 0.0, T, S) == 0.0);
    }

    SECTION("Drawdown decreases with distance and grows with time") {
        REQUIRE(theis_solution(50.0, t, Q, T, S) > theis_solution(100.0, t, Q, T, S));
        REQUIRE(theis_solution(r, 10.0, Q, T, S) > theis_solution(r, 1.0, Q, T, S));
    }

    SECTION("Cooper-Jacob is clamped to zero far from the well") {
        REQUIRE(cooper_jacob_solution(1e5, 1.0, Q, T, S) == 0.0);
    }

    SECTION("Dispatch selects the kernel") {
        REQUIRE(drawdown(DrawdownMethod::Theis, r, t, Q, T, S) ==
                theis_solution(r, t, Q, T, S));
        REQUIRE(drawdown(DrawdownMethod::CooperJacob, r, t, Q, T, S) ==
                cooper_jacob_solution(r, t, Q, T, S));
    }

    SECTION("Invalid inputs") {
        REQUIRE_THROWS_AS(theis_solution(r, 0.0, Q, T, S), NumericalDomainError);
        REQUIRE_THROWS_AS(theis_solution(r, -1.0, Q, T, S), NumericalDomainError);
        REQUIRE_THROWS_AS(theis_solution(0.0, t, Q, T, S), NumericalDomainError);
        REQUIRE_THROWS_AS(theis_solution(r, t, Q, -T, S), InvalidParameter);
        REQUIRE_THROWS_AS(theis_solution(r, t, Q, T, 0.0), InvalidParameter);
        REQUIRE_THROWS_AS(theis_solution(r, t, Q, T, 1.0), InvalidParameter);
        REQUIRE_THROWS_AS(cooper_jacob_solution(r, 0.0, Q, T, S), NumericalDomainError);
    }
}

TEST_CASE("Cooper-Jacob applicability", "[well_functions]") {
    const Real T = 500.0, S = 2e-4;

    // t = 25 r² S / T
    REQUIRE(cooper_jacob_min_time(100.0, T, S) == Approx(0.1));
    REQUIRE(cooper_jacob_valid(100.0, 1.0, T, S));
    REQUIRE_FALSE(cooper_jacob_valid(100.0, 0.05, T, S));
}

TEST_CASE("Thiem steady state", "[well_functions]") {
    const Real T = 500.0, Q = 1000.0, R = 1000.0;

    REQUIRE(thiem_solution(100.0, Q, T, R) ==
            Approx(Q / (2.0 * constants::PI * T) * std::log(10.0)));
    REQUIRE(thiem_solution(100.0, Q, T, R) == Approx(0.7329356).epsilon(1e-6));
    REQUIRE(thiem_solution(R, Q, T, R) == 0.0);
    REQUIRE(thiem_solution(2.0 * R, Q, T, R) == 0.0);
    REQUIRE(thiem_head(100.0, Q, T, R, 50.0) ==
            Approx(50.0 - thiem_solution(100.0, Q, T, R)));

    REQUIRE_THROWS_AS(thiem_solution(100.0, Q, T, 0.0), InvalidParameter);
    REQUIRE_THROWS_AS(thiem_solution(0.0, Q, T, R), NumericalDomainError);
}

TEST_CASE("AquiferModel", "[aquifer]") {
    AquiferModel aquifer(500.0, 2e-4);

    REQUIRE(aquifer.transmissivity() == 500.0);
    REQUIRE(aquifer.storativity() == 2e-4);
    REQUIRE(aquifer.parameters().diffusivity() == Approx(2.5e6));
    REQUIRE(aquifer.u(100.0, 1.0) == Approx(0.001));
    REQUIRE(aquifer.theis(100.0, 1.0, 1000.0) == Approx(1.007695787).epsilon(1e-8));
    REQUIRE(aquifer.unit_drawdown(100.0, 1.0, DrawdownMethod::Theis) ==
            Approx(aquifer.theis(100.0, 1.0, 1000.0) / 1000.0));
    REQUIRE(aquifer.cooper_jacob_min_time(100.0) == Approx(0.1));

    REQUIRE_THROWS_AS(AquiferModel(0.0, 2e-4), InvalidParameter);
    REQUIRE_THROWS_AS(AquiferModel(500.0, 1.5), InvalidParameter);
    REQUIRE_THROWS_AS(AquiferParameters(-1.0, 0.1).validate(), InvalidParameter);
}
