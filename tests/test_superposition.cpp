/**
 * @file test_superposition.cpp
 * @brief Linearity and additivity of multi-well drawdown
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <aqopt/aqopt.hpp>
#include <cmath>

using namespace aqopt;
using Catch::Approx;

namespace {

const AquiferParameters PARAMS(500.0, 2e-4);

Vector points_x() {
    Vector xs(4);
    xs << 250.0, 100.0, 0.0, 700.0;
    return xs;
}

Vector points_y() {
    Vector ys(4);
    ys << 0.0, 150.0, 0.0, -200.0;
    return ys;
}

} // namespace

TEST_CASE("Two-well superposition", "[superposition]") {
    SuperpositionEngine engine(PARAMS, DrawdownMethod::Theis);
    std::vector<WellSource> wells = {{0.0, 0.0, 1000.0}, {500.0, 0.0, 800.0}};

    Real s = engine.drawdown(wells, 250.0, 0.0, 10.0);
    REQUIRE(s == Approx(1.9483911525).epsilon(1e-8));
    REQUIRE(s == Approx(1.0824395292 + 0.8659516233).epsilon(1e-8));
}

TEST_CASE("Superposition is linear and additive", "[superposition]") {
    const Vector xs = points_x();
    const Vector ys = points_y();
    const Real t = 30.0;

    for (DrawdownMethod method : {DrawdownMethod::Theis, DrawdownMethod::CooperJacob}) {
        SuperpositionEngine engine(PARAMS, method);
        std::vector<WellSource> a = {{0.0, 0.0, 1000.0}};
        std::vector<WellSource> b = {{400.0, 300.0, 600.0}};
        std::vector<WellSource> ab = {a[0], b[0]};

        Vector s_a = engine.drawdown(a, xs, ys, t);
        Vector s_b = engine.drawdown(b, xs, ys, t);
        Vector s_ab = engine.drawdown(ab, xs, ys, t);
        for (Index k = 0; k < xs.size(); ++k) {
            REQUIRE(s_ab(k) == Approx(s_a(k) + s_b(k)).epsilon(1e-12));
        }

        std::vector<WellSource> scaled = {{0.0, 0.0, 2500.0}};
        Vector s_scaled = engine.drawdown(scaled, xs, ys, t);
        for (Index k = 0; k < xs.size(); ++k) {
            REQUIRE(s_scaled(k) == Approx(2.5 * s_a(k)).epsilon(1e-12));
        }
    }
}

TEST_CASE("Superposition monotonicity", "[superposition]") {
    SuperpositionEngine engine(PARAMS, DrawdownMethod::Theis);
    std::vector<WellSource> wells = {{0.0, 0.0, 1000.0}, {500.0, 0.0, 800.0}};

    SECTION("Raising any rate does not lower drawdown") {
        Real base = engine.drawdown(wells, 250.0, 100.0, 10.0);
        wells[1].Q = 900.0;
        REQUIRE(engine.drawdown(wells, 250.0, 100.0, 10.0) > base);
    }

    SECTION("Drawdown grows with time") {
        Vector times(4);
        times << 0.1, 1.0, 10.0, 100.0;
        Vector s = engine.drawdown_history(wells, 250.0, 100.0, times);
        for (Index k = 1; k < times.size(); ++k) {
            REQUIRE(s(k) > s(k - 1));
        }
    }

    SECTION("Zero rates give zero drawdown") {
        std::vector<WellSource> idle = {{0.0, 0.0, 0.0}, {500.0, 0.0, 0.0}};
        REQUIRE(engine.drawdown(idle, 250.0, 0.0, 10.0) == 0.0);
    }
}

TEST_CASE("Observation at the well is floored", "[superposition]") {
    SuperpositionEngine engine(PARAMS, DrawdownMethod::Theis);
    std::vector<WellSource> wells = {{0.0, 0.0, 1000.0, 0.2}};

    Real at_well = engine.drawdown(wells, 0.0, 0.0, 1.0);
    REQUIRE(std::isfinite(at_well));
    REQUIRE(at_well == Approx(theis_solution(0.2, 1.0, 1000.0, 500.0, 2e-4)));
}

TEST_CASE("Response matrix reproduces drawdown", "[superposition]") {
    WellField field;
    field.add_well(PumpingWell(0.0, 0.0, 1200.0));
    field.add_well(PumpingWell(500.0, 0.0, 700.0));
    field.add_well(PumpingWell(250.0, 433.0, 300.0));

    std::vector<ConstraintPoint> points = {
        ConstraintPoint::from_min_head(250.0, 200.0, 45.0),
        ConstraintPoint::from_min_head(400.0, 400.0, 45.0),
    };

    for (DrawdownMethod method : {DrawdownMethod::Theis, DrawdownMethod::CooperJacob}) {
        SuperpositionEngine engine(PARAMS, method);
        Matrix A = engine.response_matrix(field, points, 100.0);
        REQUIRE(A.rows() == 2);
        REQUIRE(A.cols() == 3);
        REQUIRE((A.array() > 0.0).all());

        Vector xs(2), ys(2);
        xs << 250.0, 400.0;
        ys << 200.0, 400.0;
        Vector direct = engine.drawdown(field, xs, ys, 100.0);
        Vector via_matrix = A * field.rates();
        for (Index j = 0; j < 2; ++j) {
            REQUIRE(via_matrix(j) == Approx(direct(j)).epsilon(1e-12));
        }
    }
}

TEST_CASE("Superposition input validation", "[superposition]") {
    SuperpositionEngine engine(PARAMS, DrawdownMethod::Theis);
    std::vector<WellSource> wells = {{0.0, 0.0, 1000.0}};
    Vector xs(2), ys(1);
    xs << 1.0, 2.0;
    ys << 1.0;

    REQUIRE_THROWS_AS(engine.drawdown(wells, xs, ys, 1.0), InvalidParameter);
    REQUIRE_THROWS_AS(engine.drawdown(std::vector<WellSource>{}, 1.0, 1.0, 1.0), InvalidParameter);
    REQUIRE_THROWS_AS(engine.drawdown(wells, 1.0, 1.0, 0.0), NumericalDomainError);
    REQUIRE_THROWS_AS(SuperpositionEngine(AquiferParameters(0.0, 0.1), DrawdownMethod::Theis),
                      InvalidParameter);

    Vector px(1), py(1);
    px << 250.0;
    py << 0.0;
    Vector s = superpose({{0.0, 0.0, 1000.0}, {500.0, 0.0, 800.0}}, px, py, 10.0,
                         PARAMS, DrawdownMethod::Theis);
    REQUIRE(s(0) == Approx(1.9483911525).epsilon(1e-8));
}

TEST_CASE("Domain errors reach the caller from every observation point", "[superposition]") {
    std::vector<WellSource> wells = {{0.0, 0.0, 1000.0, 0.1}};

    // r = 1e200 is finite but r² overflows, so u = inf at the odd points
    Vector xs(64), ys = Vector::Zero(64);
    for (Index k = 0; k < xs.size(); ++k) {
        xs(k) = (k % 2 == 0) ? 100.0 : 1e200;
    }

    SuperpositionEngine theis(PARAMS, DrawdownMethod::Theis);
    REQUIRE_THROWS_AS(theis.drawdown(wells, xs, ys, 10.0), NumericalDomainError);

    Vector wx(1), wy(1), wr(1);
    wx << 0.0;
    wy << 0.0;
    wr << 0.1;
    REQUIRE_THROWS_AS(theis.response_matrix(wx, wy, wr, xs, ys, 10.0), NumericalDomainError);

    // Points within range alone evaluate normally
    Vector near = Vector::Constant(8, 100.0);
    Vector s = theis.drawdown(wells, near, Vector::Zero(8), 10.0);
    REQUIRE(s.minCoeff() == Approx(s.maxCoeff()));
}
