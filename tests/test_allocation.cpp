/**
 * @file test_allocation.cpp
 * @brief Linear and nonlinear pumping allocation on a four-well field
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <aqopt/aqopt.hpp>
#include <cmath>
#include <string>

using namespace aqopt;
using Catch::Approx;

namespace {

// Four wells, Q_max = 1500, h0 = 50, h_min = 45 at three points after 100 days.
// All wells at Q_max draw the points down by 7.6 - 8.0 m, so the limits bind.
struct Scenario {
    WellField field;
    Vector Q_max;
    std::vector<ConstraintPoint> points;
    AquiferParameters params{500.0, 2e-4};
    Real h0 = 50.0;
    Real t = 100.0;

    Scenario() {
        field.add_well(PumpingWell(0.0, 0.0, 0.0, "W1"));
        field.add_well(PumpingWell(500.0, 0.0, 0.0, "W2"));
        field.add_well(PumpingWell(250.0, 433.0, 0.0, "W3"));
        field.add_well(PumpingWell(500.0, 866.0, 0.0, "W4"));
        Q_max = Vector::Constant(4, 1500.0);
        points = {
            ConstraintPoint::from_min_head(250.0, 200.0, 45.0, "P1"),
            ConstraintPoint::from_min_head(400.0, 400.0, 45.0, "P2"),
            ConstraintPoint::from_min_head(250.0, 650.0, 45.0, "P3"),
        };
    }
};

AllocationOptimizer make_optimizer() {
    AllocationConfig config;
    config.max_iterations = 200;
    config.warn_cooper_jacob = false;
    return AllocationOptimizer(config);
}

} // namespace

TEST_CASE("Linear allocation", "[allocation]") {
    Scenario sc;
    AllocationOptimizer optimizer = make_optimizer();

    OptimizationResult r = optimizer.optimize(AllocationMethod::Linear, sc.field, sc.Q_max,
                                              sc.points, sc.params, sc.h0, sc.t);

    REQUIRE(r.success);
    REQUIRE(r.authoritative);
    REQUIRE(r.status == OptimizationStatus::Optimal);
    REQUIRE(r.method == AllocationMethod::Linear);
    REQUIRE(r.rates.size() == 4);
    REQUIRE(r.total_rate == Approx(r.rates.sum()));
    REQUIRE(r.total_rate == Approx(3927.67).epsilon(1e-3));
    REQUIRE(r.message.find("linear program") != std::string::npos);

    for (Index i = 0; i < 4; ++i) {
        REQUIRE(r.rates(i) >= 0.0);
        REQUIRE(r.rates(i) <= 1500.0 + 1e-9);
    }
    // Cooper-Jacob heads honour the limits
    for (Index j = 0; j < 3; ++j) {
        REQUIRE(r.heads(j) >= 45.0 - 1e-6);
        REQUIRE(r.theis_heads(j) == Approx(r.heads(j)).margin(1e-2));
    }
    // At least one limit is active
    REQUIRE(r.heads.minCoeff() == Approx(45.0).margin(1e-6));
    REQUIRE(r.max_u < constants::COOPER_JACOB_U_LIMIT);
}

TEST_CASE("Nonlinear allocation", "[allocation]") {
    Scenario sc;
    AllocationOptimizer optimizer = make_optimizer();

    OptimizationResult r = optimizer.optimize(AllocationMethod::Nonlinear, sc.field, sc.Q_max,
                                              sc.points, sc.params, sc.h0, sc.t);

    REQUIRE(r.success);
    REQUIRE(r.status == OptimizationStatus::Optimal);
    REQUIRE(r.method == AllocationMethod::Nonlinear);
    REQUIRE(r.rates.size() == 4);
    REQUIRE(r.total_rate == Approx(3927.56).epsilon(2e-3));
    REQUIRE(r.message.find("SQP") != std::string::npos);

    for (Index i = 0; i < 4; ++i) {
        REQUIRE(r.rates(i) >= 0.0);
        REQUIRE(r.rates(i) <= 1500.0 + 1e-9);
    }
    for (Index j = 0; j < 3; ++j) {
        REQUIRE(r.theis_heads(j) >= 45.0 - 1e-4);
        REQUIRE(r.theis_heads(j) == r.heads(j));
    }
}

TEST_CASE("Linear and nonlinear allocation agree for small u", "[allocation]") {
    Scenario sc;
    AllocationOptimizer optimizer = make_optimizer();

    OptimizationResult lin = optimizer.optimize(AllocationMethod::Linear, sc.field, sc.Q_max,
                                                sc.points, sc.params, sc.h0, sc.t);
    OptimizationResult nl = optimizer.optimize(AllocationMethod::Nonlinear, sc.field, sc.Q_max,
                                               sc.points, sc.params, sc.h0, sc.t);
    REQUIRE(lin.success);
    REQUIRE(nl.success);
    REQUIRE(std::abs(nl.total_rate - lin.total_rate) / lin.total_rate < 0.01);
}

TEST_CASE("Allocation without binding limits pumps at capacity", "[allocation]") {
    Scenario sc;
    for (auto& p : sc.points) p.limit = 40.0;
    AllocationOptimizer optimizer = make_optimizer();

    for (AllocationMethod method : {AllocationMethod::Linear, AllocationMethod::Nonlinear}) {
        OptimizationResult r = optimizer.optimize(method, sc.field, sc.Q_max,
                                                  sc.points, sc.params, sc.h0, sc.t);
        REQUIRE(r.success);
        REQUIRE(r.total_rate == Approx(6000.0).epsilon(1e-6));
    }
}

TEST_CASE("Allocation respects a zero rate bound", "[allocation]") {
    Scenario sc;
    sc.Q_max(0) = 0.0;
    AllocationOptimizer optimizer = make_optimizer();

    for (AllocationMethod method : {AllocationMethod::Linear, AllocationMethod::Nonlinear}) {
        OptimizationResult r = optimizer.optimize(method, sc.field, sc.Q_max,
                                                  sc.points, sc.params, sc.h0, sc.t);
        REQUIRE(r.success);
        REQUIRE(r.rates(0) == Approx(0.0).margin(1e-9));
    }
}

TEST_CASE("Allocation with unreachable heads is infeasible", "[allocation]") {
    Scenario sc;
    for (auto& p : sc.points) p.limit = 55.0;
    AllocationOptimizer optimizer = make_optimizer();

    for (AllocationMethod method : {AllocationMethod::Linear, AllocationMethod::Nonlinear}) {
        OptimizationResult r = optimizer.optimize(method, sc.field, sc.Q_max,
                                                  sc.points, sc.params, sc.h0, sc.t);
        REQUIRE_FALSE(r.success);
        REQUIRE(r.status == OptimizationStatus::Infeasible);
        REQUIRE(r.rates.size() == 0);
        REQUIRE(r.message.find("Infeasible") != std::string::npos);
    }
}

TEST_CASE("Nonlinear allocation out of iterations", "[allocation]") {
    Scenario sc;
    AllocationConfig config;
    config.max_iterations = 1;
    config.warn_cooper_jacob = false;
    AllocationOptimizer optimizer(config);

    OptimizationResult r = optimizer.optimize(AllocationMethod::Nonlinear, sc.field, sc.Q_max,
                                              sc.points, sc.params, sc.h0, sc.t);

    REQUIRE_FALSE(r.success);
    REQUIRE_FALSE(r.authoritative);
    REQUIRE(r.status == OptimizationStatus::NonConvergence);
    REQUIRE(r.message.find("Did not converge") != std::string::npos);
    REQUIRE(r.message.find("Maximum iterations") != std::string::npos);

    // Best candidate so far: the half-capacity start is feasible, so it is at least that good
    REQUIRE(r.rates.size() == 4);
    REQUIRE(r.total_rate == Approx(r.rates.sum()));
    REQUIRE(r.total_rate >= 3000.0 - 1e-6);
    for (Index i = 0; i < 4; ++i) {
        REQUIRE(r.rates(i) >= 0.0);
        REQUIRE(r.rates(i) <= 1500.0 + 1e-9);
    }
    REQUIRE(r.theis_heads.size() == 3);
    for (Index j = 0; j < 3; ++j) {
        REQUIRE(r.theis_heads(j) >= 45.0 - 1e-4);
    }
}

TEST_CASE("Allocation with drawdown limits", "[allocation]") {
    Scenario sc;
    // s <= 5 is the same limit as h >= 45 when h0 = 50
    for (auto& p : sc.points) {
        p = ConstraintPoint::from_max_drawdown(p.x, p.y, 5.0, p.name);
    }
    AllocationOptimizer optimizer = make_optimizer();
    OptimizationResult r = optimizer.optimize(AllocationMethod::Linear, sc.field, sc.Q_max,
                                              sc.points, sc.params, sc.h0, sc.t);
    REQUIRE(r.success);
    REQUIRE(r.total_rate == Approx(3927.67).epsilon(1e-3));
    REQUIRE(r.drawdowns.maxCoeff() <= 5.0 + 1e-6);
}

TEST_CASE("Coordinate-based allocation", "[allocation]") {
    std::vector<Vec2> wells = {{0.0, 0.0}, {500.0, 0.0}, {250.0, 433.0}, {500.0, 866.0}};
    std::vector<Vec2> points = {{250.0, 200.0}, {400.0, 400.0}, {250.0, 650.0}};
    Vector Q_max = Vector::Constant(4, 1500.0);
    AllocationOptimizer optimizer = make_optimizer();

    OptimizationResult r = optimizer.optimize(AllocationMethod::Linear, wells, 500.0, 2e-4, 50.0,
                                              45.0, Q_max, points, 100.0);
    REQUIRE(r.success);
    REQUIRE(r.total_rate == Approx(3927.67).epsilon(1e-3));

    Vector h_min(2);
    h_min << 45.0, 45.0;
    REQUIRE_THROWS_AS(optimizer.optimize(AllocationMethod::Linear, wells, 500.0, 2e-4, 50.0,
                                         h_min, Q_max, points, 100.0),
                      InvalidParameter);
}

TEST_CASE("Unconstrained reference case", "[allocation]") {
    Scenario sc;
    AllocationOptimizer optimizer = make_optimizer();
    ReferenceCase ref = optimizer.unconstrained(sc.field, sc.Q_max, sc.points,
                                                sc.params, sc.h0, sc.t);

    REQUIRE(ref.total_rate == Approx(6000.0));
    REQUIRE(ref.n_violated == 3);
    REQUIRE(ref.heads(0) == Approx(50.0 - 7.99115).epsilon(1e-4));
    REQUIRE(ref.heads(2) == Approx(50.0 - 7.64927).epsilon(1e-4));
    for (Index j = 0; j < 3; ++j) {
        REQUIRE(ref.margins(j) < 0.0);
    }
}

TEST_CASE("Cooper-Jacob range warning", "[allocation]") {
    Scenario sc;
    AllocationConfig config;
    config.warn_cooper_jacob = true;
    AllocationOptimizer optimizer(config);

    // Ten minutes of pumping puts the far wells well outside u < 0.01
    OptimizationResult r = optimizer.optimize(AllocationMethod::Linear, sc.field, sc.Q_max,
                                              sc.points, sc.params, sc.h0, 0.007);
    REQUIRE(r.max_u > constants::COOPER_JACOB_U_LIMIT);
    REQUIRE(r.message.find("Cooper-Jacob") != std::string::npos);
    REQUIRE(max_theis_u(sc.field, sc.points, sc.params, 0.007) == Approx(r.max_u));
}

TEST_CASE("Allocation input validation", "[allocation]") {
    Scenario sc;
    AllocationOptimizer optimizer = make_optimizer();
    const auto method = AllocationMethod::Linear;

    WellField empty;
    REQUIRE_THROWS_AS(optimizer.optimize(method, empty, Vector(0), sc.points,
                                         sc.params, sc.h0, sc.t),
                      InvalidParameter);
    REQUIRE_THROWS_AS(optimizer.optimize(method, sc.field, sc.Q_max, {},
                                         sc.params, sc.h0, sc.t),
                      InvalidParameter);
    REQUIRE_THROWS_AS(optimizer.optimize(method, sc.field, Vector::Ones(3), sc.points,
                                         sc.params, sc.h0, sc.t),
                      InvalidParameter);
    REQUIRE_THROWS_AS(optimizer.optimize(method, sc.field, sc.Q_max, sc.points,
                                         AquiferParameters(-500.0, 2e-4), sc.h0, sc.t),
                      InvalidParameter);
    REQUIRE_THROWS_AS(optimizer.optimize(method, sc.field, sc.Q_max, sc.points,
                                         sc.params, sc.h0, 0.0),
                      InvalidParameter);

    Vector negative = sc.Q_max;
    negative(2) = -1.0;
    REQUIRE_THROWS_AS(optimizer.optimize(method, sc.field, negative, sc.points,
                                         sc.params, sc.h0, sc.t),
                      InvalidParameter);
}
