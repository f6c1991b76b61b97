#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <aqopt/aqopt.hpp>
#include <limits>
#include <random>

using namespace aqopt;
using Catch::Approx;

namespace {

std::vector<ConstraintPoint> monitoring_points(Real h_min) {
    return {
        ConstraintPoint::from_min_head(250.0, 200.0, h_min, "P1"),
        ConstraintPoint::from_min_head(400.0, 400.0, h_min, "P2"),
        ConstraintPoint::from_min_head(250.0, 650.0, h_min, "P3"),
    };
}

const AquiferParameters PARAMS(500.0, 2e-4);
const FeasibleRegion REGION(-500.0, 1500.0, -500.0, 1500.0);

} // namespace

TEST_CASE("Siting search is reproducible", "[siting]") {
    SitingOptions options;
    options.max_iterations = 300;
    SitingOptimizer optimizer(options);
    auto points = monitoring_points(45.0);

    std::mt19937_64 rng_a(7);
    std::mt19937_64 rng_b(7);
    SitingResult a = optimizer.search(3, REGION, 3000.0, PARAMS, 50.0, points, 100.0, rng_a);
    SitingResult b = optimizer.search(3, REGION, 3000.0, PARAMS, 50.0, points, 100.0, rng_b);

    REQUIRE(a.violation == b.violation);
    REQUIRE(a.locations.size() == 3);
    for (Size i = 0; i < a.locations.size(); ++i) {
        REQUIRE(a.locations[i] == b.locations[i]);
    }

    SECTION("Batch size does not change the result") {
        SitingOptions serial = options;
        serial.batch_size = 1;
        std::mt19937_64 rng_c(7);
        SitingResult c = SitingOptimizer(serial).search(3, REGION, 3000.0, PARAMS, 50.0,
                                                        points, 100.0, rng_c);
        REQUIRE(c.violation == a.violation);
        for (Size i = 0; i < a.locations.size(); ++i) {
            REQUIRE(c.locations[i] == a.locations[i]);
        }
        REQUIRE(c.improvements == a.improvements);
    }
}

TEST_CASE("Siting result invariants", "[siting]") {
    SitingOptions options;
    options.max_iterations = 100;
    SitingOptimizer optimizer(options);
    auto points = monitoring_points(45.0);
    std::mt19937_64 rng(42);

    SitingResult r = optimizer.search(3, REGION, 3000.0, PARAMS, 50.0, points, 100.0, rng);

    REQUIRE(r.iterations == 100);
    REQUIRE(r.improvements >= 1);
    REQUIRE(r.rates.size() == 3);
    REQUIRE(r.rates.sum() == Approx(3000.0));
    for (const auto& p : r.locations) {
        REQUIRE(REGION.contains(p.x(), p.y()));
    }
    REQUIRE(r.violation >= 0.0);
    REQUIRE(r.feasible == (r.violation < options.feasibility_tolerance));
    REQUIRE(r.heads.size() == 3);
    REQUIRE(r.theis_heads.size() == 3);

    // The reported violation is the Cooper-Jacob shortfall at the best layout
    REQUIRE(optimizer.violation(r.locations, r.rates, PARAMS, 50.0, points, 100.0) ==
            Approx(r.violation).margin(1e-12));
}

TEST_CASE("Siting finds a feasible layout away from the points", "[siting]") {
    SitingOptions options;
    options.max_iterations = 50;
    SitingOptimizer optimizer(options);
    auto points = monitoring_points(45.0);
    std::mt19937_64 rng(1);

    // Anywhere in this region three 100 m³/day wells stay well inside the limits
    FeasibleRegion far(2000.0, 3000.0, 2000.0, 3000.0);
    SitingResult r = optimizer.search(3, far, 300.0, PARAMS, 50.0, points, 100.0, rng);
    REQUIRE(r.feasible);
    REQUIRE(r.violation == 0.0);
    REQUIRE(r.improvements == 1);
    for (Index j = 0; j < 3; ++j) {
        REQUIRE(r.heads(j) > 45.0);
    }
}

TEST_CASE("Siting with unreachable heads", "[siting]") {
    SitingOptions options;
    options.max_iterations = 20;
    SitingOptimizer optimizer(options);
    std::mt19937_64 rng(3);

    // h_min above h0: every layout is short by at least 5 m per point
    SitingResult r = optimizer.search(2, REGION, 1000.0, PARAMS, 50.0,
                                      monitoring_points(55.0), 100.0, rng);
    REQUIRE_FALSE(r.feasible);
    REQUIRE(r.violation >= 15.0);
}

TEST_CASE("Siting demand split", "[siting]") {
    SitingOptimizer optimizer;
    Vector even = optimizer.split_demand(4, 3000.0);
    REQUIRE(even(0) == Approx(750.0));
    REQUIRE(even.sum() == Approx(3000.0));

    optimizer.options().weights = Vector(2);
    optimizer.options().weights << 1.0, 3.0;
    Vector weighted = optimizer.split_demand(2, 3000.0);
    REQUIRE(weighted(0) == Approx(750.0));
    REQUIRE(weighted(1) == Approx(2250.0));

    REQUIRE_THROWS_AS(optimizer.split_demand(3, 3000.0), InvalidParameter);
    REQUIRE_THROWS_AS(optimizer.split_demand(0, 3000.0), InvalidParameter);
    REQUIRE_THROWS_AS(optimizer.split_demand(2, -1.0), InvalidParameter);
}

TEST_CASE("Siting coordinate overload", "[siting]") {
    SitingOptimizer optimizer;
    std::vector<Vec2> points = {{250.0, 200.0}, {400.0, 400.0}};
    std::mt19937_64 rng(11);

    SitingResult r = optimizer.search(2, REGION, 2000.0, 500.0, 2e-4, 50.0, 45.0,
                                      points, 100.0, 37, rng);
    REQUIRE(r.iterations == 37);
    REQUIRE(r.locations.size() == 2);
    REQUIRE(optimizer.options().max_iterations == 1000);
}

TEST_CASE("Siting input validation", "[siting]") {
    SitingOptimizer optimizer;
    auto points = monitoring_points(45.0);
    std::mt19937_64 rng(5);

    REQUIRE_THROWS_AS(optimizer.search(2, FeasibleRegion(10.0, 0.0, 0.0, 10.0), 1000.0,
                                       PARAMS, 50.0, points, 100.0, rng),
                      InvalidParameter);
    REQUIRE_THROWS_AS(optimizer.search(0, REGION, 1000.0, PARAMS, 50.0, points, 100.0, rng),
                      InvalidParameter);
    REQUIRE_THROWS_AS(optimizer.search(2, REGION, 1000.0, PARAMS, 50.0, {}, 100.0, rng),
                      InvalidParameter);
    REQUIRE_THROWS_AS(optimizer.search(2, REGION, 1000.0, PARAMS, 50.0, points, -1.0, rng),
                      InvalidParameter);
    REQUIRE_THROWS_AS(optimizer.search(2, REGION, 1000.0, AquiferParameters(500.0, 2.0),
                                       50.0, points, 100.0, rng),
                      InvalidParameter);

    auto nan_point = points;
    nan_point[1].x = std::numeric_limits<Real>::quiet_NaN();
    REQUIRE_THROWS_AS(optimizer.search(2, REGION, 1000.0, PARAMS, 50.0, nan_point, 100.0, rng),
                      InvalidParameter);
    REQUIRE_THROWS_AS(optimizer.violation({Vec2(0.0, 0.0)}, Vector::Ones(1), PARAMS, 50.0,
                                          nan_point, 100.0),
                      InvalidParameter);
}

TEST_CASE("Siting surfaces domain errors from the candidate batch", "[siting]") {
    SitingOptions options;
    options.max_iterations = 64;
    options.batch_size = 16;
    SitingOptimizer optimizer(options);
    std::mt19937_64 rng(9);

    // Every candidate sits ~2e308 from the point, the distance overflows to inf
    FeasibleRegion edge(-1e308, -0.9e308, 0.0, 1.0);
    std::vector<ConstraintPoint> far_point = {
        ConstraintPoint::from_min_head(1e308, 0.0, 45.0, "P1"),
    };
    REQUIRE_THROWS_AS(optimizer.search(2, edge, 1000.0, PARAMS, 50.0, far_point, 100.0, rng),
                      NumericalDomainError);
}
