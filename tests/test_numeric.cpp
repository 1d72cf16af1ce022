#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "numeric.hpp"
#include <cmath>
#include <stdexcept>

using namespace retirecalc;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Bisection Tests
// ============================================================================

TEST_CASE("BisectionOptions defaults", "[numeric]") {
    BisectionOptions options;
    REQUIRE(options.tolerance == 1.0);
    REQUIRE(options.max_iterations == 20);
}

TEST_CASE("Bisection finds the target of an increasing function", "[numeric][bisection]") {
    auto f = [](double x) { return 2.0 * x; };

    SearchResult r = bisect_increasing(f, 37.0, 0.0, 100.0);

    REQUIRE(r.converged);
    REQUIRE(std::abs(r.value - 37.0) < 1.0);
    REQUIRE(r.value == f(r.x));
    REQUIRE(r.iterations <= 20);
}

TEST_CASE("Bisection with a tight tolerance", "[numeric][bisection]") {
    auto f = [](double x) { return x * x; };

    SearchResult r = bisect_increasing(f, 2.0, 0.0, 2.0, BisectionOptions(1e-9, 100));

    REQUIRE(r.converged);
    REQUIRE_THAT(r.x, WithinAbs(std::sqrt(2.0), 1e-8));
}

TEST_CASE("Bisection returns best estimate when target is out of reach", "[numeric][bisection]") {
    auto f = [](double x) { return x; };

    SearchResult r = bisect_increasing(f, 150.0, 0.0, 100.0);

    REQUIRE_FALSE(r.converged);
    REQUIRE(r.iterations == 20);
    REQUIRE(r.x > 99.9);
    REQUIRE(r.x <= 100.0);
}

TEST_CASE("Bisection rejects an inverted interval", "[numeric][bisection][error]") {
    auto f = [](double x) { return x; };
    REQUIRE_THROWS_AS(bisect_increasing(f, 1.0, 10.0, 0.0), std::invalid_argument);
}

// ============================================================================
// Ternary Search Tests
// ============================================================================

TEST_CASE("Ternary search locates a minimum", "[numeric][ternary]") {
    auto f = [](double x) { return (x - 3.0) * (x - 3.0) + 5.0; };

    SearchResult r = ternary_minimize(f, 0.0, 10.0);

    REQUIRE(r.converged);
    REQUIRE(r.iterations == 15);
    REQUIRE_THAT(r.x, WithinAbs(3.0, 0.05));
    REQUIRE_THAT(r.value, WithinAbs(5.0, 0.01));
}

TEST_CASE("Ternary search on a boundary minimum", "[numeric][ternary]") {
    auto f = [](double x) { return x; };

    SearchResult r = ternary_minimize(f, 0.0, 1000.0, 30, 1.0);

    REQUIRE(r.converged);
    REQUIRE(r.x < 1.0);
}

TEST_CASE("Ternary search reports non-convergence", "[numeric][ternary]") {
    auto f = [](double x) { return std::abs(x - 40.0); };

    SearchResult r = ternary_minimize(f, 0.0, 100.0, 1, 1.0);

    REQUIRE_FALSE(r.converged);
    REQUIRE(r.iterations == 1);
}

TEST_CASE("Ternary search rejects an inverted interval", "[numeric][ternary][error]") {
    auto f = [](double x) { return x; };
    REQUIRE_THROWS_AS(ternary_minimize(f, 5.0, 1.0), std::invalid_argument);
}
