#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "monte_carlo.hpp"
#include "simulation.hpp"

using namespace retirecalc;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Helper functions
// ============================================================================

namespace {

SimulationInputs make_retiree(double spend, double volatility) {
    SimulationInputs inputs;
    inputs.jurisdiction = "AB";
    inputs.inflation_rate = 0.02;
    inputs.post_retirement_spend = spend;
    inputs.returns = ReturnAssumptions(0.02, 0.02, 0.05, volatility);

    inputs.person.age = 65;
    inputs.person.retirement_age = 65;
    inputs.person.life_expectancy = 90;
    inputs.person.rrsp = Account(AccountType::RRSP, 500000.0);
    inputs.person.tfsa = Account(AccountType::TFSA, 100000.0);
    inputs.person.non_registered = NonRegisteredAccount(100000.0, 80000.0, AssetMix());
    return inputs;
}

} // anonymous namespace

// ============================================================================
// Percentile Tests
// ============================================================================

TEST_CASE("percentile_at indexes floor(p * N)", "[monte_carlo][statistics]") {
    std::vector<double> sorted = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};

    REQUIRE(percentile_at(sorted, 0.0) == 1.0);
    REQUIRE(percentile_at(sorted, 0.05) == 1.0);
    REQUIRE(percentile_at(sorted, 0.25) == 3.0);
    REQUIRE(percentile_at(sorted, 0.50) == 6.0);
    REQUIRE(percentile_at(sorted, 0.95) == 10.0);
    REQUIRE(percentile_at(sorted, 1.0) == 10.0);

    REQUIRE(percentile_at({}, 0.5) == 0.0);
}

TEST_CASE("MonteCarloResult defaults", "[monte_carlo]") {
    MonteCarloResult result;
    REQUIRE(result.empty());
    REQUIRE(result.runs == 0);
    REQUIRE(result.success_rate == 0.0);
}

// ============================================================================
// Driver Tests
// ============================================================================

TEST_CASE("Monte Carlo produces ordered bands for every year", "[monte_carlo]") {
    SimulationInputs inputs = make_retiree(45000.0, 0.12);

    MonteCarloResult result = run_monte_carlo(inputs, 100, 42);

    REQUIRE(result.runs == 100);
    REQUIRE(result.seed == 42);
    REQUIRE(result.percentiles.size() == 26);
    REQUIRE(result.success_rate >= 0.0);
    REQUIRE(result.success_rate <= 1.0);
    REQUIRE(result.execution_time_ms >= 0.0);

    for (size_t i = 0; i < result.percentiles.size(); ++i) {
        const MonteCarloPercentile& band = result.percentiles[i];
        REQUIRE(band.year == 2025 + static_cast<int>(i));
        REQUIRE(band.age == 65 + static_cast<int>(i));
        REQUIRE(band.p5() <= band.p25());
        REQUIRE(band.p25() <= band.p50());
        REQUIRE(band.p50() <= band.p75());
        REQUIRE(band.p75() <= band.p95());
    }

    // With volatility the outcomes spread out
    REQUIRE(result.percentiles.back().p95() > result.percentiles.back().p5());
}

TEST_CASE("Zero volatility collapses to the deterministic projection", "[monte_carlo][property]") {
    SimulationInputs inputs = make_retiree(45000.0, 0.0);

    SimulationConfig config;
    config.emit_run_events = false;
    std::vector<SimulationResult> deterministic = run_simulation(inputs, TaxRates::canada_2024(), config);

    MonteCarloResult result = run_monte_carlo(inputs, 25, 7);

    REQUIRE(result.percentiles.size() == deterministic.size());
    for (size_t i = 0; i < deterministic.size(); ++i) {
        for (double value : result.percentiles[i].values) {
            REQUIRE(value == deterministic[i].total_assets);
        }
    }

    const bool deterministic_success = deterministic.back().total_assets > SUCCESS_THRESHOLD;
    REQUIRE(result.success_rate == (deterministic_success ? 1.0 : 0.0));
    REQUIRE(result.median_terminal_assets == deterministic.back().total_assets);
}

TEST_CASE("Same seed reproduces the batch", "[monte_carlo][property]") {
    SimulationInputs inputs = make_retiree(50000.0, 0.15);

    MonteCarloResult a = run_monte_carlo(inputs, 60, 1234);
    MonteCarloResult b = run_monte_carlo(inputs, 60, 1234);

    REQUIRE(a.success_rate == b.success_rate);
    REQUIRE(a.median_terminal_assets == b.median_terminal_assets);
    REQUIRE(a.percentiles.size() == b.percentiles.size());
    for (size_t i = 0; i < a.percentiles.size(); ++i) {
        REQUIRE(a.percentiles[i].values == b.percentiles[i].values);
    }

    MonteCarloResult c = run_monte_carlo(inputs, 60, 4321);
    REQUIRE(c.percentiles.back().values != a.percentiles.back().values);
}

TEST_CASE("Success rate does not rise with spending", "[monte_carlo][property]") {
    double previous = 1.0;
    for (double spend : {30000.0, 50000.0, 70000.0, 90000.0, 120000.0}) {
        MonteCarloResult result = run_monte_carlo(make_retiree(spend, 0.12), 80, 2024);
        REQUIRE(result.success_rate <= previous);
        previous = result.success_rate;
    }
    REQUIRE(previous < 1.0);
}

TEST_CASE("Monte Carlo edge cases", "[monte_carlo][error]") {
    SECTION("Zero iterations") {
        MonteCarloResult result = run_monte_carlo(make_retiree(45000.0, 0.1), 0, 42);
        REQUIRE(result.empty());
        REQUIRE(result.runs == 0);
    }

    SECTION("Invalid inputs") {
        SimulationInputs inputs = make_retiree(45000.0, 0.1);
        inputs.person.retirement_age = 95;
        MonteCarloResult result = run_monte_carlo(inputs, 50, 42);
        REQUIRE(result.empty());
    }
}
