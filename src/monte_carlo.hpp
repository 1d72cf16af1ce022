#ifndef RETIRECALC_MONTE_CARLO_HPP
#define RETIRECALC_MONTE_CARLO_HPP

#include "household.hpp"
#include "tax_rates.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace retirecalc {

// Distribution of total household assets across runs for one year
struct MonteCarloPercentile {
    int year;
    int age;                            // Primary person's age
    std::array<double, 5> values;       // P5, P25, P50, P75, P95

    double p5() const { return values[0]; }
    double p25() const { return values[1]; }
    double p50() const { return values[2]; }
    double p75() const { return values[3]; }
    double p95() const { return values[4]; }

    MonteCarloPercentile();
};

struct MonteCarloResult {
    std::vector<MonteCarloPercentile> percentiles;  // One entry per projected year
    double success_rate;                // Fraction of runs ending above the threshold
    double median_terminal_assets;
    size_t runs;
    uint64_t seed;
    double execution_time_ms;

    MonteCarloResult();

    bool empty() const { return percentiles.empty(); }
};

// Percentile levels reported for each year
constexpr std::array<double, 5> MONTE_CARLO_LEVELS = {0.05, 0.25, 0.50, 0.75, 0.95};

// Final-year assets must exceed this for a run to count as a success
constexpr double SUCCESS_THRESHOLD = 1000.0;

// Value at index floor(p * N) of an ascending-sorted vector (clamped to N - 1)
double percentile_at(const std::vector<double>& sorted_values, double p);

// Run `iterations` stochastic projections and aggregate total assets per year.
// Each run draws capital growth as mean + volatility * Z from its own
// generator, seeded from a master generator so the whole batch is
// reproducible for a given seed. Runs execute in parallel when built with
// OpenMP; aggregation happens after all runs complete. Invalid inputs or zero
// iterations give an empty result.
MonteCarloResult run_monte_carlo(
    const SimulationInputs& inputs,
    size_t iterations = 200,
    uint64_t seed = 42,
    const TaxRates& rates = TaxRates::canada_2024()
);

} // namespace retirecalc

#endif // RETIRECALC_MONTE_CARLO_HPP
