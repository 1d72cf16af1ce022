#include "monte_carlo.hpp"
#include "logger.hpp"
#include "market_returns.hpp"
#include "simulation.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace retirecalc {

MonteCarloPercentile::MonteCarloPercentile()
    : year(0), age(0), values{0.0, 0.0, 0.0, 0.0, 0.0} {}

MonteCarloResult::MonteCarloResult()
    : percentiles(), success_rate(0.0), median_terminal_assets(0.0),
      runs(0), seed(0), execution_time_ms(0.0) {}

double percentile_at(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    const double n = static_cast<double>(sorted_values.size());
    size_t index = static_cast<size_t>(std::floor(p * n));
    if (index >= sorted_values.size()) {
        index = sorted_values.size() - 1;
    }
    return sorted_values[index];
}

MonteCarloResult run_monte_carlo(
    const SimulationInputs& inputs,
    size_t iterations,
    uint64_t seed,
    const TaxRates& rates)
{
    MonteCarloResult result;
    result.seed = seed;

    auto start_time = std::chrono::high_resolution_clock::now();
    auto elapsed_ms = [&start_time]() {
        auto end_time = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double, std::milli>(end_time - start_time).count();
    };

    Logger& logger = Logger::get_instance();
    RunContext ctx("monte-carlo", "monte_carlo");

    const std::string invalid = validate_inputs(inputs);
    if (!invalid.empty()) {
        logger.log_inputs_rejected(ctx, invalid);
        result.execution_time_ms = elapsed_ms();
        return result;
    }
    if (iterations == 0) {
        result.execution_time_ms = elapsed_ms();
        return result;
    }

    // Resolved once here so nothing inside the parallel region can throw
    const ResolvedJurisdiction jurisdiction = rates.resolve(inputs.jurisdiction);
    if (jurisdiction.used_fallback) {
        logger.log_jurisdiction_fallback(ctx, jurisdiction.requested, jurisdiction.resolved);
    }

    const size_t years = static_cast<size_t>(projection_years(inputs));
    const std::vector<uint64_t> run_seeds = derive_run_seeds(seed, iterations);

    logger.log_run_start(ctx, {
        {"iterations", std::to_string(iterations)},
        {"seed", std::to_string(seed)},
        {"years", std::to_string(years)},
        {"volatility", std::to_string(inputs.returns.volatility)}
    });

    // run_assets[run][year] = end-of-year total assets
    std::vector<std::vector<double>> run_assets(iterations);
    std::vector<SimulationResult> reference_years;

    const long run_count = static_cast<long>(iterations);

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (long i = 0; i < run_count; ++i) {
        const size_t run = static_cast<size_t>(i);
        ReturnGenerator generator(run_seeds[run]);
        const std::vector<double> growth_path = generator.sample_path(
            years, inputs.returns.capital_growth, inputs.returns.volatility);

        SimulationConfig config(true, run_seeds[run]);
        config.emit_run_events = false;

        const std::vector<SimulationResult> projection =
            run_simulation_with_growth(inputs, growth_path, rates, config);

        std::vector<double>& assets = run_assets[run];
        assets.reserve(projection.size());
        for (const auto& year : projection) {
            assets.push_back(year.total_assets);
        }

        if (run == 0) {
            reference_years = projection;
        }
    }

    // Aggregate per year across runs
    const size_t result_years = reference_years.size();
    result.percentiles.reserve(result_years);

    std::vector<double> column(iterations);
    for (size_t y = 0; y < result_years; ++y) {
        for (size_t run = 0; run < iterations; ++run) {
            column[run] = y < run_assets[run].size() ? run_assets[run][y] : 0.0;
        }
        std::sort(column.begin(), column.end());

        MonteCarloPercentile band;
        band.year = reference_years[y].year;
        band.age = reference_years[y].age;
        for (size_t k = 0; k < MONTE_CARLO_LEVELS.size(); ++k) {
            band.values[k] = percentile_at(column, MONTE_CARLO_LEVELS[k]);
        }
        result.percentiles.push_back(band);
    }

    // Terminal outcome of each run
    std::vector<double> terminal;
    terminal.reserve(iterations);
    size_t successes = 0;
    for (const auto& assets : run_assets) {
        const double final_assets = assets.empty() ? 0.0 : assets.back();
        terminal.push_back(final_assets);
        if (final_assets > SUCCESS_THRESHOLD) {
            ++successes;
        }
    }
    std::sort(terminal.begin(), terminal.end());

    result.runs = iterations;
    result.success_rate = static_cast<double>(successes) / static_cast<double>(iterations);
    result.median_terminal_assets = percentile_at(terminal, 0.5);
    result.execution_time_ms = elapsed_ms();

    RunMetrics metrics;
    metrics.execution_time_ms = result.execution_time_ms;
    metrics.years_projected = result_years;
    metrics.runs_completed = result.runs;
    metrics.success_rate = result.success_rate;
    metrics.final_assets = result.median_terminal_assets;
    logger.log_run_complete(ctx, metrics);

    return result;
}

} // namespace retirecalc
