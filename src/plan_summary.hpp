#ifndef RETIRECALC_PLAN_SUMMARY_HPP
#define RETIRECALC_PLAN_SUMMARY_HPP

#include "household.hpp"
#include "simulation.hpp"
#include "tax_rates.hpp"
#include <optional>
#include <vector>

namespace retirecalc {

// Whole-plan figures derived from a projection. Rates are fractions (0-1).
struct PlanSummary {
    double estate_value;                 // Assets left at the end of the projection
    double estate_tax;                   // Terminal tax at the last death
    double total_retirement_tax;
    double total_retirement_income;      // Taxable income over retirement years
    double total_tax_plus_estate;
    double effective_tax_rate_retirement;
    double effective_tax_rate_estate;
    double total_effective_tax_rate;
    double net_retirement_income;
    double net_estate_value;
    double total_net_value;
    double initial_withdrawal_rate;
    std::optional<int> out_of_money_age; // First retirement age with assets < 1000

    PlanSummary();
};

// Below this, household assets are considered exhausted
constexpr double OUT_OF_MONEY_THRESHOLD = 1000.0;

// Summarize a projection. Retirement years are those where the primary
// person's age is at least their retirement age. With inflation_adjusted set,
// each year's amounts are divided by that year's inflation factor. An empty
// projection gives an all-zero summary.
PlanSummary summarize_plan(
    const std::vector<SimulationResult>& results,
    const SimulationInputs& inputs,
    const TaxRates& rates = TaxRates::canada_2024(),
    bool inflation_adjusted = false
);

} // namespace retirecalc

#endif // RETIRECALC_PLAN_SUMMARY_HPP
