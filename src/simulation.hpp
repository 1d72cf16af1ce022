#ifndef RETIRECALC_SIMULATION_HPP
#define RETIRECALC_SIMULATION_HPP

#include "household.hpp"
#include "income_split.hpp"
#include "tax_rates.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace retirecalc {

// End-of-year balances of one person's accounts
struct AccountSnapshot {
    double rrsp;
    double tfsa;
    double non_registered;
    double non_registered_acb;

    AccountSnapshot();

    double total() const { return rrsp + tfsa + non_registered; }
};

// One projected year for the household. Balances are end-of-year (after
// reinvestment, growth and any estate rollover).
struct SimulationResult {
    int year;
    int age;                            // Primary person's age
    std::optional<int> spouse_age;
    bool person_alive;
    bool spouse_alive;

    AccountSnapshot person_accounts;
    AccountSnapshot spouse_accounts;
    double total_assets;

    // Household income figures
    double gross_income;                // Total taxable income
    double net_income;                  // Cash received - tax - amount reinvested
    double employment_income;
    double cpp_income;
    double oas_income;
    double investment_income;           // Interest + cash dividends
    double spending_target;
    double tax_paid;                    // Income tax + clawback, after any split
    double person_tax;
    double spouse_tax;

    // Net-of-tax breakdown (tax allocated by share of taxable income)
    double net_employment_income;
    double net_cpp_income;
    double net_oas_income;
    double net_rrsp_income;
    double net_investment_income;

    // Raw withdrawals
    double rrif_minimum_withdrawal;
    double melt_withdrawal;
    double extra_rrsp_withdrawal;       // Drawn by the deficit waterfall
    double total_rrsp_withdrawal;
    double total_tfsa_withdrawal;
    double total_non_registered_withdrawal;
    double person_rrsp_withdrawal;
    double spouse_rrsp_withdrawal;
    double person_tfsa_withdrawal;
    double spouse_tfsa_withdrawal;
    double person_non_registered_withdrawal;
    double spouse_non_registered_withdrawal;
    double person_net_withdrawal;
    double spouse_net_withdrawal;
    double realized_capital_gains;

    // Reinvestment of surplus
    double household_surplus;
    double reinvested_tfsa;
    double reinvested_rrsp;
    double reinvested_non_registered;
    double shortfall;                   // Deficit no account could cover

    double inflation_factor;
    double growth_rate;                 // Capital growth applied this year

    double income_split_amount;
    double income_split_savings;
    SplitDirection income_split_direction;
    bool jurisdiction_fallback;

    // Estate
    bool person_died;                   // Final year of life
    bool spouse_died;
    double rrsp_rolled_to_spouse;
    double terminal_tax_rrsp;
    double terminal_tax_capital_gains;
    double terminal_tax;
    double gross_estate_value;
    double net_estate_value;

    SimulationResult();
};

// Options for a single projection
struct SimulationConfig {
    bool stochastic;                    // Perturb capital growth each year
    uint64_t seed;                      // Generator seed in stochastic mode
    std::string run_id;                 // Label for log lines
    bool emit_run_events;               // Log run start/complete, rejections, fallback

    SimulationConfig();
    SimulationConfig(bool stochastic_, uint64_t seed_);
};

// Project the household year by year until both people have died (or the
// 120-year cap). The caller's inputs are copied, never mutated. Invalid age
// configurations return an empty sequence and log a warning.
std::vector<SimulationResult> run_simulation(
    const SimulationInputs& inputs,
    const TaxRates& rates = TaxRates::canada_2024(),
    const SimulationConfig& config = SimulationConfig()
);

// Projection with an explicit capital-growth path (one rate per year; the
// last rate repeats if the path is shorter than the projection). Used by the
// Monte Carlo driver.
std::vector<SimulationResult> run_simulation_with_growth(
    const SimulationInputs& inputs,
    const std::vector<double>& growth_path,
    const TaxRates& rates = TaxRates::canada_2024(),
    const SimulationConfig& config = SimulationConfig()
);

// Number of years run_simulation would emit for valid inputs
int projection_years(const SimulationInputs& inputs);

} // namespace retirecalc

#endif // RETIRECALC_SIMULATION_HPP
