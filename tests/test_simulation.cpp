#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "benefits.hpp"
#include "logger.hpp"
#include "simulation.hpp"
#include "tax.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace retirecalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Helper functions for setting up households
// ============================================================================

namespace {

SimulationConfig quiet_config() {
    SimulationConfig config;
    config.emit_run_events = false;
    return config;
}

Person make_person(int age, int retirement_age, int life_expectancy,
                   double rrsp = 0.0, double tfsa = 0.0, double non_registered = 0.0) {
    Person p;
    p.age = age;
    p.retirement_age = retirement_age;
    p.life_expectancy = life_expectancy;
    p.rrsp = Account(AccountType::RRSP, rrsp);
    p.tfsa = Account(AccountType::TFSA, tfsa);
    p.non_registered = NonRegisteredAccount(non_registered, non_registered * 0.7, AssetMix());
    return p;
}

SimulationInputs flat_inputs() {
    SimulationInputs inputs;
    inputs.inflation_rate = 0.0;
    inputs.returns = ReturnAssumptions(0.0, 0.0, 0.0, 0.0);
    return inputs;
}

SimulationInputs make_couple() {
    SimulationInputs inputs;
    inputs.jurisdiction = "ON";
    inputs.inflation_rate = 0.02;
    inputs.pre_retirement_spend = 70000.0;
    inputs.post_retirement_spend = 60000.0;
    inputs.returns = ReturnAssumptions(0.03, 0.03, 0.05, 0.0);

    inputs.person = make_person(60, 65, 90, 450000.0, 95000.0, 150000.0);
    inputs.person.current_income = 95000.0;
    inputs.person.rrsp_melt_amount = 20000.0;

    Person spouse = make_person(58, 63, 92, 180000.0, 80000.0, 40000.0);
    spouse.current_income = 60000.0;
    spouse.cpp_start_age = 67;
    spouse.oas_start_age = 67;
    inputs.spouse = spouse;

    inputs.one_time_events.emplace_back("Roof", 25000.0, 68, EventType::Expense);
    inputs.one_time_events.emplace_back("Downsize", 150000.0, 78, EventType::Inflow);
    return inputs;
}

// Routes log output to a fresh file only
void log_to_file(const std::string& path, LogLevel level) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<std::string> lines_containing(const std::string& path, const std::string& needle) {
    Logger::get_instance().flush();
    std::vector<std::string> matches;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (line.find(needle) != std::string::npos) matches.push_back(line);
    }
    return matches;
}

void reset_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

void require_non_negative(const AccountSnapshot& s) {
    REQUIRE(s.rrsp >= 0.0);
    REQUIRE(s.tfsa >= 0.0);
    REQUIRE(s.non_registered >= 0.0);
}

} // anonymous namespace

// ============================================================================
// Result Type Tests
// ============================================================================

TEST_CASE("SimulationConfig defaults", "[simulation]") {
    SimulationConfig config;
    REQUIRE_FALSE(config.stochastic);
    REQUIRE(config.seed == 42);
    REQUIRE(config.emit_run_events);

    SimulationConfig stochastic(true, 7);
    REQUIRE(stochastic.stochastic);
    REQUIRE(stochastic.seed == 7);
}

TEST_CASE("AccountSnapshot total", "[simulation]") {
    AccountSnapshot s;
    REQUIRE(s.total() == 0.0);
    s.rrsp = 1.0;
    s.tfsa = 2.0;
    s.non_registered = 3.0;
    s.non_registered_acb = 100.0;
    REQUIRE(s.total() == 6.0);
}

// ============================================================================
// Basic Projection Tests
// ============================================================================

TEST_CASE("Two-year single-person projection", "[simulation][scenario]") {
    SimulationInputs inputs = flat_inputs();
    inputs.person = make_person(65, 65, 66, 100000.0);
    inputs.person.non_registered = NonRegisteredAccount();
    inputs.person.cpp_start_age = 70;
    inputs.person.oas_start_age = 70;

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].age == 65);
    REQUIRE(results[1].age == 66);
    REQUIRE(results[0].year == 2025);
    REQUIRE(results[1].year == 2026);
    REQUIRE_FALSE(results[0].spouse_age.has_value());

    for (const auto& r : results) {
        // Below the conversion age: no mandatory withdrawal, nothing else needed
        REQUIRE(r.rrif_minimum_withdrawal == 0.0);
        REQUIRE(r.total_rrsp_withdrawal == 0.0);
        REQUIRE(r.gross_income == 0.0);
        REQUIRE(r.tax_paid == 0.0);
        REQUIRE(r.person_accounts.rrsp == 100000.0);
        REQUIRE(r.total_assets == 100000.0);
    }

    SECTION("Final year settles the estate") {
        const SimulationResult& last = results.back();
        REQUIRE(last.person_died);
        REQUIRE_FALSE(results[0].person_died);
        REQUIRE(last.terminal_tax > 0.0);
        REQUIRE(last.terminal_tax_capital_gains == 0.0);
        REQUIRE_THAT(last.terminal_tax_rrsp, WithinAbs(last.terminal_tax, 1e-9));
        REQUIRE_THAT(last.terminal_tax,
                     WithinAbs(compute_tax(100000.0, "ON", 1.0, TaxRates::canada_2024(),
                                           TaxCreditInputs(66, 0.0, 0.0)), 1e-6));
        REQUIRE(last.gross_estate_value == 100000.0);
        REQUIRE_THAT(last.net_estate_value, WithinAbs(100000.0 - last.terminal_tax, 1e-9));
    }
}

TEST_CASE("Mandatory withdrawal from age 72", "[simulation]") {
    SimulationInputs inputs = flat_inputs();
    inputs.person = make_person(72, 65, 74, 100000.0);
    inputs.person.non_registered = NonRegisteredAccount();
    inputs.person.cpp_start_age = 75;
    inputs.person.oas_start_age = 75;

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    REQUIRE(results.size() == 3);
    REQUIRE_THAT(results[0].rrif_minimum_withdrawal, WithinAbs(5400.0, 1e-9));
    REQUIRE_THAT(results[1].rrif_minimum_withdrawal, WithinAbs(94600.0 * 0.0553, 1e-6));

    SECTION("Unspent minimum is reinvested, never into the RRSP") {
        REQUIRE(results[0].household_surplus > 0.0);
        REQUIRE(results[0].reinvested_rrsp == 0.0);
        REQUIRE(results[0].reinvested_tfsa > 0.0);
        REQUIRE_THAT(results[0].reinvested_tfsa + results[0].reinvested_non_registered,
                     WithinAbs(results[0].household_surplus, 1e-6));
    }
}

TEST_CASE("Projection years and calendar", "[simulation]") {
    SimulationInputs inputs = make_couple();
    inputs.start_year = 2030;

    // Spouse outlives: 92 - 58 + 1 = 35 years
    REQUIRE(projection_years(inputs) == 35);

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
    REQUIRE(results.size() == 35);
    for (size_t i = 0; i < results.size(); ++i) {
        REQUIRE(results[i].year == 2030 + static_cast<int>(i));
        REQUIRE(results[i].age == 60 + static_cast<int>(i));
        REQUIRE(results[i].spouse_age.value() == 58 + static_cast<int>(i));
        REQUIRE_THAT(results[i].inflation_factor, WithinRel(std::pow(1.02, static_cast<double>(i)), 1e-12));
    }

    // Person dies at 90, spouse continues alone
    REQUIRE(results[30].person_alive);
    REQUIRE(results[30].person_died);
    REQUIRE_FALSE(results[31].person_alive);
    REQUIRE(results[31].spouse_alive);
}

// ============================================================================
// Determinism and Input Handling
// ============================================================================

TEST_CASE("Deterministic runs are reproducible", "[simulation][property]") {
    SimulationInputs inputs = make_couple();

    std::vector<SimulationResult> a = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
    std::vector<SimulationResult> b = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].total_assets == b[i].total_assets);
        REQUIRE(a[i].tax_paid == b[i].tax_paid);
        REQUIRE(a[i].net_income == b[i].net_income);
        REQUIRE(a[i].total_rrsp_withdrawal == b[i].total_rrsp_withdrawal);
        REQUIRE(a[i].terminal_tax == b[i].terminal_tax);
    }
}

TEST_CASE("Caller inputs are not mutated", "[simulation]") {
    SimulationInputs inputs = make_couple();

    run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    REQUIRE(inputs.person.rrsp.balance() == 450000.0);
    REQUIRE(inputs.person.tfsa.balance() == 95000.0);
    REQUIRE(inputs.person.non_registered.balance() == 150000.0);
    REQUIRE(inputs.spouse->rrsp.balance() == 180000.0);
}

TEST_CASE("Invalid age configurations give an empty projection", "[simulation][error]") {
    SimulationInputs inputs = make_couple();

    SECTION("Retirement after death") {
        inputs.person.retirement_age = 95;
    }

    SECTION("Negative age") {
        inputs.person.age = -5;
    }

    SECTION("Already past life expectancy") {
        inputs.person.age = 91;
    }

    SECTION("Lifespan beyond the cap") {
        inputs.person.age = 0;
        inputs.person.life_expectancy = 125;
    }

    SECTION("Invalid spouse") {
        inputs.spouse->life_expectancy = 50;
    }

    std::vector<SimulationResult> results = run_simulation(inputs);
    REQUIRE(results.empty());
    REQUIRE_FALSE(validate_inputs(inputs).empty());
}

TEST_CASE("Unknown jurisdiction falls back visibly", "[simulation]") {
    SimulationInputs inputs = make_couple();
    std::vector<SimulationResult> baseline = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    inputs.jurisdiction = "ZZ";
    std::vector<SimulationResult> fallback = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    REQUIRE(fallback.size() == baseline.size());
    for (size_t i = 0; i < fallback.size(); ++i) {
        REQUIRE(fallback[i].jurisdiction_fallback);
        REQUIRE_FALSE(baseline[i].jurisdiction_fallback);
        REQUIRE(fallback[i].tax_paid == baseline[i].tax_paid);
    }
}

// ============================================================================
// Waterfall Invariants
// ============================================================================

TEST_CASE("Balances never go negative", "[simulation][property]") {
    SimulationInputs inputs = make_couple();
    inputs.post_retirement_spend = 150000.0;

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    bool saw_shortfall = false;
    for (const auto& r : results) {
        require_non_negative(r.person_accounts);
        require_non_negative(r.spouse_accounts);
        REQUIRE(r.total_assets >= 0.0);
        REQUIRE(r.shortfall >= 0.0);
        if (r.shortfall > 1.0) {
            saw_shortfall = true;
        }
    }
    REQUIRE(saw_shortfall);
}

TEST_CASE("Withdrawals cover the spending target without overshooting", "[simulation][property]") {
    SimulationInputs inputs;
    inputs.jurisdiction = "AB";
    inputs.inflation_rate = 0.02;
    inputs.post_retirement_spend = 50000.0;
    inputs.returns = ReturnAssumptions(0.0, 0.0, 0.04, 0.0);
    inputs.person = make_person(65, 65, 90, 600000.0, 100000.0);
    inputs.person.non_registered = NonRegisteredAccount();

    SECTION("Tax-efficient order") {
        inputs.withdrawal_strategy = WithdrawalStrategy::TaxEfficient;
    }

    SECTION("RRSP-first order") {
        inputs.withdrawal_strategy = WithdrawalStrategy::RrspFirst;
    }

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
    REQUIRE(results.size() == 26);

    for (const auto& r : results) {
        if (r.shortfall >= 1.0) {
            continue;
        }
        REQUIRE(r.net_income <= r.spending_target + 5.0);
        // Tax on realized gains is not grossed up, so only gain-free years are exact
        if (r.realized_capital_gains == 0.0) {
            REQUIRE_THAT(r.net_income, WithinAbs(r.spending_target, 5.0));
        }
    }
}

TEST_CASE("Realized gains never push net above the target", "[simulation][property]") {
    SimulationInputs inputs;
    inputs.jurisdiction = "AB";
    inputs.post_retirement_spend = 45000.0;
    inputs.returns = ReturnAssumptions(0.02, 0.02, 0.05, 0.0);
    inputs.person = make_person(66, 60, 85, 200000.0, 50000.0, 300000.0);
    inputs.spouse = make_person(64, 60, 88, 150000.0, 40000.0, 100000.0);

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    for (const auto& r : results) {
        REQUIRE(r.net_income <= r.spending_target + 5.0);
    }
}

TEST_CASE("Tax-efficient order draws non-registered before RRSP", "[simulation]") {
    SimulationInputs inputs = flat_inputs();
    inputs.jurisdiction = "AB";
    inputs.post_retirement_spend = 20000.0;
    inputs.person = make_person(65, 65, 70, 100000.0, 50000.0, 100000.0);
    inputs.person.cpp_start_age = 70;
    inputs.person.oas_start_age = 70;

    SECTION("Tax-efficient") {
        std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
        REQUIRE(results[0].total_non_registered_withdrawal > 0.0);
        REQUIRE(results[0].total_tfsa_withdrawal == 0.0);
        REQUIRE(results[0].extra_rrsp_withdrawal == 0.0);
        REQUIRE(results[0].realized_capital_gains > 0.0);
    }

    SECTION("RRSP-first") {
        inputs.withdrawal_strategy = WithdrawalStrategy::RrspFirst;
        std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
        REQUIRE(results[0].extra_rrsp_withdrawal > 20000.0);
        // At most the solver's rounding is left for later steps
        REQUIRE(results[0].total_non_registered_withdrawal < 1.0);
        REQUIRE(results[0].total_tfsa_withdrawal == 0.0);
    }
}

TEST_CASE("Deferred draw split between spouses", "[simulation]") {
    SimulationInputs inputs = flat_inputs();
    inputs.jurisdiction = "AB";
    inputs.post_retirement_spend = 80000.0;
    inputs.person = make_person(65, 65, 70, 300000.0);
    inputs.person.non_registered = NonRegisteredAccount();
    inputs.spouse = make_person(65, 65, 70, 100000.0);
    inputs.spouse->non_registered = NonRegisteredAccount();

    SECTION("By balance favours the larger RRSP") {
        inputs.deferred_split = DeferredDrawSplit::ByBalance;
        std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
        REQUIRE(results[0].person_rrsp_withdrawal > results[0].spouse_rrsp_withdrawal);
    }

    SECTION("Equal split draws the same from each") {
        inputs.deferred_split = DeferredDrawSplit::Equal;
        std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
        REQUIRE_THAT(results[0].person_rrsp_withdrawal,
                     WithinAbs(results[0].spouse_rrsp_withdrawal, 2.0));
    }
}

// ============================================================================
// Income and Surplus
// ============================================================================

TEST_CASE("Working-year surplus fills TFSA, then RRSP, then non-registered", "[simulation]") {
    SimulationInputs inputs = flat_inputs();
    inputs.pre_retirement_spend = 40000.0;
    inputs.person = make_person(50, 65, 85);
    inputs.person.current_income = 100000.0;

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
    const SimulationResult& first = results[0];

    REQUIRE(first.employment_income == 100000.0);
    REQUIRE(first.household_surplus > 25000.0);
    REQUIRE_THAT(first.reinvested_tfsa, WithinAbs(7000.0, 1e-9));
    REQUIRE_THAT(first.reinvested_rrsp, WithinAbs(18000.0, 1e-9));
    REQUIRE_THAT(first.reinvested_non_registered,
                 WithinAbs(first.household_surplus - 25000.0, 1e-6));
    REQUIRE_THAT(first.net_income, WithinAbs(first.spending_target, 1e-6));
}

TEST_CASE("Employment stops at retirement", "[simulation]") {
    SimulationInputs inputs = flat_inputs();
    inputs.person = make_person(63, 65, 70, 100000.0);
    inputs.person.current_income = 80000.0;

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    REQUIRE(results[0].employment_income == 80000.0);
    REQUIRE(results[1].employment_income == 80000.0);
    REQUIRE(results[2].employment_income == 0.0);
}

TEST_CASE("Government benefits start at their start ages", "[simulation]") {
    SimulationInputs inputs = flat_inputs();
    inputs.person = make_person(64, 64, 70);
    inputs.person.cpp_start_age = 65;
    inputs.person.oas_start_age = 66;

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
    const TaxRates& rates = TaxRates::canada_2024();

    REQUIRE(results[0].cpp_income == 0.0);
    REQUIRE_THAT(results[1].cpp_income, WithinAbs(estimate_cpp(40.0, 65, rates), 1e-9));
    REQUIRE(results[1].oas_income == 0.0);
    REQUIRE_THAT(results[2].oas_income, WithinAbs(estimate_oas(66, 66, rates), 1e-9));
}

TEST_CASE("CPP requested before 60 starts at 60", "[simulation]") {
    SimulationInputs inputs = flat_inputs();
    inputs.person = make_person(55, 55, 62, 200000.0);
    inputs.person.cpp_start_age = 55;

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
    const TaxRates& rates = TaxRates::canada_2024();

    for (int i = 0; i < 5; ++i) {
        REQUIRE(results[i].cpp_income == 0.0);
    }
    REQUIRE_THAT(results[5].cpp_income, WithinAbs(estimate_cpp(40.0, 60, rates), 1e-9));
    REQUIRE_THAT(results[5].cpp_income, WithinAbs(estimate_cpp(40.0, 55, rates), 1e-9));
}

TEST_CASE("RRSP meltdown window", "[simulation]") {
    SimulationInputs inputs = flat_inputs();
    inputs.person = make_person(60, 60, 75, 500000.0);
    inputs.person.rrsp_melt_amount = 20000.0;

    SECTION("Melt runs from retirement until the conversion age") {
        std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
        REQUIRE_THAT(results[0].melt_withdrawal, WithinAbs(20000.0, 1e-9));
        REQUIRE_THAT(results[11].melt_withdrawal, WithinAbs(20000.0, 1e-9));   // age 71
        REQUIRE(results[12].melt_withdrawal == 0.0);                           // age 72
        REQUIRE(results[12].rrif_minimum_withdrawal > 0.0);
    }

    SECTION("Explicit start age delays the melt") {
        inputs.person.rrsp_melt_start_age = 63;
        std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
        REQUIRE(results[2].melt_withdrawal == 0.0);
        REQUIRE_THAT(results[3].melt_withdrawal, WithinAbs(20000.0, 1e-9));
    }

    SECTION("RRSP-first suppresses the melt once retired") {
        inputs.withdrawal_strategy = WithdrawalStrategy::RrspFirst;
        std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
        REQUIRE(results[0].melt_withdrawal == 0.0);
    }
}

TEST_CASE("One-time events adjust the spending target", "[simulation]") {
    SimulationInputs inputs = flat_inputs();
    inputs.post_retirement_spend = 30000.0;
    inputs.person = make_person(65, 65, 70, 500000.0);
    inputs.one_time_events.emplace_back("Car", 40000.0, 66, EventType::Expense);
    inputs.one_time_events.emplace_back("Inheritance", 10000.0, 67, EventType::Inflow);

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    REQUIRE(results[0].spending_target == 30000.0);
    REQUIRE(results[1].spending_target == 70000.0);
    REQUIRE(results[2].spending_target == 20000.0);

    SECTION("Event amounts are indexed") {
        inputs.inflation_rate = 0.10;
        std::vector<SimulationResult> indexed = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
        REQUIRE_THAT(indexed[1].spending_target, WithinRel(70000.0 * 1.1, 1e-12));
    }
}

TEST_CASE("An unmet spending target is warned about once", "[simulation][logger]") {
    const std::string path = (std::filesystem::temp_directory_path() / "retirecalc_shortfall.log").string();
    log_to_file(path, LogLevel::WARN);

    SimulationInputs inputs = flat_inputs();
    inputs.post_retirement_spend = 60000.0;
    inputs.person = make_person(65, 65, 70, 20000.0);

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), SimulationConfig());
    std::vector<std::string> warnings = lines_containing(path, "Spending target not met");
    reset_logger();

    REQUIRE(results.back().shortfall > 0.0);
    REQUIRE(warnings.size() == 1);
    REQUIRE(warnings[0].find("\"level\":\"WARN\"") != std::string::npos);
    std::filesystem::remove(path);
}

// ============================================================================
// Income Splitting
// ============================================================================

TEST_CASE("Pension income splitting lowers household tax", "[simulation][income_split]") {
    SimulationInputs inputs = flat_inputs();
    inputs.jurisdiction = "AB";
    inputs.person = make_person(72, 65, 75, 1000000.0);
    inputs.person.non_registered = NonRegisteredAccount();
    inputs.spouse = make_person(72, 65, 75);
    inputs.spouse->non_registered = NonRegisteredAccount();

    std::vector<SimulationResult> separate = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    inputs.use_income_splitting = true;
    std::vector<SimulationResult> split = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    REQUIRE(split[0].income_split_amount > 0.0);
    REQUIRE(split[0].income_split_savings > 0.0);
    REQUIRE(split[0].tax_paid < separate[0].tax_paid);
    REQUIRE_THAT(separate[0].tax_paid - split[0].tax_paid,
                 WithinAbs(split[0].income_split_savings, 1e-6));
    REQUIRE(separate[0].income_split_amount == 0.0);

    REQUIRE(split[0].income_split_direction != SplitDirection::None);
    REQUIRE(separate[0].income_split_direction == SplitDirection::None);
}

// ============================================================================
// Estate
// ============================================================================

TEST_CASE("First death rolls assets to the surviving spouse", "[simulation][estate]") {
    SimulationInputs inputs = flat_inputs();
    inputs.person = make_person(65, 65, 70, 300000.0, 50000.0, 80000.0);
    inputs.spouse = make_person(65, 65, 80, 100000.0);

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
    REQUIRE(results.size() == 16);

    const SimulationResult& death_year = results[5];
    REQUIRE(death_year.person_died);
    REQUIRE_FALSE(death_year.spouse_died);
    REQUIRE(death_year.terminal_tax == 0.0);
    REQUIRE(death_year.rrsp_rolled_to_spouse > 0.0);
    REQUIRE(death_year.person_accounts.total() == 0.0);
    REQUIRE(death_year.spouse_accounts.rrsp > 100000.0);

    const SimulationResult& last = results.back();
    REQUIRE(last.spouse_died);
    REQUIRE(last.terminal_tax > 0.0);
    REQUIRE_THAT(last.net_estate_value, WithinAbs(last.gross_estate_value - last.terminal_tax, 1e-6));
}

TEST_CASE("Rollover logs each transferred account", "[simulation][estate][logger]") {
    const std::string path = (std::filesystem::temp_directory_path() / "retirecalc_rollover.log").string();
    log_to_file(path, LogLevel::DEBUG);

    SimulationInputs inputs = flat_inputs();
    inputs.person = make_person(65, 65, 70, 300000.0, 50000.0);
    inputs.spouse = make_person(65, 65, 80, 100000.0);
    run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    std::vector<std::string> events = lines_containing(path, "Account rolled over to surviving spouse");
    reset_logger();

    REQUIRE(events.size() == 2);
    REQUIRE(events[0].find("\"account\":\"rrsp\"") != std::string::npos);
    REQUIRE(events[1].find("\"account\":\"tfsa\"") != std::string::npos);
    std::filesystem::remove(path);
}

TEST_CASE("Same-year deaths are both taxed", "[simulation][estate]") {
    SimulationInputs inputs = flat_inputs();
    inputs.person = make_person(70, 65, 71, 200000.0);
    inputs.person.non_registered = NonRegisteredAccount();
    inputs.spouse = make_person(70, 65, 71, 200000.0);
    inputs.spouse->non_registered = NonRegisteredAccount();

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());
    const SimulationResult& last = results.back();

    REQUIRE(last.person_died);
    REQUIRE(last.spouse_died);
    REQUIRE(last.rrsp_rolled_to_spouse == 0.0);
    REQUIRE(last.terminal_tax > 0.0);
    REQUIRE_THAT(last.gross_estate_value, WithinAbs(last.total_assets, 1e-6));
}

TEST_CASE("Terminal tax includes deemed capital gains", "[simulation][estate]") {
    SimulationInputs inputs = flat_inputs();
    inputs.person = make_person(80, 65, 80);
    inputs.person.non_registered = NonRegisteredAccount(200000.0, 50000.0, AssetMix());

    std::vector<SimulationResult> results = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].terminal_tax_rrsp == 0.0);
    REQUIRE(results[0].terminal_tax_capital_gains > 0.0);
}

// ============================================================================
// Stochastic Mode
// ============================================================================

TEST_CASE("Stochastic runs are seeded", "[simulation][stochastic]") {
    SimulationInputs inputs = make_couple();
    inputs.returns.volatility = 0.15;

    SimulationConfig config(true, 7);
    config.emit_run_events = false;

    std::vector<SimulationResult> a = run_simulation(inputs, TaxRates::canada_2024(), config);
    std::vector<SimulationResult> b = run_simulation(inputs, TaxRates::canada_2024(), config);
    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].growth_rate == b[i].growth_rate);
        REQUIRE(a[i].total_assets == b[i].total_assets);
    }

    config.seed = 8;
    std::vector<SimulationResult> c = run_simulation(inputs, TaxRates::canada_2024(), config);
    REQUIRE(c[0].growth_rate != a[0].growth_rate);
}

TEST_CASE("Zero volatility stochastic run matches deterministic", "[simulation][stochastic]") {
    SimulationInputs inputs = make_couple();

    SimulationConfig config(true, 99);
    config.emit_run_events = false;

    std::vector<SimulationResult> stochastic = run_simulation(inputs, TaxRates::canada_2024(), config);
    std::vector<SimulationResult> deterministic = run_simulation(inputs, TaxRates::canada_2024(), quiet_config());

    REQUIRE(stochastic.size() == deterministic.size());
    for (size_t i = 0; i < stochastic.size(); ++i) {
        REQUIRE(stochastic[i].total_assets == deterministic[i].total_assets);
    }
}

TEST_CASE("Explicit growth path is applied per year", "[simulation][stochastic]") {
    SimulationInputs inputs = flat_inputs();
    inputs.person = make_person(65, 65, 67, 0.0, 100000.0);
    inputs.person.non_registered = NonRegisteredAccount();
    inputs.person.cpp_start_age = 70;
    inputs.person.oas_start_age = 70;

    std::vector<SimulationResult> results = run_simulation_with_growth(
        inputs, {0.10, -0.20}, TaxRates::canada_2024(), quiet_config());

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].growth_rate == 0.10);
    REQUIRE(results[1].growth_rate == -0.20);
    REQUIRE(results[2].growth_rate == -0.20);  // last rate repeats
    REQUIRE_THAT(results[0].person_accounts.tfsa, WithinRel(110000.0, 1e-12));
    REQUIRE_THAT(results[1].person_accounts.tfsa, WithinRel(88000.0, 1e-12));
}
