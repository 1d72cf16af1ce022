#include "simulation.hpp"
#include "benefits.hpp"
#include "gross_up.hpp"
#include "income_split.hpp"
#include "logger.hpp"
#include "market_returns.hpp"
#include "tax.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>

namespace retirecalc {

// ============================================================================
// Result types
// ============================================================================

AccountSnapshot::AccountSnapshot()
    : rrsp(0.0), tfsa(0.0), non_registered(0.0), non_registered_acb(0.0) {}

SimulationResult::SimulationResult()
    : year(0), age(0), spouse_age(), person_alive(false), spouse_alive(false),
      person_accounts(), spouse_accounts(), total_assets(0.0),
      gross_income(0.0), net_income(0.0), employment_income(0.0),
      cpp_income(0.0), oas_income(0.0), investment_income(0.0),
      spending_target(0.0), tax_paid(0.0), person_tax(0.0), spouse_tax(0.0),
      net_employment_income(0.0), net_cpp_income(0.0), net_oas_income(0.0),
      net_rrsp_income(0.0), net_investment_income(0.0),
      rrif_minimum_withdrawal(0.0), melt_withdrawal(0.0), extra_rrsp_withdrawal(0.0),
      total_rrsp_withdrawal(0.0), total_tfsa_withdrawal(0.0),
      total_non_registered_withdrawal(0.0),
      person_rrsp_withdrawal(0.0), spouse_rrsp_withdrawal(0.0),
      person_tfsa_withdrawal(0.0), spouse_tfsa_withdrawal(0.0),
      person_non_registered_withdrawal(0.0), spouse_non_registered_withdrawal(0.0),
      person_net_withdrawal(0.0), spouse_net_withdrawal(0.0),
      realized_capital_gains(0.0),
      household_surplus(0.0), reinvested_tfsa(0.0), reinvested_rrsp(0.0),
      reinvested_non_registered(0.0), shortfall(0.0),
      inflation_factor(1.0), growth_rate(0.0),
      income_split_amount(0.0), income_split_savings(0.0),
      income_split_direction(SplitDirection::None), jurisdiction_fallback(false),
      person_died(false), spouse_died(false), rrsp_rolled_to_spouse(0.0),
      terminal_tax_rrsp(0.0), terminal_tax_capital_gains(0.0), terminal_tax(0.0),
      gross_estate_value(0.0), net_estate_value(0.0) {}

SimulationConfig::SimulationConfig()
    : stochastic(false), seed(42), run_id("projection"), emit_run_events(true) {}

SimulationConfig::SimulationConfig(bool stochastic_, uint64_t seed_)
    : stochastic(stochastic_), seed(seed_), run_id("projection"), emit_run_events(true) {}

// ============================================================================
// Per-year helpers
// ============================================================================

namespace {

constexpr double EPSILON = 1e-9;
constexpr int PENSION_CREDIT_AGE = 65;

// Everything one living person earns, withdraws and reinvests in a year
struct PersonYear {
    bool alive = false;
    int age = 0;
    double employment = 0.0;
    double cpp = 0.0;
    double oas = 0.0;
    double rrif = 0.0;
    double melt = 0.0;
    double extra_rrsp = 0.0;
    double interest = 0.0;
    double cash_dividends = 0.0;
    double grossed_up_dividends = 0.0;
    double tfsa_withdrawal = 0.0;
    double non_registered_withdrawal = 0.0;
    double realized_gain = 0.0;
    double reinvest_tfsa = 0.0;
    double reinvest_rrsp = 0.0;
    double reinvest_non_registered = 0.0;
    double taxable = 0.0;
    double tax = 0.0;

    double rrsp_income() const { return rrif + melt + extra_rrsp; }
    double investment_cash() const { return interest + cash_dividends; }
    double investment_taxable() const { return interest + grossed_up_dividends; }

    double eligible_pension() const {
        return age >= PENSION_CREDIT_AGE ? rrsp_income() : 0.0;
    }

    // Cash received before any waterfall draw
    double forced_cash() const {
        return employment + cpp + oas + rrif + melt + investment_cash();
    }

    double withdrawals() const {
        return extra_rrsp + tfsa_withdrawal + non_registered_withdrawal;
    }

    double reinvested() const {
        return reinvest_tfsa + reinvest_rrsp + reinvest_non_registered;
    }
};

// Shared, read-only state for one projection year
struct YearContext {
    const TaxRates& rates;
    const std::string& jurisdiction;
    double inflation_factor;
};

struct Household {
    std::array<Person*, 2> people;
    std::array<PersonYear, 2> years;

    size_t size() const { return people[1] ? 2 : 1; }
    bool alive(size_t i) const { return people[i] && years[i].alive; }
};

TaxCreditInputs credits_for(const PersonYear& py) {
    return TaxCreditInputs(py.age, py.eligible_pension(), py.grossed_up_dividends);
}

double taxable_income(const PersonYear& py, const TaxRates& rates) {
    return py.employment + py.cpp + py.oas + py.rrsp_income() + py.investment_taxable()
         + rates.plans.capital_gains_inclusion * py.realized_gain;
}

double tax_with_clawback(const PersonYear& py, const YearContext& ctx) {
    return compute_tax_with_clawback(taxable_income(py, ctx.rates), py.oas, ctx.jurisdiction,
                                     ctx.inflation_factor, ctx.rates, credits_for(py));
}

bool in_melt_window(const Person& p, int age, const TaxRates& rates) {
    return p.rrsp_melt_amount > 0.0
        && age >= p.melt_start_age()
        && age < rates.plans.mandatory_withdrawal_age;
}

// Step 1: employment, benefits, mandatory and voluntary RRSP withdrawals,
// and yield from the non-registered account.
PersonYear forced_income(
    Person& p,
    int age,
    const SimulationInputs& inputs,
    bool allow_melt,
    const YearContext& ctx)
{
    const TaxRates& rates = ctx.rates;
    const double f = ctx.inflation_factor;

    PersonYear py;
    py.alive = true;
    py.age = age;

    py.employment = age < p.retirement_age ? p.current_income : 0.0;

    // Payments begin at the same clamped age the amount is priced at
    const int cpp_start = std::clamp(p.cpp_start_age, rates.cpp.earliest_start_age,
                                     rates.cpp.latest_start_age);
    if (age >= cpp_start) {
        py.cpp = estimate_cpp(p.cpp_contributed_years, p.cpp_start_age, rates, f);
    }
    py.oas = estimate_oas(age, p.oas_start_age, rates, f);

    if (age >= rates.plans.mandatory_withdrawal_age) {
        py.rrif = p.rrsp.withdraw(p.rrsp.balance() * rrif_minimum_factor(age));
    }

    if (allow_melt && in_melt_window(p, age, rates)) {
        py.melt = p.rrsp.withdraw(p.rrsp_melt_amount);
    }

    const double balance = p.non_registered.balance();
    const AssetMix& mix = p.non_registered.asset_mix();
    py.interest = balance * mix.interest * inputs.returns.interest;
    py.cash_dividends = balance * mix.dividend * inputs.returns.dividend;
    py.grossed_up_dividends = py.cash_dividends * rates.credits.dividend_gross_up;

    return py;
}

double spending_target(const SimulationInputs& inputs, const Household& hh, int primary_age,
                       double inflation_factor)
{
    bool retired = true;
    for (size_t i = 0; i < hh.size(); ++i) {
        if (hh.alive(i) && hh.years[i].age < hh.people[i]->retirement_age) {
            retired = false;
        }
    }

    double target = (retired ? inputs.post_retirement_spend : inputs.pre_retirement_spend)
                  * inflation_factor;

    for (const auto& event : inputs.one_time_events) {
        if (event.age != primary_age) {
            continue;
        }
        const double amount = event.amount * inflation_factor;
        target += event.type == EventType::Expense ? amount : -amount;
    }
    return target;
}

// ----------------------------------------------------------------------------
// Deficit waterfall steps. Each returns the net cash obtained.
// ----------------------------------------------------------------------------

double draw_non_registered(Household& hh, double need) {
    double available = 0.0;
    for (size_t i = 0; i < hh.size(); ++i) {
        if (hh.alive(i)) available += hh.people[i]->non_registered.balance();
    }
    if (need <= EPSILON || available <= 0.0) {
        return 0.0;
    }

    const double take = std::min(available, need);
    double obtained = 0.0;
    for (size_t i = 0; i < hh.size(); ++i) {
        if (!hh.alive(i)) continue;
        Person& p = *hh.people[i];
        const double share = take * p.non_registered.balance() / available;
        const NonRegisteredWithdrawal w = p.non_registered.withdraw(share);
        hh.years[i].non_registered_withdrawal += w.amount;
        hh.years[i].realized_gain += w.realized_gain;
        obtained += w.amount;
    }
    return obtained;
}

double draw_tfsa(Household& hh, double need) {
    double available = 0.0;
    for (size_t i = 0; i < hh.size(); ++i) {
        if (hh.alive(i)) available += hh.people[i]->tfsa.balance();
    }
    if (need <= EPSILON || available <= 0.0) {
        return 0.0;
    }

    const double take = std::min(available, need);
    double obtained = 0.0;
    for (size_t i = 0; i < hh.size(); ++i) {
        if (!hh.alive(i)) continue;
        Person& p = *hh.people[i];
        const double taken = p.tfsa.withdraw(take * p.tfsa.balance() / available);
        hh.years[i].tfsa_withdrawal += taken;
        obtained += taken;
    }
    return obtained;
}

// RRSP draws are grossed up per person so each share arrives net of its
// marginal tax. A second pass lets one spouse cover what the other's capped
// balance could not.
double draw_rrsp(Household& hh, double need, DeferredDrawSplit split, const YearContext& ctx) {
    double obtained = 0.0;

    for (int pass = 0; pass < 2; ++pass) {
        const double remaining = need - obtained;
        if (remaining <= EPSILON) {
            break;
        }

        double available = 0.0;
        int holders = 0;
        for (size_t i = 0; i < hh.size(); ++i) {
            if (hh.alive(i) && hh.people[i]->rrsp.balance() > 0.0) {
                available += hh.people[i]->rrsp.balance();
                ++holders;
            }
        }
        if (holders == 0) {
            break;
        }

        for (size_t i = 0; i < hh.size(); ++i) {
            if (!hh.alive(i)) continue;
            Person& p = *hh.people[i];
            PersonYear& py = hh.years[i];
            const double balance = p.rrsp.balance();
            if (balance <= 0.0) continue;

            const double share = split == DeferredDrawSplit::ByBalance
                ? remaining * balance / available
                : remaining / holders;
            if (share <= EPSILON) continue;

            const double current_taxable = taxable_income(py, ctx.rates);
            const TaxCreditInputs credits = credits_for(py);
            const bool pension_eligible = py.age >= PENSION_CREDIT_AGE;

            const GrossUpResult gross_up = solve_gross_withdrawal(
                share, current_taxable, py.oas, ctx.jurisdiction, ctx.inflation_factor,
                ctx.rates, credits, pension_eligible);

            double gross = gross_up.gross;
            double net = gross_up.net;
            if (gross > balance) {
                gross = balance;
                net = gross - marginal_tax_on_withdrawal(
                    gross, current_taxable, py.oas, ctx.jurisdiction, ctx.inflation_factor,
                    ctx.rates, credits, pension_eligible);
            }

            py.extra_rrsp += p.rrsp.withdraw(gross);
            obtained += net;
        }
    }
    return obtained;
}

double resolve_deficit(Household& hh, double deficit, const SimulationInputs& inputs,
                       const YearContext& ctx)
{
    double remaining = deficit;
    auto apply = [&remaining](double net) {
        remaining = std::max(0.0, remaining - net);
    };

    if (inputs.withdrawal_strategy == WithdrawalStrategy::RrspFirst) {
        apply(draw_rrsp(hh, remaining, inputs.deferred_split, ctx));
        apply(draw_non_registered(hh, remaining));
        apply(draw_tfsa(hh, remaining));
    } else {
        apply(draw_non_registered(hh, remaining));
        apply(draw_tfsa(hh, remaining));
        apply(draw_rrsp(hh, remaining, inputs.deferred_split, ctx));
    }
    return remaining;
}

// ----------------------------------------------------------------------------
// Surplus waterfall
// ----------------------------------------------------------------------------

double tfsa_room(const TaxRates& rates, double inflation_factor) {
    const double rounding = rates.plans.tfsa_rounding;
    const double indexed = rates.plans.tfsa_annual_limit * inflation_factor;
    if (rounding <= 0.0) {
        return indexed;
    }
    return std::round(indexed / rounding) * rounding;
}

void reinvest_surplus(Household& hh, double surplus, const YearContext& ctx) {
    const TaxRates& rates = ctx.rates;
    double remaining = surplus;

    const double room = tfsa_room(rates, ctx.inflation_factor);
    for (size_t i = 0; i < hh.size() && remaining > 0.0; ++i) {
        if (!hh.alive(i)) continue;
        const double amount = std::min(remaining, room);
        hh.people[i]->tfsa.deposit(amount);
        hh.years[i].reinvest_tfsa += amount;
        remaining -= amount;
    }

    for (size_t i = 0; i < hh.size() && remaining > 0.0; ++i) {
        if (!hh.alive(i)) continue;
        Person& p = *hh.people[i];
        PersonYear& py = hh.years[i];
        if (py.age >= rates.plans.rrsp_contribution_age_limit || py.employment <= 0.0
            || in_melt_window(p, py.age, rates)) {
            continue;
        }
        const double limit = std::min(py.employment * rates.plans.rrsp_contribution_rate,
                                      rates.plans.rrsp_dollar_cap * ctx.inflation_factor);
        const double amount = std::min(remaining, limit);
        p.rrsp.deposit(amount);
        py.reinvest_rrsp += amount;
        remaining -= amount;
    }

    if (remaining <= 0.0) {
        return;
    }

    int living = 0;
    for (size_t i = 0; i < hh.size(); ++i) {
        if (hh.alive(i)) ++living;
    }
    for (size_t i = 0; i < hh.size(); ++i) {
        if (!hh.alive(i)) continue;
        const double amount = remaining / living;
        hh.people[i]->non_registered.contribute(amount);
        hh.years[i].reinvest_non_registered += amount;
    }
}

// ----------------------------------------------------------------------------
// Estate
// ----------------------------------------------------------------------------

void roll_over_estate(Person& deceased, Person& survivor, SimulationResult& record) {
    Logger& logger = Logger::get_instance();
    if (logger.is_enabled(LogLevel::DEBUG)) {
        for (const Account* account : {&deceased.rrsp, &deceased.tfsa}) {
            logger.log_debug("Account rolled over to surviving spouse", {
                {"account", account_type_to_string(account->type())},
                {"amount", format_amount(account->balance())},
                {"year", std::to_string(record.year)}
            });
        }
    }

    const double rrsp = deceased.rrsp.drain();
    survivor.rrsp.deposit(rrsp);
    survivor.tfsa.deposit(deceased.tfsa.drain());
    deceased.non_registered.transfer_to(survivor.non_registered);
    record.rrsp_rolled_to_spouse += rrsp;
}

// Deemed disposition at the last death, taxed on top of the year's income
void apply_terminal_tax(const Person& deceased, const PersonYear& py, const YearContext& ctx,
                        SimulationResult& record)
{
    const TaxCreditInputs credits = credits_for(py);
    const double base = py.taxable;
    const double rrsp = deceased.rrsp.balance();
    const double gains = ctx.rates.plans.capital_gains_inclusion
                       * deceased.non_registered.unrealized_gain();

    auto tax_at = [&](double income) {
        return compute_tax(income, ctx.jurisdiction, ctx.inflation_factor, ctx.rates, credits);
    };

    const double tax_base = tax_at(base);
    const double tax_with_rrsp = tax_at(base + rrsp);
    const double tax_with_gains = tax_at(base + rrsp + gains);

    const double on_rrsp = tax_with_rrsp - tax_base;
    const double on_gains = tax_with_gains - tax_with_rrsp;

    record.terminal_tax_rrsp += on_rrsp;
    record.terminal_tax_capital_gains += on_gains;
    record.terminal_tax += on_rrsp + on_gains;
    record.gross_estate_value += deceased.total_assets();
    record.net_estate_value += deceased.total_assets() - (on_rrsp + on_gains);
}

AccountSnapshot snapshot(const Person& p) {
    AccountSnapshot s;
    s.rrsp = p.rrsp.balance();
    s.tfsa = p.tfsa.balance();
    s.non_registered = p.non_registered.balance();
    s.non_registered_acb = p.non_registered.adjusted_cost_base();
    return s;
}

// Net figures: each taxable source carries its share of the household tax
void allocate_tax(const Household& hh, SimulationResult& record) {
    const double total_taxable = record.gross_income;
    auto allocated = [&](double taxable_amount) {
        if (total_taxable <= 0.0) return 0.0;
        return record.tax_paid * taxable_amount / total_taxable;
    };

    record.net_employment_income = record.employment_income - allocated(record.employment_income);
    record.net_cpp_income = record.cpp_income - allocated(record.cpp_income);
    record.net_oas_income = record.oas_income - allocated(record.oas_income);
    record.net_rrsp_income = record.total_rrsp_withdrawal - allocated(record.total_rrsp_withdrawal);

    double investment_taxable = 0.0;
    for (size_t i = 0; i < hh.size(); ++i) {
        if (hh.alive(i)) investment_taxable += hh.years[i].investment_taxable();
    }
    record.net_investment_income = record.investment_income - allocated(investment_taxable);

    const PersonYear& p = hh.years[0];
    record.person_net_withdrawal = p.rrsp_income() - allocated(p.rrsp_income())
                                 + p.tfsa_withdrawal + p.non_registered_withdrawal;
    if (hh.size() > 1) {
        const PersonYear& s = hh.years[1];
        record.spouse_net_withdrawal = s.rrsp_income() - allocated(s.rrsp_income())
                                     + s.tfsa_withdrawal + s.non_registered_withdrawal;
    }
}

void fill_income_fields(const Household& hh, SimulationResult& record) {
    double cash_in = 0.0;
    double reinvested = 0.0;

    for (size_t i = 0; i < hh.size(); ++i) {
        if (!hh.alive(i)) continue;
        const PersonYear& py = hh.years[i];

        record.gross_income += py.taxable;
        record.employment_income += py.employment;
        record.cpp_income += py.cpp;
        record.oas_income += py.oas;
        record.investment_income += py.investment_cash();
        record.tax_paid += py.tax;

        record.rrif_minimum_withdrawal += py.rrif;
        record.melt_withdrawal += py.melt;
        record.extra_rrsp_withdrawal += py.extra_rrsp;
        record.total_rrsp_withdrawal += py.rrsp_income();
        record.total_tfsa_withdrawal += py.tfsa_withdrawal;
        record.total_non_registered_withdrawal += py.non_registered_withdrawal;
        record.realized_capital_gains += py.realized_gain;

        record.reinvested_tfsa += py.reinvest_tfsa;
        record.reinvested_rrsp += py.reinvest_rrsp;
        record.reinvested_non_registered += py.reinvest_non_registered;

        cash_in += py.forced_cash() + py.withdrawals();
        reinvested += py.reinvested();
    }

    const PersonYear& p = hh.years[0];
    record.person_tax = p.tax;
    record.person_rrsp_withdrawal = p.rrsp_income();
    record.person_tfsa_withdrawal = p.tfsa_withdrawal;
    record.person_non_registered_withdrawal = p.non_registered_withdrawal;
    if (hh.size() > 1) {
        const PersonYear& s = hh.years[1];
        record.spouse_tax = s.tax;
        record.spouse_rrsp_withdrawal = s.rrsp_income();
        record.spouse_tfsa_withdrawal = s.tfsa_withdrawal;
        record.spouse_non_registered_withdrawal = s.non_registered_withdrawal;
    }

    record.net_income = cash_in - record.tax_paid - reinvested;
}

std::vector<SimulationResult> project(
    const SimulationInputs& inputs,
    const std::vector<double>& growth_path,
    const TaxRates& rates,
    const SimulationConfig& config)
{
    RunContext run_ctx(config.run_id, config.stochastic ? "stochastic" : "deterministic");
    Logger& logger = Logger::get_instance();

    std::vector<SimulationResult> results;

    const std::string invalid = validate_inputs(inputs);
    if (!invalid.empty()) {
        if (config.emit_run_events) {
            logger.log_inputs_rejected(run_ctx, invalid);
        }
        return results;
    }

    const ResolvedJurisdiction jurisdiction = rates.resolve(inputs.jurisdiction);
    if (jurisdiction.used_fallback && config.emit_run_events) {
        logger.log_jurisdiction_fallback(run_ctx, jurisdiction.requested, jurisdiction.resolved);
    }

    const int years = projection_years(inputs);

    if (config.emit_run_events) {
        logger.log_run_start(run_ctx, {
            {"jurisdiction", jurisdiction.resolved},
            {"years", std::to_string(years)},
            {"strategy", withdrawal_strategy_to_string(inputs.withdrawal_strategy)},
            {"has_spouse", inputs.spouse ? "true" : "false"}
        });
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    // Working copies; the caller's records are never touched
    Person person = inputs.person.clone();
    std::optional<Person> spouse;
    if (inputs.spouse) {
        spouse = inputs.spouse->clone();
    }

    results.reserve(static_cast<size_t>(years));
    bool shortfall_reported = false;

    for (int t = 0; t < years && t < MAX_PROJECTION_YEARS; ++t) {
        const int person_age = inputs.person.age + t;
        const std::optional<int> spouse_age = spouse
            ? std::optional<int>(inputs.spouse->age + t) : std::nullopt;

        const bool person_alive = person_age <= person.life_expectancy;
        const bool spouse_alive = spouse && *spouse_age <= spouse->life_expectancy;
        if (!person_alive && !spouse_alive) {
            break;
        }

        const double inflation_factor = std::pow(1.0 + inputs.inflation_rate, t);
        const double growth = growth_path.empty()
            ? inputs.returns.capital_growth
            : growth_path[std::min(static_cast<size_t>(t), growth_path.size() - 1)];

        const YearContext ctx{rates, jurisdiction.resolved, inflation_factor};

        Household hh;
        hh.people = {&person, spouse ? &*spouse : nullptr};

        // 1. Forced income
        const std::array<bool, 2> alive = {person_alive, spouse_alive};
        const std::array<int, 2> ages = {person_age, spouse_age.value_or(0)};
        for (size_t i = 0; i < hh.size(); ++i) {
            if (!alive[i]) continue;
            Person& p = *hh.people[i];
            const bool allow_melt = !(inputs.withdrawal_strategy == WithdrawalStrategy::RrspFirst
                                      && ages[i] >= p.retirement_age);
            hh.years[i] = forced_income(p, ages[i], inputs, allow_melt, ctx);
        }

        // 2. Baseline position
        double base_net_cash = 0.0;
        for (size_t i = 0; i < hh.size(); ++i) {
            if (!hh.alive(i)) continue;
            base_net_cash += hh.years[i].forced_cash() - tax_with_clawback(hh.years[i], ctx);
        }

        SimulationResult record;
        record.year = inputs.start_year + t;
        record.age = person_age;
        record.spouse_age = spouse_age;
        record.person_alive = person_alive;
        record.spouse_alive = spouse_alive;
        record.inflation_factor = inflation_factor;
        record.growth_rate = growth;
        record.jurisdiction_fallback = jurisdiction.used_fallback;
        record.spending_target = spending_target(inputs, hh, person_age, inflation_factor);

        const double deficit = std::max(0.0, record.spending_target - base_net_cash);
        const double surplus = std::max(0.0, base_net_cash - record.spending_target);

        // 3-4. Waterfalls
        if (deficit > 0.0) {
            record.shortfall = resolve_deficit(hh, deficit, inputs, ctx);
            if (record.shortfall > EPSILON && !shortfall_reported && config.emit_run_events) {
                logger.log_warning(run_ctx, "Spending target not met from age " +
                                            std::to_string(person_age));
                shortfall_reported = true;
            }
        } else if (surplus > 0.0) {
            record.household_surplus = surplus;
            reinvest_surplus(hh, surplus, ctx);
        }

        // 5. Final tax
        for (size_t i = 0; i < hh.size(); ++i) {
            if (!hh.alive(i)) continue;
            PersonYear& py = hh.years[i];
            py.taxable = taxable_income(py, rates);
            py.tax = tax_with_clawback(py, ctx);
        }

        if (inputs.use_income_splitting && hh.alive(0) && hh.alive(1)) {
            const PersonYear& a = hh.years[0];
            const PersonYear& b = hh.years[1];
            const SplitResult split = compute_optimal_split(
                SplitParticipant(a.taxable, a.eligible_pension(), a.oas, a.grossed_up_dividends, a.age),
                SplitParticipant(b.taxable, b.eligible_pension(), b.oas, b.grossed_up_dividends, b.age),
                jurisdiction.resolved, inflation_factor, rates);
            if (split.direction != SplitDirection::None) {
                hh.years[0].tax = split.new_tax_a;
                hh.years[1].tax = split.new_tax_b;
                record.income_split_amount = split.amount;
                record.income_split_savings = split.savings;
                record.income_split_direction = split.direction;
            }
        }

        // 6. Growth
        for (size_t i = 0; i < hh.size(); ++i) {
            if (!hh.alive(i)) continue;
            Person& p = *hh.people[i];
            p.rrsp.grow(growth);
            p.tfsa.grow(growth);
            p.non_registered.grow(growth);
        }

        // 7. Estate
        for (size_t i = 0; i < hh.size(); ++i) {
            if (!hh.alive(i) || hh.years[i].age != hh.people[i]->life_expectancy) continue;

            const size_t other = 1 - i;
            const bool survivor = hh.size() > 1 && hh.alive(other)
                && hh.years[other].age < hh.people[other]->life_expectancy;

            if (i == 0) record.person_died = true;
            else record.spouse_died = true;

            if (survivor) {
                roll_over_estate(*hh.people[i], *hh.people[other], record);
            } else {
                apply_terminal_tax(*hh.people[i], hh.years[i], ctx, record);
            }
        }

        // 8. Record
        fill_income_fields(hh, record);
        allocate_tax(hh, record);

        record.person_accounts = snapshot(person);
        if (spouse) {
            record.spouse_accounts = snapshot(*spouse);
        }
        record.total_assets = record.person_accounts.total() + record.spouse_accounts.total();

        results.push_back(record);
    }

    if (config.emit_run_events) {
        auto end_time = std::chrono::high_resolution_clock::now();
        RunMetrics metrics;
        metrics.execution_time_ms = std::chrono::duration<double, std::milli>(
            end_time - start_time).count();
        metrics.years_projected = results.size();
        metrics.final_assets = results.empty() ? 0.0 : results.back().total_assets;
        logger.log_run_complete(run_ctx, metrics);
    }

    return results;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

int projection_years(const SimulationInputs& inputs) {
    int years = inputs.person.life_expectancy - inputs.person.age + 1;
    if (inputs.spouse) {
        years = std::max(years, inputs.spouse->life_expectancy - inputs.spouse->age + 1);
    }
    return std::max(0, std::min(years, MAX_PROJECTION_YEARS));
}

std::vector<SimulationResult> run_simulation(
    const SimulationInputs& inputs,
    const TaxRates& rates,
    const SimulationConfig& config)
{
    std::vector<double> growth_path;
    if (config.stochastic) {
        ReturnGenerator generator(config.seed);
        growth_path = generator.sample_path(
            static_cast<size_t>(projection_years(inputs)),
            inputs.returns.capital_growth,
            inputs.returns.volatility);
    }
    return project(inputs, growth_path, rates, config);
}

std::vector<SimulationResult> run_simulation_with_growth(
    const SimulationInputs& inputs,
    const std::vector<double>& growth_path,
    const TaxRates& rates,
    const SimulationConfig& config)
{
    return project(inputs, growth_path, rates, config);
}

} // namespace retirecalc
