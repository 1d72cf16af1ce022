#include "plan_summary.hpp"
#include "tax.hpp"
#include <algorithm>

namespace retirecalc {

PlanSummary::PlanSummary()
    : estate_value(0.0), estate_tax(0.0), total_retirement_tax(0.0),
      total_retirement_income(0.0), total_tax_plus_estate(0.0),
      effective_tax_rate_retirement(0.0), effective_tax_rate_estate(0.0),
      total_effective_tax_rate(0.0), net_retirement_income(0.0),
      net_estate_value(0.0), total_net_value(0.0), initial_withdrawal_rate(0.0),
      out_of_money_age() {}

namespace {

double ratio(double numerator, double denominator) {
    return denominator > 0.0 ? numerator / denominator : 0.0;
}

double total_withdrawals(const SimulationResult& r) {
    return r.total_rrsp_withdrawal + r.total_tfsa_withdrawal + r.total_non_registered_withdrawal;
}

double starting_assets(const SimulationInputs& inputs) {
    double total = inputs.person.total_assets();
    if (inputs.spouse) {
        total += inputs.spouse->total_assets();
    }
    return total;
}

// Terminal tax when the projection stopped before the last death was taxed
// (iteration cap): deemed disposition of everything left, with no other income.
double fallback_estate_tax(const SimulationResult& last, const SimulationInputs& inputs,
                           const TaxRates& rates)
{
    const double inclusion = rates.plans.capital_gains_inclusion;
    auto gains = [](const AccountSnapshot& s) {
        return std::max(0.0, s.non_registered - s.non_registered_acb);
    };
    const double terminal_income =
        last.person_accounts.rrsp + last.spouse_accounts.rrsp
        + inclusion * (gains(last.person_accounts) + gains(last.spouse_accounts));
    return compute_tax(terminal_income, inputs.jurisdiction, last.inflation_factor, rates);
}

} // anonymous namespace

PlanSummary summarize_plan(
    const std::vector<SimulationResult>& results,
    const SimulationInputs& inputs,
    const TaxRates& rates,
    bool inflation_adjusted)
{
    PlanSummary summary;
    if (results.empty()) {
        return summary;
    }

    auto adjust = [inflation_adjusted](double value, double factor) {
        return inflation_adjusted && factor > 0.0 ? value / factor : value;
    };

    const int retirement_age = inputs.person.retirement_age;

    for (const auto& r : results) {
        if (r.age < retirement_age) {
            continue;
        }
        summary.total_retirement_tax += adjust(r.tax_paid, r.inflation_factor);
        summary.total_retirement_income += adjust(r.gross_income, r.inflation_factor);
        if (!summary.out_of_money_age && r.total_assets < OUT_OF_MONEY_THRESHOLD) {
            summary.out_of_money_age = r.age;
        }
    }

    // Estate
    const SimulationResult& last = results.back();
    const bool estate_settled = last.person_died || last.spouse_died;
    const double nominal_estate = estate_settled ? last.gross_estate_value : last.total_assets;
    const double nominal_estate_tax = estate_settled
        ? last.terminal_tax
        : fallback_estate_tax(last, inputs, rates);

    summary.estate_value = adjust(nominal_estate, last.inflation_factor);
    summary.estate_tax = adjust(nominal_estate_tax, last.inflation_factor);

    summary.total_tax_plus_estate = summary.total_retirement_tax + summary.estate_tax;
    summary.effective_tax_rate_retirement =
        ratio(summary.total_retirement_tax, summary.total_retirement_income);
    summary.effective_tax_rate_estate = ratio(summary.estate_tax, summary.estate_value);
    summary.total_effective_tax_rate = ratio(
        summary.total_tax_plus_estate, summary.total_retirement_income + summary.estate_value);

    summary.net_retirement_income = summary.total_retirement_income - summary.total_retirement_tax;
    summary.net_estate_value = summary.estate_value - summary.estate_tax;
    summary.total_net_value = summary.net_retirement_income + summary.net_estate_value;

    // Initial withdrawal rate (nominal ratio)
    auto retirement_year = std::find_if(results.begin(), results.end(),
        [retirement_age](const SimulationResult& r) { return r.age == retirement_age; });

    if (retirement_year != results.end() && retirement_year != results.begin()) {
        const SimulationResult& previous = *(retirement_year - 1);
        summary.initial_withdrawal_rate =
            ratio(total_withdrawals(*retirement_year), previous.total_assets);
    } else {
        summary.initial_withdrawal_rate =
            ratio(total_withdrawals(results.front()), starting_assets(inputs));
    }

    return summary;
}

} // namespace retirecalc
