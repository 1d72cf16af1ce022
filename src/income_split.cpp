#include "income_split.hpp"
#include "numeric.hpp"
#include "tax.hpp"

namespace retirecalc {

namespace {

constexpr int SPLIT_AGE = 65;
constexpr double MAX_SPLIT_FRACTION = 0.5;
constexpr int SEARCH_ITERATIONS = 15;

struct DirectionOutcome {
    double amount;
    double tax_transferor;
    double tax_recipient;
    double savings;
};

double participant_tax(
    const SplitParticipant& p,
    double income,
    double pension,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates)
{
    const TaxCreditInputs credits(p.age, pension, p.grossed_up_dividends);
    return compute_tax_with_clawback(income, p.benefit_amount, jurisdiction,
                                     inflation_factor, rates, credits);
}

bool can_transfer(const SplitParticipant& transferor) {
    return transferor.age >= SPLIT_AGE && transferor.eligible_pension_income > 0.0;
}

DirectionOutcome search_direction(
    const SplitParticipant& from,
    const SplitParticipant& to,
    double baseline_total,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates)
{
    auto combined_tax = [&](double x) {
        return participant_tax(from, from.taxable_income - x, from.eligible_pension_income - x,
                               jurisdiction, inflation_factor, rates)
             + participant_tax(to, to.taxable_income + x, to.eligible_pension_income + x,
                               jurisdiction, inflation_factor, rates);
    };

    const double upper = MAX_SPLIT_FRACTION * from.eligible_pension_income;
    const SearchResult best = ternary_minimize(combined_tax, 0.0, upper, SEARCH_ITERATIONS);

    DirectionOutcome outcome;
    outcome.amount = best.x;
    outcome.tax_transferor = participant_tax(from, from.taxable_income - best.x,
                                             from.eligible_pension_income - best.x,
                                             jurisdiction, inflation_factor, rates);
    outcome.tax_recipient = participant_tax(to, to.taxable_income + best.x,
                                            to.eligible_pension_income + best.x,
                                            jurisdiction, inflation_factor, rates);
    outcome.savings = baseline_total - (outcome.tax_transferor + outcome.tax_recipient);
    return outcome;
}

} // anonymous namespace

SplitParticipant::SplitParticipant()
    : taxable_income(0.0), eligible_pension_income(0.0), benefit_amount(0.0),
      grossed_up_dividends(0.0), age(0) {}

SplitParticipant::SplitParticipant(double income, double pension, double benefit,
                                   double dividends, int age_)
    : taxable_income(income), eligible_pension_income(pension), benefit_amount(benefit),
      grossed_up_dividends(dividends), age(age_) {}

SplitResult::SplitResult()
    : amount(0.0), direction(SplitDirection::None), savings(0.0),
      baseline_tax_a(0.0), baseline_tax_b(0.0), new_tax_a(0.0), new_tax_b(0.0) {}

std::string split_direction_to_string(SplitDirection direction) {
    switch (direction) {
        case SplitDirection::None: return "none";
        case SplitDirection::FromAToB: return "a_to_b";
        case SplitDirection::FromBToA: return "b_to_a";
        default: return "unknown";
    }
}

SplitResult compute_optimal_split(
    const SplitParticipant& a,
    const SplitParticipant& b,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates)
{
    SplitResult result;
    result.baseline_tax_a = participant_tax(a, a.taxable_income, a.eligible_pension_income,
                                            jurisdiction, inflation_factor, rates);
    result.baseline_tax_b = participant_tax(b, b.taxable_income, b.eligible_pension_income,
                                            jurisdiction, inflation_factor, rates);
    result.new_tax_a = result.baseline_tax_a;
    result.new_tax_b = result.baseline_tax_b;

    const double baseline_total = result.baseline_total();

    if (can_transfer(a)) {
        const DirectionOutcome out = search_direction(a, b, baseline_total, jurisdiction,
                                                      inflation_factor, rates);
        if (out.savings > result.savings) {
            result.amount = out.amount;
            result.direction = SplitDirection::FromAToB;
            result.savings = out.savings;
            result.new_tax_a = out.tax_transferor;
            result.new_tax_b = out.tax_recipient;
        }
    }

    if (can_transfer(b)) {
        const DirectionOutcome out = search_direction(b, a, baseline_total, jurisdiction,
                                                      inflation_factor, rates);
        if (out.savings > result.savings) {
            result.amount = out.amount;
            result.direction = SplitDirection::FromBToA;
            result.savings = out.savings;
            result.new_tax_a = out.tax_recipient;
            result.new_tax_b = out.tax_transferor;
        }
    }

    return result;
}

} // namespace retirecalc
