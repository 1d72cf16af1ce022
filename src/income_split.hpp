#ifndef RETIRECALC_INCOME_SPLIT_HPP
#define RETIRECALC_INCOME_SPLIT_HPP

#include "tax_rates.hpp"
#include <cstdint>
#include <string>

namespace retirecalc {

// One spouse's tax position for a single year
struct SplitParticipant {
    double taxable_income;
    double eligible_pension_income;
    double benefit_amount;           // OAS received (for clawback)
    double grossed_up_dividends;
    int age;

    SplitParticipant();
    SplitParticipant(double income, double pension, double benefit, double dividends, int age_);
};

enum class SplitDirection : uint8_t {
    None = 0,
    FromAToB = 1,
    FromBToA = 2
};

std::string split_direction_to_string(SplitDirection direction);

struct SplitResult {
    double amount;                   // Pension income transferred
    SplitDirection direction;
    double savings;                  // Combined baseline tax - combined new tax
    double baseline_tax_a;           // Standalone tax + clawback
    double baseline_tax_b;
    double new_tax_a;                // Equal to baseline when no split
    double new_tax_b;

    SplitResult();

    double baseline_total() const { return baseline_tax_a + baseline_tax_b; }
};

// Search for the eligible pension transfer that minimizes combined household
// tax (including clawback). A direction is considered only when the
// transferor is at least 65 and has eligible pension income; the amount is
// searched in [0, 50% of the transferor's pension] with a 15-step ternary
// search. Returns a zero split when neither direction saves tax.
SplitResult compute_optimal_split(
    const SplitParticipant& a,
    const SplitParticipant& b,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates
);

} // namespace retirecalc

#endif // RETIRECALC_INCOME_SPLIT_HPP
