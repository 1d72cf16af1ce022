#ifndef RETIRECALC_GROSS_UP_HPP
#define RETIRECALC_GROSS_UP_HPP

#include "tax.hpp"
#include <string>

namespace retirecalc {

// Result of converting an after-tax target into a taxable withdrawal
struct GrossUpResult {
    double gross;           // Taxable amount to withdraw
    double marginal_tax;    // Extra tax + clawback caused by the withdrawal
    double net;             // gross - marginal_tax
    int iterations;
    bool converged;         // |net - target| < 1 within the iteration budget

    GrossUpResult();
};

// Extra tax (including benefit clawback) from adding `gross` on top of
// `current_taxable`. With pension_eligible set, the withdrawal also counts
// toward eligible pension income on the after side.
double marginal_tax_on_withdrawal(
    double gross,
    double current_taxable,
    double base_benefit_amount,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates,
    const TaxCreditInputs& credits = TaxCreditInputs(),
    bool pension_eligible = false
);

// Find the taxable withdrawal that leaves `target_net` after its marginal tax.
// Bisection over [target, min(3 * target, 10,000,000)], at most 20 iterations,
// tolerance of one currency unit. Never fails: on non-convergence the last
// midpoint is returned with converged = false.
GrossUpResult solve_gross_withdrawal(
    double target_net,
    double current_taxable,
    double base_benefit_amount,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates,
    const TaxCreditInputs& credits = TaxCreditInputs(),
    bool pension_eligible = false
);

} // namespace retirecalc

#endif // RETIRECALC_GROSS_UP_HPP
