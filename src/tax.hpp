#ifndef RETIRECALC_TAX_HPP
#define RETIRECALC_TAX_HPP

#include "tax_rates.hpp"
#include <string>

namespace retirecalc {

// Optional inputs that unlock non-refundable credits.
// A credit is applied only when its input is positive (or age-eligible).
struct TaxCreditInputs {
    int age;
    double eligible_pension_income;
    double grossed_up_dividends;

    TaxCreditInputs();
    TaxCreditInputs(int age_, double pension, double dividends);
};

// Component-level view of a single tax computation
struct TaxBreakdown {
    double federal_tax;             // Bracket tax before credits
    double regional_tax;            // Bracket tax before credits
    double federal_personal_credit;
    double regional_personal_credit;
    double pension_credit;
    double dividend_credit;
    double age_credit;
    double health_premium;
    double surtax;
    double total;                   // Floored at zero
    std::string jurisdiction;       // Jurisdiction actually used
    bool used_fallback;             // Requested jurisdiction was not in the table

    TaxBreakdown();
};

// Progressive tax on a single bracket schedule, thresholds scaled by inflation
double compute_bracket_tax(double income, const BracketSchedule& brackets,
                           double inflation_factor = 1.0);

// Full income tax with every component reported
TaxBreakdown compute_tax_breakdown(
    double taxable_income,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates,
    const TaxCreditInputs& credits = TaxCreditInputs()
);

// Total income tax payable (never negative)
double compute_tax(
    double taxable_income,
    const std::string& jurisdiction,
    double inflation_factor = 1.0,
    const TaxRates& rates = TaxRates::canada_2024(),
    const TaxCreditInputs& credits = TaxCreditInputs()
);

// Benefit recovery tax: 15% of net income over the indexed threshold,
// capped at the benefit actually received (max_clawback).
double compute_clawback(
    double net_income,
    double max_clawback,
    double inflation_factor = 1.0,
    double threshold = TaxRates::canada_2024().oas.clawback_threshold,
    double rate = TaxRates::canada_2024().oas.clawback_rate
);

// Income tax plus benefit clawback for one person-year
double compute_tax_with_clawback(
    double taxable_income,
    double benefit_received,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates,
    const TaxCreditInputs& credits = TaxCreditInputs()
);

} // namespace retirecalc

#endif // RETIRECALC_TAX_HPP
