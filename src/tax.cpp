#include "tax.hpp"
#include <algorithm>
#include <limits>

namespace retirecalc {

// ============================================================================
// Input / Result Types
// ============================================================================

TaxCreditInputs::TaxCreditInputs()
    : age(0), eligible_pension_income(0.0), grossed_up_dividends(0.0) {}

TaxCreditInputs::TaxCreditInputs(int age_, double pension, double dividends)
    : age(age_), eligible_pension_income(pension), grossed_up_dividends(dividends) {}

TaxBreakdown::TaxBreakdown()
    : federal_tax(0.0), regional_tax(0.0),
      federal_personal_credit(0.0), regional_personal_credit(0.0),
      pension_credit(0.0), dividend_credit(0.0), age_credit(0.0),
      health_premium(0.0), surtax(0.0), total(0.0),
      used_fallback(false) {}

// ============================================================================
// Surcharge Helpers
// ============================================================================

namespace {

double compute_health_premium(double income, const RegionalSurcharge& surcharge,
                              double inflation_factor) {
    for (const auto& band : surcharge.health_premium_bands) {
        if (income <= band.upper_bound * inflation_factor) {
            return band.premium;
        }
    }
    return surcharge.health_premium_max;
}

// Surtax is levied on basic regional tax (after personal credit), not on income
double compute_surtax(double basic_regional_tax, const RegionalSurcharge& surcharge,
                      double inflation_factor) {
    if (basic_regional_tax <= 0.0) {
        return 0.0;
    }

    const double tier1 = surcharge.surtax_tier1_threshold * inflation_factor;
    const double tier2 = surcharge.surtax_tier2_threshold * inflation_factor;

    double surtax = 0.0;
    if (basic_regional_tax > tier1) {
        surtax += (basic_regional_tax - tier1) * surcharge.surtax_tier1_rate;
    }
    if (basic_regional_tax > tier2) {
        surtax += (basic_regional_tax - tier2) * surcharge.surtax_tier2_rate;
    }
    return surtax;
}

} // anonymous namespace

// ============================================================================
// Tax Computation
// ============================================================================

double compute_bracket_tax(double income, const BracketSchedule& brackets,
                           double inflation_factor) {
    double accumulated = 0.0;

    for (size_t i = 0; i < brackets.size(); ++i) {
        const double start = brackets[i].threshold * inflation_factor;
        const double next = (i + 1 < brackets.size())
            ? brackets[i + 1].threshold * inflation_factor
            : std::numeric_limits<double>::infinity();

        if (income > start) {
            accumulated += (std::min(income, next) - start) * brackets[i].rate;
        }
    }

    return accumulated;
}

TaxBreakdown compute_tax_breakdown(
    double taxable_income,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates,
    const TaxCreditInputs& credits)
{
    const ResolvedJurisdiction region = rates.resolve(jurisdiction);
    const CreditConstants& cc = rates.credits;

    TaxBreakdown tax;
    tax.jurisdiction = region.resolved;
    tax.used_fallback = region.used_fallback;

    tax.federal_tax = compute_bracket_tax(taxable_income, rates.federal_brackets, inflation_factor);
    tax.regional_tax = compute_bracket_tax(taxable_income, *region.brackets, inflation_factor);

    // Indexed basic personal amounts, each valued at its lowest bracket rate
    tax.federal_personal_credit =
        rates.federal_basic_personal_amount * inflation_factor * cc.federal_credit_rate;
    tax.regional_personal_credit =
        region.basic_personal_amount * inflation_factor * region.brackets->front().rate;

    const double basic_regional_tax = tax.regional_tax - tax.regional_personal_credit;
    double total = (tax.federal_tax - tax.federal_personal_credit) + basic_regional_tax;

    if (credits.eligible_pension_income > 0.0) {
        tax.pension_credit = std::min(credits.eligible_pension_income,
                                      cc.pension_amount * inflation_factor) * cc.pension_credit_rate;
        total -= tax.pension_credit;
    }

    if (credits.grossed_up_dividends > 0.0) {
        tax.dividend_credit = credits.grossed_up_dividends *
                              (cc.federal_dividend_rate + region.dividend_credit_rate);
        total -= tax.dividend_credit;
    }

    if (credits.age >= cc.age_credit_age) {
        const double excess = std::max(0.0, taxable_income - cc.age_amount_threshold * inflation_factor);
        const double claim = std::max(0.0, cc.age_amount_max * inflation_factor -
                                           cc.age_amount_reduction_rate * excess);
        tax.age_credit = claim * cc.age_credit_rate;
        total -= tax.age_credit;
    }

    if (region.surcharge != nullptr) {
        tax.health_premium = compute_health_premium(taxable_income, *region.surcharge, inflation_factor);
        tax.surtax = compute_surtax(basic_regional_tax, *region.surcharge, inflation_factor);
        total += tax.health_premium + tax.surtax;
    }

    tax.total = std::max(0.0, total);
    return tax;
}

double compute_tax(
    double taxable_income,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates,
    const TaxCreditInputs& credits)
{
    return compute_tax_breakdown(taxable_income, jurisdiction, inflation_factor, rates, credits).total;
}

double compute_clawback(
    double net_income,
    double max_clawback,
    double inflation_factor,
    double threshold,
    double rate)
{
    const double indexed_threshold = threshold * inflation_factor;
    if (net_income <= indexed_threshold || max_clawback <= 0.0) {
        return 0.0;
    }
    return std::min((net_income - indexed_threshold) * rate, max_clawback);
}

double compute_tax_with_clawback(
    double taxable_income,
    double benefit_received,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates,
    const TaxCreditInputs& credits)
{
    return compute_tax(taxable_income, jurisdiction, inflation_factor, rates, credits) +
           compute_clawback(taxable_income, benefit_received, inflation_factor,
                            rates.oas.clawback_threshold, rates.oas.clawback_rate);
}

} // namespace retirecalc
