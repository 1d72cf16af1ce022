#ifndef RETIRECALC_TAX_RATES_HPP
#define RETIRECALC_TAX_RATES_HPP

#include <map>
#include <string>
#include <vector>

namespace retirecalc {

// One bracket of a progressive schedule. The rate applies from threshold up to
// the next bracket's threshold (or without limit for the last bracket).
struct TaxBracket {
    double threshold;
    double rate;
};

using BracketSchedule = std::vector<TaxBracket>;

// Step-function premium: premium applies when income <= upper_bound (indexed)
struct PremiumBand {
    double upper_bound;
    double premium;
};

// Regional surcharges levied on top of basic regional tax.
// Health premium is a step function of taxable income; the surtax is charged
// on basic regional tax above two indexed tiers (cumulative).
struct RegionalSurcharge {
    std::vector<PremiumBand> health_premium_bands;  // ascending upper bounds
    double health_premium_max;                      // premium above last band
    double surtax_tier1_threshold;
    double surtax_tier1_rate;
    double surtax_tier2_threshold;
    double surtax_tier2_rate;

    RegionalSurcharge();
};

struct CreditConstants {
    double federal_credit_rate;          // Applied to the federal personal amount
    double pension_amount;               // Max eligible pension income claimable
    double pension_credit_rate;          // Combined federal + regional value
    double federal_dividend_rate;        // On grossed-up eligible dividends
    double default_dividend_rate;        // Regional rate when jurisdiction unlisted
    double dividend_gross_up;            // Taxable multiplier on cash dividends
    int age_credit_age;
    double age_amount_max;
    double age_amount_threshold;
    double age_amount_reduction_rate;
    double age_credit_rate;

    CreditConstants();
};

struct CppConstants {
    double max_annual_benefit;           // At age 65 with full contribution history
    int full_contribution_years;
    int standard_start_age;
    double early_reduction_per_month;
    double late_increase_per_month;
    int earliest_start_age;
    int latest_start_age;

    CppConstants();
};

struct OasConstants {
    double base_annual_benefit;          // Paid at standard start age, before indexing
    double clawback_threshold;
    double clawback_rate;
    int standard_start_age;
    double deferral_increase_per_month;
    int max_deferral_months;
    int late_life_age;
    double late_life_increase;

    OasConstants();
};

struct RegisteredPlanConstants {
    double tfsa_annual_limit;
    double tfsa_rounding;                // Indexed limit rounds to nearest multiple
    double rrsp_contribution_rate;
    double rrsp_dollar_cap;
    int rrsp_contribution_age_limit;     // Contributions allowed while age < limit
    int mandatory_withdrawal_age;        // RRIF minimums from this age
    double capital_gains_inclusion;

    RegisteredPlanConstants();
};

// Result of looking up a jurisdiction code.
// used_fallback is set when the requested code was not in the table and the
// default jurisdiction's values were returned instead.
struct ResolvedJurisdiction {
    std::string requested;
    std::string resolved;
    bool used_fallback;
    const BracketSchedule* brackets;
    double basic_personal_amount;
    double dividend_credit_rate;
    const RegionalSurcharge* surcharge;  // nullptr when the jurisdiction has none
};

// TaxRates: the full constant table consumed by every tax computation.
// Instances are immutable once built and are always passed explicitly.
class TaxRates {
public:
    TaxRates();

    // Named, versioned default table (2024 federal and provincial figures)
    static const TaxRates& canada_2024();

    BracketSchedule federal_brackets;
    std::map<std::string, BracketSchedule> regional_brackets;
    double federal_basic_personal_amount;
    std::map<std::string, double> regional_basic_personal_amounts;
    std::map<std::string, double> regional_dividend_credit_rates;
    std::map<std::string, RegionalSurcharge> regional_surcharges;
    std::string default_jurisdiction;
    std::string version;

    CreditConstants credits;
    CppConstants cpp;
    OasConstants oas;
    RegisteredPlanConstants plans;

    // Resolve a jurisdiction code, falling back to default_jurisdiction.
    // Throws std::invalid_argument if the default itself is missing.
    ResolvedJurisdiction resolve(const std::string& code) const;

    // True when the code has a non-empty bracket schedule and a personal amount
    bool has_jurisdiction(const std::string& code) const;

    // Check structural invariants (sorted, non-empty schedules, resolvable
    // default). Throws std::invalid_argument describing the first violation.
    void validate() const;
};

} // namespace retirecalc

#endif // RETIRECALC_TAX_RATES_HPP
