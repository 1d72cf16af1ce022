#include "tax_rates.hpp"
#include <stdexcept>

namespace retirecalc {

// ============================================================================
// Constant Group Defaults
// ============================================================================

RegionalSurcharge::RegionalSurcharge()
    : health_premium_max(0.0),
      surtax_tier1_threshold(0.0),
      surtax_tier1_rate(0.0),
      surtax_tier2_threshold(0.0),
      surtax_tier2_rate(0.0) {}

CreditConstants::CreditConstants()
    : federal_credit_rate(0.15),
      pension_amount(2000.0),
      pension_credit_rate(0.20),
      federal_dividend_rate(0.150198),
      default_dividend_rate(0.10),
      dividend_gross_up(1.38),
      age_credit_age(65),
      age_amount_max(8790.0),
      age_amount_threshold(44325.0),
      age_amount_reduction_rate(0.15),
      age_credit_rate(0.20) {}

CppConstants::CppConstants()
    : max_annual_benefit(17196.0),
      full_contribution_years(40),
      standard_start_age(65),
      early_reduction_per_month(0.006),
      late_increase_per_month(0.007),
      earliest_start_age(60),
      latest_start_age(70) {}

OasConstants::OasConstants()
    : base_annual_benefit(8820.0),
      clawback_threshold(90997.0),
      clawback_rate(0.15),
      standard_start_age(65),
      deferral_increase_per_month(0.006),
      max_deferral_months(60),
      late_life_age(75),
      late_life_increase(0.10) {}

RegisteredPlanConstants::RegisteredPlanConstants()
    : tfsa_annual_limit(7000.0),
      tfsa_rounding(500.0),
      rrsp_contribution_rate(0.18),
      rrsp_dollar_cap(31000.0),
      rrsp_contribution_age_limit(71),
      mandatory_withdrawal_age(72),
      capital_gains_inclusion(0.50) {}

// ============================================================================
// TaxRates Implementation
// ============================================================================

TaxRates::TaxRates()
    : federal_basic_personal_amount(0.0),
      default_jurisdiction("ON"),
      version("custom") {}

const TaxRates& TaxRates::canada_2024() {
    static const TaxRates table = [] {
        TaxRates t;
        t.version = "canada-2024";
        t.default_jurisdiction = "ON";

        t.federal_brackets = {
            {0.0, 0.15},
            {55867.0, 0.205},
            {111733.0, 0.26},
            {173205.0, 0.29},
            {246752.0, 0.33},
        };

        t.regional_brackets["AB"] = {
            {0.0, 0.10}, {157978.0, 0.12}, {189574.0, 0.13},
            {252765.0, 0.14}, {379148.0, 0.15},
        };
        t.regional_brackets["BC"] = {
            {0.0, 0.0506}, {49279.0, 0.077}, {98560.0, 0.105}, {113158.0, 0.1229},
            {137407.0, 0.147}, {186306.0, 0.168}, {259829.0, 0.205},
        };
        t.regional_brackets["MB"] = {
            {0.0, 0.108}, {47000.0, 0.1275}, {100000.0, 0.174},
        };
        t.regional_brackets["NB"] = {
            {0.0, 0.094}, {51306.0, 0.14}, {102614.0, 0.16}, {190060.0, 0.195},
        };
        t.regional_brackets["NL"] = {
            {0.0, 0.087}, {44192.0, 0.145}, {88382.0, 0.158}, {157792.0, 0.178},
            {220910.0, 0.198}, {282214.0, 0.208}, {564429.0, 0.213}, {1128858.0, 0.218},
        };
        t.regional_brackets["NS"] = {
            {0.0, 0.0879}, {30507.0, 0.1495}, {61015.0, 0.1667},
            {95883.0, 0.175}, {154650.0, 0.21},
        };
        t.regional_brackets["NT"] = {
            {0.0, 0.059}, {51964.0, 0.086}, {103930.0, 0.122}, {168967.0, 0.1405},
        };
        t.regional_brackets["NU"] = {
            {0.0, 0.04}, {54707.0, 0.07}, {109413.0, 0.09}, {177881.0, 0.115},
        };
        t.regional_brackets["ON"] = {
            {0.0, 0.0505}, {52886.0, 0.0915}, {105775.0, 0.1116},
            {150000.0, 0.1216}, {220000.0, 0.1316},
        };
        t.regional_brackets["PE"] = {
            {0.0, 0.095}, {33328.0, 0.1347}, {64656.0, 0.166},
            {105000.0, 0.1762}, {140000.0, 0.19},
        };
        t.regional_brackets["QC"] = {
            {0.0, 0.14}, {53255.0, 0.19}, {106495.0, 0.24}, {129590.0, 0.2575},
        };
        t.regional_brackets["SK"] = {
            {0.0, 0.105}, {53463.0, 0.125}, {152750.0, 0.145},
        };
        t.regional_brackets["YT"] = {
            {0.0, 0.064}, {57375.0, 0.09}, {114750.0, 0.109},
            {177882.0, 0.128}, {500000.0, 0.15},
        };

        t.federal_basic_personal_amount = 15705.0;
        t.regional_basic_personal_amounts = {
            {"AB", 21885.0}, {"BC", 12588.0}, {"MB", 15780.0}, {"NB", 13044.0},
            {"NL", 10818.0}, {"NS", 11481.0}, {"NT", 17373.0}, {"NU", 18767.0},
            {"ON", 12399.0}, {"PE", 13500.0}, {"QC", 18056.0}, {"SK", 18491.0},
            {"YT", 15705.0},
        };

        // Eligible dividend tax credit, as a fraction of the grossed-up amount
        t.regional_dividend_credit_rates = {
            {"AB", 0.0812}, {"BC", 0.12}, {"MB", 0.08}, {"NB", 0.14},
            {"NL", 0.063}, {"NS", 0.0885}, {"NT", 0.115}, {"NU", 0.0551},
            {"ON", 0.10}, {"PE", 0.105}, {"QC", 0.117}, {"SK", 0.11},
            {"YT", 0.1202},
        };

        // Ontario Health Premium and Ontario surtax
        RegionalSurcharge on;
        on.health_premium_bands = {
            {20000.0, 0.0}, {36000.0, 300.0}, {48000.0, 450.0},
            {72000.0, 600.0}, {200000.0, 750.0},
        };
        on.health_premium_max = 900.0;
        on.surtax_tier1_threshold = 5315.0;
        on.surtax_tier1_rate = 0.20;
        on.surtax_tier2_threshold = 6802.0;
        on.surtax_tier2_rate = 0.36;
        t.regional_surcharges["ON"] = on;

        return t;
    }();
    return table;
}

bool TaxRates::has_jurisdiction(const std::string& code) const {
    auto it = regional_brackets.find(code);
    return it != regional_brackets.end() && !it->second.empty() &&
           regional_basic_personal_amounts.count(code) > 0;
}

ResolvedJurisdiction TaxRates::resolve(const std::string& code) const {
    ResolvedJurisdiction result;
    result.requested = code;
    result.used_fallback = !has_jurisdiction(code);
    result.resolved = result.used_fallback ? default_jurisdiction : code;

    if (!has_jurisdiction(result.resolved)) {
        throw std::invalid_argument("Default jurisdiction '" + default_jurisdiction +
                                    "' is not present in tax table " + version);
    }

    result.brackets = &regional_brackets.at(result.resolved);
    result.basic_personal_amount = regional_basic_personal_amounts.at(result.resolved);

    auto div_it = regional_dividend_credit_rates.find(result.resolved);
    result.dividend_credit_rate = (div_it != regional_dividend_credit_rates.end())
        ? div_it->second
        : credits.default_dividend_rate;

    auto sur_it = regional_surcharges.find(result.resolved);
    result.surcharge = (sur_it != regional_surcharges.end()) ? &sur_it->second : nullptr;

    return result;
}

namespace {

void validate_schedule(const BracketSchedule& schedule, const std::string& name) {
    if (schedule.empty()) {
        throw std::invalid_argument("Bracket schedule '" + name + "' is empty");
    }
    for (size_t i = 1; i < schedule.size(); ++i) {
        if (schedule[i].threshold <= schedule[i - 1].threshold) {
            throw std::invalid_argument("Bracket schedule '" + name +
                                        "' is not sorted by ascending threshold");
        }
    }
    for (const auto& bracket : schedule) {
        if (bracket.rate < 0.0 || bracket.rate >= 1.0) {
            throw std::invalid_argument("Bracket schedule '" + name +
                                        "' has a rate outside [0, 1)");
        }
    }
}

} // anonymous namespace

void TaxRates::validate() const {
    validate_schedule(federal_brackets, "federal");
    for (const auto& [code, schedule] : regional_brackets) {
        validate_schedule(schedule, code);
        if (regional_basic_personal_amounts.count(code) == 0) {
            throw std::invalid_argument("Jurisdiction '" + code +
                                        "' has brackets but no basic personal amount");
        }
    }
    if (!has_jurisdiction(default_jurisdiction)) {
        throw std::invalid_argument("Default jurisdiction '" + default_jurisdiction +
                                    "' does not resolve to brackets and a personal amount");
    }
    for (const auto& [code, surcharge] : regional_surcharges) {
        for (size_t i = 1; i < surcharge.health_premium_bands.size(); ++i) {
            if (surcharge.health_premium_bands[i].upper_bound <=
                surcharge.health_premium_bands[i - 1].upper_bound) {
                throw std::invalid_argument("Health premium bands for '" + code +
                                            "' are not ascending");
            }
        }
    }
}

} // namespace retirecalc
