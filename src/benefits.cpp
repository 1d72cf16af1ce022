#include "benefits.hpp"
#include <algorithm>
#include <array>

namespace retirecalc {

namespace {

// Federal RRIF minimum factors (post-2015), ages 71-94
constexpr int RRIF_TABLE_FIRST_AGE = 71;
constexpr int RRIF_TABLE_LAST_AGE = 94;
constexpr double RRIF_FACTOR_BELOW_TABLE = 0.05;
constexpr double RRIF_FACTOR_ABOVE_TABLE = 0.20;

constexpr std::array<double, RRIF_TABLE_LAST_AGE - RRIF_TABLE_FIRST_AGE + 1> RRIF_FACTORS = {
    0.0528, 0.0540, 0.0553, 0.0567, 0.0582,  // 71-75
    0.0598, 0.0617, 0.0636, 0.0658, 0.0682,  // 76-80
    0.0708, 0.0738, 0.0771, 0.0808, 0.0851,  // 81-85
    0.0899, 0.0955, 0.1021, 0.1099, 0.1192,  // 86-90
    0.1306, 0.1449, 0.1634, 0.1879           // 91-94
};

} // anonymous namespace

double estimate_cpp(
    double years_contributed,
    int start_age,
    const TaxRates& rates,
    double inflation_factor)
{
    const CppConstants& cpp = rates.cpp;

    const double max_annual = cpp.max_annual_benefit * inflation_factor;
    const double percent_of_max = std::min(1.0, std::max(0.0,
        years_contributed / static_cast<double>(cpp.full_contribution_years)));

    const int effective_start = std::clamp(start_age, cpp.earliest_start_age, cpp.latest_start_age);
    const int months_diff = (effective_start - cpp.standard_start_age) * 12;

    double adjustment = 1.0;
    if (months_diff < 0) {
        adjustment = 1.0 - (-months_diff) * cpp.early_reduction_per_month;
    } else if (months_diff > 0) {
        adjustment = 1.0 + months_diff * cpp.late_increase_per_month;
    }

    return max_annual * percent_of_max * adjustment;
}

double estimate_oas(
    int age,
    int start_age,
    const TaxRates& rates,
    double inflation_factor)
{
    if (age < start_age) {
        return 0.0;
    }

    const OasConstants& oas = rates.oas;
    double benefit = oas.base_annual_benefit * inflation_factor;

    if (start_age > oas.standard_start_age) {
        const int months_delayed = std::min((start_age - oas.standard_start_age) * 12,
                                            oas.max_deferral_months);
        benefit *= 1.0 + months_delayed * oas.deferral_increase_per_month;
    }

    if (age >= oas.late_life_age) {
        benefit *= 1.0 + oas.late_life_increase;
    }

    return benefit;
}

double rrif_minimum_factor(int age) {
    if (age < RRIF_TABLE_FIRST_AGE) {
        return RRIF_FACTOR_BELOW_TABLE;
    }
    if (age > RRIF_TABLE_LAST_AGE) {
        return RRIF_FACTOR_ABOVE_TABLE;
    }
    return RRIF_FACTORS[static_cast<size_t>(age - RRIF_TABLE_FIRST_AGE)];
}

} // namespace retirecalc
