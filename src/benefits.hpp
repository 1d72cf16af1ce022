#ifndef RETIRECALC_BENEFITS_HPP
#define RETIRECALC_BENEFITS_HPP

#include "tax_rates.hpp"

namespace retirecalc {

// Estimated annual CPP retirement pension once started.
// Scaled by contribution history (years / full_contribution_years, capped at 1)
// and by start age: -0.6% per month before 65, +0.7% per month after.
// Start age is clamped to the program's 60-70 window.
double estimate_cpp(
    double years_contributed,
    int start_age,
    const TaxRates& rates,
    double inflation_factor = 1.0
);

// Annual OAS pension at a given age. Zero before start_age.
// Deferral bonus of 0.6% per month past 65 (max 60 months), plus a 10%
// increase from age 75.
double estimate_oas(
    int age,
    int start_age,
    const TaxRates& rates,
    double inflation_factor = 1.0
);

// RRIF minimum withdrawal factor for an age.
// Flat 5% below the table, flat 20% from 95, table lookup in between.
double rrif_minimum_factor(int age);

} // namespace retirecalc

#endif // RETIRECALC_BENEFITS_HPP
