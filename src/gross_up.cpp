#include "gross_up.hpp"
#include "logger.hpp"
#include "numeric.hpp"
#include <algorithm>

namespace retirecalc {

namespace {

constexpr double MAX_GROSS_WITHDRAWAL = 10000000.0;
constexpr double UPPER_BOUND_MULTIPLE = 3.0;
constexpr double NET_TOLERANCE = 1.0;
constexpr int MAX_ITERATIONS = 20;

TaxCreditInputs credits_after(const TaxCreditInputs& before, double gross, bool pension_eligible) {
    TaxCreditInputs after = before;
    if (pension_eligible) {
        after.eligible_pension_income += gross;
    }
    return after;
}

} // anonymous namespace

GrossUpResult::GrossUpResult()
    : gross(0.0), marginal_tax(0.0), net(0.0), iterations(0), converged(true) {}

double marginal_tax_on_withdrawal(
    double gross,
    double current_taxable,
    double base_benefit_amount,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates,
    const TaxCreditInputs& credits,
    bool pension_eligible)
{
    const double before = compute_tax_with_clawback(
        current_taxable, base_benefit_amount, jurisdiction, inflation_factor, rates, credits);
    const double after = compute_tax_with_clawback(
        current_taxable + gross, base_benefit_amount, jurisdiction, inflation_factor, rates,
        credits_after(credits, gross, pension_eligible));
    return after - before;
}

GrossUpResult solve_gross_withdrawal(
    double target_net,
    double current_taxable,
    double base_benefit_amount,
    const std::string& jurisdiction,
    double inflation_factor,
    const TaxRates& rates,
    const TaxCreditInputs& credits,
    bool pension_eligible)
{
    GrossUpResult result;
    if (target_net <= 0.0) {
        return result;
    }

    const double base_tax = compute_tax_with_clawback(
        current_taxable, base_benefit_amount, jurisdiction, inflation_factor, rates, credits);

    auto net_for_gross = [&](double gross) {
        const double tax = compute_tax_with_clawback(
            current_taxable + gross, base_benefit_amount, jurisdiction, inflation_factor, rates,
            credits_after(credits, gross, pension_eligible));
        return gross - (tax - base_tax);
    };

    const double lo = std::min(target_net, MAX_GROSS_WITHDRAWAL);
    const double hi = std::min(UPPER_BOUND_MULTIPLE * target_net, MAX_GROSS_WITHDRAWAL);

    const SearchResult search = bisect_increasing(
        net_for_gross, target_net, lo, hi, BisectionOptions(NET_TOLERANCE, MAX_ITERATIONS));

    result.gross = search.x;
    result.net = search.value;
    result.marginal_tax = search.x - search.value;
    result.iterations = search.iterations;
    result.converged = search.converged;

    if (!result.converged) {
        Logger::get_instance().log_solver_nonconvergence(
            "gross_withdrawal", target_net, result.gross, result.iterations);
    }

    return result;
}

} // namespace retirecalc
