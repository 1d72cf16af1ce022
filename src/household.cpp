#include "household.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace retirecalc {

// ============================================================================
// Enum conversions
// ============================================================================

std::string account_type_to_string(AccountType type) {
    switch (type) {
        case AccountType::RRSP: return "rrsp";
        case AccountType::TFSA: return "tfsa";
        case AccountType::NonRegistered: return "non_registered";
        default: return "unknown";
    }
}

std::string withdrawal_strategy_to_string(WithdrawalStrategy strategy) {
    switch (strategy) {
        case WithdrawalStrategy::TaxEfficient: return "tax-efficient";
        case WithdrawalStrategy::RrspFirst: return "rrsp-first";
        default: return "unknown";
    }
}

WithdrawalStrategy withdrawal_strategy_from_string(const std::string& value) {
    if (value == "tax-efficient") return WithdrawalStrategy::TaxEfficient;
    if (value == "rrsp-first") return WithdrawalStrategy::RrspFirst;
    throw std::invalid_argument("Unknown withdrawal strategy: " + value);
}

std::string deferred_split_to_string(DeferredDrawSplit split) {
    switch (split) {
        case DeferredDrawSplit::ByBalance: return "balance";
        case DeferredDrawSplit::Equal: return "equal";
        default: return "unknown";
    }
}

DeferredDrawSplit deferred_split_from_string(const std::string& value) {
    if (value == "balance") return DeferredDrawSplit::ByBalance;
    if (value == "equal") return DeferredDrawSplit::Equal;
    throw std::invalid_argument("Unknown deferred split policy: " + value);
}

// ============================================================================
// Account
// ============================================================================

Account::Account(AccountType type, double balance)
    : type_(type), balance_(std::max(0.0, balance)) {}

double Account::withdraw(double amount) {
    if (amount <= 0.0 || balance_ <= 0.0) {
        return 0.0;
    }
    const double taken = std::min(amount, balance_);
    balance_ -= taken;
    if (balance_ < 0.0) {
        balance_ = 0.0;
    }
    return taken;
}

void Account::deposit(double amount) {
    if (amount > 0.0) {
        balance_ += amount;
    }
}

void Account::grow(double rate) {
    balance_ = std::max(0.0, balance_ * (1.0 + rate));
}

double Account::drain() {
    const double amount = balance_;
    balance_ = 0.0;
    return amount;
}

// ============================================================================
// Non-registered account
// ============================================================================

AssetMix::AssetMix()
    : interest(0.2), dividend(0.3), capital_gain(0.5) {}

AssetMix::AssetMix(double interest_, double dividend_, double capital_gain_)
    : interest(interest_), dividend(dividend_), capital_gain(capital_gain_) {}

NonRegisteredAccount::NonRegisteredAccount()
    : balance_(0.0), acb_(0.0), mix_() {}

NonRegisteredAccount::NonRegisteredAccount(double balance, double adjusted_cost_base,
                                           const AssetMix& mix)
    : balance_(std::max(0.0, balance)),
      acb_(std::max(0.0, adjusted_cost_base)),
      mix_(mix) {}

double NonRegisteredAccount::gain_ratio() const {
    if (balance_ <= 0.0) {
        return 0.0;
    }
    return std::max(0.0, 1.0 - acb_ / balance_);
}

double NonRegisteredAccount::unrealized_gain() const {
    return std::max(0.0, balance_ - acb_);
}

NonRegisteredWithdrawal NonRegisteredAccount::withdraw(double amount) {
    NonRegisteredWithdrawal result{0.0, 0.0};
    if (amount <= 0.0 || balance_ <= 0.0) {
        return result;
    }

    const double balance_before = balance_;
    const double taken = std::min(amount, balance_before);

    result.amount = taken;
    result.realized_gain = taken * gain_ratio();

    if (taken >= balance_before) {
        balance_ = 0.0;
        acb_ = 0.0;
    } else {
        acb_ *= 1.0 - taken / balance_before;
        balance_ = balance_before - taken;
    }
    return result;
}

void NonRegisteredAccount::contribute(double amount) {
    if (amount > 0.0) {
        balance_ += amount;
        acb_ += amount;
    }
}

void NonRegisteredAccount::grow(double capital_growth_rate) {
    balance_ = std::max(0.0, balance_ * (1.0 + mix_.capital_gain * capital_growth_rate));
}

void NonRegisteredAccount::transfer_to(NonRegisteredAccount& other) {
    other.balance_ += balance_;
    other.acb_ += acb_;
    balance_ = 0.0;
    acb_ = 0.0;
}

// ============================================================================
// Person and inputs
// ============================================================================

Person::Person()
    : age(60),
      retirement_age(65),
      life_expectancy(90),
      current_income(0.0),
      cpp_start_age(65),
      cpp_contributed_years(40.0),
      oas_start_age(65),
      rrsp_melt_start_age(),
      rrsp_melt_amount(0.0),
      rrsp(AccountType::RRSP),
      tfsa(AccountType::TFSA),
      non_registered() {}

int Person::melt_start_age() const {
    return rrsp_melt_start_age.value_or(retirement_age);
}

double Person::total_assets() const {
    return rrsp.balance() + tfsa.balance() + non_registered.balance();
}

OneTimeEvent::OneTimeEvent()
    : name(), amount(0.0), age(0), type(EventType::Expense) {}

OneTimeEvent::OneTimeEvent(const std::string& name_, double amount_, int age_, EventType type_)
    : name(name_), amount(amount_), age(age_), type(type_) {}

ReturnAssumptions::ReturnAssumptions()
    : interest(0.03), dividend(0.03), capital_growth(0.05), volatility(0.0) {}

ReturnAssumptions::ReturnAssumptions(double interest_, double dividend_, double growth, double vol)
    : interest(interest_), dividend(dividend_), capital_growth(growth), volatility(vol) {}

SimulationInputs::SimulationInputs()
    : person(),
      spouse(),
      jurisdiction("ON"),
      inflation_rate(0.02),
      pre_retirement_spend(0.0),
      post_retirement_spend(0.0),
      one_time_events(),
      withdrawal_strategy(WithdrawalStrategy::TaxEfficient),
      deferred_split(DeferredDrawSplit::ByBalance),
      use_income_splitting(false),
      start_year(2025),
      returns() {}

// ============================================================================
// Validation
// ============================================================================

namespace {

std::string validate_person(const Person& p, const std::string& label) {
    std::ostringstream oss;
    if (p.age < 0 || p.retirement_age < 0 || p.life_expectancy < 0) {
        oss << label << ": ages must be non-negative";
    } else if (p.retirement_age > p.life_expectancy) {
        oss << label << ": retirement age " << p.retirement_age
            << " is after life expectancy " << p.life_expectancy;
    } else if (p.life_expectancy < p.age) {
        oss << label << ": life expectancy " << p.life_expectancy
            << " is before current age " << p.age;
    } else if (p.life_expectancy - p.age + 1 > MAX_PROJECTION_YEARS) {
        oss << label << ": lifespan of " << (p.life_expectancy - p.age + 1)
            << " years exceeds the " << MAX_PROJECTION_YEARS << "-year cap";
    }
    return oss.str();
}

} // anonymous namespace

std::string validate_inputs(const SimulationInputs& inputs) {
    if (!std::isfinite(inputs.inflation_rate) || !std::isfinite(inputs.returns.capital_growth)
        || !std::isfinite(inputs.returns.volatility)) {
        return "inflation and return assumptions must be finite";
    }
    if (inputs.inflation_rate <= -1.0) {
        return "inflation rate must be greater than -100%";
    }

    std::string reason = validate_person(inputs.person, "person");
    if (!reason.empty()) {
        return reason;
    }
    if (inputs.spouse) {
        reason = validate_person(*inputs.spouse, "spouse");
    }
    return reason;
}

} // namespace retirecalc
