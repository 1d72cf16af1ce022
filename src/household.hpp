#ifndef RETIRECALC_HOUSEHOLD_HPP
#define RETIRECALC_HOUSEHOLD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace retirecalc {

enum class AccountType : uint8_t {
    RRSP = 0,            // Tax-deferred; withdrawals fully taxable
    TFSA = 1,            // Tax-free
    NonRegistered = 2    // Taxable; gains taxed on realization
};

std::string account_type_to_string(AccountType type);

// Registered account. Balance never goes below zero: withdraw() caps the
// amount at the available balance and returns what was actually taken.
class Account {
public:
    explicit Account(AccountType type, double balance = 0.0);

    AccountType type() const { return type_; }
    double balance() const { return balance_; }

    double withdraw(double amount);
    void deposit(double amount);
    void grow(double rate);

    // Move the whole balance out (used for spousal rollover)
    double drain();

private:
    AccountType type_;
    double balance_;
};

// Fractions of a non-registered portfolio by return type; should sum to ~1.0
struct AssetMix {
    double interest;
    double dividend;
    double capital_gain;

    AssetMix();
    AssetMix(double interest_, double dividend_, double capital_gain_);
};

// Outcome of a non-registered withdrawal
struct NonRegisteredWithdrawal {
    double amount;           // Cash taken (principal + gain)
    double realized_gain;    // Portion above ACB
};

// Taxable investment account tracking adjusted cost base.
// ACB is reduced proportionally on withdrawal:
//   acb *= 1 - withdrawn / balance_before
class NonRegisteredAccount {
public:
    NonRegisteredAccount();
    NonRegisteredAccount(double balance, double adjusted_cost_base, const AssetMix& mix);

    double balance() const { return balance_; }
    double adjusted_cost_base() const { return acb_; }
    const AssetMix& asset_mix() const { return mix_; }

    // Fraction of a withdrawal that is gain, from the ACB ratio
    double gain_ratio() const;

    // Unrealized gain (balance above ACB, floored at zero)
    double unrealized_gain() const;

    NonRegisteredWithdrawal withdraw(double amount);

    // New principal: raises balance and ACB equally
    void contribute(double amount);

    // Only the capital-gain share of the mix grows; yield is paid out as cash
    void grow(double capital_growth_rate);

    // Transfer balance and ACB into another account (spousal rollover)
    void transfer_to(NonRegisteredAccount& other);

private:
    double balance_;
    double acb_;
    AssetMix mix_;
};

struct Person {
    int age;
    int retirement_age;
    int life_expectancy;                   // Last age alive
    double current_income;                 // Employment income while working
    int cpp_start_age;
    double cpp_contributed_years;          // Capped at the full-pension requirement
    int oas_start_age;
    std::optional<int> rrsp_melt_start_age;  // Defaults to retirement_age
    double rrsp_melt_amount;               // Voluntary annual RRSP withdrawal (0 = off)

    Account rrsp;
    Account tfsa;
    NonRegisteredAccount non_registered;

    Person();

    int melt_start_age() const;
    double total_assets() const;

    // Explicit value copy handed to the simulator
    Person clone() const { return *this; }
};

enum class EventType : uint8_t {
    Expense = 0,
    Inflow = 1
};

// One-time spending or windfall, triggered at the primary person's age
struct OneTimeEvent {
    std::string name;
    double amount;           // In today's dollars; indexed when triggered
    int age;
    EventType type;

    OneTimeEvent();
    OneTimeEvent(const std::string& name_, double amount_, int age_, EventType type_ = EventType::Expense);
};

enum class WithdrawalStrategy : uint8_t {
    TaxEfficient = 0,    // Non-registered -> TFSA -> RRSP
    RrspFirst = 1        // RRSP -> Non-registered -> TFSA
};

// How the RRSP step of the deficit waterfall divides the net need between
// spouses.
enum class DeferredDrawSplit : uint8_t {
    ByBalance = 0,       // Pro-rata by each spouse's RRSP balance
    Equal = 1            // 50/50 regardless of balances
};

std::string withdrawal_strategy_to_string(WithdrawalStrategy strategy);
WithdrawalStrategy withdrawal_strategy_from_string(const std::string& value);
std::string deferred_split_to_string(DeferredDrawSplit split);
DeferredDrawSplit deferred_split_from_string(const std::string& value);

struct ReturnAssumptions {
    double interest;         // Yield on the interest share of the mix
    double dividend;         // Yield on the dividend share of the mix
    double capital_growth;   // Annual growth (mean in stochastic mode)
    double volatility;       // Std dev of capital growth (stochastic mode)

    ReturnAssumptions();
    ReturnAssumptions(double interest_, double dividend_, double growth, double vol = 0.0);
};

struct SimulationInputs {
    Person person;
    std::optional<Person> spouse;
    std::string jurisdiction;
    double inflation_rate;
    double pre_retirement_spend;     // Household, today's dollars
    double post_retirement_spend;    // Household, today's dollars
    std::vector<OneTimeEvent> one_time_events;
    WithdrawalStrategy withdrawal_strategy;
    DeferredDrawSplit deferred_split;
    bool use_income_splitting;
    int start_year;                  // Calendar year of the first projected year
    ReturnAssumptions returns;

    SimulationInputs();
};

// Maximum number of projected years
constexpr int MAX_PROJECTION_YEARS = 120;

// Checks age configuration. Returns an empty string when valid, otherwise a
// description of the first problem found.
std::string validate_inputs(const SimulationInputs& inputs);

} // namespace retirecalc

#endif // RETIRECALC_HOUSEHOLD_HPP
