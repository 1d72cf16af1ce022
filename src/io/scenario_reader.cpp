#include "scenario_reader.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace retirecalc {
namespace io {

namespace {

template <typename T>
T value_or(const json& j, const char* key, const T& fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    return j[key].get<T>();
}

void require(const json& j, const char* key, const std::string& context) {
    if (!j.contains(key)) {
        throw ConfigParseError(context + " missing required field: " + key);
    }
}

AssetMix parse_asset_mix(const json& j) {
    AssetMix mix;
    mix.interest = value_or(j, "interest", mix.interest);
    mix.dividend = value_or(j, "dividend", mix.dividend);
    mix.capital_gain = value_or(j, "capital_gain", mix.capital_gain);
    return mix;
}

Person parse_person(const json& j, const std::string& context) {
    if (!j.is_object()) {
        throw ConfigParseError(context + " must be an object");
    }
    require(j, "age", context);
    require(j, "retirement_age", context);
    require(j, "life_expectancy", context);

    Person p;
    p.age = j["age"].get<int>();
    p.retirement_age = j["retirement_age"].get<int>();
    p.life_expectancy = j["life_expectancy"].get<int>();
    p.current_income = value_or(j, "current_income", p.current_income);
    p.cpp_start_age = value_or(j, "cpp_start_age", p.cpp_start_age);
    p.cpp_contributed_years = value_or(j, "cpp_contributed_years", p.cpp_contributed_years);
    p.oas_start_age = value_or(j, "oas_start_age", p.oas_start_age);
    if (j.contains("rrsp_melt_start_age") && !j["rrsp_melt_start_age"].is_null()) {
        p.rrsp_melt_start_age = j["rrsp_melt_start_age"].get<int>();
    }
    p.rrsp_melt_amount = value_or(j, "rrsp_melt_amount", p.rrsp_melt_amount);

    p.rrsp = Account(AccountType::RRSP, value_or(j, "rrsp", 0.0));
    p.tfsa = Account(AccountType::TFSA, value_or(j, "tfsa", 0.0));

    if (j.contains("non_registered")) {
        const json& nr = j["non_registered"];
        const double balance = value_or(nr, "balance", 0.0);
        const double acb = value_or(nr, "acb", balance);
        const AssetMix mix = nr.contains("asset_mix") ? parse_asset_mix(nr["asset_mix"]) : AssetMix();
        p.non_registered = NonRegisteredAccount(balance, acb, mix);
    }

    return p;
}

OneTimeEvent parse_event(const json& j) {
    require(j, "amount", "one_time_event");
    require(j, "age", "one_time_event");

    OneTimeEvent event;
    event.name = value_or<std::string>(j, "name", "");
    event.amount = j["amount"].get<double>();
    event.age = j["age"].get<int>();

    const std::string type = value_or<std::string>(j, "type", "expense");
    if (type == "expense") {
        event.type = EventType::Expense;
    } else if (type == "inflow") {
        event.type = EventType::Inflow;
    } else {
        throw ConfigParseError("one_time_event '" + event.name + "' has unknown type: " + type);
    }
    return event;
}

BracketSchedule parse_brackets(const json& j, const std::string& context) {
    if (!j.is_array()) {
        throw ConfigParseError(context + " brackets must be an array");
    }
    BracketSchedule schedule;
    for (const auto& b : j) {
        require(b, "threshold", context);
        require(b, "rate", context);
        schedule.push_back(TaxBracket{b["threshold"].get<double>(), b["rate"].get<double>()});
    }
    return schedule;
}

std::string read_stream(std::istream& is) {
    std::ostringstream buffer;
    buffer << is.rdbuf();
    return buffer.str();
}

} // anonymous namespace

// ============================================================================
// Scenario
// ============================================================================

SimulationInputs parse_simulation_inputs(const std::string& json_string) {
    SimulationInputs inputs;

    try {
        json j = json::parse(json_string);

        if (!j.contains("person")) {
            throw ConfigParseError("Missing required field: person");
        }
        inputs.person = parse_person(j["person"], "person");

        if (j.contains("spouse") && !j["spouse"].is_null()) {
            inputs.spouse = parse_person(j["spouse"], "spouse");
        }

        inputs.jurisdiction = value_or(j, "jurisdiction", inputs.jurisdiction);
        inputs.inflation_rate = value_or(j, "inflation_rate", inputs.inflation_rate);
        inputs.pre_retirement_spend = value_or(j, "pre_retirement_spend", inputs.pre_retirement_spend);
        inputs.post_retirement_spend = value_or(j, "post_retirement_spend", inputs.post_retirement_spend);
        inputs.use_income_splitting = value_or(j, "income_splitting", inputs.use_income_splitting);
        inputs.start_year = value_or(j, "start_year", inputs.start_year);

        if (j.contains("withdrawal_strategy")) {
            inputs.withdrawal_strategy =
                withdrawal_strategy_from_string(j["withdrawal_strategy"].get<std::string>());
        }
        if (j.contains("deferred_split")) {
            inputs.deferred_split = deferred_split_from_string(j["deferred_split"].get<std::string>());
        }

        if (j.contains("returns")) {
            const json& r = j["returns"];
            inputs.returns.interest = value_or(r, "interest", inputs.returns.interest);
            inputs.returns.dividend = value_or(r, "dividend", inputs.returns.dividend);
            inputs.returns.capital_growth = value_or(r, "capital_growth", inputs.returns.capital_growth);
            inputs.returns.volatility = value_or(r, "volatility", inputs.returns.volatility);
        }

        if (j.contains("one_time_events")) {
            for (const auto& event_json : j["one_time_events"]) {
                inputs.one_time_events.push_back(parse_event(event_json));
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(e.what());
    }

    return inputs;
}

SimulationInputs load_simulation_inputs(std::istream& is) {
    return parse_simulation_inputs(read_stream(is));
}

SimulationInputs load_simulation_inputs(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open scenario file: " + file_path);
    }
    return load_simulation_inputs(file);
}

// ============================================================================
// Tax rates
// ============================================================================

TaxRates parse_tax_rates(const std::string& json_string) {
    TaxRates rates = TaxRates::canada_2024();

    try {
        json j = json::parse(json_string);

        rates.version = value_or(j, "version", rates.version + "+overrides");
        rates.default_jurisdiction = value_or(j, "default_jurisdiction", rates.default_jurisdiction);

        if (j.contains("federal_brackets")) {
            rates.federal_brackets = parse_brackets(j["federal_brackets"], "federal");
        }
        rates.federal_basic_personal_amount =
            value_or(j, "federal_basic_personal_amount", rates.federal_basic_personal_amount);

        if (j.contains("jurisdictions")) {
            for (auto it = j["jurisdictions"].begin(); it != j["jurisdictions"].end(); ++it) {
                const std::string& code = it.key();
                const json& entry = it.value();
                if (entry.contains("brackets")) {
                    rates.regional_brackets[code] = parse_brackets(entry["brackets"], code);
                }
                if (entry.contains("basic_personal_amount")) {
                    rates.regional_basic_personal_amounts[code] =
                        entry["basic_personal_amount"].get<double>();
                }
                if (entry.contains("dividend_credit_rate")) {
                    rates.regional_dividend_credit_rates[code] =
                        entry["dividend_credit_rate"].get<double>();
                }
            }
        }

        if (j.contains("cpp")) {
            const json& c = j["cpp"];
            rates.cpp.max_annual_benefit = value_or(c, "max_annual_benefit", rates.cpp.max_annual_benefit);
            rates.cpp.full_contribution_years =
                value_or(c, "full_contribution_years", rates.cpp.full_contribution_years);
        }

        if (j.contains("oas")) {
            const json& o = j["oas"];
            rates.oas.base_annual_benefit = value_or(o, "base_annual_benefit", rates.oas.base_annual_benefit);
            rates.oas.clawback_threshold = value_or(o, "clawback_threshold", rates.oas.clawback_threshold);
            rates.oas.clawback_rate = value_or(o, "clawback_rate", rates.oas.clawback_rate);
        }

        if (j.contains("plans")) {
            const json& p = j["plans"];
            rates.plans.tfsa_annual_limit = value_or(p, "tfsa_annual_limit", rates.plans.tfsa_annual_limit);
            rates.plans.rrsp_contribution_rate =
                value_or(p, "rrsp_contribution_rate", rates.plans.rrsp_contribution_rate);
            rates.plans.rrsp_dollar_cap = value_or(p, "rrsp_dollar_cap", rates.plans.rrsp_dollar_cap);
            rates.plans.capital_gains_inclusion =
                value_or(p, "capital_gains_inclusion", rates.plans.capital_gains_inclusion);
        }

        rates.validate();

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(std::string("Invalid tax rates: ") + e.what());
    }

    return rates;
}

TaxRates load_tax_rates(std::istream& is) {
    return parse_tax_rates(read_stream(is));
}

TaxRates load_tax_rates(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open tax rates file: " + file_path);
    }
    return load_tax_rates(file);
}

} // namespace io
} // namespace retirecalc
