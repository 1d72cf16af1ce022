#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace retirecalc {
namespace io {

namespace {

// Emits "key": value pairs of one JSON object, handling separators and
// indentation at a fixed depth.
class ObjectWriter {
public:
    ObjectWriter(std::ostream& os, bool pretty_print, int depth)
        : os_(os), pretty_(pretty_print), depth_(depth), first_(true) {
        os_ << "{";
    }

    ObjectWriter& field(const char* key, double value) {
        key_prefix(key);
        os_ << value;
        return *this;
    }

    ObjectWriter& field(const char* key, int value) {
        key_prefix(key);
        os_ << value;
        return *this;
    }

    ObjectWriter& field(const char* key, size_t value) {
        key_prefix(key);
        os_ << value;
        return *this;
    }

    ObjectWriter& field(const char* key, const std::string& value) {
        key_prefix(key);
        os_ << "\"" << value << "\"";
        return *this;
    }

    ObjectWriter& field(const char* key, bool value) {
        key_prefix(key);
        os_ << (value ? "true" : "false");
        return *this;
    }

    ObjectWriter& field(const char* key, const std::optional<int>& value) {
        key_prefix(key);
        if (value) {
            os_ << *value;
        } else {
            os_ << "null";
        }
        return *this;
    }

    // Opens a nested value; the caller writes it directly to the stream
    std::ostream& raw(const char* key) {
        key_prefix(key);
        return os_;
    }

    void close() {
        if (pretty_) {
            os_ << "\n" << indent(depth_);
        }
        os_ << "}";
    }

    std::string indent(int depth) const {
        return pretty_ ? std::string(static_cast<size_t>(depth) * 2, ' ') : std::string();
    }

private:
    void key_prefix(const char* key) {
        if (!first_) {
            os_ << ",";
        }
        first_ = false;
        if (pretty_) {
            os_ << "\n" << indent(depth_ + 1);
        }
        os_ << "\"" << key << "\":" << (pretty_ ? " " : "");
    }

    std::ostream& os_;
    bool pretty_;
    int depth_;
    bool first_;
};

void write_accounts(std::ostream& os, const AccountSnapshot& a, bool pretty, int depth) {
    ObjectWriter obj(os, pretty, depth);
    obj.field("rrsp", a.rrsp)
       .field("tfsa", a.tfsa)
       .field("non_registered", a.non_registered)
       .field("non_registered_acb", a.non_registered_acb);
    obj.close();
}

void write_year(std::ostream& os, const SimulationResult& r, bool pretty, int depth) {
    ObjectWriter obj(os, pretty, depth);
    obj.field("year", r.year)
       .field("age", r.age)
       .field("spouse_age", r.spouse_age)
       .field("person_alive", r.person_alive)
       .field("spouse_alive", r.spouse_alive);

    write_accounts(obj.raw("person_accounts"), r.person_accounts, pretty, depth + 1);
    write_accounts(obj.raw("spouse_accounts"), r.spouse_accounts, pretty, depth + 1);

    obj.field("total_assets", r.total_assets)
       .field("gross_income", r.gross_income)
       .field("net_income", r.net_income)
       .field("employment_income", r.employment_income)
       .field("cpp_income", r.cpp_income)
       .field("oas_income", r.oas_income)
       .field("investment_income", r.investment_income)
       .field("spending_target", r.spending_target)
       .field("tax_paid", r.tax_paid)
       .field("person_tax", r.person_tax)
       .field("spouse_tax", r.spouse_tax)
       .field("net_employment_income", r.net_employment_income)
       .field("net_cpp_income", r.net_cpp_income)
       .field("net_oas_income", r.net_oas_income)
       .field("net_rrsp_income", r.net_rrsp_income)
       .field("net_investment_income", r.net_investment_income)
       .field("rrif_minimum_withdrawal", r.rrif_minimum_withdrawal)
       .field("melt_withdrawal", r.melt_withdrawal)
       .field("extra_rrsp_withdrawal", r.extra_rrsp_withdrawal)
       .field("total_rrsp_withdrawal", r.total_rrsp_withdrawal)
       .field("total_tfsa_withdrawal", r.total_tfsa_withdrawal)
       .field("total_non_registered_withdrawal", r.total_non_registered_withdrawal)
       .field("person_rrsp_withdrawal", r.person_rrsp_withdrawal)
       .field("spouse_rrsp_withdrawal", r.spouse_rrsp_withdrawal)
       .field("person_tfsa_withdrawal", r.person_tfsa_withdrawal)
       .field("spouse_tfsa_withdrawal", r.spouse_tfsa_withdrawal)
       .field("person_non_registered_withdrawal", r.person_non_registered_withdrawal)
       .field("spouse_non_registered_withdrawal", r.spouse_non_registered_withdrawal)
       .field("person_net_withdrawal", r.person_net_withdrawal)
       .field("spouse_net_withdrawal", r.spouse_net_withdrawal)
       .field("realized_capital_gains", r.realized_capital_gains)
       .field("household_surplus", r.household_surplus)
       .field("reinvested_tfsa", r.reinvested_tfsa)
       .field("reinvested_rrsp", r.reinvested_rrsp)
       .field("reinvested_non_registered", r.reinvested_non_registered)
       .field("shortfall", r.shortfall)
       .field("inflation_factor", r.inflation_factor)
       .field("growth_rate", r.growth_rate)
       .field("income_split_amount", r.income_split_amount)
       .field("income_split_savings", r.income_split_savings)
       .field("income_split_direction", split_direction_to_string(r.income_split_direction))
       .field("jurisdiction_fallback", r.jurisdiction_fallback)
       .field("person_died", r.person_died)
       .field("spouse_died", r.spouse_died)
       .field("rrsp_rolled_to_spouse", r.rrsp_rolled_to_spouse)
       .field("terminal_tax_rrsp", r.terminal_tax_rrsp)
       .field("terminal_tax_capital_gains", r.terminal_tax_capital_gains)
       .field("terminal_tax", r.terminal_tax)
       .field("gross_estate_value", r.gross_estate_value)
       .field("net_estate_value", r.net_estate_value);
    obj.close();
}

template <typename T, typename WriteItem>
void write_array(std::ostream& os, const std::vector<T>& items, bool pretty, int depth,
                 WriteItem write_item) {
    const std::string item_indent = pretty ? std::string(static_cast<size_t>(depth + 1) * 2, ' ') : "";
    os << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) os << ",";
        if (pretty) os << "\n" << item_indent;
        write_item(items[i], depth + 1);
    }
    if (pretty && !items.empty()) {
        os << "\n" << std::string(static_cast<size_t>(depth) * 2, ' ');
    }
    os << "]";
}

template <typename Writer, typename Value>
void write_to_file(const std::string& filepath, const Value& value, bool pretty_print,
                   Writer writer) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    writer(file, value, pretty_print);
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filepath);
    }
}

} // anonymous namespace

void write_simulation_json(std::ostream& os, const std::vector<SimulationResult>& results,
                           bool pretty_print) {
    os << std::fixed << std::setprecision(6);

    const bool fallback = !results.empty() && results.front().jurisdiction_fallback;

    ObjectWriter doc(os, pretty_print, 0);
    doc.field("year_count", results.size())
       .field("jurisdiction_fallback", fallback);

    write_array(doc.raw("years"), results, pretty_print, 1,
        [&os, pretty_print](const SimulationResult& r, int depth) {
            write_year(os, r, pretty_print, depth);
        });

    doc.close();
    os << (pretty_print ? "\n" : "");
}

void write_simulation_json(const std::string& filepath, const std::vector<SimulationResult>& results,
                           bool pretty_print) {
    write_to_file(filepath, results, pretty_print,
        [](std::ostream& os, const std::vector<SimulationResult>& r, bool pretty) {
            write_simulation_json(os, r, pretty);
        });
}

void write_monte_carlo_json(std::ostream& os, const MonteCarloResult& result,
                            bool pretty_print) {
    os << std::fixed << std::setprecision(6);

    ObjectWriter doc(os, pretty_print, 0);
    doc.field("runs", result.runs)
       .field("seed", static_cast<size_t>(result.seed))
       .field("success_rate", result.success_rate)
       .field("median_terminal_assets", result.median_terminal_assets);

    os << std::setprecision(2);
    doc.field("execution_time_ms", result.execution_time_ms);
    os << std::setprecision(6);

    write_array(doc.raw("percentiles"), result.percentiles, pretty_print, 1,
        [&os, pretty_print](const MonteCarloPercentile& band, int depth) {
            ObjectWriter obj(os, pretty_print, depth);
            obj.field("year", band.year)
               .field("age", band.age)
               .field("p5", band.p5())
               .field("p25", band.p25())
               .field("p50", band.p50())
               .field("p75", band.p75())
               .field("p95", band.p95());
            obj.close();
        });

    doc.close();
    os << (pretty_print ? "\n" : "");
}

void write_monte_carlo_json(const std::string& filepath, const MonteCarloResult& result,
                            bool pretty_print) {
    write_to_file(filepath, result, pretty_print,
        [](std::ostream& os, const MonteCarloResult& r, bool pretty) {
            write_monte_carlo_json(os, r, pretty);
        });
}

void write_summary_json(std::ostream& os, const PlanSummary& summary, bool pretty_print) {
    os << std::fixed << std::setprecision(6);

    ObjectWriter doc(os, pretty_print, 0);
    doc.field("estate_value", summary.estate_value)
       .field("estate_tax", summary.estate_tax)
       .field("total_retirement_tax", summary.total_retirement_tax)
       .field("total_retirement_income", summary.total_retirement_income)
       .field("total_tax_plus_estate", summary.total_tax_plus_estate)
       .field("effective_tax_rate_retirement", summary.effective_tax_rate_retirement)
       .field("effective_tax_rate_estate", summary.effective_tax_rate_estate)
       .field("total_effective_tax_rate", summary.total_effective_tax_rate)
       .field("net_retirement_income", summary.net_retirement_income)
       .field("net_estate_value", summary.net_estate_value)
       .field("total_net_value", summary.total_net_value)
       .field("initial_withdrawal_rate", summary.initial_withdrawal_rate)
       .field("out_of_money_age", summary.out_of_money_age);
    doc.close();
    os << (pretty_print ? "\n" : "");
}

void write_summary_json(const std::string& filepath, const PlanSummary& summary, bool pretty_print) {
    write_to_file(filepath, summary, pretty_print,
        [](std::ostream& os, const PlanSummary& s, bool pretty) {
            write_summary_json(os, s, pretty);
        });
}

} // namespace io
} // namespace retirecalc
