#ifndef RETIRECALC_IO_SCENARIO_READER_HPP
#define RETIRECALC_IO_SCENARIO_READER_HPP

#include "../household.hpp"
#include "../tax_rates.hpp"
#include <istream>
#include <stdexcept>
#include <string>

namespace retirecalc {
namespace io {

/**
 * @brief Exception thrown when a scenario or tax-rate document cannot be used
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses a household scenario from a JSON string
 *
 * Required: a "person" object with age, retirement_age and life_expectancy.
 * Everything else falls back to the SimulationInputs / Person defaults.
 *
 * @throws ConfigParseError on malformed JSON, missing required fields,
 *         wrong types or unknown enum values
 */
SimulationInputs parse_simulation_inputs(const std::string& json_string);

/**
 * @brief Reads a household scenario from a stream
 */
SimulationInputs load_simulation_inputs(std::istream& is);

/**
 * @brief Reads a household scenario from a file
 *
 * @throws ConfigParseError if the file cannot be opened
 */
SimulationInputs load_simulation_inputs(const std::string& file_path);

/**
 * @brief Parses tax-rate overrides applied on top of canada_2024
 *
 * Any subset of: version, default_jurisdiction, federal_brackets,
 * federal_basic_personal_amount, jurisdictions (brackets, basic personal
 * amount, dividend credit rate per code), cpp, oas and plans constants.
 * The merged table is validated before it is returned.
 *
 * @throws ConfigParseError on malformed JSON or a table that fails validation
 */
TaxRates parse_tax_rates(const std::string& json_string);

TaxRates load_tax_rates(std::istream& is);

TaxRates load_tax_rates(const std::string& file_path);

} // namespace io
} // namespace retirecalc

#endif // RETIRECALC_IO_SCENARIO_READER_HPP
