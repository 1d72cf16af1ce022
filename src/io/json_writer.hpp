#ifndef RETIRECALC_IO_JSON_WRITER_HPP
#define RETIRECALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../monte_carlo.hpp"
#include "../plan_summary.hpp"
#include "../simulation.hpp"

namespace retirecalc {
namespace io {

// Write a yearly projection as {"year_count": N, "jurisdiction_fallback": b, "years": [...]}
void write_simulation_json(std::ostream& os, const std::vector<SimulationResult>& results,
                           bool pretty_print = true);

void write_simulation_json(const std::string& filepath, const std::vector<SimulationResult>& results,
                           bool pretty_print = true);

// Write percentile bands, success rate and run metadata
void write_monte_carlo_json(std::ostream& os, const MonteCarloResult& result,
                            bool pretty_print = true);

void write_monte_carlo_json(const std::string& filepath, const MonteCarloResult& result,
                            bool pretty_print = true);

// Write whole-plan metrics; out_of_money_age is null when assets last
void write_summary_json(std::ostream& os, const PlanSummary& summary,
                        bool pretty_print = true);

void write_summary_json(const std::string& filepath, const PlanSummary& summary,
                        bool pretty_print = true);

} // namespace io
} // namespace retirecalc

#endif // RETIRECALC_IO_JSON_WRITER_HPP
