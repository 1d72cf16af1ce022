#ifndef RETIRECALC_PARQUET_WRITER_HPP
#define RETIRECALC_PARQUET_WRITER_HPP

#include "../simulation.hpp"
#include <string>
#include <vector>

namespace retirecalc {

class ParquetWriter {
public:
    /**
     * Write a yearly projection to a Parquet file.
     *
     * Output schema (one row per projected year):
     *   - year, age: int32
     *   - total_assets, gross_income, net_income, spending_target, tax_paid,
     *     cpp_income, oas_income, total_rrsp_withdrawal, total_tfsa_withdrawal,
     *     total_non_registered_withdrawal, realized_capital_gains, shortfall,
     *     terminal_tax, inflation_factor: float64
     *
     * @param results Projection to write (must not be empty)
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the file cannot be written, or when built
     *         without Apache Arrow
     */
    static void write_results(const std::vector<SimulationResult>& results,
                              const std::string& filepath);

    // Column names in schema order
    static std::vector<std::string> column_names();
};

} // namespace retirecalc

#endif // RETIRECALC_PARQUET_WRITER_HPP
