#include "parquet_writer.hpp"
#include <stdexcept>
#include <utility>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace retirecalc {

namespace {

using DoubleColumn = std::pair<const char*, double SimulationResult::*>;

const std::vector<DoubleColumn>& double_columns() {
    static const std::vector<DoubleColumn> columns = {
        {"total_assets", &SimulationResult::total_assets},
        {"gross_income", &SimulationResult::gross_income},
        {"net_income", &SimulationResult::net_income},
        {"spending_target", &SimulationResult::spending_target},
        {"tax_paid", &SimulationResult::tax_paid},
        {"cpp_income", &SimulationResult::cpp_income},
        {"oas_income", &SimulationResult::oas_income},
        {"total_rrsp_withdrawal", &SimulationResult::total_rrsp_withdrawal},
        {"total_tfsa_withdrawal", &SimulationResult::total_tfsa_withdrawal},
        {"total_non_registered_withdrawal", &SimulationResult::total_non_registered_withdrawal},
        {"realized_capital_gains", &SimulationResult::realized_capital_gains},
        {"shortfall", &SimulationResult::shortfall},
        {"terminal_tax", &SimulationResult::terminal_tax},
        {"inflation_factor", &SimulationResult::inflation_factor}
    };
    return columns;
}

} // anonymous namespace

std::vector<std::string> ParquetWriter::column_names() {
    std::vector<std::string> names = {"year", "age"};
    for (const auto& column : double_columns()) {
        names.emplace_back(column.first);
    }
    return names;
}

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

} // anonymous namespace

void ParquetWriter::write_results(const std::vector<SimulationResult>& results,
                                  const std::string& filepath) {
    if (results.empty()) {
        throw std::runtime_error("Projection has no years to write");
    }

    std::vector<std::shared_ptr<arrow::Field>> fields = {
        arrow::field("year", arrow::int32()),
        arrow::field("age", arrow::int32())
    };
    for (const auto& column : double_columns()) {
        fields.push_back(arrow::field(column.first, arrow::float64()));
    }
    auto schema = arrow::schema(fields);

    std::vector<std::shared_ptr<arrow::Array>> arrays;

    // Integer columns
    arrow::Int32Builder year_builder;
    arrow::Int32Builder age_builder;
    check(year_builder.Reserve(results.size()), "Failed to reserve memory for year column");
    check(age_builder.Reserve(results.size()), "Failed to reserve memory for age column");
    for (const auto& r : results) {
        check(year_builder.Append(r.year), "Failed to append year");
        check(age_builder.Append(r.age), "Failed to append age");
    }
    std::shared_ptr<arrow::Array> year_array;
    std::shared_ptr<arrow::Array> age_array;
    check(year_builder.Finish(&year_array), "Failed to finish year array");
    check(age_builder.Finish(&age_array), "Failed to finish age array");
    arrays.push_back(year_array);
    arrays.push_back(age_array);

    // Monetary columns
    for (const auto& column : double_columns()) {
        arrow::DoubleBuilder builder;
        check(builder.Reserve(results.size()),
              std::string("Failed to reserve memory for ") + column.first + " column");
        for (const auto& r : results) {
            check(builder.Append(r.*(column.second)),
                  std::string("Failed to append ") + column.first);
        }
        std::shared_ptr<arrow::Array> array;
        check(builder.Finish(&array), std::string("Failed to finish ") + column.first + " array");
        arrays.push_back(array);
    }

    auto table = arrow::Table::Make(schema, arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "Failed to write Parquet table");
    check(outfile->Close(), "Failed to close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_results(const std::vector<SimulationResult>& /* results */,
                                  const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace retirecalc
