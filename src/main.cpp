#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include "household.hpp"
#include "logger.hpp"
#include "monte_carlo.hpp"
#include "plan_summary.hpp"
#include "simulation.hpp"
#include "tax_rates.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/scenario_reader.hpp"

namespace {

struct CLIArgs {
    std::string scenario_path;
    std::string tax_rates_path;
    size_t monte_carlo_runs = 0;          // 0 = deterministic projection only
    uint64_t seed = 42;
    std::string output_path;
    std::string parquet_path;
    std::string summary_path;
    bool inflation_adjusted = false;
    std::string log_level = "INFO";
    std::string log_file;
    bool log_text = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "RetireCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --scenario <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --scenario <path>           JSON household scenario (required)\n";
    std::cerr << "  --tax-rates <path>          JSON overrides for the canada-2024 tax table\n\n";
    std::cerr << "Projection options:\n";
    std::cerr << "  --monte-carlo <runs>        Run a Monte Carlo batch instead of one projection\n";
    std::cerr << "  --seed <value>              Random seed for reproducibility (default: 42)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --parquet <path>            Also write the yearly projection as Parquet\n";
    std::cerr << "  --summary <path>            Write whole-plan summary metrics as JSON\n";
    std::cerr << "  --inflation-adjusted        Report summary figures in today's dollars\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Append log lines to a file\n";
    std::cerr << "  --log-text                  Plain-text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Deterministic projection with summary:\n";
    std::cerr << "     " << program_name << " --scenario data/sample_household.json \\\n";
    std::cerr << "         --summary summary.json --output projection.json\n\n";
    std::cerr << "  2. Monte Carlo batch:\n";
    std::cerr << "     " << program_name << " --scenario data/sample_household.json \\\n";
    std::cerr << "         --monte-carlo 250 --seed 7 --output bands.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

// std::stoull accepts a leading '-' and wraps it to a huge value
uint64_t parse_unsigned(const std::string& text) {
    const size_t first = text.find_first_not_of(" \t\n\r\f\v");
    if (first != std::string::npos && text[first] == '-') {
        throw std::invalid_argument("negative value " + text);
    }
    return std::stoull(text);
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--scenario" && i + 1 < argc) {
                args.scenario_path = argv[++i];
            } else if (arg == "--tax-rates" && i + 1 < argc) {
                args.tax_rates_path = argv[++i];
            } else if (arg == "--monte-carlo" && i + 1 < argc) {
                args.monte_carlo_runs = static_cast<size_t>(parse_unsigned(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = parse_unsigned(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--parquet" && i + 1 < argc) {
                args.parquet_path = argv[++i];
            } else if (arg == "--summary" && i + 1 < argc) {
                args.summary_path = argv[++i];
            } else if (arg == "--inflation-adjusted") {
                args.inflation_adjusted = true;
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else if (arg == "--log-text") {
                args.log_text = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n\n";
        return false;
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.scenario_path.empty()) {
        std::cerr << "Error: --scenario is required\n";
        valid = false;
    } else if (!file_exists(args.scenario_path)) {
        std::cerr << "Error: Scenario file not found: " << args.scenario_path << "\n";
        valid = false;
    }

    if (!args.tax_rates_path.empty() && !file_exists(args.tax_rates_path)) {
        std::cerr << "Error: Tax rates file not found: " << args.tax_rates_path << "\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

std::string scenario_label(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    const size_t dot = name.find_last_of('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    retirecalc::LoggerConfig log_config;
    log_config.min_level = retirecalc::string_to_level(args.log_level);
    log_config.enable_json = !args.log_text;
    if (!args.log_file.empty()) {
        log_config.enable_file = true;
        log_config.log_file_path = args.log_file;
    }
    retirecalc::Logger& logger = retirecalc::Logger::get_instance();
    logger.configure(log_config);

    const std::string run_id = scenario_label(args.scenario_path);
    retirecalc::RunContext ctx(run_id, args.monte_carlo_runs > 0 ? "monte_carlo" : "deterministic");

    try {
        std::cerr << "Loading scenario from " << args.scenario_path << "..." << std::flush;
        retirecalc::SimulationInputs inputs = retirecalc::io::load_simulation_inputs(args.scenario_path);
        std::cerr << " done\n";

        retirecalc::TaxRates rates = retirecalc::TaxRates::canada_2024();
        if (!args.tax_rates_path.empty()) {
            std::cerr << "Loading tax rates from " << args.tax_rates_path << "..." << std::flush;
            rates = retirecalc::io::load_tax_rates(args.tax_rates_path);
            std::cerr << " done (" << rates.version << ")\n";
        }

        retirecalc::SimulationConfig sim_config;
        sim_config.run_id = run_id;
        sim_config.seed = args.seed;

        std::vector<retirecalc::SimulationResult> projection =
            retirecalc::run_simulation(inputs, rates, sim_config);

        if (projection.empty()) {
            std::cerr << "Error: Scenario rejected: " << retirecalc::validate_inputs(inputs) << "\n";
            logger.flush();
            return 1;
        }

        const retirecalc::PlanSummary summary =
            retirecalc::summarize_plan(projection, inputs, rates, args.inflation_adjusted);

        std::cerr << "\nProjection:\n";
        std::cerr << "  Years:              " << projection.size() << "\n";
        std::cerr << "  Final assets:       " << retirecalc::format_amount(projection.back().total_assets) << "\n";
        std::cerr << "  Retirement tax:     " << retirecalc::format_amount(summary.total_retirement_tax) << "\n";
        std::cerr << "  Estate tax:         " << retirecalc::format_amount(summary.estate_tax) << "\n";
        std::cerr << "  Net estate:         " << retirecalc::format_amount(summary.net_estate_value) << "\n";
        if (summary.out_of_money_age) {
            std::cerr << "  Out of money at:    " << *summary.out_of_money_age << "\n";
        }

        if (args.monte_carlo_runs > 0) {
            std::cerr << "\nRunning Monte Carlo (" << args.monte_carlo_runs << " runs, seed "
                      << args.seed << ")...\n";
            retirecalc::MonteCarloResult mc =
                retirecalc::run_monte_carlo(inputs, args.monte_carlo_runs, args.seed, rates);

            std::cerr << "  Success rate:       " << mc.success_rate << "\n";
            std::cerr << "  Median terminal:    " << retirecalc::format_amount(mc.median_terminal_assets) << "\n";
            std::cerr << "  Execution:          " << mc.execution_time_ms << " ms\n";

            if (args.output_path.empty()) {
                retirecalc::io::write_monte_carlo_json(std::cout, mc);
            } else {
                retirecalc::io::write_monte_carlo_json(args.output_path, mc);
                std::cerr << "\nOutput written to: " << args.output_path << "\n";
            }
        } else {
            if (args.output_path.empty()) {
                retirecalc::io::write_simulation_json(std::cout, projection);
            } else {
                retirecalc::io::write_simulation_json(args.output_path, projection);
                std::cerr << "\nOutput written to: " << args.output_path << "\n";
            }
        }

        if (!args.summary_path.empty()) {
            retirecalc::io::write_summary_json(args.summary_path, summary);
            std::cerr << "Summary written to: " << args.summary_path << "\n";
        }

        if (!args.parquet_path.empty()) {
            retirecalc::ParquetWriter::write_results(projection, args.parquet_path);
            std::cerr << "Parquet written to: " << args.parquet_path << "\n";
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
