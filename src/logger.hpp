/**
 * @file logger.hpp
 * @brief Structured logging for the projection engine
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text output
 * - Run context tracking (run id, mode, Monte Carlo iteration)
 * - Domain events: run start/complete, rejected inputs, jurisdiction
 *   fallback, solver non-convergence
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef RETIRECALC_LOGGER_HPP
#define RETIRECALC_LOGGER_HPP

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace retirecalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Solver diagnostics and per-run detail
    INFO,    ///< Run start/end
    WARN,    ///< Rejected inputs, jurisdiction fallback
    ERROR    ///< Failures surfaced to the caller
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (defaults to INFO)
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Identifies the projection a log line belongs to
 */
struct RunContext {
    std::string run_id;              ///< Caller-supplied identifier (scenario name)
    std::string mode;                ///< "deterministic", "stochastic" or "monte_carlo"
    size_t iteration;                ///< Monte Carlo run index (0 otherwise)

    RunContext()
        : run_id(""), mode("deterministic"), iteration(0) {}

    RunContext(const std::string& id, const std::string& mode_)
        : run_id(id), mode(mode_), iteration(0) {}
};

/**
 * @brief Summary figures reported when a run completes
 */
struct RunMetrics {
    double execution_time_ms;
    size_t years_projected;
    size_t runs_completed;
    double success_rate;
    double final_assets;

    RunMetrics()
        : execution_time_ms(0.0), years_projected(0), runs_completed(0),
          success_rate(0.0), final_assets(0.0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("retirecalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   RunContext ctx("household-a", "monte_carlo");
 *   Logger::get_instance().log_run_start(ctx, {{"iterations", "250"}});
 *   @endcode
 *
 * Calls are serialized internally so Monte Carlo worker threads may log.
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings (reopens the log file)
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a projection
     *
     * @param ctx Run context
     * @param parameters Key run parameters (jurisdiction, years, iterations)
     */
    void log_run_start(
        const RunContext& ctx,
        const std::map<std::string, std::string>& parameters
    );

    /**
     * @brief Log the completion of a projection
     */
    void log_run_complete(
        const RunContext& ctx,
        const RunMetrics& metrics
    );

    /**
     * @brief Log that inputs were rejected and an empty result returned
     */
    void log_inputs_rejected(
        const RunContext& ctx,
        const std::string& reason
    );

    /**
     * @brief Log that a jurisdiction code was resolved via the default
     */
    void log_jurisdiction_fallback(
        const RunContext& ctx,
        const std::string& requested,
        const std::string& resolved
    );

    /**
     * @brief Log that a numeric search returned a best estimate
     */
    void log_solver_nonconvergence(
        const std::string& solver,
        double target,
        double best_estimate,
        int iterations
    );

    void log_warning(const RunContext& ctx, const std::string& warning_message);

    void log_error(const RunContext& ctx, const std::string& error_message);

    void log_debug(const std::string& message, const std::map<std::string, std::string>& fields);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

    bool is_enabled(LogLevel level) const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    using Fields = std::map<std::string, std::string>;

    // event, run_id and mode for a run-scoped line
    static Fields context_fields(const RunContext& ctx, const std::string& event);

    void log(LogLevel level, const std::string& message, const Fields& fields);
    void write_line(const std::string& line);
};

/**
 * @brief Fixed-precision formatting for monetary log fields
 */
std::string format_amount(double value);

} // namespace retirecalc

#endif // RETIRECALC_LOGGER_HPP
