/**
 * @file logger.cpp
 * @brief Structured logger: JSON or key=value lines on stderr and/or a file
 */

#include "logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace retirecalc {

namespace {

// UTC, ISO-8601 with milliseconds: 2025-03-01T14:02:11.042Z
std::string utc_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t seconds = system_clock::to_time_t(now);
    const long millis = static_cast<long>(
        duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm utc;
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    char buffer[32];
    const size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    std::snprintf(buffer + n, sizeof(buffer) - n, ".%03ldZ", millis);
    return buffer;
}

void append_escaped(std::string& out, const std::string& text) {
    for (const char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char code[8];
                    std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(c));
                    out += code;
                } else {
                    out += c;
                }
        }
    }
}

void append_pair(std::string& out, const std::string& key, const std::string& value) {
    if (out.size() > 1) out += ',';
    out += '"';
    append_escaped(out, key);
    out += "\":\"";
    append_escaped(out, value);
    out += '"';
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : config_() {}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (!config_.enable_file) {
        return;
    }
    file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Warning: cannot open log file " << config_.log_file_path
                  << ", logging to console only" << std::endl;
        file_stream_.reset();
    }
}

Logger::Fields Logger::context_fields(const RunContext& ctx, const std::string& event) {
    Fields fields;
    fields["event"] = event;
    fields["run_id"] = ctx.run_id;
    fields["mode"] = ctx.mode;
    return fields;
}

void Logger::log_run_start(
    const RunContext& ctx,
    const std::map<std::string, std::string>& parameters
) {
    Fields fields = context_fields(ctx, "run_start");
    fields["iteration"] = std::to_string(ctx.iteration);
    for (const auto& [key, value] : parameters) {
        fields["param." + key] = value;
    }
    log(LogLevel::INFO, "Projection started", fields);
}

void Logger::log_run_complete(
    const RunContext& ctx,
    const RunMetrics& metrics
) {
    Fields fields = context_fields(ctx, "run_complete");
    fields["execution_time_ms"] = format_amount(metrics.execution_time_ms);
    fields["years_projected"] = std::to_string(metrics.years_projected);
    fields["final_assets"] = format_amount(metrics.final_assets);

    // Batch figures only mean something for Monte Carlo
    if (metrics.runs_completed > 0) {
        fields["runs_completed"] = std::to_string(metrics.runs_completed);
        fields["success_rate"] = std::to_string(metrics.success_rate);
    }
    log(LogLevel::INFO, "Projection completed", fields);
}

void Logger::log_inputs_rejected(
    const RunContext& ctx,
    const std::string& reason
) {
    Fields fields = context_fields(ctx, "inputs_rejected");
    fields["reason"] = reason;
    log(LogLevel::WARN, "Simulation inputs rejected", fields);
}

void Logger::log_jurisdiction_fallback(
    const RunContext& ctx,
    const std::string& requested,
    const std::string& resolved
) {
    Fields fields = context_fields(ctx, "jurisdiction_fallback");
    fields["requested"] = requested;
    fields["resolved"] = resolved;
    log(LogLevel::WARN, "Unknown jurisdiction, using default", fields);
}

void Logger::log_solver_nonconvergence(
    const std::string& solver,
    double target,
    double best_estimate,
    int iterations
) {
    if (!is_enabled(LogLevel::DEBUG)) {
        return;
    }

    Fields fields;
    fields["event"] = "solver_nonconvergence";
    fields["solver"] = solver;
    fields["target"] = format_amount(target);
    fields["best_estimate"] = format_amount(best_estimate);
    fields["iterations"] = std::to_string(iterations);
    log(LogLevel::DEBUG, "Solver returned best estimate", fields);
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    Fields fields = context_fields(ctx, "warning");
    fields["warning"] = warning_message;
    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    Fields fields = context_fields(ctx, "error");
    fields["error_message"] = error_message;
    log(LogLevel::ERROR, "Projection failed", fields);
}

void Logger::log_debug(const std::string& message, const std::map<std::string, std::string>& fields) {
    if (is_enabled(LogLevel::DEBUG)) {
        log(LogLevel::DEBUG, message, fields);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

bool Logger::is_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= config_.min_level;
}

void Logger::log(LogLevel level, const std::string& message, const Fields& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    const std::string timestamp = utc_timestamp();
    std::string line;

    if (config_.enable_json) {
        // timestamp, level and message lead; fields follow in key order
        line = "{";
        append_pair(line, "timestamp", timestamp);
        append_pair(line, "level", level_to_string(level));
        append_pair(line, "message", message);
        for (const auto& [key, value] : fields) {
            append_pair(line, key, value);
        }
        line += '}';
    } else {
        line = timestamp + " [" + level_to_string(level) + "] " + message;
        for (const auto& [key, value] : fields) {
            line += ' ';
            line += key;
            line += '=';
            line += value;
        }
    }

    write_line(line);
}

void Logger::write_line(const std::string& line) {
    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (file_stream_) {
        *file_stream_ << line << '\n';
    }
}

std::string format_amount(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // namespace retirecalc
