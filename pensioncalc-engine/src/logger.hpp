/**
 * @file logger.hpp
 * @brief Structured logging for the pension engine and CLI
 *
 * The Logger provides:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output, one object per line
 * - Computation context (country, worker type, sex, earnings multiple)
 * - Serialized writes, safe from OpenMP worker threads
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef PENSIONCALC_LOGGER_HPP
#define PENSIONCALC_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "reasoning.hpp"

namespace pensioncalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Stage summaries and intermediate values
    INFO,    ///< Inputs loaded, computations completed
    WARN,    ///< Recorded issues (clamps, fallbacks, skipped schemes)
    ERROR    ///< Failures that abort a computation or the run
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Identifies one (profile, earnings multiple) computation
 */
struct LogContext {
    std::string country;             ///< ISO3 code
    std::string worker_type;
    std::string sex;
    double earnings_multiple;

    LogContext()
        : earnings_multiple(0.0) {}

    LogContext(const std::string& iso3, const std::string& wt, const std::string& s, double multiple)
        : country(iso3), worker_type(wt), sex(s), earnings_multiple(multiple) {}
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
          log_file_path("pensioncalc.log"),
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
 *   LogContext ctx("JOR", "private_employee", "male", 1.0);
 *   Logger::get_instance().log_computation_start(ctx, 4);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);

    /**
     * @brief Log a country parameter file being loaded
     *
     * @param country ISO3 code
     * @param path Source file
     * @param scheme_count Number of schemes
     * @param worker_type_count Number of worker types
     */
    void log_parameters_loaded(
        const std::string& country,
        const std::string& path,
        size_t scheme_count,
        size_t worker_type_count
    );

    /**
     * @brief Log a life table being loaded
     *
     * @param country ISO3 code the table is registered under
     * @param path Source file
     */
    void log_life_table_loaded(
        const std::string& country,
        const std::string& path
    );

    void log_computation_start(const LogContext& ctx, size_t scheme_count);

    /**
     * @brief Log a finished computation
     *
     * @param ctx Computation context
     * @param gross_benefit Annual gross benefit
     * @param net_benefit Annual net benefit
     * @param warning_count Number of recorded issues
     * @param elapsed_ms Wall time
     */
    void log_computation_complete(
        const LogContext& ctx,
        double gross_benefit,
        double net_benefit,
        size_t warning_count,
        double elapsed_ms
    );

    // Issues are logged at WARN, scheme-local errors included
    void log_issue(const LogContext& ctx, const Issue& issue);

    void log_error(const LogContext& ctx, const std::string& error_message);

    // Free-form message with optional fields
    void log_message(LogLevel level, const std::string& message,
                     const std::map<std::string, std::string>& fields = {});

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;
    bool is_enabled(LogLevel level) const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> context_fields(const LogContext& ctx, const std::string& event) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace pensioncalc

#endif // PENSIONCALC_LOGGER_HPP
