/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace pensioncalc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_parameters_loaded(
    const std::string& country,
    const std::string& path,
    size_t scheme_count,
    size_t worker_type_count
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "parameters_loaded";
    fields["country"] = country;
    fields["path"] = path;
    fields["scheme_count"] = std::to_string(scheme_count);
    fields["worker_type_count"] = std::to_string(worker_type_count);

    log(LogLevel::INFO, "Loaded country parameters", fields);
}

void Logger::log_life_table_loaded(
    const std::string& country,
    const std::string& path
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "life_table_loaded";
    fields["country"] = country;
    fields["path"] = path;

    log(LogLevel::INFO, "Loaded life table", fields);
}

void Logger::log_computation_start(const LogContext& ctx, size_t scheme_count) {
    auto fields = context_fields(ctx, "computation_start");
    fields["scheme_count"] = std::to_string(scheme_count);

    log(LogLevel::DEBUG, "Starting computation", fields);
}

void Logger::log_computation_complete(
    const LogContext& ctx,
    double gross_benefit,
    double net_benefit,
    size_t warning_count,
    double elapsed_ms
) {
    auto fields = context_fields(ctx, "computation_complete");
    fields["gross_benefit"] = format_number(gross_benefit, 2);
    fields["net_benefit"] = format_number(net_benefit, 2);
    fields["warning_count"] = std::to_string(warning_count);
    fields["elapsed_ms"] = format_number(elapsed_ms, 3);

    log(LogLevel::DEBUG, "Computation completed", fields);
}

void Logger::log_issue(const LogContext& ctx, const Issue& issue) {
    auto fields = context_fields(ctx, "issue");
    fields["kind"] = issue_kind_to_string(issue.kind);
    if (!issue.scheme_id.empty()) {
        fields["scheme_id"] = issue.scheme_id;
    }

    log(LogLevel::WARN, issue.message, fields);
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    auto fields = context_fields(ctx, "error");
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Computation error", fields);
}

void Logger::log_message(LogLevel level, const std::string& message,
                         const std::map<std::string, std::string>& fields) {
    log(level, message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
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
    return level >= get_min_level();
}

std::map<std::string, std::string> Logger::context_fields(const LogContext& ctx, const std::string& event) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["country"] = ctx.country;
    fields["worker_type"] = ctx.worker_type;
    fields["sex"] = ctx.sex;
    fields["earnings_multiple"] = format_number(ctx.earnings_multiple, 2);
    return fields;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (!is_enabled(level)) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace pensioncalc
