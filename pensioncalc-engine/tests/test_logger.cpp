/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace pensioncalc;
using json = nlohmann::json;

namespace {

// Route output to a fresh file only
void log_to_file(const std::string& path, LogLevel min_level = LogLevel::DEBUG) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<json> read_log_lines(const std::string& path) {
    Logger::get_instance().flush();
    std::vector<json> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(json::parse(line));
        }
    }
    return lines;
}

void reset_logger(const std::string& path) {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
    std::filesystem::remove(path);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "pensioncalc.log");
    }

    SECTION("Log level filtering") {
        LoggerConfig config;
        config.min_level = LogLevel::WARN;
        config.enable_console = false;
        logger.configure(config);

        REQUIRE(logger.get_min_level() == LogLevel::WARN);
        REQUIRE_FALSE(logger.is_enabled(LogLevel::INFO));
        REQUIRE(logger.is_enabled(LogLevel::ERROR));
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
    }
}

TEST_CASE("Logger input loading events", "[logger]") {
    const std::string path = "test_pensioncalc_inputs.log";
    log_to_file(path);

    Logger& logger = Logger::get_instance();
    logger.log_parameters_loaded("EXA", "data/sample_country.json", 5, 4);
    logger.log_life_table_loaded("EXA", "data/sample_life_table.csv");

    auto lines = read_log_lines(path);
    REQUIRE(lines.size() == 2);

    REQUIRE(lines[0]["event"] == "parameters_loaded");
    REQUIRE(lines[0]["level"] == "INFO");
    REQUIRE(lines[0]["country"] == "EXA");
    REQUIRE(lines[0]["scheme_count"] == "5");
    REQUIRE(lines[0]["worker_type_count"] == "4");
    REQUIRE(lines[0].contains("timestamp"));

    REQUIRE(lines[1]["event"] == "life_table_loaded");
    REQUIRE(lines[1]["path"] == "data/sample_life_table.csv");

    reset_logger(path);
}

TEST_CASE("Logger computation events carry their context", "[logger]") {
    const std::string path = "test_pensioncalc_computation.log";
    log_to_file(path);

    Logger& logger = Logger::get_instance();
    LogContext ctx("EXA", "private_employee", "female", 1.5);
    logger.log_computation_start(ctx, 4);
    logger.log_issue(ctx, Issue(IssueKind::ComputationWarning, "db", "Component capped at scheme maximum"));
    logger.log_computation_complete(ctx, 7000.0, 6300.0, 1, 0.25);
    logger.log_error(ctx, "every payable scheme is misconfigured");

    auto lines = read_log_lines(path);
    REQUIRE(lines.size() == 4);

    REQUIRE(lines[0]["event"] == "computation_start");
    REQUIRE(lines[0]["level"] == "DEBUG");
    REQUIRE(lines[0]["sex"] == "female");
    REQUIRE(lines[0]["earnings_multiple"] == "1.50");

    REQUIRE(lines[1]["level"] == "WARN");
    REQUIRE(lines[1]["kind"] == "ComputationWarning");
    REQUIRE(lines[1]["scheme_id"] == "db");
    REQUIRE(lines[1]["message"] == "Component capped at scheme maximum");

    REQUIRE(lines[2]["gross_benefit"] == "7000.00");
    REQUIRE(lines[2]["warning_count"] == "1");

    REQUIRE(lines[3]["level"] == "ERROR");
    REQUIRE(lines[3]["error_message"] == "every payable scheme is misconfigured");

    reset_logger(path);
}

TEST_CASE("Logger drops events below the minimum level", "[logger]") {
    const std::string path = "test_pensioncalc_filter.log";
    log_to_file(path, LogLevel::WARN);

    Logger& logger = Logger::get_instance();
    LogContext ctx("EXA", "private_employee", "male", 1.0);
    logger.log_computation_start(ctx, 2);
    logger.log_message(LogLevel::INFO, "ignored");
    logger.log_message(LogLevel::WARN, "kept", {{"reason", "quote \" and newline\n"}});

    auto lines = read_log_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0]["message"] == "kept");
    REQUIRE(lines[0]["reason"] == "quote \" and newline\n");

    reset_logger(path);
}

TEST_CASE("Logger serializes concurrent writers", "[logger][concurrency]") {
    const std::string path = "test_pensioncalc_threads.log";
    log_to_file(path, LogLevel::INFO);

    constexpr int kThreads = 4;
    constexpr int kMessages = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < kMessages; ++i) {
                Logger::get_instance().log_message(LogLevel::INFO, "tick",
                    {{"thread", std::to_string(t)}, {"i", std::to_string(i)}});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto lines = read_log_lines(path);
    REQUIRE(lines.size() == static_cast<size_t>(kThreads * kMessages));

    reset_logger(path);
}
