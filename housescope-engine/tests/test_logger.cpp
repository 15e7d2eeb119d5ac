/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch.hpp>
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace housescope;
using json = nlohmann::json;

namespace {

const char* const TEST_LOG = "housescope_test.log";

// Points the logger at a fresh file with console output off
void configure_file_logger(LogLevel level, bool json_lines = true) {
    std::filesystem::remove(TEST_LOG);

    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_json = json_lines;
    config.log_file_path = TEST_LOG;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_log_lines() {
    Logger::get_instance().flush();
    std::vector<std::string> lines;
    std::ifstream file(TEST_LOG);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

void reset_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
    std::filesystem::remove(TEST_LOG);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "housescope.log");
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }

    SECTION("Minimum level can be changed") {
        Logger& logger = Logger::get_instance();
        configure_file_logger(LogLevel::DEBUG);
        REQUIRE(logger.get_min_level() == LogLevel::DEBUG);
        logger.set_min_level(LogLevel::ERROR);
        REQUIRE(logger.get_min_level() == LogLevel::ERROR);
        reset_logger();
    }
}

TEST_CASE("Logger writes JSON lines", "[logger]") {
    Logger& logger = Logger::get_instance();
    configure_file_logger(LogLevel::INFO);

    logger.log_config_loaded("", "bisection");
    logger.log_snapshot_loaded("accounts", "data/accounts.csv", 5);

    auto lines = read_log_lines();
    REQUIRE(lines.size() == 2);

    json config_line = json::parse(lines[0]);
    REQUIRE(config_line["event"] == "config_loaded");
    REQUIRE(config_line["config_path"] == "<defaults>");
    REQUIRE(config_line["solver_method"] == "bisection");
    REQUIRE(config_line["level"] == "INFO");
    REQUIRE(config_line.contains("timestamp"));

    json snapshot_line = json::parse(lines[1]);
    REQUIRE(snapshot_line["event"] == "snapshot_loaded");
    REQUIRE(snapshot_line["kind"] == "accounts");
    REQUIRE(snapshot_line["rows_loaded"] == "5");
    REQUIRE(snapshot_line["message"] == "Loaded accounts");

    reset_logger();
}

TEST_CASE("Logger filters by level", "[logger]") {
    Logger& logger = Logger::get_instance();
    configure_file_logger(LogLevel::WARN);

    SolverOptions options;
    SolverResult converged;
    converged.converged = true;
    converged.iterations = 31;
    converged.price = Decimal(163228);
    logger.log_solver_result(options, converged);

    SolverResult stalled;
    stalled.iterations = 10;
    stalled.residual = Decimal(42);
    logger.log_solver_result(SolverOptions::fixed_point(), stalled);

    logger.log_affordability_warning("Emergency fund covers only 2.5 months");
    logger.log_error("Failed to open file", "load");

    auto lines = read_log_lines();
    REQUIRE(lines.size() == 3);

    json solver_line = json::parse(lines[0]);
    REQUIRE(solver_line["level"] == "WARN");
    REQUIRE(solver_line["method"] == "fixed-point");
    REQUIRE(solver_line["converged"] == "false");
    REQUIRE(solver_line["residual"] == "42.0000");

    json warning_line = json::parse(lines[1]);
    REQUIRE(warning_line["event"] == "affordability_warning");
    REQUIRE(warning_line["warning"] == "Emergency fund covers only 2.5 months");

    json error_line = json::parse(lines[2]);
    REQUIRE(error_line["level"] == "ERROR");
    REQUIRE(error_line["phase"] == "load");
    REQUIRE(error_line["error_message"] == "Failed to open file");

    reset_logger();
}

TEST_CASE("Logger emits category detail at DEBUG", "[logger]") {
    Logger& logger = Logger::get_instance();
    configure_file_logger(LogLevel::DEBUG);

    FinancialMetrics metrics;
    metrics.account_count = 2;
    metrics.net_worth = Decimal(17500);
    CategoryAmount rent;
    rent.category = "rent";
    rent.amount = Decimal(4500);
    rent.percentage = Decimal(100);
    metrics.expense_breakdown.push_back(rent);

    logger.log_metrics_computed(metrics, "2024-03-31");

    auto lines = read_log_lines();
    REQUIRE(lines.size() == 2);

    json summary = json::parse(lines[0]);
    REQUIRE(summary["event"] == "metrics_computed");
    REQUIRE(summary["net_worth"] == "17500.00");
    REQUIRE(summary["as_of"] == "2024-03-31");

    json detail = json::parse(lines[1]);
    REQUIRE(detail["level"] == "DEBUG");
    REQUIRE(detail["category"] == "rent");
    REQUIRE(detail["amount"] == "4500.00");

    reset_logger();
}

TEST_CASE("Logger plain text output", "[logger]") {
    Logger& logger = Logger::get_instance();
    configure_file_logger(LogLevel::INFO, false);

    logger.log_error("Bad input", "analyze");

    auto lines = read_log_lines();
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[ERROR] Bad input {") != std::string::npos);
    REQUIRE(lines[0].find("phase=analyze") != std::string::npos);

    reset_logger();
}
