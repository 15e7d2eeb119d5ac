#include <catch2/catch.hpp>
#include "config_parser.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace housescope;

TEST_CASE("Environment variable expansion", "[config_parser]") {
    SECTION("Expand ${VAR}") {
        setenv("HOUSESCOPE_TEST_VAR", "test_value", 1);
        auto result = expand_environment_variables("prefix_${HOUSESCOPE_TEST_VAR}_suffix");
        REQUIRE(result == "prefix_test_value_suffix");
        unsetenv("HOUSESCOPE_TEST_VAR");
    }

    SECTION("Expand $VAR") {
        setenv("HOUSESCOPE_TEST_VAR", "test_value", 1);
        auto result = expand_environment_variables("prefix_$HOUSESCOPE_TEST_VAR");
        REQUIRE(result == "prefix_test_value");
        unsetenv("HOUSESCOPE_TEST_VAR");
    }

    SECTION("Undefined variable expands to empty string") {
        auto result = expand_environment_variables("${HOUSESCOPE_UNDEFINED_VAR}");
        REQUIRE(result == "");
    }

    SECTION("Literal dollar signs are kept") {
        REQUIRE(expand_environment_variables("$5 fee") == "$5 fee");
        REQUIRE(expand_environment_variables("cost $") == "cost $");
        REQUIRE(expand_environment_variables("${unterminated") == "${unterminated");
    }

    SECTION("No variables returns original string") {
        auto result = expand_environment_variables("no_variables_here");
        REQUIRE(result == "no_variables_here");
    }
}

TEST_CASE("Relative paths resolve against the config file", "[config_parser]") {
    REQUIRE(resolve_relative_path("logs/run.log", "/etc/housescope/config.json") == "/etc/housescope/logs/run.log");
    REQUIRE(resolve_relative_path("/var/log/run.log", "/etc/housescope/config.json") == "/var/log/run.log");
}

TEST_CASE("JSON config parsing", "[config_parser]") {
    SECTION("Empty object keeps defaults") {
        auto config = parse_engine_config_from_string("{}");
        REQUIRE(config.defaults.interest_rate == Decimal::from_string("0.07"));
        REQUIRE(config.defaults.loan_term_years == 30);
        REQUIRE(config.solver.method == SolverMethod::Bisection);
        REQUIRE(config.metrics.window_months == 3);
        REQUIRE(config.logging.min_level == LogLevel::INFO);
    }

    SECTION("Parse full config") {
        std::string json = R"({
            "affordability": {
                "interest_rate": "0.0675",
                "loan_term_years": 15,
                "property_tax_rate": 0.018,
                "insurance_rate": 0.004,
                "pmi_rate": 0.0075,
                "front_end_dti": 0.31,
                "pmi_threshold": 0.25,
                "dti_warning_percent": 36,
                "emergency_target_months": 3,
                "reserve_months": 4,
                "closing_cost_rate": 0.025,
                "safe_range_floor": 0.85
            },
            "solver": {"method": "newton", "tolerance": 0.5},
            "metrics": {
                "window_months": 6,
                "days_per_month": 31,
                "credit_payment_rate": 0.02,
                "loan_payment_rate": 0.015,
                "income_categories": ["salary", "Bonus"],
                "excluded_expense_categories": ["transfer"]
            },
            "logging": {"level": "DEBUG", "console": false, "json": false}
        })";

        auto config = parse_engine_config_from_string(json);

        REQUIRE(config.defaults.interest_rate == Decimal::from_string("0.0675"));
        REQUIRE(config.defaults.loan_term_years == 15);
        REQUIRE(config.defaults.property_tax_rate == Decimal::from_string("0.018"));
        REQUIRE(config.defaults.pmi_rate == Decimal::from_string("0.0075"));
        REQUIRE(config.defaults.front_end_dti == Decimal::from_string("0.31"));
        REQUIRE(config.defaults.pmi_threshold == Decimal::from_string("0.25"));
        REQUIRE(config.defaults.dti_warning_percent == Decimal(36));
        REQUIRE(config.defaults.emergency_target_months == 3.0);
        REQUIRE(config.defaults.reserve_months == 4);
        REQUIRE(config.defaults.closing_cost_rate == Decimal::from_string("0.025"));
        REQUIRE(config.defaults.safe_range_floor == Decimal::from_string("0.85"));

        REQUIRE(config.solver.method == SolverMethod::Newton);
        REQUIRE(config.solver.tolerance == Decimal::from_string("0.5"));
        REQUIRE(config.solver.max_iterations == 20);

        REQUIRE(config.metrics.window_months == 6);
        REQUIRE(config.metrics.days_per_month == 31);
        REQUIRE(config.metrics.credit_payment_rate == Decimal::from_string("0.02"));
        REQUIRE(config.metrics.loan_payment_rate == Decimal::from_string("0.015"));
        REQUIRE(config.metrics.classification.income_categories().count("bonus") == 1);
        REQUIRE(config.metrics.classification.income_categories().count("deposit") == 0);
        REQUIRE(config.metrics.classification.excluded_expense_categories().size() == 1);

        REQUIRE(config.logging.min_level == LogLevel::DEBUG);
        REQUIRE_FALSE(config.logging.enable_console);
        REQUIRE_FALSE(config.logging.enable_json);
        REQUIRE_FALSE(config.logging.enable_file);
    }

    SECTION("Solver method starts from its preset") {
        auto config = parse_engine_config_from_string(R"({"solver": {"method": "fixed-point"}})");
        REQUIRE(config.solver.method == SolverMethod::FixedPoint);
        REQUIRE(config.solver.tolerance == Decimal(10));
        REQUIRE(config.solver.max_iterations == 10);

        config = parse_engine_config_from_string(R"({"solver": {"method": "fixed-point", "max_iterations": 40}})");
        REQUIRE(config.solver.max_iterations == 40);
        REQUIRE(config.solver.gain == Decimal(200));
    }

    SECTION("String values expand environment variables") {
        setenv("HOUSESCOPE_TEST_RATE", "0.055", 1);
        auto config = parse_engine_config_from_string(
            R"({"affordability": {"interest_rate": "${HOUSESCOPE_TEST_RATE}"}})");
        REQUIRE(config.defaults.interest_rate == Decimal::from_string("0.055"));
        unsetenv("HOUSESCOPE_TEST_RATE");
    }
}

TEST_CASE("Account types in the metrics section", "[config_parser]") {
    auto config = parse_engine_config_from_string(R"({
        "metrics": {
            "income_account_types": ["checking", "Savings"],
            "expense_account_types": ["checking", "credit"]
        }
    })");

    const ClassificationPolicy& policy = config.metrics.classification;
    REQUIRE(policy.income_account_types().size() == 2);
    REQUIRE(policy.income_account_types().count(AccountType::Savings) == 1);
    REQUIRE(policy.expense_account_types().size() == 2);
    REQUIRE(policy.expense_account_types().count(AccountType::Credit) == 1);
    REQUIRE(policy.income_categories().count("salary") == 1);

    SECTION("Absent keys leave accounts unrestricted") {
        REQUIRE_FALSE(parse_engine_config_from_string("{}").metrics.classification.restricts_accounts());
    }
}

TEST_CASE("Invalid configs are rejected", "[config_parser]") {
    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string("{ invalid json }"), ConfigParseError);
    }

    SECTION("Root must be an object") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string("[1, 2]"), ConfigParseError);
    }

    SECTION("Wrong value types") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"affordability": {"loan_term_years": "thirty"}})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"affordability": {"interest_rate": true}})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"affordability": {"interest_rate": "seven"}})"),
                          ConfigParseError);
    }

    SECTION("Out-of-range values") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"affordability": {"loan_term_years": 0}})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"affordability": {"front_end_dti": 1.5}})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"solver": {"tolerance": 0}})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"solver": {"max_iterations": -1}})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"metrics": {"window_months": 0}})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"affordability": {"interest_rate": 1e12}})"),
                          ConfigParseError);
    }

    SECTION("Unknown names") {
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"solver": {"method": "secant"}})"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"metrics": {"income_account_types": ["brokerage"]}})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_engine_config_from_string(R"({"logging": {"level": "TRACE"}})"), ConfigParseError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_engine_config_from_file("/nonexistent/housescope.json"), ConfigParseError);
    }
}

TEST_CASE("Config file with a relative log path", "[config_parser]") {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "housescope_config_test";
    std::filesystem::create_directories(dir);
    std::filesystem::path file = dir / "config.json";
    {
        std::ofstream out(file);
        out << R"({"logging": {"file": "logs/housescope.log", "level": "WARN"}})";
    }

    auto config = parse_engine_config_from_file(file.string());
    REQUIRE(config.logging.enable_file);
    REQUIRE(config.logging.min_level == LogLevel::WARN);
    REQUIRE(config.logging.log_file_path == (dir / "logs/housescope.log").string());

    std::filesystem::remove_all(dir);
}
