#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace housescope {

namespace {

// Numbers are taken as doubles; strings go through the exact decimal parser
// after environment expansion, so "0.0675" stays exact.
bool read_decimal(const json& section, const char* key, Decimal& target) {
    if (!section.contains(key)) {
        return false;
    }
    const json& value = section[key];
    try {
        if (value.is_string()) {
            target = Decimal::from_string(expand_environment_variables(value.get<std::string>()));
        } else if (value.is_number()) {
            target = Decimal::from_double(value.get<double>());
        } else {
            throw ConfigParseError(std::string("Field '") + key + "' must be a number");
        }
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(std::string("Invalid value for '") + key + "': " + e.what());
    } catch (const std::overflow_error& e) {
        throw ConfigParseError(std::string("Value out of range for '") + key + "': " + e.what());
    }
    return true;
}

bool read_int(const json& section, const char* key, int& target) {
    if (!section.contains(key)) {
        return false;
    }
    target = section[key].get<int>();
    return true;
}

std::set<std::string> read_categories(const json& section, const char* key) {
    std::set<std::string> categories;
    for (const auto& entry : section[key]) {
        categories.insert(expand_environment_variables(entry.get<std::string>()));
    }
    return categories;
}

std::set<AccountType> read_account_types(const json& section, const char* key) {
    std::set<AccountType> types;
    for (const auto& entry : section[key]) {
        std::string name = entry.get<std::string>();
        AccountType type = parse_account_type(name);
        if (type == AccountType::Other) {
            throw ConfigParseError(std::string("Unknown account type in '") + key + "': " + name);
        }
        types.insert(type);
    }
    return types;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigParseError(message);
    }
}

void parse_affordability(const json& j, AffordabilityDefaults& defaults) {
    read_decimal(j, "interest_rate", defaults.interest_rate);
    read_int(j, "loan_term_years", defaults.loan_term_years);
    read_decimal(j, "property_tax_rate", defaults.property_tax_rate);
    read_decimal(j, "insurance_rate", defaults.insurance_rate);
    read_decimal(j, "pmi_rate", defaults.pmi_rate);
    read_decimal(j, "front_end_dti", defaults.front_end_dti);
    read_decimal(j, "pmi_threshold", defaults.pmi_threshold);
    read_decimal(j, "dti_warning_percent", defaults.dti_warning_percent);
    if (j.contains("emergency_target_months")) {
        defaults.emergency_target_months = j["emergency_target_months"].get<double>();
    }
    read_int(j, "reserve_months", defaults.reserve_months);
    read_decimal(j, "closing_cost_rate", defaults.closing_cost_rate);
    read_decimal(j, "safe_range_floor", defaults.safe_range_floor);

    require(defaults.loan_term_years > 0, "affordability.loan_term_years must be positive");
    require(!defaults.interest_rate.is_negative(), "affordability.interest_rate must not be negative");
    require(!defaults.property_tax_rate.is_negative(), "affordability.property_tax_rate must not be negative");
    require(!defaults.insurance_rate.is_negative(), "affordability.insurance_rate must not be negative");
    require(!defaults.pmi_rate.is_negative(), "affordability.pmi_rate must not be negative");
    require(defaults.front_end_dti.is_positive() && defaults.front_end_dti <= Decimal(1),
            "affordability.front_end_dti must be in (0, 1]");
    require(defaults.reserve_months >= 0, "affordability.reserve_months must not be negative");
    require(!defaults.closing_cost_rate.is_negative(), "affordability.closing_cost_rate must not be negative");
}

void parse_solver(const json& j, SolverOptions& solver) {
    if (j.contains("method")) {
        try {
            SolverMethod method = parse_solver_method(j["method"].get<std::string>());
            // Start from the method's own preset, then apply explicit overrides
            switch (method) {
                case SolverMethod::FixedPoint: solver = SolverOptions::fixed_point(); break;
                case SolverMethod::Newton: solver = SolverOptions::newton(); break;
                case SolverMethod::Bisection: solver = SolverOptions::bisection(); break;
            }
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError(std::string("solver.method: ") + e.what());
        }
    }
    read_decimal(j, "tolerance", solver.tolerance);
    read_int(j, "max_iterations", solver.max_iterations);
    read_decimal(j, "gain", solver.gain);
    read_decimal(j, "seed_multiplier", solver.seed_multiplier);

    require(solver.tolerance.is_positive(), "solver.tolerance must be positive");
    require(solver.max_iterations > 0, "solver.max_iterations must be positive");
}

void parse_metrics(const json& j, MetricsConfig& metrics) {
    read_int(j, "window_months", metrics.window_months);
    read_int(j, "days_per_month", metrics.days_per_month);
    read_decimal(j, "credit_payment_rate", metrics.credit_payment_rate);
    read_decimal(j, "loan_payment_rate", metrics.loan_payment_rate);
    if (j.contains("income_categories")) {
        metrics.classification.set_income_categories(read_categories(j, "income_categories"));
    }
    if (j.contains("excluded_expense_categories")) {
        metrics.classification.set_excluded_expense_categories(read_categories(j, "excluded_expense_categories"));
    }
    if (j.contains("income_account_types")) {
        metrics.classification.set_income_account_types(read_account_types(j, "income_account_types"));
    }
    if (j.contains("expense_account_types")) {
        metrics.classification.set_expense_account_types(read_account_types(j, "expense_account_types"));
    }

    require(metrics.window_months > 0, "metrics.window_months must be positive");
    require(metrics.days_per_month > 0, "metrics.days_per_month must be positive");
}

void parse_logging(const json& j, LoggerConfig& logging) {
    if (j.contains("level")) {
        std::string level = j["level"].get<std::string>();
        require(level == "DEBUG" || level == "INFO" || level == "WARN" || level == "ERROR",
                "logging.level must be one of DEBUG, INFO, WARN, ERROR");
        logging.min_level = string_to_level(level);
    }
    if (j.contains("console")) {
        logging.enable_console = j["console"].get<bool>();
    }
    if (j.contains("json")) {
        logging.enable_json = j["json"].get<bool>();
    }
    if (j.contains("file")) {
        logging.log_file_path = expand_environment_variables(j["file"].get<std::string>());
        logging.enable_file = !logging.log_file_path.empty();
    }
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Names start with a letter or underscore
        size_t name_start = pos;
        if (pos < result.size() &&
            (std::isalpha(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            while (pos < result.size() &&
                   (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
                pos++;
            }
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated reference; leave the text as written
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
        }

        if (var_name.empty()) {
            // A lone '$' (e.g. "$5") is literal text
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    try {
        json j = json::parse(json_string);
        require(j.is_object(), "Configuration must be a JSON object");

        if (j.contains("affordability")) {
            parse_affordability(j["affordability"], config.defaults);
        }
        if (j.contains("solver")) {
            parse_solver(j["solver"], config.solver);
        }
        if (j.contains("metrics")) {
            parse_metrics(j["metrics"], config.metrics);
        }
        if (j.contains("logging")) {
            parse_logging(j["logging"], config.logging);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    EngineConfig config = parse_engine_config_from_string(buffer.str());

    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace housescope
