/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace housescope {

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
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_config_loaded(const std::string& path, const std::string& solver_method) {
    std::map<std::string, std::string> fields;
    fields["event"] = "config_loaded";
    fields["config_path"] = path.empty() ? "<defaults>" : path;
    fields["solver_method"] = solver_method;

    log(LogLevel::INFO, "Configuration loaded", fields);
}

void Logger::log_snapshot_loaded(const std::string& kind, const std::string& path, size_t rows) {
    std::map<std::string, std::string> fields;
    fields["event"] = "snapshot_loaded";
    fields["kind"] = kind;
    fields["path"] = path;
    fields["rows_loaded"] = std::to_string(rows);

    log(LogLevel::INFO, "Loaded " + kind, fields);
}

void Logger::log_metrics_computed(const FinancialMetrics& metrics, const std::string& as_of) {
    std::map<std::string, std::string> fields;
    fields["event"] = "metrics_computed";
    fields["as_of"] = as_of;
    fields["account_count"] = std::to_string(metrics.account_count);
    fields["transaction_count"] = std::to_string(metrics.transaction_count);
    fields["net_worth"] = metrics.net_worth.to_string(2);
    fields["monthly_income"] = metrics.monthly_income.to_string(2);
    fields["monthly_expenses"] = metrics.monthly_expenses.to_string(2);
    fields["dti_ratio"] = metrics.dti_ratio.to_string(2);

    log(LogLevel::INFO, "Metrics computed", fields);

    for (const auto& entry : metrics.expense_breakdown) {
        std::map<std::string, std::string> detail;
        detail["event"] = "category_total";
        detail["category"] = entry.category;
        detail["amount"] = entry.amount.to_string(2);
        detail["percentage"] = entry.percentage.to_string(2);
        log(LogLevel::DEBUG, "Expense category", detail);
    }
}

void Logger::log_solver_result(const SolverOptions& options, const SolverResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "solver_result";
    fields["method"] = solver_method_to_string(options.method);
    fields["iterations"] = std::to_string(result.iterations);
    fields["converged"] = result.converged ? "true" : "false";
    fields["price"] = result.price.to_string(2);
    fields["residual"] = result.residual.to_string(4);
    fields["tolerance"] = options.tolerance.to_string(2);

    if (result.converged) {
        log(LogLevel::INFO, "Price search converged", fields);
    } else {
        log(LogLevel::WARN, "Price search stopped before reaching tolerance", fields);
    }
}

void Logger::log_affordability_warning(const std::string& warning) {
    std::map<std::string, std::string> fields;
    fields["event"] = "affordability_warning";
    fields["warning"] = warning;

    log(LogLevel::WARN, warning, fields);
}

void Logger::log_error(const std::string& error_message, const std::string& phase) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["error_message"] = error_message;
    if (!phase.empty()) {
        fields["phase"] = phase;
    }

    log(LogLevel::ERROR, error_message, fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
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
    nlohmann::json line(fields);
    return line.dump();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace housescope
