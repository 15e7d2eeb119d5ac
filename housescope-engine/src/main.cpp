#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "affordability_engine.hpp"
#include "config_parser.hpp"
#include "date.hpp"
#include "logger.hpp"
#include "metrics_calculator.hpp"
#include "snapshot.hpp"
#include "io/json_writer.hpp"

namespace {

struct CLIArgs {
    std::string accounts_path;
    std::string transactions_path;
    std::string profile_path;
    std::string config_path;
    std::string as_of;
    std::string mode = "dashboard";
    std::string output_path;
    std::string solver;
    bool help = false;
    // Affordability request; percentages as typed on the command line
    std::string down_payment_percent = "20";
    std::optional<std::string> interest_rate_percent;
    std::optional<int> loan_term_years;
    std::optional<std::string> property_tax_percent;
    std::optional<std::string> insurance_percent;
    std::optional<std::string> monthly_debt;
    std::string hoa_monthly = "0";
};

void print_usage(const char* program_name) {
    std::cerr << "HouseScope Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Snapshot options:\n";
    std::cerr << "  --accounts <path>           CSV or Parquet file with account balances (required)\n";
    std::cerr << "  --transactions <path>       CSV or Parquet file with transactions\n";
    std::cerr << "  --profile <path>            JSON financial profile (monthly_debt_payment)\n";
    std::cerr << "  --as-of <YYYY-MM-DD>        End of the trailing window (default: today)\n\n";
    std::cerr << "Run options:\n";
    std::cerr << "  --mode <name>               dashboard or affordability (default: dashboard)\n";
    std::cerr << "  --config <path>             JSON engine configuration\n";
    std::cerr << "  --solver <name>             fixed-point, bisection or newton (default: bisection)\n\n";
    std::cerr << "Affordability options:\n";
    std::cerr << "  --down-payment <pct>        Down payment percent of price (default: 20)\n";
    std::cerr << "  --interest-rate <pct>       Annual interest rate percent (default: 7)\n";
    std::cerr << "  --term <years>              Loan term in years (default: 30)\n";
    std::cerr << "  --property-tax-rate <pct>   Annual property tax percent (default: 1.2)\n";
    std::cerr << "  --insurance-rate <pct>      Annual insurance percent (default: 0.5)\n";
    std::cerr << "  --monthly-debt <amount>     Monthly debt payments (default: from --profile, else 0)\n";
    std::cerr << "  --hoa <amount>              Monthly HOA fee (default: 0)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Dashboard:\n";
    std::cerr << "     " << program_name << " --accounts data/accounts.csv \\\n";
    std::cerr << "         --transactions data/transactions.csv --as-of 2024-03-31\n\n";
    std::cerr << "  2. Affordability with 10% down at 6.5%:\n";
    std::cerr << "     " << program_name << " --mode affordability --accounts data/accounts.csv \\\n";
    std::cerr << "         --transactions data/transactions.csv --profile data/profile.json \\\n";
    std::cerr << "         --down-payment 10 --interest-rate 6.5 --output report.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (str.length() < suffix.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--accounts" && i + 1 < argc) {
            args.accounts_path = argv[++i];
        } else if (arg == "--transactions" && i + 1 < argc) {
            args.transactions_path = argv[++i];
        } else if (arg == "--profile" && i + 1 < argc) {
            args.profile_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--as-of" && i + 1 < argc) {
            args.as_of = argv[++i];
        } else if (arg == "--mode" && i + 1 < argc) {
            args.mode = argv[++i];
        } else if (arg == "--solver" && i + 1 < argc) {
            args.solver = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--down-payment" && i + 1 < argc) {
            args.down_payment_percent = argv[++i];
        } else if (arg == "--interest-rate" && i + 1 < argc) {
            args.interest_rate_percent = argv[++i];
        } else if (arg == "--term" && i + 1 < argc) {
            try {
                args.loan_term_years = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --term must be a whole number of years\n\n";
                return false;
            }
        } else if (arg == "--property-tax-rate" && i + 1 < argc) {
            args.property_tax_percent = argv[++i];
        } else if (arg == "--insurance-rate" && i + 1 < argc) {
            args.insurance_percent = argv[++i];
        } else if (arg == "--monthly-debt" && i + 1 < argc) {
            args.monthly_debt = argv[++i];
        } else if (arg == "--hoa" && i + 1 < argc) {
            args.hoa_monthly = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.accounts_path.empty()) {
        std::cerr << "Error: --accounts is required\n";
        valid = false;
    } else if (!file_exists(args.accounts_path)) {
        std::cerr << "Error: Accounts file not found: " << args.accounts_path << "\n";
        valid = false;
    }

    if (!args.transactions_path.empty() && !file_exists(args.transactions_path)) {
        std::cerr << "Error: Transactions file not found: " << args.transactions_path << "\n";
        valid = false;
    }

    if (!args.profile_path.empty() && !file_exists(args.profile_path)) {
        std::cerr << "Error: Profile file not found: " << args.profile_path << "\n";
        valid = false;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.mode != "dashboard" && args.mode != "affordability") {
        std::cerr << "Error: --mode must be dashboard or affordability\n";
        valid = false;
    }

    return valid;
}

// "6.5" -> 0.065
housescope::Decimal percent_to_fraction(const std::string& text, const std::string& option) {
    try {
        return housescope::Decimal::from_string(text) / housescope::Decimal(100);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument(option + " must be a number, got '" + text + "'");
    }
}

housescope::Decimal parse_amount(const std::string& text, const std::string& option) {
    try {
        return housescope::Decimal::from_string(text);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument(option + " must be a number, got '" + text + "'");
    }
}

housescope::Date today() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);
    return housescope::Date(tm_buf.tm_year + 1900, static_cast<unsigned>(tm_buf.tm_mon + 1),
                            static_cast<unsigned>(tm_buf.tm_mday));
}

housescope::AccountSet load_accounts(const std::string& path) {
    if (ends_with(path, ".parquet")) {
        return housescope::AccountSet::load_from_parquet(path);
    }
    return housescope::AccountSet::load_from_csv(path);
}

housescope::TransactionSet load_transactions(const std::string& path) {
    if (ends_with(path, ".parquet")) {
        return housescope::TransactionSet::load_from_parquet(path);
    }
    return housescope::TransactionSet::load_from_csv(path);
}

housescope::AffordabilityInput build_affordability_input(const CLIArgs& args,
                                                         const housescope::FinancialMetrics& metrics,
                                                         const housescope::FinancialProfile* profile) {
    housescope::AffordabilityInput input;
    input.monthly_income = metrics.monthly_income;
    input.down_payment_fraction = percent_to_fraction(args.down_payment_percent, "--down-payment");
    if (args.interest_rate_percent) {
        input.interest_rate = percent_to_fraction(*args.interest_rate_percent, "--interest-rate");
    }
    input.loan_term_years = args.loan_term_years;
    if (args.property_tax_percent) {
        input.property_tax_rate = percent_to_fraction(*args.property_tax_percent, "--property-tax-rate");
    }
    if (args.insurance_percent) {
        input.insurance_rate = percent_to_fraction(*args.insurance_percent, "--insurance-rate");
    }
    input.hoa_monthly = parse_amount(args.hoa_monthly, "--hoa");
    if (args.monthly_debt) {
        input.monthly_debt_payments = parse_amount(*args.monthly_debt, "--monthly-debt");
    }
    input.monthly_debt_payments = housescope::resolve_monthly_debt(input, profile);
    return input;
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

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    housescope::Logger& logger = housescope::Logger::get_instance();

    try {
        housescope::EngineConfig config;
        if (!args.config_path.empty()) {
            config = housescope::parse_engine_config_from_file(args.config_path);
        }
        if (!args.solver.empty()) {
            housescope::SolverMethod method = housescope::parse_solver_method(args.solver);
            if (method != config.solver.method) {
                switch (method) {
                    case housescope::SolverMethod::FixedPoint:
                        config.solver = housescope::SolverOptions::fixed_point();
                        break;
                    case housescope::SolverMethod::Newton:
                        config.solver = housescope::SolverOptions::newton();
                        break;
                    case housescope::SolverMethod::Bisection:
                        config.solver = housescope::SolverOptions::bisection();
                        break;
                }
            }
        }
        logger.configure(config.logging);
        logger.log_config_loaded(args.config_path, housescope::solver_method_to_string(config.solver.method));

        housescope::Date as_of = args.as_of.empty() ? today() : housescope::Date::from_string(args.as_of);

        housescope::AccountSet accounts = load_accounts(args.accounts_path);
        logger.log_snapshot_loaded("accounts", args.accounts_path, accounts.size());

        housescope::TransactionSet transactions;
        if (!args.transactions_path.empty()) {
            transactions = load_transactions(args.transactions_path);
            logger.log_snapshot_loaded("transactions", args.transactions_path, transactions.size());
        }

        std::unique_ptr<housescope::FinancialProfile> profile;
        if (!args.profile_path.empty()) {
            profile = std::make_unique<housescope::FinancialProfile>(
                housescope::FinancialProfile::load_from_json(args.profile_path));
            logger.log_snapshot_loaded("profile", args.profile_path, 1);
        }

        housescope::FinancialMetrics metrics =
            housescope::compute_metrics(accounts, transactions, as_of, config.metrics);
        logger.log_metrics_computed(metrics, as_of.to_string());

        if (args.mode == "dashboard") {
            if (args.output_path.empty()) {
                housescope::io::write_dashboard_json(std::cout, metrics);
            } else {
                housescope::io::write_dashboard_json(args.output_path, metrics);
                std::cerr << "Output written to: " << args.output_path << "\n";
            }
            logger.flush();
            return 0;
        }

        if (!metrics.has_accounts()) {
            throw std::runtime_error("No accounts found. Add accounts to calculate affordability.");
        }

        housescope::AffordabilityInput input = build_affordability_input(args, metrics, profile.get());
        housescope::AffordabilityReport report = housescope::analyze_affordability(
            input, housescope::HouseholdPosition::from_metrics(metrics), config.defaults, config.solver);

        logger.log_solver_result(config.solver, report.solver);
        for (const auto& warning : report.warnings) {
            logger.log_affordability_warning(warning);
        }

        if (args.output_path.empty()) {
            housescope::io::write_affordability_json(std::cout, report);
        } else {
            housescope::io::write_affordability_json(args.output_path, report);
            std::cerr << "Output written to: " << args.output_path << "\n";
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        logger.log_error(e.what(), args.mode);
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
