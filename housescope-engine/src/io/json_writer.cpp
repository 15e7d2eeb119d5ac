#include "json_writer.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace housescope {
namespace io {

const char* const NO_ACCOUNTS_MESSAGE = "No accounts found. Add accounts to see financial metrics.";

namespace {

double money(const Decimal& value) {
    return value.rounded(2).to_double();
}

double one_place(double value) {
    return Decimal::from_double(value).rounded(1).to_double();
}

// Category to amount
json breakdown_to_json(const std::vector<CategoryAmount>& breakdown) {
    json amounts = json::object();
    for (const auto& entry : breakdown) {
        amounts[entry.category] = money(entry.amount);
    }
    return amounts;
}

// Largest first, with each category's share of the total
json breakdown_detail_to_json(const std::vector<CategoryAmount>& breakdown) {
    json entries = json::array();
    for (const auto& entry : breakdown) {
        entries.push_back({
            {"category", entry.category},
            {"amount", money(entry.amount)},
            {"percentage", money(entry.percentage)}
        });
    }
    return entries;
}

void dump(std::ostream& os, const json& document, bool pretty_print) {
    os << document.dump(pretty_print ? 2 : -1) << "\n";
}

template <typename Value, typename Writer>
void write_file(const std::string& filepath, const Value& value, bool pretty_print, Writer writer) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    writer(file, value, pretty_print);
}

} // anonymous namespace

void write_dashboard_json(std::ostream& os, const FinancialMetrics& metrics, bool pretty_print) {
    json document;

    if (!metrics.has_accounts()) {
        document["net_worth"] = 0;
        document["assets"] = 0;
        document["liabilities"] = 0;
        document["monthly_income"] = 0;
        document["monthly_expenses"] = 0;
        document["savings_rate"] = 0;
        document["emergency_buffer_months"] = 0;
        document["dti_ratio"] = 0;
        document["message"] = NO_ACCOUNTS_MESSAGE;
        dump(os, document, pretty_print);
        return;
    }

    document["net_worth"] = money(metrics.net_worth);
    document["assets"] = money(metrics.assets);
    document["liabilities"] = money(metrics.liabilities);
    document["liquid_cash"] = money(metrics.liquid_cash);
    document["monthly_income"] = money(metrics.monthly_income);
    document["monthly_expenses"] = money(metrics.monthly_expenses);
    document["savings_rate"] = money(metrics.savings_rate);
    document["emergency_buffer_months"] = one_place(metrics.emergency_buffer_months);
    document["monthly_debt_service"] = money(metrics.monthly_debt_service);
    document["dti_ratio"] = money(metrics.dti_ratio);
    document["expense_breakdown"] = breakdown_to_json(metrics.expense_breakdown);
    document["income_breakdown"] = breakdown_to_json(metrics.income_breakdown);
    document["expense_breakdown_detail"] = breakdown_detail_to_json(metrics.expense_breakdown);
    document["income_breakdown_detail"] = breakdown_detail_to_json(metrics.income_breakdown);
    document["account_count"] = metrics.account_count;
    document["transaction_count"] = metrics.transaction_count;

    dump(os, document, pretty_print);
}

void write_dashboard_json(const std::string& filepath, const FinancialMetrics& metrics, bool pretty_print) {
    write_file(filepath, metrics, pretty_print,
               [](std::ostream& os, const FinancialMetrics& m, bool pretty) { write_dashboard_json(os, m, pretty); });
}

void write_affordability_json(std::ostream& os, const AffordabilityReport& report, bool pretty_print) {
    const PaymentBreakdown& payment = report.breakdown;

    json document;
    document["max_home_price"] = money(report.max_home_price);
    document["safe_home_price"] = money(report.cash_constrained_price);
    document["recommended_range"] = {
        {"min", money(report.safe_price_min)},
        {"max", money(report.safe_price_max)}
    };
    document["max_monthly_payment"] = money(report.max_monthly_payment);
    document["down_payment"] = {
        {"percent", money(report.terms.down_payment_fraction * Decimal(100))},
        {"amount", money(report.down_payment)}
    };
    document["loan"] = {
        {"amount", money(report.loan_amount)},
        {"interest_rate", report.terms.annual_rate.to_double()},
        {"term_years", report.terms.term_years}
    };
    document["monthly_payment"] = {
        {"total", money(payment.total)},
        {"principal_interest", money(payment.principal_interest)},
        {"property_tax", money(payment.property_tax)},
        {"insurance", money(payment.insurance)},
        {"pmi", money(payment.pmi)},
        {"hoa", money(payment.hoa)}
    };
    document["cash_requirements"] = {
        {"down_payment", money(report.down_payment)},
        {"closing_costs", money(report.closing_costs)},
        {"emergency_reserves", money(report.emergency_reserves)},
        {"total_needed", money(report.total_cash_needed)},
        {"available", money(report.available_cash)}
    };
    document["financial_health"] = {
        {"monthly_income", money(report.monthly_income)},
        {"monthly_expenses", money(report.monthly_expenses)},
        {"monthly_debt", money(report.monthly_debt)},
        {"housing_dti_ratio", money(report.housing_dti)},
        {"dti_ratio", money(report.household_dti)},
        {"emergency_buffer_months", one_place(report.emergency_buffer_months)}
    };
    document["solver"] = {
        {"iterations", report.solver.iterations},
        {"converged", report.solver.converged},
        {"residual", report.solver.residual.rounded(4).to_double()}
    };
    document["warnings"] = report.warnings;
    document["recommendations"] = report.recommendations;

    dump(os, document, pretty_print);
}

void write_affordability_json(const std::string& filepath, const AffordabilityReport& report, bool pretty_print) {
    write_file(filepath, report, pretty_print,
               [](std::ostream& os, const AffordabilityReport& r, bool pretty) { write_affordability_json(os, r, pretty); });
}

} // namespace io
} // namespace housescope
