#ifndef HOUSESCOPE_METRICS_CALCULATOR_HPP
#define HOUSESCOPE_METRICS_CALCULATOR_HPP

#include "classification.hpp"
#include "date.hpp"
#include "decimal.hpp"
#include "snapshot.hpp"
#include <string>
#include <vector>

namespace housescope {

// Configuration for metric derivation
struct MetricsConfig {
    int window_months;                  // Trailing window for income/expenses (default 3)
    int days_per_month;                 // Window month length in days (default 30)
    Decimal credit_payment_rate;        // Monthly minimum payment proxy for credit (default 0.03)
    Decimal loan_payment_rate;          // Monthly minimum payment proxy for loans (default 0.01)
    ClassificationPolicy classification;

    MetricsConfig();
};

struct AssetsLiabilities {
    Decimal assets;
    Decimal liabilities;
};

enum class FlowDirection {
    Inflow,    // amount > 0
    Outflow    // amount < 0, reported as magnitude
};

struct CategoryAmount {
    std::string category;
    Decimal amount;        // Magnitude, always >= 0
    Decimal percentage;    // Share of the direction total, 0-100, unrounded
};

// Everything the dashboard shows, at full precision
struct FinancialMetrics {
    Decimal net_worth;
    Decimal assets;
    Decimal liabilities;
    Decimal liquid_cash;
    Decimal monthly_income;
    Decimal monthly_expenses;
    Decimal savings_rate;               // Percentage
    double emergency_buffer_months;
    Decimal monthly_debt_service;       // Estimated from balances
    Decimal dti_ratio;                  // Percentage
    std::vector<CategoryAmount> expense_breakdown;
    std::vector<CategoryAmount> income_breakdown;
    size_t account_count;
    size_t transaction_count;           // Transactions inside the trailing window

    bool has_accounts() const { return account_count > 0; }

    FinancialMetrics();
};

// Assets: checking + savings + investment balances.
// Liabilities: abs(balance) of credit and loan accounts.
// Accounts of any other type are ignored.
AssetsLiabilities assets_and_liabilities(const std::vector<AccountSnapshot>& accounts);

Decimal net_worth(const std::vector<AccountSnapshot>& accounts);

// Checking + savings balances
Decimal liquid_cash(const std::vector<AccountSnapshot>& accounts);

// Average monthly income over the trailing window ending at as_of.
// Returns 0 when window_months <= 0.
Decimal monthly_income(const std::vector<TransactionSnapshot>& transactions,
                       const Date& as_of,
                       int window_months = 3,
                       const ClassificationPolicy& policy = ClassificationPolicy(),
                       int days_per_month = 30);

// Average monthly expenses (magnitudes) over the trailing window
Decimal monthly_expenses(const std::vector<TransactionSnapshot>& transactions,
                         const Date& as_of,
                         int window_months = 3,
                         const ClassificationPolicy& policy = ClassificationPolicy(),
                         int days_per_month = 30);

// Same, with each transaction's account type available to the policy.
// Transactions whose account is not in the list count as AccountType::Other.
Decimal monthly_income(const std::vector<AccountSnapshot>& accounts,
                       const std::vector<TransactionSnapshot>& transactions,
                       const Date& as_of,
                       int window_months = 3,
                       const ClassificationPolicy& policy = ClassificationPolicy(),
                       int days_per_month = 30);

Decimal monthly_expenses(const std::vector<AccountSnapshot>& accounts,
                         const std::vector<TransactionSnapshot>& transactions,
                         const Date& as_of,
                         int window_months = 3,
                         const ClassificationPolicy& policy = ClassificationPolicy(),
                         int days_per_month = 30);

// (income - expenses) / income * 100, or 0 when income <= 0
Decimal savings_rate(const Decimal& income, const Decimal& expenses);

// Months of expenses covered by liquid cash, or 0 when expenses <= 0
double emergency_buffer_months(const Decimal& liquid, const Decimal& expenses);

// Sum of credit_payment_rate * |credit balance| + loan_payment_rate * |loan balance|
Decimal estimated_monthly_debt_service(const std::vector<AccountSnapshot>& accounts,
                                       const MetricsConfig& config = MetricsConfig());

// Estimated debt service / income * 100, or 0 when income <= 0
Decimal dti_ratio(const std::vector<AccountSnapshot>& accounts,
                  const Decimal& income,
                  const MetricsConfig& config = MetricsConfig());

// Groups transactions of one direction by category, sorted by amount
// descending (ties by category name). Empty when the total is zero.
std::vector<CategoryAmount> category_breakdown(const std::vector<TransactionSnapshot>& transactions,
                                               FlowDirection direction);

// Same, restricted to the trailing window ending at as_of
std::vector<CategoryAmount> category_breakdown(const std::vector<TransactionSnapshot>& transactions,
                                               FlowDirection direction,
                                               const Date& as_of,
                                               int window_months,
                                               int days_per_month = 30);

// Computes all dashboard metrics from one snapshot
FinancialMetrics compute_metrics(const std::vector<AccountSnapshot>& accounts,
                                 const std::vector<TransactionSnapshot>& transactions,
                                 const Date& as_of,
                                 const MetricsConfig& config = MetricsConfig());

// Overload accepting snapshot sets for convenience
FinancialMetrics compute_metrics(const AccountSet& accounts,
                                 const TransactionSet& transactions,
                                 const Date& as_of,
                                 const MetricsConfig& config = MetricsConfig());

} // namespace housescope

#endif // HOUSESCOPE_METRICS_CALCULATOR_HPP
