#include "metrics_calculator.hpp"
#include <algorithm>
#include <map>

namespace housescope {

// ============================================================================
// Config / Result construction
// ============================================================================

MetricsConfig::MetricsConfig()
    : window_months(3),
      days_per_month(30),
      credit_payment_rate(Decimal::from_string("0.03")),
      loan_payment_rate(Decimal::from_string("0.01")),
      classification() {}

FinancialMetrics::FinancialMetrics()
    : emergency_buffer_months(0.0),
      account_count(0),
      transaction_count(0) {}

// ============================================================================
// Balance Metrics
// ============================================================================

AssetsLiabilities assets_and_liabilities(const std::vector<AccountSnapshot>& accounts) {
    AssetsLiabilities result;
    for (const auto& account : accounts) {
        if (is_asset(account.account_type)) {
            result.assets += account.balance;
        } else if (is_liability(account.account_type)) {
            result.liabilities += account.balance.abs();
        }
    }
    return result;
}

Decimal net_worth(const std::vector<AccountSnapshot>& accounts) {
    AssetsLiabilities totals = assets_and_liabilities(accounts);
    return totals.assets - totals.liabilities;
}

Decimal liquid_cash(const std::vector<AccountSnapshot>& accounts) {
    Decimal total;
    for (const auto& account : accounts) {
        if (is_liquid(account.account_type)) {
            total += account.balance;
        }
    }
    return total;
}

// ============================================================================
// Cash Flow Metrics
// ============================================================================

Decimal monthly_income(const std::vector<TransactionSnapshot>& transactions,
                       const Date& as_of,
                       int window_months,
                       const ClassificationPolicy& policy,
                       int days_per_month) {
    if (window_months <= 0) {
        return Decimal();
    }

    Decimal total;
    for (const auto& txn : transactions) {
        if (in_trailing_window(txn.date, as_of, window_months, days_per_month) && policy.is_income(txn)) {
            total += txn.amount;
        }
    }
    return total / Decimal(window_months);
}

Decimal monthly_expenses(const std::vector<TransactionSnapshot>& transactions,
                         const Date& as_of,
                         int window_months,
                         const ClassificationPolicy& policy,
                         int days_per_month) {
    if (window_months <= 0) {
        return Decimal();
    }

    Decimal total;
    for (const auto& txn : transactions) {
        if (in_trailing_window(txn.date, as_of, window_months, days_per_month) && policy.is_expense(txn)) {
            total += txn.amount.abs();
        }
    }
    return total / Decimal(window_months);
}

namespace {

std::map<uint64_t, AccountType> account_types_by_id(const std::vector<AccountSnapshot>& accounts) {
    std::map<uint64_t, AccountType> types;
    for (const auto& account : accounts) {
        types[account.id] = account.account_type;
    }
    return types;
}

AccountType lookup_type(const std::map<uint64_t, AccountType>& types, uint64_t account_id) {
    auto it = types.find(account_id);
    return it != types.end() ? it->second : AccountType::Other;
}

} // anonymous namespace

Decimal monthly_income(const std::vector<AccountSnapshot>& accounts,
                       const std::vector<TransactionSnapshot>& transactions,
                       const Date& as_of,
                       int window_months,
                       const ClassificationPolicy& policy,
                       int days_per_month) {
    if (window_months <= 0) {
        return Decimal();
    }

    auto types = account_types_by_id(accounts);
    Decimal total;
    for (const auto& txn : transactions) {
        if (in_trailing_window(txn.date, as_of, window_months, days_per_month) &&
            policy.is_income(txn, lookup_type(types, txn.account_id))) {
            total += txn.amount;
        }
    }
    return total / Decimal(window_months);
}

Decimal monthly_expenses(const std::vector<AccountSnapshot>& accounts,
                         const std::vector<TransactionSnapshot>& transactions,
                         const Date& as_of,
                         int window_months,
                         const ClassificationPolicy& policy,
                         int days_per_month) {
    if (window_months <= 0) {
        return Decimal();
    }

    auto types = account_types_by_id(accounts);
    Decimal total;
    for (const auto& txn : transactions) {
        if (in_trailing_window(txn.date, as_of, window_months, days_per_month) &&
            policy.is_expense(txn, lookup_type(types, txn.account_id))) {
            total += txn.amount.abs();
        }
    }
    return total / Decimal(window_months);
}

// ============================================================================
// Ratios
// ============================================================================

Decimal savings_rate(const Decimal& income, const Decimal& expenses) {
    if (income <= Decimal()) {
        return Decimal();
    }
    return (income - expenses) / income * Decimal(100);
}

double emergency_buffer_months(const Decimal& liquid, const Decimal& expenses) {
    if (expenses <= Decimal()) {
        return 0.0;
    }
    return (liquid / expenses).to_double();
}

Decimal estimated_monthly_debt_service(const std::vector<AccountSnapshot>& accounts,
                                       const MetricsConfig& config) {
    Decimal total;
    for (const auto& account : accounts) {
        if (account.account_type == AccountType::Credit) {
            total += account.balance.abs() * config.credit_payment_rate;
        } else if (account.account_type == AccountType::Loan) {
            total += account.balance.abs() * config.loan_payment_rate;
        }
    }
    return total;
}

Decimal dti_ratio(const std::vector<AccountSnapshot>& accounts,
                  const Decimal& income,
                  const MetricsConfig& config) {
    if (income <= Decimal()) {
        return Decimal();
    }
    return estimated_monthly_debt_service(accounts, config) / income * Decimal(100);
}

// ============================================================================
// Category Breakdown
// ============================================================================

namespace {

template <typename Filter>
std::vector<CategoryAmount> build_breakdown(const std::vector<TransactionSnapshot>& transactions,
                                            FlowDirection direction,
                                            Filter include) {
    std::map<std::string, Decimal> totals;
    Decimal grand_total;

    for (const auto& txn : transactions) {
        bool matches = direction == FlowDirection::Inflow ? txn.amount.is_positive()
                                                          : txn.amount.is_negative();
        if (!matches || !include(txn)) {
            continue;
        }
        Decimal magnitude = txn.amount.abs();
        totals[normalize_category(txn.category)] += magnitude;
        grand_total += magnitude;
    }

    std::vector<CategoryAmount> breakdown;
    if (grand_total.is_zero()) {
        return breakdown;
    }

    breakdown.reserve(totals.size());
    for (const auto& [category, amount] : totals) {
        CategoryAmount entry;
        entry.category = category;
        entry.amount = amount;
        entry.percentage = amount / grand_total * Decimal(100);
        breakdown.push_back(entry);
    }

    std::sort(breakdown.begin(), breakdown.end(), [](const CategoryAmount& a, const CategoryAmount& b) {
        if (a.amount != b.amount) {
            return a.amount > b.amount;
        }
        return a.category < b.category;
    });

    return breakdown;
}

} // anonymous namespace

std::vector<CategoryAmount> category_breakdown(const std::vector<TransactionSnapshot>& transactions,
                                               FlowDirection direction) {
    return build_breakdown(transactions, direction, [](const TransactionSnapshot&) { return true; });
}

std::vector<CategoryAmount> category_breakdown(const std::vector<TransactionSnapshot>& transactions,
                                               FlowDirection direction,
                                               const Date& as_of,
                                               int window_months,
                                               int days_per_month) {
    return build_breakdown(transactions, direction, [&](const TransactionSnapshot& txn) {
        return in_trailing_window(txn.date, as_of, window_months, days_per_month);
    });
}

// ============================================================================
// All Metrics
// ============================================================================

FinancialMetrics compute_metrics(const std::vector<AccountSnapshot>& accounts,
                                 const std::vector<TransactionSnapshot>& transactions,
                                 const Date& as_of,
                                 const MetricsConfig& config) {
    FinancialMetrics metrics;
    metrics.account_count = accounts.size();

    AssetsLiabilities totals = assets_and_liabilities(accounts);
    metrics.assets = totals.assets;
    metrics.liabilities = totals.liabilities;
    metrics.net_worth = totals.assets - totals.liabilities;
    metrics.liquid_cash = liquid_cash(accounts);

    metrics.monthly_income = monthly_income(accounts, transactions, as_of, config.window_months,
                                            config.classification, config.days_per_month);
    metrics.monthly_expenses = monthly_expenses(accounts, transactions, as_of, config.window_months,
                                                config.classification, config.days_per_month);

    metrics.savings_rate = savings_rate(metrics.monthly_income, metrics.monthly_expenses);
    metrics.emergency_buffer_months = emergency_buffer_months(metrics.liquid_cash, metrics.monthly_expenses);
    metrics.monthly_debt_service = estimated_monthly_debt_service(accounts, config);
    metrics.dti_ratio = dti_ratio(accounts, metrics.monthly_income, config);

    metrics.expense_breakdown = category_breakdown(transactions, FlowDirection::Outflow, as_of,
                                                   config.window_months, config.days_per_month);
    metrics.income_breakdown = category_breakdown(transactions, FlowDirection::Inflow, as_of,
                                                  config.window_months, config.days_per_month);

    metrics.transaction_count = static_cast<size_t>(std::count_if(
        transactions.begin(), transactions.end(), [&](const TransactionSnapshot& txn) {
            return in_trailing_window(txn.date, as_of, config.window_months, config.days_per_month);
        }));

    return metrics;
}

FinancialMetrics compute_metrics(const AccountSet& accounts,
                                 const TransactionSet& transactions,
                                 const Date& as_of,
                                 const MetricsConfig& config) {
    return compute_metrics(accounts.accounts(), transactions.transactions(), as_of, config);
}

} // namespace housescope
