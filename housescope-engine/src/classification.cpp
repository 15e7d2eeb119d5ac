#include "classification.hpp"

namespace housescope {

ClassificationPolicy::ClassificationPolicy()
    : income_categories_{"salary", "income", "paycheck", "deposit"},
      excluded_expense_categories_{"transfer", "payment"} {}

ClassificationPolicy::ClassificationPolicy(std::set<std::string> income_categories,
                                           std::set<std::string> excluded_expense_categories)
    : income_categories_(normalized(income_categories)),
      excluded_expense_categories_(normalized(excluded_expense_categories)) {}

ClassificationPolicy ClassificationPolicy::standard() {
    return ClassificationPolicy();
}

ClassificationPolicy ClassificationPolicy::account_restricted() {
    ClassificationPolicy policy;
    policy.set_income_account_types({AccountType::Checking, AccountType::Savings});
    policy.set_expense_account_types({AccountType::Checking, AccountType::Credit});
    return policy;
}

bool ClassificationPolicy::is_income(const TransactionSnapshot& txn) const {
    if (income_predicate_) {
        return income_predicate_(txn);
    }
    if (!txn.amount.is_positive()) {
        return false;
    }
    return income_categories_.count(normalize_category(txn.category)) > 0;
}

bool ClassificationPolicy::is_expense(const TransactionSnapshot& txn) const {
    if (expense_predicate_) {
        return expense_predicate_(txn);
    }
    if (!txn.amount.is_negative()) {
        return false;
    }
    return excluded_expense_categories_.count(normalize_category(txn.category)) == 0;
}

bool ClassificationPolicy::is_income(const TransactionSnapshot& txn, AccountType account_type) const {
    if (!income_account_types_.empty() && income_account_types_.count(account_type) == 0) {
        return false;
    }
    return is_income(txn);
}

bool ClassificationPolicy::is_expense(const TransactionSnapshot& txn, AccountType account_type) const {
    if (!expense_account_types_.empty() && expense_account_types_.count(account_type) == 0) {
        return false;
    }
    return is_expense(txn);
}

void ClassificationPolicy::set_income_categories(const std::set<std::string>& categories) {
    income_categories_ = normalized(categories);
}

void ClassificationPolicy::set_excluded_expense_categories(const std::set<std::string>& categories) {
    excluded_expense_categories_ = normalized(categories);
}

std::set<std::string> ClassificationPolicy::normalized(const std::set<std::string>& categories) {
    std::set<std::string> result;
    for (const auto& category : categories) {
        result.insert(normalize_category(category));
    }
    return result;
}

} // namespace housescope
