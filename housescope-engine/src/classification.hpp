#ifndef HOUSESCOPE_CLASSIFICATION_HPP
#define HOUSESCOPE_CLASSIFICATION_HPP

#include "snapshot.hpp"
#include <functional>
#include <set>
#include <string>
#include <utility>

namespace housescope {

// Decides which transactions count as income and which as expenses.
//
// Default rule:
//   income  = amount > 0 and category in {salary, income, paycheck, deposit}
//   expense = amount < 0 and category not in {transfer, payment}
//
// The allow-list keeps transfers that arrive as positive amounts out of
// income; the exclusion list keeps internal transfers and debt payments
// from being counted twice as spending. Category matching is
// case-insensitive. Either rule can be replaced wholesale by a predicate.
//
// Optionally each direction can also be limited to the types of the
// account a transaction was posted to. An empty set means any account.
class ClassificationPolicy {
public:
    using Predicate = std::function<bool(const TransactionSnapshot&)>;

    ClassificationPolicy();
    ClassificationPolicy(std::set<std::string> income_categories,
                         std::set<std::string> excluded_expense_categories);

    static ClassificationPolicy standard();
    // Standard categories, income from checking/savings only and expenses
    // from checking/credit only
    static ClassificationPolicy account_restricted();

    bool is_income(const TransactionSnapshot& txn) const;
    bool is_expense(const TransactionSnapshot& txn) const;

    // Same, also checking the type of the account the transaction belongs to
    bool is_income(const TransactionSnapshot& txn, AccountType account_type) const;
    bool is_expense(const TransactionSnapshot& txn, AccountType account_type) const;

    void set_income_categories(const std::set<std::string>& categories);
    void set_excluded_expense_categories(const std::set<std::string>& categories);

    // Custom predicates take precedence over the category sets
    void set_income_predicate(Predicate predicate) { income_predicate_ = std::move(predicate); }
    void set_expense_predicate(Predicate predicate) { expense_predicate_ = std::move(predicate); }

    void set_income_account_types(const std::set<AccountType>& types) { income_account_types_ = types; }
    void set_expense_account_types(const std::set<AccountType>& types) { expense_account_types_ = types; }

    const std::set<std::string>& income_categories() const { return income_categories_; }
    const std::set<std::string>& excluded_expense_categories() const { return excluded_expense_categories_; }
    const std::set<AccountType>& income_account_types() const { return income_account_types_; }
    const std::set<AccountType>& expense_account_types() const { return expense_account_types_; }

    bool restricts_accounts() const {
        return !income_account_types_.empty() || !expense_account_types_.empty();
    }

private:
    std::set<std::string> income_categories_;
    std::set<std::string> excluded_expense_categories_;
    std::set<AccountType> income_account_types_;
    std::set<AccountType> expense_account_types_;
    Predicate income_predicate_;
    Predicate expense_predicate_;

    static std::set<std::string> normalized(const std::set<std::string>& categories);
};

} // namespace housescope

#endif // HOUSESCOPE_CLASSIFICATION_HPP
