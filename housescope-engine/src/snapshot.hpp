#ifndef HOUSESCOPE_SNAPSHOT_HPP
#define HOUSESCOPE_SNAPSHOT_HPP

#include "date.hpp"
#include "decimal.hpp"
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace housescope {

enum class AccountType : uint8_t {
    Checking = 0,
    Savings = 1,
    Investment = 2,
    Credit = 3,
    Loan = 4,
    Other = 255   // Unrecognized; neither asset nor liability
};

// Case-insensitive; unknown names map to AccountType::Other
AccountType parse_account_type(const std::string& name);
std::string account_type_to_string(AccountType type);

bool is_asset(AccountType type);
bool is_liability(AccountType type);
bool is_liquid(AccountType type);

// Read-only view of one account at snapshot time.
// Credit and loan balances may be stored negative; they are read as abs(balance).
struct AccountSnapshot {
    uint64_t id;
    AccountType account_type;
    Decimal balance;
    std::optional<Decimal> credit_limit;

    AccountSnapshot();
    AccountSnapshot(uint64_t account_id, AccountType type, const Decimal& bal);

    bool operator==(const AccountSnapshot& other) const;
};

// Positive amount = inflow, negative = outflow.
// Category is stored lower-case; empty categories become "uncategorized".
struct TransactionSnapshot {
    uint64_t id;
    uint64_t account_id;
    Date date;
    Decimal amount;
    std::string category;

    TransactionSnapshot();
    TransactionSnapshot(uint64_t txn_id, uint64_t acct_id, const Date& d,
                        const Decimal& amt, const std::string& cat);

    bool operator==(const TransactionSnapshot& other) const;
};

std::string normalize_category(const std::string& category);

// Recurring debt serviced outside the tracked accounts (e.g. student loans)
struct FinancialProfile {
    Decimal monthly_debt_payment;

    FinancialProfile();

    // {"monthly_debt_payment": 450.00}; a missing key means zero
    static FinancialProfile load_from_json(const std::string& filepath);
    static FinancialProfile parse_json(const std::string& json_text);
};

class AccountSet {
public:
    void add(const AccountSnapshot& account);

    const AccountSnapshot& get(size_t index) const;
    size_t size() const { return accounts_.size(); }
    bool empty() const { return accounts_.empty(); }

    const std::vector<AccountSnapshot>& accounts() const { return accounts_; }

    // Columns: id,account_type,balance[,credit_limit]
    static AccountSet load_from_csv(const std::string& filepath);
    static AccountSet load_from_csv(std::istream& is);

    static AccountSet load_from_parquet(const std::string& filepath);

private:
    std::vector<AccountSnapshot> accounts_;
};

class TransactionSet {
public:
    void add(const TransactionSnapshot& txn);
    void add(TransactionSnapshot&& txn);

    const TransactionSnapshot& get(size_t index) const;
    size_t size() const { return transactions_.size(); }
    bool empty() const { return transactions_.empty(); }
    void reserve(size_t count) { transactions_.reserve(count); }

    const std::vector<TransactionSnapshot>& transactions() const { return transactions_; }

    // Columns: id,account_id,date,amount,category
    static TransactionSet load_from_csv(const std::string& filepath);
    static TransactionSet load_from_csv(std::istream& is);

    static TransactionSet load_from_parquet(const std::string& filepath);

private:
    std::vector<TransactionSnapshot> transactions_;
};

} // namespace housescope

#endif // HOUSESCOPE_SNAPSHOT_HPP
