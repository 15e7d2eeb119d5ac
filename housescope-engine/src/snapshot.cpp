#include "snapshot.hpp"
#include "io/csv_reader.hpp"
#include "io/parquet_reader.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace housescope {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

uint64_t parse_id(const std::string& text, const std::string& field, size_t line) {
    try {
        size_t consumed = 0;
        uint64_t value = std::stoull(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + field + " '" + text + "' on line " + std::to_string(line));
    }
}

Decimal parse_amount(const std::string& text, const std::string& field, size_t line) {
    try {
        return Decimal::from_string(text);
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid " + field + " on line " + std::to_string(line) + ": " + e.what());
    }
}

} // anonymous namespace

// ============================================================================
// AccountType
// ============================================================================

AccountType parse_account_type(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "checking") return AccountType::Checking;
    if (lower == "savings") return AccountType::Savings;
    if (lower == "investment") return AccountType::Investment;
    if (lower == "credit") return AccountType::Credit;
    if (lower == "loan") return AccountType::Loan;
    return AccountType::Other;
}

std::string account_type_to_string(AccountType type) {
    switch (type) {
        case AccountType::Checking: return "checking";
        case AccountType::Savings: return "savings";
        case AccountType::Investment: return "investment";
        case AccountType::Credit: return "credit";
        case AccountType::Loan: return "loan";
        default: return "other";
    }
}

bool is_asset(AccountType type) {
    return type == AccountType::Checking ||
           type == AccountType::Savings ||
           type == AccountType::Investment;
}

bool is_liability(AccountType type) {
    return type == AccountType::Credit || type == AccountType::Loan;
}

bool is_liquid(AccountType type) {
    return type == AccountType::Checking || type == AccountType::Savings;
}

// ============================================================================
// AccountSnapshot / TransactionSnapshot
// ============================================================================

AccountSnapshot::AccountSnapshot()
    : id(0), account_type(AccountType::Other), balance() {}

AccountSnapshot::AccountSnapshot(uint64_t account_id, AccountType type, const Decimal& bal)
    : id(account_id), account_type(type), balance(bal) {}

bool AccountSnapshot::operator==(const AccountSnapshot& other) const {
    return id == other.id &&
           account_type == other.account_type &&
           balance == other.balance &&
           credit_limit == other.credit_limit;
}

TransactionSnapshot::TransactionSnapshot()
    : id(0), account_id(0), date(), amount(), category("uncategorized") {}

TransactionSnapshot::TransactionSnapshot(uint64_t txn_id, uint64_t acct_id, const Date& d,
                                         const Decimal& amt, const std::string& cat)
    : id(txn_id), account_id(acct_id), date(d), amount(amt), category(normalize_category(cat)) {}

bool TransactionSnapshot::operator==(const TransactionSnapshot& other) const {
    return id == other.id &&
           account_id == other.account_id &&
           date == other.date &&
           amount == other.amount &&
           category == other.category;
}

std::string normalize_category(const std::string& category) {
    auto start = std::find_if_not(category.begin(), category.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(category.rbegin(), category.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();
    std::string trimmed = (start < end) ? std::string(start, end) : std::string();
    if (trimmed.empty()) {
        return "uncategorized";
    }
    return to_lower(trimmed);
}

// ============================================================================
// FinancialProfile
// ============================================================================

FinancialProfile::FinancialProfile() : monthly_debt_payment() {}

FinancialProfile FinancialProfile::parse_json(const std::string& json_text) {
    FinancialProfile profile;
    try {
        json j = json::parse(json_text);
        if (j.contains("monthly_debt_payment") && !j["monthly_debt_payment"].is_null()) {
            const auto& value = j["monthly_debt_payment"];
            profile.monthly_debt_payment = value.is_string()
                ? Decimal::from_string(value.get<std::string>())
                : Decimal::from_double(value.get<double>());
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse financial profile: " + std::string(e.what()));
    }
    return profile;
}

FinancialProfile FinancialProfile::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open profile file: " + filepath);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_json(buffer.str());
}

// ============================================================================
// AccountSet
// ============================================================================

void AccountSet::add(const AccountSnapshot& account) {
    accounts_.push_back(account);
}

const AccountSnapshot& AccountSet::get(size_t index) const {
    if (index >= accounts_.size()) {
        throw std::out_of_range("Account index out of range");
    }
    return accounts_[index];
}

AccountSet AccountSet::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

AccountSet AccountSet::load_from_csv(std::istream& is) {
    AccountSet set;
    io::CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return set;
    }

    size_t line = 1;
    while (reader.has_more()) {
        auto row = reader.read_row();
        ++line;
        if (row.empty() || (row.size() == 1 && row[0].empty())) {
            continue;
        }
        if (row.size() < 3) {
            throw std::runtime_error("Accounts CSV requires columns: id,account_type,balance (line " +
                                     std::to_string(line) + ")");
        }

        AccountSnapshot account(parse_id(row[0], "account id", line),
                                parse_account_type(row[1]),
                                parse_amount(row[2], "balance", line));
        if (row.size() > 3 && !row[3].empty()) {
            account.credit_limit = parse_amount(row[3], "credit_limit", line);
        }
        set.add(account);
    }

    return set;
}

AccountSet AccountSet::load_from_parquet(const std::string& filepath) {
    return io::ParquetReader::load_accounts(filepath);
}

// ============================================================================
// TransactionSet
// ============================================================================

void TransactionSet::add(const TransactionSnapshot& txn) {
    transactions_.push_back(txn);
}

void TransactionSet::add(TransactionSnapshot&& txn) {
    transactions_.push_back(std::move(txn));
}

const TransactionSnapshot& TransactionSet::get(size_t index) const {
    if (index >= transactions_.size()) {
        throw std::out_of_range("Transaction index out of range");
    }
    return transactions_[index];
}

TransactionSet TransactionSet::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

TransactionSet TransactionSet::load_from_csv(std::istream& is) {
    TransactionSet set;
    io::CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return set;
    }

    size_t line = 1;
    while (reader.has_more()) {
        auto row = reader.read_row();
        ++line;
        if (row.empty() || (row.size() == 1 && row[0].empty())) {
            continue;
        }
        if (row.size() < 4) {
            throw std::runtime_error("Transactions CSV requires columns: id,account_id,date,amount,category (line " +
                                     std::to_string(line) + ")");
        }

        Date date;
        try {
            date = Date::from_string(row[2]);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("Invalid date on line " + std::to_string(line) + ": " + e.what());
        }

        set.add(TransactionSnapshot(parse_id(row[0], "transaction id", line),
                                    parse_id(row[1], "account id", line),
                                    date,
                                    parse_amount(row[3], "amount", line),
                                    row.size() > 4 ? row[4] : std::string()));
    }

    return set;
}

TransactionSet TransactionSet::load_from_parquet(const std::string& filepath) {
    return io::ParquetReader::load_transactions(filepath);
}

} // namespace housescope
