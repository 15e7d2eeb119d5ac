#include "parquet_reader.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

namespace housescope {
namespace io {

#ifdef HAVE_ARROW

namespace {

std::shared_ptr<arrow::Table> read_table(const std::string& filepath) {
    auto infile_result = arrow::io::ReadableFile::Open(filepath, arrow::default_memory_pool());
    if (!infile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + filepath + " - " +
                                 infile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::ReadableFile> infile = *infile_result;

    std::unique_ptr<parquet::arrow::FileReader> arrow_reader;
    auto status = parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &arrow_reader);
    if (!status.ok()) {
        throw std::runtime_error("Cannot create Parquet reader: " + status.ToString());
    }

    std::shared_ptr<arrow::Table> table;
    status = arrow_reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Cannot read Parquet table: " + status.ToString());
    }

    // One chunk per column so rows can be addressed directly
    auto combined = table->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        throw std::runtime_error("Cannot combine Parquet chunks: " + combined.status().ToString());
    }
    return *combined;
}

std::shared_ptr<arrow::Array> require_column(const std::shared_ptr<arrow::Table>& table,
                                             const std::string& name) {
    int idx = table->schema()->GetFieldIndex(name);
    if (idx < 0) {
        throw std::runtime_error("Parquet file missing required column: " + name);
    }
    return table->column(idx)->chunk(0);
}

std::shared_ptr<arrow::Array> optional_column(const std::shared_ptr<arrow::Table>& table,
                                              const std::string& name) {
    int idx = table->schema()->GetFieldIndex(name);
    if (idx < 0) {
        return nullptr;
    }
    return table->column(idx)->chunk(0);
}

uint64_t id_value(const std::shared_ptr<arrow::Array>& column, int64_t row) {
    switch (column->type_id()) {
        case arrow::Type::UINT64:
            return std::static_pointer_cast<arrow::UInt64Array>(column)->Value(row);
        case arrow::Type::INT64:
            return static_cast<uint64_t>(std::static_pointer_cast<arrow::Int64Array>(column)->Value(row));
        case arrow::Type::INT32:
            return static_cast<uint64_t>(std::static_pointer_cast<arrow::Int32Array>(column)->Value(row));
        default:
            throw std::runtime_error("Unsupported id column type: " + column->type()->ToString());
    }
}

Decimal decimal_value(const std::shared_ptr<arrow::Array>& column, int64_t row) {
    switch (column->type_id()) {
        case arrow::Type::STRING:
            return Decimal::from_string(std::static_pointer_cast<arrow::StringArray>(column)->GetString(row));
        case arrow::Type::DOUBLE:
            return Decimal::from_double(std::static_pointer_cast<arrow::DoubleArray>(column)->Value(row));
        default:
            throw std::runtime_error("Unsupported amount column type: " + column->type()->ToString());
    }
}

std::string string_value(const std::shared_ptr<arrow::Array>& column, int64_t row) {
    if (column->type_id() != arrow::Type::STRING) {
        throw std::runtime_error("Expected string column, got: " + column->type()->ToString());
    }
    if (column->IsNull(row)) {
        return std::string();
    }
    return std::static_pointer_cast<arrow::StringArray>(column)->GetString(row);
}

Date date_value(const std::shared_ptr<arrow::Array>& column, int64_t row) {
    if (column->type_id() == arrow::Type::DATE32) {
        return Date::from_days(std::static_pointer_cast<arrow::Date32Array>(column)->Value(row));
    }
    return Date::from_string(string_value(column, row));
}

} // anonymous namespace

AccountSet ParquetReader::load_accounts(const std::string& filepath) {
    AccountSet set;
    auto table = read_table(filepath);
    if (table->num_rows() == 0) {
        return set;
    }

    auto id_column = require_column(table, "id");
    auto type_column = require_column(table, "account_type");
    auto balance_column = require_column(table, "balance");
    auto limit_column = optional_column(table, "credit_limit");

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        AccountSnapshot account(id_value(id_column, i),
                                parse_account_type(string_value(type_column, i)),
                                decimal_value(balance_column, i));
        if (limit_column && !limit_column->IsNull(i)) {
            account.credit_limit = decimal_value(limit_column, i);
        }
        set.add(account);
    }

    return set;
}

TransactionSet ParquetReader::load_transactions(const std::string& filepath) {
    TransactionSet set;
    auto table = read_table(filepath);
    if (table->num_rows() == 0) {
        return set;
    }

    auto id_column = require_column(table, "id");
    auto account_column = require_column(table, "account_id");
    auto date_column = require_column(table, "date");
    auto amount_column = require_column(table, "amount");
    auto category_column = optional_column(table, "category");

    set.reserve(static_cast<size_t>(table->num_rows()));
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        set.add(TransactionSnapshot(id_value(id_column, i),
                                    id_value(account_column, i),
                                    date_value(date_column, i),
                                    decimal_value(amount_column, i),
                                    category_column ? string_value(category_column, i) : std::string()));
    }

    return set;
}

#else // !HAVE_ARROW

AccountSet ParquetReader::load_accounts(const std::string& filepath) {
    (void)filepath;
    throw std::runtime_error("Apache Arrow not available. Rebuild with Arrow/Parquet installed to enable Parquet support.");
}

TransactionSet ParquetReader::load_transactions(const std::string& filepath) {
    (void)filepath;
    throw std::runtime_error("Apache Arrow not available. Rebuild with Arrow/Parquet installed to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace io
} // namespace housescope
