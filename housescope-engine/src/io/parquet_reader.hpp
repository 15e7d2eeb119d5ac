#ifndef HOUSESCOPE_PARQUET_READER_HPP
#define HOUSESCOPE_PARQUET_READER_HPP

#include "../snapshot.hpp"
#include <string>

namespace housescope {
namespace io {

class ParquetReader {
public:
    /**
     * Load account snapshots from a Parquet file.
     *
     * Expected schema:
     *   - id: uint64 or int64
     *   - account_type: string (checking, savings, investment, credit, loan)
     *   - balance: string (exact decimal text) or float64
     *   - credit_limit: optional, same types as balance, nullable
     *
     * @throws std::runtime_error if file cannot be read or schema is invalid
     */
    static AccountSet load_accounts(const std::string& filepath);

    /**
     * Load transaction snapshots from a Parquet file.
     *
     * Expected schema:
     *   - id, account_id: uint64 or int64
     *   - date: string "YYYY-MM-DD" or date32
     *   - amount: string (exact decimal text) or float64
     *   - category: string, nullable
     *
     * @throws std::runtime_error if file cannot be read or schema is invalid
     */
    static TransactionSet load_transactions(const std::string& filepath);
};

} // namespace io
} // namespace housescope

#endif // HOUSESCOPE_PARQUET_READER_HPP
