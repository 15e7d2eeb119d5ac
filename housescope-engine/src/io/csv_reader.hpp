#ifndef HOUSESCOPE_CSV_READER_HPP
#define HOUSESCOPE_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace housescope {
namespace io {

// Line-oriented CSV reader. Cells are trimmed; a cell wrapped in double
// quotes may contain the delimiter, and "" inside it is a literal quote.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

private:
    std::istream& is_;
    char delimiter_;

    static std::string trim(const std::string& s);
};

} // namespace io
} // namespace housescope

#endif // HOUSESCOPE_CSV_READER_HPP
