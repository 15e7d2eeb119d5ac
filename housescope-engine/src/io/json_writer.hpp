#ifndef HOUSESCOPE_IO_JSON_WRITER_HPP
#define HOUSESCOPE_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../affordability_engine.hpp"
#include "../metrics_calculator.hpp"

namespace housescope {
namespace io {

// Shown in place of the figures when the snapshot has no accounts
extern const char* const NO_ACCOUNTS_MESSAGE;

// Write the dashboard figures as JSON. Money, savings rate and DTI are
// rounded to 2 places and the emergency buffer to 1. The breakdowns map
// category to amount; the *_breakdown_detail arrays keep them ordered
// largest first with percentages. A snapshot without accounts produces
// zeros plus a "message" field.
void write_dashboard_json(std::ostream& os, const FinancialMetrics& metrics,
                          bool pretty_print = true);

void write_dashboard_json(const std::string& filepath, const FinancialMetrics& metrics,
                          bool pretty_print = true);

// Write the affordability report as JSON, rounded the same way
void write_affordability_json(std::ostream& os, const AffordabilityReport& report,
                              bool pretty_print = true);

void write_affordability_json(const std::string& filepath, const AffordabilityReport& report,
                              bool pretty_print = true);

} // namespace io
} // namespace housescope

#endif // HOUSESCOPE_IO_JSON_WRITER_HPP
