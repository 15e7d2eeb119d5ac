#ifndef HOUSESCOPE_AFFORDABILITY_ENGINE_HPP
#define HOUSESCOPE_AFFORDABILITY_ENGINE_HPP

#include "decimal.hpp"
#include "metrics_calculator.hpp"
#include "price_solver.hpp"
#include "snapshot.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace housescope {

// Regional and policy defaults, used wherever a request leaves a field unset
struct AffordabilityDefaults {
    Decimal interest_rate;              // Annual, fraction (default 0.07)
    int loan_term_years;                // Default 30
    Decimal property_tax_rate;          // Annual, fraction of price (default 0.012)
    Decimal insurance_rate;             // Annual, fraction of price (default 0.005)
    Decimal pmi_rate;                   // Annual, fraction of loan (default 0.005)
    Decimal front_end_dti;              // Housing share of gross income (default 0.28)
    Decimal pmi_threshold;              // Down payment fraction that removes PMI (default 0.20)
    Decimal dti_warning_percent;        // Household DTI warning level (default 43)
    double emergency_target_months;     // Emergency buffer warning level (default 6)
    int reserve_months;                 // Months of expenses held back as reserves (default 6)
    Decimal closing_cost_rate;          // Fraction of price (default 0.03)
    Decimal safe_range_floor;           // Lower end of the safe range (default 0.80)

    AffordabilityDefaults();
};

// One affordability request. Unset optionals fall back to AffordabilityDefaults.
struct AffordabilityInput {
    Decimal monthly_income;
    std::optional<Decimal> monthly_debt_payments;
    Decimal down_payment_fraction;                 // 0..1 (default 0.20)
    std::optional<Decimal> interest_rate;
    std::optional<int> loan_term_years;
    std::optional<Decimal> property_tax_rate;
    std::optional<Decimal> insurance_rate;
    Decimal hoa_monthly;

    AffordabilityInput();
};

// Fully resolved financing terms for a payment calculation
struct LoanTerms {
    Decimal down_payment_fraction;
    Decimal annual_rate;
    int term_years;
    Decimal property_tax_rate;
    Decimal insurance_rate;
    Decimal pmi_rate;
    Decimal pmi_threshold;
    Decimal hoa_monthly;

    LoanTerms();
};

// Raised by validate_input for out-of-domain requests
class InvalidInputError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Rejects negative income/debt/HOA, a down payment outside [0, 1], rates
// outside [0, 1] and a non-positive term.
void validate_input(const AffordabilityInput& input);

LoanTerms resolve_terms(const AffordabilityInput& input,
                        const AffordabilityDefaults& defaults = AffordabilityDefaults());

// Explicit input value, then the profile's value, then zero
Decimal resolve_monthly_debt(const AffordabilityInput& input, const FinancialProfile* profile);

// ============================================================================
// Payment components
// ============================================================================

// max(0, income * dti_limit - existing_debt)
Decimal max_monthly_payment(const Decimal& income,
                            const Decimal& existing_debt,
                            const Decimal& dti_limit = Decimal::from_string("0.28"));

// Level monthly payment, M = P*r*(1+r)^n / ((1+r)^n - 1), r = rate/12,
// n = term*12. A zero rate gives principal / n. Returns 0 for n <= 0.
Decimal mortgage_payment(const Decimal& principal, const Decimal& annual_rate, int term_years);

Decimal property_tax(const Decimal& price, const Decimal& annual_rate);
Decimal insurance(const Decimal& price, const Decimal& annual_rate);

// Zero when down_payment_fraction >= threshold, else loan * pmi_rate / 12
Decimal pmi(const Decimal& loan_amount,
            const Decimal& down_payment_fraction,
            const Decimal& pmi_rate,
            const Decimal& threshold = Decimal::from_string("0.20"));

struct PaymentBreakdown {
    Decimal principal_interest;
    Decimal property_tax;
    Decimal insurance;
    Decimal pmi;
    Decimal hoa;
    Decimal total;      // Exact sum of the five components
};

PaymentBreakdown payment_breakdown(const Decimal& price, const LoanTerms& terms);

// Uses the default tax, insurance and PMI rates and no HOA
PaymentBreakdown payment_breakdown(const Decimal& price,
                                   const Decimal& down_payment_fraction,
                                   const Decimal& annual_rate,
                                   int term_years);

// ============================================================================
// Price search
// ============================================================================

// Largest price whose payment_breakdown(price, terms).total meets target
SolverResult solve_max_home_price(const Decimal& target_monthly_payment,
                                  const LoanTerms& terms,
                                  const SolverOptions& options = SolverOptions());

Decimal max_home_price(const Decimal& target_monthly_payment,
                       const Decimal& down_payment_fraction,
                       const Decimal& annual_rate,
                       int term_years,
                       const SolverOptions& options = SolverOptions());

// ============================================================================
// Full analysis
// ============================================================================

// The household figures the analysis needs from MetricsCalculator
struct HouseholdPosition {
    Decimal monthly_expenses;
    Decimal available_cash;             // Total assets
    Decimal dti_ratio;                  // Percentage, from estimated debt service
    double emergency_buffer_months;

    HouseholdPosition();

    static HouseholdPosition from_metrics(const FinancialMetrics& metrics);
};

struct AffordabilityReport {
    LoanTerms terms;
    Decimal monthly_income;
    Decimal monthly_debt;
    Decimal max_monthly_payment;
    Decimal max_home_price;
    Decimal safe_price_min;
    Decimal safe_price_max;
    Decimal down_payment;
    Decimal loan_amount;
    PaymentBreakdown breakdown;

    Decimal closing_costs;
    Decimal emergency_reserves;
    Decimal total_cash_needed;          // Down payment + closing costs + reserves
    Decimal available_cash;
    Decimal cash_constrained_price;     // Largest price the available cash covers

    Decimal housing_dti;                // breakdown.total / income * 100
    Decimal household_dti;              // From HouseholdPosition
    Decimal monthly_expenses;
    double emergency_buffer_months;

    SolverResult solver;
    std::vector<std::string> warnings;
    std::vector<std::string> recommendations;

    AffordabilityReport();
};

// Validates the input, sizes the housing payment, solves for the maximum
// price and builds the cash and warning summary. Throws InvalidInputError
// for out-of-domain input.
AffordabilityReport analyze_affordability(const AffordabilityInput& input,
                                          const HouseholdPosition& household,
                                          const AffordabilityDefaults& defaults = AffordabilityDefaults(),
                                          const SolverOptions& options = SolverOptions());

// "$1,234.56", "-$12.00"
std::string format_currency(const Decimal& amount);

} // namespace housescope

#endif // HOUSESCOPE_AFFORDABILITY_ENGINE_HPP
