#include "affordability_engine.hpp"
#include <iomanip>
#include <sstream>

namespace housescope {

namespace {

const Decimal MONTHS_PER_YEAR(12);

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw InvalidInputError(message);
    }
}

bool is_fraction(const Decimal& value) {
    return value >= Decimal() && value <= Decimal(1);
}

// "43", "43.5"
std::string trimmed(const Decimal& value) {
    std::string text = value.to_string(2);
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

std::string one_place(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// Configuration
// ============================================================================

AffordabilityDefaults::AffordabilityDefaults()
    : interest_rate(Decimal::from_string("0.07")),
      loan_term_years(30),
      property_tax_rate(Decimal::from_string("0.012")),
      insurance_rate(Decimal::from_string("0.005")),
      pmi_rate(Decimal::from_string("0.005")),
      front_end_dti(Decimal::from_string("0.28")),
      pmi_threshold(Decimal::from_string("0.20")),
      dti_warning_percent(43),
      emergency_target_months(6.0),
      reserve_months(6),
      closing_cost_rate(Decimal::from_string("0.03")),
      safe_range_floor(Decimal::from_string("0.80")) {}

AffordabilityInput::AffordabilityInput()
    : down_payment_fraction(Decimal::from_string("0.20")) {}

LoanTerms::LoanTerms()
    : term_years(0) {}

void validate_input(const AffordabilityInput& input) {
    require(!input.monthly_income.is_negative(), "monthly income must not be negative");
    if (input.monthly_debt_payments) {
        require(!input.monthly_debt_payments->is_negative(), "monthly debt payments must not be negative");
    }
    require(is_fraction(input.down_payment_fraction), "down payment must be between 0% and 100%");
    if (input.interest_rate) {
        require(is_fraction(*input.interest_rate), "interest rate must be between 0% and 100%");
    }
    if (input.loan_term_years) {
        require(*input.loan_term_years > 0, "loan term must be at least one year");
    }
    if (input.property_tax_rate) {
        require(is_fraction(*input.property_tax_rate), "property tax rate must be between 0% and 100%");
    }
    if (input.insurance_rate) {
        require(is_fraction(*input.insurance_rate), "insurance rate must be between 0% and 100%");
    }
    require(!input.hoa_monthly.is_negative(), "HOA fee must not be negative");
}

LoanTerms resolve_terms(const AffordabilityInput& input, const AffordabilityDefaults& defaults) {
    LoanTerms terms;
    terms.down_payment_fraction = input.down_payment_fraction;
    terms.annual_rate = input.interest_rate.value_or(defaults.interest_rate);
    terms.term_years = input.loan_term_years.value_or(defaults.loan_term_years);
    terms.property_tax_rate = input.property_tax_rate.value_or(defaults.property_tax_rate);
    terms.insurance_rate = input.insurance_rate.value_or(defaults.insurance_rate);
    terms.pmi_rate = defaults.pmi_rate;
    terms.pmi_threshold = defaults.pmi_threshold;
    terms.hoa_monthly = input.hoa_monthly;
    return terms;
}

Decimal resolve_monthly_debt(const AffordabilityInput& input, const FinancialProfile* profile) {
    if (input.monthly_debt_payments) {
        return *input.monthly_debt_payments;
    }
    if (profile) {
        return profile->monthly_debt_payment;
    }
    return Decimal();
}

// ============================================================================
// Payment components
// ============================================================================

Decimal max_monthly_payment(const Decimal& income, const Decimal& existing_debt, const Decimal& dti_limit) {
    return max(income * dti_limit - existing_debt, Decimal());
}

Decimal mortgage_payment(const Decimal& principal, const Decimal& annual_rate, int term_years) {
    if (term_years <= 0) {
        return Decimal();
    }
    const Decimal payments(term_years * 12);
    if (annual_rate.is_zero()) {
        return principal / payments;
    }

    Decimal monthly_rate = annual_rate / MONTHS_PER_YEAR;
    Decimal growth = Decimal(1) + monthly_rate;
    if (growth <= Decimal()) {
        return principal / payments;
    }

    // Equivalent form P*r / (1 - (1+r)^-n); the discount factor stays below
    // one, so high rates and long terms cannot overflow.
    Decimal discount = Decimal::pow(Decimal(1) / growth, static_cast<unsigned>(term_years * 12));
    Decimal denominator = Decimal(1) - discount;
    if (denominator.is_zero()) {
        return principal / payments;
    }
    return principal * monthly_rate / denominator;
}

Decimal property_tax(const Decimal& price, const Decimal& annual_rate) {
    return price * annual_rate / MONTHS_PER_YEAR;
}

Decimal insurance(const Decimal& price, const Decimal& annual_rate) {
    return price * annual_rate / MONTHS_PER_YEAR;
}

Decimal pmi(const Decimal& loan_amount,
            const Decimal& down_payment_fraction,
            const Decimal& pmi_rate,
            const Decimal& threshold) {
    if (down_payment_fraction >= threshold) {
        return Decimal();
    }
    return loan_amount * pmi_rate / MONTHS_PER_YEAR;
}

PaymentBreakdown payment_breakdown(const Decimal& price, const LoanTerms& terms) {
    Decimal down_payment = price * terms.down_payment_fraction;
    Decimal loan_amount = price - down_payment;

    PaymentBreakdown breakdown;
    breakdown.principal_interest = mortgage_payment(loan_amount, terms.annual_rate, terms.term_years);
    breakdown.property_tax = property_tax(price, terms.property_tax_rate);
    breakdown.insurance = insurance(price, terms.insurance_rate);
    breakdown.pmi = pmi(loan_amount, terms.down_payment_fraction, terms.pmi_rate, terms.pmi_threshold);
    breakdown.hoa = terms.hoa_monthly;
    breakdown.total = breakdown.principal_interest + breakdown.property_tax + breakdown.insurance +
                      breakdown.pmi + breakdown.hoa;
    return breakdown;
}

PaymentBreakdown payment_breakdown(const Decimal& price,
                                   const Decimal& down_payment_fraction,
                                   const Decimal& annual_rate,
                                   int term_years) {
    AffordabilityInput input;
    input.down_payment_fraction = down_payment_fraction;
    input.interest_rate = annual_rate;
    input.loan_term_years = term_years;
    return payment_breakdown(price, resolve_terms(input));
}

// ============================================================================
// Price search
// ============================================================================

SolverResult solve_max_home_price(const Decimal& target_monthly_payment,
                                  const LoanTerms& terms,
                                  const SolverOptions& options) {
    return solve_price(target_monthly_payment, [&terms](const Decimal& price) {
        return payment_breakdown(price, terms).total;
    }, options);
}

Decimal max_home_price(const Decimal& target_monthly_payment,
                       const Decimal& down_payment_fraction,
                       const Decimal& annual_rate,
                       int term_years,
                       const SolverOptions& options) {
    AffordabilityInput input;
    input.down_payment_fraction = down_payment_fraction;
    input.interest_rate = annual_rate;
    input.loan_term_years = term_years;
    return solve_max_home_price(target_monthly_payment, resolve_terms(input), options).price;
}

// ============================================================================
// Full analysis
// ============================================================================

HouseholdPosition::HouseholdPosition()
    : emergency_buffer_months(0.0) {}

HouseholdPosition HouseholdPosition::from_metrics(const FinancialMetrics& metrics) {
    HouseholdPosition position;
    position.monthly_expenses = metrics.monthly_expenses;
    position.available_cash = metrics.assets;
    position.dti_ratio = metrics.dti_ratio;
    position.emergency_buffer_months = metrics.emergency_buffer_months;
    return position;
}

AffordabilityReport::AffordabilityReport()
    : emergency_buffer_months(0.0) {}

AffordabilityReport analyze_affordability(const AffordabilityInput& input,
                                          const HouseholdPosition& household,
                                          const AffordabilityDefaults& defaults,
                                          const SolverOptions& options) {
    validate_input(input);

    AffordabilityReport report;
    report.terms = resolve_terms(input, defaults);
    report.monthly_income = input.monthly_income;
    report.monthly_debt = resolve_monthly_debt(input, nullptr);
    report.max_monthly_payment = max_monthly_payment(input.monthly_income, report.monthly_debt,
                                                     defaults.front_end_dti);

    // HOA is part of the breakdown total, so the mortgage is sized on what is
    // left after it.
    report.solver = solve_max_home_price(report.max_monthly_payment, report.terms, options);
    const Decimal price = report.solver.price;

    report.max_home_price = price;
    report.safe_price_min = price * defaults.safe_range_floor;
    report.safe_price_max = price;
    report.breakdown = payment_breakdown(price, report.terms);
    report.down_payment = price * report.terms.down_payment_fraction;
    report.loan_amount = price - report.down_payment;

    report.closing_costs = price * defaults.closing_cost_rate;
    report.emergency_reserves = household.monthly_expenses * Decimal(defaults.reserve_months);
    report.total_cash_needed = report.down_payment + report.closing_costs + report.emergency_reserves;
    report.available_cash = household.available_cash;

    // Cash needed grows as price * (down payment + closing) + reserves
    Decimal cash_per_dollar = report.terms.down_payment_fraction + defaults.closing_cost_rate;
    if (cash_per_dollar.is_positive()) {
        Decimal spendable = max(household.available_cash - report.emergency_reserves, Decimal());
        report.cash_constrained_price = min(spendable / cash_per_dollar, price);
    } else {
        report.cash_constrained_price = price;
    }

    report.housing_dti = input.monthly_income.is_positive()
        ? report.breakdown.total / input.monthly_income * Decimal(100)
        : Decimal();
    report.household_dti = household.dti_ratio;
    report.monthly_expenses = household.monthly_expenses;
    report.emergency_buffer_months = household.emergency_buffer_months;

    if (report.terms.down_payment_fraction < report.terms.pmi_threshold) {
        report.warnings.push_back("Down payment less than " + trimmed(report.terms.pmi_threshold * Decimal(100)) +
                                  "% requires PMI, increasing monthly costs");
        report.recommendations.push_back("Consider saving for a " +
                                         trimmed(report.terms.pmi_threshold * Decimal(100)) +
                                         "% down payment to avoid PMI");
    }

    if (report.available_cash < report.total_cash_needed) {
        report.warnings.push_back("Insufficient cash reserves. Need " + format_currency(report.total_cash_needed) +
                                  ", have " + format_currency(report.available_cash));
        report.recommendations.push_back("Build emergency fund before purchasing");
    }

    if (household.dti_ratio > defaults.dti_warning_percent) {
        report.warnings.push_back("DTI ratio (" + household.dti_ratio.to_string(1) + "%) exceeds recommended " +
                                  trimmed(defaults.dti_warning_percent) + "%");
        report.recommendations.push_back("Reduce debt payments before purchasing");
    }

    if (household.emergency_buffer_months < defaults.emergency_target_months) {
        report.warnings.push_back("Emergency fund covers only " + one_place(household.emergency_buffer_months) +
                                  " months");
        report.recommendations.push_back("Build " + trimmed(Decimal::from_double(defaults.emergency_target_months)) +
                                         "+ months of emergency reserves");
    }

    return report;
}

std::string format_currency(const Decimal& amount) {
    std::string digits = amount.abs().to_string(2);
    std::string::size_type point = digits.find('.');
    std::string whole = digits.substr(0, point);
    std::string fraction = digits.substr(point);

    std::string grouped;
    int count = 0;
    for (auto it = whole.rbegin(); it != whole.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++count;
    }

    std::string sign = amount.rounded(2).is_negative() ? "-" : "";
    return sign + "$" + grouped + fraction;
}

} // namespace housescope
