#ifndef HOUSESCOPE_PRICE_SOLVER_HPP
#define HOUSESCOPE_PRICE_SOLVER_HPP

#include "decimal.hpp"
#include <functional>
#include <string>

namespace housescope {

enum class SolverMethod {
    FixedPoint,   // price += (target - f(price)) * gain; gain halves on overshoot
    Bisection,    // Bracket [0, hi] grown by doubling, then halved; never over target
    Newton        // Newton step with a finite-difference slope
};

SolverMethod parse_solver_method(const std::string& name);
std::string solver_method_to_string(SolverMethod method);

struct SolverOptions {
    SolverMethod method;
    Decimal tolerance;          // Stop when |target - f(price)| < tolerance
    int max_iterations;         // Hard cap; the best price so far is returned
    Decimal gain;               // Fixed-point step multiplier
    Decimal seed_multiplier;    // Initial guess = target * seed_multiplier

    SolverOptions();

    // Damped iteration with gain 200, tolerance $10, at most 10 steps
    static SolverOptions fixed_point();
    // Default: tolerance $1, at most 100 halvings
    static SolverOptions bisection();
    // Tolerance $1, at most 20 steps
    static SolverOptions newton();
};

struct SolverResult {
    Decimal price;
    Decimal residual;     // target - f(price)
    int iterations;
    bool converged;

    SolverResult();
};

// Finds price >= 0 with f(price) ~= target, where f is the monthly cost of
// owning a home at that price. f must be non-decreasing in price.
// Never throws for non-convergence; check SolverResult::converged.
SolverResult solve_price(const Decimal& target,
                         const std::function<Decimal(const Decimal&)>& monthly_cost,
                         const SolverOptions& options = SolverOptions());

} // namespace housescope

#endif // HOUSESCOPE_PRICE_SOLVER_HPP
