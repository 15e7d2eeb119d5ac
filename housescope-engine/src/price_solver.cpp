#include "price_solver.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace housescope {

namespace {

// Prices are clamped to [0, PRICE_CEILING] so a diverging iteration cannot
// overflow the decimal range.
const Decimal PRICE_CEILING(1000000000);

Decimal clamp_price(const Decimal& price) {
    return min(max(price, Decimal()), PRICE_CEILING);
}

struct Evaluation {
    Decimal price;
    Decimal residual;
};

// Keeps whichever evaluation is closest to the target
void track_best(Evaluation& best, const Decimal& price, const Decimal& residual) {
    if (residual.abs() < best.residual.abs()) {
        best.price = price;
        best.residual = residual;
    }
}

// Keeps the closest evaluation whose cost does not exceed the target
void track_affordable(Evaluation& best, const Decimal& price, const Decimal& residual) {
    if (!residual.is_negative() && residual < best.residual) {
        best.price = price;
        best.residual = residual;
    }
}

SolverResult finish(const Evaluation& best, int iterations, const Decimal& tolerance) {
    SolverResult result;
    result.price = best.price;
    result.residual = best.residual;
    result.iterations = iterations;
    result.converged = best.residual.abs() < tolerance;
    return result;
}

SolverResult solve_fixed_point(const Decimal& target,
                               const std::function<Decimal(const Decimal&)>& f,
                               const SolverOptions& options) {
    Decimal price = clamp_price(target * options.seed_multiplier);
    Decimal gain = options.gain;
    Evaluation best{price, target - f(price)};
    Decimal difference = best.residual;
    int iterations = 0;

    for (int i = 0; i < options.max_iterations; ++i) {
        ++iterations;
        if (i > 0) {
            Decimal previous = difference;
            difference = target - f(price);
            track_best(best, price, difference);

            // Overshot the target: halve the step so a steep cost curve
            // settles instead of oscillating
            if (difference.is_negative() != previous.is_negative()) {
                gain = gain / Decimal(2);
            }
        }

        if (difference.abs() < options.tolerance) {
            break;
        }
        price = clamp_price(price + difference * gain);
    }

    // The last step moved the price again; keep it if it is closer
    track_best(best, price, target - f(price));
    return finish(best, iterations, options.tolerance);
}

// Reports the highest price whose cost stays within the target, so the
// result never exceeds the budget.
SolverResult solve_bisection(const Decimal& target,
                             const std::function<Decimal(const Decimal&)>& f,
                             const SolverOptions& options) {
    Decimal low;
    Evaluation best{low, target - f(low)};
    if (best.residual <= Decimal()) {
        // Even a zero price costs at least the target (e.g. HOA alone)
        return finish(best, 0, options.tolerance);
    }

    Decimal high = clamp_price(max(target * options.seed_multiplier, Decimal(1)));
    Decimal high_residual = target - f(high);
    track_affordable(best, high, high_residual);
    while (high_residual > Decimal() && high < PRICE_CEILING) {
        low = high;
        high = clamp_price(high * Decimal(2));
        high_residual = target - f(high);
        track_affordable(best, high, high_residual);
    }
    if (high_residual > Decimal()) {
        return finish(best, 0, options.tolerance);
    }

    int iterations = 0;
    while (iterations < options.max_iterations && best.residual >= options.tolerance) {
        ++iterations;
        Decimal mid = (low + high) / Decimal(2);
        Decimal residual = target - f(mid);
        track_affordable(best, mid, residual);

        if (residual > Decimal()) {
            low = mid;
        } else {
            high = mid;
        }
        if (high - low <= Decimal::from_raw(1)) {
            break;
        }
    }

    return finish(best, iterations, options.tolerance);
}

SolverResult solve_newton(const Decimal& target,
                          const std::function<Decimal(const Decimal&)>& f,
                          const SolverOptions& options) {
    const Decimal step(1000);

    Decimal price = clamp_price(target * options.seed_multiplier);
    Evaluation best{price, target - f(price)};
    int iterations = 0;

    for (int i = 0; i < options.max_iterations; ++i) {
        ++iterations;
        Decimal cost = f(price);
        Decimal difference = target - cost;
        track_best(best, price, difference);
        if (difference.abs() < options.tolerance) {
            break;
        }

        Decimal slope = (f(price + step) - cost) / step;
        if (slope <= Decimal()) {
            break;  // Flat cost curve; no price moves the payment
        }
        price = clamp_price(price + difference / slope);
    }

    return finish(best, iterations, options.tolerance);
}

} // anonymous namespace

// ============================================================================
// Options
// ============================================================================

SolverOptions::SolverOptions()
    : method(SolverMethod::Bisection),
      tolerance(1),
      max_iterations(100),
      gain(200),
      seed_multiplier(200) {}

SolverOptions SolverOptions::fixed_point() {
    SolverOptions options;
    options.method = SolverMethod::FixedPoint;
    options.tolerance = Decimal(10);
    options.max_iterations = 10;
    return options;
}

SolverOptions SolverOptions::bisection() {
    return SolverOptions();
}

SolverOptions SolverOptions::newton() {
    SolverOptions options;
    options.method = SolverMethod::Newton;
    options.max_iterations = 20;
    return options;
}

SolverResult::SolverResult()
    : price(), residual(), iterations(0), converged(false) {}

SolverMethod parse_solver_method(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "fixed-point" || lower == "fixed_point" || lower == "fixedpoint") return SolverMethod::FixedPoint;
    if (lower == "bisection") return SolverMethod::Bisection;
    if (lower == "newton") return SolverMethod::Newton;
    throw std::invalid_argument("Unknown solver method: " + name);
}

std::string solver_method_to_string(SolverMethod method) {
    switch (method) {
        case SolverMethod::FixedPoint: return "fixed-point";
        case SolverMethod::Bisection: return "bisection";
        case SolverMethod::Newton: return "newton";
        default: return "unknown";
    }
}

// ============================================================================
// Solver
// ============================================================================

SolverResult solve_price(const Decimal& target,
                         const std::function<Decimal(const Decimal&)>& monthly_cost,
                         const SolverOptions& options) {
    switch (options.method) {
        case SolverMethod::FixedPoint:
            return solve_fixed_point(target, monthly_cost, options);
        case SolverMethod::Newton:
            return solve_newton(target, monthly_cost, options);
        case SolverMethod::Bisection:
        default:
            return solve_bisection(target, monthly_cost, options);
    }
}

} // namespace housescope
