#include <catch2/catch.hpp>
#include <stdexcept>
#include "affordability_engine.hpp"
#include "price_solver.hpp"

using namespace housescope;

namespace {

LoanTerms terms_at(const char* rate, const char* down_payment = "0.20") {
    AffordabilityInput input;
    input.down_payment_fraction = Decimal::from_string(down_payment);
    input.interest_rate = Decimal::from_string(rate);
    input.loan_term_years = 30;
    return resolve_terms(input);
}

// Solves for the price that produces the payment of a known price, then
// checks the payment of the solved price against that target.
void check_inverse(const LoanTerms& terms, const SolverOptions& options, const Decimal& max_gap) {
    for (long long price = 100000; price <= 600000; price += 50000) {
        Decimal target = payment_breakdown(Decimal(price), terms).total;
        SolverResult result = solve_max_home_price(target, terms, options);
        Decimal achieved = payment_breakdown(result.price, terms).total;

        INFO("price " << price << " rate " << terms.annual_rate << " method "
             << solver_method_to_string(options.method));
        REQUIRE((achieved - target).abs() <= max_gap);
        REQUIRE(result.converged);
    }
}

} // anonymous namespace

// ============================================================================
// Options
// ============================================================================

TEST_CASE("Solver presets", "[solver]") {
    SolverOptions defaults;
    REQUIRE(defaults.method == SolverMethod::Bisection);
    REQUIRE(defaults.tolerance == Decimal(1));
    REQUIRE(defaults.max_iterations == 100);

    SolverOptions legacy = SolverOptions::fixed_point();
    REQUIRE(legacy.method == SolverMethod::FixedPoint);
    REQUIRE(legacy.tolerance == Decimal(10));
    REQUIRE(legacy.max_iterations == 10);
    REQUIRE(legacy.gain == Decimal(200));
    REQUIRE(legacy.seed_multiplier == Decimal(200));

    REQUIRE(SolverOptions::newton().method == SolverMethod::Newton);
}

TEST_CASE("Solver method names", "[solver]") {
    REQUIRE(parse_solver_method("bisection") == SolverMethod::Bisection);
    REQUIRE(parse_solver_method("Newton") == SolverMethod::Newton);
    REQUIRE(parse_solver_method("fixed-point") == SolverMethod::FixedPoint);
    REQUIRE(parse_solver_method("FIXED_POINT") == SolverMethod::FixedPoint);
    REQUIRE_THROWS_AS(parse_solver_method("secant"), std::invalid_argument);

    REQUIRE(solver_method_to_string(SolverMethod::FixedPoint) == "fixed-point");
    REQUIRE(parse_solver_method(solver_method_to_string(SolverMethod::Newton)) == SolverMethod::Newton);
}

// ============================================================================
// Convergence
// ============================================================================

TEST_CASE("Bisection inverts the payment across rates and prices", "[solver][inverse]") {
    SolverOptions options = SolverOptions::bisection();
    for (const char* rate : {"0", "0.02", "0.04", "0.06", "0.07", "0.08", "0.10"}) {
        check_inverse(terms_at(rate), options, Decimal(1));
    }

    SECTION("With PMI") {
        check_inverse(terms_at("0.065", "0.05"), options, Decimal(1));
    }
}

TEST_CASE("Bisection never reports a price over budget", "[solver][inverse]") {
    SolverOptions options = SolverOptions::bisection();
    for (const char* rate : {"0", "0.05", "0.10"}) {
        for (const char* down_payment : {"0.05", "0.20"}) {
            LoanTerms terms = terms_at(rate, down_payment);
            for (long long target = 500; target <= 5000; target += 750) {
                SolverResult result = solve_max_home_price(Decimal(target), terms, options);
                Decimal achieved = payment_breakdown(result.price, terms).total;

                INFO("target " << target << " rate " << rate << " down payment " << down_payment);
                REQUIRE(result.converged);
                REQUIRE(achieved <= Decimal(target));
                REQUIRE(Decimal(target) - achieved < Decimal(1));
            }
        }
    }
}

TEST_CASE("Newton inverts the payment across rates and prices", "[solver][inverse]") {
    SolverOptions options = SolverOptions::newton();
    for (const char* rate : {"0", "0.03", "0.07", "0.10"}) {
        check_inverse(terms_at(rate), options, Decimal(1));
    }
}

TEST_CASE("Fixed-point iteration stays within $50", "[solver][inverse]") {
    SolverOptions options = SolverOptions::fixed_point();
    for (const char* rate : {"0", "0.03", "0.05", "0.07", "0.08", "0.10"}) {
        check_inverse(terms_at(rate), options, Decimal(50));
        check_inverse(terms_at(rate, "0.05"), options, Decimal(50));
    }

    SECTION("Steep cost curves are damped") {
        // Gain 200 overshoots at these rates; halving on each overshoot
        // still settles inside ten steps
        for (const char* rate : {"0.12", "0.15"}) {
            check_inverse(terms_at(rate, "0.05"), options, Decimal(50));
        }
    }

    SECTION("Never falls back to a zero price") {
        LoanTerms terms = terms_at("0.10", "0.05");
        Decimal target = payment_breakdown(Decimal(200000), terms).total;
        SolverResult result = solve_max_home_price(target, terms, options);
        REQUIRE(result.converged);
        REQUIRE((result.price - Decimal(200000)).abs() < Decimal(10000));
    }
}

TEST_CASE("Solver on a linear cost curve", "[solver]") {
    auto cost = [](const Decimal& price) { return price * Decimal::from_string("0.007"); };

    SECTION("Converges within tolerance") {
        SolverResult result = solve_price(Decimal(700), cost);
        REQUIRE(result.converged);
        REQUIRE(result.residual.abs() < Decimal(1));
        REQUIRE((result.price - Decimal(100000)).abs() < Decimal(150));
    }

    SECTION("Iteration cap returns the best affordable price reached") {
        SolverOptions options;
        options.max_iterations = 2;
        SolverResult result = solve_price(Decimal(700), cost, options);

        // Bracket [0, 140000]: midpoints 70000 then 105000; only the first
        // stays within the target
        REQUIRE_FALSE(result.converged);
        REQUIRE(result.iterations == 2);
        REQUIRE(result.price == Decimal(70000));
        REQUIRE(result.residual == Decimal(210));
    }

    SECTION("Zero target") {
        SolverResult result = solve_price(Decimal(), cost);
        REQUIRE(result.price.is_zero());
        REQUIRE(result.iterations == 0);
        REQUIRE(result.converged);
    }
}

TEST_CASE("Solver when no price meets the target", "[solver]") {
    SECTION("Fixed costs exceed the target") {
        auto cost = [](const Decimal& price) { return Decimal(500) + price * Decimal::from_string("0.01"); };

        for (SolverOptions options : {SolverOptions::bisection(), SolverOptions::fixed_point(),
                                      SolverOptions::newton()}) {
            SolverResult result = solve_price(Decimal(400), cost, options);
            REQUIRE(result.price.is_zero());
            REQUIRE(result.residual == Decimal(-100));
            REQUIRE_FALSE(result.converged);
        }
    }

    SECTION("Target beyond the price ceiling") {
        auto cost = [](const Decimal& price) { return price * Decimal::from_raw(1); };
        SolverResult result = solve_price(Decimal(1000000), cost);
        REQUIRE(result.price == Decimal(1000000000));
        REQUIRE_FALSE(result.converged);
    }

    SECTION("Flat cost curve stops Newton") {
        auto cost = [](const Decimal&) { return Decimal(100); };
        SolverResult result = solve_price(Decimal(200), cost, SolverOptions::newton());
        REQUIRE_FALSE(result.converged);
        REQUIRE(result.iterations == 1);
    }
}

TEST_CASE("Fixed-point without enough iterations is flagged", "[solver]") {
    SolverOptions options = SolverOptions::fixed_point();
    options.max_iterations = 1;

    SolverResult result = solve_max_home_price(Decimal(1100), terms_at("0.07"), options);
    REQUIRE_FALSE(result.converged);
    REQUIRE(result.iterations == 1);
    REQUIRE(result.price.is_positive());
}
