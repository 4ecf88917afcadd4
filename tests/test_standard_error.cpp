/**
 * @file test_standard_error.cpp
 * @brief Stratified standard error and its preconditions
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <bias_correction/errors.hpp>
#include <bias_correction/standard_error.hpp>
#include "test_helpers.hpp"
#include <cmath>

using namespace bias_correction;
using namespace test_helpers;
using Catch::Approx;

TEST_CASE("Standard error uses the pooled sample count as N_h", "[StandardErrorEstimator]")
{
    // term_1 = 60^2 * (1 - 10/20) * 0.8*0.2 / 10 = 28.8
    // term_2 = 40^2 * (1 - 10/20) * 0.5*0.5 / 10 = 20.0
    double se = StandardErrorEstimator::compute(
        vec({60.0, 40.0}), vec({10.0, 10.0}), 20.0, vec({0.8, 0.5}));
    REQUIRE(se == Approx(std::sqrt(48.8)));
}

TEST_CASE("Pure strata contribute no variance", "[StandardErrorEstimator]")
{
    double se = StandardErrorEstimator::compute(
        vec({60.0, 40.0}), vec({10.0, 10.0}), 20.0, vec({1.0, 0.0}));
    REQUIRE(se == 0.0);
}

TEST_CASE("A single stratum has no finite-population term left", "[StandardErrorEstimator]")
{
    // n_h == N_h makes (1 - n_h/N_h) vanish
    double se = StandardErrorEstimator::compute(vec({100.0}), vec({25.0}), 25.0, vec({0.4}));
    REQUIRE(se == 0.0);
}

TEST_CASE("Unequal sample sizes", "[StandardErrorEstimator]")
{
    // N = 40; term_1 = 900 * 0.75 * 0.25 / 10 = 16.875; term_2 = 4900 * 0.25 * 0.21 / 30 = 8.575
    double se = StandardErrorEstimator::compute(
        vec({30.0, 70.0}), vec({10.0, 30.0}), 40.0, vec({0.5, 0.3}));
    REQUIRE(se == Approx(std::sqrt(16.875 + 8.575)));
    REQUIRE(se >= 0.0);
}

TEST_CASE("Division-by-zero preconditions", "[StandardErrorEstimator]")
{
    Eigen::VectorXd empty(0);

    SECTION("no strata")
    {
        REQUIRE_THROWS_AS(StandardErrorEstimator::compute(empty, empty, 0.0, empty),
                          DivisionByZeroError);
    }

    SECTION("a stratum with n_h = 0")
    {
        REQUIRE_THROWS_AS(
            StandardErrorEstimator::compute(vec({1.0, 2.0}), vec({5.0, 0.0}), 5.0, vec({0.5, 0.5})),
            DivisionByZeroError);
    }

    SECTION("N_h = 0")
    {
        REQUIRE_THROWS_AS(
            StandardErrorEstimator::compute(vec({1.0}), vec({5.0}), 0.0, vec({0.5})),
            DivisionByZeroError);
    }
}

TEST_CASE("Mismatched lengths are invalid input", "[StandardErrorEstimator]")
{
    REQUIRE_THROWS_AS(
        StandardErrorEstimator::compute(vec({1.0, 2.0}), vec({5.0}), 5.0, vec({0.5, 0.5})),
        InvalidInputError);
}
