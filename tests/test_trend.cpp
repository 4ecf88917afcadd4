/**
 * @file test_trend.cpp
 * @brief Linear trend of adjusted areas
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <bias_correction/errors.hpp>
#include <bias_correction/trend.hpp>
#include "test_helpers.hpp"
#include <cmath>

using namespace bias_correction;
using namespace test_helpers;
using Catch::Approx;

namespace {

AdjustmentResult point(Year year, double adjusted) {
    AdjustmentResult r;
    r.year = year;
    r.observed = adjusted;
    r.adjusted = adjusted;
    return r;
}

/**
 * adjusted = 10 + 2 * (year - 2000) + {1, -1, 0, -1, 1} over 2000-2004.
 * The residuals are orthogonal to both year and intercept, so the fitted
 * slope is exactly 2 and SSR = 4. 1998 and 1999 are outliers before the
 * default start year.
 */
AdjustmentSeries knownSeries() {
    return {
        point(1998, 500.0),
        point(1999, -300.0),
        point(2000, 11.0),
        point(2001, 11.0),
        point(2002, 14.0),
        point(2003, 15.0),
        point(2004, 19.0)
    };
}

} // namespace

TEST_CASE("Slope, its standard error and the change over the span", "[TrendEstimator]")
{
    Config cfg;
    TrendEstimator estimator(cfg);

    TrendResult trend = estimator.estimate(knownSeries());

    REQUIRE(trend.first_year == 2000);
    REQUIRE(trend.last_year == 2004);
    REQUIRE(trend.n_points == 5);
    REQUIRE(trend.slope == Approx(2.0));

    // sqrt( SSR / (n - 2) / Sxx ) = sqrt( 4 / 3 / 10 )
    const double se = std::sqrt(4.0 / 3.0 / 10.0);
    REQUIRE(trend.slope_se == Approx(se));
    REQUIRE(trend.total_change == Approx(8.0));
    REQUIRE(trend.error == Approx(4.0 * se));
}

TEST_CASE("Start year comes from the configuration", "[TrendEstimator]")
{
    Config cfg;
    cfg.trend_start_year = 2001;
    TrendEstimator estimator(cfg);

    TrendResult trend = estimator.estimate(knownSeries());
    REQUIRE(trend.first_year == 2001);
    REQUIRE(trend.n_points == 4);
    // Points 11, 14, 15, 19 over 2001-2004: Sxy = 12.5, Sxx = 5
    REQUIRE(trend.slope == Approx(2.5));
    REQUIRE(trend.total_change == Approx(7.5));
}

TEST_CASE("A perfect line has no slope error", "[TrendEstimator]")
{
    std::vector<Year> years = {2010, 2011, 2012, 2013};
    std::vector<double> values = {5.0, 4.5, 4.0, 3.5};

    TrendResult trend = TrendEstimator::fit(years, values);
    REQUIRE(trend.slope == Approx(-0.5));
    REQUIRE(trend.slope_se == Approx(0.0).margin(1e-12));
    REQUIRE(trend.total_change == Approx(-1.5));
}

TEST_CASE("Combined series use their adjusted column", "[TrendEstimator]")
{
    Config cfg;
    TrendEstimator estimator(cfg);

    CombinedSeries combined;
    for (const auto& r : knownSeries()) {
        combined.push_back(CombinedResult::passThrough(r));
    }

    TrendResult a = estimator.estimate(knownSeries());
    TrendResult b = estimator.estimate(combined);
    REQUIRE(b.slope == a.slope);
    REQUIRE(b.error == a.error);
}

TEST_CASE("Too few points or one repeated year cannot be fitted", "[TrendEstimator]")
{
    Config cfg;
    TrendEstimator estimator(cfg);

    SECTION("two years after the start year")
    {
        AdjustmentSeries series = {point(1999, 1.0), point(2000, 2.0), point(2001, 3.0)};
        REQUIRE_THROWS_AS(estimator.estimate(series), InvalidInputError);
    }

    SECTION("mismatched lengths")
    {
        REQUIRE_THROWS_AS(TrendEstimator::fit({2000, 2001, 2002}, {1.0, 2.0}),
                          InvalidInputError);
    }

    SECTION("single repeated year")
    {
        REQUIRE_THROWS_AS(TrendEstimator::fit({2000, 2000, 2000}, {1.0, 2.0, 3.0}),
                          DivisionByZeroError);
    }
}
