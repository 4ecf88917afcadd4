/**
 * @file trend.hpp
 * @brief Linear trend of an adjusted-area series
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <vector>

namespace bias_correction {

/**
 * @brief Ordinary least-squares line through (year, adjusted)
 */
struct TrendResult {
    Year first_year = 0;
    Year last_year = 0;
    size_t n_points = 0;

    double slope = 0.0;         ///< Area change per year
    double slope_se = 0.0;      ///< Standard error of the slope
    double total_change = 0.0;  ///< slope * (last_year - first_year)
    double error = 0.0;         ///< slope_se * (last_year - first_year)
};

/**
 * @brief Net change of a series over the fitted years
 *
 * Only records with year >= Config::trend_start_year enter the fit.
 */
class TrendEstimator {
public:
    explicit TrendEstimator(const Config& config);

    /**
     * @throws InvalidInputError if fewer than 3 years remain after filtering
     * @throws DivisionByZeroError if all remaining years are equal
     */
    TrendResult estimate(const AdjustmentSeries& series) const;
    TrendResult estimate(const CombinedSeries& series) const;

    /**
     * @brief Fit on raw parallel vectors, no year filtering
     *
     * slope_se = sqrt( SSR / (n - 2) / Sxx )
     */
    static TrendResult fit(const std::vector<Year>& years, const std::vector<double>& values);

private:
    const Config& cfg_;
};

} // namespace bias_correction
