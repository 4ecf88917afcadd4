/**
 * @file result_combiner.hpp
 * @brief Merge independently estimated subregions into country totals
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <string>

namespace bias_correction {

/**
 * @brief Sums two subregions' estimates, adding their variances
 *
 * Subregions are sampled independently, so se = sqrt(se_a^2 + se_b^2).
 */
class ResultCombiner {
public:
    explicit ResultCombiner(const Config& config);

    /**
     * @brief Country totals over both subregions
     *
     * Iterates the countries of @p results_a:
     * - a region-exclusive country is passed through unchanged;
     * - a country also present in @p results_b is summed year by year;
     * - any other country is left out.
     * Countries present only in @p results_b are left out.
     *
     * @throws AlignmentError if a country's two series differ in years or order
     */
    CombinedCountryResults combine(
        const CountryResults& results_a,
        const CountryResults& results_b
    ) const;

    /**
     * @brief Year-by-year sum of two aligned series
     *
     * @param label Country code used in error messages
     * @throws AlignmentError if the years differ
     */
    static CombinedSeries combineSeries(
        const AdjustmentSeries& a,
        const AdjustmentSeries& b,
        const std::string& label = ""
    );

private:
    const Config& cfg_;
};

} // namespace bias_correction
