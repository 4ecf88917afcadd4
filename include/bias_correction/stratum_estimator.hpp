/**
 * @file stratum_estimator.hpp
 * @brief One bias-adjusted area estimate from stratified validation samples
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <vector>

namespace bias_correction {

/**
 * @brief Estimate plus the per-stratum terms that produced it
 */
struct StratumEstimate {
    AdjustmentResult result;
    std::vector<StratumContribution> contributions;  ///< Ascending stratum id
};

/**
 * @brief Composes ErrorRateCalculator, AreaAdjuster and StandardErrorEstimator
 *
 * Strata without samples are skipped: they add no area, rate, n_h or p_bar
 * term. Weights of the remaining strata are used as-is (not renormalized).
 */
class StratumEstimator {
public:
    explicit StratumEstimator(const Config& config);

    /**
     * @brief Adjusted area for one region / year / footprint
     *
     * @param observed_area Uncorrected classifier area
     * @param samples Validation samples of the year (any strata)
     * @param strata Stratum definitions with area proportions
     * @param total_area Region area the proportions refer to
     *
     * @throws ConfigurationError if a sample's stratum is not defined
     * @throws InvalidInputError if a label is outside {0, 1}
     * @throws DivisionByZeroError if no defined stratum has samples
     */
    AdjustmentResult estimate(
        double observed_area,
        const ValidationSamples& samples,
        const StrataDefinitions& strata,
        double total_area
    ) const;

    /**
     * @brief Same as estimate(), also returning the per-stratum breakdown
     */
    StratumEstimate estimateDetailed(
        double observed_area,
        const ValidationSamples& samples,
        const StrataDefinitions& strata,
        double total_area
    ) const;

private:
    const Config& cfg_;
};

} // namespace bias_correction
