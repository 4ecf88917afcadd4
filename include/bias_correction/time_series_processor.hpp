/**
 * @file time_series_processor.hpp
 * @brief Annual application of StratumEstimator to one observed-area column
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "stratum_estimator.hpp"
#include <string>

namespace bias_correction {

class TimeSeriesProcessor {
public:
    explicit TimeSeriesProcessor(const Config& config);

    /**
     * @brief One AdjustmentResult per year, ascending
     *
     * Each year uses the first observed row of that year and only that
     * year's validation samples; years are independent.
     *
     * @throws MissingDataError if a year or @p area_column has no observed value
     */
    AdjustmentSeries process(
        const YearRange& years,
        const ObservedAreaTable& observed,
        const ValidationSamples& samples,
        const StrataDefinitions& strata,
        double total_area,
        const std::string& area_column
    ) const;

private:
    const Config& cfg_;
    StratumEstimator estimator_;
};

} // namespace bias_correction
