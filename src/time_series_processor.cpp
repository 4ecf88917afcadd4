/**
 * @file time_series_processor.cpp
 * @brief Implementation of TimeSeriesProcessor
 */

#include "bias_correction/time_series_processor.hpp"
#include <iostream>

namespace bias_correction {

TimeSeriesProcessor::TimeSeriesProcessor(const Config& config)
    : cfg_(config), estimator_(config) {
}

AdjustmentSeries TimeSeriesProcessor::process(
    const YearRange& years,
    const ObservedAreaTable& observed,
    const ValidationSamples& samples,
    const StrataDefinitions& strata,
    double total_area,
    const std::string& area_column
) const {
    AdjustmentSeries results;
    results.reserve(years.size());

    for (Year year : years.years()) {
        double observed_area = observed.value(year, area_column);
        ValidationSamples year_samples = filterByYear(samples, year);

        AdjustmentResult result = estimator_.estimate(
            observed_area, year_samples, strata, total_area);
        result.year = year;
        results.push_back(result);
    }

    if (cfg_.verbose) {
        std::cout << "[TimeSeriesProcessor] " << area_column << ": "
                  << results.size() << " years (" << years.first << "-"
                  << years.last << ")\n";
    }

    return results;
}

} // namespace bias_correction
