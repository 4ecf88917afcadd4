/**
 * @file subregion_processor.hpp
 * @brief Time series of every country column of one subregion
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "time_series_processor.hpp"
#include <string>
#include <vector>

namespace bias_correction {

class SubregionProcessor {
public:
    explicit SubregionProcessor(const Config& config);

    /**
     * @brief Adjusted series per country code
     *
     * The country code of a column is its leading token before the
     * configured separator ("us_mill_acres" -> "us"); its total area is
     * looked up in @p overlap_areas.
     *
     * @throws ConfigurationError if @p overlap_areas lacks a country code
     * @throws MissingDataError from TimeSeriesProcessor
     */
    CountryResults process(
        const ObservedAreaTable& observed,
        const ValidationSamples& samples,
        const StrataDefinitions& strata,
        const OverlapAreas& overlap_areas,
        const std::vector<std::string>& country_columns,
        const YearRange& years
    ) const;

private:
    const Config& cfg_;
    TimeSeriesProcessor time_series_;
};

} // namespace bias_correction
