/**
 * @file subregion_processor.cpp
 * @brief Implementation of SubregionProcessor
 */

#include "bias_correction/subregion_processor.hpp"
#include "bias_correction/errors.hpp"

namespace bias_correction {

SubregionProcessor::SubregionProcessor(const Config& config)
    : cfg_(config), time_series_(config) {
}

CountryResults SubregionProcessor::process(
    const ObservedAreaTable& observed,
    const ValidationSamples& samples,
    const StrataDefinitions& strata,
    const OverlapAreas& overlap_areas,
    const std::vector<std::string>& country_columns,
    const YearRange& years
) const {
    CountryResults results;

    for (const auto& column : country_columns) {
        CountryCode country = countryCodeFromColumn(column, cfg_.column_separator);

        auto it = overlap_areas.find(country);
        if (it == overlap_areas.end()) {
            throw ConfigurationError(
                "no overlap area for country '" + country + "' (column '" + column + "')");
        }

        results[country] = time_series_.process(
            years, observed, samples, strata, it->second, column);
    }

    return results;
}

} // namespace bias_correction
