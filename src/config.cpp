/**
 * @file config.cpp
 * @brief Default study configuration and validation
 */

#include "bias_correction/config.hpp"
#include "bias_correction/errors.hpp"
#include <cmath>

namespace bias_correction {

namespace {

void validateSubregion(const SubregionConfig& sub, const Config& cfg) {
    if (sub.strata.empty()) {
        throw ConfigurationError("subregion '" + sub.name + "' has no strata");
    }
    double total = sub.strata.totalWeight();
    if (std::abs(total - 1.0) > cfg.weight_tolerance) {
        throw ConfigurationError(
            "strata weights of '" + sub.name + "' sum to " + std::to_string(total));
    }
    for (const auto& [country, area] : sub.overlap_areas) {
        if (!(area >= 0.0)) {
            throw ConfigurationError(
                "overlap area of '" + country + "' in '" + sub.name + "' is negative");
        }
    }
    for (const auto& column : cfg.country_columns) {
        CountryCode code = countryCodeFromColumn(column, cfg.column_separator);
        if (sub.overlap_areas.count(code) == 0) {
            throw ConfigurationError(
                "subregion '" + sub.name + "' has no overlap area for '" + code + "'");
        }
    }
}

} // namespace

// ============================================================================
// Config
// ============================================================================

const SubregionConfig& Config::subregion(Scope scope) const {
    switch (scope) {
        case Scope::REGION_A: return region_a;
        case Scope::REGION_B: return region_b;
        default:
            throw InvalidInputError("no subregion design for scope 'combined'");
    }
}

void Config::validate() const {
    if (years.empty()) {
        throw ConfigurationError(
            "empty year range " + std::to_string(years.first) + "-" +
            std::to_string(years.last));
    }
    if (country_columns.empty()) {
        throw ConfigurationError("no country columns configured");
    }
    validateSubregion(region_a, *this);
    validateSubregion(region_b, *this);
}

Config Config::createDefault() {
    Config cfg;
    cfg.years = YearRange{1996, 2021};

    cfg.region_a.name = "great_plains";
    cfg.region_a.strata = StrataDefinitions({
        {1, 0.3399459905021893},    // likely stable croplands
        {2, 0.04854199924345394},   // cropland gain
        {3, 0.055592609114006625},  // cropland loss
        {4, 0.5540253044095518},    // likely stable non-croplands
        {5, 0.0018940967307983225}  // possible errors
    });
    cfg.region_a.overlap_areas = {
        {"us", 550.7870614297041},
        {"canada", 113.59558968030782},
        {"mx", 25.740657567547277},
        {"total", 690.1233086775592}
    };

    cfg.region_b.name = "mexico";
    cfg.region_b.strata = StrataDefinitions({
        {1, 0.03336170578959062},
        {2, 0.008431742977548621},
        {3, 0.001045225520779897},
        {4, 0.9321715151583109},
        {5, 0.02498981055377003}
    });
    cfg.region_b.overlap_areas = {
        {"total", 195.50},
        {"us", 54.00},
        {"mx", 141.51},
        {"canada", 0.0}
    };

    return cfg;
}

// ============================================================================
// Free functions
// ============================================================================

CountryCode countryCodeFromColumn(const std::string& column, char separator) {
    auto pos = column.find(separator);
    CountryCode code = (pos == std::string::npos) ? column : column.substr(0, pos);
    if (code.empty()) {
        throw ConfigurationError("column '" + column + "' has no country prefix");
    }
    return code;
}

} // namespace bias_correction
