/**
 * @file config.hpp
 * @brief Run configuration: strata weights, overlap areas, years, columns
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <set>
#include <string>
#include <vector>

namespace bias_correction {

/**
 * @brief Sampling design of one geographic subregion
 */
struct SubregionConfig {
    std::string name;              ///< Display name, e.g. "great_plains"
    StrataDefinitions strata;      ///< Stratum id -> area proportion
    OverlapAreas overlap_areas;    ///< Country -> region area (incl. "total")
};

/**
 * @brief System configuration, loaded once and passed by value
 *
 * SUBREGION A: rows whose region label equals @c region_a_label
 * SUBREGION B: every other row
 */
struct Config {
    // =========================================================================
    // TIME SERIES
    // =========================================================================

    YearRange years;  ///< Inclusive, 1996-2021 by default

    // =========================================================================
    // OBSERVED-AREA TABLE LAYOUT
    // =========================================================================

    /// Area columns, named {country}{separator}{unit}
    std::vector<std::string> country_columns = {
        "us_mill_acres", "canada_mill_acres", "mx_mill_acres", "total_mill_acres"
    };
    char column_separator = '_';      ///< Country code = token before first separator
    std::string region_a_label = "GREAT PLAINS";

    // =========================================================================
    // SUBREGIONS
    // =========================================================================

    SubregionConfig region_a;
    SubregionConfig region_b;

    /// Countries sampled only in subregion A; passed through when combining
    std::set<CountryCode> region_exclusive_countries = {"canada"};

    // =========================================================================
    // TREND
    // =========================================================================

    Year trend_start_year = 2000;     ///< First year entering the linear trend fit

    // =========================================================================
    // VALIDATION / DIAGNOSTICS
    // =========================================================================

    double weight_tolerance = 1e-6;   ///< |sum(w_h) - 1| allowed
    bool verbose = false;             ///< Print [Component] diagnostics to stdout

    /**
     * @brief Subregion design by scope
     * @throws InvalidInputError for Scope::COMBINED
     */
    const SubregionConfig& subregion(Scope scope) const;

    /**
     * @brief Check weights, areas, years and column resolution
     * @throws ConfigurationError on the first violation
     */
    void validate() const;

    /**
     * @brief Configuration of the North American cropland study
     *
     * Great Plains (A) and Southern/Mexico (B) strata and overlap areas in
     * million acres, years 1996-2021.
     */
    static Config createDefault();
};

/**
 * @brief Country code of an area column ("us_mill_acres" -> "us")
 */
CountryCode countryCodeFromColumn(const std::string& column, char separator = '_');

} // namespace bias_correction
