/**
 * @file test_helpers.hpp
 * @brief Builders for validation samples and observed-area tables
 */

#pragma once

#include <bias_correction/config.hpp>
#include <bias_correction/data_types.hpp>
#include <Eigen/Dense>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace test_helpers {

using namespace bias_correction;

inline Eigen::VectorXd vec(std::initializer_list<double> values) {
    Eigen::VectorXd v(Eigen::Index(values.size()));
    Eigen::Index i = 0;
    for (double x : values) {
        v(i++) = x;
    }
    return v;
}

/// Append @p count identical samples
inline void addSamples(ValidationSamples& samples, StratumId stratum, Year year,
                       int reference, int predicted, int count) {
    for (int i = 0; i < count; ++i) {
        samples.push_back({stratum, reference, predicted, year});
    }
}

inline ValidationSamples repeated(StratumId stratum, Year year,
                                  int reference, int predicted, int count) {
    ValidationSamples samples;
    addSamples(samples, stratum, year, reference, predicted, count);
    return samples;
}

/**
 * Two-stratum design with 10 samples each:
 * stratum 1: 8 x (1,1), 2 x (1,0); stratum 2: 10 x (0,0)
 */
inline ValidationSamples scenarioOneSamples(Year year) {
    ValidationSamples samples;
    addSamples(samples, 1, year, 1, 1, 8);
    addSamples(samples, 1, year, 1, 0, 2);
    addSamples(samples, 2, year, 0, 0, 10);
    return samples;
}

/// Samples with every label combination, so se > 0
inline ValidationSamples mixedSamples(Year year) {
    ValidationSamples samples;
    addSamples(samples, 1, year, 1, 1, 6);
    addSamples(samples, 1, year, 0, 1, 2);
    addSamples(samples, 1, year, 1, 0, 2);
    addSamples(samples, 2, year, 0, 0, 7);
    addSamples(samples, 2, year, 1, 0, 3);
    return samples;
}

inline ObservedAreaRow row(Year year, const std::string& region,
                           std::map<std::string, double> areas) {
    ObservedAreaRow r;
    r.year = year;
    r.region = region;
    r.areas = std::move(areas);
    return r;
}

/// Small configuration: two strata per subregion, us/canada/total columns
inline Config smallConfig() {
    Config cfg;
    cfg.years = YearRange{2000, 2002};
    cfg.country_columns = {"us_mill_acres", "canada_mill_acres", "total_mill_acres"};
    cfg.region_a_label = "NORTH";
    cfg.region_a.name = "north";
    cfg.region_a.strata = StrataDefinitions({{1, 0.6}, {2, 0.4}});
    cfg.region_a.overlap_areas = {{"us", 100.0}, {"canada", 50.0}, {"total", 150.0}};
    cfg.region_b.name = "south";
    cfg.region_b.strata = StrataDefinitions({{1, 0.25}, {2, 0.75}});
    cfg.region_b.overlap_areas = {{"us", 80.0}, {"canada", 0.0}, {"total", 80.0}};
    cfg.region_exclusive_countries = {"canada"};
    return cfg;
}

} // namespace test_helpers
