/**
 * @file result_combiner.cpp
 * @brief Implementation of ResultCombiner
 */

#include "bias_correction/result_combiner.hpp"
#include "bias_correction/errors.hpp"
#include <cmath>
#include <iostream>
#include <utility>

namespace bias_correction {

ResultCombiner::ResultCombiner(const Config& config)
    : cfg_(config) {
}

CombinedCountryResults ResultCombiner::combine(
    const CountryResults& results_a,
    const CountryResults& results_b
) const {
    CombinedCountryResults combined;

    for (const auto& [country, series_a] : results_a) {
        if (cfg_.region_exclusive_countries.count(country)) {
            CombinedSeries passed;
            passed.reserve(series_a.size());
            for (const auto& r : series_a) {
                passed.push_back(CombinedResult::passThrough(r));
            }
            combined[country] = std::move(passed);
            continue;
        }

        auto it = results_b.find(country);
        if (it == results_b.end()) {
            if (cfg_.verbose) {
                std::cout << "[ResultCombiner] '" << country
                          << "' has no second-subregion series, not combined\n";
            }
            continue;
        }

        combined[country] = combineSeries(series_a, it->second, country);
    }

    if (cfg_.verbose) {
        for (const auto& [country, series_b] : results_b) {
            if (results_a.count(country) == 0) {
                std::cout << "[ResultCombiner] '" << country
                          << "' only in second subregion, dropped\n";
            }
        }
    }

    return combined;
}

CombinedSeries ResultCombiner::combineSeries(
    const AdjustmentSeries& a,
    const AdjustmentSeries& b,
    const std::string& label
) {
    const std::string prefix = label.empty() ? "" : "'" + label + "' ";
    if (a.size() != b.size()) {
        throw AlignmentError(
            prefix + "series lengths " + std::to_string(a.size()) + " and " +
            std::to_string(b.size()));
    }

    CombinedSeries out;
    out.reserve(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].year != b[i].year) {
            throw AlignmentError(
                prefix + "position " + std::to_string(i) + " holds years " +
                std::to_string(a[i].year) + " and " + std::to_string(b[i].year));
        }

        CombinedResult r;
        r.year = a[i].year;
        r.observed = a[i].observed + b[i].observed;
        r.adjusted = a[i].adjusted + b[i].adjusted;
        r.adjustment = a[i].adjustment + b[i].adjustment;
        r.se = std::sqrt(a[i].se * a[i].se + b[i].se * b[i].se);
        r.ci_95 = kCi95Z * r.se;
        r.n_subregions = 2;
        out.push_back(r);
    }
    return out;
}

} // namespace bias_correction
