/**
 * @file data_types.cpp
 * @brief Implementation of input tables and result records
 */

#include "bias_correction/data_types.hpp"
#include "bias_correction/errors.hpp"
#include <algorithm>
#include <cstdio>

namespace bias_correction {

// ============================================================================
// StrataDefinitions
// ============================================================================

StrataDefinitions::StrataDefinitions(const std::map<StratumId, double>& proportions) {
    strata_.reserve(proportions.size());
    for (const auto& [id, weight] : proportions) {
        if (!(weight >= 0.0 && weight <= 1.0)) {
            throw ConfigurationError(
                "stratum " + std::to_string(id) + " weight " +
                std::to_string(weight) + " outside [0, 1]");
        }
        strata_.push_back({id, weight});
    }
    // std::map already yields ascending ids
}

double StrataDefinitions::weight(StratumId id) const {
    auto it = std::lower_bound(
        strata_.begin(), strata_.end(), id,
        [](const StratumDefinition& s, StratumId key) { return s.id < key; });
    if (it == strata_.end() || it->id != id) {
        throw ConfigurationError("stratum " + std::to_string(id) + " has no proportion");
    }
    return it->weight;
}

bool StrataDefinitions::contains(StratumId id) const {
    return std::any_of(strata_.begin(), strata_.end(),
                       [id](const StratumDefinition& s) { return s.id == id; });
}

double StrataDefinitions::totalWeight() const {
    double sum = 0.0;
    for (const auto& s : strata_) {
        sum += s.weight;
    }
    return sum;
}

std::map<StratumId, double> StrataDefinitions::proportions() const {
    std::map<StratumId, double> out;
    for (const auto& s : strata_) {
        out[s.id] = s.weight;
    }
    return out;
}

// ============================================================================
// Validation samples
// ============================================================================

void validateSamples(const ValidationSamples& samples, const StrataDefinitions& strata) {
    for (size_t i = 0; i < samples.size(); ++i) {
        const auto& s = samples[i];
        if ((s.reference_label != 0 && s.reference_label != 1) ||
            (s.predicted_label != 0 && s.predicted_label != 1)) {
            throw InvalidInputError(
                "sample " + std::to_string(i) + " has labels (" +
                std::to_string(s.reference_label) + ", " +
                std::to_string(s.predicted_label) + "), expected 0 or 1");
        }
        if (!strata.contains(s.stratum_id)) {
            throw ConfigurationError(
                "sample " + std::to_string(i) + " references stratum " +
                std::to_string(s.stratum_id) + " missing from the proportions");
        }
    }
}

// ============================================================================
// ObservedAreaTable
// ============================================================================

double ObservedAreaTable::value(Year year, const std::string& column) const {
    for (const auto& row : rows_) {
        if (row.year != year) {
            continue;
        }
        auto it = row.areas.find(column);
        if (it == row.areas.end()) {
            throw MissingDataError(
                "column '" + column + "' absent for year " + std::to_string(year));
        }
        return it->second;
    }
    throw MissingDataError(
        "no observed-area row for year " + std::to_string(year) +
        " (column '" + column + "')");
}

ObservedAreaTable ObservedAreaTable::filter(
    const std::function<bool(const ObservedAreaRow&)>& predicate
) const {
    ObservedAreaTable out;
    for (const auto& row : rows_) {
        if (predicate(row)) {
            out.addRow(row);
        }
    }
    return out;
}

// ============================================================================
// Result records
// ============================================================================

std::string AdjustmentResult::toString() const {
    char buffer[160];
    snprintf(buffer, sizeof(buffer),
             "AdjustmentResult(year=%d, observed=%.3f, adjusted=%.3f, adj=%+.3f, se=%.3f)",
             year, observed, adjusted, adjustment, se);
    return std::string(buffer);
}

CombinedResult CombinedResult::passThrough(const AdjustmentResult& result) {
    CombinedResult out;
    out.year = result.year;
    out.observed = result.observed;
    out.adjusted = result.adjusted;
    out.adjustment = result.adjustment;
    out.se = result.se;
    out.ci_95 = result.ci_95;
    out.n_subregions = 1;
    return out;
}

std::string CombinedResult::toString() const {
    char buffer[160];
    snprintf(buffer, sizeof(buffer),
             "CombinedResult(year=%d, observed=%.3f, adjusted=%.3f, se=%.3f, regions=%d)",
             year, observed, adjusted, se, n_subregions);
    return std::string(buffer);
}

const CountryResults& FootprintResults::regional(Scope scope) const {
    switch (scope) {
        case Scope::REGION_A: return region_a;
        case Scope::REGION_B: return region_b;
        default:
            throw InvalidInputError("scope '" + bias_correction::toString(scope) +
                                    "' has no per-subregion results");
    }
}

const FootprintResults& BiasReport::at(FootprintType type) const {
    auto it = footprints.find(type);
    if (it == footprints.end()) {
        throw MissingDataError("footprint '" + toString(type) + "' not in report");
    }
    return it->second;
}

} // namespace bias_correction
