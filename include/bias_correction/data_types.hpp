/**
 * @file data_types.hpp
 * @brief Core data structures for samples, observed areas and estimates
 */

#pragma once

#include "common.hpp"
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace bias_correction {

// ============================================================================
// Inputs
// ============================================================================

/**
 * @brief One stratum of the sampling design
 */
struct StratumDefinition {
    StratumId id;
    double weight;  ///< Proportion of total area (w_h)
};

/**
 * @brief Immutable set of strata, iterated in ascending id order
 */
class StrataDefinitions {
public:
    StrataDefinitions() = default;

    /**
     * @brief Build from an id -> weight mapping
     *
     * @throws ConfigurationError if a weight lies outside [0, 1]
     */
    explicit StrataDefinitions(const std::map<StratumId, double>& proportions);

    /**
     * @brief Weight of a stratum
     * @throws ConfigurationError if the id is unknown
     */
    double weight(StratumId id) const;

    bool contains(StratumId id) const;

    /// Sum of all weights
    double totalWeight() const;

    std::map<StratumId, double> proportions() const;

    size_t size() const { return strata_.size(); }
    bool empty() const { return strata_.empty(); }

    std::vector<StratumDefinition>::const_iterator begin() const { return strata_.begin(); }
    std::vector<StratumDefinition>::const_iterator end() const { return strata_.end(); }

private:
    std::vector<StratumDefinition> strata_;  ///< Sorted by id
};

/**
 * @brief Reference-vs-prediction pair for one validation point
 *
 * Field names map to the validation table columns
 * strata / landcover_code / window_ag / year.
 */
struct ValidationSample {
    StratumId stratum_id;
    int reference_label;  ///< landcover_code, 0 or 1
    int predicted_label;  ///< window_ag, 0 or 1
    Year year;
};

using ValidationSamples = std::vector<ValidationSample>;

inline ValidationSamples filterByYear(const ValidationSamples& samples, Year year) {
    ValidationSamples out;
    for (const auto& s : samples) {
        if (s.year == year) {
            out.push_back(s);
        }
    }
    return out;
}

inline ValidationSamples filterByStratum(const ValidationSamples& samples, StratumId id) {
    ValidationSamples out;
    for (const auto& s : samples) {
        if (s.stratum_id == id) {
            out.push_back(s);
        }
    }
    return out;
}

/**
 * @brief Check labels and stratum ids of a validation set
 *
 * @throws InvalidInputError if a label is not 0 or 1
 * @throws ConfigurationError if a stratum id is not in @p strata
 */
void validateSamples(const ValidationSamples& samples, const StrataDefinitions& strata);

/**
 * @brief One row of an observed-area table
 */
struct ObservedAreaRow {
    Year year;
    std::string region;                    ///< eco_region label
    std::map<std::string, double> areas;   ///< column name -> observed area
};

/**
 * @brief Observed (uncorrected) area per year and country column
 */
class ObservedAreaTable {
public:
    ObservedAreaTable() = default;
    explicit ObservedAreaTable(std::vector<ObservedAreaRow> rows) : rows_(std::move(rows)) {}

    void addRow(ObservedAreaRow row) { rows_.push_back(std::move(row)); }

    /**
     * @brief Observed area of the first row matching @p year
     *
     * @throws MissingDataError if no row has that year or the row lacks the column
     */
    double value(Year year, const std::string& column) const;

    /// Rows accepted by @p predicate, in their original order
    ObservedAreaTable filter(const std::function<bool(const ObservedAreaRow&)>& predicate) const;

    const std::vector<ObservedAreaRow>& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

private:
    std::vector<ObservedAreaRow> rows_;
};

// ============================================================================
// Estimates
// ============================================================================

/**
 * @brief Commission and omission error rates of one stratum
 */
struct StratumErrorRates {
    double commission_rate = 0.0;
    double omission_rate = 0.0;
};

/**
 * @brief Per-stratum terms that entered one estimate
 */
struct StratumContribution {
    StratumId id;
    double weight;
    double area;        ///< A_h = w_h * total_area
    StratumErrorRates rates;
    size_t n_samples;   ///< n_h
    double p_bar;       ///< Mean reference label
    double adjustment;  ///< Signed, weighted area adjustment
};

/**
 * @brief Bias-adjusted area for one region / country / footprint / year
 */
struct AdjustmentResult {
    Year year = 0;
    double observed = 0.0;
    double adjusted = 0.0;    ///< observed + adjustment
    double adjustment = 0.0;
    double se = 0.0;
    double ci_95 = 0.0;       ///< 1.96 * se

    std::string toString() const;
};

/**
 * @brief Country total assembled from one or two subregion results
 */
struct CombinedResult {
    Year year = 0;
    double observed = 0.0;
    double adjusted = 0.0;
    double adjustment = 0.0;
    double se = 0.0;          ///< sqrt(se_a^2 + se_b^2) when merged
    double ci_95 = 0.0;
    int n_subregions = 1;     ///< 1 = passed through, 2 = merged

    /// Single-subregion record carried over unchanged
    static CombinedResult passThrough(const AdjustmentResult& result);

    std::string toString() const;
};

using AdjustmentSeries = std::vector<AdjustmentResult>;
using CombinedSeries = std::vector<CombinedResult>;

using CountryResults = std::map<CountryCode, AdjustmentSeries>;
using CombinedCountryResults = std::map<CountryCode, CombinedSeries>;

/**
 * @brief All scopes of one footprint type
 */
struct FootprintResults {
    CombinedCountryResults combined;
    CountryResults region_a;
    CountryResults region_b;

    /**
     * @brief Per-subregion results
     * @throws InvalidInputError for Scope::COMBINED (use @c combined)
     */
    const CountryResults& regional(Scope scope) const;
};

/**
 * @brief Full orchestrator output keyed by footprint type
 */
struct BiasReport {
    std::map<FootprintType, FootprintResults> footprints;

    /// @throws MissingDataError if the footprint was not computed
    const FootprintResults& at(FootprintType type) const;
};

} // namespace bias_correction
