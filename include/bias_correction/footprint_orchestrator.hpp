/**
 * @file footprint_orchestrator.hpp
 * @brief Entry point: both footprints x both subregions x all countries
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <functional>
#include <memory>

namespace bias_correction {

// Forward declarations
class SubregionProcessor;
class ResultCombiner;

/// True if an observed-area row belongs to subregion A
using RegionPredicate = std::function<bool(const ObservedAreaRow&)>;

/**
 * @brief Validation data and sampling design of one subregion
 */
struct SubregionInputs {
    ValidationSamples samples;
    StrataDefinitions strata;
    OverlapAreas overlap_areas;

    static SubregionInputs fromConfig(const SubregionConfig& sub, ValidationSamples samples);
};

/**
 * @brief Runs the full bias correction workflow
 *
 * For each footprint (gross, net):
 * 1. Split observed rows into subregion A / B with the region predicate
 * 2. SubregionProcessor on each half with that subregion's samples and design
 * 3. ResultCombiner into country totals
 *
 * Example usage:
 * ```cpp
 * Config config = Config::createDefault();
 * FootprintOrchestrator orchestrator(config);
 * BiasReport report = orchestrator.run(gross, net, gp_samples, mx_samples);
 * const auto& us = report.at(FootprintType::GROSS).combined.at("us");
 * ```
 */
class FootprintOrchestrator {
public:
    /**
     * @param config Validated configuration (copied)
     * @param region_predicate Row-to-subregion-A test; defaults to
     *        row.region == config.region_a_label
     */
    explicit FootprintOrchestrator(const Config& config,
                                   RegionPredicate region_predicate = nullptr);
    ~FootprintOrchestrator();

    FootprintOrchestrator(const FootprintOrchestrator&) = delete;
    FootprintOrchestrator& operator=(const FootprintOrchestrator&) = delete;

    /**
     * @brief Nested results for both footprint types
     *
     * @param gross Cumulative-footprint observed areas (both subregions)
     * @param net Annual-footprint observed areas (both subregions)
     * @param region_a Samples and design of subregion A
     * @param region_b Samples and design of subregion B
     * @param years Inclusive year range
     */
    BiasReport run(
        const ObservedAreaTable& gross,
        const ObservedAreaTable& net,
        const SubregionInputs& region_a,
        const SubregionInputs& region_b,
        const YearRange& years
    ) const;

    /**
     * @brief run() with the designs and years of the configuration
     */
    BiasReport run(
        const ObservedAreaTable& gross,
        const ObservedAreaTable& net,
        const ValidationSamples& samples_a,
        const ValidationSamples& samples_b
    ) const;

    /**
     * @brief All scopes of a single footprint
     */
    FootprintResults runFootprint(
        FootprintType type,
        const ObservedAreaTable& observed,
        const SubregionInputs& region_a,
        const SubregionInputs& region_b,
        const YearRange& years
    ) const;

private:
    // Stored by value: processors below hold references to it.
    Config cfg_;
    RegionPredicate in_region_a_;

    std::unique_ptr<SubregionProcessor> subregion_processor_;
    std::unique_ptr<ResultCombiner> combiner_;
};

} // namespace bias_correction
