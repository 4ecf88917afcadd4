/**
 * @file footprint_orchestrator.cpp
 * @brief Implementation of FootprintOrchestrator
 */

#include "bias_correction/footprint_orchestrator.hpp"
#include "bias_correction/result_combiner.hpp"
#include "bias_correction/subregion_processor.hpp"
#include <iostream>
#include <utility>

namespace bias_correction {

SubregionInputs SubregionInputs::fromConfig(const SubregionConfig& sub, ValidationSamples samples) {
    SubregionInputs inputs;
    inputs.samples = std::move(samples);
    inputs.strata = sub.strata;
    inputs.overlap_areas = sub.overlap_areas;
    return inputs;
}

FootprintOrchestrator::FootprintOrchestrator(
    const Config& config,
    RegionPredicate region_predicate
) : cfg_(config), in_region_a_(std::move(region_predicate)) {

    if (!in_region_a_) {
        const std::string label = cfg_.region_a_label;
        in_region_a_ = [label](const ObservedAreaRow& row) { return row.region == label; };
    }

    // Use member cfg_, not the parameter
    subregion_processor_ = std::make_unique<SubregionProcessor>(cfg_);
    combiner_ = std::make_unique<ResultCombiner>(cfg_);
}

FootprintOrchestrator::~FootprintOrchestrator() = default;

FootprintResults FootprintOrchestrator::runFootprint(
    FootprintType type,
    const ObservedAreaTable& observed,
    const SubregionInputs& region_a,
    const SubregionInputs& region_b,
    const YearRange& years
) const {
    ObservedAreaTable rows_a = observed.filter(in_region_a_);
    ObservedAreaTable rows_b = observed.filter(
        [this](const ObservedAreaRow& row) { return !in_region_a_(row); });

    if (cfg_.verbose) {
        std::cout << "[FootprintOrchestrator] " << toString(type) << ": "
                  << rows_a.size() << " rows in " << cfg_.region_a.name << ", "
                  << rows_b.size() << " rows in " << cfg_.region_b.name << "\n";
    }

    FootprintResults results;
    results.region_a = subregion_processor_->process(
        rows_a, region_a.samples, region_a.strata, region_a.overlap_areas,
        cfg_.country_columns, years);
    results.region_b = subregion_processor_->process(
        rows_b, region_b.samples, region_b.strata, region_b.overlap_areas,
        cfg_.country_columns, years);
    results.combined = combiner_->combine(results.region_a, results.region_b);

    return results;
}

BiasReport FootprintOrchestrator::run(
    const ObservedAreaTable& gross,
    const ObservedAreaTable& net,
    const SubregionInputs& region_a,
    const SubregionInputs& region_b,
    const YearRange& years
) const {
    BiasReport report;
    report.footprints[FootprintType::GROSS] =
        runFootprint(FootprintType::GROSS, gross, region_a, region_b, years);
    report.footprints[FootprintType::NET] =
        runFootprint(FootprintType::NET, net, region_a, region_b, years);
    return report;
}

BiasReport FootprintOrchestrator::run(
    const ObservedAreaTable& gross,
    const ObservedAreaTable& net,
    const ValidationSamples& samples_a,
    const ValidationSamples& samples_b
) const {
    return run(gross, net,
               SubregionInputs::fromConfig(cfg_.region_a, samples_a),
               SubregionInputs::fromConfig(cfg_.region_b, samples_b),
               cfg_.years);
}

} // namespace bias_correction
