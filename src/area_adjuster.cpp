/**
 * @file area_adjuster.cpp
 * @brief Implementation of AreaAdjuster
 */

#include "bias_correction/area_adjuster.hpp"
#include "bias_correction/errors.hpp"

namespace bias_correction {

AreaAdjustment AreaAdjuster::adjust(
    const Eigen::VectorXd& strata_areas,
    const Eigen::VectorXd& commission_rates,
    const Eigen::VectorXd& omission_rates,
    const Eigen::VectorXd& strata_proportions
) {
    const Eigen::Index n = strata_areas.size();
    if (commission_rates.size() != n || omission_rates.size() != n ||
        strata_proportions.size() != n) {
        throw InvalidInputError(
            "area adjustment inputs have lengths " + std::to_string(n) + ", " +
            std::to_string(commission_rates.size()) + ", " +
            std::to_string(omission_rates.size()) + ", " +
            std::to_string(strata_proportions.size()));
    }

    Eigen::ArrayXd commission_adjustment = strata_areas.array() * commission_rates.array();
    Eigen::ArrayXd omission_adjustment = strata_areas.array() * omission_rates.array();
    Eigen::ArrayXd net_adjustment = omission_adjustment - commission_adjustment;

    AreaAdjustment result;
    result.per_stratum = (net_adjustment * strata_proportions.array()).matrix();

    // Left-to-right accumulation
    result.total = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        result.total += result.per_stratum(i);
    }
    return result;
}

AreaAdjustment AreaAdjuster::adjust(
    const Eigen::VectorXd& strata_areas,
    const std::vector<StratumErrorRates>& rates,
    const Eigen::VectorXd& strata_proportions
) {
    Eigen::VectorXd commission(Eigen::Index(rates.size()));
    Eigen::VectorXd omission(Eigen::Index(rates.size()));
    for (size_t i = 0; i < rates.size(); ++i) {
        commission(Eigen::Index(i)) = rates[i].commission_rate;
        omission(Eigen::Index(i)) = rates[i].omission_rate;
    }
    return adjust(strata_areas, commission, omission, strata_proportions);
}

} // namespace bias_correction
