/**
 * @file area_adjuster.hpp
 * @brief Stratum-weighted area adjustment from commission / omission rates
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <Eigen/Dense>
#include <vector>

namespace bias_correction {

/**
 * @brief Per-stratum adjustments and their sum
 */
struct AreaAdjustment {
    Eigen::VectorXd per_stratum;  ///< adjustment_h, signed
    double total = 0.0;           ///< sum over strata present
};

/**
 * @brief Converts error rates and stratum areas into a net area adjustment
 *
 * adjustment_h = (A_h * O_h - A_h * C_h) * w_h
 *
 * A_h already carries w_h (A_h = w_h * total_area); the second w_h factor is
 * part of the estimator as published by the study and is kept.
 */
class AreaAdjuster {
public:
    /**
     * @param strata_areas A_h for each stratum present
     * @param commission_rates C_h, parallel to @p strata_areas
     * @param omission_rates O_h, parallel to @p strata_areas
     * @param strata_proportions w_h, parallel to @p strata_areas (not renormalized)
     *
     * @throws InvalidInputError if the lengths differ
     */
    static AreaAdjustment adjust(
        const Eigen::VectorXd& strata_areas,
        const Eigen::VectorXd& commission_rates,
        const Eigen::VectorXd& omission_rates,
        const Eigen::VectorXd& strata_proportions
    );

    /**
     * @brief Convenience overload taking rate records
     */
    static AreaAdjustment adjust(
        const Eigen::VectorXd& strata_areas,
        const std::vector<StratumErrorRates>& rates,
        const Eigen::VectorXd& strata_proportions
    );
};

} // namespace bias_correction
