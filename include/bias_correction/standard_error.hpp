/**
 * @file standard_error.hpp
 * @brief Standard error of the adjusted area under stratified random sampling
 */

#pragma once

#include "common.hpp"
#include <Eigen/Dense>

namespace bias_correction {

/**
 * @brief Olofsson et al. (2014) stratified standard error
 *
 * SE = sqrt( sum_h A_h^2 * (1 - n_h / N_h) * p_h (1 - p_h) / n_h )
 *
 * N_h is the total sample count over all strata used in the estimate rather
 * than a per-stratum population size. Results depend on this; keep it.
 */
class StandardErrorEstimator {
public:
    /**
     * @param strata_areas A_h for each stratum present
     * @param n_h Sample count per stratum
     * @param N_h Total sample count across the strata used
     * @param p_bar_h Mean reference label per stratum
     * @return Non-negative standard error
     *
     * @throws InvalidInputError if the vector lengths differ
     * @throws DivisionByZeroError if there are no strata, any n_h <= 0, or N_h <= 0
     */
    static double compute(
        const Eigen::VectorXd& strata_areas,
        const Eigen::VectorXd& n_h,
        double N_h,
        const Eigen::VectorXd& p_bar_h
    );
};

} // namespace bias_correction
