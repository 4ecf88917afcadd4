/**
 * @file standard_error.cpp
 * @brief Implementation of StandardErrorEstimator
 */

#include "bias_correction/standard_error.hpp"
#include "bias_correction/errors.hpp"
#include <cmath>

namespace bias_correction {

double StandardErrorEstimator::compute(
    const Eigen::VectorXd& strata_areas,
    const Eigen::VectorXd& n_h,
    double N_h,
    const Eigen::VectorXd& p_bar_h
) {
    const Eigen::Index n = strata_areas.size();
    if (n_h.size() != n || p_bar_h.size() != n) {
        throw InvalidInputError(
            "standard error inputs have lengths " + std::to_string(n) + ", " +
            std::to_string(n_h.size()) + ", " + std::to_string(p_bar_h.size()));
    }
    if (n == 0) {
        throw DivisionByZeroError("no stratum has validation samples");
    }
    if (!(N_h > 0.0)) {
        throw DivisionByZeroError("total sample count N_h is zero");
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        if (!(n_h(i) > 0.0)) {
            throw DivisionByZeroError("stratum at position " + std::to_string(i) +
                                      " has no samples");
        }
    }

    // Sample variance S_ph^2
    Eigen::ArrayXd s_squared_ph = p_bar_h.array() * (1.0 - p_bar_h.array());
    Eigen::ArrayXd terms =
        (strata_areas.array().square() * (1.0 - n_h.array() / N_h) * s_squared_ph) /
        n_h.array();

    double variance = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        variance += terms(i);
    }
    return std::sqrt(variance);
}

} // namespace bias_correction
