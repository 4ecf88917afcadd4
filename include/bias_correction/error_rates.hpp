/**
 * @file error_rates.hpp
 * @brief Commission / omission error rates from a 2x2 confusion matrix
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <cstdint>

namespace bias_correction {

/**
 * @brief Reference (rows) x prediction (columns) counts over labels {0, 1}
 */
struct ConfusionMatrix {
    int64_t true_negative = 0;   ///< reference 0, predicted 0
    int64_t false_positive = 0;  ///< reference 0, predicted 1
    int64_t false_negative = 0;  ///< reference 1, predicted 0
    int64_t true_positive = 0;   ///< reference 1, predicted 1

    int64_t total() const {
        return true_negative + false_positive + false_negative + true_positive;
    }
};

/**
 * @brief Error rates of one stratum's validation samples
 *
 * The label universe is fixed to {0, 1}; a stratum where only one class was
 * observed still yields a well-formed 2x2 matrix.
 */
class ErrorRateCalculator {
public:
    /**
     * @brief Count samples into the 2x2 matrix
     * @throws InvalidInputError if a label is not 0 or 1
     */
    static ConfusionMatrix confusionMatrix(const ValidationSamples& samples);

    /**
     * @brief Rates from a confusion matrix
     *
     * commission = fp / (fp + tp), omission = fn / (fn + tp); a zero
     * denominator gives a rate of 0.
     */
    static StratumErrorRates fromMatrix(const ConfusionMatrix& cm);

    /**
     * @brief Rates of a single stratum's samples, (0, 0) when empty
     */
    static StratumErrorRates compute(const ValidationSamples& stratum_samples);
};

} // namespace bias_correction
