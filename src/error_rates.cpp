/**
 * @file error_rates.cpp
 * @brief Implementation of ErrorRateCalculator
 */

#include "bias_correction/error_rates.hpp"
#include "bias_correction/errors.hpp"

namespace bias_correction {

ConfusionMatrix ErrorRateCalculator::confusionMatrix(const ValidationSamples& samples) {
    ConfusionMatrix cm;
    for (const auto& s : samples) {
        const bool ref_ok = s.reference_label == 0 || s.reference_label == 1;
        const bool pred_ok = s.predicted_label == 0 || s.predicted_label == 1;
        if (!ref_ok || !pred_ok) {
            throw InvalidInputError(
                "label pair (" + std::to_string(s.reference_label) + ", " +
                std::to_string(s.predicted_label) + ") in stratum " +
                std::to_string(s.stratum_id) + " is outside {0, 1}");
        }

        if (s.reference_label == 0) {
            if (s.predicted_label == 0) {
                cm.true_negative++;
            } else {
                cm.false_positive++;
            }
        } else {
            if (s.predicted_label == 0) {
                cm.false_negative++;
            } else {
                cm.true_positive++;
            }
        }
    }
    return cm;
}

StratumErrorRates ErrorRateCalculator::fromMatrix(const ConfusionMatrix& cm) {
    StratumErrorRates rates;
    if (cm.total() == 0) {
        return rates;
    }

    const int64_t predicted_positive = cm.false_positive + cm.true_positive;
    const int64_t reference_positive = cm.false_negative + cm.true_positive;

    rates.commission_rate = predicted_positive > 0
        ? double(cm.false_positive) / double(predicted_positive)
        : 0.0;
    rates.omission_rate = reference_positive > 0
        ? double(cm.false_negative) / double(reference_positive)
        : 0.0;
    return rates;
}

StratumErrorRates ErrorRateCalculator::compute(const ValidationSamples& stratum_samples) {
    return fromMatrix(confusionMatrix(stratum_samples));
}

} // namespace bias_correction
