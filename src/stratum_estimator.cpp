/**
 * @file stratum_estimator.cpp
 * @brief Implementation of StratumEstimator
 */

#include "bias_correction/stratum_estimator.hpp"
#include "bias_correction/area_adjuster.hpp"
#include "bias_correction/error_rates.hpp"
#include "bias_correction/standard_error.hpp"
#include <Eigen/Dense>
#include <iostream>
#include <utility>

namespace bias_correction {

StratumEstimator::StratumEstimator(const Config& config)
    : cfg_(config) {
}

AdjustmentResult StratumEstimator::estimate(
    double observed_area,
    const ValidationSamples& samples,
    const StrataDefinitions& strata,
    double total_area
) const {
    return estimateDetailed(observed_area, samples, strata, total_area).result;
}

StratumEstimate StratumEstimator::estimateDetailed(
    double observed_area,
    const ValidationSamples& samples,
    const StrataDefinitions& strata,
    double total_area
) const {
    validateSamples(samples, strata);

    std::vector<StratumContribution> used;
    used.reserve(strata.size());

    for (const auto& stratum : strata) {
        ValidationSamples stratum_samples = filterByStratum(samples, stratum.id);
        if (stratum_samples.empty()) {
            continue;
        }

        StratumContribution c;
        c.id = stratum.id;
        c.weight = stratum.weight;
        c.area = stratum.weight * total_area;
        c.rates = ErrorRateCalculator::compute(stratum_samples);
        c.n_samples = stratum_samples.size();

        double reference_sum = 0.0;
        for (const auto& s : stratum_samples) {
            reference_sum += s.reference_label;
        }
        c.p_bar = reference_sum / double(c.n_samples);
        c.adjustment = 0.0;

        used.push_back(c);
    }

    // Parallel vectors over the strata actually present
    const Eigen::Index n = Eigen::Index(used.size());
    Eigen::VectorXd areas(n), commission(n), omission(n), proportions(n), n_h(n), p_bar_h(n);
    double N_h = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& c = used[size_t(i)];
        areas(i) = c.area;
        commission(i) = c.rates.commission_rate;
        omission(i) = c.rates.omission_rate;
        proportions(i) = c.weight;
        n_h(i) = double(c.n_samples);
        p_bar_h(i) = c.p_bar;
        N_h += double(c.n_samples);
    }

    AreaAdjustment adjustment = AreaAdjuster::adjust(areas, commission, omission, proportions);
    for (Eigen::Index i = 0; i < n; ++i) {
        used[size_t(i)].adjustment = adjustment.per_stratum(i);
    }

    double se = StandardErrorEstimator::compute(areas, n_h, N_h, p_bar_h);

    StratumEstimate est;
    est.result.observed = observed_area;
    est.result.adjustment = adjustment.total;
    est.result.adjusted = observed_area + adjustment.total;
    est.result.se = se;
    est.result.ci_95 = kCi95Z * se;
    est.contributions = std::move(used);

    if (cfg_.verbose) {
        std::cout << "[StratumEstimator] " << est.contributions.size() << "/"
                  << strata.size() << " strata sampled, N_h=" << N_h
                  << ", adjustment=" << est.result.adjustment
                  << ", se=" << est.result.se << "\n";
    }

    return est;
}

} // namespace bias_correction
