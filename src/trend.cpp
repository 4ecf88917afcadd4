/**
 * @file trend.cpp
 * @brief Implementation of TrendEstimator
 */

#include "bias_correction/trend.hpp"
#include "bias_correction/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace bias_correction {

namespace {

template <typename Series>
TrendResult estimateSeries(const Series& series, const Config& cfg) {
    std::vector<Year> years;
    std::vector<double> values;
    for (const auto& r : series) {
        if (r.year >= cfg.trend_start_year) {
            years.push_back(r.year);
            values.push_back(r.adjusted);
        }
    }

    TrendResult trend = TrendEstimator::fit(years, values);

    if (cfg.verbose) {
        std::cout << "[TrendEstimator] " << trend.first_year << "-" << trend.last_year
                  << " (" << trend.n_points << " years): change=" << trend.total_change
                  << " +/- " << trend.error << "\n";
    }
    return trend;
}

} // namespace

TrendEstimator::TrendEstimator(const Config& config)
    : cfg_(config) {
}

TrendResult TrendEstimator::estimate(const AdjustmentSeries& series) const {
    return estimateSeries(series, cfg_);
}

TrendResult TrendEstimator::estimate(const CombinedSeries& series) const {
    return estimateSeries(series, cfg_);
}

TrendResult TrendEstimator::fit(const std::vector<Year>& years,
                                const std::vector<double>& values) {
    if (years.size() != values.size()) {
        throw InvalidInputError(
            "trend inputs have lengths " + std::to_string(years.size()) + " and " +
            std::to_string(values.size()));
    }
    if (years.size() < 3) {
        throw InvalidInputError(
            "trend needs at least 3 years, got " + std::to_string(years.size()));
    }

    const Eigen::Index n = Eigen::Index(years.size());

    // Centre years so the intercept column stays orthogonal to the slope column
    double mean_year = 0.0;
    for (Year y : years) {
        mean_year += double(y);
    }
    mean_year /= double(n);

    Eigen::MatrixXd X(n, 2);
    Eigen::VectorXd y(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        X(i, 0) = 1.0;
        X(i, 1) = double(years[size_t(i)]) - mean_year;
        y(i) = values[size_t(i)];
    }

    const double sxx = X.col(1).squaredNorm();
    if (!(sxx > 0.0)) {
        throw DivisionByZeroError("all trend points share one year");
    }

    Eigen::Vector2d beta = X.colPivHouseholderQr().solve(y);
    Eigen::VectorXd residuals = y - X * beta;
    const double ssr = residuals.squaredNorm();

    TrendResult trend;
    trend.first_year = *std::min_element(years.begin(), years.end());
    trend.last_year = *std::max_element(years.begin(), years.end());
    trend.n_points = years.size();
    trend.slope = beta(1);
    trend.slope_se = std::sqrt(ssr / double(n - 2) / sxx);

    const double span = double(trend.last_year - trend.first_year);
    trend.total_change = trend.slope * span;
    trend.error = trend.slope_se * span;
    return trend;
}

} // namespace bias_correction
