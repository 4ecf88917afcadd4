/**
 * @file example_simple.cpp
 * @brief Simple example showing basic bias correction usage
 */

#include <bias_correction/config_io.hpp>
#include <bias_correction/errors.hpp>
#include <bias_correction/footprint_orchestrator.hpp>
#include <bias_correction/result_io.hpp>
#include <bias_correction/trend.hpp>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string>

using namespace bias_correction;

namespace {

/**
 * Synthetic validation points: the classifier misses some cropland in
 * strata 1-2 and over-predicts a little in strata 3-5.
 */
ValidationSamples simulateSamples(const YearRange& years, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> u(0.0, 1.0);

    const double p_crop[] = {0.0, 0.9, 0.6, 0.3, 0.05, 0.4};
    const double p_miss[] = {0.0, 0.10, 0.20, 0.05, 0.02, 0.30};
    const double p_false[] = {0.0, 0.05, 0.10, 0.15, 0.03, 0.25};

    ValidationSamples samples;
    for (Year year : years.years()) {
        for (StratumId stratum = 1; stratum <= 5; ++stratum) {
            for (int i = 0; i < 40; ++i) {
                int reference = u(rng) < p_crop[stratum] ? 1 : 0;
                int predicted = reference;
                if (reference == 1 && u(rng) < p_miss[stratum]) {
                    predicted = 0;
                } else if (reference == 0 && u(rng) < p_false[stratum]) {
                    predicted = 1;
                }
                samples.push_back({stratum, reference, predicted, year});
            }
        }
    }
    return samples;
}

ObservedAreaTable simulateObserved(const Config& config, double growth) {
    ObservedAreaTable table;
    for (Year year : config.years.years()) {
        double t = double(year - config.years.first);

        ObservedAreaRow gp;
        gp.year = year;
        gp.region = config.region_a_label;
        gp.areas["us_mill_acres"] = 180.0 + growth * t;
        gp.areas["canada_mill_acres"] = 45.0 + 0.2 * growth * t;
        gp.areas["mx_mill_acres"] = 6.0;
        gp.areas["total_mill_acres"] = gp.areas["us_mill_acres"] +
                                       gp.areas["canada_mill_acres"] +
                                       gp.areas["mx_mill_acres"];
        table.addRow(gp);

        ObservedAreaRow south;
        south.year = year;
        south.region = "SOUTHERN";
        south.areas["us_mill_acres"] = 8.0 + 0.1 * growth * t;
        south.areas["canada_mill_acres"] = 0.0;
        south.areas["mx_mill_acres"] = 4.5 + 0.05 * growth * t;
        south.areas["total_mill_acres"] = south.areas["us_mill_acres"] +
                                          south.areas["mx_mill_acres"];
        table.addRow(south);
    }
    return table;
}

void printSeries(const std::string& country, const CombinedSeries& series, size_t every) {
    std::cout << "\n" << country << "\n";
    std::cout << std::left << std::setw(8) << "Year"
              << std::setw(12) << "Observed"
              << std::setw(12) << "Adjusted"
              << std::setw(12) << "Adjustment"
              << std::setw(10) << "SE"
              << std::setw(10) << "CI95" << "\n";
    std::cout << std::string(64, '-') << "\n";

    for (size_t i = 0; i < series.size(); ++i) {
        if (i % every != 0 && i + 1 != series.size()) {
            continue;
        }
        const auto& r = series[i];
        std::cout << std::left << std::setw(8) << r.year
                  << std::fixed << std::setprecision(2)
                  << std::setw(12) << r.observed
                  << std::setw(12) << r.adjusted
                  << std::setw(12) << std::showpos << r.adjustment << std::noshowpos
                  << std::setw(10) << r.se
                  << std::setw(10) << r.ci_95 << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string output_path;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [options]\n\n";
            std::cout << "Options:\n";
            std::cout << "  --config PATH   JSON configuration (default: built-in study)\n";
            std::cout << "  --output PATH   Write the JSON report here\n";
            std::cout << "  --verbose, -v   Print per-component diagnostics\n";
            std::cout << "  --help, -h      Show this help\n";
            return 0;
        }
    }

    std::cout << "=== Bias Correction Simple Example ===" << std::endl;

    try {
        Config config = Config::createDefault();
        if (!config_path.empty()) {
            std::ifstream in(config_path);
            if (!in) {
                std::cerr << "ERROR: Cannot open " << config_path << "\n";
                return 1;
            }
            config = loadConfig(in);
        } else {
            config.validate();
        }
        if (verbose) {
            config.verbose = true;
        }

        std::cout << "Years: " << config.years.first << "-" << config.years.last << "\n";
        std::cout << "Subregions: " << config.region_a.name << " ("
                  << config.region_a.strata.size() << " strata), "
                  << config.region_b.name << " ("
                  << config.region_b.strata.size() << " strata)\n";

        // Simulate data (in a real application, load the accuracy points and
        // the classifier's area tables)
        ValidationSamples gp_samples = simulateSamples(config.years, 42);
        ValidationSamples mx_samples = simulateSamples(config.years, 7);
        ObservedAreaTable gross = simulateObserved(config, 1.5);
        ObservedAreaTable net = simulateObserved(config, 0.8);

        std::cout << "Validation points: " << gp_samples.size() << " + "
                  << mx_samples.size() << "\n";

        FootprintOrchestrator orchestrator(config);
        BiasReport report = orchestrator.run(gross, net, gp_samples, mx_samples);

        for (FootprintType type : {FootprintType::GROSS, FootprintType::NET}) {
            std::cout << "\n--- " << toString(type) << " footprint (combined) ---";
            for (const auto& [country, series] : report.at(type).combined) {
                printSeries(country, series, 5);
            }
        }

        TrendEstimator trend_estimator(config);
        std::cout << "\nChange since " << config.trend_start_year << " (combined):\n";
        for (FootprintType type : {FootprintType::GROSS, FootprintType::NET}) {
            for (const auto& [country, series] : report.at(type).combined) {
                TrendResult trend = trend_estimator.estimate(series);
                std::cout << "  " << std::left << std::setw(6) << toString(type)
                          << std::setw(8) << country
                          << std::fixed << std::setprecision(2)
                          << std::showpos << trend.total_change << std::noshowpos
                          << " +/- " << trend.error << " ("
                          << trend.first_year << "-" << trend.last_year << ")\n";
            }
        }

        if (verbose) {
            const FootprintResults& gross_results = report.at(FootprintType::GROSS);
            std::cout << "\nLast year, gross footprint:\n";
            for (const auto& [country, series] : gross_results.region_a) {
                std::cout << "  " << config.region_a.name << "/" << country << ": "
                          << series.back().toString() << "\n";
            }
            for (const auto& [country, series] : gross_results.combined) {
                std::cout << "  combined/" << country << ": "
                          << series.back().toString() << "\n";
            }
        }

        if (!output_path.empty()) {
            std::ofstream out(output_path);
            if (!out) {
                std::cerr << "ERROR: Cannot write " << output_path << "\n";
                return 1;
            }
            writeReport(out, report, 2);
            std::cout << "\nReport written to " << output_path << "\n";
        } else {
            std::ostringstream buffer;
            writeReport(buffer, report);
            std::cout << "\nJSON report size: " << buffer.str().size() << " bytes\n";
        }
    } catch (const BiasCorrectionError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Example Complete ===" << std::endl;
    return 0;
}
