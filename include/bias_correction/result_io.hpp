/**
 * @file result_io.hpp
 * @brief JSON conversion of adjusted-area results
 *
 * Each country series is stored in "split" layout:
 * {"columns": ["year", "observed", ...], "data": [[1996, 12.5, ...], ...]}
 * nested as {footprint: {scope: {country: series}}}. Doubles are written in
 * shortest round-trip form, so a reloaded report is bit-identical.
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <nlohmann/json.hpp>
#include <iosfwd>
#include <string>

namespace bias_correction {

/// Inverse of toString(); @throws InvalidInputError on an unknown name
FootprintType footprintTypeFromString(const std::string& name);

/// Inverse of toString(); @throws InvalidInputError on an unknown name
Scope scopeFromString(const std::string& name);

nlohmann::json seriesToJson(const AdjustmentSeries& series);
nlohmann::json seriesToJson(const CombinedSeries& series);

/// @throws InvalidInputError on a malformed document
AdjustmentSeries adjustmentSeriesFromJson(const nlohmann::json& j);

/// @throws InvalidInputError on a malformed document
CombinedSeries combinedSeriesFromJson(const nlohmann::json& j);

nlohmann::json reportToJson(const BiasReport& report);

/// @throws InvalidInputError on a malformed document or unknown key
BiasReport reportFromJson(const nlohmann::json& j);

/**
 * @brief Write a report as JSON text
 * @param indent Pretty-print indent, -1 for compact
 */
void writeReport(std::ostream& out, const BiasReport& report, int indent = -1);

/// @throws InvalidInputError if the stream is not a valid report
BiasReport readReport(std::istream& in);

} // namespace bias_correction
