/**
 * @file result_io.cpp
 * @brief Implementation of JSON result conversion
 */

#include "bias_correction/result_io.hpp"
#include "bias_correction/errors.hpp"
#include <istream>
#include <ostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace bias_correction {

namespace {

const std::vector<std::string> kAdjustmentColumns = {
    "year", "observed", "adjusted", "adjustment", "se", "ci_95"
};

const std::vector<std::string> kCombinedColumns = {
    "year", "observed", "adjusted", "adjustment", "se", "ci_95", "n_subregions"
};

/**
 * @brief Column name -> position for a split-layout table
 */
std::map<std::string, size_t> columnIndex(const json& j,
                                          const std::vector<std::string>& required) {
    if (!j.is_object() || !j.contains("columns") || !j.contains("data")) {
        throw InvalidInputError("series must be an object with 'columns' and 'data'");
    }
    const json& columns = j.at("columns");
    if (!columns.is_array()) {
        throw InvalidInputError("'columns' must be an array");
    }

    std::map<std::string, size_t> index;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (!columns[i].is_string()) {
            throw InvalidInputError("column name at position " + std::to_string(i) +
                                    " is not a string");
        }
        index[columns[i].get<std::string>()] = i;
    }
    for (const auto& name : required) {
        if (index.count(name) == 0) {
            throw InvalidInputError("series lacks column '" + name + "'");
        }
    }
    if (!j.at("data").is_array()) {
        throw InvalidInputError("'data' must be an array of rows");
    }
    return index;
}

const json& cell(const json& row, size_t pos, size_t row_number) {
    if (!row.is_array() || pos >= row.size()) {
        throw InvalidInputError("row " + std::to_string(row_number) + " is too short");
    }
    const json& value = row[pos];
    if (!value.is_number()) {
        throw InvalidInputError("row " + std::to_string(row_number) + ", position " +
                                std::to_string(pos) + " is not a number");
    }
    return value;
}

const json& integerCell(const json& row, size_t pos, size_t row_number) {
    const json& value = cell(row, pos, row_number);
    if (!value.is_number_integer()) {
        throw InvalidInputError("row " + std::to_string(row_number) + ", position " +
                                std::to_string(pos) + " is not an integer");
    }
    return value;
}

template <typename Record>
void readCommonFields(Record& r, const json& row, const std::map<std::string, size_t>& idx,
                      size_t row_number) {
    r.year = integerCell(row, idx.at("year"), row_number).get<Year>();
    r.observed = cell(row, idx.at("observed"), row_number).get<double>();
    r.adjusted = cell(row, idx.at("adjusted"), row_number).get<double>();
    r.adjustment = cell(row, idx.at("adjustment"), row_number).get<double>();
    r.se = cell(row, idx.at("se"), row_number).get<double>();
    r.ci_95 = cell(row, idx.at("ci_95"), row_number).get<double>();
}

template <typename Series, typename Convert>
json countriesToJson(const std::map<CountryCode, Series>& results, Convert convert) {
    json j = json::object();
    for (const auto& [country, series] : results) {
        j[country] = convert(series);
    }
    return j;
}

template <typename Series, typename Convert>
std::map<CountryCode, Series> countriesFromJson(const json& j, Convert convert) {
    if (!j.is_object()) {
        throw InvalidInputError("scope entry must map country codes to series");
    }
    std::map<CountryCode, Series> out;
    for (const auto& [country, series] : j.items()) {
        out[country] = convert(series);
    }
    return out;
}

} // namespace

// ============================================================================
// Enum parsing
// ============================================================================

FootprintType footprintTypeFromString(const std::string& name) {
    if (name == "gross") return FootprintType::GROSS;
    if (name == "net") return FootprintType::NET;
    throw InvalidInputError("unknown footprint type '" + name + "'");
}

Scope scopeFromString(const std::string& name) {
    if (name == "combined") return Scope::COMBINED;
    if (name == "region_a") return Scope::REGION_A;
    if (name == "region_b") return Scope::REGION_B;
    throw InvalidInputError("unknown scope '" + name + "'");
}

// ============================================================================
// Series
// ============================================================================

json seriesToJson(const AdjustmentSeries& series) {
    json data = json::array();
    for (const auto& r : series) {
        data.push_back(json::array({r.year, r.observed, r.adjusted, r.adjustment, r.se, r.ci_95}));
    }
    return json{{"columns", kAdjustmentColumns}, {"data", data}};
}

json seriesToJson(const CombinedSeries& series) {
    json data = json::array();
    for (const auto& r : series) {
        data.push_back(json::array({r.year, r.observed, r.adjusted, r.adjustment, r.se,
                                    r.ci_95, r.n_subregions}));
    }
    return json{{"columns", kCombinedColumns}, {"data", data}};
}

AdjustmentSeries adjustmentSeriesFromJson(const json& j) {
    auto idx = columnIndex(j, kAdjustmentColumns);
    const json& data = j.at("data");

    AdjustmentSeries series;
    series.reserve(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        AdjustmentResult r;
        readCommonFields(r, data[i], idx, i);
        series.push_back(r);
    }
    return series;
}

CombinedSeries combinedSeriesFromJson(const json& j) {
    // n_subregions is optional so that plain adjustment tables load as pass-through
    auto idx = columnIndex(j, kAdjustmentColumns);
    const json& data = j.at("data");
    auto n_it = idx.find("n_subregions");

    CombinedSeries series;
    series.reserve(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        CombinedResult r;
        readCommonFields(r, data[i], idx, i);
        r.n_subregions = (n_it == idx.end())
            ? 1
            : integerCell(data[i], n_it->second, i).get<int>();
        series.push_back(r);
    }
    return series;
}

// ============================================================================
// Report
// ============================================================================

json reportToJson(const BiasReport& report) {
    json j = json::object();
    for (const auto& [type, results] : report.footprints) {
        auto adjustment_series = [](const AdjustmentSeries& s) { return seriesToJson(s); };
        auto combined_series = [](const CombinedSeries& s) { return seriesToJson(s); };

        json footprint = json::object();
        footprint[toString(Scope::COMBINED)] = countriesToJson(results.combined, combined_series);
        footprint[toString(Scope::REGION_A)] = countriesToJson(results.region_a, adjustment_series);
        footprint[toString(Scope::REGION_B)] = countriesToJson(results.region_b, adjustment_series);
        j[toString(type)] = footprint;
    }
    return j;
}

BiasReport reportFromJson(const json& j) {
    if (!j.is_object()) {
        throw InvalidInputError("report root must be an object keyed by footprint type");
    }

    BiasReport report;
    for (const auto& [type_name, footprint] : j.items()) {
        FootprintType type = footprintTypeFromString(type_name);
        if (!footprint.is_object()) {
            throw InvalidInputError("footprint '" + type_name + "' must be an object");
        }

        FootprintResults results;
        for (const auto& [scope_name, countries] : footprint.items()) {
            switch (scopeFromString(scope_name)) {
                case Scope::COMBINED:
                    results.combined = countriesFromJson<CombinedSeries>(
                        countries, [](const json& s) { return combinedSeriesFromJson(s); });
                    break;
                case Scope::REGION_A:
                    results.region_a = countriesFromJson<AdjustmentSeries>(
                        countries, [](const json& s) { return adjustmentSeriesFromJson(s); });
                    break;
                case Scope::REGION_B:
                    results.region_b = countriesFromJson<AdjustmentSeries>(
                        countries, [](const json& s) { return adjustmentSeriesFromJson(s); });
                    break;
            }
        }
        report.footprints[type] = std::move(results);
    }
    return report;
}

void writeReport(std::ostream& out, const BiasReport& report, int indent) {
    out << reportToJson(report).dump(indent);
}

BiasReport readReport(std::istream& in) {
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw InvalidInputError(std::string("cannot parse report: ") + e.what());
    }
    return reportFromJson(j);
}

} // namespace bias_correction
