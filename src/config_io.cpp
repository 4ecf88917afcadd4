/**
 * @file config_io.cpp
 * @brief JSON reading and writing of Config
 */

#include "bias_correction/config_io.hpp"
#include "bias_correction/errors.hpp"
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace bias_correction {

namespace {

StrataDefinitions strataFromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("strata_proportions must be an object of id -> weight");
    }
    std::map<StratumId, double> proportions;
    for (const auto& [key, value] : j.items()) {
        StratumId id;
        try {
            size_t pos = 0;
            id = std::stoi(key, &pos);
            if (pos != key.size()) {
                throw std::invalid_argument(key);
            }
        } catch (const std::exception&) {
            throw ConfigurationError("stratum id '" + key + "' is not an integer");
        }
        if (!value.is_number()) {
            throw ConfigurationError("weight of stratum " + key + " is not a number");
        }
        proportions[id] = value.get<double>();
    }
    return StrataDefinitions(proportions);
}

json strataToJson(const StrataDefinitions& strata) {
    json j = json::object();
    for (const auto& s : strata) {
        j[std::to_string(s.id)] = s.weight;
    }
    return j;
}

SubregionConfig subregionFromJson(const json& j, SubregionConfig base) {
    if (!j.is_object()) {
        throw ConfigurationError("subregion entry must be an object");
    }
    if (j.contains("name")) {
        base.name = j.at("name").get<std::string>();
    }
    if (j.contains("strata_proportions")) {
        base.strata = strataFromJson(j.at("strata_proportions"));
    }
    if (j.contains("overlap_areas")) {
        base.overlap_areas = j.at("overlap_areas").get<OverlapAreas>();
    }
    return base;
}

json subregionToJson(const SubregionConfig& sub) {
    return json{
        {"name", sub.name},
        {"strata_proportions", strataToJson(sub.strata)},
        {"overlap_areas", sub.overlap_areas}
    };
}

} // namespace

Config configFromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("configuration root must be a JSON object");
    }

    Config cfg = Config::createDefault();
    try {
        if (j.contains("first_year")) {
            cfg.years.first = j.at("first_year").get<Year>();
        }
        if (j.contains("last_year")) {
            cfg.years.last = j.at("last_year").get<Year>();
        }
        if (j.contains("country_columns")) {
            cfg.country_columns = j.at("country_columns").get<std::vector<std::string>>();
        }
        if (j.contains("column_separator")) {
            auto sep = j.at("column_separator").get<std::string>();
            if (sep.size() != 1) {
                throw ConfigurationError("column_separator must be a single character");
            }
            cfg.column_separator = sep[0];
        }
        if (j.contains("region_a_label")) {
            cfg.region_a_label = j.at("region_a_label").get<std::string>();
        }
        if (j.contains("region_exclusive_countries")) {
            cfg.region_exclusive_countries =
                j.at("region_exclusive_countries").get<std::set<CountryCode>>();
        }
        if (j.contains("trend_start_year")) {
            cfg.trend_start_year = j.at("trend_start_year").get<Year>();
        }
        if (j.contains("weight_tolerance")) {
            cfg.weight_tolerance = j.at("weight_tolerance").get<double>();
        }
        if (j.contains("verbose")) {
            cfg.verbose = j.at("verbose").get<bool>();
        }
        if (j.contains("subregions")) {
            const auto& subs = j.at("subregions");
            if (subs.contains("region_a")) {
                cfg.region_a = subregionFromJson(subs.at("region_a"), cfg.region_a);
            }
            if (subs.contains("region_b")) {
                cfg.region_b = subregionFromJson(subs.at("region_b"), cfg.region_b);
            }
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("malformed JSON value: ") + e.what());
    }

    return cfg;
}

json configToJson(const Config& config) {
    return json{
        {"first_year", config.years.first},
        {"last_year", config.years.last},
        {"country_columns", config.country_columns},
        {"column_separator", std::string(1, config.column_separator)},
        {"region_a_label", config.region_a_label},
        {"region_exclusive_countries", config.region_exclusive_countries},
        {"trend_start_year", config.trend_start_year},
        {"weight_tolerance", config.weight_tolerance},
        {"verbose", config.verbose},
        {"subregions", {
            {"region_a", subregionToJson(config.region_a)},
            {"region_b", subregionToJson(config.region_b)}
        }}
    };
}

Config loadConfig(std::istream& in) {
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("cannot parse configuration: ") + e.what());
    }

    Config cfg = configFromJson(j);
    cfg.validate();

    if (cfg.verbose) {
        std::cout << "[Config] years " << cfg.years.first << "-" << cfg.years.last
                  << ", " << cfg.country_columns.size() << " country columns\n";
        std::cout << "  " << cfg.region_a.name << ": " << cfg.region_a.strata.size()
                  << " strata, " << cfg.region_b.name << ": "
                  << cfg.region_b.strata.size() << " strata\n";
    }
    return cfg;
}

} // namespace bias_correction
