/**
 * @file test_config.cpp
 * @brief Default study configuration, JSON loading and validation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <bias_correction/config_io.hpp>
#include <bias_correction/errors.hpp>
#include "test_helpers.hpp"
#include <sstream>

using namespace bias_correction;
using namespace test_helpers;
using Catch::Approx;
using json = nlohmann::json;

TEST_CASE("Default configuration describes the cropland study", "[Config]")
{
    Config cfg = Config::createDefault();

    REQUIRE(cfg.years.first == 1996);
    REQUIRE(cfg.years.last == 2021);
    REQUIRE(cfg.years.size() == 26);
    REQUIRE(cfg.country_columns.size() == 4);
    REQUIRE(cfg.region_a_label == "GREAT PLAINS");
    REQUIRE(cfg.region_exclusive_countries.count("canada") == 1);
    REQUIRE(cfg.trend_start_year == 2000);

    REQUIRE(cfg.region_a.strata.size() == 5);
    REQUIRE(cfg.region_a.strata.weight(4) == 0.5540253044095518);
    REQUIRE(cfg.region_b.strata.weight(1) == 0.03336170578959062);
    REQUIRE(cfg.region_a.overlap_areas.at("total") == Approx(690.1233086775592));
    REQUIRE(cfg.region_b.overlap_areas.at("canada") == 0.0);

    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("Strata iterate in ascending id order", "[Config]")
{
    StrataDefinitions strata({{5, 0.1}, {2, 0.4}, {3, 0.5}});
    std::vector<StratumId> ids;
    for (const auto& s : strata) {
        ids.push_back(s.id);
    }
    REQUIRE(ids == std::vector<StratumId>{2, 3, 5});
    REQUIRE(strata.totalWeight() == Approx(1.0));
    REQUIRE_THROWS_AS(strata.weight(4), ConfigurationError);
    REQUIRE_THROWS_AS(StrataDefinitions({{1, 1.5}}), ConfigurationError);
}

TEST_CASE("Subregion lookup by scope", "[Config]")
{
    Config cfg = smallConfig();
    REQUIRE(cfg.subregion(Scope::REGION_A).name == "north");
    REQUIRE(cfg.subregion(Scope::REGION_B).name == "south");
    REQUIRE_THROWS_AS(cfg.subregion(Scope::COMBINED), InvalidInputError);
}

TEST_CASE("Validation rejects inconsistent designs", "[Config]")
{
    Config cfg = smallConfig();
    REQUIRE_NOTHROW(cfg.validate());

    SECTION("weights not summing to one")
    {
        cfg.region_b.strata = StrataDefinitions({{1, 0.25}, {2, 0.7}});
        REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
    }

    SECTION("column without an overlap area")
    {
        cfg.country_columns.push_back("mx_mill_acres");
        REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
    }

    SECTION("negative overlap area")
    {
        cfg.region_a.overlap_areas["us"] = -1.0;
        REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
    }

    SECTION("empty year range")
    {
        cfg.years = YearRange{2010, 2009};
        REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
    }
}

TEST_CASE("JSON overrides defaults key by key", "[Config]")
{
    json j = {
        {"first_year", 2000},
        {"last_year", 2005},
        {"verbose", false},
        {"subregions", {
            {"region_b", {
                {"strata_proportions", {{"1", 0.5}, {"2", 0.5}}}
            }}
        }}
    };

    Config cfg = configFromJson(j);
    REQUIRE(cfg.years.first == 2000);
    REQUIRE(cfg.years.last == 2005);
    REQUIRE(cfg.region_b.strata.size() == 2);
    REQUIRE(cfg.region_b.overlap_areas.at("mx") == Approx(141.51));
    REQUIRE(cfg.region_a.strata.size() == 5);
}

TEST_CASE("Configuration survives a JSON round trip", "[Config]")
{
    Config original = smallConfig();
    original.trend_start_year = 2001;
    std::stringstream in(configToJson(original).dump());
    Config loaded = loadConfig(in);

    REQUIRE(loaded.years.first == original.years.first);
    REQUIRE(loaded.trend_start_year == 2001);
    REQUIRE(loaded.country_columns == original.country_columns);
    REQUIRE(loaded.region_a_label == original.region_a_label);
    REQUIRE(loaded.region_a.strata.proportions() == original.region_a.strata.proportions());
    REQUIRE(loaded.region_b.overlap_areas == original.region_b.overlap_areas);
    REQUIRE(loaded.region_exclusive_countries == original.region_exclusive_countries);
}

TEST_CASE("Malformed configuration", "[Config]")
{
    SECTION("non-integer stratum id")
    {
        json j = {{"subregions", {{"region_a", {{"strata_proportions", {{"one", 1.0}}}}}}}};
        REQUIRE_THROWS_AS(configFromJson(j), ConfigurationError);
    }

    SECTION("wrong value type")
    {
        json j = {{"first_year", "nineteen"}};
        REQUIRE_THROWS_AS(configFromJson(j), ConfigurationError);
    }

    SECTION("unparsable stream")
    {
        std::stringstream in("[1, 2");
        REQUIRE_THROWS_AS(loadConfig(in), ConfigurationError);
    }

    SECTION("valid JSON, invalid design")
    {
        std::stringstream in(R"({"subregions": {"region_a": {"strata_proportions": {"1": 0.2}}}})");
        REQUIRE_THROWS_AS(loadConfig(in), ConfigurationError);
    }
}

TEST_CASE("Sample validation", "[Config]")
{
    StrataDefinitions strata({{1, 0.6}, {2, 0.4}});
    REQUIRE_NOTHROW(validateSamples(scenarioOneSamples(2000), strata));

    ValidationSamples bad_label = {{1, 1, 3, 2000}};
    REQUIRE_THROWS_AS(validateSamples(bad_label, strata), InvalidInputError);

    ValidationSamples bad_stratum = {{7, 1, 1, 2000}};
    REQUIRE_THROWS_AS(validateSamples(bad_stratum, strata), ConfigurationError);
}
