/**
 * @file config_io.hpp
 * @brief JSON reading and writing of Config
 */

#pragma once

#include "config.hpp"
#include <nlohmann/json.hpp>
#include <iosfwd>

namespace bias_correction {

/**
 * @brief Build a Config from JSON; absent keys keep their createDefault() value
 * @throws ConfigurationError on malformed values
 */
Config configFromJson(const nlohmann::json& j);

nlohmann::json configToJson(const Config& config);

/**
 * @brief Parse, build and validate a Config from a JSON stream
 */
Config loadConfig(std::istream& in);

} // namespace bias_correction
