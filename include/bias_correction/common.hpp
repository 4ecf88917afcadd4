/**
 * @file common.hpp
 * @brief Common types, enums, and utilities for bias-adjusted area estimation
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace bias_correction {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Area footprint definition
 */
enum class FootprintType {
    GROSS,  ///< Cumulative (total ever observed) footprint
    NET     ///< Annual (active in year) footprint
};

/**
 * @brief Geographic scope of a result set
 */
enum class Scope {
    COMBINED,  ///< Both subregions merged
    REGION_A,  ///< First subregion only
    REGION_B   ///< Second subregion only
};

// ============================================================================
// String conversions
// ============================================================================

inline std::string toString(FootprintType type) {
    switch (type) {
        case FootprintType::GROSS: return "gross";
        case FootprintType::NET: return "net";
        default: return "unknown";
    }
}

inline std::string toString(Scope scope) {
    switch (scope) {
        case Scope::COMBINED: return "combined";
        case Scope::REGION_A: return "region_a";
        case Scope::REGION_B: return "region_b";
        default: return "unknown";
    }
}

// ============================================================================
// Type aliases for clarity
// ============================================================================

using StratumId = int32_t;
using Year = int32_t;
using CountryCode = std::string;

/// Total region area per country code (includes the "total" aggregate)
using OverlapAreas = std::map<CountryCode, double>;

/// Two-sided 95% normal-approximation multiplier
constexpr double kCi95Z = 1.96;

/**
 * @brief Inclusive year range [first, last]
 */
struct YearRange {
    Year first = 1996;
    Year last = 2021;

    bool empty() const { return last < first; }
    size_t size() const { return empty() ? 0 : size_t(last - first + 1); }

    std::vector<Year> years() const {
        std::vector<Year> out;
        out.reserve(size());
        for (Year y = first; y <= last; ++y) {
            out.push_back(y);
        }
        return out;
    }
};

} // namespace bias_correction
