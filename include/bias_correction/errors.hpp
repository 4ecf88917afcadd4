/**
 * @file errors.hpp
 * @brief Exception types raised by the estimator
 *
 * Every error propagates to the caller unhandled; the estimator never
 * substitutes a default value for a failed calculation.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace bias_correction {

/**
 * @brief Base class for all estimator errors
 */
class BiasCorrectionError : public std::runtime_error {
public:
    explicit BiasCorrectionError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Malformed or mismatched-length inputs to a calculation
class InvalidInputError : public BiasCorrectionError {
public:
    explicit InvalidInputError(const std::string& what)
        : BiasCorrectionError("invalid input: " + what) {}
};

/// A calculation would divide by a zero denominator
class DivisionByZeroError : public BiasCorrectionError {
public:
    explicit DivisionByZeroError(const std::string& what)
        : BiasCorrectionError("division by zero: " + what) {}
};

/// Requested year or column has no row in the observed-area table
class MissingDataError : public BiasCorrectionError {
public:
    explicit MissingDataError(const std::string& what)
        : BiasCorrectionError("missing data: " + what) {}
};

/// Two series to combine do not share the same years in the same order
class AlignmentError : public BiasCorrectionError {
public:
    explicit AlignmentError(const std::string& what)
        : BiasCorrectionError("misaligned series: " + what) {}
};

/// Configuration does not cover a referenced country or stratum
class ConfigurationError : public BiasCorrectionError {
public:
    explicit ConfigurationError(const std::string& what)
        : BiasCorrectionError("configuration: " + what) {}
};

} // namespace bias_correction
