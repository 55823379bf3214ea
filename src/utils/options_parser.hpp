#pragma once

#include "statkit/core/analysis_options.hpp"
#include "statkit/core/regression_options.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace statkit {
namespace engine {

/// A single configuration value as supplied by the caller
using OptionValue = std::variant<bool, int64_t, double, std::string>;

/// Raw analysis configuration: option name -> value
using OptionMap = std::map<std::string, OptionValue>;

/// Name of the held alternative ("bool", "integer", "double", "string")
const char *OptionTypeName(const OptionValue &value);

/// Textual form of a value, used in log lines and error messages
std::string FormatOptionValue(const OptionValue &value);

/**
 * Converts an OptionMap into the typed options struct of one analysis
 *
 * Rules shared by every analysis:
 * - keys are case-insensitive ("Alpha" and "alpha" are the same key, giving
 *   both is an error)
 * - unknown keys fail with InvalidConfigError listing the valid keys
 * - integers are accepted where a double is expected, and 0/1 where a bool is
 *   expected
 * - any other type mismatch fails with InvalidConfigError
 * - the parsed struct is validated before it is returned (except where the
 *   check needs the data, e.g. k against the row count)
 *
 * Recognised keys (defaults in parentheses):
 *   CleaningOptions:    policy (drop_row), constant, missing_threshold (0.5), remove_duplicates (false)
 *   TTestOptions:       variant (equal_variance), alpha (0.05), confidence_level (0.95)
 *   AnovaOptions:       alpha (0.05)
 *   CorrelationOptions: method (pearson), alpha (0.05)
 *   RegressionOptions:  intercept (true), confidence_level (0.95), alpha (0.05), qr_tolerance (-1 = auto)
 *   PcaOptions:         components (all columns), standardize (true)
 *   KMeansOptions:      k (required), init (farthest_first), seed (42), max_iterations (300),
 *                       tolerance (1e-4), standardize (false)
 */
class OptionsParser {
public:
	template <typename T>
	static T Parse(const OptionMap &options);

	/// Analyses without options (describe) still reject unknown keys
	static void ExpectEmpty(const OptionMap &options, const std::string &analysis);

	/// Valid keys of an analysis, in documentation order
	static const std::vector<std::string> &ValidKeys(const std::string &analysis);

private:
	OptionsParser() = delete;
};

template <>
core::CleaningOptions OptionsParser::Parse<core::CleaningOptions>(const OptionMap &options);

template <>
core::TTestOptions OptionsParser::Parse<core::TTestOptions>(const OptionMap &options);

template <>
core::AnovaOptions OptionsParser::Parse<core::AnovaOptions>(const OptionMap &options);

template <>
core::CorrelationOptions OptionsParser::Parse<core::CorrelationOptions>(const OptionMap &options);

template <>
core::RegressionOptions OptionsParser::Parse<core::RegressionOptions>(const OptionMap &options);

template <>
core::PcaOptions OptionsParser::Parse<core::PcaOptions>(const OptionMap &options);

template <>
core::KMeansOptions OptionsParser::Parse<core::KMeansOptions>(const OptionMap &options);

} // namespace engine
} // namespace statkit
