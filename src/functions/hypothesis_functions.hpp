#pragma once

#include "engine/analysis_request.hpp"
#include "engine/analysis_result.hpp"
#include "statkit/core/dataset.hpp"

namespace statkit {
namespace engine {

/**
 * @brief Two-sample and paired t-tests
 *
 * Selection:
 *   - one variable + one grouping column: independent (or group-paired) test
 *   - two variables, no grouping column: paired test of first - second
 *
 * Options: variant (equal_variance | welch | paired), alpha, confidence_level
 *
 * Returns:
 *   - payload: TTestResult
 *   - charts: box chart per group, bar chart of group means
 *   - interpretation: decision, mean difference with its interval, effect
 *     size and the Levene check for the independent variants
 */
class TTestFunction {
public:
	static AnalysisResult Run(const core::Dataset &dataset, const AnalysisRequest &request);
};

/**
 * @brief One-way analysis of variance
 *
 * Selection: one variable + one grouping column. Options: alpha
 *
 * Returns:
 *   - payload: AnovaResult
 *   - charts: box chart per group, bar chart of group means
 */
class AnovaFunction {
public:
	static AnalysisResult Run(const core::Dataset &dataset, const AnalysisRequest &request);
};

} // namespace engine
} // namespace statkit
