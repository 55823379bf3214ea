#pragma once

#include "engine/analysis_request.hpp"
#include "engine/analysis_result.hpp"
#include "statkit/core/dataset.hpp"

namespace statkit {
namespace engine {

/**
 * @brief Per-column descriptive statistics
 *
 * Numeric columns get summary statistics, categorical and text columns get a
 * frequency table. An empty selection describes every column. No options.
 *
 * Returns:
 *   - payload: DescriptiveResult
 *   - charts: one box chart over all numeric columns, one bar chart per
 *     categorical/text column
 */
class DescribeFunction {
public:
	static AnalysisResult Run(const core::Dataset &dataset, const AnalysisRequest &request);
};

} // namespace engine
} // namespace statkit
