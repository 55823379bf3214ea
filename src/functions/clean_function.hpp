#pragma once

#include "engine/analysis_request.hpp"
#include "engine/analysis_result.hpp"
#include "statkit/core/dataset.hpp"

namespace statkit {
namespace engine {

/**
 * @brief Missing-value handling and duplicate removal
 *
 * Options: policy, constant, missing_threshold, remove_duplicates.
 * Target columns come from the selection (empty = every column).
 *
 * Returns:
 *   - payload: CleaningResult with the new dataset and its operation log
 *   - charts: bar chart of missing cells per column before and after cleaning
 *   - interpretation: the operation log plus the resulting shape
 */
class CleanFunction {
public:
	static AnalysisResult Run(const core::Dataset &dataset, const AnalysisRequest &request);
};

} // namespace engine
} // namespace statkit
