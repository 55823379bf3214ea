#pragma once

#include "engine/analysis_request.hpp"
#include "engine/analysis_result.hpp"
#include "statkit/core/cancellation.hpp"
#include "statkit/core/dataset.hpp"

namespace statkit {
namespace engine {

/**
 * @brief Pearson or Spearman correlation matrix (pairwise-complete)
 *
 * Options: method (pearson | spearman), alpha
 *
 * Returns:
 *   - payload: CorrelationResult with coefficients, p-values and per-cell n
 *   - charts: correlation heatmap (one series per matrix row); for exactly two
 *     columns also a scatter of the pairwise-complete points
 *   - interpretation: one line per column pair with strength and direction
 */
class CorrelateFunction {
public:
	static AnalysisResult Run(const core::Dataset &dataset, const AnalysisRequest &request,
	                          const core::CancellationToken *cancellation);
};

} // namespace engine
} // namespace statkit
