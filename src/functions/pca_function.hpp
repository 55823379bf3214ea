#pragma once

#include "engine/analysis_request.hpp"
#include "engine/analysis_result.hpp"
#include "statkit/core/cancellation.hpp"
#include "statkit/core/dataset.hpp"

namespace statkit {
namespace engine {

/**
 * @brief Principal component analysis
 *
 * Options: components (default: one per column), standardize
 *
 * Returns:
 *   - payload: PcaResult (eigenvalues, variance ratios, loadings, scores)
 *   - charts: scree bar chart, cumulative explained variance line and, with at
 *     least two components, a scatter of the first two component scores
 */
class PcaFunction {
public:
	static AnalysisResult Run(const core::Dataset &dataset, const AnalysisRequest &request,
	                          const core::CancellationToken *cancellation);
};

} // namespace engine
} // namespace statkit
