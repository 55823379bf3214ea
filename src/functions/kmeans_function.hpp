#pragma once

#include "engine/analysis_request.hpp"
#include "engine/analysis_result.hpp"
#include "statkit/core/cancellation.hpp"
#include "statkit/core/dataset.hpp"

namespace statkit {
namespace engine {

/**
 * @brief K-Means clustering
 *
 * Options: k (required), init (farthest_first | random_seeded), seed,
 * max_iterations, tolerance, standardize
 *
 * Returns:
 *   - payload: KMeansResult (assignments, centroids, WCSS, stop reason)
 *   - charts: scatter of the first two clustering columns with one series per
 *     cluster plus a centroid series (a single column is drawn as a strip)
 */
class KMeansFunction {
public:
	static AnalysisResult Run(const core::Dataset &dataset, const AnalysisRequest &request,
	                          const core::CancellationToken *cancellation);
};

} // namespace engine
} // namespace statkit
