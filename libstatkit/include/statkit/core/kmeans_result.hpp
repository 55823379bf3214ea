#pragma once

#include "statkit/core/analysis_options.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace statkit {
namespace core {

enum class StopReason { CONVERGED, MAX_ITERATIONS };

inline const char *StopReasonName(StopReason reason) {
	return reason == StopReason::CONVERGED ? "converged" : "max_iterations";
}

struct KMeansResult {
	std::vector<std::string> columns;

	KMeansInit init = KMeansInit::FARTHEST_FIRST;
	uint64_t seed = 42;
	bool standardized = false;

	/// Clustered row used as the starting point of each centroid, in selection order
	std::vector<size_t> initial_rows;

	/// Cluster index (0-based) of each clustered row
	std::vector<size_t> assignments;

	/// Source row of each clustered row (complete cases only)
	std::vector<size_t> source_rows;

	/// Final centroids in original units: k × columns
	Eigen::MatrixXd centroids;

	/// Points per cluster
	std::vector<size_t> cluster_sizes;

	/// Within-cluster sum of squares per cluster (in the clustering space)
	std::vector<double> cluster_wcss;

	/// Total within-cluster sum of squares
	double wcss = 0.0;

	size_t iterations = 0;

	StopReason stop_reason = StopReason::MAX_ITERATIONS;

	/// Largest coordinate-wise centroid shift of the last iteration
	double final_shift = 0.0;

	/// Number of empty-cluster reseeds performed
	size_t reseeds = 0;

	size_t k() const {
		return static_cast<size_t>(centroids.rows());
	}
};

} // namespace core
} // namespace statkit
