#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace statkit {
namespace core {

/**
 * Principal component analysis output
 *
 * Components are ordered by descending eigenvalue. Each loading vector has unit
 * norm and its largest-magnitude entry is positive.
 */
struct PcaResult {
	std::vector<std::string> columns;

	bool standardized = true;

	/// Column means used for centering
	Eigen::VectorXd means;

	/// Column scales used for standardization (1.0 when not standardized)
	Eigen::VectorXd scales;

	/// Eigenvalues of the kept components (length = component_count)
	Eigen::VectorXd eigenvalues;

	/// Eigenvalue / sum of all eigenvalues
	Eigen::VectorXd explained_variance_ratio;

	Eigen::VectorXd cumulative_variance_ratio;

	/// Loadings: columns × components, column j is the j-th eigenvector
	Eigen::MatrixXd loadings;

	/// Projected coordinates: rows × components
	Eigen::MatrixXd scores;

	/// Source row of each score row (complete cases only)
	std::vector<size_t> source_rows;

	size_t component_count() const {
		return static_cast<size_t>(eigenvalues.size());
	}
};

} // namespace core
} // namespace statkit
