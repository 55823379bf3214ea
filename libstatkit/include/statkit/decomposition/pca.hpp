#pragma once

#include "statkit/core/analysis_options.hpp"
#include "statkit/core/cancellation.hpp"
#include "statkit/core/dataset.hpp"
#include "statkit/core/errors.hpp"
#include "statkit/core/pca_result.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

namespace statkit {
namespace decomposition {

/**
 * Principal component analysis by eigendecomposition
 *
 * 1. Center each column (and scale to unit sample variance when standardizing)
 * 2. Covariance of the transformed data, S = Z'Z / (n - 1)
 *    (the correlation matrix when standardizing)
 * 3. SelfAdjointEigenSolver on S
 * 4. Order components by descending eigenvalue
 * 5. Project: scores = Z * loadings
 *
 * Ordering and signs are deterministic: eigenvalues equal within a relative
 * 1e-10 are ordered by the column index of their largest-magnitude loading,
 * and each loading vector is flipped so that this entry is positive.
 */
class PCA {
public:
	/**
	 * @param cancellation Optional token, polled before and after the decomposition
	 * @throws InvalidConfigError when component_count exceeds the number of columns
	 * @throws InsufficientDataError with fewer than 2 complete rows
	 * @throws DegenerateInputError for a constant column under standardization, or zero total variance
	 */
	static core::PcaResult Compute(const core::Dataset &dataset, const std::vector<std::string> &columns,
	                               const core::PcaOptions &options = {},
	                               const core::CancellationToken *cancellation = nullptr) {
		options.Validate(columns.size());

		std::vector<size_t> rows;
		const Eigen::MatrixXd X = dataset.CompleteCases(columns, &rows);
		auto result = ComputeMatrix(X, options, cancellation, columns);
		result.columns = columns;
		result.source_rows = std::move(rows);
		return result;
	}

	/// PCA on a fully observed matrix (rows × columns)
	static core::PcaResult ComputeMatrix(const Eigen::MatrixXd &X, const core::PcaOptions &options = {},
	                                     const core::CancellationToken *cancellation = nullptr,
	                                     const std::vector<std::string> &names = {}) {
		const Eigen::Index n = X.rows();
		const Eigen::Index p = X.cols();
		options.Validate(static_cast<size_t>(p));
		if (n < 2) {
			throw core::InsufficientDataError("PCA needs at least 2 complete rows (got " + std::to_string(n) + ")");
		}

		core::PcaResult result;
		result.standardized = options.standardize;
		result.means = X.colwise().mean();
		result.scales = Eigen::VectorXd::Ones(p);

		Eigen::MatrixXd Z = X.rowwise() - result.means.transpose();
		if (options.standardize) {
			for (Eigen::Index j = 0; j < p; j++) {
				const double sd = std::sqrt(Z.col(j).squaredNorm() / static_cast<double>(n - 1));
				if (!(sd > 1e-12)) {
					const auto col = static_cast<size_t>(j);
					const std::string label = col < names.size() ? "'" + names[col] + "'" : std::to_string(col);
					throw core::DegenerateInputError("column " + label +
					                                 " has zero variance and cannot be standardized");
				}
				result.scales(j) = sd;
				Z.col(j) /= sd;
			}
		}

		const Eigen::MatrixXd S = (Z.transpose() * Z) / static_cast<double>(n - 1);
		if (!(S.trace() > 0.0)) {
			throw core::DegenerateInputError("total variance is zero; principal components are undefined");
		}

		core::CheckCancelled(cancellation, "PCA decomposition");
		Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(S);
		if (solver.info() != Eigen::Success) {
			throw core::DegenerateInputError("eigendecomposition did not converge");
		}
		core::CheckCancelled(cancellation, "PCA projection");

		// Clamp round-off negatives, then orient every eigenvector
		Eigen::VectorXd eigenvalues = solver.eigenvalues().cwiseMax(0.0);
		Eigen::MatrixXd vectors = solver.eigenvectors();
		std::vector<Eigen::Index> anchor(static_cast<size_t>(p));
		for (Eigen::Index c = 0; c < p; c++) {
			Eigen::Index idx = 0;
			vectors.col(c).cwiseAbs().maxCoeff(&idx);
			anchor[static_cast<size_t>(c)] = idx;
			if (vectors(idx, c) < 0.0) {
				vectors.col(c) = -vectors.col(c);
			}
		}

		const double total = eigenvalues.sum();

		// Snap near-equal eigenvalues together so ties are decided by the anchor column
		const double tie_tol = 1e-10 * std::max(1.0, eigenvalues.maxCoeff());
		std::vector<Eigen::Index> order(static_cast<size_t>(p));
		std::iota(order.begin(), order.end(), 0);
		std::sort(order.begin(), order.end(),
		          [&eigenvalues](Eigen::Index a, Eigen::Index b) { return eigenvalues(a) > eigenvalues(b); });
		Eigen::VectorXd snapped = eigenvalues;
		for (size_t i = 1; i < order.size(); i++) {
			if (eigenvalues(order[i - 1]) - eigenvalues(order[i]) <= tie_tol) {
				snapped(order[i]) = snapped(order[i - 1]);
			}
		}
		std::sort(order.begin(), order.end(), [&](Eigen::Index a, Eigen::Index b) {
			if (snapped(a) != snapped(b)) {
				return snapped(a) > snapped(b);
			}
			return anchor[static_cast<size_t>(a)] < anchor[static_cast<size_t>(b)] ||
			       (anchor[static_cast<size_t>(a)] == anchor[static_cast<size_t>(b)] && a < b);
		});

		const Eigen::Index k =
		    options.component_count == 0 ? p : static_cast<Eigen::Index>(options.component_count);
		result.eigenvalues.resize(k);
		result.loadings.resize(p, k);
		for (Eigen::Index c = 0; c < k; c++) {
			const Eigen::Index src = order[static_cast<size_t>(c)];
			result.eigenvalues(c) = eigenvalues(src);
			result.loadings.col(c) = vectors.col(src);
		}

		result.explained_variance_ratio = result.eigenvalues / total;
		result.cumulative_variance_ratio.resize(k);
		double running = 0.0;
		for (Eigen::Index c = 0; c < k; c++) {
			running += result.explained_variance_ratio(c);
			result.cumulative_variance_ratio(c) = running;
		}

		result.scores = Z * result.loadings;
		return result;
	}
};

} // namespace decomposition
} // namespace statkit
