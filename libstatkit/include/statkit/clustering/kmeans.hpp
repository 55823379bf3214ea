#pragma once

#include "statkit/core/analysis_options.hpp"
#include "statkit/core/cancellation.hpp"
#include "statkit/core/dataset.hpp"
#include "statkit/core/errors.hpp"
#include "statkit/core/kmeans_result.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace statkit {
namespace clustering {

/**
 * K-Means clustering (Lloyd iterations)
 *
 * Each iteration:
 * 1. Assign every point to its nearest centroid (squared Euclidean distance,
 *    ties broken by the lowest centroid index)
 * 2. Reseed empty clusters at the point farthest from its assigned centroid
 *    (ties by lowest row index), taken from a cluster with at least 2 members
 * 3. Move every centroid to the mean of its points
 * 4. Stop when the largest coordinate-wise centroid shift is <= tolerance, or
 *    after max_iterations
 *
 * Initialization is deterministic given the seed. Row indices are drawn as
 * mt19937_64() % range so that results do not depend on the standard library's
 * distribution implementations.
 */
class KMeans {
public:
	/**
	 * Cluster the complete rows of the given numeric columns
	 *
	 * @param cancellation Optional token, polled once per iteration
	 * @throws InvalidConfigError when k is outside [1, rows] or the options are invalid
	 */
	static core::KMeansResult Cluster(const core::Dataset &dataset, const std::vector<std::string> &columns,
	                                  const core::KMeansOptions &options,
	                                  const core::CancellationToken *cancellation = nullptr) {
		if (columns.empty()) {
			throw core::InvalidConfigError("k-means requires at least one column");
		}
		std::vector<size_t> rows;
		const Eigen::MatrixXd X = dataset.CompleteCases(columns, &rows);
		auto result = ClusterMatrix(X, options, cancellation);
		result.columns = columns;
		result.source_rows = std::move(rows);
		return result;
	}

	/// Cluster a fully observed matrix (rows are points)
	static core::KMeansResult ClusterMatrix(const Eigen::MatrixXd &X, const core::KMeansOptions &options,
	                                        const core::CancellationToken *cancellation = nullptr) {
		const auto n = static_cast<size_t>(X.rows());
		options.Validate(n);
		const auto k = options.k;

		core::KMeansResult result;
		result.init = options.init;
		result.seed = options.seed;
		result.standardized = options.standardize;

		// Clustering space: raw or z-scored (constant columns keep scale 1)
		Eigen::MatrixXd Z = X;
		if (options.standardize) {
			const Eigen::RowVectorXd means = X.colwise().mean();
			Z = X.rowwise() - means;
			for (Eigen::Index j = 0; j < Z.cols(); j++) {
				const double sd = n > 1 ? std::sqrt(Z.col(j).squaredNorm() / static_cast<double>(n - 1)) : 0.0;
				if (sd > 1e-12) {
					Z.col(j) /= sd;
				}
			}
		}

		Eigen::MatrixXd centroids = InitialCentroids(Z, options, result.initial_rows);
		std::vector<size_t> assignments(n, 0);

		for (size_t iter = 1; iter <= options.max_iterations; iter++) {
			core::CheckCancelled(cancellation, "k-means iteration");

			std::vector<double> distances(n, 0.0);
			for (size_t i = 0; i < n; i++) {
				const auto nearest = Nearest(Z.row(static_cast<Eigen::Index>(i)), centroids);
				assignments[i] = nearest.first;
				distances[i] = nearest.second;
			}

			std::vector<size_t> sizes(k, 0);
			for (size_t c : assignments) {
				sizes[c]++;
			}
			for (size_t c = 0; c < k; c++) {
				if (sizes[c] == 0) {
					Reseed(c, assignments, distances, sizes);
					result.reseeds++;
				}
			}

			const Eigen::MatrixXd updated = ClusterMeans(Z, assignments, k);
			const double shift = (updated - centroids).cwiseAbs().maxCoeff();
			centroids = updated;
			result.iterations = iter;
			result.final_shift = shift;

			if (shift <= options.tolerance) {
				result.stop_reason = core::StopReason::CONVERGED;
				break;
			}
		}

		// Centroids are means of the assigned points, so WCSS uses the final partition
		result.assignments = assignments;
		result.cluster_sizes.assign(k, 0);
		result.cluster_wcss.assign(k, 0.0);
		for (size_t i = 0; i < n; i++) {
			const size_t c = assignments[i];
			result.cluster_sizes[c]++;
			result.cluster_wcss[c] +=
			    (Z.row(static_cast<Eigen::Index>(i)) - centroids.row(static_cast<Eigen::Index>(c))).squaredNorm();
		}
		result.wcss = std::accumulate(result.cluster_wcss.begin(), result.cluster_wcss.end(), 0.0);
		result.centroids = ClusterMeans(X, assignments, k);
		return result;
	}

private:
	static Eigen::MatrixXd InitialCentroids(const Eigen::MatrixXd &Z, const core::KMeansOptions &options,
	                                        std::vector<size_t> &chosen) {
		const auto n = static_cast<size_t>(Z.rows());
		const auto k = options.k;
		std::mt19937_64 rng(options.seed);

		chosen.clear();
		chosen.reserve(k);
		if (options.init == core::KMeansInit::RANDOM_SEEDED) {
			// Partial Fisher-Yates: k distinct rows
			std::vector<size_t> indices(n);
			std::iota(indices.begin(), indices.end(), 0);
			for (size_t i = 0; i < k; i++) {
				const size_t j = i + static_cast<size_t>(rng() % (n - i));
				std::swap(indices[i], indices[j]);
				chosen.push_back(indices[i]);
			}
		} else {
			std::vector<bool> taken(n, false);
			std::vector<double> nearest(n, std::numeric_limits<double>::infinity());
			size_t next = static_cast<size_t>(rng() % n);
			for (size_t c = 0; c < k; c++) {
				chosen.push_back(next);
				taken[next] = true;
				if (c + 1 == k) {
					break;
				}
				// Farthest remaining row from its nearest chosen centroid, ties by lowest index
				const auto last = static_cast<Eigen::Index>(next);
				size_t farthest = n;
				double best = -1.0;
				for (size_t i = 0; i < n; i++) {
					const double d = (Z.row(static_cast<Eigen::Index>(i)) - Z.row(last)).squaredNorm();
					if (d < nearest[i]) {
						nearest[i] = d;
					}
					if (!taken[i] && nearest[i] > best) {
						best = nearest[i];
						farthest = i;
					}
				}
				next = farthest;
			}
		}

		Eigen::MatrixXd centroids(static_cast<Eigen::Index>(k), Z.cols());
		for (size_t c = 0; c < k; c++) {
			centroids.row(static_cast<Eigen::Index>(c)) = Z.row(static_cast<Eigen::Index>(chosen[c]));
		}
		return centroids;
	}

	/// (centroid index, squared distance), ties by lowest index
	static std::pair<size_t, double> Nearest(const Eigen::RowVectorXd &point, const Eigen::MatrixXd &centroids) {
		size_t best = 0;
		double best_d = std::numeric_limits<double>::infinity();
		for (Eigen::Index c = 0; c < centroids.rows(); c++) {
			const double d = (point - centroids.row(c)).squaredNorm();
			if (d < best_d) {
				best_d = d;
				best = static_cast<size_t>(c);
			}
		}
		return {best, best_d};
	}

	/// Move the farthest eligible point into the empty cluster
	static void Reseed(size_t empty, std::vector<size_t> &assignments, std::vector<double> &distances,
	                   std::vector<size_t> &sizes) {
		size_t pick = assignments.size();
		double best = -1.0;
		for (size_t i = 0; i < assignments.size(); i++) {
			if (sizes[assignments[i]] > 1 && distances[i] > best) {
				best = distances[i];
				pick = i;
			}
		}
		// k <= n guarantees a cluster with 2+ members whenever one is empty
		sizes[assignments[pick]]--;
		assignments[pick] = empty;
		sizes[empty] = 1;
		distances[pick] = 0.0;
	}

	static Eigen::MatrixXd ClusterMeans(const Eigen::MatrixXd &points, const std::vector<size_t> &assignments,
	                                    size_t k) {
		Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(k), points.cols());
		std::vector<size_t> counts(k, 0);
		for (size_t i = 0; i < assignments.size(); i++) {
			sums.row(static_cast<Eigen::Index>(assignments[i])) += points.row(static_cast<Eigen::Index>(i));
			counts[assignments[i]]++;
		}
		for (size_t c = 0; c < k; c++) {
			if (counts[c] > 0) {
				sums.row(static_cast<Eigen::Index>(c)) /= static_cast<double>(counts[c]);
			}
		}
		return sums;
	}
};

} // namespace clustering
} // namespace statkit
