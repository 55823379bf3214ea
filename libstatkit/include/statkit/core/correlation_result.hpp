#pragma once

#include "statkit/core/analysis_options.hpp"
#include "statkit/core/hypothesis_result.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace statkit {
namespace core {

/**
 * Correlation matrix with per-cell inference
 *
 * Cells are computed pairwise-complete: cell (i, j) uses only rows where both
 * column i and column j are observed, so sample_sizes(i, j) may differ from
 * cell to cell. The matrix is symmetric with a unit diagonal.
 */
struct CorrelationResult {
	CorrelationMethod method = CorrelationMethod::PEARSON;

	std::vector<std::string> columns;

	/// Correlation coefficients (p × p)
	Eigen::MatrixXd coefficients;

	/// Two-tailed p-values for H0: rho = 0 (diagonal is 0)
	Eigen::MatrixXd p_values;

	/// Pairwise-complete sample size per cell (diagonal: observed count of the column)
	Eigen::MatrixXi sample_sizes;

	double alpha = 0.05;

	/// Jarque-Bera check of each column's observed values (defined = false below 4 values)
	std::vector<NormalityResult> normality;

	/// Pearson when no column rejects normality at alpha, otherwise Spearman
	CorrelationMethod recommended_method = CorrelationMethod::PEARSON;

	double at(size_t i, size_t j) const {
		return coefficients(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
	}
};

/// Verbal strength of an absolute correlation
inline const char *CorrelationStrength(double r) {
	const double abs_r = r < 0.0 ? -r : r;
	if (abs_r < 0.3) {
		return "negligible";
	}
	if (abs_r < 0.5) {
		return "weak";
	}
	if (abs_r < 0.8) {
		return "moderate";
	}
	return "strong";
}

} // namespace core
} // namespace statkit
