#pragma once

#include "statkit/core/errors.hpp"
#include "statkit/core/regression_options.hpp"
#include "statkit/solvers/ols_solver.hpp"
#include <Eigen/Dense>
#include <vector>

namespace statkit {
namespace diagnostics {

/**
 * Variance Inflation Factor (VIF) Calculator
 *
 * VIF measures how much the variance of a regression coefficient is inflated
 * due to collinearity with other predictors.
 *
 * VIF_j = 1 / (1 - R²_j)
 *
 * where R²_j is from regressing X_j on all other predictors (with intercept).
 *
 * Interpretation:
 * - VIF < 5: Low collinearity
 * - 5 ≤ VIF < 10: Moderate collinearity
 * - VIF ≥ 10: High collinearity (problematic)
 *
 * Only called on designs that already passed the full-rank check, so every
 * auxiliary regression is well-posed and every VIF is finite.
 */
class VIFCalculator {
public:
	struct VIFResult {
		/// Variance Inflation Factor
		double vif = 1.0;

		/// R² from auxiliary regression
		double r_squared = 0.0;

		/// Index of the variable
		size_t variable_index = 0;
	};

	/**
	 * Compute VIF for all variables in the predictor matrix
	 *
	 * @param X Predictor matrix (n × p), NO intercept column
	 * @throws InvalidConfigError with fewer than 2 predictors
	 */
	static std::vector<VIFResult> ComputeVIF(const Eigen::MatrixXd &X) {
		const size_t p = static_cast<size_t>(X.cols());
		if (p < 2) {
			throw core::InvalidConfigError("VIF requires at least 2 predictors");
		}

		std::vector<VIFResult> results;
		results.reserve(p);
		for (size_t j = 0; j < p; j++) {
			results.push_back(ComputeSingleVIF(X, j));
		}
		return results;
	}

	/**
	 * Compute VIF for a single variable: X_j ~ X_{-j} + intercept
	 */
	static VIFResult ComputeSingleVIF(const Eigen::MatrixXd &X, size_t variable_index) {
		const size_t p = static_cast<size_t>(X.cols());
		if (variable_index >= p) {
			throw core::InvalidConfigError("variable index " + std::to_string(variable_index) + " out of range");
		}

		const Eigen::VectorXd y = X.col(static_cast<Eigen::Index>(variable_index));
		Eigen::MatrixXd X_reduced(X.rows(), static_cast<Eigen::Index>(p - 1));
		Eigen::Index col_idx = 0;
		for (size_t k = 0; k < p; k++) {
			if (k != variable_index) {
				X_reduced.col(col_idx++) = X.col(static_cast<Eigen::Index>(k));
			}
		}

		const auto aux = solvers::OLSSolver::Fit(y, X_reduced, core::RegressionOptions::OLS(true));

		if (aux.r_squared >= 1.0) {
			throw core::SingularDesignError("predictor " + std::to_string(variable_index) +
			                                " is a linear combination of the others");
		}

		VIFResult result;
		result.variable_index = variable_index;
		result.r_squared = aux.r_squared;
		result.vif = 1.0 / (1.0 - aux.r_squared);
		return result;
	}
};

} // namespace diagnostics
} // namespace statkit
