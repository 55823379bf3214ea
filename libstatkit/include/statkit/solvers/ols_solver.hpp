#pragma once

#include "statkit/core/errors.hpp"
#include "statkit/core/regression_options.hpp"
#include "statkit/core/regression_result.hpp"
#include "statkit/utils/distributions.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace statkit {
namespace solvers {

/**
 * Ordinary Least Squares (OLS) Regression Solver
 *
 * Uses Eigen's ColPivHouseholderQR decomposition. Rank-deficient designs are
 * rejected with SingularDesignError instead of being fitted with aliased
 * coefficients, so every reported statistic is defined.
 *
 * Algorithm:
 * 1. Center y and X when an intercept is requested (the intercept is never
 *    part of the decomposition)
 * 2. QR decomposition with column pivoting: X*P = Q*R
 * 3. Numerical rank from the R diagonal; rank < p is singular
 * 4. Solve R * beta_p = (Q^T * y) and map back through the permutation
 * 5. Intercept = mean(y) - Σ beta_j * mean(x_j)
 * 6. Residuals, fitted values and fit statistics
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 */
class OLSSolver {
public:
	/**
	 * Fit OLS regression
	 *
	 * @param y Response vector (length n)
	 * @param X Predictor matrix (n × p), WITHOUT an intercept column
	 * @param options Regression options (intercept, tolerance, etc.)
	 * @return RegressionResult with coefficients, residuals and fit statistics
	 * @throws InvalidConfigError for invalid options or mismatched dimensions
	 * @throws SingularDesignError when the design is rank-deficient or n <= number of parameters
	 * @throws DegenerateInputError when the response has no variation to explain
	 */
	static core::RegressionResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                  const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/**
	 * Fit OLS regression with standard errors for statistical inference
	 *
	 * SE(beta_j) = sqrt(MSE * (X'X)^-1_jj), with
	 * SE(intercept) = sqrt(MSE * (1/n + x̄' (Xc'Xc)^-1 x̄)) on centered predictors.
	 */
	static core::RegressionResult FitWithStdErrors(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                               const core::RegressionOptions &options =
	                                                   core::RegressionOptions::OLS());

	/**
	 * Quick check for constant columns
	 *
	 * @param X Design matrix
	 * @param tol Tolerance for considering variance as zero
	 * @return Vector of bools, true if column is constant
	 */
	static std::vector<bool> DetectConstantColumns(const Eigen::MatrixXd &X, double tol = 1e-10);

	/**
	 * Check if matrix is full rank
	 *
	 * @param X Design matrix
	 * @param tolerance Threshold for rank determination (-1 = auto)
	 * @return true if rank(X) == ncol(X)
	 */
	static bool IsFullRank(const Eigen::MatrixXd &X, double tolerance = -1.0);

	/**
	 * (X'X)^-1 of the working design from its pivoted QR
	 *
	 * (X'X)^-1 = P R^-1 R^-T P^T, valid for full column rank.
	 */
	static Eigen::MatrixXd XtXInverse(const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> &qr);

	/// Predictors centered on their column means
	static Eigen::MatrixXd CenterColumns(const Eigen::MatrixXd &X, const Eigen::VectorXd &means);

private:
	static Eigen::ColPivHouseholderQR<Eigen::MatrixXd> Decompose(const Eigen::MatrixXd &X_work,
	                                                             const core::RegressionOptions &options);

	/**
	 * Compute fit quality statistics (R², adjusted R², MSE, F, AIC/BIC)
	 */
	static void ComputeStatistics(const Eigen::VectorXd &y, core::RegressionResult &result);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline Eigen::MatrixXd OLSSolver::CenterColumns(const Eigen::MatrixXd &X, const Eigen::VectorXd &means) {
	Eigen::MatrixXd centered(X.rows(), X.cols());
	for (Eigen::Index j = 0; j < X.cols(); j++) {
		centered.col(j) = X.col(j).array() - means(j);
	}
	return centered;
}

inline Eigen::ColPivHouseholderQR<Eigen::MatrixXd> OLSSolver::Decompose(const Eigen::MatrixXd &X_work,
                                                                        const core::RegressionOptions &options) {
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X_work);
	if (options.qr_tolerance > 0.0) {
		qr.setThreshold(options.qr_tolerance);
	}
	return qr;
}

inline core::RegressionResult OLSSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                             const core::RegressionOptions &options) {
	options.Validate();

	const size_t n = static_cast<size_t>(X.rows());
	const size_t p_user = static_cast<size_t>(X.cols());
	if (static_cast<size_t>(y.size()) != n) {
		throw core::InvalidConfigError("response has " + std::to_string(y.size()) + " rows, predictors have " +
		                               std::to_string(n));
	}

	const size_t n_params = options.intercept ? (p_user + 1) : p_user;
	if (n_params == 0) {
		throw core::InvalidConfigError("regression without intercept requires at least one predictor");
	}
	if (n <= n_params) {
		throw core::SingularDesignError(std::to_string(n) + " observations cannot identify " +
		                                std::to_string(n_params) +
		                                " parameters with residual degrees of freedom left");
	}

	// Center data instead of adding an intercept column
	Eigen::VectorXd x_means = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(p_user));
	double y_mean = 0.0;
	Eigen::MatrixXd X_work;
	Eigen::VectorXd y_work;
	if (options.intercept) {
		x_means = X.colwise().mean();
		y_mean = y.mean();
		X_work = CenterColumns(X, x_means);
		y_work = y.array() - y_mean;
	} else {
		X_work = X;
		y_work = y;
	}

	core::RegressionResult result(n, n_params, n_params);
	result.has_intercept = options.intercept;

	const size_t coef_offset = options.intercept ? 1 : 0;
	if (p_user > 0) {
		const auto qr = Decompose(X_work, options);
		result.tolerance_used = qr.threshold();

		const size_t feature_rank = static_cast<size_t>(qr.rank());
		if (feature_rank < p_user) {
			throw core::SingularDesignError("design matrix is rank-deficient (rank " +
			                                std::to_string(feature_rank + coef_offset) + " of " +
			                                std::to_string(n_params) + " parameters)");
		}

		const Eigen::VectorXd beta = qr.solve(y_work);
		for (size_t j = 0; j < p_user; j++) {
			result.coefficients[static_cast<Eigen::Index>(j + coef_offset)] = beta[static_cast<Eigen::Index>(j)];
		}
	}

	// Intercept = mean(y) - Σ beta_j * mean(x_j)
	if (options.intercept) {
		double intercept = y_mean;
		for (size_t j = 0; j < p_user; j++) {
			intercept -= result.coefficients[static_cast<Eigen::Index>(j + 1)] * x_means(static_cast<Eigen::Index>(j));
		}
		result.coefficients[0] = intercept;
	}

	Eigen::VectorXd y_pred = Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n), result.intercept());
	for (size_t j = 0; j < p_user; j++) {
		y_pred += result.coefficients[static_cast<Eigen::Index>(j + coef_offset)] * X.col(static_cast<Eigen::Index>(j));
	}
	result.fitted_values = y_pred;
	result.residuals = y - y_pred;

	ComputeStatistics(y, result);
	return result;
}

inline core::RegressionResult OLSSolver::FitWithStdErrors(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                          const core::RegressionOptions &options) {
	auto result = Fit(y, X, options);

	const size_t n = static_cast<size_t>(X.rows());
	const size_t p_user = static_cast<size_t>(X.cols());
	const size_t coef_offset = options.intercept ? 1 : 0;

	result.std_errors = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(result.n_params));
	result.has_std_errors = true;

	if (p_user == 0) {
		// Intercept-only model
		result.std_errors[0] = std::sqrt(result.mse / static_cast<double>(n));
		return result;
	}

	Eigen::VectorXd x_means;
	Eigen::MatrixXd X_work;
	if (options.intercept) {
		x_means = X.colwise().mean();
		X_work = CenterColumns(X, x_means);
	} else {
		X_work = X;
	}

	const auto qr = Decompose(X_work, options);
	const Eigen::MatrixXd XtX_inv = XtXInverse(qr);

	for (size_t j = 0; j < p_user; j++) {
		const auto jj = static_cast<Eigen::Index>(j);
		result.std_errors[static_cast<Eigen::Index>(j + coef_offset)] = std::sqrt(result.mse * XtX_inv(jj, jj));
	}

	if (options.intercept) {
		const double variance_component = x_means.transpose() * XtX_inv * x_means;
		result.std_errors[0] = std::sqrt(result.mse * (1.0 / static_cast<double>(n) + variance_component));
	}

	return result;
}

inline Eigen::MatrixXd OLSSolver::XtXInverse(const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> &qr) {
	const Eigen::Index p = qr.cols();
	const Eigen::MatrixXd R = qr.matrixR().topLeftCorner(p, p).triangularView<Eigen::Upper>();
	const Eigen::MatrixXd R_inv =
	    R.triangularView<Eigen::Upper>().solve(Eigen::MatrixXd::Identity(p, p));
	const Eigen::MatrixXd pivoted = R_inv * R_inv.transpose();

	// Undo the column permutation: (X'X)^-1 = P (R'R)^-1 P'
	const auto &P = qr.colsPermutation();
	return P * pivoted * P.transpose();
}

inline std::vector<bool> OLSSolver::DetectConstantColumns(const Eigen::MatrixXd &X, double tol) {
	const size_t p = static_cast<size_t>(X.cols());
	std::vector<bool> is_constant(p, false);
	if (X.rows() < 2) {
		return is_constant;
	}

	for (size_t j = 0; j < p; j++) {
		const auto col = X.col(static_cast<Eigen::Index>(j));
		const double mean = col.mean();
		const double variance = (col.array() - mean).square().sum() / static_cast<double>(X.rows() - 1);
		if (variance < tol) {
			is_constant[j] = true;
		}
	}
	return is_constant;
}

inline bool OLSSolver::IsFullRank(const Eigen::MatrixXd &X, double tolerance) {
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
	if (tolerance > 0.0) {
		qr.setThreshold(tolerance);
	}
	return qr.rank() == X.cols();
}

inline void OLSSolver::ComputeStatistics(const Eigen::VectorXd &y, core::RegressionResult &result) {
	const auto n = static_cast<double>(result.n_obs);
	const double df_resid = static_cast<double>(result.df_residual());
	const double df_model = static_cast<double>(result.df_model());

	result.ss_residual = result.residuals.squaredNorm();
	if (result.has_intercept) {
		result.ss_total = (y.array() - y.mean()).square().sum();
	} else {
		result.ss_total = y.squaredNorm();
	}
	if (!(result.ss_total > 0.0)) {
		throw core::DegenerateInputError("dependent variable has no variation; R² is undefined");
	}

	result.r_squared = 1.0 - result.ss_residual / result.ss_total;
	result.r_squared = std::max(0.0, std::min(1.0, result.r_squared));

	const double n_int = result.has_intercept ? 1.0 : 0.0;
	result.adj_r_squared = 1.0 - (1.0 - result.r_squared) * (n - n_int) / df_resid;

	// For numerical stability with near-perfect fits, use a minimum threshold
	// This keeps standard errors and information criteria finite
	constexpr double min_mse = 1e-20;
	result.mse = std::max(result.ss_residual / df_resid, min_mse);
	result.residual_standard_error = std::sqrt(result.mse);

	if (df_model > 0.0) {
		const double ss_model = result.ss_total - result.ss_residual;
		result.f_statistic = std::max(0.0, ss_model / df_model) / result.mse;
		result.f_statistic_pvalue = utils::f_pvalue(result.f_statistic, df_model, df_resid);
	} else {
		result.f_statistic = 0.0;
		result.f_statistic_pvalue = 1.0;
	}

	const double sigma2_ml = std::max(result.ss_residual / n, min_mse);
	result.log_likelihood = -0.5 * n * (std::log(2.0 * utils::PI) + std::log(sigma2_ml) + 1.0);
	const double k = static_cast<double>(result.rank) + 1.0;
	result.aic = -2.0 * result.log_likelihood + 2.0 * k;
	result.bic = -2.0 * result.log_likelihood + k * std::log(n);
}

} // namespace solvers
} // namespace statkit
