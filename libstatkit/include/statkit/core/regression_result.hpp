#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace statkit {
namespace core {

/**
 * Result of a linear regression fit
 *
 * Contains coefficients, residuals, fit statistics and (after inference)
 * standard errors, t-statistics, p-values and confidence intervals.
 *
 * Layout notes:
 * - Parameter vectors have length n_params. When has_intercept is true the
 *   intercept is stored at index 0 and the slopes follow in predictor order.
 * - coefficient_names uses "(Intercept)" for the intercept term.
 * - Rank-deficient designs are rejected by the solver, so every parameter is
 *   estimated and every field below is finite once the fit succeeds.
 */
struct RegressionResult {
	// ========================================================================
	// Core regression outputs
	// ========================================================================

	/// Name of the dependent variable (empty for matrix-level fits)
	std::string dependent_name;

	/// Parameter names, aligned with coefficients
	std::vector<std::string> coefficient_names;

	/// Estimated regression coefficients (length = n_params)
	Eigen::VectorXd coefficients;

	/// Flag indicating if an intercept was fitted (stored at index 0)
	bool has_intercept = false;

	/// Fitted values X*beta (length = n_obs)
	Eigen::VectorXd fitted_values;

	/// Residuals: y - X*beta (length = n_obs)
	Eigen::VectorXd residuals;

	/// Source row of each observation (complete cases only)
	std::vector<size_t> source_rows;

	// ========================================================================
	// Rank information
	// ========================================================================

	/// Rank of the design matrix including the intercept
	size_t rank;

	/// Number of parameters (predictors + intercept)
	size_t n_params;

	/// Number of observations used in the fit
	size_t n_obs;

	/// Tolerance used for rank determination in QR decomposition
	double tolerance_used = -1.0;

	// ========================================================================
	// Fit quality statistics
	// ========================================================================

	/// Coefficient of determination: 1 - SSE/SST
	/// SST is taken around the mean with an intercept and around zero without one
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Adjusted R²: 1 - (1-R²)*(n-i)/(n-p), i = 1 with an intercept, 0 without
	double adj_r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Mean squared error: SSE / df_residual
	double mse = std::numeric_limits<double>::quiet_NaN();

	/// Residual standard error: sqrt(MSE)
	double residual_standard_error = std::numeric_limits<double>::quiet_NaN();

	/// Residual sum of squares
	double ss_residual = std::numeric_limits<double>::quiet_NaN();

	/// Total sum of squares (around the mean when an intercept is fitted)
	double ss_total = std::numeric_limits<double>::quiet_NaN();

	/// F-statistic for overall model significance
	/// F = ((TSS - RSS) / df_model) / (RSS / df_residual)
	double f_statistic = std::numeric_limits<double>::quiet_NaN();

	/// p-value for F-statistic
	double f_statistic_pvalue = std::numeric_limits<double>::quiet_NaN();

	// ========================================================================
	// Model selection criteria
	// ========================================================================

	/// AIC = -2 log L + 2k where k = rank + 1 (the error variance counts)
	double aic = std::numeric_limits<double>::quiet_NaN();

	/// BIC = -2 log L + k log(n)
	double bic = std::numeric_limits<double>::quiet_NaN();

	/// Gaussian log-likelihood: -n/2 * (log(2π) + log(RSS/n) + 1)
	double log_likelihood = std::numeric_limits<double>::quiet_NaN();

	// ========================================================================
	// Statistical inference outputs
	// ========================================================================

	/// Standard errors of coefficients (length = n_params)
	Eigen::VectorXd std_errors;

	/// t-statistics: coef / std_error
	Eigen::VectorXd t_statistics;

	/// Two-tailed p-values for H0: coef = 0
	Eigen::VectorXd p_values;

	/// Confidence interval bounds
	Eigen::VectorXd ci_lower;
	Eigen::VectorXd ci_upper;

	/// Confidence level used for intervals (e.g., 0.95 for 95% CI)
	double confidence_level = 0.95;

	/// Flag indicating if standard errors have been computed
	bool has_std_errors = false;

	// ========================================================================
	// Observation diagnostics (for residual charts)
	// ========================================================================

	Eigen::VectorXd leverage;
	Eigen::VectorXd standardized_residuals;
	Eigen::VectorXd cooks_distance;

	/// Variance inflation factor per predictor (empty with fewer than 2 predictors)
	std::vector<double> vif;

	// ========================================================================
	// Degrees of freedom (for inference)
	// ========================================================================

	/// Degrees of freedom for the model: slopes only (rank minus intercept)
	size_t df_model() const {
		if (has_intercept) {
			return rank > 0 ? rank - 1 : 0;
		}
		return rank;
	}

	/// Degrees of freedom for residuals: n - rank
	size_t df_residual() const {
		if (n_obs <= rank) return 0;
		return n_obs - rank;
	}

	// ========================================================================
	// Constructors
	// ========================================================================

	RegressionResult()
		: rank(0), n_params(0), n_obs(0) {}

	RegressionResult(size_t n_obs_, size_t n_params_, size_t rank_)
		: rank(rank_), n_params(n_params_), n_obs(n_obs_) {
		coefficients = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_params_));
		residuals = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_obs_));
		fitted_values = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_obs_));
	}

	// ========================================================================
	// Utility methods
	// ========================================================================

	/// Check if result is valid (full rank and finite coefficients)
	bool is_valid() const {
		if (rank == 0 || n_params == 0 || n_obs == 0 || rank != n_params) return false;
		for (Eigen::Index i = 0; i < coefficients.size(); i++) {
			if (!std::isfinite(coefficients[i])) {
				return false;
			}
		}
		return true;
	}

	/// Slope coefficient for a predictor position (0-based, excluding intercept)
	double slope(size_t predictor) const {
		return coefficients[static_cast<Eigen::Index>(predictor + (has_intercept ? 1 : 0))];
	}

	/// Intercept value, 0 when the model has none
	double intercept() const {
		return has_intercept ? coefficients[0] : 0.0;
	}
};

} // namespace core
} // namespace statkit
