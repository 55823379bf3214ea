#pragma once

#include "statkit/core/regression_result.hpp"
#include <Eigen/Dense>

namespace statkit {
namespace diagnostics {

/**
 * RegressionDiagnostics: Diagnostic measures for regression models
 *
 * This class provides methods to compute:
 * - Leverage (hat values): h_i = x_i'(X'X)^{-1}x_i
 * - Standardized residuals: r_i / sqrt(MSE * (1 - h_i))
 * - Cook's distance: influence of each observation
 *
 * These feed the residual charts and help identify outliers (large residuals),
 * high leverage points (unusual X values) and influential observations.
 */
class RegressionDiagnostics {
public:
	/**
	 * Compute leverage (hat) values
	 *
	 * Properties:
	 * - 0 ≤ h_i ≤ 1
	 * - Σ h_i = number of parameters
	 * - High leverage: h_i > 2p/n
	 *
	 * @param X Predictor matrix (n × p, raw, WITHOUT an intercept column)
	 * @param intercept Whether the model includes an intercept
	 * @return Vector of leverage values (length n)
	 */
	static Eigen::VectorXd ComputeLeverage(const Eigen::MatrixXd &X, bool intercept);

	/**
	 * Compute standardized residuals
	 *
	 * r_i^std = r_i / sqrt(MSE * (1 - h_i)), 0 where h_i = 1 (the fit passes
	 * through the point and the residual is 0).
	 */
	static Eigen::VectorXd ComputeStandardizedResiduals(const Eigen::VectorXd &residuals,
	                                                    const Eigen::VectorXd &leverage, double mse);

	/**
	 * Compute Cook's distance
	 *
	 * D_i = (r_i^std)² * h_i / (p * (1 - h_i))
	 *
	 * Influential: D_i > 4/n or D_i > 1
	 *
	 * @param n_params Number of parameters (intercept included)
	 */
	static Eigen::VectorXd ComputeCooksDistance(const Eigen::VectorXd &standardized_residuals,
	                                            const Eigen::VectorXd &leverage, size_t n_params);

	/**
	 * Compute all diagnostics and store them in the result
	 *
	 * @param X Predictor matrix used for the fit (raw)
	 */
	static void ComputeAllDiagnostics(const Eigen::MatrixXd &X, core::RegressionResult &result);
};

} // namespace diagnostics
} // namespace statkit

#include "statkit/diagnostics/regression_diagnostics_impl.hpp"
