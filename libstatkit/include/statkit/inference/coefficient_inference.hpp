#pragma once

#include "statkit/core/inference_result.hpp"
#include "statkit/core/regression_result.hpp"
#include "statkit/utils/distributions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <utility>

namespace statkit {
namespace inference {

/**
 * CoefficientInference: Statistical inference for regression coefficients
 *
 * This class provides methods to compute:
 * - t-statistics for hypothesis testing
 * - p-values (two-tailed tests)
 * - Confidence intervals
 *
 * The inference is based on the standard OLS theory:
 * - t_j = β_j / SE(β_j)  ~ t(n - p)
 * - p_j = P(|T| > |t_j|)
 * - CI_j = β_j ± t_{α/2} * SE(β_j)
 *
 * Where p counts every estimated parameter, the intercept included. Standard
 * errors come from the solver (OLSSolver::FitWithStdErrors).
 */
class CoefficientInference {
public:
	/**
	 * Compute coefficient inference from a fitted regression
	 *
	 * @param result Regression result with coefficients and standard errors
	 * @param confidence_level Confidence level for intervals (default: 0.95)
	 * @return InferenceResult with t-statistics, p-values, and confidence intervals
	 * @throws InvalidConfigError when the result carries no standard errors
	 * @throws SingularDesignError when no residual degrees of freedom remain
	 */
	static core::InferenceResult ComputeInference(const core::RegressionResult &result,
	                                              double confidence_level = 0.95);

	/// Copy inference outputs into the regression result
	static void Apply(const core::InferenceResult &inference, core::RegressionResult &result);

	/**
	 * t_j = β_j / SE(β_j)
	 */
	static Eigen::VectorXd ComputeTStatistics(const Eigen::VectorXd &coefficients, const Eigen::VectorXd &std_errors);

	/**
	 * p_j = P(|T| > |t_j|) where T ~ t(df)
	 */
	static Eigen::VectorXd ComputePValues(const Eigen::VectorXd &t_statistics, size_t df);

	/**
	 * CI_j = β_j ± t_{α/2, df} * SE(β_j)
	 *
	 * @return Pair of (lower_bounds, upper_bounds)
	 */
	static std::pair<Eigen::VectorXd, Eigen::VectorXd> ComputeConfidenceIntervals(const Eigen::VectorXd &coefficients,
	                                                                              const Eigen::VectorXd &std_errors,
	                                                                              size_t df,
	                                                                              double confidence_level);
};

} // namespace inference
} // namespace statkit

#include "statkit/inference/coefficient_inference_impl.hpp"
