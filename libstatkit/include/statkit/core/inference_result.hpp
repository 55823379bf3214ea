#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <limits>

namespace statkit {
namespace core {

/**
 * Statistical inference results for regression coefficients
 *
 * All vectors have length n_params and follow the coefficient layout of
 * RegressionResult (intercept first when fitted).
 */
struct InferenceResult {
	/// Standard errors of coefficients
	Eigen::VectorXd std_errors;

	/// t-statistics: coef / std_error
	Eigen::VectorXd t_statistics;

	/// Two-tailed p-values for H0: coef = 0
	Eigen::VectorXd p_values;

	/// coef - t_critical * std_error
	Eigen::VectorXd ci_lower;

	/// coef + t_critical * std_error
	Eigen::VectorXd ci_upper;

	/// Confidence level used (e.g., 0.95 for 95% CI)
	double confidence_level = 0.95;

	/// Degrees of freedom used for t-distribution
	size_t degrees_of_freedom = 0;

	InferenceResult() = default;

	InferenceResult(size_t n_params, double conf_level = 0.95)
		: confidence_level(conf_level) {
		const auto n = static_cast<Eigen::Index>(n_params);
		std_errors = Eigen::VectorXd::Zero(n);
		t_statistics = Eigen::VectorXd::Zero(n);
		p_values = Eigen::VectorXd::Ones(n);
		ci_lower = Eigen::VectorXd::Zero(n);
		ci_upper = Eigen::VectorXd::Zero(n);
	}
};

} // namespace core
} // namespace statkit
