#pragma once

#include "statkit/core/errors.hpp"
#include "statkit/inference/coefficient_inference.hpp"

namespace statkit {
namespace inference {

// Implementation of CoefficientInference methods

inline Eigen::VectorXd CoefficientInference::ComputeTStatistics(const Eigen::VectorXd &coefficients,
                                                                const Eigen::VectorXd &std_errors) {
	const Eigen::Index p = coefficients.size();
	Eigen::VectorXd t_stats(p);

	// Standard errors are strictly positive: the solver clamps MSE from below
	for (Eigen::Index j = 0; j < p; j++) {
		t_stats(j) = coefficients(j) / std_errors(j);
	}
	return t_stats;
}

inline Eigen::VectorXd CoefficientInference::ComputePValues(const Eigen::VectorXd &t_statistics, size_t df) {
	const Eigen::Index p = t_statistics.size();
	Eigen::VectorXd p_values(p);
	for (Eigen::Index j = 0; j < p; j++) {
		p_values(j) = utils::student_t_pvalue(t_statistics(j), static_cast<double>(df));
	}
	return p_values;
}

inline std::pair<Eigen::VectorXd, Eigen::VectorXd>
CoefficientInference::ComputeConfidenceIntervals(const Eigen::VectorXd &coefficients,
                                                 const Eigen::VectorXd &std_errors, size_t df,
                                                 double confidence_level) {
	const double alpha = 1.0 - confidence_level;
	const double t_crit = utils::student_t_critical(alpha / 2.0, static_cast<double>(df));

	Eigen::VectorXd ci_lower = coefficients - t_crit * std_errors;
	Eigen::VectorXd ci_upper = coefficients + t_crit * std_errors;
	return {ci_lower, ci_upper};
}

inline core::InferenceResult CoefficientInference::ComputeInference(const core::RegressionResult &result,
                                                                    double confidence_level) {
	if (!result.has_std_errors) {
		throw core::InvalidConfigError("coefficient inference requires standard errors; use FitWithStdErrors");
	}
	if (confidence_level <= 0.0 || confidence_level >= 1.0) {
		throw core::InvalidConfigError("confidence_level must be in (0, 1) (got " + std::to_string(confidence_level) +
		                               ")");
	}

	// rank includes the intercept when fitted
	const size_t df = result.df_residual();
	if (df == 0) {
		throw core::SingularDesignError("no residual degrees of freedom for inference (n <= p)");
	}

	core::InferenceResult inference(result.n_params, confidence_level);
	inference.std_errors = result.std_errors;
	inference.t_statistics = ComputeTStatistics(result.coefficients, result.std_errors);
	inference.p_values = ComputePValues(inference.t_statistics, df);

	auto intervals = ComputeConfidenceIntervals(result.coefficients, result.std_errors, df, confidence_level);
	inference.ci_lower = std::move(intervals.first);
	inference.ci_upper = std::move(intervals.second);
	inference.degrees_of_freedom = df;
	return inference;
}

inline void CoefficientInference::Apply(const core::InferenceResult &inference, core::RegressionResult &result) {
	result.std_errors = inference.std_errors;
	result.t_statistics = inference.t_statistics;
	result.p_values = inference.p_values;
	result.ci_lower = inference.ci_lower;
	result.ci_upper = inference.ci_upper;
	result.confidence_level = inference.confidence_level;
}

} // namespace inference
} // namespace statkit
