#pragma once

#include "statkit/diagnostics/regression_diagnostics.hpp"
#include <algorithm>
#include <cmath>

namespace statkit {
namespace diagnostics {

// Implementation of RegressionDiagnostics methods

inline Eigen::VectorXd RegressionDiagnostics::ComputeLeverage(const Eigen::MatrixXd &X, bool intercept) {
	const Eigen::Index n = X.rows();

	Eigen::MatrixXd X_aug;
	if (intercept) {
		X_aug.resize(n, X.cols() + 1);
		X_aug.col(0) = Eigen::VectorXd::Ones(n);
		X_aug.rightCols(X.cols()) = X;
	} else {
		X_aug = X;
	}
	if (X_aug.cols() == 0) {
		return Eigen::VectorXd::Zero(n);
	}

	// h_i = ||Q1_i||² with Q1 the thin Q factor (X has full column rank after a successful fit)
	Eigen::HouseholderQR<Eigen::MatrixXd> qr(X_aug);
	const Eigen::MatrixXd Q1 = qr.householderQ() * Eigen::MatrixXd::Identity(n, X_aug.cols());

	Eigen::VectorXd leverage = Q1.rowwise().squaredNorm();
	for (Eigen::Index i = 0; i < n; i++) {
		leverage(i) = std::max(0.0, std::min(1.0, leverage(i)));
	}
	return leverage;
}

inline Eigen::VectorXd RegressionDiagnostics::ComputeStandardizedResiduals(const Eigen::VectorXd &residuals,
                                                                           const Eigen::VectorXd &leverage,
                                                                           double mse) {
	const Eigen::Index n = residuals.size();
	Eigen::VectorXd std_resid(n);
	for (Eigen::Index i = 0; i < n; i++) {
		const double one_minus_h = 1.0 - leverage(i);
		if (one_minus_h <= 1e-12) {
			std_resid(i) = 0.0;
		} else {
			std_resid(i) = residuals(i) / std::sqrt(mse * one_minus_h);
		}
	}
	return std_resid;
}

inline Eigen::VectorXd RegressionDiagnostics::ComputeCooksDistance(const Eigen::VectorXd &standardized_residuals,
                                                                   const Eigen::VectorXd &leverage,
                                                                   size_t n_params) {
	const Eigen::Index n = standardized_residuals.size();
	Eigen::VectorXd cooks_d(n);
	for (Eigen::Index i = 0; i < n; i++) {
		const double h = leverage(i);
		const double one_minus_h = 1.0 - h;
		if (one_minus_h <= 1e-12) {
			cooks_d(i) = 0.0;
		} else {
			const double r = standardized_residuals(i);
			cooks_d(i) = r * r * h / (static_cast<double>(n_params) * one_minus_h);
		}
	}
	return cooks_d;
}

inline void RegressionDiagnostics::ComputeAllDiagnostics(const Eigen::MatrixXd &X, core::RegressionResult &result) {
	result.leverage = ComputeLeverage(X, result.has_intercept);
	result.standardized_residuals = ComputeStandardizedResiduals(result.residuals, result.leverage, result.mse);
	result.cooks_distance = ComputeCooksDistance(result.standardized_residuals, result.leverage, result.n_params);
}

} // namespace diagnostics
} // namespace statkit
