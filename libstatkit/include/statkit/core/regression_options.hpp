#pragma once

#include "statkit/core/errors.hpp"
#include <cstdint>
#include <string>

namespace statkit {
namespace core {

/**
 * Configuration options for linear regression
 *
 * All options have in-class defaults; Validate() rejects out-of-range values
 * with InvalidConfigError.
 */
struct RegressionOptions {
	// ========================================================================
	// Model options
	// ========================================================================

	/// Include intercept term in regression
	/// Default: true
	bool intercept = true;

	// ========================================================================
	// Statistical inference parameters
	// ========================================================================

	/// Confidence level for coefficient confidence intervals
	/// Default: 0.95 (95% confidence intervals)
	double confidence_level = 0.95;

	/// Significance level used for the textual decision on each coefficient
	/// Default: 0.05
	double alpha = 0.05;

	// ========================================================================
	// Computational parameters
	// ========================================================================

	/// QR decomposition rank tolerance (-1 = auto, use Eigen default)
	/// Default: -1.0 (auto)
	double qr_tolerance = -1.0;

	// ========================================================================
	// Constructors
	// ========================================================================

	RegressionOptions() = default;

	/// Convenience constructor for common OLS options
	static RegressionOptions OLS(bool intercept_ = true) {
		RegressionOptions opts;
		opts.intercept = intercept_;
		return opts;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws InvalidConfigError if validation fails
	 */
	void Validate() const {
		if (confidence_level <= 0.0 || confidence_level >= 1.0) {
			throw InvalidConfigError("confidence_level must be in (0, 1) (got " + std::to_string(confidence_level) +
			                         ")");
		}

		if (alpha <= 0.0 || alpha >= 1.0) {
			throw InvalidConfigError("alpha must be in (0, 1) (got " + std::to_string(alpha) + ")");
		}

		// -1 selects Eigen's default threshold
		if (qr_tolerance != -1.0 && (qr_tolerance <= 0.0 || qr_tolerance >= 1.0)) {
			throw InvalidConfigError("qr_tolerance must be -1 (auto) or in (0, 1) (got " +
			                         std::to_string(qr_tolerance) + ")");
		}
	}
};

} // namespace core
} // namespace statkit
