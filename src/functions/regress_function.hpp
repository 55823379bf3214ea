#pragma once

#include "engine/analysis_request.hpp"
#include "engine/analysis_result.hpp"
#include "statkit/core/cancellation.hpp"
#include "statkit/core/dataset.hpp"

namespace statkit {
namespace engine {

/**
 * @brief Simple and multiple linear regression (OLS)
 *
 * Selection: one DEPENDENT column and one or more INDEPENDENT columns.
 * Options: intercept, confidence_level, alpha, qr_tolerance
 *
 * Model: min ||y - Xβ||², solved by column-pivoted QR
 *
 * Returns:
 *   - payload: RegressionResult (coefficients, inference, fit statistics,
 *     residuals and observation diagnostics)
 *   - charts: observed data with the fitted line (observed vs fitted for
 *     several predictors), residuals vs fitted values
 *   - interpretation: model fit, one line per coefficient, collinearity warnings
 */
class RegressFunction {
public:
	static AnalysisResult Run(const core::Dataset &dataset, const AnalysisRequest &request,
	                          const core::CancellationToken *cancellation);
};

} // namespace engine
} // namespace statkit
