#pragma once

#include "engine/analysis_request.hpp"
#include "engine/analysis_result.hpp"
#include "statkit/core/cancellation.hpp"
#include "statkit/core/cleaning_result.hpp"
#include "statkit/core/dataset.hpp"

namespace statkit {
namespace engine {

/**
 * @brief Entry point of the analysis engine
 *
 * Holds no state: every call is a pure function of the dataset and the
 * request, so several analyses may run concurrently over the same dataset.
 *
 * Errors are logged at WARN and rethrown unchanged. A call either returns a
 * complete result or throws one core::StatkitError subclass; core::Cancelled
 * is thrown when the token is set while the analysis runs.
 */
class AnalysisEngine {
public:
	/**
	 * @brief Run one analysis
	 *
	 * @param dataset Source data, read only
	 * @param request Analysis kind, column selection and options
	 * @param cancellation Optional token polled by the long-running analyses
	 */
	static AnalysisResult Run(const core::Dataset &dataset, const AnalysisRequest &request,
	                          const core::CancellationToken *cancellation = nullptr);

	/**
	 * @brief Data health report (missing cells, duplicate rows, IQR outliers)
	 */
	static core::QualityReport CheckQuality(const core::Dataset &dataset);

private:
	static AnalysisResult Dispatch(const core::Dataset &dataset, const AnalysisRequest &request,
	                               const core::CancellationToken *cancellation);

	AnalysisEngine() = delete;
};

} // namespace engine
} // namespace statkit
