#pragma once

#include "engine/analysis_request.hpp"
#include "engine/chart_descriptor.hpp"
#include "statkit/core/cleaning_result.hpp"
#include "statkit/core/correlation_result.hpp"
#include "statkit/core/descriptive_result.hpp"
#include "statkit/core/errors.hpp"
#include "statkit/core/hypothesis_result.hpp"
#include "statkit/core/kmeans_result.hpp"
#include "statkit/core/pca_result.hpp"
#include "statkit/core/regression_result.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace statkit {
namespace engine {

/// One result shape per analysis kind
using ResultPayload = std::variant<core::CleaningResult, core::DescriptiveResult, core::TTestResult, core::AnovaResult,
                                   core::CorrelationResult, core::RegressionResult, core::PcaResult, core::KMeansResult>;

/**
 * Output envelope of a single analysis
 *
 * Immutable after construction. The payload alternative always matches
 * Kind(); As<T>() refuses to hand out any other shape.
 */
class AnalysisResult {
public:
	AnalysisResult(AnalysisKind kind, ResultPayload payload, std::vector<ChartDescriptor> charts,
	               std::vector<std::string> interpretation)
	    : kind_(kind), payload_(std::move(payload)), charts_(std::move(charts)),
	      interpretation_(std::move(interpretation)) {
	}

	AnalysisKind Kind() const {
		return kind_;
	}

	const ResultPayload &Payload() const {
		return payload_;
	}

	template <typename T>
	bool Holds() const {
		return std::holds_alternative<T>(payload_);
	}

	/**
	 * Typed access to the payload
	 *
	 * @throws InvalidConfigError when the result is of another kind
	 */
	template <typename T>
	const T &As() const {
		const T *value = std::get_if<T>(&payload_);
		if (value == nullptr) {
			throw core::InvalidConfigError(std::string("result of a ") + AnalysisKindName(kind_) +
			                               " analysis does not hold the requested type");
		}
		return *value;
	}

	const std::vector<ChartDescriptor> &Charts() const {
		return charts_;
	}

	/// Plain-language reading of the result, one statement per line
	const std::vector<std::string> &Interpretation() const {
		return interpretation_;
	}

private:
	AnalysisKind kind_;
	ResultPayload payload_;
	std::vector<ChartDescriptor> charts_;
	std::vector<std::string> interpretation_;
};

} // namespace engine
} // namespace statkit
