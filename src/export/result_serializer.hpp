#pragma once

#include "engine/analysis_result.hpp"
#include "engine/chart_descriptor.hpp"
#include "statkit/core/cleaning_result.hpp"
#include "statkit/core/dataset.hpp"
#include "statkit/core/errors.hpp"
#include <nlohmann/json.hpp>

namespace statkit {
namespace engine {

/**
 * @brief Export of results as JSON objects (field name -> scalar/array)
 *
 * Layout of an analysis result:
 *   {"kind": "ttest", "result": {...}, "charts": [...], "interpretation": [...]}
 *
 * Matrices are arrays of rows. Statistics that are undefined (absent
 * std::optional fields) are null. No binary chart data is embedded.
 */
class ResultSerializer {
public:
	static nlohmann::json ToJson(const AnalysisResult &result);

	static nlohmann::json ToJson(const ChartDescriptor &chart);

	static nlohmann::json ToJson(const core::QualityReport &report);

	/// Columns as {"name", "type", "values"} with null for missing cells
	static nlohmann::json ToJson(const core::Dataset &dataset);

	/// {"error": "<kind>", "message": "..."}
	static nlohmann::json ErrorToJson(const core::StatkitError &error);

private:
	ResultSerializer() = delete;
};

} // namespace engine
} // namespace statkit
