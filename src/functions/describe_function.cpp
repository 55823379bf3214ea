#include "functions/describe_function.hpp"
#include "functions/function_helpers.hpp"
#include "statkit/descriptive/descriptive_statistics.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"

namespace statkit {
namespace engine {

AnalysisResult DescribeFunction::Run(const core::Dataset &dataset, const AnalysisRequest &request) {
	OptionsParser::ExpectEmpty(request.Options(), "describe");
	const auto columns = request.Selection().AllNames();
	STATKIT_DEBUG("Describing " << (columns.empty() ? dataset.ColumnCount() : columns.size()) << " columns over "
	                            << dataset.RowCount() << " rows");

	auto result = descriptive::DescriptiveStatistics::Describe(dataset, columns);

	std::vector<ChartDescriptor> charts;
	std::vector<std::string> interpretation;

	if (!result.numeric.empty()) {
		ChartDescriptor box(ChartKind::BOX, "Distribution per column", "column", "value");
		for (const auto &summary : result.numeric) {
			box.categories.push_back(summary.name);
			box.AddSeries(summary.name, FiveNumbers(summary));

			std::string line = summary.name + ": n = " + std::to_string(summary.count) +
			                   ", mean = " + FormatStat(summary.mean) + ", sd = " + FormatStat(summary.std_dev) +
			                   ", median = " + FormatStat(summary.median);
			if (summary.skewness && std::fabs(*summary.skewness) > 1.0) {
				line += *summary.skewness > 0.0 ? " (strongly right-skewed)" : " (strongly left-skewed)";
			}
			interpretation.push_back(line);
		}
		charts.push_back(std::move(box));
	}

	for (const auto &table : result.categorical) {
		ChartDescriptor bar(ChartKind::BAR, "Frequencies of " + table.name, table.name, "count");
		std::vector<double> counts;
		for (const auto &category : table.categories) {
			bar.categories.push_back(category.category);
			counts.push_back(static_cast<double>(category.count));
		}
		bar.AddSeries("count", std::move(counts));
		charts.push_back(std::move(bar));

		if (!table.categories.empty()) {
			const auto &top = table.categories.front();
			interpretation.push_back(table.name + ": " + std::to_string(table.categories.size()) +
			                         " categories, most frequent '" + top.category + "' (" +
			                         FormatStat(top.percent, 1) + "%)");
		}
	}

	return AnalysisResult(AnalysisKind::DESCRIBE, std::move(result), std::move(charts), std::move(interpretation));
}

} // namespace engine
} // namespace statkit
