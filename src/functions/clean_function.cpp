#include "functions/clean_function.hpp"
#include "statkit/cleaning/data_cleaner.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"

namespace statkit {
namespace engine {

AnalysisResult CleanFunction::Run(const core::Dataset &dataset, const AnalysisRequest &request) {
	const auto options = OptionsParser::Parse<core::CleaningOptions>(request.Options());
	const auto targets = request.Selection().AllNames();
	STATKIT_DEBUG("Cleaning " << dataset.RowCount() << " rows, policy=" << core::MissingStrategyName(options.strategy)
	                          << ", targets=" << (targets.empty() ? dataset.ColumnCount() : targets.size()));

	auto result = cleaning::DataCleaner::Clean(dataset, targets, options);
	for (const auto &line : result.log) {
		STATKIT_INFO("clean: " << line);
	}

	ChartDescriptor missing(ChartKind::BAR, "Missing values per column", "column", "missing cells");
	std::vector<double> before;
	std::vector<double> after;
	for (const auto &col : dataset.Columns()) {
		missing.categories.push_back(col.Name());
		before.push_back(static_cast<double>(col.MissingCount()));
		after.push_back(result.dataset.HasColumn(col.Name())
		                    ? static_cast<double>(result.dataset.MissingCount(col.Name()))
		                    : 0.0);
	}
	missing.AddSeries("before", std::move(before)).AddSeries("after", std::move(after));

	std::vector<std::string> interpretation = result.log;
	interpretation.push_back(std::to_string(result.dataset.RowCount()) + " rows and " +
	                         std::to_string(result.dataset.ColumnCount()) + " columns remain");

	return AnalysisResult(AnalysisKind::CLEAN, std::move(result), {std::move(missing)}, std::move(interpretation));
}

} // namespace engine
} // namespace statkit
