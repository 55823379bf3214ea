#include "functions/pca_function.hpp"
#include "functions/function_helpers.hpp"
#include "statkit/decomposition/pca.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"

namespace statkit {
namespace engine {

AnalysisResult PcaFunction::Run(const core::Dataset &dataset, const AnalysisRequest &request,
                                const core::CancellationToken *cancellation) {
	const auto options = OptionsParser::Parse<core::PcaOptions>(request.Options());
	const auto &selection = request.Selection();
	selection.Validate(dataset, true);
	const auto columns = selection.AllNames();
	STATKIT_DEBUG("PCA of " << columns.size() << " columns over " << dataset.RowCount()
	                        << " rows, standardize=" << options.standardize);

	STATKIT_TIMING_START();
	auto result = decomposition::PCA::Compute(dataset, columns, options, cancellation);
	STATKIT_TIMING_END("PCA");

	const size_t k = result.component_count();
	std::vector<std::string> labels;
	for (size_t c = 0; c < k; c++) {
		labels.push_back("PC" + std::to_string(c + 1));
	}

	std::vector<ChartDescriptor> charts;
	ChartDescriptor scree(ChartKind::BAR, "Explained variance per component", "component", "explained variance ratio");
	scree.categories = labels;
	scree.AddSeries("explained_variance_ratio", ToStdVector(result.explained_variance_ratio));
	charts.push_back(std::move(scree));

	ChartDescriptor cumulative(ChartKind::LINE, "Cumulative explained variance", "component",
	                           "cumulative variance ratio");
	cumulative.categories = labels;
	cumulative.AddSeries("cumulative_variance_ratio", ToStdVector(result.cumulative_variance_ratio));
	charts.push_back(std::move(cumulative));

	if (k >= 2) {
		ChartDescriptor scores(ChartKind::SCATTER, "Component scores", "PC1", "PC2");
		scores.AddPoints("scores", ToStdVector(result.scores.col(0)), ToStdVector(result.scores.col(1)));
		charts.push_back(std::move(scores));
	}

	std::vector<std::string> interpretation;
	for (size_t c = 0; c < k; c++) {
		const auto idx = static_cast<Eigen::Index>(c);
		Eigen::Index top = 0;
		result.loadings.col(idx).cwiseAbs().maxCoeff(&top);
		interpretation.push_back(labels[c] + " explains " + FormatPercent(result.explained_variance_ratio(idx)) +
		                         " of the variance (eigenvalue " + FormatStat(result.eigenvalues(idx), 3) +
		                         "), loads most on " + columns[static_cast<size_t>(top)]);
	}
	interpretation.push_back("the first " + std::to_string(k) + " components explain " +
	                         FormatPercent(result.cumulative_variance_ratio(static_cast<Eigen::Index>(k - 1))) +
	                         " of the total variance");

	return AnalysisResult(AnalysisKind::PCA, std::move(result), std::move(charts), std::move(interpretation));
}

} // namespace engine
} // namespace statkit
