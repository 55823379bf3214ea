#include "functions/kmeans_function.hpp"
#include "functions/function_helpers.hpp"
#include "statkit/clustering/kmeans.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"

namespace statkit {
namespace engine {

namespace {

ChartDescriptor ClusterChart(const core::Dataset &dataset, const core::KMeansResult &result) {
	const auto &columns = result.columns;
	const bool single = columns.size() == 1;
	const auto &x_cells = dataset.GetColumn(columns[0]).NumericValues();
	const auto *y_cells = single ? nullptr : &dataset.GetColumn(columns[1]).NumericValues();

	// A single column is drawn as a strip along the x axis
	ChartDescriptor chart(ChartKind::SCATTER, "Clusters", columns[0], single ? "" : columns[1]);
	const size_t k = result.k();
	std::vector<std::vector<double>> xs(k);
	std::vector<std::vector<double>> ys(k);
	for (size_t i = 0; i < result.assignments.size(); i++) {
		const size_t row = result.source_rows[i];
		const size_t c = result.assignments[i];
		xs[c].push_back(*x_cells[row]);
		ys[c].push_back(single ? 0.0 : *(*y_cells)[row]);
	}
	for (size_t c = 0; c < k; c++) {
		chart.AddPoints("cluster " + std::to_string(c + 1), std::move(xs[c]), std::move(ys[c]));
	}

	std::vector<double> cx;
	std::vector<double> cy;
	for (Eigen::Index c = 0; c < result.centroids.rows(); c++) {
		cx.push_back(result.centroids(c, 0));
		cy.push_back(single ? 0.0 : result.centroids(c, 1));
	}
	chart.AddPoints("centroids", std::move(cx), std::move(cy));
	return chart;
}

} // namespace

AnalysisResult KMeansFunction::Run(const core::Dataset &dataset, const AnalysisRequest &request,
                                   const core::CancellationToken *cancellation) {
	const auto options = OptionsParser::Parse<core::KMeansOptions>(request.Options());
	const auto &selection = request.Selection();
	selection.Validate(dataset, true);
	const auto columns = selection.AllNames();
	STATKIT_DEBUG("k-means with k=" << options.k << ", init=" << core::KMeansInitName(options.init)
	                                << ", seed=" << options.seed << " on " << columns.size() << " columns over "
	                                << dataset.RowCount() << " rows");

	STATKIT_TIMING_START();
	auto result = clustering::KMeans::Cluster(dataset, columns, options, cancellation);
	STATKIT_TIMING_END("k-means");
	STATKIT_DEBUG("k-means stopped (" << core::StopReasonName(result.stop_reason) << ") after " << result.iterations
	                                  << " iterations, " << result.reseeds << " reseeds");

	std::vector<ChartDescriptor> charts;
	charts.push_back(ClusterChart(dataset, result));

	std::vector<std::string> interpretation;
	if (result.stop_reason == core::StopReason::CONVERGED) {
		interpretation.push_back("converged after " + std::to_string(result.iterations) + " iterations");
	} else {
		interpretation.push_back("stopped after the maximum of " + std::to_string(result.iterations) +
		                         " iterations without converging (last centroid shift " +
		                         FormatStat(result.final_shift, 6) + ")");
	}
	for (size_t c = 0; c < result.k(); c++) {
		interpretation.push_back("cluster " + std::to_string(c + 1) + ": " + std::to_string(result.cluster_sizes[c]) +
		                         " points, within-cluster sum of squares " + FormatStat(result.cluster_wcss[c]));
	}
	interpretation.push_back("total within-cluster sum of squares " + FormatStat(result.wcss));

	return AnalysisResult(AnalysisKind::KMEANS, std::move(result), std::move(charts), std::move(interpretation));
}

} // namespace engine
} // namespace statkit
