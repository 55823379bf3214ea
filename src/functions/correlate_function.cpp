#include "functions/correlate_function.hpp"
#include "functions/function_helpers.hpp"
#include "statkit/correlation/correlation.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"

namespace statkit {
namespace engine {

AnalysisResult CorrelateFunction::Run(const core::Dataset &dataset, const AnalysisRequest &request,
                                      const core::CancellationToken *cancellation) {
	const auto options = OptionsParser::Parse<core::CorrelationOptions>(request.Options());
	const auto &selection = request.Selection();
	selection.Validate(dataset, true);
	const auto columns = selection.AllNames();
	STATKIT_DEBUG(core::CorrelationMethodName(options.method)
	              << " correlation of " << columns.size() << " columns over " << dataset.RowCount() << " rows");

	auto result = correlation::Correlation::Compute(dataset, columns, options, cancellation);
	const auto p = static_cast<Eigen::Index>(columns.size());

	std::vector<ChartDescriptor> charts;
	ChartDescriptor heatmap(ChartKind::CORRELATION_HEATMAP,
	                        std::string(options.method == core::CorrelationMethod::PEARSON ? "Pearson" : "Spearman") +
	                            " correlation matrix");
	heatmap.categories = columns;
	for (Eigen::Index i = 0; i < p; i++) {
		heatmap.AddSeries(columns[static_cast<size_t>(i)], ToStdVector(result.coefficients.row(i).transpose()));
	}
	charts.push_back(std::move(heatmap));

	if (columns.size() == 2) {
		const auto &x = dataset.GetColumn(columns[0]).NumericValues();
		const auto &y = dataset.GetColumn(columns[1]).NumericValues();
		std::vector<double> xs;
		std::vector<double> ys;
		for (size_t row = 0; row < dataset.RowCount(); row++) {
			if (x[row] && y[row]) {
				xs.push_back(*x[row]);
				ys.push_back(*y[row]);
			}
		}
		ChartDescriptor scatter(ChartKind::SCATTER, columns[1] + " vs " + columns[0], columns[0], columns[1]);
		scatter.AddPoints("observations", std::move(xs), std::move(ys));
		charts.push_back(std::move(scatter));
	}

	std::vector<std::string> interpretation;
	for (Eigen::Index i = 0; i < p; i++) {
		for (Eigen::Index j = i + 1; j < p; j++) {
			const double r = result.coefficients(i, j);
			std::string line = columns[static_cast<size_t>(i)] + " ~ " + columns[static_cast<size_t>(j)] +
			                   ": r = " + FormatStat(r, 3) + " (" + core::CorrelationStrength(r);
			if (std::string(core::CorrelationStrength(r)) != "negligible") {
				line += r > 0.0 ? ", positive" : ", negative";
			}
			line += "), p " + FormatPValue(result.p_values(i, j)) + ", n = " +
			        std::to_string(result.sample_sizes(i, j));
			line += result.p_values(i, j) < result.alpha ? ", significant" : ", not significant";
			interpretation.push_back(line);
		}
	}

	std::string normality = "Jarque-Bera normality: ";
	for (size_t i = 0; i < result.normality.size(); i++) {
		const auto &check = result.normality[i];
		if (i > 0) {
			normality += ", ";
		}
		normality += check.column;
		if (!check.defined) {
			normality += " not assessed (n < 4)";
		} else {
			normality += std::string(check.is_normal ? " normal" : " non-normal") + " (p " +
			             FormatPValue(check.p_value) + ")";
		}
	}
	normality += "; " + std::string(core::CorrelationMethodName(result.recommended_method)) + " recommended";
	if (result.recommended_method != result.method) {
		STATKIT_INFO("correlation ran as " << core::CorrelationMethodName(result.method) << " but "
		                                   << core::CorrelationMethodName(result.recommended_method)
		                                   << " is recommended for these columns");
	}
	interpretation.push_back(normality);

	return AnalysisResult(AnalysisKind::CORRELATE, std::move(result), std::move(charts), std::move(interpretation));
}

} // namespace engine
} // namespace statkit
