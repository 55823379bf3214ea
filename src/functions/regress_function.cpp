#include "functions/regress_function.hpp"
#include "functions/function_helpers.hpp"
#include "statkit/solvers/linear_regression.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"
#include <algorithm>
#include <numeric>

namespace statkit {
namespace engine {

namespace {

/// Observed points with the fitted line, x sorted so the line draws left to right
ChartDescriptor FitChart(const core::Dataset &dataset, const core::RegressionResult &result,
                         const std::string &predictor) {
	const auto &cells = dataset.GetColumn(predictor).NumericValues();
	const size_t n = result.source_rows.size();

	std::vector<double> x(n);
	for (size_t i = 0; i < n; i++) {
		x[i] = *cells[result.source_rows[i]];
	}
	std::vector<double> y = ToStdVector(result.fitted_values + result.residuals);

	std::vector<size_t> order(n);
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(), [&x](size_t a, size_t b) { return x[a] < x[b]; });
	std::vector<double> line_x;
	std::vector<double> line_y;
	for (size_t i : order) {
		line_x.push_back(x[i]);
		line_y.push_back(result.fitted_values[static_cast<Eigen::Index>(i)]);
	}

	ChartDescriptor chart(ChartKind::SCATTER, result.dependent_name + " vs " + predictor, predictor,
	                      result.dependent_name);
	chart.AddPoints("observed", std::move(x), std::move(y));
	chart.AddPoints("fitted line", std::move(line_x), std::move(line_y));
	return chart;
}

ChartDescriptor ObservedVsFittedChart(const core::RegressionResult &result) {
	const std::vector<double> fitted = ToStdVector(result.fitted_values);
	const std::vector<double> observed = ToStdVector(result.fitted_values + result.residuals);
	const auto range = std::minmax_element(fitted.begin(), fitted.end());

	ChartDescriptor chart(ChartKind::SCATTER, "Observed vs fitted " + result.dependent_name,
	                      "fitted " + result.dependent_name, "observed " + result.dependent_name);
	chart.AddPoints("observed", fitted, observed);
	chart.AddPoints("fitted line", {*range.first, *range.second}, {*range.first, *range.second});
	return chart;
}

ChartDescriptor ResidualChart(const core::RegressionResult &result) {
	ChartDescriptor chart(ChartKind::SCATTER, "Residuals vs fitted", "fitted " + result.dependent_name, "residual");
	chart.AddPoints("residuals", ToStdVector(result.fitted_values), ToStdVector(result.residuals));
	return chart;
}

} // namespace

AnalysisResult RegressFunction::Run(const core::Dataset &dataset, const AnalysisRequest &request,
                                    const core::CancellationToken *cancellation) {
	const auto options = OptionsParser::Parse<core::RegressionOptions>(request.Options());
	const auto &selection = request.Selection();
	selection.Validate(dataset, true);

	const auto dependents = selection.Names(core::ColumnRole::DEPENDENT);
	const auto independents = selection.Names(core::ColumnRole::INDEPENDENT);
	if (dependents.size() != 1) {
		throw core::InvalidConfigError("regression needs exactly one dependent column (got " +
		                               std::to_string(dependents.size()) + ")");
	}
	STATKIT_DEBUG("OLS regression of '" << dependents[0] << "' on " << independents.size() << " predictors over "
	                                    << dataset.RowCount() << " rows, intercept=" << options.intercept);

	STATKIT_TIMING_START();
	auto result = solvers::LinearRegression::Regress(dataset, dependents[0], independents, options, cancellation);
	STATKIT_TIMING_END("OLS regression");

	std::vector<ChartDescriptor> charts;
	if (independents.size() == 1) {
		charts.push_back(FitChart(dataset, result, independents[0]));
	} else {
		charts.push_back(ObservedVsFittedChart(result));
	}
	charts.push_back(ResidualChart(result));

	std::vector<std::string> interpretation;
	interpretation.push_back("R² = " + FormatStat(result.r_squared) + ", adjusted R² = " +
	                         FormatStat(result.adj_r_squared) + ", n = " + std::to_string(result.n_obs));
	if (result.df_model() > 0) {
		interpretation.push_back("F(" + std::to_string(result.df_model()) + ", " +
		                         std::to_string(result.df_residual()) + ") = " + FormatStat(result.f_statistic) +
		                         ", p " + FormatPValue(result.f_statistic_pvalue) +
		                         (result.f_statistic_pvalue < options.alpha ? ": the model is significant"
		                                                                    : ": the model is not significant"));
	}
	for (size_t i = 0; i < result.coefficient_names.size(); i++) {
		const auto idx = static_cast<Eigen::Index>(i);
		interpretation.push_back(result.coefficient_names[i] + ": b = " + FormatStat(result.coefficients[idx]) +
		                         " (SE " + FormatStat(result.std_errors[idx]) + "), t = " +
		                         FormatStat(result.t_statistics[idx], 3) + ", p " +
		                         FormatPValue(result.p_values[idx]) +
		                         (result.p_values[idx] < options.alpha ? ", significant" : ", not significant"));
	}
	for (size_t j = 0; j < result.vif.size(); j++) {
		if (result.vif[j] >= 10.0) {
			interpretation.push_back("VIF of " + independents[j] + " is " + FormatStat(result.vif[j], 1) +
			                         ": high collinearity, coefficient estimates are unstable");
		}
	}

	return AnalysisResult(AnalysisKind::REGRESS, std::move(result), std::move(charts), std::move(interpretation));
}

} // namespace engine
} // namespace statkit
