#include "export/result_serializer.hpp"
#include "statkit/core/analysis_options.hpp"

namespace statkit {
namespace engine {

using nlohmann::json;

namespace {

json VectorJson(const Eigen::VectorXd &values) {
	return json(std::vector<double>(values.data(), values.data() + values.size()));
}

template <typename Derived>
json MatrixJson(const Eigen::MatrixBase<Derived> &matrix) {
	json rows = json::array();
	for (Eigen::Index i = 0; i < matrix.rows(); i++) {
		json row = json::array();
		for (Eigen::Index j = 0; j < matrix.cols(); j++) {
			row.push_back(matrix(i, j));
		}
		rows.push_back(std::move(row));
	}
	return rows;
}

json OptionalJson(const std::optional<double> &value) {
	return value ? json(*value) : json(nullptr);
}

json GroupJson(const core::GroupSummary &group) {
	return {{"name", group.name},
	        {"n", group.n},
	        {"mean", group.mean},
	        {"variance", group.variance},
	        {"std_dev", group.std_dev},
	        {"min", group.min},
	        {"q1", group.q1},
	        {"median", group.median},
	        {"q3", group.q3},
	        {"max", group.max}};
}

json GroupsJson(const std::vector<core::GroupSummary> &groups) {
	json out = json::array();
	for (const auto &group : groups) {
		out.push_back(GroupJson(group));
	}
	return out;
}

json LeveneJson(const core::LeveneResult &levene) {
	if (!levene.defined) {
		return nullptr;
	}
	return {{"statistic", levene.statistic},
	        {"p_value", levene.p_value},
	        {"df_between", levene.df_between},
	        {"df_within", levene.df_within}};
}

json TukeyJson(const std::vector<core::TukeyComparison> &comparisons) {
	json out = json::array();
	for (const auto &cmp : comparisons) {
		out.push_back({{"group_a", cmp.group_a},
		               {"group_b", cmp.group_b},
		               {"mean_difference", cmp.mean_difference},
		               {"std_error", cmp.std_error},
		               {"q_statistic", cmp.q_statistic},
		               {"p_adjusted", cmp.p_adjusted},
		               {"ci_lower", cmp.ci_lower},
		               {"ci_upper", cmp.ci_upper},
		               {"reject", cmp.reject}});
	}
	return out;
}

json NormalityJson(const std::vector<core::NormalityResult> &results) {
	json out = json::array();
	for (const auto &normality : results) {
		json entry = {{"column", normality.column}, {"n", normality.n}};
		if (normality.defined) {
			entry["skewness"] = normality.skewness;
			entry["kurtosis"] = normality.kurtosis;
			entry["statistic"] = normality.statistic;
			entry["p_value"] = normality.p_value;
			entry["is_normal"] = normality.is_normal;
		} else {
			entry["is_normal"] = nullptr;
		}
		out.push_back(std::move(entry));
	}
	return out;
}

/// One overload per payload alternative
struct PayloadJson {
	json operator()(const core::CleaningResult &r) const {
		return {{"dataset", ResultSerializer::ToJson(r.dataset)},
		        {"rows", r.dataset.RowCount()},
		        {"columns", r.dataset.ColumnCount()},
		        {"rows_removed", r.rows_removed},
		        {"duplicates_removed", r.duplicates_removed},
		        {"columns_removed", r.columns_removed},
		        {"imputed_counts", r.imputed_counts},
		        {"log", r.log}};
	}

	json operator()(const core::DescriptiveResult &r) const {
		json numeric = json::array();
		for (const auto &s : r.numeric) {
			numeric.push_back({{"name", s.name},
			                   {"count", s.count},
			                   {"missing", s.missing},
			                   {"sum", s.sum},
			                   {"mean", s.mean},
			                   {"variance", s.variance},
			                   {"std_dev", s.std_dev},
			                   {"min", s.min},
			                   {"q1", s.q1},
			                   {"median", s.median},
			                   {"q3", s.q3},
			                   {"max", s.max},
			                   {"range", s.range()},
			                   {"iqr", s.iqr()},
			                   {"skewness", OptionalJson(s.skewness)},
			                   {"kurtosis", OptionalJson(s.kurtosis)},
			                   {"coefficient_of_variation", OptionalJson(s.coefficient_of_variation)}});
		}
		json categorical = json::array();
		for (const auto &table : r.categorical) {
			json categories = json::array();
			for (const auto &c : table.categories) {
				categories.push_back({{"category", c.category}, {"count", c.count}, {"percent", c.percent}});
			}
			categorical.push_back({{"name", table.name}, {"missing", table.missing}, {"categories", categories}});
		}
		return {{"numeric", numeric}, {"categorical", categorical}};
	}

	json operator()(const core::TTestResult &r) const {
		return {{"variant", core::TTestVariantName(r.variant)},
		        {"value_column", r.value_column},
		        {"group_column", r.group_column},
		        {"groups", GroupsJson(r.groups)},
		        {"statistic", r.statistic},
		        {"degrees_of_freedom", r.degrees_of_freedom},
		        {"p_value", r.p_value},
		        {"mean_difference", r.mean_difference},
		        {"std_error", r.std_error},
		        {"confidence_level", r.confidence_level},
		        {"ci_lower", r.ci_lower},
		        {"ci_upper", r.ci_upper},
		        {"cohens_d", r.cohens_d},
		        {"levene", r.variant == core::TTestVariant::PAIRED ? json(nullptr) : LeveneJson(r.levene)},
		        {"alpha", r.alpha},
		        {"reject_null", r.reject_null},
		        {"interpretation", r.interpretation}};
	}

	json operator()(const core::AnovaResult &r) const {
		return {{"value_column", r.value_column},
		        {"group_column", r.group_column},
		        {"groups", GroupsJson(r.groups)},
		        {"ss_between", r.ss_between},
		        {"ss_within", r.ss_within},
		        {"ss_total", r.ss_total},
		        {"df_between", r.df_between},
		        {"df_within", r.df_within},
		        {"ms_between", r.ms_between},
		        {"ms_within", r.ms_within},
		        {"f_statistic", r.f_statistic},
		        {"p_value", r.p_value},
		        {"eta_squared", r.eta_squared},
		        {"levene", LeveneJson(r.levene)},
		        {"tukey", TukeyJson(r.tukey)},
		        {"tukey_critical", r.tukey_critical},
		        {"alpha", r.alpha},
		        {"reject_null", r.reject_null},
		        {"interpretation", r.interpretation}};
	}

	json operator()(const core::CorrelationResult &r) const {
		return {{"method", core::CorrelationMethodName(r.method)},
		        {"columns", r.columns},
		        {"coefficients", MatrixJson(r.coefficients)},
		        {"p_values", MatrixJson(r.p_values)},
		        {"sample_sizes", MatrixJson(r.sample_sizes)},
		        {"normality", NormalityJson(r.normality)},
		        {"recommended_method", core::CorrelationMethodName(r.recommended_method)},
		        {"alpha", r.alpha}};
	}

	json operator()(const core::RegressionResult &r) const {
		return {{"dependent", r.dependent_name},
		        {"coefficient_names", r.coefficient_names},
		        {"coefficients", VectorJson(r.coefficients)},
		        {"std_errors", VectorJson(r.std_errors)},
		        {"t_statistics", VectorJson(r.t_statistics)},
		        {"p_values", VectorJson(r.p_values)},
		        {"ci_lower", VectorJson(r.ci_lower)},
		        {"ci_upper", VectorJson(r.ci_upper)},
		        {"confidence_level", r.confidence_level},
		        {"intercept", r.has_intercept},
		        {"n_obs", r.n_obs},
		        {"n_params", r.n_params},
		        {"df_model", r.df_model()},
		        {"df_residual", r.df_residual()},
		        {"r_squared", r.r_squared},
		        {"adj_r_squared", r.adj_r_squared},
		        {"mse", r.mse},
		        {"residual_standard_error", r.residual_standard_error},
		        {"f_statistic", r.f_statistic},
		        {"f_statistic_pvalue", r.f_statistic_pvalue},
		        {"log_likelihood", r.log_likelihood},
		        {"aic", r.aic},
		        {"bic", r.bic},
		        {"fitted_values", VectorJson(r.fitted_values)},
		        {"residuals", VectorJson(r.residuals)},
		        {"leverage", VectorJson(r.leverage)},
		        {"standardized_residuals", VectorJson(r.standardized_residuals)},
		        {"cooks_distance", VectorJson(r.cooks_distance)},
		        {"vif", r.vif},
		        {"source_rows", r.source_rows}};
	}

	json operator()(const core::PcaResult &r) const {
		return {{"columns", r.columns},
		        {"standardized", r.standardized},
		        {"means", VectorJson(r.means)},
		        {"scales", VectorJson(r.scales)},
		        {"eigenvalues", VectorJson(r.eigenvalues)},
		        {"explained_variance_ratio", VectorJson(r.explained_variance_ratio)},
		        {"cumulative_variance_ratio", VectorJson(r.cumulative_variance_ratio)},
		        {"loadings", MatrixJson(r.loadings)},
		        {"scores", MatrixJson(r.scores)},
		        {"source_rows", r.source_rows}};
	}

	json operator()(const core::KMeansResult &r) const {
		return {{"columns", r.columns},
		        {"k", r.k()},
		        {"init", core::KMeansInitName(r.init)},
		        {"seed", r.seed},
		        {"standardized", r.standardized},
		        {"initial_rows", r.initial_rows},
		        {"assignments", r.assignments},
		        {"source_rows", r.source_rows},
		        {"centroids", MatrixJson(r.centroids)},
		        {"cluster_sizes", r.cluster_sizes},
		        {"cluster_wcss", r.cluster_wcss},
		        {"wcss", r.wcss},
		        {"iterations", r.iterations},
		        {"stop_reason", core::StopReasonName(r.stop_reason)},
		        {"final_shift", r.final_shift},
		        {"reseeds", r.reseeds}};
	}
};

} // namespace

json ResultSerializer::ToJson(const AnalysisResult &result) {
	json charts = json::array();
	for (const auto &chart : result.Charts()) {
		charts.push_back(ToJson(chart));
	}
	return {{"kind", AnalysisKindName(result.Kind())},
	        {"result", std::visit(PayloadJson {}, result.Payload())},
	        {"charts", charts},
	        {"interpretation", result.Interpretation()}};
}

json ResultSerializer::ToJson(const ChartDescriptor &chart) {
	json series = json::array();
	for (const auto &s : chart.series) {
		json entry = {{"name", s.name}, {"values", s.values}};
		if (!s.x.empty()) {
			entry["x"] = s.x;
		}
		series.push_back(std::move(entry));
	}
	return {{"kind", ChartKindName(chart.kind)},
	        {"title", chart.title},
	        {"x_label", chart.x_label},
	        {"y_label", chart.y_label},
	        {"categories", chart.categories},
	        {"series", series}};
}

json ResultSerializer::ToJson(const core::QualityReport &report) {
	return {{"rows", report.n_rows},
	        {"columns", report.n_cols},
	        {"duplicate_key_columns", report.duplicate_key_columns},
	        {"duplicate_rows", report.duplicate_rows},
	        {"missing_total", report.missing_total},
	        {"rows_with_missing", report.rows_with_missing},
	        {"missing_by_column", report.missing_by_column},
	        {"outliers_by_column", report.outliers_by_column}};
}

json ResultSerializer::ToJson(const core::Dataset &dataset) {
	json columns = json::array();
	for (const auto &col : dataset.Columns()) {
		json values = json::array();
		if (col.IsNumeric()) {
			for (const auto &cell : col.NumericValues()) {
				values.push_back(cell ? json(*cell) : json(nullptr));
			}
		} else {
			for (const auto &cell : col.TextValues()) {
				values.push_back(cell ? json(*cell) : json(nullptr));
			}
		}
		columns.push_back({{"name", col.Name()}, {"type", core::ColumnTypeName(col.Type())}, {"values", values}});
	}
	return {{"columns", columns}};
}

json ResultSerializer::ErrorToJson(const core::StatkitError &error) {
	return {{"error", core::ErrorKindName(error.Kind())}, {"message", error.what()}};
}

} // namespace engine
} // namespace statkit
