#include "functions/hypothesis_functions.hpp"
#include "functions/function_helpers.hpp"
#include "statkit/hypothesis/anova.hpp"
#include "statkit/hypothesis/t_test.hpp"
#include "utils/options_parser.hpp"
#include "utils/tracing.hpp"

namespace statkit {
namespace engine {

namespace {

std::vector<ChartDescriptor> GroupCharts(const std::vector<core::GroupSummary> &groups, const std::string &value,
                                         const std::string &group) {
	ChartDescriptor box(ChartKind::BOX, value + " by " + group, group, value);
	ChartDescriptor means(ChartKind::BAR, "Mean " + value + " by " + group, group, "mean " + value);
	std::vector<double> mean_values;
	for (const auto &summary : groups) {
		box.categories.push_back(summary.name);
		box.AddSeries(summary.name, FiveNumbers(summary));
		means.categories.push_back(summary.name);
		mean_values.push_back(summary.mean);
	}
	means.AddSeries("mean", std::move(mean_values));
	return {std::move(box), std::move(means)};
}

std::string LeveneLine(const core::LeveneResult &levene, double alpha) {
	if (!levene.defined) {
		return "Levene's test is undefined (no spread in the absolute deviations)";
	}
	std::string line = "Levene's test: F(" + std::to_string(levene.df_between) + ", " +
	                   std::to_string(levene.df_within) + ") = " + FormatStat(levene.statistic) + ", p " +
	                   FormatPValue(levene.p_value);
	line += levene.p_value < alpha ? "; group variances differ" : "; no evidence of unequal variances";
	return line;
}

/// Significant Tukey pairs, listed only when the omnibus test rejects
std::string TukeyLine(const core::AnovaResult &result) {
	if (!result.reject_null) {
		return "Tukey HSD: no post-hoc comparison needed, group means do not differ";
	}
	std::string pairs;
	for (const auto &cmp : result.tukey) {
		if (!cmp.reject) {
			continue;
		}
		if (!pairs.empty()) {
			pairs += "; ";
		}
		pairs += cmp.group_a + " vs " + cmp.group_b + " (diff = " + FormatStat(cmp.mean_difference) + ", p adj " +
		         FormatPValue(cmp.p_adjusted) + ")";
	}
	if (pairs.empty()) {
		return "Tukey HSD: no pair of groups differs significantly";
	}
	return "Tukey HSD: " + pairs;
}

} // namespace

AnalysisResult TTestFunction::Run(const core::Dataset &dataset, const AnalysisRequest &request) {
	const auto options = OptionsParser::Parse<core::TTestOptions>(request.Options());
	const auto &selection = request.Selection();
	selection.Validate(dataset, true);

	const auto variables = selection.Names(core::ColumnRole::VARIABLE);
	const auto grouping = selection.Names(core::ColumnRole::GROUPING);

	core::TTestResult result;
	if (variables.size() == 1 && grouping.size() == 1) {
		STATKIT_DEBUG("t-test (" << core::TTestVariantName(options.variant) << ") of '" << variables[0] << "' by '"
		                         << grouping[0] << "'");
		result = hypothesis::TTest::Test(dataset, variables[0], grouping[0], options);
	} else if (variables.size() == 2 && grouping.empty()) {
		if (options.variant != core::TTestVariant::PAIRED) {
			throw core::InvalidConfigError("a t-test on two measurement columns requires variant 'paired'");
		}
		STATKIT_DEBUG("paired t-test of '" << variables[0] << "' - '" << variables[1] << "'");
		result = hypothesis::TTest::PairedColumns(dataset, variables[0], variables[1], options);
	} else {
		throw core::InvalidConfigError("a t-test needs one value column and one grouping column, "
		                               "or two measurement columns");
	}

	std::vector<std::string> interpretation;
	interpretation.push_back(result.interpretation);
	interpretation.push_back("t(" + FormatStat(result.degrees_of_freedom, 2) + ") = " + FormatStat(result.statistic) +
	                         ", mean difference = " + FormatStat(result.mean_difference) + ", " +
	                         FormatStat(100.0 * result.confidence_level, 0) + "% CI [" + FormatStat(result.ci_lower) +
	                         ", " + FormatStat(result.ci_upper) + "]");
	interpretation.push_back("Cohen's d = " + FormatStat(result.cohens_d, 3));
	if (result.variant != core::TTestVariant::PAIRED) {
		interpretation.push_back(LeveneLine(result.levene, result.alpha));
		if (result.variant == core::TTestVariant::EQUAL_VARIANCE && result.levene.defined &&
		    result.levene.p_value < result.alpha) {
			interpretation.push_back("consider the Welch variant, which does not assume equal variances");
		}
	}

	auto charts = GroupCharts(result.groups, result.value_column, result.group_column);
	return AnalysisResult(AnalysisKind::TTEST, std::move(result), std::move(charts), std::move(interpretation));
}

AnalysisResult AnovaFunction::Run(const core::Dataset &dataset, const AnalysisRequest &request) {
	const auto options = OptionsParser::Parse<core::AnovaOptions>(request.Options());
	const auto &selection = request.Selection();
	selection.Validate(dataset, true);

	const auto variables = selection.Names(core::ColumnRole::VARIABLE);
	const auto grouping = selection.Names(core::ColumnRole::GROUPING);
	if (variables.size() != 1 || grouping.size() != 1) {
		throw core::InvalidConfigError("ANOVA needs one value column and one grouping column");
	}
	STATKIT_DEBUG("one-way ANOVA of '" << variables[0] << "' by '" << grouping[0] << "'");

	auto result = hypothesis::OneWayAnova::Test(dataset, variables[0], grouping[0], options);

	std::vector<std::string> interpretation;
	interpretation.push_back(result.interpretation);
	interpretation.push_back("F(" + std::to_string(result.df_between) + ", " + std::to_string(result.df_within) +
	                         ") = " + FormatStat(result.f_statistic) + ", eta squared = " +
	                         FormatStat(result.eta_squared, 3));
	interpretation.push_back(LeveneLine(result.levene, result.alpha));
	interpretation.push_back(TukeyLine(result));

	auto charts = GroupCharts(result.groups, result.value_column, result.group_column);
	return AnalysisResult(AnalysisKind::ANOVA, std::move(result), std::move(charts), std::move(interpretation));
}

} // namespace engine
} // namespace statkit
