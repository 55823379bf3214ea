#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "engine/analysis_engine.hpp"
#include "utils/tracing.hpp"

#include <cmath>
#include <sstream>

using namespace statkit::core;
using namespace statkit::engine;
using Catch::Matchers::ContainsSubstring;

const double TOLERANCE = 1e-6;
const double LOOSE_TOLERANCE = 1e-4;

namespace {

OptionValue Text(const char *value) {
	return std::string(value);
}

Dataset Trial() {
	return Dataset(std::vector<Column> {
	    Column::Numeric("score", std::vector<double> {1, 4, 2, 5, 3, 6}),
	    Column::Categorical("arm", {std::string("control"), std::string("treated"), std::string("control"),
	                                std::string("treated"), std::string("control"), std::string("treated")}),
	    Column::Numeric("before", std::vector<NumericCell> {10.0, 12.0, 14.0, 16.0, 18.0, 99.0}),
	    Column::Numeric("after", std::vector<NumericCell> {11.0, 12.0, 15.0, 18.0, 20.0, std::nullopt})});
}

Dataset Plots() {
	return Dataset(std::vector<Column> {
	    Column::Numeric("yield", std::vector<double> {1, 2, 3, 4, 5, 6, 7, 8, 9}),
	    Column::Categorical("plot", {std::string("a"), std::string("a"), std::string("a"), std::string("b"),
	                                 std::string("b"), std::string("b"), std::string("c"), std::string("c"),
	                                 std::string("c")})});
}

Dataset Advertising() {
	return Dataset(std::vector<Column> {
	    Column::Numeric("spend", std::vector<NumericCell> {1.0, 2.0, 3.0, 4.0, 5.0, std::nullopt}),
	    Column::Numeric("sales", std::vector<NumericCell> {2.0, 4.0, 5.0, 4.0, 5.0, 9.0}),
	    Column::Numeric("reach", std::vector<NumericCell> {2.0, 1.0, 4.0, 3.0, 6.0, 5.0})});
}

Dataset Blobs() {
	return Dataset(std::vector<Column> {
	    Column::Numeric("x", std::vector<NumericCell> {0.0, 0.0, 1.0, std::nullopt, 10.0, 10.0, 11.0}),
	    Column::Numeric("y", std::vector<NumericCell> {0.0, 1.0, 0.0, 5.0, 10.0, 11.0, 10.0})});
}

/// Redirects the tracer into a string for one test
class CapturedLog {
public:
	explicit CapturedLog(LogLevel level) : previous_(Tracer::GetLogLevel()) {
		Tracer::SetOutput(&stream_);
		Tracer::SetLogLevel(level);
	}

	~CapturedLog() {
		Tracer::SetOutput(nullptr);
		Tracer::SetLogLevel(previous_);
	}

	std::string Text() const {
		return stream_.str();
	}

private:
	std::ostringstream stream_;
	LogLevel previous_;
};

} // namespace

TEST_CASE("AnalysisEngine: Clean", "[engine][clean]") {
	auto data = Dataset(std::vector<Column> {
	    Column::Numeric("v", std::vector<NumericCell> {1.0, std::nullopt, 3.0, 5.0}),
	    Column::Categorical("k", {std::string("a"), std::string("b"), std::nullopt, std::string("b")})});

	auto result = AnalysisEngine::Run(data, AnalysisRequest::Clean({}, {{"policy", Text("impute_mean")}}));
	REQUIRE(result.Kind() == AnalysisKind::CLEAN);
	REQUIRE(result.Holds<CleaningResult>());

	const auto &cleaned = result.As<CleaningResult>();
	REQUIRE(cleaned.dataset.RowCount() == 4);
	REQUIRE(cleaned.imputed_counts.at("v") == 1);
	REQUIRE_THAT(*cleaned.dataset.GetColumn("v").NumericValues()[1], Catch::Matchers::WithinAbs(3.0, TOLERANCE));

	// the source dataset is never modified
	REQUIRE(data.MissingCount("v") == 1);

	REQUIRE(result.Charts().size() == 1);
	const auto &chart = result.Charts()[0];
	REQUIRE(chart.kind == ChartKind::BAR);
	REQUIRE(chart.categories == std::vector<std::string> {"v", "k"});
	REQUIRE(chart.series.size() == 2);
	REQUIRE(chart.series[0].values == std::vector<double> {1.0, 1.0});
	REQUIRE(chart.series[1].values[0] == 0.0);

	REQUIRE(result.Interpretation().back() == "4 rows and 2 columns remain");
}

TEST_CASE("AnalysisEngine: Describe", "[engine][describe]") {
	auto result = AnalysisEngine::Run(Trial(), AnalysisRequest::Describe({"score", "arm"}));
	REQUIRE(result.Kind() == AnalysisKind::DESCRIBE);

	const auto &described = result.As<DescriptiveResult>();
	REQUIRE(described.numeric.size() == 1);
	REQUIRE(described.categorical.size() == 1);
	REQUIRE_THAT(described.numeric[0].mean, Catch::Matchers::WithinAbs(3.5, TOLERANCE));

	REQUIRE(result.Charts().size() == 2);
	REQUIRE(result.Charts()[0].kind == ChartKind::BOX);
	REQUIRE(result.Charts()[0].series[0].values.size() == 5);
	REQUIRE(result.Charts()[1].kind == ChartKind::BAR);
	REQUIRE(result.Charts()[1].categories.size() == 2);

	REQUIRE(result.Interpretation().size() == 2);
	REQUIRE_THAT(result.Interpretation()[0], ContainsSubstring("score: n = 6"));

	SECTION("Empty selection covers every column") {
		auto all = AnalysisEngine::Run(Trial(), AnalysisRequest::Describe({}));
		REQUIRE(all.As<DescriptiveResult>().numeric.size() == 3);
	}

	SECTION("Options are rejected") {
		AnalysisRequest request(AnalysisKind::DESCRIBE, ColumnSelection::Variables({"score"}), {{"alpha", 0.05}});
		REQUIRE_THROWS_AS(AnalysisEngine::Run(Trial(), request), InvalidConfigError);
	}
}

TEST_CASE("AnalysisEngine: T-test", "[engine][hypothesis]") {
	auto result = AnalysisEngine::Run(Trial(), AnalysisRequest::TTest("score", "arm"));
	REQUIRE(result.Kind() == AnalysisKind::TTEST);

	const auto &test = result.As<TTestResult>();
	REQUIRE_THAT(test.statistic, Catch::Matchers::WithinAbs(-3.6742346, TOLERANCE));
	REQUIRE_THAT(test.p_value, Catch::Matchers::WithinAbs(0.0213116, LOOSE_TOLERANCE));

	REQUIRE(result.Charts().size() == 2);
	REQUIRE(result.Charts()[0].kind == ChartKind::BOX);
	REQUIRE(result.Charts()[0].categories == std::vector<std::string> {"control", "treated"});
	REQUIRE(result.Charts()[1].series[0].values == std::vector<double> {2.0, 5.0});

	REQUIRE(result.Interpretation()[0].find("reject H0") == 0);
	REQUIRE_THAT(result.Interpretation()[2], ContainsSubstring("Cohen's d = -3.000"));
	REQUIRE_THAT(result.Interpretation()[3], ContainsSubstring("Levene's test"));

	SECTION("Welch variant from options") {
		auto welch = AnalysisEngine::Run(Trial(), AnalysisRequest::TTest("score", "arm", {{"variant", Text("welch")}}));
		REQUIRE(welch.As<TTestResult>().variant == TTestVariant::WELCH);
	}

	SECTION("Paired measurement columns") {
		auto paired = AnalysisEngine::Run(Trial(), AnalysisRequest::PairedTTest("before", "after"));
		const auto &r = paired.As<TTestResult>();
		REQUIRE(r.variant == TTestVariant::PAIRED);
		REQUIRE(r.groups[0].name == "before");
		REQUIRE(r.groups[0].n == 5);
		REQUIRE_THAT(r.statistic, Catch::Matchers::WithinAbs(-3.2071349, TOLERANCE));
		// no variance-equality line for paired data
		REQUIRE(paired.Interpretation().size() == 3);
	}

	SECTION("Two measurement columns need the paired variant") {
		AnalysisRequest request(AnalysisKind::TTEST, ColumnSelection::Variables({"before", "after"}),
		                        {{"variant", Text("welch")}});
		REQUIRE_THROWS_AS(AnalysisEngine::Run(Trial(), request), InvalidConfigError);
	}

	SECTION("Grouping column with more than two levels") {
		REQUIRE_THROWS_AS(AnalysisEngine::Run(Trial(), AnalysisRequest::TTest("score", "before")),
		                  InvalidGroupCountError);
	}
}

TEST_CASE("AnalysisEngine: ANOVA", "[engine][hypothesis]") {
	auto result = AnalysisEngine::Run(Plots(), AnalysisRequest::Anova("yield", "plot"));
	REQUIRE(result.Kind() == AnalysisKind::ANOVA);

	const auto &anova = result.As<AnovaResult>();
	REQUIRE_THAT(anova.f_statistic, Catch::Matchers::WithinAbs(27.0, TOLERANCE));
	REQUIRE_THAT(anova.eta_squared, Catch::Matchers::WithinAbs(0.9, TOLERANCE));

	REQUIRE(result.Charts().size() == 2);
	REQUIRE(result.Charts()[0].series.size() == 3);
	REQUIRE(result.Interpretation().size() == 4);
	REQUIRE_THAT(result.Interpretation()[1], ContainsSubstring("F(2, 6) = 27.0000"));
	REQUIRE_THAT(result.Interpretation()[3], ContainsSubstring("Tukey HSD: a vs b (diff = 3.0000, p adj"));
	REQUIRE_THAT(result.Interpretation()[3], ContainsSubstring("a vs c (diff = 6.0000"));
	REQUIRE(anova.tukey.size() == 3);

	SECTION("No post-hoc comparisons without an omnibus effect") {
		auto flat = Dataset(std::vector<Column> {
		    Column::Numeric("yield", std::vector<double> {1, 3, 5, 2, 3, 4}),
		    Column::Categorical("plot", {std::string("a"), std::string("a"), std::string("a"), std::string("b"),
		                                 std::string("b"), std::string("b")})});
		auto none = AnalysisEngine::Run(flat, AnalysisRequest::Anova("yield", "plot"));
		REQUIRE(none.Interpretation().back().find("Tukey HSD: no post-hoc comparison needed") == 0);
	}

	SECTION("Unknown option") {
		REQUIRE_THROWS_WITH(AnalysisEngine::Run(Plots(), AnalysisRequest::Anova("yield", "plot", {{"tukey", true}})),
		                    ContainsSubstring("Unknown option: 'tukey' for anova"));
	}
}

TEST_CASE("AnalysisEngine: Correlate", "[engine][correlation]") {
	auto data = Dataset(std::vector<Column> {Column::Numeric("x", std::vector<double> {1, 2, 3, 4, 5}),
	                                         Column::Numeric("y", std::vector<double> {2, 4, 5, 4, 5})});

	auto result = AnalysisEngine::Run(data, AnalysisRequest::Correlate({"x", "y"}));
	REQUIRE(result.Kind() == AnalysisKind::CORRELATE);
	REQUIRE_THAT(result.As<CorrelationResult>().coefficients(0, 1),
	             Catch::Matchers::WithinAbs(std::sqrt(0.6), TOLERANCE));

	REQUIRE(result.Charts().size() == 2);
	REQUIRE(result.Charts()[0].kind == ChartKind::CORRELATION_HEATMAP);
	REQUIRE(result.Charts()[0].series.size() == 2);
	REQUIRE(result.Charts()[1].kind == ChartKind::SCATTER);
	REQUIRE(result.Charts()[1].series[0].x.size() == 5);

	REQUIRE(result.Interpretation().size() == 2);
	REQUIRE_THAT(result.Interpretation()[0], ContainsSubstring("x ~ y: r = 0.775 (moderate, positive)"));
	REQUIRE_THAT(result.Interpretation()[0], ContainsSubstring("not significant"));
	REQUIRE_THAT(result.Interpretation()[1], ContainsSubstring("Jarque-Bera normality: x normal (p = 0.8"));
	REQUIRE_THAT(result.Interpretation()[1], ContainsSubstring("pearson recommended"));

	SECTION("Three columns give no scatter chart") {
		auto wide = Dataset(std::vector<Column> {Column::Numeric("x", std::vector<double> {1, 2, 3, 4, 5}),
		                                         Column::Numeric("y", std::vector<double> {2, 4, 5, 4, 5}),
		                                         Column::Numeric("z", std::vector<double> {5, 3, 4, 1, 2})});
		auto matrix = AnalysisEngine::Run(wide, AnalysisRequest::Correlate({"x", "y", "z"},
		                                                                   {{"method", Text("spearman")}}));
		REQUIRE(matrix.Charts().size() == 1);
		REQUIRE(matrix.Interpretation().size() == 4);
		REQUIRE(matrix.As<CorrelationResult>().method == CorrelationMethod::SPEARMAN);
	}
}

TEST_CASE("AnalysisEngine: Regress", "[engine][regression]") {
	auto result = AnalysisEngine::Run(Advertising(), AnalysisRequest::Regress("sales", {"spend"}));
	REQUIRE(result.Kind() == AnalysisKind::REGRESS);

	const auto &fit = result.As<RegressionResult>();
	REQUIRE(fit.n_obs == 5);
	REQUIRE_THAT(fit.coefficients[0], Catch::Matchers::WithinAbs(2.2, TOLERANCE));
	REQUIRE_THAT(fit.coefficients[1], Catch::Matchers::WithinAbs(0.6, TOLERANCE));
	REQUIRE_THAT(fit.r_squared, Catch::Matchers::WithinAbs(0.6, TOLERANCE));

	// fit line plus residuals
	REQUIRE(result.Charts().size() == 2);
	REQUIRE(result.Charts()[0].title == "sales vs spend");
	REQUIRE(result.Charts()[0].series.size() == 2);
	REQUIRE(result.Charts()[0].series[1].x == std::vector<double> {1, 2, 3, 4, 5});
	REQUIRE(result.Charts()[1].title == "Residuals vs fitted");

	REQUIRE_THAT(result.Interpretation()[0], ContainsSubstring("R² = 0.6000"));
	REQUIRE_THAT(result.Interpretation()[1], ContainsSubstring("F(1, 3) = 4.5000"));

	SECTION("Several predictors plot observed against fitted") {
		auto multi = AnalysisEngine::Run(Advertising(), AnalysisRequest::Regress("sales", {"spend", "reach"}));
		REQUIRE(multi.Charts()[0].title == "Observed vs fitted sales");
		REQUIRE(multi.As<RegressionResult>().vif.size() == 2);
	}

	SECTION("Without intercept") {
		auto origin =
		    AnalysisEngine::Run(Advertising(), AnalysisRequest::Regress("sales", {"spend"}, {{"intercept", false}}));
		REQUIRE_FALSE(origin.As<RegressionResult>().has_intercept);
		REQUIRE(origin.As<RegressionResult>().coefficients.size() == 1);
	}

	SECTION("Unknown predictor") {
		REQUIRE_THROWS_AS(AnalysisEngine::Run(Advertising(), AnalysisRequest::Regress("sales", {"tv"})),
		                  InvalidConfigError);
	}
}

TEST_CASE("AnalysisEngine: PCA", "[engine][pca]") {
	auto data = Dataset(std::vector<Column> {
	    Column::Numeric("height", std::vector<NumericCell> {150.0, 160.0, 165.0, 170.0, 180.0, 175.0, std::nullopt}),
	    Column::Numeric("weight", std::vector<NumericCell> {50.0, 58.0, 62.0, 68.0, 80.0, 70.0, 65.0}),
	    Column::Numeric("age", std::vector<NumericCell> {30.0, 25.0, 40.0, 35.0, 28.0, 50.0, 33.0})});

	auto result = AnalysisEngine::Run(data, AnalysisRequest::Pca({"height", "weight", "age"}));
	REQUIRE(result.Kind() == AnalysisKind::PCA);

	const auto &pca = result.As<PcaResult>();
	REQUIRE(pca.component_count() == 3);
	REQUIRE(pca.scores.rows() == 6);
	REQUIRE_THAT(pca.cumulative_variance_ratio(2), Catch::Matchers::WithinAbs(1.0, TOLERANCE));

	REQUIRE(result.Charts().size() == 3);
	REQUIRE(result.Charts()[0].kind == ChartKind::BAR);
	REQUIRE(result.Charts()[0].categories == std::vector<std::string> {"PC1", "PC2", "PC3"});
	REQUIRE(result.Charts()[1].kind == ChartKind::LINE);
	REQUIRE(result.Charts()[2].kind == ChartKind::SCATTER);
	REQUIRE(result.Interpretation().size() == 4);

	SECTION("One component has no score plot") {
		auto first = AnalysisEngine::Run(data, AnalysisRequest::Pca({"height", "weight", "age"},
		                                                            {{"components", OptionValue(int64_t(1))}}));
		REQUIRE(first.Charts().size() == 2);
		REQUIRE(first.As<PcaResult>().component_count() == 1);
	}

	SECTION("More components than columns") {
		REQUIRE_THROWS_AS(AnalysisEngine::Run(data, AnalysisRequest::Pca({"height", "weight"},
		                                                                 {{"components", OptionValue(int64_t(3))}})),
		                  InvalidConfigError);
	}
}

TEST_CASE("AnalysisEngine: K-means", "[engine][kmeans]") {
	auto result = AnalysisEngine::Run(Blobs(), AnalysisRequest::KMeans({"x", "y"}, {{"k", OptionValue(int64_t(2))}}));
	REQUIRE(result.Kind() == AnalysisKind::KMEANS);

	const auto &clusters = result.As<KMeansResult>();
	REQUIRE(clusters.k() == 2);
	REQUIRE(clusters.assignments.size() == 6);
	REQUIRE(clusters.cluster_sizes[0] == 3);
	REQUIRE(clusters.cluster_sizes[1] == 3);
	REQUIRE_THAT(clusters.wcss, Catch::Matchers::WithinAbs(8.0 / 3.0, TOLERANCE));
	REQUIRE(clusters.stop_reason == StopReason::CONVERGED);

	REQUIRE(result.Charts().size() == 1);
	const auto &chart = result.Charts()[0];
	REQUIRE(chart.series.size() == 3);
	REQUIRE(chart.series[2].name == "centroids");
	REQUIRE(chart.series[0].x.size() + chart.series[1].x.size() == 6);

	REQUIRE(result.Interpretation().front().find("converged after") == 0);
	REQUIRE(result.Interpretation().size() == 4);

	SECTION("k larger than the complete rows") {
		REQUIRE_THROWS_AS(
		    AnalysisEngine::Run(Blobs(), AnalysisRequest::KMeans({"x", "y"}, {{"k", OptionValue(int64_t(7))}})),
		    InvalidConfigError);
	}

	SECTION("k is required") {
		REQUIRE_THROWS_AS(AnalysisEngine::Run(Blobs(), AnalysisRequest::KMeans({"x", "y"}, {})), InvalidConfigError);
	}
}

TEST_CASE("AnalysisEngine: Typed access checks the kind", "[engine]") {
	auto result = AnalysisEngine::Run(Plots(), AnalysisRequest::Anova("yield", "plot"));
	REQUIRE_FALSE(result.Holds<TTestResult>());
	REQUIRE_THROWS_WITH(result.As<TTestResult>(), ContainsSubstring("result of a anova analysis"));
}

TEST_CASE("AnalysisEngine: Cancellation", "[engine][cancellation]") {
	CancellationToken token;
	token.Cancel();
	REQUIRE_THROWS_AS(AnalysisEngine::Run(Blobs(), AnalysisRequest::KMeans({"x", "y"}, {{"k", OptionValue(int64_t(2))}}),
	                                      &token),
	                  Cancelled);
	REQUIRE_THROWS_AS(AnalysisEngine::Run(Trial(), AnalysisRequest::Describe({}), &token), Cancelled);

	CancellationToken idle;
	REQUIRE_NOTHROW(AnalysisEngine::Run(Trial(), AnalysisRequest::Describe({}), &idle));
}

TEST_CASE("AnalysisEngine: Logging", "[engine][tracing]") {
	SECTION("Failures are logged at WARN and rethrown") {
		CapturedLog log(LogLevel::WARN);
		REQUIRE_THROWS_AS(AnalysisEngine::Run(Trial(), AnalysisRequest::Anova("score", "missing")),
		                  InvalidConfigError);
		REQUIRE_THAT(log.Text(), ContainsSubstring("[statkit/WARN]"));
		REQUIRE_THAT(log.Text(), ContainsSubstring("anova failed [invalid_config]: unknown column 'missing'"));
	}

	SECTION("Options are traced") {
		CapturedLog log(LogLevel::TRACE);
		AnalysisEngine::Run(Plots(), AnalysisRequest::Anova("yield", "plot", {{"alpha", 0.01}}));
		REQUIRE_THAT(log.Text(), ContainsSubstring("anova option alpha = 0.01"));
		REQUIRE_THAT(log.Text(), ContainsSubstring("anova completed with 2 charts"));
	}

	SECTION("Quality check") {
		CapturedLog log(LogLevel::INFO);
		auto report = AnalysisEngine::CheckQuality(Blobs());
		REQUIRE(report.missing_total == 1);
		REQUIRE(report.rows_with_missing == std::vector<size_t> {3});
		REQUIRE_THAT(log.Text(), ContainsSubstring("quality: 1 missing cells"));
	}
}
