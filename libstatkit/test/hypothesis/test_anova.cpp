#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <statkit/core/dataset.hpp>
#include <statkit/hypothesis/anova.hpp>
#include <statkit/hypothesis/levene_test.hpp>
#include <statkit/hypothesis/tukey_hsd.hpp>
#include <cmath>

using namespace statkit::core;
using namespace statkit::hypothesis;

const double TOLERANCE = 1e-6;
const double LOOSE_TOLERANCE = 1e-4;

TEST_CASE("ANOVA: Three separated groups", "[hypothesis][anova]") {
	auto data = Dataset(std::vector<Column> {
	    Column::Numeric("yield", std::vector<double> {1, 2, 3, 4, 5, 6, 7, 8, 9}),
	    Column::Categorical("plot", {std::string("a"), std::string("a"), std::string("a"), std::string("b"),
	                                 std::string("b"), std::string("b"), std::string("c"), std::string("c"),
	                                 std::string("c")})});

	auto result = OneWayAnova::Test(data, "yield", "plot");

	REQUIRE(result.groups.size() == 3);
	REQUIRE(result.groups[2].name == "c");
	REQUIRE_THAT(result.ss_between, Catch::Matchers::WithinAbs(54.0, TOLERANCE));
	REQUIRE_THAT(result.ss_within, Catch::Matchers::WithinAbs(6.0, TOLERANCE));
	REQUIRE_THAT(result.ss_total, Catch::Matchers::WithinAbs(60.0, TOLERANCE));
	REQUIRE(result.df_between == 2);
	REQUIRE(result.df_within == 6);
	REQUIRE_THAT(result.ms_between, Catch::Matchers::WithinAbs(27.0, TOLERANCE));
	REQUIRE_THAT(result.ms_within, Catch::Matchers::WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(result.f_statistic, Catch::Matchers::WithinAbs(27.0, TOLERANCE));
	// F(2, 6) upper tail: (1 + f/3)^-3
	REQUIRE_THAT(result.p_value, Catch::Matchers::WithinAbs(0.001, TOLERANCE));
	REQUIRE_THAT(result.eta_squared, Catch::Matchers::WithinAbs(0.9, TOLERANCE));
	REQUIRE(result.reject_null);

	REQUIRE(result.levene.defined);
	REQUIRE_THAT(result.levene.statistic, Catch::Matchers::WithinAbs(0.0, TOLERANCE));
	REQUIRE(result.levene.df_between == 2);
	REQUIRE(result.levene.df_within == 6);
}

TEST_CASE("ANOVA: Tukey HSD comparisons", "[hypothesis][anova][tukey]") {
	GroupedValues grouped;
	grouped.names = {"a", "b", "c"};
	grouped.values = {{1, 2, 3}, {4, 5, 6}, {7, 8, 9}};

	auto result = OneWayAnova::Compute(grouped);
	// MS_within = 1, equal n = 3: SE = sqrt(1/3)
	const double se = std::sqrt(1.0 / 3.0);

	REQUIRE(result.tukey.size() == 3);
	REQUIRE_THAT(result.tukey_critical, Catch::Matchers::WithinAbs(4.339, 5e-3));

	const auto &ab = result.tukey[0];
	REQUIRE(ab.group_a == "a");
	REQUIRE(ab.group_b == "b");
	REQUIRE_THAT(ab.mean_difference, Catch::Matchers::WithinAbs(3.0, TOLERANCE));
	REQUIRE_THAT(ab.std_error, Catch::Matchers::WithinAbs(se, TOLERANCE));
	REQUIRE_THAT(ab.q_statistic, Catch::Matchers::WithinAbs(3.0 / se, TOLERANCE));
	REQUIRE_THAT(ab.ci_lower, Catch::Matchers::WithinAbs(3.0 - result.tukey_critical * se, TOLERANCE));
	REQUIRE_THAT(ab.ci_upper, Catch::Matchers::WithinAbs(3.0 + result.tukey_critical * se, TOLERANCE));
	REQUIRE(ab.ci_lower > 0.0);

	REQUIRE(result.tukey[1].group_b == "c");
	REQUIRE_THAT(result.tukey[1].mean_difference, Catch::Matchers::WithinAbs(6.0, TOLERANCE));
	// a larger difference gives a smaller adjusted p-value
	REQUIRE(result.tukey[1].p_adjusted < ab.p_adjusted);
	REQUIRE(result.tukey[2].group_a == "b");

	for (const auto &cmp : result.tukey) {
		REQUIRE(cmp.reject);
		REQUIRE(cmp.p_adjusted < 0.05);
	}

	SECTION("Two groups match the pooled t-test") {
		GroupedValues pair;
		pair.names = {"x", "y"};
		pair.values = {{1, 2, 3}, {4, 5, 6}};
		auto two = OneWayAnova::Compute(pair);
		REQUIRE(two.tukey.size() == 1);
		REQUIRE_THAT(two.tukey[0].p_adjusted, Catch::Matchers::WithinAbs(0.0213116, LOOSE_TOLERANCE));
		REQUIRE_THAT(two.tukey[0].p_adjusted, Catch::Matchers::WithinAbs(two.p_value, LOOSE_TOLERANCE));
	}

	SECTION("Unequal group sizes use the Tukey-Kramer error") {
		std::vector<GroupSummary> groups(2);
		groups[0].name = "small";
		groups[0].n = 2;
		groups[0].mean = 1.0;
		groups[1].name = "large";
		groups[1].n = 6;
		groups[1].mean = 2.0;
		auto comparisons = TukeyHSD::Compute(groups, 2.0, 6, 0.05);
		REQUIRE(comparisons.size() == 1);
		REQUIRE_THAT(comparisons[0].std_error, Catch::Matchers::WithinAbs(std::sqrt(1.0 * (0.5 + 1.0 / 6.0)), TOLERANCE));
	}
}

TEST_CASE("ANOVA: Overlapping groups", "[hypothesis][anova]") {
	GroupedValues grouped;
	grouped.names = {"x", "y"};
	grouped.values = {{1, 3, 5}, {2, 3, 4}};

	auto result = OneWayAnova::Compute(grouped);
	REQUIRE_THAT(result.ss_between, Catch::Matchers::WithinAbs(0.0, TOLERANCE));
	REQUIRE_THAT(result.f_statistic, Catch::Matchers::WithinAbs(0.0, TOLERANCE));
	REQUIRE_THAT(result.p_value, Catch::Matchers::WithinAbs(1.0, TOLERANCE));
	REQUIRE_FALSE(result.reject_null);

	REQUIRE(result.tukey.size() == 1);
	REQUIRE_FALSE(result.tukey[0].reject);
	REQUIRE_THAT(result.tukey[0].p_adjusted, Catch::Matchers::WithinAbs(1.0, TOLERANCE));
}

TEST_CASE("ANOVA: Invalid input", "[hypothesis][anova]") {
	GroupedValues grouped;

	SECTION("Single group") {
		grouped.names = {"only"};
		grouped.values = {{1, 2, 3}};
		REQUIRE_THROWS_AS(OneWayAnova::Compute(grouped), InsufficientDataError);
	}

	SECTION("Group with one value") {
		grouped.names = {"a", "b"};
		grouped.values = {{1, 2, 3}, {4}};
		REQUIRE_THROWS_AS(OneWayAnova::Compute(grouped), InsufficientDataError);
	}

	SECTION("Constant groups") {
		grouped.names = {"a", "b"};
		grouped.values = {{1, 1}, {2, 2}};
		REQUIRE_THROWS_AS(OneWayAnova::Compute(grouped), DegenerateInputError);
	}
}

TEST_CASE("Levene: Unequal spread", "[hypothesis][levene]") {
	// deviations from the medians: {1, 0, 1} and {10, 0, 10}
	auto result = LeveneTest::Compute({{1, 2, 3}, {0, 10, 20}});
	REQUIRE(result.defined);
	// z means 2/3 and 20/3, within SS 2/3 + 200/3, between 3 * (3^2) * 2 = 54
	REQUIRE_THAT(result.statistic, Catch::Matchers::WithinAbs(4.0 * 54.0 / (202.0 / 3.0), TOLERANCE));

	SECTION("Undefined for constant groups") {
		auto constant = LeveneTest::Compute({{2, 2}, {5, 5}});
		REQUIRE_FALSE(constant.defined);
	}
}
