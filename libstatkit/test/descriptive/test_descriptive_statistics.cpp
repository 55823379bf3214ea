#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <statkit/core/dataset.hpp>
#include <statkit/descriptive/descriptive_statistics.hpp>

using namespace statkit::core;
using namespace statkit::descriptive;

const double TOLERANCE = 1e-6;

TEST_CASE("Descriptive: Numeric summary", "[descriptive][summary]") {
	auto summary = DescriptiveStatistics::Summarize("x", {1, 2, 3, 4, 5});

	REQUIRE(summary.count == 5);
	REQUIRE(summary.missing == 0);
	REQUIRE_THAT(summary.sum, Catch::Matchers::WithinAbs(15.0, TOLERANCE));
	REQUIRE_THAT(summary.mean, Catch::Matchers::WithinAbs(3.0, TOLERANCE));
	REQUIRE_THAT(summary.variance, Catch::Matchers::WithinAbs(2.5, TOLERANCE));
	REQUIRE_THAT(summary.std_dev, Catch::Matchers::WithinAbs(1.5811388, TOLERANCE));
	REQUIRE(summary.min == 1.0);
	REQUIRE_THAT(summary.q1, Catch::Matchers::WithinAbs(2.0, TOLERANCE));
	REQUIRE_THAT(summary.median, Catch::Matchers::WithinAbs(3.0, TOLERANCE));
	REQUIRE_THAT(summary.q3, Catch::Matchers::WithinAbs(4.0, TOLERANCE));
	REQUIRE(summary.max == 5.0);
	REQUIRE_THAT(summary.range(), Catch::Matchers::WithinAbs(4.0, TOLERANCE));
	REQUIRE_THAT(summary.iqr(), Catch::Matchers::WithinAbs(2.0, TOLERANCE));

	REQUIRE(summary.skewness.has_value());
	REQUIRE_THAT(*summary.skewness, Catch::Matchers::WithinAbs(0.0, TOLERANCE));
	REQUIRE(summary.kurtosis.has_value());
	REQUIRE_THAT(*summary.kurtosis, Catch::Matchers::WithinAbs(-1.2, TOLERANCE));
	REQUIRE(summary.coefficient_of_variation.has_value());
	REQUIRE_THAT(*summary.coefficient_of_variation, Catch::Matchers::WithinAbs(0.527046, TOLERANCE));
}

TEST_CASE("Descriptive: Undefined statistics are absent", "[descriptive][summary]") {
	SECTION("Constant column") {
		auto summary = DescriptiveStatistics::Summarize("c", {4, 4, 4, 4});
		REQUIRE(summary.variance == 0.0);
		REQUIRE_FALSE(summary.skewness.has_value());
		REQUIRE_FALSE(summary.kurtosis.has_value());
		REQUIRE(summary.coefficient_of_variation.has_value());
	}

	SECTION("Too few values for kurtosis") {
		auto summary = DescriptiveStatistics::Summarize("s", {1, 2, 6});
		REQUIRE(summary.skewness.has_value());
		REQUIRE_FALSE(summary.kurtosis.has_value());
	}

	SECTION("Zero mean") {
		auto summary = DescriptiveStatistics::Summarize("z", {-1, 1});
		REQUIRE_FALSE(summary.coefficient_of_variation.has_value());
	}

	SECTION("A single observation is degenerate") {
		REQUIRE_THROWS_AS(DescriptiveStatistics::Summarize("one", {3.0}), DegenerateInputError);
	}
}

TEST_CASE("Descriptive: Frequencies", "[descriptive][frequency]") {
	auto column = Column::Categorical("g", {std::string("b"), std::string("a"), std::string("b"), std::nullopt,
	                                        std::string("c"), std::string("a")});
	auto table = DescriptiveStatistics::Frequencies(column);

	REQUIRE(table.name == "g");
	REQUIRE(table.missing == 1);
	REQUIRE(table.categories.size() == 3);

	// descending count, ties by category
	REQUIRE(table.categories[0].category == "a");
	REQUIRE(table.categories[0].count == 2);
	REQUIRE_THAT(table.categories[0].percent, Catch::Matchers::WithinAbs(40.0, TOLERANCE));
	REQUIRE(table.categories[1].category == "b");
	REQUIRE(table.categories[2].category == "c");
	REQUIRE_THAT(table.categories[2].percent, Catch::Matchers::WithinAbs(20.0, TOLERANCE));
}

TEST_CASE("Descriptive: Describe a dataset", "[descriptive]") {
	auto data = Dataset(std::vector<Column> {
	    Column::Numeric("x", std::vector<NumericCell> {1.0, 2.0, std::nullopt, 3.0}),
	    Column::Categorical("g", {std::string("u"), std::string("v"), std::string("u"), std::string("u")})});

	SECTION("All columns") {
		auto result = DescriptiveStatistics::Describe(data, {});
		REQUIRE(result.numeric.size() == 1);
		REQUIRE(result.categorical.size() == 1);
		REQUIRE(result.numeric[0].count == 3);
		REQUIRE(result.numeric[0].missing == 1);
		REQUIRE_THAT(result.numeric[0].mean, Catch::Matchers::WithinAbs(2.0, TOLERANCE));
		REQUIRE(result.categorical[0].categories[0].category == "u");
	}

	SECTION("Selected columns") {
		auto result = DescriptiveStatistics::Describe(data, {"g"});
		REQUIRE(result.numeric.empty());
		REQUIRE(result.categorical.size() == 1);
	}

	SECTION("Unknown column") {
		REQUIRE_THROWS_AS(DescriptiveStatistics::Describe(data, {"nope"}), InvalidConfigError);
	}
}
