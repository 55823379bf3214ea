#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <statkit/cleaning/data_cleaner.hpp>
#include <statkit/core/analysis_options.hpp>
#include <statkit/core/dataset.hpp>

using namespace statkit::cleaning;
using namespace statkit::core;

const double TOLERANCE = 1e-9;

namespace {

Dataset WithGaps() {
	return Dataset(std::vector<Column> {
	    Column::Numeric("a", std::vector<NumericCell> {1.0, std::nullopt, 3.0, 4.0, 3.0}),
	    Column::Numeric("b", std::vector<NumericCell> {std::nullopt, std::nullopt, std::nullopt, 2.0, 5.0}),
	    Column::Categorical("c", {std::string("x"), std::string("y"), std::string("y"), std::nullopt, std::string("x")})});
}

} // namespace

TEST_CASE("DataCleaner: Drop rows", "[cleaning][drop]") {
	const auto data = WithGaps();

	SECTION("All columns") {
		auto result = DataCleaner::Clean(data, {}, CleaningOptions::DropRow());
		REQUIRE(result.dataset.RowCount() == 1);
		REQUIRE(result.rows_removed == 4);
		REQUIRE(*result.dataset.GetColumn("a").NumericValues()[0] == 3.0);
		REQUIRE(result.log.size() == 1);
	}

	SECTION("Target columns only") {
		auto result = DataCleaner::Clean(data, {"a"}, CleaningOptions::DropRow());
		REQUIRE(result.dataset.RowCount() == 4);
		REQUIRE(result.rows_removed == 1);
		REQUIRE(result.dataset.MissingCount("a") == 0);
		// other columns keep their gaps
		REQUIRE(result.dataset.MissingCount("b") == 2);
	}

	SECTION("Source dataset is unchanged") {
		DataCleaner::Clean(data, {}, CleaningOptions::DropRow());
		REQUIRE(data.RowCount() == 5);
		REQUIRE(data.MissingCount("a") == 1);
	}

	SECTION("Nothing left") {
		auto all_missing = Dataset(std::vector<Column> {
		    Column::Numeric("v", std::vector<NumericCell> {std::nullopt, std::nullopt})});
		REQUIRE_THROWS_AS(DataCleaner::Clean(all_missing, {}, CleaningOptions::DropRow()), EmptyResultError);
	}
}

TEST_CASE("DataCleaner: Drop columns", "[cleaning][drop]") {
	const auto data = WithGaps();

	auto result = DataCleaner::Clean(data, {}, CleaningOptions::DropColumn(0.5));
	REQUIRE(result.columns_removed == std::vector<std::string> {"b"});
	REQUIRE(result.dataset.ColumnNames() == std::vector<std::string> {"a", "c"});
	REQUIRE(result.dataset.RowCount() == 5);

	SECTION("Ratio equal to the threshold is kept") {
		auto kept = DataCleaner::Clean(data, {}, CleaningOptions::DropColumn(0.6));
		REQUIRE(kept.columns_removed.empty());
	}

	SECTION("Removing every column is an error") {
		REQUIRE_THROWS_AS(DataCleaner::Clean(data, {}, CleaningOptions::DropColumn(0.0)), EmptyResultError);
	}
}

TEST_CASE("DataCleaner: Imputation", "[cleaning][impute]") {
	const auto data = WithGaps();

	SECTION("Mean") {
		auto result = DataCleaner::Clean(data, {"a"}, CleaningOptions::Impute(MissingStrategy::IMPUTE_MEAN));
		REQUIRE_THAT(*result.dataset.GetColumn("a").NumericValues()[1], Catch::Matchers::WithinAbs(2.75, TOLERANCE));
		REQUIRE(result.imputed_counts.at("a") == 1);
		REQUIRE(result.dataset.RowCount() == 5);
	}

	SECTION("Median") {
		auto result = DataCleaner::Clean(data, {"a"}, CleaningOptions::Impute(MissingStrategy::IMPUTE_MEDIAN));
		REQUIRE_THAT(*result.dataset.GetColumn("a").NumericValues()[1], Catch::Matchers::WithinAbs(3.0, TOLERANCE));
	}

	SECTION("Mode with ties takes the lowest value") {
		auto result = DataCleaner::Clean(data, {"b", "c"}, CleaningOptions::Impute(MissingStrategy::IMPUTE_MODE));
		REQUIRE(*result.dataset.GetColumn("b").NumericValues()[0] == 2.0);
		REQUIRE(*result.dataset.GetColumn("c").TextValues()[3] == "x");
	}

	SECTION("Mean on a categorical column falls back to the mode") {
		auto result = DataCleaner::Clean(data, {"c"}, CleaningOptions::Impute(MissingStrategy::IMPUTE_MEAN));
		REQUIRE(*result.dataset.GetColumn("c").TextValues()[3] == "x");
		REQUIRE(result.dataset.GetColumn("c").Type() == ColumnType::CATEGORICAL);
	}

	SECTION("Constant") {
		auto result = DataCleaner::Clean(data, {"a", "b"}, CleaningOptions::ImputeConstant(0.0));
		REQUIRE(result.dataset.MissingCount("a") == 0);
		REQUIRE(result.dataset.MissingCount("b") == 0);
		REQUIRE(*result.dataset.GetColumn("b").NumericValues()[2] == 0.0);
		REQUIRE(result.log.size() == 2);
	}

	SECTION("Text constant cannot fill a numeric column") {
		REQUIRE_THROWS_AS(DataCleaner::Clean(data, {"a"}, CleaningOptions::ImputeConstant(std::string("none"))),
		                  InvalidConfigError);
	}

	SECTION("Constant policy requires a value") {
		REQUIRE_THROWS_AS(DataCleaner::Clean(data, {}, CleaningOptions::Impute(MissingStrategy::IMPUTE_CONSTANT)),
		                  InvalidConfigError);
	}

	SECTION("Column without observed values") {
		auto empty = Dataset(std::vector<Column> {
		    Column::Numeric("v", std::vector<NumericCell> {std::nullopt, std::nullopt}),
		    Column::Numeric("w", std::vector<double> {1, 2})});
		REQUIRE_THROWS_AS(DataCleaner::Clean(empty, {"v"}, CleaningOptions::Impute(MissingStrategy::IMPUTE_MEAN)),
		                  InsufficientDataError);
	}
}

TEST_CASE("DataCleaner: Duplicates", "[cleaning][duplicates]") {
	auto data = Dataset(std::vector<Column> {
	    Column::Numeric("v", std::vector<NumericCell> {1.0, 2.0, 1.0, std::nullopt, std::nullopt}),
	    Column::Categorical("k", {std::string("a"), std::string("b"), std::string("a"), std::nullopt, std::nullopt})});

	size_t removed = 0;
	auto deduplicated = DataCleaner::RemoveDuplicates(data, {}, &removed);
	// missing equals missing
	REQUIRE(removed == 2);
	REQUIRE(deduplicated.RowCount() == 3);
	REQUIRE(*deduplicated.GetColumn("v").NumericValues()[1] == 2.0);

	SECTION("Combined with a missing-value policy") {
		CleaningOptions opts = CleaningOptions::DropRow();
		opts.remove_duplicates = true;
		auto result = DataCleaner::Clean(data, {}, opts);
		REQUIRE(result.duplicates_removed == 2);
		REQUIRE(result.rows_removed == 1);
		REQUIRE(result.dataset.RowCount() == 2);
	}
}

TEST_CASE("DataCleaner: Quality report", "[cleaning][quality]") {
	auto data = Dataset(std::vector<Column> {
	    Column::Numeric("id", std::vector<double> {1, 2, 3, 4, 5, 6, 7, 8}),
	    Column::Numeric("value", std::vector<NumericCell> {10.0, 11.0, 10.0, 12.0, 11.0, 10.0, std::nullopt, 100.0}),
	    Column::Categorical("group", {std::string("a"), std::string("b"), std::string("a"), std::string("b"),
	                                  std::string("b"), std::string("c"), std::string("c"), std::string("c")})});

	auto report = DataCleaner::CheckQuality(data);
	REQUIRE(report.n_rows == 8);
	REQUIRE(report.n_cols == 3);

	// the unique id column is not part of the duplicate key
	REQUIRE(report.duplicate_key_columns == std::vector<std::string> {"value", "group"});
	REQUIRE(report.duplicate_rows == std::vector<size_t> {0, 1, 2, 4});

	REQUIRE(report.missing_total == 1);
	REQUIRE(report.rows_with_missing == std::vector<size_t> {6});
	REQUIRE(report.missing_by_column.at("value") == 1);

	REQUIRE(report.outliers_by_column.at("value") == 1);
	REQUIRE(report.outliers_by_column.count("id") == 0);
}
