#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <statkit/core/cancellation.hpp>
#include <statkit/core/dataset.hpp>
#include <statkit/decomposition/pca.hpp>
#include <cmath>

using namespace statkit::core;
using namespace statkit::decomposition;

const double TOLERANCE = 1e-6;

TEST_CASE("PCA: Perfectly correlated columns", "[pca]") {
	Eigen::MatrixXd X(4, 2);
	X << 1, 2, 2, 4, 3, 6, 4, 8;

	auto result = PCA::ComputeMatrix(X);

	REQUIRE(result.component_count() == 2);
	REQUIRE_THAT(result.eigenvalues(0), Catch::Matchers::WithinAbs(2.0, TOLERANCE));
	REQUIRE_THAT(result.eigenvalues(1), Catch::Matchers::WithinAbs(0.0, TOLERANCE));
	REQUIRE_THAT(result.explained_variance_ratio(0), Catch::Matchers::WithinAbs(1.0, TOLERANCE));

	// unit norm with a positive dominant entry
	REQUIRE_THAT(result.loadings(0, 0), Catch::Matchers::WithinAbs(1.0 / std::sqrt(2.0), TOLERANCE));
	REQUIRE_THAT(result.loadings(1, 0), Catch::Matchers::WithinAbs(1.0 / std::sqrt(2.0), TOLERANCE));
}

TEST_CASE("PCA: Unset component count keeps one component per column", "[pca]") {
	Eigen::MatrixXd X(5, 3);
	X << 1, 2, 0, 2, 1, 1, 3, 5, 0, 4, 3, 2, 5, 4, 1;

	REQUIRE(PcaOptions().component_count == 0);
	REQUIRE(PCA::ComputeMatrix(X, PcaOptions()).component_count() == 3);
	REQUIRE(PCA::ComputeMatrix(X, PcaOptions::WithComponents(1)).component_count() == 1);
}

TEST_CASE("PCA: Covariance decomposition", "[pca]") {
	// uncorrelated columns with variances 5/3 and 4/3
	Eigen::MatrixXd X(4, 2);
	X << 1, 1, 2, -1, 3, -1, 4, 1;

	auto result = PCA::ComputeMatrix(X, PcaOptions::WithComponents(0, false));

	REQUIRE_FALSE(result.standardized);
	REQUIRE(result.scales(0) == 1.0);
	REQUIRE_THAT(result.means(0), Catch::Matchers::WithinAbs(2.5, TOLERANCE));
	REQUIRE_THAT(result.eigenvalues(0), Catch::Matchers::WithinAbs(5.0 / 3.0, TOLERANCE));
	REQUIRE_THAT(result.eigenvalues(1), Catch::Matchers::WithinAbs(4.0 / 3.0, TOLERANCE));
	REQUIRE_THAT(result.explained_variance_ratio(0), Catch::Matchers::WithinAbs(5.0 / 9.0, TOLERANCE));
	REQUIRE_THAT(result.cumulative_variance_ratio(1), Catch::Matchers::WithinAbs(1.0, TOLERANCE));

	REQUIRE_THAT(result.loadings(0, 0), Catch::Matchers::WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(result.loadings(1, 1), Catch::Matchers::WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(result.scores(0, 0), Catch::Matchers::WithinAbs(-1.5, TOLERANCE));
	REQUIRE_THAT(result.scores(1, 1), Catch::Matchers::WithinAbs(-1.0, TOLERANCE));
}

TEST_CASE("PCA: Tied eigenvalues are ordered by column", "[pca][determinism]") {
	// standardized uncorrelated columns: the correlation matrix is the identity
	Eigen::MatrixXd X(4, 2);
	X << 0, 0, 0, 2, 2, 0, 2, 2;

	auto result = PCA::ComputeMatrix(X);
	REQUIRE_THAT(result.eigenvalues(0), Catch::Matchers::WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(result.eigenvalues(1), Catch::Matchers::WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(result.loadings(0, 0), Catch::Matchers::WithinAbs(1.0, TOLERANCE));
	REQUIRE_THAT(result.loadings(1, 1), Catch::Matchers::WithinAbs(1.0, TOLERANCE));
}

TEST_CASE("PCA: Properties on a dataset", "[pca]") {
	auto data = Dataset(std::vector<Column> {
	    Column::Numeric("height", std::vector<NumericCell> {150.0, 160.0, 165.0, 170.0, 180.0, 175.0, std::nullopt}),
	    Column::Numeric("weight", std::vector<NumericCell> {50.0, 58.0, 62.0, 68.0, 80.0, 70.0, 65.0}),
	    Column::Numeric("age", std::vector<NumericCell> {30.0, 25.0, 40.0, 35.0, 28.0, 50.0, 33.0})});

	auto result = PCA::Compute(data, {"height", "weight", "age"});

	REQUIRE(result.source_rows.size() == 6);
	REQUIRE(result.scores.rows() == 6);
	REQUIRE(result.columns.size() == 3);

	// correlation-matrix PCA: eigenvalues sum to the number of columns
	REQUIRE_THAT(result.eigenvalues.sum(), Catch::Matchers::WithinAbs(3.0, TOLERANCE));
	REQUIRE_THAT(result.explained_variance_ratio.sum(), Catch::Matchers::WithinAbs(1.0, TOLERANCE));

	for (Eigen::Index c = 0; c < 3; c++) {
		REQUIRE_THAT(result.loadings.col(c).norm(), Catch::Matchers::WithinAbs(1.0, TOLERANCE));
		Eigen::Index idx = 0;
		result.loadings.col(c).cwiseAbs().maxCoeff(&idx);
		REQUIRE(result.loadings(idx, c) > 0.0);
		if (c > 0) {
			REQUIRE(result.eigenvalues(c - 1) >= result.eigenvalues(c));
		}
		// score variance equals the eigenvalue
		const double variance = result.scores.col(c).squaredNorm() / 5.0;
		REQUIRE_THAT(variance, Catch::Matchers::WithinAbs(result.eigenvalues(c), TOLERANCE));
	}

	// orthonormal loadings
	const Eigen::MatrixXd gram = result.loadings.transpose() * result.loadings;
	REQUIRE((gram - Eigen::MatrixXd::Identity(3, 3)).cwiseAbs().maxCoeff() < TOLERANCE);

	SECTION("Fewer components") {
		auto reduced = PCA::Compute(data, {"height", "weight", "age"}, PcaOptions::WithComponents(2));
		REQUIRE(reduced.component_count() == 2);
		REQUIRE(reduced.loadings.cols() == 2);
		REQUIRE(reduced.scores.cols() == 2);
		REQUIRE_THAT(reduced.eigenvalues(0), Catch::Matchers::WithinAbs(result.eigenvalues(0), TOLERANCE));
		REQUIRE(reduced.cumulative_variance_ratio(1) < 1.0);
	}
}

TEST_CASE("PCA: Invalid input", "[pca][errors]") {
	SECTION("Constant column cannot be standardized") {
		Eigen::MatrixXd X(3, 2);
		X << 1, 5, 2, 5, 3, 5;
		REQUIRE_THROWS_AS(PCA::ComputeMatrix(X), DegenerateInputError);
	}

	SECTION("Too many components") {
		Eigen::MatrixXd X(3, 2);
		X << 1, 2, 2, 1, 3, 5;
		REQUIRE_THROWS_AS(PCA::ComputeMatrix(X, PcaOptions::WithComponents(3)), InvalidConfigError);
	}

	SECTION("Single row") {
		Eigen::MatrixXd X(1, 2);
		X << 1, 2;
		REQUIRE_THROWS_AS(PCA::ComputeMatrix(X), InsufficientDataError);
	}

	SECTION("Cancelled") {
		Eigen::MatrixXd X(3, 2);
		X << 1, 2, 2, 1, 3, 5;
		CancellationToken token;
		token.Cancel();
		REQUIRE_THROWS_AS(PCA::ComputeMatrix(X, PcaOptions(), &token), Cancelled);
	}
}
