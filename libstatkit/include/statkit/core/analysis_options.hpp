#pragma once

#include "statkit/core/errors.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace statkit {
namespace core {

// ============================================================================
// Cleaning
// ============================================================================

/// Missing-value strategy applied by the cleaning module
enum class MissingStrategy { DROP_ROW, DROP_COLUMN, IMPUTE_MEAN, IMPUTE_MEDIAN, IMPUTE_MODE, IMPUTE_CONSTANT };

inline const char *MissingStrategyName(MissingStrategy strategy) {
	switch (strategy) {
	case MissingStrategy::DROP_ROW:
		return "drop_row";
	case MissingStrategy::DROP_COLUMN:
		return "drop_column";
	case MissingStrategy::IMPUTE_MEAN:
		return "impute_mean";
	case MissingStrategy::IMPUTE_MEDIAN:
		return "impute_median";
	case MissingStrategy::IMPUTE_MODE:
		return "impute_mode";
	case MissingStrategy::IMPUTE_CONSTANT:
		return "impute_constant";
	default:
		return "unknown";
	}
}

/**
 * Missing-value policy plus the cleaning switches that go with it
 *
 * IMPUTE_CONSTANT needs a constant: numeric target columns use
 * numeric_constant, categorical/text target columns use text_constant (or the
 * textual form of numeric_constant when only that is set).
 */
struct CleaningOptions {
	MissingStrategy strategy = MissingStrategy::DROP_ROW;

	std::optional<double> numeric_constant;
	std::optional<std::string> text_constant;

	/// DROP_COLUMN removes a target column when missing/rows is strictly greater than this
	double missing_threshold = 0.5;

	/// Remove exact duplicate rows (first occurrence kept) before handling missing values
	bool remove_duplicates = false;

	static CleaningOptions DropRow() {
		return CleaningOptions();
	}

	static CleaningOptions DropColumn(double threshold = 0.5) {
		CleaningOptions opts;
		opts.strategy = MissingStrategy::DROP_COLUMN;
		opts.missing_threshold = threshold;
		return opts;
	}

	static CleaningOptions Impute(MissingStrategy strategy) {
		CleaningOptions opts;
		opts.strategy = strategy;
		return opts;
	}

	static CleaningOptions ImputeConstant(double value) {
		CleaningOptions opts;
		opts.strategy = MissingStrategy::IMPUTE_CONSTANT;
		opts.numeric_constant = value;
		return opts;
	}

	static CleaningOptions ImputeConstant(const std::string &value) {
		CleaningOptions opts;
		opts.strategy = MissingStrategy::IMPUTE_CONSTANT;
		opts.text_constant = value;
		return opts;
	}

	void Validate() const {
		if (missing_threshold < 0.0 || missing_threshold > 1.0) {
			throw InvalidConfigError("missing_threshold must be in [0, 1] (got " + std::to_string(missing_threshold) +
			                         ")");
		}
		if (strategy == MissingStrategy::IMPUTE_CONSTANT && !numeric_constant.has_value() &&
		    !text_constant.has_value()) {
			throw InvalidConfigError("impute_constant requires a constant value");
		}
	}
};

// ============================================================================
// Hypothesis tests
// ============================================================================

enum class TTestVariant { EQUAL_VARIANCE, WELCH, PAIRED };

inline const char *TTestVariantName(TTestVariant variant) {
	switch (variant) {
	case TTestVariant::EQUAL_VARIANCE:
		return "equal_variance";
	case TTestVariant::WELCH:
		return "welch";
	case TTestVariant::PAIRED:
		return "paired";
	default:
		return "unknown";
	}
}

struct TTestOptions {
	TTestVariant variant = TTestVariant::EQUAL_VARIANCE;

	/// Significance level for the reject/fail-to-reject decision
	double alpha = 0.05;

	/// Confidence level for the interval on the mean difference
	double confidence_level = 0.95;

	static TTestOptions Of(TTestVariant variant_, double alpha_ = 0.05) {
		TTestOptions opts;
		opts.variant = variant_;
		opts.alpha = alpha_;
		return opts;
	}

	void Validate() const {
		if (alpha <= 0.0 || alpha >= 1.0) {
			throw InvalidConfigError("alpha must be in (0, 1) (got " + std::to_string(alpha) + ")");
		}
		if (confidence_level <= 0.0 || confidence_level >= 1.0) {
			throw InvalidConfigError("confidence_level must be in (0, 1) (got " + std::to_string(confidence_level) +
			                         ")");
		}
	}
};

struct AnovaOptions {
	double alpha = 0.05;

	void Validate() const {
		if (alpha <= 0.0 || alpha >= 1.0) {
			throw InvalidConfigError("alpha must be in (0, 1) (got " + std::to_string(alpha) + ")");
		}
	}
};

// ============================================================================
// Correlation
// ============================================================================

enum class CorrelationMethod { PEARSON, SPEARMAN };

inline const char *CorrelationMethodName(CorrelationMethod method) {
	return method == CorrelationMethod::PEARSON ? "pearson" : "spearman";
}

struct CorrelationOptions {
	CorrelationMethod method = CorrelationMethod::PEARSON;

	/// Significance level used to flag cells
	double alpha = 0.05;

	static CorrelationOptions Pearson() {
		return CorrelationOptions();
	}

	static CorrelationOptions Spearman() {
		CorrelationOptions opts;
		opts.method = CorrelationMethod::SPEARMAN;
		return opts;
	}

	void Validate() const {
		if (alpha <= 0.0 || alpha >= 1.0) {
			throw InvalidConfigError("alpha must be in (0, 1) (got " + std::to_string(alpha) + ")");
		}
	}
};

// ============================================================================
// PCA
// ============================================================================

struct PcaOptions {
	/// Number of components to keep (0 = one per input column)
	size_t component_count = 0;

	/// Standardize columns to unit variance (correlation-matrix PCA); false = covariance PCA
	bool standardize = true;

	static PcaOptions WithComponents(size_t count, bool standardize_ = true) {
		PcaOptions opts;
		opts.component_count = count;
		opts.standardize = standardize_;
		return opts;
	}

	/// Validate against the number of input columns
	void Validate(size_t n_columns) const {
		if (n_columns == 0) {
			throw InvalidConfigError("PCA requires at least one column");
		}
		if (component_count > n_columns) {
			throw InvalidConfigError("component_count (" + std::to_string(component_count) +
			                         ") exceeds the number of input columns (" + std::to_string(n_columns) + ")");
		}
	}
};

// ============================================================================
// K-Means
// ============================================================================

enum class KMeansInit { RANDOM_SEEDED, FARTHEST_FIRST };

inline const char *KMeansInitName(KMeansInit init) {
	return init == KMeansInit::RANDOM_SEEDED ? "random_seeded" : "farthest_first";
}

struct KMeansOptions {
	/// Number of clusters, 1 <= k <= rows
	size_t k = 0;

	KMeansInit init = KMeansInit::FARTHEST_FIRST;

	/// Seed for initialization; identical seeds give identical results
	uint64_t seed = 42;

	size_t max_iterations = 300;

	/// Stop when the largest coordinate-wise centroid shift falls below this
	double tolerance = 1e-4;

	/// Cluster on z-scores (centroids are still reported in original units)
	bool standardize = false;

	static KMeansOptions WithK(size_t k_, KMeansInit init_ = KMeansInit::FARTHEST_FIRST, uint64_t seed_ = 42) {
		KMeansOptions opts;
		opts.k = k_;
		opts.init = init_;
		opts.seed = seed_;
		return opts;
	}

	/// Validate against the number of rows available for clustering
	void Validate(size_t n_rows) const {
		if (k < 1 || k > n_rows) {
			throw InvalidConfigError("k must satisfy 1 <= k <= rows (got k=" + std::to_string(k) +
			                         ", rows=" + std::to_string(n_rows) + ")");
		}
		if (max_iterations == 0) {
			throw InvalidConfigError("max_iterations must be positive");
		}
		if (!(tolerance >= 0.0)) {
			throw InvalidConfigError("tolerance must be non-negative (got " + std::to_string(tolerance) + ")");
		}
	}
};

} // namespace core
} // namespace statkit
