#pragma once

#include <optional>
#include <string>
#include <vector>

namespace statkit {
namespace core {

/**
 * Summary statistics for one numeric column
 *
 * Quartiles use linear interpolation between order statistics (Hyndman-Fan
 * type 7): position h = (n - 1) * p over the sorted values.
 * Statistics that are undefined for the data at hand are std::nullopt rather
 * than NaN.
 */
struct ColumnSummary {
	std::string name;

	size_t count = 0;
	size_t missing = 0;

	double sum = 0.0;
	double mean = 0.0;

	/// Sample variance (divisor n - 1)
	double variance = 0.0;
	double std_dev = 0.0;

	double min = 0.0;
	double q1 = 0.0;
	double median = 0.0;
	double q3 = 0.0;
	double max = 0.0;

	double range() const {
		return max - min;
	}

	double iqr() const {
		return q3 - q1;
	}

	/// Adjusted Fisher-Pearson skewness G1 (n >= 3, non-zero variance)
	std::optional<double> skewness;

	/// Sample excess kurtosis G2 (n >= 4, non-zero variance)
	std::optional<double> kurtosis;

	/// std_dev / |mean| (mean != 0)
	std::optional<double> coefficient_of_variation;
};

/// One category of a frequency table
struct CategoryCount {
	std::string category;
	size_t count = 0;

	/// Percentage of non-missing cells
	double percent = 0.0;
};

/// Frequency table for a categorical or text column
struct FrequencyTable {
	std::string name;
	size_t missing = 0;

	/// Sorted by descending count, then category
	std::vector<CategoryCount> categories;
};

struct DescriptiveResult {
	std::vector<ColumnSummary> numeric;
	std::vector<FrequencyTable> categorical;
};

} // namespace core
} // namespace statkit
