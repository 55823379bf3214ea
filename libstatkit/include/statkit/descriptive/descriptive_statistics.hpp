#pragma once

#include "statkit/core/dataset.hpp"
#include "statkit/core/descriptive_result.hpp"
#include "statkit/core/errors.hpp"
#include "statkit/utils/sample_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace statkit {
namespace descriptive {

/**
 * Per-column summary statistics
 *
 * Numeric columns produce a ColumnSummary, categorical and text columns a
 * FrequencyTable. Missing cells are excluded from every statistic and reported
 * as a count.
 */
class DescriptiveStatistics {
public:
	/**
	 * Describe the given columns
	 *
	 * @param dataset Source dataset
	 * @param columns Columns to describe (empty = all columns, in dataset order)
	 * @throws InvalidConfigError for unknown columns
	 * @throws DegenerateInputError when a numeric column has fewer than 2 observed values
	 */
	static core::DescriptiveResult Describe(const core::Dataset &dataset, const std::vector<std::string> &columns);

	/**
	 * Summarize observed numeric values
	 *
	 * @throws DegenerateInputError when values.size() < 2 (variance undefined)
	 */
	static core::ColumnSummary Summarize(const std::string &name, const std::vector<double> &values,
	                                     size_t missing = 0);

	static core::FrequencyTable Frequencies(const core::Column &column);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::ColumnSummary DescriptiveStatistics::Summarize(const std::string &name,
                                                            const std::vector<double> &values, size_t missing) {
	if (values.size() < 2) {
		throw core::DegenerateInputError("column '" + name + "' has " + std::to_string(values.size()) +
		                                 " observed values; variance needs at least 2");
	}

	core::ColumnSummary summary;
	summary.name = name;
	summary.count = values.size();
	summary.missing = missing;

	for (double v : values) {
		summary.sum += v;
	}
	summary.mean = summary.sum / static_cast<double>(summary.count);
	summary.variance = utils::SampleVariance(values, summary.mean);
	summary.std_dev = std::sqrt(summary.variance);

	const auto sorted = utils::SortedCopy(values);
	summary.min = sorted.front();
	summary.max = sorted.back();
	summary.q1 = utils::QuantileSorted(sorted, 0.25);
	summary.median = utils::QuantileSorted(sorted, 0.5);
	summary.q3 = utils::QuantileSorted(sorted, 0.75);

	// Shape statistics are undefined for constant data
	if (summary.variance > 0.0) {
		if (summary.count >= 3) {
			summary.skewness = utils::AdjustedSkewness(values, summary.mean);
		}
		if (summary.count >= 4) {
			summary.kurtosis = utils::ExcessKurtosis(values, summary.mean);
		}
	}
	if (summary.mean != 0.0) {
		summary.coefficient_of_variation = summary.std_dev / std::fabs(summary.mean);
	}
	return summary;
}

inline core::FrequencyTable DescriptiveStatistics::Frequencies(const core::Column &column) {
	core::FrequencyTable table;
	table.name = column.Name();

	std::map<std::string, size_t> counts;
	size_t observed = 0;
	for (size_t row = 0; row < column.Size(); row++) {
		if (column.IsMissing(row)) {
			table.missing++;
			continue;
		}
		counts[column.CellKey(row)]++;
		observed++;
	}

	for (const auto &entry : counts) {
		core::CategoryCount category;
		category.category = entry.first;
		category.count = entry.second;
		category.percent = 100.0 * static_cast<double>(entry.second) / static_cast<double>(observed);
		table.categories.push_back(category);
	}
	std::stable_sort(table.categories.begin(), table.categories.end(),
	                 [](const core::CategoryCount &a, const core::CategoryCount &b) { return a.count > b.count; });
	return table;
}

inline core::DescriptiveResult DescriptiveStatistics::Describe(const core::Dataset &dataset,
                                                               const std::vector<std::string> &columns) {
	const auto names = columns.empty() ? dataset.ColumnNames() : columns;

	core::DescriptiveResult result;
	for (const auto &name : names) {
		const auto &col = dataset.GetColumn(name);
		if (col.IsNumeric()) {
			result.numeric.push_back(Summarize(name, col.ObservedValues(), col.MissingCount()));
		} else {
			result.categorical.push_back(Frequencies(col));
		}
	}
	return result;
}

} // namespace descriptive
} // namespace statkit
