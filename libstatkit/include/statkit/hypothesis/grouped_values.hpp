#pragma once

#include "statkit/core/dataset.hpp"
#include "statkit/core/errors.hpp"
#include "statkit/core/hypothesis_result.hpp"
#include "statkit/utils/sample_statistics.hpp"
#include <cmath>
#include <string>
#include <unordered_map>
#include <vector>

namespace statkit {
namespace hypothesis {

/**
 * Numeric values split by the levels of a grouping column
 *
 * Groups appear in order of first appearance in the grouping column. Rows with
 * a missing group or a missing value are skipped.
 */
struct GroupedValues {
	std::vector<std::string> names;
	std::vector<std::vector<double>> values;

	size_t group_count() const {
		return names.size();
	}

	size_t total_count() const {
		size_t total = 0;
		for (const auto &group : values) {
			total += group.size();
		}
		return total;
	}

	/**
	 * Split a numeric column by a grouping column
	 *
	 * @throws InvalidConfigError when a column is unknown or the value column is not numeric
	 */
	static GroupedValues Split(const core::Dataset &dataset, const std::string &value_column,
	                           const std::string &group_column) {
		const auto &values = dataset.GetColumn(value_column).NumericValues();
		const auto &groups = dataset.GetColumn(group_column);

		GroupedValues result;
		std::unordered_map<std::string, size_t> index;
		for (size_t row = 0; row < dataset.RowCount(); row++) {
			if (groups.IsMissing(row) || !values[row].has_value()) {
				continue;
			}
			const auto key = groups.CellKey(row);
			auto it = index.find(key);
			if (it == index.end()) {
				it = index.emplace(key, result.names.size()).first;
				result.names.push_back(key);
				result.values.emplace_back();
			}
			result.values[it->second].push_back(*values[row]);
		}
		return result;
	}
};

/// Box-plot diagnostics for one group
inline core::GroupSummary SummarizeGroup(const std::string &name, const std::vector<double> &values) {
	core::GroupSummary summary;
	summary.name = name;
	summary.n = values.size();
	if (values.empty()) {
		return summary;
	}
	summary.mean = utils::Mean(values);
	summary.variance = utils::SampleVariance(values, summary.mean);
	summary.std_dev = std::sqrt(summary.variance);

	const auto sorted = utils::SortedCopy(values);
	summary.min = sorted.front();
	summary.q1 = utils::QuantileSorted(sorted, 0.25);
	summary.median = utils::QuantileSorted(sorted, 0.5);
	summary.q3 = utils::QuantileSorted(sorted, 0.75);
	summary.max = sorted.back();
	return summary;
}

} // namespace hypothesis
} // namespace statkit
