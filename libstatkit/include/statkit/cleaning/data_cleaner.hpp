#pragma once

#include "statkit/core/analysis_options.hpp"
#include "statkit/core/cleaning_result.hpp"
#include "statkit/core/dataset.hpp"
#include "statkit/core/errors.hpp"
#include "statkit/utils/sample_statistics.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace statkit {
namespace cleaning {

/**
 * DataCleaner: missing-value handling, duplicate removal and quality checks
 *
 * Every operation is a pure transform: the input Dataset is left untouched and
 * a new Dataset is returned.
 *
 * Missing-value strategies (applied to the target columns only):
 * - DROP_ROW: remove rows with a missing value in any target column
 * - DROP_COLUMN: remove target columns whose missing ratio exceeds the threshold
 * - IMPUTE_MEAN / IMPUTE_MEDIAN: fill with the column statistic
 *   (non-numeric columns fall back to the mode)
 * - IMPUTE_MODE: fill with the most frequent value (ties: lowest value)
 * - IMPUTE_CONSTANT: fill with a user-supplied constant
 */
class DataCleaner {
public:
	/**
	 * Apply a cleaning policy
	 *
	 * @param dataset Source dataset
	 * @param target_columns Columns the policy applies to (empty = all columns)
	 * @param options Policy and switches
	 * @return New dataset with the operation log
	 * @throws InvalidConfigError for unknown columns or an unusable constant
	 * @throws InsufficientDataError when a column to impute has no observed value
	 * @throws EmptyResultError when no rows or no columns would remain
	 */
	static core::CleaningResult Clean(const core::Dataset &dataset, const std::vector<std::string> &target_columns,
	                                  const core::CleaningOptions &options);

	/**
	 * Remove exact duplicate rows, keeping the first occurrence
	 *
	 * Missing equals missing. Relative row order is preserved.
	 *
	 * @param subset Columns forming the duplicate key (empty = all columns)
	 * @param removed Optional output of the number of rows removed
	 */
	static core::Dataset RemoveDuplicates(const core::Dataset &dataset, const std::vector<std::string> &subset,
	                                      size_t *removed = nullptr);

	/**
	 * Data health check: missing cells, duplicate groups and IQR outliers
	 *
	 * Columns whose name contains "id" (case-insensitive) and whose values are
	 * all distinct are treated as row identifiers and left out of the duplicate
	 * key.
	 */
	static core::QualityReport CheckQuality(const core::Dataset &dataset);

	/// Most frequent observed value of a numeric column (ties: lowest value)
	static double NumericMode(const core::Column &column);

	/// Most frequent observed value of a categorical/text column (ties: lexicographically lowest)
	static std::string TextMode(const core::Column &column);

private:
	static std::vector<std::string> ResolveTargets(const core::Dataset &dataset,
	                                               const std::vector<std::string> &target_columns);

	static core::Column ImputeColumn(const core::Column &column, const core::CleaningOptions &options,
	                                 std::string &description);

	static size_t RowHash(const core::Dataset &dataset, const std::vector<size_t> &key_columns, size_t row);

	static bool RowsEqual(const core::Dataset &dataset, const std::vector<size_t> &key_columns, size_t a, size_t b);

	/// For every row, the index of the first row with an identical key
	static std::vector<size_t> GroupRows(const core::Dataset &dataset, const std::vector<size_t> &key_columns);

	static std::string FormatNumber(double value);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline std::vector<std::string> DataCleaner::ResolveTargets(const core::Dataset &dataset,
                                                            const std::vector<std::string> &target_columns) {
	if (target_columns.empty()) {
		return dataset.ColumnNames();
	}
	std::unordered_set<std::string> seen;
	for (const auto &name : target_columns) {
		if (!dataset.HasColumn(name)) {
			throw core::InvalidConfigError("unknown column '" + name + "'");
		}
		if (!seen.insert(name).second) {
			throw core::InvalidConfigError("column '" + name + "' selected more than once");
		}
	}
	return target_columns;
}

inline std::string DataCleaner::FormatNumber(double value) {
	std::ostringstream out;
	out.precision(15);
	out << value;
	return out.str();
}

inline size_t DataCleaner::RowHash(const core::Dataset &dataset, const std::vector<size_t> &key_columns, size_t row) {
	size_t seed = 0;
	for (size_t j : key_columns) {
		const auto &col = dataset.ColumnAt(j);
		size_t h;
		if (col.IsMissing(row)) {
			h = 0x9e3779b9u;
		} else if (col.IsNumeric()) {
			h = std::hash<double>()(*col.NumericValues()[row]);
		} else {
			h = std::hash<std::string>()(*col.TextValues()[row]);
		}
		seed ^= h + 0x9e3779b9u + (seed << 6) + (seed >> 2);
	}
	return seed;
}

inline bool DataCleaner::RowsEqual(const core::Dataset &dataset, const std::vector<size_t> &key_columns, size_t a,
                                   size_t b) {
	for (size_t j : key_columns) {
		if (!dataset.ColumnAt(j).CellEquals(a, b)) {
			return false;
		}
	}
	return true;
}

inline std::vector<size_t> DataCleaner::GroupRows(const core::Dataset &dataset,
                                                  const std::vector<size_t> &key_columns) {
	// group_of[row] = first row with identical key
	std::vector<size_t> group_of(dataset.RowCount());
	std::unordered_map<size_t, std::vector<size_t>> buckets;
	for (size_t row = 0; row < dataset.RowCount(); row++) {
		auto &bucket = buckets[RowHash(dataset, key_columns, row)];
		bool found = false;
		for (size_t representative : bucket) {
			if (RowsEqual(dataset, key_columns, representative, row)) {
				group_of[row] = representative;
				found = true;
				break;
			}
		}
		if (!found) {
			bucket.push_back(row);
			group_of[row] = row;
		}
	}
	return group_of;
}

inline core::Dataset DataCleaner::RemoveDuplicates(const core::Dataset &dataset,
                                                   const std::vector<std::string> &subset, size_t *removed) {
	std::vector<size_t> key_columns;
	for (const auto &name : ResolveTargets(dataset, subset)) {
		key_columns.push_back(dataset.ColumnIndex(name));
	}

	const auto group_of = GroupRows(dataset, key_columns);
	std::vector<size_t> kept;
	for (size_t row = 0; row < group_of.size(); row++) {
		if (group_of[row] == row) {
			kept.push_back(row);
		}
	}
	if (removed != nullptr) {
		*removed = dataset.RowCount() - kept.size();
	}
	return dataset.TakeRows(kept);
}

inline double DataCleaner::NumericMode(const core::Column &column) {
	std::map<double, size_t> counts;
	for (const auto &cell : column.NumericValues()) {
		if (cell.has_value()) {
			counts[*cell]++;
		}
	}
	if (counts.empty()) {
		throw core::InsufficientDataError("column '" + column.Name() + "' has no observed values to impute from");
	}
	// std::map iterates in ascending order, so the first maximum is the lowest value
	auto best = counts.begin();
	for (auto it = counts.begin(); it != counts.end(); ++it) {
		if (it->second > best->second) {
			best = it;
		}
	}
	return best->first;
}

inline std::string DataCleaner::TextMode(const core::Column &column) {
	std::map<std::string, size_t> counts;
	for (const auto &cell : column.TextValues()) {
		if (cell.has_value()) {
			counts[*cell]++;
		}
	}
	if (counts.empty()) {
		throw core::InsufficientDataError("column '" + column.Name() + "' has no observed values to impute from");
	}
	auto best = counts.begin();
	for (auto it = counts.begin(); it != counts.end(); ++it) {
		if (it->second > best->second) {
			best = it;
		}
	}
	return best->first;
}

inline core::Column DataCleaner::ImputeColumn(const core::Column &column, const core::CleaningOptions &options,
                                              std::string &description) {
	using core::MissingStrategy;

	if (column.IsNumeric()) {
		double fill = 0.0;
		switch (options.strategy) {
		case MissingStrategy::IMPUTE_MEAN:
		case MissingStrategy::IMPUTE_MEDIAN: {
			const auto observed = column.ObservedValues();
			if (observed.empty()) {
				throw core::InsufficientDataError("column '" + column.Name() +
				                                  "' has no observed values to impute from");
			}
			if (options.strategy == MissingStrategy::IMPUTE_MEAN) {
				fill = utils::Mean(observed);
				description = "mean";
			} else {
				fill = utils::Median(observed);
				description = "median";
			}
			break;
		}
		case MissingStrategy::IMPUTE_MODE:
			fill = NumericMode(column);
			description = "mode";
			break;
		case MissingStrategy::IMPUTE_CONSTANT:
			if (!options.numeric_constant.has_value()) {
				throw core::InvalidConfigError("column '" + column.Name() +
				                               "' is numeric but the imputation constant is not a number");
			}
			fill = *options.numeric_constant;
			description = "constant";
			break;
		default:
			throw core::InvalidConfigError(std::string("strategy ") + core::MissingStrategyName(options.strategy) +
			                               " does not impute");
		}
		auto cells = column.NumericValues();
		for (auto &cell : cells) {
			if (!cell.has_value()) {
				cell = fill;
			}
		}
		return core::Column::Numeric(column.Name(), std::move(cells));
	}

	std::string fill;
	if (options.strategy == MissingStrategy::IMPUTE_CONSTANT) {
		fill = options.text_constant.has_value() ? *options.text_constant : FormatNumber(*options.numeric_constant);
		description = "constant";
	} else {
		// mean and median are undefined for categories: use the mode
		fill = TextMode(column);
		description = "mode";
	}
	auto cells = column.TextValues();
	for (auto &cell : cells) {
		if (!cell.has_value()) {
			cell = fill;
		}
	}
	if (column.Type() == core::ColumnType::CATEGORICAL) {
		return core::Column::Categorical(column.Name(), std::move(cells));
	}
	return core::Column::Text(column.Name(), std::move(cells));
}

inline core::CleaningResult DataCleaner::Clean(const core::Dataset &dataset,
                                               const std::vector<std::string> &target_columns,
                                               const core::CleaningOptions &options) {
	using core::MissingStrategy;

	options.Validate();
	const auto targets = ResolveTargets(dataset, target_columns);

	core::CleaningResult result;
	core::Dataset current = dataset;

	// Step 1: duplicates
	if (options.remove_duplicates) {
		size_t removed = 0;
		current = RemoveDuplicates(current, {}, &removed);
		result.duplicates_removed = removed;
		if (removed > 0) {
			result.log.push_back("removed " + std::to_string(removed) + " duplicate rows");
		}
	}

	// Step 2: missing values
	switch (options.strategy) {
	case MissingStrategy::DROP_ROW: {
		std::vector<const core::Column *> cols;
		for (const auto &name : targets) {
			cols.push_back(&current.GetColumn(name));
		}
		std::vector<bool> keep(current.RowCount(), true);
		size_t dropped = 0;
		for (size_t row = 0; row < current.RowCount(); row++) {
			for (const auto *col : cols) {
				if (col->IsMissing(row)) {
					keep[row] = false;
					dropped++;
					break;
				}
			}
		}
		if (dropped == current.RowCount()) {
			throw core::EmptyResultError("dropping rows with missing values would remove all " +
			                             std::to_string(current.RowCount()) + " rows");
		}
		current = current.FilterRows(keep);
		result.rows_removed = dropped;
		if (dropped > 0) {
			result.log.push_back("dropped " + std::to_string(dropped) + " rows with missing values");
		}
		break;
	}
	case MissingStrategy::DROP_COLUMN: {
		const auto n_rows = static_cast<double>(current.RowCount());
		for (const auto &name : targets) {
			const double ratio = n_rows > 0 ? static_cast<double>(current.MissingCount(name)) / n_rows : 0.0;
			if (ratio > options.missing_threshold) {
				result.columns_removed.push_back(name);
			}
		}
		if (result.columns_removed.size() == current.ColumnCount()) {
			throw core::EmptyResultError("dropping columns over the missing threshold would remove every column");
		}
		current = current.WithoutColumns(result.columns_removed);
		for (const auto &name : result.columns_removed) {
			result.log.push_back("dropped column '" + name + "' (missing ratio above " +
			                     FormatNumber(options.missing_threshold) + ")");
		}
		break;
	}
	default: {
		for (const auto &name : targets) {
			const auto &col = current.GetColumn(name);
			const size_t missing = col.MissingCount();
			if (missing == 0) {
				continue;
			}
			std::string description;
			current = current.ReplaceColumn(ImputeColumn(col, options, description));
			result.imputed_counts[name] = missing;
			result.log.push_back("filled " + std::to_string(missing) + " missing values in '" + name + "' (" +
			                     description + ")");
		}
		break;
	}
	}

	if (current.RowCount() == 0) {
		throw core::EmptyResultError("cleaning left no rows");
	}

	result.dataset = std::move(current);
	return result;
}

inline core::QualityReport DataCleaner::CheckQuality(const core::Dataset &dataset) {
	core::QualityReport report;
	report.n_rows = dataset.RowCount();
	report.n_cols = dataset.ColumnCount();

	// Duplicate key: skip unique ID-like columns
	std::vector<size_t> key_columns;
	for (size_t j = 0; j < dataset.ColumnCount(); j++) {
		const auto &col = dataset.ColumnAt(j);
		std::string lower = col.Name();
		std::transform(lower.begin(), lower.end(), lower.begin(),
		               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		if (lower.find("id") != std::string::npos) {
			const auto group_of = GroupRows(dataset, {j});
			bool unique = true;
			for (size_t row = 0; row < group_of.size(); row++) {
				if (group_of[row] != row) {
					unique = false;
					break;
				}
			}
			if (unique) {
				continue;
			}
		}
		key_columns.push_back(j);
	}
	if (key_columns.empty()) {
		for (size_t j = 0; j < dataset.ColumnCount(); j++) {
			key_columns.push_back(j);
		}
	}
	for (size_t j : key_columns) {
		report.duplicate_key_columns.push_back(dataset.ColumnAt(j).Name());
	}

	if (!key_columns.empty()) {
		const auto group_of = GroupRows(dataset, key_columns);
		std::vector<size_t> group_size(dataset.RowCount(), 0);
		for (size_t row = 0; row < group_of.size(); row++) {
			group_size[group_of[row]]++;
		}
		for (size_t row = 0; row < group_of.size(); row++) {
			if (group_size[group_of[row]] > 1) {
				report.duplicate_rows.push_back(row);
			}
		}
	}

	// Missing cells
	for (size_t row = 0; row < dataset.RowCount(); row++) {
		for (const auto &col : dataset.Columns()) {
			if (col.IsMissing(row)) {
				report.rows_with_missing.push_back(row);
				break;
			}
		}
	}
	for (const auto &col : dataset.Columns()) {
		const size_t missing = col.MissingCount();
		report.missing_total += missing;
		if (missing > 0) {
			report.missing_by_column[col.Name()] = missing;
		}
	}

	// IQR outliers on numeric columns
	for (const auto &col : dataset.Columns()) {
		if (!col.IsNumeric()) {
			continue;
		}
		const auto sorted = utils::SortedCopy(col.ObservedValues());
		if (sorted.empty()) {
			continue;
		}
		const double q1 = utils::QuantileSorted(sorted, 0.25);
		const double q3 = utils::QuantileSorted(sorted, 0.75);
		const double iqr = q3 - q1;
		const double lower = q1 - 1.5 * iqr;
		const double upper = q3 + 1.5 * iqr;
		size_t outliers = 0;
		for (double v : sorted) {
			if (v < lower || v > upper) {
				outliers++;
			}
		}
		if (outliers > 0) {
			report.outliers_by_column[col.Name()] = outliers;
		}
	}

	return report;
}

} // namespace cleaning
} // namespace statkit
