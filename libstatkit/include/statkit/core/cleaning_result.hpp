#pragma once

#include "statkit/core/dataset.hpp"
#include <map>
#include <string>
#include <vector>

namespace statkit {
namespace core {

/// Output of DataCleaner::Clean: the new dataset plus what was done to it
struct CleaningResult {
	Dataset dataset;

	/// Human-readable operation log, one line per applied step
	std::vector<std::string> log;

	size_t rows_removed = 0;
	size_t duplicates_removed = 0;
	std::vector<std::string> columns_removed;

	/// Number of cells filled per imputed column
	std::map<std::string, size_t> imputed_counts;
};

/// Data health report produced by DataCleaner::CheckQuality
struct QualityReport {
	size_t n_rows = 0;
	size_t n_cols = 0;

	/// Columns used as the duplicate key (unique ID-like columns excluded)
	std::vector<std::string> duplicate_key_columns;

	/// Rows belonging to a duplicate group (every member, including the first)
	std::vector<size_t> duplicate_rows;

	/// Total missing cells across all columns
	size_t missing_total = 0;

	/// Rows with at least one missing cell
	std::vector<size_t> rows_with_missing;

	/// Missing count per column (only columns with at least one missing cell)
	std::map<std::string, size_t> missing_by_column;

	/// IQR outlier count per numeric column (only columns with outliers)
	std::map<std::string, size_t> outliers_by_column;
};

} // namespace core
} // namespace statkit
