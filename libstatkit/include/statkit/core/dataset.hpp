#pragma once

#include "statkit/core/errors.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace statkit {
namespace core {

/// Declared type of a dataset column
enum class ColumnType { NUMERIC, CATEGORICAL, TEXT };

inline const char *ColumnTypeName(ColumnType type) {
	switch (type) {
	case ColumnType::NUMERIC:
		return "numeric";
	case ColumnType::CATEGORICAL:
		return "categorical";
	case ColumnType::TEXT:
		return "text";
	default:
		return "unknown";
	}
}

/// A numeric cell; std::nullopt marks a missing value
using NumericCell = std::optional<double>;

/// A categorical or text cell; std::nullopt marks a missing value
using TextCell = std::optional<std::string>;

/**
 * A named, typed column of equal-length cells
 *
 * Numeric columns store NumericCell values, categorical and text columns store
 * TextCell values. A NaN or infinity passed into a numeric column is stored as
 * missing so that no non-finite value ever reaches an analysis.
 */
class Column {
public:
	Column() : type_(ColumnType::NUMERIC) {
	}

	static Column Numeric(std::string name, std::vector<NumericCell> values) {
		Column col;
		col.name_ = std::move(name);
		col.type_ = ColumnType::NUMERIC;
		for (auto &value : values) {
			if (value.has_value() && !std::isfinite(*value)) {
				value.reset();
			}
		}
		col.numeric_ = std::move(values);
		return col;
	}

	/// Convenience for fully observed numeric data
	static Column Numeric(std::string name, const std::vector<double> &values) {
		std::vector<NumericCell> cells(values.begin(), values.end());
		return Numeric(std::move(name), std::move(cells));
	}

	static Column Categorical(std::string name, std::vector<TextCell> values) {
		Column col;
		col.name_ = std::move(name);
		col.type_ = ColumnType::CATEGORICAL;
		col.text_ = std::move(values);
		return col;
	}

	static Column Text(std::string name, std::vector<TextCell> values) {
		Column col;
		col.name_ = std::move(name);
		col.type_ = ColumnType::TEXT;
		col.text_ = std::move(values);
		return col;
	}

	const std::string &Name() const {
		return name_;
	}

	ColumnType Type() const {
		return type_;
	}

	bool IsNumeric() const {
		return type_ == ColumnType::NUMERIC;
	}

	size_t Size() const {
		return IsNumeric() ? numeric_.size() : text_.size();
	}

	bool IsMissing(size_t row) const {
		return IsNumeric() ? !numeric_[row].has_value() : !text_[row].has_value();
	}

	size_t MissingCount() const {
		size_t count = 0;
		for (size_t i = 0; i < Size(); i++) {
			if (IsMissing(i)) {
				count++;
			}
		}
		return count;
	}

	const std::vector<NumericCell> &NumericValues() const {
		if (!IsNumeric()) {
			throw InvalidConfigError("column '" + name_ + "' is " + ColumnTypeName(type_) + ", numeric required");
		}
		return numeric_;
	}

	const std::vector<TextCell> &TextValues() const {
		if (IsNumeric()) {
			throw InvalidConfigError("column '" + name_ + "' is numeric, categorical or text required");
		}
		return text_;
	}

	/// Non-missing numeric values in row order
	std::vector<double> ObservedValues() const {
		const auto &cells = NumericValues();
		std::vector<double> values;
		values.reserve(cells.size());
		for (const auto &cell : cells) {
			if (cell.has_value()) {
				values.push_back(*cell);
			}
		}
		return values;
	}

	/// Render a cell as a group/category key
	///
	/// Numeric cells use the shortest of 15 or max_digits10 significant digits
	/// that reads back as the same double, so distinct values never share a key.
	std::string CellKey(size_t row) const {
		if (IsNumeric()) {
			const double value = *numeric_[row];
			std::ostringstream out;
			out.precision(15);
			out << value;
			if (std::strtod(out.str().c_str(), nullptr) != value) {
				out.str(std::string());
				out.precision(std::numeric_limits<double>::max_digits10);
				out << value;
			}
			return out.str();
		}
		return *text_[row];
	}

	bool CellEquals(size_t row_a, size_t row_b) const {
		if (IsNumeric()) {
			return numeric_[row_a] == numeric_[row_b];
		}
		return text_[row_a] == text_[row_b];
	}

	/// New column holding only the given rows, in the given order
	Column TakeRows(const std::vector<size_t> &rows) const {
		Column col;
		col.name_ = name_;
		col.type_ = type_;
		if (IsNumeric()) {
			col.numeric_.reserve(rows.size());
			for (size_t row : rows) {
				col.numeric_.push_back(numeric_[row]);
			}
		} else {
			col.text_.reserve(rows.size());
			for (size_t row : rows) {
				col.text_.push_back(text_[row]);
			}
		}
		return col;
	}

private:
	std::string name_;
	ColumnType type_;
	std::vector<NumericCell> numeric_;
	std::vector<TextCell> text_;
};

/**
 * In-memory tabular dataset
 *
 * Invariants (checked on construction):
 * - column names are unique
 * - all columns have the same number of rows
 *
 * A Dataset is never mutated by an analysis. Every transform (Select,
 * TakeRows, ReplaceColumn, ...) returns a new Dataset so that analyses can be
 * re-run against the untouched source, and concurrent readers need no locking.
 */
class Dataset {
public:
	Dataset() : row_count_(0) {
	}

	explicit Dataset(std::vector<Column> columns) : columns_(std::move(columns)), row_count_(0) {
		std::unordered_set<std::string> seen;
		for (size_t j = 0; j < columns_.size(); j++) {
			const auto &col = columns_[j];
			if (!seen.insert(col.Name()).second) {
				throw InvalidConfigError("duplicate column name '" + col.Name() + "'");
			}
			if (j == 0) {
				row_count_ = col.Size();
			} else if (col.Size() != row_count_) {
				throw InvalidConfigError("column '" + col.Name() + "' has " + std::to_string(col.Size()) +
				                         " rows, expected " + std::to_string(row_count_));
			}
		}
	}

	size_t RowCount() const {
		return row_count_;
	}

	size_t ColumnCount() const {
		return columns_.size();
	}

	bool HasColumn(const std::string &name) const {
		for (const auto &col : columns_) {
			if (col.Name() == name) {
				return true;
			}
		}
		return false;
	}

	size_t ColumnIndex(const std::string &name) const {
		for (size_t j = 0; j < columns_.size(); j++) {
			if (columns_[j].Name() == name) {
				return j;
			}
		}
		throw InvalidConfigError("unknown column '" + name + "'");
	}

	const Column &GetColumn(const std::string &name) const {
		return columns_[ColumnIndex(name)];
	}

	const Column &ColumnAt(size_t index) const {
		return columns_.at(index);
	}

	const std::vector<Column> &Columns() const {
		return columns_;
	}

	std::vector<std::string> ColumnNames() const {
		std::vector<std::string> names;
		names.reserve(columns_.size());
		for (const auto &col : columns_) {
			names.push_back(col.Name());
		}
		return names;
	}

	size_t MissingCount(const std::string &name) const {
		return GetColumn(name).MissingCount();
	}

	/// New dataset with the named columns, in the requested order
	Dataset Select(const std::vector<std::string> &names) const {
		std::vector<Column> selected;
		selected.reserve(names.size());
		for (const auto &name : names) {
			selected.push_back(GetColumn(name));
		}
		Dataset result(std::move(selected));
		if (names.empty()) {
			result.row_count_ = 0;
		}
		return result;
	}

	/// New dataset without the named columns
	Dataset WithoutColumns(const std::vector<std::string> &names) const {
		std::unordered_set<std::string> drop(names.begin(), names.end());
		std::vector<Column> kept;
		for (const auto &col : columns_) {
			if (drop.count(col.Name()) == 0) {
				kept.push_back(col);
			}
		}
		Dataset result(std::move(kept));
		if (result.columns_.empty()) {
			result.row_count_ = row_count_;
		}
		return result;
	}

	/// New dataset with the given rows (in the given order)
	Dataset TakeRows(const std::vector<size_t> &rows) const {
		std::vector<Column> taken;
		taken.reserve(columns_.size());
		for (const auto &col : columns_) {
			taken.push_back(col.TakeRows(rows));
		}
		Dataset result(std::move(taken));
		result.row_count_ = rows.size();
		return result;
	}

	/// New dataset keeping rows whose mask entry is true
	Dataset FilterRows(const std::vector<bool> &keep) const {
		if (keep.size() != row_count_) {
			throw LengthMismatchError("row mask has " + std::to_string(keep.size()) + " entries, dataset has " +
			                          std::to_string(row_count_) + " rows");
		}
		std::vector<size_t> rows;
		for (size_t i = 0; i < keep.size(); i++) {
			if (keep[i]) {
				rows.push_back(i);
			}
		}
		return TakeRows(rows);
	}

	/// New dataset where the column with the same name is replaced
	Dataset ReplaceColumn(Column column) const {
		std::vector<Column> replaced = columns_;
		replaced[ColumnIndex(column.Name())] = std::move(column);
		return Dataset(std::move(replaced));
	}

	/**
	 * Extract numeric columns as a matrix, keeping only complete rows
	 *
	 * A row is kept when none of the named columns is missing (listwise
	 * deletion).
	 *
	 * @param names Numeric columns, in output column order
	 * @param rows_out Optional output of the source row index for each matrix row
	 * @return n_complete × names.size() matrix
	 */
	Eigen::MatrixXd CompleteCases(const std::vector<std::string> &names,
	                              std::vector<size_t> *rows_out = nullptr) const {
		std::vector<const std::vector<NumericCell> *> cells;
		cells.reserve(names.size());
		for (const auto &name : names) {
			cells.push_back(&GetColumn(name).NumericValues());
		}

		std::vector<size_t> rows;
		for (size_t i = 0; i < row_count_; i++) {
			bool complete = true;
			for (const auto *col : cells) {
				if (!(*col)[i].has_value()) {
					complete = false;
					break;
				}
			}
			if (complete) {
				rows.push_back(i);
			}
		}

		Eigen::MatrixXd X(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(names.size()));
		for (size_t r = 0; r < rows.size(); r++) {
			for (size_t j = 0; j < cells.size(); j++) {
				X(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(j)) = *(*cells[j])[rows[r]];
			}
		}
		if (rows_out != nullptr) {
			*rows_out = std::move(rows);
		}
		return X;
	}

private:
	std::vector<Column> columns_;
	size_t row_count_;
};

} // namespace core
} // namespace statkit
