#pragma once

#include "statkit/core/dataset.hpp"
#include "statkit/core/errors.hpp"
#include <string>
#include <vector>

namespace statkit {
namespace core {

/// Role a selected column plays in an analysis
enum class ColumnRole { VARIABLE, DEPENDENT, INDEPENDENT, GROUPING };

inline const char *ColumnRoleName(ColumnRole role) {
	switch (role) {
	case ColumnRole::VARIABLE:
		return "variable";
	case ColumnRole::DEPENDENT:
		return "dependent";
	case ColumnRole::INDEPENDENT:
		return "independent";
	case ColumnRole::GROUPING:
		return "grouping";
	default:
		return "unknown";
	}
}

/**
 * Ordered set of column names with role tags
 *
 * Names are unique within a selection. Validate() checks the selection against
 * a dataset: every name must exist, and when numeric data is required every
 * non-grouping column must be numeric.
 */
class ColumnSelection {
public:
	struct Entry {
		std::string name;
		ColumnRole role;
	};

	ColumnSelection() = default;

	ColumnSelection &Add(const std::string &name, ColumnRole role = ColumnRole::VARIABLE) {
		for (const auto &entry : entries_) {
			if (entry.name == name) {
				throw InvalidConfigError("column '" + name + "' selected more than once");
			}
		}
		entries_.push_back({name, role});
		return *this;
	}

	/// Selection of plain variables
	static ColumnSelection Variables(const std::vector<std::string> &names) {
		ColumnSelection selection;
		for (const auto &name : names) {
			selection.Add(name, ColumnRole::VARIABLE);
		}
		return selection;
	}

	const std::vector<Entry> &Entries() const {
		return entries_;
	}

	bool Empty() const {
		return entries_.empty();
	}

	/// Names with the given role, in selection order
	std::vector<std::string> Names(ColumnRole role) const {
		std::vector<std::string> names;
		for (const auto &entry : entries_) {
			if (entry.role == role) {
				names.push_back(entry.name);
			}
		}
		return names;
	}

	std::vector<std::string> AllNames() const {
		std::vector<std::string> names;
		names.reserve(entries_.size());
		for (const auto &entry : entries_) {
			names.push_back(entry.name);
		}
		return names;
	}

	/**
	 * Validate the selection against a dataset
	 *
	 * @param dataset Dataset the analysis will run on
	 * @param require_numeric When true, every column not tagged GROUPING must be numeric
	 * @throws InvalidConfigError on unknown columns or incompatible types
	 */
	void Validate(const Dataset &dataset, bool require_numeric) const {
		for (const auto &entry : entries_) {
			if (!dataset.HasColumn(entry.name)) {
				throw InvalidConfigError("unknown column '" + entry.name + "'");
			}
			if (require_numeric && entry.role != ColumnRole::GROUPING) {
				const auto &col = dataset.GetColumn(entry.name);
				if (!col.IsNumeric()) {
					throw InvalidConfigError("column '" + entry.name + "' is " + ColumnTypeName(col.Type()) +
					                         " but is used as " + ColumnRoleName(entry.role) +
					                         "; a numeric column is required");
				}
			}
		}
	}

private:
	std::vector<Entry> entries_;
};

} // namespace core
} // namespace statkit
