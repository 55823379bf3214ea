#pragma once

#include "statkit/core/column_selection.hpp"
#include "utils/options_parser.hpp"
#include <string>
#include <vector>

namespace statkit {
namespace engine {

enum class AnalysisKind { CLEAN, DESCRIBE, TTEST, ANOVA, CORRELATE, REGRESS, PCA, KMEANS };

/// Stable analysis identifier, also the option namespace used by OptionsParser
inline const char *AnalysisKindName(AnalysisKind kind) {
	switch (kind) {
	case AnalysisKind::CLEAN:
		return "clean";
	case AnalysisKind::DESCRIBE:
		return "describe";
	case AnalysisKind::TTEST:
		return "ttest";
	case AnalysisKind::ANOVA:
		return "anova";
	case AnalysisKind::CORRELATE:
		return "correlate";
	case AnalysisKind::REGRESS:
		return "regress";
	case AnalysisKind::PCA:
		return "pca";
	case AnalysisKind::KMEANS:
		return "kmeans";
	default:
		return "unknown";
	}
}

/**
 * One analysis to run: kind, selected columns and raw options
 *
 * Immutable once built. The factories tag columns with the roles each
 * analysis expects; the options are only parsed (and validated) when the
 * engine runs the request.
 */
class AnalysisRequest {
public:
	AnalysisRequest(AnalysisKind kind, core::ColumnSelection selection, OptionMap options = {})
	    : kind_(kind), selection_(std::move(selection)), options_(std::move(options)) {
	}

	/// Cleaning of the target columns (empty = every column)
	static AnalysisRequest Clean(const std::vector<std::string> &targets, OptionMap options = {}) {
		return AnalysisRequest(AnalysisKind::CLEAN, core::ColumnSelection::Variables(targets), std::move(options));
	}

	static AnalysisRequest Describe(const std::vector<std::string> &columns) {
		return AnalysisRequest(AnalysisKind::DESCRIBE, core::ColumnSelection::Variables(columns));
	}

	/// Two-group t-test of value_column split by group_column
	static AnalysisRequest TTest(const std::string &value_column, const std::string &group_column,
	                             OptionMap options = {}) {
		core::ColumnSelection selection;
		selection.Add(value_column, core::ColumnRole::VARIABLE).Add(group_column, core::ColumnRole::GROUPING);
		return AnalysisRequest(AnalysisKind::TTEST, std::move(selection), std::move(options));
	}

	/// Paired t-test of two measurement columns; forces variant = paired
	static AnalysisRequest PairedTTest(const std::string &first_column, const std::string &second_column,
	                                   OptionMap options = {}) {
		options["variant"] = std::string("paired");
		return AnalysisRequest(AnalysisKind::TTEST, core::ColumnSelection::Variables({first_column, second_column}),
		                       std::move(options));
	}

	static AnalysisRequest Anova(const std::string &value_column, const std::string &group_column,
	                             OptionMap options = {}) {
		core::ColumnSelection selection;
		selection.Add(value_column, core::ColumnRole::VARIABLE).Add(group_column, core::ColumnRole::GROUPING);
		return AnalysisRequest(AnalysisKind::ANOVA, std::move(selection), std::move(options));
	}

	static AnalysisRequest Correlate(const std::vector<std::string> &columns, OptionMap options = {}) {
		return AnalysisRequest(AnalysisKind::CORRELATE, core::ColumnSelection::Variables(columns),
		                       std::move(options));
	}

	static AnalysisRequest Regress(const std::string &dependent, const std::vector<std::string> &independents,
	                               OptionMap options = {}) {
		core::ColumnSelection selection;
		selection.Add(dependent, core::ColumnRole::DEPENDENT);
		for (const auto &name : independents) {
			selection.Add(name, core::ColumnRole::INDEPENDENT);
		}
		return AnalysisRequest(AnalysisKind::REGRESS, std::move(selection), std::move(options));
	}

	static AnalysisRequest Pca(const std::vector<std::string> &columns, OptionMap options = {}) {
		return AnalysisRequest(AnalysisKind::PCA, core::ColumnSelection::Variables(columns), std::move(options));
	}

	static AnalysisRequest KMeans(const std::vector<std::string> &columns, OptionMap options) {
		return AnalysisRequest(AnalysisKind::KMEANS, core::ColumnSelection::Variables(columns), std::move(options));
	}

	AnalysisKind Kind() const {
		return kind_;
	}

	const core::ColumnSelection &Selection() const {
		return selection_;
	}

	const OptionMap &Options() const {
		return options_;
	}

private:
	const AnalysisKind kind_;
	const core::ColumnSelection selection_;
	const OptionMap options_;
};

} // namespace engine
} // namespace statkit
