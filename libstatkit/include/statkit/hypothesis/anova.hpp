#pragma once

#include "statkit/core/analysis_options.hpp"
#include "statkit/core/dataset.hpp"
#include "statkit/core/errors.hpp"
#include "statkit/core/hypothesis_result.hpp"
#include "statkit/hypothesis/grouped_values.hpp"
#include "statkit/hypothesis/levene_test.hpp"
#include "statkit/hypothesis/tukey_hsd.hpp"
#include "statkit/utils/distributions.hpp"
#include <string>
#include <vector>

namespace statkit {
namespace hypothesis {

/**
 * One-way analysis of variance
 *
 *   SS_between = Σ n_i (x̄_i - x̄)²        df = k - 1
 *   SS_within  = Σ Σ (x_ij - x̄_i)²       df = N - k
 *   F = MS_between / MS_within ~ F(k - 1, N - k)
 *
 * Tukey HSD pairwise comparisons are always computed at the same alpha.
 */
class OneWayAnova {
public:
	/**
	 * @throws InsufficientDataError with fewer than 2 groups or a group with fewer than 2 values
	 * @throws DegenerateInputError when every group is constant (MS_within = 0)
	 */
	static core::AnovaResult Test(const core::Dataset &dataset, const std::string &value_column,
	                              const std::string &group_column, const core::AnovaOptions &options = {}) {
		const auto grouped = GroupedValues::Split(dataset, value_column, group_column);
		auto result = Compute(grouped, options);
		result.value_column = value_column;
		result.group_column = group_column;
		return result;
	}

	static core::AnovaResult Compute(const GroupedValues &grouped, const core::AnovaOptions &options = {}) {
		options.Validate();

		const size_t k = grouped.group_count();
		if (k < 2) {
			throw core::InsufficientDataError("one-way ANOVA requires at least 2 groups, found " + std::to_string(k));
		}

		core::AnovaResult result;
		result.alpha = options.alpha;

		size_t n_total = 0;
		double grand_sum = 0.0;
		for (size_t i = 0; i < k; i++) {
			const auto &values = grouped.values[i];
			if (values.size() < 2) {
				throw core::InsufficientDataError("group '" + grouped.names[i] + "' has " +
				                                  std::to_string(values.size()) + " values; at least 2 are required");
			}
			result.groups.push_back(SummarizeGroup(grouped.names[i], values));
			n_total += values.size();
			for (double v : values) {
				grand_sum += v;
			}
		}
		const double grand_mean = grand_sum / static_cast<double>(n_total);

		for (const auto &group : result.groups) {
			const double d = group.mean - grand_mean;
			result.ss_between += static_cast<double>(group.n) * d * d;
			result.ss_within += static_cast<double>(group.n - 1) * group.variance;
		}
		result.ss_total = result.ss_between + result.ss_within;

		result.df_between = k - 1;
		result.df_within = n_total - k;
		result.ms_between = result.ss_between / static_cast<double>(result.df_between);
		result.ms_within = result.ss_within / static_cast<double>(result.df_within);

		if (!(result.ms_within > 0.0)) {
			throw core::DegenerateInputError("all groups are constant; the F statistic is undefined");
		}

		result.f_statistic = result.ms_between / result.ms_within;
		result.p_value = utils::f_pvalue(result.f_statistic, static_cast<double>(result.df_between),
		                                 static_cast<double>(result.df_within));
		result.eta_squared = result.ss_total > 0.0 ? result.ss_between / result.ss_total : 0.0;
		result.levene = LeveneTest::Compute(grouped.values);
		result.tukey = TukeyHSD::Compute(result.groups, result.ms_within, result.df_within, options.alpha,
		                                 &result.tukey_critical);

		result.reject_null = result.p_value < options.alpha;
		result.interpretation = core::DecisionText(result.p_value, options.alpha);
		result.interpretation +=
		    result.reject_null ? ": at least one group mean differs" : ": no significant difference between group means";
		return result;
	}
};

} // namespace hypothesis
} // namespace statkit
