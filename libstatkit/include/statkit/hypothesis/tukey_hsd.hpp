#pragma once

#include "statkit/core/hypothesis_result.hpp"
#include "statkit/utils/distributions.hpp"
#include <cmath>
#include <vector>

namespace statkit {
namespace hypothesis {

/**
 * Tukey's honestly significant difference test (Tukey-Kramer form)
 *
 * For groups a and b with ANOVA error mean square MS_within on df_within
 * degrees of freedom:
 *
 *   SE = sqrt(MS_within / 2 * (1/n_a + 1/n_b))
 *   q  = |x̄_b - x̄_a| / SE  ~ studentized range(k, df_within)
 *
 * The simultaneous interval is (x̄_b - x̄_a) ± q_crit * SE with q_crit the
 * upper alpha point of the studentized range.
 */
class TukeyHSD {
public:
	/**
	 * @param groups Group summaries from the ANOVA, at least 2
	 * @param ms_within Error mean square (> 0)
	 * @param df_within Error degrees of freedom (>= 2)
	 * @param critical Receives the studentized range critical value when non-null
	 */
	static std::vector<core::TukeyComparison> Compute(const std::vector<core::GroupSummary> &groups,
	                                                  double ms_within, size_t df_within, double alpha,
	                                                  double *critical = nullptr) {
		std::vector<core::TukeyComparison> comparisons;
		const size_t k = groups.size();
		if (k < 2 || df_within < 2 || !(ms_within > 0.0)) {
			return comparisons;
		}
		const auto k_d = static_cast<double>(k);
		const auto df = static_cast<double>(df_within);
		const double q_crit = utils::studentized_range_critical(alpha, k_d, df);
		if (critical) {
			*critical = q_crit;
		}

		for (size_t a = 0; a < k; a++) {
			for (size_t b = a + 1; b < k; b++) {
				core::TukeyComparison cmp;
				cmp.group_a = groups[a].name;
				cmp.group_b = groups[b].name;
				cmp.mean_difference = groups[b].mean - groups[a].mean;
				const auto n_a = static_cast<double>(groups[a].n);
				const auto n_b = static_cast<double>(groups[b].n);
				cmp.std_error = std::sqrt(ms_within / 2.0 * (1.0 / n_a + 1.0 / n_b));
				cmp.q_statistic = std::fabs(cmp.mean_difference) / cmp.std_error;
				cmp.p_adjusted = utils::studentized_range_pvalue(cmp.q_statistic, k_d, df);
				cmp.ci_lower = cmp.mean_difference - q_crit * cmp.std_error;
				cmp.ci_upper = cmp.mean_difference + q_crit * cmp.std_error;
				cmp.reject = cmp.p_adjusted < alpha;
				comparisons.push_back(cmp);
			}
		}
		return comparisons;
	}
};

} // namespace hypothesis
} // namespace statkit
