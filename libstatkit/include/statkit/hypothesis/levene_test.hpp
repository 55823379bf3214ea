#pragma once

#include "statkit/core/hypothesis_result.hpp"
#include "statkit/utils/distributions.hpp"
#include "statkit/utils/sample_statistics.hpp"
#include <cmath>
#include <vector>

namespace statkit {
namespace hypothesis {

/**
 * Levene's test for equality of variances, median-centred (Brown-Forsythe)
 *
 * With z_ij = |x_ij - median_i|:
 *
 *   W = (N - k) / (k - 1) * Σ n_i (z̄_i - z̄)² / Σ Σ (z_ij - z̄_i)²
 *
 * W is compared against F(k - 1, N - k).
 */
class LeveneTest {
public:
	/**
	 * @param groups At least two groups; N must exceed k
	 * @return Result with defined = false when the statistic is undefined
	 *         (fewer than 2 groups, N <= k, or zero spread of the deviations)
	 */
	static core::LeveneResult Compute(const std::vector<std::vector<double>> &groups) {
		core::LeveneResult result;

		const size_t k = groups.size();
		size_t n_total = 0;
		for (const auto &group : groups) {
			n_total += group.size();
		}
		if (k < 2 || n_total <= k) {
			return result;
		}
		result.df_between = k - 1;
		result.df_within = n_total - k;

		std::vector<std::vector<double>> deviations(k);
		std::vector<double> group_means(k, 0.0);
		double grand_sum = 0.0;
		for (size_t i = 0; i < k; i++) {
			if (groups[i].empty()) {
				return result;
			}
			const double median = utils::Median(groups[i]);
			deviations[i].reserve(groups[i].size());
			for (double v : groups[i]) {
				deviations[i].push_back(std::fabs(v - median));
			}
			group_means[i] = utils::Mean(deviations[i]);
			grand_sum += group_means[i] * static_cast<double>(groups[i].size());
		}
		const double grand_mean = grand_sum / static_cast<double>(n_total);

		double between = 0.0;
		double within = 0.0;
		for (size_t i = 0; i < k; i++) {
			const double d = group_means[i] - grand_mean;
			between += static_cast<double>(deviations[i].size()) * d * d;
			for (double z : deviations[i]) {
				within += (z - group_means[i]) * (z - group_means[i]);
			}
		}
		if (within <= 0.0) {
			return result;
		}

		result.statistic = (static_cast<double>(result.df_within) / static_cast<double>(result.df_between)) *
		                   (between / within);
		result.p_value = utils::f_pvalue(result.statistic, static_cast<double>(result.df_between),
		                                 static_cast<double>(result.df_within));
		result.defined = true;
		return result;
	}
};

} // namespace hypothesis
} // namespace statkit
