#pragma once

#include "statkit/core/analysis_options.hpp"
#include <sstream>
#include <string>
#include <vector>

namespace statkit {
namespace core {

/// Per-group diagnostics reported by the hypothesis tests (box-plot input)
struct GroupSummary {
	std::string name;
	size_t n = 0;
	double mean = 0.0;

	/// Sample variance (divisor n - 1)
	double variance = 0.0;
	double std_dev = 0.0;

	double min = 0.0;
	double q1 = 0.0;
	double median = 0.0;
	double q3 = 0.0;
	double max = 0.0;
};

/// Levene's test for homogeneity of variance (median-centred)
struct LeveneResult {
	double statistic = 0.0;
	double p_value = 1.0;
	size_t df_between = 0;
	size_t df_within = 0;

	/// True when the statistic could be computed (non-zero spread of deviations)
	bool defined = false;
};

/// One Tukey HSD pairwise comparison (Tukey-Kramer for unequal group sizes)
struct TukeyComparison {
	std::string group_a;
	std::string group_b;

	/// Mean of group_b minus mean of group_a
	double mean_difference = 0.0;

	/// sqrt(MS_within / 2 · (1/n_a + 1/n_b))
	double std_error = 0.0;

	/// Studentized range statistic |difference| / std_error
	double q_statistic = 0.0;

	/// Family-wise adjusted p-value from the studentized range distribution
	double p_adjusted = 1.0;

	/// Simultaneous (1 - alpha) confidence interval of the difference
	double ci_lower = 0.0;
	double ci_upper = 0.0;

	bool reject = false;
};

/// Jarque-Bera normality test on one sample
struct NormalityResult {
	std::string column;
	size_t n = 0;

	/// Moment skewness m3 / m2^1.5
	double skewness = 0.0;

	/// Moment kurtosis m4 / m2² (3 for a normal sample)
	double kurtosis = 0.0;

	/// JB = n/6 · (S² + (K - 3)² / 4), chi-square with 2 degrees of freedom
	double statistic = 0.0;
	double p_value = 1.0;

	/// p_value > alpha
	bool is_normal = true;

	/// False when the sample was too small or constant to test
	bool defined = false;
};

struct TTestResult {
	TTestVariant variant = TTestVariant::EQUAL_VARIANCE;

	std::string value_column;

	/// Grouping column, or the second measurement column for column-paired tests
	std::string group_column;

	/// Two groups (independent) or two measurements (paired), in first-appearance order
	std::vector<GroupSummary> groups;

	double statistic = 0.0;
	double degrees_of_freedom = 0.0;
	double p_value = 1.0;

	/// Mean of the first group minus mean of the second (paired: mean of differences)
	double mean_difference = 0.0;
	double std_error = 0.0;

	double confidence_level = 0.95;
	double ci_lower = 0.0;
	double ci_upper = 0.0;

	/// Cohen's d (pooled SD for independent variants, SD of differences for paired)
	double cohens_d = 0.0;

	/// Only meaningful for the independent variants
	LeveneResult levene;

	double alpha = 0.05;
	bool reject_null = false;

	std::string interpretation;
};

struct AnovaResult {
	std::string value_column;
	std::string group_column;

	std::vector<GroupSummary> groups;

	double ss_between = 0.0;
	double ss_within = 0.0;
	double ss_total = 0.0;

	size_t df_between = 0;
	size_t df_within = 0;

	double ms_between = 0.0;
	double ms_within = 0.0;

	double f_statistic = 0.0;
	double p_value = 1.0;

	/// SS_between / SS_total
	double eta_squared = 0.0;

	LeveneResult levene;

	/// Tukey HSD for every pair of groups, in group order (a before b)
	std::vector<TukeyComparison> tukey;

	/// Studentized range critical value used for the Tukey intervals
	double tukey_critical = 0.0;

	double alpha = 0.05;
	bool reject_null = false;

	std::string interpretation;
};

/// "reject H0 (p = 0.0213 < alpha = 0.05)" style decision line
inline std::string DecisionText(double p_value, double alpha) {
	std::ostringstream out;
	out.precision(4);
	if (p_value < alpha) {
		out << "reject H0 (p = " << p_value << " < alpha = " << alpha << ")";
	} else {
		out << "fail to reject H0 (p = " << p_value << " >= alpha = " << alpha << ")";
	}
	return out.str();
}

} // namespace core
} // namespace statkit
