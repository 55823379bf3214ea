#pragma once

#include <algorithm>
#include <cmath>
#include <numeric>
#include <vector>

namespace statkit {
namespace utils {

/**
 * Elementary sample statistics shared by the analysis modules
 *
 * Callers are responsible for the minimum sample sizes; these helpers do not
 * throw. Quantiles use linear interpolation between order statistics
 * (Hyndman-Fan type 7, the default of R and NumPy).
 */

inline double Mean(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

/// Sample variance with divisor n - 1 (two-pass)
inline double SampleVariance(const std::vector<double> &values, double mean) {
	if (values.size() < 2) {
		return 0.0;
	}
	double ss = 0.0;
	for (double v : values) {
		const double d = v - mean;
		ss += d * d;
	}
	return ss / static_cast<double>(values.size() - 1);
}

inline double SampleVariance(const std::vector<double> &values) {
	return SampleVariance(values, Mean(values));
}

inline std::vector<double> SortedCopy(const std::vector<double> &values) {
	std::vector<double> sorted(values);
	std::sort(sorted.begin(), sorted.end());
	return sorted;
}

/**
 * Quantile of pre-sorted values, type 7
 *
 * h = (n - 1) * p, result = x[floor(h)] + (h - floor(h)) * (x[floor(h) + 1] - x[floor(h)])
 */
inline double QuantileSorted(const std::vector<double> &sorted, double p) {
	if (sorted.empty()) {
		return 0.0;
	}
	if (sorted.size() == 1) {
		return sorted[0];
	}
	const double h = static_cast<double>(sorted.size() - 1) * p;
	const auto lo = static_cast<size_t>(std::floor(h));
	if (lo + 1 >= sorted.size()) {
		return sorted.back();
	}
	const double frac = h - static_cast<double>(lo);
	return sorted[lo] + frac * (sorted[lo + 1] - sorted[lo]);
}

inline double Median(const std::vector<double> &values) {
	return QuantileSorted(SortedCopy(values), 0.5);
}

/**
 * Ranks starting at 1, tied values share the average of their ranks
 */
inline std::vector<double> AverageRanks(const std::vector<double> &values) {
	const size_t n = values.size();
	std::vector<size_t> order(n);
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(), [&values](size_t a, size_t b) { return values[a] < values[b]; });

	std::vector<double> ranks(n, 0.0);
	size_t i = 0;
	while (i < n) {
		size_t j = i;
		while (j + 1 < n && values[order[j + 1]] == values[order[i]]) {
			j++;
		}
		// positions i..j (0-based) share ranks i+1..j+1
		const double rank = 0.5 * static_cast<double>(i + j) + 1.0;
		for (size_t k = i; k <= j; k++) {
			ranks[order[k]] = rank;
		}
		i = j + 1;
	}
	return ranks;
}

/// Central moment sum_i (x_i - mean)^order / n
inline double CentralMoment(const std::vector<double> &values, double mean, int order) {
	if (values.empty()) {
		return 0.0;
	}
	double acc = 0.0;
	for (double v : values) {
		acc += std::pow(v - mean, order);
	}
	return acc / static_cast<double>(values.size());
}

/**
 * Adjusted Fisher-Pearson skewness G1
 *
 * G1 = sqrt(n(n-1)) / (n-2) * m3 / m2^(3/2). Requires n >= 3 and m2 > 0.
 */
inline double AdjustedSkewness(const std::vector<double> &values, double mean) {
	const auto n = static_cast<double>(values.size());
	const double m2 = CentralMoment(values, mean, 2);
	const double m3 = CentralMoment(values, mean, 3);
	const double g1 = m3 / std::pow(m2, 1.5);
	return std::sqrt(n * (n - 1.0)) / (n - 2.0) * g1;
}

/**
 * Sample excess kurtosis G2
 *
 * G2 = (n-1) / ((n-2)(n-3)) * ((n+1) g2 + 6) with g2 = m4 / m2² - 3.
 * Requires n >= 4 and m2 > 0.
 */
inline double ExcessKurtosis(const std::vector<double> &values, double mean) {
	const auto n = static_cast<double>(values.size());
	const double m2 = CentralMoment(values, mean, 2);
	const double m4 = CentralMoment(values, mean, 4);
	const double g2 = m4 / (m2 * m2) - 3.0;
	return (n - 1.0) / ((n - 2.0) * (n - 3.0)) * ((n + 1.0) * g2 + 6.0);
}

} // namespace utils
} // namespace statkit
