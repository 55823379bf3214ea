#pragma once

#include "statkit/core/analysis_options.hpp"
#include "statkit/core/cancellation.hpp"
#include "statkit/core/correlation_result.hpp"
#include "statkit/core/dataset.hpp"
#include "statkit/core/errors.hpp"
#include "statkit/hypothesis/normality_test.hpp"
#include "statkit/utils/distributions.hpp"
#include "statkit/utils/sample_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

namespace statkit {
namespace correlation {

/**
 * Pearson and Spearman correlation matrices
 *
 * Every cell is computed pairwise-complete: only rows where both columns of
 * the pair are observed contribute, so the sample size can differ per cell.
 * Spearman ranks the pairwise-complete values (average rank for ties) and
 * applies the Pearson formula to the ranks.
 *
 * Cell p-values test H0: rho = 0 with t = r * sqrt((n - 2) / (1 - r²)) on
 * n - 2 degrees of freedom.
 *
 * Each column is also checked for normality (Jarque-Bera) and the result
 * recommends Spearman when any column departs from normality.
 */
class Correlation {
public:
	/**
	 * Correlation matrix of the given numeric columns
	 *
	 * @param cancellation Optional token, polled once per matrix row
	 * @throws InvalidConfigError with no columns or a non-numeric column
	 * @throws InsufficientDataError when a column or a pair has fewer than 3 observations
	 * @throws DegenerateInputError when a column is constant over the rows of a pair
	 */
	static core::CorrelationResult Compute(const core::Dataset &dataset, const std::vector<std::string> &columns,
	                                       const core::CorrelationOptions &options = {},
	                                       const core::CancellationToken *cancellation = nullptr);

	/**
	 * Correlation of two fully observed series of equal length
	 *
	 * @throws DegenerateInputError when either series is constant
	 */
	static double Coefficient(const std::vector<double> &x, const std::vector<double> &y,
	                          core::CorrelationMethod method = core::CorrelationMethod::PEARSON);

	/// Two-tailed p-value for a correlation coefficient on n observations
	static double PValue(double r, size_t n);

private:
	static double Pearson(const std::vector<double> &x, const std::vector<double> &y);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double Correlation::Pearson(const std::vector<double> &x, const std::vector<double> &y) {
	const double mean_x = utils::Mean(x);
	const double mean_y = utils::Mean(y);

	double sxx = 0.0;
	double syy = 0.0;
	double sxy = 0.0;
	for (size_t i = 0; i < x.size(); i++) {
		const double dx = x[i] - mean_x;
		const double dy = y[i] - mean_y;
		sxx += dx * dx;
		syy += dy * dy;
		sxy += dx * dy;
	}
	if (!(sxx > 0.0) || !(syy > 0.0)) {
		throw core::DegenerateInputError("correlation is undefined for a constant series");
	}
	const double r = sxy / std::sqrt(sxx * syy);
	return std::max(-1.0, std::min(1.0, r));
}

inline double Correlation::Coefficient(const std::vector<double> &x, const std::vector<double> &y,
                                       core::CorrelationMethod method) {
	if (x.size() != y.size()) {
		throw core::LengthMismatchError("correlation requires series of equal length (got " +
		                                std::to_string(x.size()) + " and " + std::to_string(y.size()) + ")");
	}
	if (method == core::CorrelationMethod::SPEARMAN) {
		return Pearson(utils::AverageRanks(x), utils::AverageRanks(y));
	}
	return Pearson(x, y);
}

inline double Correlation::PValue(double r, size_t n) {
	if (n < 3) {
		return 1.0;
	}
	const double abs_r = std::fabs(r);
	if (abs_r >= 1.0) {
		return 0.0;
	}
	const double df = static_cast<double>(n - 2);
	const double t = r * std::sqrt(df / (1.0 - r * r));
	return utils::student_t_pvalue(t, df);
}

inline core::CorrelationResult Correlation::Compute(const core::Dataset &dataset,
                                                    const std::vector<std::string> &columns,
                                                    const core::CorrelationOptions &options,
                                                    const core::CancellationToken *cancellation) {
	options.Validate();
	if (columns.empty()) {
		throw core::InvalidConfigError("correlation requires at least one column");
	}

	const size_t p = columns.size();
	std::vector<const std::vector<core::NumericCell> *> cells;
	for (const auto &name : columns) {
		const auto &col = dataset.GetColumn(name);
		cells.push_back(&col.NumericValues());

		const auto observed = col.ObservedValues();
		if (observed.size() < 3) {
			throw core::InsufficientDataError("column '" + name + "' has " + std::to_string(observed.size()) +
			                                  " observed values; correlation needs at least 3");
		}
		const auto range = std::minmax_element(observed.begin(), observed.end());
		if (*range.first == *range.second) {
			throw core::DegenerateInputError("column '" + name + "' is constant; correlation is undefined");
		}
	}

	core::CorrelationResult result;
	result.method = options.method;
	result.alpha = options.alpha;
	result.columns = columns;

	for (const auto &name : columns) {
		const auto observed = dataset.GetColumn(name).ObservedValues();
		core::NormalityResult normality;
		if (observed.size() >= hypothesis::NormalityTest::MIN_OBSERVATIONS) {
			normality = hypothesis::NormalityTest::JarqueBera(observed, options.alpha);
		} else {
			normality.n = observed.size();
		}
		normality.column = name;
		if (normality.defined && !normality.is_normal) {
			result.recommended_method = core::CorrelationMethod::SPEARMAN;
		}
		result.normality.push_back(std::move(normality));
	}
	result.coefficients = Eigen::MatrixXd::Identity(static_cast<Eigen::Index>(p), static_cast<Eigen::Index>(p));
	result.p_values = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(p), static_cast<Eigen::Index>(p));
	result.sample_sizes = Eigen::MatrixXi::Zero(static_cast<Eigen::Index>(p), static_cast<Eigen::Index>(p));

	const size_t n_rows = dataset.RowCount();
	for (size_t i = 0; i < p; i++) {
		core::CheckCancelled(cancellation, "correlation matrix");

		const auto ii = static_cast<Eigen::Index>(i);
		result.sample_sizes(ii, ii) = static_cast<int>(dataset.GetColumn(columns[i]).Size() -
		                                               dataset.GetColumn(columns[i]).MissingCount());

		for (size_t j = i + 1; j < p; j++) {
			std::vector<double> x;
			std::vector<double> y;
			for (size_t row = 0; row < n_rows; row++) {
				const auto &a = (*cells[i])[row];
				const auto &b = (*cells[j])[row];
				if (a.has_value() && b.has_value()) {
					x.push_back(*a);
					y.push_back(*b);
				}
			}
			if (x.size() < 3) {
				throw core::InsufficientDataError("columns '" + columns[i] + "' and '" + columns[j] + "' share " +
				                                  std::to_string(x.size()) +
				                                  " complete rows; correlation needs at least 3");
			}

			double r;
			try {
				r = Coefficient(x, y, options.method);
			} catch (const core::DegenerateInputError &) {
				throw core::DegenerateInputError("columns '" + columns[i] + "' and '" + columns[j] +
				                                 "': a column is constant over their complete rows");
			}

			const auto jj = static_cast<Eigen::Index>(j);
			result.coefficients(ii, jj) = r;
			result.coefficients(jj, ii) = r;
			const double p_value = PValue(r, x.size());
			result.p_values(ii, jj) = p_value;
			result.p_values(jj, ii) = p_value;
			result.sample_sizes(ii, jj) = static_cast<int>(x.size());
			result.sample_sizes(jj, ii) = static_cast<int>(x.size());
		}
	}
	return result;
}

} // namespace correlation
} // namespace statkit
