#pragma once

#include "statkit/core/descriptive_result.hpp"
#include "statkit/core/hypothesis_result.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <sstream>
#include <string>
#include <vector>

namespace statkit {
namespace engine {

inline std::vector<double> ToStdVector(const Eigen::VectorXd &values) {
	return std::vector<double>(values.data(), values.data() + values.size());
}

/// min, Q1, median, Q3, max (box chart series layout)
inline std::vector<double> FiveNumbers(const core::GroupSummary &group) {
	return {group.min, group.q1, group.median, group.q3, group.max};
}

inline std::vector<double> FiveNumbers(const core::ColumnSummary &summary) {
	return {summary.min, summary.q1, summary.median, summary.q3, summary.max};
}

/// Fixed-precision number for interpretation lines
inline std::string FormatStat(double value, int precision = 4) {
	std::ostringstream out;
	out.setf(std::ios::fixed);
	out.precision(precision);
	out << value;
	return out.str();
}

inline std::string FormatPValue(double p_value) {
	if (p_value < 1e-4) {
		return "< 0.0001";
	}
	return "= " + FormatStat(p_value);
}

inline std::string FormatPercent(double ratio) {
	return FormatStat(100.0 * ratio, 1) + "%";
}

} // namespace engine
} // namespace statkit
