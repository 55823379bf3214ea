#pragma once

#include <string>
#include <utility>
#include <vector>

namespace statkit {
namespace engine {

enum class ChartKind { BOX, SCATTER, BAR, CORRELATION_HEATMAP, LINE };

inline const char *ChartKindName(ChartKind kind) {
	switch (kind) {
	case ChartKind::BOX:
		return "box";
	case ChartKind::SCATTER:
		return "scatter";
	case ChartKind::BAR:
		return "bar";
	case ChartKind::CORRELATION_HEATMAP:
		return "correlation-heatmap";
	case ChartKind::LINE:
		return "line";
	default:
		return "unknown";
	}
}

/**
 * A named, ordered numeric sequence
 *
 * When x is empty the values are plotted by position (or against the chart's
 * categories); otherwise x and values have equal length and form (x, y) pairs.
 */
struct ChartSeries {
	std::string name;
	std::vector<double> values;
	std::vector<double> x;
};

/**
 * Chart-ready data handed to the rendering collaborator
 *
 * Holds series and labels only, never pixels. Box charts carry one series per
 * box with the five values min, Q1, median, Q3, max.
 */
struct ChartDescriptor {
	ChartKind kind = ChartKind::BAR;
	std::string title;
	std::string x_label;
	std::string y_label;

	/// Series in drawing order
	std::vector<ChartSeries> series;

	/// Category labels for box, bar and heatmap charts
	std::vector<std::string> categories;

	ChartDescriptor() = default;

	ChartDescriptor(ChartKind kind_, std::string title_, std::string x_label_ = "", std::string y_label_ = "")
	    : kind(kind_), title(std::move(title_)), x_label(std::move(x_label_)), y_label(std::move(y_label_)) {
	}

	ChartDescriptor &AddSeries(std::string name, std::vector<double> values) {
		series.push_back({std::move(name), std::move(values), {}});
		return *this;
	}

	ChartDescriptor &AddPoints(std::string name, std::vector<double> x_values, std::vector<double> y_values) {
		series.push_back({std::move(name), std::move(y_values), std::move(x_values)});
		return *this;
	}
};

} // namespace engine
} // namespace statkit
