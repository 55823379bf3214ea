#include "utils/options_parser.hpp"
#include "statkit/core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace statkit {
namespace engine {

using core::InvalidConfigError;

namespace {

std::string NormalizeKey(const std::string &text) {
	std::string lower = text;
	for (auto &c : lower) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
		if (c == '-') {
			c = '_';
		}
	}
	return lower;
}

std::string JoinKeys(const std::vector<std::string> &keys) {
	std::string joined;
	for (size_t i = 0; i < keys.size(); i++) {
		if (i > 0) {
			joined += ", ";
		}
		joined += keys[i];
	}
	return joined;
}

/// Case-insensitive, typed view over an OptionMap for one analysis
class OptionReader {
public:
	OptionReader(const OptionMap &options, const std::string &analysis) {
		const auto &valid = OptionsParser::ValidKeys(analysis);
		for (const auto &entry : options) {
			const std::string key = NormalizeKey(entry.first);
			if (std::find(valid.begin(), valid.end(), key) == valid.end()) {
				if (valid.empty()) {
					throw InvalidConfigError("Unknown option: '" + entry.first + "'. " + analysis +
					                         " takes no options");
				}
				throw InvalidConfigError("Unknown option: '" + entry.first + "' for " + analysis +
				                         ". Valid options are: " + JoinKeys(valid));
			}
			if (!values_.emplace(key, &entry.second).second) {
				throw InvalidConfigError("Option '" + key + "' given more than once");
			}
		}
	}

	bool Has(const std::string &key) const {
		return values_.count(key) > 0;
	}

	bool GetBool(const std::string &key, bool fallback) const {
		const OptionValue *value = Find(key);
		if (value == nullptr) {
			return fallback;
		}
		if (const auto *b = std::get_if<bool>(value)) {
			return *b;
		}
		if (const auto *i = std::get_if<int64_t>(value)) {
			if (*i == 0 || *i == 1) {
				return *i == 1;
			}
		}
		TypeError(key, "a boolean", *value);
	}

	double GetDouble(const std::string &key, double fallback) const {
		const OptionValue *value = Find(key);
		if (value == nullptr) {
			return fallback;
		}
		if (const auto *d = std::get_if<double>(value)) {
			return *d;
		}
		if (const auto *i = std::get_if<int64_t>(value)) {
			return static_cast<double>(*i);
		}
		TypeError(key, "a number", *value);
	}

	int64_t GetInteger(const std::string &key, int64_t fallback) const {
		const OptionValue *value = Find(key);
		if (value == nullptr) {
			return fallback;
		}
		if (const auto *i = std::get_if<int64_t>(value)) {
			return *i;
		}
		TypeError(key, "an integer", *value);
	}

	std::string GetString(const std::string &key, const std::string &fallback) const {
		const OptionValue *value = Find(key);
		if (value == nullptr) {
			return fallback;
		}
		if (const auto *s = std::get_if<std::string>(value)) {
			return NormalizeKey(*s);
		}
		TypeError(key, "a string", *value);
	}

	const OptionValue *Find(const std::string &key) const {
		auto it = values_.find(key);
		return it == values_.end() ? nullptr : it->second;
	}

private:
	[[noreturn]] static void TypeError(const std::string &key, const char *expected, const OptionValue &value) {
		throw InvalidConfigError("Option '" + key + "' must be " + expected + ", got " + OptionTypeName(value) +
		                         " " + FormatOptionValue(value));
	}

	std::map<std::string, const OptionValue *> values_;
};

[[noreturn]] void InvalidChoice(const std::string &key, const std::string &got, const char *choices) {
	throw InvalidConfigError("Option '" + key + "' must be one of " + choices + ", got: '" + got + "'");
}

} // namespace

const char *OptionTypeName(const OptionValue &value) {
	switch (value.index()) {
	case 0:
		return "bool";
	case 1:
		return "integer";
	case 2:
		return "double";
	default:
		return "string";
	}
}

std::string FormatOptionValue(const OptionValue &value) {
	std::ostringstream out;
	if (const auto *b = std::get_if<bool>(&value)) {
		out << (*b ? "true" : "false");
	} else if (const auto *i = std::get_if<int64_t>(&value)) {
		out << *i;
	} else if (const auto *d = std::get_if<double>(&value)) {
		out << *d;
	} else {
		out << "'" << std::get<std::string>(value) << "'";
	}
	return out.str();
}

const std::vector<std::string> &OptionsParser::ValidKeys(const std::string &analysis) {
	static const std::map<std::string, std::vector<std::string>> keys = {
	    {"clean", {"policy", "constant", "missing_threshold", "remove_duplicates"}},
	    {"describe", {}},
	    {"ttest", {"variant", "alpha", "confidence_level"}},
	    {"anova", {"alpha"}},
	    {"correlate", {"method", "alpha"}},
	    {"regress", {"intercept", "confidence_level", "alpha", "qr_tolerance"}},
	    {"pca", {"components", "standardize"}},
	    {"kmeans", {"k", "init", "seed", "max_iterations", "tolerance", "standardize"}},
	};
	auto it = keys.find(analysis);
	if (it == keys.end()) {
		throw InvalidConfigError("unknown analysis '" + analysis + "'");
	}
	return it->second;
}

void OptionsParser::ExpectEmpty(const OptionMap &options, const std::string &analysis) {
	OptionReader reader(options, analysis);
}

template <>
core::CleaningOptions OptionsParser::Parse<core::CleaningOptions>(const OptionMap &options) {
	OptionReader reader(options, "clean");
	core::CleaningOptions opts;

	const std::string policy = reader.GetString("policy", "drop_row");
	if (policy == "drop_row") {
		opts.strategy = core::MissingStrategy::DROP_ROW;
	} else if (policy == "drop_column") {
		opts.strategy = core::MissingStrategy::DROP_COLUMN;
	} else if (policy == "impute_mean") {
		opts.strategy = core::MissingStrategy::IMPUTE_MEAN;
	} else if (policy == "impute_median") {
		opts.strategy = core::MissingStrategy::IMPUTE_MEDIAN;
	} else if (policy == "impute_mode") {
		opts.strategy = core::MissingStrategy::IMPUTE_MODE;
	} else if (policy == "impute_constant") {
		opts.strategy = core::MissingStrategy::IMPUTE_CONSTANT;
	} else {
		InvalidChoice("policy", policy,
		              "drop_row, drop_column, impute_mean, impute_median, impute_mode, impute_constant");
	}

	// The constant keeps its type: numbers fill numeric columns, text fills categorical ones
	if (const OptionValue *constant = reader.Find("constant")) {
		if (const auto *s = std::get_if<std::string>(constant)) {
			opts.text_constant = *s;
		} else if (std::holds_alternative<bool>(*constant)) {
			throw InvalidConfigError("Option 'constant' must be a number or a string, got bool");
		} else {
			opts.numeric_constant = reader.GetDouble("constant", 0.0);
		}
		if (opts.strategy != core::MissingStrategy::IMPUTE_CONSTANT) {
			throw InvalidConfigError("Option 'constant' is only valid with policy 'impute_constant'");
		}
	}

	opts.missing_threshold = reader.GetDouble("missing_threshold", opts.missing_threshold);
	opts.remove_duplicates = reader.GetBool("remove_duplicates", opts.remove_duplicates);
	opts.Validate();
	return opts;
}

template <>
core::TTestOptions OptionsParser::Parse<core::TTestOptions>(const OptionMap &options) {
	OptionReader reader(options, "ttest");
	core::TTestOptions opts;

	const std::string variant = reader.GetString("variant", "equal_variance");
	if (variant == "equal_variance") {
		opts.variant = core::TTestVariant::EQUAL_VARIANCE;
	} else if (variant == "welch") {
		opts.variant = core::TTestVariant::WELCH;
	} else if (variant == "paired") {
		opts.variant = core::TTestVariant::PAIRED;
	} else {
		InvalidChoice("variant", variant, "equal_variance, welch, paired");
	}

	opts.alpha = reader.GetDouble("alpha", opts.alpha);
	opts.confidence_level = reader.GetDouble("confidence_level", opts.confidence_level);
	opts.Validate();
	return opts;
}

template <>
core::AnovaOptions OptionsParser::Parse<core::AnovaOptions>(const OptionMap &options) {
	OptionReader reader(options, "anova");
	core::AnovaOptions opts;
	opts.alpha = reader.GetDouble("alpha", opts.alpha);
	opts.Validate();
	return opts;
}

template <>
core::CorrelationOptions OptionsParser::Parse<core::CorrelationOptions>(const OptionMap &options) {
	OptionReader reader(options, "correlate");
	core::CorrelationOptions opts;

	const std::string method = reader.GetString("method", "pearson");
	if (method == "pearson") {
		opts.method = core::CorrelationMethod::PEARSON;
	} else if (method == "spearman") {
		opts.method = core::CorrelationMethod::SPEARMAN;
	} else {
		InvalidChoice("method", method, "pearson, spearman");
	}

	opts.alpha = reader.GetDouble("alpha", opts.alpha);
	opts.Validate();
	return opts;
}

template <>
core::RegressionOptions OptionsParser::Parse<core::RegressionOptions>(const OptionMap &options) {
	OptionReader reader(options, "regress");
	core::RegressionOptions opts;
	opts.intercept = reader.GetBool("intercept", opts.intercept);
	opts.confidence_level = reader.GetDouble("confidence_level", opts.confidence_level);
	opts.alpha = reader.GetDouble("alpha", opts.alpha);
	opts.qr_tolerance = reader.GetDouble("qr_tolerance", opts.qr_tolerance);
	opts.Validate();
	return opts;
}

template <>
core::PcaOptions OptionsParser::Parse<core::PcaOptions>(const OptionMap &options) {
	OptionReader reader(options, "pca");
	core::PcaOptions opts;
	if (reader.Has("components")) {
		const int64_t components = reader.GetInteger("components", 0);
		if (components < 1) {
			throw InvalidConfigError("Option 'components' must be >= 1, got: " + std::to_string(components));
		}
		opts.component_count = static_cast<size_t>(components);
	}
	opts.standardize = reader.GetBool("standardize", opts.standardize);
	return opts;
}

template <>
core::KMeansOptions OptionsParser::Parse<core::KMeansOptions>(const OptionMap &options) {
	OptionReader reader(options, "kmeans");
	core::KMeansOptions opts;

	if (!reader.Has("k")) {
		throw InvalidConfigError("Option 'k' is required for kmeans");
	}
	const int64_t k = reader.GetInteger("k", 0);
	if (k < 1) {
		throw InvalidConfigError("Option 'k' must be >= 1, got: " + std::to_string(k));
	}
	opts.k = static_cast<size_t>(k);

	const std::string init = reader.GetString("init", "farthest_first");
	if (init == "farthest_first") {
		opts.init = core::KMeansInit::FARTHEST_FIRST;
	} else if (init == "random_seeded") {
		opts.init = core::KMeansInit::RANDOM_SEEDED;
	} else {
		InvalidChoice("init", init, "farthest_first, random_seeded");
	}

	const int64_t seed = reader.GetInteger("seed", static_cast<int64_t>(opts.seed));
	if (seed < 0) {
		throw InvalidConfigError("Option 'seed' must be non-negative, got: " + std::to_string(seed));
	}
	opts.seed = static_cast<uint64_t>(seed);

	const int64_t max_iterations = reader.GetInteger("max_iterations", static_cast<int64_t>(opts.max_iterations));
	if (max_iterations < 1) {
		throw InvalidConfigError("Option 'max_iterations' must be positive, got: " + std::to_string(max_iterations));
	}
	opts.max_iterations = static_cast<size_t>(max_iterations);

	opts.tolerance = reader.GetDouble("tolerance", opts.tolerance);
	if (!(opts.tolerance >= 0.0)) {
		throw InvalidConfigError("Option 'tolerance' must be non-negative");
	}
	opts.standardize = reader.GetBool("standardize", opts.standardize);
	return opts;
}

} // namespace engine
} // namespace statkit
