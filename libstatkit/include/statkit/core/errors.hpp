#pragma once

#include <stdexcept>
#include <string>

namespace statkit {
namespace core {

/**
 * Error taxonomy shared by every statkit operation
 *
 * Every analysis either returns a fully populated result or throws exactly one
 * of the exception types below. The kind is also available as an enum so that
 * outer layers (export, UI) can report it without RTTI switches.
 */
enum class ErrorKind {
	INVALID_CONFIG,
	INVALID_GROUP_COUNT,
	LENGTH_MISMATCH,
	INSUFFICIENT_DATA,
	DEGENERATE_INPUT,
	SINGULAR_DESIGN,
	EMPTY_RESULT,
	CANCELLED
};

/// Stable identifier for an error kind (used in exported error records)
inline const char *ErrorKindName(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::INVALID_CONFIG:
		return "invalid_config";
	case ErrorKind::INVALID_GROUP_COUNT:
		return "invalid_group_count";
	case ErrorKind::LENGTH_MISMATCH:
		return "length_mismatch";
	case ErrorKind::INSUFFICIENT_DATA:
		return "insufficient_data";
	case ErrorKind::DEGENERATE_INPUT:
		return "degenerate_input";
	case ErrorKind::SINGULAR_DESIGN:
		return "singular_design";
	case ErrorKind::EMPTY_RESULT:
		return "empty_result";
	case ErrorKind::CANCELLED:
		return "cancelled";
	default:
		return "unknown";
	}
}

/**
 * Base class of all statkit errors
 *
 * Catch this type to handle any engine failure; inspect Kind() to decide how
 * to present it.
 */
class StatkitError : public std::runtime_error {
public:
	StatkitError(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {
	}

	ErrorKind Kind() const noexcept {
		return kind_;
	}

private:
	ErrorKind kind_;
};

/// Malformed or out-of-range request parameters, unknown option keys
class InvalidConfigError : public StatkitError {
public:
	explicit InvalidConfigError(const std::string &message) : StatkitError(ErrorKind::INVALID_CONFIG, message) {
	}
};

/// Grouping column does not produce the number of groups a test requires
class InvalidGroupCountError : public StatkitError {
public:
	explicit InvalidGroupCountError(const std::string &message)
	    : StatkitError(ErrorKind::INVALID_GROUP_COUNT, message) {
	}
};

/// Matched series (paired test) have different lengths
class LengthMismatchError : public StatkitError {
public:
	explicit LengthMismatchError(const std::string &message) : StatkitError(ErrorKind::LENGTH_MISMATCH, message) {
	}
};

/// Not enough non-missing observations for a meaningful result
class InsufficientDataError : public StatkitError {
public:
	explicit InsufficientDataError(const std::string &message)
	    : StatkitError(ErrorKind::INSUFFICIENT_DATA, message) {
	}
};

/// Data present but degenerate (zero variance, undefined statistic)
class DegenerateInputError : public StatkitError {
public:
	explicit DegenerateInputError(const std::string &message) : StatkitError(ErrorKind::DEGENERATE_INPUT, message) {
	}
};

/// Regression design matrix is rank-deficient
class SingularDesignError : public StatkitError {
public:
	explicit SingularDesignError(const std::string &message) : StatkitError(ErrorKind::SINGULAR_DESIGN, message) {
	}
};

/// A cleaning or filtering step left zero usable rows
class EmptyResultError : public StatkitError {
public:
	explicit EmptyResultError(const std::string &message) : StatkitError(ErrorKind::EMPTY_RESULT, message) {
	}
};

/// Cooperative cancellation was honored
class Cancelled : public StatkitError {
public:
	explicit Cancelled(const std::string &message = "operation cancelled")
	    : StatkitError(ErrorKind::CANCELLED, message) {
	}
};

} // namespace core
} // namespace statkit
