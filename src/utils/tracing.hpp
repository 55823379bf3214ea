#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>

namespace statkit {
namespace engine {

/**
 * @brief Process-wide logging for the analysis engine
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error, none)
 * - Lines formatted as "[timestamp] [statkit/LEVEL] file:line - message"
 * - Timing measurements logged at DEBUG
 * - Environment variable control
 * - Serialised output, so concurrent analyses never interleave lines
 *
 * Control via environment variable: STATKIT_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 * Default: warn in release builds (NDEBUG), info otherwise
 *
 * Example usage:
 *   STATKIT_DEBUG("Clustering " << rows << " rows");
 *   STATKIT_TIMING_START();
 *   // ... do work ...
 *   STATKIT_TIMING_END("k-means");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads STATKIT_LOG_LEVEL once per process. Called lazily by every other
	 * member, so explicit calls are optional.
	 */
	static void Initialize();

	/**
	 * @brief Set global log level (overrides the environment)
	 */
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Check if a message at given level should be logged
	 */
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @param level Receives the parsed level
	 * @return false for an unrecognised name (level is left untouched)
	 */
	static bool ParseLevel(const std::string &name, LogLevel &level);

	/**
	 * @brief Redirect output (nullptr restores stderr)
	 *
	 * The stream must outlive all logging through it.
	 */
	static void SetOutput(std::ostream *out);

	/**
	 * @brief Log a message with location information
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	/**
	 * @brief Log a message without location information
	 */
	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	/**
	 * @brief Current local time as "YYYY-MM-DD HH:MM:SS.mmm"
	 */
	static std::string GetTimestamp();

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log duration at DEBUG
	 *
	 * @param handle Handle from TimingStart()
	 * @param operation_name Human-readable operation name
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static LogLevel DefaultLevel();
	static void Write(LogLevel level, const std::string &location, const std::string &message);

	static std::atomic<LogLevel> current_level_;
	static std::atomic<std::ostream *> output_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define STATKIT_LOG_AT(level, msg)                                                                                     \
	do {                                                                                                               \
		if (statkit::engine::Tracer::ShouldLog(level)) {                                                               \
			std::ostringstream statkit_log_oss;                                                                        \
			statkit_log_oss << msg;                                                                                    \
			statkit::engine::Tracer::Log(level, __FILE__, __LINE__, statkit_log_oss.str());                            \
		}                                                                                                              \
	} while (0)

/**
 * @brief Trace-level logging with stream syntax
 *
 * Usage: STATKIT_TRACE(message << stream << contents)
 */
#define STATKIT_TRACE(msg) STATKIT_LOG_AT(statkit::engine::LogLevel::TRACE, msg)

#define STATKIT_DEBUG(msg) STATKIT_LOG_AT(statkit::engine::LogLevel::DBG, msg)

#define STATKIT_INFO(msg) STATKIT_LOG_AT(statkit::engine::LogLevel::INFO, msg)

#define STATKIT_WARN(msg) STATKIT_LOG_AT(statkit::engine::LogLevel::WARN, msg)

#define STATKIT_ERROR(msg) STATKIT_LOG_AT(statkit::engine::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   STATKIT_TIMING_START();
 *   // ... do work ...
 *   STATKIT_TIMING_END("Operation name");
 */
#define STATKIT_TIMING_START() const uint64_t statkit_timing_handle = statkit::engine::Tracer::TimingStart()

#define STATKIT_TIMING_END(operation_name) statkit::engine::Tracer::TimingEnd(statkit_timing_handle, operation_name)

} // namespace engine
} // namespace statkit
