#include "utils/tracing.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <mutex>

namespace statkit {
namespace engine {

std::atomic<LogLevel> Tracer::current_level_ {LogLevel::NONE};
std::atomic<std::ostream *> Tracer::output_ {nullptr};

// Guards initialization and every write to the output stream
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::mutex g_tracer_mutex;
static std::once_flag g_tracer_init;

LogLevel Tracer::DefaultLevel() {
	// Release builds: suppress INFO messages
#ifdef NDEBUG
	return LogLevel::WARN;
#else
	return LogLevel::INFO;
#endif
}

void Tracer::Initialize() {
	std::call_once(g_tracer_init, []() {
		LogLevel level = DefaultLevel();
		const char *env_level = std::getenv("STATKIT_LOG_LEVEL");
		if (env_level != nullptr) {
			// Unrecognised values keep the build default
			ParseLevel(env_level, level);
		}
		current_level_.store(level);
	});
}

bool Tracer::ParseLevel(const std::string &name, LogLevel &level) {
	std::string lower = name;
	for (auto &c : lower) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (lower == "trace") {
		level = LogLevel::TRACE;
	} else if (lower == "debug") {
		level = LogLevel::DBG;
	} else if (lower == "info") {
		level = LogLevel::INFO;
	} else if (lower == "warn") {
		level = LogLevel::WARN;
	} else if (lower == "error") {
		level = LogLevel::ERR;
	} else if (lower == "none") {
		level = LogLevel::NONE;
	} else {
		return false;
	}
	return true;
}

void Tracer::SetLogLevel(LogLevel level) {
	Initialize();
	current_level_.store(level);
}

LogLevel Tracer::GetLogLevel() {
	Initialize();
	return current_level_.load();
}

bool Tracer::ShouldLog(LogLevel level) {
	if (level == LogLevel::NONE) {
		return false;
	}
	return level >= GetLogLevel();
}

void Tracer::SetOutput(std::ostream *out) {
	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	output_.store(out);
}

std::string Tracer::GetLevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	default:
		return "UNKNOWN";
	}
}

std::string Tracer::GetTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::tm local {};
	localtime_r(&time, &local);

	std::ostringstream oss;
	oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
	return oss.str();
}

void Tracer::Write(LogLevel level, const std::string &location, const std::string &message) {
	const std::string timestamp = GetTimestamp();
	const std::string level_name = GetLevelName(level);

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::ostream *out = output_.load();
	std::ostream &stream = out != nullptr ? *out : std::cerr;
	stream << "[" << timestamp << "] [statkit/" << level_name << "] " << location << message << '\n';
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	// Extract filename from full path
	size_t last_slash = file.find_last_of("/\\");
	std::string filename = (last_slash == std::string::npos) ? file : file.substr(last_slash + 1);

	Write(level, filename + ":" + std::to_string(line) + " - ", message);
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}
	Write(level, "", message);
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
	                                 std::chrono::steady_clock::now().time_since_epoch())
	                                 .count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	const uint64_t end_ns = TimingStart();
	const uint64_t duration_ns = end_ns - handle;
	const double duration_ms = static_cast<double>(duration_ns) / 1000000.0;

	if (ShouldLog(LogLevel::DBG)) {
		std::ostringstream oss;
		oss << std::fixed << std::setprecision(2);
		oss << operation_name << " completed in " << duration_ms << " ms";
		LogDirect(LogLevel::DBG, oss.str());
	}

	return duration_ms;
}

} // namespace engine
} // namespace statkit
