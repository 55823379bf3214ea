#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "utils/tracing.hpp"

#include <sstream>

using namespace statkit::engine;
using Catch::Matchers::ContainsSubstring;

namespace {

/// Captures tracer output for the lifetime of the scope
class CapturedLog {
public:
	explicit CapturedLog(LogLevel level) : previous_(Tracer::GetLogLevel()) {
		Tracer::SetOutput(&stream_);
		Tracer::SetLogLevel(level);
	}

	~CapturedLog() {
		Tracer::SetOutput(nullptr);
		Tracer::SetLogLevel(previous_);
	}

	std::string Text() const {
		return stream_.str();
	}

private:
	std::ostringstream stream_;
	LogLevel previous_;
};

} // namespace

TEST_CASE("Tracer: Level names", "[engine][tracing]") {
	REQUIRE(Tracer::GetLevelName(LogLevel::TRACE) == "TRACE");
	REQUIRE(Tracer::GetLevelName(LogLevel::DBG) == "DEBUG");
	REQUIRE(Tracer::GetLevelName(LogLevel::WARN) == "WARN");
	REQUIRE(Tracer::GetLevelName(LogLevel::ERR) == "ERROR");

	LogLevel level = LogLevel::NONE;
	REQUIRE(Tracer::ParseLevel("Debug", level));
	REQUIRE(level == LogLevel::DBG);
	REQUIRE(Tracer::ParseLevel("error", level));
	REQUIRE(level == LogLevel::ERR);

	// unrecognised names leave the level untouched
	REQUIRE_FALSE(Tracer::ParseLevel("verbose", level));
	REQUIRE(level == LogLevel::ERR);
}

TEST_CASE("Tracer: Threshold filtering", "[engine][tracing]") {
	CapturedLog log(LogLevel::WARN);

	REQUIRE_FALSE(Tracer::ShouldLog(LogLevel::INFO));
	REQUIRE(Tracer::ShouldLog(LogLevel::WARN));
	REQUIRE(Tracer::ShouldLog(LogLevel::ERR));
	REQUIRE_FALSE(Tracer::ShouldLog(LogLevel::NONE));

	STATKIT_INFO("hidden " << 1);
	STATKIT_WARN("shown " << 2);

	const std::string text = log.Text();
	REQUIRE(text.find("hidden") == std::string::npos);
	REQUIRE_THAT(text, ContainsSubstring("[statkit/WARN] test_tracing.cpp:"));
	REQUIRE_THAT(text, ContainsSubstring(" - shown 2"));
}

TEST_CASE("Tracer: Level none silences everything", "[engine][tracing]") {
	CapturedLog log(LogLevel::NONE);
	STATKIT_ERROR("not written");
	Tracer::LogDirect(LogLevel::ERR, "not written either");
	REQUIRE(log.Text().empty());
}

TEST_CASE("Tracer: Direct lines and timing", "[engine][tracing]") {
	CapturedLog log(LogLevel::TRACE);

	Tracer::LogDirect(LogLevel::INFO, "plain message");
	STATKIT_TIMING_START();
	const double ms = STATKIT_TIMING_END("unit of work");
	REQUIRE(ms >= 0.0);

	const std::string text = log.Text();
	REQUIRE_THAT(text, ContainsSubstring("[statkit/INFO] plain message"));
	REQUIRE_THAT(text, ContainsSubstring("[statkit/DEBUG] unit of work completed in "));
	REQUIRE_THAT(text, ContainsSubstring(" ms"));

	// "[YYYY-MM-DD HH:MM:SS.mmm]" prefix
	REQUIRE(text[0] == '[');
	REQUIRE(text[24] == ']');
	REQUIRE(Tracer::GetTimestamp().size() == 23);
}
