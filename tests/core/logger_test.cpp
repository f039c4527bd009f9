#include "core/logging/logger.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <sstream>
#include <string>

using pulsecam::core::logging::LogLevel;
using pulsecam::core::logging::Logger;

TEST_CASE("Logger writes key=value lines with component and fields", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kDebug, out);
  logger.SetComponent("capture");

  logger.Info("using capture device", {{"device", "/dev/video0"}, {"fps", "60.00"}});

  const std::string line = out.str();
  REQUIRE(line.rfind("ts_utc=", 0) == 0U);
  // ts_utc=YYYY-MM-DDTHH:MM:SS.mmmZ
  REQUIRE(line.size() > 31U);
  REQUIRE(line[17] == 'T');
  REQUIRE(line[26] == '.');
  REQUIRE(line[30] == 'Z');
  REQUIRE(line.find(" level=INFO component=\"capture\" msg=\"using capture device\"") !=
          std::string::npos);
  REQUIRE(line.find(" device=\"/dev/video0\" fps=\"60.00\"\n") != std::string::npos);
}

TEST_CASE("Logger drops lines below the minimum level", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kWarn, out);

  logger.Debug("hidden");
  logger.Info("hidden");
  REQUIRE(out.str().empty());

  logger.Warn("shown");
  REQUIRE(out.str().find("level=WARN") != std::string::npos);

  logger.SetMinLevel(LogLevel::kError);
  out.str("");
  logger.Warn("hidden after raise");
  REQUIRE(out.str().empty());
  logger.Error("shown after raise");
  REQUIRE(out.str().find("level=ERROR") != std::string::npos);
}

TEST_CASE("Logger escapes quotes and newlines", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kInfo, out);
  logger.Error("bad \"value\"", {{"error", "line1\nline2"}});

  const std::string line = out.str();
  REQUIRE(line.find("msg=\"bad \\\"value\\\"\"") != std::string::npos);
  REQUIRE(line.find("error=\"line1\\nline2\"") != std::string::npos);
}

TEST_CASE("Log levels parse case-insensitively", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;
  REQUIRE(pulsecam::core::logging::ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(pulsecam::core::logging::ParseLogLevel("warning", level, error));
  REQUIRE(level == LogLevel::kWarn);

  REQUIRE_FALSE(pulsecam::core::logging::ParseLogLevel("verbose", level, error));
  REQUIRE(error.find("debug|info|warn|error") != std::string::npos);
  REQUIRE(level == LogLevel::kWarn);
}

TEST_CASE("Log level can come from the environment", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;

  ::setenv("PULSECAM_LOG_LEVEL", "error", 1);
  REQUIRE(pulsecam::core::logging::LogLevelFromEnvironment(level, error));
  REQUIRE(level == LogLevel::kError);

  ::setenv("PULSECAM_LOG_LEVEL", "loud", 1);
  REQUIRE_FALSE(pulsecam::core::logging::LogLevelFromEnvironment(level, error));
  REQUIRE(error.find("PULSECAM_LOG_LEVEL") != std::string::npos);
  REQUIRE(level == LogLevel::kError);

  ::unsetenv("PULSECAM_LOG_LEVEL");
  REQUIRE_FALSE(pulsecam::core::logging::LogLevelFromEnvironment(level, error));
  REQUIRE(error.empty());
}
