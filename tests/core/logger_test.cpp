#include "core/logging/logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using cupkit::core::logging::LogLevel;
using cupkit::core::logging::Logger;

TEST_CASE("Log levels parse case-insensitively", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;
  REQUIRE(cupkit::core::logging::ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(cupkit::core::logging::ParseLogLevel("Warning", level, error));
  REQUIRE(level == LogLevel::kWarn);

  REQUIRE_FALSE(cupkit::core::logging::ParseLogLevel("", level, error));
  REQUIRE(error.find("missing value") != std::string::npos);
  REQUIRE_FALSE(cupkit::core::logging::ParseLogLevel("trace", level, error));
  REQUIRE(error == "invalid --log-level 'trace' (expected debug|info|warn|error)");
}

TEST_CASE("Lines carry operation, context and fields in order", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kInfo, out);
  logger.SetOperation("rename");
  logger.SetContext("root", "/data");
  logger.SetContext("root", "/srv/data");

  logger.Debug("hidden");
  logger.Warn("source has no group", {{"path", "groups/\"odd\".json"}});

  const std::string text = out.str();
  REQUIRE(text.rfind("ts_utc=", 0) == 0U);
  REQUIRE(text.find("hidden") == std::string::npos);
  REQUIRE(text.find(" level=WARN op=\"rename\" msg=\"source has no group\" root=\"/srv/data\" "
                    "path=\"groups/\\\"odd\\\".json\"\n") != std::string::npos);
  REQUIRE(text.find("root=\"/data\"") == std::string::npos);
}

TEST_CASE("The null logger swallows every line", "[core][logging]") {
  Logger& logger = cupkit::core::logging::NullLogger();
  REQUIRE(logger.MinLevel() == LogLevel::kError);
  logger.Error("dropped", {{"k", "v"}});
  REQUIRE_FALSE(logger.ShouldLog(LogLevel::kWarn));
}
