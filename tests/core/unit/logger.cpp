#include <doctest/doctest.h>

#include <faceid/core/logger.hpp>

#include <cstdlib>
#include <optional>
#include <string_view>

namespace {

struct TestLogger {
  static constexpr std::string_view Name() noexcept { return "TEST"; }
};

struct TestLoggerWithConfig {
  static constexpr std::string_view Name() noexcept { return "TEST_CONFIGURED"; }
  static faceid::LoggerConfig Config() noexcept {
    auto config = faceid::LoggerConfig::ConsoleOnly();
    config.level = faceid::LogLevel::kError;
    return config;
  }
};

}  // namespace

TEST_SUITE("faceid::Logger") {
  TEST_CASE("Logger::GetInstance: Default logger basic usage") {
    auto& logger = faceid::Logger::GetInstance();

    CHECK(logger.HasLogger(faceid::kDefaultLogger));
    CHECK_NOTHROW(FACEID_INFO("Info message"));
    CHECK_NOTHROW(FACEID_WARN("Warn message"));
    CHECK_NOTHROW(FACEID_ERROR("Error message"));
    CHECK_NOTHROW(FACEID_INFO("Formatted {}: {}", "number", 42));
    FACEID_DEBUG("Debug message");
    FACEID_TRACE("Trace message");
  }

  TEST_CASE("Logger::AddLogger: Typed logger and level control") {
    auto& logger = faceid::Logger::GetInstance();
    constexpr TestLogger test_logger{};

    logger.AddLogger(test_logger, faceid::LoggerConfig::ConsoleOnly());
    REQUIRE(logger.HasLogger(test_logger));

    logger.SetLevel(test_logger, faceid::LogLevel::kWarn);
    CHECK_EQ(logger.GetLevel(test_logger), faceid::LogLevel::kWarn);
    CHECK_FALSE(logger.ShouldLog(test_logger, faceid::LogLevel::kInfo));
    CHECK(logger.ShouldLog(test_logger, faceid::LogLevel::kError));

    CHECK_NOTHROW(FACEID_INFO_LOGGER(test_logger, "Filtered message"));
    CHECK_NOTHROW(FACEID_WARN_LOGGER(test_logger, "Warn message {}", 1));

    logger.RemoveLogger(test_logger);
    CHECK_FALSE(logger.HasLogger(test_logger));
  }

  TEST_CASE("Logger::AddLogger: Uses the logger's own Config") {
    auto& logger = faceid::Logger::GetInstance();

    logger.AddLogger<TestLoggerWithConfig>();
    REQUIRE(logger.HasLogger<TestLoggerWithConfig>());
    CHECK_EQ(logger.GetLevel<TestLoggerWithConfig>(), faceid::LogLevel::kError);

    logger.RemoveLogger<TestLoggerWithConfig>();
  }

  TEST_CASE("Logger::LogMessage: Unknown logger is rejected") {
    auto& logger = faceid::Logger::GetInstance();
    logger.RemoveLogger<TestLogger>();

    CHECK_FALSE(logger.HasLogger<TestLogger>());
    CHECK_FALSE(logger.ShouldLog(TestLogger{}, faceid::LogLevel::kCritical));
    CHECK_EQ(logger.GetLevel<TestLogger>(), faceid::LogLevel::kTrace);
  }

  TEST_CASE("Logger::SetGlobalLevel: Applies to existing loggers") {
    auto& logger = faceid::Logger::GetInstance();
    const auto previous = logger.GetLevel();
    constexpr TestLogger test_logger{};
    logger.AddLogger(test_logger, faceid::LoggerConfig::ConsoleOnly());

    logger.SetGlobalLevel(faceid::LogLevel::kError);
    CHECK_EQ(logger.GetLevel(), faceid::LogLevel::kError);
    CHECK_EQ(logger.GetLevel(test_logger), faceid::LogLevel::kError);

    logger.SetGlobalLevel(previous);
    logger.RemoveLogger(test_logger);
  }

  TEST_CASE("ParseLogLevel: Level names") {
    CHECK_EQ(faceid::ParseLogLevel("trace"), std::optional(faceid::LogLevel::kTrace));
    CHECK_EQ(faceid::ParseLogLevel("DEBUG"), std::optional(faceid::LogLevel::kDebug));
    CHECK_EQ(faceid::ParseLogLevel("Info"), std::optional(faceid::LogLevel::kInfo));
    CHECK_EQ(faceid::ParseLogLevel("warning"), std::optional(faceid::LogLevel::kWarn));
    CHECK_EQ(faceid::ParseLogLevel("warn"), std::optional(faceid::LogLevel::kWarn));
    CHECK_EQ(faceid::ParseLogLevel("critical"), std::optional(faceid::LogLevel::kCritical));
    CHECK_FALSE(faceid::ParseLogLevel("verbose").has_value());
    CHECK_FALSE(faceid::ParseLogLevel("").has_value());
  }

  TEST_CASE("LogLevelToString: All levels") {
    CHECK_EQ(faceid::LogLevelToString(faceid::LogLevel::kTrace), "TRACE");
    CHECK_EQ(faceid::LogLevelToString(faceid::LogLevel::kDebug), "DEBUG");
    CHECK_EQ(faceid::LogLevelToString(faceid::LogLevel::kInfo), "INFO");
    CHECK_EQ(faceid::LogLevelToString(faceid::LogLevel::kWarn), "WARN");
    CHECK_EQ(faceid::LogLevelToString(faceid::LogLevel::kError), "ERROR");
    CHECK_EQ(faceid::LogLevelToString(faceid::LogLevel::kCritical), "CRITICAL");
  }

  TEST_CASE("LoggerConfig: Presets") {
    const auto console = faceid::LoggerConfig::ConsoleOnly();
    CHECK(console.enable_console);
    CHECK_FALSE(console.enable_file);

    const auto debug = faceid::LoggerConfig::Debug();
    CHECK_EQ(debug.level, faceid::LogLevel::kTrace);
    CHECK_EQ(debug.source_location_level, faceid::LogLevel::kWarn);

    const auto release = faceid::LoggerConfig::Release();
    CHECK_EQ(release.level, faceid::LogLevel::kInfo);
    CHECK_EQ(release.stack_trace_level, faceid::LogLevel::kCritical);
  }

  TEST_CASE("LoggerConfig::FromEnvironment: Level and directory overrides") {
    ::setenv("FACEID_LOG_LEVEL", "error", 1);
    ::setenv("FACEID_LOG_DIR", "faceid_test_logs", 1);

    const auto config = faceid::LoggerConfig::FromEnvironment(faceid::LoggerConfig::Default());
    CHECK_EQ(config.level, faceid::LogLevel::kError);
    CHECK_EQ(config.log_directory, "faceid_test_logs");
    CHECK(config.enable_file);

    SUBCASE("Unknown level keeps the base level") {
      ::setenv("FACEID_LOG_LEVEL", "loud", 1);
      const auto unchanged = faceid::LoggerConfig::FromEnvironment(faceid::LoggerConfig::Release());
      CHECK_EQ(unchanged.level, faceid::LogLevel::kInfo);
    }

    ::unsetenv("FACEID_LOG_LEVEL");
    ::unsetenv("FACEID_LOG_DIR");
  }
}
