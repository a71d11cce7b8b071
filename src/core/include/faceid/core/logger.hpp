#pragma once

#include <faceid/core/pch.hpp>

#include <faceid/core/core.hpp>

#include <ctti/type_id.hpp>

#include <QFile>
#include <QMutex>
#include <QTextStream>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace faceid {

/**
 * @brief Log severity levels.
 */
enum class LogLevel : uint8_t {
  kTrace = 0,
  kDebug = 1,
  kInfo = 2,
  kWarn = 3,
  kError = 4,
  kCritical = 5,
};

/**
 * @brief Converts LogLevel to a human-readable string.
 * @param level The log level to convert.
 * @return A string view representing the log level.
 */
[[nodiscard]] constexpr std::string_view LogLevelToString(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::kTrace:
      return "TRACE";
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kCritical:
      return "CRITICAL";
    default:
      return "UNKNOWN";
  }
}

/**
 * @brief Parses a level name as written in FACEID_LOG_LEVEL.
 * @details Accepts the names produced by LogLevelToString in any letter case, plus "warning".
 * @param name Level name
 * @return Parsed level or std::nullopt for unknown names
 */
[[nodiscard]] std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept;

/**
 * @brief Configuration for logger behavior and output.
 */
struct LoggerConfig {
  std::string log_directory;                                ///< Log output directory path (empty = no file output).
  std::string file_name_pattern = "{name}_{timestamp}.log";  ///< Pattern for log file names.

  LogLevel level = LogLevel::kInfo;             ///< Minimum level a new logger accepts.
  LogLevel auto_flush_level = LogLevel::kWarn;  ///< Minimum log level to flush automatically.

  bool enable_console = true;  ///< Enable console output.
  bool enable_file = false;    ///< Enable file output.
  bool truncate_files = true;  ///< Enable truncation of existing log files.

  LogLevel source_location_level = LogLevel::kError;  ///< Minimum level to include source location.
  LogLevel stack_trace_level = LogLevel::kCritical;   ///< Minimum level to include stack trace.

  [[nodiscard]] static LoggerConfig Default() noexcept { return {}; }

  [[nodiscard]] static LoggerConfig ConsoleOnly() noexcept {
    LoggerConfig config;
    config.enable_console = true;
    config.enable_file = false;
    return config;
  }

  /**
   * @brief Creates configuration optimized for debug builds.
   * @return LoggerConfig instance accepting every level
   */
  [[nodiscard]] static LoggerConfig Debug() noexcept {
    LoggerConfig config;
    config.level = LogLevel::kTrace;
    config.source_location_level = LogLevel::kWarn;
    return config;
  }

  [[nodiscard]] static LoggerConfig Release() noexcept {
    LoggerConfig config;
    config.level = LogLevel::kInfo;
    return config;
  }

  /**
   * @brief Applies FACEID_LOG_LEVEL and FACEID_LOG_DIR on top of a base configuration.
   * @details A non-empty FACEID_LOG_DIR enables file output into that directory.
   * Unknown level names are ignored.
   * @param base Configuration to start from
   * @return Configuration with environment overrides applied
   */
  [[nodiscard]] static LoggerConfig FromEnvironment(LoggerConfig base) noexcept;
};

/**
 * @brief Type alias for logger type IDs.
 */
using LoggerId = size_t;

/**
 * @brief Trait to identify valid logger types.
 * @details A valid logger type must be an empty struct or class with a Name() function.
 * @tparam T Type to check
 */
template <typename T>
concept LoggerTrait = std::is_empty_v<std::remove_cvref_t<T>> && requires {
  { T::Name() } -> std::same_as<std::string_view>;
};

/**
 * @brief Trait to identify loggers with custom configuration.
 * @tparam T Type to check
 */
template <typename T>
concept LoggerWithConfigTrait = LoggerTrait<T> && requires {
  { T::Config() } -> std::same_as<LoggerConfig>;
};

template <LoggerTrait T>
constexpr LoggerId LoggerIdOf() noexcept {
  return ctti::type_index_of<T>().hash();
}

template <LoggerTrait T>
constexpr std::string_view LoggerNameOf() noexcept {
  return T::Name();
}

/**
 * @brief Default logger type.
 */
struct DefaultLogger {
  static constexpr std::string_view Name() noexcept { return "APP"; }

  static LoggerConfig Config() noexcept {
#if defined(FACEID_RELEASE_MODE)
    return LoggerConfig::FromEnvironment(LoggerConfig::Release());
#else
    return LoggerConfig::FromEnvironment(LoggerConfig::Debug());
#endif
  }
};

inline constexpr DefaultLogger kDefaultLogger{};

namespace details {

/**
 * @brief Extracts the file name from a given path.
 * @param path The full file path.
 * @return The file name portion of the path.
 */
[[nodiscard]] constexpr std::string_view GetFileName(std::string_view path) noexcept {
  const size_t last_slash = path.find_last_of("/\\");
  return (last_slash != std::string_view::npos) ? path.substr(last_slash + 1) : path;
}

}  // namespace details

/**
 * @brief Centralized logging system with configurable output and formatting.
 * @details Uses Qt for file I/O and console output. Typed loggers are registered
 * lazily on first use with the default configuration unless they provide their own.
 * @note Thread-safe.
 */
class Logger {
public:
  Logger(const Logger&) = delete;
  Logger(Logger&&) = delete;
  ~Logger() noexcept = default;

  Logger& operator=(const Logger&) = delete;
  Logger& operator=(Logger&&) = delete;

  /**
   * @brief Adds a logger with the specified type and configuration.
   * @details Does nothing if the logger is already registered.
   * @tparam T Logger type
   * @param logger Logger type instance
   * @param config Configuration for the logger
   */
  template <LoggerTrait T>
  void AddLogger(T /*logger*/, const LoggerConfig& config) noexcept {
    AddLoggerImpl(LoggerIdOf<T>(), LoggerNameOf<T>(), config);
  }

  /**
   * @brief Adds a logger using its own Config() or the current default configuration.
   * @tparam T Logger type
   */
  template <LoggerTrait T>
  void AddLogger(T logger = {}) noexcept {
    if constexpr (LoggerWithConfigTrait<T>) {
      AddLogger(logger, T::Config());
    } else {
      AddLogger(logger, GetDefaultConfig());
    }
  }

  /**
   * @brief Removes a logger with the given type.
   * @note Cannot remove the default logger
   * @tparam T Logger type
   */
  template <LoggerTrait T>
  void RemoveLogger(T /*logger*/ = {}) noexcept {
    if constexpr (!std::same_as<T, DefaultLogger>) {
      RemoveLoggerImpl(LoggerIdOf<T>());
    }
  }

  /**
   * @brief Flushes all registered loggers.
   */
  void FlushAll() noexcept;

  /**
   * @brief Logs a string message with typed logger.
   * @tparam T Logger type
   * @param logger Logger type instance
   * @param level Log severity level
   * @param loc Source location where the log was triggered
   * @param message Message to log
   */
  template <LoggerTrait T>
  void LogMessage(T logger, LogLevel level, const std::source_location& loc, std::string_view message) noexcept {
    if (!LogMessageImpl(LoggerIdOf<T>(), level, loc, message)) {
      AddLogger(logger);
      LogMessageImpl(LoggerIdOf<T>(), level, loc, message);
    }
  }

  template <LoggerTrait T, typename... Args>
    requires(sizeof...(Args) > 0)
  void LogMessage(T logger, LogLevel level, const std::source_location& loc, std::format_string<Args...> fmt,
                  Args&&... args) noexcept {
    try {
      const std::string message = std::format(fmt, std::forward<Args>(args)...);
      LogMessage(logger, level, loc, message);
    } catch (const std::exception& e) {
      LogMessage(logger, LogLevel::kError, loc, e.what());
    }
  }

  void LogMessage(LogLevel level, const std::source_location& loc, std::string_view message) noexcept {
    LogMessageImpl(LoggerIdOf<DefaultLogger>(), level, loc, message);
  }

  template <typename... Args>
    requires(sizeof...(Args) > 0)
  void LogMessage(LogLevel level, const std::source_location& loc, std::format_string<Args...> fmt,
                  Args&&... args) noexcept {
    LogMessage(kDefaultLogger, level, loc, fmt, std::forward<Args>(args)...);
  }

  /**
   * @brief Logs assertion failure with the default logger.
   * @param condition The failed condition as a string
   * @param loc Source location where the assertion failed
   * @param message Additional message describing the failure
   */
  void LogAssertionFailure(std::string_view condition, const std::source_location& loc,
                           std::string_view message) noexcept;

  /**
   * @brief Sets the global default configuration for new loggers.
   * @param config The configuration to use as default
   */
  void SetDefaultConfig(const LoggerConfig& config) noexcept;

  template <LoggerTrait T>
  void SetLevel(T /*logger*/, LogLevel level) noexcept {
    SetLevelImpl(LoggerIdOf<T>(), level);
  }

  void SetLevel(LogLevel level) noexcept { SetLevelImpl(LoggerIdOf<DefaultLogger>(), level); }

  /**
   * @brief Sets the minimum level of every registered logger and of the default configuration.
   * @param level Minimum log level to set
   */
  void SetGlobalLevel(LogLevel level) noexcept;

  template <LoggerTrait T>
  [[nodiscard]] bool HasLogger(T /*logger*/ = {}) const noexcept {
    const std::shared_lock lock(loggers_mutex_);
    return loggers_.contains(LoggerIdOf<T>());
  }

  template <LoggerTrait T>
  [[nodiscard]] bool ShouldLog(T /*logger*/, LogLevel level) const noexcept {
    return ShouldLogImpl(LoggerIdOf<T>(), level);
  }

  [[nodiscard]] bool ShouldLog(LogLevel level) const noexcept {
    return ShouldLogImpl(LoggerIdOf<DefaultLogger>(), level);
  }

  /**
   * @brief Gets the current log level for a typed logger.
   * @return The current log level, or LogLevel::kTrace if logger doesn't exist
   */
  template <LoggerTrait T>
  [[nodiscard]] LogLevel GetLevel(T /*logger*/ = {}) const noexcept {
    return GetLevelImpl(LoggerIdOf<T>());
  }

  [[nodiscard]] LogLevel GetLevel() const noexcept { return GetLevelImpl(LoggerIdOf<DefaultLogger>()); }

  [[nodiscard]] LoggerConfig GetDefaultConfig() const noexcept;

  /**
   * @brief Gets the singleton instance.
   * @return Reference to the Logger instance
   */
  [[nodiscard]] static Logger& GetInstance() noexcept {
    static Logger instance;
    return instance;
  }

private:
  struct LoggerData {
    std::string name;
    LoggerConfig config;
    LogLevel level = LogLevel::kTrace;
    std::unique_ptr<QFile> file;
    std::unique_ptr<QTextStream> file_stream;
    QMutex file_mutex;

    LoggerData(std::string n, LoggerConfig cfg) : name(std::move(n)), config(std::move(cfg)), level(config.level) {}
    LoggerData(const LoggerData&) = delete;
    LoggerData(LoggerData&&) = delete;
    ~LoggerData() = default;

    LoggerData& operator=(const LoggerData&) = delete;
    LoggerData& operator=(LoggerData&&) = delete;
  };

  Logger() noexcept;

  void AddLoggerImpl(LoggerId logger_id, std::string_view name, const LoggerConfig& config) noexcept;
  void RemoveLoggerImpl(LoggerId logger_id) noexcept;
  void SetLevelImpl(LoggerId logger_id, LogLevel level) noexcept;
  [[nodiscard]] bool ShouldLogImpl(LoggerId logger_id, LogLevel level) const noexcept;
  [[nodiscard]] LogLevel GetLevelImpl(LoggerId logger_id) const noexcept;

  /// @return False if no logger with this id is registered.
  bool LogMessageImpl(LoggerId logger_id, LogLevel level, const std::source_location& loc,
                      std::string_view message) noexcept;

  [[nodiscard]] static std::unique_ptr<LoggerData> CreateLoggerData(std::string_view name,
                                                                    const LoggerConfig& config) noexcept;
  [[nodiscard]] static std::string FormatLogFileName(std::string_view logger_name, std::string_view pattern) noexcept;
  [[nodiscard]] static std::string FormatLogMessage(const LoggerData& data, LogLevel level,
                                                    const std::source_location& loc, std::string_view message) noexcept;

  static void WriteToConsole(LogLevel level, std::string_view message) noexcept;
  static void WriteToFile(LoggerData& data, std::string_view message) noexcept;

  [[nodiscard]] static std::string CaptureStackTrace() noexcept;

  std::unordered_map<LoggerId, std::unique_ptr<LoggerData>> loggers_;
  mutable std::shared_mutex loggers_mutex_;
  LoggerConfig default_config_;
};

}  // namespace faceid

// ============================================================================
// Logging Macros
// ============================================================================

#ifdef FACEID_DEBUG_MODE
#define FACEID_DEBUG(...) \
  ::faceid::Logger::GetInstance().LogMessage(::faceid::LogLevel::kDebug, std::source_location::current(), __VA_ARGS__)

#define FACEID_DEBUG_LOGGER(logger, ...)                                                                          \
  ::faceid::Logger::GetInstance().LogMessage(logger, ::faceid::LogLevel::kDebug, std::source_location::current(), \
                                             __VA_ARGS__)
#else
#define FACEID_DEBUG(...) [[maybe_unused]] static constexpr auto FACEID_ANONYMOUS_VAR(unused_debug) = 0
#define FACEID_DEBUG_LOGGER(logger, ...) \
  [[maybe_unused]] static constexpr auto FACEID_ANONYMOUS_VAR(unused_debug_logger) = 0
#endif

#if defined(FACEID_ENABLE_ASSERTS)
#define FACEID_TRACE(...) \
  ::faceid::Logger::GetInstance().LogMessage(::faceid::LogLevel::kTrace, std::source_location::current(), __VA_ARGS__)

#define FACEID_TRACE_LOGGER(logger, ...)                                                                          \
  ::faceid::Logger::GetInstance().LogMessage(logger, ::faceid::LogLevel::kTrace, std::source_location::current(), \
                                             __VA_ARGS__)
#else
#define FACEID_TRACE(...) [[maybe_unused]] static constexpr auto FACEID_ANONYMOUS_VAR(unused_trace) = 0
#define FACEID_TRACE_LOGGER(logger, ...) \
  [[maybe_unused]] static constexpr auto FACEID_ANONYMOUS_VAR(unused_trace_logger) = 0
#endif

#define FACEID_INFO(...) \
  ::faceid::Logger::GetInstance().LogMessage(::faceid::LogLevel::kInfo, std::source_location::current(), __VA_ARGS__)
#define FACEID_WARN(...) \
  ::faceid::Logger::GetInstance().LogMessage(::faceid::LogLevel::kWarn, std::source_location::current(), __VA_ARGS__)
#define FACEID_ERROR(...) \
  ::faceid::Logger::GetInstance().LogMessage(::faceid::LogLevel::kError, std::source_location::current(), __VA_ARGS__)
#define FACEID_CRITICAL(...)                                                                                 \
  ::faceid::Logger::GetInstance().LogMessage(::faceid::LogLevel::kCritical, std::source_location::current(), \
                                             __VA_ARGS__)

#define FACEID_INFO_LOGGER(logger, ...)                                                                          \
  ::faceid::Logger::GetInstance().LogMessage(logger, ::faceid::LogLevel::kInfo, std::source_location::current(), \
                                             __VA_ARGS__)
#define FACEID_WARN_LOGGER(logger, ...)                                                                          \
  ::faceid::Logger::GetInstance().LogMessage(logger, ::faceid::LogLevel::kWarn, std::source_location::current(), \
                                             __VA_ARGS__)
#define FACEID_ERROR_LOGGER(logger, ...)                                                                          \
  ::faceid::Logger::GetInstance().LogMessage(logger, ::faceid::LogLevel::kError, std::source_location::current(), \
                                             __VA_ARGS__)
#define FACEID_CRITICAL_LOGGER(logger, ...)                                                                          \
  ::faceid::Logger::GetInstance().LogMessage(logger, ::faceid::LogLevel::kCritical, std::source_location::current(), \
                                             __VA_ARGS__)
