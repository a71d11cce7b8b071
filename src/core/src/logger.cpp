#include <faceid/core/logger.hpp>

#include <faceid/core/assert.hpp>

#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QString>
#include <QtLogging>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <format>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#ifdef FACEID_ENABLE_STACKTRACE
// FACEID_USE_STD_STACKTRACE is defined by CMake when std::stacktrace links
#ifdef FACEID_USE_STD_STACKTRACE
#include <stacktrace>
#else
#include <boost/stacktrace.hpp>
#endif
#endif

namespace faceid {

std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept {
  std::string lowered(name);
  std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace") {
    return LogLevel::kTrace;
  }
  if (lowered == "debug") {
    return LogLevel::kDebug;
  }
  if (lowered == "info") {
    return LogLevel::kInfo;
  }
  if (lowered == "warn" || lowered == "warning") {
    return LogLevel::kWarn;
  }
  if (lowered == "error") {
    return LogLevel::kError;
  }
  if (lowered == "critical") {
    return LogLevel::kCritical;
  }
  return std::nullopt;
}

LoggerConfig LoggerConfig::FromEnvironment(LoggerConfig base) noexcept {
  if (const char* level_env = std::getenv("FACEID_LOG_LEVEL"); level_env != nullptr) {
    if (const auto level = ParseLogLevel(level_env); level.has_value()) {
      base.level = *level;
    }
  }

  if (const char* dir_env = std::getenv("FACEID_LOG_DIR"); dir_env != nullptr && *dir_env != '\0') {
    base.log_directory = dir_env;
    base.enable_file = true;
  }

  return base;
}

Logger::Logger() noexcept : default_config_(DefaultLogger::Config()) {
  loggers_.emplace(LoggerIdOf<DefaultLogger>(), CreateLoggerData(LoggerNameOf<DefaultLogger>(), default_config_));
}

void Logger::AddLoggerImpl(LoggerId logger_id, std::string_view name, const LoggerConfig& config) noexcept {
  const std::scoped_lock lock(loggers_mutex_);
  if (loggers_.contains(logger_id)) {
    return;
  }
  loggers_.emplace(logger_id, CreateLoggerData(name, config));
}

void Logger::RemoveLoggerImpl(LoggerId logger_id) noexcept {
  const std::scoped_lock lock(loggers_mutex_);
  if (const auto it = loggers_.find(logger_id); it != loggers_.end()) {
    if (it->second && it->second->file_stream) {
      it->second->file_stream->flush();
    }
    loggers_.erase(it);
  }
}

void Logger::FlushAll() noexcept {
  const std::shared_lock lock(loggers_mutex_);
  for (auto& [_, data] : loggers_) {
    if (data && data->file_stream) {
      const QMutexLocker file_lock(&data->file_mutex);
      data->file_stream->flush();
    }
  }
}

bool Logger::LogMessageImpl(LoggerId logger_id, LogLevel level, const std::source_location& loc,
                            std::string_view message) noexcept {
  const std::shared_lock lock(loggers_mutex_);
  const auto it = loggers_.find(logger_id);
  if (it == loggers_.end() || !it->second) {
    return false;
  }

  auto& data = *it->second;
  if (level < data.level) {
    return true;
  }

  const std::string formatted = FormatLogMessage(data, level, loc, message);

  if (data.config.enable_console) {
    WriteToConsole(level, formatted);
  }

  if (data.config.enable_file && data.file_stream) {
    WriteToFile(data, formatted);
    if (level >= data.config.auto_flush_level) {
      const QMutexLocker file_lock(&data.file_mutex);
      data.file_stream->flush();
    }
  }
  return true;
}

void Logger::LogAssertionFailure(std::string_view condition, const std::source_location& loc,
                                 std::string_view message) noexcept {
  try {
    const std::string assertion_msg = std::format("Assertion failed: {} | {}", condition, message);
    LogMessageImpl(LoggerIdOf<DefaultLogger>(), LogLevel::kCritical, loc, assertion_msg);
  } catch (const std::exception&) {
    LogMessageImpl(LoggerIdOf<DefaultLogger>(), LogLevel::kCritical, loc, condition);
  }
}

void Logger::SetDefaultConfig(const LoggerConfig& config) noexcept {
  const std::scoped_lock lock(loggers_mutex_);
  default_config_ = config;
}

LoggerConfig Logger::GetDefaultConfig() const noexcept {
  const std::shared_lock lock(loggers_mutex_);
  return default_config_;
}

void Logger::SetLevelImpl(LoggerId logger_id, LogLevel level) noexcept {
  const std::scoped_lock lock(loggers_mutex_);
  if (const auto it = loggers_.find(logger_id); it != loggers_.end() && it->second) {
    it->second->level = level;
  }
}

void Logger::SetGlobalLevel(LogLevel level) noexcept {
  const std::scoped_lock lock(loggers_mutex_);
  default_config_.level = level;
  for (auto& [_, data] : loggers_) {
    if (data) {
      data->level = level;
    }
  }
}

bool Logger::ShouldLogImpl(LoggerId logger_id, LogLevel level) const noexcept {
  const std::shared_lock lock(loggers_mutex_);
  if (const auto it = loggers_.find(logger_id); it != loggers_.end() && it->second) {
    return level >= it->second->level;
  }
  return false;
}

LogLevel Logger::GetLevelImpl(LoggerId logger_id) const noexcept {
  const std::shared_lock lock(loggers_mutex_);
  if (const auto it = loggers_.find(logger_id); it != loggers_.end() && it->second) {
    return it->second->level;
  }
  return LogLevel::kTrace;
}

auto Logger::CreateLoggerData(std::string_view name, const LoggerConfig& config) noexcept
    -> std::unique_ptr<LoggerData> {
  auto data = std::make_unique<LoggerData>(std::string(name), config);
  if (!config.enable_file || config.log_directory.empty()) {
    return data;
  }

  const QString directory = QString::fromStdString(config.log_directory);
  if (!QDir().mkpath(directory)) {
    qWarning().noquote() << "Could not create log directory" << directory;
    return data;
  }

  const std::string filename = FormatLogFileName(name, config.file_name_pattern);
  data->file = std::make_unique<QFile>(QDir(directory).filePath(QString::fromStdString(filename)));

  QIODevice::OpenMode mode = QIODevice::WriteOnly | QIODevice::Text;
  if (!config.truncate_files) {
    mode |= QIODevice::Append;
  }
  if (data->file->open(mode)) {
    data->file_stream = std::make_unique<QTextStream>(data->file.get());
  } else {
    qWarning().noquote() << "Could not open log file" << data->file->fileName();
  }
  return data;
}

std::string Logger::FormatLogFileName(std::string_view logger_name, std::string_view pattern) noexcept {
  std::string result(pattern);

  if (const size_t pos = result.find("{name}"); pos != std::string::npos) {
    result.replace(pos, 6, logger_name);
  }

  if (const size_t pos = result.find("{timestamp}"); pos != std::string::npos) {
    const QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd_HH-mm-ss");
    result.replace(pos, 11, timestamp.toStdString());
  }

  return result;
}

std::string Logger::FormatLogMessage(const LoggerData& data, LogLevel level, const std::source_location& loc,
                                     std::string_view message) noexcept {
  const QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");

  std::string result;
  result.reserve(256);
  result.append("[");
  result.append(timestamp.toStdString());
  result.append("] [");
  result.append(LogLevelToString(level));
  result.append("] ");
  result.append(data.name);
  result.append(": ");
  result.append(message);

  if (level >= data.config.source_location_level) {
    result.append(" [");
    result.append(details::GetFileName(loc.file_name()));
    result.append(":");
    result.append(std::to_string(loc.line()));
    result.append("]");
  }

  if (level >= data.config.stack_trace_level) {
    result.append(CaptureStackTrace());
  }

  return result;
}

void Logger::WriteToConsole(LogLevel level, std::string_view message) noexcept {
  const QString text = QString::fromUtf8(message.data(), static_cast<qsizetype>(message.size()));
  switch (level) {
    case LogLevel::kTrace:
    case LogLevel::kDebug:
      qDebug().noquote() << text;
      break;
    case LogLevel::kInfo:
      qInfo().noquote() << text;
      break;
    case LogLevel::kWarn:
      qWarning().noquote() << text;
      break;
    case LogLevel::kError:
    case LogLevel::kCritical:
      qCritical().noquote() << text;
      break;
  }
}

void Logger::WriteToFile(LoggerData& data, std::string_view message) noexcept {
  if (!data.file_stream) {
    return;
  }

  const QMutexLocker lock(&data.file_mutex);
  *data.file_stream << QString::fromUtf8(message.data(), static_cast<qsizetype>(message.size())) << "\n";
}

std::string Logger::CaptureStackTrace() noexcept {
#ifdef FACEID_ENABLE_STACKTRACE
  constexpr size_t kMaxStackTraceFrames = 10;

  std::string result;
  result.reserve(512);
  result.append("\nStack trace:");

#ifdef FACEID_USE_STD_STACKTRACE
  const auto stack_trace = std::stacktrace::current();
  const auto stack_size = static_cast<size_t>(stack_trace.size());
  if (stack_size <= 1) {
    result.append(" <empty>");
    return result;
  }

  const size_t frame_count = std::min(stack_size, 1 + kMaxStackTraceFrames);
  for (size_t i = 1; i < frame_count; ++i) {
    result.append(std::format("\n  {}: {}", i, std::to_string(stack_trace[static_cast<std::stacktrace::size_type>(i)])));
  }
#else
  const boost::stacktrace::stacktrace stack_trace;
  if (stack_trace.size() <= 1) {
    result.append(" <empty>");
    return result;
  }

  const size_t frame_count = std::min(stack_trace.size(), 1 + kMaxStackTraceFrames);
  for (size_t i = 1; i < frame_count; ++i) {
    result.append(std::format("\n  {}: {}", i, boost::stacktrace::to_string(stack_trace[i])));
  }
#endif

  return result;
#else
  return {};
#endif
}

namespace details {

void LogAssertionFailureViaLogger(std::string_view condition, const std::source_location& loc,
                                  std::string_view message) noexcept {
  Logger::GetInstance().LogAssertionFailure(condition, loc, message);
}

}  // namespace details

}  // namespace faceid
