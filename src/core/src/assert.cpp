#include <faceid/core/assert.hpp>

#include <faceid/core/core.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <print>
#include <source_location>
#include <string>
#include <string_view>

#ifdef FACEID_ENABLE_STACKTRACE
#ifdef FACEID_USE_STD_STACKTRACE
#include <stacktrace>
#else
#include <boost/stacktrace.hpp>
#endif
#endif

namespace {

#ifdef FACEID_ENABLE_STACKTRACE
[[nodiscard]] std::string CaptureStackTrace() noexcept {
  constexpr size_t kMaxStackTraceFrames = 16;

  std::string result = "Stack trace:";
#ifdef FACEID_USE_STD_STACKTRACE
  const auto stack_trace = std::stacktrace::current(1, kMaxStackTraceFrames);
  if (stack_trace.empty()) {
    result.append(" <empty>");
  }
  for (size_t i = 0; i < stack_trace.size(); ++i) {
    result.append(std::format("\n  {}: {}", i + 1, std::to_string(stack_trace[i])));
  }
#else
  const boost::stacktrace::stacktrace stack_trace(1, kMaxStackTraceFrames);
  if (stack_trace.empty()) {
    result.append(" <empty>");
  }
  for (size_t i = 0; i < stack_trace.size(); ++i) {
    result.append(std::format("\n  {}: {}", i + 1, boost::stacktrace::to_string(stack_trace[i])));
  }
#endif
  return result;
}
#endif

}  // namespace

namespace faceid {

void AbortWithStacktrace(std::string_view message) noexcept {
  std::println(stderr, "\n=== FATAL ERROR ===");
  std::println(stderr, "Message: {}", message);

#ifdef FACEID_ENABLE_STACKTRACE
  std::println(stderr, "{}", CaptureStackTrace());
#else
  std::println(stderr, "Stack trace: <not available - build with FACEID_ENABLE_STACKTRACE>");
#endif

  std::println(stderr, "===================\n");
  std::fflush(stderr);

  FACEID_DEBUG_BREAK();
  std::abort();
}

namespace details {

void AssertionFailed(std::string_view condition, const std::source_location& loc,
                     std::string_view message) noexcept {
  LogAssertionFailureViaLogger(condition, loc, message);

  const std::string text =
      message.empty() ? std::format("Assertion failed: {} at {}:{}", condition, loc.file_name(), loc.line())
                      : std::format("Assertion failed: {} ({}) at {}:{}", condition, message, loc.file_name(), loc.line());
  AbortWithStacktrace(text);
}

}  // namespace details

}  // namespace faceid
