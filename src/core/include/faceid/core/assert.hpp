#pragma once

#include <faceid/core/core.hpp>

#include <exception>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace faceid {

namespace details {

#ifdef FACEID_ENABLE_ASSERTS
inline constexpr bool kEnableAssert = true;
#else
inline constexpr bool kEnableAssert = false;
#endif

/**
 * @brief Routes an assertion failure to the logger.
 * @details Defined next to the logger so that this header stays free of Qt.
 */
void LogAssertionFailureViaLogger(std::string_view condition, const std::source_location& loc,
                                  std::string_view message) noexcept;

/**
 * @brief Reports a failed assertion: logs it, prints it to stderr and aborts.
 */
[[noreturn]] void AssertionFailed(std::string_view condition, const std::source_location& loc,
                                  std::string_view message) noexcept;

template <typename... Args>
[[nodiscard]] inline std::string FormatAssertMessage(std::format_string<Args...> fmt, Args&&... args) noexcept {
  try {
    return std::format(fmt, std::forward<Args>(args)...);
  } catch (const std::exception&) {
    return "<message formatting failed>";
  }
}

[[nodiscard]] inline std::string FormatAssertMessage() noexcept {
  return {};
}

}  // namespace details

/**
 * @brief Prints a fatal error with a stack trace to stderr and aborts.
 * @param message Description of the failure
 */
[[noreturn]] void AbortWithStacktrace(std::string_view message) noexcept;

}  // namespace faceid

#ifdef FACEID_ENABLE_ASSERTS

/**
 * @brief Debug-only check. Aborts with a stack trace when the condition is false.
 * @details Usage: FACEID_ASSERT(cond) or FACEID_ASSERT(cond, "fmt {}", args...)
 */
#define FACEID_ASSERT(condition, ...)                                                                     \
  do {                                                                                                    \
    if (FACEID_EXPECT_FALSE(!(condition))) [[unlikely]] {                                                 \
      ::faceid::details::AssertionFailed(#condition, std::source_location::current(),                     \
                                         ::faceid::details::FormatAssertMessage(__VA_OPT__(__VA_ARGS__))); \
    }                                                                                                     \
  } while (false)

/**
 * @brief Debug-only check of a class or algorithm invariant.
 */
#define FACEID_INVARIANT(condition, ...) FACEID_ASSERT(condition __VA_OPT__(, ) __VA_ARGS__)

#else

#define FACEID_ASSERT(condition, ...) ((void)sizeof(condition))
#define FACEID_INVARIANT(condition, ...) ((void)sizeof(condition))

#endif

/**
 * @brief Always-on check. Logs the failure and continues.
 * @details Evaluates to the condition so callers can branch on it.
 */
#define FACEID_VERIFY(condition, ...)                                                                      \
  ([&]() -> bool {                                                                                         \
    if (FACEID_EXPECT_FALSE(!(condition))) [[unlikely]] {                                                  \
      ::faceid::details::LogAssertionFailureViaLogger(                                                     \
          #condition, std::source_location::current(),                                                     \
          ::faceid::details::FormatAssertMessage(__VA_OPT__(__VA_ARGS__)));                                \
      return false;                                                                                        \
    }                                                                                                      \
    return true;                                                                                           \
  }())
