#pragma once

#include <string_view>

namespace faceid {

/**
 * @brief Logger for user-triggered capture runs.
 */
struct PipelineLogger {
  static constexpr std::string_view Name() noexcept { return "PIPELINE"; }
};

/**
 * @brief Logger for the periodic camera stream.
 */
struct StreamLogger {
  static constexpr std::string_view Name() noexcept { return "STREAM"; }
};

inline constexpr PipelineLogger kPipelineLogger{};
inline constexpr StreamLogger kStreamLogger{};

}  // namespace faceid
