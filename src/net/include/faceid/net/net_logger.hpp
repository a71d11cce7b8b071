#pragma once

#include <string_view>

namespace faceid::net {

/**
 * @brief Logger for backend configuration and HTTP traffic.
 */
struct NetLogger {
  static constexpr std::string_view Name() noexcept { return "NET"; }
};

inline constexpr NetLogger kNetLogger{};

}  // namespace faceid::net
