#pragma once

#include <faceid/net/pch.hpp>

#include <faceid/core/utils/filesystem.hpp>

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace faceid::net {

/// Environment variable holding the backend base URL.
inline constexpr std::string_view kApiUrlVariable = "API_URL";

/// Dotenv file consulted when the environment does not define the URL.
inline constexpr std::string_view kDefaultEnvFile = ".env";

/**
 * @brief Parses dotenv content.
 * @details One KEY=VALUE pair per line. Blank lines and lines starting with '#' are skipped,
 * an optional leading "export " is dropped, keys and values are trimmed and a value wrapped
 * in matching single or double quotes is unquoted. Lines without '=' are ignored.
 * @param content File content
 * @return Parsed variables; later duplicates override earlier ones
 */
[[nodiscard]] auto ParseDotEnv(std::string_view content) -> std::unordered_map<std::string, std::string>;

/**
 * @brief Reads and parses a dotenv file.
 * @param path Path to the file
 * @return Parsed variables or FileError
 */
[[nodiscard]] auto LoadDotEnv(const std::filesystem::path& path)
    -> std::expected<std::unordered_map<std::string, std::string>, utils::FileError>;

/**
 * @brief Backend endpoint configuration.
 * @details An empty base URL means the recognition feature is not configured. This is not
 * fatal to the application: every request reports TransportError::kNotConfigured instead.
 */
struct ApiConfig {
  std::string base_url;                             ///< Base URL without trailing slash.
  std::chrono::milliseconds timeout{30000};         ///< Per-request transfer timeout.
  std::string start_stream_path = "/start_stream";  ///< Stream start endpoint.
  std::string recognize_path = "/main";             ///< Recognition endpoint.

  [[nodiscard]] bool IsConfigured() const noexcept { return !base_url.empty(); }

  /**
   * @brief Builds the full URL of an endpoint.
   * @param path Endpoint path starting with '/'
   * @return base_url + path
   */
  [[nodiscard]] std::string Endpoint(std::string_view path) const;

  /**
   * @brief Returns a copy with the given base URL, normalized.
   * @details Surrounding whitespace and trailing slashes are removed.
   */
  [[nodiscard]] ApiConfig WithBaseUrl(std::string_view url) const;

  /**
   * @brief Resolves the configuration at startup.
   * @details API_URL from the process environment wins. Otherwise the dotenv file is consulted.
   * A missing dotenv file is not an error.
   * @param env_file Dotenv file to consult
   * @return Resolved configuration, possibly unconfigured
   */
  [[nodiscard]] static ApiConfig FromEnvironment(const std::filesystem::path& env_file = kDefaultEnvFile);
};

}  // namespace faceid::net
