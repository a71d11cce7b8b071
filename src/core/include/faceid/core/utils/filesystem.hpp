#pragma once

#include <faceid/core/pch.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace faceid::utils {

enum class FileError : uint8_t {
  kCouldNotOpen,
  kReadFailed,
  kWriteFailed,
};

[[nodiscard]] constexpr std::string_view FileErrorToString(FileError error) noexcept {
  switch (error) {
    case FileError::kCouldNotOpen:
      return "Could not open file";
    case FileError::kReadFailed:
      return "Failed to read file";
    case FileError::kWriteFailed:
      return "Failed to write file";
    default:
      return "Unknown file error";
  }
}

/**
 * @brief Reads the whole file as text.
 * @param path Path to the file
 * @return File contents or FileError
 */
[[nodiscard]] auto ReadFileToString(const std::filesystem::path& path) -> std::expected<std::string, FileError>;

[[nodiscard]] inline auto ReadFileToString(std::string_view path) -> std::expected<std::string, FileError> {
  return ReadFileToString(std::filesystem::path(path));
}

/**
 * @brief Reads the whole file as raw bytes.
 * @param path Path to the file
 * @return File bytes or FileError
 */
[[nodiscard]] auto ReadFileToBytes(const std::filesystem::path& path) -> std::expected<std::vector<uint8_t>, FileError>;

/**
 * @brief Writes bytes to a file, replacing any previous content.
 * @param path Destination path
 * @param bytes Data to write
 */
[[nodiscard]] auto WriteBytesToFile(const std::filesystem::path& path, std::span<const uint8_t> bytes)
    -> std::expected<void, FileError>;

/**
 * @brief Returns the part of the path after the last separator.
 */
[[nodiscard]] constexpr std::string_view GetFileName(std::string_view path) noexcept {
  const size_t last_slash = path.find_last_of("/\\");
  return (last_slash != std::string_view::npos) ? path.substr(last_slash + 1) : path;
}

/**
 * @brief Returns the extension of the file name including the dot, or an empty view.
 */
[[nodiscard]] constexpr std::string_view GetFileExtension(std::string_view path) noexcept {
  const std::string_view name = GetFileName(path);
  const size_t last_dot = name.find_last_of('.');
  return (last_dot != std::string_view::npos) ? name.substr(last_dot) : std::string_view{};
}

}  // namespace faceid::utils
