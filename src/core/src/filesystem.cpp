#include <faceid/core/utils/filesystem.hpp>

#include <algorithm>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

namespace faceid::utils {

auto ReadFileToString(const std::filesystem::path& path) -> std::expected<std::string, FileError> {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return std::unexpected(FileError::kCouldNotOpen);
  }

  std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
  if (file.bad()) {
    return std::unexpected(FileError::kReadFailed);
  }
  return content;
}

auto ReadFileToBytes(const std::filesystem::path& path) -> std::expected<std::vector<uint8_t>, FileError> {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return std::unexpected(FileError::kCouldNotOpen);
  }

  std::vector<uint8_t> bytes(std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{});
  if (file.bad()) {
    return std::unexpected(FileError::kReadFailed);
  }
  return bytes;
}

auto WriteBytesToFile(const std::filesystem::path& path, std::span<const uint8_t> bytes)
    -> std::expected<void, FileError> {
  std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return std::unexpected(FileError::kCouldNotOpen);
  }

  std::ranges::copy(bytes, std::ostreambuf_iterator<char>(file));
  file.flush();
  if (!file) {
    return std::unexpected(FileError::kWriteFailed);
  }
  return {};
}

}  // namespace faceid::utils
