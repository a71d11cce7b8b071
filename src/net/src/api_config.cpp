#include <faceid/net/api_config.hpp>

#include <faceid/core/logger.hpp>
#include <faceid/net/net_logger.hpp>

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

namespace faceid::net {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

[[nodiscard]] std::string_view Trim(std::string_view text) noexcept {
  const size_t begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  const size_t end = text.find_last_not_of(kWhitespace);
  return text.substr(begin, end - begin + 1);
}

[[nodiscard]] std::string_view Unquote(std::string_view value) noexcept {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

}  // namespace

auto ParseDotEnv(std::string_view content) -> std::unordered_map<std::string, std::string> {
  constexpr std::string_view kExportPrefix = "export ";

  std::unordered_map<std::string, std::string> variables;
  while (!content.empty()) {
    const size_t newline = content.find('\n');
    std::string_view line = Trim(content.substr(0, newline));
    content = newline == std::string_view::npos ? std::string_view{} : content.substr(newline + 1);

    if (line.empty() || line.front() == '#') {
      continue;
    }
    if (line.starts_with(kExportPrefix)) {
      line = Trim(line.substr(kExportPrefix.size()));
    }

    const size_t separator = line.find('=');
    if (separator == std::string_view::npos) {
      continue;
    }

    const std::string_view key = Trim(line.substr(0, separator));
    if (key.empty()) {
      continue;
    }
    variables.insert_or_assign(std::string(key), std::string(Unquote(Trim(line.substr(separator + 1)))));
  }
  return variables;
}

auto LoadDotEnv(const std::filesystem::path& path)
    -> std::expected<std::unordered_map<std::string, std::string>, utils::FileError> {
  const auto content = utils::ReadFileToString(path);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }
  return ParseDotEnv(*content);
}

std::string ApiConfig::Endpoint(std::string_view path) const {
  std::string url = base_url;
  url.append(path);
  return url;
}

ApiConfig ApiConfig::WithBaseUrl(std::string_view url) const {
  ApiConfig config = *this;
  std::string_view trimmed = Trim(url);
  while (trimmed.ends_with('/')) {
    trimmed.remove_suffix(1);
  }
  config.base_url = std::string(trimmed);
  return config;
}

ApiConfig ApiConfig::FromEnvironment(const std::filesystem::path& env_file) {
  const ApiConfig defaults;

  if (const char* env_url = std::getenv(kApiUrlVariable.data()); env_url != nullptr && *env_url != '\0') {
    FACEID_DEBUG_LOGGER(kNetLogger, "{} taken from process environment", kApiUrlVariable);
    return defaults.WithBaseUrl(env_url);
  }

  const auto variables = LoadDotEnv(env_file);
  if (!variables.has_value()) {
    FACEID_WARN_LOGGER(kNetLogger, "{} is not set and '{}' could not be read: {}", kApiUrlVariable,
                       env_file.string(), utils::FileErrorToString(variables.error()));
    return defaults;
  }

  if (const auto it = variables->find(std::string(kApiUrlVariable)); it != variables->end()) {
    const ApiConfig config = defaults.WithBaseUrl(it->second);
    if (config.IsConfigured()) {
      FACEID_DEBUG_LOGGER(kNetLogger, "{} taken from '{}'", kApiUrlVariable, env_file.string());
      return config;
    }
  }

  FACEID_WARN_LOGGER(kNetLogger, "{} is not configured, recognition requests will fail", kApiUrlVariable);
  return defaults;
}

}  // namespace faceid::net
