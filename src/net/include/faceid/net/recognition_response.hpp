#pragma once

#include <faceid/net/pch.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace faceid::net {

/**
 * @brief Reasons a stream start response body is rejected.
 */
enum class ResponseError : uint8_t {
  kNotAnObject,   ///< Body is not a JSON object.
  kInvalidField,  ///< A known field has the wrong JSON type.
};

[[nodiscard]] constexpr std::string_view ResponseErrorToString(ResponseError error) noexcept {
  switch (error) {
    case ResponseError::kNotAnObject:
      return "Response is not a JSON object";
    case ResponseError::kInvalidField:
      return "Response field has an unexpected type";
    default:
      return "Unknown response error";
  }
}

/**
 * @brief Result of POST /main.
 */
struct RecognitionResponse {
  std::string message;                  ///< Text shown to the user.
  std::optional<std::string> identity;  ///< Recognized person, if any.
  std::optional<double> confidence;     ///< Match confidence reported by the backend.
  bool structured = true;               ///< False when the body did not match the schema.

  [[nodiscard]] bool operator==(const RecognitionResponse&) const noexcept = default;
};

/**
 * @brief Result of POST /start_stream.
 */
struct StreamStartResponse {
  std::optional<std::string> message;

  [[nodiscard]] bool operator==(const StreamStartResponse&) const noexcept = default;
};

/**
 * @brief Parses the body of a recognition response.
 * @details Expects {"message": string, "identity"?: string, "confidence"?: number}.
 * Any other body is returned verbatim as the message with structured = false.
 * @param body Raw response body
 * @return Parsed response
 */
[[nodiscard]] auto ParseRecognitionResponse(std::string_view body) -> RecognitionResponse;

/**
 * @brief Parses the body of a stream start response.
 * @details An empty body is accepted. Otherwise the body must be a JSON object whose
 * optional "message" is a string.
 * @param body Raw response body
 * @return Parsed response or ResponseError
 */
[[nodiscard]] auto ParseStreamStartResponse(std::string_view body) -> std::expected<StreamStartResponse, ResponseError>;

}  // namespace faceid::net
