#pragma once

#include <faceid/net/pch.hpp>

#include <faceid/net/recognition_response.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace faceid::net {

/**
 * @brief Error codes for backend requests.
 */
enum class TransportError : uint8_t {
  kNotConfigured,      ///< No backend URL configured.
  kNetworkFailure,     ///< Connection or protocol failure.
  kTimeout,            ///< Request exceeded the configured timeout.
  kHttpStatus,         ///< Backend answered with a status other than 200.
  kMalformedResponse,  ///< Stream start body does not match its schema.
};

/**
 * @brief Converts TransportError to a human-readable string.
 * @param error The error to convert
 * @return A string view representing the error
 */
[[nodiscard]] constexpr std::string_view TransportErrorToString(TransportError error) noexcept {
  switch (error) {
    case TransportError::kNotConfigured:
      return "Backend URL is not configured";
    case TransportError::kNetworkFailure:
      return "Network failure";
    case TransportError::kTimeout:
      return "Request timed out";
    case TransportError::kHttpStatus:
      return "Unexpected HTTP status";
    case TransportError::kMalformedResponse:
      return "Malformed response";
    default:
      return "Unknown transport error";
  }
}

/**
 * @brief Failed request with the details available at the failure point.
 */
struct TransportFailure {
  TransportError code = TransportError::kNetworkFailure;
  int http_status = 0;  ///< HTTP status when a response arrived, 0 otherwise.
  std::string detail;   ///< Error string or response body excerpt.

  /**
   * @brief Formats the failure for logs and user notices.
   * @return "<error>" or "<error> (HTTP <status>): <detail>"
   */
  [[nodiscard]] std::string Describe() const;
};

/**
 * @brief Client of the recognition backend.
 * @details Requests are asynchronous. Each call issues exactly one request and invokes its
 * callback exactly once, on the thread owning the transport. There are no retries.
 */
class RecognitionTransport {
public:
  using StartStreamResult = std::expected<StreamStartResponse, TransportFailure>;
  using RecognizeResult = std::expected<RecognitionResponse, TransportFailure>;

  using StartStreamCallback = std::function<void(StartStreamResult result)>;
  using RecognizeCallback = std::function<void(RecognizeResult result)>;

  virtual ~RecognitionTransport() = default;

  /**
   * @brief Sends POST /start_stream with no body.
   * @param callback Invoked with the parsed response or the failure
   */
  virtual void StartStream(StartStreamCallback callback) = 0;

  /**
   * @brief Sends POST /main with the image bytes as application/octet-stream.
   * @param image_bytes Encoded image
   * @param callback Invoked with the parsed response or the failure
   */
  virtual void Recognize(std::vector<uint8_t> image_bytes, RecognizeCallback callback) = 0;

  /// @return False when requests would fail with TransportError::kNotConfigured.
  [[nodiscard]] virtual bool IsConfigured() const noexcept = 0;
};

}  // namespace faceid::net
