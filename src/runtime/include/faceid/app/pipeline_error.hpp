#pragma once

#include <faceid/pch.hpp>

#include <faceid/net/recognition_transport.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace faceid {

/**
 * @brief Failure kinds of a capture run.
 * @details Every kind ends the current run. None is retried.
 */
enum class PipelineError : uint8_t {
  kNoSelection,         ///< The picker was cancelled. Silent.
  kDecodeError,         ///< The image could not be read or decoded.
  kNoFaceDetected,      ///< The locator found no face.
  kConfigurationError,  ///< The recognition endpoint is not configured.
  kTransportError,      ///< The request failed or returned a non-200 status.
  kStorageError,        ///< A normalized or cropped file could not be written.
  kDetectionFailed,     ///< The locator itself failed.
  kBusy                 ///< A run is already in progress.
};

[[nodiscard]] constexpr std::string_view PipelineErrorToString(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::kNoSelection:
      return "No image selected";
    case PipelineError::kDecodeError:
      return "Image could not be decoded";
    case PipelineError::kNoFaceDetected:
      return "No face detected";
    case PipelineError::kConfigurationError:
      return "Configuration error";
    case PipelineError::kTransportError:
      return "Recognition request failed";
    case PipelineError::kStorageError:
      return "Image could not be saved";
    case PipelineError::kDetectionFailed:
      return "Face detection failed";
    case PipelineError::kBusy:
      return "Capture already in progress";
  }
  return "Unknown error";
}

/**
 * @brief Checks whether a failure is reported to the user.
 */
[[nodiscard]] constexpr bool IsSilent(PipelineError error) noexcept {
  return error == PipelineError::kNoSelection;
}

/**
 * @brief Title and message shown to the user.
 */
struct UserNotice {
  std::string title;
  std::string message;

  [[nodiscard]] bool operator==(const UserNotice& other) const = default;
};

/**
 * @brief Pipeline failure with its detail text.
 */
struct PipelineFailure {
  PipelineError code = PipelineError::kDecodeError;
  std::string detail;

  /**
   * @brief Builds the notice shown for this failure.
   * @details The title names the failure kind, the message carries the detail text.
   */
  [[nodiscard]] UserNotice ToNotice() const;

  /**
   * @brief Converts a transport failure.
   * @details A missing endpoint is a configuration error. Every other transport failure is a transport error.
   */
  [[nodiscard]] static PipelineFailure FromTransport(const net::TransportFailure& failure);
};

}  // namespace faceid
