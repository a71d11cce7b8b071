#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/pipeline_error.hpp>

#include <cstdint>
#include <string_view>

namespace faceid {

/**
 * @brief Application return codes indicating execution result.
 */
enum class AppReturnCode : uint8_t {
  kSuccess = 0,           ///< Application executed successfully.
  kCameraInitFailed,      ///< Failed to open the camera.
  kModelLoadFailed,       ///< Failed to load the face detection model.
  kInvalidConfiguration,  ///< Invalid command line or configuration.
  kApiNotConfigured,      ///< API_URL is not set.
  kNoImageSelected,       ///< No image was selected.
  kImageDecodeFailed,     ///< The image could not be decoded.
  kNoFaceDetected,        ///< No face was found in the image.
  kRecognitionFailed,     ///< The recognition request failed.
  kStorageError,          ///< An image file could not be written.
  kDetectionFailed,       ///< The face detector failed.
  kUnknownError = 255     ///< Unknown error occurred.
};

[[nodiscard]] constexpr std::string_view AppReturnCodeToString(AppReturnCode code) noexcept {
  switch (code) {
    case AppReturnCode::kSuccess:
      return "Success";
    case AppReturnCode::kCameraInitFailed:
      return "Camera initialization failed";
    case AppReturnCode::kModelLoadFailed:
      return "Model load failed";
    case AppReturnCode::kInvalidConfiguration:
      return "Invalid configuration";
    case AppReturnCode::kApiNotConfigured:
      return "API not configured";
    case AppReturnCode::kNoImageSelected:
      return "No image selected";
    case AppReturnCode::kImageDecodeFailed:
      return "Image decode failed";
    case AppReturnCode::kNoFaceDetected:
      return "No face detected";
    case AppReturnCode::kRecognitionFailed:
      return "Recognition failed";
    case AppReturnCode::kStorageError:
      return "Storage error";
    case AppReturnCode::kDetectionFailed:
      return "Face detection failed";
    case AppReturnCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

/**
 * @brief Maps the failure of a capture run to the process result.
 */
[[nodiscard]] constexpr AppReturnCode ToAppReturnCode(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::kNoSelection:
      return AppReturnCode::kNoImageSelected;
    case PipelineError::kDecodeError:
      return AppReturnCode::kImageDecodeFailed;
    case PipelineError::kNoFaceDetected:
      return AppReturnCode::kNoFaceDetected;
    case PipelineError::kConfigurationError:
      return AppReturnCode::kApiNotConfigured;
    case PipelineError::kTransportError:
      return AppReturnCode::kRecognitionFailed;
    case PipelineError::kStorageError:
      return AppReturnCode::kStorageError;
    case PipelineError::kDetectionFailed:
      return AppReturnCode::kDetectionFailed;
    case PipelineError::kBusy:
      return AppReturnCode::kUnknownError;
  }
  return AppReturnCode::kUnknownError;
}

[[nodiscard]] constexpr bool IsSuccess(AppReturnCode code) noexcept {
  return code == AppReturnCode::kSuccess;
}

/**
 * @brief Converts AppReturnCode to an integer exit code.
 * @param code The return code to convert.
 * @return Integer exit code suitable for returning from main().
 */
[[nodiscard]] constexpr int ToExitCode(AppReturnCode code) noexcept {
  return static_cast<int>(code);
}

}  // namespace faceid
