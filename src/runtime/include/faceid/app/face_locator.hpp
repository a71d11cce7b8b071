#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/face_data.hpp>
#include <faceid/app/frame.hpp>

#include <cstdint>
#include <expected>
#include <string_view>
#include <vector>

namespace faceid {

/**
 * @brief Error codes for face locator operations.
 */
enum class FaceLocatorError : uint8_t {
  kModelNotFound,     ///< Model file not found.
  kConfigNotFound,    ///< Configuration file not found.
  kModelLoadFailed,   ///< Failed to load the model.
  kInvalidModel,      ///< Model is invalid or corrupted.
  kProcessingFailed,  ///< Image processing failed.
  kNotInitialized     ///< Locator not initialized.
};

[[nodiscard]] constexpr std::string_view FaceLocatorErrorToString(FaceLocatorError error) noexcept {
  switch (error) {
    case FaceLocatorError::kModelNotFound:
      return "Model file not found";
    case FaceLocatorError::kConfigNotFound:
      return "Configuration file not found";
    case FaceLocatorError::kModelLoadFailed:
      return "Failed to load model";
    case FaceLocatorError::kInvalidModel:
      return "Invalid or corrupted model";
    case FaceLocatorError::kProcessingFailed:
      return "Image processing failed";
    case FaceLocatorError::kNotInitialized:
      return "Face locator not initialized";
  }
  return "Unknown error";
}

/**
 * @brief Detects faces in an upright image.
 */
class FaceLocator {
public:
  virtual ~FaceLocator() = default;

  /**
   * @brief Finds faces in an image.
   * @param frame Upright BGR pixels
   * @return Faces in the order the detector reports them, possibly empty
   */
  [[nodiscard]] virtual auto Locate(const Frame& frame) -> std::expected<std::vector<FaceDetection>, FaceLocatorError> = 0;
};

}  // namespace faceid
