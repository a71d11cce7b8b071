#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/frame.hpp>
#include <faceid/app/frame_source.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>

class QWidget;

namespace faceid {

/**
 * @brief Where a photo comes from.
 */
enum class SourceKind : uint8_t {
  kCamera,  ///< Take a new photo.
  kGallery  ///< Pick an existing image file.
};

[[nodiscard]] constexpr std::string_view SourceKindToString(SourceKind kind) noexcept {
  switch (kind) {
    case SourceKind::kCamera:
      return "camera";
    case SourceKind::kGallery:
      return "gallery";
  }
  return "unknown";
}

[[nodiscard]] constexpr auto ParseSourceKind(std::string_view name) noexcept -> std::optional<SourceKind> {
  if (name == "camera") {
    return SourceKind::kCamera;
  }
  if (name == "gallery") {
    return SourceKind::kGallery;
  }
  return std::nullopt;
}

enum class AcquireError : uint8_t {
  kCancelled,     ///< The user dismissed the picker.
  kUnavailable,   ///< The camera could not deliver a photo.
  kStorageFailed  ///< The photo could not be written to disk.
};

[[nodiscard]] constexpr std::string_view AcquireErrorToString(AcquireError error) noexcept {
  switch (error) {
    case AcquireError::kCancelled:
      return "Selection cancelled";
    case AcquireError::kUnavailable:
      return "Camera unavailable";
    case AcquireError::kStorageFailed:
      return "Photo could not be saved";
  }
  return "Unknown error";
}

/**
 * @brief Platform picker producing an image file on disk.
 */
class ImageSource {
public:
  virtual ~ImageSource() = default;

  /**
   * @brief Lets the user take or pick a photo.
   * @param kind Camera or gallery
   * @return Path of the image file
   */
  [[nodiscard]] virtual auto Acquire(SourceKind kind) -> std::expected<std::filesystem::path, AcquireError> = 0;
};

struct ImageSourceConfig {
  std::filesystem::path preset_image;    ///< Gallery answer used without a dialog (headless runs).
  std::filesystem::path gallery_dir;     ///< Initial directory of the file dialog.
  std::filesystem::path capture_dir;     ///< Directory for camera photos (empty for the temp directory).
  int jpeg_quality = 95;                 ///< JPEG quality of camera photos.
  std::chrono::milliseconds frame_timeout{3000};  ///< How long to wait for the first camera frame.
  bool interactive = true;               ///< Whether the file dialog may be shown.
};

/**
 * @brief Waits for a frame while keeping the Qt event loop running.
 * @param source Open frame source
 * @param timeout Maximum wait
 * @return Frame, or the last error once the timeout expires
 */
[[nodiscard]] auto WaitForFrame(FrameSource& source, std::chrono::milliseconds timeout)
    -> std::expected<Frame, FrameSourceError>;

/**
 * @brief ImageSource using QFileDialog for the gallery and a live FrameSource for the camera.
 * @details A camera that is already open (a running stream) is sampled directly.
 * Otherwise it is opened for the duration of the capture only.
 */
class QtImageSource final : public ImageSource {
public:
  QtImageSource(FrameSource& camera, ImageSourceConfig config, QWidget* dialog_parent = nullptr)
      : camera_(camera), config_(std::move(config)), dialog_parent_(dialog_parent) {}

  [[nodiscard]] auto Acquire(SourceKind kind) -> std::expected<std::filesystem::path, AcquireError> override;

  void SetGalleryDirectory(std::filesystem::path directory) { config_.gallery_dir = std::move(directory); }
  void SetJpegQuality(int quality) noexcept { config_.jpeg_quality = quality; }

  [[nodiscard]] const ImageSourceConfig& Config() const noexcept { return config_; }

private:
  [[nodiscard]] auto AcquireFromGallery() -> std::expected<std::filesystem::path, AcquireError>;
  [[nodiscard]] auto AcquireFromCamera() -> std::expected<std::filesystem::path, AcquireError>;

  FrameSource& camera_;
  ImageSourceConfig config_;
  QWidget* dialog_parent_ = nullptr;
};

}  // namespace faceid
