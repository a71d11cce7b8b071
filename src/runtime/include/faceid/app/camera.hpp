#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/frame.hpp>
#include <faceid/app/frame_source.hpp>

#include <QCamera>
#include <QCameraDevice>
#include <QMediaCaptureSession>
#include <QObject>
#include <QVideoSink>

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class QVideoFrame;

namespace faceid {

/**
 * @brief Error codes for camera operations.
 */
enum class CameraError : uint8_t {
  kNotFound,           ///< No camera device found.
  kNotStarted,         ///< Camera not started.
  kCaptureError,       ///< Error during frame capture.
  kConfigurationError  ///< Camera configuration error.
};

[[nodiscard]] constexpr std::string_view CameraErrorToString(CameraError error) noexcept {
  switch (error) {
    case CameraError::kNotFound:
      return "Camera not found";
    case CameraError::kNotStarted:
      return "Camera not started";
    case CameraError::kCaptureError:
      return "Frame capture error";
    case CameraError::kConfigurationError:
      return "Camera configuration error";
  }
  return "Unknown error";
}

/**
 * @brief Information about a camera device.
 */
struct CameraDeviceInfo {
  std::string id;           ///< Unique device identifier.
  std::string description;  ///< Human-readable description.
  bool is_default = false;  ///< Whether this is the default camera.
};

struct CameraConfig {
  std::string device_id;       ///< Device ID to use (empty for default).
  int preferred_width = 1280;  ///< Preferred capture width.
  int preferred_height = 720;  ///< Preferred capture height.
  int preferred_fps = 30;      ///< Preferred frames per second.
};

/**
 * @brief Camera access wrapper using Qt Multimedia.
 * @details Keeps the latest delivered frame converted to BGR.
 */
class Camera final : public QObject {
  Q_OBJECT

public:
  explicit Camera(QObject* parent = nullptr) : QObject(parent) {}

  Camera(const Camera&) = delete;
  Camera(Camera&&) = delete;
  ~Camera() override { Stop(); }

  Camera& operator=(const Camera&) = delete;
  Camera& operator=(Camera&&) = delete;

  [[nodiscard]] static auto AvailableDevices() -> std::vector<CameraDeviceInfo>;

  /**
   * @brief Gets the default camera device info.
   * @return Default camera info, or nullopt if no cameras available.
   */
  [[nodiscard]] static auto DefaultDevice() -> std::optional<CameraDeviceInfo>;

  /**
   * @brief Initializes the camera with the given configuration.
   * @param config Camera configuration.
   * @return Expected void on success, or CameraError on failure.
   */
  [[nodiscard]] auto Initialize(const CameraConfig& config = {}) -> std::expected<void, CameraError>;

  [[nodiscard]] auto Start() -> std::expected<void, CameraError>;
  void Stop();

  /**
   * @brief Returns a copy of the latest frame.
   * @return Frame, kNotStarted while stopped, or kCaptureError before the first frame arrives
   */
  [[nodiscard]] auto CaptureFrame() -> std::expected<Frame, CameraError>;

  [[nodiscard]] bool Active() const noexcept { return active_; }
  [[nodiscard]] bool Initialized() const noexcept { return initialized_; }

  [[nodiscard]] uint64_t FramesCaptured() const noexcept { return frames_captured_; }

  [[nodiscard]] const CameraConfig& Config() const noexcept { return config_; }

signals:
  /**
   * @brief Signal emitted when a new frame is available.
   * @param frame The captured frame.
   */
  void FrameReady(const faceid::Frame& frame);

  void ErrorOccurred(faceid::CameraError error);

private slots:
  void OnVideoFrameChanged(const QVideoFrame& frame);
  void OnCameraError(QCamera::Error error);

private:
  [[nodiscard]] static Frame ConvertFrame(const QVideoFrame& qframe);

  /**
   * @brief Finds a camera device by ID.
   * @param device_id The device ID to find (empty for default).
   * @return The camera device, or nullopt if not found.
   */
  [[nodiscard]] static auto FindDevice(std::string_view device_id) -> std::optional<QCameraDevice>;

  std::unique_ptr<QCamera> camera_;
  std::unique_ptr<QMediaCaptureSession> capture_session_;
  std::unique_ptr<QVideoSink> video_sink_;

  CameraConfig config_;
  Frame last_frame_;

  uint64_t frames_captured_ = 0;
  bool initialized_ = false;
  bool active_ = false;
};

/**
 * @brief FrameSource backed by a Qt Multimedia camera.
 * @details The camera object exists only while the source is open.
 */
class CameraFrameSource final : public QObject, public FrameSource {
  Q_OBJECT

public:
  explicit CameraFrameSource(CameraConfig config = {}, QObject* parent = nullptr)
      : QObject(parent), config_(std::move(config)) {}

  CameraFrameSource(const CameraFrameSource&) = delete;
  CameraFrameSource(CameraFrameSource&&) = delete;
  ~CameraFrameSource() override { Close(); }

  CameraFrameSource& operator=(const CameraFrameSource&) = delete;
  CameraFrameSource& operator=(CameraFrameSource&&) = delete;

  [[nodiscard]] auto Open() -> std::expected<void, FrameSourceError> override;
  [[nodiscard]] auto GrabFrame() -> std::expected<Frame, FrameSourceError> override;
  void Close() noexcept override;
  [[nodiscard]] bool IsOpen() const noexcept override { return camera_ != nullptr; }

  void SetDeviceId(std::string device_id) { config_.device_id = std::move(device_id); }

  [[nodiscard]] const CameraConfig& Config() const noexcept { return config_; }

signals:
  /**
   * @brief Forwards every camera frame while open. Used for the preview.
   */
  void FrameReady(const faceid::Frame& frame);

private:
  CameraConfig config_;
  std::unique_ptr<Camera> camera_;
};

}  // namespace faceid
