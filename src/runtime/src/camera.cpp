#include <faceid/app/camera.hpp>

#include <faceid/core/logger.hpp>

#include <QCamera>
#include <QImage>
#include <QMediaCaptureSession>
#include <QMediaDevices>
#include <QObject>
#include <QVideoFrame>
#include <QVideoSink>

#include <cstdlib>
#include <exception>
#include <expected>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace faceid {

namespace {

[[nodiscard]] CameraDeviceInfo ToDeviceInfo(const QCameraDevice& device, bool is_default) {
  return {.id = device.id().toStdString(), .description = device.description().toStdString(), .is_default = is_default};
}

[[nodiscard]] QCameraFormat SelectFormat(const QList<QCameraFormat>& formats, const CameraConfig& config) {
  QCameraFormat best_format = formats.first();
  int best_score = std::numeric_limits<int>::max();

  for (const auto& format : formats) {
    const int width_diff = std::abs(format.resolution().width() - config.preferred_width);
    const int height_diff = std::abs(format.resolution().height() - config.preferred_height);
    const int fps_diff = std::abs(static_cast<int>(format.maxFrameRate()) - config.preferred_fps);
    const int score = width_diff + height_diff + fps_diff * 10;

    if (score < best_score) {
      best_score = score;
      best_format = format;
    }
  }
  return best_format;
}

}  // namespace

auto Camera::AvailableDevices() -> std::vector<CameraDeviceInfo> {
  const auto qt_devices = QMediaDevices::videoInputs();
  const auto default_device = QMediaDevices::defaultVideoInput();

  std::vector<CameraDeviceInfo> devices;
  devices.reserve(static_cast<size_t>(qt_devices.size()));
  for (const auto& device : qt_devices) {
    devices.push_back(ToDeviceInfo(device, device == default_device));
  }
  return devices;
}

auto Camera::DefaultDevice() -> std::optional<CameraDeviceInfo> {
  const auto device = QMediaDevices::defaultVideoInput();
  if (device.isNull()) {
    return std::nullopt;
  }
  return ToDeviceInfo(device, true);
}

auto Camera::Initialize(const CameraConfig& config) -> std::expected<void, CameraError> {
  if (initialized_) {
    Stop();
  }

  config_ = config;

  auto device = FindDevice(config_.device_id);
  if (!device) {
    FACEID_ERROR("Camera device not found: {}", config_.device_id.empty() ? "default" : config_.device_id);
    return std::unexpected(CameraError::kNotFound);
  }

  try {
    camera_ = std::make_unique<QCamera>(*device);
    video_sink_ = std::make_unique<QVideoSink>();
    capture_session_ = std::make_unique<QMediaCaptureSession>();
    capture_session_->setCamera(camera_.get());
    capture_session_->setVideoSink(video_sink_.get());

    connect(video_sink_.get(), &QVideoSink::videoFrameChanged, this, &Camera::OnVideoFrameChanged);
    connect(camera_.get(), &QCamera::errorOccurred, this, &Camera::OnCameraError);

    const auto formats = device->videoFormats();
    if (!formats.isEmpty()) {
      const QCameraFormat format = SelectFormat(formats, config_);
      camera_->setCameraFormat(format);
      FACEID_INFO("Camera configured: {}x{} @ {} fps", format.resolution().width(), format.resolution().height(),
                  static_cast<int>(format.maxFrameRate()));
    }

    last_frame_ = Frame();
    initialized_ = true;
    FACEID_INFO("Camera initialized: {}", device->description().toStdString());
    return {};
  } catch (const std::exception& e) {
    FACEID_ERROR("Failed to initialize camera: {}", e.what());
    return std::unexpected(CameraError::kConfigurationError);
  }
}

auto Camera::Start() -> std::expected<void, CameraError> {
  if (!initialized_) {
    FACEID_ERROR("Cannot start: camera not initialized");
    return std::unexpected(CameraError::kNotStarted);
  }

  if (active_) {
    return {};
  }

  camera_->start();
  active_ = true;
  FACEID_INFO("Camera started");
  return {};
}

void Camera::Stop() {
  if (!active_) {
    return;
  }

  if (camera_) [[likely]] {
    camera_->stop();
  }

  active_ = false;
  FACEID_INFO("Camera stopped (captured: {})", frames_captured_);
}

auto Camera::CaptureFrame() -> std::expected<Frame, CameraError> {
  if (!initialized_ || !active_) {
    return std::unexpected(CameraError::kNotStarted);
  }

  if (last_frame_.Empty()) {
    return std::unexpected(CameraError::kCaptureError);
  }

  return last_frame_.Clone();
}

void Camera::OnVideoFrameChanged(const QVideoFrame& frame) {
  if (!frame.isValid()) [[unlikely]] {
    return;
  }

  Frame converted = ConvertFrame(frame);
  if (converted.Empty()) {
    return;
  }

  last_frame_ = std::move(converted);
  ++frames_captured_;
  emit FrameReady(last_frame_);
}

void Camera::OnCameraError(QCamera::Error error) {
  if (error == QCamera::NoError) {
    return;
  }

  FACEID_ERROR("Camera error: {}", camera_ ? camera_->errorString().toStdString() : std::string("unknown"));
  emit ErrorOccurred(CameraError::kCaptureError);
}

Frame Camera::ConvertFrame(const QVideoFrame& qframe) {
  const QImage image = qframe.toImage();
  if (image.isNull()) {
    FACEID_WARN("Failed to convert video frame to image");
    return {};
  }
  return Frame::FromQImage(image);
}

auto Camera::FindDevice(std::string_view device_id) -> std::optional<QCameraDevice> {
  const auto devices = QMediaDevices::videoInputs();

  if (device_id.empty()) {
    const auto default_device = QMediaDevices::defaultVideoInput();
    if (!default_device.isNull()) {
      return default_device;
    }
    if (!devices.isEmpty()) {
      return devices.first();
    }
    return std::nullopt;
  }

  for (const auto& device : devices) {
    if (device.id().toStdString() == device_id) {
      return device;
    }
  }
  return std::nullopt;
}

auto CameraFrameSource::Open() -> std::expected<void, FrameSourceError> {
  if (camera_) {
    return std::unexpected(FrameSourceError::kBusy);
  }

  auto camera = std::make_unique<Camera>();
  if (auto result = camera->Initialize(config_); !result) {
    FACEID_ERROR("Failed to initialize camera: {}", CameraErrorToString(result.error()));
    return std::unexpected(FrameSourceError::kUnavailable);
  }

  if (auto result = camera->Start(); !result) {
    FACEID_ERROR("Failed to start camera: {}", CameraErrorToString(result.error()));
    return std::unexpected(FrameSourceError::kUnavailable);
  }

  connect(camera.get(), &Camera::FrameReady, this, &CameraFrameSource::FrameReady);
  camera_ = std::move(camera);
  return {};
}

auto CameraFrameSource::GrabFrame() -> std::expected<Frame, FrameSourceError> {
  if (!camera_) {
    return std::unexpected(FrameSourceError::kUnavailable);
  }

  auto frame = camera_->CaptureFrame();
  if (!frame) {
    return std::unexpected(frame.error() == CameraError::kCaptureError ? FrameSourceError::kNoFrame
                                                                        : FrameSourceError::kUnavailable);
  }
  return std::move(*frame);
}

void CameraFrameSource::Close() noexcept {
  if (!camera_) {
    return;
  }

  camera_->disconnect(this);
  camera_->Stop();
  camera_.reset();
}

}  // namespace faceid
