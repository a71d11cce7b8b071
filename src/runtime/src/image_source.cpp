#include <faceid/app/image_source.hpp>

#include <faceid/app/loggers.hpp>
#include <faceid/core/logger.hpp>

#include <QDateTime>
#include <QDir>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QFileDialog>
#include <QString>
#include <QTimer>

#include <chrono>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace faceid {

namespace {

constexpr int kFramePollIntervalMs = 30;

[[nodiscard]] std::filesystem::path CaptureDirectory(const ImageSourceConfig& config) {
  if (!config.capture_dir.empty()) {
    return config.capture_dir;
  }
  return std::filesystem::path(QDir::tempPath().toStdString());
}

[[nodiscard]] std::string CaptureFileName() {
  const QString timestamp = QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss_zzz");
  return "capture_" + timestamp.toStdString() + ".jpg";
}

}  // namespace

auto WaitForFrame(FrameSource& source, std::chrono::milliseconds timeout) -> std::expected<Frame, FrameSourceError> {
  QElapsedTimer timer;
  timer.start();

  while (true) {
    auto frame = source.GrabFrame();
    if (frame || frame.error() != FrameSourceError::kNoFrame || timer.elapsed() >= timeout.count()) {
      return frame;
    }

    QEventLoop loop;
    QTimer::singleShot(kFramePollIntervalMs, &loop, &QEventLoop::quit);
    loop.exec();
  }
}

auto QtImageSource::Acquire(SourceKind kind) -> std::expected<std::filesystem::path, AcquireError> {
  switch (kind) {
    case SourceKind::kGallery:
      return AcquireFromGallery();
    case SourceKind::kCamera:
      return AcquireFromCamera();
  }
  return std::unexpected(AcquireError::kCancelled);
}

auto QtImageSource::AcquireFromGallery() -> std::expected<std::filesystem::path, AcquireError> {
  if (!config_.preset_image.empty()) {
    return config_.preset_image;
  }

  if (!config_.interactive) {
    FACEID_DEBUG_LOGGER(kPipelineLogger, "No image preset for non-interactive gallery selection");
    return std::unexpected(AcquireError::kCancelled);
  }

  const QString selected =
      QFileDialog::getOpenFileName(dialog_parent_, QObject::tr("Select a photo"),
                                   QString::fromStdString(config_.gallery_dir.string()),
                                   QObject::tr("Images (*.jpg *.jpeg *.png *.bmp *.webp *.tif *.tiff)"));
  if (selected.isEmpty()) {
    return std::unexpected(AcquireError::kCancelled);
  }

  std::filesystem::path path(selected.toStdString());
  config_.gallery_dir = path.parent_path();
  return path;
}

auto QtImageSource::AcquireFromCamera() -> std::expected<std::filesystem::path, AcquireError> {
  FrameSourceLease lease;
  if (!camera_.IsOpen()) {
    auto acquired = FrameSourceLease::Acquire(camera_);
    if (!acquired) {
      return std::unexpected(AcquireError::kUnavailable);
    }
    lease = std::move(*acquired);
  }

  auto frame = WaitForFrame(camera_, config_.frame_timeout);
  if (!frame) {
    FACEID_WARN_LOGGER(kPipelineLogger, "Camera did not deliver a frame: {}", FrameSourceErrorToString(frame.error()));
    return std::unexpected(AcquireError::kUnavailable);
  }

  const std::filesystem::path directory = CaptureDirectory(config_);
  std::error_code ec;
  if (std::filesystem::create_directories(directory, ec); ec) {
    FACEID_WARN_LOGGER(kPipelineLogger, "Could not create {}: {}", directory.string(), ec.message());
    return std::unexpected(AcquireError::kStorageFailed);
  }

  const std::filesystem::path path = directory / CaptureFileName();
  if (auto written = frame->WriteJpeg(path, config_.jpeg_quality); !written) {
    return std::unexpected(AcquireError::kStorageFailed);
  }

  FACEID_DEBUG_LOGGER(kPipelineLogger, "Camera photo saved to {}", path.string());
  return path;
}

}  // namespace faceid
