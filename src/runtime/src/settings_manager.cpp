#include <faceid/app/settings_manager.hpp>

#include <faceid/app/model_config.hpp>
#include <faceid/core/logger.hpp>

#include <algorithm>

namespace faceid {

namespace {

[[nodiscard]] bool IsKnownModelType(const QString& type) {
  return ParseModelType(type.toStdString()).has_value();
}

}  // namespace

SettingsManager::SettingsManager(QObject* parent) : QObject(parent), settings_("FaceId", "FaceIdClient") {
  load();
}

SettingsManager::SettingsManager(const QString& file_path, QObject* parent)
    : QObject(parent), settings_(file_path, QSettings::IniFormat) {
  load();
}

void SettingsManager::load() {
  confidence_threshold_ =
      std::clamp(settings_.value("detection/confidenceThreshold", kDefaultConfidenceThreshold).toFloat(), 0.0F, 1.0F);

  const QString model_type = settings_.value("detection/modelType", "yunet").toString();
  model_type_ = IsKnownModelType(model_type) ? model_type : QStringLiteral("yunet");

  stream_interval_ms_ =
      std::max(settings_.value("stream/intervalMs", kDefaultStreamIntervalMs).toInt(), kMinStreamIntervalMs);
  jpeg_quality_ = std::clamp(settings_.value("capture/jpegQuality", kDefaultJpegQuality).toInt(), 1, 100);
  last_camera_id_ = settings_.value("lastUsed/cameraId", "").toString();
  last_gallery_dir_ = settings_.value("lastUsed/galleryDir", "").toString();

  FACEID_INFO("Settings loaded: model={}, confidence={:.2f}, interval={} ms, jpeg={}", model_type_.toStdString(),
              confidence_threshold_, stream_interval_ms_, jpeg_quality_);
  EmitAllChanged();
}

void SettingsManager::save() {
  settings_.setValue("detection/confidenceThreshold", confidence_threshold_);
  settings_.setValue("detection/modelType", model_type_);
  settings_.setValue("stream/intervalMs", stream_interval_ms_);
  settings_.setValue("capture/jpegQuality", jpeg_quality_);
  settings_.setValue("lastUsed/cameraId", last_camera_id_);
  settings_.setValue("lastUsed/galleryDir", last_gallery_dir_);
  settings_.sync();

  if (settings_.status() != QSettings::NoError) {
    FACEID_WARN("Failed to save settings to {}", settings_.fileName().toStdString());
  }
}

void SettingsManager::resetToDefaults() {
  FACEID_INFO("Resetting settings to defaults");

  settings_.clear();
  confidence_threshold_ = kDefaultConfidenceThreshold;
  model_type_ = QStringLiteral("yunet");
  stream_interval_ms_ = kDefaultStreamIntervalMs;
  jpeg_quality_ = kDefaultJpegQuality;
  last_camera_id_.clear();
  last_gallery_dir_.clear();

  save();
  EmitAllChanged();
}

void SettingsManager::setConfidenceThreshold(float threshold) {
  threshold = std::clamp(threshold, 0.0F, 1.0F);
  if (confidence_threshold_ != threshold) {
    confidence_threshold_ = threshold;
    save();
    emit confidenceThresholdChanged();
  }
}

void SettingsManager::setModelType(const QString& type) {
  if (!IsKnownModelType(type)) {
    FACEID_WARN("Ignoring unknown model type: {}", type.toStdString());
    return;
  }

  if (model_type_ != type) {
    model_type_ = type;
    save();
    emit modelTypeChanged();
  }
}

void SettingsManager::setStreamIntervalMs(int interval_ms) {
  interval_ms = std::max(interval_ms, kMinStreamIntervalMs);
  if (stream_interval_ms_ != interval_ms) {
    stream_interval_ms_ = interval_ms;
    save();
    emit streamIntervalMsChanged();
  }
}

void SettingsManager::setJpegQuality(int quality) {
  quality = std::clamp(quality, 1, 100);
  if (jpeg_quality_ != quality) {
    jpeg_quality_ = quality;
    save();
    emit jpegQualityChanged();
  }
}

void SettingsManager::setLastCameraId(const QString& id) {
  if (last_camera_id_ != id) {
    last_camera_id_ = id;
    save();
    emit lastCameraIdChanged();
  }
}

void SettingsManager::setLastGalleryDir(const QString& dir) {
  if (last_gallery_dir_ != dir) {
    last_gallery_dir_ = dir;
    save();
    emit lastGalleryDirChanged();
  }
}

void SettingsManager::EmitAllChanged() {
  emit confidenceThresholdChanged();
  emit modelTypeChanged();
  emit streamIntervalMsChanged();
  emit jpegQualityChanged();
  emit lastCameraIdChanged();
  emit lastGalleryDirChanged();
}

}  // namespace faceid
