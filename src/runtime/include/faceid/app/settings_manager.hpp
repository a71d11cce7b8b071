#pragma once

#include <QObject>
#include <QSettings>
#include <QString>

namespace faceid {

/**
 * @brief Persistent GUI preferences stored with QSettings.
 * @details Every setter persists the new value immediately and emits its change signal.
 */
class SettingsManager final : public QObject {
  Q_OBJECT

  Q_PROPERTY(
      float confidenceThreshold READ confidenceThreshold WRITE setConfidenceThreshold NOTIFY confidenceThresholdChanged)
  Q_PROPERTY(QString modelType READ modelType WRITE setModelType NOTIFY modelTypeChanged)
  Q_PROPERTY(int streamIntervalMs READ streamIntervalMs WRITE setStreamIntervalMs NOTIFY streamIntervalMsChanged)
  Q_PROPERTY(int jpegQuality READ jpegQuality WRITE setJpegQuality NOTIFY jpegQualityChanged)
  Q_PROPERTY(QString lastCameraId READ lastCameraId WRITE setLastCameraId NOTIFY lastCameraIdChanged)
  Q_PROPERTY(QString lastGalleryDir READ lastGalleryDir WRITE setLastGalleryDir NOTIFY lastGalleryDirChanged)

public:
  static constexpr float kDefaultConfidenceThreshold = 0.5F;
  static constexpr int kDefaultStreamIntervalMs = 1000;
  static constexpr int kMinStreamIntervalMs = 100;
  static constexpr int kDefaultJpegQuality = 95;

  /**
   * @brief Uses the platform settings store of the application.
   */
  explicit SettingsManager(QObject* parent = nullptr);

  /**
   * @brief Uses an INI file.
   * @param file_path Settings file
   */
  explicit SettingsManager(const QString& file_path, QObject* parent = nullptr);

  ~SettingsManager() override = default;

  SettingsManager(const SettingsManager&) = delete;
  SettingsManager(SettingsManager&&) = delete;
  SettingsManager& operator=(const SettingsManager&) = delete;
  SettingsManager& operator=(SettingsManager&&) = delete;

  [[nodiscard]] float confidenceThreshold() const noexcept { return confidence_threshold_; }
  [[nodiscard]] QString modelType() const { return model_type_; }
  [[nodiscard]] int streamIntervalMs() const noexcept { return stream_interval_ms_; }
  [[nodiscard]] int jpegQuality() const noexcept { return jpeg_quality_; }
  [[nodiscard]] QString lastCameraId() const { return last_camera_id_; }
  [[nodiscard]] QString lastGalleryDir() const { return last_gallery_dir_; }

  /// Clamped to [0, 1].
  void setConfidenceThreshold(float threshold);

  /// Unknown model keys are ignored.
  void setModelType(const QString& type);

  /// Clamped to at least kMinStreamIntervalMs.
  void setStreamIntervalMs(int interval_ms);

  /// Clamped to [1, 100].
  void setJpegQuality(int quality);

  void setLastCameraId(const QString& id);
  void setLastGalleryDir(const QString& dir);

  Q_INVOKABLE void load();
  Q_INVOKABLE void save();
  Q_INVOKABLE void resetToDefaults();

  [[nodiscard]] QString fileName() const { return settings_.fileName(); }

signals:
  void confidenceThresholdChanged();
  void modelTypeChanged();
  void streamIntervalMsChanged();
  void jpegQualityChanged();
  void lastCameraIdChanged();
  void lastGalleryDirChanged();

private:
  void EmitAllChanged();

  QSettings settings_;

  float confidence_threshold_{kDefaultConfidenceThreshold};
  QString model_type_{QStringLiteral("yunet")};
  int stream_interval_ms_{kDefaultStreamIntervalMs};
  int jpeg_quality_{kDefaultJpegQuality};
  QString last_camera_id_;
  QString last_gallery_dir_;
};

}  // namespace faceid
