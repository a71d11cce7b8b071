#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/capture_pipeline.hpp>
#include <faceid/app/frame.hpp>
#include <faceid/app/image_source.hpp>
#include <faceid/app/notice.hpp>
#include <faceid/app/pipeline_error.hpp>

#include <QString>
#include <QWidget>

class QComboBox;
class QDoubleSpinBox;
class QLabel;
class QPushButton;
class QSpinBox;

namespace faceid {

class CameraFrameSource;
class SettingsManager;
class StreamSession;

/**
 * @brief Main window of the GUI client.
 * @details A thin layer over CapturePipeline and StreamSession: buttons start runs, the pipeline state
 * enables and disables them, notices become message boxes. The preferences group edits SettingsManager;
 * a model change applies on the next start.
 */
class RecognitionWindow final : public QWidget, public NoticeSink {
  Q_OBJECT

public:
  explicit RecognitionWindow(QWidget* parent = nullptr);

  RecognitionWindow(const RecognitionWindow&) = delete;
  RecognitionWindow(RecognitionWindow&&) = delete;
  ~RecognitionWindow() override = default;

  RecognitionWindow& operator=(const RecognitionWindow&) = delete;
  RecognitionWindow& operator=(RecognitionWindow&&) = delete;

  /**
   * @brief Connects the widgets to the application objects.
   * @warning Every argument must outlive the window's use of it. Call once.
   */
  void Bind(CapturePipeline& pipeline, StreamSession& stream, CameraFrameSource& camera, QtImageSource& images,
            SettingsManager& settings);

  void ShowNotice(const UserNotice& notice) override;

  [[nodiscard]] QString ResultText() const;

private:
  void BuildLayout();
  void PopulateCameras();
  void StartRun(SourceKind kind);
  void OnPipelineState(PipelineState state);
  void OnStreamActive(bool active);
  void UpdatePreview(const Frame& frame);
  void ConnectPreferences();
  void SyncPreferences();

  CapturePipeline* pipeline_ = nullptr;
  StreamSession* stream_ = nullptr;
  CameraFrameSource* camera_ = nullptr;
  QtImageSource* images_ = nullptr;
  SettingsManager* settings_ = nullptr;

  QLabel* preview_ = nullptr;
  QLabel* result_ = nullptr;
  QLabel* status_ = nullptr;
  QComboBox* camera_select_ = nullptr;
  QPushButton* gallery_button_ = nullptr;
  QPushButton* camera_button_ = nullptr;
  QPushButton* start_stream_button_ = nullptr;
  QPushButton* stop_stream_button_ = nullptr;

  QComboBox* model_select_ = nullptr;
  QDoubleSpinBox* confidence_spin_ = nullptr;
  QSpinBox* interval_spin_ = nullptr;
  QSpinBox* jpeg_quality_spin_ = nullptr;
  QPushButton* reset_settings_button_ = nullptr;

  bool has_cameras_ = true;
};

}  // namespace faceid
