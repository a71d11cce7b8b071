#include <faceid/gui/recognition_window.hpp>

#include <faceid/app/camera.hpp>
#include <faceid/app/loggers.hpp>
#include <faceid/app/model_config.hpp>
#include <faceid/app/settings_manager.hpp>
#include <faceid/app/stream_session.hpp>
#include <faceid/core/assert.hpp>
#include <faceid/core/logger.hpp>

#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QImage>
#include <QLabel>
#include <QMessageBox>
#include <QPixmap>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSpinBox>
#include <QVBoxLayout>

#include <filesystem>
#include <string>
#include <string_view>

namespace faceid {

namespace {

constexpr int kPreviewWidth = 640;
constexpr int kPreviewHeight = 480;
constexpr int kMaxStreamIntervalMs = 60000;

[[nodiscard]] QString ToQString(std::string_view text) {
  return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

}  // namespace

RecognitionWindow::RecognitionWindow(QWidget* parent) : QWidget(parent) {
  setWindowTitle(QStringLiteral("FaceId Client"));
  BuildLayout();
}

void RecognitionWindow::BuildLayout() {
  preview_ = new QLabel(this);
  preview_->setObjectName(QStringLiteral("preview"));
  preview_->setMinimumSize(kPreviewWidth / 2, kPreviewHeight / 2);
  preview_->setAlignment(Qt::AlignCenter);
  preview_->setText(QStringLiteral("No camera preview"));
  preview_->setStyleSheet(QStringLiteral("background-color: black; color: gray;"));

  camera_select_ = new QComboBox(this);
  gallery_button_ = new QPushButton(QStringLiteral("Gallery"), this);
  camera_button_ = new QPushButton(QStringLiteral("Camera"), this);
  start_stream_button_ = new QPushButton(QStringLiteral("Start stream"), this);
  stop_stream_button_ = new QPushButton(QStringLiteral("Stop stream"), this);
  stop_stream_button_->setEnabled(false);

  result_ = new QLabel(this);
  result_->setWordWrap(true);
  result_->setTextInteractionFlags(Qt::TextSelectableByMouse);
  status_ = new QLabel(QStringLiteral("Idle"), this);

  auto* capture_row = new QHBoxLayout();
  capture_row->addWidget(gallery_button_);
  capture_row->addWidget(camera_button_);

  auto* stream_row = new QHBoxLayout();
  stream_row->addWidget(camera_select_, 1);
  stream_row->addWidget(start_stream_button_);
  stream_row->addWidget(stop_stream_button_);

  model_select_ = new QComboBox(this);
  for (const ModelType type : {ModelType::kYuNetONNX, ModelType::kResNet10Caffe}) {
    model_select_->addItem(ToQString(ModelTypeToString(type)), ToQString(ModelTypeKey(type)));
  }
  model_select_->setToolTip(QStringLiteral("Applies on the next start"));

  confidence_spin_ = new QDoubleSpinBox(this);
  confidence_spin_->setRange(0.0, 1.0);
  confidence_spin_->setSingleStep(0.05);
  confidence_spin_->setDecimals(2);

  interval_spin_ = new QSpinBox(this);
  interval_spin_->setRange(SettingsManager::kMinStreamIntervalMs, kMaxStreamIntervalMs);
  interval_spin_->setSingleStep(100);
  interval_spin_->setSuffix(QStringLiteral(" ms"));

  jpeg_quality_spin_ = new QSpinBox(this);
  jpeg_quality_spin_->setRange(1, 100);

  reset_settings_button_ = new QPushButton(QStringLiteral("Reset settings"), this);

  auto* preferences = new QGroupBox(QStringLiteral("Preferences"), this);
  auto* form = new QFormLayout(preferences);
  form->addRow(QStringLiteral("Model"), model_select_);
  form->addRow(QStringLiteral("Confidence"), confidence_spin_);
  form->addRow(QStringLiteral("Stream interval"), interval_spin_);
  form->addRow(QStringLiteral("JPEG quality"), jpeg_quality_spin_);
  form->addRow(reset_settings_button_);

  auto* layout = new QVBoxLayout(this);
  layout->addWidget(preview_, 1);
  layout->addLayout(capture_row);
  layout->addLayout(stream_row);
  layout->addWidget(preferences);
  layout->addWidget(result_);
  layout->addWidget(status_);

  resize(kPreviewWidth, kPreviewHeight + 320);
}

void RecognitionWindow::Bind(CapturePipeline& pipeline, StreamSession& stream, CameraFrameSource& camera,
                             QtImageSource& images, SettingsManager& settings) {
  FACEID_ASSERT(pipeline_ == nullptr, "RecognitionWindow is already bound");

  pipeline_ = &pipeline;
  stream_ = &stream;
  camera_ = &camera;
  images_ = &images;
  settings_ = &settings;

  PopulateCameras();

  pipeline_->SetStateObserver([this](PipelineState state) { OnPipelineState(state); });
  pipeline_->SetImageObserver([this](const CapturedImage& image) { UpdatePreview(image.pixels); });

  connect(gallery_button_, &QPushButton::clicked, this, [this]() { StartRun(SourceKind::kGallery); });
  connect(camera_button_, &QPushButton::clicked, this, [this]() { StartRun(SourceKind::kCamera); });
  connect(start_stream_button_, &QPushButton::clicked, this, [this]() {
    stream_->Start();
    OnStreamActive(stream_->Active());
  });
  connect(stop_stream_button_, &QPushButton::clicked, this, [this]() { stream_->Stop(); });

  connect(stream_, &StreamSession::Started, this, [this]() { status_->setText(QStringLiteral("Streaming")); });
  connect(stream_, &StreamSession::Stopped, this, [this]() { OnStreamActive(false); });
  connect(stream_, &StreamSession::ResultReceived, this, [this](const QString& message) { result_->setText(message); });
  connect(stream_, &StreamSession::FrameSkipped, this,
          [this](const QString& reason) { status_->setText(QStringLiteral("Frame skipped: %1").arg(reason)); });

  connect(camera_, &CameraFrameSource::FrameReady, this, [this](const Frame& frame) { UpdatePreview(frame); });

  connect(camera_select_, &QComboBox::currentIndexChanged, this, [this](int index) {
    if (index < 0) {
      return;
    }
    const QString id = camera_select_->itemData(index).toString();
    camera_->SetDeviceId(id.toStdString());
    settings_->setLastCameraId(id);
  });

  ConnectPreferences();
}

void RecognitionWindow::ConnectPreferences() {
  SyncPreferences();

  connect(model_select_, &QComboBox::currentIndexChanged, this, [this](int index) {
    if (index >= 0) {
      settings_->setModelType(model_select_->itemData(index).toString());
    }
  });
  connect(confidence_spin_, &QDoubleSpinBox::valueChanged, this,
          [this](double value) { settings_->setConfidenceThreshold(static_cast<float>(value)); });
  connect(interval_spin_, &QSpinBox::valueChanged, this, [this](int value) { settings_->setStreamIntervalMs(value); });
  connect(jpeg_quality_spin_, &QSpinBox::valueChanged, this, [this](int value) { settings_->setJpegQuality(value); });
  connect(reset_settings_button_, &QPushButton::clicked, this, [this]() { settings_->resetToDefaults(); });

  connect(settings_, &SettingsManager::modelTypeChanged, this, [this]() { SyncPreferences(); });
  connect(settings_, &SettingsManager::confidenceThresholdChanged, this, [this]() { SyncPreferences(); });
  connect(settings_, &SettingsManager::streamIntervalMsChanged, this, [this]() { SyncPreferences(); });
  connect(settings_, &SettingsManager::jpegQualityChanged, this, [this]() { SyncPreferences(); });
}

void RecognitionWindow::SyncPreferences() {
  const QSignalBlocker model_blocker(model_select_);
  const QSignalBlocker confidence_blocker(confidence_spin_);
  const QSignalBlocker interval_blocker(interval_spin_);
  const QSignalBlocker quality_blocker(jpeg_quality_spin_);

  model_select_->setCurrentIndex(model_select_->findData(settings_->modelType()));
  confidence_spin_->setValue(settings_->confidenceThreshold());
  interval_spin_->setValue(settings_->streamIntervalMs());
  jpeg_quality_spin_->setValue(settings_->jpegQuality());
}

void RecognitionWindow::PopulateCameras() {
  const auto devices = Camera::AvailableDevices();
  const QString last_id = settings_->lastCameraId();

  const QSignalBlocker blocker(camera_select_);
  camera_select_->clear();
  int selected = -1;
  for (const auto& device : devices) {
    const QString id = QString::fromStdString(device.id);
    camera_select_->addItem(QString::fromStdString(device.description), id);
    if (id == last_id || (selected < 0 && last_id.isEmpty() && device.is_default)) {
      selected = camera_select_->count() - 1;
    }
  }

  if (devices.empty()) {
    camera_select_->addItem(QStringLiteral("No camera found"), QString());
    has_cameras_ = false;
    camera_select_->setEnabled(false);
    camera_button_->setEnabled(false);
    start_stream_button_->setEnabled(false);
    FACEID_WARN("No camera devices found");
    return;
  }

  if (selected >= 0) {
    camera_select_->setCurrentIndex(selected);
  }
}

void RecognitionWindow::StartRun(SourceKind kind) {
  if (pipeline_->Busy()) {
    return;
  }

  pipeline_->Run(kind, [this, kind](const RunResult& result) {
    if (result) {
      result_->setText(QString::fromStdString(result->message));
    }
    if (kind == SourceKind::kGallery && !images_->Config().gallery_dir.empty()) {
      settings_->setLastGalleryDir(QString::fromStdString(images_->Config().gallery_dir.string()));
    }
  });
}

void RecognitionWindow::OnPipelineState(PipelineState state) {
  const bool idle = state == PipelineState::kIdle;
  gallery_button_->setEnabled(idle);
  camera_button_->setEnabled(idle && has_cameras_);

  status_->setText(ToQString(PipelineStateToString(state)));
}

void RecognitionWindow::OnStreamActive(bool active) {
  start_stream_button_->setEnabled(!active && has_cameras_);
  stop_stream_button_->setEnabled(active);
  camera_select_->setEnabled(!active && has_cameras_);
  if (!active) {
    status_->setText(QStringLiteral("Stream stopped"));
    preview_->setPixmap(QPixmap());
    preview_->setText(QStringLiteral("No camera preview"));
  }
}

void RecognitionWindow::UpdatePreview(const Frame& frame) {
  if (frame.Empty()) {
    return;
  }

  const QImage image = frame.ToQImage();
  preview_->setPixmap(
      QPixmap::fromImage(image).scaled(preview_->size(), Qt::KeepAspectRatio, Qt::SmoothTransformation));
}

void RecognitionWindow::ShowNotice(const UserNotice& notice) {
  FACEID_INFO_LOGGER(kPipelineLogger, "Notice: {}: {}", notice.title, notice.message);
  QMessageBox::information(this, QString::fromStdString(notice.title), QString::fromStdString(notice.message));
}

QString RecognitionWindow::ResultText() const {
  return result_->text();
}

}  // namespace faceid
