#include <faceid/app/app.hpp>

#include <faceid/core/assert.hpp>
#include <faceid/core/logger.hpp>
#include <faceid/gui/recognition_window.hpp>

#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QEventLoop>
#include <QObject>
#include <QTimer>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <print>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace faceid {

namespace {

constexpr int kMaxStreamSeconds = 24 * 60 * 60;

[[nodiscard]] QString ToQString(std::string_view text) {
  return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

void AddOptions(QCommandLineParser& parser) {
  parser.setApplicationDescription(QStringLiteral("Face recognition client"));
  parser.addHelpOption();
  parser.addVersionOption();

  parser.addOptions({
      {QStringLiteral("headless"), QStringLiteral("Run without GUI")},
      {{QStringLiteral("V"), QStringLiteral("verbose")}, QStringLiteral("Enable verbose logging")},
      {QStringLiteral("image"), QStringLiteral("Image to recognize (headless gallery run)"), QStringLiteral("path")},
      {QStringLiteral("source"), QStringLiteral("Headless capture source: camera, gallery"), QStringLiteral("source"),
       QStringLiteral("gallery")},
      {QStringLiteral("stream"), QStringLiteral("Headless: run the periodic camera stream")},
      {QStringLiteral("stream-seconds"), QStringLiteral("Headless stream duration in seconds"),
       QStringLiteral("seconds"), QStringLiteral("10")},
      {QStringLiteral("interval-ms"), QStringLiteral("Stream capture interval in milliseconds"), QStringLiteral("ms"),
       QStringLiteral("1000")},
      {QStringLiteral("api-url"), QStringLiteral("Recognition backend URL (overrides API_URL)"),
       QStringLiteral("url")},
      {QStringLiteral("env-file"), QStringLiteral("Dotenv file consulted when API_URL is unset"),
       QStringLiteral("path"), QStringLiteral(".env")},
      {QStringLiteral("model-type"), QStringLiteral("Face detection model type: yunet, resnet10"),
       QStringLiteral("type"), QStringLiteral("yunet")},
      {QStringLiteral("models-dir"), QStringLiteral("Directory containing the model files"), QStringLiteral("path"),
       QStringLiteral("models")},
      {QStringLiteral("model"), QStringLiteral("Path to face detection model (overrides --model-type)"),
       QStringLiteral("path")},
      {QStringLiteral("config"), QStringLiteral("Path to model configuration"), QStringLiteral("path")},
      {QStringLiteral("confidence"), QStringLiteral("Detection confidence threshold (0.0-1.0)"),
       QStringLiteral("value"), QStringLiteral("0.5")},
      {QStringLiteral("gpu"), QStringLiteral("Use GPU acceleration")},
      {QStringLiteral("camera"), QStringLiteral("Camera device ID"), QStringLiteral("device")},
      {QStringLiteral("jpeg-quality"), QStringLiteral("JPEG quality of written images (1-100)"),
       QStringLiteral("quality"), QStringLiteral("95")},
  });
}

[[nodiscard]] AppConfig ApplyOptions(const QCommandLineParser& parser) {
  auto config = AppConfig::Default();

  config.headless = parser.isSet(QStringLiteral("headless"));
  config.verbose = parser.isSet(QStringLiteral("verbose"));
  config.stream_mode = parser.isSet(QStringLiteral("stream"));
  config.image = parser.value(QStringLiteral("image")).toStdString();
  config.api_url = parser.value(QStringLiteral("api-url")).trimmed().toStdString();
  config.env_file = parser.value(QStringLiteral("env-file")).toStdString();

  const QString source = parser.value(QStringLiteral("source"));
  if (const auto kind = ParseSourceKind(source.toStdString()); kind.has_value()) {
    config.source = *kind;
  } else {
    FACEID_WARN("Unknown source '{}', using default (gallery)", source.toStdString());
  }

  bool ok = false;
  const int stream_seconds = parser.value(QStringLiteral("stream-seconds")).toInt(&ok);
  if (ok && stream_seconds > 0 && stream_seconds <= kMaxStreamSeconds) {
    config.stream_duration = std::chrono::seconds(stream_seconds);
  } else {
    FACEID_WARN("Invalid stream-seconds value, using default ({})", config.stream_duration.count());
  }

  const int interval_ms = parser.value(QStringLiteral("interval-ms")).toInt(&ok);
  if (ok && interval_ms >= SettingsManager::kMinStreamIntervalMs) {
    config.stream.interval = std::chrono::milliseconds(interval_ms);
  } else {
    FACEID_WARN("Invalid interval-ms value, using default ({})", config.stream.interval.count());
  }
  config.explicit_options.interval = parser.isSet(QStringLiteral("interval-ms"));

  const int jpeg_quality = parser.value(QStringLiteral("jpeg-quality")).toInt(&ok);
  if (ok && jpeg_quality >= 1 && jpeg_quality <= 100) {
    config.normalizer.jpeg_quality = jpeg_quality;
    config.stream.jpeg_quality = jpeg_quality;
  } else {
    FACEID_WARN("Invalid jpeg-quality value, using default ({})", config.normalizer.jpeg_quality);
  }
  config.explicit_options.jpeg_quality = parser.isSet(QStringLiteral("jpeg-quality"));

  const std::string models_dir = parser.value(QStringLiteral("models-dir")).toStdString();
  const QString custom_model_path = parser.value(QStringLiteral("model"));
  if (!custom_model_path.isEmpty()) {
    config.model = ModelConfig::Default(models_dir);
    config.model.model_path = custom_model_path.toStdString();
    config.model.config_path = parser.value(QStringLiteral("config")).toStdString();
    if (!config.model.config_path.empty()) {
      config.model.type = ModelType::kResNet10Caffe;
    }
    config.explicit_options.model = true;
  } else {
    const QString model_type = parser.value(QStringLiteral("model-type"));
    auto type = ParseModelType(model_type.toStdString());
    if (!type) {
      FACEID_WARN("Unknown model type '{}', using default (yunet)", model_type.toStdString());
    }
    config.model = ModelConfig::FromType(type.value_or(ModelType::kYuNetONNX), models_dir);
    config.explicit_options.model = parser.isSet(QStringLiteral("model-type"));
  }

  config.model.use_gpu = parser.isSet(QStringLiteral("gpu"));

  const float confidence = parser.value(QStringLiteral("confidence")).toFloat(&ok);
  if (ok && confidence >= 0.0F && confidence <= 1.0F) {
    config.model.confidence_threshold = confidence;
  } else {
    FACEID_WARN("Invalid confidence value, using default ({:.2f})", config.model.confidence_threshold);
  }
  config.explicit_options.confidence = parser.isSet(QStringLiteral("confidence"));

  const QString camera_id = parser.value(QStringLiteral("camera"));
  if (!camera_id.isEmpty()) {
    config.camera.device_id = camera_id.toStdString();
    config.explicit_options.camera = true;
  }

  FACEID_ASSERT(config.model.confidence_threshold >= 0.0F && config.model.confidence_threshold <= 1.0F,
                "Confidence threshold must be in [0, 1] range");
  return config;
}

}  // namespace

AppConfig AppConfig::Default() {
  AppConfig config;
  config.model = ModelConfig::Default();
  config.stream.interval = std::chrono::milliseconds(SettingsManager::kDefaultStreamIntervalMs);
  config.normalizer.jpeg_quality = SettingsManager::kDefaultJpegQuality;
  config.stream.jpeg_quality = SettingsManager::kDefaultJpegQuality;
  return config;
}

auto AppConfig::Validate() const -> std::expected<void, std::string> {
  if (!headless) {
    return {};
  }

  if (stream_mode) {
    if (!image.empty()) {
      return std::unexpected("--image cannot be combined with --stream");
    }
    return {};
  }

  if (source == SourceKind::kGallery && image.empty()) {
    return std::unexpected("Headless gallery runs need --image");
  }
  if (source == SourceKind::kCamera && !image.empty()) {
    return std::unexpected("--image cannot be combined with --source camera");
  }
  return {};
}

AppConfig ParseArguments(int argc, char** argv) {
  // QCommandLineParser::process needs an application instance
  QCoreApplication temp_app(argc, argv);
  temp_app.setApplicationName(ToQString(App::Name()));
  temp_app.setApplicationVersion(ToQString(App::Version()));

  QCommandLineParser parser;
  AddOptions(parser);
  parser.process(temp_app);
  return ApplyOptions(parser);
}

auto ParseArguments(const QStringList& arguments) -> std::expected<AppConfig, std::string> {
  QCommandLineParser parser;
  AddOptions(parser);
  if (!parser.parse(arguments)) {
    return std::unexpected(parser.errorText().toStdString());
  }
  return ApplyOptions(parser);
}

App::App(int argc, char** argv, AppConfig config) : config_(std::move(config)), use_gui_(!config_.headless) {
  // Qt keeps references to argc and argv for the lifetime of the application object
  static std::vector<std::string> arg_storage;
  static std::vector<char*> arg_ptrs;
  static int static_argc = 0;

  if (arg_storage.empty()) {
    arg_storage.reserve(static_cast<size_t>(argc));
    arg_ptrs.reserve(static_cast<size_t>(argc) + 1);
    for (int i = 0; i < argc; ++i) {
      arg_storage.emplace_back(argv[i]);
    }
    for (auto& arg : arg_storage) {
      arg_ptrs.push_back(arg.data());
    }
    arg_ptrs.push_back(nullptr);
    static_argc = argc;
  }

  if (use_gui_) {
    qt_app_ = std::make_unique<QApplication>(static_argc, arg_ptrs.data());
  } else {
    qt_app_ = std::make_unique<QCoreApplication>(static_argc, arg_ptrs.data());
  }

  qt_app_->setApplicationName(ToQString(Name()));
  qt_app_->setApplicationVersion(ToQString(Version()));

  if (config_.verbose) {
    Logger::GetInstance().SetGlobalLevel(LogLevel::kDebug);
  }

  FACEID_INFO("{} v{} initializing... (GUI: {})", Name(), Version(), use_gui_ ? "enabled" : "disabled");
}

App::~App() {
  if (stream_) {
    stream_->Stop();
  }

  if (window_) {
    window_->close();
  }

  FACEID_INFO("{} shutting down", Name());
  Logger::GetInstance().FlushAll();
}

AppReturnCode App::Run() {
  if (auto valid = config_.Validate(); !valid) {
    FACEID_ERROR("Invalid configuration: {}", valid.error());
    return AppReturnCode::kInvalidConfiguration;
  }

  if (auto init = Initialize(); !init) {
    return init.error();
  }

  AppReturnCode code = AppReturnCode::kSuccess;
  if (use_gui_) {
    code = RunGui();
  } else if (config_.stream_mode) {
    code = RunHeadlessStream();
  } else {
    code = RunHeadlessCapture();
  }

  FACEID_INFO("{} finished: {}", Name(), AppReturnCodeToString(code));
  return code;
}

auto App::Initialize() -> std::expected<void, AppReturnCode> {
  if (use_gui_) {
    settings_ = std::make_unique<SettingsManager>();
    ApplySettings();
  }

  net::ApiConfig api = net::ApiConfig::FromEnvironment(config_.env_file);
  if (!config_.api_url.empty()) {
    api = api.WithBaseUrl(config_.api_url);
  }
  if (api.IsConfigured()) {
    FACEID_INFO("Recognition backend: {}", api.base_url);
  }
  transport_ = std::make_unique<net::HttpTransport>(std::move(api));

  if (auto loaded = locator_.Initialize(config_.model); !loaded) {
    FACEID_ERROR("Failed to initialize face locator: {}", FaceLocatorErrorToString(loaded.error()));
    return std::unexpected(AppReturnCode::kModelLoadFailed);
  }

  normalizer_.SetJpegQuality(config_.normalizer.jpeg_quality);
  camera_ = std::make_unique<CameraFrameSource>(config_.camera);

  ImageSourceConfig source_config;
  source_config.preset_image = config_.image;
  source_config.jpeg_quality = config_.normalizer.jpeg_quality;
  source_config.interactive = use_gui_;
  if (settings_) {
    source_config.gallery_dir = settings_->lastGalleryDir().toStdString();
  }

  NoticeSink* notices = nullptr;
  if (use_gui_) {
    window_ = std::make_unique<RecognitionWindow>();
    notices = window_.get();
    image_source_ = std::make_unique<QtImageSource>(*camera_, std::move(source_config), window_.get());
  } else {
    log_notices_ = std::make_unique<LogNoticeSink>();
    notices = log_notices_.get();
    image_source_ = std::make_unique<QtImageSource>(*camera_, std::move(source_config));
  }

  pipeline_ = std::make_unique<CapturePipeline>(normalizer_, *image_source_, locator_, *transport_, *notices);
  stream_ = std::make_unique<StreamSession>(*camera_, locator_, *transport_, normalizer_, *notices, config_.stream);
  return {};
}

void App::ApplySettings() {
  FACEID_ASSERT(settings_ != nullptr, "Settings are only loaded in GUI mode");

  if (!config_.explicit_options.model) {
    if (const auto type = ParseModelType(settings_->modelType().toStdString()); type.has_value()) {
      const auto models_dir = config_.model.model_path.parent_path().string();
      const bool use_gpu = config_.model.use_gpu;
      const float confidence = config_.model.confidence_threshold;
      config_.model = ModelConfig::FromType(*type, models_dir);
      config_.model.use_gpu = use_gpu;
      config_.model.confidence_threshold = confidence;
    }
  }
  if (!config_.explicit_options.confidence) {
    config_.model.confidence_threshold = settings_->confidenceThreshold();
  }
  if (!config_.explicit_options.interval) {
    config_.stream.interval = std::chrono::milliseconds(settings_->streamIntervalMs());
  }
  if (!config_.explicit_options.jpeg_quality) {
    config_.normalizer.jpeg_quality = settings_->jpegQuality();
    config_.stream.jpeg_quality = settings_->jpegQuality();
  }
  if (!config_.explicit_options.camera) {
    config_.camera.device_id = settings_->lastCameraId().toStdString();
  }
}

AppReturnCode App::RunHeadlessCapture() {
  AppReturnCode code = AppReturnCode::kSuccess;
  bool finished = false;
  QEventLoop loop;

  pipeline_->Run(config_.source, [&](const RunResult& result) {
    if (result) {
      std::println("{}", result->message);
    } else {
      code = ToAppReturnCode(result.error().code);
    }
    finished = true;
    loop.quit();
  });

  // The callback may already have run if the run failed before submitting
  if (!finished) {
    loop.exec();
  }
  return code;
}

AppReturnCode App::RunHeadlessStream() {
  if (!transport_->IsConfigured()) {
    FACEID_ERROR("Streaming needs {} or --api-url", net::kApiUrlVariable);
    return AppReturnCode::kApiNotConfigured;
  }

  bool started = false;
  QEventLoop loop;

  QObject::connect(stream_.get(), &StreamSession::Started, &loop, [&started]() { started = true; });
  QObject::connect(stream_.get(), &StreamSession::Stopped, &loop, &QEventLoop::quit);
  QObject::connect(stream_.get(), &StreamSession::ResultReceived, &loop,
                   [](const QString& message) { std::println("{}", message.toStdString()); });

  stream_->Start();
  if (!stream_->Active()) {
    return AppReturnCode::kCameraInitFailed;
  }

  QTimer::singleShot(std::chrono::duration_cast<std::chrono::milliseconds>(config_.stream_duration), &loop,
                     [this]() { stream_->Stop(); });
  loop.exec();

  if (!started) {
    return AppReturnCode::kRecognitionFailed;
  }

  FACEID_INFO("Stream finished: {} submitted, {} results, {} skipped", stream_->FramesSubmitted(),
              stream_->ResultsReceived(), stream_->FramesSkipped());
  return AppReturnCode::kSuccess;
}

AppReturnCode App::RunGui() {
  FACEID_ASSERT(window_ != nullptr, "GUI mode needs a window");

  window_->Bind(*pipeline_, *stream_, *camera_, *image_source_, *settings_);
  QObject::connect(settings_.get(), &SettingsManager::confidenceThresholdChanged, window_.get(),
                   [this]() { locator_.SetConfidenceThreshold(settings_->confidenceThreshold()); });
  QObject::connect(settings_.get(), &SettingsManager::streamIntervalMsChanged, window_.get(), [this]() {
    stream_->SetInterval(std::chrono::milliseconds(settings_->streamIntervalMs()));
  });
  QObject::connect(settings_.get(), &SettingsManager::jpegQualityChanged, window_.get(), [this]() {
    normalizer_.SetJpegQuality(settings_->jpegQuality());
    image_source_->SetJpegQuality(settings_->jpegQuality());
  });

  window_->show();
  const int result = qt_app_->exec();
  stream_->Stop();
  return result == 0 ? AppReturnCode::kSuccess : AppReturnCode::kUnknownError;
}

}  // namespace faceid
