#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/app_return_code.hpp>
#include <faceid/app/camera.hpp>
#include <faceid/app/capture_pipeline.hpp>
#include <faceid/app/dnn_face_locator.hpp>
#include <faceid/app/image_normalizer.hpp>
#include <faceid/app/image_source.hpp>
#include <faceid/app/model_config.hpp>
#include <faceid/app/notice.hpp>
#include <faceid/app/settings_manager.hpp>
#include <faceid/app/stream_session.hpp>
#include <faceid/net/api_config.hpp>
#include <faceid/net/http_transport.hpp>

#include <QStringList>

#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

class QCoreApplication;

namespace faceid {

class RecognitionWindow;

/**
 * @brief Application configuration.
 */
struct AppConfig {
  /**
   * @brief Options given explicitly on the command line. Those take precedence over saved settings.
   */
  struct ExplicitOptions {
    bool model = false;
    bool confidence = false;
    bool interval = false;
    bool jpeg_quality = false;
    bool camera = false;
  };

  CameraConfig camera;                             ///< Camera configuration.
  ModelConfig model;                               ///< Face detection model.
  StreamConfig stream;                             ///< Periodic stream settings.
  NormalizerConfig normalizer;                     ///< Rewrite and crop settings.
  std::string api_url;                             ///< Overrides API_URL when not empty.
  std::filesystem::path env_file = net::kDefaultEnvFile;  ///< Dotenv file consulted when API_URL is unset.
  std::filesystem::path image;                     ///< Image used for a headless gallery run.
  SourceKind source = SourceKind::kGallery;        ///< Source of a headless run.
  std::chrono::seconds stream_duration{10};        ///< Length of a headless stream run.
  bool headless = false;                           ///< Run without GUI.
  bool stream_mode = false;                        ///< Headless: run the stream instead of a single capture.
  bool verbose = false;                            ///< Enable verbose logging.
  ExplicitOptions explicit_options;

  [[nodiscard]] static AppConfig Default();

  /**
   * @brief Checks option combinations that cannot run.
   * @return Description of the first problem found
   */
  [[nodiscard]] auto Validate() const -> std::expected<void, std::string>;
};

/**
 * @brief Parses command line arguments into configuration.
 * @details Handles --help and --version and exits on unknown options, like QCommandLineParser::process.
 * Invalid option values are logged and replaced by their defaults.
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration
 */
[[nodiscard]] AppConfig ParseArguments(int argc, char** argv);

/**
 * @brief Parses an argument list (program name first) without exiting.
 * @return Parsed configuration, or the parser error text
 */
[[nodiscard]] auto ParseArguments(const QStringList& arguments) -> std::expected<AppConfig, std::string>;

/**
 * @brief Main application class.
 * @details Headless runs perform a single capture (--image or --source camera) or run the stream for a fixed
 * time, then exit. GUI runs show the RecognitionWindow until it is closed.
 */
class App {
public:
  App(int argc, char** argv) : App(argc, argv, ParseArguments(argc, argv)) {}

  /**
   * @brief Constructs the application with explicit configuration.
   * @param argc Argument count
   * @param argv Argument values
   * @param config Application configuration
   */
  App(int argc, char** argv, AppConfig config);

  App(const App&) = delete;
  App(App&&) = delete;
  ~App();

  App& operator=(const App&) = delete;
  App& operator=(App&&) = delete;

  /**
   * @brief Runs the application until it finishes.
   * @return Application return code
   */
  [[nodiscard]] AppReturnCode Run();

  [[nodiscard]] const AppConfig& Config() const noexcept { return config_; }

  [[nodiscard]] static constexpr std::string_view Name() noexcept { return "FaceId Client"; }
  [[nodiscard]] static constexpr std::string_view Version() noexcept { return "0.1.0"; }

private:
  [[nodiscard]] auto Initialize() -> std::expected<void, AppReturnCode>;

  /**
   * @brief Overrides configuration values with saved settings where no option was given.
   */
  void ApplySettings();

  [[nodiscard]] AppReturnCode RunHeadlessCapture();
  [[nodiscard]] AppReturnCode RunHeadlessStream();
  [[nodiscard]] AppReturnCode RunGui();

  AppConfig config_;
  bool use_gui_ = false;

  std::unique_ptr<QCoreApplication> qt_app_;
  std::unique_ptr<SettingsManager> settings_;
  std::unique_ptr<net::HttpTransport> transport_;
  DnnFaceLocator locator_;
  ImageCaptureNormalizer normalizer_;
  std::unique_ptr<CameraFrameSource> camera_;
  std::unique_ptr<QtImageSource> image_source_;
  std::unique_ptr<LogNoticeSink> log_notices_;
  std::unique_ptr<RecognitionWindow> window_;
  std::unique_ptr<CapturePipeline> pipeline_;
  std::unique_ptr<StreamSession> stream_;
};

}  // namespace faceid
