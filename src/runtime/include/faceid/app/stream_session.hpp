#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/face_locator.hpp>
#include <faceid/app/frame_source.hpp>
#include <faceid/app/image_normalizer.hpp>
#include <faceid/app/notice.hpp>
#include <faceid/net/recognition_transport.hpp>

#include <QObject>
#include <QString>
#include <QTimer>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace faceid {

struct StreamConfig {
  std::chrono::milliseconds interval{1000};  ///< Time between two captured frames.
  std::filesystem::path frame_path;          ///< File each frame is written to (empty for the temp directory).
  int jpeg_quality = 90;                     ///< Quality of the frame file.

  /**
   * @brief Frame file used when none is configured.
   */
  [[nodiscard]] static std::filesystem::path DefaultFramePath();
};

enum class StreamState : uint8_t {
  kStopped,   ///< No camera held, no timer running.
  kStarting,  ///< Camera held, waiting for the start_stream response.
  kRunning    ///< Timer running.
};

[[nodiscard]] constexpr std::string_view StreamStateToString(StreamState state) noexcept {
  switch (state) {
    case StreamState::kStopped:
      return "Stopped";
    case StreamState::kStarting:
      return "Starting";
    case StreamState::kRunning:
      return "Running";
  }
  return "Unknown";
}

/**
 * @brief Periodic capture from a live camera.
 * @details Start takes the camera, announces the stream to the backend and then submits one frame per interval.
 * Failures inside a tick are logged and the frame is skipped. Stop and destruction stop the timer and release
 * the camera. Responses that arrive after Stop are dropped.
 */
class StreamSession final : public QObject {
  Q_OBJECT

public:
  /**
   * @warning All collaborators must outlive the session.
   */
  StreamSession(FrameSource& camera, FaceLocator& locator, net::RecognitionTransport& transport,
                const ImageCaptureNormalizer& normalizer, NoticeSink& notices, StreamConfig config = {},
                QObject* parent = nullptr);

  StreamSession(const StreamSession&) = delete;
  StreamSession(StreamSession&&) = delete;
  ~StreamSession() override;

  StreamSession& operator=(const StreamSession&) = delete;
  StreamSession& operator=(StreamSession&&) = delete;

  /**
   * @brief Opens the camera and starts the stream.
   * @details Does nothing when already started. A camera that cannot be opened, or a failed
   * start_stream request, is reported through the NoticeSink and leaves the session stopped.
   */
  void Start();

  /**
   * @brief Stops the timer and releases the camera.
   */
  void Stop();

  /**
   * @brief Runs one capture step immediately.
   * @details Ignored unless the session is running.
   */
  void Tick();

  void SetInterval(std::chrono::milliseconds interval);

  [[nodiscard]] StreamState State() const noexcept { return state_; }
  [[nodiscard]] bool Running() const noexcept { return state_ == StreamState::kRunning; }
  [[nodiscard]] bool Active() const noexcept { return state_ != StreamState::kStopped; }

  [[nodiscard]] const StreamConfig& Config() const noexcept { return config_; }

  [[nodiscard]] uint64_t FramesSubmitted() const noexcept { return frames_submitted_; }
  [[nodiscard]] uint64_t FramesSkipped() const noexcept { return frames_skipped_; }
  [[nodiscard]] uint64_t ResultsReceived() const noexcept { return results_received_; }

signals:
  void Started();
  void Stopped();

  /**
   * @brief Emitted for every recognition response of the stream.
   */
  void ResultReceived(const QString& message);

  /**
   * @brief Emitted when a frame was dropped or its request failed.
   */
  void FrameSkipped(const QString& reason);

private:
  void OnStreamStarted(const net::RecognitionTransport::StartStreamResult& result);
  void Skip(std::string_view reason);

  FrameSource& camera_;
  FaceLocator& locator_;
  net::RecognitionTransport& transport_;
  const ImageCaptureNormalizer& normalizer_;
  NoticeSink& notices_;
  StreamConfig config_;

  QTimer timer_;
  FrameSourceLease lease_;
  StreamState state_ = StreamState::kStopped;
  uint64_t generation_ = 0;  ///< Bumped on Stop so late callbacks can be recognized.

  uint64_t frames_submitted_ = 0;
  uint64_t frames_skipped_ = 0;
  uint64_t results_received_ = 0;
};

}  // namespace faceid
