#include <faceid/app/stream_session.hpp>

#include <faceid/app/captured_image.hpp>
#include <faceid/app/loggers.hpp>
#include <faceid/core/logger.hpp>

#include <QDir>
#include <QPointer>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace faceid {

std::filesystem::path StreamConfig::DefaultFramePath() {
  return std::filesystem::path(QDir::tempPath().toStdString()) / "faceid_stream_frame.jpg";
}

StreamSession::StreamSession(FrameSource& camera, FaceLocator& locator, net::RecognitionTransport& transport,
                             const ImageCaptureNormalizer& normalizer, NoticeSink& notices, StreamConfig config,
                             QObject* parent)
    : QObject(parent),
      camera_(camera),
      locator_(locator),
      transport_(transport),
      normalizer_(normalizer),
      notices_(notices),
      config_(std::move(config)) {
  if (config_.frame_path.empty()) {
    config_.frame_path = StreamConfig::DefaultFramePath();
  }

  timer_.setInterval(static_cast<int>(config_.interval.count()));
  connect(&timer_, &QTimer::timeout, this, &StreamSession::Tick);
}

StreamSession::~StreamSession() {
  timer_.stop();
  ++generation_;
  lease_.Release();
}

void StreamSession::Start() {
  if (state_ != StreamState::kStopped) {
    FACEID_DEBUG_LOGGER(kStreamLogger, "Start ignored while {}", StreamStateToString(state_));
    return;
  }

  auto lease = FrameSourceLease::Acquire(camera_);
  if (!lease) {
    FACEID_WARN_LOGGER(kStreamLogger, "Cannot start stream: {}", FrameSourceErrorToString(lease.error()));
    notices_.ShowNotice({.title = "Camera unavailable",
                         .message = std::string(FrameSourceErrorToString(lease.error()))});
    return;
  }

  lease_ = std::move(*lease);
  state_ = StreamState::kStarting;
  const uint64_t generation = ++generation_;
  FACEID_INFO_LOGGER(kStreamLogger, "Starting stream (interval {} ms)", config_.interval.count());

  transport_.StartStream([self = QPointer<StreamSession>(this),
                          generation](net::RecognitionTransport::StartStreamResult result) {
    if (self.isNull() || self->generation_ != generation) {
      return;
    }
    self->OnStreamStarted(result);
  });
}

void StreamSession::OnStreamStarted(const net::RecognitionTransport::StartStreamResult& result) {
  if (!result) {
    const PipelineFailure failure = PipelineFailure::FromTransport(result.error());
    FACEID_WARN_LOGGER(kStreamLogger, "start_stream failed: {}", failure.detail);
    notices_.ShowNotice(failure.ToNotice());
    Stop();
    return;
  }

  if (result->message.has_value()) {
    FACEID_INFO_LOGGER(kStreamLogger, "Stream started: {}", *result->message);
  } else {
    FACEID_INFO_LOGGER(kStreamLogger, "Stream started");
  }

  state_ = StreamState::kRunning;
  timer_.start();
  emit Started();
}

void StreamSession::Stop() {
  if (state_ == StreamState::kStopped) {
    return;
  }

  timer_.stop();
  ++generation_;
  lease_.Release();
  state_ = StreamState::kStopped;

  FACEID_INFO_LOGGER(kStreamLogger, "Stream stopped (submitted: {}, skipped: {}, results: {})", frames_submitted_,
                     frames_skipped_, results_received_);
  emit Stopped();
}

void StreamSession::Tick() {
  if (state_ != StreamState::kRunning) {
    return;
  }

  auto frame = lease_.GrabFrame();
  if (!frame) {
    Skip(FrameSourceErrorToString(frame.error()));
    return;
  }

  auto written = frame->WriteJpeg(config_.frame_path, config_.jpeg_quality);
  if (!written) {
    Skip(utils::FileErrorToString(written.error()));
    return;
  }

  CapturedImage captured;
  captured.path = config_.frame_path;
  captured.pixels = std::move(*frame);
  captured.encoded = std::move(*written);

  auto outcome = normalizer_.DetectAndCrop(captured, locator_);
  if (!outcome) {
    Skip(PipelineErrorToString(outcome.error().code));
    return;
  }

  if (!outcome->FaceFound()) {
    Skip(PipelineErrorToString(PipelineError::kNoFaceDetected));
    return;
  }

  ++frames_submitted_;
  normalizer_.Submit(outcome->image, transport_,
                     [self = QPointer<StreamSession>(this), generation = generation_](SubmitResult result) {
                       if (self.isNull() || self->generation_ != generation) {
                         return;
                       }

                       if (!result) {
                         const PipelineFailure& failure = result.error();
                         const std::string_view reason =
                             failure.detail.empty() ? PipelineErrorToString(failure.code) : std::string_view(failure.detail);
                         self->Skip(reason);
                         return;
                       }

                       ++self->results_received_;
                       FACEID_INFO_LOGGER(kStreamLogger, "Stream result: {}", result->message);
                       emit self->ResultReceived(QString::fromStdString(result->message));
                     });
}

void StreamSession::SetInterval(std::chrono::milliseconds interval) {
  config_.interval = interval;
  timer_.setInterval(static_cast<int>(interval.count()));
}

void StreamSession::Skip(std::string_view reason) {
  ++frames_skipped_;
  FACEID_WARN_LOGGER(kStreamLogger, "Frame skipped: {}", reason);
  emit FrameSkipped(QString::fromUtf8(reason.data(), static_cast<qsizetype>(reason.size())));
}

}  // namespace faceid
