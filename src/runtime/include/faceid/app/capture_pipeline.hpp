#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/captured_image.hpp>
#include <faceid/app/face_locator.hpp>
#include <faceid/app/image_normalizer.hpp>
#include <faceid/app/image_source.hpp>
#include <faceid/app/notice.hpp>
#include <faceid/app/pipeline_error.hpp>
#include <faceid/net/recognition_response.hpp>
#include <faceid/net/recognition_transport.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

namespace faceid {

enum class PipelineState : uint8_t {
  kIdle,       ///< Ready for a new run.
  kCapturing,  ///< Waiting for the picker and decoding.
  kDetecting,  ///< Normalizing and locating the face.
  kSubmitting  ///< Recognition request in flight.
};

[[nodiscard]] constexpr std::string_view PipelineStateToString(PipelineState state) noexcept {
  switch (state) {
    case PipelineState::kIdle:
      return "Idle";
    case PipelineState::kCapturing:
      return "Capturing";
    case PipelineState::kDetecting:
      return "Detecting";
    case PipelineState::kSubmitting:
      return "Submitting";
  }
  return "Unknown";
}

using RunResult = std::expected<net::RecognitionResponse, PipelineFailure>;
using RunCallback = std::function<void(const RunResult& result)>;
using StateObserver = std::function<void(PipelineState state)>;
using ImageObserver = std::function<void(const CapturedImage& image)>;

/**
 * @brief User-triggered capture run: acquire, normalize, detect and crop, submit.
 * @details Idle -> Capturing -> Detecting -> Submitting -> Idle. Any failure returns to Idle.
 * Only one run exists at a time, so at most one request per capture event is in flight.
 * Failures other than a cancelled picker are shown through the NoticeSink, as is the recognition result.
 */
class CapturePipeline {
public:
  /**
   * @param normalizer Image stages
   * @param source Platform picker
   * @param locator Face detector
   * @param transport Recognition backend
   * @param notices Destination of user notices
   * @warning All collaborators must outlive the pipeline.
   */
  CapturePipeline(const ImageCaptureNormalizer& normalizer, ImageSource& source, FaceLocator& locator,
                  net::RecognitionTransport& transport, NoticeSink& notices) noexcept
      : normalizer_(normalizer), source_(source), locator_(locator), transport_(transport), notices_(notices) {}

  CapturePipeline(const CapturePipeline&) = delete;
  CapturePipeline(CapturePipeline&&) = delete;
  ~CapturePipeline() = default;

  CapturePipeline& operator=(const CapturePipeline&) = delete;
  CapturePipeline& operator=(CapturePipeline&&) = delete;

  /**
   * @brief Starts a run.
   * @details Returns to the caller once the request is sent or the run has failed.
   * A run requested while another is active fails with kBusy and leaves the active run untouched.
   * @param kind Camera or gallery
   * @param on_complete Invoked once when the run ends, after the state is back to Idle
   */
  void Run(SourceKind kind, RunCallback on_complete = {});

  void SetStateObserver(StateObserver observer) { state_observer_ = std::move(observer); }

  /// Receives the upright photo of each run, before face detection.
  void SetImageObserver(ImageObserver observer) { image_observer_ = std::move(observer); }

  [[nodiscard]] PipelineState State() const noexcept { return state_; }
  [[nodiscard]] bool Busy() const noexcept { return state_ != PipelineState::kIdle; }

  [[nodiscard]] uint64_t RunsCompleted() const noexcept { return runs_completed_; }
  [[nodiscard]] uint64_t RunsFailed() const noexcept { return runs_failed_; }

private:
  void TransitionTo(PipelineState state);
  void Fail(const PipelineFailure& failure, const RunCallback& on_complete);
  void Complete(const net::RecognitionResponse& response, const RunCallback& on_complete);

  const ImageCaptureNormalizer& normalizer_;
  ImageSource& source_;
  FaceLocator& locator_;
  net::RecognitionTransport& transport_;
  NoticeSink& notices_;

  StateObserver state_observer_;
  ImageObserver image_observer_;
  PipelineState state_ = PipelineState::kIdle;
  uint64_t runs_completed_ = 0;
  uint64_t runs_failed_ = 0;

  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);  ///< Expires with the pipeline.
};

}  // namespace faceid
