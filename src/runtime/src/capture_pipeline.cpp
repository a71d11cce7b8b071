#include <faceid/app/capture_pipeline.hpp>

#include <faceid/app/loggers.hpp>
#include <faceid/core/logger.hpp>

#include <expected>
#include <memory>
#include <string>
#include <utility>

namespace faceid {

void CapturePipeline::Run(SourceKind kind, RunCallback on_complete) {
  if (state_ != PipelineState::kIdle) {
    FACEID_WARN_LOGGER(kPipelineLogger, "Ignoring {} request while {}", SourceKindToString(kind),
                       PipelineStateToString(state_));
    if (on_complete) {
      on_complete(std::unexpected(PipelineFailure{PipelineError::kBusy, {}}));
    }
    return;
  }

  TransitionTo(PipelineState::kCapturing);
  auto captured = normalizer_.Acquire(source_, kind);
  if (!captured) {
    Fail(captured.error(), on_complete);
    return;
  }

  TransitionTo(PipelineState::kDetecting);
  auto upright = normalizer_.NormalizeOrientation(std::move(*captured));
  if (!upright) {
    Fail(upright.error(), on_complete);
    return;
  }
  if (image_observer_) {
    image_observer_(*upright);
  }

  auto outcome = normalizer_.DetectAndCrop(*upright, locator_);
  if (!outcome) {
    Fail(outcome.error(), on_complete);
    return;
  }

  if (!outcome->FaceFound()) {
    Fail({PipelineError::kNoFaceDetected, "No face was found in the image. Try another photo."}, on_complete);
    return;
  }

  TransitionTo(PipelineState::kSubmitting);
  normalizer_.Submit(outcome->image, transport_,
                     [this, alive = std::weak_ptr<bool>(alive_), on_complete = std::move(on_complete)](
                         SubmitResult result) {
                       if (alive.expired()) {
                         return;
                       }
                       if (!result) {
                         Fail(result.error(), on_complete);
                         return;
                       }
                       Complete(*result, on_complete);
                     });
}

void CapturePipeline::TransitionTo(PipelineState state) {
  if (state == state_) {
    return;
  }

  FACEID_DEBUG_LOGGER(kPipelineLogger, "{} -> {}", PipelineStateToString(state_), PipelineStateToString(state));
  state_ = state;
  if (state_observer_) {
    state_observer_(state_);
  }
}

void CapturePipeline::Fail(const PipelineFailure& failure, const RunCallback& on_complete) {
  if (IsSilent(failure.code)) {
    FACEID_DEBUG_LOGGER(kPipelineLogger, "Run ended: {}", PipelineErrorToString(failure.code));
  } else {
    ++runs_failed_;
    FACEID_WARN_LOGGER(kPipelineLogger, "Run failed: {}: {}", PipelineErrorToString(failure.code), failure.detail);
    notices_.ShowNotice(failure.ToNotice());
  }

  TransitionTo(PipelineState::kIdle);
  if (on_complete) {
    on_complete(std::unexpected(failure));
  }
}

void CapturePipeline::Complete(const net::RecognitionResponse& response, const RunCallback& on_complete) {
  ++runs_completed_;
  FACEID_INFO_LOGGER(kPipelineLogger, "Recognition result: {}", response.message);
  notices_.ShowNotice({.title = "Recognition result", .message = response.message});

  TransitionTo(PipelineState::kIdle);
  if (on_complete) {
    on_complete(response);
  }
}

}  // namespace faceid
