#include <faceid/app/frame_source.hpp>

#include <faceid/core/logger.hpp>

#include <expected>
#include <utility>

namespace faceid {

auto FrameSourceLease::Acquire(FrameSource& source) -> std::expected<FrameSourceLease, FrameSourceError> {
  if (source.IsOpen()) {
    return std::unexpected(FrameSourceError::kBusy);
  }

  if (auto result = source.Open(); !result) {
    FACEID_WARN("Failed to open frame source: {}", FrameSourceErrorToString(result.error()));
    return std::unexpected(result.error());
  }
  return FrameSourceLease(source);
}

void FrameSourceLease::Release() noexcept {
  if (source_ == nullptr) {
    return;
  }
  std::exchange(source_, nullptr)->Close();
}

auto FrameSourceLease::GrabFrame() -> std::expected<Frame, FrameSourceError> {
  if (source_ == nullptr) {
    return std::unexpected(FrameSourceError::kUnavailable);
  }
  return source_->GrabFrame();
}

}  // namespace faceid
