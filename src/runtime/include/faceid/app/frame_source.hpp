#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/frame.hpp>

#include <cstdint>
#include <expected>
#include <string_view>
#include <utility>

namespace faceid {

/**
 * @brief Error codes for live frame sources.
 */
enum class FrameSourceError : uint8_t {
  kUnavailable,  ///< The device could not be opened.
  kNoFrame,      ///< The device is open but has not delivered a frame yet.
  kBusy          ///< The device is already held by another lease.
};

[[nodiscard]] constexpr std::string_view FrameSourceErrorToString(FrameSourceError error) noexcept {
  switch (error) {
    case FrameSourceError::kUnavailable:
      return "Camera unavailable";
    case FrameSourceError::kNoFrame:
      return "No frame available";
    case FrameSourceError::kBusy:
      return "Camera busy";
  }
  return "Unknown error";
}

/**
 * @brief Live camera that delivers frames on demand.
 */
class FrameSource {
public:
  virtual ~FrameSource() = default;

  [[nodiscard]] virtual auto Open() -> std::expected<void, FrameSourceError> = 0;

  /**
   * @brief Returns a copy of the most recent frame.
   */
  [[nodiscard]] virtual auto GrabFrame() -> std::expected<Frame, FrameSourceError> = 0;

  virtual void Close() noexcept = 0;

  [[nodiscard]] virtual bool IsOpen() const noexcept = 0;
};

/**
 * @brief Scoped ownership of an open FrameSource.
 * @details The source is closed when the lease is destroyed or released, on every exit path.
 */
class FrameSourceLease {
public:
  FrameSourceLease() noexcept = default;
  FrameSourceLease(const FrameSourceLease&) = delete;
  FrameSourceLease(FrameSourceLease&& other) noexcept : source_(std::exchange(other.source_, nullptr)) {}
  ~FrameSourceLease() noexcept { Release(); }

  FrameSourceLease& operator=(const FrameSourceLease&) = delete;
  FrameSourceLease& operator=(FrameSourceLease&& other) noexcept;

  /**
   * @brief Opens the source and takes ownership of it.
   * @param source Source to open, must outlive the lease
   * @return Lease, or kBusy if the source is already open
   */
  [[nodiscard]] static auto Acquire(FrameSource& source) -> std::expected<FrameSourceLease, FrameSourceError>;

  /**
   * @brief Closes the source early. Does nothing for an empty lease.
   */
  void Release() noexcept;

  [[nodiscard]] auto GrabFrame() -> std::expected<Frame, FrameSourceError>;

  [[nodiscard]] bool Active() const noexcept { return source_ != nullptr; }
  explicit operator bool() const noexcept { return Active(); }

private:
  explicit FrameSourceLease(FrameSource& source) noexcept : source_(&source) {}

  FrameSource* source_ = nullptr;
};

inline FrameSourceLease& FrameSourceLease::operator=(FrameSourceLease&& other) noexcept {
  if (this != &other) {
    Release();
    source_ = std::exchange(other.source_, nullptr);
  }
  return *this;
}

}  // namespace faceid
