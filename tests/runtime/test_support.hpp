#pragma once

#include <faceid/app/face_data.hpp>
#include <faceid/app/face_locator.hpp>
#include <faceid/app/frame.hpp>
#include <faceid/app/frame_source.hpp>
#include <faceid/app/image_source.hpp>
#include <faceid/net/recognition_transport.hpp>

#include <QEventLoop>
#include <QObject>
#include <QTimer>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace faceid::testing {

/// Left half red, right half blue (BGR).
inline Frame MakeSplitFrame(int width, int height) {
  cv::Mat mat(height, width, CV_8UC3, cv::Scalar(255, 0, 0));
  mat(cv::Rect(0, 0, width / 2, height)).setTo(cv::Scalar(0, 0, 255));
  return Frame(std::move(mat));
}

inline bool IsReddish(const cv::Vec3b& bgr) {
  return bgr[2] > 180 && bgr[0] < 80;
}

inline bool IsBluish(const cv::Vec3b& bgr) {
  return bgr[0] > 180 && bgr[2] < 80;
}

/// Inserts an EXIF APP1 segment with the given orientation tag right after SOI.
inline std::vector<uint8_t> WithExifOrientation(const std::vector<uint8_t>& jpeg, int orientation) {
  const std::vector<uint8_t> payload = {
      'E', 'x', 'i', 'f', 0x00, 0x00,                    // Exif header
      'I', 'I', 0x2A, 0x00, 0x08, 0x00, 0x00, 0x00,      // little endian TIFF header, IFD at 8
      0x01, 0x00,                                        // one entry
      0x12, 0x01, 0x03, 0x00, 0x01, 0x00, 0x00, 0x00,    // Orientation, SHORT, count 1
      static_cast<uint8_t>(orientation), 0x00, 0x00, 0x00,
      0x00, 0x00, 0x00, 0x00,                            // no next IFD
  };
  const size_t length = payload.size() + 2;

  std::vector<uint8_t> result;
  result.reserve(jpeg.size() + length + 2);
  result.insert(result.end(), jpeg.begin(), jpeg.begin() + 2);
  result.push_back(0xFF);
  result.push_back(0xE1);
  result.push_back(static_cast<uint8_t>(length >> 8));
  result.push_back(static_cast<uint8_t>(length & 0xFF));
  result.insert(result.end(), payload.begin(), payload.end());
  result.insert(result.end(), jpeg.begin() + 2, jpeg.end());
  return result;
}

inline cv::Mat DecodeBytes(const std::vector<uint8_t>& bytes) {
  return cv::imdecode(cv::Mat(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t*>(bytes.data())),
                      cv::IMREAD_COLOR);
}

/// Runs the event loop until done() turns true or the deadline passes.
template <typename Done>
bool SpinUntil(Done done, std::chrono::milliseconds deadline = std::chrono::milliseconds(5000)) {
  QEventLoop loop;
  QTimer timeout;
  timeout.setSingleShot(true);
  QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
  timeout.start(deadline);

  QTimer poll;
  QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
    if (done()) {
      loop.quit();
    }
  });
  poll.start(5);

  if (!done()) {
    loop.exec();
  }
  return done();
}

class FakeFaceLocator final : public FaceLocator {
public:
  auto Locate(const Frame& frame) -> std::expected<std::vector<FaceDetection>, FaceLocatorError> override {
    ++calls;
    last_width = frame.Width();
    last_height = frame.Height();
    if (error.has_value()) {
      return std::unexpected(*error);
    }
    return detections;
  }

  std::vector<FaceDetection> detections;
  std::optional<FaceLocatorError> error;
  size_t calls = 0;
  int last_width = 0;
  int last_height = 0;
};

class FakeImageSource final : public ImageSource {
public:
  auto Acquire(SourceKind kind) -> std::expected<std::filesystem::path, AcquireError> override {
    ++calls;
    last_kind = kind;
    return answer;
  }

  std::expected<std::filesystem::path, AcquireError> answer = std::unexpected(AcquireError::kCancelled);
  size_t calls = 0;
  std::optional<SourceKind> last_kind;
};

class FakeFrameSource final : public FrameSource {
public:
  auto Open() -> std::expected<void, FrameSourceError> override {
    ++opens;
    if (fail_open) {
      return std::unexpected(FrameSourceError::kUnavailable);
    }
    open_ = true;
    return {};
  }

  auto GrabFrame() -> std::expected<Frame, FrameSourceError> override {
    if (!open_) {
      return std::unexpected(FrameSourceError::kUnavailable);
    }
    if (frame.Empty()) {
      return std::unexpected(FrameSourceError::kNoFrame);
    }
    ++grabs;
    return frame;
  }

  void Close() noexcept override {
    if (open_) {
      ++closes;
    }
    open_ = false;
  }

  [[nodiscard]] bool IsOpen() const noexcept override { return open_; }

  Frame frame;
  bool fail_open = false;
  size_t opens = 0;
  size_t closes = 0;
  size_t grabs = 0;

private:
  bool open_ = false;
};

/// Records requests. Answers immediately unless deferred.
class FakeTransport final : public net::RecognitionTransport {
public:
  void StartStream(StartStreamCallback callback) override {
    ++start_calls;
    if (defer) {
      pending_start.push_back(std::move(callback));
      return;
    }
    callback(start_result);
  }

  void Recognize(std::vector<uint8_t> image_bytes, RecognizeCallback callback) override {
    bodies.push_back(std::move(image_bytes));
    if (defer) {
      pending_recognize.push_back(std::move(callback));
      return;
    }
    callback(recognize_result);
  }

  [[nodiscard]] bool IsConfigured() const noexcept override { return true; }

  [[nodiscard]] size_t RecognizeCalls() const noexcept { return bodies.size(); }

  void CompletePending() {
    auto starts = std::exchange(pending_start, {});
    for (auto& callback : starts) {
      callback(start_result);
    }
    auto recognizes = std::exchange(pending_recognize, {});
    for (auto& callback : recognizes) {
      callback(recognize_result);
    }
  }

  StartStreamResult start_result = net::StreamStartResponse{.message = "stream started"};
  RecognizeResult recognize_result = net::RecognitionResponse{.message = "Hello, Alice", .identity = "alice"};
  bool defer = false;

  size_t start_calls = 0;
  std::vector<std::vector<uint8_t>> bodies;
  std::vector<StartStreamCallback> pending_start;
  std::vector<RecognizeCallback> pending_recognize;
};

}  // namespace faceid::testing
