#pragma once

#include <faceid/pch.hpp>

#include <faceid/core/utils/filesystem.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

#include <opencv2/core/mat.hpp>

class QImage;

namespace faceid {

/**
 * @brief Wrapper around a BGR cv::Mat holding decoded pixels.
 * @details Copying a frame copies its pixels.
 */
class Frame {
public:
  Frame() noexcept = default;

  /**
   * @brief Constructs a frame from a cv::Mat.
   * @param mat The OpenCV matrix to wrap (shallow copy).
   */
  explicit Frame(cv::Mat mat) noexcept : mat_(std::move(mat)) {}

  Frame(const Frame& other) : mat_(other.mat_.clone()) {}
  Frame(Frame&& other) noexcept : mat_(std::move(other.mat_)) {}
  ~Frame() noexcept = default;

  Frame& operator=(const Frame& other);
  Frame& operator=(Frame&& other) noexcept;

  /**
   * @brief Converts a QImage of any format to a BGR frame.
   * @param image Source image
   * @return Frame owning its pixels, empty if the image is null
   */
  [[nodiscard]] static Frame FromQImage(const QImage& image);

  /**
   * @brief Converts the frame to an RGB888 QImage owning its pixels.
   * @return Converted image, null if the frame is empty
   */
  [[nodiscard]] QImage ToQImage() const;

  /**
   * @brief Encodes the frame as JPEG.
   * @param quality JPEG quality (0-100)
   * @return Encoded bytes, or std::nullopt if encoding failed
   */
  [[nodiscard]] auto EncodeJpeg(int quality) const -> std::optional<std::vector<uint8_t>>;

  /**
   * @brief Encodes the frame as JPEG and writes it to a file, replacing any existing content.
   * @param path Destination file
   * @param quality JPEG quality (0-100)
   * @return Bytes written, or kWriteFailed if encoding or writing failed
   */
  [[nodiscard]] auto WriteJpeg(const std::filesystem::path& path, int quality) const
      -> std::expected<std::vector<uint8_t>, utils::FileError>;

  /**
   * @brief Copies a rectangular region.
   * @warning The rectangle must lie within the frame.
   * @return New frame owning the region pixels
   */
  [[nodiscard]] Frame Crop(int left, int top, int width, int height) const;

  [[nodiscard]] Frame Clone() const;

  [[nodiscard]] bool Empty() const noexcept { return mat_.empty(); }
  explicit operator bool() const noexcept { return !Empty(); }

  [[nodiscard]] int Width() const noexcept { return mat_.cols; }
  [[nodiscard]] int Height() const noexcept { return mat_.rows; }
  [[nodiscard]] int Channels() const noexcept { return mat_.channels(); }

  [[nodiscard]] cv::Mat& Mat() noexcept { return mat_; }
  [[nodiscard]] const cv::Mat& Mat() const noexcept { return mat_; }

private:
  cv::Mat mat_;
};

inline Frame& Frame::operator=(const Frame& other) {
  if (this != &other) {
    mat_ = other.mat_.clone();
  }
  return *this;
}

inline Frame& Frame::operator=(Frame&& other) noexcept {
  if (this != &other) {
    mat_ = std::move(other.mat_);
  }
  return *this;
}

}  // namespace faceid
