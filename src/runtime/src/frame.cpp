#include <faceid/app/frame.hpp>

#include <faceid/core/assert.hpp>
#include <faceid/core/logger.hpp>
#include <faceid/core/utils/filesystem.hpp>

#include <QImage>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

namespace faceid {

Frame Frame::FromQImage(const QImage& image) {
  if (image.isNull()) {
    return {};
  }

  const QImage rgb = image.convertToFormat(QImage::Format_RGB888);
  const cv::Mat view(rgb.height(), rgb.width(), CV_8UC3, const_cast<uchar*>(rgb.constBits()),
                     static_cast<size_t>(rgb.bytesPerLine()));

  Frame result;
  cv::cvtColor(view, result.mat_, cv::COLOR_RGB2BGR);
  return result;
}

QImage Frame::ToQImage() const {
  if (mat_.empty()) {
    return {};
  }

  cv::Mat rgb;
  cv::cvtColor(mat_, rgb, cv::COLOR_BGR2RGB);
  const QImage view(rgb.data, rgb.cols, rgb.rows, static_cast<qsizetype>(rgb.step), QImage::Format_RGB888);
  return view.copy();
}

auto Frame::EncodeJpeg(int quality) const -> std::optional<std::vector<uint8_t>> {
  if (mat_.empty()) {
    return std::nullopt;
  }

  try {
    std::vector<uint8_t> bytes;
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 0, 100)};
    if (!cv::imencode(".jpg", mat_, bytes, params)) {
      FACEID_ERROR("JPEG encoding failed for {}x{} frame", Width(), Height());
      return std::nullopt;
    }
    return bytes;
  } catch (const cv::Exception& e) {
    FACEID_ERROR("OpenCV exception during JPEG encoding: {}", e.what());
    return std::nullopt;
  }
}

auto Frame::WriteJpeg(const std::filesystem::path& path, int quality) const
    -> std::expected<std::vector<uint8_t>, utils::FileError> {
  auto bytes = EncodeJpeg(quality);
  if (!bytes) {
    return std::unexpected(utils::FileError::kWriteFailed);
  }

  if (auto written = utils::WriteBytesToFile(path, *bytes); !written) {
    FACEID_ERROR("Failed to write {}: {}", path.string(), utils::FileErrorToString(written.error()));
    return std::unexpected(written.error());
  }
  return std::move(*bytes);
}

Frame Frame::Crop(int left, int top, int width, int height) const {
  FACEID_ASSERT(left >= 0 && top >= 0 && width > 0 && height > 0, "Crop rectangle must be non-empty");
  FACEID_ASSERT(left + width <= Width() && top + height <= Height(), "Crop rectangle must lie within the frame");
  return Frame(mat_(cv::Rect(left, top, width, height)).clone());
}

Frame Frame::Clone() const {
  return Frame(mat_.clone());
}

}  // namespace faceid
