#include <faceid/app/image_normalizer.hpp>

#include <faceid/app/loggers.hpp>
#include <faceid/app/orientation.hpp>
#include <faceid/core/assert.hpp>
#include <faceid/core/logger.hpp>
#include <faceid/core/utils/filesystem.hpp>

#include <QBuffer>
#include <QByteArray>
#include <QImage>
#include <QImageReader>

#include <algorithm>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace faceid {

namespace {

[[nodiscard]] PipelineFailure DecodeFailure(const std::filesystem::path& path, std::string_view reason) {
  return {PipelineError::kDecodeError, std::format("{}: {}", path.filename().string(), reason)};
}

[[nodiscard]] PipelineFailure AcquireFailure(AcquireError error) {
  switch (error) {
    case AcquireError::kCancelled:
      return {PipelineError::kNoSelection, {}};
    case AcquireError::kUnavailable:
      return {PipelineError::kDecodeError, "Camera unavailable"};
    case AcquireError::kStorageFailed:
      return {PipelineError::kStorageError, std::string(AcquireErrorToString(error))};
  }
  return {PipelineError::kDecodeError, std::string(AcquireErrorToString(error))};
}

}  // namespace

auto ImageCaptureNormalizer::Acquire(ImageSource& source, SourceKind kind) const
    -> std::expected<CapturedImage, PipelineFailure> {
  auto path = source.Acquire(kind);
  if (!path) {
    if (path.error() == AcquireError::kCancelled) {
      FACEID_DEBUG_LOGGER(kPipelineLogger, "{} selection cancelled", SourceKindToString(kind));
    }
    return std::unexpected(AcquireFailure(path.error()));
  }

  FACEID_INFO_LOGGER(kPipelineLogger, "Acquired {} image: {}", SourceKindToString(kind), path->string());
  return Decode(*path);
}

auto ImageCaptureNormalizer::Decode(const std::filesystem::path& path) -> std::expected<CapturedImage, PipelineFailure> {
  auto bytes = utils::ReadFileToBytes(path);
  if (!bytes) {
    return std::unexpected(DecodeFailure(path, utils::FileErrorToString(bytes.error())));
  }

  QByteArray data(static_cast<qsizetype>(bytes->size()), Qt::Uninitialized);
  std::ranges::copy(*bytes, data.begin());
  QBuffer buffer(&data);
  if (!buffer.open(QIODevice::ReadOnly)) {
    return std::unexpected(DecodeFailure(path, "Could not open buffer"));
  }

  QImageReader reader(&buffer);
  reader.setAutoTransform(false);
  const QImageIOHandler::Transformations transformations = reader.transformation();

  const QImage image = reader.read();
  if (image.isNull()) {
    return std::unexpected(DecodeFailure(path, reader.errorString().toStdString()));
  }

  CapturedImage captured;
  captured.path = path;
  captured.pixels = Frame::FromQImage(image);
  captured.orientation = OrientationFromTransformations(transformations);
  captured.encoded = std::move(*bytes);

  if (captured.pixels.Empty()) {
    return std::unexpected(DecodeFailure(path, "Empty image"));
  }

  FACEID_DEBUG_LOGGER(kPipelineLogger, "Decoded {}x{} image, orientation {}", captured.Width(), captured.Height(),
                      OrientationToString(captured.orientation));
  return captured;
}

auto ImageCaptureNormalizer::NormalizeOrientation(CapturedImage image) const
    -> std::expected<CapturedImage, PipelineFailure> {
  if (image.orientation == Orientation::kNormal) {
    return image;
  }

  Frame upright = ApplyOrientation(image.pixels, image.orientation);
  auto written = upright.WriteJpeg(image.path, config_.jpeg_quality);
  if (!written) {
    return std::unexpected(PipelineFailure{
        PipelineError::kStorageError,
        std::format("{}: {}", image.path.filename().string(), utils::FileErrorToString(written.error()))});
  }

  FACEID_INFO_LOGGER(kPipelineLogger, "Rewrote {} upright ({} -> {}x{})", image.path.filename().string(),
                     OrientationToString(image.orientation), upright.Width(), upright.Height());

  image.pixels = std::move(upright);
  image.orientation = Orientation::kNormal;
  image.encoded = std::move(*written);
  return image;
}

auto ImageCaptureNormalizer::DetectAndCrop(const CapturedImage& image, FaceLocator& locator) const
    -> std::expected<DetectionOutcome, PipelineFailure> {
  FACEID_ASSERT(image.orientation == Orientation::kNormal, "Image must be normalized before detection");

  auto faces = locator.Locate(image.pixels);
  if (!faces) {
    return std::unexpected(
        PipelineFailure{PipelineError::kDetectionFailed, std::string(FaceLocatorErrorToString(faces.error()))});
  }

  if (faces->empty()) {
    FACEID_INFO_LOGGER(kPipelineLogger, "No face found in {}", image.path.filename().string());
    return DetectionOutcome{.image = {.path = image.path,
                                      .encoded = image.encoded,
                                      .width = image.Width(),
                                      .height = image.Height()},
                            .face = std::nullopt};
  }

  const FaceBoundingBox& first = faces->front().box;
  const auto box = ClampToImage(first, image.Width(), image.Height());
  if (!box) {
    return std::unexpected(PipelineFailure{PipelineError::kDetectionFailed, "Image has no pixels"});
  }
  if (!first.InsideImage(image.Width(), image.Height())) {
    FACEID_DEBUG_LOGGER(kPipelineLogger, "Face box ({}, {}, {}x{}) exceeds the {}x{} image, clamped", first.left,
                        first.top, first.width, first.height, image.Width(), image.Height());
  }

  const Frame cropped = image.pixels.Crop(box->left, box->top, box->width, box->height);
  const std::filesystem::path cropped_path = CroppedPath(image.path);
  auto written = cropped.WriteJpeg(cropped_path, config_.jpeg_quality);
  if (!written) {
    return std::unexpected(PipelineFailure{
        PipelineError::kStorageError,
        std::format("{}: {}", cropped_path.filename().string(), utils::FileErrorToString(written.error()))});
  }

  FACEID_INFO_LOGGER(kPipelineLogger, "Cropped first of {} face(s) to ({}, {}, {}x{})", faces->size(), box->left,
                     box->top, box->width, box->height);

  return DetectionOutcome{.image = {.path = cropped_path,
                                    .encoded = std::move(*written),
                                    .width = box->width,
                                    .height = box->height},
                          .face = box};
}

void ImageCaptureNormalizer::Submit(const NormalizedImage& image, net::RecognitionTransport& transport,
                                    SubmitCallback callback) const {
  auto bytes = utils::ReadFileToBytes(image.path);
  if (!bytes) {
    callback(std::unexpected(DecodeFailure(image.path, utils::FileErrorToString(bytes.error()))));
    return;
  }

  FACEID_DEBUG_LOGGER(kPipelineLogger, "Submitting {} ({} bytes)", image.path.filename().string(), bytes->size());

  transport.Recognize(std::move(*bytes), [callback = std::move(callback)](net::RecognitionTransport::RecognizeResult result) {
    if (!result) {
      callback(std::unexpected(PipelineFailure::FromTransport(result.error())));
      return;
    }
    callback(std::move(*result));
  });
}

std::filesystem::path ImageCaptureNormalizer::CroppedPath(const std::filesystem::path& original) {
  std::filesystem::path cropped = original;
  cropped += "_cropped.jpg";
  return cropped;
}

}  // namespace faceid
