#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/captured_image.hpp>
#include <faceid/app/face_data.hpp>
#include <faceid/app/face_locator.hpp>
#include <faceid/app/image_source.hpp>
#include <faceid/app/pipeline_error.hpp>
#include <faceid/net/recognition_response.hpp>
#include <faceid/net/recognition_transport.hpp>

#include <expected>
#include <filesystem>
#include <functional>
#include <optional>

namespace faceid {

struct NormalizerConfig {
  int jpeg_quality = 95;  ///< Quality of rewritten and cropped files.
};

/**
 * @brief Result of face detection on a captured image.
 */
struct DetectionOutcome {
  NormalizedImage image;                ///< Cropped image, or the untouched original when no face was found.
  std::optional<FaceBoundingBox> face;  ///< Clamped crop rectangle.

  [[nodiscard]] bool FaceFound() const noexcept { return face.has_value(); }
};

using SubmitResult = std::expected<net::RecognitionResponse, PipelineFailure>;
using SubmitCallback = std::function<void(SubmitResult result)>;

/**
 * @brief Turns a captured or selected photo into upright, face-cropped bytes and submits them.
 * @details Stages never retry. Each stage reports failure as a PipelineFailure.
 */
class ImageCaptureNormalizer {
public:
  explicit ImageCaptureNormalizer(NormalizerConfig config = {}) noexcept : config_(config) {}

  /**
   * @brief Asks the picker for a photo and decodes it.
   * @param source Platform picker
   * @param kind Camera or gallery
   * @return Decoded image, or kNoSelection when the picker was cancelled
   */
  [[nodiscard]] auto Acquire(ImageSource& source, SourceKind kind) const -> std::expected<CapturedImage, PipelineFailure>;

  /**
   * @brief Reads and decodes an image file without applying its orientation tag.
   * @param path Image file
   * @return Decoded image with its orientation tag, or kDecodeError
   */
  [[nodiscard]] static auto Decode(const std::filesystem::path& path) -> std::expected<CapturedImage, PipelineFailure>;

  /**
   * @brief Bakes the orientation tag into pixel order.
   * @warning The file at image.path is overwritten in place.
   * @details Images that are already upright are returned untouched, so applying it twice changes nothing.
   * @return Upright image with orientation kNormal
   */
  [[nodiscard]] auto NormalizeOrientation(CapturedImage image) const -> std::expected<CapturedImage, PipelineFailure>;

  /**
   * @brief Runs the locator and crops to the first face.
   * @details Without faces the original file and bytes are returned and no file is written.
   * Otherwise the first face, clamped to the image, is written to CroppedPath(image.path).
   */
  [[nodiscard]] auto DetectAndCrop(const CapturedImage& image, FaceLocator& locator) const
      -> std::expected<DetectionOutcome, PipelineFailure>;

  /**
   * @brief Reads the final bytes from disk and sends exactly one recognition request.
   * @param image Image to submit
   * @param transport Recognition backend
   * @param callback Invoked once with the response or the failure
   */
  void Submit(const NormalizedImage& image, net::RecognitionTransport& transport, SubmitCallback callback) const;

  /**
   * @brief Path of the cropped copy: the original path with "_cropped.jpg" appended.
   */
  [[nodiscard]] static std::filesystem::path CroppedPath(const std::filesystem::path& original);

  [[nodiscard]] const NormalizerConfig& Config() const noexcept { return config_; }
  void SetJpegQuality(int quality) noexcept { config_.jpeg_quality = quality; }

private:
  NormalizerConfig config_;
};

}  // namespace faceid
