#include <doctest/doctest.h>

#include <faceid/app/image_normalizer.hpp>

#include "runtime/test_support.hpp"

#include <faceid/core/utils/filesystem.hpp>

#include <QTemporaryDir>

#include <opencv2/core.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using faceid::testing::FakeFaceLocator;
using faceid::testing::FakeImageSource;
using faceid::testing::FakeTransport;

struct TempImages {
  QTemporaryDir dir;

  [[nodiscard]] std::filesystem::path Path(const std::string& name) const {
    return std::filesystem::path(dir.path().toStdString()) / name;
  }

  /// Writes a split-color JPEG and returns its path.
  [[nodiscard]] std::filesystem::path WriteSplit(const std::string& name, int width, int height,
                                                 std::optional<int> exif_orientation = std::nullopt) const {
    const auto path = Path(name);
    auto bytes = faceid::testing::MakeSplitFrame(width, height).EncodeJpeg(95);
    REQUIRE(bytes.has_value());
    if (exif_orientation.has_value()) {
      bytes = faceid::testing::WithExifOrientation(*bytes, *exif_orientation);
    }
    REQUIRE(faceid::utils::WriteBytesToFile(path, *bytes).has_value());
    return path;
  }
};

std::vector<uint8_t> ReadBytes(const std::filesystem::path& path) {
  auto bytes = faceid::utils::ReadFileToBytes(path);
  REQUIRE(bytes.has_value());
  return *bytes;
}

}  // namespace

TEST_SUITE("faceid::ImageCaptureNormalizer") {
  TEST_CASE("Decode: Reads pixels, orientation and bytes") {
    TempImages images;
    REQUIRE(images.dir.isValid());
    const auto path = images.WriteSplit("photo.jpg", 40, 20);

    const auto captured = faceid::ImageCaptureNormalizer::Decode(path);
    REQUIRE(captured.has_value());
    CHECK_EQ(captured->path, path);
    CHECK_EQ(captured->Width(), 40);
    CHECK_EQ(captured->Height(), 20);
    CHECK_EQ(captured->orientation, faceid::Orientation::kNormal);
    CHECK_EQ(captured->encoded, ReadBytes(path));
  }

  TEST_CASE("Decode: EXIF orientation is reported, pixels stay in stored order") {
    TempImages images;
    REQUIRE(images.dir.isValid());
    const auto path = images.WriteSplit("rotated.jpg", 40, 20, 6);

    const auto captured = faceid::ImageCaptureNormalizer::Decode(path);
    REQUIRE(captured.has_value());
    CHECK_EQ(captured->orientation, faceid::Orientation::kRotate90Clockwise);
    CHECK_EQ(captured->Width(), 40);
    CHECK_EQ(captured->Height(), 20);
  }

  TEST_CASE("Decode: Failures are decode errors") {
    TempImages images;
    REQUIRE(images.dir.isValid());

    SUBCASE("Missing file") {
      const auto captured = faceid::ImageCaptureNormalizer::Decode(images.Path("missing.jpg"));
      REQUIRE_FALSE(captured.has_value());
      CHECK_EQ(captured.error().code, faceid::PipelineError::kDecodeError);
      CHECK_NE(captured.error().detail.find("missing.jpg"), std::string::npos);
    }

    SUBCASE("Not an image") {
      const auto path = images.Path("notes.jpg");
      const std::vector<uint8_t> text = {'h', 'e', 'l', 'l', 'o'};
      REQUIRE(faceid::utils::WriteBytesToFile(path, text).has_value());

      const auto captured = faceid::ImageCaptureNormalizer::Decode(path);
      REQUIRE_FALSE(captured.has_value());
      CHECK_EQ(captured.error().code, faceid::PipelineError::kDecodeError);
    }
  }

  TEST_CASE("NormalizeOrientation: Bakes rotation into pixels and overwrites the file") {
    TempImages images;
    REQUIRE(images.dir.isValid());
    const auto path = images.WriteSplit("rotated.jpg", 40, 20, 6);
    const auto original_bytes = ReadBytes(path);

    const faceid::ImageCaptureNormalizer normalizer;
    auto captured = faceid::ImageCaptureNormalizer::Decode(path);
    REQUIRE(captured.has_value());

    const auto upright = normalizer.NormalizeOrientation(std::move(*captured));
    REQUIRE(upright.has_value());
    CHECK_EQ(upright->path, path);
    CHECK_EQ(upright->orientation, faceid::Orientation::kNormal);
    CHECK_EQ(upright->Width(), 20);
    CHECK_EQ(upright->Height(), 40);

    // The left (red) half of the stored image ends up on top
    CHECK(faceid::testing::IsReddish(upright->pixels.Mat().at<cv::Vec3b>(5, 10)));
    CHECK(faceid::testing::IsBluish(upright->pixels.Mat().at<cv::Vec3b>(35, 10)));

    const auto rewritten = ReadBytes(path);
    CHECK_NE(rewritten, original_bytes);
    CHECK_EQ(upright->encoded, rewritten);

    const auto reread = faceid::ImageCaptureNormalizer::Decode(path);
    REQUIRE(reread.has_value());
    CHECK_EQ(reread->orientation, faceid::Orientation::kNormal);
    CHECK_EQ(reread->Width(), 20);
    CHECK_EQ(reread->Height(), 40);
  }

  TEST_CASE("NormalizeOrientation: Idempotent") {
    TempImages images;
    REQUIRE(images.dir.isValid());
    const auto path = images.WriteSplit("rotated.jpg", 40, 20, 8);

    const faceid::ImageCaptureNormalizer normalizer;
    auto first_decode = faceid::ImageCaptureNormalizer::Decode(path);
    REQUIRE(first_decode.has_value());
    const auto first = normalizer.NormalizeOrientation(std::move(*first_decode));
    REQUIRE(first.has_value());
    const auto after_first = ReadBytes(path);

    auto second_decode = faceid::ImageCaptureNormalizer::Decode(path);
    REQUIRE(second_decode.has_value());
    const auto second = normalizer.NormalizeOrientation(std::move(*second_decode));
    REQUIRE(second.has_value());

    CHECK_EQ(ReadBytes(path), after_first);
    CHECK_EQ(second->encoded, first->encoded);
    CHECK_EQ(second->Width(), first->Width());
    CHECK_EQ(second->Height(), first->Height());
  }

  TEST_CASE("NormalizeOrientation: Upright image is left untouched") {
    TempImages images;
    REQUIRE(images.dir.isValid());
    const auto path = images.WriteSplit("upright.jpg", 40, 20);
    const auto original_bytes = ReadBytes(path);

    const faceid::ImageCaptureNormalizer normalizer;
    auto captured = faceid::ImageCaptureNormalizer::Decode(path);
    REQUIRE(captured.has_value());

    const auto upright = normalizer.NormalizeOrientation(std::move(*captured));
    REQUIRE(upright.has_value());
    CHECK_EQ(upright->encoded, original_bytes);
    CHECK_EQ(ReadBytes(path), original_bytes);
  }

  TEST_CASE("DetectAndCrop: No face returns the original bytes") {
    TempImages images;
    REQUIRE(images.dir.isValid());
    const auto path = images.WriteSplit("empty_scene.jpg", 64, 48);
    const auto original_bytes = ReadBytes(path);

    const faceid::ImageCaptureNormalizer normalizer;
    FakeFaceLocator locator;
    const auto captured = faceid::ImageCaptureNormalizer::Decode(path);
    REQUIRE(captured.has_value());

    const auto outcome = normalizer.DetectAndCrop(*captured, locator);
    REQUIRE(outcome.has_value());
    CHECK_FALSE(outcome->FaceFound());
    CHECK_EQ(outcome->image.path, path);
    CHECK_EQ(outcome->image.encoded, original_bytes);
    CHECK_EQ(outcome->image.width, 64);
    CHECK_EQ(outcome->image.height, 48);
    CHECK_EQ(locator.calls, 1U);
    CHECK_FALSE(std::filesystem::exists(faceid::ImageCaptureNormalizer::CroppedPath(path)));
  }

  TEST_CASE("DetectAndCrop: Uses the first box in detector order") {
    TempImages images;
    REQUIRE(images.dir.isValid());
    const auto path = images.WriteSplit("group.jpg", 200, 100);
    const auto original_bytes = ReadBytes(path);

    const faceid::ImageCaptureNormalizer normalizer;
    FakeFaceLocator locator;
    // The second box is larger and more confident, the first one still wins
    locator.detections = {
        {.box = {10, 10, 40, 30}, .confidence = 0.6F},
        {.box = {100, 0, 100, 100}, .confidence = 0.99F},
    };

    const auto captured = faceid::ImageCaptureNormalizer::Decode(path);
    REQUIRE(captured.has_value());

    const auto outcome = normalizer.DetectAndCrop(*captured, locator);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->FaceFound());
    CHECK_EQ(*outcome->face, faceid::FaceBoundingBox{10, 10, 40, 30});
    CHECK_EQ(outcome->image.path, faceid::ImageCaptureNormalizer::CroppedPath(path));
    CHECK_EQ(outcome->image.width, 40);
    CHECK_EQ(outcome->image.height, 30);
    CHECK_EQ(ReadBytes(outcome->image.path), outcome->image.encoded);

    const cv::Mat crop = faceid::testing::DecodeBytes(outcome->image.encoded);
    CHECK_EQ(crop.cols, 40);
    CHECK_EQ(crop.rows, 30);
    CHECK(faceid::testing::IsReddish(crop.at<cv::Vec3b>(15, 20)));

    CHECK_EQ(ReadBytes(path), original_bytes);
  }

  TEST_CASE("DetectAndCrop: Box is clamped to the image") {
    TempImages images;
    REQUIRE(images.dir.isValid());
    const auto path = images.WriteSplit("wide.jpg", 1000, 800);

    const faceid::ImageCaptureNormalizer normalizer;
    FakeFaceLocator locator;
    locator.detections = {{.box = {950, 10, 200, 100}, .confidence = 0.9F}};

    const auto captured = faceid::ImageCaptureNormalizer::Decode(path);
    REQUIRE(captured.has_value());

    const auto outcome = normalizer.DetectAndCrop(*captured, locator);
    REQUIRE(outcome.has_value());
    CHECK_EQ(*outcome->face, faceid::FaceBoundingBox{950, 10, 50, 100});

    const cv::Mat crop = faceid::testing::DecodeBytes(outcome->image.encoded);
    CHECK_EQ(crop.cols, 50);
    CHECK_EQ(crop.rows, 100);
  }

  TEST_CASE("DetectAndCrop: Locator failure") {
    TempImages images;
    REQUIRE(images.dir.isValid());
    const auto path = images.WriteSplit("photo.jpg", 32, 32);

    const faceid::ImageCaptureNormalizer normalizer;
    FakeFaceLocator locator;
    locator.error = faceid::FaceLocatorError::kProcessingFailed;

    const auto captured = faceid::ImageCaptureNormalizer::Decode(path);
    REQUIRE(captured.has_value());

    const auto outcome = normalizer.DetectAndCrop(*captured, locator);
    REQUIRE_FALSE(outcome.has_value());
    CHECK_EQ(outcome.error().code, faceid::PipelineError::kDetectionFailed);
    CHECK_EQ(outcome.error().detail, "Image processing failed");
  }

  TEST_CASE("Acquire: Source errors map to pipeline errors") {
    const faceid::ImageCaptureNormalizer normalizer;
    FakeImageSource source;

    SUBCASE("Cancelled picker is a silent no selection") {
      source.answer = std::unexpected(faceid::AcquireError::kCancelled);
      const auto result = normalizer.Acquire(source, faceid::SourceKind::kGallery);
      REQUIRE_FALSE(result.has_value());
      CHECK_EQ(result.error().code, faceid::PipelineError::kNoSelection);
      CHECK(faceid::IsSilent(result.error().code));
    }

    SUBCASE("Camera without frames") {
      source.answer = std::unexpected(faceid::AcquireError::kUnavailable);
      const auto result = normalizer.Acquire(source, faceid::SourceKind::kCamera);
      REQUIRE_FALSE(result.has_value());
      CHECK_EQ(result.error().code, faceid::PipelineError::kDecodeError);
      CHECK_EQ(result.error().detail, "Camera unavailable");
    }

    SUBCASE("Photo could not be stored") {
      source.answer = std::unexpected(faceid::AcquireError::kStorageFailed);
      const auto result = normalizer.Acquire(source, faceid::SourceKind::kCamera);
      REQUIRE_FALSE(result.has_value());
      CHECK_EQ(result.error().code, faceid::PipelineError::kStorageError);
    }

    CHECK_EQ(source.calls, 1U);
  }

  TEST_CASE("Submit: Sends the bytes on disk") {
    TempImages images;
    REQUIRE(images.dir.isValid());
    const auto path = images.WriteSplit("face.jpg", 32, 32);

    const faceid::ImageCaptureNormalizer normalizer;
    FakeTransport transport;
    const faceid::NormalizedImage image{.path = path, .encoded = {}, .width = 32, .height = 32};

    std::optional<faceid::SubmitResult> result;
    normalizer.Submit(image, transport, [&result](faceid::SubmitResult r) { result = std::move(r); });

    REQUIRE(result.has_value());
    REQUIRE(result->has_value());
    CHECK_EQ((*result)->message, "Hello, Alice");
    REQUIRE_EQ(transport.RecognizeCalls(), 1U);
    CHECK_EQ(transport.bodies.front(), ReadBytes(path));
  }

  TEST_CASE("Submit: Transport failures are not retried") {
    TempImages images;
    REQUIRE(images.dir.isValid());
    const auto path = images.WriteSplit("face.jpg", 32, 32);

    const faceid::ImageCaptureNormalizer normalizer;
    FakeTransport transport;
    const faceid::NormalizedImage image{.path = path, .encoded = {}, .width = 32, .height = 32};

    SUBCASE("HTTP error") {
      transport.recognize_result =
          std::unexpected(faceid::net::TransportFailure{faceid::net::TransportError::kHttpStatus, 500, "boom"});

      std::optional<faceid::SubmitResult> result;
      normalizer.Submit(image, transport, [&result](faceid::SubmitResult r) { result = std::move(r); });

      REQUIRE(result.has_value());
      REQUIRE_FALSE(result->has_value());
      CHECK_EQ(result->error().code, faceid::PipelineError::kTransportError);
      CHECK_NE(result->error().detail.find("HTTP 500"), std::string::npos);
    }

    SUBCASE("Missing API_URL") {
      transport.recognize_result =
          std::unexpected(faceid::net::TransportFailure{faceid::net::TransportError::kNotConfigured, 0, ""});

      std::optional<faceid::SubmitResult> result;
      normalizer.Submit(image, transport, [&result](faceid::SubmitResult r) { result = std::move(r); });

      REQUIRE(result.has_value());
      REQUIRE_FALSE(result->has_value());
      CHECK_EQ(result->error().code, faceid::PipelineError::kConfigurationError);
    }

    CHECK_EQ(transport.RecognizeCalls(), 1U);
  }

  TEST_CASE("Submit: Unreadable file sends nothing") {
    const faceid::ImageCaptureNormalizer normalizer;
    FakeTransport transport;
    const faceid::NormalizedImage image{.path = "faceid_does_not_exist.jpg", .encoded = {}, .width = 0, .height = 0};

    std::optional<faceid::SubmitResult> result;
    normalizer.Submit(image, transport, [&result](faceid::SubmitResult r) { result = std::move(r); });

    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->has_value());
    CHECK_EQ(result->error().code, faceid::PipelineError::kDecodeError);
    CHECK_EQ(transport.RecognizeCalls(), 0U);
  }

  TEST_CASE("CroppedPath: Appends the suffix to the full name") {
    CHECK_EQ(faceid::ImageCaptureNormalizer::CroppedPath("/tmp/photo.jpg"),
             std::filesystem::path("/tmp/photo.jpg_cropped.jpg"));
    CHECK_EQ(faceid::ImageCaptureNormalizer::CroppedPath("capture.png"), std::filesystem::path("capture.png_cropped.jpg"));
  }
}
