#include <doctest/doctest.h>

#include <faceid/app/capture_pipeline.hpp>
#include <faceid/app/stream_session.hpp>
#include <faceid/net/api_config.hpp>
#include <faceid/net/http_transport.hpp>

#include "net/canned_http_server.hpp"
#include "runtime/test_support.hpp"

#include <faceid/core/utils/filesystem.hpp>

#include <QByteArray>
#include <QTemporaryDir>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace {

using faceid::testing::CannedHttpServer;
using faceid::testing::FakeFaceLocator;
using faceid::testing::FakeFrameSource;
using faceid::testing::FakeImageSource;
using faceid::testing::ToByteArray;

constexpr const char* kRecognizedBody = R"({"message": "Hello, Bob", "identity": "bob", "confidence": 0.93})";

}  // namespace

TEST_SUITE("faceid::CaptureFlow") {
  TEST_CASE("CaptureFlow: Rotated gallery photo is uprighted, cropped and posted once") {
    CannedHttpServer server(200, kRecognizedBody);
    REQUIRE(server.Listening());

    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto photo = std::filesystem::path(dir.path().toStdString()) / "portrait.jpg";
    const auto encoded = faceid::testing::MakeSplitFrame(120, 80).EncodeJpeg(95);
    REQUIRE(encoded.has_value());
    REQUIRE(faceid::utils::WriteBytesToFile(photo, faceid::testing::WithExifOrientation(*encoded, 6)).has_value());

    faceid::net::HttpTransport transport(faceid::net::ApiConfig{}.WithBaseUrl(server.BaseUrl()));
    const faceid::ImageCaptureNormalizer normalizer;
    FakeImageSource source;
    source.answer = photo;
    FakeFaceLocator locator;
    locator.detections = {{.box = {10, 20, 40, 50}, .confidence = 0.95F}};
    faceid::RecordingNoticeSink notices;
    faceid::CapturePipeline pipeline(normalizer, source, locator, transport, notices);

    std::optional<faceid::RunResult> result;
    pipeline.Run(faceid::SourceKind::kGallery, [&result](const faceid::RunResult& r) { result = r; });
    CHECK_EQ(pipeline.State(), faceid::PipelineState::kSubmitting);

    REQUIRE(faceid::testing::SpinUntil([&result]() { return result.has_value(); }));
    REQUIRE(result->has_value());
    CHECK_EQ((*result)->message, "Hello, Bob");
    CHECK_EQ((*result)->identity, std::optional<std::string>("bob"));

    // The locator saw the upright image
    CHECK_EQ(locator.last_width, 80);
    CHECK_EQ(locator.last_height, 120);

    REQUIRE_EQ(server.Requests().size(), 1U);
    const auto& request = server.Requests().front();
    CHECK_EQ(request.path, QByteArray("/main"));
    CHECK_EQ(request.content_type, QByteArray("application/octet-stream"));

    const auto cropped = faceid::utils::ReadFileToBytes(faceid::ImageCaptureNormalizer::CroppedPath(photo));
    REQUIRE(cropped.has_value());
    CHECK_EQ(request.body, ToByteArray(*cropped));

    const auto rewritten = faceid::ImageCaptureNormalizer::Decode(photo);
    REQUIRE(rewritten.has_value());
    CHECK_EQ(rewritten->orientation, faceid::Orientation::kNormal);
    CHECK_EQ(rewritten->Width(), 80);
    CHECK_EQ(rewritten->Height(), 120);

    REQUIRE_EQ(notices.Notices().size(), 1U);
    CHECK_EQ(notices.Notices().front().message, "Hello, Bob");
  }

  TEST_CASE("CaptureFlow: Cancelled picker never reaches the backend") {
    CannedHttpServer server(200, kRecognizedBody);
    REQUIRE(server.Listening());

    faceid::net::HttpTransport transport(faceid::net::ApiConfig{}.WithBaseUrl(server.BaseUrl()));
    const faceid::ImageCaptureNormalizer normalizer;
    FakeImageSource source;
    FakeFaceLocator locator;
    faceid::RecordingNoticeSink notices;
    faceid::CapturePipeline pipeline(normalizer, source, locator, transport, notices);

    pipeline.Run(faceid::SourceKind::kGallery);
    faceid::testing::SpinUntil([]() { return false; }, std::chrono::milliseconds(100));

    CHECK(server.Requests().empty());
    CHECK_EQ(transport.PendingRequests(), 0U);
    CHECK(notices.Notices().empty());
  }

  TEST_CASE("CaptureFlow: Backend error is shown once and not retried") {
    CannedHttpServer server(500, R"({"error": "model offline"})");
    REQUIRE(server.Listening());

    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto photo = std::filesystem::path(dir.path().toStdString()) / "face.jpg";
    REQUIRE(faceid::testing::MakeSplitFrame(64, 64).WriteJpeg(photo, 90).has_value());

    faceid::net::HttpTransport transport(faceid::net::ApiConfig{}.WithBaseUrl(server.BaseUrl()));
    const faceid::ImageCaptureNormalizer normalizer;
    FakeImageSource source;
    source.answer = photo;
    FakeFaceLocator locator;
    locator.detections = {{.box = {0, 0, 32, 32}, .confidence = 0.9F}};
    faceid::RecordingNoticeSink notices;
    faceid::CapturePipeline pipeline(normalizer, source, locator, transport, notices);

    std::optional<faceid::RunResult> result;
    pipeline.Run(faceid::SourceKind::kGallery, [&result](const faceid::RunResult& r) { result = r; });
    REQUIRE(faceid::testing::SpinUntil([&result]() { return result.has_value(); }));

    REQUIRE_FALSE(result->has_value());
    CHECK_EQ(result->error().code, faceid::PipelineError::kTransportError);
    CHECK_NE(result->error().detail.find("HTTP 500"), std::string::npos);
    CHECK_EQ(server.Requests().size(), 1U);
    CHECK_EQ(notices.Notices().size(), 1U);
  }

  TEST_CASE("CaptureFlow: Stream announces itself before the first frame") {
    CannedHttpServer server(200, R"({"message": "Hello, Bob"})");
    REQUIRE(server.Listening());

    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    faceid::net::HttpTransport transport(faceid::net::ApiConfig{}.WithBaseUrl(server.BaseUrl()));
    const faceid::ImageCaptureNormalizer normalizer;
    FakeFrameSource camera;
    camera.frame = faceid::testing::MakeSplitFrame(64, 48);
    FakeFaceLocator locator;
    locator.detections = {{.box = {8, 8, 24, 24}, .confidence = 0.9F}};
    faceid::RecordingNoticeSink notices;

    faceid::StreamConfig config;
    config.interval = std::chrono::milliseconds(50);
    config.frame_path = std::filesystem::path(dir.path().toStdString()) / "frame.jpg";
    faceid::StreamSession session(camera, locator, transport, normalizer, notices, config);

    session.Start();
    CHECK_EQ(session.State(), faceid::StreamState::kStarting);

    REQUIRE(faceid::testing::SpinUntil([&session]() { return session.ResultsReceived() >= 2; }));
    session.Stop();

    REQUIRE_GE(server.Requests().size(), 3U);
    CHECK_EQ(server.Requests()[0].path, QByteArray("/start_stream"));
    CHECK_EQ(server.Requests()[1].path, QByteArray("/main"));
    CHECK_EQ(server.Requests()[2].path, QByteArray("/main"));
    CHECK_FALSE(camera.IsOpen());
    CHECK(notices.Notices().empty());
  }
}
