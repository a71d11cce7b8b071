#include <doctest/doctest.h>

#include <faceid/net/api_config.hpp>
#include <faceid/net/http_transport.hpp>

#include "net/canned_http_server.hpp"

#include <QByteArray>
#include <QEventLoop>
#include <QObject>
#include <QTimer>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using faceid::testing::CannedHttpServer;

/// Runs the event loop until done() turns true or the deadline passes.
template <typename Done>
bool SpinUntil(Done done, std::chrono::milliseconds deadline = std::chrono::milliseconds(5000)) {
  QEventLoop loop;
  QTimer timer;
  timer.setSingleShot(true);
  QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
  timer.start(deadline);

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

faceid::net::ApiConfig ConfigFor(const CannedHttpServer& server) {
  return faceid::net::ApiConfig{}.WithBaseUrl(server.BaseUrl());
}

}  // namespace

TEST_SUITE("faceid::net::HttpTransport") {
  TEST_CASE("HttpTransport: Recognize posts raw bytes to /main") {
    CannedHttpServer server(200, R"({"message": "Hello, Alice", "identity": "alice"})");
    REQUIRE(server.Listening());

    faceid::net::HttpTransport transport(ConfigFor(server));
    const std::vector<uint8_t> image = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 0xFF, 0xD9};

    std::optional<faceid::net::RecognitionTransport::RecognizeResult> result;
    transport.Recognize(image, [&result](faceid::net::RecognitionTransport::RecognizeResult r) { result = std::move(r); });
    CHECK_EQ(transport.PendingRequests(), 1);

    REQUIRE(SpinUntil([&result]() { return result.has_value(); }));
    REQUIRE(result->has_value());
    CHECK_EQ((*result)->message, "Hello, Alice");
    CHECK_EQ((*result)->identity, std::optional<std::string>("alice"));
    CHECK_EQ(transport.PendingRequests(), 0);

    REQUIRE_EQ(server.Requests().size(), 1);
    const auto& request = server.Requests().front();
    CHECK_EQ(request.method, QByteArray("POST"));
    CHECK_EQ(request.path, QByteArray("/main"));
    CHECK_EQ(request.content_type, QByteArray("application/octet-stream"));
    CHECK_EQ(request.body, QByteArray("\xFF\xD8\xFF\xE0\x00\x10\xFF\xD9", 8));
  }

  TEST_CASE("HttpTransport: StartStream posts to /start_stream") {
    CannedHttpServer server(200, R"({"message": "stream started"})");
    REQUIRE(server.Listening());

    faceid::net::HttpTransport transport(ConfigFor(server));

    std::optional<faceid::net::RecognitionTransport::StartStreamResult> result;
    transport.StartStream([&result](faceid::net::RecognitionTransport::StartStreamResult r) { result = std::move(r); });

    REQUIRE(SpinUntil([&result]() { return result.has_value(); }));
    REQUIRE(result->has_value());
    CHECK_EQ((*result)->message, std::optional<std::string>("stream started"));

    REQUIRE_EQ(server.Requests().size(), 1);
    CHECK_EQ(server.Requests().front().path, QByteArray("/start_stream"));
    CHECK(server.Requests().front().body.isEmpty());
  }

  TEST_CASE("HttpTransport: Non-200 status is reported") {
    CannedHttpServer server(503, R"({"detail": "model loading"})");
    REQUIRE(server.Listening());

    faceid::net::HttpTransport transport(ConfigFor(server));

    std::optional<faceid::net::RecognitionTransport::RecognizeResult> result;
    transport.Recognize({1, 2, 3}, [&result](faceid::net::RecognitionTransport::RecognizeResult r) { result = std::move(r); });

    REQUIRE(SpinUntil([&result]() { return result.has_value(); }));
    REQUIRE_FALSE(result->has_value());
    CHECK_EQ(result->error().code, faceid::net::TransportError::kHttpStatus);
    CHECK_EQ(result->error().http_status, 503);
    CHECK_NE(result->error().detail.find("model loading"), std::string::npos);
    CHECK_EQ(server.Requests().size(), 1);
  }

  TEST_CASE("HttpTransport: Recognition body outside the schema is delivered verbatim") {
    CannedHttpServer server(200, R"({"name": "alice"})");
    REQUIRE(server.Listening());

    faceid::net::HttpTransport transport(ConfigFor(server));

    std::optional<faceid::net::RecognitionTransport::RecognizeResult> result;
    transport.Recognize({1}, [&result](faceid::net::RecognitionTransport::RecognizeResult r) { result = std::move(r); });

    REQUIRE(SpinUntil([&result]() { return result.has_value(); }));
    REQUIRE(result->has_value());
    CHECK_EQ((*result)->message, R"({"name": "alice"})");
    CHECK_FALSE((*result)->structured);
  }

  TEST_CASE("HttpTransport: Malformed stream start body is reported") {
    CannedHttpServer server(200, "stream started");
    REQUIRE(server.Listening());

    faceid::net::HttpTransport transport(ConfigFor(server));

    std::optional<faceid::net::RecognitionTransport::StartStreamResult> result;
    transport.StartStream([&result](faceid::net::RecognitionTransport::StartStreamResult r) { result = std::move(r); });

    REQUIRE(SpinUntil([&result]() { return result.has_value(); }));
    REQUIRE_FALSE(result->has_value());
    CHECK_EQ(result->error().code, faceid::net::TransportError::kMalformedResponse);
  }

  TEST_CASE("HttpTransport: Timeout when the backend never answers") {
    CannedHttpServer server(200, {}, false);
    REQUIRE(server.Listening());

    auto config = ConfigFor(server);
    config.timeout = std::chrono::milliseconds(200);
    faceid::net::HttpTransport transport(config);

    std::optional<faceid::net::RecognitionTransport::RecognizeResult> result;
    transport.Recognize({1}, [&result](faceid::net::RecognitionTransport::RecognizeResult r) { result = std::move(r); });

    REQUIRE(SpinUntil([&result]() { return result.has_value(); }));
    REQUIRE_FALSE(result->has_value());
    CHECK_EQ(result->error().code, faceid::net::TransportError::kTimeout);
  }

  TEST_CASE("HttpTransport: Destruction aborts pending requests without callbacks") {
    CannedHttpServer server(200, {}, false);
    REQUIRE(server.Listening());

    bool called = false;
    {
      faceid::net::HttpTransport transport(ConfigFor(server));
      transport.Recognize({1, 2}, [&called](faceid::net::RecognitionTransport::RecognizeResult) { called = true; });
      CHECK_EQ(transport.PendingRequests(), 1);
      REQUIRE(SpinUntil([&server]() { return !server.Requests().empty(); }));
    }

    CHECK_FALSE(SpinUntil([&called]() { return called; }, std::chrono::milliseconds(200)));
    CHECK_FALSE(called);
  }

  TEST_CASE("HttpTransport: Unconfigured transport fails without a request") {
    faceid::net::HttpTransport transport(faceid::net::ApiConfig{});
    CHECK_FALSE(transport.IsConfigured());

    std::optional<faceid::net::RecognitionTransport::RecognizeResult> result;
    transport.Recognize({1}, [&result](faceid::net::RecognitionTransport::RecognizeResult r) { result = std::move(r); });

    // Reported synchronously
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->has_value());
    CHECK_EQ(result->error().code, faceid::net::TransportError::kNotConfigured);
    CHECK_EQ(transport.PendingRequests(), 0);
  }
}
