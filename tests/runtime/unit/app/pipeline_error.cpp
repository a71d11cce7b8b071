#include <doctest/doctest.h>

#include <faceid/app/notice.hpp>
#include <faceid/app/pipeline_error.hpp>

#include <string>

TEST_SUITE("faceid::PipelineFailure") {
  TEST_CASE("IsSilent: Only a cancelled picker is silent") {
    CHECK(faceid::IsSilent(faceid::PipelineError::kNoSelection));
    CHECK_FALSE(faceid::IsSilent(faceid::PipelineError::kDecodeError));
    CHECK_FALSE(faceid::IsSilent(faceid::PipelineError::kNoFaceDetected));
    CHECK_FALSE(faceid::IsSilent(faceid::PipelineError::kConfigurationError));
    CHECK_FALSE(faceid::IsSilent(faceid::PipelineError::kTransportError));
    CHECK_FALSE(faceid::IsSilent(faceid::PipelineError::kBusy));
  }

  TEST_CASE("ToNotice: Title names the failure, message carries the detail") {
    const faceid::PipelineFailure failure{faceid::PipelineError::kDecodeError, "photo.jpg: Unsupported image format"};
    const auto notice = failure.ToNotice();
    CHECK_EQ(notice.title, "Image could not be decoded");
    CHECK_EQ(notice.message, "photo.jpg: Unsupported image format");

    const faceid::PipelineFailure bare{faceid::PipelineError::kStorageError, {}};
    CHECK_EQ(bare.ToNotice(), faceid::UserNotice{"Image could not be saved", "Image could not be saved"});
  }

  TEST_CASE("FromTransport: Missing endpoint is a configuration error") {
    const auto configuration = faceid::PipelineFailure::FromTransport(
        {faceid::net::TransportError::kNotConfigured, 0, "API_URL is not set"});
    CHECK_EQ(configuration.code, faceid::PipelineError::kConfigurationError);
    CHECK_NE(configuration.detail.find("API_URL is not set"), std::string::npos);

    const auto http = faceid::PipelineFailure::FromTransport({faceid::net::TransportError::kHttpStatus, 404, "Not Found"});
    CHECK_EQ(http.code, faceid::PipelineError::kTransportError);
    CHECK_NE(http.detail.find("HTTP 404"), std::string::npos);

    const auto malformed =
        faceid::PipelineFailure::FromTransport({faceid::net::TransportError::kMalformedResponse, 200, "Empty body"});
    CHECK_EQ(malformed.code, faceid::PipelineError::kTransportError);
  }

  TEST_CASE("RecordingNoticeSink: Keeps notices in order") {
    faceid::RecordingNoticeSink sink;
    sink.ShowNotice({"First", "one"});
    sink.ShowNotice({"Second", "two"});

    REQUIRE_EQ(sink.Notices().size(), 2U);
    CHECK_EQ(sink.Notices()[0].title, "First");
    CHECK_EQ(sink.Notices()[1].message, "two");

    sink.Clear();
    CHECK(sink.Notices().empty());
  }

  TEST_CASE("LogNoticeSink: Accepts notices") {
    faceid::LogNoticeSink sink;
    CHECK_NOTHROW(sink.ShowNotice({"Recognition result", "Hello"}));
  }
}
