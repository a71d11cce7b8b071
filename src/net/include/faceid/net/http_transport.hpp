#pragma once

#include <faceid/net/pch.hpp>

#include <faceid/net/api_config.hpp>
#include <faceid/net/recognition_transport.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace faceid::net {

/**
 * @brief RecognitionTransport over Qt Network.
 * @details Requests run on the Qt event loop of the owning thread. Destroying the transport
 * aborts pending requests without invoking their callbacks.
 */
class HttpTransport final : public RecognitionTransport {
public:
  explicit HttpTransport(ApiConfig config);
  HttpTransport(const HttpTransport&) = delete;
  HttpTransport(HttpTransport&&) = delete;
  ~HttpTransport() override;

  HttpTransport& operator=(const HttpTransport&) = delete;
  HttpTransport& operator=(HttpTransport&&) = delete;

  void StartStream(StartStreamCallback callback) override;
  void Recognize(std::vector<uint8_t> image_bytes, RecognizeCallback callback) override;

  [[nodiscard]] bool IsConfigured() const noexcept override { return config_.IsConfigured(); }

  /// @return Number of requests still waiting for a response.
  [[nodiscard]] size_t PendingRequests() const noexcept;

  [[nodiscard]] const ApiConfig& Config() const noexcept { return config_; }

private:
  struct Impl;

  ApiConfig config_;
  std::unique_ptr<Impl> impl_;
};

}  // namespace faceid::net
