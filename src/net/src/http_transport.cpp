#include <faceid/net/http_transport.hpp>

#include <faceid/core/logger.hpp>
#include <faceid/net/net_logger.hpp>

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QObject>
#include <QString>
#include <QUrl>
#include <QVariant>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace faceid::net {

namespace {

constexpr int kHttpOk = 200;
constexpr qsizetype kMaxDetailLength = 256;

using RawResult = std::expected<QByteArray, TransportFailure>;
using RawCallback = std::function<void(RawResult result)>;

[[nodiscard]] std::string Excerpt(const QByteArray& body) {
  return QString::fromUtf8(body.left(kMaxDetailLength)).trimmed().toStdString();
}

[[nodiscard]] RawResult ToRawResult(QNetworkReply& reply) {
  const QVariant status_attribute = reply.attribute(QNetworkRequest::HttpStatusCodeAttribute);
  const int status = status_attribute.isValid() ? status_attribute.toInt() : 0;
  const QByteArray body = reply.readAll();
  const QNetworkReply::NetworkError error = reply.error();

  // A transfer timeout surfaces as a cancelled operation
  if (error == QNetworkReply::OperationCanceledError || error == QNetworkReply::TimeoutError) {
    return std::unexpected(TransportFailure{TransportError::kTimeout, status, reply.errorString().toStdString()});
  }

  if (status != 0 && status != kHttpOk) {
    return std::unexpected(TransportFailure{TransportError::kHttpStatus, status, Excerpt(body)});
  }

  if (error != QNetworkReply::NoError) {
    return std::unexpected(TransportFailure{TransportError::kNetworkFailure, status, reply.errorString().toStdString()});
  }

  if (status == 0) {
    return std::unexpected(TransportFailure{TransportError::kNetworkFailure, 0, "No HTTP status in reply"});
  }

  return body;
}

}  // namespace

std::string TransportFailure::Describe() const {
  std::string text(TransportErrorToString(code));
  if (http_status != 0) {
    text.append(std::format(" (HTTP {})", http_status));
  }
  if (!detail.empty()) {
    text.append(": ");
    text.append(detail);
  }
  return text;
}

struct HttpTransport::Impl {
  QNetworkAccessManager manager;
  size_t pending = 0;

  void Post(const ApiConfig& config, std::string_view path, QByteArray body, bool octet_stream,
            RawCallback callback);
};

void HttpTransport::Impl::Post(const ApiConfig& config, std::string_view path, QByteArray body, bool octet_stream,
                               RawCallback callback) {
  const std::string url = config.Endpoint(path);

  QNetworkRequest request(QUrl(QString::fromStdString(url)));
  if (octet_stream) {
    request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/octet-stream"));
  }
  request.setTransferTimeout(static_cast<int>(config.timeout.count()));

  FACEID_INFO_LOGGER(kNetLogger, "POST {} ({} bytes)", url, body.size());

  QNetworkReply* reply = manager.post(request, body);
  ++pending;

  QObject::connect(reply, &QNetworkReply::finished, &manager,
                   [this, reply, url, callback = std::move(callback)]() {
                     --pending;
                     reply->deleteLater();

                     RawResult result = ToRawResult(*reply);
                     if (result.has_value()) {
                       FACEID_DEBUG_LOGGER(kNetLogger, "POST {} succeeded ({} bytes)", url, result->size());
                     } else {
                       FACEID_WARN_LOGGER(kNetLogger, "POST {} failed: {}", url, result.error().Describe());
                     }
                     callback(std::move(result));
                   });
}

HttpTransport::HttpTransport(ApiConfig config) : config_(std::move(config)), impl_(std::make_unique<Impl>()) {}

HttpTransport::~HttpTransport() {
  if (PendingRequests() > 0) {
    FACEID_DEBUG_LOGGER(kNetLogger, "Aborting {} pending request(s)", PendingRequests());
  }
  for (QNetworkReply* reply : impl_->manager.findChildren<QNetworkReply*>()) {
    QObject::disconnect(reply, nullptr, &impl_->manager, nullptr);
    reply->abort();
  }
}

void HttpTransport::StartStream(StartStreamCallback callback) {
  if (!config_.IsConfigured()) {
    callback(std::unexpected(TransportFailure{TransportError::kNotConfigured, 0, "API_URL is not set"}));
    return;
  }

  impl_->Post(config_, config_.start_stream_path, QByteArray{}, false,
              [callback = std::move(callback)](RawResult raw) {
                if (!raw.has_value()) {
                  callback(std::unexpected(std::move(raw.error())));
                  return;
                }

                auto parsed = ParseStreamStartResponse(std::string_view(raw->constData(), raw->size()));
                if (!parsed.has_value()) {
                  callback(std::unexpected(TransportFailure{TransportError::kMalformedResponse, kHttpOk,
                                                            std::string(ResponseErrorToString(parsed.error()))}));
                  return;
                }
                callback(std::move(*parsed));
              });
}

void HttpTransport::Recognize(std::vector<uint8_t> image_bytes, RecognizeCallback callback) {
  if (!config_.IsConfigured()) {
    callback(std::unexpected(TransportFailure{TransportError::kNotConfigured, 0, "API_URL is not set"}));
    return;
  }

  QByteArray body(static_cast<qsizetype>(image_bytes.size()), Qt::Uninitialized);
  std::ranges::copy(image_bytes, body.begin());
  impl_->Post(config_, config_.recognize_path, std::move(body), true,
              [callback = std::move(callback)](RawResult raw) {
                if (!raw.has_value()) {
                  callback(std::unexpected(std::move(raw.error())));
                  return;
                }

                callback(ParseRecognitionResponse(std::string_view(raw->constData(), raw->size())));
              });
}

size_t HttpTransport::PendingRequests() const noexcept {
  return impl_->pending;
}

}  // namespace faceid::net
