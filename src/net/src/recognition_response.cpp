#include <faceid/net/recognition_response.hpp>

#include <faceid/core/logger.hpp>
#include <faceid/net/net_logger.hpp>

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace faceid::net {

namespace {

[[nodiscard]] std::string_view TrimBody(std::string_view body) noexcept {
  constexpr std::string_view kWhitespace = " \t\r\n";
  const size_t begin = body.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  return body.substr(begin, body.find_last_not_of(kWhitespace) - begin + 1);
}

[[nodiscard]] QJsonDocument ParseJson(std::string_view body, QJsonParseError& error) {
  return QJsonDocument::fromJson(QByteArray(body.data(), static_cast<qsizetype>(body.size())), &error);
}

}  // namespace

auto ParseRecognitionResponse(std::string_view body) -> RecognitionResponse {
  const RecognitionResponse plain{.message = std::string(body), .structured = false};

  QJsonParseError parse_error{};
  const QJsonDocument document = ParseJson(TrimBody(body), parse_error);
  if (parse_error.error != QJsonParseError::NoError) {
    FACEID_WARN_LOGGER(kNetLogger, "Recognition response is not JSON ({}), using it as plain text",
                       parse_error.errorString().toStdString());
    return plain;
  }

  if (!document.isObject()) {
    FACEID_WARN_LOGGER(kNetLogger, "Recognition response is not a JSON object, using it as plain text");
    return plain;
  }

  const QJsonObject object = document.object();
  const QJsonValue message = object.value("message");
  const QJsonValue identity = object.value("identity");
  const QJsonValue confidence = object.value("confidence");

  const bool identity_ok = identity.isUndefined() || identity.isNull() || identity.isString();
  const bool confidence_ok = confidence.isUndefined() || confidence.isNull() || confidence.isDouble();
  if (!message.isString() || !identity_ok || !confidence_ok) {
    FACEID_WARN_LOGGER(kNetLogger, "Recognition response does not match the schema, using it as plain text");
    return plain;
  }

  RecognitionResponse response;
  response.message = message.toString().toStdString();
  if (identity.isString()) {
    response.identity = identity.toString().toStdString();
  }
  if (confidence.isDouble()) {
    response.confidence = confidence.toDouble();
  }
  return response;
}

auto ParseStreamStartResponse(std::string_view body) -> std::expected<StreamStartResponse, ResponseError> {
  const std::string_view trimmed = TrimBody(body);
  if (trimmed.empty()) {
    return StreamStartResponse{};
  }

  QJsonParseError parse_error{};
  const QJsonDocument document = ParseJson(trimmed, parse_error);
  if (parse_error.error != QJsonParseError::NoError || !document.isObject()) {
    return std::unexpected(ResponseError::kNotAnObject);
  }

  StreamStartResponse response;
  if (const QJsonValue message = document.object().value("message"); !message.isUndefined() && !message.isNull()) {
    if (!message.isString()) {
      return std::unexpected(ResponseError::kInvalidField);
    }
    response.message = message.toString().toStdString();
  }
  return response;
}

}  // namespace faceid::net
