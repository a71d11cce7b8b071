#include <faceid/app/notice.hpp>

#include <faceid/app/loggers.hpp>
#include <faceid/core/logger.hpp>

#include <string>

namespace faceid {

UserNotice PipelineFailure::ToNotice() const {
  UserNotice notice;
  notice.title = std::string(PipelineErrorToString(code));
  notice.message = detail.empty() ? notice.title : detail;
  return notice;
}

PipelineFailure PipelineFailure::FromTransport(const net::TransportFailure& failure) {
  if (failure.code == net::TransportError::kNotConfigured) {
    return {PipelineError::kConfigurationError, failure.Describe()};
  }
  return {PipelineError::kTransportError, failure.Describe()};
}

void LogNoticeSink::ShowNotice(const UserNotice& notice) {
  FACEID_INFO_LOGGER(kPipelineLogger, "{}: {}", notice.title, notice.message);
}

}  // namespace faceid
