#pragma once
#include <expected>
#include <string>
#include <string_view>

namespace media_service {

enum class ErrorKind {
  Validation,           // malformed request, bad bitrate
  NotFound,             // unknown artifact/job, missing file
  NotReady,             // artifact exists but has no re-encoded output yet
  RangeNotSatisfiable,
  TranscodeFailure,
  Internal
};

struct ServiceError {
  ErrorKind kind{ErrorKind::Internal};
  std::string message;
};

inline std::unexpected<ServiceError> makeError(ErrorKind kind, std::string message) {
  return std::unexpected(ServiceError{kind, std::move(message)});
}

constexpr std::string_view toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation: return "validation";
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::NotReady: return "not_ready";
    case ErrorKind::RangeNotSatisfiable: return "range_not_satisfiable";
    case ErrorKind::TranscodeFailure: return "transcode_failure";
    case ErrorKind::Internal: return "internal";
  }
  return "internal";
}

} // namespace media_service
