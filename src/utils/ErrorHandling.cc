#include "spill/utils/ErrorHandling.hh"
#include "spill/core/Log.hh"

namespace spill {

SpillException::SpillException(const std::string &message)
    : message(message) {}

const char *SpillException::what() const noexcept { return message.c_str(); }

void throwError(const std::string &message) {
  SPILL_LOG_ERROR("SpillException: {}", message);
  throw SpillException(message);
}

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::AlreadyExists:
    return "AlreadyExists";
  case ErrorCode::ResourceExhausted:
    return "ResourceExhausted";
  case ErrorCode::ParseError:
    return "ParseError";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

} // namespace spill
