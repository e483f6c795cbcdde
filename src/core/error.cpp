// core/error.cpp - Error helpers
#include "error.hpp"
#include "../utils.hpp"

namespace safio {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::UnsupportedPlatform:
    return "UnsupportedPlatform";
  case ErrorKind::InvalidRelativePath:
    return "InvalidRelativePath";
  case ErrorKind::TypeMismatch:
    return "TypeMismatch";
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::BridgeInvocationFailed:
    return "BridgeInvocationFailed";
  case ErrorKind::LocalIoFailure:
    return "LocalIoFailure";
  case ErrorKind::InvalidArgument:
    return "InvalidArgument";
  case ErrorKind::InvalidState:
    return "InvalidState";
  }
  return "Unknown";
}

static std::string describe_attempts(
    const std::string &reference,
    const std::vector<ModeExhaustedError::Attempt> &attempts) {
  std::string msg = "No access mode could open " + reference + " (";
  for (size_t i = 0; i < attempts.size(); ++i) {
    msg += attempts[i].first + ": " + attempts[i].second;
    if (i < attempts.size() - 1)
      msg += "; ";
  }
  msg += ")";
  return msg;
}

ModeExhaustedError::ModeExhaustedError(std::string reference,
                                       std::vector<Attempt> attempts)
    : Error(ErrorKind::BridgeInvocationFailed,
            describe_attempts(reference, attempts)),
      reference_(std::move(reference)), attempts_(std::move(attempts)) {}

Error local_io_error(const std::string &what, int err) {
  return Error(ErrorKind::LocalIoFailure, what + ": " + errno_string(err));
}

} // namespace safio
