// core/error.hpp - Error kinds raised by the access layer
#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace safio {

enum class ErrorKind {
  UnsupportedPlatform,
  InvalidRelativePath,
  TypeMismatch,
  NotFound,
  BridgeInvocationFailed,
  LocalIoFailure,
  InvalidArgument,
  InvalidState,
};

const char *error_kind_name(ErrorKind kind);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Every candidate mode of a negotiated open failed for one reference
class ModeExhaustedError : public Error {
public:
  using Attempt = std::pair<std::string, std::string>; // mode, failure

  ModeExhaustedError(std::string reference, std::vector<Attempt> attempts);

  const std::string &reference() const { return reference_; }
  const std::vector<Attempt> &attempts() const { return attempts_; }

private:
  std::string reference_;
  std::vector<Attempt> attempts_;
};

// LocalIoFailure carrying strerror(err)
Error local_io_error(const std::string &what, int err);

} // namespace safio
