#pragma once
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace devpulse::core {

enum class ErrorKind {
  InvalidInput,
  NotFound,
  UpstreamFailure,
  Internal,
};

struct Error {
  ErrorKind Kind{ErrorKind::Internal};
  std::string Message;
};

inline Error invalidInput(std::string Message) {
  return Error{ErrorKind::InvalidInput, std::move(Message)};
}

inline Error notFound(std::string Message) {
  return Error{ErrorKind::NotFound, std::move(Message)};
}

inline Error upstreamFailure(std::string Message) {
  return Error{ErrorKind::UpstreamFailure, std::move(Message)};
}

inline std::string_view toString(ErrorKind Kind) {
  switch (Kind) {
  case ErrorKind::InvalidInput:
    return "invalid_input";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::UpstreamFailure:
    return "upstream_failure";
  case ErrorKind::Internal:
    return "internal";
  }
  return "internal";
}

} // namespace devpulse::core
