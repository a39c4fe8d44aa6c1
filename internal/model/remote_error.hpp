#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rdash::model {

enum class RemoteErrorKind : std::uint8_t {
  kAuthFailure = 0,
  kNotFound,
  kRateLimited,
  kNetworkError,
  kTimeout,
  kClientError,
  kMalformedResponse,
};

constexpr std::string_view ToString(RemoteErrorKind kind) {
  switch (kind) {
    case RemoteErrorKind::kAuthFailure:
      return "auth_failure";
    case RemoteErrorKind::kNotFound:
      return "not_found";
    case RemoteErrorKind::kRateLimited:
      return "rate_limited";
    case RemoteErrorKind::kNetworkError:
      return "network_error";
    case RemoteErrorKind::kTimeout:
      return "timeout";
    case RemoteErrorKind::kClientError:
      return "client_error";
    case RemoteErrorKind::kMalformedResponse:
    default:
      return "malformed_response";
  }
}

// Transient kinds get exactly one automatic retry.
constexpr bool IsTransient(RemoteErrorKind kind) {
  return kind == RemoteErrorKind::kRateLimited || kind == RemoteErrorKind::kNetworkError || kind == RemoteErrorKind::kTimeout;
}

struct RemoteError {
  RemoteErrorKind kind = RemoteErrorKind::kNetworkError;
  int             http_status = 0; // 0 when the request never got a response
  std::string     message;

  bool transient() const {
    return IsTransient(kind);
  }
};

} // namespace rdash::model
