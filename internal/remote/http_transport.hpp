#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace rdash::remote {

struct HttpRequest {
  std::string                                      url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::chrono::milliseconds                        timeout{30000};
};

enum class TransportStatus {
  kOk,           // a response arrived; see status_code
  kTimeout,      // the request exceeded HttpRequest::timeout
  kNetworkError, // DNS, connect, TLS, reset, ...
};

struct HttpResponse {
  TransportStatus transport = TransportStatus::kOk;
  long            status_code = 0;
  std::string     body;
  std::string     error; // transport error text when transport != kOk
};

/*
  Blocking HTTP GET. Implementations must be safe to call from several
  threads at once; the sync engine issues one request per service
  concurrently.
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Get(const HttpRequest& request) = 0;
};

} // namespace rdash::remote
