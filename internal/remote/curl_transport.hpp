#pragma once

#include <string>

#include "internal/remote/http_transport.hpp"

namespace rdash::remote {

/*
  libcurl transport. One easy handle per request, so concurrent Get()
  calls share nothing. curl_global_init runs once per process.
*/
class CurlTransport : public HttpTransport {
 public:
  explicit CurlTransport(std::string user_agent = "rdash/1.0");

  HttpResponse Get(const HttpRequest& request) override;

 private:
  std::string user_agent_;
};

} // namespace rdash::remote
