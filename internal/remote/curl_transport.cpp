#include "curl_transport.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>

namespace rdash::remote {

namespace {

std::once_flag g_curl_init;

size_t WriteBody(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(data, size * nmemb);
  return size * nmemb;
}

struct EasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

} // namespace

CurlTransport::CurlTransport(std::string user_agent) : user_agent_(std::move(user_agent)) {
  std::call_once(g_curl_init, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

HttpResponse CurlTransport::Get(const HttpRequest& request) {
  HttpResponse response;

  std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
  if (!handle) {
    response.transport = TransportStatus::kNetworkError;
    response.error     = "curl_easy_init failed";
    return response;
  }

  curl_slist* raw_headers = nullptr;
  for (const auto& [name, value] : request.headers) {
    const auto line = name + ": " + value;
    raw_headers     = curl_slist_append(raw_headers, line.c_str());
  }
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  CURL* curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

  const CURLcode rc = curl_easy_perform(curl);
  if (rc != CURLE_OK) {
    response.transport = rc == CURLE_OPERATION_TIMEDOUT ? TransportStatus::kTimeout : TransportStatus::kNetworkError;
    response.error     = curl_easy_strerror(rc);
    return response;
  }

  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

} // namespace rdash::remote
