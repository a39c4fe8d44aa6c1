#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/remote/fetch_result.hpp"
#include "internal/remote/http_transport.hpp"
#include "internal/remote/status_fetcher.hpp"

namespace rdash::remote {

constexpr const char* kDefaultBaseUrl = "https://api.render.com/v1";

struct ClientOptions {
  std::string               base_url = kDefaultBaseUrl;
  std::string               api_key;
  std::chrono::milliseconds request_timeout{30000};
  std::chrono::milliseconds retry_backoff{500};
};

/*
  Render API client.

  Every GET is classified into a model::RemoteError on failure. Transient
  kinds (rate limit, network, timeout) are retried exactly once after
  retry_backoff; everything else is returned on the first attempt.
  Thread-safe as long as the transport is.
*/
class RenderClient : public StatusFetcher {
 public:
  RenderClient(ClientOptions options, std::shared_ptr<HttpTransport> transport);

  FetchResult<model::ServiceDetail>               FetchServiceDetail(const std::string& service_id);
  FetchResult<std::optional<model::DeployDetail>> FetchLatestDeploy(const std::string& service_id);

  // Both reads must succeed; the first failure is returned as-is.
  FetchResult<model::CombinedStatus> FetchCombined(const std::string& service_id) override;

  FetchResult<std::vector<model::ServiceDetail>> ListServices(int limit = 100);

 private:
  FetchResult<std::string> Get(const std::string& path);
  FetchResult<std::string> GetOnce(const std::string& path);

  ClientOptions                  options_;
  std::shared_ptr<HttpTransport> transport_;
};

// Maps a transport outcome to an error, or nullopt for a 2xx response.
std::optional<model::RemoteError> Classify(const HttpResponse& response, const std::string& path);

// Percent-encodes one URL path segment.
std::string EscapePathSegment(const std::string& segment);

} // namespace rdash::remote
