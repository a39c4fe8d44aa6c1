#include "render_client.hpp"

#include <cctype>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/remote/response_parser.hpp"

namespace rdash::remote {

using model::CombinedStatus;
using model::DeployDetail;
using model::RemoteError;
using model::RemoteErrorKind;
using model::ServiceDetail;
using model::ServiceState;

namespace obs = rdash::observability;

std::optional<RemoteError> Classify(const HttpResponse& response, const std::string& path) {
  switch (response.transport) {
    case TransportStatus::kTimeout:
      return RemoteError{RemoteErrorKind::kTimeout, 0, "Request timed out: " + path};
    case TransportStatus::kNetworkError:
      return RemoteError{RemoteErrorKind::kNetworkError, 0, "Network error: " + response.error};
    case TransportStatus::kOk:
      break;
  }

  const long code = response.status_code;
  if (code >= 200 && code < 300) return std::nullopt;

  const int status = static_cast<int>(code);
  if (code == 401 || code == 403) {
    return RemoteError{RemoteErrorKind::kAuthFailure, status, "Authentication failed. Check your RENDER_API_KEY is correct."};
  }
  if (code == 404) return RemoteError{RemoteErrorKind::kNotFound, status, "Resource not found: " + path};
  if (code == 429) return RemoteError{RemoteErrorKind::kRateLimited, status, "Rate limit exceeded. Please wait before refreshing."};
  if (code >= 500) {
    return RemoteError{RemoteErrorKind::kNetworkError, status, "API error " + std::to_string(code) + ": " + response.body};
  }
  if (code >= 400) {
    return RemoteError{RemoteErrorKind::kClientError, status, "API error " + std::to_string(code) + ": " + response.body};
  }
  return RemoteError{RemoteErrorKind::kMalformedResponse, status, "Unexpected HTTP status " + std::to_string(code)};
}

std::string EscapePathSegment(const std::string& segment) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(segment.size());
  for (unsigned char c : segment) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
      continue;
    }
    out.push_back('%');
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0F]);
  }
  return out;
}

RenderClient::RenderClient(ClientOptions options, std::shared_ptr<HttpTransport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {
  while (!options_.base_url.empty() && options_.base_url.back() == '/') options_.base_url.pop_back();
}

// ------------------------------------------------------------
// Transport + retry
// ------------------------------------------------------------

FetchResult<std::string> RenderClient::GetOnce(const std::string& path) {
  HttpRequest request;
  request.url     = options_.base_url + path;
  request.timeout = options_.request_timeout;
  request.headers = {{"Authorization", "Bearer " + options_.api_key}, {"Accept", "application/json"}};

  auto response = transport_->Get(request);
  if (auto error = Classify(response, path)) return *error;
  return std::move(response.body);
}

FetchResult<std::string> RenderClient::Get(const std::string& path) {
  auto first = GetOnce(path);
  if (first.ok() || !first.error().transient()) return first;

  obs::LogInfo("retrying remote request", {obs::StringField("path", path), obs::StringField("kind", model::ToString(first.error().kind))});

  if (options_.retry_backoff.count() > 0) std::this_thread::sleep_for(options_.retry_backoff);
  return GetOnce(path);
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

FetchResult<ServiceDetail> RenderClient::FetchServiceDetail(const std::string& service_id) {
  auto body = Get("/services/" + EscapePathSegment(service_id));
  if (!body.ok()) return body.error();
  return ParseService(body.value());
}

FetchResult<std::optional<DeployDetail>> RenderClient::FetchLatestDeploy(const std::string& service_id) {
  auto body = Get("/services/" + EscapePathSegment(service_id) + "/deploys?limit=1");
  if (!body.ok()) return body.error();
  return ParseLatestDeploy(body.value());
}

FetchResult<CombinedStatus> RenderClient::FetchCombined(const std::string& service_id) {
  auto service = FetchServiceDetail(service_id);
  if (!service.ok()) return service.error();

  auto deploy = FetchLatestDeploy(service_id);
  if (!deploy.ok()) return deploy.error();

  CombinedStatus combined;
  combined.service       = std::move(service.value());
  combined.latest_deploy = std::move(deploy.value());

  if (combined.latest_deploy && model::IsInProgress(combined.latest_deploy->state)) {
    combined.service.state = ServiceState::kDeploying;
  }
  return combined;
}

FetchResult<std::vector<ServiceDetail>> RenderClient::ListServices(int limit) {
  auto body = Get("/services?limit=" + std::to_string(limit));
  if (!body.ok()) return body.error();
  return ParseServiceList(body.value());
}

} // namespace rdash::remote
