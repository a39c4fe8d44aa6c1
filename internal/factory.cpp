#include "factory.hpp"

#include <memory>

#include "internal/config/config_loader.hpp"
#include "internal/remote/curl_transport.hpp"

namespace rdash::factory {

remote::ClientOptions ClientOptionsFromConfig(const rdash::config::DashboardConfig& config) {
  const auto& render = config.render();

  remote::ClientOptions options;
  options.api_key = render.api_key();
  if (!render.base_url().empty()) options.base_url = render.base_url();
  if (render.request_timeout_ms() > 0) options.request_timeout = std::chrono::milliseconds(render.request_timeout_ms());
  if (render.has_retry_backoff_ms()) options.retry_backoff = std::chrono::milliseconds(render.retry_backoff_ms());
  return options;
}

RuntimeDependencies Build(const rdash::config::DashboardConfig& config, std::shared_ptr<remote::HttpTransport> transport) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Configured services
  // ------------------------------------------------------------------
  deps.store = std::make_shared<store::ServiceStore>(rdash::config::ToServiceRecords(config));

  // ------------------------------------------------------------------
  // Remote access
  // ------------------------------------------------------------------
  if (!transport) transport = std::make_shared<remote::CurlTransport>();
  deps.client = std::make_shared<remote::RenderClient>(ClientOptionsFromConfig(config), std::move(transport));

  // ------------------------------------------------------------------
  // Shared state + background refresh
  // ------------------------------------------------------------------
  deps.cache = std::make_shared<status::StatusCache>();
  deps.cache->Seed(deps.store->Ids());

  deps.engine = std::make_shared<sync::SyncEngine>(deps.client, deps.cache);

  return deps;
}

} // namespace rdash::factory
