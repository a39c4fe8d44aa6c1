#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/remote/http_transport.hpp"
#include "internal/remote/render_client.hpp"
#include "internal/status/status_cache.hpp"
#include "internal/store/service_store.hpp"
#include "internal/sync/sync_engine.hpp"

namespace rdash::factory {

/*
  RuntimeDependencies

  Owns the long-lived objects shared by the dashboard and the one-shot
  commands. The engine is built but not started.
*/
struct RuntimeDependencies {
  std::shared_ptr<store::ServiceStore>  store;
  std::shared_ptr<remote::RenderClient> client;
  std::shared_ptr<status::StatusCache>  cache;
  std::shared_ptr<sync::SyncEngine>     engine;
};

remote::ClientOptions ClientOptionsFromConfig(const rdash::config::DashboardConfig& config);

/*
  Build

  Composition root. The only place that knows the concrete transport;
  tests pass a scripted one. Without a transport a CurlTransport is used.
  Throws util::ConfigError when the services list is invalid.
*/
RuntimeDependencies Build(const rdash::config::DashboardConfig& config, std::shared_ptr<remote::HttpTransport> transport = nullptr);

} // namespace rdash::factory
