#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/remote_error.hpp"
#include "internal/util/time.hpp"

namespace rdash::model {

enum class ServiceState : std::uint8_t {
  kUnknown = 0,
  kRunning,
  kDeploying,
  kSuspended,
  kFailed,
};

enum class DeployState : std::uint8_t {
  kCreated = 0,
  kBuilding,
  kLive,
  kFailed,
  kCanceled,
};

constexpr std::string_view ToString(ServiceState state) {
  switch (state) {
    case ServiceState::kRunning:
      return "running";
    case ServiceState::kDeploying:
      return "deploying";
    case ServiceState::kSuspended:
      return "suspended";
    case ServiceState::kFailed:
      return "failed";
    case ServiceState::kUnknown:
    default:
      return "unknown";
  }
}

constexpr std::string_view ToString(DeployState state) {
  switch (state) {
    case DeployState::kBuilding:
      return "building";
    case DeployState::kLive:
      return "live";
    case DeployState::kFailed:
      return "failed";
    case DeployState::kCanceled:
      return "canceled";
    case DeployState::kCreated:
    default:
      return "created";
  }
}

constexpr bool IsInProgress(DeployState state) {
  return state == DeployState::kBuilding || state == DeployState::kCreated;
}

struct ServiceDetail {
  std::string                id;
  std::string                name;
  std::string                type;
  ServiceState               state = ServiceState::kUnknown;
  std::optional<std::string> url;
};

struct DeployDetail {
  std::string                    id;
  DeployState                    state = DeployState::kCreated;
  std::optional<std::string>     commit_ref;
  std::optional<std::string>     commit_message;
  util::TimePoint                started_at{};
  std::optional<util::TimePoint> finished_at;
};

// Result of a successful combined fetch: service detail plus latest deploy.
struct CombinedStatus {
  ServiceDetail               service;
  std::optional<DeployDetail> latest_deploy;
};

/*
  Latest known state of one service plus fetch metadata.

  service_state stays kUnknown until the first successful fetch. A failed
  fetch only touches last_error / last_fetched_at, so the previously
  known-good fields survive transient failures.
*/
struct StatusSnapshot {
  std::string id;

  ServiceState                service_state = ServiceState::kUnknown;
  std::optional<std::string>  service_name;
  std::optional<std::string>  service_type;
  std::optional<std::string>  service_url;
  std::optional<DeployDetail> latest_deploy;

  std::optional<util::TimePoint> last_fetched_at;
  std::optional<util::TimePoint> last_success_at;
  std::optional<RemoteError>     last_error;
  bool                           in_flight = false;

  bool has_data() const {
    return last_success_at.has_value();
  }
};

} // namespace rdash::model
