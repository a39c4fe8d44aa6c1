#include "internal/remote/response_parser.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

using rdash::model::DeployState;
using rdash::model::RemoteErrorKind;
using rdash::model::ServiceState;
using namespace rdash::remote;

int64_t UnixMillis(rdash::util::TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

constexpr const char* kWrappedService = R"({
  "service": {
    "id": "srv-1",
    "name": "Chat API",
    "type": "web_service",
    "suspended": "not_suspended",
    "status": "available",
    "autoDeploy": "yes",
    "serviceDetails": {"url": "https://chat.onrender.com", "numInstances": 2}
  }
})";

void TestParsesWrappedService() {
  auto result = ParseService(kWrappedService);
  assert(result.ok());
  assert(result.value().id == "srv-1");
  assert(result.value().name == "Chat API");
  assert(result.value().type == "web_service");
  assert(result.value().state == ServiceState::kRunning);
  assert(result.value().url.has_value());
  assert(*result.value().url == "https://chat.onrender.com");
}

void TestParsesBareServiceAndSuspendedFlag() {
  auto result = ParseService(R"({"id": "srv-2", "name": "Cron", "status": "available", "suspended": "suspended"})");
  assert(result.ok());
  assert(result.value().state == ServiceState::kSuspended);
  assert(!result.value().url.has_value());
}

void TestServiceWithoutIdIsMalformed() {
  auto result = ParseService(R"({"service": {"name": "ghost"}})");
  assert(!result.ok());
  assert(result.error().kind == RemoteErrorKind::kMalformedResponse);

  auto garbage = ParseService("<html>502</html>");
  assert(!garbage.ok());
  assert(garbage.error().kind == RemoteErrorKind::kMalformedResponse);
}

void TestParsesLatestDeployFromCursorEnvelope() {
  auto result = ParseLatestDeploy(R"([{
    "deploy": {
      "id": "dep-1",
      "status": "live",
      "commit": {"id": "0123456789abcdef", "message": "Fix login"},
      "createdAt": "2024-05-01T10:00:00Z",
      "finishedAt": "2024-05-01T10:03:00.500Z"
    },
    "cursor": "abc"
  }])");

  assert(result.ok());
  assert(result.value().has_value());

  const auto& deploy = *result.value();
  assert(deploy.id == "dep-1");
  assert(deploy.state == DeployState::kLive);
  assert(deploy.commit_ref && *deploy.commit_ref == "0123456789abcdef");
  assert(deploy.commit_message && *deploy.commit_message == "Fix login");
  assert(UnixMillis(deploy.started_at) == 1714557600000LL);
  assert(deploy.finished_at.has_value());
  assert(UnixMillis(*deploy.finished_at) == 1714557780500LL);
}

void TestEmptyDeployListIsNotAnError() {
  auto result = ParseLatestDeploy("[]");
  assert(result.ok());
  assert(!result.value().has_value());
}

void TestDeployListMustBeAnArray() {
  auto result = ParseLatestDeploy(R"({"unexpected": true})");
  assert(!result.ok());
  assert(result.error().kind == RemoteErrorKind::kMalformedResponse);
}

void TestParsesServiceList() {
  auto result = ParseServiceList(R"([
    {"service": {"id": "srv-1", "name": "Chat API", "status": "available"}, "cursor": "a"},
    {"service": {"id": "srv-2", "name": "Worker", "status": "deploying"}, "cursor": "b"}
  ])");
  assert(result.ok());
  assert(result.value().size() == 2);
  assert(result.value()[1].id == "srv-2");
  assert(result.value()[1].state == ServiceState::kDeploying);
}

void TestStateMapping() {
  assert(MapServiceState("available", "") == ServiceState::kRunning);
  assert(MapServiceState("failed", "") == ServiceState::kFailed);
  assert(MapServiceState("unavailable", "not_suspended") == ServiceState::kFailed);
  assert(MapServiceState("suspended", "") == ServiceState::kSuspended);
  assert(MapServiceState("", "") == ServiceState::kUnknown);
  assert(MapServiceState("something_new", "") == ServiceState::kUnknown);

  assert(MapDeployState("live") == DeployState::kLive);
  assert(MapDeployState("build_in_progress") == DeployState::kBuilding);
  assert(MapDeployState("update_in_progress") == DeployState::kBuilding);
  assert(MapDeployState("pre_deploy_in_progress") == DeployState::kBuilding);
  assert(MapDeployState("build_failed") == DeployState::kFailed);
  assert(MapDeployState("pre_deploy_failed") == DeployState::kFailed);
  assert(MapDeployState("canceled") == DeployState::kCanceled);
  assert(MapDeployState("deactivated") == DeployState::kCanceled);
  assert(MapDeployState("created") == DeployState::kCreated);
  assert(MapDeployState("brand_new_status") == DeployState::kCreated);
}

} // namespace

int main() {
  TestParsesWrappedService();
  TestParsesBareServiceAndSuspendedFlag();
  TestServiceWithoutIdIsMalformed();
  TestParsesLatestDeployFromCursorEnvelope();
  TestEmptyDeployListIsNotAnError();
  TestDeployListMustBeAnArray();
  TestParsesServiceList();
  TestStateMapping();

  std::cout << "rdash_unit_response_parser: pass\n";
  return 0;
}
