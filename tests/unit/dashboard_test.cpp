#include "internal/tui/dashboard.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono_literals;
using rdash::model::DeployDetail;
using rdash::model::DeployState;
using rdash::model::RemoteError;
using rdash::model::RemoteErrorKind;
using rdash::model::StatusSnapshot;
using rdash::tui::DeployLine;
using rdash::tui::StalenessLabel;

void TestDeployLineBeforeFirstFetch() {
  StatusSnapshot snapshot;
  assert(DeployLine(snapshot, rdash::util::Now()) == "└─ Loading...");

  snapshot.last_error = RemoteError{RemoteErrorKind::kAuthFailure, 401, "Authentication failed"};
  assert(DeployLine(snapshot, rdash::util::Now()) == "└─ No data yet");
}

void TestDeployLineStates() {
  const auto now = rdash::util::Now();

  StatusSnapshot snapshot;
  snapshot.last_success_at = now;
  assert(DeployLine(snapshot, now) == "└─ No deployments");

  DeployDetail deploy;
  deploy.state           = DeployState::kBuilding;
  deploy.started_at      = now - 5min;
  snapshot.latest_deploy = deploy;
  assert(DeployLine(snapshot, now) == "└─ Deploy started: 5m ago");

  snapshot.latest_deploy->state = DeployState::kLive;
  snapshot.latest_deploy->started_at = now - 2h;
  assert(DeployLine(snapshot, now) == "└─ Last deploy: 2h ago (live)");
}

void TestStalenessLabel() {
  assert(StalenessLabel(false, std::nullopt) == "Waiting for first refresh");
  assert(StalenessLabel(true, std::chrono::steady_clock::duration(12s)) == "Refreshing...");
  assert(StalenessLabel(false, std::chrono::steady_clock::duration(12s)) == "Updated 12s ago");
}

} // namespace

int main() {
  TestDeployLineBeforeFirstFetch();
  TestDeployLineStates();
  TestStalenessLabel();

  std::cout << "rdash_unit_dashboard: pass\n";
  return 0;
}
