#include "internal/cli/status_formatter.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/cli/dashboard_urls.hpp"

namespace {

using namespace rdash::cli;
using rdash::model::DeployDetail;
using rdash::model::DeployState;
using rdash::model::RemoteError;
using rdash::model::RemoteErrorKind;
using rdash::model::ServiceRecord;
using rdash::model::ServiceState;
using rdash::model::StatusSnapshot;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

StatusSnapshot Snapshot(rdash::util::TimePoint now) {
  StatusSnapshot snapshot;
  snapshot.id              = "srv-1";
  snapshot.service_state   = ServiceState::kRunning;
  snapshot.service_name    = "Chat API";
  snapshot.service_type    = "web_service";
  snapshot.service_url     = "https://chat.onrender.com";
  snapshot.last_success_at = now;

  DeployDetail deploy;
  deploy.id             = "dep-1";
  deploy.state          = DeployState::kLive;
  deploy.commit_ref     = "0123456789abcdef";
  deploy.commit_message = "Fix login\n\nlong body";
  deploy.started_at     = now - std::chrono::hours(3);
  snapshot.latest_deploy = deploy;
  return snapshot;
}

const ServiceRecord kRecord{"srv-1", "chat", {"chat", "chat-api"}, 1};

void TestStatusBlock() {
  FormatOptions options;
  options.now = rdash::util::Now();

  const auto text = FormatStatus(kRecord, Snapshot(options.now), options);
  assert(Contains(text, "Chat API"));
  assert(Contains(text, "Status: running"));
  assert(Contains(text, "Type: web_service"));
  assert(Contains(text, "URL: https://chat.onrender.com"));
  assert(Contains(text, "Deployment: ● Live"));
  assert(Contains(text, "Deployed: 3h ago"));
  assert(Contains(text, "Commit: 0123456 - Fix login"));
  assert(!Contains(text, "long body"));
  assert(!Contains(text, "\x1B["));
  assert(!Contains(text, "Last refresh failed"));
}

void TestStatusShowsErrorNextToLastKnownState() {
  FormatOptions options;
  options.now = rdash::util::Now();

  auto snapshot       = Snapshot(options.now);
  snapshot.last_error = RemoteError{RemoteErrorKind::kTimeout, 0, "Request timed out"};

  const auto text = FormatStatus(kRecord, snapshot, options);
  assert(Contains(text, "Status: running"));
  assert(Contains(text, "Last refresh failed: Request timed out"));
}

void TestInProgressDeployShowsStarted() {
  FormatOptions options;
  options.now = rdash::util::Now();

  auto snapshot                 = Snapshot(options.now);
  snapshot.latest_deploy->state = DeployState::kBuilding;
  snapshot.service_state        = ServiceState::kDeploying;

  const auto text = FormatStatus(kRecord, snapshot, options);
  assert(Contains(text, "Status: deploying"));
  assert(Contains(text, "Started: 3h ago"));
}

void TestColorOutput() {
  FormatOptions options;
  options.color = true;
  options.now   = rdash::util::Now();

  const auto text = FormatStatus(kRecord, Snapshot(options.now), options);
  assert(Contains(text, "\x1B[32m"));
}

void TestAmbiguousAndNoMatch() {
  const std::vector<ServiceRecord> candidates = {kRecord, ServiceRecord{"srv-2", "chart", {"chart"}, 2}};

  const auto ambiguous = FormatAmbiguous("ch", candidates);
  assert(Contains(ambiguous, "Multiple services match 'ch'"));
  assert(Contains(ambiguous, "1. chat (aliases: chat, chat-api)"));
  assert(Contains(ambiguous, "2. chart (aliases: chart)"));

  const auto none = FormatNoMatch("zzz", candidates);
  assert(Contains(none, "No service found matching 'zzz'"));
  assert(Contains(none, "chart (chart)"));
}

void TestServiceListIsSortedByPriority() {
  const std::vector<ServiceRecord> records = {ServiceRecord{"srv-2", "Zed", {"z"}, 5}, ServiceRecord{"srv-1", "Alpha", {"a"}, 1}};
  const auto                       text    = FormatServiceList(records);
  assert(Contains(text, "Configured services (2)"));
  assert(text.find("Alpha") < text.find("Zed"));
}

void TestTitleCase() {
  assert(TitleCase("build_failed") == "Build Failed");
  assert(TitleCase("live") == "Live");
}

void TestDashboardUrls() {
  assert(DashboardUrl("srv-1", Action::kLogs) == "https://dashboard.render.com/web/srv-1/logs");
  assert(DashboardUrl("srv-1", Action::kEvents) == "https://dashboard.render.com/web/srv-1/events");
  assert(DashboardUrl("srv-1", Action::kDeploys) == "https://dashboard.render.com/web/srv-1/deploys");
  assert(DashboardUrl("srv-1", Action::kSettings) == "https://dashboard.render.com/web/srv-1");

  assert(ParseAction("LOGS") == Action::kLogs);
  assert(ParseAction("status") == Action::kStatus);
  assert(!ParseAction("restart").has_value());
}

} // namespace

int main() {
  TestStatusBlock();
  TestStatusShowsErrorNextToLastKnownState();
  TestInProgressDeployShowsStarted();
  TestColorOutput();
  TestAmbiguousAndNoMatch();
  TestServiceListIsSortedByPriority();
  TestTitleCase();
  TestDashboardUrls();

  std::cout << "rdash_unit_status_formatter: pass\n";
  return 0;
}
