#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cli/dashboard_urls.hpp"
#include "internal/model/service_record.hpp"
#include "internal/model/status_snapshot.hpp"
#include "internal/util/time.hpp"

namespace rdash::status {
class StatusCache;
}
namespace rdash::sync {
class SyncEngine;
}

namespace rdash::tui {

/*
  Full-screen ncurses dashboard.

  Reads only the StatusCache (polled every tick) and the engine's
  staleness clock; refreshes go through SyncEngine::TriggerManualRefresh.
  Keys: r refresh, q quit, up/down or j/k select, l/e/d/s open
  logs/events/deploys/settings of the selected service.
*/
class Dashboard {
 public:
  Dashboard(std::vector<model::ServiceRecord> services, std::shared_ptr<status::StatusCache> cache, std::shared_ptr<sync::SyncEngine> engine);

  // Blocks until the user quits.
  void Run();

 private:
  void Draw();
  int  DrawCard(int row, int max_row, int width, const model::ServiceRecord& record, const model::StatusSnapshot& snapshot, bool selected);
  bool HandleKey(int ch);
  void OpenSelected(cli::Action action);

  std::vector<model::ServiceRecord>    services_;
  std::shared_ptr<status::StatusCache> cache_;
  std::shared_ptr<sync::SyncEngine>    engine_;

  size_t      selected_ = 0;
  size_t      offset_   = 0;
  std::string flash_;
  util::TimePoint flash_until_{};
};

// "└─ Last deploy: 3h ago (live)" and friends; shared with tests.
std::string DeployLine(const model::StatusSnapshot& snapshot, util::TimePoint now);

// "Updated 12s ago" / "Refreshing..." / "Waiting for first refresh"
std::string StalenessLabel(bool cycle_running, const std::optional<std::chrono::steady_clock::duration>& since_start);

} // namespace rdash::tui
