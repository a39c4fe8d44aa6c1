#include "dashboard_urls.hpp"

#include "internal/util/strings.hpp"

namespace rdash::cli {

namespace {
constexpr const char* kDashboardBase = "https://dashboard.render.com/web/";
}

std::optional<Action> ParseAction(std::string_view value) {
  const auto action = util::ToLower(value);
  if (action == "status") return Action::kStatus;
  if (action == "logs") return Action::kLogs;
  if (action == "events") return Action::kEvents;
  if (action == "deploys") return Action::kDeploys;
  if (action == "settings") return Action::kSettings;
  return std::nullopt;
}

std::string_view ToString(Action action) {
  switch (action) {
    case Action::kStatus:
      return "status";
    case Action::kLogs:
      return "logs";
    case Action::kEvents:
      return "events";
    case Action::kDeploys:
      return "deploys";
    case Action::kSettings:
    default:
      return "settings";
  }
}

std::string DashboardUrl(const std::string& service_id, Action action) {
  const std::string base = kDashboardBase + service_id;

  switch (action) {
    case Action::kLogs:
      return base + "/logs";
    case Action::kEvents:
      return base + "/events";
    case Action::kDeploys:
      return base + "/deploys";
    case Action::kStatus:
    case Action::kSettings:
    default:
      return base;
  }
}

} // namespace rdash::cli
