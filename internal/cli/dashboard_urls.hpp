#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rdash::cli {

enum class Action {
  kStatus,
  kLogs,
  kEvents,
  kDeploys,
  kSettings,
};

std::optional<Action> ParseAction(std::string_view value);

std::string_view ToString(Action action);

// https://dashboard.render.com/web/<id>[/logs|/events|/deploys]; kStatus and kSettings map to the service root.
std::string DashboardUrl(const std::string& service_id, Action action);

} // namespace rdash::cli
