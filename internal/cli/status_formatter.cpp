#include "status_formatter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "internal/store/service_store.hpp"

namespace rdash::cli {

using model::DeployState;
using model::ServiceState;

namespace {

const char* StateColor(ServiceState state) {
  switch (state) {
    case ServiceState::kRunning:
      return "\x1B[32m";
    case ServiceState::kDeploying:
      return "\x1B[33m";
    case ServiceState::kFailed:
      return "\x1B[31m";
    case ServiceState::kSuspended:
      return "\x1B[90m";
    case ServiceState::kUnknown:
    default:
      return "\x1B[37m";
  }
}

const char* DeployColor(DeployState state) {
  if (state == DeployState::kLive) return "\x1B[32m";
  if (model::IsInProgress(state)) return "\x1B[33m";
  if (state == DeployState::kFailed) return "\x1B[31m";
  return "\x1B[37m";
}

std::string Paint(const std::string& text, const char* sgr, bool color) {
  if (!color) return text;
  return std::string(sgr) + text + "\x1B[0m";
}

} // namespace

std::string TitleCase(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  bool start = true;
  for (char c : value) {
    if (c == '_' || c == ' ') {
      out.push_back(' ');
      start = true;
      continue;
    }
    out.push_back(start ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
    start = false;
  }
  return out;
}

std::string JoinAliases(const model::ServiceRecord& record) {
  if (record.aliases.empty()) return "no aliases";

  std::string out;
  for (size_t i = 0; i < record.aliases.size(); ++i) {
    if (i) out += ", ";
    out += record.aliases[i];
  }
  return out;
}

std::string FormatStatus(const model::ServiceRecord& record, const model::StatusSnapshot& snapshot, const FormatOptions& options) {
  std::ostringstream out;

  const auto& name = snapshot.service_name ? *snapshot.service_name : record.name;
  out << Paint("●", StateColor(snapshot.service_state), options.color) << ' ' << name << '\n';
  out << "Status: " << model::ToString(snapshot.service_state) << '\n';
  if (snapshot.service_type) out << "Type: " << *snapshot.service_type << '\n';
  if (snapshot.service_url) out << "URL: " << *snapshot.service_url << '\n';

  if (snapshot.latest_deploy) {
    const auto& deploy = *snapshot.latest_deploy;
    out << "Deployment: " << Paint("●", DeployColor(deploy.state), options.color) << ' ' << TitleCase(model::ToString(deploy.state)) << '\n';
    out << (model::IsInProgress(deploy.state) ? "Started: " : "Deployed: ") << util::TimeAgo(deploy.started_at, options.now) << '\n';
    if (deploy.commit_ref) {
      out << "Commit: " << deploy.commit_ref->substr(0, 7);
      if (deploy.commit_message) {
        const auto& message = *deploy.commit_message;
        out << " - " << message.substr(0, message.find('\n'));
      }
      out << '\n';
    }
  } else if (snapshot.has_data()) {
    out << "Deployment: none\n";
  }

  if (snapshot.last_error) {
    out << Paint("Last refresh failed: " + snapshot.last_error->message, "\x1B[31m", options.color) << '\n';
  }

  std::string text = out.str();
  if (!text.empty() && text.back() == '\n') text.pop_back();
  return text;
}

std::string FormatAmbiguous(const std::string& token, const std::vector<model::ServiceRecord>& candidates) {
  std::ostringstream out;
  out << "Multiple services match '" << token << "':\n";
  for (size_t i = 0; i < candidates.size(); ++i) {
    out << "  " << (i + 1) << ". " << candidates[i].name << " (aliases: " << JoinAliases(candidates[i]) << ")\n";
  }
  out << "\nUse a more specific alias or service name.";
  return out.str();
}

std::string FormatNoMatch(const std::string& token, const std::vector<model::ServiceRecord>& records) {
  std::ostringstream out;
  out << "No service found matching '" << token << "'\n\nAvailable services:";
  for (const auto& record : records) {
    out << "\n  " << record.name << " (" << JoinAliases(record) << ")";
  }
  return out.str();
}

std::string FormatServiceList(const std::vector<model::ServiceRecord>& records) {
  auto sorted = records;
  std::stable_sort(sorted.begin(), sorted.end(), store::PriorityOrder);

  std::ostringstream out;
  out << "Configured services (" << sorted.size() << "):\n";
  for (const auto& record : sorted) {
    out << "\n  " << record.name << '\n';
    out << "    ID: " << record.id << '\n';
    out << "    Aliases: " << JoinAliases(record) << '\n';
  }
  return out.str();
}

} // namespace rdash::cli
