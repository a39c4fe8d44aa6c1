#include "service_commands.hpp"

#include <algorithm>
#include <istream>
#include <ostream>

#include "internal/cli/status_formatter.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/config/config_writer.hpp"
#include "internal/model/service_record.hpp"
#include "internal/remote/render_client.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace rdash::cli {

using model::ServiceDetail;

std::string DefaultAlias(const std::string& name) {
  auto alias = util::ToLower(name);
  std::replace(alias.begin(), alias.end(), ' ', '-');
  std::replace(alias.begin(), alias.end(), '_', '-');
  return alias;
}

int ListConfiguredServices(const config::DashboardConfig& cfg, std::ostream& out) {
  const auto records = config::ToServiceRecords(cfg);
  if (records.empty()) {
    out << "No services configured. Add one with: rdash service add <name|service-id>\n";
    return 0;
  }
  out << FormatServiceList(records);
  return 0;
}

int AddService(remote::RenderClient& client, config::ConfigWriter& writer, const std::string& term, const std::vector<std::string>& aliases,
               std::ostream& out, std::ostream& err) {
  std::vector<ServiceDetail> matches;

  if (util::StartsWith(term, "srv-")) {
    out << "Looking up service ID: " << term << "...\n";
    auto detail = client.FetchServiceDetail(term);
    if (!detail.ok()) {
      err << "Error fetching service: " << detail.error().message << "\n";
      err << "Make sure the service ID is correct. You can find service IDs at https://dashboard.render.com\n";
      return 1;
    }
    matches.push_back(detail.value());
  } else {
    out << "Searching for services matching '" << term << "'...\n";
    auto all = client.ListServices();
    if (!all.ok()) {
      err << "Error listing services: " << all.error().message << "\n";
      return 1;
    }

    const auto needle = util::ToLower(term);
    for (const auto& service : all.value()) {
      if (util::ToLower(service.name).find(needle) != std::string::npos || util::ToLower(service.id).find(needle) != std::string::npos) {
        matches.push_back(service);
      }
    }

    if (matches.empty()) {
      err << "No services found matching '" << term << "'\n";
      if (!all.value().empty()) {
        err << "\nAvailable services:\n";
        const size_t shown = std::min<size_t>(all.value().size(), 10);
        for (size_t i = 0; i < shown; ++i) err << "  - " << all.value()[i].name << " (" << all.value()[i].id << ")\n";
        if (all.value().size() > shown) err << "  ... and " << (all.value().size() - shown) << " more\n";
      }
      err << "\nOr add by service ID directly:\n  rdash service add srv-xxxxxxxxxxxxx\n";
      return 1;
    }
  }

  if (matches.size() > 1) {
    err << "Found " << matches.size() << " matching services:\n";
    for (size_t i = 0; i < matches.size(); ++i) {
      err << "  " << (i + 1) << ". " << matches[i].name << " (" << matches[i].id << ") - " << matches[i].type << "\n";
    }
    err << "\nRe-run with the service ID to pick one.\n";
    return 1;
  }

  const auto& service = matches.front();

  model::ServiceRecord record;
  record.id      = service.id;
  record.name    = service.name;
  record.aliases = aliases.empty() ? std::vector<std::string>{DefaultAlias(service.name)} : aliases;

  try {
    writer.AddService(record);
  } catch (const util::ConfigError& e) {
    err << "Error adding service: " << e.what() << "\n";
    return 1;
  }

  out << "Added " << service.name << " (" << service.id << ") to " << writer.path().string() << "\n\nYou can now use:\n";
  for (const auto& alias : record.aliases) {
    out << "  rdash " << alias << " status\n";
    out << "  rdash " << alias << " logs\n";
  }
  return 0;
}

int RemoveService(const config::DashboardConfig& cfg, config::ConfigWriter& writer, const std::string& token, bool assume_yes,
                  std::istream& in, std::ostream& out, std::ostream& err) {
  const auto records = config::ToServiceRecords(cfg);
  const auto needle  = util::ToLower(token);

  auto it = std::find_if(records.begin(), records.end(), [&](const model::ServiceRecord& r) {
    if (r.id == token) return true;
    return std::any_of(r.aliases.begin(), r.aliases.end(), [&](const std::string& a) { return util::ToLower(a) == needle; });
  });

  if (it == records.end()) {
    err << "Service '" << token << "' not found in config\n";
    return 1;
  }

  if (!assume_yes) {
    out << "Remove service: " << it->name << " (" << it->id << ")?\nType 'yes' to confirm: " << std::flush;
    std::string answer;
    if (!std::getline(in, answer) || util::ToLower(answer) != "yes") {
      out << "Cancelled\n";
      return 0;
    }
  }

  try {
    writer.RemoveService(it->id);
  } catch (const util::NotFound& e) {
    err << e.what() << "\n";
    return 1;
  }

  out << "Removed " << it->name << " from config\n";
  return 0;
}

} // namespace rdash::cli
