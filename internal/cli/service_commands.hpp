#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace rdash::remote {
class RenderClient;
}
namespace rdash::config {
class ConfigWriter;
}

namespace rdash::cli {

/*
  `rdash service ...` maintains the services list of the config file.
  Each returns the process exit code.
*/

int ListConfiguredServices(const config::DashboardConfig& config, std::ostream& out);

// term is a service id ("srv-...") or a case-insensitive name fragment
// searched through the account's service list. Without aliases the
// default alias is derived from the service name.
int AddService(remote::RenderClient& client, config::ConfigWriter& writer, const std::string& term, const std::vector<std::string>& aliases,
               std::ostream& out, std::ostream& err);

// token is a service id or one of its aliases (exact, case-insensitive).
int RemoveService(const config::DashboardConfig& config, config::ConfigWriter& writer, const std::string& token, bool assume_yes,
                  std::istream& in, std::ostream& out, std::ostream& err);

// "Chat API_v2" -> "chat-api-v2"
std::string DefaultAlias(const std::string& name);

} // namespace rdash::cli
