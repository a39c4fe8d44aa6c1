#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cli/browser.hpp"
#include "internal/cli/dashboard_urls.hpp"
#include "internal/cli/service_commands.hpp"
#include "internal/cli/status_formatter.hpp"
#include "internal/cli/status_query.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/config/config_writer.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/curl_transport.hpp"
#include "internal/resolver/service_resolver.hpp"
#include "internal/tui/dashboard.hpp"
#include "internal/util/errors.hpp"

using rdash::config::ConfigLoader;
using rdash::config::DashboardConfig;
using rdash::observability::LogTarget;
using rdash::observability::StringField;

namespace {

constexpr int kExitUsage  = 1;
constexpr int kExitRemote = 2;

struct CommandLine {
  std::optional<std::string> config_path;
  bool                       help       = false;
  bool                       refresh    = false;
  bool                       assume_yes = false;
  std::vector<std::string>   positional;
};

void Usage(std::ostream& out) {
  out << "Usage:\n"
      << "  rdash [--config PATH]                                  live dashboard\n"
      << "  rdash [--config PATH] <service> status [--refresh]     print current status\n"
      << "  rdash [--config PATH] <service> logs|events|deploys|settings\n"
      << "  rdash [--config PATH] service list\n"
      << "  rdash [--config PATH] service add <srv-id|name> [alias...]\n"
      << "  rdash [--config PATH] service remove <alias|id> [--yes]\n"
      << "\n"
      << "<service> is an alias, an alias prefix or a name prefix.\n";
}

CommandLine ParseArgs(int argc, char** argv) {
  CommandLine cmd;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      cmd.help = true;
    } else if (arg == "--config") {
      if (i + 1 >= argc) throw rdash::util::UsageError("--config requires a path");
      cmd.config_path = argv[++i];
    } else if (arg.rfind("--config=", 0) == 0) {
      cmd.config_path = arg.substr(9);
    } else if (arg == "--refresh") {
      cmd.refresh = true;
    } else if (arg == "--yes" || arg == "-y") {
      cmd.assume_yes = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw rdash::util::UsageError("Unknown option: " + arg);
    } else {
      cmd.positional.push_back(arg);
    }
  }
  return cmd;
}

DashboardConfig LoadConfig(const CommandLine& cmd, const ConfigLoader::Options& options = {}) {
  const auto path = ConfigLoader::Discover(cmd.config_path);
  if (!path) {
    throw rdash::util::ConfigError("No config file found. Create " + ConfigLoader::DefaultUserPath().string() +
                                   " or add a service with: rdash service add <name|service-id>");
  }
  return ConfigLoader::LoadFromYaml(path->string(), options);
}

// ------------------------------------------------------------
// rdash (no arguments)
// ------------------------------------------------------------

int RunDashboard(const CommandLine& cmd) {
  auto config = LoadConfig(cmd);
  rdash::observability::InitializeLogging(config.logging(), LogTarget::kDefaultFile);

  auto deps = rdash::factory::Build(config);
  deps.engine->Start(deps.store->Ids(), rdash::config::RefreshInterval(config));
  RDASH_LOG_INFO("dashboard started", {rdash::observability::IntField("services", static_cast<int64_t>(deps.store->size()))});

  rdash::tui::Dashboard dashboard(deps.store->ByPriority(), deps.cache, deps.engine);
  dashboard.Run();

  deps.engine->Stop();
  RDASH_LOG_INFO("dashboard stopped");
  return 0;
}

// ------------------------------------------------------------
// rdash service list|add|remove
// ------------------------------------------------------------

int RunServiceCommand(const CommandLine& cmd) {
  const auto& args = cmd.positional;
  if (args.size() < 2) throw rdash::util::UsageError("Missing service subcommand (list, add, remove)");

  const auto& sub = args[1];
  ConfigLoader::Options lenient;
  lenient.allow_empty_services = true;

  if (sub == "list") {
    auto config = LoadConfig(cmd, lenient);
    rdash::observability::InitializeLogging(config.logging(), LogTarget::kStderr);
    return rdash::cli::ListConfiguredServices(config, std::cout);
  }

  if (sub == "add") {
    if (args.size() < 3) throw rdash::util::UsageError("Usage: rdash service add <srv-id|name> [alias...]");

    // A missing file is fine here; the writer creates it.
    const auto      discovered = ConfigLoader::Discover(cmd.config_path);
    const auto      path       = discovered && std::filesystem::exists(*discovered) ? *discovered : ConfigLoader::DefaultUserPath();
    DashboardConfig config;
    if (std::filesystem::exists(path)) {
      config = ConfigLoader::LoadFromYaml(path.string(), lenient);
    } else if (const char* env = std::getenv("RENDER_API_KEY"); env && *env) {
      config.mutable_render()->set_api_key(env);
    } else {
      throw rdash::util::ConfigError("RENDER_API_KEY is not set. Please set it with: export RENDER_API_KEY=your-key");
    }
    rdash::observability::InitializeLogging(config.logging(), LogTarget::kStderr);

    rdash::remote::RenderClient client(rdash::factory::ClientOptionsFromConfig(config), std::make_shared<rdash::remote::CurlTransport>());
    rdash::config::ConfigWriter writer(path);
    const std::vector<std::string> aliases(args.begin() + 3, args.end());
    return rdash::cli::AddService(client, writer, args[2], aliases, std::cout, std::cerr);
  }

  if (sub == "remove") {
    if (args.size() != 3) throw rdash::util::UsageError("Usage: rdash service remove <alias|id> [--yes]");

    const auto path = ConfigLoader::Discover(cmd.config_path);
    if (!path) throw rdash::util::ConfigError("No config file found");
    auto config = ConfigLoader::LoadFromYaml(path->string(), lenient);
    rdash::observability::InitializeLogging(config.logging(), LogTarget::kStderr);

    rdash::config::ConfigWriter writer(*path);
    return rdash::cli::RemoveService(config, writer, args[2], cmd.assume_yes, std::cin, std::cout, std::cerr);
  }

  throw rdash::util::UsageError("Unknown service subcommand: " + sub);
}

// ------------------------------------------------------------
// rdash <token> <action>
// ------------------------------------------------------------

int RunTokenCommand(const CommandLine& cmd) {
  const auto& args = cmd.positional;
  if (args.size() != 2) throw rdash::util::UsageError("Usage: rdash <service> <action>");

  const auto action = rdash::cli::ParseAction(args[1]);
  if (!action) {
    throw rdash::util::UsageError("Invalid action: " + args[1] + ". Valid actions: status, logs, events, deploys, settings");
  }

  auto config = LoadConfig(cmd);
  rdash::observability::InitializeLogging(config.logging(), LogTarget::kStderr);
  auto deps = rdash::factory::Build(config);

  const auto match = rdash::resolver::Resolve(args[0], deps.store->Records());
  switch (match.kind) {
    case rdash::resolver::MatchKind::kNoMatch:
      std::cerr << rdash::cli::FormatNoMatch(args[0], deps.store->ByPriority()) << "\n";
      return kExitUsage;
    case rdash::resolver::MatchKind::kAmbiguous:
      std::cerr << rdash::cli::FormatAmbiguous(args[0], match.candidates) << "\n";
      return kExitUsage;
    case rdash::resolver::MatchKind::kUnique:
      break;
  }

  const auto& record = match.record();

  if (*action == rdash::cli::Action::kStatus) {
    rdash::cli::StatusQuery query(deps.client, deps.cache);
    const auto              snapshot = query.Query(record, cmd.refresh);

    rdash::cli::FormatOptions options;
    options.color = ::isatty(STDOUT_FILENO) != 0;
    std::cout << rdash::cli::FormatStatus(record, snapshot, options) << "\n";
    return 0;
  }

  const auto url = rdash::cli::DashboardUrl(record.id, *action);
  std::cout << "Opening " << rdash::cli::ToString(*action) << " for " << record.name << "...\n";
  if (!rdash::cli::OpenInBrowser(url)) {
    std::cerr << "Could not open a browser. Open this URL manually:\n" << url << "\n";
    return kExitUsage;
  }
  std::cout << url << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  int rc = 0;
  try {
    const auto cmd = ParseArgs(argc, argv);

    if (cmd.help) {
      Usage(std::cout);
    } else if (cmd.positional.empty()) {
      rc = RunDashboard(cmd);
    } else if (cmd.positional[0] == "service") {
      rc = RunServiceCommand(cmd);
    } else {
      rc = RunTokenCommand(cmd);
    }
  } catch (const rdash::util::UsageError& e) {
    std::cerr << e.what() << "\n\n";
    Usage(std::cerr);
    rc = kExitUsage;
  } catch (const rdash::util::ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    rc = kExitUsage;
  } catch (const rdash::cli::RemoteFailure& e) {
    RDASH_LOG_ERROR("status fetch failed", {StringField("kind", rdash::model::ToString(e.error().kind)), StringField("error", e.what())});
    std::cerr << "Error: " << e.what() << "\n";
    rc = kExitRemote;
  } catch (const std::exception& e) {
    RDASH_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    std::cerr << "Error: " << e.what() << "\n";
    rc = kExitUsage;
  }

  rdash::observability::ShutdownLogging();
  return rc;
}
