#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/service_record.hpp"

namespace rdash::config {

/*
  Loads DashboardConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Every failure is reported as util::ConfigError.
*/
class ConfigLoader {
 public:
  struct Options {
    // Accept a config without services (used by "service add").
    bool allow_empty_services = false;
  };

  static DashboardConfig LoadFromYaml(const std::string& path, const Options& options);
  static DashboardConfig LoadFromYaml(const std::string& path) {
    return LoadFromYaml(path, Options{});
  }

  // --config value if given, else ./config.yaml, else
  // ~/.config/render-dashboard/config.yaml. nullopt when nothing exists.
  static std::optional<std::filesystem::path> Discover(const std::optional<std::string>& explicit_path);

  // Where a new config file is created when none exists.
  static std::filesystem::path DefaultUserPath();
};

// Records in configuration order, with defaults applied.
std::vector<model::ServiceRecord> ToServiceRecords(const DashboardConfig& config);

std::chrono::milliseconds RefreshInterval(const DashboardConfig& config);

} // namespace rdash::config
