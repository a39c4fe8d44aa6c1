#include "config_writer.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace rdash::config {

namespace {

YAML::Node LoadOrCreate(const std::filesystem::path& path) {
  if (std::filesystem::exists(path)) {
    try {
      auto root = YAML::LoadFile(path.string());
      if (root.IsMap()) return root;
    } catch (const std::exception& e) {
      throw util::ConfigError("Invalid YAML in config file: " + std::string(e.what()));
    }
    throw util::ConfigError("Config file must contain a YAML dictionary");
  }

  YAML::Node root;
  root["render"]["api_key"]          = "${RENDER_API_KEY}";
  root["render"]["refresh_interval"] = 30;
  return root;
}

void Save(const std::filesystem::path& path, const YAML::Node& root) {
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

  YAML::Emitter out;
  out << root;

  std::ofstream file(path, std::ios::trunc);
  if (!file) {
    throw util::ConfigError("Cannot write config file: " + path.string());
  }
  file << out.c_str() << '\n';
}

} // namespace

ConfigWriter::ConfigWriter(std::filesystem::path path) : path_(std::move(path)) {
}

void ConfigWriter::AddService(const model::ServiceRecord& record) {
  auto root     = LoadOrCreate(path_);
  auto services = root["services"];

  std::unordered_set<std::string> taken;
  if (services && services.IsSequence()) {
    for (const auto& entry : services) {
      if (entry["id"] && entry["id"].as<std::string>() == record.id) {
        throw util::ConfigError("Service " + record.id + " is already configured");
      }
      if (entry["aliases"] && entry["aliases"].IsSequence()) {
        for (const auto& alias : entry["aliases"]) taken.insert(util::ToLower(alias.as<std::string>()));
      }
    }
  }

  for (const auto& alias : record.aliases) {
    if (taken.count(util::ToLower(alias))) {
      throw util::ConfigError("Alias '" + alias + "' is already used by another service");
    }
  }

  YAML::Node entry;
  entry["id"]   = record.id;
  entry["name"] = record.name;
  for (const auto& alias : record.aliases) entry["aliases"].push_back(alias);
  entry["priority"] = record.priority;

  root["services"].push_back(entry);
  Save(path_, root);
}

void ConfigWriter::RemoveService(const std::string& service_id) {
  if (!std::filesystem::exists(path_)) {
    throw util::NotFound("Config file not found: " + path_.string());
  }

  auto root     = LoadOrCreate(path_);
  auto services = root["services"];
  if (!services || !services.IsSequence()) {
    throw util::NotFound("Service " + service_id + " is not configured");
  }

  YAML::Node kept(YAML::NodeType::Sequence);
  bool       removed = false;
  for (const auto& entry : services) {
    if (entry["id"] && entry["id"].as<std::string>() == service_id) {
      removed = true;
      continue;
    }
    kept.push_back(entry);
  }

  if (!removed) {
    throw util::NotFound("Service " + service_id + " is not configured");
  }

  root["services"] = kept;
  Save(path_, root);
}

} // namespace rdash::config
