#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <cstdio>

#include "internal/store/service_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace rdash::config {

using util::ConfigError;

namespace {

constexpr uint32_t kDefaultRefreshSeconds = 30;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigError("Unsupported YAML node");
  }
}

// Aliases and names are strings even when they look like numbers ("2048").
void StringifyScalars(google::protobuf::Value* value) {
  if (value->kind_case() == google::protobuf::Value::kNumberValue) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.15g", value->number_value());
    value->set_string_value(buffer);
  } else if (value->kind_case() == google::protobuf::Value::kBoolValue) {
    value->set_string_value(value->bool_value() ? "true" : "false");
  }
}

void NormalizeServiceEntries(google::protobuf::Value* root) {
  if (root->kind_case() != google::protobuf::Value::kStructValue) return;

  auto& fields = *root->mutable_struct_value()->mutable_fields();
  auto  it     = fields.find("services");
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kListValue) return;

  for (auto& entry : *it->second.mutable_list_value()->mutable_values()) {
    if (entry.kind_case() != google::protobuf::Value::kStructValue) continue;

    auto& service = *entry.mutable_struct_value()->mutable_fields();
    for (const char* key : {"id", "name"}) {
      if (auto field = service.find(key); field != service.end()) StringifyScalars(&field->second);
    }
    if (auto aliases = service.find("aliases"); aliases != service.end() && aliases->second.kind_case() == google::protobuf::Value::kListValue) {
      for (auto& alias : *aliases->second.mutable_list_value()->mutable_values()) StringifyScalars(&alias);
    }
  }
}

// "${VAR}" -> value of VAR; anything else unchanged.
std::string SubstituteEnv(const std::string& value) {
  if (value.size() < 3 || !util::StartsWith(value, "${") || value.back() != '}') return value;

  const auto  name = value.substr(2, value.size() - 3);
  const char* env  = std::getenv(name.c_str());
  if (!env) {
    throw ConfigError("Environment variable " + name + " not set. Please set it with: export " + name + "=your-value");
  }
  return env;
}

void ValidateServiceEntries(const DashboardConfig& config) {
  for (int i = 0; i < config.services_size(); ++i) {
    const auto& entry = config.services(i);
    if (entry.id().empty()) {
      throw ConfigError("Service at index " + std::to_string(i) + " missing required 'id' field");
    }
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

DashboardConfig ConfigLoader::LoadFromYaml(const std::string& path, const Options& options) {
  if (!std::filesystem::exists(path)) {
    throw ConfigError("Config file not found: " + path);
  }

  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigError("Invalid YAML in config file: " + std::string(e.what()));
  }

  if (!yaml.IsMap()) {
    throw ConfigError("Config file must contain a YAML dictionary");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);
  NormalizeServiceEntries(&json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  DashboardConfig config;

  google::protobuf::util::JsonParseOptions parse_options;
  parse_options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, parse_options);
  if (!status.ok()) {
    throw ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  // credential
  auto* render = config.mutable_render();
  render->set_api_key(SubstituteEnv(render->api_key()));
  if (render->api_key().empty()) {
    if (const char* env = std::getenv("RENDER_API_KEY"); env && *env) render->set_api_key(env);
  }
  if (render->api_key().empty()) {
    throw ConfigError("Missing render.api_key in config. Set it to ${RENDER_API_KEY} and export RENDER_API_KEY=your-key");
  }

  if (render->refresh_interval() == 0) render->set_refresh_interval(kDefaultRefreshSeconds);

  ValidateServiceEntries(config);
  if (!options.allow_empty_services || config.services_size() > 0) {
    // full store validation: non-empty, unique ids, aliases present and unique
    (void)store::ServiceStore(ToServiceRecords(config));
  }

  return config;
}

std::optional<std::filesystem::path> ConfigLoader::Discover(const std::optional<std::string>& explicit_path) {
  if (explicit_path) {
    return std::filesystem::path(*explicit_path);
  }

  std::filesystem::path local("config.yaml");
  if (std::filesystem::exists(local)) return local;

  auto user = DefaultUserPath();
  if (std::filesystem::exists(user)) return user;

  return std::nullopt;
}

std::filesystem::path ConfigLoader::DefaultUserPath() {
  std::filesystem::path base;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    base = xdg;
  } else if (const char* home = std::getenv("HOME"); home && *home) {
    base = std::filesystem::path(home) / ".config";
  } else {
    base = std::filesystem::current_path();
  }
  return base / "render-dashboard" / "config.yaml";
}

std::vector<model::ServiceRecord> ToServiceRecords(const DashboardConfig& config) {
  std::vector<model::ServiceRecord> records;
  records.reserve(config.services_size());

  for (const auto& entry : config.services()) {
    model::ServiceRecord record;
    record.id       = entry.id();
    record.name     = entry.name().empty() ? entry.id() : entry.name();
    record.aliases.assign(entry.aliases().begin(), entry.aliases().end());
    record.priority = entry.has_priority() ? entry.priority() : model::kDefaultPriority;
    records.push_back(std::move(record));
  }
  return records;
}

std::chrono::milliseconds RefreshInterval(const DashboardConfig& config) {
  const auto seconds = config.render().refresh_interval() == 0 ? kDefaultRefreshSeconds : config.render().refresh_interval();
  return std::chrono::seconds(seconds);
}

} // namespace rdash::config
