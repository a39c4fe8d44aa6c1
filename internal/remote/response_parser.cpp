#include "response_parser.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"
#include "render/v1/render_api.pb.h"

namespace rdash::remote {

using model::DeployDetail;
using model::DeployState;
using model::RemoteError;
using model::RemoteErrorKind;
using model::ServiceDetail;
using model::ServiceState;

namespace {

RemoteError Malformed(const std::string& what) {
  return RemoteError{RemoteErrorKind::kMalformedResponse, 0, "Malformed API response: " + what};
}

bool ParseValue(std::string_view body, google::protobuf::Value* value) {
  return google::protobuf::util::JsonStringToMessage(std::string(body), value).ok();
}

// Unwraps {"<key>": {...}} when present, otherwise returns the object itself.
const google::protobuf::Struct* Unwrap(const google::protobuf::Value& value, const std::string& key) {
  if (value.kind_case() != google::protobuf::Value::kStructValue) return nullptr;

  const auto& fields = value.struct_value().fields();
  auto        it     = fields.find(key);
  if (it != fields.end() && it->second.kind_case() == google::protobuf::Value::kStructValue) {
    return &it->second.struct_value();
  }
  return &value.struct_value();
}

template <typename Message>
bool StructToMessage(const google::protobuf::Struct& object, Message* message) {
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(object, &json).ok()) return false;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return google::protobuf::util::JsonStringToMessage(json, message, options).ok();
}

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

FetchResult<ServiceDetail> ToServiceDetail(const google::protobuf::Struct& object) {
  rdash::render::v1::Service service;
  if (!StructToMessage(object, &service)) return Malformed("service object does not match the expected schema");
  if (service.id().empty()) return Malformed("service object has no id");

  ServiceDetail detail;
  detail.id    = service.id();
  detail.name  = service.name().empty() ? service.id() : service.name();
  detail.type  = service.type();
  detail.state = MapServiceState(service.status(), service.suspended());
  detail.url   = NonEmpty(service.service_details().url());
  return detail;
}

// Extracts the "services"/"deploys" array from either a bare list or an object envelope.
const google::protobuf::ListValue* ListOf(const google::protobuf::Value& value, const std::string& key) {
  if (value.kind_case() == google::protobuf::Value::kListValue) return &value.list_value();
  if (value.kind_case() != google::protobuf::Value::kStructValue) return nullptr;

  const auto& fields = value.struct_value().fields();
  auto        it     = fields.find(key);
  if (it == fields.end()) return nullptr;
  if (it->second.kind_case() == google::protobuf::Value::kNullValue) {
    static const google::protobuf::ListValue kEmpty;
    return &kEmpty;
  }
  if (it->second.kind_case() != google::protobuf::Value::kListValue) return nullptr;
  return &it->second.list_value();
}

} // namespace

ServiceState MapServiceState(std::string_view status, std::string_view suspended) {
  if (util::ToLower(suspended) == "suspended") return ServiceState::kSuspended;

  const auto value = util::ToLower(status);
  if (value == "available") return ServiceState::kRunning;
  if (value == "deploying") return ServiceState::kDeploying;
  if (value == "suspended") return ServiceState::kSuspended;
  if (value == "failed" || value == "unavailable") return ServiceState::kFailed;
  return ServiceState::kUnknown;
}

DeployState MapDeployState(std::string_view status) {
  const auto value = util::ToLower(status);
  if (value == "live") return DeployState::kLive;
  if (value == "build_in_progress" || value == "update_in_progress" || value == "pre_deploy_in_progress") {
    return DeployState::kBuilding;
  }
  if (value == "build_failed" || value == "update_failed" || value == "pre_deploy_failed") return DeployState::kFailed;
  if (value == "canceled" || value == "deactivated") return DeployState::kCanceled;
  return DeployState::kCreated;
}

FetchResult<ServiceDetail> ParseService(std::string_view body) {
  google::protobuf::Value value;
  if (!ParseValue(body, &value)) return Malformed("service body is not valid JSON");

  const auto* object = Unwrap(value, "service");
  if (!object) return Malformed("service body is not a JSON object");
  return ToServiceDetail(*object);
}

FetchResult<std::optional<DeployDetail>> ParseLatestDeploy(std::string_view body) {
  google::protobuf::Value value;
  if (!ParseValue(body, &value)) return Malformed("deploy list is not valid JSON");

  const auto* list = ListOf(value, "deploys");
  if (!list) return Malformed("deploy list is not a JSON array");
  if (list->values_size() == 0) return std::optional<DeployDetail>{};

  const auto* object = Unwrap(list->values(0), "deploy");
  if (!object) return Malformed("deploy entry is not a JSON object");

  rdash::render::v1::Deploy deploy;
  if (!StructToMessage(*object, &deploy)) return Malformed("deploy object does not match the expected schema");
  if (deploy.id().empty()) return Malformed("deploy object has no id");

  DeployDetail detail;
  detail.id             = deploy.id();
  detail.state          = MapDeployState(deploy.status());
  detail.commit_ref     = NonEmpty(deploy.commit().id());
  detail.commit_message = NonEmpty(deploy.commit().message());
  detail.started_at     = deploy.has_created_at() ? util::FromProto(deploy.created_at()) : util::Now();
  if (deploy.has_finished_at()) detail.finished_at = util::FromProto(deploy.finished_at());
  return std::optional<DeployDetail>(std::move(detail));
}

FetchResult<std::vector<ServiceDetail>> ParseServiceList(std::string_view body) {
  google::protobuf::Value value;
  if (!ParseValue(body, &value)) return Malformed("service list is not valid JSON");

  const auto* list = ListOf(value, "services");
  if (!list) return Malformed("service list is not a JSON array");

  std::vector<ServiceDetail> services;
  services.reserve(list->values_size());
  for (const auto& entry : list->values()) {
    const auto* object = Unwrap(entry, "service");
    if (!object) return Malformed("service list entry is not a JSON object");

    auto detail = ToServiceDetail(*object);
    if (!detail.ok()) return detail.error();
    services.push_back(std::move(detail.value()));
  }
  return services;
}

} // namespace rdash::remote
