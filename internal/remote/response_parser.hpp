#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/status_snapshot.hpp"
#include "internal/remote/fetch_result.hpp"

namespace rdash::remote {

/*
  Render API JSON -> model types.

  Bodies are parsed into google::protobuf::Value, unwrapped from their
  envelope ({"service": {...}} or [{"deploy": {...}, "cursor": ...}]),
  then mapped onto the render/v1 messages with unknown fields ignored.
  Any shape violation yields kMalformedResponse.
*/

FetchResult<model::ServiceDetail>               ParseService(std::string_view body);
FetchResult<std::optional<model::DeployDetail>> ParseLatestDeploy(std::string_view body);
FetchResult<std::vector<model::ServiceDetail>>  ParseServiceList(std::string_view body);

model::ServiceState MapServiceState(std::string_view status, std::string_view suspended);
model::DeployState  MapDeployState(std::string_view status);

} // namespace rdash::remote
