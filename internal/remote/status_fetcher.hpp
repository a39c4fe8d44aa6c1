#pragma once

#include <string>

#include "internal/model/status_snapshot.hpp"
#include "internal/remote/fetch_result.hpp"

namespace rdash::remote {

/*
  The single operation the sync engine needs from the remote side.
  RenderClient implements it; tests substitute scripted fetchers.
*/
class StatusFetcher {
 public:
  virtual ~StatusFetcher() = default;

  virtual FetchResult<model::CombinedStatus> FetchCombined(const std::string& service_id) = 0;
};

} // namespace rdash::remote
