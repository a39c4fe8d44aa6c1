#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/model/remote_error.hpp"
#include "internal/model/service_record.hpp"
#include "internal/model/status_snapshot.hpp"

namespace rdash::remote {
class StatusFetcher;
}
namespace rdash::status {
class StatusCache;
}

namespace rdash::cli {

// Raised by the one-shot path once the retry policy is exhausted.
class RemoteFailure : public std::runtime_error {
 public:
  explicit RemoteFailure(model::RemoteError error) : std::runtime_error(error.message), error_(std::move(error)) {
  }

  const model::RemoteError& error() const {
    return error_;
  }

 private:
  model::RemoteError error_;
};

/*
  StatusQuery

  One-shot status for a single resolved service. Issues exactly one
  combined fetch (not a cycle) when the cache has no successful snapshot
  or when force is set, then reads the result back from the cache.
*/
class StatusQuery {
 public:
  StatusQuery(std::shared_ptr<remote::StatusFetcher> fetcher, std::shared_ptr<status::StatusCache> cache);

  // Throws RemoteFailure when the fetch fails, and util::InvalidState
  // when another fetch for the same service is already running.
  model::StatusSnapshot Query(const model::ServiceRecord& record, bool force = false);

 private:
  std::shared_ptr<remote::StatusFetcher> fetcher_;
  std::shared_ptr<status::StatusCache>   cache_;
};

} // namespace rdash::cli
