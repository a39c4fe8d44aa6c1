#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/status_snapshot.hpp"
#include "internal/remote/fetch_result.hpp"
#include "internal/util/time.hpp"

namespace rdash::status {

using FetchOutcome = remote::FetchResult<model::CombinedStatus>;

/*
  StatusCache

  Service id -> latest StatusSnapshot. The only mutable state shared
  between the sync engine, the one-shot CLI query and the dashboard.

  Consistency model:
  - every operation holds the cache mutex; Get returns a copy, so a
    reader sees a snapshot either entirely before or entirely after a
    CompleteFetch, never a mix
  - BeginFetch is the per-service gate: at most one outstanding fetch
    per id
  - a failed CompleteFetch only sets last_error and last_fetched_at
*/
class StatusCache {
 public:
  // Creates kUnknown entries for ids not yet present.
  void Seed(const std::vector<std::string>& ids);

  model::StatusSnapshot Get(const std::string& id) const;

  // Returns false if a fetch for id is already in flight.
  bool BeginFetch(const std::string& id);

  void CompleteFetch(const std::string& id, const FetchOutcome& outcome, util::TimePoint now = util::Now());

  std::vector<std::string> Ids() const;

 private:
  mutable std::shared_mutex                              mutex_;
  std::unordered_map<std::string, model::StatusSnapshot> cache_;
};

} // namespace rdash::status
