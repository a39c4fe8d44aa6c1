#include "status_cache.hpp"

#include <algorithm>
#include <mutex>

namespace rdash::status {

using model::StatusSnapshot;

namespace {

StatusSnapshot UnknownSnapshot(const std::string& id) {
  StatusSnapshot snapshot;
  snapshot.id = id;
  return snapshot;
}

} // namespace

// ------------------------------------------------------------
// Seed
// ------------------------------------------------------------

void StatusCache::Seed(const std::vector<std::string>& ids) {
  std::unique_lock lock(mutex_);
  for (const auto& id : ids) {
    cache_.try_emplace(id, UnknownSnapshot(id));
  }
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

StatusSnapshot StatusCache::Get(const std::string& id) const {
  std::shared_lock lock(mutex_);

  auto it = cache_.find(id);
  if (it == cache_.end()) return UnknownSnapshot(id);

  return it->second;
}

// ------------------------------------------------------------
// Fetch gate
// ------------------------------------------------------------

bool StatusCache::BeginFetch(const std::string& id) {
  std::unique_lock lock(mutex_);

  auto [it, inserted] = cache_.try_emplace(id, UnknownSnapshot(id));
  (void)inserted;
  if (it->second.in_flight) return false;

  it->second.in_flight = true;
  return true;
}

void StatusCache::CompleteFetch(const std::string& id, const FetchOutcome& outcome, util::TimePoint now) {
  std::unique_lock lock(mutex_);

  auto& dst = cache_.try_emplace(id, UnknownSnapshot(id)).first->second;

  dst.in_flight       = false;
  dst.last_fetched_at = now;

  if (!outcome.ok()) {
    // keep last known-good fields, only annotate
    dst.last_error = outcome.error();
    return;
  }

  const auto& status = outcome.value();
  dst.service_state  = status.service.state;
  dst.service_name   = status.service.name;
  dst.service_type   = status.service.type.empty() ? std::nullopt : std::optional<std::string>(status.service.type);
  dst.service_url    = status.service.url;
  dst.latest_deploy  = status.latest_deploy;

  dst.last_success_at = now;
  dst.last_error.reset();
}

std::vector<std::string> StatusCache::Ids() const {
  std::shared_lock lock(mutex_);

  std::vector<std::string> ids;
  ids.reserve(cache_.size());
  for (const auto& [id, snapshot] : cache_) ids.push_back(id);
  std::sort(ids.begin(), ids.end());
  return ids;
}

} // namespace rdash::status
