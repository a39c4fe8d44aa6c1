#include "status_query.hpp"

#include "internal/observability/logging.hpp"
#include "internal/remote/status_fetcher.hpp"
#include "internal/status/status_cache.hpp"
#include "internal/util/errors.hpp"

namespace rdash::cli {

namespace obs = rdash::observability;

StatusQuery::StatusQuery(std::shared_ptr<remote::StatusFetcher> fetcher, std::shared_ptr<status::StatusCache> cache)
    : fetcher_(std::move(fetcher)), cache_(std::move(cache)) {
}

model::StatusSnapshot StatusQuery::Query(const model::ServiceRecord& record, bool force) {
  auto snapshot = cache_->Get(record.id);
  if (snapshot.has_data() && !force) return snapshot;

  if (!cache_->BeginFetch(record.id)) {
    throw util::InvalidState("A fetch for " + record.id + " is already running");
  }

  status::FetchOutcome outcome = model::RemoteError{model::RemoteErrorKind::kMalformedResponse, 0, "fetch did not complete"};
  try {
    outcome = fetcher_->FetchCombined(record.id);
  } catch (const std::exception& e) {
    outcome = model::RemoteError{model::RemoteErrorKind::kMalformedResponse, 0, std::string("Internal error: ") + e.what()};
  }
  cache_->CompleteFetch(record.id, outcome);

  if (!outcome.ok()) {
    obs::LogWarn("status query failed", {obs::StringField("service", record.id), obs::StringField("kind", model::ToString(outcome.error().kind))});
    throw RemoteFailure(outcome.error());
  }

  return cache_->Get(record.id);
}

} // namespace rdash::cli
