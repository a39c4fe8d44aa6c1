#include "sync_engine.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>

#include "internal/model/remote_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/status_fetcher.hpp"
#include "internal/status/status_cache.hpp"

namespace rdash::sync {

namespace obs = rdash::observability;

using model::RemoteError;
using model::RemoteErrorKind;

SyncEngine::SyncEngine(std::shared_ptr<remote::StatusFetcher> fetcher, std::shared_ptr<status::StatusCache> cache)
    : fetcher_(std::move(fetcher)), cache_(std::move(cache)) {
}

SyncEngine::~SyncEngine() {
  Stop();
}

void SyncEngine::Start(std::vector<std::string> service_ids, std::chrono::milliseconds interval) {
  if (interval.count() <= 0) {
    throw std::invalid_argument("refresh interval must be positive");
  }

  std::lock_guard lock(mutex_);
  if (running_) {
    throw std::logic_error("sync engine already started");
  }

  service_ids_    = std::move(service_ids);
  interval_       = interval;
  running_        = true;
  manual_pending_ = true; // first cycle runs immediately

  cache_->Seed(service_ids_);
  scheduler_ = std::thread(&SyncEngine::Loop, this);

  obs::LogInfo("sync engine started",
               {obs::IntField("services", static_cast<int64_t>(service_ids_.size())), obs::IntField("interval_ms", interval_.count())});
}

void SyncEngine::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_ && !scheduler_.joinable()) return;
    running_ = false;
  }
  wake_cv_.notify_all();

  if (scheduler_.joinable()) scheduler_.join();
  cycle_cv_.notify_all();
}

void SyncEngine::TriggerManualRefresh() {
  {
    std::lock_guard lock(mutex_);
    manual_pending_ = true;
  }
  wake_cv_.notify_all();
}

std::optional<SyncEngine::SteadyClock::duration> SyncEngine::TimeSinceLastCycleStart() const {
  std::lock_guard lock(mutex_);
  if (!last_cycle_start_) return std::nullopt;
  return SteadyClock::now() - *last_cycle_start_;
}

EngineState SyncEngine::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

bool SyncEngine::IsCycleRunning() const {
  return State() == EngineState::kCycleRunning;
}

uint64_t SyncEngine::CycleCount() const {
  std::lock_guard lock(mutex_);
  return cycles_;
}

bool SyncEngine::AwaitCycles(uint64_t count, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return cycle_cv_.wait_for(lock, timeout, [&] { return cycles_ >= count; });
}

// ------------------------------------------------------------
// Scheduler
// ------------------------------------------------------------

void SyncEngine::Loop() {
  std::unique_lock lock(mutex_);
  auto             next_due = SteadyClock::now() + interval_;

  while (running_) {
    wake_cv_.wait_until(lock, next_due, [&] { return !running_ || manual_pending_; });
    if (!running_) break;

    const bool timer_due = SteadyClock::now() >= next_due;
    if (!manual_pending_ && !timer_due) continue;

    manual_pending_   = false;
    state_            = EngineState::kCycleRunning;
    last_cycle_start_ = SteadyClock::now();

    lock.unlock();
    RunCycle();
    lock.lock();

    state_   = EngineState::kIdle;
    next_due = SteadyClock::now() + interval_;
    ++cycles_;
    cycle_cv_.notify_all();
  }

  state_ = EngineState::kIdle;
}

void SyncEngine::RunCycle() {
  const auto started = SteadyClock::now();
  obs::LogDebug("refresh cycle started", {obs::IntField("services", static_cast<int64_t>(service_ids_.size()))});

  std::vector<std::thread> workers;
  workers.reserve(service_ids_.size());

  for (const auto& id : service_ids_) {
    if (!cache_->BeginFetch(id)) {
      obs::LogDebug("fetch already in flight, skipping", {obs::StringField("service", id)});
      continue;
    }

    try {
      workers.push_back(SpawnWorker([this, id] { FetchOne(id); }));
    } catch (const std::system_error& e) {
      obs::LogError("could not start fetch worker", {obs::StringField("service", id), obs::StringField("error", e.what())});
      cache_->CompleteFetch(id, RemoteError{RemoteErrorKind::kMalformedResponse, 0, std::string("Internal error: ") + e.what()});
    }
  }

  for (auto& worker : workers) worker.join();

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - started);
  obs::LogDebug("refresh cycle finished",
                {obs::IntField("dispatched", static_cast<int64_t>(workers.size())), obs::IntField("elapsed_ms", elapsed.count())});
}

std::thread SyncEngine::SpawnWorker(std::function<void()> work) {
  return std::thread(std::move(work));
}

void SyncEngine::FetchOne(const std::string& service_id) {
  status::FetchOutcome outcome = RemoteError{RemoteErrorKind::kMalformedResponse, 0, "fetch did not complete"};
  try {
    outcome = fetcher_->FetchCombined(service_id);
  } catch (const std::exception& e) {
    outcome = RemoteError{RemoteErrorKind::kMalformedResponse, 0, std::string("Internal error: ") + e.what()};
  }

  if (!outcome.ok()) {
    obs::LogWarn("service fetch failed", {obs::StringField("service", service_id), obs::StringField("kind", model::ToString(outcome.error().kind)),
                                          obs::StringField("error", outcome.error().message)});
  }
  cache_->CompleteFetch(service_id, outcome);
}

} // namespace rdash::sync
