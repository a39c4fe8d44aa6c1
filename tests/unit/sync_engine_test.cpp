#include "internal/sync/sync_engine.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "internal/remote/status_fetcher.hpp"
#include "internal/status/status_cache.hpp"

namespace {

using namespace std::chrono_literals;

using rdash::model::CombinedStatus;
using rdash::model::RemoteError;
using rdash::model::RemoteErrorKind;
using rdash::model::ServiceState;
using rdash::remote::FetchResult;
using rdash::status::StatusCache;
using rdash::sync::SyncEngine;

constexpr auto kLongInterval = std::chrono::milliseconds(std::chrono::hours(1));

CombinedStatus Running(const std::string& id) {
  CombinedStatus status;
  status.service.id    = id;
  status.service.name  = id;
  status.service.state = ServiceState::kRunning;
  return status;
}

// Holds fetchers until Open(); counts how many are waiting.
class Gate {
 public:
  void Wait() {
    std::unique_lock lock(mutex_);
    ++waiting_;
    cv_.notify_all();
    cv_.wait(lock, [&] { return open_; });
  }

  void Open() {
    {
      std::lock_guard lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  bool AwaitWaiting(int count) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, 5s, [&] { return waiting_ >= count; });
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    open_    = false;
  int                     waiting_ = 0;
};

class ScriptedFetcher : public rdash::remote::StatusFetcher {
 public:
  using Handler = std::function<FetchResult<CombinedStatus>(const std::string&)>;

  explicit ScriptedFetcher(Handler handler) : handler_(std::move(handler)) {
  }

  FetchResult<CombinedStatus> FetchCombined(const std::string& service_id) override {
    {
      std::lock_guard lock(mutex_);
      calls_.push_back(service_id);
    }
    return handler_(service_id);
  }

  std::vector<std::string> calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

 private:
  Handler                  handler_;
  mutable std::mutex       mutex_;
  std::vector<std::string> calls_;
};

void TestFirstCycleRunsImmediately() {
  auto cache   = std::make_shared<StatusCache>();
  auto fetcher = std::make_shared<ScriptedFetcher>([](const std::string& id) { return FetchResult<CombinedStatus>(Running(id)); });

  SyncEngine engine(fetcher, cache);
  assert(!engine.TimeSinceLastCycleStart().has_value());
  assert(engine.State() == rdash::sync::EngineState::kIdle);

  engine.Start({"srv-1", "srv-2"}, kLongInterval);
  assert(engine.AwaitCycles(1, 5s));

  assert(engine.TimeSinceLastCycleStart().has_value());
  assert(cache->Get("srv-1").service_state == ServiceState::kRunning);
  assert(cache->Get("srv-2").service_state == ServiceState::kRunning);
  assert(fetcher->calls().size() == 2);

  engine.Stop();
}

void TestManualTriggersDuringCycleCoalesce() {
  auto gate    = std::make_shared<Gate>();
  auto blocked = std::make_shared<std::atomic<bool>>(true);
  auto cache   = std::make_shared<StatusCache>();
  auto fetcher = std::make_shared<ScriptedFetcher>([gate, blocked](const std::string& id) {
    if (blocked->load()) gate->Wait();
    return FetchResult<CombinedStatus>(Running(id));
  });

  SyncEngine engine(fetcher, cache);
  engine.Start({"srv-1"}, kLongInterval);

  assert(gate->AwaitWaiting(1));
  assert(engine.IsCycleRunning());

  engine.TriggerManualRefresh();
  engine.TriggerManualRefresh();
  engine.TriggerManualRefresh();

  blocked->store(false);
  gate->Open();

  assert(engine.AwaitCycles(2, 5s));
  std::this_thread::sleep_for(200ms);

  assert(engine.CycleCount() == 2);
  assert(fetcher->calls().size() == 2);

  engine.Stop();
}

void TestOneFailureDoesNotAffectSiblings() {
  auto cache   = std::make_shared<StatusCache>();
  auto fetcher = std::make_shared<ScriptedFetcher>([](const std::string& id) -> FetchResult<CombinedStatus> {
    if (id == "srv-bad") return RemoteError{RemoteErrorKind::kNotFound, 404, "Resource not found"};
    if (id == "srv-throws") throw std::runtime_error("boom");
    return Running(id);
  });

  SyncEngine engine(fetcher, cache);
  engine.Start({"srv-good", "srv-bad", "srv-throws"}, kLongInterval);
  assert(engine.AwaitCycles(1, 5s));
  engine.Stop();

  const auto good = cache->Get("srv-good");
  assert(good.service_state == ServiceState::kRunning);
  assert(!good.last_error.has_value());

  const auto bad = cache->Get("srv-bad");
  assert(bad.service_state == ServiceState::kUnknown);
  assert(bad.last_error && bad.last_error->kind == RemoteErrorKind::kNotFound);
  assert(!bad.in_flight);

  const auto throws = cache->Get("srv-throws");
  assert(throws.last_error && throws.last_error->kind == RemoteErrorKind::kMalformedResponse);
  assert(!throws.in_flight);
}

void TestInFlightServiceIsSkipped() {
  auto cache   = std::make_shared<StatusCache>();
  auto fetcher = std::make_shared<ScriptedFetcher>([](const std::string& id) { return FetchResult<CombinedStatus>(Running(id)); });

  // a one-shot query owns srv-1 while the cycle runs
  assert(cache->BeginFetch("srv-1"));

  SyncEngine engine(fetcher, cache);
  engine.Start({"srv-1", "srv-2"}, kLongInterval);
  assert(engine.AwaitCycles(1, 5s));
  engine.Stop();

  assert(fetcher->calls() == (std::vector<std::string>{"srv-2"}));
  assert(cache->Get("srv-1").in_flight);
  assert(!cache->Get("srv-2").in_flight);
}

void TestFailedRefreshKeepsLastKnownGoodState() {
  auto fail    = std::make_shared<std::atomic<bool>>(false);
  auto cache   = std::make_shared<StatusCache>();
  auto fetcher = std::make_shared<ScriptedFetcher>([fail](const std::string& id) -> FetchResult<CombinedStatus> {
    if (fail->load()) return RemoteError{RemoteErrorKind::kTimeout, 0, "Request timed out"};
    return Running(id);
  });

  SyncEngine engine(fetcher, cache);
  engine.Start({"srv-1"}, kLongInterval);
  assert(engine.AwaitCycles(1, 5s));

  fail->store(true);
  engine.TriggerManualRefresh();
  assert(engine.AwaitCycles(2, 5s));
  engine.Stop();

  const auto snapshot = cache->Get("srv-1");
  assert(snapshot.service_state == ServiceState::kRunning);
  assert(snapshot.last_error && snapshot.last_error->kind == RemoteErrorKind::kTimeout);
  assert(snapshot.has_data());
}

void TestTimerDrivesCycles() {
  auto cache   = std::make_shared<StatusCache>();
  auto fetcher = std::make_shared<ScriptedFetcher>([](const std::string& id) { return FetchResult<CombinedStatus>(Running(id)); });

  SyncEngine engine(fetcher, cache);
  engine.Start({"srv-1"}, 50ms);
  assert(engine.AwaitCycles(3, 5s));
  engine.Stop();

  const auto after_stop = engine.CycleCount();
  std::this_thread::sleep_for(150ms);
  assert(engine.CycleCount() == after_stop);
}

void TestStopLetsInFlightCycleFinish() {
  auto gate    = std::make_shared<Gate>();
  auto cache   = std::make_shared<StatusCache>();
  auto fetcher = std::make_shared<ScriptedFetcher>([gate](const std::string& id) {
    gate->Wait();
    return FetchResult<CombinedStatus>(Running(id));
  });

  SyncEngine engine(fetcher, cache);
  engine.Start({"srv-1"}, kLongInterval);
  assert(gate->AwaitWaiting(1));

  std::atomic<bool> stopped{false};
  std::thread       stopper([&] {
    engine.Stop();
    stopped.store(true);
  });

  // Stop() waits for the blocked fetch instead of abandoning it.
  std::this_thread::sleep_for(100ms);
  assert(!stopped.load());
  assert(cache->Get("srv-1").in_flight);

  gate->Open();
  stopper.join();
  assert(stopped.load());

  const auto snapshot = cache->Get("srv-1");
  assert(snapshot.service_state == ServiceState::kRunning);
  assert(snapshot.has_data());
  assert(!snapshot.in_flight);
  assert(!snapshot.last_error.has_value());
  assert(engine.CycleCount() == 1);
  assert(!engine.IsCycleRunning());
}

// Fails the Nth worker start (0-based) of every cycle's dispatch order.
class FailingSpawnEngine : public SyncEngine {
 public:
  FailingSpawnEngine(std::shared_ptr<rdash::remote::StatusFetcher> fetcher, std::shared_ptr<StatusCache> cache, int refused)
      : SyncEngine(std::move(fetcher), std::move(cache)), refused_(refused) {
  }

  ~FailingSpawnEngine() override {
    Stop();
  }

 protected:
  std::thread SpawnWorker(std::function<void()> work) override {
    if (spawns_.fetch_add(1) == refused_) {
      throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again), "thread creation failed");
    }
    return SyncEngine::SpawnWorker(std::move(work));
  }

 private:
  int              refused_;
  std::atomic<int> spawns_{0};
};

void TestWorkerStartFailureReleasesSlot() {
  auto cache   = std::make_shared<StatusCache>();
  auto fetcher = std::make_shared<ScriptedFetcher>([](const std::string& id) { return FetchResult<CombinedStatus>(Running(id)); });

  FailingSpawnEngine engine(fetcher, cache, 1);
  engine.Start({"srv-1", "srv-2", "srv-3"}, kLongInterval);
  assert(engine.AwaitCycles(1, 5s));

  assert(cache->Get("srv-1").service_state == ServiceState::kRunning);
  assert(cache->Get("srv-3").service_state == ServiceState::kRunning);

  const auto refused = cache->Get("srv-2");
  assert(!refused.in_flight);
  assert(refused.service_state == ServiceState::kUnknown);
  assert(refused.last_error && refused.last_error->kind == RemoteErrorKind::kMalformedResponse);
  auto calls = fetcher->calls();
  std::sort(calls.begin(), calls.end());
  assert(calls == (std::vector<std::string>{"srv-1", "srv-3"}));

  // the slot is free again, so the next cycle fetches srv-2
  engine.TriggerManualRefresh();
  assert(engine.AwaitCycles(2, 5s));
  engine.Stop();

  const auto retried = cache->Get("srv-2");
  assert(retried.service_state == ServiceState::kRunning);
  assert(!retried.last_error.has_value());
}

void TestStartValidatesArguments() {
  auto cache   = std::make_shared<StatusCache>();
  auto fetcher = std::make_shared<ScriptedFetcher>([](const std::string& id) { return FetchResult<CombinedStatus>(Running(id)); });

  SyncEngine engine(fetcher, cache);

  bool rejected_interval = false;
  try {
    engine.Start({"srv-1"}, 0ms);
  } catch (const std::invalid_argument&) {
    rejected_interval = true;
  }
  assert(rejected_interval);

  engine.Start({"srv-1"}, kLongInterval);
  bool rejected_restart = false;
  try {
    engine.Start({"srv-1"}, kLongInterval);
  } catch (const std::logic_error&) {
    rejected_restart = true;
  }
  assert(rejected_restart);
  engine.Stop();
}

} // namespace

int main() {
  TestFirstCycleRunsImmediately();
  TestManualTriggersDuringCycleCoalesce();
  TestOneFailureDoesNotAffectSiblings();
  TestInFlightServiceIsSkipped();
  TestFailedRefreshKeepsLastKnownGoodState();
  TestTimerDrivesCycles();
  TestStopLetsInFlightCycleFinish();
  TestWorkerStartFailureReleasesSlot();
  TestStartValidatesArguments();

  std::cout << "rdash_unit_sync_engine: pass\n";
  return 0;
}
