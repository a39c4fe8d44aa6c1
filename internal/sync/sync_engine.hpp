#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rdash::remote {
class StatusFetcher;
}
namespace rdash::status {
class StatusCache;
}

namespace rdash::sync {

enum class EngineState {
  kIdle,
  kCycleRunning,
};

/*
  SyncEngine

  Periodically refreshes every configured service into the StatusCache.

  - One scheduler thread. A cycle starts when the interval elapses or a
    manual refresh is pending; the first cycle runs right after Start().
  - Within a cycle every service whose BeginFetch is granted gets its
    own worker thread; the cycle ends when all workers have joined.
    A failing service never cancels its siblings.
  - At most one cycle in flight. Manual triggers during a cycle collapse
    into a single follow-up cycle. A timer tick during a cycle is dropped.
  - Stop() does not abort requests; the running cycle settles (fetches
    complete or time out) before the scheduler joins.
  - A worker that cannot be started releases its BeginFetch slot with
    an error outcome; the workers already started are still joined.
*/
class SyncEngine {
 public:
  using SteadyClock = std::chrono::steady_clock;

  SyncEngine(std::shared_ptr<remote::StatusFetcher> fetcher, std::shared_ptr<status::StatusCache> cache);
  virtual ~SyncEngine();

  SyncEngine(const SyncEngine&)            = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  void Start(std::vector<std::string> service_ids, std::chrono::milliseconds interval);
  void Stop();

  // Fire-and-forget; never waits for a cycle.
  void TriggerManualRefresh();

  // Empty until the first cycle has started.
  std::optional<SteadyClock::duration> TimeSinceLastCycleStart() const;

  EngineState State() const;
  bool        IsCycleRunning() const;
  uint64_t    CycleCount() const;

  // Blocks until at least `count` cycles have completed or the timeout expires.
  bool AwaitCycles(uint64_t count, std::chrono::milliseconds timeout) const;

 protected:
  // Starts one fetch worker. Subclasses that override this must call
  // Stop() from their own destructor.
  virtual std::thread SpawnWorker(std::function<void()> work);

 private:
  void Loop();
  void RunCycle();
  void FetchOne(const std::string& service_id);

  std::shared_ptr<remote::StatusFetcher> fetcher_;
  std::shared_ptr<status::StatusCache>   cache_;

  std::vector<std::string>  service_ids_;
  std::chrono::milliseconds interval_{30000};

  mutable std::mutex              mutex_;
  mutable std::condition_variable wake_cv_;
  mutable std::condition_variable cycle_cv_;

  bool                                   running_        = false;
  bool                                   manual_pending_ = false;
  EngineState                            state_          = EngineState::kIdle;
  uint64_t                               cycles_         = 0;
  std::optional<SteadyClock::time_point> last_cycle_start_;

  std::thread scheduler_;
};

} // namespace rdash::sync
