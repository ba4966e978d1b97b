#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace copytrade {

// -----------------------------------------------------------------------------
// PeriodicTask
// -----------------------------------------------------------------------------
// Responsibility: Runs one callback on its own thread every `interval`.
// CopyTradeEngine uses it for supervision: managePositions() followed by
// CircuitBreaker::periodicCheck().
//
// A pass is never interrupted. stop() wakes the thread while it sleeps
// between passes, but if a pass is running it waits for the pass to finish,
// so positions are never left halfway through a close.
//
// An exception escaping the callback is logged and the next pass runs as
// scheduled.
//
// Thread model: start() and stop() are safe from any thread; the callback
// runs only on the owned thread.
// -----------------------------------------------------------------------------
class PeriodicTask {
 public:
  using Callback = std::function<void()>;

  PeriodicTask(std::string name, std::chrono::milliseconds interval,
               Callback callback);

  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;
  PeriodicTask(PeriodicTask&&) = delete;
  PeriodicTask& operator=(PeriodicTask&&) = delete;

  // Idempotent. The first pass runs immediately.
  void start();

  // Idempotent. Returns after the current pass (if any) has completed.
  void stop();

  bool running() const { return running_.load(); }

  // Completed passes since construction.
  std::uint64_t passes() const { return passes_.load(); }

 private:
  void run();

  const std::string name_;
  const std::chrono::milliseconds interval_;
  const Callback callback_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> passes_{0};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace copytrade
