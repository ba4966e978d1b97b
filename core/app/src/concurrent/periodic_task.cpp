#include "copytrade/concurrent/periodic_task.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace copytrade {

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds interval,
                           Callback callback)
    : name_(std::move(name)),
      interval_(interval),
      callback_(std::move(callback)) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void PeriodicTask::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    // Store under the mutex so the worker cannot miss the wakeup between
    // checking its predicate and starting to wait.
    std::lock_guard lock(stop_mutex_);
    running_.store(false);
  }
  stop_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): pass, then sleep until the next pass or stop()
// -----------------------------------------------------------------------------
void PeriodicTask::run() {
  while (running_.load()) {
    try {
      callback_();
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] ERROR: pass failed: " << e.what()
                << "\n";
    }
    passes_.fetch_add(1);

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
  }
}

}  // namespace copytrade
