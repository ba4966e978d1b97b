#include "copytrade/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace copytrade {

namespace {

// Upper bound on how long stop() waits for an idle worker to notice.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();

  std::size_t dropped = 0;
  while (queue_.try_pop()) {
    ++dropped;
  }
  if (dropped > 0) {
    std::cerr << "[" << name_ << "] WARNING: dropped " << dropped
              << " queued event(s) at shutdown\n";
  }
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdleWaitTimeout);
    if (event) {
      bus_.publish(*event);
    }
  }
}

}  // namespace copytrade
