#pragma once

#include "copytrade/concurrent/thread_safe_queue.hpp"
#include "copytrade/eventbus/event_bus.hpp"
#include "copytrade/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>
#include <utility>

namespace copytrade {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its EventBus. CopyTradeEngine runs the signal
// loop on one of these, which makes the loop the single consumer of trade
// signals: signals are executed one at a time, in arrival order.
//
// Shutdown: stop() lets the event being dispatched finish, then discards the
// rest of the queue. Signals still queued at shutdown are logged as dropped
// rather than executed against a half-stopped engine.
//
// Thread model: start(), stop() and push() are safe from any thread. All
// subscriber callbacks run on the loop thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "event_loop");

  // Stops and joins the worker.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Joins the worker; must not be called from a subscriber
  // callback (the loop thread cannot join itself).
  void stop();

  bool running() const { return running_.load(); }

  void push(Event event) { queue_.push(std::move(event)); }

  std::size_t pending() const { return queue_.size(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  void run();

  const std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace copytrade
