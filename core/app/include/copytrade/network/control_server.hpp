#pragma once

#include "copytrade/concurrent/thread_safe_queue.hpp"
#include "copytrade/notify/i_notification_sink.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace copytrade {

// -----------------------------------------------------------------------------
// ControlServer: ZeroMQ operator channel: commands in, notifications out
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread serving two sockets:
//
//   REP  (cmd_endpoint)  Operator commands as plain text ("PING", "STATUS",
//                        "RESET", "HALT <reason>", "CLOSE <position_id>").
//                        Each is forwarded to the command handler, bound to
//                        CopyTradeEngine::executeCommand(), and the JSON
//                        reply is sent back.
//   PUB  (pub_endpoint)  Every NotificationEvent as one JSON message:
//                        {"type":"breaker_activated","subject":...,
//                         "message":...,"timestamp":"...Z"}
//
// @details
// notify() only enqueues, so a breaker activation or a position close never
// waits on socket I/O. The queue is bounded (kMaxPendingNotifications); when
// it is full, or the server is not running, the notification is dropped and
// counted.
//
// The REP socket uses ZMQ_RCVTIMEO (kPollTimeoutMs) so the thread alternates
// between draining notifications and waiting for commands, and notices
// stop() promptly.
//
// Thread model:
//   start() / stop() from the owning thread. notify() from any thread. The
//   command handler runs on the server thread.
//
// Ownership:
//   Owned by CopyTradeEngine. Owns the ZMQ context, both sockets, the queue
//   and the thread.
// -----------------------------------------------------------------------------
class ControlServer final : public INotificationSink {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  static constexpr std::size_t kMaxPendingNotifications = 1024;

  ControlServer(CommandHandler command_handler, std::string cmd_endpoint,
                std::string pub_endpoint);

  ~ControlServer() override;

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;
  ControlServer(ControlServer&&) = delete;
  ControlServer& operator=(ControlServer&&) = delete;

  // Binds both sockets and spawns the thread. Idempotent. Throws
  // zmq::error_t when an endpoint cannot be bound.
  void start();

  // Publishes what is still queued, then joins. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // INotificationSink: enqueue for the PUB socket.
  void notify(const NotificationEvent& event) override;

  std::uint64_t dropped() const { return dropped_.load(); }

  static std::string formatNotification(const NotificationEvent& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void publishPending();
  void serveOneCommand();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<NotificationEvent> outbox_{kMaxPendingNotifications};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};
  std::thread thread_;
};

}  // namespace copytrade
