#include "copytrade/network/control_server.hpp"
#include "copytrade/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace copytrade {

ControlServer::ControlServer(CommandHandler command_handler,
                             std::string cmd_endpoint,
                             std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

ControlServer::~ControlServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets and spawn the server thread
// -----------------------------------------------------------------------------
void ControlServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[ControlServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void ControlServer::stop() {
  running_.store(false);
  if (!thread_.joinable()) {
    return;
  }
  thread_.join();

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[ControlServer] stopped. dropped notifications="
            << dropped_.load() << "\n";
}

// -----------------------------------------------------------------------------
// notify(): enqueue only; never blocks on I/O
// -----------------------------------------------------------------------------
void ControlServer::notify(const NotificationEvent& event) {
  if (!running_.load() || !outbox_.try_push(event)) {
    ++dropped_;
  }
}

// -----------------------------------------------------------------------------
// run(): drain notifications, then wait briefly for one command
// -----------------------------------------------------------------------------
void ControlServer::run() {
  while (running_.load()) {
    publishPending();
    serveOneCommand();
  }
  publishPending();
}

void ControlServer::publishPending() {
  while (auto event = outbox_.try_pop()) {
    const std::string payload = formatNotification(*event);
    zmq::message_t msg(payload.data(), payload.size());
    try {
      if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
        ++dropped_;
      }
    } catch (const zmq::error_t& e) {
      ++dropped_;
      std::cerr << "[ControlServer] ERROR: publish failed: " << e.what()
                << "\n";
    }
  }
}

void ControlServer::serveOneCommand() {
  zmq::message_t request;
  zmq::recv_result_t result;
  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() != EINTR) {
      std::cerr << "[ControlServer] ERROR: receive failed: " << e.what()
                << "\n";
    }
    return;
  }
  if (!result.has_value()) {
    return;
  }

  const std::string command = request.to_string();
  std::string response;
  try {
    response = command_handler_(command);
  } catch (const std::exception& e) {
    nlohmann::json error;
    error["status"] = "error";
    error["message"] = e.what();
    response = error.dump();
  }

  // A REP socket must answer every request before it can receive again.
  zmq::message_t reply(response.data(), response.size());
  try {
    cmd_socket_->send(reply, zmq::send_flags::none);
  } catch (const zmq::error_t& e) {
    std::cerr << "[ControlServer] ERROR: reply to '" << command
              << "' failed: " << e.what() << "\n";
  }
}

std::string ControlServer::formatNotification(const NotificationEvent& event) {
  nlohmann::json j;
  j["type"] = toString(event.type);
  j["subject"] = event.subject;
  j["message"] = event.message;
  j["timestamp"] = formatIso8601(event.timestamp_ms);
  return j.dump();
}

}  // namespace copytrade
