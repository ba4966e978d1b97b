#include "copytrade/gateway/signal_gateway.hpp"
#include "copytrade/config/json_fields.hpp"
#include "copytrade/errors/errors.hpp"
#include "copytrade/time/time_utils.hpp"

#include <iostream>
#include <utility>

namespace copytrade {

namespace {

std::string requiredString(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j.at(key).is_string()) {
    throw ValidationError(std::string("missing or non-string field '") + key +
                          "'");
  }
  auto value = j.at(key).get<std::string>();
  if (value.empty()) {
    throw ValidationError(std::string("field '") + key + "' is empty");
  }
  return value;
}

Decimal decimalField(const nlohmann::json& j, const char* key) {
  if (!j.contains(key)) {
    throw ValidationError(std::string("missing field '") + key + "'");
  }
  auto value = parseJsonDecimal(j.at(key));
  if (!value) {
    throw ValidationError(std::string("field '") + key +
                          "' is not a valid decimal");
  }
  return *value;
}

}  // namespace

SignalGateway::SignalGateway(SignalSink sink, std::string endpoint)
    : sink_(std::move(sink)), endpoint_(std::move(endpoint)) {}

SignalGateway::~SignalGateway() { stop(); }

// -----------------------------------------------------------------------------
// start(): create the SUB socket, connect, spawn the receive thread
// -----------------------------------------------------------------------------
void SignalGateway::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::sub);
  socket_->set(zmq::sockopt::subscribe, "");
  socket_->set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_->connect(endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[SignalGateway] listening on " << endpoint_ << "\n";
}

void SignalGateway::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
    socket_.reset();
    context_.reset();
    std::cout << "[SignalGateway] stopped. received=" << received_.load()
              << " rejected=" << rejected_.load() << "\n";
  }
}

// -----------------------------------------------------------------------------
// run(): receive, decode, forward
// -----------------------------------------------------------------------------
void SignalGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_->recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[SignalGateway] ERROR: receive failed: " << e.what()
                << "\n";
      break;
    }
    if (!result.has_value()) {
      continue;
    }

    ++received_;
    std::string payload = msg.to_string();
    try {
      sink_(parseTradeSignal(payload));
    } catch (const ValidationError& e) {
      ++rejected_;
      std::cerr << "[SignalGateway] WARNING: rejected signal: " << e.what()
                << " payload: " << payload << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// parseTradeSignal
// -----------------------------------------------------------------------------
domain::TradeSignal SignalGateway::parseTradeSignal(const std::string& payload) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError(std::string("malformed JSON: ") + e.what());
  }
  return parseTradeSignal(j);
}

domain::TradeSignal SignalGateway::parseTradeSignal(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ValidationError("signal payload is not a JSON object");
  }

  domain::TradeSignal signal;
  signal.trade_id = requiredString(j, "trade_id");
  signal.market_id = requiredString(j, "market_id");

  auto side = domain::parseSide(requiredString(j, "side"));
  if (!side) {
    throw ValidationError("side must be BUY or SELL, got '" +
                          j.at("side").get<std::string>() + "'");
  }
  signal.side = *side;

  signal.amount = decimalField(j, "amount");
  signal.price = decimalField(j, "price");
  signal.confidence =
      j.contains("confidence") ? decimalField(j, "confidence")
                               : Decimal::fromInt(1);

  if (j.contains("timestamp_ms")) {
    if (!j.at("timestamp_ms").is_number_integer()) {
      throw ValidationError("timestamp_ms must be an integer");
    }
    signal.timestamp_ms = j.at("timestamp_ms").get<std::int64_t>();
  } else if (j.contains("timestamp")) {
    const auto& ts = j.at("timestamp");
    std::optional<std::int64_t> ms;
    if (ts.is_string()) {
      ms = parseIso8601(ts.get<std::string>());
    }
    if (!ms) {
      throw ValidationError("timestamp is not ISO-8601 UTC");
    }
    signal.timestamp_ms = *ms;
  }
  return signal;
}

}  // namespace copytrade
