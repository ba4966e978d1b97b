#include "copytrade/config/config_loader.hpp"
#include "copytrade/config/json_fields.hpp"
#include "copytrade/errors/errors.hpp"

#include <fstream>

namespace copytrade {

namespace {

const nlohmann::json* field(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  return it == j.end() ? nullptr : &*it;
}

void readDecimal(const nlohmann::json& j, const char* key, Decimal& out) {
  if (const auto* v = field(j, key)) {
    auto value = parseJsonDecimal(*v);
    if (!value) {
      throw ConfigError(std::string("'") + key + "' must be a decimal");
    }
    out = *value;
  }
}

template <typename T>
void readNumber(const nlohmann::json& j, const char* key, T& out) {
  if (const auto* v = field(j, key)) {
    if (!v->is_number()) {
      throw ConfigError(std::string("'") + key + "' must be a number");
    }
    out = v->get<T>();
  }
}

template <typename Duration>
void readDuration(const nlohmann::json& j, const char* key, Duration& out) {
  typename Duration::rep count = out.count();
  readNumber(j, key, count);
  out = Duration(count);
}

void readString(const nlohmann::json& j, const char* key, std::string& out) {
  if (const auto* v = field(j, key)) {
    if (!v->is_string()) {
      throw ConfigError(std::string("'") + key + "' must be a string");
    }
    out = v->get<std::string>();
  }
}

void parseRetry(const nlohmann::json& j, RetryPolicy& retry) {
  if (!j.is_object()) {
    throw ConfigError("'retry' must be an object");
  }
  readNumber(j, "max_attempts", retry.max_attempts);
  readDuration(j, "initial_delay_ms", retry.initial_delay);
  readNumber(j, "multiplier", retry.multiplier);
  readDuration(j, "max_delay_ms", retry.max_delay);
}

void parseRisk(const nlohmann::json& j, domain::RiskConfig& risk) {
  if (!j.is_object()) {
    throw ConfigError("'risk' must be an object");
  }
  readDecimal(j, "max_daily_loss", risk.max_daily_loss);
  readNumber(j, "consecutive_loss_threshold", risk.consecutive_loss_threshold);
  readDuration(j, "cooldown_seconds", risk.cooldown);
  readString(j, "state_file_path", risk.state_file_path);

  readDecimal(j, "min_position_size", risk.min_position_size);
  readDecimal(j, "max_position_size", risk.max_position_size);
  readDecimal(j, "risk_budget_fraction", risk.risk_budget_fraction);
  readDecimal(j, "price_risk_epsilon", risk.price_risk_epsilon);
  readDecimal(j, "copy_ratio", risk.copy_ratio);

  readDecimal(j, "stop_loss_pct", risk.stop_loss_pct);
  readDecimal(j, "take_profit_pct", risk.take_profit_pct);
  readDuration(j, "max_position_age_seconds", risk.max_position_age);

  readDecimal(j, "min_price", risk.min_price);
  readDecimal(j, "max_price", risk.max_price);
  readDecimal(j, "min_confidence", risk.min_confidence);
  readNumber(j, "max_concurrent_positions", risk.max_concurrent_positions);
  readDuration(j, "stale_signal_age_seconds", risk.stale_signal_age);

  readDuration(j, "price_timeout_ms", risk.price_timeout);
  if (const auto* retry = field(j, "retry")) {
    parseRetry(*retry, risk.io_retry);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// validateRiskConfig
// -----------------------------------------------------------------------------
void validateRiskConfig(const domain::RiskConfig& risk) {
  const Decimal one = Decimal::fromInt(1);
  if (!risk.max_daily_loss.isPositive()) {
    throw ConfigError("max_daily_loss must be positive");
  }
  if (risk.consecutive_loss_threshold < 1) {
    throw ConfigError("consecutive_loss_threshold must be at least 1");
  }
  if (risk.cooldown.count() < 0) {
    throw ConfigError("cooldown_seconds must not be negative");
  }
  if (risk.state_file_path.empty()) {
    throw ConfigError("state_file_path must not be empty");
  }
  if (!risk.min_position_size.isPositive() ||
      risk.max_position_size < risk.min_position_size) {
    throw ConfigError("position size bounds must satisfy 0 < min <= max");
  }
  if (!risk.risk_budget_fraction.isPositive() ||
      risk.risk_budget_fraction > one) {
    throw ConfigError("risk_budget_fraction must be in (0, 1]");
  }
  if (!risk.price_risk_epsilon.isPositive()) {
    throw ConfigError("price_risk_epsilon must be positive");
  }
  if (!risk.copy_ratio.isPositive()) {
    throw ConfigError("copy_ratio must be positive");
  }
  if (risk.stop_loss_pct.isNegative() || risk.stop_loss_pct >= one ||
      risk.take_profit_pct.isNegative()) {
    throw ConfigError("stop_loss_pct must be in [0, 1), take_profit_pct >= 0");
  }
  if (!risk.min_price.isPositive() || risk.max_price < risk.min_price) {
    throw ConfigError("price band must satisfy 0 < min_price <= max_price");
  }
  if (risk.min_confidence.isNegative() || risk.min_confidence > one) {
    throw ConfigError("min_confidence must be in [0, 1]");
  }
  if (risk.max_concurrent_positions == 0) {
    throw ConfigError("max_concurrent_positions must be at least 1");
  }
  if (risk.price_timeout.count() <= 0) {
    throw ConfigError("price_timeout_ms must be positive");
  }
  if (risk.io_retry.max_attempts < 1 || risk.io_retry.multiplier < 1.0) {
    throw ConfigError("retry needs max_attempts >= 1 and multiplier >= 1");
  }
}

// -----------------------------------------------------------------------------
// parseEngineConfig / loadEngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  EngineConfig config;
  try {
    if (const auto* risk = field(j, "risk")) {
      parseRisk(*risk, config.risk);
    }
    readString(j, "signal_endpoint", config.signal_endpoint);
    readString(j, "control_cmd_endpoint", config.control_cmd_endpoint);
    readString(j, "control_pub_endpoint", config.control_pub_endpoint);
    readDuration(j, "supervision_interval_ms", config.supervision_interval);
    if (const auto* paper = field(j, "paper_trading")) {
      if (!paper->is_boolean()) {
        throw ConfigError("'paper_trading' must be a boolean");
      }
      config.paper_trading = paper->get<bool>();
    }
    readDecimal(j, "paper_balance", config.paper_balance);
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }

  validateRiskConfig(config.risk);
  if (config.paper_balance.isNegative()) {
    throw ConfigError("paper_balance must not be negative");
  }
  if (config.supervision_interval.count() <= 0) {
    throw ConfigError("supervision_interval_ms must be positive");
  }
  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file " + path);
  }
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("malformed configuration file " + path + ": " +
                      e.what());
  }
  return parseEngineConfig(j);
}

}  // namespace copytrade
