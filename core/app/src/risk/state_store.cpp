#include "copytrade/risk/state_store.hpp"
#include "copytrade/config/json_fields.hpp"
#include "copytrade/errors/errors.hpp"
#include "copytrade/time/time_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace copytrade {

namespace fs = std::filesystem;

namespace {

Decimal decimalField(const nlohmann::json& j, const char* key) {
  auto value = parseJsonDecimal(j.at(key));
  if (!value) {
    throw StateCorruptionError(std::string("field '") + key +
                               "' is not a valid decimal");
  }
  return *value;
}

std::optional<std::int64_t> timestampField(const nlohmann::json& j,
                                           const char* key) {
  const auto& v = j.at(key);
  if (v.is_null()) {
    return std::nullopt;
  }
  auto ms = parseIso8601(v.get<std::string>());
  if (!ms) {
    throw StateCorruptionError(std::string("invalid timestamp '") + key +
                               "': " + v.get<std::string>());
  }
  return ms;
}

nlohmann::json optionalTimestamp(const std::optional<std::int64_t>& ms) {
  return ms ? nlohmann::json(formatIso8601(*ms)) : nlohmann::json(nullptr);
}

}  // namespace

StateStore::StateStore(std::string path) : path_(std::move(path)) {}

// -----------------------------------------------------------------------------
// toJson / fromJson
// -----------------------------------------------------------------------------
nlohmann::json StateStore::toJson(const domain::CircuitBreakerState& state) {
  nlohmann::json j;
  j["active"] = state.active;
  j["reason"] = state.reason ? nlohmann::json(*state.reason)
                             : nlohmann::json(nullptr);
  j["activated_at"] = optionalTimestamp(state.activated_at_ms);
  j["cooldown_until"] = optionalTimestamp(state.cooldown_until_ms);
  j["daily_loss"] = state.daily_loss.toString();
  j["max_daily_loss"] = state.max_daily_loss.toString();
  j["consecutive_losses"] = state.consecutive_losses;
  j["consecutive_loss_threshold"] = state.consecutive_loss_threshold;
  j["last_reset_date"] = formatUtcDate(state.last_reset_day);
  j["total_trades"] = state.total_trades;
  j["failed_trades"] = state.failed_trades;
  return j;
}

domain::CircuitBreakerState StateStore::fromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw StateCorruptionError("state file is not a JSON object");
  }

  domain::CircuitBreakerState state;
  try {
    state.active = j.at("active").get<bool>();

    const auto& reason = j.at("reason");
    if (!reason.is_null()) {
      state.reason = reason.get<std::string>();
    }

    state.activated_at_ms = timestampField(j, "activated_at");
    state.cooldown_until_ms = timestampField(j, "cooldown_until");
    state.daily_loss = decimalField(j, "daily_loss");
    state.max_daily_loss = decimalField(j, "max_daily_loss");
    state.consecutive_losses = j.at("consecutive_losses").get<int>();
    state.consecutive_loss_threshold =
        j.value("consecutive_loss_threshold", state.consecutive_loss_threshold);
    state.total_trades = j.value("total_trades", std::uint64_t{0});
    state.failed_trades = j.value("failed_trades", std::uint64_t{0});

    auto day = parseUtcDate(j.at("last_reset_date").get<std::string>());
    if (!day) {
      throw StateCorruptionError("invalid last_reset_date");
    }
    state.last_reset_day = *day;
  } catch (const nlohmann::json::exception& e) {
    throw StateCorruptionError(std::string("malformed state: ") + e.what());
  }

  if (state.daily_loss.isNegative() || state.consecutive_losses < 0) {
    throw StateCorruptionError("negative loss counters in state file");
  }
  if (state.active && (!state.reason || !state.activated_at_ms)) {
    throw StateCorruptionError("active state without reason or activation time");
  }
  return state;
}

// -----------------------------------------------------------------------------
// load: defaults when absent, defaults + ERROR log when corrupt
// -----------------------------------------------------------------------------
domain::CircuitBreakerState StateStore::load(
    const domain::CircuitBreakerState& defaults) const {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    std::cout << "[StateStore] No state file at " << path_
              << ". Starting from defaults.\n";
    return defaults;
  }

  try {
    std::ifstream in(path_);
    if (!in) {
      throw StateCorruptionError("cannot open " + path_);
    }
    nlohmann::json j;
    try {
      j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw StateCorruptionError(std::string("parse error: ") + e.what());
    }
    return fromJson(j);
  } catch (const StateCorruptionError& e) {
    std::cerr << "[StateStore] ERROR: state file " << path_
              << " is unreadable (" << e.what()
              << "). Falling back to default inactive state.\n";
    return defaults;
  }
}

// -----------------------------------------------------------------------------
// save: temp file in the same directory, flush, rename over the target
// -----------------------------------------------------------------------------
void StateStore::save(const domain::CircuitBreakerState& state) const {
  const fs::path target(path_);
  const fs::path temp(path_ + ".tmp");

  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw StateWriteError("cannot create directory " +
                            target.parent_path().string() + ": " +
                            ec.message());
    }
  }

  {
    std::ofstream out(temp, std::ios::out | std::ios::trunc);
    if (!out) {
      throw StateWriteError("cannot open " + temp.string() + " for writing");
    }
    out << toJson(state).dump(2) << '\n';
    out.flush();
    if (!out) {
      throw StateWriteError("write to " + temp.string() + " failed");
    }
  }

  fs::rename(temp, target, ec);
  if (ec) {
    fs::remove(temp, ec);
    throw StateWriteError("cannot rename " + temp.string() + " to " + path_);
  }
}

}  // namespace copytrade
