#pragma once

// =============================================================================
// test_support.hpp
// =============================================================================
// Helpers shared by the test suites: a scratch directory per test, a
// notification sink that records what it receives, and signal builders.
// =============================================================================

#include "copytrade/domain/decimal.hpp"
#include "copytrade/domain/risk_config.hpp"
#include "copytrade/domain/trade_signal.hpp"
#include "copytrade/notify/i_notification_sink.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace copytrade::test_support {

// 2026-10-19T12:00:00.000Z
constexpr std::int64_t kNoonMs = 1792411200000;
constexpr std::int64_t kNoonDay = 20745;

inline Decimal dec(const char* text) { return Decimal::parse(text); }

// -----------------------------------------------------------------------------
// ScratchDir: unique directory under the system temp dir, removed on exit.
// -----------------------------------------------------------------------------
class ScratchDir {
 public:
  ScratchDir() {
    const auto* info =
        ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "copytrade_";
    if (info != nullptr) {
      name += std::string(info->test_suite_name()) + "_" + info->name();
    }
    name += "_" + std::to_string(std::chrono::steady_clock::now()
                                     .time_since_epoch()
                                     .count());
    path_ = std::filesystem::temp_directory_path() / name;
    std::filesystem::create_directories(path_);
  }

  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::string file(const std::string& name) const {
    return (path_ / name).string();
  }

 private:
  std::filesystem::path path_;
};

// -----------------------------------------------------------------------------
// RecordingSink: keeps every notification for later inspection.
// -----------------------------------------------------------------------------
class RecordingSink final : public INotificationSink {
 public:
  void notify(const NotificationEvent& event) override {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
  }

  std::vector<NotificationEvent> events() const {
    std::lock_guard lock(mutex_);
    return events_;
  }

  std::size_t count(NotificationType type) const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& e : events_) {
      if (e.type == type) {
        ++n;
      }
    }
    return n;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<NotificationEvent> events_;
};

// Risk configuration with instant retries, suitable for unit tests.
inline domain::RiskConfig fastRiskConfig(const std::string& state_file) {
  domain::RiskConfig config;
  config.state_file_path = state_file;
  config.io_retry.initial_delay = std::chrono::milliseconds(0);
  config.io_retry.max_delay = std::chrono::milliseconds(0);
  return config;
}

inline domain::TradeSignal makeSignal(const std::string& trade_id,
                                      const std::string& market_id,
                                      domain::Side side = domain::Side::Buy,
                                      const char* price = "0.5",
                                      const char* amount = "100") {
  domain::TradeSignal signal;
  signal.trade_id = trade_id;
  signal.market_id = market_id;
  signal.side = side;
  signal.amount = Decimal::parse(amount);
  signal.price = Decimal::parse(price);
  signal.confidence = Decimal::parse("0.9");
  return signal;
}

}  // namespace copytrade::test_support
