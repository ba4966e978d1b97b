#pragma once

#include <cstdint>
#include <string>

namespace copytrade {

// -----------------------------------------------------------------------------
// NotificationEvent
// -----------------------------------------------------------------------------
// One operator-facing event. subject is the trade id, position id or, for
// breaker events, the breaker reason.
// -----------------------------------------------------------------------------
enum class NotificationType {
  BreakerActivated,
  BreakerReset,
  TradeSubmitted,
  TradeFailed,
  PositionClosed,
};

const char* toString(NotificationType type);

struct NotificationEvent {
  NotificationType type{NotificationType::TradeSubmitted};
  std::string subject;
  std::string message;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// INotificationSink: fire-and-forget operator notifications
// -----------------------------------------------------------------------------
//
// @brief  Consumed interface for delivering NotificationEvents (chat alerts,
//         telemetry sockets, ...).
//
// @details
// Delivery is best effort. Implementations should not block the caller for
// long; ControlServer, for instance, only enqueues. Callers in the trading
// path go through notifySafely(), so an implementation that throws can never
// break a trade or a close.
//
// Thread model:
//   notify() may be called concurrently from the signal loop, the supervision
//   thread and the control thread.
// -----------------------------------------------------------------------------
class INotificationSink {
 public:
  virtual ~INotificationSink() = default;

  virtual void notify(const NotificationEvent& event) = 0;
};

// Calls sink->notify(event) if sink is non-null. Logs and drops any
// exception.
void notifySafely(INotificationSink* sink, const NotificationEvent& event);

}  // namespace copytrade
