#include "copytrade/notify/i_notification_sink.hpp"

#include <exception>
#include <iostream>

namespace copytrade {

const char* toString(NotificationType type) {
  switch (type) {
    case NotificationType::BreakerActivated: return "breaker_activated";
    case NotificationType::BreakerReset:     return "breaker_reset";
    case NotificationType::TradeSubmitted:   return "trade_submitted";
    case NotificationType::TradeFailed:      return "trade_failed";
    case NotificationType::PositionClosed:   return "position_closed";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// notifySafely: delivery failures are logged, never propagated
// -----------------------------------------------------------------------------
void notifySafely(INotificationSink* sink, const NotificationEvent& event) {
  if (sink == nullptr) {
    return;
  }
  try {
    sink->notify(event);
  } catch (const std::exception& e) {
    std::cerr << "[Notify] ERROR: dropping " << toString(event.type)
              << " notification for " << event.subject << ": " << e.what()
              << "\n";
  }
}

}  // namespace copytrade
