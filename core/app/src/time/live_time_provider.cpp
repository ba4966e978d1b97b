#include "copytrade/time/live_time_provider.hpp"

#include <chrono>

namespace copytrade {

std::int64_t LiveTimeProvider::now_ms() const {
  using std::chrono::milliseconds;
  using std::chrono::system_clock;
  return std::chrono::time_point_cast<milliseconds>(system_clock::now())
      .time_since_epoch()
      .count();
}

}  // namespace copytrade
