#include "copytrade/time/simulation_time_provider.hpp"
#include "copytrade/time/time_utils.hpp"

#include <stdexcept>

namespace copytrade {

SimulationTimeProvider SimulationTimeProvider::at(const std::string& iso8601) {
  auto ms = parseIso8601(iso8601);
  if (!ms) {
    throw std::invalid_argument("not an ISO-8601 UTC instant: " + iso8601);
  }
  return SimulationTimeProvider(*ms);
}

}  // namespace copytrade
