#include "copytrade/execution/position_table.hpp"

#include <utility>

namespace copytrade {

// -----------------------------------------------------------------------------
// acquire: lock the current handle for id, retry if it was replaced
// -----------------------------------------------------------------------------
PositionLock PositionTable::acquire(const std::string& position_id) {
  for (;;) {
    std::shared_ptr<std::mutex> handle;
    {
      std::lock_guard lock(table_mutex_);
      auto& slot = locks_[position_id];
      if (!slot) {
        slot = std::make_shared<std::mutex>();
      }
      handle = slot;
    }

    std::unique_lock<std::mutex> held(*handle);

    std::lock_guard lock(table_mutex_);
    auto it = locks_.find(position_id);
    if (it != locks_.end() && it->second == handle) {
      return PositionLock{std::move(handle), std::move(held)};
    }
    // Handle was erased (and possibly replaced) while we waited.
  }
}

std::optional<domain::Position> PositionTable::find(
    const std::string& position_id) const {
  std::lock_guard lock(table_mutex_);
  auto it = positions_.find(position_id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PositionTable::contains(const std::string& position_id) const {
  std::lock_guard lock(table_mutex_);
  return positions_.count(position_id) != 0;
}

std::vector<domain::Position> PositionTable::snapshot() const {
  std::lock_guard lock(table_mutex_);
  std::vector<domain::Position> out;
  out.reserve(positions_.size());
  for (const auto& [id, position] : positions_) {
    out.push_back(position);
  }
  return out;
}

std::size_t PositionTable::size() const {
  std::lock_guard lock(table_mutex_);
  return positions_.size();
}

void PositionTable::insert(const domain::Position& position) {
  std::lock_guard lock(table_mutex_);
  positions_[position.id] = position;
}

bool PositionTable::updateStatus(const std::string& position_id,
                                 domain::PositionStatus status) {
  std::lock_guard lock(table_mutex_);
  auto it = positions_.find(position_id);
  if (it == positions_.end()) {
    return false;
  }
  it->second.status = status;
  return true;
}

std::optional<domain::Position> PositionTable::closeAndRemove(
    const std::string& position_id) {
  std::lock_guard lock(table_mutex_);
  auto it = positions_.find(position_id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  domain::Position closed = it->second;
  closed.status = domain::PositionStatus::Closed;
  positions_.erase(it);
  locks_.erase(position_id);
  return closed;
}

void PositionTable::eraseLockIfNoPosition(const std::string& position_id) {
  std::lock_guard lock(table_mutex_);
  if (positions_.count(position_id) == 0) {
    locks_.erase(position_id);
  }
}

std::size_t PositionTable::lockCount() const {
  std::lock_guard lock(table_mutex_);
  return locks_.size();
}

}  // namespace copytrade
