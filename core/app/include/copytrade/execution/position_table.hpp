#pragma once

#include "copytrade/domain/position.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace copytrade {

// -----------------------------------------------------------------------------
// PositionLock: RAII hold on one position id
// -----------------------------------------------------------------------------
// Keeps the per-id mutex alive (shared_ptr) for as long as it is locked, even
// if the table drops its own handle meanwhile.
// -----------------------------------------------------------------------------
struct PositionLock {
  std::shared_ptr<std::mutex> mutex;
  std::unique_lock<std::mutex> lock;
};

// -----------------------------------------------------------------------------
// PositionTable: open positions plus one lock per position id
// -----------------------------------------------------------------------------
//
// @brief  Map position_id → Position, and map position_id → mutex, with the
//         guarantee that for any id at most one open, close or supervision
//         step is in progress at a time.
//
// @details
// Two levels of locking:
//   table_mutex_  guards both maps. Held only for map lookups and edits,
//                 never across a call to the exchange.
//   per-id mutex  serializes every multi-step operation on one position id
//                 (validate → order → insert, or re-check → close order →
//                 remove). Held across exchange calls.
//
// acquire(id) creates the per-id mutex on first use. Because closeAndRemove()
// erases the mutex together with the position, a thread that fetched a
// handle before the erase could end up holding an orphaned mutex while a
// newcomer creates a fresh one. acquire() therefore re-checks, after
// locking, that the table still maps id to the same handle, and retries
// otherwise. Two holders of "the lock for id X" are thus impossible.
//
// Invariants:
//   - A Closed position is never present: closeAndRemove() marks it Closed
//     and erases it in one table-mutex critical section.
//   - Lock entries without a position are removed by closeAndRemove() and
//     eraseLockIfNoPosition(), so the lock map does not grow without bound.
//
// Thread model:
//   All methods are thread-safe. Mutating methods (insert, updateStatus,
//   closeAndRemove) must be called while holding acquire(id) for that id.
// -----------------------------------------------------------------------------
class PositionTable {
 public:
  PositionTable() = default;

  PositionTable(const PositionTable&) = delete;
  PositionTable& operator=(const PositionTable&) = delete;

  // Blocks until the per-id lock is held.
  PositionLock acquire(const std::string& position_id);

  std::optional<domain::Position> find(const std::string& position_id) const;
  bool contains(const std::string& position_id) const;
  std::vector<domain::Position> snapshot() const;
  std::size_t size() const;

  // Inserts or replaces the position under its id.
  void insert(const domain::Position& position);

  // Returns false when the position is absent.
  bool updateStatus(const std::string& position_id,
                    domain::PositionStatus status);

  // -------------------------------------------------------------------------
  // closeAndRemove(position_id)
  // -------------------------------------------------------------------------
  // @brief  Marks the position Closed and removes it together with its lock
  //         entry.
  //
  // @return The position as it was removed (status Closed), or std::nullopt
  //         if it was already gone.
  // -------------------------------------------------------------------------
  std::optional<domain::Position> closeAndRemove(
      const std::string& position_id);

  // Drops the lock entry of an id that has no position (failed open).
  void eraseLockIfNoPosition(const std::string& position_id);

  std::size_t lockCount() const;

 private:
  mutable std::mutex table_mutex_;
  std::unordered_map<std::string, domain::Position> positions_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

}  // namespace copytrade
