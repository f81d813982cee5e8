// History Store
//
// Story:
// This module keeps a rolling log of what the network looked like on each
// simulation tick: the device set and the allocation computed for it. Only
// the simulation loop appends; readers query copies. Entries are never
// modified after they are appended.
//
// Algorithm:
// - Append pushes to the back of a deque (O(1) amortized), then prunes with
//   cutoff = snapshot.timestamp - retention_window.
// - Prune pops from the front while front.timestamp < cutoff. Snapshots
//   arrive in timestamp order, so the oldest entries are always in front.
// - Size is bounded by retention_window / tick_period in steady state.
//
// Thread Safety:
// All public methods are thread-safe (protected by mutex).

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "clock.h"
#include "device.h"

namespace bandwidth {

/// Default retention: 24 hours.
inline constexpr std::chrono::hours kDefaultRetentionWindow{24};

/// One tick's state. Immutable once appended.
struct HistoricalSnapshot {
  TimePoint timestamp{};
  std::vector<Device> devices;
  Allocation allocation;
};

/// Bounded, timestamp-ordered log of snapshots.
///
/// Example:
///   HistoryStore history(std::chrono::hours(24));
///   history.Append({clock->Now(), devices, allocation});
///   auto last_hour = history.Query(now - 1h, now);
class HistoryStore {
 public:
  /// Constructs a history store.
  ///
  /// @param retention_window Entries older than the newest timestamp minus
  ///                         this window are evicted. Non-positive values
  ///                         fall back to kDefaultRetentionWindow.
  explicit HistoryStore(
      std::chrono::milliseconds retention_window = kDefaultRetentionWindow);

  ~HistoryStore() = default;

  // Non-copyable, non-movable
  HistoryStore(const HistoryStore&) = delete;
  HistoryStore& operator=(const HistoryStore&) = delete;

  /// Appends a snapshot and prunes entries outside the retention window.
  ///
  /// A snapshot stamped earlier than the newest entry is stored with the
  /// newest timestamp so the log stays ordered.
  void Append(HistoricalSnapshot snapshot);

  /// Removes every entry with timestamp strictly older than cutoff.
  /// @return Number of entries removed.
  size_t Prune(TimePoint cutoff);

  /// Returns copies of entries with from <= timestamp <= to, oldest first.
  std::vector<HistoricalSnapshot> Query(TimePoint from, TimePoint to) const;

  /// Returns copies of all retained entries, oldest first.
  std::vector<HistoricalSnapshot> All() const;

  /// Returns the newest entry, or std::nullopt if empty.
  std::optional<HistoricalSnapshot> Latest() const;

  /// Returns the number of retained entries.
  size_t Size() const;

  std::chrono::milliseconds retention_window() const {
    return retention_window_;
  }

 private:
  /// Pops stale entries from the front. Must hold mutex_.
  size_t PruneLocked(TimePoint cutoff);

  const std::chrono::milliseconds retention_window_;
  std::deque<HistoricalSnapshot> entries_;

  // Thread safety
  mutable std::mutex mutex_;
};

}  // namespace bandwidth
