// History Store - Implementation
//
// See history_store.h for the Story and algorithm description.

#include "history_store.h"

#include <algorithm>
#include <utility>

namespace bandwidth {

HistoryStore::HistoryStore(std::chrono::milliseconds retention_window)
    : retention_window_(retention_window.count() > 0
                            ? retention_window
                            : std::chrono::milliseconds(
                                  kDefaultRetentionWindow)) {}

void HistoryStore::Append(HistoricalSnapshot snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!entries_.empty() && snapshot.timestamp < entries_.back().timestamp) {
    snapshot.timestamp = entries_.back().timestamp;
  }

  TimePoint cutoff = snapshot.timestamp - retention_window_;
  entries_.push_back(std::move(snapshot));
  PruneLocked(cutoff);
}

size_t HistoryStore::Prune(TimePoint cutoff) {
  std::lock_guard<std::mutex> lock(mutex_);
  return PruneLocked(cutoff);
}

std::vector<HistoricalSnapshot> HistoryStore::Query(TimePoint from,
                                                    TimePoint to) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<HistoricalSnapshot> result;
  if (to < from) {
    return result;
  }

  // Entries are timestamp-ordered; binary search the window.
  auto first = std::lower_bound(
      entries_.begin(), entries_.end(), from,
      [](const HistoricalSnapshot& entry, TimePoint t) {
        return entry.timestamp < t;
      });
  auto last = std::upper_bound(
      first, entries_.end(), to,
      [](TimePoint t, const HistoricalSnapshot& entry) {
        return t < entry.timestamp;
      });

  result.assign(first, last);
  return result;
}

std::vector<HistoricalSnapshot> HistoryStore::All() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<HistoricalSnapshot>(entries_.begin(), entries_.end());
}

std::optional<HistoricalSnapshot> HistoryStore::Latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.empty()) {
    return std::nullopt;
  }
  return entries_.back();
}

size_t HistoryStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

size_t HistoryStore::PruneLocked(TimePoint cutoff) {
  size_t removed = 0;
  while (!entries_.empty() && entries_.front().timestamp < cutoff) {
    entries_.pop_front();
    ++removed;
  }
  return removed;
}

}  // namespace bandwidth
