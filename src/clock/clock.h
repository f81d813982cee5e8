// Clock
//
// Story:
// Every timestamp the monitor records (snapshot times, connected_since,
// retention cutoffs) is read through this interface so that tests can drive
// time forward by hand instead of sleeping.
//
// Timestamps are wall-clock (std::chrono::system_clock) because they are
// shown to operators and exported over RPC as unix milliseconds.

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace bandwidth {

using TimePoint = std::chrono::system_clock::time_point;

/// Abstract interface for obtaining the current time.
/// Allows dependency injection for testing.
class Clock {
 public:
  virtual ~Clock() = default;

  /// Returns the current time point.
  virtual TimePoint Now() const = 0;
};

/// Real clock implementation using std::chrono::system_clock.
/// Use this in production code.
class RealClock : public Clock {
 public:
  TimePoint Now() const override { return std::chrono::system_clock::now(); }
};

/// Fake clock for testing. Time is manually controlled via Advance().
/// Starts at time_point{} (epoch).
class FakeClock : public Clock {
 public:
  TimePoint Now() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_time_;
  }

  /// Advances the clock by the specified duration.
  void Advance(std::chrono::system_clock::duration duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_time_ += duration;
  }

  /// Sets the clock to a specific time point.
  void SetTime(TimePoint time) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_time_ = time;
  }

 private:
  mutable std::mutex mutex_;
  TimePoint current_time_{};
};

/// Converts a time point to milliseconds since the unix epoch.
inline int64_t ToUnixMillis(TimePoint time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             time.time_since_epoch())
      .count();
}

/// Converts milliseconds since the unix epoch to a time point.
/// Values beyond the range of TimePoint saturate to TimePoint::min()/max().
inline TimePoint FromUnixMillis(int64_t millis) {
  const int64_t max_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          TimePoint::max().time_since_epoch())
          .count();
  const int64_t min_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          TimePoint::min().time_since_epoch())
          .count();
  if (millis >= max_millis) {
    return TimePoint::max();
  }
  if (millis <= min_millis) {
    return TimePoint::min();
  }
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
      std::chrono::milliseconds(millis)));
}

}  // namespace bandwidth
