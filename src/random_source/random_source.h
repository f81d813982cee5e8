// Random Source
//
// Story:
// The simulation jitters device metrics every tick. All randomness is drawn
// through this interface so tests can substitute a scripted sequence and
// assert exact clamp and ordering behavior.
//
// Thread Safety:
// Mt19937RandomSource is thread-safe (protected by mutex). Implementations
// used from a single simulation thread need not be.

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

namespace bandwidth {

/// Abstract source of random draws.
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  /// Returns a real number uniformly distributed in [lo, hi].
  virtual double Uniform(double lo, double hi) = 0;

  /// Returns true with probability p.
  virtual bool Chance(double p) = 0;

  /// Returns an index uniformly distributed in [0, n). n must be > 0.
  virtual size_t Index(size_t n) = 0;

  /// Returns an integer uniformly distributed in [lo, hi].
  virtual int UniformInt(int lo, int hi) = 0;
};

/// Production random source backed by std::mt19937_64.
///
/// Example:
///   Mt19937RandomSource random(42);  // Reproducible sequence
///   double jitter = random.Uniform(-50.0, 50.0);
class Mt19937RandomSource : public RandomSource {
 public:
  /// Constructs a random source.
  ///
  /// @param seed Fixed seed for reproducible runs. If std::nullopt, seeds
  ///             from std::random_device.
  explicit Mt19937RandomSource(std::optional<uint64_t> seed = std::nullopt);

  // Non-copyable, non-movable (due to mutex)
  Mt19937RandomSource(const Mt19937RandomSource&) = delete;
  Mt19937RandomSource& operator=(const Mt19937RandomSource&) = delete;

  double Uniform(double lo, double hi) override;
  bool Chance(double p) override;
  size_t Index(size_t n) override;
  int UniformInt(int lo, int hi) override;

 private:
  std::mt19937_64 engine_;
  std::mutex mutex_;
};

}  // namespace bandwidth
