// Random Source - Implementation
//
// See random_source.h for the Story.

#include "random_source.h"

namespace bandwidth {

Mt19937RandomSource::Mt19937RandomSource(std::optional<uint64_t> seed)
    : engine_(seed ? *seed : std::random_device{}()) {}

double Mt19937RandomSource::Uniform(double lo, double hi) {
  if (hi <= lo) {
    return lo;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(engine_);
}

bool Mt19937RandomSource::Chance(double p) {
  if (p <= 0.0) {
    return false;
  }
  if (p >= 1.0) {
    return true;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::bernoulli_distribution dist(p);
  return dist(engine_);
}

size_t Mt19937RandomSource::Index(size_t n) {
  if (n <= 1) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::uniform_int_distribution<size_t> dist(0, n - 1);
  return dist(engine_);
}

int Mt19937RandomSource::UniformInt(int lo, int hi) {
  if (hi <= lo) {
    return lo;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(engine_);
}

}  // namespace bandwidth
