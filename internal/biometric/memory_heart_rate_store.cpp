#include "memory_heart_rate_store.hpp"

#include <cmath>
#include <mutex>

#include "internal/util/errors.hpp"

namespace pulsetx::biometric {

MemoryHeartRateStore::MemoryHeartRateStore(bool read_authorized) : read_authorized_(read_authorized) {
}

bool MemoryHeartRateStore::ReadAuthorized() const {
  return read_authorized_.load();
}

void MemoryHeartRateStore::SetReadAuthorized(bool granted) {
  read_authorized_.store(granted);
}

std::optional<double> MemoryHeartRateStore::AverageBetween(util::TimePoint start, util::TimePoint end) const {
  std::shared_lock lock(mutex_);

  double      sum   = 0.0;
  std::size_t count = 0;
  for (auto it = samples_.lower_bound(start); it != samples_.end() && it->first < end; ++it) {
    sum += it->second;
    ++count;
  }

  if (count == 0) return std::nullopt;
  return sum / static_cast<double>(count);
}

void MemoryHeartRateStore::Append(const std::vector<HeartRateSample>& samples) {
  // validate the whole batch first so a bad sample leaves the store untouched
  for (const auto& sample : samples) {
    if (!std::isfinite(sample.bpm) || sample.bpm < 0.0) {
      throw util::InvalidArgument("heart rate sample must be a finite, non-negative bpm");
    }
  }

  std::unique_lock lock(mutex_);
  for (const auto& sample : samples) {
    samples_.emplace(sample.at, sample.bpm);
  }
}

std::size_t MemoryHeartRateStore::Size() const {
  std::shared_lock lock(mutex_);
  return samples_.size();
}

} // namespace pulsetx::biometric
