#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <shared_mutex>

#include "heart_rate_store.hpp"

namespace pulsetx::biometric {

/*
  In-process sample store.

  Samples are kept ordered by time; a window query is a range
  scan over the map.
*/
class MemoryHeartRateStore final : public HeartRateStore {
 public:
  explicit MemoryHeartRateStore(bool read_authorized = false);

  bool ReadAuthorized() const override;
  void SetReadAuthorized(bool granted);

  std::optional<double> AverageBetween(util::TimePoint start, util::TimePoint end) const override;

  void Append(const std::vector<HeartRateSample>& samples) override;

  std::size_t Size() const;

 private:
  std::atomic<bool> read_authorized_;

  mutable std::shared_mutex                mutex_;
  std::multimap<util::TimePoint, double>   samples_;
};

} // namespace pulsetx::biometric
