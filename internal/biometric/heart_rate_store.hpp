#pragma once

#include <optional>
#include <vector>

#include "internal/util/time.hpp"

namespace pulsetx::biometric {

struct HeartRateSample {
  util::TimePoint at;
  double          bpm = 0.0;
};

/*
  Source of heart rate samples, in beats per minute.

  The read grant is owned by whoever hosts the store; the resolver
  only asks. AverageBetween may throw on query failure.
*/
class HeartRateStore {
 public:
  virtual ~HeartRateStore() = default;

  virtual bool ReadAuthorized() const = 0;

  // Mean of samples with start <= at < end, nullopt when there are none.
  virtual std::optional<double> AverageBetween(util::TimePoint start, util::TimePoint end) const = 0;

  virtual void Append(const std::vector<HeartRateSample>& samples) = 0;
};

} // namespace pulsetx::biometric
