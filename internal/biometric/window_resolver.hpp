#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "heart_rate_store.hpp"

namespace pulsetx::biometric {

struct Resolution {
  enum class Status {
    kOk,
    kNoAuthorization,
    kNoSamples,
    kQueryFailed,
  };

  std::optional<int> bpm;
  Status             status = Status::kNoSamples;
};

const char* StatusName(Resolution::Status status);

/*
  Averages heart rate over a fixed 60 second window centred on an
  instant. Best effort: every failure collapses to "no value".
*/
class WindowResolver {
 public:
  static constexpr std::chrono::seconds kHalfWindow{30};

  explicit WindowResolver(std::shared_ptr<const HeartRateStore> store);

  Resolution Resolve(util::TimePoint at) const;

  std::optional<int> AverageAround(util::TimePoint at) const {
    return Resolve(at).bpm;
  }

 private:
  std::shared_ptr<const HeartRateStore> store_;
};

} // namespace pulsetx::biometric
