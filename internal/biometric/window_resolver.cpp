#include "window_resolver.hpp"

#include <cmath>
#include <exception>
#include <limits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pulsetx::biometric {

using pulsetx::observability::IntField;
using pulsetx::observability::StringField;

const char* StatusName(Resolution::Status status) {
  switch (status) {
    case Resolution::Status::kOk:
      return "ok";
    case Resolution::Status::kNoAuthorization:
      return "no_authorization";
    case Resolution::Status::kNoSamples:
      return "no_samples";
    case Resolution::Status::kQueryFailed:
      return "query_failed";
  }
  return "unknown";
}

WindowResolver::WindowResolver(std::shared_ptr<const HeartRateStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw util::InvalidArgument("WindowResolver requires a heart rate store");
  }
}

Resolution WindowResolver::Resolve(util::TimePoint at) const {
  Resolution out;

  if (!store_->ReadAuthorized()) {
    out.status = Resolution::Status::kNoAuthorization;
    return out;
  }

  std::optional<double> average;
  try {
    average = store_->AverageBetween(at - kHalfWindow, at + kHalfWindow);
  } catch (const std::exception& e) {
    PULSETX_LOG_WARN("Heart rate query failed", {IntField("at_unix", util::ToUnixSeconds(at)), StringField("error", e.what())});
    out.status = Resolution::Status::kQueryFailed;
    return out;
  }

  if (!average.has_value()) {
    out.status = Resolution::Status::kNoSamples;
    return out;
  }

  if (!std::isfinite(*average) || *average > static_cast<double>(std::numeric_limits<int>::max())) {
    out.status = Resolution::Status::kQueryFailed;
    return out;
  }

  // truncate, not round
  out.bpm    = static_cast<int>(*average);
  out.status = Resolution::Status::kOk;
  return out;
}

} // namespace pulsetx::biometric
