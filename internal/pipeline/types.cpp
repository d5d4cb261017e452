#include "types.hpp"

namespace pulsetx::pipeline {

const char* ToString(LoadingState state) {
  switch (state) {
    case LoadingState::kIdle:
      return "idle";
    case LoadingState::kLoadingInitial:
      return "loading_initial";
    case LoadingState::kLoadingMore:
      return "loading_more";
  }
  return "unknown";
}

const char* ToString(RequestDecision decision) {
  switch (decision) {
    case RequestDecision::kAccepted:
      return "accepted";
    case RequestDecision::kRejectedBusy:
      return "rejected_busy";
    case RequestDecision::kRejectedNoCursor:
      return "rejected_no_cursor";
    case RequestDecision::kRejectedExhausted:
      return "rejected_exhausted";
    case RequestDecision::kRejectedInvalid:
      return "rejected_invalid";
  }
  return "unknown";
}

const char* ToString(PageOutcome::Kind kind) {
  switch (kind) {
    case PageOutcome::Kind::kAppended:
      return "appended";
    case PageOutcome::Kind::kExhausted:
      return "exhausted";
    case PageOutcome::Kind::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace pulsetx::pipeline
