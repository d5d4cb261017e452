#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace pulsetx::pipeline {

/*
  Session state of one correlation pipeline.

  Not synchronized; CorrelationPipeline owns the only instance and
  serializes access with its own mutex.

  Invariants:
    - records_ keeps server order across pages
    - cursor_ is the signature of the last record of the last
      non-empty page, and only ever moves forward
    - loading_ leaves kIdle only through TryAcquire
    - exhausted_ latches on the first successful empty page until
      Reset; a failed page never sets it
*/
class PipelineState {
 public:
  LoadingState loading() const {
    return loading_;
  }

  // kIdle -> target. Returns false, changing nothing, when busy.
  bool TryAcquire(LoadingState target);
  void Release();

  // Starts a new history for `address`.
  void Reset(std::string address);

  // Appends in order and advances the cursor. An empty page changes nothing.
  void AppendPage(std::vector<EnrichedRecord> page);

  void MarkExhausted() {
    exhausted_ = true;
  }

  // Applies a finished page according to outcome.kind, records the
  // outcome and returns to kIdle. `page` is ignored unless kAppended.
  void Complete(PageOutcome outcome, std::vector<EnrichedRecord> page);

  const std::string& address() const {
    return address_;
  }

  const std::vector<EnrichedRecord>& records() const {
    return records_;
  }

  const std::optional<std::string>& cursor() const {
    return cursor_;
  }

  bool exhausted() const {
    return exhausted_;
  }

  const std::optional<PageOutcome>& last_outcome() const {
    return last_outcome_;
  }

  PipelineSnapshot Snapshot() const;

 private:
  std::string                 address_;
  std::vector<EnrichedRecord> records_;
  std::optional<std::string>  cursor_;
  bool                        exhausted_ = false;
  LoadingState                loading_ = LoadingState::kIdle;
  std::optional<PageOutcome>  last_outcome_;
};

} // namespace pulsetx::pipeline
