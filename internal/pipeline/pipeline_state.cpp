#include "pipeline_state.hpp"

#include <iterator>
#include <utility>

namespace pulsetx::pipeline {

bool PipelineState::TryAcquire(LoadingState target) {
  if (loading_ != LoadingState::kIdle || target == LoadingState::kIdle) {
    return false;
  }
  loading_ = target;
  return true;
}

void PipelineState::Release() {
  loading_ = LoadingState::kIdle;
}

void PipelineState::Reset(std::string address) {
  address_ = std::move(address);
  records_.clear();
  cursor_.reset();
  exhausted_ = false;
  last_outcome_.reset();
}

void PipelineState::AppendPage(std::vector<EnrichedRecord> page) {
  if (page.empty()) return;

  cursor_ = page.back().signature;
  records_.insert(records_.end(), std::make_move_iterator(page.begin()), std::make_move_iterator(page.end()));
}

void PipelineState::Complete(PageOutcome outcome, std::vector<EnrichedRecord> page) {
  switch (outcome.kind) {
    case PageOutcome::Kind::kAppended:
      AppendPage(std::move(page));
      break;
    case PageOutcome::Kind::kExhausted:
      MarkExhausted();
      break;
    case PageOutcome::Kind::kFailed:
      // cursor and exhaustion stay as they were so the same page can be retried
      break;
  }
  last_outcome_ = std::move(outcome);
  loading_      = LoadingState::kIdle;
}

PipelineSnapshot PipelineState::Snapshot() const {
  PipelineSnapshot snapshot;
  snapshot.address      = address_;
  snapshot.records      = records_;
  snapshot.cursor       = cursor_;
  snapshot.exhausted    = exhausted_;
  snapshot.loading      = loading_;
  snapshot.last_outcome = last_outcome_;
  return snapshot;
}

} // namespace pulsetx::pipeline
