#include "internal/pipeline/pipeline_state.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using pulsetx::pipeline::EnrichedRecord;
using pulsetx::pipeline::LoadingState;
using pulsetx::pipeline::PageOutcome;
using pulsetx::pipeline::PipelineState;

std::vector<EnrichedRecord> Page(std::initializer_list<const char*> signatures) {
  std::vector<EnrichedRecord> page;
  for (const char* signature : signatures) {
    EnrichedRecord record;
    record.signature = signature;
    page.push_back(record);
  }
  return page;
}

void TestAcquireOnlyFromIdle() {
  PipelineState state;
  assert(state.loading() == LoadingState::kIdle);

  assert(state.TryAcquire(LoadingState::kLoadingInitial));
  assert(state.loading() == LoadingState::kLoadingInitial);
  assert(!state.TryAcquire(LoadingState::kLoadingMore));
  assert(!state.TryAcquire(LoadingState::kLoadingInitial));
  assert(state.loading() == LoadingState::kLoadingInitial);

  state.Release();
  assert(state.loading() == LoadingState::kIdle);
  assert(!state.TryAcquire(LoadingState::kIdle));
  assert(state.TryAcquire(LoadingState::kLoadingMore));
}

void TestAppendAdvancesCursorInOrder() {
  PipelineState state;
  state.Reset("addr");

  state.AppendPage(Page({"A", "B"}));
  assert(state.cursor() == std::string("B"));

  state.AppendPage(Page({"C"}));
  assert(state.cursor() == std::string("C"));
  assert(state.records().size() == 3);
  assert(state.records()[0].signature == "A");
  assert(state.records()[2].signature == "C");
  assert(!state.exhausted());
}

PageOutcome Outcome(PageOutcome::Kind kind) {
  PageOutcome outcome;
  outcome.kind = kind;
  return outcome;
}

void TestEmptyPageKeepsCursorAndLatchesExhaustion() {
  PipelineState state;
  state.Reset("addr");
  state.AppendPage(Page({"A"}));

  state.AppendPage({});
  assert(!state.exhausted());

  assert(state.TryAcquire(LoadingState::kLoadingMore));
  state.Complete(Outcome(PageOutcome::Kind::kExhausted), {});
  assert(state.cursor() == std::string("A"));
  assert(state.records().size() == 1);
  assert(state.exhausted());
  assert(state.loading() == LoadingState::kIdle);
  assert(state.last_outcome()->kind == PageOutcome::Kind::kExhausted);
}

void TestFailedPageNeverExhausts() {
  PipelineState state;
  state.Reset("addr");
  assert(state.TryAcquire(LoadingState::kLoadingInitial));
  state.Complete(Outcome(PageOutcome::Kind::kAppended), Page({"A", "B"}));

  assert(state.TryAcquire(LoadingState::kLoadingMore));
  state.Complete(Outcome(PageOutcome::Kind::kFailed), {});

  assert(!state.exhausted());
  assert(state.cursor() == std::string("B"));
  assert(state.records().size() == 2);
  assert(state.loading() == LoadingState::kIdle);
  assert(state.last_outcome()->kind == PageOutcome::Kind::kFailed);

  // a failed page carrying records still appends nothing
  assert(state.TryAcquire(LoadingState::kLoadingMore));
  state.Complete(Outcome(PageOutcome::Kind::kFailed), Page({"C"}));
  assert(state.records().size() == 2);
  assert(state.cursor() == std::string("B"));
}

void TestResetClearsHistoryButNotLoading() {
  PipelineState state;
  state.Reset("first");
  state.AppendPage(Page({"A"}));
  assert(state.TryAcquire(LoadingState::kLoadingMore));
  state.Complete(Outcome(PageOutcome::Kind::kExhausted), {});
  assert(state.exhausted());
  assert(state.TryAcquire(LoadingState::kLoadingInitial));

  state.Reset("second");
  assert(state.address() == "second");
  assert(state.records().empty());
  assert(!state.cursor().has_value());
  assert(!state.exhausted());
  assert(!state.last_outcome().has_value());
  assert(state.loading() == LoadingState::kLoadingInitial);
}

void TestSnapshotCopiesState() {
  PipelineState state;
  state.Reset("addr");
  state.AppendPage(Page({"A", "B"}));

  auto snapshot = state.Snapshot();
  state.AppendPage(Page({"C"}));

  assert(snapshot.address == "addr");
  assert(snapshot.records.size() == 2);
  assert(snapshot.cursor == std::string("B"));
  assert(snapshot.loading == LoadingState::kIdle);
}

void TestNames() {
  assert(std::string(pulsetx::pipeline::ToString(LoadingState::kLoadingMore)) == "loading_more");
  assert(std::string(pulsetx::pipeline::ToString(PageOutcome::Kind::kExhausted)) == "exhausted");
}

} // namespace

int main() {
  TestAcquireOnlyFromIdle();
  TestAppendAdvancesCursorInOrder();
  TestEmptyPageKeepsCursorAndLatchesExhaustion();
  TestFailedPageNeverExhausts();
  TestResetClearsHistoryButNotLoading();
  TestSnapshotCopiesState();
  TestNames();

  std::cout << "pulsetx_unit_pipeline_state: pass\n";
  return 0;
}
