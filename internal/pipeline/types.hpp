#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/ledger/fetch_error.hpp"
#include "internal/util/time.hpp"

namespace pulsetx::pipeline {

struct EnrichedRecord {
  std::string     id;
  std::string     signature;
  uint64_t        slot = 0;
  util::TimePoint timestamp;

  // block_time was missing and timestamp is the local enrichment time
  bool timestamp_defaulted = false;

  // the ledger reported a transaction error
  bool failed = false;

  std::optional<int> heart_rate_bpm;
};

enum class LoadingState {
  kIdle,
  kLoadingInitial,
  kLoadingMore,
};

enum class RequestDecision {
  kAccepted,
  kRejectedBusy,
  kRejectedNoCursor,
  kRejectedExhausted,
  kRejectedInvalid,
};

struct PageOutcome {
  enum class Kind {
    kAppended,
    kExhausted,
    kFailed,
  };

  Kind     kind     = Kind::kAppended;
  bool     initial  = false;
  uint32_t appended = 0;
  uint32_t degraded = 0;

  std::optional<ledger::FetchError> error;
  util::TimePoint                   finished_at;
};

struct PipelineSnapshot {
  std::string                 address;
  std::vector<EnrichedRecord> records;
  std::optional<std::string>  cursor;
  bool                        exhausted = false;
  LoadingState                loading = LoadingState::kIdle;
  std::optional<PageOutcome>  last_outcome;
};

const char* ToString(LoadingState state);
const char* ToString(RequestDecision decision);
const char* ToString(PageOutcome::Kind kind);

} // namespace pulsetx::pipeline
