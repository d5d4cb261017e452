#include "correlation_pipeline.hpp"

#include <exception>
#include <utility>

#include "internal/biometric/window_resolver.hpp"
#include "internal/ledger/signature_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace pulsetx::pipeline {

using pulsetx::observability::BoolField;
using pulsetx::observability::IntField;
using pulsetx::observability::StringField;

namespace {

bool HasTransactionError(const pulsetx::ledger::v1::SignatureInfo& info) {
  return info.has_err() && info.err().kind_case() != google::protobuf::Value::kNullValue;
}

} // namespace

CorrelationPipeline::CorrelationPipeline(std::shared_ptr<const ledger::SignatureClient>   client,
                                         std::shared_ptr<const biometric::WindowResolver> resolver, PipelineOptions options)
    : client_(std::move(client)), resolver_(std::move(resolver)), options_(options) {
  if (!client_ || !resolver_) {
    throw util::InvalidArgument("CorrelationPipeline requires a signature client and a window resolver");
  }
  if (options_.page_limit == 0) {
    throw util::InvalidArgument("CorrelationPipeline page_limit must be positive");
  }
}

CorrelationPipeline::~CorrelationPipeline() {
  Stop();
}

void CorrelationPipeline::Start() {
  std::lock_guard lock(mutex_);
  if (stopped_) {
    throw util::Unavailable("pipeline cannot be restarted after Stop");
  }
  if (running_) return;

  running_ = true;
  thread_  = std::thread(&CorrelationPipeline::Run, this);
}

void CorrelationPipeline::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
    stopped_ = true;
  }
  scheduler_.Shutdown();
  if (thread_.joinable())
    thread_.join();
}

void CorrelationPipeline::Run() {
  // drain even after shutdown so an accepted request always returns to idle
  while (auto task = scheduler_.Dequeue()) {
    Execute(*task);
  }
}

// ------------------------------------------------------------
// Requests
// ------------------------------------------------------------

RequestDecision CorrelationPipeline::InitialFetch(const std::string& address) {
  if (address.empty()) {
    return RequestDecision::kRejectedInvalid;
  }

  FetchTask task;
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      throw util::Unavailable("pipeline is not running");
    }
    if (!state_.TryAcquire(LoadingState::kLoadingInitial)) {
      PULSETX_LOG_DEBUG("Initial fetch rejected while busy", {StringField("state", ToString(state_.loading()))});
      return RequestDecision::kRejectedBusy;
    }

    state_.Reset(address);

    task.initial = true;
    task.address = address;
    task.limit   = options_.page_limit;

    // Enqueue only throws once shut down, which running_ excludes here
    scheduler_.Enqueue(std::move(task));
  }

  PULSETX_LOG_INFO("Initial fetch accepted", {StringField("address", address)});
  return RequestDecision::kAccepted;
}

RequestDecision CorrelationPipeline::LoadMore() {
  FetchTask task;
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      throw util::Unavailable("pipeline is not running");
    }
    if (state_.loading() != LoadingState::kIdle) {
      return RequestDecision::kRejectedBusy;
    }
    if (!state_.cursor().has_value()) {
      return RequestDecision::kRejectedNoCursor;
    }
    if (state_.exhausted()) {
      return RequestDecision::kRejectedExhausted;
    }
    state_.TryAcquire(LoadingState::kLoadingMore);

    task.initial = false;
    task.address = state_.address();
    task.before  = state_.cursor();
    task.limit   = options_.page_limit;

    scheduler_.Enqueue(std::move(task));
  }

  PULSETX_LOG_DEBUG("Load more accepted");
  return RequestDecision::kAccepted;
}

// ------------------------------------------------------------
// Worker side
// ------------------------------------------------------------

void CorrelationPipeline::Execute(const FetchTask& task) {
  PageOutcome outcome;
  outcome.initial = task.initial;

  ledger::FetchResult result = ledger::FetchResult::Err(ledger::FetchError::Transport("not attempted"));
  try {
    result = client_->FetchPage(task.address, task.limit, task.before);
  } catch (const std::exception& e) {
    PULSETX_LOG_ERROR("Signature page fetch raised", {StringField("address", task.address), StringField("error", e.what())});
    result = ledger::FetchResult::Err(ledger::FetchError::Transport(e.what()));
  }

  if (!result) {
    outcome.kind  = PageOutcome::Kind::kFailed;
    outcome.error = result.error();
    Finish(std::move(outcome), {});
    return;
  }

  if (result.page().empty()) {
    outcome.kind = PageOutcome::Kind::kExhausted;
    Finish(std::move(outcome), {});
    return;
  }

  auto records = Enrich(result.page(), outcome.degraded);

  outcome.kind     = PageOutcome::Kind::kAppended;
  outcome.appended = static_cast<uint32_t>(records.size());
  Finish(std::move(outcome), std::move(records));
}

std::vector<EnrichedRecord> CorrelationPipeline::Enrich(const ledger::SignaturePage& page, uint32_t& degraded) const {
  std::vector<EnrichedRecord> records;
  records.reserve(page.size());

  // One lookup at a time, in page order.
  for (const auto& info : page) {
    EnrichedRecord record;
    record.id        = util::GenerateUUIDString();
    record.signature = info.signature();
    record.slot      = info.slot();
    record.failed    = HasTransactionError(info);

    if (info.has_block_time()) {
      record.timestamp = util::FromUnixSeconds(info.block_time());
    } else {
      record.timestamp           = util::Now();
      record.timestamp_defaulted = true;
      PULSETX_LOG_WARN("Signature without block time, using local time", {StringField("signature", info.signature())});
    }

    const auto resolution = resolver_->Resolve(record.timestamp);
    record.heart_rate_bpm = resolution.bpm;
    if (!resolution.bpm.has_value()) {
      ++degraded;
      PULSETX_LOG_DEBUG("No heart rate for record",
                        {StringField("signature", record.signature), StringField("reason", biometric::StatusName(resolution.status))});
    }

    records.push_back(std::move(record));
  }

  return records;
}

void CorrelationPipeline::Finish(PageOutcome outcome, std::vector<EnrichedRecord> page) {
  outcome.finished_at = util::Now();

  CompletionListener listener;
  {
    std::lock_guard lock(mutex_);
    state_.Complete(outcome, std::move(page));
    listener = listener_;
  }
  idle_cv_.notify_all();

  if (outcome.kind == PageOutcome::Kind::kFailed) {
    PULSETX_LOG_WARN("Page fetch failed", {BoolField("initial", outcome.initial), StringField("error", outcome.error->ToString())});
  } else {
    PULSETX_LOG_INFO("Page fetch finished", {BoolField("initial", outcome.initial), StringField("outcome", ToString(outcome.kind)),
                                             IntField("appended", outcome.appended), IntField("degraded", outcome.degraded)});
  }

  if (listener) {
    try {
      listener(outcome);
    } catch (const std::exception& e) {
      PULSETX_LOG_ERROR("Completion listener threw", {StringField("error", e.what())});
    }
  }
}

// ------------------------------------------------------------
// Observation
// ------------------------------------------------------------

PipelineSnapshot CorrelationPipeline::Snapshot() const {
  std::lock_guard lock(mutex_);
  return state_.Snapshot();
}

std::vector<EnrichedRecord> CorrelationPipeline::Records() const {
  std::lock_guard lock(mutex_);
  return state_.records();
}

std::optional<std::string> CorrelationPipeline::Cursor() const {
  std::lock_guard lock(mutex_);
  return state_.cursor();
}

std::optional<PageOutcome> CorrelationPipeline::LastOutcome() const {
  std::lock_guard lock(mutex_);
  return state_.last_outcome();
}

bool CorrelationPipeline::IsLoadingInitial() const {
  std::lock_guard lock(mutex_);
  return state_.loading() == LoadingState::kLoadingInitial;
}

bool CorrelationPipeline::IsLoadingMore() const {
  std::lock_guard lock(mutex_);
  return state_.loading() == LoadingState::kLoadingMore;
}

bool CorrelationPipeline::IsLoading() const {
  std::lock_guard lock(mutex_);
  return state_.loading() != LoadingState::kIdle;
}

bool CorrelationPipeline::WaitIdle(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [&] { return state_.loading() == LoadingState::kIdle; });
}

void CorrelationPipeline::SetCompletionListener(CompletionListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

} // namespace pulsetx::pipeline
