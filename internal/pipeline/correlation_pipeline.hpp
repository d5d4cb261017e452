#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "fetch_scheduler.hpp"
#include "pipeline_state.hpp"
#include "types.hpp"

namespace pulsetx::ledger {
class SignatureClient;
}

namespace pulsetx::biometric {
class WindowResolver;
}

namespace pulsetx::pipeline {

struct PipelineOptions {
  uint32_t page_limit = 30;
};

/*
  Cursor-paginated fetch-and-correlate pipeline.

  InitialFetch / LoadMore decide synchronously and return at once;
  the page fetch and enrichment run on the pipeline's worker thread.
  Requests arriving while a page is in flight are rejected, never
  queued. Within a page, heart rate lookups run one at a time in
  page order.
*/
class CorrelationPipeline {
 public:
  using CompletionListener = std::function<void(const PageOutcome&)>;

  CorrelationPipeline(std::shared_ptr<const ledger::SignatureClient> client, std::shared_ptr<const biometric::WindowResolver> resolver,
                      PipelineOptions options = {});
  ~CorrelationPipeline();

  CorrelationPipeline(const CorrelationPipeline&)            = delete;
  CorrelationPipeline& operator=(const CorrelationPipeline&) = delete;

  // A stopped pipeline cannot be started again.
  void Start();

  // Refuses new work, lets an in-flight page finish, joins the worker.
  void Stop();

  RequestDecision InitialFetch(const std::string& address);
  RequestDecision LoadMore();

  PipelineSnapshot            Snapshot() const;
  std::vector<EnrichedRecord> Records() const;
  std::optional<std::string>  Cursor() const;
  std::optional<PageOutcome>  LastOutcome() const;

  bool IsLoadingInitial() const;
  bool IsLoadingMore() const;
  bool IsLoading() const;

  // true when idle before the timeout
  bool WaitIdle(std::chrono::milliseconds timeout) const;

  // Called on the worker thread after every page, success or not.
  // The listener must not call Stop() or destroy the pipeline: Stop()
  // joins the worker thread the listener is running on.
  void SetCompletionListener(CompletionListener listener);

 private:
  void Run();
  void Execute(const FetchTask& task);
  void Finish(PageOutcome outcome, std::vector<EnrichedRecord> page);

  std::vector<EnrichedRecord> Enrich(const ledger::SignaturePage& page, uint32_t& degraded) const;

  std::shared_ptr<const ledger::SignatureClient>   client_;
  std::shared_ptr<const biometric::WindowResolver> resolver_;
  PipelineOptions                                  options_;

  FetchScheduler    scheduler_;
  std::thread       thread_;
  std::atomic<bool> running_{false};
  bool              stopped_ = false;

  mutable std::mutex              mutex_;
  mutable std::condition_variable idle_cv_;
  PipelineState                   state_;
  CompletionListener              listener_;
};

} // namespace pulsetx::pipeline
