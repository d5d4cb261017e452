#include "fetch_scheduler.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace pulsetx::pipeline {

void FetchScheduler::Enqueue(FetchTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::Unavailable("fetch scheduler is shut down");
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<FetchTask> FetchScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  FetchTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void FetchScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace pulsetx::pipeline
