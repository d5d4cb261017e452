#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace pulsetx::pipeline {

/*
  A page fetch handed from a caller to the pipeline worker.
*/
struct FetchTask {
  bool                       initial = false;
  std::string                address;
  std::optional<std::string> before;
  uint32_t                   limit = 0;
};

/*
  Thread-safe blocking queue feeding the pipeline worker.

  The loading gate means it never holds more than one task, but
  the queue does not rely on that.
*/
class FetchScheduler {
 public:
  // throws util::Unavailable after Shutdown
  void Enqueue(FetchTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<FetchTask> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<FetchTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace pulsetx::pipeline
