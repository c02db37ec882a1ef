#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>

#include "common/config.hpp"
#include "server/thread_pool.hpp"

namespace voicecmd::server {

// Thrown by handlers that notice their task was cancelled.
class OperationCancelled : public std::runtime_error {
 public:
  OperationCancelled() : std::runtime_error("operation cancelled") {}
};

// Shared cancellation flag. Copies observe the same flag. Cancellation is
// cooperative: a task sees it only when it checks.
class CancellationToken {
 public:
  CancellationToken();

  void cancel();
  bool cancelled() const;
  void throw_if_cancelled() const;
  // Sleeps for `timeout` unless cancelled first. Returns true when the full
  // timeout elapsed, false when woken by cancellation.
  bool wait_for(std::chrono::milliseconds timeout) const;

 private:
  struct State {
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool cancelled{false};
  };
  std::shared_ptr<State> state_;
};

// Owns the tasks spawned for one connection: spawn, cancel-all, join-all.
// Tasks run on the shared ThreadPool; at most `max_inflight` run or wait in
// the pool at once, beyond that the overflow policy decides.
class TaskScope {
 public:
  using Task = std::function<void(const CancellationToken&)>;

  enum class SpawnResult { Spawned, Rejected, Cancelled, Closed };

  TaskScope(ThreadPool& pool, std::size_t max_inflight, OverflowPolicy policy);
  // Cancels and joins whatever is still running.
  ~TaskScope();

  TaskScope(const TaskScope&) = delete;
  TaskScope& operator=(const TaskScope&) = delete;

  SpawnResult spawn(Task task);
  void cancel_all();
  void join_all();

  std::size_t in_flight() const;
  const CancellationToken& token() const { return token_; }

 private:
  struct State {
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::size_t active{0};
  };

  ThreadPool& pool_;
  std::size_t max_inflight_;
  OverflowPolicy policy_;
  CancellationToken token_;
  std::shared_ptr<State> state_;
};

}  // namespace voicecmd::server
