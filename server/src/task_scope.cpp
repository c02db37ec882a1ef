#include "server/task_scope.hpp"

#include <spdlog/spdlog.h>

namespace voicecmd::server {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(state_->mtx);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::cancelled() const {
  std::lock_guard<std::mutex> lock(state_->mtx);
  return state_->cancelled;
}

void CancellationToken::throw_if_cancelled() const {
  if (cancelled()) throw OperationCancelled();
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_->mtx);
  return !state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

TaskScope::TaskScope(ThreadPool& pool, std::size_t max_inflight, OverflowPolicy policy)
    : pool_(pool),
      max_inflight_(max_inflight == 0 ? 1 : max_inflight),
      policy_(policy),
      state_(std::make_shared<State>()) {}

TaskScope::~TaskScope() {
  cancel_all();
  join_all();
}

TaskScope::SpawnResult TaskScope::spawn(Task task) {
  {
    std::unique_lock<std::mutex> lock(state_->mtx);
    if (state_->active >= max_inflight_) {
      if (policy_ == OverflowPolicy::Reject) return SpawnResult::Rejected;
      state_->cv.wait(lock, [this] {
        return state_->active < max_inflight_ || token_.cancelled();
      });
    }
    if (token_.cancelled()) return SpawnResult::Cancelled;
    ++state_->active;
  }

  // The task keeps the counters alive on its own; it may outlive a wait
  // that has already given up on it.
  auto state = state_;
  CancellationToken token = token_;
  bool queued = pool_.enqueue([state, token, task = std::move(task)] {
    struct Done {
      std::shared_ptr<State> state;
      ~Done() {
        std::lock_guard<std::mutex> lock(state->mtx);
        --state->active;
        state->cv.notify_all();
      }
    } done{state};
    try {
      task(token);
    } catch (const std::exception& ex) {
      spdlog::error("[scope] task ended with uncaught exception: {}", ex.what());
    }
  });

  if (!queued) {
    std::lock_guard<std::mutex> lock(state_->mtx);
    --state_->active;
    state_->cv.notify_all();
    return SpawnResult::Closed;
  }
  return SpawnResult::Spawned;
}

void TaskScope::cancel_all() {
  token_.cancel();
  std::lock_guard<std::mutex> lock(state_->mtx);
  state_->cv.notify_all();
}

void TaskScope::join_all() {
  std::unique_lock<std::mutex> lock(state_->mtx);
  state_->cv.wait(lock, [this] { return state_->active == 0; });
}

std::size_t TaskScope::in_flight() const {
  std::lock_guard<std::mutex> lock(state_->mtx);
  return state_->active;
}

}  // namespace voicecmd::server
