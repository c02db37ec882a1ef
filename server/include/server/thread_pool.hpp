#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace voicecmd::server {

// Worker threads shared by every connection. Command handlers run here so
// blocking calls never stall a connection's read loop.
//
// The pool keeps `core_workers` threads warm and starts another thread
// whenever a job arrives with no idle worker to take it, so a job never
// waits behind another connection's long-running handlers. Threads beyond
// the core retire after `idle_timeout` without work. The number of jobs in
// flight is bounded by the callers (TaskScope admission), not here.
class ThreadPool {
 public:
  using Job = std::function<void()>;

  explicit ThreadPool(std::size_t core_workers,
                      std::chrono::milliseconds idle_timeout = std::chrono::seconds(30));
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Returns false once shutdown has begun; the job is not queued then.
  bool enqueue(Job job);
  // Runs every job already queued, then joins the workers. Idempotent.
  void shutdown();

  // Live worker threads.
  std::size_t size() const;
  std::size_t core_size() const { return core_; }
  // Jobs waiting for a worker / jobs currently running.
  std::size_t queued() const;
  std::size_t busy() const;

 private:
  void start_worker_locked();
  std::vector<std::thread> take_retired_locked();
  void worker_loop(std::size_t id);

  const std::size_t core_;
  const std::chrono::milliseconds idle_timeout_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<Job> jobs_;
  std::size_t busy_{0};
  std::size_t idle_{0};
  std::size_t live_{0};
  bool stopping_{false};
  std::size_t next_id_{0};
  std::map<std::size_t, std::thread> workers_;
  std::vector<std::size_t> retired_;
};

}  // namespace voicecmd::server
