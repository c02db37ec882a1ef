#include "server/thread_pool.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace voicecmd::server {

ThreadPool::ThreadPool(std::size_t core_workers, std::chrono::milliseconds idle_timeout)
    : core_(core_workers == 0 ? 1 : core_workers), idle_timeout_(idle_timeout) {
  std::lock_guard<std::mutex> lock(mtx_);
  for (std::size_t i = 0; i < core_; ++i) start_worker_locked();
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::start_worker_locked() {
  const std::size_t id = next_id_++;
  ++live_;
  workers_.emplace(id, std::thread(&ThreadPool::worker_loop, this, id));
}

// Threads that have left worker_loop; joined by the caller outside the lock.
std::vector<std::thread> ThreadPool::take_retired_locked() {
  std::vector<std::thread> done;
  for (std::size_t id : retired_) {
    auto it = workers_.find(id);
    if (it == workers_.end()) continue;
    done.push_back(std::move(it->second));
    workers_.erase(it);
  }
  retired_.clear();
  return done;
}

bool ThreadPool::enqueue(Job job) {
  std::vector<std::thread> retired;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return false;
    jobs_.push(std::move(job));
    if (idle_ < jobs_.size()) start_worker_locked();
    retired = take_retired_locked();
  }
  cv_.notify_one();
  for (auto& t : retired) t.join();
  return true;
}

void ThreadPool::shutdown() {
  std::vector<std::thread> all;
  std::size_t pending = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return;
    stopping_ = true;
    pending = jobs_.size();
    for (auto& entry : workers_) all.push_back(std::move(entry.second));
    workers_.clear();
    retired_.clear();
  }
  cv_.notify_all();
  spdlog::debug("[pool] stopping {} workers, {} job(s) left to drain", all.size(), pending);
  for (auto& t : all) {
    if (t.joinable()) t.join();
  }
}

std::size_t ThreadPool::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return live_;
}

std::size_t ThreadPool::queued() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return jobs_.size();
}

std::size_t ThreadPool::busy() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return busy_;
}

void ThreadPool::worker_loop(std::size_t id) {
  std::unique_lock<std::mutex> lock(mtx_);
  while (true) {
    ++idle_;
    bool woken = cv_.wait_for(lock, idle_timeout_,
                              [this] { return stopping_ || !jobs_.empty(); });
    --idle_;
    if (jobs_.empty()) {
      if (stopping_) break;
      if (!woken && live_ > core_) {
        retired_.push_back(id);
        break;
      }
      continue;
    }

    Job job = std::move(jobs_.front());
    jobs_.pop();
    ++busy_;
    lock.unlock();
    // A job that throws must not take the worker down with it.
    try {
      job();
    } catch (const std::exception& ex) {
      spdlog::error("[pool] worker {} job threw: {}", id, ex.what());
    } catch (...) {
      spdlog::error("[pool] worker {} job threw a non-standard exception", id);
    }
    job = nullptr;
    lock.lock();
    --busy_;
  }
  --live_;
}

}  // namespace voicecmd::server
