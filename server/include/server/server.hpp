#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "common/config.hpp"
#include "server/dispatcher.hpp"
#include "server/listener.hpp"
#include "server/processor.hpp"
#include "server/registry.hpp"
#include "server/thread_pool.hpp"

namespace voicecmd::server {

class Connection;

class Server {
 public:
  Server(const Settings& settings, std::shared_ptr<const CommandSet> commands,
         OutcomeSink& sink);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Binds the endpoint and starts accepting. False (with error) on bind failure.
  bool start(std::string& error);
  // Cancels every connection's commands, waits for them and closes the endpoint.
  void stop();

  bool running() const { return running_.load(); }
  std::size_t connection_count();
  // accept() calls that failed since start; each one is followed by a pause.
  std::uint64_t accept_failures() const { return accept_failures_.load(); }

 private:
  void accept_loop();
  void reap_finished();
  void close_all_connections();
  void back_off_after_accept_error();

  Settings settings_;
  UnixListener listener_;
  ThreadPool workers_;
  CommandProcessor processor_;
  ConnectionDispatcher dispatcher_;

  std::atomic<bool> running_{false};
  int wake_fds_[2]{-1, -1};
  std::thread accept_thread_;
  std::uint64_t next_id_{1};
  std::atomic<std::uint64_t> accept_failures_{0};

  std::mutex conns_mtx_;
  std::vector<std::shared_ptr<Connection>> connections_;
};

// One accepted client: a reader thread plus the task scope its commands run in.
class Connection {
 public:
  Connection(int fd, std::string peer, const ConnectionDispatcher& dispatcher);
  ~Connection();

  void start();
  // Cancels the connection's commands without waiting for them.
  void cancel();
  void stop();
  bool finished() const { return finished_.load(); }
  const std::string& peer() const { return peer_; }

 private:
  void read_loop();

  int fd_;
  std::string peer_;
  const ConnectionDispatcher& dispatcher_;
  std::unique_ptr<TaskScope> scope_;
  std::atomic<bool> finished_{false};
  std::atomic<bool> stopped_{false};
  std::thread reader_;
};

}  // namespace voicecmd::server
