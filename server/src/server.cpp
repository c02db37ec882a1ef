#include "server/server.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/frame_receiver.hpp"

namespace voicecmd::server {

namespace {

// Pause after a failed accept(); a pending connection the server cannot take
// (EMFILE, ENFILE) keeps the listener readable.
constexpr int kAcceptBackoffMs = 100;

// Unix sockets have no address worth printing; use the peer's pid instead.
std::string peer_name(int fd, std::uint64_t id) {
  std::ostringstream oss;
  oss << "conn-" << id;
  ucred cred{};
  socklen_t len = sizeof(cred);
  if (::getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &cred, &len) == 0) {
    oss << " (pid " << cred.pid << ")";
  }
  return oss.str();
}

}  // namespace

Server::Server(const Settings& settings, std::shared_ptr<const CommandSet> commands,
               OutcomeSink& sink)
    : settings_(settings),
      listener_(settings.socket_path, settings.socket_permissions),
      workers_(settings.worker_threads),
      processor_(std::move(commands), sink),
      dispatcher_(processor_, workers_, DispatcherOptions::from_settings(settings)) {}

Server::~Server() {
  stop();
}

bool Server::start(std::string& error) {
  if (running_.load()) return true;
  if (!listener_.open(error)) return false;
  if (::pipe2(wake_fds_, O_CLOEXEC) < 0) {
    error = std::string("pipe: ") + std::strerror(errno);
    listener_.close();
    return false;
  }
  running_.store(true);
  accept_thread_ = std::thread(&Server::accept_loop, this);
  spdlog::info("[server] listening on {} ({} core workers, {} in flight per connection, {})",
               listener_.path(), workers_.size(), settings_.max_inflight_per_connection,
               to_string(settings_.overflow_policy));
  return true;
}

void Server::stop() {
  if (!running_.exchange(false)) return;
  const char wake = 'x';
  if (::write(wake_fds_[1], &wake, 1) < 0) {
    spdlog::warn("[server] wake write failed: {}", std::strerror(errno));
  }
  if (accept_thread_.joinable()) accept_thread_.join();
  listener_.close();
  spdlog::info("[server] stopping: {} connection(s), {} command(s) running, {} queued",
               connection_count(), workers_.busy(), workers_.queued());
  close_all_connections();
  workers_.shutdown();
  ::close(wake_fds_[0]);
  ::close(wake_fds_[1]);
  wake_fds_[0] = wake_fds_[1] = -1;
  spdlog::info("[server] stopped");
}

std::size_t Server::connection_count() {
  std::lock_guard<std::mutex> lock(conns_mtx_);
  return connections_.size();
}

void Server::accept_loop() {
  while (running_.load()) {
    pollfd fds[2]{};
    fds[0].fd = listener_.fd();
    fds[0].events = POLLIN;
    fds[1].fd = wake_fds_[0];
    fds[1].events = POLLIN;
    int ready = ::poll(fds, 2, 1000);
    if (ready < 0) {
      if (errno == EINTR) continue;
      spdlog::error("[server] poll failed: {}", std::strerror(errno));
      break;
    }
    reap_finished();
    if (fds[1].revents != 0) break;
    if ((fds[0].revents & POLLIN) == 0) continue;

    std::string error;
    int client_fd = listener_.accept(error);
    if (client_fd < 0) {
      spdlog::warn("[server] {}", error);
      back_off_after_accept_error();
      continue;
    }
    auto conn = std::make_shared<Connection>(client_fd, peer_name(client_fd, next_id_++),
                                             dispatcher_);
    {
      std::lock_guard<std::mutex> lock(conns_mtx_);
      connections_.push_back(conn);
    }
    conn->start();
    spdlog::info("[server] new connection {}", conn->peer());
  }
}

void Server::back_off_after_accept_error() {
  ++accept_failures_;
  pollfd wake{};
  wake.fd = wake_fds_[0];
  wake.events = POLLIN;
  // stop() still wakes us; the byte stays in the pipe for the main poll.
  while (::poll(&wake, 1, kAcceptBackoffMs) < 0 && errno == EINTR) {
  }
}

void Server::reap_finished() {
  std::vector<std::shared_ptr<Connection>> done;
  {
    std::lock_guard<std::mutex> lock(conns_mtx_);
    auto it = connections_.begin();
    while (it != connections_.end()) {
      if ((*it)->finished()) {
        done.push_back(*it);
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& c : done) {
    c->stop();
    spdlog::info("[server] connection {} closed", c->peer());
  }
}

void Server::close_all_connections() {
  std::vector<std::shared_ptr<Connection>> to_close;
  {
    std::lock_guard<std::mutex> lock(conns_mtx_);
    to_close.swap(connections_);
  }
  // Cancel everything first so connections wind down together.
  for (auto& c : to_close) {
    if (c) c->cancel();
  }
  for (auto& c : to_close) {
    if (c) c->stop();
  }
}

Connection::Connection(int fd, std::string peer, const ConnectionDispatcher& dispatcher)
    : fd_(fd), peer_(std::move(peer)), dispatcher_(dispatcher), scope_(dispatcher.make_scope()) {}

Connection::~Connection() {
  stop();
}

void Connection::start() {
  reader_ = std::thread(&Connection::read_loop, this);
}

void Connection::cancel() {
  scope_->cancel_all();
}

// Cancel first so queued commands skip their handlers, then wake the reader
// out of read(); it joins the scope before exiting.
void Connection::stop() {
  if (stopped_.exchange(true)) return;
  scope_->cancel_all();
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
  if (reader_.joinable()) reader_.join();
  scope_->join_all();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void Connection::read_loop() {
  FdStream stream(fd_);
  ReceiveStatus status = dispatcher_.handle(stream, *scope_, peer_);
  spdlog::debug("[conn] {} reader exiting: {}", peer_, to_string(status));
  // Dropped connections see EOF now, not when the accept loop reaps them.
  if (status != ReceiveStatus::EndOfStream) ::shutdown(fd_, SHUT_RDWR);
  finished_.store(true);
}

}  // namespace voicecmd::server
