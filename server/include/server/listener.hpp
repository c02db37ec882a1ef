#pragma once

#include <optional>
#include <string>

namespace voicecmd::server {

constexpr int kListenBacklog = 100;

// Owns the Unix domain socket a server listens on.
//
// open() takes an exclusive advisory lock on "<path>.lock" first, so two
// servers started on the same path cannot both delete and rebind it; the
// loser fails with "endpoint in use". The holder then removes any stale
// socket file, binds, restricts the mode (if asked) and only then listens.
class UnixListener {
 public:
  UnixListener(std::string path, std::optional<unsigned> permissions);
  ~UnixListener();

  UnixListener(const UnixListener&) = delete;
  UnixListener& operator=(const UnixListener&) = delete;

  bool open(std::string& error);
  // Accepts one pending connection. Returns the descriptor or -1 with error.
  int accept(std::string& error);
  // Stops listening, removes the socket file and releases the lock.
  void close();

  int fd() const { return fd_; }
  const std::string& path() const { return path_; }

 private:
  bool acquire_lock(std::string& error);
  void release_lock();

  std::string path_;
  std::optional<unsigned> permissions_;
  int fd_{-1};
  int lock_fd_{-1};
};

}  // namespace voicecmd::server
