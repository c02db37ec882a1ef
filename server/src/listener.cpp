#include "server/listener.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include <spdlog/spdlog.h>

namespace voicecmd::server {

namespace {

std::string errno_text(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

}  // namespace

UnixListener::UnixListener(std::string path, std::optional<unsigned> permissions)
    : path_(std::move(path)), permissions_(permissions) {}

UnixListener::~UnixListener() {
  close();
}

bool UnixListener::acquire_lock(std::string& error) {
  const std::string lock_path = path_ + ".lock";
  lock_fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (lock_fd_ < 0) {
    error = errno_text("open " + lock_path);
    return false;
  }
  if (::flock(lock_fd_, LOCK_EX | LOCK_NB) < 0) {
    error = errno == EWOULDBLOCK ? "endpoint in use by another server: " + path_
                                 : errno_text("flock " + lock_path);
    release_lock();
    return false;
  }
  return true;
}

void UnixListener::release_lock() {
  // The lock file stays behind: unlinking it would let two later servers
  // lock two different files for the same path.
  if (lock_fd_ >= 0) {
    ::close(lock_fd_);
    lock_fd_ = -1;
  }
}

bool UnixListener::open(std::string& error) {
  if (fd_ >= 0) return true;

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (path_.empty() || path_.size() >= sizeof(addr.sun_path)) {
    error = "socket path empty or too long: " + path_;
    return false;
  }
  std::memcpy(addr.sun_path, path_.c_str(), path_.size() + 1);

  if (!acquire_lock(error)) return false;

  if (::unlink(path_.c_str()) == 0) {
    spdlog::info("[listener] removed stale endpoint {}", path_);
  } else if (errno != ENOENT) {
    spdlog::warn("[listener] could not remove {}: {}", path_, std::strerror(errno));
  }

  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    error = errno_text("socket");
    release_lock();
    return false;
  }
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    error = errno_text("bind " + path_);
    ::close(fd);
    release_lock();
    return false;
  }
  if (permissions_ && ::chmod(path_.c_str(), static_cast<mode_t>(*permissions_)) < 0) {
    error = errno_text("chmod " + path_);
    ::close(fd);
    ::unlink(path_.c_str());
    release_lock();
    return false;
  }
  if (::listen(fd, kListenBacklog) < 0) {
    error = errno_text("listen");
    ::close(fd);
    ::unlink(path_.c_str());
    release_lock();
    return false;
  }
  fd_ = fd;
  return true;
}

int UnixListener::accept(std::string& error) {
  while (true) {
    int client = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client >= 0) return client;
    if (errno == EINTR) continue;
    error = errno_text("accept");
    return -1;
  }
}

void UnixListener::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
    ::unlink(path_.c_str());
  }
  release_lock();
}

}  // namespace voicecmd::server
