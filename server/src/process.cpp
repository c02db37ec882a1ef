#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "server/plugins.hpp"

extern char** environ;

namespace voicecmd::server {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);
// How long a child gets to exit after SIGTERM before it is killed.
constexpr auto kTerminateGrace = std::chrono::seconds(2);

void terminate_child(pid_t pid, const std::string& name, int& status) {
  ::kill(pid, SIGTERM);
  auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
  while (std::chrono::steady_clock::now() < deadline) {
    pid_t done = ::waitpid(pid, &status, WNOHANG);
    if (done == pid) return;
    if (done < 0 && errno != EINTR) return;
    std::this_thread::sleep_for(kPollInterval);
  }
  spdlog::warn("[process] {} (pid {}) ignored SIGTERM, killing it", name, pid);
  ::kill(pid, SIGKILL);
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

}  // namespace

void run_process(const std::vector<std::string>& argv, const CancellationToken& cancel) {
  if (argv.empty()) throw std::invalid_argument("run_process: empty argv");

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = 0;
  int rc = ::posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), environ);
  if (rc != 0) {
    throw std::runtime_error("cannot start " + argv[0] + ": " + std::strerror(rc));
  }
  spdlog::debug("[process] started {} (pid {})", argv[0], pid);

  int status = 0;
  while (true) {
    pid_t done = ::waitpid(pid, &status, WNOHANG);
    if (done == pid) break;
    if (done < 0) {
      if (errno == EINTR) continue;
      throw std::runtime_error("waitpid " + argv[0] + ": " + std::strerror(errno));
    }
    if (!cancel.wait_for(kPollInterval)) {
      terminate_child(pid, argv[0], status);
      throw OperationCancelled();
    }
  }

  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) return;
  if (WIFEXITED(status)) {
    throw std::runtime_error(argv[0] + " exited with status " +
                             std::to_string(WEXITSTATUS(status)));
  }
  throw std::runtime_error(argv[0] + " terminated abnormally");
}

}  // namespace voicecmd::server
