#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "server/registry.hpp"
#include "server/task_scope.hpp"

namespace voicecmd::server {

enum class Outcome { Handled, Unrecognized, HandlerFailed, Rejected, Cancelled };

std::string to_string(Outcome outcome);

struct ProcessResult {
  Outcome outcome{Outcome::Unrecognized};
  std::string text;     // the line as received
  std::string command;  // matched pattern, empty when unrecognized
  std::string error;    // cause for HandlerFailed / Unrecognized / Rejected
};

// Receives the outcome of every message. Called from worker threads and
// reader threads concurrently.
class OutcomeSink {
 public:
  virtual ~OutcomeSink() = default;
  virtual void record(const ProcessResult& result) = 0;
};

// Logs each outcome through spdlog and keeps totals.
class LoggingOutcomeSink : public OutcomeSink {
 public:
  struct Stats {
    std::uint64_t handled = 0;
    std::uint64_t unrecognized = 0;
    std::uint64_t handler_failed = 0;
    std::uint64_t rejected = 0;
    std::uint64_t cancelled = 0;
  };

  void record(const ProcessResult& result) override;
  Stats stats() const;

 private:
  std::atomic<std::uint64_t> handled_{0};
  std::atomic<std::uint64_t> unrecognized_{0};
  std::atomic<std::uint64_t> handler_failed_{0};
  std::atomic<std::uint64_t> rejected_{0};
  std::atomic<std::uint64_t> cancelled_{0};
};

// Parses one line and runs its handler. Failures never leave this call:
// they come back as the result and are reported to the sink.
class CommandProcessor {
 public:
  CommandProcessor(std::shared_ptr<const CommandSet> commands, OutcomeSink& sink);

  ProcessResult process(const std::string& text, const CancellationToken& cancel) const;

  // For messages dropped before reaching process().
  void report(ProcessResult result) const;

 private:
  ProcessResult run(const std::string& text, const CancellationToken& cancel) const;

  std::shared_ptr<const CommandSet> commands_;
  OutcomeSink& sink_;
};

}  // namespace voicecmd::server
