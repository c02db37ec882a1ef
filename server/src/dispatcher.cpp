#include "server/dispatcher.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace voicecmd::server {

DispatcherOptions DispatcherOptions::from_settings(const Settings& settings) {
  DispatcherOptions options;
  options.max_frame_length = settings.max_frame_length;
  options.receive_chunk = settings.receive_chunk;
  options.max_inflight = settings.max_inflight_per_connection;
  options.overflow_policy = settings.overflow_policy;
  return options;
}

ConnectionDispatcher::ConnectionDispatcher(const CommandProcessor& processor, ThreadPool& pool,
                                           DispatcherOptions options)
    : processor_(processor), pool_(pool), options_(options) {}

std::unique_ptr<TaskScope> ConnectionDispatcher::make_scope() const {
  return std::make_unique<TaskScope>(pool_, options_.max_inflight, options_.overflow_policy);
}

ReceiveStatus ConnectionDispatcher::handle(ByteStream& stream, TaskScope& scope,
                                           const std::string& peer) const {
  FrameReceiver receiver(stream, kTerminator, options_.max_frame_length, options_.receive_chunk);
  while (true) {
    std::string frame;
    std::string error;
    ReceiveStatus status = receiver.receive(frame, error);
    switch (status) {
      case ReceiveStatus::Frame:
        dispatch(std::move(frame), scope);
        continue;
      case ReceiveStatus::EndOfStream:
        spdlog::debug("[conn] {} closed, waiting for {} command(s)", peer, scope.in_flight());
        scope.join_all();
        return status;
      case ReceiveStatus::FrameTooLong:
      case ReceiveStatus::IncompleteFrame:
        spdlog::warn("[conn] {} dropped: {}", peer, error);
        break;
      case ReceiveStatus::IoError:
        spdlog::error("[conn] {} dropped: {}", peer, error);
        break;
    }
    scope.cancel_all();
    scope.join_all();
    return status;
  }
}

void ConnectionDispatcher::dispatch(std::string text, TaskScope& scope) const {
  if (!is_valid_utf8(text)) {
    processor_.report(ProcessResult{Outcome::Unrecognized, std::move(text), {}, "invalid UTF-8"});
    return;
  }

  const CommandProcessor* processor = &processor_;
  std::string copy = text;
  auto spawned = scope.spawn([processor, copy = std::move(copy)](const CancellationToken& cancel) {
    processor->process(copy, cancel);
  });

  switch (spawned) {
    case TaskScope::SpawnResult::Spawned:
      break;
    case TaskScope::SpawnResult::Rejected:
      processor_.report(ProcessResult{Outcome::Rejected, std::move(text), {},
                                      "too many commands in flight"});
      break;
    case TaskScope::SpawnResult::Cancelled:
    case TaskScope::SpawnResult::Closed:
      processor_.report(ProcessResult{Outcome::Cancelled, std::move(text), {}, {}});
      break;
  }
}

}  // namespace voicecmd::server
