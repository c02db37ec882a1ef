#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "common/config.hpp"
#include "common/frame_receiver.hpp"
#include "server/processor.hpp"
#include "server/task_scope.hpp"
#include "server/thread_pool.hpp"

namespace voicecmd::server {

struct DispatcherOptions {
  std::size_t max_frame_length{kDefaultMaxFrameLength};
  std::size_t receive_chunk{kReceiveChunk};
  std::size_t max_inflight{64};
  OverflowPolicy overflow_policy{OverflowPolicy::Block};

  static DispatcherOptions from_settings(const Settings& settings);
};

// Reads frames from one connection and hands each to the processor as its
// own task, so a slow handler never holds up the next line.
class ConnectionDispatcher {
 public:
  ConnectionDispatcher(const CommandProcessor& processor, ThreadPool& pool,
                       DispatcherOptions options);

  std::unique_ptr<TaskScope> make_scope() const;

  // Returns when the stream ends (after joining every task) or fails
  // (after cancelling, then joining). The returned status says which.
  ReceiveStatus handle(ByteStream& stream, TaskScope& scope, const std::string& peer) const;

 private:
  void dispatch(std::string text, TaskScope& scope) const;

  const CommandProcessor& processor_;
  ThreadPool& pool_;
  DispatcherOptions options_;
};

}  // namespace voicecmd::server
