#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include "common/codec.hpp"

namespace voicecmd {

// What the read loop does when a connection already has the maximum number
// of commands in flight.
enum class OverflowPolicy { Block, Reject };

std::string to_string(OverflowPolicy policy);
std::optional<OverflowPolicy> overflow_policy_from_string(const std::string& value);

struct LoggingSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string file;  // empty: log to stdout
  std::size_t max_size{5 * 1024 * 1024};
  std::size_t max_files{3};
};

struct Settings {
  std::string socket_path{"/tmp/voicecmd.sock"};
  std::optional<unsigned> socket_permissions{0600};
  std::size_t max_frame_length{kDefaultMaxFrameLength};
  std::size_t receive_chunk{kReceiveChunk};
  std::size_t worker_threads{8};  // warm workers; the pool grows past them on demand
  std::size_t max_inflight_per_connection{64};
  OverflowPolicy overflow_policy{OverflowPolicy::Block};
  std::vector<std::string> plugins{"basic", "diagnostics"};
  LoggingSettings logging;
};

// Apply the keys present in `j` on top of `out`. Unknown keys and values of
// the wrong type are errors; `error` names the offending key.
bool settings_from_json(const nlohmann::json& j, Settings& out, std::string& error);

// Missing file: defaults, returns true. Unreadable JSON or a bad key: false.
bool load_settings(const std::string& path, Settings& out, std::string& error);

}  // namespace voicecmd
