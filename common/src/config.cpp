#include "common/config.hpp"

#include <cstdlib>
#include <fstream>
#include <utility>

namespace voicecmd {
namespace {

bool read_size(const nlohmann::json& j, const std::string& key, std::size_t& out,
               std::string& error) {
  if (!j.is_number_unsigned() || j.get<std::size_t>() == 0) {
    error = key + " must be a positive integer";
    return false;
  }
  out = j.get<std::size_t>();
  return true;
}

bool read_string(const nlohmann::json& j, const std::string& key, std::string& out,
                 std::string& error) {
  if (!j.is_string()) {
    error = key + " must be a string";
    return false;
  }
  out = j.get<std::string>();
  return true;
}

// "0600" style octal string, or null to leave the socket mode alone.
bool read_permissions(const nlohmann::json& j, std::optional<unsigned>& out,
                      std::string& error) {
  if (j.is_null()) {
    out.reset();
    return true;
  }
  if (!j.is_string() || j.get<std::string>().empty()) {
    error = "socket_permissions must be an octal string or null";
    return false;
  }
  const std::string raw = j.get<std::string>();
  char* end = nullptr;
  unsigned long value = std::strtoul(raw.c_str(), &end, 8);
  if (end == nullptr || *end != '\0' || value > 07777) {
    error = "socket_permissions is not a valid octal mode: " + raw;
    return false;
  }
  out = static_cast<unsigned>(value);
  return true;
}

bool logging_from_json(const nlohmann::json& j, LoggingSettings& out, std::string& error) {
  if (!j.is_object()) {
    error = "logging must be an object";
    return false;
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& key = it.key();
    if (key == "level") {
      std::string raw;
      if (!read_string(it.value(), "logging.level", raw, error)) return false;
      auto level = spdlog::level::from_str(raw);
      // from_str maps unknown names to off; only accept "off" when asked for.
      if (level == spdlog::level::off && raw != "off") {
        error = "logging.level is not a log level: " + raw;
        return false;
      }
      out.level = level;
    } else if (key == "file") {
      if (!read_string(it.value(), "logging.file", out.file, error)) return false;
    } else if (key == "max_size") {
      if (!read_size(it.value(), "logging.max_size", out.max_size, error)) return false;
    } else if (key == "max_files") {
      if (!read_size(it.value(), "logging.max_files", out.max_files, error)) return false;
    } else {
      error = "unknown key: logging." + key;
      return false;
    }
  }
  return true;
}

}  // namespace

std::string to_string(OverflowPolicy policy) {
  switch (policy) {
    case OverflowPolicy::Block:
      return "block";
    case OverflowPolicy::Reject:
      return "reject";
  }
  return "block";
}

std::optional<OverflowPolicy> overflow_policy_from_string(const std::string& value) {
  if (value == "block") return OverflowPolicy::Block;
  if (value == "reject") return OverflowPolicy::Reject;
  return std::nullopt;
}

bool settings_from_json(const nlohmann::json& j, Settings& out, std::string& error) {
  if (!j.is_object()) {
    error = "configuration must be a JSON object";
    return false;
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& key = it.key();
    const nlohmann::json& value = it.value();
    if (key == "socket_path") {
      if (!read_string(value, key, out.socket_path, error)) return false;
      if (out.socket_path.empty()) {
        error = "socket_path must not be empty";
        return false;
      }
    } else if (key == "socket_permissions") {
      if (!read_permissions(value, out.socket_permissions, error)) return false;
    } else if (key == "max_frame_length") {
      if (!read_size(value, key, out.max_frame_length, error)) return false;
    } else if (key == "receive_chunk") {
      if (!read_size(value, key, out.receive_chunk, error)) return false;
    } else if (key == "worker_threads") {
      if (!read_size(value, key, out.worker_threads, error)) return false;
    } else if (key == "max_inflight_per_connection") {
      if (!read_size(value, key, out.max_inflight_per_connection, error)) return false;
    } else if (key == "overflow_policy") {
      std::string raw;
      if (!read_string(value, key, raw, error)) return false;
      auto policy = overflow_policy_from_string(raw);
      if (!policy) {
        error = "overflow_policy must be \"block\" or \"reject\"";
        return false;
      }
      out.overflow_policy = *policy;
    } else if (key == "plugins") {
      if (!value.is_array()) {
        error = "plugins must be an array of names";
        return false;
      }
      std::vector<std::string> names;
      for (const auto& name : value) {
        if (!name.is_string()) {
          error = "plugins must be an array of names";
          return false;
        }
        names.push_back(name.get<std::string>());
      }
      out.plugins = std::move(names);
    } else if (key == "logging") {
      if (!logging_from_json(value, out.logging, error)) return false;
    } else {
      error = "unknown key: " + key;
      return false;
    }
  }
  return true;
}

bool load_settings(const std::string& path, Settings& out, std::string& error) {
  out = Settings{};
  if (path.empty()) return true;

  std::ifstream file(path);
  if (!file.is_open()) return true;

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(file);
  } catch (const std::exception& ex) {
    error = path + ": JSON parse error: " + ex.what();
    return false;
  }
  if (!settings_from_json(j, out, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

}  // namespace voicecmd
