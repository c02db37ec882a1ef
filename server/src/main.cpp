#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "common/config.hpp"
#include "server/plugins.hpp"
#include "server/processor.hpp"
#include "server/server.hpp"

using voicecmd::Settings;
using voicecmd::server::LoggingOutcomeSink;
using voicecmd::server::Server;

namespace {
std::atomic<bool> g_stop{false};

void signal_handler(int) {
  g_stop.store(true);
}

void setup_logging(const voicecmd::LoggingSettings& logging) {
  std::shared_ptr<spdlog::logger> logger;
  if (!logging.file.empty()) {
    std::filesystem::path parent = std::filesystem::path(logging.file).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
    logger = spdlog::rotating_logger_mt("server", logging.file, logging.max_size,
                                        logging.max_files);
  } else {
    logger = spdlog::stdout_color_mt("server");
  }
  spdlog::set_default_logger(logger);
  spdlog::set_level(logging.level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

}  // namespace

int main(int argc, char** argv) {
  if (argc > 3) {
    std::cerr << "Usage: " << argv[0] << " [config.json] [socket_path]\n";
    return 1;
  }
  std::string config_path = argc > 1 ? argv[1] : "config/voicecmd.json";

  Settings settings;
  std::string error;
  if (!voicecmd::load_settings(config_path, settings, error)) {
    std::cerr << "[server] config error: " << error << "\n";
    return 1;
  }
  if (argc > 2) settings.socket_path = argv[2];

  try {
    setup_logging(settings.logging);
  } catch (const std::exception& ex) {
    std::cerr << "[server] cannot set up logging: " << ex.what() << "\n";
    return 1;
  }

  auto registry = voicecmd::server::assemble_plugins(settings.plugins, error);
  if (!registry) {
    spdlog::critical("[server] plugin assembly failed: {}", error);
    return 1;
  }
  std::shared_ptr<const voicecmd::server::CommandSet> commands;
  try {
    commands = registry->compile();
  } catch (const voicecmd::server::GrammarError& ex) {
    spdlog::critical("[server] grammar error: {}", ex.what());
    return 1;
  }
  for (const auto& pattern : registry->patterns()) {
    spdlog::debug("[server] pattern {}", pattern);
  }
  spdlog::info("[server] {} commands from {} plugin(s)", commands->size(),
               settings.plugins.size());

  LoggingOutcomeSink sink;
  Server server(settings, commands, sink);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  if (!server.start(error)) {
    spdlog::critical("[server] failed to start: {}", error);
    return 1;
  }

  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  server.stop();
  auto stats = sink.stats();
  spdlog::info("[server] handled={} unrecognized={} failed={} rejected={} cancelled={}",
               stats.handled, stats.unrecognized, stats.handler_failed, stats.rejected,
               stats.cancelled);
  return 0;
}
