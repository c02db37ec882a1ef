#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "server/plugins.hpp"

namespace voicecmd::server {

namespace {

unsigned parse_number(const Value& value) {
  std::string word = value.text;
  std::transform(word.begin(), word.end(), word.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto it = number_words().find(word);
  if (it != number_words().end()) return it->second;
  unsigned long n = std::stoul(value.text);
  if (n > std::numeric_limits<unsigned>::max()) {
    throw std::out_of_range("number too large: " + value.text);
  }
  return static_cast<unsigned>(n);
}

}  // namespace

CommandRegistry diagnostics_plugin() {
  CommandRegistry registry;
  registry.define("?any_text", R"(/\S.*/)");
  registry.define("number",
                  R"(/[0-9]+/ | "zero" | "one" | "two" | "three" | "four" | "five" | "six" | )"
                  R"("seven" | "eight" | "nine" | "ten")");

  registry.add(R"("ping")", [](const Arguments&, const CancellationToken&) {
    spdlog::info("[diagnostics] pong");
  });

  registry.add(R"("echo" any_text)", [](const Arguments& args, const CancellationToken&) {
    spdlog::info("[diagnostics] echo: {}", args.at(0).text);
  });

  // Holds a worker for a while; returns early if the connection goes away.
  registry.add(R"("sleep" number)", [](const Arguments& args, const CancellationToken& cancel) {
    unsigned seconds = parse_number(args.at(0));
    if (!cancel.wait_for(std::chrono::seconds(seconds))) throw OperationCancelled();
    spdlog::info("[diagnostics] slept {}s", seconds);
  });

  return registry;
}

}  // namespace voicecmd::server
