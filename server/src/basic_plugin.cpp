#include <stdexcept>
#include <string>
#include <vector>

#include "server/plugins.hpp"

namespace voicecmd::server {

namespace {

void press(const std::string& keys, const CancellationToken& cancel) {
  if (keys.empty()) throw std::invalid_argument("no key to press");
  run_process({"xdotool", "key", "--clearmodifiers", keys}, cancel);
}

const Value& single_arg(const Arguments& args) {
  if (args.size() != 1) {
    throw std::invalid_argument("expected one argument, got " + std::to_string(args.size()));
  }
  return args.front();
}

std::string key_alternatives() {
  std::string body;
  for (const auto& entry : pronunciation_to_key()) {
    if (!body.empty()) body += " | ";
    body += "\"" + entry.first + "\"";
  }
  return body;
}

}  // namespace

CommandRegistry basic_plugin() {
  CommandRegistry registry;
  registry.define("?any_text", R"(/\S.*/)");
  registry.define("modifier", R"("control" | "shift" | "alt" | "super")");
  registry.define("key", key_alternatives());
  registry.define("chord", R"((modifier ["+"])* key)");

  registry.add(R"("say" chord)", [](const Arguments& args, const CancellationToken& cancel) {
    press(chord_to_keys(single_arg(args)), cancel);
  });

  registry.add(R"("switch" chord)", [](const Arguments& args, const CancellationToken& cancel) {
    press("super+" + chord_to_keys(single_arg(args)), cancel);
  });

  registry.add(R"("type" any_text)", [](const Arguments& args, const CancellationToken& cancel) {
    run_process({"xdotool", "type", "--", single_arg(args).text}, cancel);
  });

  registry.add(R"("alert" any_text)", [](const Arguments& args, const CancellationToken& cancel) {
    run_process({"notify-send", "voicecmd", single_arg(args).text}, cancel);
  });

  registry.add(R"("speak" any_text)", [](const Arguments& args, const CancellationToken& cancel) {
    run_process({"espeak", single_arg(args).text}, cancel);
  });

  registry.add(R"("monitor")", [](const Arguments&, const CancellationToken& cancel) {
    press("M", cancel);
  });

  registry.add(R"("mouse")", [](const Arguments&, const CancellationToken& cancel) {
    press("O", cancel);
  });

  // Always fails; handy for checking that failures stay contained.
  registry.add(R"("fail")", [](const Arguments&, const CancellationToken&) {
    throw std::domain_error("division by zero");
  });

  return registry;
}

}  // namespace voicecmd::server
