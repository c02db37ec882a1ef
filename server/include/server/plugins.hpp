#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "server/grammar.hpp"
#include "server/registry.hpp"
#include "server/task_scope.hpp"

namespace voicecmd::server {

struct PluginDescriptor {
  std::string name;
  std::string description;
  std::function<CommandRegistry()> build;
};

// Every plugin the server can load, by name.
const std::vector<PluginDescriptor>& plugin_catalog();

// Builds the named plugins and combines them in the given order.
// Unknown names and grammar conflicts come back as std::nullopt + error.
std::optional<CommandRegistry> assemble_plugins(const std::vector<std::string>& names,
                                                std::string& error);

CommandRegistry basic_plugin();
CommandRegistry diagnostics_plugin();

// Spoken word -> key name as xdotool spells it ("alpha" -> "a").
const std::map<std::string, std::string>& pronunciation_to_key();
// Words a spoken number may use, "zero" to "ten".
const std::map<std::string, unsigned>& number_words();

// "control shift alpha" as matched by the chord rule -> "ctrl+shift+a".
std::string chord_to_keys(const Value& chord);

// Runs argv[0] from PATH and waits for it. Throws std::runtime_error if it
// cannot start or exits non-zero; kills it and throws OperationCancelled if
// the token is cancelled first.
void run_process(const std::vector<std::string>& argv, const CancellationToken& cancel);

}  // namespace voicecmd::server
