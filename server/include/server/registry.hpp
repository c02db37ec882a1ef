#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "server/grammar.hpp"
#include "server/task_scope.hpp"

namespace voicecmd::server {

// Runs on a worker thread. Side effects only; report failure by throwing.
using HandlerFn = std::function<void(const Arguments&, const CancellationToken&)>;

// Compiled, read-only view of one or more registries.
class CommandSet {
 public:
  CommandSet(Grammar grammar, std::map<std::string, HandlerFn> handlers);

  std::optional<ParsedCommand> parse(const std::string& text) const;
  // nullptr when no pattern has this id.
  const HandlerFn* find_handler(const std::string& command) const;

  std::size_t size() const { return handlers_.size(); }

 private:
  Grammar grammar_;
  std::map<std::string, HandlerFn> handlers_;
};

// Collects rule definitions and (pattern, handler) registrations from one
// source. Several registries are merged with combine() and then compiled
// once; registration is over after compile().
class CommandRegistry {
 public:
  // `name` may start with '?' to inline single-valued matches.
  void define(const std::string& name, const std::string& body);
  void add(const std::string& pattern, HandlerFn handler);

  // Merges in order. A pattern registered by two sources is an error; a rule
  // defined by two sources must have the same definition in both.
  static CommandRegistry combine(const std::vector<CommandRegistry>& parts);

  // Throws GrammarError when a pattern refers to an undefined rule.
  std::shared_ptr<const CommandSet> compile() const;

  std::size_t size() const { return commands_.size(); }
  std::vector<std::string> patterns() const;

 private:
  struct RuleEntry {
    std::string name;  // without the '?' marker
    bool inline_single{false};
    std::string body;
    PatternPtr node;
  };

  struct CommandEntry {
    std::string pattern;
    PatternPtr node;
    HandlerFn handler;
  };

  void add_rule(const RuleEntry& rule);
  void add_command(const CommandEntry& command);

  std::vector<RuleEntry> rules_;
  std::vector<CommandEntry> commands_;
};

}  // namespace voicecmd::server
