#include "server/registry.hpp"

#include <utility>

namespace voicecmd::server {

CommandSet::CommandSet(Grammar grammar, std::map<std::string, HandlerFn> handlers)
    : grammar_(std::move(grammar)), handlers_(std::move(handlers)) {}

std::optional<ParsedCommand> CommandSet::parse(const std::string& text) const {
  return grammar_.parse(text);
}

const HandlerFn* CommandSet::find_handler(const std::string& command) const {
  auto it = handlers_.find(command);
  if (it == handlers_.end()) return nullptr;
  return &it->second;
}

void CommandRegistry::define(const std::string& name, const std::string& body) {
  RuleEntry rule;
  rule.inline_single = !name.empty() && name.front() == '?';
  rule.name = rule.inline_single ? name.substr(1) : name;
  if (rule.name.empty()) throw GrammarError("rule name must not be empty");
  rule.body = body;
  rule.node = compile_pattern(body);
  add_rule(rule);
}

void CommandRegistry::add(const std::string& pattern, HandlerFn handler) {
  if (!handler) throw GrammarError("pattern " + pattern + " has no handler");
  add_command(CommandEntry{pattern, compile_pattern(pattern), std::move(handler)});
}

void CommandRegistry::add_rule(const RuleEntry& rule) {
  for (const auto& existing : rules_) {
    if (existing.name != rule.name) continue;
    if (existing.body == rule.body && existing.inline_single == rule.inline_single) return;
    throw GrammarError("rule '" + rule.name + "' defined differently by two sources");
  }
  rules_.push_back(rule);
}

void CommandRegistry::add_command(const CommandEntry& command) {
  for (const auto& existing : commands_) {
    if (existing.pattern == command.pattern) {
      throw GrammarError("pattern registered twice: " + command.pattern);
    }
  }
  commands_.push_back(command);
}

CommandRegistry CommandRegistry::combine(const std::vector<CommandRegistry>& parts) {
  CommandRegistry combined;
  for (const auto& part : parts) {
    for (const auto& rule : part.rules_) combined.add_rule(rule);
    for (const auto& command : part.commands_) combined.add_command(command);
  }
  return combined;
}

std::shared_ptr<const CommandSet> CommandRegistry::compile() const {
  std::vector<Grammar::Rule> rules;
  rules.reserve(rules_.size());
  for (const auto& rule : rules_) {
    rules.push_back(Grammar::Rule{rule.name, rule.inline_single, rule.node});
  }

  std::vector<Grammar::Command> commands;
  std::map<std::string, HandlerFn> handlers;
  for (const auto& command : commands_) {
    commands.push_back(Grammar::Command{command.pattern, command.node});
    handlers.emplace(command.pattern, command.handler);
  }
  return std::make_shared<const CommandSet>(Grammar(std::move(rules), std::move(commands)),
                                            std::move(handlers));
}

std::vector<std::string> CommandRegistry::patterns() const {
  std::vector<std::string> out;
  out.reserve(commands_.size());
  for (const auto& command : commands_) out.push_back(command.pattern);
  return out;
}

}  // namespace voicecmd::server
