#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace voicecmd::server {

class GrammarError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// One matched rule reference. "control + alpha" against the chord rule comes
// out as chord{modifier "control", key "alpha"}.
struct Value {
  std::string rule;
  std::string text;
  std::vector<Value> children;
};

using Arguments = std::vector<Value>;

struct ParsedCommand {
  std::string command;  // the pattern the text matched
  Arguments args;
};

struct PatternNode {
  enum class Kind { Literal, Regex, Reference, Sequence, Choice, Repeat };

  Kind kind{Kind::Sequence};
  std::string text;  // literal text, regex source or rule name
  std::regex regex;
  std::vector<std::shared_ptr<const PatternNode>> children;
  std::size_t min{0};
  std::size_t max{0};  // Repeat only; 0 means unbounded
};

using PatternPtr = std::shared_ptr<const PatternNode>;

// Pattern syntax:
//   expr := seq ("|" seq)*        seq  := item*
//   item := atom ("*" | "+" | "?")?
//   atom := "literal" | /regex/ | name | ( expr ) | [ expr ]
// Throws GrammarError on malformed input.
PatternPtr compile_pattern(const std::string& source);

// Rules and command patterns compiled together. Immutable once built, so a
// single instance is shared by every connection without locking.
class Grammar {
 public:
  struct Rule {
    std::string name;
    bool inline_single{false};  // "?name": stands for its only child value
    PatternPtr body;
  };

  struct Command {
    std::string id;
    PatternPtr pattern;
  };

  // Throws GrammarError when a pattern refers to an undefined rule.
  Grammar(std::vector<Rule> rules, std::vector<Command> commands);

  // The first command, in registration order, whose pattern covers the whole
  // text. Whitespace between pattern elements is ignored.
  std::optional<ParsedCommand> parse(const std::string& text) const;

  std::size_t command_count() const { return commands_.size(); }
  std::size_t rule_count() const { return rules_.size(); }

 private:
  friend class Matcher;

  void check_references(const PatternNode& node, const std::string& owner) const;

  std::vector<Rule> rules_;
  std::map<std::string, std::size_t> rule_index_;
  std::vector<Command> commands_;
};

}  // namespace voicecmd::server
