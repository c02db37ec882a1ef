#include <chrono>
#include <string>
#include <vector>

#include "common/codec.hpp"
#include "server/grammar.hpp"
#include "server/plugins.hpp"
#include "server/registry.hpp"
#include "test_support.hpp"

using voicecmd::server::Arguments;
using voicecmd::server::CancellationToken;
using voicecmd::server::CommandRegistry;
using voicecmd::server::GrammarError;
using voicecmd::testing::TestRunner;

namespace {

void noop(const Arguments&, const CancellationToken&) {}

bool throws_grammar_error(void (*fn)()) {
  try {
    fn();
  } catch (const GrammarError&) {
    return true;
  }
  return false;
}

}  // namespace

int main() {
  TestRunner tr("grammar");

  // Malformed patterns are rejected when registered.
  {
    tr.expect(throws_grammar_error([] { voicecmd::server::compile_pattern("\"say"); }),
              "unterminated literal");
    tr.expect(throws_grammar_error([] { voicecmd::server::compile_pattern("(\"a\""); }),
              "unclosed group");
    tr.expect(throws_grammar_error([] { voicecmd::server::compile_pattern("\"\""); }),
              "empty literal");
    tr.expect(throws_grammar_error([] { voicecmd::server::compile_pattern("/[/"); }),
              "bad regex");
    tr.expect(throws_grammar_error([] { voicecmd::server::compile_pattern(""); }),
              "empty pattern");
    tr.expect(throws_grammar_error([] { voicecmd::server::compile_pattern("\"a\" )"); }),
              "stray parenthesis");
  }

  // Literals: whole text, whitespace and case insensitive, word boundaries.
  {
    CommandRegistry registry;
    registry.add("\"ping\"", noop);
    auto commands = registry.compile();
    tr.expect(commands->parse("ping").has_value(), "literal matches");
    tr.expect(commands->parse("  PING \r").has_value(), "literal ignores case and spaces");
    tr.expect(!commands->parse("pingx").has_value(), "literal respects word boundary");
    tr.expect(!commands->parse("ping pong").has_value(), "whole text must match");
    tr.expect(!commands->parse("").has_value(), "empty text matches nothing");
  }

  // Chords through the basic plugin's rules.
  {
    auto commands = voicecmd::server::basic_plugin().compile();
    auto parsed = commands->parse("say control + alpha");
    tr.expect(parsed.has_value(), "chord with plus parses");
    if (parsed) {
      tr.expect(parsed->command == "\"say\" chord", "command id is the pattern");
      tr.expect(parsed->args.size() == 1 && parsed->args[0].rule == "chord", "one chord value");
      tr.expect(voicecmd::server::chord_to_keys(parsed->args[0]) == "ctrl+a",
                "chord maps to ctrl+a");
    }

    parsed = commands->parse("say shift alt bravo");
    tr.expect(parsed && voicecmd::server::chord_to_keys(parsed->args[0]) == "shift+alt+b",
              "modifiers without plus");

    parsed = commands->parse("say enter");
    tr.expect(parsed && voicecmd::server::chord_to_keys(parsed->args[0]) == "Return",
              "named key");

    parsed = commands->parse("switch three");
    tr.expect(parsed && parsed->command == "\"switch\" chord", "switch command");

    parsed = commands->parse("alert hello   world");
    tr.expect(parsed.has_value(), "free text command parses");
    if (parsed) {
      tr.expect(parsed->args.size() == 1 && parsed->args[0].rule == "any_text",
                "free text value");
      tr.expect(parsed->args[0].text == "hello   world", "free text kept verbatim");
    }

    tr.expect(!commands->parse("say").has_value(), "missing chord");
    tr.expect(!commands->parse("say gibberish").has_value(), "unknown key");
    tr.expect(commands->parse("fail").has_value(), "fail command parses");
  }

  // Sub-rule values nest.
  {
    CommandRegistry registry;
    registry.define("item", "/[a-z]+/");
    registry.define("items", "item (\",\" item)*");
    registry.add("\"buy\" items", noop);
    auto parsed = registry.compile()->parse("buy milk, eggs,bread");
    tr.expect(parsed.has_value(), "list parses");
    if (parsed) {
      const auto& items = parsed->args.at(0);
      tr.expect(items.rule == "items" && items.children.size() == 3, "three items");
      tr.expect(items.children.size() == 3 && items.children[2].text == "bread", "last item");
    }
  }

  // A chord as long as the largest frame parses in linear time.
  {
    auto commands = voicecmd::server::basic_plugin().compile();
    std::string text = "say";
    const std::size_t modifiers = 2000;
    for (std::size_t i = 0; i < modifiers; ++i) text += " control";
    text += " alpha";
    tr.expect(text.size() <= voicecmd::kDefaultMaxFrameLength, "chord fits in one frame");

    auto started = std::chrono::steady_clock::now();
    auto parsed = commands->parse(text);
    auto took = std::chrono::steady_clock::now() - started;
    tr.expect(parsed.has_value(), "long chord parses");
    tr.expect(parsed && parsed->args.size() == 1 &&
                  parsed->args[0].children.size() == modifiers + 1,
              "every modifier kept in order");
    tr.expect(parsed && parsed->args[0].children.back().rule == "key" &&
                  parsed->args[0].children.back().text == "alpha",
              "key comes last");
    tr.expect(took < std::chrono::milliseconds(500), "long chord parses quickly");
  }

  // Optional parts and alternatives.
  {
    CommandRegistry registry;
    registry.add("\"go\" [\"to\"] (\"left\" | \"right\")", noop);
    auto commands = registry.compile();
    tr.expect(commands->parse("go left").has_value(), "optional omitted");
    tr.expect(commands->parse("go to right").has_value(), "optional present");
    tr.expect(!commands->parse("go up").has_value(), "alternative not listed");
  }

  // References to undefined rules fail at compile time.
  {
    CommandRegistry registry;
    registry.add("\"open\" nowhere", noop);
    bool threw = false;
    try {
      registry.compile();
    } catch (const GrammarError&) {
      threw = true;
    }
    tr.expect(threw, "undefined rule rejected");
  }

  // Left recursion terminates.
  {
    CommandRegistry registry;
    registry.define("list", "list \",\" word | word");
    registry.define("word", "/[a-z]+/");
    registry.add("\"go\" list", noop);
    auto commands = registry.compile();
    tr.expect(commands->parse("go a").has_value(), "left-recursive rule base case");
    commands->parse("go a,b");
    tr.expect(true, "left-recursive rule returns");
  }

  // The earliest registration wins when several patterns match.
  {
    CommandRegistry registry;
    registry.define("?any_text", "/\\S.*/");
    registry.add("\"open\" any_text", noop);
    registry.add("\"open\" \"door\"", noop);
    auto parsed = registry.compile()->parse("open door");
    tr.expect(parsed && parsed->command == "\"open\" any_text", "first registered wins");
  }

  // Combining disjoint registries recognizes both.
  {
    CommandRegistry first;
    first.add("\"ping\"", noop);
    CommandRegistry second;
    second.define("word", "/[a-z]+/");
    second.add("\"echo\" word", noop);
    auto combined = CommandRegistry::combine({first, second});
    tr.expect(combined.size() == 2, "combined size");
    auto commands = combined.compile();
    tr.expect(commands->parse("ping").has_value(), "first source recognized");
    tr.expect(commands->parse("echo hi").has_value(), "second source recognized");
    tr.expect(commands->find_handler("\"ping\"") != nullptr, "handler for first source");
    tr.expect(commands->find_handler("\"echo\" word") != nullptr, "handler for second source");
  }

  // Duplicate pattern ids are rejected.
  {
    CommandRegistry first;
    first.add("\"ping\"", noop);
    CommandRegistry second;
    second.add("\"ping\"", noop);
    bool threw = false;
    try {
      CommandRegistry::combine({first, second});
    } catch (const GrammarError&) {
      threw = true;
    }
    tr.expect(threw, "duplicate pattern across sources rejected");

    bool threw_same = false;
    try {
      first.add("\"ping\"", noop);
    } catch (const GrammarError&) {
      threw_same = true;
    }
    tr.expect(threw_same, "duplicate pattern in one source rejected");
  }

  // Shared rules must agree.
  {
    CommandRegistry first;
    first.define("word", "/[a-z]+/");
    CommandRegistry same;
    same.define("word", "/[a-z]+/");
    CommandRegistry different;
    different.define("word", "/[0-9]+/");

    bool same_ok = true;
    try {
      CommandRegistry::combine({first, same});
    } catch (const GrammarError&) {
      same_ok = false;
    }
    tr.expect(same_ok, "identical shared rule accepted");

    bool threw = false;
    try {
      CommandRegistry::combine({first, different});
    } catch (const GrammarError&) {
      threw = true;
    }
    tr.expect(threw, "conflicting shared rule rejected");
  }

  // The plugin catalog.
  {
    std::string error;
    auto registry = voicecmd::server::assemble_plugins({"basic", "diagnostics"}, error);
    tr.expect(registry.has_value(), "basic + diagnostics assemble: " + error);
    if (registry) {
      auto commands = registry->compile();
      tr.expect(commands->parse("ping").has_value(), "diagnostics command");
      tr.expect(commands->parse("monitor").has_value(), "basic command");
      auto parsed = commands->parse("sleep five");
      tr.expect(parsed && parsed->args.at(0).text == "five", "number word argument");
      parsed = commands->parse("sleep 12");
      tr.expect(parsed && parsed->args.at(0).text == "12", "number digits argument");
    }

    auto missing = voicecmd::server::assemble_plugins({"basic", "nope"}, error);
    tr.expect(!missing.has_value(), "unknown plugin rejected");
    tr.expect(error.find("nope") != std::string::npos, "error names the plugin");
  }

  return tr.exit_code();
}
