#include "server/plugins.hpp"

#include <algorithm>
#include <cctype>

namespace voicecmd::server {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

const std::vector<PluginDescriptor>& plugin_catalog() {
  static const std::vector<PluginDescriptor> catalog = {
      {"basic", "key presses, typing, alerts and speech", basic_plugin},
      {"diagnostics", "ping, echo and sleep for checking the server", diagnostics_plugin},
  };
  return catalog;
}

std::optional<CommandRegistry> assemble_plugins(const std::vector<std::string>& names,
                                                std::string& error) {
  const auto& catalog = plugin_catalog();
  std::vector<CommandRegistry> parts;
  try {
    for (const auto& name : names) {
      auto it = std::find_if(catalog.begin(), catalog.end(),
                             [&name](const PluginDescriptor& p) { return p.name == name; });
      if (it == catalog.end()) {
        error = "unknown plugin: " + name;
        return std::nullopt;
      }
      parts.push_back(it->build());
    }
    return CommandRegistry::combine(parts);
  } catch (const GrammarError& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

const std::map<std::string, std::string>& pronunciation_to_key() {
  static const std::map<std::string, std::string> table = [] {
    std::map<std::string, std::string> t;
    const char* nato[] = {"alpha", "bravo", "charlie", "delta", "echo", "foxtrot", "golf",
                          "hotel", "india", "juliet", "kilo", "lima", "mike", "november",
                          "oscar", "papa", "quebec", "romeo", "sierra", "tango", "uniform",
                          "victor", "whiskey", "xray", "yankee", "zulu"};
    for (const char* word : nato) t[word] = std::string(1, word[0]);
    for (const auto& entry : number_words()) {
      if (entry.second < 10) t[entry.first] = std::to_string(entry.second);
    }
    t["enter"] = "Return";
    t["escape"] = "Escape";
    t["tab"] = "Tab";
    t["space"] = "space";
    t["backspace"] = "BackSpace";
    t["delete"] = "Delete";
    t["home"] = "Home";
    t["end"] = "End";
    t["up"] = "Up";
    t["down"] = "Down";
    t["left"] = "Left";
    t["right"] = "Right";
    t["control"] = "ctrl";
    t["shift"] = "shift";
    t["alt"] = "alt";
    t["super"] = "super";
    return t;
  }();
  return table;
}

const std::map<std::string, unsigned>& number_words() {
  static const std::map<std::string, unsigned> words = {
      {"zero", 0}, {"one", 1}, {"two", 2}, {"three", 3}, {"four", 4}, {"five", 5},
      {"six", 6},  {"seven", 7}, {"eight", 8}, {"nine", 9}, {"ten", 10},
  };
  return words;
}

std::string chord_to_keys(const Value& chord) {
  const auto& table = pronunciation_to_key();
  std::string keys;
  for (const auto& part : chord.children) {
    auto it = table.find(lower(part.text));
    if (it == table.end()) continue;
    if (!keys.empty()) keys += '+';
    keys += it->second;
  }
  return keys;
}

}  // namespace voicecmd::server
