#include "server/grammar.hpp"

#include <cctype>
#include <set>
#include <utility>

namespace voicecmd::server {
namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_word(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_name_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::size_t skip_space(const std::string& s, std::size_t pos) {
  while (pos < s.size() && is_space(s[pos])) ++pos;
  return pos;
}

PatternPtr make_node(PatternNode::Kind kind, std::string text = {}) {
  auto node = std::make_shared<PatternNode>();
  node->kind = kind;
  node->text = std::move(text);
  return node;
}

// Recursive descent over the pattern source.
class PatternParser {
 public:
  explicit PatternParser(const std::string& src) : src_(src) {}

  PatternPtr parse() {
    PatternPtr node = parse_expr();
    pos_ = skip_space(src_, pos_);
    if (pos_ != src_.size()) fail("unexpected '" + std::string(1, src_[pos_]) + "'");
    return node;
  }

 private:
  [[noreturn]] void fail(const std::string& what) const {
    throw GrammarError("pattern '" + src_ + "' at offset " + std::to_string(pos_) + ": " + what);
  }

  bool peek(char c) {
    pos_ = skip_space(src_, pos_);
    return pos_ < src_.size() && src_[pos_] == c;
  }

  PatternPtr parse_expr() {
    std::vector<PatternPtr> alternatives{parse_seq()};
    while (peek('|')) {
      ++pos_;
      alternatives.push_back(parse_seq());
    }
    if (alternatives.size() == 1) return alternatives.front();
    auto node = std::make_shared<PatternNode>();
    node->kind = PatternNode::Kind::Choice;
    node->children = std::move(alternatives);
    return node;
  }

  PatternPtr parse_seq() {
    std::vector<PatternPtr> items;
    while (true) {
      pos_ = skip_space(src_, pos_);
      if (pos_ >= src_.size()) break;
      char c = src_[pos_];
      if (c == '|' || c == ')' || c == ']') break;
      items.push_back(parse_item());
    }
    if (items.empty()) fail("empty expression");
    if (items.size() == 1) return items.front();
    auto node = std::make_shared<PatternNode>();
    node->kind = PatternNode::Kind::Sequence;
    node->children = std::move(items);
    return node;
  }

  PatternPtr parse_item() {
    PatternPtr atom = parse_atom();
    std::size_t min = 0;
    std::size_t max = 0;
    if (pos_ < src_.size() && src_[pos_] == '*') {
      min = 0;
      max = 0;
    } else if (pos_ < src_.size() && src_[pos_] == '+') {
      min = 1;
      max = 0;
    } else if (pos_ < src_.size() && src_[pos_] == '?') {
      min = 0;
      max = 1;
    } else {
      return atom;
    }
    ++pos_;
    return make_repeat(std::move(atom), min, max);
  }

  static PatternPtr make_repeat(PatternPtr child, std::size_t min, std::size_t max) {
    auto node = std::make_shared<PatternNode>();
    node->kind = PatternNode::Kind::Repeat;
    node->children.push_back(std::move(child));
    node->min = min;
    node->max = max;
    return node;
  }

  PatternPtr parse_atom() {
    pos_ = skip_space(src_, pos_);
    char c = src_[pos_];
    if (c == '"') return parse_delimited('"', PatternNode::Kind::Literal);
    if (c == '/') return parse_delimited('/', PatternNode::Kind::Regex);
    if (c == '(' || c == '[') {
      const char close = c == '(' ? ')' : ']';
      ++pos_;
      PatternPtr inner = parse_expr();
      if (!peek(close)) fail(std::string("expected '") + close + "'");
      ++pos_;
      return close == ']' ? make_repeat(std::move(inner), 0, 1) : inner;
    }
    if (is_name_start(c)) {
      std::size_t start = pos_;
      while (pos_ < src_.size() && is_word(src_[pos_])) ++pos_;
      return make_node(PatternNode::Kind::Reference, src_.substr(start, pos_ - start));
    }
    fail("unexpected '" + std::string(1, c) + "'");
  }

  // "..." literal or /.../ regex; a backslash escapes the delimiter.
  PatternPtr parse_delimited(char delim, PatternNode::Kind kind) {
    ++pos_;
    std::string body;
    while (pos_ < src_.size() && src_[pos_] != delim) {
      if (src_[pos_] == '\\' && pos_ + 1 < src_.size() && src_[pos_ + 1] == delim) {
        ++pos_;
      }
      body.push_back(src_[pos_++]);
    }
    if (pos_ >= src_.size()) fail(std::string("unterminated ") + delim);
    ++pos_;
    if (body.empty()) fail("empty literal");

    auto node = std::make_shared<PatternNode>();
    node->kind = kind;
    node->text = body;
    if (kind == PatternNode::Kind::Regex) {
      try {
        node->regex = std::regex(body, std::regex::ECMAScript);
      } catch (const std::regex_error& ex) {
        fail("bad regex /" + body + "/: " + ex.what());
      }
    }
    return node;
  }

  const std::string& src_;
  std::size_t pos_{0};
};

}  // namespace

PatternPtr compile_pattern(const std::string& source) {
  return PatternParser(source).parse();
}

// Matching state for a single parse. Every node yields the set of end
// offsets it can reach from a start offset, keeping the first value list per
// end. Rule results are memoized per offset, and a rule re-entered at the same
// offset fails instead of recursing, so left-recursive rules terminate.
//
// Values collected while matching are kept as a persistent rope of rule hits:
// extending a partial match shares its prefix instead of copying it, and
// Value objects are built only for the parse that wins.
class Matcher {
 public:
  struct Hit;
  struct Seg;
  using SegPtr = std::shared_ptr<const Seg>;

  struct Hit {
    const Grammar::Rule* rule;
    std::size_t start;
    std::size_t end;
    SegPtr children;
  };

  // Leaf when `hit` is set, otherwise the concatenation left ++ right.
  struct Seg {
    std::shared_ptr<const Hit> hit;
    SegPtr left;
    SegPtr right;
    std::size_t count;
  };

  struct Match {
    std::size_t end;
    SegPtr values;  // null when the match produced no values
  };
  using Matches = std::vector<Match>;

  Matcher(const Grammar& grammar, const std::string& text) : grammar_(grammar), text_(text) {}

  Matches match(const PatternNode& node, std::size_t pos) {
    switch (node.kind) {
      case PatternNode::Kind::Literal:
        return match_literal(node, pos);
      case PatternNode::Kind::Regex:
        return match_regex(node, pos);
      case PatternNode::Kind::Reference:
        return match_reference(node, pos);
      case PatternNode::Kind::Sequence:
        return match_sequence(node, pos);
      case PatternNode::Kind::Choice: {
        Matches out;
        for (const auto& child : node.children) {
          add_all(out, match(*child, pos));
        }
        return out;
      }
      case PatternNode::Kind::Repeat:
        return match_repeat(node, pos);
    }
    return {};
  }

  Arguments materialize(const SegPtr& values) const {
    Arguments out;
    if (!values) return out;
    out.reserve(values->count);
    std::vector<const Seg*> pending{values.get()};
    while (!pending.empty()) {
      const Seg* seg = pending.back();
      pending.pop_back();
      if (seg->hit) {
        const Hit& hit = *seg->hit;
        Value value;
        value.rule = hit.rule->name;
        value.text = hit.end > hit.start ? text_.substr(hit.start, hit.end - hit.start)
                                         : std::string();
        value.children = materialize(hit.children);
        out.push_back(std::move(value));
        continue;
      }
      pending.push_back(seg->right.get());
      pending.push_back(seg->left.get());
    }
    return out;
  }

 private:
  static std::size_t count_of(const SegPtr& seg) { return seg ? seg->count : 0; }

  static SegPtr concat(const SegPtr& left, const SegPtr& right) {
    if (!left) return right;
    if (!right) return left;
    return std::make_shared<Seg>(Seg{nullptr, left, right, left->count + right->count});
  }

  static void add(Matches& out, Match m) {
    for (const auto& existing : out) {
      if (existing.end == m.end) return;
    }
    out.push_back(std::move(m));
  }

  static void add_all(Matches& out, Matches more) {
    for (auto& m : more) add(out, std::move(m));
  }

  Matches match_literal(const PatternNode& node, std::size_t pos) {
    pos = skip_space(text_, pos);
    const std::string& lit = node.text;
    if (text_.size() - pos < lit.size()) return {};
    for (std::size_t i = 0; i < lit.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(text_[pos + i])) !=
          std::tolower(static_cast<unsigned char>(lit[i]))) {
        return {};
      }
    }
    std::size_t end = pos + lit.size();
    // "say" must not match the front of "saying".
    if (is_word(lit.back()) && end < text_.size() && is_word(text_[end])) return {};
    return {Match{end, nullptr}};
  }

  Matches match_regex(const PatternNode& node, std::size_t pos) {
    pos = skip_space(text_, pos);
    std::smatch m;
    auto first = text_.begin() + static_cast<std::ptrdiff_t>(pos);
    if (!std::regex_search(first, text_.end(), m, node.regex,
                           std::regex_constants::match_continuous)) {
      return {};
    }
    if (m.length(0) == 0) return {};
    return {Match{pos + static_cast<std::size_t>(m.length(0)), nullptr}};
  }

  Matches match_reference(const PatternNode& node, std::size_t pos) {
    const std::size_t index = grammar_.rule_index_.at(node.text);
    const auto key = std::make_pair(index, pos);
    auto cached = memo_.find(key);
    if (cached != memo_.end()) return cached->second;
    if (!active_.insert(key).second) return {};

    const Grammar::Rule& rule = grammar_.rules_[index];
    const std::size_t start = skip_space(text_, pos);
    Matches out;
    for (auto& m : match(*rule.body, pos)) {
      if (rule.inline_single && count_of(m.values) == 1) {
        out.push_back(std::move(m));
        continue;
      }
      auto hit = std::make_shared<Hit>(Hit{&rule, start, m.end, std::move(m.values)});
      out.push_back(Match{m.end, std::make_shared<Seg>(Seg{std::move(hit), nullptr,
                                                                 nullptr, 1})});
    }

    active_.erase(key);
    memo_.emplace(key, out);
    return out;
  }

  Matches match_sequence(const PatternNode& node, std::size_t pos) {
    Matches partial{Match{pos, nullptr}};
    for (const auto& child : node.children) {
      Matches next;
      for (const auto& p : partial) {
        for (auto& m : match(*child, p.end)) {
          add(next, Match{m.end, concat(p.values, m.values)});
        }
      }
      if (next.empty()) return {};
      partial = std::move(next);
    }
    return partial;
  }

  Matches match_repeat(const PatternNode& node, std::size_t pos) {
    const PatternNode& child = *node.children.front();
    Matches out;
    std::set<std::size_t> ends;
    Matches frontier{Match{pos, nullptr}};
    if (node.min == 0) {
      out = frontier;
      ends.insert(pos);
    }

    std::size_t count = 0;
    while (!frontier.empty() && (node.max == 0 || count < node.max)) {
      ++count;
      Matches next;
      for (const auto& p : frontier) {
        for (auto& m : match(child, p.end)) {
          // An iteration that consumes nothing would repeat forever.
          if (m.end == p.end) continue;
          add(next, Match{m.end, concat(p.values, m.values)});
        }
      }
      if (count >= node.min) {
        for (const auto& m : next) {
          if (ends.insert(m.end).second) out.push_back(m);
        }
      }
      frontier = std::move(next);
    }
    return out;
  }

  const Grammar& grammar_;
  const std::string& text_;
  std::map<std::pair<std::size_t, std::size_t>, Matches> memo_;
  std::set<std::pair<std::size_t, std::size_t>> active_;
};

Grammar::Grammar(std::vector<Rule> rules, std::vector<Command> commands)
    : rules_(std::move(rules)), commands_(std::move(commands)) {
  for (std::size_t i = 0; i < rules_.size(); ++i) {
    if (!rule_index_.emplace(rules_[i].name, i).second) {
      throw GrammarError("rule defined twice: " + rules_[i].name);
    }
  }
  for (const auto& rule : rules_) {
    check_references(*rule.body, "rule " + rule.name);
  }
  for (const auto& command : commands_) {
    check_references(*command.pattern, "pattern " + command.id);
  }
}

void Grammar::check_references(const PatternNode& node, const std::string& owner) const {
  if (node.kind == PatternNode::Kind::Reference && rule_index_.count(node.text) == 0) {
    throw GrammarError(owner + " refers to undefined rule '" + node.text + "'");
  }
  for (const auto& child : node.children) {
    check_references(*child, owner);
  }
}

std::optional<ParsedCommand> Grammar::parse(const std::string& text) const {
  Matcher matcher(*this, text);
  for (const auto& command : commands_) {
    for (auto& m : matcher.match(*command.pattern, 0)) {
      if (skip_space(text, m.end) == text.size()) {
        return ParsedCommand{command.id, matcher.materialize(m.values)};
      }
    }
  }
  return std::nullopt;
}

}  // namespace voicecmd::server
