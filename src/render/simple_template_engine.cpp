#include "docsandbox/render/simple_template_engine.hpp"

#include "docsandbox/common/clock.hpp"
#include "docsandbox/common/fs.hpp"
#include "docsandbox/common/json_util.hpp"

#include <cctype>
#include <deque>
#include <optional>
#include <sstream>
#include <vector>

namespace docsandbox::render {

namespace {

constexpr int MAX_DEPTH = 16;

using common::ErrorCode;
using common::Result;
using common::Status;

struct Token {
  enum class Type { Text, Variable, Statement };
  Type type = Type::Text;
  std::string content;
  std::size_t line = 1;
};

struct Node {
  enum class Kind { Text, Variable, Include, Block, If, For };
  Kind kind = Kind::Text;
  std::string text;
  std::string loop_var;
  bool negate = false;
  std::vector<Node> children;
  std::vector<Node> else_children;
};

struct ParsedTemplate {
  std::vector<Node> nodes;
  std::optional<std::string> parent;
};

Status syntax_error(const std::string &name, const std::size_t line, const std::string &message) {
  return Status::error(name + ":" + std::to_string(line) + ": " + message,
                       ErrorCode::TemplateError);
}

std::vector<std::string> split_words(const std::string &text) {
  std::istringstream stream(text);
  std::vector<std::string> words;
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

bool is_identifier_path(const std::string &value) {
  if (value.empty() || value.front() == '.' || value.back() == '.') {
    return false;
  }
  bool segment_start = true;
  for (const char ch : value) {
    const auto uch = static_cast<unsigned char>(ch);
    if (ch == '.') {
      if (segment_start) {
        return false;
      }
      segment_start = true;
      continue;
    }
    if (segment_start && std::isdigit(uch) != 0) {
      return false;
    }
    if (std::isalnum(uch) == 0 && ch != '_') {
      return false;
    }
    segment_start = false;
  }
  return true;
}

std::optional<std::string> unquote(const std::string &value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return std::nullopt;
}

std::size_t line_at(const std::string &source, const std::size_t offset) {
  std::size_t line = 1;
  for (std::size_t i = 0; i < offset && i < source.size(); ++i) {
    if (source[i] == '\n') {
      ++line;
    }
  }
  return line;
}

Result<std::vector<Token>> tokenize(const std::string &source, const std::string &name) {
  std::vector<Token> tokens;
  std::size_t pos = 0;
  while (pos < source.size()) {
    std::size_t open = source.find('{', pos);
    while (open != std::string::npos && open + 1 < source.size() && source[open + 1] != '{' &&
           source[open + 1] != '%' && source[open + 1] != '#') {
      open = source.find('{', open + 1);
    }
    if (open == std::string::npos || open + 1 >= source.size()) {
      tokens.push_back(Token{.type = Token::Type::Text, .content = source.substr(pos)});
      break;
    }
    if (open > pos) {
      tokens.push_back(
          Token{.type = Token::Type::Text, .content = source.substr(pos, open - pos)});
    }

    const char marker = source[open + 1];
    const std::string close = marker == '{' ? "}}" : (marker == '%' ? "%}" : "#}");
    const std::size_t line = line_at(source, open);
    const std::size_t end = source.find(close, open + 2);
    if (end == std::string::npos) {
      return Result<std::vector<Token>>::failure(
          syntax_error(name, line, std::string("unterminated tag '{") + marker + "'"));
    }
    pos = end + 2;
    if (marker == '#') {
      continue;
    }

    std::string content = common::trim(source.substr(open + 2, end - open - 2));
    if (!content.empty() && content.front() == '-') {
      content = common::trim(content.substr(1));
    }
    if (!content.empty() && content.back() == '-') {
      content = common::trim(content.substr(0, content.size() - 1));
    }
    if (content.empty()) {
      return Result<std::vector<Token>>::failure(syntax_error(name, line, "empty tag"));
    }
    tokens.push_back(Token{.type = marker == '{' ? Token::Type::Variable : Token::Type::Statement,
                           .content = std::move(content),
                           .line = line});
  }
  return Result<std::vector<Token>>::success(std::move(tokens));
}

std::vector<std::string> split_filters(const std::string &expression) {
  std::vector<std::string> parts;
  std::string current;
  char quote = '\0';
  for (const char ch : expression) {
    if (quote != '\0') {
      current.push_back(ch);
      if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      current.push_back(ch);
      continue;
    }
    if (ch == '|') {
      parts.push_back(common::trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  parts.push_back(common::trim(current));
  return parts;
}

Status check_expression(const std::string &expression, const std::string &name,
                        const std::size_t line) {
  const auto parts = split_filters(expression);
  if (!is_identifier_path(parts.front()) && !unquote(parts.front()).has_value()) {
    return syntax_error(name, line, "unsupported expression '" + parts.front() + "'");
  }
  for (std::size_t i = 1; i < parts.size(); ++i) {
    const std::string &filter = parts[i];
    if (filter == "upper" || filter == "lower" || filter == "trim" || filter == "length" ||
        filter == "escape" || filter == "e" || filter == "safe") {
      continue;
    }
    if (common::starts_with(filter, "default(") && filter.back() == ')' &&
        unquote(common::trim(filter.substr(8, filter.size() - 9))).has_value()) {
      continue;
    }
    return syntax_error(name, line, "unknown filter '" + filter + "'");
  }
  return Status::success();
}

class Parser {
public:
  Parser(const std::vector<Token> &tokens, std::string name)
      : tokens_(tokens), name_(std::move(name)) {}

  Result<ParsedTemplate> parse() {
    ParsedTemplate parsed;
    std::string terminator;
    auto status = parse_until(parsed.nodes, {}, terminator, &parsed.parent, 0);
    if (!status.ok()) {
      return Result<ParsedTemplate>::failure(status);
    }
    return Result<ParsedTemplate>::success(std::move(parsed));
  }

private:
  Status parse_until(std::vector<Node> &out, const std::vector<std::string> &terminators,
                     std::string &matched, std::optional<std::string> *parent,
                     const std::size_t opened_line) {
    while (index_ < tokens_.size()) {
      const Token &token = tokens_[index_++];
      if (token.type == Token::Type::Text) {
        out.push_back(Node{.kind = Node::Kind::Text, .text = token.content});
        continue;
      }
      if (token.type == Token::Type::Variable) {
        auto status = check_expression(token.content, name_, token.line);
        if (!status.ok()) {
          return status;
        }
        out.push_back(Node{.kind = Node::Kind::Variable, .text = token.content});
        continue;
      }

      const auto words = split_words(token.content);
      const std::string &keyword = words.front();
      for (const auto &terminator : terminators) {
        if (keyword == terminator) {
          matched = keyword;
          return Status::success();
        }
      }

      if (keyword == "include" || keyword == "extends") {
        const auto target = words.size() == 2 ? unquote(words[1]) : std::nullopt;
        if (!target.has_value() || target->empty()) {
          return syntax_error(name_, token.line, keyword + " expects a quoted file name");
        }
        if (keyword == "extends") {
          if (parent == nullptr) {
            return syntax_error(name_, token.line, "extends must appear at the top level");
          }
          if (parent->has_value()) {
            return syntax_error(name_, token.line, "template extends more than once");
          }
          *parent = *target;
        } else {
          out.push_back(Node{.kind = Node::Kind::Include, .text = *target});
        }
        continue;
      }

      if (keyword == "block") {
        if (words.size() != 2 || !is_identifier_path(words[1])) {
          return syntax_error(name_, token.line, "block expects a name");
        }
        Node node{.kind = Node::Kind::Block, .text = words[1]};
        std::string end;
        auto status = parse_until(node.children, {"endblock"}, end, nullptr, token.line);
        if (!status.ok()) {
          return status;
        }
        out.push_back(std::move(node));
        continue;
      }

      if (keyword == "if") {
        std::size_t first = 1;
        Node node{.kind = Node::Kind::If};
        if (words.size() == 3 && words[1] == "not") {
          node.negate = true;
          first = 2;
        }
        if (words.size() != first + 1 || !is_identifier_path(words[first])) {
          return syntax_error(name_, token.line, "if expects a variable name");
        }
        node.text = words[first];
        std::string end;
        auto status =
            parse_until(node.children, {"else", "endif"}, end, nullptr, token.line);
        if (!status.ok()) {
          return status;
        }
        if (end == "else") {
          status = parse_until(node.else_children, {"endif"}, end, nullptr, token.line);
          if (!status.ok()) {
            return status;
          }
        }
        out.push_back(std::move(node));
        continue;
      }

      if (keyword == "for") {
        if (words.size() != 4 || words[2] != "in" || !is_identifier_path(words[1]) ||
            words[1].find('.') != std::string::npos || !is_identifier_path(words[3])) {
          return syntax_error(name_, token.line, "for expects 'for item in list'");
        }
        Node node{.kind = Node::Kind::For, .text = words[3], .loop_var = words[1]};
        std::string end;
        auto status = parse_until(node.children, {"endfor"}, end, nullptr, token.line);
        if (!status.ok()) {
          return status;
        }
        out.push_back(std::move(node));
        continue;
      }

      if (keyword == "endblock" || keyword == "endif" || keyword == "endfor" ||
          keyword == "else") {
        return syntax_error(name_, token.line, "unexpected '" + keyword + "'");
      }
      return syntax_error(name_, token.line, "unknown statement '" + keyword + "'");
    }

    if (!terminators.empty()) {
      return syntax_error(name_, opened_line, "missing '" + terminators.back() + "'");
    }
    return Status::success();
  }

  const std::vector<Token> &tokens_;
  std::string name_;
  std::size_t index_ = 0;
};

Result<ParsedTemplate> parse_source(const std::string &source, const std::string &name) {
  auto tokens = tokenize(source, name);
  if (!tokens.ok()) {
    return Result<ParsedTemplate>::failure(tokens.status());
  }
  return Parser(tokens.value(), name).parse();
}

std::vector<std::string> split_json_array(const std::string &raw) {
  std::vector<std::string> items;
  if (raw.size() < 2 || raw.front() != '[') {
    return items;
  }
  std::size_t pos = 1;
  while (pos < raw.size()) {
    pos = common::json_skip_ws(raw, pos);
    if (pos >= raw.size() || raw[pos] == ']') {
      break;
    }
    if (raw[pos] == ',') {
      ++pos;
      continue;
    }
    if (raw[pos] == '"') {
      const auto end = common::json_find_string_end(raw, pos);
      if (end == std::string::npos) {
        break;
      }
      items.push_back(common::json_unescape(raw.substr(pos + 1, end - pos - 1)));
      pos = end + 1;
    } else if (raw[pos] == '{' || raw[pos] == '[') {
      const char open = raw[pos];
      const auto end = common::json_find_matching_token(raw, pos, open, open == '{' ? '}' : ']');
      if (end == std::string::npos) {
        break;
      }
      items.push_back(raw.substr(pos, end - pos + 1));
      pos = end + 1;
    } else {
      const std::size_t start = pos;
      while (pos < raw.size() && raw[pos] != ',' && raw[pos] != ']') {
        ++pos;
      }
      items.push_back(common::trim(raw.substr(start, pos - start)));
    }
  }
  return items;
}

bool is_truthy(const std::optional<std::string> &value) {
  if (!value.has_value()) {
    return false;
  }
  const std::string trimmed = common::trim(*value);
  return !(trimmed.empty() || trimmed == "false" || trimmed == "0" || trimmed == "null" ||
           trimmed == "[]" || trimmed == "{}");
}

std::string html_escape(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    switch (ch) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&#34;";
      break;
    case '\'':
      out += "&#39;";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

std::string to_upper(std::string value) {
  for (auto &ch : value) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  return value;
}

class Renderer {
public:
  Renderer(const TemplateBindings &bindings, std::optional<std::filesystem::path> root)
      : bindings_(bindings), root_(std::move(root)) {}

  Result<std::string> render_template(const std::string &source, const std::string &name,
                                      const int depth) {
    auto parsed = parse_source(source, name);
    if (!parsed.ok()) {
      return Result<std::string>::failure(parsed.status());
    }
    loaded_.push_back(std::move(parsed.value()));
    const ParsedTemplate *current = &loaded_.back();

    int chain = 0;
    while (current->parent.has_value()) {
      collect_blocks(current->nodes);
      if (!root_.has_value()) {
        return Result<std::string>::failure(
            "extends requires a template loader: " + *current->parent, ErrorCode::TemplateError);
      }
      if (++chain > MAX_DEPTH) {
        return Result<std::string>::failure("extends chain too deep in " + name,
                                            ErrorCode::TemplateError);
      }
      auto parent = load(*current->parent);
      if (!parent.ok()) {
        return Result<std::string>::failure(parent.status());
      }
      loaded_.push_back(std::move(parent.value()));
      current = &loaded_.back();
    }

    std::string out;
    auto status = render_nodes(current->nodes, out, depth);
    if (!status.ok()) {
      return Result<std::string>::failure(status);
    }
    return Result<std::string>::success(std::move(out));
  }

private:
  void collect_blocks(const std::vector<Node> &nodes) {
    for (const auto &node : nodes) {
      if (node.kind == Node::Kind::Block) {
        blocks_.try_emplace(node.text, &node.children);
      }
      collect_blocks(node.children);
      collect_blocks(node.else_children);
    }
  }

  Result<std::string> read_template(const std::string &name) const {
    auto path = common::resolve_within(*root_, name);
    if (!path.ok()) {
      return Result<std::string>::failure(path.status());
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path.value(), ec)) {
      return Result<std::string>::failure("template not found: " + name, ErrorCode::NotFound);
    }
    return common::read_text_file(path.value());
  }

  Result<ParsedTemplate> load(const std::string &name) const {
    auto source = read_template(name);
    if (!source.ok()) {
      return Result<ParsedTemplate>::failure(source.status());
    }
    return parse_source(source.value(), name);
  }

  std::optional<std::string> lookup(const std::string &path) const {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
      if (const auto found = it->find(path); found != it->end()) {
        return found->second;
      }
    }
    if (const auto found = bindings_.find(path); found != bindings_.end()) {
      return found->second;
    }
    return std::nullopt;
  }

  std::string evaluate(const std::string &expression) const {
    const auto parts = split_filters(expression);
    std::optional<std::string> value = unquote(parts.front());
    if (!value.has_value()) {
      value = lookup(parts.front());
    }
    for (std::size_t i = 1; i < parts.size(); ++i) {
      const std::string &filter = parts[i];
      if (common::starts_with(filter, "default(")) {
        if (!value.has_value() || value->empty()) {
          value = unquote(common::trim(filter.substr(8, filter.size() - 9)));
        }
        continue;
      }
      if (!value.has_value()) {
        continue;
      }
      if (filter == "upper") {
        value = to_upper(*value);
      } else if (filter == "lower") {
        value = common::to_lower(*value);
      } else if (filter == "trim") {
        value = common::trim(*value);
      } else if (filter == "length") {
        value = std::to_string(!value->empty() && value->front() == '['
                                   ? split_json_array(*value).size()
                                   : value->size());
      } else if (filter == "escape" || filter == "e") {
        value = html_escape(*value);
      }
    }
    return value.value_or("");
  }

  Status render_nodes(const std::vector<Node> &nodes, std::string &out, const int depth) {
    if (depth > MAX_DEPTH) {
      return Status::error("template nesting too deep", ErrorCode::TemplateError);
    }
    for (const auto &node : nodes) {
      Status status = Status::success();
      switch (node.kind) {
      case Node::Kind::Text:
        out += node.text;
        break;
      case Node::Kind::Variable:
        out += evaluate(node.text);
        break;
      case Node::Kind::Block: {
        const auto it = blocks_.find(node.text);
        status = render_nodes(it != blocks_.end() ? *it->second : node.children, out, depth + 1);
        break;
      }
      case Node::Kind::If: {
        const bool truthy = is_truthy(lookup(node.text));
        status = render_nodes(truthy != node.negate ? node.children : node.else_children, out,
                              depth + 1);
        break;
      }
      case Node::Kind::For:
        status = render_loop(node, out, depth);
        break;
      case Node::Kind::Include:
        status = render_include(node.text, out, depth);
        break;
      }
      if (!status.ok()) {
        return status;
      }
    }
    return Status::success();
  }

  Status render_loop(const Node &node, std::string &out, const int depth) {
    const auto items = split_json_array(lookup(node.text).value_or(""));
    for (std::size_t index = 0; index < items.size(); ++index) {
      TemplateBindings scope;
      scope[node.loop_var] = items[index];
      if (!items[index].empty() && items[index].front() == '{') {
        for (const auto &[key, value] : common::json_flatten_object(items[index])) {
          scope[node.loop_var + "." + key] = value;
        }
      }
      scope["loop.index"] = std::to_string(index + 1);
      scope["loop.first"] = index == 0 ? "true" : "false";
      scope["loop.last"] = index + 1 == items.size() ? "true" : "false";
      scope["loop.length"] = std::to_string(items.size());

      scopes_.push_back(std::move(scope));
      auto status = render_nodes(node.children, out, depth + 1);
      scopes_.pop_back();
      if (!status.ok()) {
        return status;
      }
    }
    return Status::success();
  }

  Status render_include(const std::string &name, std::string &out, const int depth) {
    if (!root_.has_value()) {
      return Status::error("include requires a template loader: " + name,
                           ErrorCode::TemplateError);
    }
    auto source = read_template(name);
    if (!source.ok()) {
      return source.status();
    }
    Renderer nested(bindings_, root_);
    nested.scopes_ = scopes_;
    auto rendered = nested.render_template(source.value(), name, depth + 1);
    if (!rendered.ok()) {
      return rendered.status();
    }
    out += rendered.value();
    return Status::success();
  }

  const TemplateBindings &bindings_;
  std::optional<std::filesystem::path> root_;
  std::vector<TemplateBindings> scopes_;
  std::deque<ParsedTemplate> loaded_;
  std::unordered_map<std::string, const std::vector<Node> *> blocks_;
};

} // namespace

SimpleTemplateEngine::SimpleTemplateEngine(const bool inject_now) : inject_now_(inject_now) {}

TemplateBindings SimpleTemplateEngine::prepare(const TemplateBindings &bindings) const {
  TemplateBindings context = bindings;
  if (inject_now_ && !context.contains("now")) {
    context["now"] = common::now_rfc3339();
  }
  return context;
}

common::Result<std::string>
SimpleTemplateEngine::render_file(const std::filesystem::path &main_file,
                                  const TemplateBindings &bindings,
                                  const std::filesystem::path &workspace_root) const {
  const auto relative = main_file.lexically_normal().lexically_relative(
      workspace_root.lexically_normal());
  if (relative.empty() || *relative.begin() == "..") {
    return Result<std::string>::failure("main file is outside the template root: " +
                                            main_file.string(),
                                        ErrorCode::NotFound);
  }
  auto source = common::read_text_file(main_file);
  if (!source.ok()) {
    return source;
  }
  const auto context = prepare(bindings);
  Renderer renderer(context, workspace_root);
  return renderer.render_template(source.value(), relative.generic_string(), 0);
}

common::Result<std::string> SimpleTemplateEngine::render_string(const std::string &source,
                                                                const TemplateBindings &bindings) const {
  const auto context = prepare(bindings);
  Renderer renderer(context, std::nullopt);
  return renderer.render_template(source, "<string>", 0);
}

common::Status SimpleTemplateEngine::validate(const std::string &source) const {
  auto parsed = parse_source(source, "<string>");
  if (!parsed.ok()) {
    return parsed.status();
  }
  return Status::success();
}

} // namespace docsandbox::render
