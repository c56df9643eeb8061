#include "gdbsession/mi/mi_codec.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>

#include "gdbsession/mi/hex.hpp"

namespace gdbsession::mi {

namespace {

bool is_safe_parameter_char(char c) {
  if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
    return true;
  }
  switch (c) {
  case '_':
  case '.':
  case ':':
  case '/':
  case '+':
  case '-':
  case '*':
  case '&':
  case '$':
  case '@':
  case '[':
  case ']':
    return true;
  default:
    return false;
  }
}

bool is_variable_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

class cursor {
public:
  explicit cursor(std::string_view text) : text_(text) {}

  bool done() const { return pos_ >= text_.size(); }
  char peek() const { return done() ? '\0' : text_[pos_]; }
  void advance() { ++pos_; }

  bool consume(char c) {
    if (peek() != c || done()) {
      return false;
    }
    ++pos_;
    return true;
  }

  // Parses the body of a c-string; the cursor must sit on the opening quote.
  std::optional<std::string> c_string() {
    if (!consume('"')) {
      return std::nullopt;
    }
    std::string out;
    while (!done()) {
      char c = text_[pos_++];
      if (c == '"') {
        return out;
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (done()) {
        return std::nullopt;
      }
      char e = text_[pos_++];
      switch (e) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 'a':
        out.push_back('\a');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'v':
        out.push_back('\v');
        break;
      case 'e':
        out.push_back('\x1b');
        break;
      default:
        if (e >= '0' && e <= '7') {
          int value = e - '0';
          for (int digits = 1; digits < 3 && !done() && peek() >= '0' && peek() <= '7'; ++digits) {
            value = value * 8 + (text_[pos_++] - '0');
          }
          out.push_back(static_cast<char>(value & 0xff));
        } else {
          out.push_back(e);
        }
        break;
      }
    }
    return std::nullopt;
  }

  std::optional<std::string> variable() {
    size_t start = pos_;
    while (!done() && is_variable_char(peek())) {
      ++pos_;
    }
    if (pos_ == start) {
      return std::nullopt;
    }
    return std::string(text_.substr(start, pos_ - start));
  }

  bool value(mi_value& out, size_t depth) {
    if (depth > k_max_nesting) {
      return false;
    }
    char c = peek();
    if (c == '"') {
      auto text = c_string();
      if (!text) {
        return false;
      }
      out.type = mi_value::kind::string;
      out.text = std::move(*text);
      return true;
    }
    if (c == '{') {
      advance();
      out.type = mi_value::kind::tuple;
      if (consume('}')) {
        return true;
      }
      if (!results(out.items, depth + 1)) {
        return false;
      }
      return consume('}');
    }
    if (c == '[') {
      advance();
      out.type = mi_value::kind::list;
      if (consume(']')) {
        return true;
      }
      char first = peek();
      if (first == '"' || first == '{' || first == '[') {
        do {
          mi_result item;
          if (!value(item.value, depth + 1)) {
            return false;
          }
          out.items.push_back(std::move(item));
        } while (consume(','));
      } else if (!results(out.items, depth + 1)) {
        return false;
      }
      return consume(']');
    }
    return false;
  }

  bool result(mi_result& out, size_t depth) {
    auto name = variable();
    if (!name || !consume('=')) {
      return false;
    }
    out.name = std::move(*name);
    return value(out.value, depth);
  }

  bool results(mi_results& out, size_t depth) {
    do {
      mi_result item;
      if (!result(item, depth)) {
        return false;
      }
      out.push_back(std::move(item));
    } while (consume(','));
    return true;
  }

  // Parses the `("," result)*` tail of a result or async record.
  bool trailing_results(mi_results& out) {
    while (consume(',')) {
      mi_result item;
      if (!result(item, 0)) {
        return false;
      }
      out.push_back(std::move(item));
    }
    return done();
  }

  std::string class_name() {
    size_t start = pos_;
    while (!done() && peek() != ',') {
      ++pos_;
    }
    return std::string(text_.substr(start, pos_ - start));
  }

private:
  std::string_view text_;
  size_t pos_ = 0;
};

std::optional<result_class> parse_result_class(std::string_view text) {
  if (text == "done") {
    return result_class::done;
  }
  if (text == "running") {
    return result_class::running;
  }
  if (text == "connected") {
    return result_class::connected;
  }
  if (text == "error") {
    return result_class::error;
  }
  if (text == "exit") {
    return result_class::exit;
  }
  return std::nullopt;
}

bool is_prompt(std::string_view line) {
  while (!line.empty() && line.back() == ' ') {
    line.remove_suffix(1);
  }
  return line == "(gdb)";
}

bool is_async_class(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (!is_variable_char(c)) {
      return false;
    }
  }
  return true;
}

record raw_console(std::string_view line) { return stream_record{stream_kind::console, std::string(line)}; }

} // namespace

std::string quote_c_string(std::string_view value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (unsigned char c : value) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20 || c == 0x7f) {
        out.push_back('\\');
        out.push_back(static_cast<char>('0' + ((c >> 6) & 0x7)));
        out.push_back(static_cast<char>('0' + ((c >> 3) & 0x7)));
        out.push_back(static_cast<char>('0' + (c & 0x7)));
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  out.push_back('"');
  return out;
}

std::string quote_parameter(std::string_view value) {
  if (value.empty()) {
    return "\"\"";
  }
  for (char c : value) {
    if (!is_safe_parameter_char(c)) {
      return quote_c_string(value);
    }
  }
  return std::string(value);
}

std::string encode_command(uint64_t token, const mi_command& command) {
  std::string line = std::to_string(token);
  line += command.operation;
  for (const auto& option : command.options) {
    line.push_back(' ');
    line += option;
  }
  if (command.ends_options &&
      std::any_of(command.parameters.begin(), command.parameters.end(),
                  [](const std::string& parameter) { return !parameter.empty() && parameter.front() == '-'; })) {
    line += " --";
  }
  for (const auto& parameter : command.parameters) {
    line.push_back(' ');
    line += quote_parameter(parameter);
  }
  return line;
}

record parse_record(std::string_view line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
    line.remove_suffix(1);
  }

  if (is_prompt(line)) {
    return prompt_record{};
  }

  size_t digits = 0;
  while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits])) != 0) {
    ++digits;
  }

  std::optional<uint64_t> token;
  if (digits > 0) {
    uint64_t value = 0;
    if (digits == line.size() || !parse_dec_u64(line.substr(0, digits), value)) {
      return raw_console(line);
    }
    token = value;
  }

  auto body = line.substr(digits);
  if (body.empty()) {
    return raw_console(line);
  }

  char marker = body.front();
  cursor in(body.substr(1));

  switch (marker) {
  case '^': {
    auto cls = parse_result_class(in.class_name());
    if (!cls) {
      return raw_console(line);
    }
    result_record out;
    out.token = token;
    out.cls = *cls;
    if (!in.trailing_results(out.results)) {
      return raw_console(line);
    }
    return out;
  }
  case '*':
  case '+':
  case '=': {
    async_record out;
    out.token = token;
    out.kind = marker == '*' ? async_kind::exec : (marker == '+' ? async_kind::status : async_kind::notify);
    out.async_class = in.class_name();
    if (!is_async_class(out.async_class) || !in.trailing_results(out.results)) {
      return raw_console(line);
    }
    return out;
  }
  case '~':
  case '@':
  case '&': {
    if (token) {
      return raw_console(line);
    }
    auto text = in.c_string();
    if (!text || !in.done()) {
      return raw_console(line);
    }
    stream_kind kind = marker == '~' ? stream_kind::console : (marker == '@' ? stream_kind::target : stream_kind::log);
    return stream_record{kind, std::move(*text)};
  }
  default:
    return raw_console(line);
  }
}

void record_parser::append(std::span<const std::byte> data) {
  for (std::byte b : data) {
    char c = static_cast<char>(std::to_integer<unsigned char>(b));
    if (c == '\n') {
      finish_line();
      continue;
    }
    line_.push_back(c);
    if (line_.size() >= k_max_line_size) {
      finish_line();
    }
  }
}

void record_parser::append(std::string_view data) {
  append(std::span<const std::byte>(reinterpret_cast<const std::byte*>(data.data()), data.size()));
}

bool record_parser::has_record() const { return !records_.empty(); }

record record_parser::pop_record() {
  if (records_.empty()) {
    return prompt_record{};
  }
  record out = std::move(records_.front());
  records_.pop_front();
  return out;
}

void record_parser::reset() {
  line_.clear();
  records_.clear();
}

void record_parser::finish_line() {
  std::string_view view = line_;
  while (!view.empty() && view.back() == '\r') {
    view.remove_suffix(1);
  }
  if (!view.empty()) {
    records_.push_back(parse_record(view));
  }
  line_.clear();
}

} // namespace gdbsession::mi
