#include "cataphract/util/json.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <utility>

#include "cataphract/util/sorted_keys.h"

namespace cataphract::json {
namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

int hex_digit(char c) {
  if (is_digit(c)) return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

void encode_utf8(std::uint32_t cp, std::string& out) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
    return;
  }
  int tail = cp < 0x800 ? 1 : (cp < 0x10000 ? 2 : 3);
  static const unsigned char lead[] = {0x00, 0xC0, 0xE0, 0xF0};
  out += static_cast<char>(lead[tail] | (cp >> (6 * tail)));
  while (tail-- > 0) out += static_cast<char>(0x80 | ((cp >> (6 * tail)) & 0x3F));
}

// Recursive-descent reader. Tracks line and column as it consumes input so
// errors can point at the offending character.
class Reader {
 public:
  explicit Reader(const std::string& text) : text_(text) {}

  Value document() {
    if (text_.compare(0, 3, "\xEF\xBB\xBF") == 0) pos_ = 3;
    Value v = value();
    blank();
    if (!done()) error("trailing characters after document");
    return v;
  }

 private:
  const std::string& text_;
  std::size_t pos_{0};
  int line_{1};
  int col_{1};

  bool done() const { return pos_ >= text_.size(); }
  char look() const { return done() ? '\0' : text_[pos_]; }

  char next() {
    if (done()) return '\0';
    const char c = text_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  [[noreturn]] void error(const std::string& what) const {
    throw std::runtime_error("JSON parse error at line " + std::to_string(line_) + ", column " +
                             std::to_string(col_) + ": " + what);
  }

  void blank() {
    while (!done() && std::isspace(static_cast<unsigned char>(look()))) next();
  }

  bool accept(char c) {
    blank();
    if (look() != c) return false;
    next();
    return true;
  }

  void require(char c) {
    if (!accept(c)) error(std::string("expected '") + c + "'");
  }

  Value value() {
    blank();
    switch (look()) {
      case '{': return object();
      case '[': return array();
      case '"': return string();
      case 't': word("true"); return true;
      case 'f': word("false"); return false;
      case 'n': word("null"); return nullptr;
      default: break;
    }
    if (look() == '-' || is_digit(look())) return number();
    error("unexpected character");
  }

  void word(const char* w) {
    for (; *w; ++w) {
      if (next() != *w) error("invalid literal");
    }
  }

  void digit_run() {
    if (!is_digit(look())) error("invalid number");
    while (is_digit(look())) next();
  }

  Value number() {
    const std::size_t start = pos_;
    if (look() == '-') next();
    if (look() == '0') {
      next();
    } else {
      digit_run();
    }
    if (look() == '.') {
      next();
      digit_run();
    }
    if (look() == 'e' || look() == 'E') {
      next();
      if (look() == '+' || look() == '-') next();
      digit_run();
    }
    const std::string lexeme = text_.substr(start, pos_ - start);
    return std::strtod(lexeme.c_str(), nullptr);
  }

  std::uint32_t code_unit() {
    std::uint32_t cu = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_digit(next());
      if (h < 0) error("bad unicode escape");
      cu = (cu << 4) | static_cast<std::uint32_t>(h);
    }
    return cu;
  }

  std::uint32_t code_point() {
    const std::uint32_t hi = code_unit();
    if (hi >= 0xDC00 && hi <= 0xDFFF) error("unexpected low surrogate");
    if (hi < 0xD800 || hi > 0xDBFF) return hi;
    if (next() != '\\' || next() != 'u') error("expected low surrogate");
    const std::uint32_t lo = code_unit();
    if (lo < 0xDC00 || lo > 0xDFFF) error("invalid low surrogate");
    return 0x10000u + ((hi - 0xD800u) << 10) + (lo - 0xDC00u);
  }

  std::string string() {
    require('"');
    std::string out;
    while (true) {
      if (done()) error("unterminated string");
      const char c = next();
      if (c == '"') return out;
      if (c != '\\') {
        out += c;
        continue;
      }
      const char esc = next();
      switch (esc) {
        case '"':
        case '\\':
        case '/': out += esc; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': encode_utf8(code_point(), out); break;
        default: error("unknown escape");
      }
    }
  }

  Value array() {
    require('[');
    Array items;
    if (accept(']')) return items;
    do {
      items.push_back(value());
    } while (accept(','));
    require(']');
    return items;
  }

  Value object() {
    require('{');
    Object members;
    if (accept('}')) return members;
    do {
      blank();
      if (look() != '"') error("expected string key");
      std::string key = string();
      require(':');
      members[std::move(key)] = value();
    } while (accept(','));
    require('}');
    return members;
  }
};

class Writer {
 public:
  explicit Writer(int indent) : indent_(indent) {}

  std::string take() { return std::move(out_); }

  void value(const Value& v, int depth) {
    if (const bool* b = v.as_bool()) {
      out_ += *b ? "true" : "false";
    } else if (const double* d = v.as_number()) {
      number(*d);
    } else if (const std::string* s = v.as_string()) {
      quoted(*s);
    } else if (const Array* a = v.as_array()) {
      out_ += '[';
      for (std::size_t k = 0; k < a->size(); ++k) {
        if (k > 0) out_ += ',';
        break_line(depth + 1);
        value((*a)[k], depth + 1);
      }
      if (!a->empty()) break_line(depth);
      out_ += ']';
    } else if (const Object* o = v.as_object()) {
      out_ += '{';
      bool first = true;
      for (const std::string& key : util::sorted_keys(*o)) {
        if (!first) out_ += ',';
        first = false;
        break_line(depth + 1);
        quoted(key);
        out_ += indent_ > 0 ? ": " : ":";
        value(o->at(key), depth + 1);
      }
      if (!o->empty()) break_line(depth);
      out_ += '}';
    } else {
      out_ += "null";
    }
  }

 private:
  int indent_;
  std::string out_;

  void break_line(int depth) {
    if (indent_ <= 0) return;
    out_ += '\n';
    out_.append(static_cast<std::size_t>(depth * indent_), ' ');
  }

  void number(double d) {
    if (!std::isfinite(d)) {
      out_ += "null";
      return;
    }
    char buf[40];
    if (std::fabs(d) < 9.0e15 && d == std::floor(d)) {
      std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d));
    } else {
      std::snprintf(buf, sizeof(buf), "%.17g", d);
    }
    out_ += buf;
  }

  void quoted(const std::string& s) {
    out_ += '"';
    for (const char c : s) {
      switch (c) {
        case '"': out_ += "\\\""; break;
        case '\\': out_ += "\\\\"; break;
        case '\n': out_ += "\\n"; break;
        case '\r': out_ += "\\r"; break;
        case '\t': out_ += "\\t"; break;
        default:
          if (static_cast<unsigned char>(c) < 0x20) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
            out_ += buf;
          } else {
            out_ += c;
          }
      }
    }
    out_ += '"';
  }
};

} // namespace

bool Value::is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
bool Value::is_bool() const { return std::holds_alternative<bool>(*this); }
bool Value::is_number() const { return std::holds_alternative<double>(*this); }
bool Value::is_string() const { return std::holds_alternative<std::string>(*this); }
bool Value::is_array() const { return std::holds_alternative<Array>(*this); }
bool Value::is_object() const { return std::holds_alternative<Object>(*this); }

const bool* Value::as_bool() const { return std::get_if<bool>(this); }
const double* Value::as_number() const { return std::get_if<double>(this); }
const std::string* Value::as_string() const { return std::get_if<std::string>(this); }
const Array* Value::as_array() const { return std::get_if<Array>(this); }
const Object* Value::as_object() const { return std::get_if<Object>(this); }

const Value& Value::at(const std::string& key) const {
  const Object& o = object();
  const auto it = o.find(key);
  if (it == o.end()) throw std::runtime_error("JSON object missing key: " + key);
  return it->second;
}

const Value& Value::at(std::size_t index) const {
  const Array& a = array();
  if (index >= a.size()) {
    throw std::runtime_error("JSON array index " + std::to_string(index) + " out of range (size " +
                             std::to_string(a.size()) + ")");
  }
  return a[index];
}

const Value* Value::find(const std::string& key) const {
  if (const Object* o = as_object()) {
    const auto it = o->find(key);
    if (it != o->end()) return &it->second;
  }
  return nullptr;
}

bool Value::bool_value(bool def) const {
  const bool* p = as_bool();
  return p ? *p : def;
}

double Value::number_value(double def) const {
  const double* p = as_number();
  return p ? *p : def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  const double* p = as_number();
  // Anything llround cannot represent falls back to the default.
  if (!p || !(std::fabs(*p) < 9.2e18)) return def;
  return static_cast<std::int64_t>(std::llround(*p));
}

std::string Value::string_value(const std::string& def) const {
  const std::string* p = as_string();
  return p ? *p : def;
}

const Object& Value::object() const {
  if (const Object* o = as_object()) return *o;
  throw std::runtime_error("JSON value is not an object");
}

const Array& Value::array() const {
  if (const Array* a = as_array()) return *a;
  throw std::runtime_error("JSON value is not an array");
}

Value parse(const std::string& text) { return Reader(text).document(); }

std::string stringify(const Value& v, int indent) {
  Writer w(indent);
  w.value(v, 0);
  return w.take();
}

} // namespace cataphract::json
