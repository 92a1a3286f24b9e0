#include "parcelday/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace parcelday::json {
namespace {

struct Parser {
  const std::string& s;
  std::size_t i{0};

  char peek() const { return i < s.size() ? s[i] : '\0'; }
  char get() { return i < s.size() ? s[i++] : '\0'; }

  void skip_ws() {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    int line = 1;
    int col = 1;
    const std::size_t pos = std::min(i, s.size());
    for (std::size_t k = 0; k < pos; ++k) {
      if (s[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    std::ostringstream ss;
    ss << "JSON parse error at line " << line << ", col " << col << ": " << msg;
    throw std::runtime_error(ss.str());
  }

  bool consume(char c) {
    skip_ws();
    if (peek() == c) {
      ++i;
      return true;
    }
    return false;
  }

  void expect(char c) {
    skip_ws();
    if (get() != c) fail(std::string("expected '") + c + "'");
  }

  Value parse_value() {
    skip_ws();
    const char c = peek();
    if (c == 'n') return parse_literal("null", nullptr);
    if (c == 't') return parse_literal("true", true);
    if (c == 'f') return parse_literal("false", false);
    if (c == '"') return parse_string();
    if (c == '[') return parse_array();
    if (c == '{') return parse_object();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
    fail("unexpected character");
  }

  Value parse_literal(const std::string& lit, Value v) {
    for (char c : lit) {
      if (get() != c) fail("invalid literal");
    }
    return v;
  }

  Value parse_number() {
    const std::size_t start = i;
    if (peek() == '-') ++i;
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++i;
    if (peek() == '.') {
      ++i;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number fraction");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++i;
    }
    if (peek() == 'e' || peek() == 'E') {
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid exponent");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++i;
    }
    try {
      return std::stod(s.substr(start, i - start));
    } catch (const std::exception&) {
      fail("failed to parse number");
    }
  }

  unsigned parse_hex4() {
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = get();
      code <<= 4;
      if (h >= '0' && h <= '9') {
        code += static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code += static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code += static_cast<unsigned>(h - 'A' + 10);
      } else {
        fail("bad unicode escape");
      }
    }
    return code;
  }

  Value parse_string() {
    expect('"');
    std::string out;
    while (true) {
      if (i >= s.size()) fail("unterminated string");
      const char c = get();
      if (c == '"') break;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char e = get();
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          // Basic multilingual plane only; data files are addresses and times.
          const unsigned cp = parse_hex4();
          if (cp >= 0xD800 && cp <= 0xDFFF) fail("surrogate escapes are not supported");
          if (cp <= 0x7F) {
            out.push_back(static_cast<char>(cp));
          } else if (cp <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
          } else {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
          }
          break;
        }
        default: fail("unknown escape");
      }
    }
    return out;
  }

  Value parse_array() {
    expect('[');
    Array arr;
    if (consume(']')) return arr;
    while (true) {
      arr.push_back(parse_value());
      if (consume(']')) break;
      expect(',');
    }
    return arr;
  }

  Value parse_object() {
    expect('{');
    Object obj;
    if (consume('}')) return obj;
    while (true) {
      skip_ws();
      if (peek() != '"') fail("expected string key");
      const std::string key = std::get<std::string>(parse_string());
      expect(':');
      obj[key] = parse_value();
      if (consume('}')) break;
      expect(',');
    }
    return obj;
  }
};

std::string escape_string(const std::string& in) {
  std::ostringstream ss;
  ss << '"';
  for (char c : in) {
    switch (c) {
      case '"': ss << "\\\""; break;
      case '\\': ss << "\\\\"; break;
      case '\n': ss << "\\n"; break;
      case '\r': ss << "\\r"; break;
      case '\t': ss << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
             << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
        } else {
          ss << c;
        }
    }
  }
  ss << '"';
  return ss.str();
}

void write_value(const Value& v, std::ostringstream& out, int indent, int depth) {
  const auto newline_pad = [&](int d) {
    if (indent <= 0) return;
    out << '\n' << std::string(static_cast<std::size_t>(d * indent), ' ');
  };

  if (v.is_null()) {
    out << "null";
  } else if (const bool* b = v.as_bool()) {
    out << (*b ? "true" : "false");
  } else if (const double* d = v.as_number()) {
    // Keep integers clean when possible.
    if (std::fabs(*d - std::round(*d)) < 1e-9) {
      out << static_cast<std::int64_t>(std::llround(*d));
    } else {
      out << *d;
    }
  } else if (const std::string* str = v.as_string()) {
    out << escape_string(*str);
  } else if (const Array* a = v.as_array()) {
    out << '[';
    for (std::size_t k = 0; k < a->size(); ++k) {
      newline_pad(depth + 1);
      write_value((*a)[k], out, indent, depth + 1);
      if (k + 1 < a->size()) out << ',';
    }
    if (!a->empty()) newline_pad(depth);
    out << ']';
  } else {
    const Object& o = v.object();
    std::vector<std::string> keys;
    keys.reserve(o.size());
    for (const auto& [k, _] : o) keys.push_back(k);
    std::sort(keys.begin(), keys.end());

    out << '{';
    for (std::size_t k = 0; k < keys.size(); ++k) {
      newline_pad(depth + 1);
      out << escape_string(keys[k]) << ':';
      if (indent > 0) out << ' ';
      write_value(o.at(keys[k]), out, indent, depth + 1);
      if (k + 1 < keys.size()) out << ',';
    }
    if (!keys.empty()) newline_pad(depth);
    out << '}';
  }
}

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
  const Value* v = find(key);
  if (!is_object()) throw std::runtime_error("JSON value is not an object");
  if (!v) throw std::runtime_error("JSON object missing key: " + key);
  return *v;
}

const Value& Value::at(std::size_t index) const {
  const Array& a = array();
  if (index >= a.size()) throw std::runtime_error("JSON array index out of range");
  return a[index];
}

const Value* Value::find(const std::string& key) const {
  const auto* o = as_object();
  if (!o) return nullptr;
  auto it = o->find(key);
  return (it == o->end()) ? nullptr : &it->second;
}

bool Value::bool_value(bool def) const {
  if (auto p = as_bool()) return *p;
  return def;
}

double Value::number_value(double def) const {
  if (auto p = as_number()) return *p;
  return def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  if (auto p = as_number()) return static_cast<std::int64_t>(std::llround(*p));
  return def;
}

std::string Value::string_value(const std::string& def) const {
  if (auto p = as_string()) return *p;
  return def;
}

const Object& Value::object() const {
  const auto* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  return *o;
}

const Array& Value::array() const {
  const auto* a = as_array();
  if (!a) throw std::runtime_error("JSON value is not an array");
  return *a;
}

Value parse(const std::string& text) {
  Parser p{text};
  Value v = p.parse_value();
  p.skip_ws();
  if (p.i != text.size()) p.fail("trailing characters after JSON");
  return v;
}

std::string stringify(const Value& v, int indent) {
  std::ostringstream out;
  write_value(v, out, indent, 0);
  return out.str();
}

} // namespace parcelday::json
