#include "warden/jsonlite.hpp"

// DETERMINISM:
//   - to_json() emits objects in std::map key order.
//   - format_double() uses fixed 6-decimal formatting with trailing zeros
//     trimmed, independent of locale.
//
// LIMITS:
//   - Nesting depth is capped at kMaxDepth so hostile request payloads cannot
//     exhaust the parser's stack.

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace warden::jsonlite {

namespace {

constexpr int kMaxDepth = 64;

void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string& s;
  size_t i{0};
  int depth{0};
  std::optional<JsonError> err;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool parse_hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else return false;
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { err = JsonError{"json_parse_error", "expected string"}; return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) {
        err = JsonError{"json_parse_error", "control character in string"};
        return {};
      }
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      switch (n) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case '/': o += '/'; break;
        case '\\': o += '\\'; break;
        case '"': o += '"'; break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!parse_hex4(cp)) { err = JsonError{"json_parse_error", "invalid \\u escape"}; return {}; }
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            i += 2;
            std::uint32_t lo = 0;
            if (!parse_hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
              err = JsonError{"json_parse_error", "invalid surrogate pair"};
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
          break;
        }
        default:
          err = JsonError{"json_parse_error", "invalid escape"};
          return {};
      }
    }
    err = JsonError{"json_parse_error", "unterminated string"};
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool integral = true;
    if (i < s.size() && s[i] == '.') {
      integral = false;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid number format"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      integral = false;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid exponent"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num_str = s.substr(start, i - start);
    char* end = nullptr;
    if (integral && num_str[0] != '-') {
      errno = 0;
      const unsigned long long n = std::strtoull(num_str.c_str(), &end, 10);
      if (errno == ERANGE) {
        err = JsonError{"json_parse_error", "integer out of range"};
        return false;
      }
      out_val = Value{static_cast<std::uint64_t>(n)};
      return true;
    }
    const double d = std::strtod(num_str.c_str(), &end);
    if (!std::isfinite(d)) {
      err = JsonError{"json_parse_error", "number out of range"};
      return false;
    }
    out_val = Value{d};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { err = JsonError{"json_parse_error", "unexpected eof"}; return {}; }
    if (s[i] == '{' || s[i] == '[') {
      if (++depth > kMaxDepth) { err = JsonError{"json_parse_error", "nesting too deep"}; return {}; }
      Value out = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return out;
    }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) return num_val;
    if (!err) err = JsonError{"json_parse_error", "unexpected token"};
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    ws();
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { err = JsonError{"json_parse_error", "expected :"}; break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    ws();
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }
};

// Fast path: most strings need no escaping and are returned as-is.
std::string escape_inner(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    } else {
      o += c;
    }
  }
  return o;
}

std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

Value finish(Parser& p, std::optional<JsonError>* error) {
  Value v = p.parse_value();
  p.ws();
  if (!p.err && p.i != p.s.size()) p.err = JsonError{"json_parse_error", "trailing data"};
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

}  // namespace

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  return finish(p, error);
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = finish(p, error);
  if (p.err) return {};
  if (!std::holds_alternative<Object>(v.v)) {
    if (error) *error = JsonError{"json_parse_error", "expected object"};
    return {};
  }
  return std::get<Object>(std::move(v.v));
}

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape_inner(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::uint64_t>(v.v)) return std::to_string(std::get<std::uint64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) return format_double(std::get<double>(v.v));
  if (std::holds_alternative<Object>(v.v)) {
    std::ostringstream oss; oss << "{"; bool first = true;
    for (const auto& [k, vv] : std::get<Object>(v.v)) { if (!first) oss << ","; first = false; oss << "\"" << escape_inner(k) << "\"" << ":" << to_json(vv); }
    oss << "}"; return oss.str();
  }
  std::ostringstream oss; oss << "["; bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) { if (!first) oss << ","; first = false; oss << to_json(vv); }
  oss << "]"; return oss.str();
}

std::string escape(const std::string& s) { return escape_inner(s); }

bool has(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it != obj.end() && !std::holds_alternative<std::nullptr_t>(it->second.v);
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}

double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  if (std::holds_alternative<std::uint64_t>(it->second.v)) return static_cast<double>(std::get<std::uint64_t>(it->second.v));
  return def;
}

std::optional<std::int64_t> get_i64(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    const std::uint64_t n = std::get<std::uint64_t>(it->second.v);
    if (n > static_cast<std::uint64_t>(INT64_MAX)) return INT64_MAX;
    return static_cast<std::int64_t>(n);
  }
  if (std::holds_alternative<double>(it->second.v)) {
    const double d = std::get<double>(it->second.v);
    if (d != std::floor(d) || d < -9.2e18 || d > 9.2e18) return std::nullopt;
    return static_cast<std::int64_t>(d);
  }
  return std::nullopt;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) {
      out.push_back(std::get<std::string>(item.v));
    }
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return out;
  for (const auto& [k, v] : std::get<Object>(it->second.v)) {
    if (std::holds_alternative<std::string>(v.v)) {
      out[k] = std::get<std::string>(v.v);
    }
  }
  return out;
}

const Object* get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<Object>(&it->second.v);
}

const Array* get_array(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<Array>(&it->second.v);
}

}  // namespace warden::jsonlite
