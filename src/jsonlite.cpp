#include "tally/jsonlite.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace tally::jsonlite {

namespace {

// Nesting limit for untrusted input (topology and event files).
constexpr int kMaxDepth = 64;

struct Parser {
  const std::string& s;
  size_t i{0};
  int depth{0};
  std::optional<JsonError> err;

  void fail(const std::string& msg) {
    if (!err) err = JsonError{"json_parse_error", msg + " at offset " + std::to_string(i)};
  }

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  std::string parse_string() {
    if (!eat('"')) { fail("expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c == '\\' && i < s.size()) {
        char n = s[i++];
        if (n == 'n') o += '\n';
        else if (n == 't') o += '\t';
        else if (n == 'r') o += '\r';
        else if (n == 'b') o += '\b';
        else if (n == 'f') o += '\f';
        else if (n == 'u') {
          if (i + 4 > s.size()) { fail("truncated \\u escape"); return {}; }
          unsigned cp = 0;
          auto [p, ec] = std::from_chars(s.data() + i, s.data() + i + 4, cp, 16);
          if (ec != std::errc() || p != s.data() + i + 4) { fail("bad \\u escape"); return {}; }
          i += 4;
          // BMP only; identifiers and names in this system are ASCII/UTF-8.
          if (cp < 0x80) {
            o += static_cast<char>(cp);
          } else if (cp < 0x800) {
            o += static_cast<char>(0xC0 | (cp >> 6));
            o += static_cast<char>(0x80 | (cp & 0x3F));
          } else {
            o += static_cast<char>(0xE0 | (cp >> 12));
            o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            o += static_cast<char>(0x80 | (cp & 0x3F));
          }
        } else o += n;
      } else {
        o += c;
      }
    }
    fail("unterminated string");
    return {};
  }

  bool parse_number(Value& out) {
    ws();
    const size_t start = i;
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool is_float = false;
    if (i < s.size() && s[i] == '.') {
      is_float = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_float = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num = s.substr(start, i - start);
    if (!is_float) {
      std::int64_t v = 0;
      auto [p, ec] = std::from_chars(num.data(), num.data() + num.size(), v);
      if (ec == std::errc() && p == num.data() + num.size()) {
        out = Value{v};
        return true;
      }
      // Out of int64 range: fall through to double.
    }
    char* end = nullptr;
    const double d = std::strtod(num.c_str(), &end);
    if (end != num.c_str() + num.size()) {
      fail("invalid number");
      return false;
    }
    out = Value{d};
    return true;
  }

  Value parse_any() {
    ws();
    if (i >= s.size()) { fail("unexpected eof"); return {}; }
    if (s[i] == '{') return Value{parse_object()};
    if (s[i] == '[') return Value{parse_array()};
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num;
    if (parse_number(num)) return num;
    fail("unexpected token");
    return {};
  }

  Object parse_object() {
    Object out;
    if (++depth > kMaxDepth) { fail("nesting too deep"); return out; }
    eat('{');
    ws();
    if (eat('}')) { --depth; return out; }
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.count(k) != 0) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { fail("expected :"); break; }
      out[k] = parse_any();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    --depth;
    return out;
  }

  Array parse_array() {
    Array out;
    if (++depth > kMaxDepth) { fail("nesting too deep"); return out; }
    eat('[');
    ws();
    if (eat(']')) { --depth; return out; }
    while (!err) {
      out.push_back(parse_any());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    --depth;
    return out;
  }
};

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

}  // namespace

std::string escape(const std::string& s) {
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
    } else                 o += c;
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

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::int64_t>(v.v)) return std::to_string(std::get<std::int64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) return format_double(std::get<double>(v.v));
  if (std::holds_alternative<Object>(v.v)) {
    std::ostringstream oss; oss << "{"; bool first = true;
    for (const auto& [k, vv] : std::get<Object>(v.v)) { if (!first) oss << ","; first = false; oss << "\"" << escape(k) << "\"" << ":" << to_json(vv); }
    oss << "}"; return oss.str();
  }
  std::ostringstream oss; oss << "["; bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) { if (!first) oss << ","; first = false; oss << to_json(vv); }
  oss << "]"; return oss.str();
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_any();
  p.ws();
  if (!p.err && p.i != text.size()) p.fail("trailing data");
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  auto v = parse_value(text, &err);
  if (!err && !std::holds_alternative<Object>(v.v)) {
    err = JsonError{"json_parse_error", "root is not an object"};
  }
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<std::string>(v->v)) return def;
  return std::get<std::string>(v->v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<bool>(v->v)) return def;
  return std::get<bool>(v->v);
}

std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<std::int64_t>(v->v)) return def;
  return std::get<std::int64_t>(v->v);
}

std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<std::int64_t>(v->v)) return def;
  const std::int64_t i = std::get<std::int64_t>(v->v);
  return i < 0 ? def : static_cast<std::uint64_t>(i);
}

double get_double(const Object& obj, const std::string& key, double def) {
  const Value* v = find(obj, key);
  if (!v) return def;
  if (std::holds_alternative<double>(v->v)) return std::get<double>(v->v);
  if (std::holds_alternative<std::int64_t>(v->v)) return static_cast<double>(std::get<std::int64_t>(v->v));
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Array>(v->v)) return out;
  for (const auto& item : std::get<Array>(v->v)) {
    if (std::holds_alternative<std::string>(item.v)) out.push_back(std::get<std::string>(item.v));
  }
  return out;
}

std::optional<Object> get_object(const Object& obj, const std::string& key) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Object>(v->v)) return std::nullopt;
  return std::get<Object>(v->v);
}

std::optional<Array> get_array(const Object& obj, const std::string& key) {
  const Value* v = find(obj, key);
  if (!v || !std::holds_alternative<Array>(v->v)) return std::nullopt;
  return std::get<Array>(v->v);
}

bool is_null(const Object& obj, const std::string& key) {
  const Value* v = find(obj, key);
  return v && std::holds_alternative<std::nullptr_t>(v->v);
}

bool has_key(const Object& obj, const std::string& key) {
  return obj.count(key) != 0;
}

}  // namespace tally::jsonlite
