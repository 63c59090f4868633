#pragma once

// tally/jsonlite.hpp - Minimal JSON value model, strict parser and writer.
//
// DETERMINISM:
//   Objects are std::map, so to_json() always emits keys sorted. Doubles are
//   formatted with format_double() (fixed 6 decimals, trailing zeros trimmed),
//   so identical values serialize identically on every platform.
//
// NUMBERS:
//   Integers without fraction or exponent parse as int64; everything else is
//   a double. get_double() accepts both.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tally::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, Array, Object> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(int i) : v(static_cast<std::int64_t>(i)) {}
  Value(std::int64_t i) : v(i) {}
  Value(std::uint64_t u) : v(static_cast<std::int64_t>(u)) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}
};

// Parse a document whose root must be an object. On error returns {} and
// sets *error (when non-null).
Object parse(const std::string& text, std::optional<JsonError>* error = nullptr);

// Parse any JSON value.
Value parse_value(const std::string& text, std::optional<JsonError>* error = nullptr);

std::string to_json(const Value& v);
std::string escape(const std::string& s);
std::string format_double(double d);

// Type-safe extractors. Missing keys or wrong types yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def = 0);
std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::optional<Object> get_object(const Object& obj, const std::string& key);
std::optional<Array> get_array(const Object& obj, const std::string& key);

// True when the key is present and holds JSON null.
bool is_null(const Object& obj, const std::string& key);
bool has_key(const Object& obj, const std::string& key);

}  // namespace tally::jsonlite
