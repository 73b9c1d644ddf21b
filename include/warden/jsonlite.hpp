#pragma once

// warden/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// Objects are std::map so serialization is key-sorted and deterministic.
// Non-negative integers parse as uint64; negative integers and fractions
// parse as double. get_i64() accepts either when the value is integral.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace warden::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(std::uint64_t n) : v(n) {}
  Value(double d) : v(d) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON value. On failure returns null and sets *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);
// Parse a JSON document whose top level must be an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& value);
std::string escape(const std::string& s);

bool has(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
// nullopt when the key is absent or not an integral number.
std::optional<std::int64_t> get_i64(const Object& obj, const std::string& key);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

}  // namespace warden::jsonlite
