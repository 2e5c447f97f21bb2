#pragma once

// triage/jsonlite.hpp: Minimal strict JSON reader/writer.
//
// DETERMINISM:
//   Object is a std::map, so serialization always emits keys sorted.
//   Doubles are written with six fixed decimals, trailing zeros trimmed.
//   to_json(parse(x)) is the canonical form of x.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace triage::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

// Parses a top-level object. Returns an empty object on error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string to_json(const Object& obj);

// Type-safe extractors. Missing key or wrong type yields the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

// Builders
Value str(std::string s);
Value num(std::uint64_t n);
Value boolean(bool b);
Value string_array(const std::vector<std::string>& items);

}  // namespace triage::jsonlite
