#include "triage/jsonlite.hpp"

// DETERMINISM GUARANTEES:
//   - to_json() returns a canonical form with sorted keys (std::map iteration).
//   - Doubles always use 6 decimal places with trailing-zero trimming.
//
// DETERMINISM RISKS:
//   - std::stod() is locale-sensitive. It is used only for input parsing, not
//     for canonical output.

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace triage::jsonlite {

namespace {

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

void append_utf8(std::string& o, unsigned cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
    return;
  }
  if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
  }
  o += static_cast<char>(0x80 | (cp & 0x3F));
}

// Recursive-descent reader. The first error sticks; later calls are no-ops.
class Reader {
 public:
  explicit Reader(const std::string& text) : s_(text) {}

  Value document() {
    Value v = value();
    skip_ws();
    if (!err_ && pos_ != s_.size()) fail("json_parse_error", "trailing data");
    return v;
  }

  const std::optional<JsonError>& error() const { return err_; }

 private:
  void fail(const char* code, std::string message) {
    if (!err_) err_ = JsonError{code, std::move(message)};
  }

  void skip_ws() {
    while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
  }

  bool consume(char c) {
    skip_ws();
    if (pos_ < s_.size() && s_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool literal(const char* word, size_t len) {
    if (s_.compare(pos_, len, word) != 0) return false;
    pos_ += len;
    return true;
  }

  Value value() {
    skip_ws();
    if (pos_ >= s_.size()) {
      fail("json_parse_error", "unexpected eof");
      return {};
    }
    switch (s_[pos_]) {
      case '{': return Value{object()};
      case '[': return Value{array()};
      case '"': return Value{string()};
      default: break;
    }
    if (literal("true", 4)) return Value{true};
    if (literal("false", 5)) return Value{false};
    if (literal("null", 4)) return Value{nullptr};
    return number();
  }

  bool hex4(unsigned& out) {
    if (pos_ + 4 > s_.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s_[pos_++];
      unsigned d;
      if (c >= '0' && c <= '9') d = static_cast<unsigned>(c - '0');
      else if (c >= 'a' && c <= 'f') d = static_cast<unsigned>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') d = static_cast<unsigned>(c - 'A' + 10);
      else return false;
      out = (out << 4) | d;
    }
    return true;
  }

  std::string string() {
    if (!consume('"')) {
      fail("json_parse_error", "expected string");
      return {};
    }
    std::string o;
    while (pos_ < s_.size()) {
      const char c = s_[pos_++];
      if (c == '"') return o;
      if (c != '\\') {
        o += c;
        continue;
      }
      if (pos_ >= s_.size()) break;
      const char esc = s_[pos_++];
      switch (esc) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'u': {
          unsigned cp = 0;
          if (!hex4(cp)) {
            fail("json_parse_error", "invalid \\u escape");
            return {};
          }
          if (cp >= 0xD800 && cp <= 0xDBFF && s_.compare(pos_, 2, "\\u") == 0) {
            pos_ += 2;
            unsigned lo = 0;
            if (!hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
              fail("json_parse_error", "invalid surrogate pair");
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
          break;
        }
        default: o += esc; break;
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  // Advances over [0-9]+; false if there is not at least one digit.
  bool digits() {
    const size_t start = pos_;
    while (pos_ < s_.size() && is_digit(s_[pos_])) ++pos_;
    return pos_ > start;
  }

  Value number() {
    const size_t start = pos_;
    if (s_.compare(pos_, 3, "NaN") == 0 || s_.compare(pos_, 8, "Infinity") == 0 ||
        s_.compare(pos_, 9, "-Infinity") == 0) {
      fail("json_parse_error", "NaN/Infinity unsupported");
      return {};
    }
    const bool negative = pos_ < s_.size() && s_[pos_] == '-';
    if (negative) ++pos_;
    if (!digits()) {
      fail("json_parse_error", "unexpected token");
      return {};
    }
    bool integral = !negative;
    if (pos_ < s_.size() && s_[pos_] == '.') {
      ++pos_;
      integral = false;
      if (!digits()) {
        fail("json_parse_error", "invalid number format");
        return {};
      }
    }
    if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
      ++pos_;
      integral = false;
      if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) ++pos_;
      if (!digits()) {
        fail("json_parse_error", "invalid exponent");
        return {};
      }
    }

    // Negative integers are kept as double so the sign survives.
    const std::string text = s_.substr(start, pos_ - start);
    try {
      if (integral) return Value{static_cast<std::uint64_t>(std::stoull(text))};
      return Value{std::stod(text)};
    } catch (const std::out_of_range&) {
      fail("json_parse_error", "number out of range: " + text);
    } catch (const std::invalid_argument&) {
      fail("json_parse_error", "invalid number: " + text);
    }
    return {};
  }

  Object object() {
    Object out;
    consume('{');
    if (consume('}')) return out;
    while (!err_) {
      std::string key = string();
      if (err_) break;
      if (out.count(key)) {
        fail("json_duplicate_key", "duplicate key: " + key);
        break;
      }
      if (!consume(':')) {
        fail("json_parse_error", "expected :");
        break;
      }
      Value v = value();
      if (err_) break;
      out.emplace(std::move(key), std::move(v));
      if (consume('}')) break;
      if (!consume(',')) fail("json_parse_error", "expected ,");
    }
    return out;
  }

  Array array() {
    Array out;
    consume('[');
    if (consume(']')) return out;
    while (!err_) {
      out.push_back(value());
      if (err_) break;
      if (consume(']')) break;
      if (!consume(',')) fail("json_parse_error", "expected ,");
    }
    return out;
  }

  const std::string& s_;
  size_t pos_{0};
  std::optional<JsonError> err_;
};

void write_string(std::string& out, const std::string& s) {
  out += '"';
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += '"';
}

void write_double(std::string& out, double d) {
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) {
    out += "0.0";
    return;
  }
  std::string text(buf, static_cast<size_t>(n));
  while (!text.empty() && text.back() == '0') text.pop_back();
  if (!text.empty() && text.back() == '.') text += '0';
  out += text;
}

void write_value(std::string& out, const Value& v);

void write_object(std::string& out, const Object& obj) {
  out += '{';
  bool first = true;
  for (const auto& [k, vv] : obj) {
    if (!first) out += ',';
    first = false;
    write_string(out, k);
    out += ':';
    write_value(out, vv);
  }
  out += '}';
}

void write_value(std::string& out, const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) {
    out += "null";
  } else if (const bool* b = std::get_if<bool>(&v.v)) {
    out += *b ? "true" : "false";
  } else if (const auto* n = std::get_if<std::uint64_t>(&v.v)) {
    out += std::to_string(*n);
  } else if (const double* d = std::get_if<double>(&v.v)) {
    write_double(out, *d);
  } else if (const auto* s = std::get_if<std::string>(&v.v)) {
    write_string(out, *s);
  } else if (const auto* o = std::get_if<Object>(&v.v)) {
    write_object(out, *o);
  } else {
    out += '[';
    bool first = true;
    for (const auto& item : std::get<Array>(v.v)) {
      if (!first) out += ',';
      first = false;
      write_value(out, item);
    }
    out += ']';
  }
}

template <typename T>
const T* find_as(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

}  // namespace

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error) {
  Reader r(text);
  const Value v = r.document();
  if (error) *error = r.error();
  return r.error() ? std::string() : to_json(v);
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader r(text);
  Value v = r.document();
  std::optional<JsonError> err = r.error();
  if (!err && !std::holds_alternative<Object>(v.v)) err = JsonError{"json_parse_error", "expected object"};
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(std::move(v.v));
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

std::string to_json(const Value& v) {
  std::string out;
  write_value(out, v);
  return out;
}

std::string to_json(const Object& obj) {
  std::string out;
  write_object(out, obj);
  return out;
}

// ---------------------------------------------------------------------------
// Extractors
// ---------------------------------------------------------------------------

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* s = find_as<std::string>(obj, key);
  return s ? *s : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* b = find_as<bool>(obj, key);
  return b ? *b : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* n = find_as<std::uint64_t>(obj, key);
  return n ? *n : def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  if (const auto* arr = find_as<Array>(obj, key)) {
    for (const auto& item : *arr) {
      if (const auto* s = std::get_if<std::string>(&item.v)) out.push_back(*s);
    }
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  if (const auto* inner = find_as<Object>(obj, key)) {
    for (const auto& [k, v] : *inner) {
      if (const auto* s = std::get_if<std::string>(&v.v)) out[k] = *s;
    }
  }
  return out;
}

const Array* get_array(const Object& obj, const std::string& key) {
  return find_as<Array>(obj, key);
}

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------

Value str(std::string s) { return Value{std::move(s)}; }
Value num(std::uint64_t n) { return Value{n}; }
Value boolean(bool b) { return Value{b}; }

Value string_array(const std::vector<std::string>& items) {
  Array out;
  out.reserve(items.size());
  for (const auto& item : items) out.push_back(Value{item});
  return Value{std::move(out)};
}

}  // namespace triage::jsonlite
