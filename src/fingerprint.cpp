#include "triage/fingerprint.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

#include "triage/hash.hpp"
#include "triage/observability.hpp"

namespace triage {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool is_ident(char c) {
  const auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) || c == '_' || u >= 0x80;
}

void append_utf8(std::string& o, uint32_t cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

std::string decode_utf16(std::string_view raw, bool little_endian) {
  std::string out;
  out.reserve(raw.size() / 2);
  auto unit_at = [&](size_t i) -> uint32_t {
    const auto a = static_cast<unsigned char>(raw[i]);
    const auto b = static_cast<unsigned char>(raw[i + 1]);
    return little_endian ? (static_cast<uint32_t>(b) << 8 | a) : (static_cast<uint32_t>(a) << 8 | b);
  };
  for (size_t i = 2; i + 1 < raw.size(); i += 2) {
    uint32_t cp = unit_at(i);
    if (cp >= 0xD800 && cp <= 0xDBFF && i + 3 < raw.size()) {
      const uint32_t lo = unit_at(i + 2);
      if (lo >= 0xDC00 && lo <= 0xDFFF) {
        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        i += 2;
      }
    }
    append_utf8(out, cp);
  }
  return out;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

std::string_view leading_word(std::string_view s) {
  size_t n = 0;
  while (n < s.size() && is_ident(s[n])) ++n;
  return s.substr(0, n);
}

// ---------------------------------------------------------------------------
// Scope classification
// ---------------------------------------------------------------------------

enum class FrameKind {
  block,      // control-flow or anonymous block; contributes nothing
  init,       // initializer, lambda or expression braces; contributes nothing
  name_space,
  type,
  function,
};

struct Classified {
  FrameKind kind{FrameKind::block};
  std::string signature;
};

// Drops leading [[attributes]], access specifiers, template<...> heads and
// "export" from a statement header.
std::string_view strip_header_prefixes(std::string_view h) {
  bool changed = true;
  while (changed) {
    changed = false;
    h = trim(h);
    if (h.starts_with("[[")) {
      const auto end = h.find("]]");
      if (end == std::string_view::npos) return h;
      h.remove_prefix(end + 2);
      changed = true;
      continue;
    }
    for (std::string_view access : {"public", "private", "protected"}) {
      if (leading_word(h) == access) {
        auto rest = trim(h.substr(access.size()));
        if (rest.starts_with(":") && !rest.starts_with("::")) {
          h = rest.substr(1);
          changed = true;
        }
      }
    }
    if (leading_word(h) == "export") {
      h.remove_prefix(6);
      changed = true;
      continue;
    }
    if (leading_word(h) == "template") {
      auto rest = trim(h.substr(8));
      if (!rest.starts_with("<")) return h;
      int depth = 0;
      size_t i = 0;
      for (; i < rest.size(); ++i) {
        if (rest[i] == '<') ++depth;
        else if (rest[i] == '>' && --depth == 0) break;
      }
      if (i >= rest.size()) return h;
      h = rest.substr(i + 1);
      changed = true;
    }
  }
  return h;
}

// Position of the first single ':' (not part of "::") at paren depth 0,
// starting at `from`. npos if none.
size_t find_single_colon(std::string_view h, size_t from) {
  int depth = 0;
  for (size_t i = from; i < h.size(); ++i) {
    const char c = h[i];
    if (c == '(' || c == '[') ++depth;
    else if ((c == ')' || c == ']') && depth > 0) --depth;
    else if (c == ':' && depth == 0) {
      const bool prev = i > 0 && h[i - 1] == ':';
      const bool next = i + 1 < h.size() && h[i + 1] == ':';
      if (!prev && !next) return i;
      if (next) ++i;
    }
  }
  return std::string_view::npos;
}

// Start of the parameter list for a function header: the first top-level
// '(' after an optional "operator<symbol>" name.
size_t find_param_open(std::string_view h, size_t& op_begin, size_t& op_end) {
  op_begin = op_end = std::string_view::npos;
  size_t search_from = 0;
  size_t pos = h.find("operator");
  while (pos != std::string_view::npos) {
    const bool left_ok = pos == 0 || !is_ident(h[pos - 1]);
    const bool right_ok = pos + 8 >= h.size() || !is_ident(h[pos + 8]);
    if (left_ok && right_ok) break;
    pos = h.find("operator", pos + 1);
  }
  if (pos != std::string_view::npos) {
    op_begin = pos;
    size_t i = pos + 8;
    while (i < h.size() && is_space(h[i])) ++i;
    if (h.compare(i, 2, "()") == 0) i += 2;
    search_from = i;
  }
  const size_t open = h.find('(', search_from);
  if (op_begin != std::string_view::npos) op_end = open;
  return open;
}

size_t matching_close(std::string_view h, size_t open) {
  int depth = 0;
  for (size_t i = open; i < h.size(); ++i) {
    if (h[i] == '(') ++depth;
    else if (h[i] == ')' && --depth == 0) return i;
  }
  return std::string_view::npos;
}

bool has_top_level_assignment(std::string_view h, size_t op_begin, size_t op_end) {
  int depth = 0;
  for (size_t i = 0; i < h.size(); ++i) {
    if (op_begin != std::string_view::npos && i >= op_begin && i < op_end) continue;
    const char c = h[i];
    if (c == '(' || c == '[' || c == '{') ++depth;
    else if ((c == ')' || c == ']' || c == '}') && depth > 0) --depth;
    else if (c == '=' && depth == 0) return true;
  }
  return false;
}

Classified classify_header(std::string_view raw_header) {
  std::string_view h = strip_header_prefixes(raw_header);
  if (h.empty()) return {FrameKind::block, {}};

  const char last = h.back();
  if (last == '=' || last == ',' || last == '(' || last == '[' || last == '?') {
    return {FrameKind::init, {}};
  }

  const std::string_view w = leading_word(h);
  if (w == "return" || w == "throw" || w == "co_return" || w == "co_yield") {
    return {FrameKind::init, {}};
  }
  if (w == "if" || w == "else" || w == "for" || w == "while" || w == "do" || w == "switch" ||
      w == "try" || w == "catch" || w == "case" || w == "default" || w == "extern" ||
      w == "__try" || w == "__finally" || w == "__except") {
    return {FrameKind::block, {}};
  }
  if (w == "namespace" || (w == "inline" && leading_word(trim(h.substr(6))) == "namespace")) {
    return {FrameKind::name_space, normalize_signature(h)};
  }
  if (h.front() == '[') return {FrameKind::init, {}};  // lambda introducer

  size_t op_begin = 0;
  size_t op_end = 0;
  const size_t open = find_param_open(h, op_begin, op_end);
  if (has_top_level_assignment(h, op_begin, op_end)) return {FrameKind::init, {}};

  std::string_view keyword = w;
  if (w == "typedef") keyword = leading_word(trim(h.substr(7)));
  if ((keyword == "class" || keyword == "struct" || keyword == "union" || keyword == "enum") &&
      open == std::string_view::npos) {
    const size_t colon = find_single_colon(h, 0);
    return {FrameKind::type, normalize_signature(h.substr(0, colon))};
  }

  if (open == std::string_view::npos) return {FrameKind::init, {}};
  const size_t close = matching_close(h, open);
  if (close == std::string_view::npos) return {FrameKind::init, {}};

  const size_t init_colon = find_single_colon(h, close + 1);
  if (init_colon != std::string_view::npos) {
    // Constructor initializer list: a '{' right after a member name is a
    // brace initializer, one after ')' or '}' opens the body.
    if (is_ident(last) || last == '>') return {FrameKind::init, {}};
    return {FrameKind::function, normalize_signature(h.substr(0, init_colon))};
  }
  return {FrameKind::function, normalize_signature(h)};
}

struct Frame {
  FrameKind kind;
  std::string signature;
  std::string saved_header;
  int saved_paren{0};
};

}  // namespace

// ---------------------------------------------------------------------------
// Normalization
// ---------------------------------------------------------------------------

std::string normalize_source(std::string_view raw) {
  std::string decoded;
  if (raw.size() >= 2 && static_cast<unsigned char>(raw[0]) == 0xFF &&
      static_cast<unsigned char>(raw[1]) == 0xFE) {
    decoded = decode_utf16(raw, true);
  } else if (raw.size() >= 2 && static_cast<unsigned char>(raw[0]) == 0xFE &&
             static_cast<unsigned char>(raw[1]) == 0xFF) {
    decoded = decode_utf16(raw, false);
  } else if (raw.size() >= 3 && static_cast<unsigned char>(raw[0]) == 0xEF &&
             static_cast<unsigned char>(raw[1]) == 0xBB && static_cast<unsigned char>(raw[2]) == 0xBF) {
    decoded.assign(raw.substr(3));
  } else {
    decoded.assign(raw);
  }

  std::string out;
  out.reserve(decoded.size());
  for (size_t i = 0; i < decoded.size(); ++i) {
    if (decoded[i] == '\r') {
      out += '\n';
      if (i + 1 < decoded.size() && decoded[i + 1] == '\n') ++i;
    } else {
      out += decoded[i];
    }
  }
  return out;
}

SourceView::SourceView(std::string_view raw) : text_(normalize_source(raw)) {
  if (text_.empty()) return;
  starts_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n' && i + 1 < text_.size()) starts_.push_back(i + 1);
  }
}

std::optional<std::string_view> SourceView::line(uint32_t line_no) const {
  if (line_no == 0 || line_no > starts_.size()) return std::nullopt;
  const size_t begin = starts_[line_no - 1];
  size_t end = text_.find('\n', begin);
  if (end == std::string::npos) end = text_.size();
  return std::string_view(text_).substr(begin, end - begin);
}

size_t SourceView::line_offset(uint32_t line_no) const {
  if (line_no == 0) return 0;
  if (line_no > starts_.size()) return text_.size();
  return starts_[line_no - 1];
}

std::string strip_whitespace(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (!is_space(c)) out += c;
  }
  return out;
}

std::string normalize_signature(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  bool pending_space = false;
  for (char c : s) {
    if (is_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space && is_ident(out.back()) && is_ident(c)) out += ' ';
    pending_space = false;
    out += c;
  }
  return out;
}

// ---------------------------------------------------------------------------
// Light scope parse
// ---------------------------------------------------------------------------

std::vector<std::string> enclosing_scopes(const SourceView& source, uint32_t line_no) {
  const std::string& t = source.text();
  const size_t end = std::min(source.line_offset(line_no), t.size());

  std::vector<Frame> stack;
  std::string header;  // cleaned text of the current statement
  int paren = 0;
  bool line_has_code = false;
  // One entry per open #if; true once past its first branch.
  std::vector<bool> conditionals;
  auto in_later_branch = [&] {
    return std::find(conditionals.begin(), conditionals.end(), true) != conditionals.end();
  };

  size_t i = 0;
  while (i < end) {
    const char c = t[i];
    const char next = i + 1 < end ? t[i + 1] : '\0';

    if (c == '\n') {
      line_has_code = false;
      header += ' ';
      ++i;
      continue;
    }
    if (is_space(c)) {
      header += ' ';
      ++i;
      continue;
    }
    if (c == '#' && !line_has_code) {
      // Preprocessor directive, including backslash continuations.
      size_t k = i + 1;
      while (i < end && t[i] != '\n') {
        if (t[i] == '\\' && i + 1 < end && t[i + 1] == '\n') ++i;
        ++i;
      }
      while (k < i && is_space(t[k])) ++k;
      size_t word_end = k;
      while (word_end < i && std::isalpha(static_cast<unsigned char>(t[word_end]))) ++word_end;
      const std::string_view word(t.data() + k, word_end - k);
      if (word.substr(0, 2) == "if") {
        conditionals.push_back(false);
      } else if ((word == "else" || word.substr(0, 4) == "elif") && !conditionals.empty()) {
        conditionals.back() = true;
      } else if (word == "endif" && !conditionals.empty()) {
        conditionals.pop_back();
      }
      // Only the first branch of a conditional is parsed; jump to the next directive.
      while (i < end && in_later_branch()) {
        ++i;
        size_t first = i;
        while (first < end && t[first] != '\n' && is_space(t[first])) ++first;
        if (first < end && t[first] == '#') {
          i = first;
          break;
        }
        while (i < end && t[i] != '\n') ++i;
      }
      header += ' ';
      continue;
    }
    line_has_code = true;

    if (c == '/' && next == '/') {
      while (i < end && t[i] != '\n') ++i;
      header += ' ';
      continue;
    }
    if (c == '/' && next == '*') {
      const size_t close = t.find("*/", i + 2);
      i = (close == std::string::npos || close + 2 > end) ? end : close + 2;
      header += ' ';
      continue;
    }
    if (c == '"') {
      const bool raw = i > 0 && t[i - 1] == 'R';
      if (raw) {
        const size_t open = t.find('(', i + 1);
        if (open == std::string::npos) { i = end; continue; }
        const std::string terminator = ")" + t.substr(i + 1, open - i - 1) + "\"";
        const size_t close = t.find(terminator, open + 1);
        i = (close == std::string::npos) ? end : close + terminator.size();
      } else {
        ++i;
        while (i < end && t[i] != '"' && t[i] != '\n') {
          if (t[i] == '\\') ++i;
          ++i;
        }
        if (i < end && t[i] == '"') ++i;
      }
      header += "\"\"";
      continue;
    }
    if (c == '\'') {
      if (i > 0 && std::isxdigit(static_cast<unsigned char>(t[i - 1])) &&
          std::isdigit(static_cast<unsigned char>(header.empty() ? ' ' : header.back()))) {
        ++i;  // digit separator
        continue;
      }
      ++i;
      while (i < end && t[i] != '\'' && t[i] != '\n') {
        if (t[i] == '\\') ++i;
        ++i;
      }
      if (i < end && t[i] == '\'') ++i;
      header += "''";
      continue;
    }

    if (c == '(' || c == '[') {
      ++paren;
      header += c;
    } else if (c == ')' || c == ']') {
      if (paren > 0) --paren;
      header += c;
    } else if (c == ';' && paren == 0) {
      header.clear();
    } else if (c == '{') {
      Frame f;
      const bool inside_init = !stack.empty() && stack.back().kind == FrameKind::init;
      if (inside_init || paren > 0) {
        f.kind = FrameKind::init;
      } else {
        auto cls = classify_header(header);
        f.kind = cls.kind;
        f.signature = std::move(cls.signature);
      }
      f.saved_header = header;
      f.saved_paren = paren;
      stack.push_back(std::move(f));
      header.clear();
      paren = 0;
    } else if (c == '}') {
      if (!stack.empty()) {
        Frame f = std::move(stack.back());
        stack.pop_back();
        if (f.kind == FrameKind::init) {
          header = f.saved_header + "{}";
          paren = f.saved_paren;
        } else {
          header.clear();
          paren = 0;
        }
      }
    } else {
      header += c;
    }
    ++i;
  }

  std::vector<std::string> chain;
  for (const auto& f : stack) {
    if (f.kind == FrameKind::name_space || f.kind == FrameKind::type ||
        f.kind == FrameKind::function) {
      chain.push_back(f.signature);
    }
  }
  return chain;
}

// ---------------------------------------------------------------------------
// Fingerprint
// ---------------------------------------------------------------------------

Fingerprint compute_fingerprint(const Finding& finding, const SourceView& source) {
  Fingerprint fp;
  std::string line_text;
  std::vector<std::string> chain;

  const auto line = source.line(finding.line);
  if (line) {
    line_text = strip_whitespace(*line);
  } else {
    // Source text unavailable: the message is the only stable text left.
    line_text = strip_whitespace(finding.message);
  }

  if (!finding.scope_text.empty()) {
    chain.push_back(normalize_signature(finding.scope_text));
  } else if (line) {
    chain = enclosing_scopes(source, finding.line);
  }

  std::string scope_payload;
  for (size_t k = 0; k < chain.size(); ++k) {
    if (k) {
      scope_payload += '\n';
      fp.scope += " > ";
    }
    scope_payload += chain[k];
    fp.scope += chain[k];
  }

  fp.confidence = chain.empty() || !line ? IdentityConfidence::file_level : IdentityConfidence::scoped;

  std::string payload;
  payload.reserve(finding.checker_id.size() + line_text.size() + scope_payload.size() + 8);
  payload += "v1\n";
  payload += finding.checker_id;
  payload += '\n';
  payload += line_text;
  payload += '\n';
  payload += scope_payload;
  fp.value = fingerprint_digest(payload);

  auto& stats = global_store_stats();
  stats.fingerprints_computed.fetch_add(1, std::memory_order_relaxed);
  if (fp.confidence == IdentityConfidence::file_level) {
    stats.identity_fallbacks.fetch_add(1, std::memory_order_relaxed);
    if (log_level() == LogLevel::debug) {
      log_message(LogLevel::debug, "fingerprint",
                  to_string(ErrorCode::identity_ambiguous) + ": " + finding.checker_id + " at " +
                      finding.file + ":" + std::to_string(finding.line) +
                      " has no enclosing scope, using file-level identity");
    }
  }
  return fp;
}

Fingerprint compute_fingerprint(const Finding& finding, std::string_view raw_source) {
  return compute_fingerprint(finding, SourceView(raw_source));
}

std::string report_path_hash(const Finding& finding, std::string_view fingerprint) {
  std::string payload;
  auto add_event = [&payload](const std::string& file, uint32_t line, uint32_t column,
                              const std::string& message) {
    payload += std::to_string(line);
    payload += '|';
    payload += std::to_string(column);
    payload += '|';
    payload += message;
    payload += '|';
    payload += file;
    payload += '\n';
  };
  if (finding.bug_path.empty()) {
    add_event(finding.file, finding.line, finding.column, finding.message);
  } else {
    for (const auto& ev : finding.bug_path) add_event(ev.file, ev.line, ev.column, ev.message);
  }
  payload += finding.checker_id;
  payload += '\n';
  payload += fingerprint;
  return bug_path_digest(payload);
}

}  // namespace triage
