#include "triage/suppression.hpp"

#include <algorithm>
#include <cctype>

namespace triage {

namespace {

constexpr std::string_view kMarkerPrefix = "triage_";

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

struct CommentLine {
  uint32_t line;
  std::string text;
};

// Text of a block comment line with /*, */ and a leading '*' removed.
std::string block_content(std::string_view s) {
  s = trim(s);
  if (s.starts_with("/*")) s.remove_prefix(2);
  if (s.ends_with("*/")) s.remove_suffix(2);
  s = trim(s);
  if (s.starts_with("*")) s.remove_prefix(1);
  return std::string(trim(s));
}

std::vector<std::string> split_checkers(std::string_view list) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : list) {
    if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
      if (!cur.empty()) out.push_back(std::move(cur));
      cur.clear();
    } else {
      cur += c;
    }
  }
  if (!cur.empty()) out.push_back(std::move(cur));
  return out;
}

}  // namespace

std::optional<ReviewStatus> marker_status(std::string_view marker) {
  if (marker == "triage_suppress" || marker == "triage_false_positive") return ReviewStatus::FalsePositive;
  if (marker == "triage_intentional") return ReviewStatus::Intentional;
  if (marker == "triage_confirmed") return ReviewStatus::Confirmed;
  return std::nullopt;
}

std::vector<SourceComment> comments_above(const SourceView& source, uint32_t line_no,
                                          std::vector<SuppressionWarning>* warnings) {
  // Collect the contiguous comment block, bottom-up.
  std::vector<CommentLine> block;
  uint32_t ln = line_no > 0 ? line_no - 1 : 0;
  while (ln >= 1) {
    const auto text = source.line(ln);
    if (!text) break;
    const std::string_view t = trim(*text);
    if (t.starts_with("//")) {
      block.push_back({ln, std::string(trim(t.substr(2)))});
      --ln;
      continue;
    }
    if (t.ends_with("*/")) {
      uint32_t k = ln;
      std::vector<CommentLine> lines;
      bool found_open = false;
      while (k >= 1) {
        const auto kt = source.line(k);
        if (!kt) break;
        lines.push_back({k, block_content(*kt)});
        if (trim(*kt).starts_with("/*")) {
          found_open = true;
          break;
        }
        if (kt->find("/*") != std::string_view::npos) break;  // code before the comment
        --k;
      }
      if (!found_open) break;
      block.insert(block.end(), lines.begin(), lines.end());
      ln = k - 1;
      continue;
    }
    break;
  }
  std::reverse(block.begin(), block.end());

  std::vector<SourceComment> out;
  bool in_comment = false;
  for (const auto& cl : block) {
    std::string_view t = trim(cl.text);
    if (t.starts_with(kMarkerPrefix)) {
      in_comment = false;
      size_t n = 0;
      while (n < t.size() && (std::isalnum(static_cast<unsigned char>(t[n])) || t[n] == '_')) ++n;
      const std::string_view word = t.substr(0, n);
      const auto status = marker_status(word);
      if (!status) {
        if (warnings) {
          warnings->push_back({cl.line, "unknown review marker '" + std::string(word) +
                                            "', expected triage_suppress, triage_false_positive, "
                                            "triage_intentional or triage_confirmed"});
        }
        continue;
      }
      std::string_view rest = trim(t.substr(n));
      if (!rest.starts_with("[")) {
        if (warnings) {
          warnings->push_back({cl.line, "review marker '" + std::string(word) +
                                            "' without a [checker-list]"});
        }
        continue;
      }
      const size_t close = rest.find(']');
      if (close == std::string_view::npos) {
        if (warnings) warnings->push_back({cl.line, "unterminated checker list"});
        continue;
      }
      SourceComment c;
      c.marker = std::string(word);
      c.status = *status;
      c.checkers = split_checkers(rest.substr(1, close - 1));
      c.message = std::string(trim(rest.substr(close + 1)));
      c.line = cl.line;
      if (c.checkers.empty()) {
        if (warnings) warnings->push_back({cl.line, "empty checker list"});
        continue;
      }
      out.push_back(std::move(c));
      in_comment = true;
    } else if (in_comment && !t.empty()) {
      auto& msg = out.back().message;
      if (!msg.empty()) msg += ' ';
      msg += t;
    }
  }
  return out;
}

bool comment_applies(const SourceComment& comment, std::string_view checker_id) {
  for (const auto& name : comment.checkers) {
    if (name == "all") return true;
    if (checker_id.find(name) != std::string_view::npos) return true;
  }
  return false;
}

SuppressionLookup find_source_review(const SourceView& source, uint32_t line_no,
                                     std::string_view checker_id) {
  SuppressionLookup result;
  const auto comments = comments_above(source, line_no, &result.warnings);

  const SourceComment* match = nullptr;
  size_t matches = 0;
  for (const auto& c : comments) {
    if (!comment_applies(c, checker_id)) continue;
    ++matches;
    if (!match) match = &c;
  }
  if (matches > 1) {
    result.warnings.push_back({line_no, std::to_string(matches) + " review comments apply to " +
                                            std::string(checker_id) + "; none is used"});
    return result;
  }
  if (match) {
    result.review = SourceReview{match->status, match->message, match->line};
  }
  return result;
}

}  // namespace triage
