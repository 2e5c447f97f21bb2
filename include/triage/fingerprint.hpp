#pragma once

// triage/fingerprint.hpp: Stable identity for one finding.
//
// IDENTITY PAYLOAD (FINGERPRINT_VERSION = 1):
//   "v1" \n checker_id \n whitespace-free line text \n scope chain
//   hashed with the "fp:" domain.
//
// INSENSITIVE TO: absolute line number, file path, file encoding (BOM,
//   UTF-16, CRLF), indentation and whitespace inside the flagged line.
// SENSITIVE TO: checker id, flagged line text, enclosing
//   namespace/class/function signatures.
//
// The scope chain comes from a light brace-matching parse of the text above
// the flagged line. No preprocessing or semantic analysis is attempted.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "triage/types.hpp"

namespace triage {

// Strips a UTF-8 BOM, decodes UTF-16 (LE/BE, by BOM) to UTF-8 and converts
// CRLF / lone CR line endings to LF.
std::string normalize_source(std::string_view raw);

// Normalized source text with a line index.
class SourceView {
 public:
  SourceView() = default;
  explicit SourceView(std::string_view raw);

  const std::string& text() const { return text_; }
  bool empty() const { return text_.empty(); }

  // 1-based. nullopt when out of range.
  std::optional<std::string_view> line(uint32_t line_no) const;

  // Byte offset of the first character of a 1-based line; text().size() past the end.
  size_t line_offset(uint32_t line_no) const;

 private:
  std::string text_;
  std::vector<size_t> starts_;
};

// Removes every ASCII whitespace character.
std::string strip_whitespace(std::string_view s);

// Collapses whitespace runs and drops whitespace not separating two
// identifier characters: "void  f( int a )" -> "void f(int a)".
std::string normalize_signature(std::string_view s);

// Signatures of the namespaces, classes and functions enclosing the start of
// the given line, outermost first. Empty at file scope.
std::vector<std::string> enclosing_scopes(const SourceView& source, uint32_t line_no);

struct Fingerprint {
  std::string value;
  IdentityConfidence confidence{IdentityConfidence::scoped};
  std::string scope;  // display form of the chain, " > " separated
};

Fingerprint compute_fingerprint(const Finding& finding, const SourceView& source);
Fingerprint compute_fingerprint(const Finding& finding, std::string_view raw_source);

// Hash of the full bug path, checker and fingerprint. Two detections with the
// same path hash are literal repeats of one another.
std::string report_path_hash(const Finding& finding, std::string_view fingerprint);

}  // namespace triage
