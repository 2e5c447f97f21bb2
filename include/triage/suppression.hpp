#pragma once

// triage/suppression.hpp: In-source review status comments.
//
// Grammar, in // or /* */ comments directly above the flagged line:
//
//   triage_suppress        [checker-list] free text   -> FalsePositive
//   triage_false_positive  [checker-list] free text   -> FalsePositive
//   triage_intentional     [checker-list] free text   -> Intentional
//   triage_confirmed       [checker-list] free text   -> Confirmed
//
// checker-list is "all" or names separated by commas or spaces. A name
// applies to a checker when it is a substring of the checker id. Free text
// may continue on following comment lines.
//
// Several stacked comments are allowed as long as at most one applies to a
// given checker; more than one is ambiguous and none is used.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "triage/fingerprint.hpp"
#include "triage/types.hpp"

namespace triage {

struct SourceComment {
  std::string marker;
  ReviewStatus status{ReviewStatus::Unreviewed};
  std::vector<std::string> checkers;
  std::string message;
  uint32_t line{0};  // first line of the comment
};

struct SuppressionWarning {
  uint32_t line{0};
  std::string reason;
};

struct SuppressionLookup {
  std::optional<SourceReview> review;
  std::vector<SuppressionWarning> warnings;
};

std::optional<ReviewStatus> marker_status(std::string_view marker);

// Parsed marker comments in the comment block ending right above line_no.
std::vector<SourceComment> comments_above(const SourceView& source, uint32_t line_no,
                                          std::vector<SuppressionWarning>* warnings = nullptr);

bool comment_applies(const SourceComment& comment, std::string_view checker_id);

SuppressionLookup find_source_review(const SourceView& source, uint32_t line_no,
                                     std::string_view checker_id);

}  // namespace triage
