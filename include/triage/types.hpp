#pragma once

// triage/types.hpp: Core data structures for the triage report engine.
//
// STATUS MODEL:
//   DetectionStatus is the lifecycle of a fingerprint inside one run.
//   ReviewStatus is a judgment attached to a fingerprint across all runs.
//   Both are closed enumerations. Every change of DetectionStatus goes through
//   the transition functions below; no caller assigns statuses ad hoc.
//
// MEMORY OWNERSHIP:
//   All types are value types with owned strings. Nothing here borrows.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace triage {

enum class ErrorCode {
  none,
  identity_ambiguous,
  storage_conflict,
  blob_not_found,
  ingestion_incomplete,
  schema_version_mismatch,
  invalid_handle,
  run_not_found,
  database_error,
  io_error,
  json_parse_error,
  json_duplicate_key,
  config_invalid,
  invalid_argument,
};

std::string to_string(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::none};
  std::string message;

  explicit operator bool() const { return code != ErrorCode::none; }
};

// Writes {code, message} to *out when out is non-null.
void set_error(Error* out, ErrorCode code, std::string message);

// ---------------------------------------------------------------------------
// Status enumerations
// ---------------------------------------------------------------------------

enum class DetectionStatus { New, Unresolved, Resolved, Reopened, Off, Unavailable };

enum class ReviewStatus { Unreviewed, Confirmed, FalsePositive, Intentional };

enum class Severity { Unspecified, Style, Low, Medium, High, Critical };

// scoped: identity includes an enclosing scope chain.
// file_level: fallback identity from checker id and line text only.
enum class IdentityConfidence { scoped, file_level };

std::string to_string(DetectionStatus s);
std::string to_string(ReviewStatus s);
std::string to_string(Severity s);
std::string to_string(IdentityConfidence c);

std::optional<DetectionStatus> parse_detection_status(std::string_view s);
std::optional<ReviewStatus> parse_review_status(std::string_view s);
std::optional<Severity> parse_severity(std::string_view s);
std::optional<IdentityConfidence> parse_identity_confidence(std::string_view s);

// New, Unresolved and Reopened reports are active.
bool is_active(DetectionStatus s);

// FalsePositive and Intentional take a fingerprint out of active listings.
bool is_suppressing(ReviewStatus s);

// ---------------------------------------------------------------------------
// Detection status transition table
// ---------------------------------------------------------------------------
//
//   previous      | present in new generation | absent from new generation
//   --------------+---------------------------+----------------------------
//   (none)        | New                       | -
//   New           | Unresolved                | Resolved / Off / Unavailable
//   Unresolved    | Unresolved                | Resolved / Off / Unavailable
//   Reopened      | Unresolved                | Resolved / Off / Unavailable
//   Resolved      | Reopened                  | Resolved
//   Off           | Unresolved                | Off
//   Unavailable   | Unresolved                | Unavailable

enum class VanishCause {
  fixed,                // checker ran and no longer reports the fingerprint
  checker_disabled,     // checker explicitly disabled for the generation
  checker_unavailable,  // checker absent from the generation's enabled set
};

DetectionStatus status_when_present(std::optional<DetectionStatus> previous);
DetectionStatus status_when_vanished(DetectionStatus previous, VanishCause cause);

// ---------------------------------------------------------------------------
// Findings, reports and runs
// ---------------------------------------------------------------------------

struct BugPathEvent {
  std::string file;
  uint32_t line{0};
  uint32_t column{0};
  std::string message;
};

// One finding as produced by an analyzer for one compilation unit.
struct Finding {
  std::string checker_id;
  std::string file;
  uint32_t line{0};
  uint32_t column{0};
  Severity severity{Severity::Unspecified};
  std::string message;
  std::vector<BugPathEvent> bug_path;
  std::string scope_text;  // enclosing scope supplied by the analyzer, may be empty
};

struct Occurrence {
  std::string compilation_unit;
  std::string file;
  uint32_t line{0};
  uint32_t column{0};
  std::string path_hash;
};

// Review status derived from an in-source comment.
struct SourceReview {
  ReviewStatus status{ReviewStatus::Unreviewed};
  std::string message;
  uint32_t line{0};
};

struct Report {
  std::string fingerprint;
  std::string blob_id;
  std::string file;
  uint32_t line{0};
  uint32_t column{0};
  std::string checker_id;
  Severity severity{Severity::Unspecified};
  std::string message;
  std::vector<BugPathEvent> bug_path;
  std::string path_hash;
  IdentityConfidence confidence{IdentityConfidence::scoped};
  std::string scope;

  DetectionStatus detection_status{DetectionStatus::New};
  ReviewStatus review_status{ReviewStatus::Unreviewed};
  uint64_t detected_generation{0};
  uint64_t fixed_generation{0};  // 0 while active
  uint64_t last_seen_generation{0};

  std::vector<Occurrence> occurrences;
  std::optional<SourceReview> source_review;
};

// Flattened, displayable record: one per (report, occurrence).
// This is the unit the dedup and diff engines operate on.
struct ReportEntry {
  std::string run;
  std::string fingerprint;
  std::string compilation_unit;
  std::string checker_id;
  std::string file;
  uint32_t line{0};
  uint32_t column{0};
  Severity severity{Severity::Unspecified};
  std::string message;
  std::string path_hash;
  DetectionStatus detection_status{DetectionStatus::New};
  ReviewStatus review_status{ReviewStatus::Unreviewed};
};

struct RunInfo {
  int64_t id{0};
  std::string name;
  uint64_t generation{0};
  uint64_t created_at{0};
  uint64_t updated_at{0};
  std::string latest_tag;
  std::map<DetectionStatus, uint64_t> status_counts;
};

struct RunHistoryEntry {
  uint64_t generation{0};
  std::string tag;
  uint64_t committed_at{0};
  uint64_t new_count{0};
  uint64_t unresolved_count{0};
  uint64_t resolved_count{0};
  uint64_t reopened_count{0};
  std::vector<std::string> enabled_checkers;
  std::vector<std::string> disabled_checkers;
};

struct ReviewRecord {
  std::string fingerprint;
  ReviewStatus status{ReviewStatus::Unreviewed};
  std::string message;
  std::string author;
  uint64_t updated_at{0};
  bool from_source{false};
};

}  // namespace triage
