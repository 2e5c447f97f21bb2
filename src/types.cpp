#include "triage/types.hpp"

namespace triage {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::identity_ambiguous: return "identity_ambiguous";
    case ErrorCode::storage_conflict: return "storage_conflict";
    case ErrorCode::blob_not_found: return "blob_not_found";
    case ErrorCode::ingestion_incomplete: return "ingestion_incomplete";
    case ErrorCode::schema_version_mismatch: return "schema_version_mismatch";
    case ErrorCode::invalid_handle: return "invalid_handle";
    case ErrorCode::run_not_found: return "run_not_found";
    case ErrorCode::database_error: return "database_error";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::invalid_argument: return "invalid_argument";
  }
  return "";
}

void set_error(Error* out, ErrorCode code, std::string message) {
  if (!out) return;
  out->code = code;
  out->message = std::move(message);
}

std::string to_string(DetectionStatus s) {
  switch (s) {
    case DetectionStatus::New: return "new";
    case DetectionStatus::Unresolved: return "unresolved";
    case DetectionStatus::Resolved: return "resolved";
    case DetectionStatus::Reopened: return "reopened";
    case DetectionStatus::Off: return "off";
    case DetectionStatus::Unavailable: return "unavailable";
  }
  return "new";
}

std::string to_string(ReviewStatus s) {
  switch (s) {
    case ReviewStatus::Unreviewed: return "unreviewed";
    case ReviewStatus::Confirmed: return "confirmed";
    case ReviewStatus::FalsePositive: return "false_positive";
    case ReviewStatus::Intentional: return "intentional";
  }
  return "unreviewed";
}

std::string to_string(Severity s) {
  switch (s) {
    case Severity::Unspecified: return "unspecified";
    case Severity::Style: return "style";
    case Severity::Low: return "low";
    case Severity::Medium: return "medium";
    case Severity::High: return "high";
    case Severity::Critical: return "critical";
  }
  return "unspecified";
}

std::string to_string(IdentityConfidence c) {
  return c == IdentityConfidence::scoped ? "scoped" : "file_level";
}

std::optional<DetectionStatus> parse_detection_status(std::string_view s) {
  if (s == "new") return DetectionStatus::New;
  if (s == "unresolved") return DetectionStatus::Unresolved;
  if (s == "resolved") return DetectionStatus::Resolved;
  if (s == "reopened") return DetectionStatus::Reopened;
  if (s == "off") return DetectionStatus::Off;
  if (s == "unavailable") return DetectionStatus::Unavailable;
  return std::nullopt;
}

std::optional<ReviewStatus> parse_review_status(std::string_view s) {
  if (s == "unreviewed") return ReviewStatus::Unreviewed;
  if (s == "confirmed") return ReviewStatus::Confirmed;
  if (s == "false_positive") return ReviewStatus::FalsePositive;
  if (s == "intentional") return ReviewStatus::Intentional;
  return std::nullopt;
}

std::optional<Severity> parse_severity(std::string_view s) {
  if (s.empty() || s == "unspecified") return Severity::Unspecified;
  if (s == "style") return Severity::Style;
  if (s == "low") return Severity::Low;
  if (s == "medium") return Severity::Medium;
  if (s == "high") return Severity::High;
  if (s == "critical") return Severity::Critical;
  return std::nullopt;
}

std::optional<IdentityConfidence> parse_identity_confidence(std::string_view s) {
  if (s == "scoped") return IdentityConfidence::scoped;
  if (s == "file_level") return IdentityConfidence::file_level;
  return std::nullopt;
}

bool is_active(DetectionStatus s) {
  return s == DetectionStatus::New || s == DetectionStatus::Unresolved ||
         s == DetectionStatus::Reopened;
}

bool is_suppressing(ReviewStatus s) {
  return s == ReviewStatus::FalsePositive || s == ReviewStatus::Intentional;
}

DetectionStatus status_when_present(std::optional<DetectionStatus> previous) {
  if (!previous) return DetectionStatus::New;
  if (*previous == DetectionStatus::Resolved) return DetectionStatus::Reopened;
  return DetectionStatus::Unresolved;
}

DetectionStatus status_when_vanished(DetectionStatus previous, VanishCause cause) {
  if (!is_active(previous)) return previous;
  switch (cause) {
    case VanishCause::fixed: return DetectionStatus::Resolved;
    case VanishCause::checker_disabled: return DetectionStatus::Off;
    case VanishCause::checker_unavailable: return DetectionStatus::Unavailable;
  }
  return DetectionStatus::Resolved;
}

}  // namespace triage
