#pragma once

// triage/diff.hpp: Set difference of two report sources by fingerprint.
//
//   new        = F(new side) - F(baseline)
//   resolved   = F(baseline) - F(new side)
//   unresolved = F(baseline) & F(new side)
//
// A stored side contributes only active reports whose review status does not
// suppress them. A local side is never filtered by review status, except when
// the other side is stored: fingerprints suppressed in the store are then
// removed from the local side too, so a suppressed finding lands in no
// category.
//
// Entries of `new_reports` and `unresolved` come from the new side, entries
// of `resolved` from the baseline. Every category is deduplicated.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "triage/types.hpp"

namespace triage {

class ReportStore;

enum class DiffMode { New, Resolved, Unresolved, All };

std::string to_string(DiffMode mode);
std::optional<DiffMode> parse_diff_mode(std::string_view s);

struct ReportSource {
  enum class Kind { local, stored };

  Kind kind{Kind::local};
  std::vector<ReportEntry> entries;  // local
  std::vector<std::string> runs;     // stored

  static ReportSource local(std::vector<ReportEntry> entries);
  static ReportSource stored(std::vector<std::string> runs);
};

struct DiffOptions {
  bool unique{false};
  bool stable_order{true};
};

struct DiffResult {
  std::vector<ReportEntry> new_reports;
  std::vector<ReportEntry> resolved;
  std::vector<ReportEntry> unresolved;
};

// Keeps the entries a stored side contributes to a diff.
std::vector<ReportEntry> active_entries(const std::vector<ReportEntry>& entries);

// Diff of two already materialized sides; no filtering is applied.
DiffResult diff_entries(const std::vector<ReportEntry>& baseline, const std::vector<ReportEntry>& new_side,
                        DiffMode mode, const DiffOptions& options);

// Resolves stored sides against the store, then diffs.
std::optional<DiffResult> diff(const ReportStore& store, const ReportSource& baseline,
                               const ReportSource& new_side, DiffMode mode, const DiffOptions& options,
                               Error* error);

}  // namespace triage
