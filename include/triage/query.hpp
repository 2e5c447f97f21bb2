#pragma once

// triage/query.hpp: Read side: listings, diffs and their renderings.
//
// Every result renders as canonical JSON (sorted keys, jsonlite) and as
// plain text, one report per line:
//
//   file:line:column: [checker] message [detection/review] fingerprint

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "triage/diff.hpp"
#include "triage/ingestion.hpp"
#include "triage/report_store.hpp"
#include "triage/types.hpp"

namespace triage {

struct ListOptions {
  bool dedup{true};
  bool unique{false};
  bool across_runs{false};
  // Empty means every detection status.
  std::set<DetectionStatus> detection_filter;
  bool include_suppressed{false};
  bool stable_order{true};
};

class QueryService {
 public:
  explicit QueryService(ReportStore& store) : store_(store) {}

  std::optional<std::vector<ReportEntry>> list_reports(const std::vector<std::string>& runs,
                                                       const ListOptions& options, Error* error) const;

  std::optional<DiffResult> diff(const ReportSource& baseline, const ReportSource& new_side, DiffMode mode,
                                 const DiffOptions& options, Error* error) const;

  std::optional<RunInfo> get_run(const std::string& name, Error* error) const;
  std::vector<RunInfo> list_runs(Error* error) const;
  std::vector<RunHistoryEntry> run_history(const std::string& name, Error* error) const;

  bool set_review_status(const std::string& fingerprint, ReviewStatus status, const std::string& message,
                         const std::string& author, Error* error);

 private:
  ReportStore& store_;
};

// Entries for a bundle that was never stored, as a local diff side.
std::vector<ReportEntry> build_local_entries(const FindingsBundle& bundle);

std::string entries_to_json(const std::vector<ReportEntry>& entries);
std::string entries_to_plaintext(const std::vector<ReportEntry>& entries);

std::string diff_to_json(const DiffResult& result, DiffMode mode);
std::string diff_to_plaintext(const DiffResult& result, DiffMode mode);

std::string run_to_json(const RunInfo& run);
std::string runs_to_json(const std::vector<RunInfo>& runs);
std::string runs_to_plaintext(const std::vector<RunInfo>& runs);
std::string history_to_json(const std::vector<RunHistoryEntry>& history);

std::string commit_summary_to_json(const CommitSummary& summary);

}  // namespace triage
