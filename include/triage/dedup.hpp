#pragma once

// triage/dedup.hpp: Deduplication and uniqueing of report entries.
//
// deduplicate(): literal repeats collapse. Two entries are repeats when they
//   share (run, fingerprint, compilation unit). A finding in a header seen
//   from N translation units stays N entries.
//
// uniqueify(): at most one entry per fingerprint, per run or across runs.
//
// Both are pure. The representative of a group is its first-seen location:
// smallest file path, then line, column, compilation unit and run. Output is
// ordered by fingerprint, then representative file path, and does not depend
// on input order.

#include <vector>

#include "triage/types.hpp"

namespace triage {

std::vector<ReportEntry> deduplicate(const std::vector<ReportEntry>& entries);

std::vector<ReportEntry> uniqueify(const std::vector<ReportEntry>& entries, bool across_runs = false);

// Ordering used by stable listings: file path, line, fingerprint.
void sort_stable(std::vector<ReportEntry>& entries);

}  // namespace triage
