#include "triage/diff.hpp"

#include <algorithm>
#include <set>

#include "triage/dedup.hpp"
#include "triage/observability.hpp"
#include "triage/report_store.hpp"

namespace triage {

namespace {

std::set<std::string> fingerprints_of(const std::vector<ReportEntry>& entries) {
  std::set<std::string> out;
  for (const auto& e : entries) out.insert(e.fingerprint);
  return out;
}

std::vector<ReportEntry> select(const std::vector<ReportEntry>& entries, const std::set<std::string>& other,
                                bool in_other) {
  std::vector<ReportEntry> out;
  for (const auto& e : entries) {
    if ((other.count(e.fingerprint) != 0) == in_other) out.push_back(e);
  }
  return out;
}

// Literal repeats (a unit logged twice) always collapse.
void finish_category(std::vector<ReportEntry>& entries, const DiffOptions& options) {
  entries = deduplicate(entries);
  if (options.unique) entries = uniqueify(entries, /*across_runs=*/true);
  if (options.stable_order) sort_stable(entries);
}

}  // namespace

std::string to_string(DiffMode mode) {
  switch (mode) {
    case DiffMode::New: return "new";
    case DiffMode::Resolved: return "resolved";
    case DiffMode::Unresolved: return "unresolved";
    case DiffMode::All: return "all";
  }
  return "all";
}

std::optional<DiffMode> parse_diff_mode(std::string_view s) {
  if (s == "new") return DiffMode::New;
  if (s == "resolved") return DiffMode::Resolved;
  if (s == "unresolved") return DiffMode::Unresolved;
  if (s == "all") return DiffMode::All;
  return std::nullopt;
}

ReportSource ReportSource::local(std::vector<ReportEntry> entries) {
  ReportSource s;
  s.kind = Kind::local;
  s.entries = std::move(entries);
  return s;
}

ReportSource ReportSource::stored(std::vector<std::string> runs) {
  ReportSource s;
  s.kind = Kind::stored;
  s.runs = std::move(runs);
  return s;
}

std::vector<ReportEntry> active_entries(const std::vector<ReportEntry>& entries) {
  std::vector<ReportEntry> out;
  for (const auto& e : entries) {
    if (is_active(e.detection_status) && !is_suppressing(e.review_status)) out.push_back(e);
  }
  return out;
}

DiffResult diff_entries(const std::vector<ReportEntry>& baseline, const std::vector<ReportEntry>& new_side,
                        DiffMode mode, const DiffOptions& options) {
  const auto base_fps = fingerprints_of(baseline);
  const auto new_fps = fingerprints_of(new_side);

  DiffResult result;
  if (mode == DiffMode::New || mode == DiffMode::All) {
    result.new_reports = select(new_side, base_fps, false);
    finish_category(result.new_reports, options);
  }
  if (mode == DiffMode::Resolved || mode == DiffMode::All) {
    result.resolved = select(baseline, new_fps, false);
    finish_category(result.resolved, options);
  }
  if (mode == DiffMode::Unresolved || mode == DiffMode::All) {
    result.unresolved = select(new_side, base_fps, true);
    finish_category(result.unresolved, options);
  }
  global_store_stats().diffs_computed.fetch_add(1, std::memory_order_relaxed);
  return result;
}

std::optional<DiffResult> diff(const ReportStore& store, const ReportSource& baseline,
                               const ReportSource& new_side, DiffMode mode, const DiffOptions& options,
                               Error* error) {
  auto materialize = [&](const ReportSource& side) -> std::optional<std::vector<ReportEntry>> {
    if (side.kind == ReportSource::Kind::local) return side.entries;
    auto entries = store.report_entries(side.runs, error);
    if (!entries) return std::nullopt;
    return active_entries(*entries);
  };

  auto base = materialize(baseline);
  if (!base) return std::nullopt;
  auto next = materialize(new_side);
  if (!next) return std::nullopt;

  // Exactly one side stored: hide store-suppressed fingerprints on the local one.
  if (baseline.kind != new_side.kind) {
    auto suppressed = store.suppressed_fingerprints(error);
    if (!suppressed) return std::nullopt;
    auto& local = baseline.kind == ReportSource::Kind::local ? *base : *next;
    local.erase(std::remove_if(local.begin(), local.end(),
                               [&](const ReportEntry& e) { return suppressed->count(e.fingerprint) != 0; }),
                local.end());
  }
  return diff_entries(*base, *next, mode, options);
}

}  // namespace triage
