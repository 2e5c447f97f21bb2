#include "triage/query.hpp"

#include <algorithm>
#include <map>

#include "triage/dedup.hpp"
#include "triage/fingerprint.hpp"
#include "triage/jsonlite.hpp"
#include "triage/suppression.hpp"

namespace triage {

namespace {

jsonlite::Value entry_value(const ReportEntry& e) {
  jsonlite::Object o;
  o["run"] = jsonlite::str(e.run);
  o["fingerprint"] = jsonlite::str(e.fingerprint);
  o["compilation_unit"] = jsonlite::str(e.compilation_unit);
  o["checker_id"] = jsonlite::str(e.checker_id);
  o["file"] = jsonlite::str(e.file);
  o["line"] = jsonlite::num(e.line);
  o["column"] = jsonlite::num(e.column);
  o["severity"] = jsonlite::str(to_string(e.severity));
  o["message"] = jsonlite::str(e.message);
  o["path_hash"] = jsonlite::str(e.path_hash);
  o["detection_status"] = jsonlite::str(to_string(e.detection_status));
  o["review_status"] = jsonlite::str(to_string(e.review_status));
  return jsonlite::Value{std::move(o)};
}

jsonlite::Value entries_value(const std::vector<ReportEntry>& entries) {
  jsonlite::Array arr;
  arr.reserve(entries.size());
  for (const auto& e : entries) arr.push_back(entry_value(e));
  return jsonlite::Value{std::move(arr)};
}

jsonlite::Value run_value(const RunInfo& run) {
  jsonlite::Object counts;
  for (const auto& [status, n] : run.status_counts) counts[to_string(status)] = jsonlite::num(n);
  jsonlite::Object o;
  o["name"] = jsonlite::str(run.name);
  o["generation"] = jsonlite::num(run.generation);
  o["created_at"] = jsonlite::num(run.created_at);
  o["updated_at"] = jsonlite::num(run.updated_at);
  o["latest_tag"] = jsonlite::str(run.latest_tag);
  o["status_counts"] = jsonlite::Value{std::move(counts)};
  return jsonlite::Value{std::move(o)};
}

std::string entry_line(const ReportEntry& e) {
  return e.file + ":" + std::to_string(e.line) + ":" + std::to_string(e.column) + ": [" + e.checker_id + "] " +
         e.message + " [" + to_string(e.detection_status) + "/" + to_string(e.review_status) + "] " +
         e.fingerprint + "\n";
}

}  // namespace

// ---------------------------------------------------------------------------
// QueryService
// ---------------------------------------------------------------------------

std::optional<std::vector<ReportEntry>> QueryService::list_reports(const std::vector<std::string>& runs,
                                                                   const ListOptions& options,
                                                                   Error* error) const {
  auto entries = store_.report_entries(runs, error);
  if (!entries) return std::nullopt;

  entries->erase(std::remove_if(entries->begin(), entries->end(),
                                [&](const ReportEntry& e) {
                                  if (!options.detection_filter.empty() &&
                                      options.detection_filter.count(e.detection_status) == 0) {
                                    return true;
                                  }
                                  return !options.include_suppressed && is_suppressing(e.review_status);
                                }),
                 entries->end());

  std::vector<ReportEntry> out = std::move(*entries);
  if (options.dedup) out = deduplicate(out);
  if (options.unique) out = uniqueify(out, options.across_runs);
  if (options.stable_order) sort_stable(out);
  return out;
}

std::optional<DiffResult> QueryService::diff(const ReportSource& baseline, const ReportSource& new_side,
                                             DiffMode mode, const DiffOptions& options, Error* error) const {
  return triage::diff(store_, baseline, new_side, mode, options, error);
}

std::optional<RunInfo> QueryService::get_run(const std::string& name, Error* error) const {
  return store_.get_run(name, error);
}

std::vector<RunInfo> QueryService::list_runs(Error* error) const {
  return store_.list_runs(error);
}

std::vector<RunHistoryEntry> QueryService::run_history(const std::string& name, Error* error) const {
  return store_.run_history(name, error);
}

bool QueryService::set_review_status(const std::string& fingerprint, ReviewStatus status,
                                     const std::string& message, const std::string& author, Error* error) {
  return store_.set_review_status(fingerprint, status, message, author, error);
}

// ---------------------------------------------------------------------------
// Local entries
// ---------------------------------------------------------------------------

std::vector<ReportEntry> build_local_entries(const FindingsBundle& bundle) {
  std::map<std::string, SourceView> views;
  for (const auto& [path, text] : bundle.sources) views.emplace(path, SourceView(text));

  static const SourceView kNoSource;
  std::vector<ReportEntry> out;
  for (const auto& unit : bundle.units) {
    for (const auto& f : unit.findings) {
      auto it = views.find(f.file);
      const SourceView& view = it == views.end() ? kNoSource : it->second;
      const Fingerprint fp = compute_fingerprint(f, view);

      ReportEntry e;
      e.fingerprint = fp.value;
      e.compilation_unit = unit.compilation_unit;
      e.checker_id = f.checker_id;
      e.file = f.file;
      e.line = f.line;
      e.column = f.column;
      e.severity = f.severity;
      e.message = f.message;
      e.path_hash = report_path_hash(f, fp.value);
      if (!view.empty()) {
        auto lookup = find_source_review(view, f.line, f.checker_id);
        if (lookup.review) e.review_status = lookup.review->status;
      }
      out.push_back(std::move(e));
    }
  }
  return out;
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

std::string entries_to_json(const std::vector<ReportEntry>& entries) {
  return jsonlite::to_json(entries_value(entries));
}

std::string entries_to_plaintext(const std::vector<ReportEntry>& entries) {
  std::string out;
  for (const auto& e : entries) out += entry_line(e);
  return out;
}

std::string diff_to_json(const DiffResult& result, DiffMode mode) {
  jsonlite::Object o;
  o["mode"] = jsonlite::str(to_string(mode));
  if (mode == DiffMode::New || mode == DiffMode::All) o["new"] = entries_value(result.new_reports);
  if (mode == DiffMode::Resolved || mode == DiffMode::All) o["resolved"] = entries_value(result.resolved);
  if (mode == DiffMode::Unresolved || mode == DiffMode::All) o["unresolved"] = entries_value(result.unresolved);
  return jsonlite::to_json(o);
}

std::string diff_to_plaintext(const DiffResult& result, DiffMode mode) {
  std::string out;
  auto section = [&](const char* title, const std::vector<ReportEntry>& entries) {
    out += std::string("== ") + title + " (" + std::to_string(entries.size()) + ")\n";
    out += entries_to_plaintext(entries);
  };
  if (mode == DiffMode::New || mode == DiffMode::All) section("new", result.new_reports);
  if (mode == DiffMode::Resolved || mode == DiffMode::All) section("resolved", result.resolved);
  if (mode == DiffMode::Unresolved || mode == DiffMode::All) section("unresolved", result.unresolved);
  return out;
}

std::string run_to_json(const RunInfo& run) {
  return jsonlite::to_json(run_value(run));
}

std::string runs_to_json(const std::vector<RunInfo>& runs) {
  jsonlite::Array arr;
  for (const auto& r : runs) arr.push_back(run_value(r));
  return jsonlite::to_json(jsonlite::Value{std::move(arr)});
}

std::string runs_to_plaintext(const std::vector<RunInfo>& runs) {
  std::string out;
  for (const auto& r : runs) {
    out += r.name + "  generation " + std::to_string(r.generation);
    if (!r.latest_tag.empty()) out += "  tag " + r.latest_tag;
    for (const auto& [status, n] : r.status_counts) out += "  " + to_string(status) + "=" + std::to_string(n);
    out += "\n";
  }
  return out;
}

std::string history_to_json(const std::vector<RunHistoryEntry>& history) {
  jsonlite::Array arr;
  for (const auto& h : history) {
    jsonlite::Object o;
    o["generation"] = jsonlite::num(h.generation);
    o["tag"] = jsonlite::str(h.tag);
    o["committed_at"] = jsonlite::num(h.committed_at);
    o["new"] = jsonlite::num(h.new_count);
    o["unresolved"] = jsonlite::num(h.unresolved_count);
    o["resolved"] = jsonlite::num(h.resolved_count);
    o["reopened"] = jsonlite::num(h.reopened_count);
    o["enabled_checkers"] = jsonlite::string_array(h.enabled_checkers);
    o["disabled_checkers"] = jsonlite::string_array(h.disabled_checkers);
    arr.push_back(jsonlite::Value{std::move(o)});
  }
  return jsonlite::to_json(jsonlite::Value{std::move(arr)});
}

std::string commit_summary_to_json(const CommitSummary& s) {
  jsonlite::Object o;
  o["run"] = jsonlite::str(s.run);
  o["generation"] = jsonlite::num(s.generation);
  o["total"] = jsonlite::num(s.total);
  o["new"] = jsonlite::num(s.new_count);
  o["unresolved"] = jsonlite::num(s.unresolved_count);
  o["reopened"] = jsonlite::num(s.reopened_count);
  o["resolved"] = jsonlite::num(s.resolved_count);
  o["off"] = jsonlite::num(s.off_count);
  o["unavailable"] = jsonlite::num(s.unavailable_count);
  o["source_reviews"] = jsonlite::num(s.source_reviews);
  return jsonlite::to_json(o);
}

}  // namespace triage
