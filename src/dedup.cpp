#include "triage/dedup.hpp"

#include <algorithm>
#include <map>
#include <tuple>

namespace triage {

namespace {

bool first_seen_less(const ReportEntry& a, const ReportEntry& b) {
  return std::tie(a.file, a.line, a.column, a.compilation_unit, a.run) <
         std::tie(b.file, b.line, b.column, b.compilation_unit, b.run);
}

// Keeps the first-seen entry per key, then orders by fingerprint and path.
template <typename Key, typename KeyFn>
std::vector<ReportEntry> collapse(const std::vector<ReportEntry>& entries, KeyFn key_of) {
  std::map<Key, const ReportEntry*> groups;
  for (const auto& e : entries) {
    auto [it, inserted] = groups.emplace(key_of(e), &e);
    if (!inserted && first_seen_less(e, *it->second)) it->second = &e;
  }

  std::vector<ReportEntry> out;
  out.reserve(groups.size());
  for (const auto& [key, e] : groups) out.push_back(*e);
  std::sort(out.begin(), out.end(), [](const ReportEntry& a, const ReportEntry& b) {
    if (a.fingerprint != b.fingerprint) return a.fingerprint < b.fingerprint;
    return first_seen_less(a, b);
  });
  return out;
}

}  // namespace

std::vector<ReportEntry> deduplicate(const std::vector<ReportEntry>& entries) {
  using Key = std::tuple<std::string, std::string, std::string>;
  return collapse<Key>(entries, [](const ReportEntry& e) {
    return Key{e.run, e.fingerprint, e.compilation_unit};
  });
}

std::vector<ReportEntry> uniqueify(const std::vector<ReportEntry>& entries, bool across_runs) {
  using Key = std::pair<std::string, std::string>;
  return collapse<Key>(entries, [across_runs](const ReportEntry& e) {
    return Key{across_runs ? std::string() : e.run, e.fingerprint};
  });
}

void sort_stable(std::vector<ReportEntry>& entries) {
  std::stable_sort(entries.begin(), entries.end(), [](const ReportEntry& a, const ReportEntry& b) {
    return std::tie(a.file, a.line, a.fingerprint) < std::tie(b.file, b.line, b.fingerprint);
  });
}

}  // namespace triage
