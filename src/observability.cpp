#include "triage/observability.hpp"

#include <bit>
#include <cstdio>
#include <ctime>

#include "triage/jsonlite.hpp"

namespace triage {

namespace {

// bit_width gives floor(log2(x)) + 1, i.e. the bucket index, for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::mutex g_sink_mu;
std::string g_event_log_path;
std::string g_log_path;
std::atomic<int> g_log_level{static_cast<int>(LogLevel::info)};
std::atomic<IngestionEventHook> g_event_hook{nullptr};

// O_APPEND writes below PIPE_BUF are atomic on POSIX; the mutex keeps longer
// lines from interleaving within this process.
void append_line(const std::string& path, const std::string& line) {
  if (FILE* f = std::fopen(path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "info";
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
  if (s == "debug") return LogLevel::debug;
  if (s == "info") return LogLevel::info;
  if (s == "warn" || s == "warning") return LogLevel::warn;
  if (s == "error") return LogLevel::error;
  return std::nullopt;
}

std::string event_to_json(const IngestionEvent& ev) {
  jsonlite::Object o;
  o["run"] = jsonlite::str(ev.run);
  o["tag"] = jsonlite::str(ev.tag);
  o["generation"] = jsonlite::num(ev.generation);
  o["outcome"] = jsonlite::str(ev.outcome);
  o["error_code"] = jsonlite::str(ev.error_code);
  o["duration_ns"] = jsonlite::num(ev.duration_ns);
  o["commit_ns"] = jsonlite::num(ev.commit_ns);
  o["attempts"] = jsonlite::num(ev.attempts);
  o["submissions"] = jsonlite::num(ev.submissions);
  o["reports"] = jsonlite::num(ev.reports);
  o["new"] = jsonlite::num(ev.new_count);
  o["unresolved"] = jsonlite::num(ev.unresolved_count);
  o["resolved"] = jsonlite::num(ev.resolved_count);
  o["reopened"] = jsonlite::num(ev.reopened_count);
  o["v"] = jsonlite::num(1);
  return jsonlite::to_json(o);
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  const size_t b = bucket_for_us(us);
  buckets_[b].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
  }

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      const double bucket_lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double bucket_hi = static_cast<double>(1ULL << i);
      return (bucket_lo + bucket_hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  out += ",\"p50_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += ",\"p99_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.99));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// StoreStats
// ---------------------------------------------------------------------------

void StoreStats::record_ingestion(const IngestionEvent& ev) {
  if (ev.outcome == "committed") {
    commits.fetch_add(1, std::memory_order_relaxed);
    commit_latency.record(ev.commit_ns);
    // Every attempt before the successful one lost a generation race.
    if (ev.attempts > 1) conflicts.fetch_add(ev.attempts - 1, std::memory_order_relaxed);
  } else {
    aborts.fetch_add(1, std::memory_order_relaxed);
    if (ev.outcome == "incomplete") incomplete_ingestions.fetch_add(1, std::memory_order_relaxed);
    if (ev.outcome == "conflict") conflicts.fetch_add(ev.attempts, std::memory_order_relaxed);
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
    ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  }
}

std::vector<IngestionEvent> StoreStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  std::vector<IngestionEvent> out;
  out.reserve(ring_buffer_.size());
  // Oldest first.
  for (size_t i = 0; i < ring_buffer_.size(); ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % ring_buffer_.size()]);
  }
  return out;
}

std::string StoreStats::to_json() const {
  std::string out;
  out.reserve(768);
  char buf[64];

  const uint64_t puts = blob_puts.load(std::memory_order_relaxed);
  const uint64_t hits = blob_hits.load(std::memory_order_relaxed);
  const double dedupe_ratio = (puts + hits > 0)
      ? (static_cast<double>(hits) / static_cast<double>(puts + hits))
      : 0.0;

  out += "{\"ingestion\":{\"commits\":";
  out += std::to_string(commits.load(std::memory_order_relaxed));
  out += ",\"conflicts\":";
  out += std::to_string(conflicts.load(std::memory_order_relaxed));
  out += ",\"aborts\":";
  out += std::to_string(aborts.load(std::memory_order_relaxed));
  out += ",\"incomplete\":";
  out += std::to_string(incomplete_ingestions.load(std::memory_order_relaxed));
  out += ",\"dropped_submissions\":";
  out += std::to_string(dropped_submissions.load(std::memory_order_relaxed));
  out += "}";

  out += ",\"reports\":{\"added\":";
  out += std::to_string(reports_added.load(std::memory_order_relaxed));
  out += ",\"merged\":";
  out += std::to_string(reports_merged.load(std::memory_order_relaxed));
  out += "}";

  out += ",\"blobs\":{\"puts\":";
  out += std::to_string(puts);
  out += ",\"hits\":";
  out += std::to_string(hits);
  out += ",\"misses\":";
  out += std::to_string(blob_misses.load(std::memory_order_relaxed));
  out += ",\"integrity_failures\":";
  out += std::to_string(blob_integrity_failures.load(std::memory_order_relaxed));
  out += ",\"dedupe_ratio\":";
  std::snprintf(buf, sizeof(buf), "%.6f", dedupe_ratio);
  out += buf;
  out += "}";

  out += ",\"identity\":{\"computed\":";
  out += std::to_string(fingerprints_computed.load(std::memory_order_relaxed));
  out += ",\"fallbacks\":";
  out += std::to_string(identity_fallbacks.load(std::memory_order_relaxed));
  out += ",\"suppression_warnings\":";
  out += std::to_string(suppression_warnings.load(std::memory_order_relaxed));
  out += "}";

  out += ",\"diffs_computed\":";
  out += std::to_string(diffs_computed.load(std::memory_order_relaxed));

  out += ",\"commit_latency\":";
  out += commit_latency.to_json();

  out += ",\"recent_events\":[";
  bool first = true;
  for (const auto& ev : recent_events_snapshot()) {
    if (!first) out += ',';
    first = false;
    out += event_to_json(ev);
  }
  out += "]}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

StoreStats& global_store_stats() {
  static StoreStats inst;
  return inst;
}

void set_ingestion_event_hook(IngestionEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_event_log_path = path;
}

void emit_ingestion_event(const IngestionEvent& ev) {
  global_store_stats().record_ingestion(ev);

  IngestionEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (g_event_log_path.empty()) return;
  append_line(g_event_log_path, event_to_json(ev) + "\n");
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

void set_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_log_path = path;
}

void log_message(LogLevel level, std::string_view component, std::string_view message) {
  if (static_cast<int>(level) < g_log_level.load(std::memory_order_relaxed)) return;

  jsonlite::Object o;
  o["ts"] = jsonlite::num(static_cast<uint64_t>(std::time(nullptr)));
  o["level"] = jsonlite::str(to_string(level));
  o["component"] = jsonlite::str(std::string(component));
  o["msg"] = jsonlite::str(std::string(message));
  const std::string line = jsonlite::to_json(o) + "\n";

  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (g_log_path.empty()) {
    std::fwrite(line.data(), 1, line.size(), stderr);
    return;
  }
  append_line(g_log_path, line);
}

}  // namespace triage
