#pragma once

// triage/observability.hpp: Structured logging and ingestion statistics.
//
// DESIGN:
//   IngestionEvent is the canonical observable unit. Every finalize() or
//   cancel() of an ingestion session emits one IngestionEvent, which is
//   recorded in StoreStats and appended as one JSON line to the event log
//   when one is configured.
//
//   log_message() writes one JSON line per message to the log sink (stderr
//   unless a log file is configured). Messages below the configured level
//   are dropped before formatting.
//
// EXTENSION_POINT: event_exporter
//   Register a hook via set_ingestion_event_hook() to forward events to an
//   external collector instead of the NDJSON file.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "triage/types.hpp"

namespace triage {

enum class LogLevel { debug, info, warn, error };

std::string to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view s);

// ---------------------------------------------------------------------------
// IngestionEvent: per-session observable unit
// ---------------------------------------------------------------------------
struct IngestionEvent {
  std::string run;
  std::string tag;
  uint64_t generation{0};
  std::string outcome;           // committed | aborted | incomplete | conflict | failed
  std::string error_code;

  uint64_t duration_ns{0};       // open() to finalize() wall-clock
  uint64_t commit_ns{0};         // final commit transaction only
  uint32_t attempts{0};          // commit attempts including conflict retries

  size_t submissions{0};
  size_t reports{0};
  size_t new_count{0};
  size_t unresolved_count{0};
  size_t resolved_count{0};
  size_t reopened_count{0};
};

std::string event_to_json(const IngestionEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram: power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us). Bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // p in [0.0, 1.0]. Returns microseconds, 0.0 if empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// StoreStats: process-wide counters
// ---------------------------------------------------------------------------
// Thread-safe. All counters are atomic; the recent-event ring uses a mutex.
class StoreStats {
 public:
  void record_ingestion(const IngestionEvent& ev);
  std::string to_json() const;

  // --- Ingestion outcomes ---
  alignas(64) std::atomic<uint64_t> commits{0};
  alignas(64) std::atomic<uint64_t> conflicts{0};
  alignas(64) std::atomic<uint64_t> aborts{0};
  alignas(64) std::atomic<uint64_t> incomplete_ingestions{0};
  alignas(64) std::atomic<uint64_t> dropped_submissions{0};

  // --- Report store ---
  alignas(64) std::atomic<uint64_t> reports_added{0};
  alignas(64) std::atomic<uint64_t> reports_merged{0};

  // --- Blob store ---
  alignas(64) std::atomic<uint64_t> blob_puts{0};
  alignas(64) std::atomic<uint64_t> blob_hits{0};       // dedup: content already stored
  alignas(64) std::atomic<uint64_t> blob_misses{0};     // get() of an unknown id
  alignas(64) std::atomic<uint64_t> blob_integrity_failures{0};

  // --- Identity ---
  alignas(64) std::atomic<uint64_t> fingerprints_computed{0};
  alignas(64) std::atomic<uint64_t> identity_fallbacks{0};
  alignas(64) std::atomic<uint64_t> suppression_warnings{0};

  // --- Queries ---
  alignas(64) std::atomic<uint64_t> diffs_computed{0};

  LatencyHistogram commit_latency;

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<IngestionEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex ring_mu_;
  std::vector<IngestionEvent> ring_buffer_;
  size_t ring_head_{0};  // next slot to overwrite once the ring is full
};

// Singleton accessor
StoreStats& global_store_stats();

// Records the event in StoreStats, then hands it to the hook if one is set,
// otherwise appends it to the event log if a path is configured.
void emit_ingestion_event(const IngestionEvent& ev);

using IngestionEventHook = void (*)(const IngestionEvent&);
void set_ingestion_event_hook(IngestionEventHook hook);

// Empty path disables the event log.
void set_event_log_path(const std::string& path);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------
void set_log_level(LogLevel level);
LogLevel log_level();

// Empty path logs to stderr.
void set_log_path(const std::string& path);

void log_message(LogLevel level, std::string_view component, std::string_view message);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace triage
