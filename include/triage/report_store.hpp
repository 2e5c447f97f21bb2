#pragma once

// triage/report_store.hpp: Persistent runs, reports and review statuses.
//
// CORE INVARIANT:
//   At most one report row per (run, fingerprint). A generation is staged in
//   memory behind a GenerationHandle and applied by commit() in a single
//   SQLite transaction, so readers observe either the whole previous
//   generation or the whole new one.
//
// CONCURRENCY:
//   - add_report() may be called from many threads on the same handle.
//     Staging is split into shards keyed by fingerprint hash.
//   - commit() is optimistic: it fails with storage_conflict when the run's
//     generation moved past the handle's base generation. There is no
//     last-committer-wins.
//   - Each operation leases its own pooled connection; the only shared lock
//     is SQLite's write lock, held for the duration of one commit.
//
// BUG PATH MERGE POLICY:
//   When a fingerprint is added more than once in a generation, every
//   occurrence is kept and the representative bug path is the one with the
//   fewest steps, ties broken by the smallest bug path hash. The result does
//   not depend on arrival order.

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "triage/config.hpp"
#include "triage/types.hpp"

namespace triage {

struct StoreOptions {
  std::string db_path{".triage/reports.db"};
  bool auto_migrate{true};
  uint32_t busy_timeout_ms{5000};
  std::size_t pool_size{4};
};

StoreOptions store_options_from(const Config& config);

struct GenerationOptions {
  std::string tag;
  // Checkers that ran for this generation. Empty means unknown.
  std::vector<std::string> enabled_checkers;
  // Checkers explicitly turned off for this generation.
  std::vector<std::string> disabled_checkers;
};

struct CommitSummary {
  std::string run;
  uint64_t generation{0};
  size_t total{0};
  size_t new_count{0};
  size_t unresolved_count{0};
  size_t reopened_count{0};
  size_t resolved_count{0};
  size_t off_count{0};
  size_t unavailable_count{0};
  size_t source_reviews{0};
};

class ReportStore;

// ---------------------------------------------------------------------------
// GenerationHandle: uncommitted generation of one run
// ---------------------------------------------------------------------------
class GenerationHandle {
 public:
  const std::string& run() const { return run_; }
  uint64_t base_generation() const { return base_; }
  uint64_t generation() const { return base_ + 1; }
  const GenerationOptions& options() const { return options_; }
  bool is_open() const { return open_.load(std::memory_order_acquire); }
  size_t report_count() const;

 private:
  friend class ReportStore;
  GenerationHandle(const ReportStore* owner, std::string run, uint64_t base, GenerationOptions options);

  static constexpr size_t kShards = 16;
  struct Shard {
    mutable std::mutex mu;
    std::map<std::string, Report> reports;
  };

  const ReportStore* owner_;
  std::string run_;
  uint64_t base_;
  GenerationOptions options_;
  std::array<Shard, kShards> shards_;
  std::atomic<bool> open_{true};
  // add_report() holds it shared; commit() and abort() hold it exclusively.
  std::shared_mutex state_mu_;
};

// ---------------------------------------------------------------------------
// ReportStore
// ---------------------------------------------------------------------------
class ReportStore {
 public:
  // Opens (creating if needed) and migrates the database. Returns nullptr with
  // *error set on failure; schema_version_mismatch when the on-disk schema is
  // newer than supported, or older and auto_migrate is off.
  static std::unique_ptr<ReportStore> open(const StoreOptions& options, Error* error);
  ~ReportStore();

  ReportStore(const ReportStore&) = delete;
  ReportStore& operator=(const ReportStore&) = delete;

  // --- Ingestion ---
  std::shared_ptr<GenerationHandle> begin_ingestion(const std::string& run,
                                                    const GenerationOptions& options,
                                                    Error* error);
  bool add_report(GenerationHandle& handle, Report report, Error* error);
  std::optional<CommitSummary> commit(GenerationHandle& handle, Error* error);
  bool abort(GenerationHandle& handle);

  // --- Runs ---
  std::optional<RunInfo> get_run(const std::string& name, Error* error) const;
  std::vector<RunInfo> list_runs(Error* error) const;
  std::vector<RunHistoryEntry> run_history(const std::string& name, Error* error) const;
  bool remove_run(const std::string& name, Error* error);

  // --- Reports ---
  // All reports of the latest committed generation, every detection status,
  // with occurrences and review status. Ordered by fingerprint.
  std::optional<std::vector<Report>> reports(const std::string& run, Error* error) const;

  // One entry per occurrence, across the given runs, read in one snapshot.
  std::optional<std::vector<ReportEntry>> report_entries(const std::vector<std::string>& runs,
                                                         Error* error) const;

  // --- Review status (per fingerprint, shared by all runs) ---
  bool set_review_status(const std::string& fingerprint, ReviewStatus status,
                         const std::string& message, const std::string& author, Error* error);
  std::optional<ReviewRecord> review_status(const std::string& fingerprint, Error* error) const;
  std::optional<std::set<std::string>> suppressed_fingerprints(Error* error) const;

  uint32_t schema_version() const;
  const std::string& db_path() const;

 private:
  struct Impl;
  explicit ReportStore(std::unique_ptr<Impl> impl);
  std::unique_ptr<Impl> impl_;
};

}  // namespace triage
