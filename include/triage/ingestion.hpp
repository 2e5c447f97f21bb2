#pragma once

// triage/ingestion.hpp: Ingestion sessions over the report store.
//
// LIFECYCLE:
//   open(run)                 one session per run; a second open() for the
//                             same run waits for the first to finish
//   begin_submission(...)     one writer per client compilation unit
//     writer.add_source()     buffer source text
//     writer.add()            buffer findings
//     writer.finish()         fingerprint, store blobs, apply source
//                             comments, stage reports in the generation
//   finalize(session)         commit, or abort if any submission is missing
//   cancel(session)           abort; the previous generation stays visible
//
// INVARIANTS:
//   - A writer destroyed without finish() is a dropped submission. Its
//     findings never reach the generation and finalize() reports
//     ingestion_incomplete.
//   - The registry mutex is held only to look up or retire a run's slot.
//     Waiting for a busy run happens on that run's own condition variable,
//     so sessions for different runs never wait on each other. A slot is
//     retired once no session holds it and nobody waits on it.
//   - On storage_conflict finalize() replays the finished submissions into a
//     fresh generation, at most commit_retries times.
//
// A session not finalized or cancelled is aborted when its last reference
// goes away.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "triage/blob_store.hpp"
#include "triage/config.hpp"
#include "triage/report_store.hpp"
#include "triage/types.hpp"

namespace triage {

// ---------------------------------------------------------------------------
// Findings interchange
// ---------------------------------------------------------------------------

struct FindingsUnit {
  std::string compilation_unit;
  std::vector<Finding> findings;
};

// {"units":[{"compilation_unit":..., "findings":[...]}], "sources":{"path":"text"}}
struct FindingsBundle {
  std::vector<FindingsUnit> units;
  std::map<std::string, std::string> sources;
};

std::optional<FindingsBundle> parse_findings_json(const std::string& text, Error* error);

// ---------------------------------------------------------------------------
// Options
// ---------------------------------------------------------------------------

struct SessionOptions {
  std::string tag;
  // When set, finalize() requires exactly this many finished submissions.
  std::optional<size_t> expected_submissions;
  std::vector<std::string> enabled_checkers;
  std::vector<std::string> disabled_checkers;
};

struct CoordinatorOptions {
  uint32_t commit_retries{3};
  uint32_t open_timeout_ms{30000};
};

CoordinatorOptions coordinator_options_from(const Config& config);

class IngestionCoordinator;
class SubmissionWriter;

namespace detail {
struct RunSlot {
  std::mutex mu;
  std::condition_variable cv;
  bool busy{false};
};
}  // namespace detail

// ---------------------------------------------------------------------------
// IngestionSession
// ---------------------------------------------------------------------------
class IngestionSession {
 public:
  ~IngestionSession();
  IngestionSession(const IngestionSession&) = delete;
  IngestionSession& operator=(const IngestionSession&) = delete;

  const std::string& run() const { return run_; }
  const SessionOptions& options() const { return options_; }
  uint64_t generation() const;
  bool is_closed() const;
  size_t finished_submissions() const;
  size_t dropped_submissions() const;

 private:
  friend class IngestionCoordinator;
  friend class SubmissionWriter;

  IngestionSession(IngestionCoordinator* owner, std::string run, SessionOptions options,
                   std::shared_ptr<detail::RunSlot> slot, std::shared_ptr<GenerationHandle> handle);

  // Caller holds mu_.
  void close_locked();

  IngestionCoordinator* owner_;
  std::string run_;
  SessionOptions options_;
  std::shared_ptr<detail::RunSlot> slot_;
  std::chrono::steady_clock::time_point started_{std::chrono::steady_clock::now()};

  mutable std::mutex mu_;
  std::shared_ptr<GenerationHandle> handle_;
  size_t open_writers_{0};
  size_t finished_{0};
  size_t dropped_{0};
  bool closed_{false};
  // Every report staged so far, for replay after a conflict.
  std::vector<Report> staged_;
};

// ---------------------------------------------------------------------------
// SubmissionWriter: one client's findings for one compilation unit
// ---------------------------------------------------------------------------
class SubmissionWriter {
 public:
  SubmissionWriter(SubmissionWriter&& other) noexcept;
  SubmissionWriter& operator=(SubmissionWriter&&) = delete;
  SubmissionWriter(const SubmissionWriter&) = delete;
  SubmissionWriter& operator=(const SubmissionWriter&) = delete;
  ~SubmissionWriter();

  const std::string& client() const { return client_; }
  const std::string& compilation_unit() const { return compilation_unit_; }
  bool is_open() const { return session_ != nullptr; }

  void add_source(const std::string& path, std::string text);
  void add(Finding finding);

  // Processes the buffered submission. The writer is closed afterwards
  // whether or not it succeeds; a failed finish counts as dropped.
  bool finish(Error* error);

 private:
  friend class IngestionCoordinator;
  SubmissionWriter(std::shared_ptr<IngestionSession> session, std::string client, std::string compilation_unit);

  void drop(const std::string& reason);

  std::shared_ptr<IngestionSession> session_;
  std::string client_;
  std::string compilation_unit_;
  std::map<std::string, std::string> sources_;
  std::vector<Finding> findings_;
};

// ---------------------------------------------------------------------------
// IngestionCoordinator
// ---------------------------------------------------------------------------
class IngestionCoordinator {
 public:
  IngestionCoordinator(ReportStore& store, IBlobStore& blobs, CoordinatorOptions options = {});

  // storage_conflict when the run stays busy for open_timeout_ms.
  std::shared_ptr<IngestionSession> open(const std::string& run, const SessionOptions& options, Error* error);

  std::optional<SubmissionWriter> begin_submission(const std::shared_ptr<IngestionSession>& session,
                                                   const std::string& client,
                                                   const std::string& compilation_unit, Error* error);

  std::optional<CommitSummary> finalize(const std::shared_ptr<IngestionSession>& session, Error* error);

  bool cancel(const std::shared_ptr<IngestionSession>& session);

  // Convenience: one session, one submission per unit, finalize.
  std::optional<CommitSummary> ingest(const std::string& run, const FindingsBundle& bundle,
                                      const SessionOptions& options, Error* error);

  ReportStore& store() { return store_; }
  IBlobStore& blobs() { return blobs_; }

  // Runs with a live or awaited session.
  size_t tracked_runs() const;

 private:
  friend class IngestionSession;
  friend class SubmissionWriter;

  std::shared_ptr<detail::RunSlot> slot_for(const std::string& run);
  // Frees the run for the next session and forgets the slot once idle.
  void release(const std::string& run, std::shared_ptr<detail::RunSlot> slot);
  void emit(const IngestionSession& session, const std::string& outcome, const Error* error,
            const CommitSummary* summary, uint32_t attempts, uint64_t commit_ns);

  ReportStore& store_;
  IBlobStore& blobs_;
  CoordinatorOptions options_;

  mutable std::mutex registry_mu_;
  std::map<std::string, std::shared_ptr<detail::RunSlot>> slots_;
};

}  // namespace triage
