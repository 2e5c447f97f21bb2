#include "triage/ingestion.hpp"

#include <limits>

#include "triage/fingerprint.hpp"
#include "triage/jsonlite.hpp"
#include "triage/observability.hpp"
#include "triage/suppression.hpp"

namespace triage {

namespace {

GenerationOptions generation_options(const SessionOptions& options) {
  GenerationOptions g;
  g.tag = options.tag;
  g.enabled_checkers = options.enabled_checkers;
  g.disabled_checkers = options.disabled_checkers;
  return g;
}

// Line and column numbers must fit the 32-bit fields they are stored in.
bool read_position(const jsonlite::Object& obj, const char* key, uint32_t& out, Error* error) {
  const unsigned long long v = jsonlite::get_u64(obj, key);
  if (v > std::numeric_limits<uint32_t>::max()) {
    set_error(error, ErrorCode::invalid_argument, std::string(key) + " out of range: " + std::to_string(v));
    return false;
  }
  out = static_cast<uint32_t>(v);
  return true;
}

std::optional<Finding> finding_from_json(const jsonlite::Object& obj, Error* error) {
  Finding f;
  f.checker_id = jsonlite::get_string(obj, "checker_id");
  f.file = jsonlite::get_string(obj, "file");
  if (f.checker_id.empty() || f.file.empty()) {
    set_error(error, ErrorCode::invalid_argument, "finding needs checker_id and file");
    return std::nullopt;
  }
  if (!read_position(obj, "line", f.line, error) || !read_position(obj, "column", f.column, error)) {
    return std::nullopt;
  }
  const std::string severity = jsonlite::get_string(obj, "severity", "unspecified");
  auto parsed = parse_severity(severity);
  if (!parsed) {
    set_error(error, ErrorCode::invalid_argument, "unknown severity '" + severity + "'");
    return std::nullopt;
  }
  f.severity = *parsed;
  f.message = jsonlite::get_string(obj, "message");
  f.scope_text = jsonlite::get_string(obj, "scope");
  if (const auto* steps = jsonlite::get_array(obj, "bug_path")) {
    for (const auto& step : *steps) {
      const auto* s = std::get_if<jsonlite::Object>(&step.v);
      if (!s) continue;
      BugPathEvent ev;
      ev.file = jsonlite::get_string(*s, "file", f.file);
      if (!read_position(*s, "line", ev.line, error) || !read_position(*s, "column", ev.column, error)) {
        return std::nullopt;
      }
      ev.message = jsonlite::get_string(*s, "message");
      f.bug_path.push_back(std::move(ev));
    }
  }
  return f;
}

}  // namespace

std::optional<FindingsBundle> parse_findings_json(const std::string& text, Error* error) {
  std::optional<jsonlite::JsonError> jerr;
  const auto root = jsonlite::parse(text, &jerr);
  if (jerr) {
    set_error(error,
              jerr->code == "json_duplicate_key" ? ErrorCode::json_duplicate_key : ErrorCode::json_parse_error,
              jerr->message);
    return std::nullopt;
  }
  const auto* units = jsonlite::get_array(root, "units");
  if (!units) {
    set_error(error, ErrorCode::invalid_argument, "findings document has no \"units\" array");
    return std::nullopt;
  }

  FindingsBundle bundle;
  for (const auto& u : *units) {
    const auto* obj = std::get_if<jsonlite::Object>(&u.v);
    if (!obj) {
      set_error(error, ErrorCode::invalid_argument, "unit is not an object");
      return std::nullopt;
    }
    FindingsUnit unit;
    unit.compilation_unit = jsonlite::get_string(*obj, "compilation_unit");
    if (const auto* findings = jsonlite::get_array(*obj, "findings")) {
      for (const auto& item : *findings) {
        const auto* fo = std::get_if<jsonlite::Object>(&item.v);
        if (!fo) {
          set_error(error, ErrorCode::invalid_argument, "finding is not an object");
          return std::nullopt;
        }
        auto f = finding_from_json(*fo, error);
        if (!f) return std::nullopt;
        unit.findings.push_back(std::move(*f));
      }
    }
    bundle.units.push_back(std::move(unit));
  }
  bundle.sources = jsonlite::get_string_map(root, "sources");
  return bundle;
}

CoordinatorOptions coordinator_options_from(const Config& config) {
  CoordinatorOptions o;
  o.commit_retries = config.commit_retries;
  o.open_timeout_ms = config.open_timeout_ms;
  return o;
}

// ---------------------------------------------------------------------------
// IngestionSession
// ---------------------------------------------------------------------------

IngestionSession::IngestionSession(IngestionCoordinator* owner, std::string run, SessionOptions options,
                                   std::shared_ptr<detail::RunSlot> slot,
                                   std::shared_ptr<GenerationHandle> handle)
    : owner_(owner),
      run_(std::move(run)),
      options_(std::move(options)),
      slot_(std::move(slot)),
      handle_(std::move(handle)) {}

IngestionSession::~IngestionSession() {
  std::unique_lock<std::mutex> lk(mu_);
  if (closed_) return;
  owner_->store_.abort(*handle_);
  close_locked();
  lk.unlock();
  log_message(LogLevel::warn, "ingestion", "session for run " + run_ + " abandoned; generation aborted");
  owner_->emit(*this, "aborted", nullptr, nullptr, 0, 0);
}

void IngestionSession::close_locked() {
  closed_ = true;
  staged_.clear();
  owner_->release(run_, std::move(slot_));
}

uint64_t IngestionSession::generation() const {
  std::lock_guard<std::mutex> lk(mu_);
  return handle_->generation();
}

bool IngestionSession::is_closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

size_t IngestionSession::finished_submissions() const {
  std::lock_guard<std::mutex> lk(mu_);
  return finished_;
}

size_t IngestionSession::dropped_submissions() const {
  std::lock_guard<std::mutex> lk(mu_);
  return dropped_;
}

// ---------------------------------------------------------------------------
// SubmissionWriter
// ---------------------------------------------------------------------------

SubmissionWriter::SubmissionWriter(std::shared_ptr<IngestionSession> session, std::string client,
                                   std::string compilation_unit)
    : session_(std::move(session)), client_(std::move(client)), compilation_unit_(std::move(compilation_unit)) {}

SubmissionWriter::SubmissionWriter(SubmissionWriter&& other) noexcept
    : session_(std::move(other.session_)),
      client_(std::move(other.client_)),
      compilation_unit_(std::move(other.compilation_unit_)),
      sources_(std::move(other.sources_)),
      findings_(std::move(other.findings_)) {
  other.session_.reset();
}

SubmissionWriter::~SubmissionWriter() {
  if (session_) drop("writer closed without finish");
}

void SubmissionWriter::add_source(const std::string& path, std::string text) {
  sources_[path] = std::move(text);
}

void SubmissionWriter::add(Finding finding) {
  findings_.push_back(std::move(finding));
}

void SubmissionWriter::drop(const std::string& reason) {
  auto session = std::move(session_);
  session_.reset();
  {
    std::lock_guard<std::mutex> lk(session->mu_);
    --session->open_writers_;
    ++session->dropped_;
  }
  global_store_stats().dropped_submissions.fetch_add(1, std::memory_order_relaxed);
  log_message(LogLevel::warn, "ingestion",
              "dropped submission " + compilation_unit_ + " from " + client_ + " for run " + session->run() +
                  ": " + reason);
}

bool SubmissionWriter::finish(Error* error) {
  if (!session_) {
    set_error(error, ErrorCode::invalid_handle, "submission already finished");
    return false;
  }
  IngestionCoordinator& coord = *session_->owner_;
  auto& stats = global_store_stats();

  std::shared_ptr<GenerationHandle> handle;
  {
    std::lock_guard<std::mutex> lk(session_->mu_);
    if (!session_->closed_) handle = session_->handle_;
  }
  if (!handle) {
    drop("session closed");
    set_error(error, ErrorCode::invalid_handle, "ingestion session is closed");
    return false;
  }

  std::map<std::string, std::string> blob_ids;
  std::map<std::string, SourceView> views;
  for (const auto& [path, text] : sources_) {
    Error blob_error;
    std::string id = coord.blobs_.put(path, text, &blob_error);
    if (id.empty()) {
      drop("source " + path + " not stored: " + blob_error.message);
      set_error(error, blob_error.code, blob_error.message);
      return false;
    }
    blob_ids[path] = std::move(id);
    views.emplace(path, SourceView(text));
  }

  static const SourceView kNoSource;
  std::vector<Report> reports;
  reports.reserve(findings_.size());
  for (const auto& f : findings_) {
    auto view_it = views.find(f.file);
    const SourceView& view = view_it == views.end() ? kNoSource : view_it->second;
    const Fingerprint fp = compute_fingerprint(f, view);

    Report r;
    r.fingerprint = fp.value;
    r.confidence = fp.confidence;
    r.scope = fp.scope;
    auto blob_it = blob_ids.find(f.file);
    if (blob_it != blob_ids.end()) r.blob_id = blob_it->second;
    r.file = f.file;
    r.line = f.line;
    r.column = f.column;
    r.checker_id = f.checker_id;
    r.severity = f.severity;
    r.message = f.message;
    r.bug_path = f.bug_path;
    r.path_hash = report_path_hash(f, r.fingerprint);
    r.occurrences.push_back({compilation_unit_, f.file, f.line, f.column, r.path_hash});

    if (!view.empty()) {
      auto lookup = find_source_review(view, f.line, f.checker_id);
      for (const auto& w : lookup.warnings) {
        stats.suppression_warnings.fetch_add(1, std::memory_order_relaxed);
        log_message(LogLevel::warn, "suppression",
                    f.file + ":" + std::to_string(w.line) + ": " + w.reason);
      }
      r.source_review = std::move(lookup.review);
    }
    reports.push_back(std::move(r));
  }

  for (const auto& r : reports) {
    Error add_error;
    if (!coord.store_.add_report(*handle, r, &add_error)) {
      drop(add_error.message);
      set_error(error, add_error.code, add_error.message);
      return false;
    }
  }

  auto session = std::move(session_);
  session_.reset();
  std::lock_guard<std::mutex> lk(session->mu_);
  --session->open_writers_;
  ++session->finished_;
  for (auto& r : reports) session->staged_.push_back(std::move(r));
  return true;
}

// ---------------------------------------------------------------------------
// IngestionCoordinator
// ---------------------------------------------------------------------------

IngestionCoordinator::IngestionCoordinator(ReportStore& store, IBlobStore& blobs, CoordinatorOptions options)
    : store_(store), blobs_(blobs), options_(options) {}

std::shared_ptr<detail::RunSlot> IngestionCoordinator::slot_for(const std::string& run) {
  std::lock_guard<std::mutex> lk(registry_mu_);
  auto& slot = slots_[run];
  if (!slot) slot = std::make_shared<detail::RunSlot>();
  return slot;
}

void IngestionCoordinator::release(const std::string& run, std::shared_ptr<detail::RunSlot> slot) {
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    slot->busy = false;
  }
  slot->cv.notify_one();
  slot.reset();

  // Only the registry still referencing the slot means no session holds it
  // and nobody waits on it; new references are only handed out under
  // registry_mu_.
  std::lock_guard<std::mutex> lk(registry_mu_);
  auto it = slots_.find(run);
  if (it != slots_.end() && it->second.use_count() == 1) slots_.erase(it);
}

size_t IngestionCoordinator::tracked_runs() const {
  std::lock_guard<std::mutex> lk(registry_mu_);
  return slots_.size();
}

std::shared_ptr<IngestionSession> IngestionCoordinator::open(const std::string& run,
                                                             const SessionOptions& options, Error* error) {
  if (run.empty()) {
    set_error(error, ErrorCode::invalid_argument, "run name must not be empty");
    return nullptr;
  }
  auto slot = slot_for(run);
  {
    std::unique_lock<std::mutex> lk(slot->mu);
    const bool acquired = slot->cv.wait_for(lk, std::chrono::milliseconds(options_.open_timeout_ms),
                                            [&] { return !slot->busy; });
    if (!acquired) {
      global_store_stats().conflicts.fetch_add(1, std::memory_order_relaxed);
      set_error(error, ErrorCode::storage_conflict,
                "run " + run + " is busy with another ingestion (waited " +
                    std::to_string(options_.open_timeout_ms) + " ms)");
      return nullptr;
    }
    slot->busy = true;
  }

  auto handle = store_.begin_ingestion(run, generation_options(options), error);
  if (!handle) {
    release(run, std::move(slot));
    return nullptr;
  }
  log_message(LogLevel::debug, "ingestion",
              "opened run " + run + " generation " + std::to_string(handle->generation()));
  return std::shared_ptr<IngestionSession>(new IngestionSession(this, run, options, std::move(slot),
                                                                std::move(handle)));
}

std::optional<SubmissionWriter> IngestionCoordinator::begin_submission(
    const std::shared_ptr<IngestionSession>& session, const std::string& client,
    const std::string& compilation_unit, Error* error) {
  if (!session || session->owner_ != this) {
    set_error(error, ErrorCode::invalid_handle, "session belongs to another coordinator");
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lk(session->mu_);
  if (session->closed_) {
    set_error(error, ErrorCode::invalid_handle, "ingestion session for run " + session->run_ + " is closed");
    return std::nullopt;
  }
  ++session->open_writers_;
  return SubmissionWriter(session, client, compilation_unit);
}

std::optional<CommitSummary> IngestionCoordinator::finalize(const std::shared_ptr<IngestionSession>& session,
                                                            Error* error) {
  if (!session || session->owner_ != this) {
    set_error(error, ErrorCode::invalid_handle, "session belongs to another coordinator");
    return std::nullopt;
  }
  std::unique_lock<std::mutex> lk(session->mu_);
  if (session->closed_) {
    set_error(error, ErrorCode::invalid_handle, "ingestion session for run " + session->run_ + " is closed");
    return std::nullopt;
  }

  const auto& expected = session->options_.expected_submissions;
  if (session->open_writers_ > 0 || session->dropped_ > 0 ||
      (expected && session->finished_ != *expected)) {
    std::string why = std::to_string(session->finished_) + " submissions finished";
    if (expected) why += " of " + std::to_string(*expected) + " expected";
    why += ", " + std::to_string(session->open_writers_) + " open, " + std::to_string(session->dropped_) +
           " dropped";
    store_.abort(*session->handle_);
    session->close_locked();
    lk.unlock();

    Error incomplete{ErrorCode::ingestion_incomplete, "run " + session->run_ + ": " + why};
    log_message(LogLevel::warn, "ingestion", incomplete.message);
    emit(*session, "incomplete", &incomplete, nullptr, 0, 0);
    set_error(error, incomplete.code, incomplete.message);
    return std::nullopt;
  }

  const GenerationOptions gen_options = generation_options(session->options_);
  std::optional<CommitSummary> summary;
  Error err;
  uint32_t attempts = 0;
  uint64_t commit_ns = 0;
  for (;;) {
    ++attempts;
    err = Error{};
    {
      ScopeTimer timer(commit_ns);
      summary = store_.commit(*session->handle_, &err);
    }
    if (summary || err.code != ErrorCode::storage_conflict || attempts > options_.commit_retries) break;

    log_message(LogLevel::warn, "ingestion",
                "run " + session->run_ + ": " + err.message + "; replaying " +
                    std::to_string(session->staged_.size()) + " reports");
    auto fresh = store_.begin_ingestion(session->run_, gen_options, &err);
    if (!fresh) break;
    session->handle_ = fresh;
    bool replayed = true;
    for (const auto& r : session->staged_) {
      if (!store_.add_report(*fresh, r, &err)) {
        replayed = false;
        break;
      }
    }
    if (!replayed) {
      store_.abort(*fresh);
      break;
    }
  }
  session->close_locked();
  lk.unlock();

  if (!summary) {
    const std::string outcome = err.code == ErrorCode::storage_conflict ? "conflict" : "failed";
    log_message(LogLevel::error, "ingestion", "run " + session->run_ + ": " + outcome + ": " + err.message);
    emit(*session, outcome, &err, nullptr, attempts, commit_ns);
    set_error(error, err.code, err.message);
    return std::nullopt;
  }
  emit(*session, "committed", nullptr, &*summary, attempts, commit_ns);
  return summary;
}

bool IngestionCoordinator::cancel(const std::shared_ptr<IngestionSession>& session) {
  if (!session || session->owner_ != this) return false;
  {
    std::lock_guard<std::mutex> lk(session->mu_);
    if (session->closed_) return false;
    store_.abort(*session->handle_);
    session->close_locked();
  }
  log_message(LogLevel::info, "ingestion", "cancelled ingestion of run " + session->run_);
  emit(*session, "aborted", nullptr, nullptr, 0, 0);
  return true;
}

std::optional<CommitSummary> IngestionCoordinator::ingest(const std::string& run, const FindingsBundle& bundle,
                                                          const SessionOptions& options, Error* error) {
  SessionOptions opts = options;
  if (!opts.expected_submissions) opts.expected_submissions = bundle.units.size();
  auto session = open(run, opts, error);
  if (!session) return std::nullopt;

  for (const auto& unit : bundle.units) {
    auto writer = begin_submission(session, "local", unit.compilation_unit, error);
    if (!writer) break;
    for (const auto& f : unit.findings) {
      auto src = bundle.sources.find(f.file);
      if (src != bundle.sources.end()) writer->add_source(src->first, src->second);
      writer->add(f);
    }
    // A failed finish is reported by finalize() as ingestion_incomplete.
    Error finish_error;
    if (!writer->finish(&finish_error)) {
      log_message(LogLevel::error, "ingestion",
                  "unit " + unit.compilation_unit + ": " + finish_error.message);
    }
  }
  return finalize(session, error);
}

void IngestionCoordinator::emit(const IngestionSession& session, const std::string& outcome, const Error* error,
                                const CommitSummary* summary, uint32_t attempts, uint64_t commit_ns) {
  IngestionEvent ev;
  ev.run = session.run();
  ev.tag = session.options().tag;
  ev.generation = summary ? summary->generation : session.generation();
  ev.outcome = outcome;
  if (error) ev.error_code = to_string(error->code);
  ev.duration_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                             std::chrono::steady_clock::now() - session.started_)
                                             .count());
  ev.commit_ns = commit_ns;
  ev.attempts = attempts;
  ev.submissions = session.finished_submissions();
  if (summary) {
    ev.reports = summary->total;
    ev.new_count = summary->new_count;
    ev.unresolved_count = summary->unresolved_count;
    ev.resolved_count = summary->resolved_count;
    ev.reopened_count = summary->reopened_count;
  }
  emit_ingestion_event(ev);
}

}  // namespace triage
