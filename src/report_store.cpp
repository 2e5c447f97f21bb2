#include "triage/report_store.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <condition_variable>
#include <ctime>
#include <filesystem>
#include <functional>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

#include "triage/jsonlite.hpp"
#include "triage/observability.hpp"
#include "triage/schema.hpp"
#include "triage/version.hpp"

namespace fs = std::filesystem;

namespace triage {

namespace {

uint64_t now_unix() {
  return static_cast<uint64_t>(std::time(nullptr));
}

// ---------------------------------------------------------------------------
// Statement: RAII prepared statement
// ---------------------------------------------------------------------------
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
  std::string error() const { return sqlite3_errmsg(db_); }

  void bind_text(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT);
  }
  void bind_int(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }

  int step() { return sqlite3_step(stmt_); }
  void reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  std::string text(int col) const {
    const auto* p = sqlite3_column_text(stmt_, col);
    return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
  }
  int64_t i64(int col) const { return sqlite3_column_int64(stmt_, col); }
  uint64_t u64(int col) const { return static_cast<uint64_t>(sqlite3_column_int64(stmt_, col)); }
  uint32_t u32(int col) const { return static_cast<uint32_t>(sqlite3_column_int64(stmt_, col)); }

 private:
  sqlite3* db_;
  sqlite3_stmt* stmt_{nullptr};
  int rc_{SQLITE_ERROR};
};

bool exec(sqlite3* db, const char* sql, std::string* err_out) {
  char* errmsg = nullptr;
  int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
  if (rc != SQLITE_OK) {
    if (err_out) *err_out = errmsg ? errmsg : sqlite3_errmsg(db);
    sqlite3_free(errmsg);
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// ConnectionPool
// ---------------------------------------------------------------------------
class ConnectionPool {
 public:
  class Lease {
   public:
    Lease(ConnectionPool* pool, sqlite3* db) : pool_(pool), db_(db) {}
    ~Lease() {
      if (pool_) pool_->release(db_);
    }
    Lease(Lease&& o) noexcept : pool_(o.pool_), db_(o.db_) { o.pool_ = nullptr; }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    sqlite3* get() const { return db_; }

   private:
    ConnectionPool* pool_;
    sqlite3* db_;
  };

  ~ConnectionPool() {
    for (sqlite3* db : all_) sqlite3_close(db);
  }

  bool open(const StoreOptions& options, Error* error) {
    const bool in_memory = options.db_path == ":memory:";
    if (!in_memory) {
      const fs::path parent = fs::path(options.db_path).parent_path();
      if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
          set_error(error, ErrorCode::io_error, "cannot create " + parent.string() + ": " + ec.message());
          return false;
        }
      }
    }
    // Separate :memory: connections would be separate databases.
    const size_t n = in_memory ? 1 : std::max<size_t>(1, options.pool_size);
    for (size_t i = 0; i < n; ++i) {
      sqlite3* db = nullptr;
      int rc = sqlite3_open_v2(options.db_path.c_str(), &db,
                               SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
      if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "unknown";
        if (db) sqlite3_close(db);
        set_error(error, ErrorCode::database_error, "cannot open " + options.db_path + ": " + msg);
        return false;
      }
      sqlite3_busy_timeout(db, static_cast<int>(options.busy_timeout_ms));
      std::string err;
      if (!exec(db, "PRAGMA foreign_keys=ON;", &err) ||
          (!in_memory && !exec(db, "PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;", &err))) {
        sqlite3_close(db);
        set_error(error, ErrorCode::database_error, "pragma failed: " + err);
        return false;
      }
      all_.push_back(db);
      idle_.push_back(db);
    }
    return true;
  }

  Lease acquire() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return !idle_.empty(); });
    sqlite3* db = idle_.back();
    idle_.pop_back();
    return Lease(this, db);
  }

 private:
  void release(sqlite3* db) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      idle_.push_back(db);
    }
    cv_.notify_one();
  }

  std::mutex mu_;
  std::condition_variable cv_;
  std::vector<sqlite3*> all_;
  std::vector<sqlite3*> idle_;
};

// Read transaction: every SELECT inside sees one snapshot.
class ReadTransaction {
 public:
  explicit ReadTransaction(sqlite3* db) : db_(db) { active_ = exec(db_, "BEGIN", nullptr); }
  ~ReadTransaction() {
    if (active_) exec(db_, "COMMIT", nullptr);
  }
  ReadTransaction(const ReadTransaction&) = delete;
  ReadTransaction& operator=(const ReadTransaction&) = delete;

 private:
  sqlite3* db_;
  bool active_{false};
};

// ---------------------------------------------------------------------------
// Encoding helpers
// ---------------------------------------------------------------------------

std::string bug_path_to_json(const std::vector<BugPathEvent>& path) {
  jsonlite::Array arr;
  arr.reserve(path.size());
  for (const auto& ev : path) {
    jsonlite::Object o;
    o["file"] = jsonlite::str(ev.file);
    o["line"] = jsonlite::num(ev.line);
    o["column"] = jsonlite::num(ev.column);
    o["message"] = jsonlite::str(ev.message);
    arr.push_back(jsonlite::Value{std::move(o)});
  }
  return jsonlite::to_json(jsonlite::Value{std::move(arr)});
}

std::vector<BugPathEvent> bug_path_from_json(const std::string& text) {
  std::vector<BugPathEvent> out;
  std::optional<jsonlite::JsonError> err;
  const auto wrapper = jsonlite::parse("{\"p\":" + text + "}", &err);
  if (err) return out;
  const auto* arr = jsonlite::get_array(wrapper, "p");
  if (!arr) return out;
  for (const auto& item : *arr) {
    const auto* o = std::get_if<jsonlite::Object>(&item.v);
    if (!o) continue;
    BugPathEvent ev;
    ev.file = jsonlite::get_string(*o, "file");
    ev.line = static_cast<uint32_t>(jsonlite::get_u64(*o, "line"));
    ev.column = static_cast<uint32_t>(jsonlite::get_u64(*o, "column"));
    ev.message = jsonlite::get_string(*o, "message");
    out.push_back(std::move(ev));
  }
  return out;
}

std::vector<std::string> string_list_from_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  const auto wrapper = jsonlite::parse("{\"l\":" + text + "}", &err);
  if (err) return {};
  return jsonlite::get_string_array(wrapper, "l");
}

std::string string_list_to_json(const std::vector<std::string>& items) {
  return jsonlite::to_json(jsonlite::string_array(items));
}

bool same_occurrence(const Occurrence& a, const Occurrence& b) {
  return a.compilation_unit == b.compilation_unit && a.file == b.file && a.line == b.line &&
         a.column == b.column && a.path_hash == b.path_hash;
}

bool occurrence_less(const Occurrence& a, const Occurrence& b) {
  return std::tie(a.file, a.line, a.column, a.compilation_unit, a.path_hash) <
         std::tie(b.file, b.line, b.column, b.compilation_unit, b.path_hash);
}

// Folds `incoming` into `kept` (same fingerprint).
void merge_report(Report& kept, Report&& incoming) {
  for (auto& occ : incoming.occurrences) {
    const bool seen = std::any_of(kept.occurrences.begin(), kept.occurrences.end(),
                                  [&](const Occurrence& o) { return same_occurrence(o, occ); });
    if (!seen) kept.occurrences.push_back(std::move(occ));
  }

  const bool shorter = incoming.bug_path.size() < kept.bug_path.size();
  const bool tie = incoming.bug_path.size() == kept.bug_path.size();
  if (shorter || (tie && incoming.path_hash < kept.path_hash)) {
    kept.blob_id = std::move(incoming.blob_id);
    kept.file = std::move(incoming.file);
    kept.line = incoming.line;
    kept.column = incoming.column;
    kept.severity = incoming.severity;
    kept.message = std::move(incoming.message);
    kept.bug_path = std::move(incoming.bug_path);
    kept.path_hash = std::move(incoming.path_hash);
  }

  if (incoming.source_review) {
    const auto& in = *incoming.source_review;
    if (!kept.source_review ||
        std::tie(in.status, in.message) < std::tie(kept.source_review->status, kept.source_review->message)) {
      kept.source_review = incoming.source_review;
    }
  }
}

constexpr const char* kSelectReports =
    "SELECT r.id, r.fingerprint, r.checker_id, r.severity, r.message, r.file, r.line, r.col, "
    "r.blob_id, r.bug_path, r.path_hash, r.confidence, r.scope, r.detection_status, "
    "r.detected_generation, r.fixed_generation, r.last_seen_generation, "
    "COALESCE(v.status, 'unreviewed') "
    "FROM reports r JOIN runs ON runs.id = r.run_id "
    "LEFT JOIN review_statuses v ON v.fingerprint = r.fingerprint "
    "WHERE runs.name = ? ORDER BY r.fingerprint";

constexpr const char* kSelectOccurrences =
    "SELECT o.report_id, o.compilation_unit, o.file, o.line, o.col, o.path_hash "
    "FROM report_occurrences o JOIN reports r ON r.id = o.report_id "
    "JOIN runs ON runs.id = r.run_id WHERE runs.name = ? "
    "ORDER BY o.report_id, o.file, o.line, o.col, o.compilation_unit";

}  // namespace

StoreOptions store_options_from(const Config& config) {
  StoreOptions o;
  o.db_path = config.db_path;
  o.auto_migrate = config.auto_migrate;
  o.busy_timeout_ms = config.db_busy_timeout_ms;
  o.pool_size = config.db_pool_size;
  return o;
}

// ---------------------------------------------------------------------------
// GenerationHandle
// ---------------------------------------------------------------------------

GenerationHandle::GenerationHandle(const ReportStore* owner, std::string run, uint64_t base,
                                   GenerationOptions options)
    : owner_(owner), run_(std::move(run)), base_(base), options_(std::move(options)) {}

size_t GenerationHandle::report_count() const {
  size_t n = 0;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lk(shard.mu);
    n += shard.reports.size();
  }
  return n;
}

// ---------------------------------------------------------------------------
// ReportStore
// ---------------------------------------------------------------------------

struct ReportStore::Impl {
  StoreOptions options;
  ConnectionPool pool;
  uint32_t schema_version{0};

  bool migrate(Error* error);
  std::optional<std::vector<Report>> load_reports(sqlite3* db, const std::string& run, Error* error) const;
  // run_not_found naming every requested run without a runs row.
  bool require_runs(sqlite3* db, const std::vector<std::string>& names, Error* error) const;
};

bool ReportStore::Impl::migrate(Error* error) {
  auto lease = pool.acquire();
  sqlite3* db = lease.get();
  std::string err;

  auto read_version = [&](uint32_t& out) -> bool {
    Statement st(db, "PRAGMA user_version");
    if (!st.ok() || st.step() != SQLITE_ROW) return false;
    out = st.u32(0);
    return true;
  };

  uint32_t on_disk = 0;
  if (!read_version(on_disk)) {
    set_error(error, ErrorCode::database_error, "cannot read schema version: " + std::string(sqlite3_errmsg(db)));
    return false;
  }
  auto check = version::check_schema(on_disk, options.auto_migrate);
  if (!check.ok) {
    set_error(error, ErrorCode::schema_version_mismatch, check.description);
    return false;
  }
  if (!check.needs_migration) {
    schema_version = on_disk;
    return true;
  }

  // BEGIN IMMEDIATE and re-read: another process may be migrating the same file.
  if (!exec(db, "BEGIN IMMEDIATE", &err)) {
    set_error(error, ErrorCode::database_error, "migration lock failed: " + err);
    return false;
  }
  if (!read_version(on_disk)) {
    exec(db, "ROLLBACK", nullptr);
    set_error(error, ErrorCode::database_error, "cannot read schema version");
    return false;
  }
  for (const auto& m : schema::migrations()) {
    if (m.version <= on_disk) continue;
    if (!exec(db, m.sql, &err)) {
      exec(db, "ROLLBACK", nullptr);
      set_error(error, ErrorCode::database_error,
                "migration to schema " + std::to_string(m.version) + " failed: " + err);
      return false;
    }
    log_message(LogLevel::info, "report_store",
                "migrated " + options.db_path + " to schema " + std::to_string(m.version) + " (" +
                    m.description + ")");
  }
  const std::string set_version = "PRAGMA user_version = " + std::to_string(version::SCHEMA_VERSION);
  if (!exec(db, set_version.c_str(), &err) || !exec(db, "COMMIT", &err)) {
    exec(db, "ROLLBACK", nullptr);
    set_error(error, ErrorCode::database_error, "migration commit failed: " + err);
    return false;
  }
  schema_version = version::SCHEMA_VERSION;
  return true;
}

std::optional<std::vector<Report>> ReportStore::Impl::load_reports(sqlite3* db, const std::string& run,
                                                                   Error* error) const {
  Statement st(db, kSelectReports);
  if (!st.ok()) {
    set_error(error, ErrorCode::database_error, st.error());
    return std::nullopt;
  }
  st.bind_text(1, run);

  std::vector<Report> out;
  std::unordered_map<int64_t, size_t> by_id;
  int rc;
  while ((rc = st.step()) == SQLITE_ROW) {
    Report r;
    const int64_t id = st.i64(0);
    r.fingerprint = st.text(1);
    r.checker_id = st.text(2);
    r.severity = parse_severity(st.text(3)).value_or(Severity::Unspecified);
    r.message = st.text(4);
    r.file = st.text(5);
    r.line = st.u32(6);
    r.column = st.u32(7);
    r.blob_id = st.text(8);
    r.bug_path = bug_path_from_json(st.text(9));
    r.path_hash = st.text(10);
    r.confidence = parse_identity_confidence(st.text(11)).value_or(IdentityConfidence::scoped);
    r.scope = st.text(12);
    r.detection_status = parse_detection_status(st.text(13)).value_or(DetectionStatus::New);
    r.detected_generation = st.u64(14);
    r.fixed_generation = st.u64(15);
    r.last_seen_generation = st.u64(16);
    r.review_status = parse_review_status(st.text(17)).value_or(ReviewStatus::Unreviewed);
    by_id[id] = out.size();
    out.push_back(std::move(r));
  }
  if (rc != SQLITE_DONE) {
    set_error(error, ErrorCode::database_error, st.error());
    return std::nullopt;
  }

  Statement occ(db, kSelectOccurrences);
  if (!occ.ok()) {
    set_error(error, ErrorCode::database_error, occ.error());
    return std::nullopt;
  }
  occ.bind_text(1, run);
  while ((rc = occ.step()) == SQLITE_ROW) {
    auto it = by_id.find(occ.i64(0));
    if (it == by_id.end()) continue;
    Occurrence o;
    o.compilation_unit = occ.text(1);
    o.file = occ.text(2);
    o.line = occ.u32(3);
    o.column = occ.u32(4);
    o.path_hash = occ.text(5);
    out[it->second].occurrences.push_back(std::move(o));
  }
  if (rc != SQLITE_DONE) {
    set_error(error, ErrorCode::database_error, occ.error());
    return std::nullopt;
  }
  return out;
}

bool ReportStore::Impl::require_runs(sqlite3* db, const std::vector<std::string>& names, Error* error) const {
  Statement st(db, "SELECT 1 FROM runs WHERE name = ?");
  if (!st.ok()) {
    set_error(error, ErrorCode::database_error, st.error());
    return false;
  }
  std::string missing;
  for (const auto& name : names) {
    st.reset();
    st.bind_text(1, name);
    const int rc = st.step();
    if (rc == SQLITE_DONE) {
      missing += missing.empty() ? name : ", " + name;
    } else if (rc != SQLITE_ROW) {
      set_error(error, ErrorCode::database_error, st.error());
      return false;
    }
  }
  if (!missing.empty()) {
    set_error(error, ErrorCode::run_not_found, "runs not found in the database: " + missing);
    return false;
  }
  return true;
}

ReportStore::ReportStore(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
ReportStore::~ReportStore() = default;

std::unique_ptr<ReportStore> ReportStore::open(const StoreOptions& options, Error* error) {
  auto impl = std::make_unique<Impl>();
  impl->options = options;
  if (!impl->pool.open(options, error)) return nullptr;
  if (!impl->migrate(error)) return nullptr;
  return std::unique_ptr<ReportStore>(new ReportStore(std::move(impl)));
}

uint32_t ReportStore::schema_version() const { return impl_->schema_version; }
const std::string& ReportStore::db_path() const { return impl_->options.db_path; }

// ---------------------------------------------------------------------------
// Ingestion
// ---------------------------------------------------------------------------

std::shared_ptr<GenerationHandle> ReportStore::begin_ingestion(const std::string& run,
                                                               const GenerationOptions& options,
                                                               Error* error) {
  if (run.empty()) {
    set_error(error, ErrorCode::invalid_argument, "run name must not be empty");
    return nullptr;
  }
  auto lease = impl_->pool.acquire();
  Statement st(lease.get(), "SELECT generation FROM runs WHERE name = ?");
  if (!st.ok()) {
    set_error(error, ErrorCode::database_error, st.error());
    return nullptr;
  }
  st.bind_text(1, run);
  uint64_t base = 0;
  const int rc = st.step();
  if (rc == SQLITE_ROW) {
    base = st.u64(0);
  } else if (rc != SQLITE_DONE) {
    set_error(error, ErrorCode::database_error, st.error());
    return nullptr;
  }
  return std::shared_ptr<GenerationHandle>(new GenerationHandle(this, run, base, options));
}

bool ReportStore::add_report(GenerationHandle& handle, Report report, Error* error) {
  if (handle.owner_ != this) {
    set_error(error, ErrorCode::invalid_handle, "generation handle belongs to another store");
    return false;
  }
  if (report.fingerprint.empty()) {
    set_error(error, ErrorCode::invalid_argument, "report without fingerprint");
    return false;
  }
  std::shared_lock<std::shared_mutex> state(handle.state_mu_);
  if (!handle.is_open()) {
    set_error(error, ErrorCode::invalid_handle, "generation " + std::to_string(handle.generation()) +
                                                    " of run " + handle.run() + " is closed");
    return false;
  }

  if (report.occurrences.empty()) {
    report.occurrences.push_back({"", report.file, report.line, report.column, report.path_hash});
  }

  auto& stats = global_store_stats();
  auto& shard = handle.shards_[std::hash<std::string>{}(report.fingerprint) % GenerationHandle::kShards];
  std::lock_guard<std::mutex> lk(shard.mu);
  auto it = shard.reports.find(report.fingerprint);
  if (it == shard.reports.end()) {
    std::string key = report.fingerprint;
    shard.reports.emplace(std::move(key), std::move(report));
    stats.reports_added.fetch_add(1, std::memory_order_relaxed);
  } else {
    merge_report(it->second, std::move(report));
    stats.reports_merged.fetch_add(1, std::memory_order_relaxed);
  }
  return true;
}

bool ReportStore::abort(GenerationHandle& handle) {
  if (handle.owner_ != this) return false;
  std::unique_lock<std::shared_mutex> state(handle.state_mu_);
  if (!handle.open_.exchange(false)) return false;
  for (auto& shard : handle.shards_) {
    std::lock_guard<std::mutex> lk(shard.mu);
    shard.reports.clear();
  }
  return true;
}

std::optional<CommitSummary> ReportStore::commit(GenerationHandle& handle, Error* error) {
  if (handle.owner_ != this) {
    set_error(error, ErrorCode::invalid_handle, "generation handle belongs to another store");
    return std::nullopt;
  }
  std::unique_lock<std::shared_mutex> state(handle.state_mu_);
  if (!handle.open_.exchange(false)) {
    set_error(error, ErrorCode::invalid_handle, "generation " + std::to_string(handle.generation()) +
                                                    " of run " + handle.run() + " is closed");
    return std::nullopt;
  }

  std::vector<Report> staged;
  for (auto& shard : handle.shards_) {
    std::lock_guard<std::mutex> lk(shard.mu);
    for (auto& entry : shard.reports) staged.push_back(std::move(entry.second));
    shard.reports.clear();
  }
  std::sort(staged.begin(), staged.end(),
            [](const Report& a, const Report& b) { return a.fingerprint < b.fingerprint; });
  for (auto& r : staged) std::sort(r.occurrences.begin(), r.occurrences.end(), occurrence_less);

  const uint64_t generation = handle.generation();
  const uint64_t ts = now_unix();
  const auto& opts = handle.options();

  auto lease = impl_->pool.acquire();
  sqlite3* db = lease.get();
  std::string err;
  if (!exec(db, "BEGIN IMMEDIATE", &err)) {
    set_error(error, ErrorCode::database_error, "commit of run " + handle.run() + " could not lock: " + err);
    return std::nullopt;
  }

  auto fail = [&](ErrorCode code, const std::string& msg) -> std::optional<CommitSummary> {
    exec(db, "ROLLBACK", nullptr);
    set_error(error, code, msg);
    return std::nullopt;
  };

  // 1. Optimistic generation check.
  int64_t run_id = 0;
  {
    Statement st(db, "SELECT id, generation FROM runs WHERE name = ?");
    if (!st.ok()) return fail(ErrorCode::database_error, st.error());
    st.bind_text(1, handle.run());
    const int rc = st.step();
    if (rc == SQLITE_ROW) {
      run_id = st.i64(0);
      const uint64_t current = st.u64(1);
      if (current != handle.base_generation()) {
        return fail(ErrorCode::storage_conflict,
                    "run " + handle.run() + " moved to generation " + std::to_string(current) +
                        " while generation " + std::to_string(generation) + " was staged on base " +
                        std::to_string(handle.base_generation()));
      }
    } else if (rc == SQLITE_DONE) {
      if (handle.base_generation() != 0) {
        return fail(ErrorCode::storage_conflict, "run " + handle.run() + " was removed during ingestion");
      }
    } else {
      return fail(ErrorCode::database_error, st.error());
    }
  }
  if (run_id == 0) {
    Statement ins(db, "INSERT INTO runs(name, generation, created_at, updated_at, latest_tag) VALUES(?, 0, ?, ?, '')");
    if (!ins.ok()) return fail(ErrorCode::database_error, ins.error());
    ins.bind_text(1, handle.run());
    ins.bind_int(2, static_cast<int64_t>(ts));
    ins.bind_int(3, static_cast<int64_t>(ts));
    if (ins.step() != SQLITE_DONE) return fail(ErrorCode::database_error, ins.error());
    run_id = sqlite3_last_insert_rowid(db);
  }

  // 2. Previous generation.
  struct Existing {
    int64_t id;
    std::string checker_id;
    DetectionStatus status;
  };
  std::unordered_map<std::string, Existing> existing;
  {
    Statement st(db, "SELECT id, fingerprint, checker_id, detection_status FROM reports WHERE run_id = ?");
    if (!st.ok()) return fail(ErrorCode::database_error, st.error());
    st.bind_int(1, run_id);
    int rc;
    while ((rc = st.step()) == SQLITE_ROW) {
      existing.emplace(st.text(1), Existing{st.i64(0), st.text(2),
                                            parse_detection_status(st.text(3)).value_or(DetectionStatus::New)});
    }
    if (rc != SQLITE_DONE) return fail(ErrorCode::database_error, st.error());
  }

  Statement update(db,
                   "UPDATE reports SET checker_id = ?, severity = ?, message = ?, file = ?, line = ?, col = ?, "
                   "blob_id = ?, bug_path = ?, path_hash = ?, confidence = ?, scope = ?, detection_status = ?, "
                   "fixed_generation = 0, last_seen_generation = ? WHERE id = ?");
  Statement insert(db,
                   "INSERT INTO reports(run_id, fingerprint, checker_id, severity, message, file, line, col, "
                   "blob_id, bug_path, path_hash, confidence, scope, detection_status, detected_generation, "
                   "fixed_generation, last_seen_generation) "
                   "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 'new', ?, 0, ?)");
  Statement clear_occ(db, "DELETE FROM report_occurrences WHERE report_id = ?");
  Statement insert_occ(db,
                       "INSERT INTO report_occurrences(report_id, compilation_unit, file, line, col, path_hash) "
                       "VALUES(?, ?, ?, ?, ?, ?)");
  Statement upsert_review(db,
                          "INSERT INTO review_statuses(fingerprint, status, message, author, updated_at, from_source) "
                          "VALUES(?, ?, ?, 'source', ?, 1) "
                          "ON CONFLICT(fingerprint) DO UPDATE SET status = excluded.status, "
                          "message = excluded.message, author = excluded.author, "
                          "updated_at = excluded.updated_at, from_source = 1 "
                          "WHERE review_statuses.status != excluded.status "
                          "OR review_statuses.message != excluded.message "
                          "OR review_statuses.from_source = 0");
  Statement vanish(db, "UPDATE reports SET detection_status = ?, fixed_generation = ? WHERE id = ?");
  for (const Statement* s : {&update, &insert, &clear_occ, &insert_occ, &upsert_review, &vanish}) {
    if (!s->ok()) return fail(ErrorCode::database_error, s->error());
  }

  CommitSummary summary;
  summary.run = handle.run();
  summary.generation = generation;
  summary.total = staged.size();

  // 3. Present in the new generation.
  std::unordered_set<std::string> new_checkers;
  for (const auto& r : staged) {
    new_checkers.insert(r.checker_id);
    int64_t report_id = 0;
    auto it = existing.find(r.fingerprint);
    if (it != existing.end()) {
      const DetectionStatus next = status_when_present(it->second.status);
      if (next == DetectionStatus::Reopened) ++summary.reopened_count;
      else ++summary.unresolved_count;
      report_id = it->second.id;
      update.reset();
      update.bind_text(1, r.checker_id);
      update.bind_text(2, to_string(r.severity));
      update.bind_text(3, r.message);
      update.bind_text(4, r.file);
      update.bind_int(5, r.line);
      update.bind_int(6, r.column);
      update.bind_text(7, r.blob_id);
      update.bind_text(8, bug_path_to_json(r.bug_path));
      update.bind_text(9, r.path_hash);
      update.bind_text(10, to_string(r.confidence));
      update.bind_text(11, r.scope);
      update.bind_text(12, to_string(next));
      update.bind_int(13, static_cast<int64_t>(generation));
      update.bind_int(14, report_id);
      if (update.step() != SQLITE_DONE) return fail(ErrorCode::database_error, update.error());
      clear_occ.reset();
      clear_occ.bind_int(1, report_id);
      if (clear_occ.step() != SQLITE_DONE) return fail(ErrorCode::database_error, clear_occ.error());
      existing.erase(it);
    } else {
      ++summary.new_count;
      insert.reset();
      insert.bind_int(1, run_id);
      insert.bind_text(2, r.fingerprint);
      insert.bind_text(3, r.checker_id);
      insert.bind_text(4, to_string(r.severity));
      insert.bind_text(5, r.message);
      insert.bind_text(6, r.file);
      insert.bind_int(7, r.line);
      insert.bind_int(8, r.column);
      insert.bind_text(9, r.blob_id);
      insert.bind_text(10, bug_path_to_json(r.bug_path));
      insert.bind_text(11, r.path_hash);
      insert.bind_text(12, to_string(r.confidence));
      insert.bind_text(13, r.scope);
      insert.bind_int(14, static_cast<int64_t>(generation));
      insert.bind_int(15, static_cast<int64_t>(generation));
      if (insert.step() != SQLITE_DONE) return fail(ErrorCode::database_error, insert.error());
      report_id = sqlite3_last_insert_rowid(db);
    }

    for (const auto& o : r.occurrences) {
      insert_occ.reset();
      insert_occ.bind_int(1, report_id);
      insert_occ.bind_text(2, o.compilation_unit);
      insert_occ.bind_text(3, o.file);
      insert_occ.bind_int(4, o.line);
      insert_occ.bind_int(5, o.column);
      insert_occ.bind_text(6, o.path_hash);
      if (insert_occ.step() != SQLITE_DONE) return fail(ErrorCode::database_error, insert_occ.error());
    }

    if (r.source_review) {
      upsert_review.reset();
      upsert_review.bind_text(1, r.fingerprint);
      upsert_review.bind_text(2, to_string(r.source_review->status));
      upsert_review.bind_text(3, r.source_review->message);
      upsert_review.bind_int(4, static_cast<int64_t>(ts));
      if (upsert_review.step() != SQLITE_DONE) return fail(ErrorCode::database_error, upsert_review.error());
      ++summary.source_reviews;
    }
  }

  // 4. Absent from the new generation.
  const std::set<std::string> disabled(opts.disabled_checkers.begin(), opts.disabled_checkers.end());
  const std::set<std::string> enabled(opts.enabled_checkers.begin(), opts.enabled_checkers.end());
  for (const auto& [fp, old] : existing) {
    if (!is_active(old.status)) continue;
    VanishCause cause = VanishCause::fixed;
    if (disabled.contains(old.checker_id)) {
      cause = VanishCause::checker_disabled;
    } else if (!enabled.empty() && !enabled.contains(old.checker_id) && !new_checkers.contains(old.checker_id)) {
      cause = VanishCause::checker_unavailable;
    }
    const DetectionStatus next = status_when_vanished(old.status, cause);
    if (next == DetectionStatus::Off) ++summary.off_count;
    else if (next == DetectionStatus::Unavailable) ++summary.unavailable_count;
    else ++summary.resolved_count;
    vanish.reset();
    vanish.bind_text(1, to_string(next));
    vanish.bind_int(2, static_cast<int64_t>(generation));
    vanish.bind_int(3, old.id);
    if (vanish.step() != SQLITE_DONE) return fail(ErrorCode::database_error, vanish.error());
  }

  // 5. Commit log and generation counter.
  {
    Statement st(db,
                 "INSERT INTO run_history(run_id, generation, tag, committed_at, new_count, unresolved_count, "
                 "resolved_count, reopened_count, enabled_checkers, disabled_checkers) "
                 "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!st.ok()) return fail(ErrorCode::database_error, st.error());
    st.bind_int(1, run_id);
    st.bind_int(2, static_cast<int64_t>(generation));
    st.bind_text(3, opts.tag);
    st.bind_int(4, static_cast<int64_t>(ts));
    st.bind_int(5, static_cast<int64_t>(summary.new_count));
    st.bind_int(6, static_cast<int64_t>(summary.unresolved_count));
    st.bind_int(7, static_cast<int64_t>(summary.resolved_count));
    st.bind_int(8, static_cast<int64_t>(summary.reopened_count));
    st.bind_text(9, string_list_to_json(opts.enabled_checkers));
    st.bind_text(10, string_list_to_json(opts.disabled_checkers));
    if (st.step() != SQLITE_DONE) return fail(ErrorCode::database_error, st.error());
  }
  {
    Statement st(db, "UPDATE runs SET generation = ?, updated_at = ?, latest_tag = ? WHERE id = ?");
    if (!st.ok()) return fail(ErrorCode::database_error, st.error());
    st.bind_int(1, static_cast<int64_t>(generation));
    st.bind_int(2, static_cast<int64_t>(ts));
    st.bind_text(3, opts.tag);
    st.bind_int(4, run_id);
    if (st.step() != SQLITE_DONE) return fail(ErrorCode::database_error, st.error());
  }

  if (!exec(db, "COMMIT", &err)) return fail(ErrorCode::database_error, "commit failed: " + err);

  log_message(LogLevel::info, "report_store",
              "run " + summary.run + " generation " + std::to_string(generation) + ": " +
                  std::to_string(summary.new_count) + " new, " + std::to_string(summary.unresolved_count) +
                  " unresolved, " + std::to_string(summary.reopened_count) + " reopened, " +
                  std::to_string(summary.resolved_count) + " resolved");
  return summary;
}

// ---------------------------------------------------------------------------
// Runs
// ---------------------------------------------------------------------------

std::optional<RunInfo> ReportStore::get_run(const std::string& name, Error* error) const {
  auto lease = impl_->pool.acquire();
  sqlite3* db = lease.get();
  ReadTransaction txn(db);

  Statement st(db, "SELECT id, name, generation, created_at, updated_at, latest_tag FROM runs WHERE name = ?");
  if (!st.ok()) {
    set_error(error, ErrorCode::database_error, st.error());
    return std::nullopt;
  }
  st.bind_text(1, name);
  const int rc = st.step();
  if (rc == SQLITE_DONE) {
    set_error(error, ErrorCode::run_not_found, "no run named " + name);
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    set_error(error, ErrorCode::database_error, st.error());
    return std::nullopt;
  }
  RunInfo info;
  info.id = st.i64(0);
  info.name = st.text(1);
  info.generation = st.u64(2);
  info.created_at = st.u64(3);
  info.updated_at = st.u64(4);
  info.latest_tag = st.text(5);

  Statement counts(db, "SELECT detection_status, COUNT(*) FROM reports WHERE run_id = ? GROUP BY detection_status");
  if (!counts.ok()) {
    set_error(error, ErrorCode::database_error, counts.error());
    return std::nullopt;
  }
  counts.bind_int(1, info.id);
  int crc;
  while ((crc = counts.step()) == SQLITE_ROW) {
    if (auto s = parse_detection_status(counts.text(0))) info.status_counts[*s] = counts.u64(1);
  }
  if (crc != SQLITE_DONE) {
    set_error(error, ErrorCode::database_error, counts.error());
    return std::nullopt;
  }
  return info;
}

std::vector<RunInfo> ReportStore::list_runs(Error* error) const {
  auto lease = impl_->pool.acquire();
  sqlite3* db = lease.get();
  ReadTransaction txn(db);

  std::vector<RunInfo> out;
  Statement st(db, "SELECT id, name, generation, created_at, updated_at, latest_tag FROM runs ORDER BY name");
  if (!st.ok()) {
    set_error(error, ErrorCode::database_error, st.error());
    return out;
  }
  std::unordered_map<int64_t, size_t> by_id;
  int rc;
  while ((rc = st.step()) == SQLITE_ROW) {
    RunInfo info;
    info.id = st.i64(0);
    info.name = st.text(1);
    info.generation = st.u64(2);
    info.created_at = st.u64(3);
    info.updated_at = st.u64(4);
    info.latest_tag = st.text(5);
    by_id[info.id] = out.size();
    out.push_back(std::move(info));
  }
  if (rc != SQLITE_DONE) {
    set_error(error, ErrorCode::database_error, st.error());
    return {};
  }

  Statement counts(db, "SELECT run_id, detection_status, COUNT(*) FROM reports GROUP BY run_id, detection_status");
  if (!counts.ok()) {
    set_error(error, ErrorCode::database_error, counts.error());
    return out;
  }
  while ((rc = counts.step()) == SQLITE_ROW) {
    auto it = by_id.find(counts.i64(0));
    auto s = parse_detection_status(counts.text(1));
    if (it != by_id.end() && s) out[it->second].status_counts[*s] = counts.u64(2);
  }
  if (rc != SQLITE_DONE) {
    set_error(error, ErrorCode::database_error, counts.error());
    return {};
  }
  return out;
}

std::vector<RunHistoryEntry> ReportStore::run_history(const std::string& name, Error* error) const {
  auto lease = impl_->pool.acquire();
  std::vector<RunHistoryEntry> out;
  Statement st(lease.get(),
               "SELECT h.generation, h.tag, h.committed_at, h.new_count, h.unresolved_count, h.resolved_count, "
               "h.reopened_count, h.enabled_checkers, h.disabled_checkers "
               "FROM run_history h JOIN runs ON runs.id = h.run_id WHERE runs.name = ? ORDER BY h.generation");
  if (!st.ok()) {
    set_error(error, ErrorCode::database_error, st.error());
    return out;
  }
  st.bind_text(1, name);
  int rc;
  while ((rc = st.step()) == SQLITE_ROW) {
    RunHistoryEntry e;
    e.generation = st.u64(0);
    e.tag = st.text(1);
    e.committed_at = st.u64(2);
    e.new_count = st.u64(3);
    e.unresolved_count = st.u64(4);
    e.resolved_count = st.u64(5);
    e.reopened_count = st.u64(6);
    e.enabled_checkers = string_list_from_json(st.text(7));
    e.disabled_checkers = string_list_from_json(st.text(8));
    out.push_back(std::move(e));
  }
  if (rc != SQLITE_DONE) {
    set_error(error, ErrorCode::database_error, st.error());
    return {};
  }
  return out;
}

bool ReportStore::remove_run(const std::string& name, Error* error) {
  auto lease = impl_->pool.acquire();
  Statement st(lease.get(), "DELETE FROM runs WHERE name = ?");
  if (!st.ok()) {
    set_error(error, ErrorCode::database_error, st.error());
    return false;
  }
  st.bind_text(1, name);
  if (st.step() != SQLITE_DONE) {
    set_error(error, ErrorCode::database_error, st.error());
    return false;
  }
  if (sqlite3_changes(lease.get()) == 0) {
    set_error(error, ErrorCode::run_not_found, "no run named " + name);
    return false;
  }
  log_message(LogLevel::info, "report_store", "removed run " + name);
  return true;
}

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------

std::optional<std::vector<Report>> ReportStore::reports(const std::string& run, Error* error) const {
  auto lease = impl_->pool.acquire();
  ReadTransaction txn(lease.get());
  if (!impl_->require_runs(lease.get(), {run}, error)) return std::nullopt;
  return impl_->load_reports(lease.get(), run, error);
}

std::optional<std::vector<ReportEntry>> ReportStore::report_entries(const std::vector<std::string>& runs,
                                                                    Error* error) const {
  auto lease = impl_->pool.acquire();
  ReadTransaction txn(lease.get());
  if (!impl_->require_runs(lease.get(), runs, error)) return std::nullopt;

  std::vector<ReportEntry> out;
  for (const auto& run : runs) {
    auto reports = impl_->load_reports(lease.get(), run, error);
    if (!reports) return std::nullopt;
    for (const auto& r : *reports) {
      ReportEntry base;
      base.run = run;
      base.fingerprint = r.fingerprint;
      base.checker_id = r.checker_id;
      base.severity = r.severity;
      base.message = r.message;
      base.detection_status = r.detection_status;
      base.review_status = r.review_status;
      if (r.occurrences.empty()) {
        base.file = r.file;
        base.line = r.line;
        base.column = r.column;
        base.path_hash = r.path_hash;
        out.push_back(std::move(base));
        continue;
      }
      for (const auto& o : r.occurrences) {
        ReportEntry e = base;
        e.compilation_unit = o.compilation_unit;
        e.file = o.file;
        e.line = o.line;
        e.column = o.column;
        e.path_hash = o.path_hash;
        out.push_back(std::move(e));
      }
    }
  }
  return out;
}

// ---------------------------------------------------------------------------
// Review status
// ---------------------------------------------------------------------------

bool ReportStore::set_review_status(const std::string& fingerprint, ReviewStatus status,
                                    const std::string& message, const std::string& author, Error* error) {
  if (fingerprint.empty()) {
    set_error(error, ErrorCode::invalid_argument, "fingerprint must not be empty");
    return false;
  }
  auto lease = impl_->pool.acquire();
  Statement st(lease.get(),
               "INSERT INTO review_statuses(fingerprint, status, message, author, updated_at, from_source) "
               "VALUES(?, ?, ?, ?, ?, 0) "
               "ON CONFLICT(fingerprint) DO UPDATE SET status = excluded.status, message = excluded.message, "
               "author = excluded.author, updated_at = excluded.updated_at, from_source = 0");
  if (!st.ok()) {
    set_error(error, ErrorCode::database_error, st.error());
    return false;
  }
  st.bind_text(1, fingerprint);
  st.bind_text(2, to_string(status));
  st.bind_text(3, message);
  st.bind_text(4, author);
  st.bind_int(5, static_cast<int64_t>(now_unix()));
  if (st.step() != SQLITE_DONE) {
    set_error(error, ErrorCode::database_error, st.error());
    return false;
  }
  log_message(LogLevel::info, "report_store",
              "review status of " + fingerprint + " set to " + to_string(status) +
                  (author.empty() ? std::string() : " by " + author));
  return true;
}

std::optional<ReviewRecord> ReportStore::review_status(const std::string& fingerprint, Error* error) const {
  auto lease = impl_->pool.acquire();
  Statement st(lease.get(),
               "SELECT fingerprint, status, message, author, updated_at, from_source "
               "FROM review_statuses WHERE fingerprint = ?");
  if (!st.ok()) {
    set_error(error, ErrorCode::database_error, st.error());
    return std::nullopt;
  }
  st.bind_text(1, fingerprint);
  const int rc = st.step();
  if (rc == SQLITE_DONE) {
    // Never reviewed.
    ReviewRecord r;
    r.fingerprint = fingerprint;
    return r;
  }
  if (rc != SQLITE_ROW) {
    set_error(error, ErrorCode::database_error, st.error());
    return std::nullopt;
  }
  ReviewRecord r;
  r.fingerprint = st.text(0);
  r.status = parse_review_status(st.text(1)).value_or(ReviewStatus::Unreviewed);
  r.message = st.text(2);
  r.author = st.text(3);
  r.updated_at = st.u64(4);
  r.from_source = st.i64(5) != 0;
  return r;
}

std::optional<std::set<std::string>> ReportStore::suppressed_fingerprints(Error* error) const {
  auto lease = impl_->pool.acquire();
  Statement st(lease.get(),
               "SELECT fingerprint FROM review_statuses WHERE status IN ('false_positive', 'intentional')");
  if (!st.ok()) {
    set_error(error, ErrorCode::database_error, st.error());
    return std::nullopt;
  }
  std::set<std::string> out;
  int rc;
  while ((rc = st.step()) == SQLITE_ROW) out.insert(st.text(0));
  if (rc != SQLITE_DONE) {
    set_error(error, ErrorCode::database_error, st.error());
    return std::nullopt;
  }
  return out;
}

}  // namespace triage
