#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include <sqlite3.h>

#include "triage/blob_store.hpp"
#include "triage/config.hpp"
#include "triage/dedup.hpp"
#include "triage/diff.hpp"
#include "triage/fingerprint.hpp"
#include "triage/hash.hpp"
#include "triage/ingestion.hpp"
#include "triage/jsonlite.hpp"
#include "triage/observability.hpp"
#include "triage/query.hpp"
#include "triage/report_store.hpp"
#include "triage/schema.hpp"
#include "triage/suppression.hpp"
#include "triage/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ============================================================================
// Fixtures
// ============================================================================

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("triage_tests_" + name);
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  return dir;
}

std::unique_ptr<triage::ReportStore> open_store(const fs::path& dir, triage::Error* error = nullptr,
                                                bool auto_migrate = true) {
  triage::StoreOptions options;
  options.db_path = (dir / "reports.db").string();
  options.auto_migrate = auto_migrate;
  options.pool_size = 4;
  return triage::ReportStore::open(options, error);
}

triage::Report make_report(const std::string& label, const std::string& checker, uint32_t line = 1) {
  triage::Report r;
  r.fingerprint = triage::fingerprint_digest(label);
  r.checker_id = checker;
  r.file = "src/" + label + ".cpp";
  r.line = line;
  r.column = 1;
  r.message = label;
  r.path_hash = triage::bug_path_digest(label);
  return r;
}

std::optional<triage::CommitSummary> commit_generation(triage::ReportStore& store, const std::string& run,
                                                       const std::vector<std::pair<std::string, std::string>>& items,
                                                       const triage::GenerationOptions& options = {}) {
  triage::Error err;
  auto handle = store.begin_ingestion(run, options, &err);
  expect(handle != nullptr, "begin_ingestion: " + err.message);
  for (const auto& [label, checker] : items) {
    expect(store.add_report(*handle, make_report(label, checker), &err), "add_report: " + err.message);
  }
  auto summary = store.commit(*handle, &err);
  expect(summary.has_value(), "commit: " + err.message);
  return summary;
}

triage::DetectionStatus status_of(const triage::ReportStore& store, const std::string& run,
                                  const std::string& label) {
  auto reports = store.reports(run, nullptr);
  expect(reports.has_value(), "reports() must succeed");
  const std::string fp = triage::fingerprint_digest(label);
  for (const auto& r : *reports) {
    if (r.fingerprint == fp) return r.detection_status;
  }
  expect(false, "report " + label + " not stored in " + run);
  return triage::DetectionStatus::New;
}

constexpr const char* kAppSource =
    "namespace app {\n"          // 1
    "int divide(int x) {\n"      // 2
    "  return x / 0;\n"          // 3
    "}\n"                        // 4
    "int lookup(int* p) {\n"     // 5
    "  return *p;\n"             // 6
    "}\n"                        // 7
    "void leak() {\n"            // 8
    "  char* b = new char[4];\n" // 9
    "}\n"                        // 10
    "}  // namespace app\n";     // 11

constexpr const char* kAppFile = "src/app.cpp";

triage::Finding app_finding(const std::string& which) {
  triage::Finding f;
  f.file = kAppFile;
  f.column = 3;
  if (which == "A") {
    f.checker_id = "core.DivideZero";
    f.line = 3;
    f.message = "Division by zero";
  } else if (which == "B") {
    f.checker_id = "core.NullDereference";
    f.line = 6;
    f.message = "Dereference of null pointer";
  } else {
    f.checker_id = "cplusplus.NewDeleteLeaks";
    f.line = 9;
    f.message = "Potential leak of memory pointed to by 'b'";
  }
  return f;
}

triage::FindingsBundle app_bundle(const std::vector<std::string>& which, const std::string& unit = "app.cpp") {
  triage::FindingsBundle bundle;
  triage::FindingsUnit u;
  u.compilation_unit = unit;
  for (const auto& w : which) u.findings.push_back(app_finding(w));
  bundle.units.push_back(std::move(u));
  bundle.sources[kAppFile] = kAppSource;
  return bundle;
}

std::string app_fingerprint(const std::string& which) {
  return triage::compute_fingerprint(app_finding(which), std::string_view(kAppSource)).value;
}

std::set<std::string> fingerprints(const std::vector<triage::ReportEntry>& entries) {
  std::set<std::string> out;
  for (const auto& e : entries) out.insert(e.fingerprint);
  return out;
}

std::mutex g_events_mu;
std::vector<triage::IngestionEvent> g_events;

void capture_event(const triage::IngestionEvent& ev) {
  std::lock_guard<std::mutex> lk(g_events_mu);
  g_events.push_back(ev);
}

// ============================================================================
// Hashing & JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(triage::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(triage::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string fp = triage::fingerprint_digest("payload");
  const std::string blob = triage::blob_content_hash("payload");
  const std::string path = triage::bug_path_digest("payload");
  expect(fp != blob && blob != path && fp != path, "domains must not collide");
  expect(triage::valid_digest(fp) && triage::valid_digest(blob), "digests are 64 lowercase hex chars");
  expect(!triage::valid_digest("xyz"), "short digest rejected");
  expect(triage::hash_runtime_info().primitive == "blake3", "hash primitive is blake3");
}

void test_json_canonical_and_strict() {
  std::optional<triage::jsonlite::JsonError> err;
  const auto canon = triage::jsonlite::canonicalize_json("{ \"b\": 1, \"a\": [true, null] }", &err);
  expect(!err, "valid JSON canonicalizes");
  expect(canon == "{\"a\":[true,null],\"b\":1}", "keys sorted, whitespace dropped");

  triage::jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate keys rejected");
  triage::jsonlite::parse("{\"a\":", &err);
  expect(err && err->code == "json_parse_error", "truncated JSON rejected");
}

// ============================================================================
// Fingerprint calculator
// ============================================================================

void test_fingerprint_line_shift() {
  const std::string shifted =
      "// header added later\n"
      "#include <cstdio>\n"
      "namespace app {\n"
      "int divide(int x) {\n"
      "      return x/0;\n"
      "}\n"
      "}\n";
  triage::Finding moved = app_finding("A");
  moved.line = 5;
  moved.file = "/home/ci/checkout/src/app.cpp";

  const auto a = triage::compute_fingerprint(app_finding("A"), std::string_view(kAppSource));
  const auto b = triage::compute_fingerprint(moved, std::string_view(shifted));
  expect(a.value == b.value, "fingerprint survives line shift, path change and reindent");
  expect(a.confidence == triage::IdentityConfidence::scoped, "scoped identity");
  expect(a.scope == "namespace app > int divide(int x)", "scope chain: " + a.scope);
}

void test_fingerprint_encodings() {
  const std::string utf8 = kAppSource;
  std::string crlf;
  for (char c : utf8) {
    if (c == '\n') crlf += "\r\n";
    else crlf += c;
  }
  const std::string bom = "\xEF\xBB\xBF" + utf8;
  std::string utf16le = "\xFF\xFE";
  for (char c : crlf) {
    utf16le += c;
    utf16le += '\0';
  }

  const auto base = triage::compute_fingerprint(app_finding("B"), std::string_view(utf8)).value;
  expect(triage::compute_fingerprint(app_finding("B"), std::string_view(crlf)).value == base, "CRLF");
  expect(triage::compute_fingerprint(app_finding("B"), std::string_view(bom)).value == base, "UTF-8 BOM");
  expect(triage::compute_fingerprint(app_finding("B"), std::string_view(utf16le)).value == base, "UTF-16LE");
}

void test_fingerprint_sensitivity() {
  const std::string renamed =
      "namespace app {\n"
      "int divide_checked(int x) {\n"
      "  return x / 0;\n"
      "}\n"
      "}\n";
  const auto a = triage::compute_fingerprint(app_finding("A"), std::string_view(kAppSource)).value;
  expect(triage::compute_fingerprint(app_finding("A"), std::string_view(renamed)).value != a,
         "enclosing function name is part of the identity");

  triage::Finding other_checker = app_finding("A");
  other_checker.checker_id = "core.UndefinedBinaryOperatorResult";
  expect(triage::compute_fingerprint(other_checker, std::string_view(kAppSource)).value != a,
         "checker id is part of the identity");

  const std::string edited =
      "namespace app {\n"
      "int divide(int x) {\n"
      "  return x / zero;\n"
      "}\n"
      "}\n";
  expect(triage::compute_fingerprint(app_finding("A"), std::string_view(edited)).value != a,
         "flagged line text is part of the identity");
}

void test_fingerprint_fallback() {
  const std::string top_level = "int g = 1 / 0;\n";
  triage::Finding f;
  f.checker_id = "core.DivideZero";
  f.file = "g.cpp";
  f.line = 1;
  f.message = "Division by zero";
  const auto fp = triage::compute_fingerprint(f, std::string_view(top_level));
  expect(fp.confidence == triage::IdentityConfidence::file_level, "file scope falls back to file_level");
  expect(fp.scope.empty(), "no scope at file level");

  const uint64_t fallbacks = triage::global_store_stats().identity_fallbacks.load();
  const auto no_source = triage::compute_fingerprint(f, triage::SourceView());
  expect(no_source.confidence == triage::IdentityConfidence::file_level, "missing source is file_level");
  expect(triage::global_store_stats().identity_fallbacks.load() > fallbacks, "fallback counted");
  f.line = 40;
  expect(triage::compute_fingerprint(f, triage::SourceView()).value == no_source.value,
         "without source the identity ignores the line number");

  f.scope_text = "void  handler( int )";
  const auto supplied = triage::compute_fingerprint(f, triage::SourceView());
  expect(supplied.scope == "void handler(int)", "analyzer scope text normalized: " + supplied.scope);
}

void test_enclosing_scopes_parser() {
  const std::string src =
      "namespace outer {\n"                        // 1
      "class Widget : public Base {\n"             // 2
      " public:\n"                                 // 3
      "  Widget() : size_{0}, name_(\"{\") {\n"    // 4
      "    // brace { in a comment\n"              // 5
      "    if (size_ == 0) {\n"                    // 6
      "      auto f = [&] { return 1; };\n"        // 7
      "      use(f);\n"                            // 8
      "    }\n"                                    // 9
      "  }\n"                                      // 10
      "};\n"                                       // 11
      "}\n";                                       // 12
  const triage::SourceView view(src);
  const auto chain = triage::enclosing_scopes(view, 8);
  expect(chain.size() == 3, "three named scopes, got " + std::to_string(chain.size()));
  expect(chain[0] == "namespace outer", "namespace: " + chain[0]);
  expect(chain[1] == "class Widget", "class: " + chain[1]);
  expect(chain[2] == "Widget()", "constructor: " + chain[2]);
  expect(triage::enclosing_scopes(view, 12).size() == 1, "after the class only the namespace remains");
}

void test_scope_parser_conditionals() {
  const std::string src =
      "#ifdef LEGACY_API\n"         // 1
      "void f(int a) {\n"           // 2
      "#else\n"                     // 3
      "void f(int a, int b) {\n"    // 4
      "#endif\n"                    // 5
      "  run(a);\n"                 // 6
      "}\n"                         // 7
      "#if 0\n"                     // 8
      "#if NESTED\n"                // 9
      "#endif\n"                    // 10
      "#elif DEBUG\n"               // 11
      "namespace dbg {\n"           // 12
      "#endif\n"                    // 13
      "void g() {\n"                // 14
      "  run(0);\n"                 // 15
      "}\n";                        // 16
  const triage::SourceView view(src);
  const auto in_f = triage::enclosing_scopes(view, 6);
  expect(in_f.size() == 1 && in_f[0] == "void f(int a)", "first branch header is used");
  const auto in_g = triage::enclosing_scopes(view, 15);
  expect(in_g.size() == 1, "split header leaves no open frame, got " + std::to_string(in_g.size()));
  expect(in_g[0] == "void g()", "g scope: " + in_g[0]);
}

void test_report_path_hash() {
  triage::Finding f = app_finding("B");
  const std::string fp = app_fingerprint("B");
  const std::string h1 = triage::report_path_hash(f, fp);
  expect(h1 == triage::report_path_hash(f, fp), "path hash deterministic");
  f.bug_path.push_back({kAppFile, 5, 1, "Assuming 'p' is null"});
  f.bug_path.push_back({kAppFile, 6, 10, "Dereference of null pointer"});
  expect(triage::report_path_hash(f, fp) != h1, "bug path steps change the path hash");
}

// ============================================================================
// In-source review comments
// ============================================================================

void test_suppression_comments() {
  const std::string src =
      "void f(int* p) {\n"                                                // 1
      "  // triage_suppress [core.NullDereference] checked by caller\n"   // 2
      "  // continues here\n"                                              // 3
      "  use(*p);\n"                                                       // 4
      "  /* triage_intentional [all] on purpose */\n"                      // 5
      "  leak();\n"                                                        // 6
      "  // triage_supress [core] typo\n"                                  // 7
      "  bad();\n"                                                         // 8
      "  // triage_confirmed [core.A] first\n"                             // 9
      "  // triage_false_positive [core] second\n"                         // 10
      "  both();\n"                                                        // 11
      "}\n";
  const triage::SourceView view(src);

  auto r = triage::find_source_review(view, 4, "core.NullDereference");
  expect(r.review && r.review->status == triage::ReviewStatus::FalsePositive, "suppress marker");
  expect(r.review->message == "checked by caller continues here", "message continues: " + r.review->message);
  expect(!triage::find_source_review(view, 4, "unix.Malloc").review, "checker list restricts the comment");

  r = triage::find_source_review(view, 6, "unix.Malloc");
  expect(r.review && r.review->status == triage::ReviewStatus::Intentional, "block comment with [all]");
  expect(r.review->message == "on purpose", "block comment message");

  r = triage::find_source_review(view, 8, "core.X");
  expect(!r.review, "misspelled marker is ignored");
  expect(!r.warnings.empty(), "misspelled marker warns");

  r = triage::find_source_review(view, 11, "core.A");
  expect(!r.review, "two applicable comments are ambiguous");
  expect(!r.warnings.empty(), "ambiguity warns");
  r = triage::find_source_review(view, 11, "core.B");
  expect(r.review && r.review->status == triage::ReviewStatus::FalsePositive, "only one applies to core.B");
}

// ============================================================================
// Blob store
// ============================================================================

void test_blob_dedup_and_paths() {
  const auto dir = fresh_dir("blob_dedup");
  triage::FsBlobStore blobs((dir / "blobs").string());
  triage::Error err;
  const std::string id1 = blobs.put("/a/app.cpp", kAppSource, &err);
  const std::string id2 = blobs.put("/b/app.cpp", kAppSource, &err);
  expect(!id1.empty() && id1 == id2, "identical content stored once");
  expect(id1 == triage::blob_content_hash(kAppSource), "id is the content hash");
  expect(blobs.size() == 1, "one blob");
  const auto paths = blobs.paths_for(id1);
  expect(paths.size() == 2, "both paths recorded");

  auto got = blobs.get(id1, &err);
  expect(got && *got == kAppSource, "get returns original bytes");

  const std::string unknown = triage::blob_content_hash("never stored");
  expect(!blobs.get(unknown, &err), "unknown id");
  expect(err.code == triage::ErrorCode::blob_not_found, "unknown id is blob_not_found");
}

void test_blob_corruption_detected() {
  const auto dir = fresh_dir("blob_corrupt");
  triage::FsBlobStore blobs((dir / "blobs").string());
  triage::Error err;
  const std::string id = blobs.put("app.cpp", kAppSource, &err);
  {
    std::ofstream ofs(blobs.object_path(id), std::ios::binary | std::ios::trunc);
    ofs << "tampered";
  }
  err = {};
  expect(!blobs.get(id, &err), "corrupted blob is not returned");
  expect(err.code == triage::ErrorCode::blob_not_found, "corruption reported as blob_not_found");

  expect(blobs.put("app.cpp", kAppSource, &err) == id, "put repairs a damaged blob");
  auto got = blobs.get(id, &err);
  expect(got && *got == kAppSource, "repaired blob verifies");
}

// ============================================================================
// Report store
// ============================================================================

void test_store_idempotent_add() {
  const auto dir = fresh_dir("idempotent");
  triage::Error err;
  auto store = open_store(dir, &err);
  expect(store != nullptr, "open: " + err.message);
  expect(store->schema_version() == triage::version::SCHEMA_VERSION, "fresh database at current schema");

  auto handle = store->begin_ingestion("r", {}, &err);
  auto long_path = make_report("A", "core.X");
  long_path.bug_path = {{"a.cpp", 1, 1, "one"}, {"a.cpp", 2, 1, "two"}, {"a.cpp", 3, 1, "three"}};
  long_path.occurrences = {{"tu1.cpp", "a.cpp", 3, 1, "p1"}};
  auto short_path = make_report("A", "core.X");
  short_path.bug_path = {{"a.cpp", 3, 1, "only"}};
  short_path.occurrences = {{"tu2.cpp", "a.cpp", 3, 1, "p2"}};

  expect(store->add_report(*handle, long_path, &err), "first add");
  expect(store->add_report(*handle, short_path, &err), "second add");
  expect(store->add_report(*handle, long_path, &err), "repeat add");
  expect(handle->report_count() == 1, "one staged report per fingerprint");

  auto summary = store->commit(*handle, &err);
  expect(summary && summary->total == 1 && summary->new_count == 1, "one new report");
  auto reports = store->reports("r", &err);
  expect(reports && reports->size() == 1, "one stored report");
  expect((*reports)[0].occurrences.size() == 2, "both compilation units kept");
  expect((*reports)[0].bug_path.size() == 1, "shortest bug path is canonical");

  // Same generation content, reversed arrival order.
  handle = store->begin_ingestion("r2", {}, &err);
  expect(store->add_report(*handle, short_path, &err), "add short first");
  expect(store->add_report(*handle, long_path, &err), "add long second");
  expect(store->commit(*handle, &err).has_value(), "commit r2");
  auto reports2 = store->reports("r2", &err);
  expect(reports2 && (*reports2)[0].bug_path.size() == 1, "merge independent of arrival order");
}

void test_resolution_round_trip() {
  const auto dir = fresh_dir("round_trip");
  auto store = open_store(dir);
  expect(store != nullptr, "open");

  auto s1 = commit_generation(*store, "main", {{"A", "x"}, {"B", "x"}, {"C", "x"}});
  expect(s1->generation == 1 && s1->new_count == 3, "generation 1: three new");

  auto s2 = commit_generation(*store, "main", {{"A", "x"}, {"C", "x"}});
  expect(s2->generation == 2 && s2->unresolved_count == 2 && s2->resolved_count == 1, "generation 2 counts");
  expect(status_of(*store, "main", "B") == triage::DetectionStatus::Resolved, "B resolved");
  expect(status_of(*store, "main", "A") == triage::DetectionStatus::Unresolved, "A unresolved");

  auto reports = store->reports("main", nullptr);
  for (const auto& r : *reports) {
    if (r.fingerprint == triage::fingerprint_digest("B")) {
      expect(r.fixed_generation == 2, "fixed in generation 2");
      expect(r.detected_generation == 1, "detected in generation 1");
    }
  }

  auto s3 = commit_generation(*store, "main", {{"A", "x"}, {"B", "x"}, {"C", "x"}});
  expect(s3->reopened_count == 1 && s3->unresolved_count == 2, "generation 3 counts");
  expect(status_of(*store, "main", "B") == triage::DetectionStatus::Reopened, "B reopened");

  auto run = store->get_run("main", nullptr);
  expect(run && run->generation == 3, "generation counter");
  expect(run->status_counts[triage::DetectionStatus::Reopened] == 1, "status counts");
  auto history = store->run_history("main", nullptr);
  expect(history.size() == 3, "one history entry per generation");
  expect(history[1].resolved_count == 1 && history[2].reopened_count == 1, "history counts");
}

void test_checker_off_and_unavailable() {
  const auto dir = fresh_dir("off_unavailable");
  auto store = open_store(dir);
  commit_generation(*store, "r", {{"A", "alpha"}, {"B", "beta"}, {"C", "gamma"}});

  triage::GenerationOptions options;
  options.enabled_checkers = {"alpha"};
  options.disabled_checkers = {"beta"};
  auto s = commit_generation(*store, "r", {{"A", "alpha"}}, options);
  expect(s->off_count == 1 && s->unavailable_count == 1 && s->resolved_count == 0, "off/unavailable counts");
  expect(status_of(*store, "r", "B") == triage::DetectionStatus::Off, "disabled checker -> Off");
  expect(status_of(*store, "r", "C") == triage::DetectionStatus::Unavailable, "missing checker -> Unavailable");

  commit_generation(*store, "r", {{"A", "alpha"}});
  expect(status_of(*store, "r", "B") == triage::DetectionStatus::Off, "inactive statuses stay");

  commit_generation(*store, "r", {{"A", "alpha"}, {"B", "beta"}, {"C", "gamma"}});
  expect(status_of(*store, "r", "B") == triage::DetectionStatus::Unresolved, "Off reappearing -> Unresolved");
  expect(status_of(*store, "r", "C") == triage::DetectionStatus::Unresolved, "Unavailable reappearing");
}

void test_same_run_conflict() {
  const auto dir = fresh_dir("conflict");
  auto store = open_store(dir);
  triage::Error err;
  auto h1 = store->begin_ingestion("r", {}, &err);
  auto h2 = store->begin_ingestion("r", {}, &err);
  expect(store->add_report(*h1, make_report("A", "x"), &err), "add h1");
  expect(store->add_report(*h2, make_report("B", "x"), &err), "add h2");

  expect(store->commit(*h1, &err).has_value(), "first commit wins");
  err = {};
  expect(!store->commit(*h2, &err).has_value(), "second commit refused");
  expect(err.code == triage::ErrorCode::storage_conflict, "storage_conflict");
  expect(!h2->is_open(), "handle closed after failed commit");

  auto reports = store->reports("r", nullptr);
  expect(reports && reports->size() == 1, "only the winner's reports");
  expect(store->get_run("r", nullptr)->generation == 1, "single generation");
}

void test_abort_keeps_previous_generation() {
  const auto dir = fresh_dir("abort");
  auto store = open_store(dir);
  commit_generation(*store, "r", {{"A", "x"}});
  triage::Error err;
  auto handle = store->begin_ingestion("r", {}, &err);
  expect(handle->generation() == 2, "next generation allocated");
  expect(store->add_report(*handle, make_report("B", "x"), &err), "stage B");
  expect(store->abort(*handle), "abort");
  expect(!store->add_report(*handle, make_report("C", "x"), &err), "closed handle rejects adds");
  expect(err.code == triage::ErrorCode::invalid_handle, "invalid_handle");
  expect(!store->commit(*handle, &err).has_value(), "closed handle cannot commit");

  auto reports = store->reports("r", nullptr);
  expect(reports->size() == 1 && (*reports)[0].detection_status == triage::DetectionStatus::New,
         "previous generation untouched");
  expect(store->get_run("r", nullptr)->generation == 1, "generation unchanged");
}

void test_concurrent_add_report() {
  const auto dir = fresh_dir("concurrent_add");
  auto store = open_store(dir);
  triage::Error err;
  auto handle = store->begin_ingestion("r", {}, &err);
  std::vector<std::thread> threads;
  std::atomic<int> failures{0};
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 100; ++i) {
        auto r = make_report("F" + std::to_string(i % 50), "x");
        r.occurrences = {{"tu" + std::to_string(t), r.file, r.line, r.column, r.path_hash}};
        if (!store->add_report(*handle, r, nullptr)) failures++;
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(failures.load() == 0, "no add failed");
  expect(handle->report_count() == 50, "50 distinct fingerprints");
  auto summary = store->commit(*handle, &err);
  expect(summary && summary->total == 50, "commit all");
  auto reports = store->reports("r", nullptr);
  expect((*reports)[0].occurrences.size() == 8, "one occurrence per compilation unit");
}

void test_review_status_persistence() {
  const auto dir = fresh_dir("review");
  auto store = open_store(dir);
  commit_generation(*store, "r", {{"A", "x"}, {"B", "x"}});
  const std::string fp_b = triage::fingerprint_digest("B");
  triage::Error err;
  expect(store->set_review_status(fp_b, triage::ReviewStatus::FalsePositive, "not reachable", "alice", &err),
         "set review");
  commit_generation(*store, "r", {{"A", "x"}, {"B", "x"}});

  auto record = store->review_status(fp_b, &err);
  expect(record && record->status == triage::ReviewStatus::FalsePositive, "review survives re-ingestion");
  expect(record->author == "alice" && !record->from_source, "manual review metadata");
  auto suppressed = store->suppressed_fingerprints(&err);
  expect(suppressed && suppressed->count(fp_b) == 1, "suppressed set");

  triage::QueryService query(*store);
  auto listed = query.list_reports({"r"}, {}, &err);
  expect(listed && listed->size() == 1, "suppressed report hidden by default");
  triage::ListOptions all;
  all.include_suppressed = true;
  listed = query.list_reports({"r"}, all, &err);
  expect(listed && listed->size() == 2, "include_suppressed lists it");

  auto unknown = store->review_status(triage::fingerprint_digest("never"), &err);
  expect(unknown && unknown->status == triage::ReviewStatus::Unreviewed, "unreviewed by default");
}

void test_remove_run() {
  const auto dir = fresh_dir("remove");
  auto store = open_store(dir);
  commit_generation(*store, "gone", {{"A", "x"}});
  commit_generation(*store, "kept", {{"A", "x"}});
  triage::Error err;
  expect(store->remove_run("gone", &err), "remove");
  expect(!store->get_run("gone", &err), "removed run is gone");
  expect(err.code == triage::ErrorCode::run_not_found, "run_not_found");
  expect(!store->remove_run("gone", &err), "second remove fails");
  expect(store->list_runs(nullptr).size() == 1, "other run kept");
  auto reports = store->reports("kept", nullptr);
  expect(reports && reports->size() == 1, "other run's reports kept");

  err = {};
  expect(store->list_runs(&err).size() == 1 && err.code == triage::ErrorCode::none, "list_runs reads to the end");
  expect(store->run_history("kept", &err).size() == 1 && err.code == triage::ErrorCode::none,
         "run_history reads to the end");
}

void test_unknown_run_rejected() {
  const auto dir = fresh_dir("unknown_run");
  auto store = open_store(dir);
  triage::FsBlobStore blobs((dir / "blobs").string());
  triage::IngestionCoordinator coordinator(*store, blobs);
  triage::Error err;
  expect(coordinator.ingest("base", app_bundle({"A", "B"}), {}, &err).has_value(), "ingest base");

  triage::QueryService query(*store);
  expect(!query.list_reports({"nosuchrun"}, {}, &err), "unknown run is not an empty list");
  expect(err.code == triage::ErrorCode::run_not_found, "list: run_not_found");

  err = {};
  expect(!query.list_reports({"base", "gone1", "gone2"}, {}, &err), "one unknown run fails the listing");
  expect(err.message.find("gone1") != std::string::npos && err.message.find("gone2") != std::string::npos,
         "every missing run named: " + err.message);

  err = {};
  const auto local = triage::build_local_entries(app_bundle({"A", "C"}));
  expect(!query.diff(triage::ReportSource::stored({"bsae"}), triage::ReportSource::local(local),
                     triage::DiffMode::All, {}, &err),
         "misspelled baseline does not turn every finding new");
  expect(err.code == triage::ErrorCode::run_not_found, "diff: run_not_found");

  err = {};
  expect(!store->reports("nosuchrun", &err), "reports() of an unknown run");
  expect(err.code == triage::ErrorCode::run_not_found, "reports: run_not_found");
}

// ============================================================================
// Schema migration
// ============================================================================

void write_v1_database(const fs::path& db_path) {
  sqlite3* db = nullptr;
  expect(sqlite3_open(db_path.string().c_str(), &db) == SQLITE_OK, "create v1 database");
  const auto& v1 = triage::schema::migrations().front();
  expect(v1.version == 1, "first migration is schema 1");
  const std::string sql = std::string(v1.sql) +
                          "PRAGMA user_version = 1;"
                          "INSERT INTO runs(name, generation, created_at, updated_at) VALUES('legacy', 1, 10, 10);"
                          "INSERT INTO reports(run_id, fingerprint, checker_id, file, line, col, detection_status,"
                          " detected_generation, last_seen_generation)"
                          " VALUES(1, 'legacy-fp', 'core.X', 'a.cpp', 4, 2, 'new', 1, 1);"
                          "INSERT INTO review_statuses(fingerprint, status, author, updated_at)"
                          " VALUES('legacy-fp', 'false_positive', 'bob', 10);";
  char* errmsg = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg);
  const std::string msg = errmsg ? errmsg : "";
  sqlite3_free(errmsg);
  sqlite3_close(db);
  expect(rc == SQLITE_OK, "populate v1 database: " + msg);
}

void test_schema_migration_from_v1() {
  const auto dir = fresh_dir("migrate");
  write_v1_database(dir / "reports.db");
  triage::Error err;
  auto store = open_store(dir, &err);
  expect(store != nullptr, "open migrates: " + err.message);
  expect(store->schema_version() == 2, "migrated to schema 2");

  auto reports = store->reports("legacy", &err);
  expect(reports && reports->size() == 1, "legacy report kept");
  expect((*reports)[0].fingerprint == "legacy-fp", "fingerprint unchanged");
  expect((*reports)[0].review_status == triage::ReviewStatus::FalsePositive, "review status unchanged");
  expect(store->run_history("legacy", nullptr).size() == 1, "history backfilled");

  triage::Report again;
  again.fingerprint = "legacy-fp";
  again.checker_id = "core.X";
  again.file = "a.cpp";
  again.line = 4;
  auto handle = store->begin_ingestion("legacy", {}, &err);
  expect(handle->base_generation() == 1, "continues from the legacy generation");
  expect(store->add_report(*handle, again, &err), "add");
  auto summary = store->commit(*handle, &err);
  expect(summary && summary->unresolved_count == 1, "legacy fingerprint matched after migration");
}

void test_schema_version_mismatch() {
  const auto dir = fresh_dir("mismatch");
  write_v1_database(dir / "reports.db");
  triage::Error err;
  expect(open_store(dir, &err, /*auto_migrate=*/false) == nullptr, "old schema refused without auto_migrate");
  expect(err.code == triage::ErrorCode::schema_version_mismatch, "schema_version_mismatch (old)");

  const auto newer = fresh_dir("newer");
  {
    sqlite3* db = nullptr;
    sqlite3_open((newer / "reports.db").string().c_str(), &db);
    sqlite3_exec(db, "PRAGMA user_version = 99;", nullptr, nullptr, nullptr);
    sqlite3_close(db);
  }
  err = {};
  expect(open_store(newer, &err) == nullptr, "newer schema refused");
  expect(err.code == triage::ErrorCode::schema_version_mismatch, "schema_version_mismatch (new)");
}

// ============================================================================
// Dedup & diff
// ============================================================================

triage::ReportEntry entry(const std::string& run, const std::string& label, const std::string& cu,
                          const std::string& file, uint32_t line) {
  triage::ReportEntry e;
  e.run = run;
  e.fingerprint = triage::fingerprint_digest(label);
  e.compilation_unit = cu;
  e.checker_id = "x";
  e.file = file;
  e.line = line;
  return e;
}

void test_dedup_and_unique() {
  const std::vector<triage::ReportEntry> entries = {
      entry("r", "H", "b.cpp", "inc/h.hpp", 10),
      entry("r", "H", "a.cpp", "inc/h.hpp", 10),
      entry("r", "H", "a.cpp", "inc/h.hpp", 10),  // literal repeat
      entry("r", "S", "a.cpp", "src/a.cpp", 3),
      entry("q", "H", "c.cpp", "inc/h.hpp", 10),
  };
  const auto deduped = triage::deduplicate(entries);
  expect(deduped.size() == 4, "one entry per (run, fingerprint, unit)");

  const auto unique = triage::uniqueify(entries);
  expect(unique.size() == 3, "one entry per fingerprint and run");
  const auto across = triage::uniqueify(entries, /*across_runs=*/true);
  expect(across.size() == 2, "one entry per fingerprint");
  for (const auto& e : across) {
    if (e.fingerprint == triage::fingerprint_digest("H")) {
      expect(e.compilation_unit == "a.cpp", "first-seen representative");
    }
  }

  std::vector<triage::ReportEntry> reversed(entries.rbegin(), entries.rend());
  const auto again = triage::uniqueify(reversed, true);
  expect(again.size() == across.size(), "order independent size");
  for (size_t i = 0; i < again.size(); ++i) {
    expect(again[i].fingerprint == across[i].fingerprint && again[i].compilation_unit == across[i].compilation_unit,
           "order independent result");
  }
}

void test_diff_symmetry() {
  const std::vector<triage::ReportEntry> x = {entry("", "A", "u", "a.cpp", 1), entry("", "B", "u", "b.cpp", 1)};
  const std::vector<triage::ReportEntry> y = {entry("", "B", "u", "b.cpp", 2), entry("", "C", "u", "c.cpp", 1)};
  const auto xy = triage::diff_entries(x, y, triage::DiffMode::All, {});
  const auto yx = triage::diff_entries(y, x, triage::DiffMode::All, {});
  expect(fingerprints(xy.new_reports) == fingerprints(yx.resolved), "new(X,Y) == resolved(Y,X)");
  expect(fingerprints(xy.resolved) == fingerprints(yx.new_reports), "resolved(X,Y) == new(Y,X)");
  expect(fingerprints(xy.unresolved) == fingerprints(yx.unresolved), "unresolved symmetric");
  expect(xy.unresolved.size() == 1 && xy.unresolved[0].line == 2, "unresolved entries come from the new side");

  const auto only_new = triage::diff_entries(x, y, triage::DiffMode::New, {});
  expect(only_new.resolved.empty() && only_new.unresolved.empty() && only_new.new_reports.size() == 1,
         "mode selects one category");
}

void test_diff_dedups_repeated_units() {
  // The same compilation unit logged twice in one findings document.
  triage::FindingsBundle bundle = app_bundle({"A"}, "a.cpp");
  bundle.units.push_back(bundle.units.front());
  const auto local = triage::build_local_entries(bundle);
  expect(local.size() == 2, "both copies materialized");

  const auto result = triage::diff_entries(local, local, triage::DiffMode::All, {});
  expect(result.unresolved.size() == 1, "one unresolved entry, got " + std::to_string(result.unresolved.size()));

  const auto fresh = triage::diff_entries({}, local, triage::DiffMode::New, {});
  expect(fresh.new_reports.size() == 1, "one new entry");

  // Distinct units keep one entry each.
  triage::FindingsBundle two_units = app_bundle({"A"}, "a.cpp");
  two_units.units.push_back(app_bundle({"A"}, "b.cpp").units.front());
  const auto per_unit = triage::diff_entries({}, triage::build_local_entries(two_units), triage::DiffMode::New, {});
  expect(per_unit.new_reports.size() == 2, "header-style finding stays per unit");
}

void test_stable_ordering() {
  const std::vector<triage::ReportEntry> shuffled = {
      entry("", "late", "u", "src/b.cpp", 1),
      entry("", "deep", "u", "src/a.cpp", 40),
      entry("", "top", "u", "src/a.cpp", 3),
  };
  const auto result = triage::diff_entries({}, shuffled, triage::DiffMode::New, {});
  expect(result.new_reports.size() == 3, "three new");
  expect(result.new_reports[0].line == 3 && result.new_reports[1].line == 40 &&
             result.new_reports[2].file == "src/b.cpp",
         "diff ordered by file, then line");

  const auto dir = fresh_dir("stable_order");
  auto store = open_store(dir);
  triage::Error err;
  auto handle = store->begin_ingestion("r", {}, &err);
  expect(handle != nullptr, "begin_ingestion");
  const std::vector<std::tuple<std::string, std::string, uint32_t>> placed = {
      {"late", "src/b.cpp", 1}, {"deep", "src/a.cpp", 40}, {"top", "src/a.cpp", 3}};
  for (const auto& [label, file, line] : placed) {
    auto r = make_report(label, "x", line);
    r.file = file;
    expect(store->add_report(*handle, r, &err), "add " + label);
  }
  expect(store->commit(*handle, &err).has_value(), "commit");

  triage::QueryService query(*store);
  auto listed = query.list_reports({"r"}, {}, &err);
  expect(listed && listed->size() == 3, "three listed");
  expect((*listed)[0].file == "src/a.cpp" && (*listed)[0].line == 3, "first: a.cpp:3");
  expect((*listed)[1].file == "src/a.cpp" && (*listed)[1].line == 40, "second: a.cpp:40");
  expect((*listed)[2].file == "src/b.cpp", "third: b.cpp");
}

void test_diff_stored_vs_local() {
  const auto dir = fresh_dir("diff_scenario");
  auto store = open_store(dir);
  triage::FsBlobStore blobs((dir / "blobs").string());
  triage::IngestionCoordinator coordinator(*store, blobs);
  triage::Error err;
  expect(coordinator.ingest("base", app_bundle({"A", "B"}), {}, &err).has_value(), "ingest baseline");
  expect(store->set_review_status(app_fingerprint("B"), triage::ReviewStatus::FalsePositive, "", "", &err),
         "suppress B");

  triage::QueryService query(*store);
  const auto local = triage::build_local_entries(app_bundle({"A", "C"}));
  auto result = query.diff(triage::ReportSource::stored({"base"}), triage::ReportSource::local(local),
                           triage::DiffMode::All, {}, &err);
  expect(result.has_value(), "diff: " + err.message);
  expect(fingerprints(result->unresolved) == std::set<std::string>{app_fingerprint("A")}, "unresolved {A}");
  expect(fingerprints(result->new_reports) == std::set<std::string>{app_fingerprint("C")}, "new {C}");
  expect(result->resolved.empty(), "suppressed B is not resolved");

  const auto local_with_b = triage::build_local_entries(app_bundle({"A", "B", "C"}));
  result = query.diff(triage::ReportSource::stored({"base"}), triage::ReportSource::local(local_with_b),
                      triage::DiffMode::All, {}, &err);
  expect(fingerprints(result->new_reports).count(app_fingerprint("B")) == 0,
         "store-suppressed fingerprint removed from the local side");

  // Two stored sides.
  expect(coordinator.ingest("next", app_bundle({"A", "C"}), {}, &err).has_value(), "ingest next");
  result = query.diff(triage::ReportSource::stored({"base"}), triage::ReportSource::stored({"next"}),
                      triage::DiffMode::All, {}, &err);
  expect(fingerprints(result->new_reports) == std::set<std::string>{app_fingerprint("C")}, "stored new {C}");
  expect(result->resolved.empty(), "stored resolved {}");
}

// ============================================================================
// Ingestion coordinator
// ============================================================================

void test_coordinator_store_with_source_review() {
  const auto dir = fresh_dir("source_review");
  auto store = open_store(dir);
  triage::FsBlobStore blobs((dir / "blobs").string());
  triage::IngestionCoordinator coordinator(*store, blobs);

  const std::string src =
      "namespace app {\n"
      "int lookup(int* p) {\n"
      "  // triage_suppress [core.NullDereference] pointer checked by caller\n"
      "  return *p;\n"
      "}\n"
      "}\n";
  triage::FindingsBundle bundle;
  triage::FindingsUnit unit;
  unit.compilation_unit = "lookup.cpp";
  triage::Finding f;
  f.checker_id = "core.NullDereference";
  f.file = "src/lookup.cpp";
  f.line = 4;
  f.message = "Dereference of null pointer";
  unit.findings.push_back(f);
  bundle.units.push_back(unit);
  bundle.sources[f.file] = src;

  triage::Error err;
  auto summary = coordinator.ingest("r", bundle, {}, &err);
  expect(summary && summary->source_reviews == 1, "source comment applied");

  const std::string fp = triage::compute_fingerprint(f, std::string_view(src)).value;
  auto record = store->review_status(fp, &err);
  expect(record && record->status == triage::ReviewStatus::FalsePositive, "review from source comment");
  expect(record->from_source && record->author == "source", "origin recorded");
  expect(record->message == "pointer checked by caller", "comment text kept");

  auto reports = store->reports("r", &err);
  expect(reports && reports->size() == 1, "report stored");
  expect(blobs.contains((*reports)[0].blob_id), "source blob stored");
  expect((*reports)[0].occurrences[0].compilation_unit == "lookup.cpp", "occurrence unit");
}

void test_coordinator_concurrent_runs() {
  const auto dir = fresh_dir("concurrent_runs");
  auto store = open_store(dir);
  triage::FsBlobStore blobs((dir / "blobs").string());
  triage::IngestionCoordinator coordinator(*store, blobs);
  std::atomic<int> ok{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      triage::Error err;
      if (coordinator.ingest("run" + std::to_string(t), app_bundle({"A", "B", "C"}), {}, &err)) ok++;
    });
  }
  for (auto& th : threads) th.join();
  expect(ok.load() == 4, "all runs committed");
  expect(store->list_runs(nullptr).size() == 4, "four runs");
}

void test_coordinator_same_run_serializes() {
  const auto dir = fresh_dir("same_run");
  auto store = open_store(dir);
  triage::FsBlobStore blobs((dir / "blobs").string());
  triage::CoordinatorOptions options;
  options.open_timeout_ms = 50;
  triage::IngestionCoordinator coordinator(*store, blobs, options);

  triage::Error err;
  auto first = coordinator.open("r", {}, &err);
  expect(first != nullptr, "first open");
  expect(coordinator.open("r", {}, &err) == nullptr, "second open times out");
  expect(err.code == triage::ErrorCode::storage_conflict, "busy run is storage_conflict");
  expect(coordinator.open("other", {}, &err) != nullptr, "different run is not blocked");

  triage::IngestionCoordinator patient(*store, blobs, triage::CoordinatorOptions{3, 5000});
  auto held = patient.open("p", {}, &err);
  std::atomic<bool> second_opened{false};
  std::atomic<bool> second_committed{false};
  std::thread waiter([&] {
    triage::Error e;
    auto s = patient.open("p", {}, &e);
    second_opened = s != nullptr;
    if (s && patient.finalize(s, &e)) second_committed = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  expect(!second_opened.load(), "second session waits for the first");
  expect(patient.finalize(held, &err).has_value(), "first finalize");
  waiter.join();
  expect(second_opened.load() && second_committed.load(), "second session proceeds after the first");
  expect(store->get_run("p", nullptr)->generation == 2, "two generations in order");

  expect(coordinator.cancel(first), "cancel first");
  expect(coordinator.open("r", {}, &err) != nullptr, "run free after cancel");
  expect(coordinator.tracked_runs() == 0, "idle run slots are forgotten");
  expect(patient.tracked_runs() == 0, "finished runs are forgotten");
}

void test_coordinator_incomplete_ingestion() {
  const auto dir = fresh_dir("incomplete");
  auto store = open_store(dir);
  triage::FsBlobStore blobs((dir / "blobs").string());
  triage::IngestionCoordinator coordinator(*store, blobs);
  triage::Error err;
  expect(coordinator.ingest("r", app_bundle({"A"}), {}, &err).has_value(), "baseline generation");

  triage::SessionOptions options;
  options.expected_submissions = 2;
  auto session = coordinator.open("r", options, &err);
  {
    auto writer = coordinator.begin_submission(session, "client-1", "app.cpp", &err);
    writer->add_source(kAppFile, kAppSource);
    writer->add(app_finding("B"));
    expect(writer->finish(&err), "finish one submission");
  }
  expect(!coordinator.finalize(session, &err).has_value(), "missing submission");
  expect(err.code == triage::ErrorCode::ingestion_incomplete, "ingestion_incomplete");
  expect(store->get_run("r", nullptr)->generation == 1, "previous generation kept");

  // Client disconnect: writer destroyed before finish().
  session = coordinator.open("r", {}, &err);
  {
    auto writer = coordinator.begin_submission(session, "client-2", "app.cpp", &err);
    writer->add(app_finding("C"));
  }
  expect(session->dropped_submissions() == 1, "dropped submission counted");
  err = {};
  expect(!coordinator.finalize(session, &err).has_value(), "dropped submission aborts");
  expect(err.code == triage::ErrorCode::ingestion_incomplete, "ingestion_incomplete after drop");
  auto reports = store->reports("r", nullptr);
  expect(reports->size() == 1, "dropped findings never stored");
}

void test_coordinator_conflict_replay() {
  const auto dir = fresh_dir("replay");
  auto store = open_store(dir);
  triage::FsBlobStore blobs((dir / "blobs").string());
  triage::IngestionCoordinator coordinator(*store, blobs);
  {
    std::lock_guard<std::mutex> lk(g_events_mu);
    g_events.clear();
  }
  triage::set_ingestion_event_hook(capture_event);

  triage::Error err;
  auto session = coordinator.open("r", {}, &err);
  {
    auto writer = coordinator.begin_submission(session, "client", "app.cpp", &err);
    writer->add_source(kAppFile, kAppSource);
    writer->add(app_finding("A"));
    expect(writer->finish(&err), "finish");
  }
  // A writer that bypasses the coordinator moves the run forward.
  commit_generation(*store, "r", {{"X", "x"}});

  auto summary = coordinator.finalize(session, &err);
  expect(summary.has_value(), "finalize retried after conflict: " + err.message);
  expect(summary->generation == 2, "replayed onto the new base");
  expect(summary->new_count == 1 && summary->resolved_count == 1, "replayed counts");

  triage::set_ingestion_event_hook(nullptr);
  std::lock_guard<std::mutex> lk(g_events_mu);
  expect(g_events.size() == 1, "one event per session");
  expect(g_events[0].outcome == "committed" && g_events[0].attempts == 2, "event records the retry");
  expect(g_events[0].run == "r" && g_events[0].submissions == 1, "event fields");
}

void test_findings_json() {
  const std::string doc =
      "{\"units\":[{\"compilation_unit\":\"a.cpp\",\"findings\":[{\"checker_id\":\"core.X\","
      "\"file\":\"a.cpp\",\"line\":3,\"column\":2,\"severity\":\"high\",\"message\":\"m\","
      "\"bug_path\":[{\"line\":1,\"column\":1,\"message\":\"s\"}]}]}],"
      "\"sources\":{\"a.cpp\":\"int main() {}\\n\"}}";
  triage::Error err;
  auto bundle = triage::parse_findings_json(doc, &err);
  expect(bundle.has_value(), "parse findings: " + err.message);
  expect(bundle->units.size() == 1 && bundle->units[0].findings.size() == 1, "one finding");
  const auto& f = bundle->units[0].findings[0];
  expect(f.severity == triage::Severity::High && f.line == 3 && f.column == 2, "finding fields");
  expect(f.bug_path.size() == 1 && f.bug_path[0].file == "a.cpp", "bug path step defaults to the finding file");
  expect(bundle->sources.at("a.cpp") == "int main() {}\n", "sources");

  expect(!triage::parse_findings_json("{\"findings\":[]}", &err), "units required");
  expect(err.code == triage::ErrorCode::invalid_argument, "invalid_argument");
  expect(!triage::parse_findings_json("{\"units\":[],\"units\":[]}", &err), "duplicate key");
  expect(err.code == triage::ErrorCode::json_duplicate_key, "json_duplicate_key");

  err = {};
  expect(!triage::parse_findings_json(
             "{\"units\":[{\"findings\":[{\"checker_id\":\"c\",\"file\":\"a.cpp\",\"line\":4294967296}]}]}",
             &err),
         "line above 32 bits refused");
  expect(err.code == triage::ErrorCode::invalid_argument, "out-of-range line is invalid_argument");
  err = {};
  expect(!triage::parse_findings_json(
             "{\"units\":[{\"findings\":[{\"checker_id\":\"c\",\"file\":\"a.cpp\",\"line\":1,"
             "\"bug_path\":[{\"column\":99999999999}]}]}]}",
             &err),
         "bug path column above 32 bits refused");
  expect(err.code == triage::ErrorCode::invalid_argument, "out-of-range column is invalid_argument");
}

// ============================================================================
// Query rendering, config, observability
// ============================================================================

void test_query_rendering() {
  triage::ReportEntry e = entry("main", "A", "a.cpp", "src/a.cpp", 7);
  e.column = 3;
  e.message = "Division by zero";
  e.review_status = triage::ReviewStatus::Confirmed;
  const std::string json = triage::entries_to_json({e});
  std::optional<triage::jsonlite::JsonError> jerr;
  expect(triage::jsonlite::canonicalize_json(json, &jerr) == json, "rendered JSON is canonical");
  expect(json.find("\"detection_status\":\"new\"") != std::string::npos, "detection status field");
  expect(json.find("\"review_status\":\"confirmed\"") != std::string::npos, "review status field");
  expect(json.find("\"fingerprint\":\"" + e.fingerprint + "\"") != std::string::npos, "hash field");

  const std::string text = triage::entries_to_plaintext({e});
  expect(text.rfind("src/a.cpp:7:3: [x] Division by zero [new/confirmed] ", 0) == 0, "plaintext: " + text);

  triage::DiffResult result;
  result.new_reports.push_back(e);
  const std::string diff_json = triage::diff_to_json(result, triage::DiffMode::New);
  expect(diff_json.find("\"resolved\"") == std::string::npos, "mode limits categories");
}

void test_config_env_overrides() {
  ::setenv("TRIAGE_DB", "/tmp/triage_env.db", 1);
  ::setenv("TRIAGE_COMMIT_RETRIES", "7", 1);
  ::setenv("TRIAGE_LOG_LEVEL", "debug", 1);
  triage::Error err;
  auto config = triage::load_config("", &err);
  expect(config.has_value(), "load_config: " + err.message);
  expect(config->db_path == "/tmp/triage_env.db", "TRIAGE_DB");
  expect(config->commit_retries == 7, "TRIAGE_COMMIT_RETRIES");
  expect(config->log_level == triage::LogLevel::debug, "TRIAGE_LOG_LEVEL");
  expect(triage::store_options_from(*config).db_path == "/tmp/triage_env.db", "store options follow config");

  ::setenv("TRIAGE_BLOB_COMPRESSION", "lz4", 1);
  expect(!triage::load_config("", &err), "invalid compression refused");
  expect(err.code == triage::ErrorCode::config_invalid, "config_invalid");

  ::unsetenv("TRIAGE_DB");
  ::unsetenv("TRIAGE_COMMIT_RETRIES");
  ::unsetenv("TRIAGE_LOG_LEVEL");
  ::unsetenv("TRIAGE_BLOB_COMPRESSION");

  triage::Config from_file;
  expect(triage::apply_config_json(from_file, "{\"blob_root\":\"/srv/blobs\",\"db_pool_size\":2}", &err),
         "config JSON");
  expect(from_file.blob_root == "/srv/blobs" && from_file.db_pool_size == 2, "config JSON values");
  expect(!triage::apply_config_json(from_file, "{\"db_pool_size\":0}", &err), "zero pool refused");
}

void test_store_stats_json() {
  auto& stats = triage::global_store_stats();
  const uint64_t before = stats.commits.load();
  triage::IngestionEvent ev;
  ev.run = "stats";
  ev.outcome = "committed";
  ev.attempts = 1;
  ev.commit_ns = 2000;
  stats.record_ingestion(ev);
  expect(stats.commits.load() == before + 1, "commit counted");
  const std::string json = stats.to_json();
  std::optional<triage::jsonlite::JsonError> jerr;
  triage::jsonlite::parse(json, &jerr);
  expect(!jerr, "stats JSON parses");
  expect(json.find("\"commits\"") != std::string::npos, "commits field");
  expect(triage::event_to_json(ev).find("\"outcome\":\"committed\"") != std::string::npos, "event JSON");

  const auto recent = stats.recent_events_snapshot();
  expect(!recent.empty() && recent.back().run == "stats", "latest event is last in the ring");
  expect(json.find("\"recent_events\":[") != std::string::npos, "stats JSON lists recent events");
}

}  // namespace

int main() {
  triage::set_log_level(triage::LogLevel::error);
  std::cout << "=== triage test suite ===\n";

  std::cout << "\n[Hashing & JSON]\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("JSON canonical and strict", test_json_canonical_and_strict);

  std::cout << "\n[Fingerprint]\n";
  run_test("stable under line shift", test_fingerprint_line_shift);
  run_test("stable under encodings", test_fingerprint_encodings);
  run_test("sensitive to checker, line and scope", test_fingerprint_sensitivity);
  run_test("file-level fallback", test_fingerprint_fallback);
  run_test("scope parser", test_enclosing_scopes_parser);
  run_test("scope parser follows first conditional branch", test_scope_parser_conditionals);
  run_test("report path hash", test_report_path_hash);

  std::cout << "\n[Review comments]\n";
  run_test("markers, typos and ambiguity", test_suppression_comments);

  std::cout << "\n[Blob store]\n";
  run_test("dedup and paths", test_blob_dedup_and_paths);
  run_test("corruption detected", test_blob_corruption_detected);

  std::cout << "\n[Report store]\n";
  run_test("idempotent add and merge", test_store_idempotent_add);
  run_test("resolve and reopen", test_resolution_round_trip);
  run_test("checker off and unavailable", test_checker_off_and_unavailable);
  run_test("same-run conflict", test_same_run_conflict);
  run_test("abort keeps previous generation", test_abort_keeps_previous_generation);
  run_test("concurrent add_report", test_concurrent_add_report);
  run_test("review status persistence", test_review_status_persistence);
  run_test("remove run", test_remove_run);
  run_test("unknown run rejected", test_unknown_run_rejected);

  std::cout << "\n[Schema]\n";
  run_test("migration from schema 1", test_schema_migration_from_v1);
  run_test("version mismatch refused", test_schema_version_mismatch);

  std::cout << "\n[Dedup & diff]\n";
  run_test("dedup and unique", test_dedup_and_unique);
  run_test("diff symmetry", test_diff_symmetry);
  run_test("diff collapses repeated units", test_diff_dedups_repeated_units);
  run_test("stable ordering", test_stable_ordering);
  run_test("stored vs local diff", test_diff_stored_vs_local);

  std::cout << "\n[Ingestion]\n";
  run_test("source review comment", test_coordinator_store_with_source_review);
  run_test("concurrent runs", test_coordinator_concurrent_runs);
  run_test("same run serializes", test_coordinator_same_run_serializes);
  run_test("incomplete ingestion", test_coordinator_incomplete_ingestion);
  run_test("conflict replay", test_coordinator_conflict_replay);
  run_test("findings JSON", test_findings_json);

  std::cout << "\n[Query, config, observability]\n";
  run_test("rendering", test_query_rendering);
  run_test("config overrides", test_config_env_overrides);
  run_test("stats JSON", test_store_stats_json);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
