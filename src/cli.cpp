#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "triage/blob_store.hpp"
#include "triage/config.hpp"
#include "triage/diff.hpp"
#include "triage/hash.hpp"
#include "triage/ingestion.hpp"
#include "triage/jsonlite.hpp"
#include "triage/observability.hpp"
#include "triage/query.hpp"
#include "triage/report_store.hpp"
#include "triage/version.hpp"

namespace {

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  *out = std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
    } else {
      cur += c;
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

int fail(const triage::Error& err) {
  triage::jsonlite::Object inner;
  inner["code"] = triage::jsonlite::str(triage::to_string(err.code));
  inner["message"] = triage::jsonlite::str(err.message);
  triage::jsonlite::Object o;
  o["error"] = triage::jsonlite::Value{std::move(inner)};
  std::cerr << triage::jsonlite::to_json(o) << "\n";
  return err.code == triage::ErrorCode::storage_conflict ? 2 : 1;
}

int usage(const std::string& msg) {
  return fail({triage::ErrorCode::invalid_argument, msg});
}

// Flags shared by every command.
struct CommonArgs {
  std::string config_path;
  std::string db_path;
  std::string blob_root;
  bool json{false};
};

bool take_common(const std::string& arg, int& i, int argc, char** argv, CommonArgs& common) {
  if (arg == "--config" && i + 1 < argc) {
    common.config_path = argv[++i];
    return true;
  }
  if (arg == "--db" && i + 1 < argc) {
    common.db_path = argv[++i];
    return true;
  }
  if (arg == "--blobs" && i + 1 < argc) {
    common.blob_root = argv[++i];
    return true;
  }
  if (arg == "--json") {
    common.json = true;
    return true;
  }
  return false;
}

std::optional<triage::Config> resolve_config(const CommonArgs& common, triage::Error* error) {
  auto config = triage::load_config(common.config_path, error);
  if (!config) return std::nullopt;
  if (!common.db_path.empty()) config->db_path = common.db_path;
  if (!common.blob_root.empty()) config->blob_root = common.blob_root;
  triage::apply_logging(*config);
  return config;
}

std::optional<triage::FindingsBundle> load_bundle(const std::string& path, triage::Error* error) {
  std::string text;
  if (!read_file(path, &text)) {
    triage::set_error(error, triage::ErrorCode::io_error, "cannot read " + path);
    return std::nullopt;
  }
  return triage::parse_findings_json(text, error);
}

// Known BLAKE3 test vectors
bool verify_hash_vectors() {
  return triage::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262" &&
         triage::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f";
}

}  // namespace

int main(int argc, char** argv) {
  std::string cmd;
  int first_arg = 1;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]).rfind("--", 0) == 0) continue;
    cmd = argv[i];
    first_arg = i + 1;
    break;
  }
  if (cmd.empty()) {
    std::cerr << "usage: triage <store|list|diff|runs|history|review|remove|health|version> [options]\n";
    return 1;
  }

  if (cmd == "version") {
    std::cout << triage::version::manifest_to_json(triage::version::current_manifest()) << "\n";
    return 0;
  }

  if (cmd == "health") {
    CommonArgs common;
    for (int i = first_arg; i < argc; ++i) take_common(argv[i], i, argc, argv, common);
    const auto h = triage::hash_runtime_info();
    triage::jsonlite::Object o;
    o["hash_primitive"] = triage::jsonlite::str(h.primitive);
    o["hash_backend"] = triage::jsonlite::str(h.backend);
    o["hash_version"] = triage::jsonlite::str(h.version);
    o["hash_available"] = triage::jsonlite::boolean(h.blake3_available);
    o["hash_vectors_ok"] = triage::jsonlite::boolean(verify_hash_vectors());
    o["schema_version"] = triage::jsonlite::num(triage::version::SCHEMA_VERSION);
    std::vector<std::string> compression{"identity"};
#if defined(TRIAGE_WITH_ZSTD)
    compression.push_back("zstd");
#endif
    o["compression_capabilities"] = triage::jsonlite::string_array(compression);

    triage::Error err;
    auto config = resolve_config(common, &err);
    if (!config) return fail(err);
    auto store = triage::ReportStore::open(triage::store_options_from(*config), &err);
    o["database"] = triage::jsonlite::str(config->db_path);
    o["database_ok"] = triage::jsonlite::boolean(store != nullptr);
    if (!store) o["database_error"] = triage::jsonlite::str(triage::to_string(err.code) + ": " + err.message);
    std::cout << triage::jsonlite::to_json(o) << "\n";
    return store ? 0 : 2;
  }

  CommonArgs common;
  std::vector<std::string> runs;
  std::string in, tag, hash, status, message, author, mode = "all";
  std::string base_run, base_local, new_run, new_local;
  std::vector<std::string> enabled, disabled, status_filter;
  bool unique = false, across_runs = false, include_suppressed = false;
  for (int i = first_arg; i < argc; ++i) {
    const std::string arg = argv[i];
    if (take_common(arg, i, argc, argv, common)) continue;
    if (arg == "--run" && i + 1 < argc) runs.push_back(argv[++i]);
    else if (arg == "--in" && i + 1 < argc) in = argv[++i];
    else if (arg == "--tag" && i + 1 < argc) tag = argv[++i];
    else if (arg == "--enabled" && i + 1 < argc) enabled = split_list(argv[++i]);
    else if (arg == "--disabled" && i + 1 < argc) disabled = split_list(argv[++i]);
    else if (arg == "--status" && i + 1 < argc) status = argv[++i];
    else if (arg == "--detection" && i + 1 < argc) status_filter = split_list(argv[++i]);
    else if (arg == "--hash" && i + 1 < argc) hash = argv[++i];
    else if (arg == "--message" && i + 1 < argc) message = argv[++i];
    else if (arg == "--author" && i + 1 < argc) author = argv[++i];
    else if (arg == "--mode" && i + 1 < argc) mode = argv[++i];
    else if (arg == "--base" && i + 1 < argc) base_run = argv[++i];
    else if (arg == "--base-local" && i + 1 < argc) base_local = argv[++i];
    else if (arg == "--new" && i + 1 < argc) new_run = argv[++i];
    else if (arg == "--new-local" && i + 1 < argc) new_local = argv[++i];
    else if (arg == "--unique") unique = true;
    else if (arg == "--across-runs") across_runs = true;
    else if (arg == "--include-suppressed") include_suppressed = true;
    else return usage("unknown argument " + arg);
  }

  triage::Error err;
  auto config = resolve_config(common, &err);
  if (!config) return fail(err);
  auto store = triage::ReportStore::open(triage::store_options_from(*config), &err);
  if (!store) return fail(err);
  triage::QueryService query(*store);

  if (cmd == "store") {
    if (runs.size() != 1 || in.empty()) return usage("store needs --run and --in");
    auto bundle = load_bundle(in, &err);
    if (!bundle) return fail(err);
    triage::FsBlobStore blobs(config->blob_root, config->blob_compression);
    triage::IngestionCoordinator coordinator(*store, blobs, triage::coordinator_options_from(*config));
    triage::SessionOptions options;
    options.tag = tag;
    options.enabled_checkers = enabled;
    options.disabled_checkers = disabled;
    auto summary = coordinator.ingest(runs.front(), *bundle, options, &err);
    if (!summary) return fail(err);
    if (common.json) {
      std::cout << "{\"stats\":" << triage::global_store_stats().to_json()
                << ",\"summary\":" << triage::commit_summary_to_json(*summary) << "}\n";
    } else {
      std::cout << triage::commit_summary_to_json(*summary) << "\n";
    }
    return 0;
  }

  if (cmd == "list") {
    if (runs.empty()) return usage("list needs at least one --run");
    triage::ListOptions options;
    options.unique = unique;
    options.across_runs = across_runs;
    options.include_suppressed = include_suppressed;
    for (const auto& s : status_filter) {
      auto parsed = triage::parse_detection_status(s);
      if (!parsed) return usage("unknown detection status " + s);
      options.detection_filter.insert(*parsed);
    }
    auto entries = query.list_reports(runs, options, &err);
    if (!entries) return fail(err);
    std::cout << (common.json ? triage::entries_to_json(*entries) + "\n" : triage::entries_to_plaintext(*entries));
    return 0;
  }

  if (cmd == "diff") {
    auto parsed_mode = triage::parse_diff_mode(mode);
    if (!parsed_mode) return usage("unknown diff mode " + mode);
    auto side = [&](const std::string& run, const std::string& local,
                    const char* name) -> std::optional<triage::ReportSource> {
      if (run.empty() == local.empty()) {
        usage(std::string("diff needs exactly one of --") + name + " and --" + name + "-local");
        return std::nullopt;
      }
      if (!run.empty()) return triage::ReportSource::stored(split_list(run));
      auto bundle = load_bundle(local, &err);
      if (!bundle) {
        fail(err);
        return std::nullopt;
      }
      return triage::ReportSource::local(triage::build_local_entries(*bundle));
    };
    auto base = side(base_run, base_local, "base");
    if (!base) return 1;
    auto next = side(new_run, new_local, "new");
    if (!next) return 1;
    triage::DiffOptions options;
    options.unique = unique;
    auto result = query.diff(*base, *next, *parsed_mode, options, &err);
    if (!result) return fail(err);
    std::cout << (common.json ? triage::diff_to_json(*result, *parsed_mode) + "\n"
                              : triage::diff_to_plaintext(*result, *parsed_mode));
    return 0;
  }

  if (cmd == "runs") {
    auto all = query.list_runs(&err);
    if (err) return fail(err);
    std::cout << (common.json ? triage::runs_to_json(all) + "\n" : triage::runs_to_plaintext(all));
    return 0;
  }

  if (cmd == "history") {
    if (runs.size() != 1) return usage("history needs --run");
    if (!query.get_run(runs.front(), &err)) return fail(err);
    auto history = query.run_history(runs.front(), &err);
    if (err) return fail(err);
    std::cout << triage::history_to_json(history) << "\n";
    return 0;
  }

  if (cmd == "review") {
    if (hash.empty() || status.empty()) return usage("review needs --hash and --status");
    auto parsed = triage::parse_review_status(status);
    if (!parsed) return usage("unknown review status " + status);
    if (!query.set_review_status(hash, *parsed, message, author, &err)) return fail(err);
    auto record = store->review_status(hash, &err);
    if (!record) return fail(err);
    triage::jsonlite::Object o;
    o["fingerprint"] = triage::jsonlite::str(record->fingerprint);
    o["status"] = triage::jsonlite::str(triage::to_string(record->status));
    o["message"] = triage::jsonlite::str(record->message);
    o["author"] = triage::jsonlite::str(record->author);
    std::cout << triage::jsonlite::to_json(o) << "\n";
    return 0;
  }

  if (cmd == "remove") {
    if (runs.empty()) return usage("remove needs --run");
    for (const auto& run : runs) {
      if (!store->remove_run(run, &err)) return fail(err);
    }
    std::cout << "{\"removed\":" << runs.size() << "}\n";
    return 0;
  }

  return usage("unknown command " + cmd);
}
