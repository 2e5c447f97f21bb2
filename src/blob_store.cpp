#include "triage/blob_store.hpp"

// EXTENSION_POINT: reference_sweep
//   Blobs referenced by no report (orphans of aborted ingestions) are never
//   reclaimed. A sweeper would scan(), join against the report database's
//   blob_id column and remove unreferenced objects older than a grace period.

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>

#if defined(TRIAGE_WITH_ZSTD)
#include <zstd.h>
#endif

#include "triage/hash.hpp"
#include "triage/jsonlite.hpp"
#include "triage/observability.hpp"

namespace fs = std::filesystem;

namespace triage {

namespace {
#if defined(TRIAGE_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Atomic write: write to temp file, then rename into place.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_all(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::string info_to_json(const BlobInfo& info) {
  jsonlite::Object o;
  o["id"] = jsonlite::str(info.id);
  o["encoding"] = jsonlite::str(info.encoding);
  o["original_size"] = jsonlite::num(info.original_size);
  o["stored_size"] = jsonlite::num(info.stored_size);
  o["stored_blob_hash"] = jsonlite::str(info.stored_blob_hash);
  o["created_at"] = jsonlite::num(info.created_at_unix_ts);
  return jsonlite::to_json(o);
}

std::optional<BlobInfo> info_from_json(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(line, &err);
  if (err) return std::nullopt;
  BlobInfo inf;
  inf.id = jsonlite::get_string(obj, "id");
  inf.encoding = jsonlite::get_string(obj, "encoding", "identity");
  inf.original_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "original_size"));
  inf.stored_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "stored_size"));
  inf.stored_blob_hash = jsonlite::get_string(obj, "stored_blob_hash");
  inf.created_at_unix_ts = jsonlite::get_u64(obj, "created_at");
  if (!valid_digest(inf.id)) return std::nullopt;
  return inf;
}

}  // namespace

FsBlobStore::FsBlobStore(std::string root, std::string compression)
    : root_(std::move(root)), compression_(std::move(compression)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
  if (ec) {
    log_message(LogLevel::error, "blob_store", "cannot create " + root_ + ": " + ec.message());
  }
}

std::string FsBlobStore::object_path(const std::string& id) const {
  return (fs::path(root_) / "objects" / id.substr(0, 2) / id.substr(2, 2) / id).string();
}

std::string FsBlobStore::meta_path(const std::string& id) const {
  return object_path(id) + ".meta";
}

std::string FsBlobStore::index_path() const {
  return (fs::path(root_) / "index.ndjson").string();
}

std::string FsBlobStore::paths_index_path() const {
  return (fs::path(root_) / "paths.ndjson").string();
}

void FsBlobStore::load_index() const {
  std::lock_guard<std::mutex> lk(index_mu_);
  if (index_loaded_) return;

  std::string line;
  if (std::ifstream ifs(index_path()); ifs) {
    while (std::getline(ifs, line)) {
      if (line.empty()) continue;
      if (auto inf = info_from_json(line)) index_[inf->id] = std::move(*inf);
    }
  }
  if (std::ifstream ifs(paths_index_path()); ifs) {
    while (std::getline(ifs, line)) {
      if (line.empty()) continue;
      std::optional<jsonlite::JsonError> err;
      const auto obj = jsonlite::parse(line, &err);
      if (err) continue;
      const auto id = jsonlite::get_string(obj, "id");
      const auto path = jsonlite::get_string(obj, "path");
      if (valid_digest(id) && !path.empty()) paths_[id].insert(path);
    }
  }
  index_loaded_ = true;
}

void FsBlobStore::save_index_entry(const BlobInfo& info) const {
  const std::string line = info_to_json(info) + "\n";
  std::ofstream ofs(index_path(), std::ios::binary | std::ios::app);
  ofs.write(line.data(), static_cast<std::streamsize>(line.size()));
}

void FsBlobStore::record_path(const std::string& id, const std::string& path) {
  if (path.empty()) return;
  load_index();
  std::lock_guard<std::mutex> lk(index_mu_);
  if (!paths_[id].insert(path).second) return;
  jsonlite::Object o;
  o["id"] = jsonlite::str(id);
  o["path"] = jsonlite::str(path);
  const std::string line = jsonlite::to_json(o) + "\n";
  std::ofstream ofs(paths_index_path(), std::ios::binary | std::ios::app);
  ofs.write(line.data(), static_cast<std::streamsize>(line.size()));
}

std::string FsBlobStore::put(const std::string& path, const std::string& bytes, Error* error) {
  auto& stats = global_store_stats();
  const std::string id = blob_content_hash(bytes);

  const fs::path target = object_path(id);
  const fs::path meta = meta_path(id);
  std::error_code ec;
  if (fs::exists(target, ec) && fs::exists(meta, ec)) {
    // Dedup. A damaged existing object is rewritten below.
    auto existing = get(id, nullptr);
    if (existing && *existing == bytes) {
      stats.blob_hits.fetch_add(1, std::memory_order_relaxed);
      record_path(id, path);
      return id;
    }
    log_message(LogLevel::warn, "blob_store", "rewriting damaged blob " + id);
  }

  std::string stored = bytes;
  std::string encoding = "identity";
#if defined(TRIAGE_WITH_ZSTD)
  if (compression_ == "zstd") {
    auto c = compress_zstd(bytes);
    if (!c.empty() && c.size() < bytes.size()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#endif

  if (!atomic_write(target, stored)) {
    set_error(error, ErrorCode::io_error, "blob write failed: " + target.string());
    return {};
  }

  BlobInfo info;
  info.id = id;
  info.encoding = encoding;
  info.original_size = bytes.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_unix_ts = static_cast<uint64_t>(std::time(nullptr));

  if (!atomic_write(meta, info_to_json(info))) {
    fs::remove(target, ec);
    set_error(error, ErrorCode::io_error, "blob meta write failed: " + meta.string());
    return {};
  }

  load_index();
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    index_[id] = info;
    save_index_entry(info);
  }
  stats.blob_puts.fetch_add(1, std::memory_order_relaxed);
  record_path(id, path);
  return id;
}

std::optional<BlobInfo> FsBlobStore::info(const std::string& id) const {
  if (!valid_digest(id)) return std::nullopt;
  load_index();
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    auto it = index_.find(id);
    if (it != index_.end()) return it->second;
  }
  // Written by another process after our index was loaded.
  auto meta = read_all(meta_path(id));
  if (!meta) return std::nullopt;
  auto inf = info_from_json(*meta);
  if (!inf || inf->id != id) return std::nullopt;
  std::lock_guard<std::mutex> lk(index_mu_);
  index_[id] = *inf;
  return inf;
}

std::optional<std::string> FsBlobStore::get(const std::string& id, Error* error) const {
  auto& stats = global_store_stats();
  auto fail = [&](const std::string& why, bool integrity) -> std::optional<std::string> {
    if (integrity) {
      stats.blob_integrity_failures.fetch_add(1, std::memory_order_relaxed);
      log_message(LogLevel::error, "blob_store", "integrity failure for blob " + id + ": " + why);
    } else {
      stats.blob_misses.fetch_add(1, std::memory_order_relaxed);
    }
    set_error(error, ErrorCode::blob_not_found, "blob " + id + ": " + why);
    return std::nullopt;
  };

  if (!valid_digest(id)) return fail("malformed id", false);
  auto data = read_all(object_path(id));
  if (!data) return fail("unknown id", false);

  auto meta = info(id);
  if (!meta) return fail("missing metadata", true);

  if (blake3_hex(*data) != meta->stored_blob_hash) return fail("stored bytes hash mismatch", true);

  if (meta->encoding == "zstd") {
#if defined(TRIAGE_WITH_ZSTD)
    auto plain = decompress_zstd(*data, meta->original_size);
    if (!plain) return fail("zstd decode failed", true);
    data = std::move(plain);
#else
    return fail("zstd encoding not supported by this build", true);
#endif
  } else if (meta->encoding != "identity") {
    return fail("unknown encoding " + meta->encoding, true);
  }

  if (blob_content_hash(*data) != id) return fail("content id mismatch", true);
  return data;
}

bool FsBlobStore::contains(const std::string& id) const {
  if (!valid_digest(id)) return false;
  std::error_code ec;
  return fs::exists(object_path(id), ec);
}

std::vector<std::string> FsBlobStore::paths_for(const std::string& id) const {
  load_index();
  std::lock_guard<std::mutex> lk(index_mu_);
  auto it = paths_.find(id);
  if (it == paths_.end()) return {};
  return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<BlobInfo> FsBlobStore::scan(size_t limit, const std::string& start_after) const {
  load_index();
  std::lock_guard<std::mutex> lk(index_mu_);
  std::vector<BlobInfo> out;
  auto it = start_after.empty() ? index_.begin() : index_.upper_bound(start_after);
  for (; it != index_.end(); ++it) {
    if (limit && out.size() >= limit) break;
    out.push_back(it->second);
  }
  return out;
}

std::size_t FsBlobStore::size() const {
  load_index();
  std::lock_guard<std::mutex> lk(index_mu_);
  return index_.size();
}

}  // namespace triage
