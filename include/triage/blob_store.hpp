#pragma once

// triage/blob_store.hpp: Content-addressed storage for analyzed source files.
//
// DESIGN INVARIANTS (must not be broken by any implementation):
//   1. Blob id = BLAKE3("blob:" || original bytes). Content-addressed, not
//      path-addressed: identical content under any path is stored once.
//   2. Writes are atomic: tmp + rename on the same filesystem.
//   3. Reads verify integrity (stored bytes and content id) before returning.
//   4. Fail-closed: an integrity failure is reported as blob_not_found,
//      never as corrupted data.
//   5. Blobs are immutable. Nothing in the engine deletes a blob; orphans
//      left by aborted ingestions are harmless.

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "triage/types.hpp"

namespace triage {

struct BlobInfo {
  std::string id;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;
  uint64_t created_at_unix_ts{0};
};

// ---------------------------------------------------------------------------
// IBlobStore: abstract storage backend interface
// ---------------------------------------------------------------------------
// Thread-safety: all implementations MUST be safe for concurrent calls.
class IBlobStore {
 public:
  virtual ~IBlobStore() = default;

  // Stores bytes and records `path` as an alias. Returns the blob id, or ""
  // with *error set on failure. Idempotent on content.
  virtual std::string put(const std::string& path, const std::string& bytes,
                          Error* error = nullptr) = 0;

  // blob_not_found for unknown ids and for objects failing verification.
  virtual std::optional<std::string> get(const std::string& id, Error* error = nullptr) const = 0;

  virtual bool contains(const std::string& id) const = 0;
  virtual std::optional<BlobInfo> info(const std::string& id) const = 0;

  // Every path the content was submitted under, sorted.
  virtual std::vector<std::string> paths_for(const std::string& id) const = 0;

  // limit 0 = unlimited. start_after is a resume token (blob id).
  virtual std::vector<BlobInfo> scan(size_t limit = 0, const std::string& start_after = "") const = 0;

  virtual std::size_t size() const = 0;
  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// FsBlobStore: local filesystem implementation
// ---------------------------------------------------------------------------
// Layout:
//   <root>/objects/AB/CD/<64-char-id>        stored bytes
//   <root>/objects/AB/CD/<64-char-id>.meta   JSON BlobInfo
//   <root>/index.ndjson                       one BlobInfo per line
//   <root>/paths.ndjson                       {"id","path"} alias records
//
// compression: "off" or "zstd" (only when built with TRIAGE_WITH_ZSTD;
// otherwise stored as identity).
class FsBlobStore : public IBlobStore {
 public:
  explicit FsBlobStore(std::string root = ".triage/blobs", std::string compression = "off");

  std::string put(const std::string& path, const std::string& bytes,
                  Error* error = nullptr) override;
  std::optional<std::string> get(const std::string& id, Error* error = nullptr) const override;
  bool contains(const std::string& id) const override;
  std::optional<BlobInfo> info(const std::string& id) const override;
  std::vector<std::string> paths_for(const std::string& id) const override;
  std::vector<BlobInfo> scan(size_t limit = 0, const std::string& start_after = "") const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "local_fs"; }

  const std::string& root() const { return root_; }
  std::string object_path(const std::string& id) const;

 private:
  std::string meta_path(const std::string& id) const;
  std::string index_path() const;
  std::string paths_index_path() const;

  void load_index() const;
  void save_index_entry(const BlobInfo& info) const;
  void record_path(const std::string& id, const std::string& path);

  std::string root_;
  std::string compression_;
  mutable std::mutex index_mu_;
  mutable std::map<std::string, BlobInfo> index_;
  mutable std::map<std::string, std::set<std::string>> paths_;
  mutable bool index_loaded_{false};
};

}  // namespace triage
