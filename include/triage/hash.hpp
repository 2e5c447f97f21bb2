#pragma once

#include <string>
#include <string_view>

namespace triage {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
  bool blake3_available{false};
};

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing. Every stored identity is produced through one of
// the wrappers below; the prefixes are part of the on-disk contract.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string fingerprint_digest(std::string_view identity_payload);  // "fp:"
std::string blob_content_hash(std::string_view raw_bytes);          // "blob:"
std::string bug_path_digest(std::string_view path_payload);         // "path:"

// True for a 64-char lowercase hex digest.
bool valid_digest(std::string_view digest);

}  // namespace triage
