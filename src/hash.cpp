#include "triage/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive.
//   2. Domain separation: "fp:", "blob:" and "path:" prefixes keep
//      fingerprints, blob ids and bug path hashes from ever colliding with one
//      another. Changing a prefix invalidates every stored identity and needs
//      a FINGERPRINT_VERSION / BLOB_FORMAT_VERSION bump (see version.hpp).

#include <array>
#include <cstdint>
#include <initializer_list>

extern "C" {
#include <blake3.h>
}

namespace triage {
namespace {

// BLAKE3 over the concatenation of parts, rendered as lowercase hex.
std::string digest_hex(std::initializer_list<std::string_view> parts) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  for (std::string_view part : parts) blake3_hasher_update(&hasher, part.data(), part.size());
  std::array<std::uint8_t, BLAKE3_OUT_LEN> raw{};
  blake3_hasher_finalize(&hasher, raw.data(), raw.size());

  static constexpr char kNibbles[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(raw.size() * 2);
  for (std::uint8_t byte : raw) {
    hex.push_back(kNibbles[byte >> 4]);
    hex.push_back(kNibbles[byte & 0x0f]);
  }
  return hex;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  return HashRuntimeInfo{"blake3", "system", blake3_version(), true};
}

std::string blake3_hex(std::string_view payload) { return digest_hex({payload}); }

std::string hash_domain(std::string_view domain, std::string_view payload) {
  return digest_hex({domain, payload});
}

std::string fingerprint_digest(std::string_view identity_payload) {
  return hash_domain("fp:", identity_payload);
}

std::string blob_content_hash(std::string_view raw_bytes) {
  return hash_domain("blob:", raw_bytes);
}

std::string bug_path_digest(std::string_view path_payload) {
  return hash_domain("path:", path_payload);
}

bool valid_digest(std::string_view d) {
  return d.size() == 64 &&
         d.find_first_not_of("0123456789abcdef") == std::string_view::npos;
}

}  // namespace triage
