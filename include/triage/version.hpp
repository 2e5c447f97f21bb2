#pragma once

// triage/version.hpp: Explicit version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift across the report database, the blob store,
//   fingerprint identities and the event log. Every component that reads or
//   writes a versioned format checks its constant here before touching data.
//
// INVARIANT:
//   Never silently accept data from a newer format version than the engine
//   was compiled against. Older report databases are migrated forward by the
//   ordered migration list in schema.hpp.

#include <cstdint>
#include <string>

namespace triage {
namespace version {

// ---------------------------------------------------------------------------
// SCHEMA_VERSION
// Report database layout, stored in PRAGMA user_version.
// Version 1 = runs, reports, report_occurrences, review_statuses.
// Version 2 = current: adds run_history, identity confidence and scope
//             columns, bug path hashes and review origin.
// ---------------------------------------------------------------------------
constexpr uint32_t SCHEMA_VERSION = 2;
constexpr uint32_t MIN_MIGRATABLE_SCHEMA = 1;

// ---------------------------------------------------------------------------
// FINGERPRINT_VERSION
// Tracks the identity payload layout and the "fp:" domain. A bump here means
// every stored fingerprint is a different identity.
// ---------------------------------------------------------------------------
constexpr uint32_t FINGERPRINT_VERSION = 1;

// ---------------------------------------------------------------------------
// BLOB_FORMAT_VERSION
// On-disk layout of the blob store: objects/AB/CD/<digest> plus .meta sidecar.
// ---------------------------------------------------------------------------
constexpr uint32_t BLOB_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// NDJSON ingestion event lines.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t schema{SCHEMA_VERSION};
  uint32_t fingerprint{FINGERPRINT_VERSION};
  uint32_t blob_format{BLOB_FORMAT_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string build_timestamp;
};

VersionManifest current_manifest(const std::string& engine_semver = "");

std::string manifest_to_json(const VersionManifest& m);

// ---------------------------------------------------------------------------
// Schema compatibility: checked when a report database is opened.
// ---------------------------------------------------------------------------
struct SchemaCheck {
  bool ok{true};
  bool needs_migration{false};
  std::string error_code;    // Empty if ok
  std::string description;
  uint32_t on_disk{0};
  uint32_t required{SCHEMA_VERSION};
};

// on_disk == 0 denotes a fresh database.
SchemaCheck check_schema(uint32_t on_disk, bool auto_migrate);

}  // namespace version
}  // namespace triage
