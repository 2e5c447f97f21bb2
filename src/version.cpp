#include "triage/version.hpp"

#include <sstream>

#ifndef TRIAGE_VERSION_STRING
#define TRIAGE_VERSION_STRING "0.3.0"
#endif

namespace triage {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver   = engine_semver.empty() ? TRIAGE_VERSION_STRING : engine_semver;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"schema\":" << m.schema
    << ",\"fingerprint\":" << m.fingerprint
    << ",\"blob_format\":" << m.blob_format
    << ",\"event_log\":" << m.event_log
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

SchemaCheck check_schema(uint32_t on_disk, bool auto_migrate) {
  SchemaCheck r;
  r.on_disk = on_disk;
  if (on_disk == 0) {
    r.needs_migration = true;  // fresh database: run every migration
    return r;
  }
  if (on_disk > SCHEMA_VERSION) {
    r.ok = false;
    r.error_code = "schema_version_mismatch";
    r.description = "database schema " + std::to_string(on_disk) +
                    " is newer than supported schema " + std::to_string(SCHEMA_VERSION) +
                    "; upgrade the engine";
    return r;
  }
  if (on_disk < MIN_MIGRATABLE_SCHEMA) {
    r.ok = false;
    r.error_code = "schema_version_mismatch";
    r.description = "database schema " + std::to_string(on_disk) + " cannot be migrated";
    return r;
  }
  if (on_disk < SCHEMA_VERSION) {
    if (!auto_migrate) {
      r.ok = false;
      r.error_code = "schema_version_mismatch";
      r.description = "database schema " + std::to_string(on_disk) + " requires migration to " +
                      std::to_string(SCHEMA_VERSION) + " and auto_migrate is disabled";
      return r;
    }
    r.needs_migration = true;
  }
  return r;
}

}  // namespace version
}  // namespace triage
