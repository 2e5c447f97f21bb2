#pragma once

// triage/schema.hpp: Ordered report database migrations.
//
// Migration N brings a database from user_version N-1 to N. Migrations only
// add tables, columns and indexes; existing fingerprints, detection statuses
// and review statuses are never rewritten, so identities stay valid across
// upgrades. The last entry's version equals version::SCHEMA_VERSION.

#include <cstdint>
#include <vector>

namespace triage::schema {

struct Migration {
  uint32_t version;
  const char* description;
  const char* sql;
};

const std::vector<Migration>& migrations();

}  // namespace triage::schema
