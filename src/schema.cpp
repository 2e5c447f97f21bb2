#include "triage/schema.hpp"

namespace triage::schema {

namespace {

constexpr const char* kSchemaV1 = R"SQL(
CREATE TABLE IF NOT EXISTS runs (
  id          INTEGER PRIMARY KEY AUTOINCREMENT,
  name        TEXT    NOT NULL UNIQUE,
  generation  INTEGER NOT NULL DEFAULT 0,
  created_at  INTEGER NOT NULL,
  updated_at  INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS reports (
  id                   INTEGER PRIMARY KEY AUTOINCREMENT,
  run_id               INTEGER NOT NULL REFERENCES runs(id) ON DELETE CASCADE,
  fingerprint          TEXT    NOT NULL,
  checker_id           TEXT    NOT NULL,
  severity             TEXT    NOT NULL DEFAULT 'unspecified',
  message              TEXT    NOT NULL DEFAULT '',
  file                 TEXT    NOT NULL,
  line                 INTEGER NOT NULL,
  col                  INTEGER NOT NULL,
  blob_id              TEXT    NOT NULL DEFAULT '',
  bug_path             TEXT    NOT NULL DEFAULT '[]',
  detection_status     TEXT    NOT NULL,
  detected_generation  INTEGER NOT NULL,
  fixed_generation     INTEGER NOT NULL DEFAULT 0,
  last_seen_generation INTEGER NOT NULL,
  UNIQUE(run_id, fingerprint)
);
CREATE INDEX IF NOT EXISTS idx_reports_fingerprint ON reports(fingerprint);

CREATE TABLE IF NOT EXISTS report_occurrences (
  report_id        INTEGER NOT NULL REFERENCES reports(id) ON DELETE CASCADE,
  compilation_unit TEXT    NOT NULL,
  file             TEXT    NOT NULL,
  line             INTEGER NOT NULL,
  col              INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_occurrences_report ON report_occurrences(report_id);

CREATE TABLE IF NOT EXISTS review_statuses (
  fingerprint TEXT    PRIMARY KEY,
  status      TEXT    NOT NULL,
  message     TEXT    NOT NULL DEFAULT '',
  author      TEXT    NOT NULL DEFAULT '',
  updated_at  INTEGER NOT NULL
);
)SQL";

constexpr const char* kSchemaV2 = R"SQL(
ALTER TABLE runs ADD COLUMN latest_tag TEXT NOT NULL DEFAULT '';
ALTER TABLE reports ADD COLUMN path_hash TEXT NOT NULL DEFAULT '';
ALTER TABLE reports ADD COLUMN confidence TEXT NOT NULL DEFAULT 'scoped';
ALTER TABLE reports ADD COLUMN scope TEXT NOT NULL DEFAULT '';
ALTER TABLE report_occurrences ADD COLUMN path_hash TEXT NOT NULL DEFAULT '';
ALTER TABLE review_statuses ADD COLUMN from_source INTEGER NOT NULL DEFAULT 0;

CREATE TABLE IF NOT EXISTS run_history (
  run_id            INTEGER NOT NULL REFERENCES runs(id) ON DELETE CASCADE,
  generation        INTEGER NOT NULL,
  tag               TEXT    NOT NULL DEFAULT '',
  committed_at      INTEGER NOT NULL,
  new_count         INTEGER NOT NULL DEFAULT 0,
  unresolved_count  INTEGER NOT NULL DEFAULT 0,
  resolved_count    INTEGER NOT NULL DEFAULT 0,
  reopened_count    INTEGER NOT NULL DEFAULT 0,
  enabled_checkers  TEXT    NOT NULL DEFAULT '[]',
  disabled_checkers TEXT    NOT NULL DEFAULT '[]',
  PRIMARY KEY(run_id, generation)
);

INSERT OR IGNORE INTO run_history(run_id, generation, committed_at)
  SELECT id, generation, updated_at FROM runs WHERE generation > 0;
)SQL";

}  // namespace

const std::vector<Migration>& migrations() {
  static const std::vector<Migration> kMigrations = {
      {1, "runs, reports, occurrences, review statuses", kSchemaV1},
      {2, "run history, identity confidence, bug path hashes, review origin", kSchemaV2},
  };
  return kMigrations;
}

}  // namespace triage::schema
