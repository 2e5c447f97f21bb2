#pragma once

// triage/config.hpp: Engine configuration.
//
// Resolution order (later wins):
//   1. Built-in defaults below.
//   2. JSON config file (path argument, or TRIAGE_CONFIG).
//   3. TRIAGE_* environment variables.
//
// Recognized environment variables:
//   TRIAGE_CONFIG             path of a JSON config file
//   TRIAGE_DB                 report database path
//   TRIAGE_BLOB_ROOT          blob store root directory
//   TRIAGE_BLOB_COMPRESSION   off | zstd
//   TRIAGE_AUTO_MIGRATE       0 | 1
//   TRIAGE_COMMIT_RETRIES     retries after StorageConflict
//   TRIAGE_OPEN_TIMEOUT_MS    wait for a busy run before giving up
//   TRIAGE_DB_POOL_SIZE       report store connection pool size
//   TRIAGE_EVENT_LOG          NDJSON ingestion event log path
//   TRIAGE_LOG_FILE           log file (stderr when unset)
//   TRIAGE_LOG_LEVEL          debug | info | warn | error

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "triage/observability.hpp"
#include "triage/types.hpp"

namespace triage {

struct Config {
  std::string db_path{".triage/reports.db"};
  std::string blob_root{".triage/blobs"};
  std::string blob_compression{"off"};
  bool auto_migrate{true};
  uint32_t commit_retries{3};
  uint32_t open_timeout_ms{30000};
  uint32_t db_busy_timeout_ms{5000};
  std::size_t db_pool_size{4};
  std::string event_log;
  std::string log_file;
  LogLevel log_level{LogLevel::info};
};

// Applies the keys present in a JSON object; unknown keys are ignored.
bool apply_config_json(Config& config, const std::string& json_text, Error* error);

// Applies TRIAGE_* variables present in the environment.
bool apply_env_overrides(Config& config, Error* error);

// Defaults, then the config file (explicit path, else TRIAGE_CONFIG), then env.
std::optional<Config> load_config(const std::string& config_path, Error* error);

// Points the process-wide log and event sinks at the configured destinations.
void apply_logging(const Config& config);

std::string config_to_json(const Config& config);

}  // namespace triage
