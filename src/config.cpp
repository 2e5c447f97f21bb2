#include "triage/config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "triage/jsonlite.hpp"

namespace triage {

namespace {

bool parse_u32(const std::string& text, uint32_t& out) {
  if (text.empty() || text.size() > 9) return false;
  uint32_t v = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<uint32_t>(c - '0');
  }
  out = v;
  return true;
}

bool parse_flag(const std::string& text, bool& out) {
  if (text == "1" || text == "true" || text == "yes" || text == "on") { out = true; return true; }
  if (text == "0" || text == "false" || text == "no" || text == "off") { out = false; return true; }
  return false;
}

bool valid_compression(const std::string& c) {
  return c == "off" || c == "zstd";
}

const char* env(const char* name) {
  const char* v = std::getenv(name);
  return (v && v[0]) ? v : nullptr;
}

}  // namespace

bool apply_config_json(Config& config, const std::string& json_text, Error* error) {
  std::optional<jsonlite::JsonError> jerr;
  const auto obj = jsonlite::parse(json_text, &jerr);
  if (jerr) {
    set_error(error, ErrorCode::config_invalid, "config: " + jerr->message);
    return false;
  }

  config.db_path = jsonlite::get_string(obj, "db_path", config.db_path);
  config.blob_root = jsonlite::get_string(obj, "blob_root", config.blob_root);
  config.blob_compression = jsonlite::get_string(obj, "blob_compression", config.blob_compression);
  config.auto_migrate = jsonlite::get_bool(obj, "auto_migrate", config.auto_migrate);
  config.commit_retries = static_cast<uint32_t>(jsonlite::get_u64(obj, "commit_retries", config.commit_retries));
  config.open_timeout_ms = static_cast<uint32_t>(jsonlite::get_u64(obj, "open_timeout_ms", config.open_timeout_ms));
  config.db_busy_timeout_ms = static_cast<uint32_t>(jsonlite::get_u64(obj, "db_busy_timeout_ms", config.db_busy_timeout_ms));
  config.db_pool_size = static_cast<std::size_t>(jsonlite::get_u64(obj, "db_pool_size", config.db_pool_size));
  config.event_log = jsonlite::get_string(obj, "event_log", config.event_log);
  config.log_file = jsonlite::get_string(obj, "log_file", config.log_file);

  const std::string level = jsonlite::get_string(obj, "log_level", "");
  if (!level.empty()) {
    auto parsed = parse_log_level(level);
    if (!parsed) {
      set_error(error, ErrorCode::config_invalid, "config: unknown log_level '" + level + "'");
      return false;
    }
    config.log_level = *parsed;
  }
  if (!valid_compression(config.blob_compression)) {
    set_error(error, ErrorCode::config_invalid,
              "config: blob_compression must be off or zstd, got '" + config.blob_compression + "'");
    return false;
  }
  if (config.db_pool_size == 0) {
    set_error(error, ErrorCode::config_invalid, "config: db_pool_size must be positive");
    return false;
  }
  return true;
}

bool apply_env_overrides(Config& config, Error* error) {
  if (const char* v = env("TRIAGE_DB")) config.db_path = v;
  if (const char* v = env("TRIAGE_BLOB_ROOT")) config.blob_root = v;
  if (const char* v = env("TRIAGE_EVENT_LOG")) config.event_log = v;
  if (const char* v = env("TRIAGE_LOG_FILE")) config.log_file = v;

  if (const char* v = env("TRIAGE_BLOB_COMPRESSION")) {
    if (!valid_compression(v)) {
      set_error(error, ErrorCode::config_invalid, std::string("TRIAGE_BLOB_COMPRESSION: ") + v);
      return false;
    }
    config.blob_compression = v;
  }
  if (const char* v = env("TRIAGE_AUTO_MIGRATE")) {
    if (!parse_flag(v, config.auto_migrate)) {
      set_error(error, ErrorCode::config_invalid, std::string("TRIAGE_AUTO_MIGRATE: ") + v);
      return false;
    }
  }
  if (const char* v = env("TRIAGE_COMMIT_RETRIES")) {
    if (!parse_u32(v, config.commit_retries)) {
      set_error(error, ErrorCode::config_invalid, std::string("TRIAGE_COMMIT_RETRIES: ") + v);
      return false;
    }
  }
  if (const char* v = env("TRIAGE_OPEN_TIMEOUT_MS")) {
    if (!parse_u32(v, config.open_timeout_ms)) {
      set_error(error, ErrorCode::config_invalid, std::string("TRIAGE_OPEN_TIMEOUT_MS: ") + v);
      return false;
    }
  }
  if (const char* v = env("TRIAGE_DB_POOL_SIZE")) {
    uint32_t n = 0;
    if (!parse_u32(v, n) || n == 0) {
      set_error(error, ErrorCode::config_invalid, std::string("TRIAGE_DB_POOL_SIZE: ") + v);
      return false;
    }
    config.db_pool_size = n;
  }
  if (const char* v = env("TRIAGE_LOG_LEVEL")) {
    auto parsed = parse_log_level(v);
    if (!parsed) {
      set_error(error, ErrorCode::config_invalid, std::string("TRIAGE_LOG_LEVEL: ") + v);
      return false;
    }
    config.log_level = *parsed;
  }
  return true;
}

std::optional<Config> load_config(const std::string& config_path, Error* error) {
  Config config;
  std::string path = config_path;
  if (path.empty()) {
    if (const char* v = env("TRIAGE_CONFIG")) path = v;
  }
  if (!path.empty()) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
      set_error(error, ErrorCode::config_invalid, "cannot read config file " + path);
      return std::nullopt;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    if (!apply_config_json(config, ss.str(), error)) return std::nullopt;
  }
  if (!apply_env_overrides(config, error)) return std::nullopt;
  return config;
}

void apply_logging(const Config& config) {
  set_log_level(config.log_level);
  set_log_path(config.log_file);
  set_event_log_path(config.event_log);
}

std::string config_to_json(const Config& config) {
  jsonlite::Object o;
  o["db_path"] = jsonlite::str(config.db_path);
  o["blob_root"] = jsonlite::str(config.blob_root);
  o["blob_compression"] = jsonlite::str(config.blob_compression);
  o["auto_migrate"] = jsonlite::boolean(config.auto_migrate);
  o["commit_retries"] = jsonlite::num(config.commit_retries);
  o["open_timeout_ms"] = jsonlite::num(config.open_timeout_ms);
  o["db_busy_timeout_ms"] = jsonlite::num(config.db_busy_timeout_ms);
  o["db_pool_size"] = jsonlite::num(config.db_pool_size);
  o["event_log"] = jsonlite::str(config.event_log);
  o["log_file"] = jsonlite::str(config.log_file);
  o["log_level"] = jsonlite::str(to_string(config.log_level));
  return jsonlite::to_json(o);
}

}  // namespace triage
