#include "config/config.hpp"
#include "common/errors.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>

namespace docrep {
namespace config {

//==============================================
// VALUE PARSING
//==============================================

namespace {

using Lookup = std::function<std::optional<std::string>(const std::string&)>;

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool read_bool(const Lookup& lookup, const std::string& name, bool fallback) {
  auto value = lookup(name);
  if (!value || value->empty()) {
    return fallback;
  }
  std::string v = to_lower(*value);
  if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
  if (v == "false" || v == "0" || v == "no" || v == "off") return false;
  throw ConfigError(name + " must be a boolean, got '" + *value + "'");
}

long long read_int(const Lookup& lookup, const std::string& name, long long fallback) {
  auto value = lookup(name);
  if (!value || value->empty()) {
    return fallback;
  }
  try {
    std::size_t consumed = 0;
    long long parsed = std::stoll(*value, &consumed);
    if (consumed != value->size() || parsed < 0) {
      throw ConfigError(name + " must be a non-negative integer, got '" + *value + "'");
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw ConfigError(name + " must be a non-negative integer, got '" + *value + "'");
  }
}

// read_int limited to what the destination field can hold
template <typename T>
T read_bounded(const Lookup& lookup, const std::string& name, T fallback) {
  long long value = read_int(lookup, name, static_cast<long long>(fallback));
  if (static_cast<unsigned long long>(value) > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
    throw ConfigError(name + " out of range: " + std::to_string(value));
  }
  return static_cast<T>(value);
}

std::string read_string(const Lookup& lookup, const std::string& name, const std::string& fallback) {
  auto value = lookup(name);
  return (value && !value->empty()) ? *value : fallback;
}

std::chrono::milliseconds read_ms(const Lookup& lookup, const std::string& name,
                                  std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds(read_int(lookup, name, fallback.count()));
}

std::vector<std::string> split_list(const std::string& list) {
  std::vector<std::string> items;
  std::stringstream ss(list);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t"));
    item.erase(item.find_last_not_of(" \t") + 1);
    if (!item.empty()) {
      items.push_back(to_lower(item));
    }
  }
  return items;
}

} // namespace

std::vector<std::string> split_flags(const std::string& options) {
  std::vector<std::string> flags;
  std::istringstream iss(options);
  std::string flag;
  while (iss >> flag) {
    flags.push_back(flag);
  }
  return flags;
}

//==============================================
// LOADING
//==============================================

Config Config::from_environment() {
  return from_lookup([](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (!value) {
      return std::nullopt;
    }
    return std::string(value);
  });
}

Config Config::from_lookup(const Lookup& lookup) {
  Config cfg;

  // Remote endpoint
  RemoteConfig& r = cfg.remote;
  r.host = read_string(lookup, "RSYNC_HOST", "");
  r.user = read_string(lookup, "RSYNC_USER", "");
  r.module = read_string(lookup, "RSYNC_MODULE", "");
  long long port = read_int(lookup, "RSYNC_PORT", r.port);
  if (port == 0 || port > 65535) {
    throw ConfigError("RSYNC_PORT out of range: " + std::to_string(port));
  }
  r.port = static_cast<uint16_t>(port);
  r.password = read_string(lookup, "RSYNC_PASSWORD", "");
  r.password_file = read_string(lookup, "RSYNC_PASSWORD_FILE", "");
  r.use_password_file = read_bool(lookup, "RSYNC_USE_PASSWORD_FILE", r.use_password_file);
  r.binary = read_string(lookup, "RSYNC_BINARY", r.binary);
  if (auto options = lookup("RSYNC_OPTIONS"); options && !options->empty()) {
    r.base_flags = split_flags(*options);
  }
  r.compress = read_bool(lookup, "RSYNC_COMPRESS", r.compress);
  r.verbose = read_bool(lookup, "RSYNC_VERBOSE", r.verbose);
  r.dry_run = read_bool(lookup, "RSYNC_DRY_RUN", r.dry_run);
  r.bandwidth_limit = read_string(lookup, "RSYNC_BANDWIDTH_LIMIT", "");
  r.exclude_from = read_string(lookup, "RSYNC_EXCLUDE_FROM", "");
  r.include_from = read_string(lookup, "RSYNC_INCLUDE_FROM", "");
  r.io_timeout_seconds = read_bounded<int>(lookup, "RSYNC_IO_TIMEOUT", r.io_timeout_seconds);
  r.remote_base_path = read_string(lookup, "RSYNC_REMOTE_BASE_PATH", r.remote_base_path);
  r.temp_dir = read_string(lookup, "RSYNC_TEMP_DIR", r.temp_dir);
  r.transfer_timeout = read_ms(lookup, "RSYNC_TIMEOUT", r.transfer_timeout);
  r.delete_timeout = read_ms(lookup, "RSYNC_DELETE_TIMEOUT", r.delete_timeout);
  r.verify_transfers = read_bool(lookup, "RSYNC_VERIFY_TRANSFERS", r.verify_transfers);

  // Replication queue
  ReplicationConfig& q = cfg.replication;
  q.enabled = read_bool(lookup, "RSYNC_ENABLED", q.enabled);
  q.max_retries = read_bounded<int>(lookup, "RSYNC_MAX_RETRIES", q.max_retries);
  q.retry_delay = read_ms(lookup, "RSYNC_RETRY_DELAY", q.retry_delay);
  q.batch_size = read_bounded<std::size_t>(lookup, "SYNC_BATCH_SIZE", q.batch_size);
  q.priority_first = read_bool(lookup, "SYNC_PRIORITY_FIRST", q.priority_first);
  q.poll_interval = read_ms(lookup, "SYNC_POLL_INTERVAL", q.poll_interval);

  // Download cache
  CacheConfig& c = cfg.cache;
  c.directory = read_string(lookup, "CACHE_DIR", "");
  c.ttl = read_ms(lookup, "CACHE_TTL", c.ttl);
  c.sweep_interval = read_ms(lookup, "CACHE_SWEEP_INTERVAL", c.sweep_interval);
  c.lock_wait_timeout = read_ms(lookup, "CACHE_LOCK_TIMEOUT", c.lock_wait_timeout);

  // Local storage
  StorageConfig& s = cfg.storage;
  s.upload_root = read_string(lookup, "UPLOAD_PATH", s.upload_root);
  s.max_file_size = read_bounded<std::uintmax_t>(lookup, "MAX_FILE_SIZE", s.max_file_size);
  if (auto types = lookup("ALLOWED_FILE_TYPES"); types && !types->empty()) {
    s.allowed_types = split_list(*types);
  }

  // Logging
  cfg.logging.file = read_string(lookup, "LOG_FILE", cfg.logging.file);
  cfg.logging.level = to_lower(read_string(lookup, "LOG_LEVEL", cfg.logging.level));

  return cfg;
}

//==============================================
// VALIDATION
//==============================================

void Config::validate() const {
  if (replication.enabled) {
    std::vector<std::string> missing;
    if (remote.host.empty()) missing.push_back("RSYNC_HOST");
    if (remote.user.empty()) missing.push_back("RSYNC_USER");
    if (remote.module.empty()) missing.push_back("RSYNC_MODULE");

    if (!missing.empty()) {
      std::string names;
      for (const auto& name : missing) {
        names += (names.empty() ? "" : ", ") + name;
      }
      BOOST_LOG_TRIVIAL(error) << "Config: Missing required remote settings: " << names;
      throw ConfigError("missing required variables: " + names);
    }

    if (remote.password.empty() && remote.password_file.empty()) {
      BOOST_LOG_TRIVIAL(warning) << "Config: No rsync credential configured, the daemon must allow anonymous access";
    }
  }

  if (replication.max_retries < 1) {
    throw ConfigError("RSYNC_MAX_RETRIES must be at least 1");
  }
  if (replication.batch_size == 0) {
    throw ConfigError("SYNC_BATCH_SIZE must be at least 1");
  }
  if (cache.ttl.count() == 0) {
    throw ConfigError("CACHE_TTL must be positive");
  }
  if (cache.sweep_interval.count() == 0 || replication.poll_interval.count() == 0) {
    throw ConfigError("CACHE_SWEEP_INTERVAL and SYNC_POLL_INTERVAL must be positive");
  }
  if (remote.transfer_timeout.count() == 0 || remote.delete_timeout.count() == 0) {
    throw ConfigError("RSYNC_TIMEOUT and RSYNC_DELETE_TIMEOUT must be positive");
  }
  if (storage.upload_root.empty()) {
    throw ConfigError("UPLOAD_PATH must not be empty");
  }
  if (remote.temp_dir.empty()) {
    throw ConfigError("RSYNC_TEMP_DIR must not be empty");
  }
}

std::string Config::cache_directory() const {
  if (!cache.directory.empty()) {
    return cache.directory;
  }
  return (std::filesystem::path(remote.temp_dir) / "downloads").string();
}

} // namespace config
} // namespace docrep
