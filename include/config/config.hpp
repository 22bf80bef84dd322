#ifndef DOCREP_CONFIG_HPP
#define DOCREP_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace docrep {
namespace config {

// Connection and invocation settings for the rsync daemon endpoint
struct RemoteConfig {
  std::string host;
  std::string user;
  std::string module;
  uint16_t port = 873;

  // Credential source: inline secret or a pre-shared password file
  std::string password;
  std::string password_file;
  bool use_password_file = true;

  std::string binary = "rsync";
  std::vector<std::string> base_flags = {"-a", "--partial", "--mkpath"};
  bool compress = true;
  bool verbose = false;
  bool dry_run = false;
  std::string bandwidth_limit;
  std::string exclude_from;
  std::string include_from;
  int io_timeout_seconds = 300;

  std::string remote_base_path = "expediente-digital";
  std::string temp_dir = "temp";

  std::chrono::milliseconds transfer_timeout{10 * 60 * 1000};
  std::chrono::milliseconds delete_timeout{5 * 60 * 1000};
  bool verify_transfers = false;
};

struct ReplicationConfig {
  bool enabled = true;
  int max_retries = 3;
  std::chrono::milliseconds retry_delay{5000};
  std::size_t batch_size = 10;
  bool priority_first = true;
  std::chrono::milliseconds poll_interval{30 * 1000};
};

struct CacheConfig {
  std::string directory;  // empty means <temp_dir>/downloads
  std::chrono::milliseconds ttl{5 * 60 * 1000};
  std::chrono::milliseconds sweep_interval{2 * 60 * 1000};
  std::chrono::milliseconds lock_wait_timeout{30 * 1000};
};

struct StorageConfig {
  std::string upload_root = "uploads";
  std::uintmax_t max_file_size = 50ull * 1024 * 1024;
  std::vector<std::string> allowed_types = {
    "pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx", "jpg", "jpeg",
    "png", "gif", "webp", "txt", "csv", "zip", "rar"
  };
};

struct LoggingConfig {
  std::string file = "docrep.log";
  std::string level = "info";
};

struct Config {
  RemoteConfig remote;
  ReplicationConfig replication;
  CacheConfig cache;
  StorageConfig storage;
  LoggingConfig logging;

  // ---- LOADING ----
  // Reads every recognized variable from the process environment
  static Config from_environment();
  // Same as above with an injectable lookup, used by tests
  static Config from_lookup(const std::function<std::optional<std::string>(const std::string&)>& lookup);

  // ---- VALIDATION ----
  // Throws ConfigError when replication is enabled without a usable endpoint
  void validate() const;

  // Directory holding cached downloads
  std::string cache_directory() const;
};

// Splits a whitespace separated option string such as RSYNC_OPTIONS
std::vector<std::string> split_flags(const std::string& options);

} // namespace config
} // namespace docrep

#endif // DOCREP_CONFIG_HPP
