#ifndef DOCREP_STORE_FILE_RECORD_HPP
#define DOCREP_STORE_FILE_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "common/clock.hpp"

namespace docrep {
namespace store {

enum class SyncStatus {
  PENDING,
  SYNCING,
  SYNCED,
  FAILED
};

enum class StorageProvider {
  LOCAL,
  REMOTE_SYNCED
};

// Ordinal values are used for queue ordering, higher first
enum class Priority {
  LOW = 0,
  NORMAL = 1,
  HIGH = 2,
  URGENT = 3
};

const char* to_string(SyncStatus status);
const char* to_string(StorageProvider provider);
const char* to_string(Priority priority);

// Parsers throw ValidationError on unknown names, priority is case-insensitive
SyncStatus parse_sync_status(const std::string& name);
Priority parse_priority(const std::string& name);

// Persisted metadata of one logical file and its replication state
struct FileRecord {
  // Identity
  std::string file_id;
  uint64_t version = 1;

  // Descriptive
  std::string original_name;
  std::string system_name;
  std::string context_id;

  // Content
  std::string checksum;
  std::uintmax_t size = 0;

  // Storage
  std::string local_path;
  std::string remote_path;
  StorageProvider storage_provider = StorageProvider::LOCAL;
  bool keep_local = true;

  // Replication state
  bool replicate = true;
  SyncStatus sync_status = SyncStatus::PENDING;
  Priority priority = Priority::NORMAL;
  int sync_retries = 0;
  std::optional<TimePoint> last_sync_attempt;
  std::optional<TimePoint> next_attempt_at;
  std::optional<TimePoint> last_sync_success;
  std::string sync_error;
  std::optional<std::uintmax_t> remote_size;
  std::string remote_url;

  // Lifecycle
  TimePoint created_at{};
  bool active = true;
};

} // namespace store
} // namespace docrep

#endif // DOCREP_STORE_FILE_RECORD_HPP
