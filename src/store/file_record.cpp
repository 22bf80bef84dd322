#include "store/file_record.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>

namespace docrep {
namespace store {

const char* to_string(SyncStatus status) {
  switch (status) {
    case SyncStatus::PENDING: return "PENDING";
    case SyncStatus::SYNCING: return "SYNCING";
    case SyncStatus::SYNCED:  return "SYNCED";
    case SyncStatus::FAILED:  return "FAILED";
    default:                  return "UNKNOWN";
  }
}

const char* to_string(StorageProvider provider) {
  switch (provider) {
    case StorageProvider::LOCAL:         return "LOCAL";
    case StorageProvider::REMOTE_SYNCED: return "REMOTE_SYNCED";
    default:                             return "UNKNOWN";
  }
}

const char* to_string(Priority priority) {
  switch (priority) {
    case Priority::LOW:    return "LOW";
    case Priority::NORMAL: return "NORMAL";
    case Priority::HIGH:   return "HIGH";
    case Priority::URGENT: return "URGENT";
    default:               return "UNKNOWN";
  }
}

SyncStatus parse_sync_status(const std::string& name) {
  if (name == "PENDING") return SyncStatus::PENDING;
  if (name == "SYNCING") return SyncStatus::SYNCING;
  if (name == "SYNCED") return SyncStatus::SYNCED;
  if (name == "FAILED") return SyncStatus::FAILED;
  throw ValidationError("unknown sync status: " + name);
}

Priority parse_priority(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "LOW") return Priority::LOW;
  if (upper == "NORMAL") return Priority::NORMAL;
  if (upper == "HIGH") return Priority::HIGH;
  if (upper == "URGENT") return Priority::URGENT;
  throw ValidationError("unknown priority: " + name);
}

} // namespace store
} // namespace docrep
