#ifndef DOCREP_CACHE_DOWNLOAD_CACHE_HPP
#define DOCREP_CACHE_DOWNLOAD_CACHE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "cache/lock_table.hpp"
#include "common/clock.hpp"
#include "utils/ticker.hpp"

namespace docrep {
namespace cache {

struct CacheEntry {
  std::string cache_key;
  std::string file_id;  // empty for entries rebuilt from disk
  uint64_t version = 0;
  std::filesystem::path path;
  std::uintmax_t size = 0;
  // Where the bytes came from, e.g. "local" or "remote"
  std::string origin;
  TimePoint created_at{};
  TimePoint expires_at{};
  TimePoint last_accessed{};
  std::size_t hit_count = 0;
};

enum class CacheOutcome {
  HIT,       // served from a live entry
  FETCHED,   // this caller downloaded it
  SHARED,    // another caller's download was reused
  FALLBACK   // lock wait timed out, fetched without the lock
};

const char* to_string(CacheOutcome outcome);

struct CacheLookup {
  CacheEntry entry;
  CacheOutcome outcome = CacheOutcome::HIT;
};

struct CacheStats {
  std::size_t entries = 0;
  std::size_t active_locks = 0;
  std::uintmax_t total_bytes = 0;
  // Up to five entries with the most hits
  std::vector<CacheEntry> top_entries;
};

// Writes the object into the given destination path
using Fetcher = std::function<void(const std::filesystem::path& destination)>;

// TTL cache of downloaded artifacts on local disk with duplicate download
// suppression per (file id, version)
class DownloadCache {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  DownloadCache(const std::string& directory, const Clock& clock,
                std::chrono::milliseconds ttl, std::chrono::milliseconds lock_wait_timeout);
  ~DownloadCache();

  DownloadCache(const DownloadCache&) = delete;
  DownloadCache& operator=(const DownloadCache&) = delete;

  // Hex MD5 of "<file id>_<version>"
  static std::string make_cache_key(const std::string& file_id, uint64_t version);


  // ---- READ PATH ----
  // Live entry without fetching, refreshes its TTL
  std::optional<CacheEntry> lookup(const std::string& file_id, uint64_t version);
  // Returns a live entry, fetching at most once across concurrent callers.
  // Throws IntegrityError for empty results and rethrows fetcher failures.
  CacheLookup get_or_fetch(const std::string& file_id, uint64_t version,
                           const std::string& origin, const Fetcher& fetcher);


  // ---- MAINTENANCE ----
  // Removes expired entries and their files, returns how many were removed
  std::size_t sweep();
  // Rebuilds the table from files left in the directory, returns entries restored
  std::size_t reconcile();
  void invalidate(const std::string& file_id, uint64_t version);
  void clear();

  void start_sweeper(std::chrono::milliseconds interval);
  void stop_sweeper();


  // ---- QUERY ----
  CacheStats stats() const;
  std::size_t size() const;
  const std::filesystem::path& directory() const { return directory_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path directory_;
  const Clock& clock_;
  std::chrono::milliseconds ttl_;
  std::chrono::milliseconds lock_wait_timeout_;

  mutable std::mutex mutex_;
  std::map<std::string, CacheEntry> entries_;
  TransferLockTable locks_;
  std::unique_ptr<utils::Ticker> sweeper_;


  // ---- UTILITY METHODS ----
  // Refreshes and returns a live entry, drops entries whose file disappeared
  std::optional<CacheEntry> touch(const std::string& key);
  // Runs the fetcher into a fresh path and inserts the result
  CacheEntry fetch_and_insert(const std::string& key, const std::string& file_id, uint64_t version,
                              const std::string& origin, const Fetcher& fetcher);
  std::filesystem::path make_entry_path(const std::string& key, uint64_t version) const;
  static void discard(const std::filesystem::path& path);
};

} // namespace cache
} // namespace docrep

#endif // DOCREP_CACHE_DOWNLOAD_CACHE_HPP
