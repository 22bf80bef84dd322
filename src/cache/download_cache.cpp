#include "cache/download_cache.hpp"
#include "common/errors.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <regex>

namespace docrep {
namespace cache {

namespace {

// download_<ms>_<random>_cache_<key>_<version>
const std::regex kEntryName(R"(^download_(\d+)_([a-z0-9]+)_cache_([0-9a-f]{32})_(\d+)$)");

constexpr int kMaxAttempts = 3;

TimePoint to_system_time(std::filesystem::file_time_type file_time) {
  using namespace std::chrono;
  return time_point_cast<system_clock::duration>(
    file_time - std::filesystem::file_time_type::clock::now() + system_clock::now());
}

} // namespace

const char* to_string(CacheOutcome outcome) {
  switch (outcome) {
    case CacheOutcome::HIT: return "hit";
    case CacheOutcome::FETCHED: return "fetched";
    case CacheOutcome::SHARED: return "shared";
    case CacheOutcome::FALLBACK: return "fallback";
    default: return "unknown";
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DownloadCache::DownloadCache(const std::string& directory, const Clock& clock,
                             std::chrono::milliseconds ttl, std::chrono::milliseconds lock_wait_timeout)
  : directory_(directory)
  , clock_(clock)
  , ttl_(ttl)
  , lock_wait_timeout_(lock_wait_timeout) {
  if (ttl_.count() <= 0) {
    throw ConfigError("cache TTL must be positive");
  }
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw StoreError("Download cache: cannot create " + directory_.string() + ": " + ec.message());
  }
  BOOST_LOG_TRIVIAL(info) << "Download cache: Initialized at " << directory_.string()
                          << " (ttl " << ttl_.count() << " ms)";
}

DownloadCache::~DownloadCache() {
  stop_sweeper();
}

std::string DownloadCache::make_cache_key(const std::string& file_id, uint64_t version) {
  return crypto::md5_hex(file_id + "_" + std::to_string(version));
}


//==============================================
// READ PATH
//==============================================

std::optional<CacheEntry> DownloadCache::lookup(const std::string& file_id, uint64_t version) {
  return touch(make_cache_key(file_id, version));
}

CacheLookup DownloadCache::get_or_fetch(const std::string& file_id, uint64_t version,
                                        const std::string& origin, const Fetcher& fetcher) {
  const std::string key = make_cache_key(file_id, version);

  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    if (auto hit = touch(key)) {
      BOOST_LOG_TRIVIAL(debug) << "Download cache: Hit for " << file_id << " v" << version;
      return {*hit, CacheOutcome::HIT};
    }

    auto acquisition = locks_.try_acquire(key);
    if (acquisition.acquired) {
      // Another caller may have finished between the miss and the acquire
      if (auto hit = touch(key)) {
        locks_.release(key, hit->path.string());
        return {*hit, CacheOutcome::HIT};
      }
      try {
        CacheEntry entry = fetch_and_insert(key, file_id, version, origin, fetcher);
        locks_.release(key, entry.path.string());
        return {entry, CacheOutcome::FETCHED};
      } catch (...) {
        locks_.fail(key, std::current_exception());
        throw;
      }
    }

    try {
      TransferLockTable::wait(acquisition.completion, lock_wait_timeout_, key);
    } catch (const LockTimeoutError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Download cache: " << e.what() << ", fetching without the lock";
      return {fetch_and_insert(key, file_id, version, origin, fetcher), CacheOutcome::FALLBACK};
    }

    if (auto shared = touch(key)) {
      return {*shared, CacheOutcome::SHARED};
    }
    BOOST_LOG_TRIVIAL(debug) << "Download cache: Shared entry for " << file_id << " vanished, retrying";
  }

  return {fetch_and_insert(key, file_id, version, origin, fetcher), CacheOutcome::FALLBACK};
}


//==============================================
// MAINTENANCE
//==============================================

std::size_t DownloadCache::sweep() {
  const TimePoint now = clock_.now();
  std::vector<CacheEntry> expired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->second.expires_at <= now) {
        expired.push_back(std::move(it->second));
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (const auto& entry : expired) {
    discard(entry.path);
  }
  if (!expired.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Download cache: Swept " << expired.size() << " expired entr"
                            << (expired.size() == 1 ? "y" : "ies");
  }
  return expired.size();
}

std::size_t DownloadCache::reconcile() {
  const TimePoint now = clock_.now();
  std::map<std::string, CacheEntry> found;
  std::vector<std::filesystem::path> leftovers;

  std::error_code ec;
  for (const auto& dirent : std::filesystem::directory_iterator(directory_, ec)) {
    if (!dirent.is_regular_file()) {
      continue;
    }
    const std::string name = dirent.path().filename().string();
    std::smatch match;
    if (!std::regex_match(name, match, kEntryName)) {
      if (name.rfind("download_", 0) == 0 || name.find(".part-") != std::string::npos) {
        leftovers.push_back(dirent.path());
      } else {
        BOOST_LOG_TRIVIAL(warning) << "Download cache: Ignoring unknown file " << name;
      }
      continue;
    }

    CacheEntry entry;
    entry.cache_key = match[3].str();
    entry.version = std::stoull(match[4].str());
    entry.path = dirent.path();
    entry.size = dirent.file_size();
    entry.origin = "disk";
    entry.created_at = to_system_time(dirent.last_write_time());
    entry.expires_at = entry.created_at + ttl_;
    entry.last_accessed = entry.created_at;

    if (entry.size == 0 || entry.expires_at <= now) {
      leftovers.push_back(entry.path);
      continue;
    }

    auto existing = found.find(entry.cache_key);
    if (existing == found.end()) {
      found.emplace(entry.cache_key, std::move(entry));
    } else if (entry.created_at > existing->second.created_at) {
      leftovers.push_back(existing->second.path);
      existing->second = std::move(entry);
    } else {
      leftovers.push_back(entry.path);
    }
  }
  if (ec) {
    throw StoreError("Download cache: cannot scan " + directory_.string() + ": " + ec.message());
  }

  for (const auto& path : leftovers) {
    discard(path);
  }

  std::size_t restored = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, entry] : found) {
      if (entries_.count(key) == 0) {
        entries_.emplace(key, std::move(entry));
        ++restored;
      }
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Download cache: Reconciled " << restored << " entr"
                          << (restored == 1 ? "y" : "ies") << ", removed " << leftovers.size()
                          << " leftover file(s)";
  return restored;
}

void DownloadCache::invalidate(const std::string& file_id, uint64_t version) {
  const std::string key = make_cache_key(file_id, version);
  std::optional<CacheEntry> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      removed = std::move(it->second);
      entries_.erase(it);
    }
  }
  if (removed) {
    discard(removed->path);
    BOOST_LOG_TRIVIAL(debug) << "Download cache: Invalidated " << file_id << " v" << version;
  }
}

void DownloadCache::clear() {
  std::map<std::string, CacheEntry> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    removed.swap(entries_);
  }
  for (const auto& [key, entry] : removed) {
    discard(entry.path);
  }
  BOOST_LOG_TRIVIAL(info) << "Download cache: Cleared " << removed.size() << " entr"
                          << (removed.size() == 1 ? "y" : "ies");
}

void DownloadCache::start_sweeper(std::chrono::milliseconds interval) {
  if (sweeper_ && sweeper_->running()) {
    return;
  }
  sweeper_ = std::make_unique<utils::Ticker>("cache-sweeper", interval, [this]() { sweep(); });
  sweeper_->start();
}

void DownloadCache::stop_sweeper() {
  if (sweeper_) {
    sweeper_->stop();
  }
}


//==============================================
// QUERY
//==============================================

CacheStats DownloadCache::stats() const {
  CacheStats stats;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats.entries = entries_.size();
    for (const auto& [key, entry] : entries_) {
      stats.total_bytes += entry.size;
      stats.top_entries.push_back(entry);
    }
  }
  stats.active_locks = locks_.size();

  std::stable_sort(stats.top_entries.begin(), stats.top_entries.end(),
                   [](const CacheEntry& a, const CacheEntry& b) { return a.hit_count > b.hit_count; });
  if (stats.top_entries.size() > 5) {
    stats.top_entries.resize(5);
  }
  return stats;
}

std::size_t DownloadCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}


//==============================================
// UTILITY METHODS
//==============================================

std::optional<CacheEntry> DownloadCache::touch(const std::string& key) {
  const TimePoint now = clock_.now();
  std::optional<CacheEntry> stale;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.expires_at <= now) {
      return std::nullopt;
    }
    std::error_code ec;
    if (std::filesystem::exists(it->second.path, ec)) {
      CacheEntry& entry = it->second;
      entry.expires_at = now + ttl_;
      entry.last_accessed = now;
      ++entry.hit_count;
      return entry;
    }
    stale = std::move(it->second);
    entries_.erase(it);
  }
  BOOST_LOG_TRIVIAL(warning) << "Download cache: Backing file " << stale->path.string()
                             << " disappeared, dropping entry";
  return std::nullopt;
}

CacheEntry DownloadCache::fetch_and_insert(const std::string& key, const std::string& file_id, uint64_t version,
                                           const std::string& origin, const Fetcher& fetcher) {
  const std::filesystem::path path = make_entry_path(key, version);
  BOOST_LOG_TRIVIAL(info) << "Download cache: Fetching " << file_id << " v" << version << " from " << origin;

  try {
    fetcher(path);
  } catch (...) {
    discard(path);
    throw;
  }

  std::error_code ec;
  std::uintmax_t size = std::filesystem::is_regular_file(path, ec) ? std::filesystem::file_size(path, ec) : 0;
  if (ec || size == 0) {
    discard(path);
    throw IntegrityError("fetch of " + file_id + " v" + std::to_string(version) + " produced no data");
  }

  const TimePoint now = clock_.now();
  CacheEntry entry;
  entry.cache_key = key;
  entry.file_id = file_id;
  entry.version = version;
  entry.path = path;
  entry.size = size;
  entry.origin = origin;
  entry.created_at = now;
  entry.expires_at = now + ttl_;
  entry.last_accessed = now;

  std::optional<std::filesystem::path> replaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.expires_at > now && std::filesystem::exists(it->second.path, ec)) {
      // A concurrent unlocked fetch won, keep its file
      replaced = path;
      entry = it->second;
    } else {
      if (it != entries_.end()) {
        replaced = it->second.path;
      }
      entries_[key] = entry;
    }
  }
  if (replaced) {
    discard(*replaced);
  }

  BOOST_LOG_TRIVIAL(info) << "Download cache: Cached " << file_id << " v" << version << " ("
                          << entry.size << " bytes)";
  return entry;
}

std::filesystem::path DownloadCache::make_entry_path(const std::string& key, uint64_t version) const {
  return directory_ / ("download_" + std::to_string(to_epoch_ms(clock_.now())) + "_" +
                       crypto::random_token(8) + "_cache_" + key + "_" + std::to_string(version));
}

void DownloadCache::discard(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Download cache: Failed to remove " << path.string() << ": " << ec.message();
  }
}

} // namespace cache
} // namespace docrep
