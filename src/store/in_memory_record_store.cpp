#include "store/file_record_store.hpp"
#include "common/errors.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace docrep {
namespace store {

//==============================================
// RECORD ACCESS
//==============================================

void InMemoryFileRecordStore::insert(const FileRecord& record) {
  if (record.file_id.empty()) {
    throw ValidationError("file id must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = records_.emplace(record.file_id, record);
  if (!inserted) {
    BOOST_LOG_TRIVIAL(error) << "Record store: Duplicate file id: " << record.file_id;
    throw ValidationError("duplicate file id: " + record.file_id);
  }
  BOOST_LOG_TRIVIAL(debug) << "Record store: Inserted record " << record.file_id
                           << " (status " << to_string(record.sync_status) << ")";
}

std::optional<FileRecord> InMemoryFileRecordStore::find(const std::string& file_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(file_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<FileRecord> InMemoryFileRecordStore::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<FileRecord> result;
  result.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    result.push_back(record);
  }
  return result;
}

//==============================================
// CONDITIONAL UPDATES
//==============================================

bool InMemoryFileRecordStore::update_if(const std::string& file_id, SyncStatus expected,
                                        const RecordMutator& mutate) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = records_.find(file_id);
  if (it == records_.end()) {
    throw NotFoundError("file record " + file_id);
  }

  if (it->second.sync_status != expected) {
    BOOST_LOG_TRIVIAL(debug) << "Record store: Conditional update skipped for " << file_id
                             << " (expected " << to_string(expected)
                             << ", found " << to_string(it->second.sync_status) << ")";
    return false;
  }

  // Mutate a copy so a throwing mutator leaves the stored record untouched
  FileRecord updated = it->second;
  mutate(updated);
  updated.file_id = file_id;
  it->second = std::move(updated);
  return true;
}

//==============================================
// QUEUE QUERIES
//==============================================

std::vector<FileRecord> InMemoryFileRecordStore::select_pending(const PendingQuery& query) const {
  std::vector<FileRecord> candidates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, record] : records_) {
      if (!record.active || !record.replicate) continue;
      if (record.sync_status != SyncStatus::PENDING) continue;
      if (record.sync_retries >= query.max_retries) continue;
      if (record.next_attempt_at && *record.next_attempt_at > query.now) continue;
      candidates.push_back(record);
    }
  }

  if (query.priority_first) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const FileRecord& a, const FileRecord& b) {
                       if (a.priority != b.priority) {
                         return static_cast<int>(a.priority) > static_cast<int>(b.priority);
                       }
                       return a.created_at < b.created_at;
                     });
  } else {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const FileRecord& a, const FileRecord& b) {
                       return a.created_at < b.created_at;
                     });
  }

  if (candidates.size() > query.limit) {
    candidates.resize(query.limit);
  }
  return candidates;
}

QueueStatus InMemoryFileRecordStore::status() const {
  QueueStatus result;
  std::map<SyncStatus, long long> retry_sums;
  long long total_retries = 0;

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, record] : records_) {
    if (!record.active || !record.replicate) continue;

    auto& bucket = result.by_status[record.sync_status];
    bucket.count++;
    bucket.total_bytes += record.size;
    retry_sums[record.sync_status] += record.sync_retries;

    result.total++;
    result.total_bytes += record.size;
    total_retries += record.sync_retries;
  }

  for (auto& [status, bucket] : result.by_status) {
    bucket.average_retries = static_cast<double>(retry_sums[status]) / static_cast<double>(bucket.count);
  }

  auto count_of = [&result](SyncStatus s) -> std::size_t {
    auto it = result.by_status.find(s);
    return it == result.by_status.end() ? 0 : it->second.count;
  };
  result.pending = count_of(SyncStatus::PENDING);
  result.syncing = count_of(SyncStatus::SYNCING);
  result.synced = count_of(SyncStatus::SYNCED);
  result.failed = count_of(SyncStatus::FAILED);
  result.average_retries = result.total == 0
      ? 0.0
      : static_cast<double>(total_retries) / static_cast<double>(result.total);

  return result;
}

} // namespace store
} // namespace docrep
