#include "replication/replication_queue.hpp"
#include "common/errors.hpp"
#include <boost/log/trivial.hpp>

namespace docrep {
namespace replication {

using store::FileRecord;
using store::SyncStatus;

ReplicationQueue::ReplicationQueue(store::FileRecordStore& store, const Clock& clock,
                                   config::ReplicationConfig config)
  : store_(store)
  , clock_(clock)
  , config_(std::move(config)) {
  if (config_.max_retries < 1) {
    throw ConfigError("max_retries must be at least 1");
  }
}


//==============================================
// WRITE PATH
//==============================================

void ReplicationQueue::enqueue(FileRecord record) {
  record.sync_status = SyncStatus::PENDING;
  record.sync_retries = 0;
  record.sync_error.clear();
  record.next_attempt_at.reset();
  if (record.created_at == TimePoint{}) {
    record.created_at = clock_.now();
  }

  store_.insert(record);
  BOOST_LOG_TRIVIAL(info) << "Replication queue: Enqueued " << record.file_id << " ("
                          << record.system_name << ", priority " << store::to_string(record.priority) << ")";
}


//==============================================
// CLAIMING
//==============================================

std::vector<FileRecord> ReplicationQueue::claim_batch(std::size_t limit) {
  store::PendingQuery query;
  query.limit = limit;
  query.max_retries = config_.max_retries;
  query.priority_first = config_.priority_first;
  query.now = clock_.now();

  std::vector<FileRecord> claimed;
  for (const auto& candidate : store_.select_pending(query)) {
    const TimePoint now = clock_.now();
    bool won = store_.update_if(candidate.file_id, SyncStatus::PENDING, [now](FileRecord& record) {
      record.sync_status = SyncStatus::SYNCING;
      record.last_sync_attempt = now;
    });
    if (!won) {
      // Another batch got there first
      BOOST_LOG_TRIVIAL(debug) << "Replication queue: " << candidate.file_id << " already claimed";
      continue;
    }
    claimed.push_back(require(candidate.file_id));
  }

  if (!claimed.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Replication queue: Claimed " << claimed.size() << " record(s)";
  }
  return claimed;
}


//==============================================
// COMPLETION
//==============================================

FileRecord ReplicationQueue::mark_synced(const std::string& file_id, const std::string& remote_url,
                                         std::uintmax_t remote_size) {
  const TimePoint now = clock_.now();
  bool updated = store_.update_if(file_id, SyncStatus::SYNCING, [&](FileRecord& record) {
    record.sync_status = SyncStatus::SYNCED;
    record.sync_error.clear();
    record.remote_url = remote_url;
    record.remote_size = remote_size;
    record.last_sync_success = now;
    record.next_attempt_at.reset();
    record.storage_provider = store::StorageProvider::REMOTE_SYNCED;
  });
  if (!updated) {
    throw Error("Replication queue: " + file_id + " is not being synchronized");
  }

  BOOST_LOG_TRIVIAL(info) << "Replication queue: " << file_id << " synced to " << remote_url;
  return require(file_id);
}

FileRecord ReplicationQueue::mark_failed(const std::string& file_id, const std::string& error) {
  const TimePoint now = clock_.now();
  const int max_retries = config_.max_retries;
  const auto retry_delay = config_.retry_delay;

  bool updated = store_.update_if(file_id, SyncStatus::SYNCING, [&](FileRecord& record) {
    record.sync_retries += 1;
    record.sync_error = error;
    if (record.sync_retries < max_retries) {
      record.sync_status = SyncStatus::PENDING;
      record.next_attempt_at = now + retry_delay * record.sync_retries;
    } else {
      record.sync_status = SyncStatus::FAILED;
      record.next_attempt_at.reset();
    }
  });
  if (!updated) {
    throw Error("Replication queue: " + file_id + " is not being synchronized");
  }

  FileRecord record = require(file_id);
  if (record.sync_status == SyncStatus::FAILED) {
    BOOST_LOG_TRIVIAL(error) << "Replication queue: " << file_id << " failed permanently after "
                             << record.sync_retries << " attempt(s): " << error;
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Replication queue: " << file_id << " attempt " << record.sync_retries
                               << "/" << max_retries << " failed, retrying: " << error;
  }
  return record;
}


//==============================================
// OPERATOR ACTIONS
//==============================================

FileRecord ReplicationQueue::request_resync(const std::string& file_id, const ResyncOptions& options) {
  // A concurrent transition makes the conditional update miss, so re-read and retry
  for (int attempt = 0; attempt < 3; ++attempt) {
    FileRecord current = require(file_id);
    if (!current.active) {
      throw NotFoundError("file " + file_id);
    }
    if (!current.replicate) {
      throw ValidationError("file " + file_id + " is not configured for replication");
    }
    if (current.sync_status == SyncStatus::SYNCING) {
      throw ValidationError("file " + file_id + " is currently being synchronized");
    }
    if (current.sync_status == SyncStatus::FAILED && !options.reset_retries &&
        current.sync_retries >= config_.max_retries) {
      throw ValidationError("file " + file_id + " exhausted its retries, reset them to re-queue");
    }

    bool updated = store_.update_if(file_id, current.sync_status, [&options](FileRecord& record) {
      if (options.reset_retries) {
        record.sync_retries = 0;
        record.sync_error.clear();
      }
      if (options.priority) {
        record.priority = *options.priority;
      }
      record.sync_status = SyncStatus::PENDING;
      record.next_attempt_at.reset();
    });
    if (updated) {
      FileRecord record = require(file_id);
      BOOST_LOG_TRIVIAL(info) << "Replication queue: Re-sync requested for " << file_id
                              << " (retries " << record.sync_retries << ", priority "
                              << store::to_string(record.priority) << ")";
      return record;
    }
  }
  throw Error("Replication queue: " + file_id + " changed state concurrently, re-sync not applied");
}

store::QueueStatus ReplicationQueue::status() const {
  return store_.status();
}

FileRecord ReplicationQueue::require(const std::string& file_id) const {
  auto record = store_.find(file_id);
  if (!record) {
    throw NotFoundError("file " + file_id);
  }
  return *record;
}

} // namespace replication
} // namespace docrep
