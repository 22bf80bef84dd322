#include "replication/replication_worker.hpp"
#include "common/errors.hpp"
#include <boost/log/trivial.hpp>

namespace docrep {
namespace replication {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ReplicationWorker::ReplicationWorker(ReplicationQueue& queue, transfer::TransferClient& client, std::string name)
  : queue_(queue)
  , client_(client)
  , name_(std::move(name)) {
  BOOST_LOG_TRIVIAL(info) << "Replication worker: " << name_ << " initialized";
}

ReplicationWorker::~ReplicationWorker() {
  stop();
}


//==============================================
// BATCH PROCESSING
//==============================================

BatchSummary ReplicationWorker::process_batch() {
  std::lock_guard<std::mutex> lock(batch_mutex_);
  BatchSummary summary;

  std::vector<store::FileRecord> batch = queue_.claim_batch();
  if (batch.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Replication worker: " << name_ << " found nothing to replicate";
  }

  for (const auto& record : batch) {
    ItemResult item = process_record(record);
    ++summary.processed;
    if (item.success) {
      ++summary.successful;
    } else {
      ++summary.failed;
    }
    summary.results.push_back(std::move(item));
  }

  if (summary.processed > 0) {
    summary.success_rate = static_cast<int>((summary.successful * 100 + summary.processed / 2) / summary.processed);
    BOOST_LOG_TRIVIAL(info) << "Replication worker: " << name_ << " batch done, " << summary.successful
                            << " succeeded, " << summary.failed << " failed (" << summary.success_rate << "%)";
  }

  summary.queue_status = queue_.status();
  ++batches_;
  return summary;
}

ItemResult ReplicationWorker::process_record(const store::FileRecord& record) {
  ItemResult item;
  item.file_id = record.file_id;
  item.system_name = record.system_name;

  store::FileRecord updated;
  try {
    transfer::TransferResult result = client_.upload(record.local_path, record.remote_path);
    updated = queue_.mark_synced(record.file_id, result.remote_url, result.bytes);
    item.success = true;
  } catch (const std::exception& e) {
    item.error = e.what();
    BOOST_LOG_TRIVIAL(warning) << "Replication worker: Upload of " << record.file_id << " failed: " << e.what();
    try {
      updated = queue_.mark_failed(record.file_id, e.what());
    } catch (const std::exception& inner) {
      // Record vanished or changed owner, it is reported but not retried here
      BOOST_LOG_TRIVIAL(error) << "Replication worker: Could not record failure for " << record.file_id
                               << ": " << inner.what();
      item.status = store::SyncStatus::FAILED;
      item.retries = record.sync_retries;
      return item;
    }
  }

  item.status = updated.sync_status;
  item.retries = updated.sync_retries;
  return item;
}


//==============================================
// BACKGROUND LOOP
//==============================================

void ReplicationWorker::start(std::chrono::milliseconds poll_interval) {
  if (ticker_ && ticker_->running()) {
    return;
  }
  ticker_ = std::make_unique<utils::Ticker>("replication-" + name_, poll_interval, [this]() {
    process_batch();
  });
  ticker_->start();
}

void ReplicationWorker::stop() {
  if (ticker_) {
    ticker_->stop();
  }
}

bool ReplicationWorker::running() const {
  return ticker_ && ticker_->running();
}

} // namespace replication
} // namespace docrep
