#ifndef DOCREP_REPLICATION_WORKER_HPP
#define DOCREP_REPLICATION_WORKER_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "replication/replication_queue.hpp"
#include "transfer/transfer_client.hpp"
#include "utils/ticker.hpp"

namespace docrep {
namespace replication {

struct ItemResult {
  std::string file_id;
  std::string system_name;
  bool success = false;
  store::SyncStatus status = store::SyncStatus::PENDING;
  int retries = 0;
  std::string error;
};

struct BatchSummary {
  std::size_t processed = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
  // Percentage, 0 when nothing was processed
  int success_rate = 0;
  std::vector<ItemResult> results;
  store::QueueStatus queue_status;
};

// Drains the replication queue through a TransferClient
class ReplicationWorker {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ReplicationWorker(ReplicationQueue& queue, transfer::TransferClient& client, std::string name = "worker");
  ~ReplicationWorker();

  ReplicationWorker(const ReplicationWorker&) = delete;
  ReplicationWorker& operator=(const ReplicationWorker&) = delete;


  // ---- BATCH PROCESSING ----
  // Claims one batch and uploads each record. Never throws for per-item failures.
  BatchSummary process_batch();


  // ---- BACKGROUND LOOP ----
  void start(std::chrono::milliseconds poll_interval);
  void stop();
  bool running() const;
  std::uint64_t batches_processed() const { return batches_; }

private:
  ReplicationQueue& queue_;
  transfer::TransferClient& client_;
  std::string name_;
  std::unique_ptr<utils::Ticker> ticker_;
  // One batch at a time per worker
  std::mutex batch_mutex_;
  std::atomic<std::uint64_t> batches_{0};

  ItemResult process_record(const store::FileRecord& record);
};

} // namespace replication
} // namespace docrep

#endif // DOCREP_REPLICATION_WORKER_HPP
