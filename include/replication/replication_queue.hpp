#ifndef DOCREP_REPLICATION_QUEUE_HPP
#define DOCREP_REPLICATION_QUEUE_HPP

#include <optional>
#include <string>
#include <vector>
#include "common/clock.hpp"
#include "config/config.hpp"
#include "store/file_record_store.hpp"

namespace docrep {
namespace replication {

struct ResyncOptions {
  bool reset_retries = false;
  std::optional<store::Priority> priority;
};

// Durable queue of records awaiting replication. State transitions go
// through the store's compare-and-update so concurrent workers never
// claim the same record.
class ReplicationQueue {
public:
  ReplicationQueue(store::FileRecordStore& store, const Clock& clock, config::ReplicationConfig config);

  // ---- WRITE PATH ----
  // Inserts a freshly uploaded record in PENDING
  void enqueue(store::FileRecord record);

  // ---- CLAIMING ----
  // Moves up to limit eligible records from PENDING to SYNCING and returns them
  std::vector<store::FileRecord> claim_batch(std::size_t limit);
  std::vector<store::FileRecord> claim_batch() { return claim_batch(config_.batch_size); }

  // ---- COMPLETION ----
  // Both require the record to be SYNCING, i.e. owned by the caller
  store::FileRecord mark_synced(const std::string& file_id, const std::string& remote_url,
                                std::uintmax_t remote_size);
  // Either schedules a retry or gives up with FAILED once max_retries is reached
  store::FileRecord mark_failed(const std::string& file_id, const std::string& error);

  // ---- OPERATOR ACTIONS ----
  // Re-queues a SYNCED or FAILED record. SYNCING records are rejected, as are
  // FAILED records whose retries are exhausted unless reset_retries is set.
  store::FileRecord request_resync(const std::string& file_id, const ResyncOptions& options = {});

  store::QueueStatus status() const;
  const config::ReplicationConfig& config() const { return config_; }

private:
  store::FileRecordStore& store_;
  const Clock& clock_;
  config::ReplicationConfig config_;

  store::FileRecord require(const std::string& file_id) const;
};

} // namespace replication
} // namespace docrep

#endif // DOCREP_REPLICATION_QUEUE_HPP
