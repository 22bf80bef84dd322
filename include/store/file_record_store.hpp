#ifndef DOCREP_STORE_FILE_RECORD_STORE_HPP
#define DOCREP_STORE_FILE_RECORD_STORE_HPP

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "store/file_record.hpp"

namespace docrep {
namespace store {

// Filter and ordering used by the replication queue to select work
struct PendingQuery {
  std::size_t limit = 10;
  int max_retries = 3;
  bool priority_first = true;
  TimePoint now{};
};

struct StatusBreakdown {
  std::size_t count = 0;
  std::uintmax_t total_bytes = 0;
  double average_retries = 0.0;
};

// Read-only projection over the active, replicated records
struct QueueStatus {
  std::size_t pending = 0;
  std::size_t syncing = 0;
  std::size_t synced = 0;
  std::size_t failed = 0;
  std::size_t total = 0;
  std::uintmax_t total_bytes = 0;
  double average_retries = 0.0;
  std::map<SyncStatus, StatusBreakdown> by_status;
};

using RecordMutator = std::function<void(FileRecord&)>;

// Narrow interface onto the external metadata store
class FileRecordStore {
public:
  virtual ~FileRecordStore() = default;

  // ---- RECORD ACCESS ----
  // Adds a new record, throws ValidationError if the id is already taken
  virtual void insert(const FileRecord& record) = 0;
  virtual std::optional<FileRecord> find(const std::string& file_id) const = 0;
  virtual std::vector<FileRecord> list() const = 0;

  // ---- CONDITIONAL UPDATES ----
  // Applies the mutator only when the stored record currently has the
  // expected status. Returns false when the status did not match.
  // Throws NotFoundError for unknown ids.
  virtual bool update_if(const std::string& file_id, SyncStatus expected,
                         const RecordMutator& mutate) = 0;

  // ---- QUEUE QUERIES ----
  virtual std::vector<FileRecord> select_pending(const PendingQuery& query) const = 0;
  virtual QueueStatus status() const = 0;
};

// Process-local implementation used by the CLI and the tests
class InMemoryFileRecordStore : public FileRecordStore {
public:
  InMemoryFileRecordStore() = default;

  void insert(const FileRecord& record) override;
  std::optional<FileRecord> find(const std::string& file_id) const override;
  std::vector<FileRecord> list() const override;
  bool update_if(const std::string& file_id, SyncStatus expected,
                 const RecordMutator& mutate) override;
  std::vector<FileRecord> select_pending(const PendingQuery& query) const override;
  QueueStatus status() const override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, FileRecord> records_;
};

} // namespace store
} // namespace docrep

#endif // DOCREP_STORE_FILE_RECORD_STORE_HPP
