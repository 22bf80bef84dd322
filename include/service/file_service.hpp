#ifndef DOCREP_SERVICE_FILE_SERVICE_HPP
#define DOCREP_SERVICE_FILE_SERVICE_HPP

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include "cache/download_cache.hpp"
#include "common/clock.hpp"
#include "config/config.hpp"
#include "replication/replication_queue.hpp"
#include "store/file_record_store.hpp"
#include "store/local_store.hpp"
#include "transfer/transfer_client.hpp"

namespace docrep {
namespace service {

struct UploadRequest {
  std::string original_name;
  std::string context_id;
  store::Priority priority = store::Priority::NORMAL;
  bool keep_local = true;
  // Defaults to whether replication is enabled
  std::optional<bool> replicate;
};

enum class ReadSource {
  LOCAL,
  REMOTE
};

const char* to_string(ReadSource source);

enum class ReadPreference {
  AUTO,
  LOCAL,
  REMOTE
};

struct ReadResult {
  store::FileRecord record;
  // Cached copy of the file contents
  std::filesystem::path path;
  ReadSource source = ReadSource::LOCAL;
  cache::CacheOutcome cache_outcome = cache::CacheOutcome::HIT;
};

struct RemoveOptions {
  bool delete_local = false;
  bool delete_remote = false;
};

// Entry point for uploads, reads and lifecycle operations on stored files
class FileService {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // client may be null when replication is disabled
  FileService(const config::Config& config,
              store::FileRecordStore& records,
              store::LocalStore& local_store,
              replication::ReplicationQueue& queue,
              cache::DownloadCache& cache,
              transfer::TransferClient* client,
              const Clock& clock);


  // ---- WRITE PATH ----
  // Persists the bytes locally and enqueues the record for replication
  store::FileRecord upload(const UploadRequest& request, std::istream& data);
  // Stores new content under the same id, bumping the version
  store::FileRecord replace_content(const std::string& file_id, std::istream& data);


  // ---- READ PATH ----
  // Throws NotFoundError, ServiceUnavailableError or IntegrityError
  ReadResult read(const std::string& file_id, ReadPreference preference = ReadPreference::AUTO);
  // Convenience wrapper returning the bytes
  std::string read_bytes(const std::string& file_id, ReadPreference preference = ReadPreference::AUTO);


  // ---- LIFECYCLE ----
  // Logical delete. Refused while the record is SYNCING.
  store::FileRecord remove(const std::string& file_id, const RemoveOptions& options = {});
  store::FileRecord resync(const std::string& file_id, const replication::ResyncOptions& options = {});
  std::optional<store::FileRecord> find(const std::string& file_id) const;
  store::QueueStatus queue_status() const;

private:
  // ---- PARAMETERS ----
  const config::Config& config_;
  store::FileRecordStore& records_;
  store::LocalStore& local_store_;
  replication::ReplicationQueue& queue_;
  cache::DownloadCache& cache_;
  transfer::TransferClient* client_;
  const Clock& clock_;


  // ---- UTILITY METHODS ----
  void validate_upload(const UploadRequest& request) const;
  ReadSource choose_source(const store::FileRecord& record, ReadPreference preference) const;
  store::FileRecord require_active(const std::string& file_id) const;
  std::string make_remote_path(const store::FileRecord& record) const;
};

} // namespace service
} // namespace docrep

#endif // DOCREP_SERVICE_FILE_SERVICE_HPP
