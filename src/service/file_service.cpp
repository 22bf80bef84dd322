#include "service/file_service.hpp"
#include "common/errors.hpp"
#include "crypto/digest.hpp"
#include "transfer/command_builder.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace docrep {
namespace service {

using store::FileRecord;
using store::SyncStatus;

namespace {

std::string extension_of(const std::string& name) {
  auto dot = name.find_last_of('.');
  if (dot == std::string::npos || dot + 1 == name.size()) {
    return "";
  }
  std::string ext = name.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

// "<yyyy>/<mm>" of the given time, in UTC
std::string year_month(TimePoint tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::setw(4) << std::setfill('0') << (tm.tm_year + 1900) << "/"
      << std::setw(2) << std::setfill('0') << (tm.tm_mon + 1);
  return out.str();
}

} // namespace

const char* to_string(ReadSource source) {
  switch (source) {
    case ReadSource::LOCAL: return "local";
    case ReadSource::REMOTE: return "remote";
    default: return "unknown";
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileService::FileService(const config::Config& config,
                         store::FileRecordStore& records,
                         store::LocalStore& local_store,
                         replication::ReplicationQueue& queue,
                         cache::DownloadCache& cache,
                         transfer::TransferClient* client,
                         const Clock& clock)
  : config_(config)
  , records_(records)
  , local_store_(local_store)
  , queue_(queue)
  , cache_(cache)
  , client_(client)
  , clock_(clock) {
  if (config_.replication.enabled && client_ == nullptr) {
    throw ConfigError("replication is enabled but no transfer client was supplied");
  }
  BOOST_LOG_TRIVIAL(info) << "File service: Initialized (replication "
                          << (config_.replication.enabled ? "enabled" : "disabled") << ")";
}


//==============================================
// WRITE PATH
//==============================================

FileRecord FileService::upload(const UploadRequest& request, std::istream& data) {
  validate_upload(request);

  const std::string system_name = local_store_.generate_system_name(request.original_name, request.context_id);
  store::SavedFile saved = local_store_.save(system_name, data);

  if (saved.size > config_.storage.max_file_size) {
    local_store_.remove(saved.path);
    throw ValidationError("file exceeds the maximum size of " + std::to_string(config_.storage.max_file_size) +
                          " bytes");
  }
  if (saved.size == 0) {
    local_store_.remove(saved.path);
    throw ValidationError("file is empty");
  }

  FileRecord record;
  record.file_id = crypto::random_token(20);
  record.version = 1;
  record.original_name = request.original_name;
  record.system_name = system_name;
  record.context_id = request.context_id;
  record.checksum = saved.checksum;
  record.size = saved.size;
  record.local_path = saved.path.string();
  record.storage_provider = store::StorageProvider::LOCAL;
  record.keep_local = request.keep_local;
  record.replicate = request.replicate.value_or(config_.replication.enabled) && config_.replication.enabled;
  record.priority = request.priority;
  record.created_at = clock_.now();

  try {
    record.remote_path = make_remote_path(record);
    if (record.replicate) {
      queue_.enqueue(record);
    } else {
      records_.insert(record);
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "File service: Failed to register " << system_name << ": " << e.what();
    local_store_.remove(saved.path);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "File service: Uploaded " << request.original_name << " as " << record.file_id
                          << " (" << record.size << " bytes)";
  return require_active(record.file_id);
}

FileRecord FileService::replace_content(const std::string& file_id, std::istream& data) {
  FileRecord current = require_active(file_id);
  if (current.sync_status == SyncStatus::SYNCING) {
    throw ValidationError("file " + file_id + " is currently being synchronized");
  }

  const std::string system_name = local_store_.generate_system_name(current.original_name, current.context_id);
  store::SavedFile saved = local_store_.save(system_name, data);
  if (saved.size == 0 || saved.size > config_.storage.max_file_size) {
    local_store_.remove(saved.path);
    throw ValidationError("replacement content must be between 1 and " +
                          std::to_string(config_.storage.max_file_size) + " bytes");
  }

  const std::string old_path = current.local_path;
  const uint64_t old_version = current.version;
  bool updated = records_.update_if(file_id, current.sync_status, [&saved, &system_name](FileRecord& record) {
    record.version += 1;
    record.system_name = system_name;
    record.local_path = saved.path.string();
    record.checksum = saved.checksum;
    record.size = saved.size;
    record.storage_provider = store::StorageProvider::LOCAL;
    if (record.replicate) {
      record.sync_status = SyncStatus::PENDING;
      record.sync_retries = 0;
      record.sync_error.clear();
      record.next_attempt_at.reset();
    }
  });
  if (!updated) {
    local_store_.remove(saved.path);
    throw ValidationError("file " + file_id + " changed state concurrently");
  }

  cache_.invalidate(file_id, old_version);
  if (old_path != saved.path.string()) {
    local_store_.remove(old_path);
  }

  FileRecord record = require_active(file_id);
  BOOST_LOG_TRIVIAL(info) << "File service: Replaced content of " << file_id << ", now version " << record.version;
  return record;
}


//==============================================
// READ PATH
//==============================================

ReadResult FileService::read(const std::string& file_id, ReadPreference preference) {
  FileRecord record = require_active(file_id);
  const ReadSource source = choose_source(record, preference);

  cache::Fetcher fetcher = [this, &record, source](const std::filesystem::path& destination) {
    if (source == ReadSource::LOCAL) {
      local_store_.copy_to(record.local_path, destination);
    } else {
      client_->download(record.remote_path, destination.string());
    }
    const std::string checksum = crypto::sha256_file(destination);
    if (!record.checksum.empty() && checksum != record.checksum) {
      BOOST_LOG_TRIVIAL(error) << "File service: Checksum mismatch for " << record.file_id << " from "
                               << to_string(source);
      throw IntegrityError("checksum mismatch for " + record.file_id);
    }
  };

  cache::CacheLookup lookup = cache_.get_or_fetch(record.file_id, record.version, to_string(source), fetcher);

  ReadResult result;
  result.record = record;
  result.path = lookup.entry.path;
  // A cache hit reports where the cached bytes originally came from
  if (lookup.entry.origin == to_string(ReadSource::REMOTE)) {
    result.source = ReadSource::REMOTE;
  } else if (lookup.entry.origin == to_string(ReadSource::LOCAL)) {
    result.source = ReadSource::LOCAL;
  } else {
    result.source = source;
  }
  result.cache_outcome = lookup.outcome;

  BOOST_LOG_TRIVIAL(info) << "File service: Read " << file_id << " v" << record.version << " ("
                          << cache::to_string(lookup.outcome) << ", " << to_string(result.source) << ")";
  return result;
}

std::string FileService::read_bytes(const std::string& file_id, ReadPreference preference) {
  ReadResult result = read(file_id, preference);
  std::ifstream in(result.path, std::ios::binary);
  if (!in) {
    throw StoreError("File service: cannot open cached copy " + result.path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

ReadSource FileService::choose_source(const FileRecord& record, ReadPreference preference) const {
  const bool synced = record.sync_status == SyncStatus::SYNCED;
  const bool local_present = !record.local_path.empty() && local_store_.has(record.local_path);

  if (!record.replicate || client_ == nullptr) {
    if (!local_present) {
      throw NotFoundError("local copy of " + record.file_id);
    }
    return ReadSource::LOCAL;
  }

  // Without a local copy only a synchronized replica can serve the read
  if (!record.keep_local && !synced) {
    throw ServiceUnavailableError("file " + record.file_id + " is " + store::to_string(record.sync_status) +
                                  " and has no local copy to serve");
  }

  switch (preference) {
    case ReadPreference::LOCAL:
      if (local_present) return ReadSource::LOCAL;
      break;
    case ReadPreference::REMOTE:
      if (synced) return ReadSource::REMOTE;
      break;
    case ReadPreference::AUTO:
      break;
  }

  if ((record.storage_provider == store::StorageProvider::LOCAL || record.keep_local) && local_present) {
    return ReadSource::LOCAL;
  }
  if (synced) {
    return ReadSource::REMOTE;
  }
  if (local_present) {
    return ReadSource::LOCAL;
  }
  throw ServiceUnavailableError("no readable copy of " + record.file_id);
}


//==============================================
// LIFECYCLE
//==============================================

FileRecord FileService::remove(const std::string& file_id, const RemoveOptions& options) {
  FileRecord current = require_active(file_id);
  if (current.sync_status == SyncStatus::SYNCING) {
    throw ValidationError("file " + file_id + " is currently being synchronized");
  }

  bool updated = records_.update_if(file_id, current.sync_status, [](FileRecord& record) {
    record.active = false;
  });
  if (!updated) {
    throw ValidationError("file " + file_id + " changed state concurrently");
  }
  cache_.invalidate(file_id, current.version);

  if (options.delete_local && !current.local_path.empty()) {
    local_store_.remove(current.local_path);
  }

  if (options.delete_remote && current.sync_status == SyncStatus::SYNCED && client_ != nullptr) {
    try {
      transfer::TransferResult result = client_->remove(current.remote_path);
      if (result.warning) {
        BOOST_LOG_TRIVIAL(warning) << "File service: Remote delete of " << file_id << ": " << result.warning_message;
      }
    } catch (const std::exception& e) {
      // The logical delete stands, the remote copy becomes an orphan
      BOOST_LOG_TRIVIAL(error) << "File service: Remote delete of " << file_id << " failed: " << e.what();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "File service: Removed " << file_id;
  auto record = records_.find(file_id);
  return record ? *record : current;
}

FileRecord FileService::resync(const std::string& file_id, const replication::ResyncOptions& options) {
  if (!config_.replication.enabled) {
    throw ServiceUnavailableError("replication is disabled");
  }
  return queue_.request_resync(file_id, options);
}

std::optional<FileRecord> FileService::find(const std::string& file_id) const {
  auto record = records_.find(file_id);
  if (!record || !record->active) {
    return std::nullopt;
  }
  return record;
}

store::QueueStatus FileService::queue_status() const {
  return queue_.status();
}


//==============================================
// UTILITY METHODS
//==============================================

void FileService::validate_upload(const UploadRequest& request) const {
  if (request.original_name.empty()) {
    throw ValidationError("original file name is required");
  }
  const std::string ext = extension_of(request.original_name);
  const auto& allowed = config_.storage.allowed_types;
  if (!allowed.empty() && std::find(allowed.begin(), allowed.end(), ext) == allowed.end()) {
    throw ValidationError("file type '" + ext + "' is not allowed");
  }

  // The context id becomes a single remote directory name
  const std::string& context = request.context_id;
  if (context == "." || context == ".." || context.find_first_of("/\\") != std::string::npos) {
    throw ValidationError("context id '" + context + "' is not a valid directory name");
  }
}

FileRecord FileService::require_active(const std::string& file_id) const {
  auto record = records_.find(file_id);
  if (!record || !record->active) {
    throw NotFoundError("file " + file_id);
  }
  return *record;
}

std::string FileService::make_remote_path(const FileRecord& record) const {
  const std::string context = record.context_id.empty() ? "general" : record.context_id;
  return transfer::TransferCommandBuilder::join_remote_path({context, year_month(record.created_at),
                                                             record.system_name});
}

} // namespace service
} // namespace docrep
