#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <map>
#include <regex>
#include <thread>
#include "cache/download_cache.hpp"
#include "common/errors.hpp"
#include "replication/replication_queue.hpp"
#include "replication/replication_worker.hpp"
#include "service/file_service.hpp"
#include "store/file_record_store.hpp"
#include "store/local_store.hpp"
#include "test_utils.hpp"

using namespace docrep;
using namespace docrep::service;
using namespace docrep::store;
using namespace std::chrono_literals;
using docrep::test::ManualClock;
using docrep::test::MockTransferClient;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

// Wires the full read/write path against an in-memory replica
class FileServiceTest : public docrep::test::TempDirTest {
protected:
  ManualClock clock;
  config::Config cfg;
  InMemoryFileRecordStore records;
  std::unique_ptr<LocalStore> local_store;
  std::unique_ptr<replication::ReplicationQueue> queue;
  std::unique_ptr<cache::DownloadCache> cache;
  NiceMock<MockTransferClient> client;
  std::unique_ptr<FileService> service;
  std::unique_ptr<replication::ReplicationWorker> worker;

  std::mutex replica_mutex;
  std::map<std::string, std::string> replica;
  std::atomic<int> downloads{0};

  void SetUp() override {
    TempDirTest::SetUp();
    cfg.remote.host = "replica";
    cfg.remote.user = "docrep";
    cfg.remote.module = "files";
    cfg.remote.temp_dir = (test_dir / "temp").string();
    cfg.storage.upload_root = (test_dir / "uploads").string();
    build(&client);

    ON_CALL(client, upload(_, _)).WillByDefault(Invoke([this](const std::string& local, const std::string& key) {
      std::lock_guard<std::mutex> lock(replica_mutex);
      replica[key] = read_file(local);
      return docrep::test::successful_upload(key, replica[key].size());
    }));
    ON_CALL(client, download(_, _)).WillByDefault(Invoke([this](const std::string& key, const std::string& dest) {
      ++downloads;
      std::this_thread::sleep_for(20ms);
      std::string content;
      {
        std::lock_guard<std::mutex> lock(replica_mutex);
        auto it = replica.find(key);
        if (it == replica.end()) {
          throw NotFoundError("remote file " + key);
        }
        content = it->second;
      }
      std::ofstream out(dest, std::ios::binary);
      out << content;
      transfer::TransferResult result;
      result.success = true;
      result.bytes = content.size();
      return result;
    }));
    ON_CALL(client, remove(_)).WillByDefault(Invoke([](const std::string&) {
      transfer::TransferResult result;
      result.success = true;
      return result;
    }));
  }

  void TearDown() override {
    worker.reset();
    service.reset();
    cache.reset();
    TempDirTest::TearDown();
  }

  void build(transfer::TransferClient* transfer_client) {
    worker.reset();
    service.reset();
    local_store = std::make_unique<LocalStore>(cfg.storage.upload_root, clock);
    queue = std::make_unique<replication::ReplicationQueue>(records, clock, cfg.replication);
    cache = std::make_unique<cache::DownloadCache>(cfg.cache_directory(), clock, cfg.cache.ttl,
                                                   cfg.cache.lock_wait_timeout);
    service = std::make_unique<FileService>(cfg, records, *local_store, *queue, *cache, transfer_client, clock);
    if (transfer_client) {
      worker = std::make_unique<replication::ReplicationWorker>(*queue, *transfer_client);
    }
  }

  FileRecord upload(const std::string& name, const std::string& content, bool keep_local = true,
                    const std::string& context = "contract-42") {
    UploadRequest request;
    request.original_name = name;
    request.context_id = context;
    request.keep_local = keep_local;
    std::istringstream data(content);
    return service->upload(request, data);
  }

  void fail_uploads() {
    ON_CALL(client, upload(_, _)).WillByDefault(Invoke([](const std::string&, const std::string&) -> transfer::TransferResult {
      throw TransferError(TransferErrorCode::CONNECTION, "replica unreachable");
    }));
  }

  std::size_t files_in_upload_root() const {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(cfg.storage.upload_root)) {
      (void)entry;
      ++count;
    }
    return count;
  }
};

//==============================================
// UPLOAD
//==============================================

TEST_F(FileServiceTest, UploadCreatesPendingRecord) {
  FileRecord record = upload("Contract.pdf", "pdf bytes");

  EXPECT_FALSE(record.file_id.empty());
  EXPECT_EQ(record.version, 1u);
  EXPECT_EQ(record.original_name, "Contract.pdf");
  EXPECT_EQ(record.sync_status, SyncStatus::PENDING);
  EXPECT_EQ(record.storage_provider, StorageProvider::LOCAL);
  EXPECT_TRUE(record.replicate);
  EXPECT_EQ(record.size, 9u);
  EXPECT_EQ(record.checksum, crypto::sha256_hex("pdf bytes"));
  EXPECT_TRUE(std::filesystem::exists(record.local_path));
  EXPECT_EQ(record.system_name.rfind("ctx_tract_42_", 0), 0u) << record.system_name;
  EXPECT_TRUE(std::regex_match(record.remote_path,
                               std::regex(R"(contract-42/\d{4}/\d{2}/ctx_tract_42_\d+_[a-z0-9]{6}\.pdf)")))
    << record.remote_path;
  EXPECT_EQ(service->queue_status().pending, 1u);
}

TEST_F(FileServiceTest, UploadWithoutContextUsesGeneralFolder) {
  FileRecord record = upload("a.txt", "x", true, "");
  EXPECT_EQ(record.remote_path.rfind("general/", 0), 0u);
}

TEST_F(FileServiceTest, UploadValidation) {
  EXPECT_THROW(upload("virus.exe", "x"), ValidationError);
  EXPECT_THROW(upload("", "x"), ValidationError);
  EXPECT_THROW(upload("empty.pdf", ""), ValidationError);

  cfg.storage.max_file_size = 4;
  EXPECT_THROW(upload("big.pdf", "12345"), ValidationError);

  EXPECT_THROW(upload("a.pdf", "hello", true, ".."), ValidationError);
  EXPECT_THROW(upload("a.pdf", "hello", true, "contracts/../etc"), ValidationError);
  EXPECT_THROW(upload("a.pdf", "hello", true, "dept\\42"), ValidationError);

  EXPECT_EQ(files_in_upload_root(), 0u);
  EXPECT_TRUE(records.list().empty());
}

//==============================================
// READ PATH
//==============================================

TEST_F(FileServiceTest, ReadImmediatelyAfterUploadIsLocal) {
  FileRecord record = upload("a.pdf", "fresh upload");
  EXPECT_CALL(client, download(_, _)).Times(0);

  ReadResult result = service->read(record.file_id);
  EXPECT_EQ(result.source, ReadSource::LOCAL);
  EXPECT_EQ(result.cache_outcome, cache::CacheOutcome::FETCHED);
  EXPECT_EQ(read_file(result.path), "fresh upload");
  EXPECT_EQ(service->read_bytes(record.file_id), "fresh upload");
}

TEST_F(FileServiceTest, SyncedRemoteOnlyFileIsDownloadedOnce) {
  FileRecord record = upload("a.pdf", "replicated", false);
  worker->process_batch();
  ASSERT_EQ(records.find(record.file_id)->sync_status, SyncStatus::SYNCED);
  EXPECT_CALL(client, download(record.remote_path, _)).Times(1);

  ReadResult first = service->read(record.file_id);
  EXPECT_EQ(first.source, ReadSource::REMOTE);
  EXPECT_EQ(first.cache_outcome, cache::CacheOutcome::FETCHED);
  EXPECT_EQ(crypto::sha256_file(first.path), record.checksum);

  ReadResult second = service->read(record.file_id);
  EXPECT_EQ(second.cache_outcome, cache::CacheOutcome::HIT);
  EXPECT_EQ(second.source, ReadSource::REMOTE);
  EXPECT_EQ(read_file(second.path), "replicated");
}

TEST_F(FileServiceTest, RemotePreferenceForSyncedFile) {
  FileRecord record = upload("a.pdf", "both copies");
  worker->process_batch();

  ReadResult result = service->read(record.file_id, ReadPreference::REMOTE);
  EXPECT_EQ(result.source, ReadSource::REMOTE);
  EXPECT_EQ(downloads.load(), 1);
}

TEST_F(FileServiceTest, ConcurrentColdReadersShareOneDownload) {
  FileRecord record = upload("a.pdf", "popular document", false);
  worker->process_batch();

  constexpr int kReaders = 6;
  std::vector<std::string> contents(kReaders);
  std::vector<std::thread> threads;
  for (int i = 0; i < kReaders; ++i) {
    threads.emplace_back([this, i, &contents, &record]() {
      contents[i] = service->read_bytes(record.file_id);
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(downloads.load(), 1);
  for (const auto& content : contents) {
    EXPECT_EQ(content, "popular document");
  }
}

TEST_F(FileServiceTest, ChecksumMismatchIsRejected) {
  FileRecord record = upload("a.pdf", "original", false);
  worker->process_batch();
  {
    std::lock_guard<std::mutex> lock(replica_mutex);
    replica[record.remote_path] = "tampered";
  }

  EXPECT_THROW(service->read(record.file_id), IntegrityError);
  EXPECT_EQ(cache->size(), 0u);
}

TEST_F(FileServiceTest, FailedReplicationWithLocalCopyIsServed) {
  fail_uploads();
  FileRecord record = upload("a.pdf", "still local");
  for (int i = 0; i < cfg.replication.max_retries; ++i) {
    worker->process_batch();
    clock.advance(1min);
  }
  ASSERT_EQ(records.find(record.file_id)->sync_status, SyncStatus::FAILED);

  EXPECT_EQ(service->read_bytes(record.file_id), "still local");
}

TEST_F(FileServiceTest, FailedReplicationWithoutLocalCopyIsUnavailable) {
  fail_uploads();
  FileRecord record = upload("a.pdf", "lost", false);
  EXPECT_THROW(service->read(record.file_id), ServiceUnavailableError);

  for (int i = 0; i < cfg.replication.max_retries; ++i) {
    worker->process_batch();
    clock.advance(1min);
  }
  EXPECT_THROW(service->read(record.file_id), ServiceUnavailableError);
}

TEST_F(FileServiceTest, UnknownFileIsNotFound) {
  EXPECT_THROW(service->read("nope"), NotFoundError);
}

//==============================================
// LIFECYCLE
//==============================================

TEST_F(FileServiceTest, RemoveIsLogical) {
  FileRecord record = upload("a.pdf", "to delete");
  service->read(record.file_id);

  service->remove(record.file_id);

  EXPECT_FALSE(service->find(record.file_id).has_value());
  EXPECT_THROW(service->read(record.file_id), NotFoundError);
  EXPECT_TRUE(std::filesystem::exists(record.local_path));
  EXPECT_EQ(cache->size(), 0u);
  EXPECT_EQ(service->queue_status().total, 0u);
}

TEST_F(FileServiceTest, RemoveWithCopies) {
  FileRecord record = upload("a.pdf", "gone");
  worker->process_batch();
  EXPECT_CALL(client, remove(record.remote_path)).Times(1);

  RemoveOptions options;
  options.delete_local = true;
  options.delete_remote = true;
  service->remove(record.file_id, options);

  EXPECT_FALSE(std::filesystem::exists(record.local_path));
}

TEST_F(FileServiceTest, RemoteDeleteFailureKeepsLogicalDelete) {
  FileRecord record = upload("a.pdf", "gone");
  worker->process_batch();
  ON_CALL(client, remove(_)).WillByDefault(Invoke([](const std::string&) -> transfer::TransferResult {
    throw TransferError(TransferErrorCode::CONNECTION, "down");
  }));

  RemoveOptions options;
  options.delete_remote = true;
  EXPECT_NO_THROW(service->remove(record.file_id, options));
  EXPECT_FALSE(service->find(record.file_id).has_value());
}

TEST_F(FileServiceTest, RemoveRefusedWhileSyncing) {
  FileRecord record = upload("a.pdf", "busy");
  queue->claim_batch();
  EXPECT_THROW(service->remove(record.file_id), ValidationError);
  EXPECT_TRUE(service->find(record.file_id).has_value());
}

TEST_F(FileServiceTest, ReplaceContentBumpsVersion) {
  FileRecord record = upload("a.pdf", "first");
  worker->process_batch();
  EXPECT_EQ(service->read_bytes(record.file_id), "first");

  std::istringstream update("second");
  FileRecord replaced = service->replace_content(record.file_id, update);

  EXPECT_EQ(replaced.version, 2u);
  EXPECT_EQ(replaced.sync_status, SyncStatus::PENDING);
  EXPECT_EQ(replaced.sync_retries, 0);
  EXPECT_EQ(replaced.remote_path, record.remote_path);
  EXPECT_EQ(replaced.checksum, crypto::sha256_hex("second"));
  EXPECT_FALSE(std::filesystem::exists(record.local_path));
  EXPECT_EQ(service->read_bytes(record.file_id), "second");
}

TEST_F(FileServiceTest, ResyncThroughService) {
  FileRecord record = upload("a.pdf", "again");
  worker->process_batch();

  replication::ResyncOptions options;
  options.priority = Priority::HIGH;
  FileRecord queued = service->resync(record.file_id, options);
  EXPECT_EQ(queued.sync_status, SyncStatus::PENDING);
  EXPECT_EQ(queued.priority, Priority::HIGH);
}

TEST_F(FileServiceTest, ReplicationDisabled) {
  cfg.replication.enabled = false;
  build(nullptr);

  FileRecord record = upload("a.pdf", "local only");
  EXPECT_FALSE(record.replicate);
  EXPECT_EQ(service->queue_status().total, 0u);
  EXPECT_EQ(service->read_bytes(record.file_id), "local only");
  EXPECT_THROW(service->resync(record.file_id), ServiceUnavailableError);
}

TEST_F(FileServiceTest, ClientRequiredWhenReplicationEnabled) {
  EXPECT_THROW(FileService(cfg, records, *local_store, *queue, *cache, nullptr, clock), ConfigError);
}
