#include <gtest/gtest.h>
#include <regex>
#include <set>
#include <sstream>
#include <thread>
#include "common/errors.hpp"
#include "crypto/digest.hpp"
#include "store/local_store.hpp"
#include "test_utils.hpp"

using namespace docrep;
using namespace docrep::store;

class LocalStoreTest : public docrep::test::TempDirTest {
protected:
  docrep::test::ManualClock clock;
  std::unique_ptr<LocalStore> store;

  void SetUp() override {
    TempDirTest::SetUp();
    store = std::make_unique<LocalStore>((test_dir / "uploads").string(), clock);
    ASSERT_NE(store, nullptr);
  }

  // Helper methods to reduce repetition
  SavedFile save_and_verify(const std::string& name, const std::string& data) {
    std::istringstream input(data);
    SavedFile saved;
    EXPECT_NO_THROW(saved = store->save(name, input)) << "Failed to save: " << name;
    EXPECT_TRUE(store->has(saved.path)) << "File should exist after saving: " << name;

    std::stringstream output;
    EXPECT_NO_THROW(store->read(saved.path, output)) << "Failed to read: " << name;
    EXPECT_EQ(output.str(), data) << "Data mismatch for: " << name;
    return saved;
  }
};

TEST_F(LocalStoreTest, CreatesUploadRoot) {
  EXPECT_TRUE(std::filesystem::is_directory(test_dir / "uploads"));
  EXPECT_EQ(store->root(), test_dir / "uploads");
}

TEST_F(LocalStoreTest, BasicOperations) {
  SavedFile saved = save_and_verify("a.pdf", "Hello, Store!");
  EXPECT_EQ(saved.size, 13u);
  EXPECT_EQ(saved.checksum, crypto::sha256_hex("Hello, Store!"));
  EXPECT_EQ(store->get_file_size(saved.path), 13u);
  EXPECT_EQ(saved.path, test_dir / "uploads" / "a.pdf");
}

TEST_F(LocalStoreTest, LargeFileAndOverwrite) {
  const std::string large(1024 * 1024, 'X');
  save_and_verify("big.bin", large);
  SavedFile updated = save_and_verify("big.bin", "Updated content");
  EXPECT_EQ(store->get_file_size(updated.path), 15u);
}

TEST_F(LocalStoreTest, NoTemporaryFilesRemain) {
  save_and_verify("a.pdf", "data");
  for (const auto& entry : std::filesystem::directory_iterator(store->root())) {
    EXPECT_EQ(entry.path().filename().string().find(".part-"), std::string::npos);
  }
}

TEST_F(LocalStoreTest, ErrorHandling) {
  std::stringstream bad_stream;
  bad_stream.setstate(std::ios::badbit);
  EXPECT_THROW(store->save("bad.pdf", bad_stream), StoreError);

  std::stringstream output;
  EXPECT_THROW(store->read(store->root() / "missing.pdf", output), NotFoundError);
  EXPECT_THROW(store->get_file_size(store->root() / "missing.pdf"), NotFoundError);
  EXPECT_THROW(store->copy_to(store->root() / "missing.pdf", test_dir / "x"), NotFoundError);
}

TEST_F(LocalStoreTest, RejectsUnsafeNames) {
  for (const std::string name : {"", ".", "..", "../escape.pdf", "dir/a.pdf", "dir\\a.pdf"}) {
    std::istringstream input("x");
    EXPECT_THROW(store->save(name, input), ValidationError) << name;
  }
}

TEST_F(LocalStoreTest, CopyAndRemove) {
  SavedFile saved = save_and_verify("a.pdf", "content");
  store->copy_to(saved.path, test_dir / "copy.pdf");
  EXPECT_EQ(read_file(test_dir / "copy.pdf"), "content");

  store->remove(saved.path);
  EXPECT_FALSE(store->has(saved.path));
  EXPECT_NO_THROW(store->remove(saved.path));
}

TEST_F(LocalStoreTest, SystemNames) {
  const std::string plain = store->generate_system_name("Contract Final.PDF");
  EXPECT_TRUE(std::regex_match(plain, std::regex(R"(\d+_[a-z0-9]{6}\.pdf)"))) << plain;
  EXPECT_EQ(plain.rfind(std::to_string(to_epoch_ms(clock.now())) + "_", 0), 0u);

  const std::string with_context = store->generate_system_name("a.docx", "contract-0012345678");
  EXPECT_TRUE(std::regex_match(with_context, std::regex(R"(ctx_12345678_\d+_[a-z0-9]{6}\.docx)"))) << with_context;

  const std::string no_extension = store->generate_system_name("README");
  EXPECT_TRUE(std::regex_match(no_extension, std::regex(R"(\d+_[a-z0-9]{6})"))) << no_extension;

  const std::string odd_context = store->generate_system_name("a.pdf", "x/y");
  EXPECT_EQ(odd_context.rfind("ctx_x_y_", 0), 0u);
}

TEST_F(LocalStoreTest, ConcurrentSaves) {
  const size_t num_threads = 5;
  std::vector<std::thread> threads;
  std::vector<std::string> names(num_threads);

  for (size_t i = 0; i < num_threads; ++i) {
    names[i] = store->generate_system_name("f" + std::to_string(i) + ".txt");
  }
  std::set<std::string> unique(names.begin(), names.end());
  ASSERT_EQ(unique.size(), num_threads);

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, &names]() {
      std::istringstream input("data " + std::to_string(i));
      store->save(names[i], input);
    });
  }
  for (auto& t : threads) t.join();

  for (size_t i = 0; i < num_threads; ++i) {
    std::stringstream output;
    store->read(store->root() / names[i], output);
    EXPECT_EQ(output.str(), "data " + std::to_string(i));
  }
}
