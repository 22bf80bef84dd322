#include <gtest/gtest.h>
#include <sys/stat.h>
#include "common/errors.hpp"
#include "test_utils.hpp"
#include "transfer/credential_file.hpp"
#include "transfer/transfer_client.hpp"

using namespace docrep;
using namespace docrep::transfer;
using docrep::test::FakeProcessRunner;

class TransferClientTest : public docrep::test::TempDirTest {
protected:
  config::RemoteConfig cfg;
  std::shared_ptr<FakeProcessRunner> runner;
  std::unique_ptr<RsyncTransferClient> client;

  void SetUp() override {
    TempDirTest::SetUp();
    cfg.host = "replica";
    cfg.user = "docrep";
    cfg.module = "files";
    cfg.temp_dir = (test_dir / "temp").string();
    runner = std::make_shared<FakeProcessRunner>();
    make_client();
  }

  void make_client() {
    client = std::make_unique<RsyncTransferClient>(cfg, runner);
  }

  static bool has_arg_prefix(const std::vector<std::string>& argv, const std::string& prefix) {
    for (const auto& arg : argv) {
      if (arg.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
  }

  // Simulates rsync writing the downloaded bytes into the destination argument
  void serve_download(const std::string& content) {
    runner->set_handler([content](const ProcessRequest& request) {
      std::ofstream out(request.argv.back(), std::ios::binary);
      out << content;
      return FakeProcessRunner::exit_with(0);
    });
  }
};

//==============================================
// UPLOAD
//==============================================

TEST_F(TransferClientTest, UploadSucceeds) {
  auto local = write_file("a.pdf", "document body");

  TransferResult result = client->upload(local.string(), "ctx/a.pdf");

  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.warning);
  EXPECT_EQ(result.bytes, 13u);
  EXPECT_EQ(result.remote_url, "rsync://docrep@replica:873/files/expediente-digital/ctx/a.pdf");
  ASSERT_EQ(runner->call_count(), 1u);
  auto request = runner->requests().front();
  EXPECT_EQ(request.argv[request.argv.size() - 2], local.string());
  EXPECT_EQ(request.timeout, cfg.transfer_timeout);
}

TEST_F(TransferClientTest, UploadRejectsMissingSource) {
  EXPECT_THROW(client->upload((test_dir / "missing.pdf").string(), "x.pdf"), ValidationError);
  EXPECT_THROW(client->upload(test_dir.string(), "x.pdf"), ValidationError);
  EXPECT_EQ(runner->call_count(), 0u);
}

TEST_F(TransferClientTest, UploadFailureMapsExitCode) {
  auto local = write_file("a.pdf", "x");
  runner->set_handler([](const ProcessRequest&) {
    return FakeProcessRunner::exit_with(10, "rsync: failed to connect to replica: Connection refused");
  });

  try {
    client->upload(local.string(), "a.pdf");
    FAIL() << "Expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.code(), TransferErrorCode::CONNECTION);
    EXPECT_EQ(e.exit_code(), 10);
    EXPECT_NE(e.stderr_excerpt().find("Connection refused"), std::string::npos);
  }
}

TEST_F(TransferClientTest, UploadTimeout) {
  auto local = write_file("a.pdf", "x");
  runner->set_handler([](const ProcessRequest&) {
    ProcessResult result;
    result.timed_out = true;
    result.exit_code = 128 + 15;
    return result;
  });

  try {
    client->upload(local.string(), "a.pdf");
    FAIL() << "Expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.code(), TransferErrorCode::TIMEOUT);
  }
}

TEST_F(TransferClientTest, UploadSpawnFailure) {
  auto local = write_file("a.pdf", "x");
  runner->set_handler([](const ProcessRequest&) {
    ProcessResult result;
    result.spawn_failed = true;
    result.exit_code = 127;
    result.stderr_text = "exec failed: No such file or directory";
    return result;
  });

  try {
    client->upload(local.string(), "a.pdf");
    FAIL() << "Expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.code(), TransferErrorCode::SPAWN_FAILED);
  }
}

TEST_F(TransferClientTest, StderrExcerptIsBounded) {
  auto local = write_file("a.pdf", "x");
  runner->set_handler([](const ProcessRequest&) {
    return FakeProcessRunner::exit_with(11, std::string(10000, 'e') + "tail");
  });

  try {
    client->upload(local.string(), "a.pdf");
    FAIL() << "Expected TransferError";
  } catch (const TransferError& e) {
    EXPECT_EQ(e.code(), TransferErrorCode::IO);
    EXPECT_LE(e.stderr_excerpt().size(), 512u);
    EXPECT_EQ(e.stderr_excerpt().substr(e.stderr_excerpt().size() - 4), "tail");
  }
}

//==============================================
// CREDENTIALS
//==============================================

TEST_F(TransferClientTest, InlineSecretUsesTemporaryPasswordFile) {
  cfg.password = "s3cret";
  make_client();
  auto local = write_file("a.pdf", "x");

  std::string seen_path;
  std::string seen_content;
  mode_t seen_mode = 0;
  runner->set_handler([&](const ProcessRequest& request) {
    for (const auto& arg : request.argv) {
      if (arg.rfind("--password-file=", 0) == 0) {
        seen_path = arg.substr(std::string("--password-file=").size());
      }
    }
    struct stat st{};
    if (::stat(seen_path.c_str(), &st) == 0) {
      seen_mode = st.st_mode & 0777;
    }
    seen_content = read_file(seen_path);
    return FakeProcessRunner::exit_with(0);
  });

  client->upload(local.string(), "a.pdf");

  ASSERT_FALSE(seen_path.empty());
  EXPECT_EQ(seen_content, "s3cret\n");
  EXPECT_EQ(seen_mode, 0600u);
  EXPECT_NE(std::filesystem::path(seen_path).filename().string().find("rsync_pwd_"), std::string::npos);
  EXPECT_FALSE(std::filesystem::exists(seen_path));
  EXPECT_EQ(CredentialFile::live_count(), 0u);
  EXPECT_TRUE(runner->requests().front().env.empty());
}

TEST_F(TransferClientTest, PasswordFileRemovedOnFailure) {
  cfg.password = "s3cret";
  make_client();
  auto local = write_file("a.pdf", "x");
  runner->set_handler([](const ProcessRequest&) { return FakeProcessRunner::exit_with(5, "auth failed"); });

  EXPECT_THROW(client->upload(local.string(), "a.pdf"), TransferError);
  EXPECT_EQ(CredentialFile::live_count(), 0u);
  for (const auto& entry : std::filesystem::directory_iterator(cfg.temp_dir)) {
    EXPECT_EQ(entry.path().filename().string().find("rsync_pwd_"), std::string::npos);
  }
}

TEST_F(TransferClientTest, InlineSecretViaEnvironment) {
  cfg.password = "s3cret";
  cfg.use_password_file = false;
  make_client();
  auto local = write_file("a.pdf", "x");

  client->upload(local.string(), "a.pdf");

  auto request = runner->requests().front();
  EXPECT_FALSE(has_arg_prefix(request.argv, "--password-file="));
  ASSERT_EQ(request.env.size(), 1u);
  EXPECT_EQ(request.env[0].first, "RSYNC_PASSWORD");
  EXPECT_EQ(request.env[0].second, "s3cret");
  for (const auto& arg : request.argv) {
    EXPECT_EQ(arg.find("s3cret"), std::string::npos);
  }
}

TEST_F(TransferClientTest, PreSharedPasswordFile) {
  cfg.password = "ignored";
  cfg.password_file = "/etc/rsync.secret";
  make_client();
  auto local = write_file("a.pdf", "x");

  client->upload(local.string(), "a.pdf");

  auto request = runner->requests().front();
  EXPECT_TRUE(has_arg_prefix(request.argv, "--password-file=/etc/rsync.secret"));
  EXPECT_TRUE(request.env.empty());
}

//==============================================
// DOWNLOAD
//==============================================

TEST_F(TransferClientTest, DownloadWritesThroughPartialFile) {
  serve_download("remote bytes");
  auto destination = test_dir / "out" / "b.pdf";

  TransferResult result = client->download("ctx/b.pdf", destination.string());

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.bytes, 12u);
  EXPECT_EQ(read_file(destination), "remote bytes");
  auto request = runner->requests().front();
  EXPECT_NE(request.argv.back().find("b.pdf.part-"), std::string::npos);
  EXPECT_EQ(request.argv[request.argv.size() - 2],
            "rsync://docrep@replica:873/files/expediente-digital/ctx/b.pdf");
  for (const auto& entry : std::filesystem::directory_iterator(destination.parent_path())) {
    EXPECT_EQ(entry.path().filename().string().find(".part-"), std::string::npos);
  }
}

TEST_F(TransferClientTest, DownloadFailureRemovesPartialFile) {
  runner->set_handler([](const ProcessRequest& request) {
    std::ofstream out(request.argv.back(), std::ios::binary);
    out << "half";
    return FakeProcessRunner::exit_with(12, "connection unexpectedly closed");
  });
  auto destination = test_dir / "b.pdf";

  EXPECT_THROW(client->download("b.pdf", destination.string()), TransferError);
  EXPECT_FALSE(std::filesystem::exists(destination));
  for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
    EXPECT_EQ(entry.path().filename().string().find(".part-"), std::string::npos);
  }
}

TEST_F(TransferClientTest, DownloadOfMissingRemoteFile) {
  runner->set_handler([](const ProcessRequest&) {
    return FakeProcessRunner::exit_with(23, "rsync: link_stat \"/b.pdf\" (in files) failed: No such file or directory (2)");
  });
  EXPECT_THROW(client->download("b.pdf", (test_dir / "b.pdf").string()), NotFoundError);
}

TEST_F(TransferClientTest, DownloadWithoutOutputFails) {
  EXPECT_THROW(client->download("b.pdf", (test_dir / "b.pdf").string()), TransferError);
}

//==============================================
// DELETE
//==============================================

TEST_F(TransferClientTest, DeleteSucceeds) {
  TransferResult result = client->remove("ctx/a.pdf");

  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.warning);
  auto request = runner->requests().front();
  EXPECT_EQ(request.timeout, cfg.delete_timeout);
  EXPECT_EQ(request.argv.back(), "rsync://docrep@replica:873/files/expediente-digital/ctx/");
  // The scratch directory is gone afterwards
  EXPECT_FALSE(std::filesystem::exists(request.argv[request.argv.size() - 2]));
}

TEST_F(TransferClientTest, DeleteAcceptsPartialTransferCodes) {
  for (int code : {23, 24}) {
    runner->set_handler([code](const ProcessRequest&) { return FakeProcessRunner::exit_with(code); });
    TransferResult result = client->remove("a.pdf");
    EXPECT_TRUE(result.success) << "exit code " << code;
    EXPECT_TRUE(result.warning) << "exit code " << code;
  }
}

TEST_F(TransferClientTest, DeleteAcceptsMissingFileMessage) {
  runner->set_handler([](const ProcessRequest&) {
    return FakeProcessRunner::exit_with(5, "ERROR: file not found");
  });
  TransferResult result = client->remove("a.pdf");
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.warning);
}

TEST_F(TransferClientTest, DeleteFailure) {
  runner->set_handler([](const ProcessRequest&) {
    return FakeProcessRunner::exit_with(10, "Connection refused");
  });
  EXPECT_THROW(client->remove("a.pdf"), TransferError);
}

TEST_F(TransferClientTest, RemoveManyStopsOnFirstFailureWhenAsked) {
  int calls = 0;
  runner->set_handler([&calls](const ProcessRequest&) {
    ++calls;
    return calls == 2 ? FakeProcessRunner::exit_with(10, "refused") : FakeProcessRunner::exit_with(0);
  });

  DeleteSummary summary = client->remove_many({"a", "b", "c"}, true);
  EXPECT_EQ(summary.total, 3u);
  EXPECT_EQ(summary.successful, 1u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(summary.outcomes.size(), 2u);

  calls = 0;
  summary = client->remove_many({"a", "b", "c"}, false);
  EXPECT_EQ(summary.successful, 2u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(summary.outcomes.size(), 3u);
  EXPECT_FALSE(summary.outcomes[1].error.empty());
}

//==============================================
// DIAGNOSTICS AND VERIFICATION
//==============================================

TEST_F(TransferClientTest, ConnectionTest) {
  ConnectionStatus ok = client->test_connection();
  EXPECT_TRUE(ok.connected);
  EXPECT_NE(ok.remote_url.find("/expediente-digital/test/rsync_test_"), std::string::npos);

  runner->set_handler([](const ProcessRequest&) { return FakeProcessRunner::exit_with(5, "auth failed"); });
  ConnectionStatus failed = client->test_connection();
  EXPECT_FALSE(failed.connected);
  EXPECT_FALSE(failed.error.empty());

  // Probe files are cleaned up locally
  for (const auto& entry : std::filesystem::directory_iterator(cfg.temp_dir)) {
    EXPECT_EQ(entry.path().filename().string().find("rsync_test_"), std::string::npos);
  }
}

TEST_F(TransferClientTest, VerifiedUploadDetectsMismatch) {
  cfg.verify_transfers = true;
  make_client();
  auto local = write_file("a.pdf", "original");

  runner->set_handler([](const ProcessRequest& request) {
    // Only the verification download writes a file
    if (request.argv.back().find(".part-") != std::string::npos) {
      std::ofstream out(request.argv.back(), std::ios::binary);
      out << "corrupted";
    }
    return FakeProcessRunner::exit_with(0);
  });

  EXPECT_THROW(client->upload(local.string(), "a.pdf"), IntegrityError);
  EXPECT_EQ(runner->call_count(), 2u);
}

TEST_F(TransferClientTest, VerifiedUploadAcceptsMatchingCopy) {
  cfg.verify_transfers = true;
  make_client();
  auto local = write_file("a.pdf", "original");

  runner->set_handler([](const ProcessRequest& request) {
    if (request.argv.back().find(".part-") != std::string::npos) {
      std::ofstream out(request.argv.back(), std::ios::binary);
      out << "original";
    }
    return FakeProcessRunner::exit_with(0);
  });

  EXPECT_TRUE(client->upload(local.string(), "a.pdf").success);
}
