#include "transfer/transfer_client.hpp"
#include "transfer/credential_file.hpp"
#include "common/clock.hpp"
#include "common/errors.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace docrep {
namespace transfer {

namespace {

constexpr std::size_t kStderrExcerpt = 512;

std::string excerpt(const std::string& text) {
  if (text.size() <= kStderrExcerpt) {
    return text;
  }
  return text.substr(text.size() - kStderrExcerpt);
}

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool reports_missing_file(const std::string& stderr_text) {
  const std::string lower = lowercase(stderr_text);
  return lower.find("no such file or directory") != std::string::npos ||
         lower.find("file not found") != std::string::npos;
}

// Empty directory used as the source of a delete, removed on scope exit
class ScratchDirectory {
public:
  explicit ScratchDirectory(const std::filesystem::path& parent)
    : path_(parent / ("empty_" + std::to_string(to_epoch_ms(std::chrono::system_clock::now())) +
                      "_" + crypto::random_token(6))) {
    std::filesystem::create_directories(path_);
  }

  ~ScratchDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer client: Failed to remove scratch directory "
                                 << path_.string() << ": " << ec.message();
    }
  }

  ScratchDirectory(const ScratchDirectory&) = delete;
  ScratchDirectory& operator=(const ScratchDirectory&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

void remove_quietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer client: Failed to remove " << path.string()
                               << ": " << ec.message();
  }
}

} // namespace

const char* to_string(TransferOperation operation) {
  switch (operation) {
    case TransferOperation::UPLOAD: return "upload";
    case TransferOperation::DOWNLOAD: return "download";
    case TransferOperation::DELETE: return "delete";
    default: return "unknown";
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RsyncTransferClient::RsyncTransferClient(config::RemoteConfig config, std::shared_ptr<ProcessRunner> runner)
  : builder_(std::move(config))
  , runner_(std::move(runner))
  , temp_dir_(TransferCommandBuilder::normalize_local_path(builder_.config().temp_dir)) {
  if (!runner_) {
    throw std::invalid_argument("Transfer client: process runner must not be null");
  }
  BOOST_LOG_TRIVIAL(info) << "Transfer client: Initialized for rsync://" << builder_.config().host
                          << ":" << builder_.config().port << "/" << builder_.config().module;
}


//==============================================
// TRANSFER OPERATIONS
//==============================================

TransferResult RsyncTransferClient::upload(const std::string& local_path, const std::string& remote_key) {
  const std::filesystem::path source(TransferCommandBuilder::normalize_local_path(local_path));
  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    throw ValidationError("upload source is not a regular file: " + local_path);
  }

  const std::string url = builder_.remote_url(remote_key);
  BOOST_LOG_TRIVIAL(info) << "Transfer client: Uploading " << source.string() << " to " << url;

  ProcessResult run = execute(TransferOperation::UPLOAD, [&](const std::optional<std::string>& password_file) {
    return builder_.build_upload(source.string(), remote_key, password_file);
  }, builder_.config().transfer_timeout);

  if (run.timed_out || run.spawn_failed || run.exit_code != 0) {
    raise_failure(TransferOperation::UPLOAD, run, url);
  }

  TransferResult result;
  result.operation = TransferOperation::UPLOAD;
  result.success = true;
  result.exit_code = run.exit_code;
  result.source = source.string();
  result.destination = url;
  result.remote_url = url;
  result.bytes = std::filesystem::file_size(source);
  result.stdout_text = std::move(run.stdout_text);
  result.stderr_text = std::move(run.stderr_text);
  result.elapsed = run.elapsed;

  if (builder_.config().verify_transfers && !builder_.config().dry_run) {
    verify_upload(source.string(), remote_key);
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer client: Upload completed (" << result.bytes << " bytes, "
                          << result.elapsed.count() << " ms)";
  return result;
}

TransferResult RsyncTransferClient::download(const std::string& remote_key, const std::string& local_path) {
  const std::filesystem::path destination(TransferCommandBuilder::normalize_local_path(local_path));
  if (destination.has_parent_path()) {
    std::filesystem::create_directories(destination.parent_path());
  }

  // rsync writes next to the destination and the result is renamed into place
  const std::filesystem::path partial = destination.parent_path() /
    (destination.filename().string() + ".part-" + crypto::random_token(8));
  const std::string url = builder_.remote_url(remote_key);
  BOOST_LOG_TRIVIAL(info) << "Transfer client: Downloading " << url << " to " << destination.string();

  ProcessResult run = execute(TransferOperation::DOWNLOAD, [&](const std::optional<std::string>& password_file) {
    return builder_.build_download(remote_key, partial.string(), password_file);
  }, builder_.config().transfer_timeout);

  if (run.timed_out || run.spawn_failed || run.exit_code != 0) {
    remove_quietly(partial);
    if (!run.timed_out && reports_missing_file(run.stderr_text)) {
      throw NotFoundError("remote file " + url);
    }
    raise_failure(TransferOperation::DOWNLOAD, run, url);
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(partial, ec)) {
    throw TransferError(TransferErrorCode::IO, "download of " + url + " produced no file",
                        excerpt(run.stderr_text), run.exit_code);
  }

  std::filesystem::rename(partial, destination, ec);
  if (ec) {
    remove_quietly(partial);
    throw TransferError(TransferErrorCode::IO, "cannot move download into place: " + ec.message());
  }

  TransferResult result;
  result.operation = TransferOperation::DOWNLOAD;
  result.success = true;
  result.exit_code = run.exit_code;
  result.source = url;
  result.destination = destination.string();
  result.remote_url = url;
  result.bytes = std::filesystem::file_size(destination);
  result.stdout_text = std::move(run.stdout_text);
  result.stderr_text = std::move(run.stderr_text);
  result.elapsed = run.elapsed;

  BOOST_LOG_TRIVIAL(info) << "Transfer client: Download completed (" << result.bytes << " bytes, "
                          << result.elapsed.count() << " ms)";
  return result;
}

TransferResult RsyncTransferClient::remove(const std::string& remote_key) {
  const std::string url = builder_.remote_url(remote_key);
  BOOST_LOG_TRIVIAL(info) << "Transfer client: Deleting " << url;

  ScratchDirectory empty_dir(temp_dir_);
  ProcessResult run = execute(TransferOperation::DELETE, [&](const std::optional<std::string>& password_file) {
    return builder_.build_delete(empty_dir.path().string(), remote_key, password_file);
  }, builder_.config().delete_timeout);

  TransferResult result;
  result.operation = TransferOperation::DELETE;
  result.exit_code = run.exit_code;
  result.source = empty_dir.path().string();
  result.destination = url;
  result.remote_url = url;
  result.stdout_text = run.stdout_text;
  result.stderr_text = run.stderr_text;
  result.elapsed = run.elapsed;

  if (!run.timed_out && !run.spawn_failed) {
    if (run.exit_code == 0) {
      result.success = true;
    } else if (transfer_error_from_exit_code(run.exit_code) == TransferErrorCode::PARTIAL) {
      // Exit codes 23 and 24 mean the entry was already gone or vanished mid-run
      result.success = true;
      result.warning = true;
      result.warning_message = "remote reported a partial transfer (exit " +
                               std::to_string(run.exit_code) + "), file treated as already absent";
    } else if (reports_missing_file(run.stderr_text)) {
      result.success = true;
      result.warning = true;
      result.warning_message = "remote file did not exist";
    }
  }

  if (!result.success) {
    raise_failure(TransferOperation::DELETE, run, url);
  }

  if (result.warning) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer client: Delete of " << url << ": " << result.warning_message;
  } else {
    BOOST_LOG_TRIVIAL(info) << "Transfer client: Delete completed (" << result.elapsed.count() << " ms)";
  }
  return result;
}

std::string RsyncTransferClient::remote_url(const std::string& remote_key) const {
  return builder_.remote_url(remote_key);
}


//==============================================
// BATCH AND DIAGNOSTICS
//==============================================

DeleteSummary RsyncTransferClient::remove_many(const std::vector<std::string>& remote_keys, bool fail_on_error) {
  DeleteSummary summary;
  summary.total = remote_keys.size();

  for (const auto& key : remote_keys) {
    DeleteOutcome outcome;
    outcome.remote_key = key;
    try {
      remove(key);
      outcome.success = true;
      ++summary.successful;
    } catch (const std::exception& e) {
      outcome.error = e.what();
      ++summary.failed;
      BOOST_LOG_TRIVIAL(error) << "Transfer client: Failed to delete " << key << ": " << e.what();
    }
    summary.outcomes.push_back(outcome);
    if (!outcome.success && fail_on_error) {
      break;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer client: Batch delete finished, " << summary.successful << "/"
                          << summary.total << " succeeded";
  return summary;
}

ConnectionStatus RsyncTransferClient::test_connection() {
  ConnectionStatus status;
  const std::string name = "rsync_test_" + std::to_string(to_epoch_ms(std::chrono::system_clock::now())) + ".txt";
  const std::filesystem::path probe = temp_dir_ / name;
  const std::string remote_key = TransferCommandBuilder::join_remote_path({"test", name});
  status.remote_url = builder_.remote_url(remote_key);

  try {
    std::filesystem::create_directories(temp_dir_);
    {
      std::ofstream out(probe, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw StoreError("cannot create probe file " + probe.string());
      }
      out << "connection probe " << name << "\n";
    }
    upload(probe.string(), remote_key);
    status.connected = true;
    BOOST_LOG_TRIVIAL(info) << "Transfer client: Connection test succeeded";
  } catch (const std::exception& e) {
    status.error = e.what();
    BOOST_LOG_TRIVIAL(error) << "Transfer client: Connection test failed: " << e.what();
  }

  remove_quietly(probe);
  return status;
}


//==============================================
// EXECUTION
//==============================================

ProcessResult RsyncTransferClient::execute(TransferOperation operation, const ArgvFactory& make_argv,
                                           std::chrono::milliseconds timeout) {
  const auto& cfg = builder_.config();
  std::unique_ptr<CredentialFile> credential;
  std::optional<std::string> password_file;
  ProcessRequest request;
  request.timeout = timeout;

  if (!cfg.password_file.empty()) {
    password_file = cfg.password_file;
  } else if (!cfg.password.empty()) {
    if (cfg.use_password_file) {
      credential = std::make_unique<CredentialFile>(temp_dir_, cfg.password);
      password_file = credential->path().string();
    } else {
      request.env.emplace_back("RSYNC_PASSWORD", cfg.password);
    }
  }

  request.argv = make_argv(password_file);
  BOOST_LOG_TRIVIAL(debug) << "Transfer client: Executing " << to_string(operation) << ": "
                           << TransferCommandBuilder::redact_for_logging(request.argv);

  // The credential file is unlinked when this scope ends
  return runner_->run(request);
}

void RsyncTransferClient::raise_failure(TransferOperation operation, const ProcessResult& result,
                                        const std::string& target) const {
  const std::string what = std::string(to_string(operation)) + " of " + target;

  if (result.timed_out) {
    BOOST_LOG_TRIVIAL(error) << "Transfer client: " << what << " timed out after "
                             << result.elapsed.count() << " ms";
    throw TransferError(TransferErrorCode::TIMEOUT, what + " timed out", excerpt(result.stderr_text),
                        result.exit_code);
  }
  if (result.spawn_failed) {
    BOOST_LOG_TRIVIAL(error) << "Transfer client: Could not start rsync: " << result.stderr_text;
    throw TransferError(TransferErrorCode::SPAWN_FAILED, what + " could not start " + builder_.config().binary,
                        excerpt(result.stderr_text), result.exit_code);
  }

  TransferErrorCode code = transfer_error_from_exit_code(result.exit_code);
  BOOST_LOG_TRIVIAL(error) << "Transfer client: " << what << " failed with exit code " << result.exit_code
                           << " (" << transfer_error_to_string(code) << "): " << excerpt(result.stderr_text);
  throw TransferError(code, what + " failed with exit code " + std::to_string(result.exit_code),
                      excerpt(result.stderr_text), result.exit_code);
}

void RsyncTransferClient::verify_upload(const std::string& local_path, const std::string& remote_key) {
  std::filesystem::create_directories(temp_dir_);
  const std::filesystem::path scratch = temp_dir_ / ("verify_" + crypto::random_token(10));

  std::string remote_checksum;
  try {
    download(remote_key, scratch.string());
    remote_checksum = crypto::sha256_file(scratch);
  } catch (const std::exception&) {
    remove_quietly(scratch);
    throw;
  }
  remove_quietly(scratch);

  const std::string local_checksum = crypto::sha256_file(local_path);
  if (remote_checksum != local_checksum) {
    BOOST_LOG_TRIVIAL(error) << "Transfer client: Verification failed for " << remote_key;
    throw IntegrityError("remote copy of " + remote_key + " does not match the local checksum");
  }
  BOOST_LOG_TRIVIAL(debug) << "Transfer client: Verified " << remote_key;
}

} // namespace transfer
} // namespace docrep
