#ifndef DOCREP_TRANSFER_CLIENT_HPP
#define DOCREP_TRANSFER_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "transfer/command_builder.hpp"
#include "transfer/process_runner.hpp"

namespace docrep {
namespace transfer {

enum class TransferOperation {
  UPLOAD,
  DOWNLOAD,
  DELETE
};

const char* to_string(TransferOperation operation);

struct TransferResult {
  TransferOperation operation = TransferOperation::UPLOAD;
  bool success = false;
  // Set when the remote reported a tolerated condition, e.g. deleting an absent file
  bool warning = false;
  std::string warning_message;
  int exit_code = -1;
  std::string source;
  std::string destination;
  std::string remote_url;
  std::uintmax_t bytes = 0;
  std::string stdout_text;
  std::string stderr_text;
  std::chrono::milliseconds elapsed{0};
};

struct DeleteOutcome {
  std::string remote_key;
  bool success = false;
  std::string error;
};

struct DeleteSummary {
  std::size_t total = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
  std::vector<DeleteOutcome> outcomes;
};

struct ConnectionStatus {
  bool connected = false;
  std::string remote_url;
  std::string error;
};

// Moves bytes between the local host and the remote replica.
// Every operation throws TransferError on failure.
class TransferClient {
public:
  virtual ~TransferClient() = default;

  virtual TransferResult upload(const std::string& local_path, const std::string& remote_key) = 0;
  virtual TransferResult download(const std::string& remote_key, const std::string& local_path) = 0;
  virtual TransferResult remove(const std::string& remote_key) = 0;
  virtual std::string remote_url(const std::string& remote_key) const = 0;
};

// TransferClient backed by an rsync daemon
class RsyncTransferClient : public TransferClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  RsyncTransferClient(config::RemoteConfig config, std::shared_ptr<ProcessRunner> runner);


  // ---- TRANSFER OPERATIONS ----
  TransferResult upload(const std::string& local_path, const std::string& remote_key) override;
  TransferResult download(const std::string& remote_key, const std::string& local_path) override;
  TransferResult remove(const std::string& remote_key) override;
  std::string remote_url(const std::string& remote_key) const override;


  // ---- BATCH AND DIAGNOSTICS ----
  // Deletes each key in order, stops at the first failure when fail_on_error is set
  DeleteSummary remove_many(const std::vector<std::string>& remote_keys, bool fail_on_error = false);
  // Uploads a small probe file under "<base>/test"
  ConnectionStatus test_connection();

private:
  // ---- PARAMETERS ----
  TransferCommandBuilder builder_;
  std::shared_ptr<ProcessRunner> runner_;
  std::filesystem::path temp_dir_;

  using ArgvFactory = std::function<std::vector<std::string>(const std::optional<std::string>&)>;

  // ---- EXECUTION ----
  // Prepares credentials, runs the command and logs the redacted command line
  ProcessResult execute(TransferOperation operation, const ArgvFactory& make_argv,
                        std::chrono::milliseconds timeout);
  // Throws the TransferError matching a failed run
  [[noreturn]] void raise_failure(TransferOperation operation, const ProcessResult& result,
                                  const std::string& target) const;
  // Downloads the uploaded object again and compares checksums
  void verify_upload(const std::string& local_path, const std::string& remote_key);
};

} // namespace transfer
} // namespace docrep

#endif // DOCREP_TRANSFER_CLIENT_HPP
