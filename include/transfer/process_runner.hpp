#ifndef DOCREP_TRANSFER_PROCESS_RUNNER_HPP
#define DOCREP_TRANSFER_PROCESS_RUNNER_HPP

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace docrep {
namespace transfer {

struct ProcessRequest {
  // argv[0] is resolved through PATH
  std::vector<std::string> argv;
  // Extra variables added to the inherited environment
  std::vector<std::pair<std::string, std::string>> env;
  std::chrono::milliseconds timeout{10 * 60 * 1000};
};

struct ProcessResult {
  int exit_code = -1;
  bool timed_out = false;
  bool spawn_failed = false;
  std::string stdout_text;
  std::string stderr_text;
  std::chrono::milliseconds elapsed{0};
};

// Executes one external command to completion
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;
  virtual ProcessResult run(const ProcessRequest& request) = 0;
};

// fork/exec based runner. On timeout the child gets SIGTERM and, after the
// grace period, SIGKILL.
class PosixProcessRunner : public ProcessRunner {
public:
  explicit PosixProcessRunner(std::chrono::milliseconds kill_grace = std::chrono::milliseconds(5000),
                              std::size_t output_limit = 1024 * 1024);

  ProcessResult run(const ProcessRequest& request) override;

private:
  std::chrono::milliseconds kill_grace_;
  // Upper bound on captured bytes per stream
  std::size_t output_limit_;
};

} // namespace transfer
} // namespace docrep

#endif // DOCREP_TRANSFER_PROCESS_RUNNER_HPP
