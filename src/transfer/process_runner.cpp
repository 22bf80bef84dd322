#include "transfer/process_runner.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <thread>

extern char** environ;

namespace docrep {
namespace transfer {

namespace {

// Owns both ends of a pipe and closes whatever is still open
struct Pipe {
  int fds[2] = {-1, -1};

  Pipe() {
    if (::pipe2(fds, O_CLOEXEC) == -1) {
      throw std::runtime_error(std::string("Process runner: pipe failed: ") + std::strerror(errno));
    }
  }

  ~Pipe() {
    close_read();
    close_write();
  }

  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  int read_end() const { return fds[0]; }
  int write_end() const { return fds[1]; }

  void close_read() {
    if (fds[0] != -1) { ::close(fds[0]); fds[0] = -1; }
  }
  void close_write() {
    if (fds[1] != -1) { ::close(fds[1]); fds[1] = -1; }
  }
};

// Builds "NAME=value" strings from the inherited environment plus overrides
std::vector<std::string> build_environment(const std::vector<std::pair<std::string, std::string>>& extra) {
  std::map<std::string, std::string> merged;
  for (char** env = environ; env && *env; ++env) {
    std::string entry(*env);
    auto pos = entry.find('=');
    if (pos == std::string::npos) continue;
    merged[entry.substr(0, pos)] = entry.substr(pos + 1);
  }
  for (const auto& [name, value] : extra) {
    merged[name] = value;
  }

  std::vector<std::string> result;
  result.reserve(merged.size());
  for (const auto& [name, value] : merged) {
    result.push_back(name + "=" + value);
  }
  return result;
}

// Appends from fd into out, keeping at most limit bytes.
// Returns false once the stream reached EOF.
bool drain(int fd, std::string& out, std::size_t limit) {
  char buffer[4096];
  ssize_t n = ::read(fd, buffer, sizeof(buffer));
  if (n > 0) {
    std::size_t room = out.size() < limit ? limit - out.size() : 0;
    out.append(buffer, std::min(room, static_cast<std::size_t>(n)));
    return true;
  }
  if (n == -1 && (errno == EINTR || errno == EAGAIN)) {
    return true;
  }
  return false;
}

int decode_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

PosixProcessRunner::PosixProcessRunner(std::chrono::milliseconds kill_grace, std::size_t output_limit)
  : kill_grace_(kill_grace)
  , output_limit_(output_limit) {}

ProcessResult PosixProcessRunner::run(const ProcessRequest& request) {
  using clock = std::chrono::steady_clock;
  ProcessResult result;

  if (request.argv.empty()) {
    result.spawn_failed = true;
    result.stderr_text = "empty command";
    return result;
  }

  // Everything the child needs is prepared before fork
  std::vector<char*> argv;
  for (const auto& arg : request.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  std::vector<std::string> env_storage = build_environment(request.env);
  std::vector<char*> envp;
  for (const auto& entry : env_storage) {
    envp.push_back(const_cast<char*>(entry.c_str()));
  }
  envp.push_back(nullptr);

  Pipe out_pipe;
  Pipe err_pipe;
  Pipe exec_pipe;  // reports exec failure, closed by O_CLOEXEC on success

  auto start = clock::now();
  const pid_t pid = ::fork();
  if (pid < 0) {
    result.spawn_failed = true;
    result.stderr_text = std::string("fork failed: ") + std::strerror(errno);
    BOOST_LOG_TRIVIAL(error) << "Process runner: " << result.stderr_text;
    return result;
  }

  if (pid == 0) {
    // Child process: wire stdio and exec
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull != -1) {
      ::dup2(devnull, STDIN_FILENO);
    }
    ::dup2(out_pipe.write_end(), STDOUT_FILENO);
    ::dup2(err_pipe.write_end(), STDERR_FILENO);

    ::execvpe(argv[0], argv.data(), envp.data());

    int err = errno;
    ssize_t ignored = ::write(exec_pipe.write_end(), &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  // Parent process
  out_pipe.close_write();
  err_pipe.close_write();
  exec_pipe.close_write();

  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_pipe.read_end(), &exec_errno, sizeof(exec_errno));
  } while (n == -1 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    result.spawn_failed = true;
    result.exit_code = 127;
    result.stderr_text = std::string("exec failed: ") + std::strerror(exec_errno);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
    BOOST_LOG_TRIVIAL(error) << "Process runner: Failed to start " << request.argv.front()
                             << ": " << std::strerror(exec_errno);
    return result;
  }

  const auto deadline = start + request.timeout;
  bool out_open = true;
  bool err_open = true;
  bool term_sent = false;
  bool kill_sent = false;
  clock::time_point kill_deadline{};

  // SIGTERM at the deadline, SIGKILL once the grace period is over
  auto enforce_deadline = [&](clock::time_point now) {
    if (!term_sent && now >= deadline) {
      BOOST_LOG_TRIVIAL(warning) << "Process runner: Timeout reached ("
                                 << request.timeout.count() << " ms), terminating pid " << pid;
      ::kill(pid, SIGTERM);
      term_sent = true;
      result.timed_out = true;
      kill_deadline = now + kill_grace_;
    } else if (term_sent && !kill_sent && now >= kill_deadline) {
      BOOST_LOG_TRIVIAL(warning) << "Process runner: Grace period expired, killing pid " << pid;
      ::kill(pid, SIGKILL);
      kill_sent = true;
    }
  };

  // Read both streams until they close, enforcing the wall-clock timeout
  while (out_open || err_open) {
    auto now = clock::now();
    enforce_deadline(now);
    if (kill_sent) {
      break;
    }

    auto wait_until = term_sent ? kill_deadline : deadline;
    auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(wait_until - now).count();
    int poll_timeout = static_cast<int>(std::max<long long>(0, std::min<long long>(wait_ms, 1000)));

    pollfd fds[2];
    nfds_t count = 0;
    if (out_open) fds[count++] = {out_pipe.read_end(), POLLIN, 0};
    if (err_open) fds[count++] = {err_pipe.read_end(), POLLIN, 0};

    int ready = ::poll(fds, count, poll_timeout);
    if (ready < 0) {
      if (errno == EINTR) continue;
      BOOST_LOG_TRIVIAL(error) << "Process runner: poll failed: " << std::strerror(errno);
      ::kill(pid, SIGKILL);
      kill_sent = true;
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      if (fds[i].fd == out_pipe.read_end()) {
        out_open = drain(fds[i].fd, result.stdout_text, output_limit_);
      } else {
        err_open = drain(fds[i].fd, result.stderr_text, output_limit_);
      }
    }
  }

  // The child may outlive its output streams, so reaping honours the same deadlines
  int status = 0;
  bool reaped = false;
  while (!reaped) {
    const pid_t waited = ::waitpid(pid, &status, kill_sent ? 0 : WNOHANG);
    if (waited == pid) {
      reaped = true;
      break;
    }
    if (waited == -1) {
      if (errno == EINTR) continue;
      BOOST_LOG_TRIVIAL(error) << "Process runner: waitpid failed: " << std::strerror(errno);
      break;
    }
    enforce_deadline(clock::now());
    if (!kill_sent) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  result.exit_code = reaped ? decode_status(status) : -1;
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);

  BOOST_LOG_TRIVIAL(debug) << "Process runner: " << request.argv.front() << " exited with code "
                           << result.exit_code << " after " << result.elapsed.count() << " ms";
  return result;
}

} // namespace transfer
} // namespace docrep
