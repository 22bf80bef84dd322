#include "transfer/credential_file.hpp"
#include "common/clock.hpp"
#include "common/errors.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <set>
#include <sys/stat.h>
#include <unistd.h>

namespace docrep {
namespace transfer {

namespace {

std::mutex& registry_mutex() {
  static std::mutex mutex;
  return mutex;
}

std::set<std::string>& registry() {
  static std::set<std::string> paths;
  return paths;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CredentialFile::CredentialFile(const std::filesystem::path& directory, const std::string& secret) {
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    throw TransferError(TransferErrorCode::CREDENTIAL,
                        "cannot create credential directory " + directory.string() + ": " + ec.message());
  }

  path_ = directory / ("rsync_pwd_" + std::to_string(to_epoch_ms(std::chrono::system_clock::now())) +
                       "_" + crypto::random_token(8) + ".tmp");

  int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd == -1) {
    throw TransferError(TransferErrorCode::CREDENTIAL,
                        "cannot create credential file: " + std::string(std::strerror(errno)));
  }
  track(path_);

  // The umask may only narrow the mode, enforce it anyway
  bool ok = ::fchmod(fd, S_IRUSR | S_IWUSR) == 0;
  std::string content = secret + "\n";
  const char* data = content.data();
  std::size_t remaining = content.size();
  while (ok && remaining > 0) {
    ssize_t written = ::write(fd, data, remaining);
    if (written == -1) {
      if (errno == EINTR) continue;
      ok = false;
      break;
    }
    data += written;
    remaining -= static_cast<std::size_t>(written);
  }
  int write_errno = errno;
  ::close(fd);

  if (!ok) {
    untrack(path_);
    std::filesystem::remove(path_, ec);
    throw TransferError(TransferErrorCode::CREDENTIAL,
                        "cannot write credential file: " + std::string(std::strerror(write_errno)));
  }

  BOOST_LOG_TRIVIAL(debug) << "Credential file: Created " << path_.filename().string();
}

CredentialFile::~CredentialFile() {
  // purge_all may already have removed the file
  if (!untrack(path_)) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Credential file: Failed to remove " << path_.string()
                               << ": " << ec.message();
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Credential file: Removed " << path_.filename().string();
  }
}


//==============================================
// PROCESS-WIDE REGISTRY
//==============================================

std::size_t CredentialFile::purge_all() {
  std::set<std::string> paths;
  {
    std::lock_guard<std::mutex> lock(registry_mutex());
    paths.swap(registry());
  }

  std::size_t removed = 0;
  for (const auto& path : paths) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
      ++removed;
    } else if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Credential file: Failed to purge " << path << ": " << ec.message();
    }
  }

  if (!paths.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Credential file: Purged " << removed << " credential file(s)";
  }
  return removed;
}

std::size_t CredentialFile::live_count() {
  std::lock_guard<std::mutex> lock(registry_mutex());
  return registry().size();
}

void CredentialFile::track(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(registry_mutex());
  registry().insert(path.string());
}

bool CredentialFile::untrack(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lock(registry_mutex());
  return registry().erase(path.string()) > 0;
}

} // namespace transfer
} // namespace docrep
