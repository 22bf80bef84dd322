#ifndef DOCREP_TRANSFER_CREDENTIAL_FILE_HPP
#define DOCREP_TRANSFER_CREDENTIAL_FILE_HPP

#include <cstddef>
#include <filesystem>
#include <string>

namespace docrep {
namespace transfer {

// Short-lived password file handed to rsync through --password-file.
// Created with mode 0600 and removed when the object goes out of scope.
class CredentialFile {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws TransferError{CREDENTIAL} if the file cannot be created exclusively
  CredentialFile(const std::filesystem::path& directory, const std::string& secret);
  ~CredentialFile();

  CredentialFile(const CredentialFile&) = delete;
  CredentialFile& operator=(const CredentialFile&) = delete;

  const std::filesystem::path& path() const { return path_; }

  // ---- PROCESS-WIDE REGISTRY ----
  // Unlinks every credential file still alive, returns how many were removed.
  // Called from the interrupt handler.
  static std::size_t purge_all();
  static std::size_t live_count();

private:
  std::filesystem::path path_;

  static void track(const std::filesystem::path& path);
  static bool untrack(const std::filesystem::path& path);
};

} // namespace transfer
} // namespace docrep

#endif // DOCREP_TRANSFER_CREDENTIAL_FILE_HPP
