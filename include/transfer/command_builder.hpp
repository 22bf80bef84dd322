#ifndef DOCREP_TRANSFER_COMMAND_BUILDER_HPP
#define DOCREP_TRANSFER_COMMAND_BUILDER_HPP

#include <optional>
#include <string>
#include <vector>
#include "config/config.hpp"

namespace docrep {
namespace transfer {

// Assembles rsync argument vectors. Pure, no I/O.
class TransferCommandBuilder {
public:
  explicit TransferCommandBuilder(config::RemoteConfig config);

  // ---- COMMANDS ----
  std::vector<std::string> build_upload(const std::string& local_path, const std::string& remote_key,
                                        const std::optional<std::string>& password_file) const;
  std::vector<std::string> build_download(const std::string& remote_key, const std::string& local_path,
                                          const std::optional<std::string>& password_file) const;
  // Syncs empty_dir into the parent of remote_key so that only that entry is deleted
  std::vector<std::string> build_delete(const std::string& empty_dir, const std::string& remote_key,
                                        const std::optional<std::string>& password_file) const;

  // ---- REMOTE PATHS ----
  // Base path joined with the key unless the key already starts with it
  std::string remote_relative_path(const std::string& remote_key) const;
  // rsync://<user>@<host>:<port>/<module>/<relative path>
  std::string remote_url(const std::string& remote_key) const;

  // ---- HELPERS ----
  // Backslashes become '/', "X:/" drive prefixes become "/cygdrive/x/"
  static std::string normalize_local_path(const std::string& path);
  // Joins segments with a single '/', dropping empty segments.
  // Throws ValidationError on ".." segments.
  static std::string join_remote_path(const std::vector<std::string>& parts);
  // Single line rendering with the password file argument masked
  static std::string redact_for_logging(const std::vector<std::string>& argv);

  const config::RemoteConfig& config() const { return config_; }

private:
  config::RemoteConfig config_;

  std::vector<std::string> common_flags(const std::optional<std::string>& password_file,
                                        bool with_filters) const;
  std::string module_url(const std::string& relative_path) const;
};

} // namespace transfer
} // namespace docrep

#endif // DOCREP_TRANSFER_COMMAND_BUILDER_HPP
