#pragma once

#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include "common/clock.hpp"

namespace docrep {
namespace store {

// Result of persisting an upload under the upload root
struct SavedFile {
  std::filesystem::path path;
  std::uintmax_t size = 0;
  std::string checksum;
};

class LocalStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  LocalStore(const std::string& upload_root, const Clock& clock);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores the stream under the given system name, written atomically
  SavedFile save(const std::string& system_name, std::istream& data);
  // Streams the stored file into output
  void read(const std::filesystem::path& path, std::ostream& output) const;
  // Copies a stored file to destination, replacing it if present
  void copy_to(const std::filesystem::path& path, const std::filesystem::path& destination) const;
  // Removes a stored file, missing files are ignored
  void remove(const std::filesystem::path& path);


  // ---- QUERY OPERATIONS ----
  bool has(const std::filesystem::path& path) const;
  std::uintmax_t get_file_size(const std::filesystem::path& path) const;
  const std::filesystem::path& root() const { return upload_root_; }


  // ---- NAMING ----
  // Builds "<epoch ms>_<random>.<ext>", prefixed with "ctx_<last 8 of context>_"
  // when a context id is supplied
  std::string generate_system_name(const std::string& original_name,
                                   const std::string& context_id = "") const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path upload_root_;
  const Clock& clock_;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Rejects names that would escape the upload root
  void validate_system_name(const std::string& system_name) const;
  // Verifies if a file exists at the given path, throws NotFoundError if not found
  void verify_file_exists(const std::filesystem::path& file_path) const;
};

} // namespace store
} // namespace docrep
