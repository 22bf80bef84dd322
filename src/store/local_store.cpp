#include "store/local_store.hpp"
#include "common/errors.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace docrep {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with upload root and ensure it exists
LocalStore::LocalStore(const std::string& upload_root, const Clock& clock)
  : upload_root_(upload_root)
  , clock_(clock) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Initializing with upload root: " << upload_root;
  check_directory_exists(upload_root_);
  BOOST_LOG_TRIVIAL(debug) << "Local store: Upload root created/verified at: " << upload_root;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

SavedFile LocalStore::save(const std::string& system_name, std::istream& data) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Storing file: " << system_name;

  validate_system_name(system_name);

  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Invalid input stream provided for: " << system_name;
    throw StoreError("Local store: Invalid input stream");
  }

  check_directory_exists(upload_root_);
  std::filesystem::path final_path = upload_root_ / system_name;
  std::filesystem::path temp_path = upload_root_ / ("." + system_name + ".part-" + crypto::random_token(6));

  std::uintmax_t bytes_written = 0;
  {
    // Open output file in binary mode for cross-platform consistency
    std::ofstream file(temp_path, std::ios::binary);
    if (!file) {
      throw StoreError("Local store: Failed to create file: " + temp_path.string());
    }

    char buffer[4096];

    // Read input stream in chunks and write to file
    while (data.read(buffer, sizeof(buffer))) {
      file.write(buffer, data.gcount());
      bytes_written += static_cast<std::uintmax_t>(data.gcount());
    }

    // Handle final partial chunk if present
    if (data.gcount() > 0) {
      file.write(buffer, data.gcount());
      bytes_written += static_cast<std::uintmax_t>(data.gcount());
    }

    file.flush();
    if (!file) {
      file.close();
      std::error_code ec;
      std::filesystem::remove(temp_path, ec);
      throw StoreError("Local store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to move file into place: " << ec.message();
    throw StoreError("Local store: Failed to move file into place: " + final_path.string());
  }

  SavedFile saved;
  saved.path = final_path;
  saved.size = bytes_written;
  saved.checksum = crypto::sha256_file(final_path);

  BOOST_LOG_TRIVIAL(info) << "Local store: Successfully stored " << bytes_written
                          << " bytes at: " << final_path.string();
  return saved;
}

void LocalStore::read(const std::filesystem::path& path, std::ostream& output) const {
  BOOST_LOG_TRIVIAL(debug) << "Local store: Reading file: " << path.string();

  verify_file_exists(path);

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StoreError("Local store: Failed to open file: " + path.string());
  }

  output << file.rdbuf();
  if (!output.good()) {
    throw StoreError("Local store: Failed to write to output stream");
  }
}

void LocalStore::copy_to(const std::filesystem::path& path,
                         const std::filesystem::path& destination) const {
  verify_file_exists(path);

  std::error_code ec;
  std::filesystem::copy_file(path, destination,
                             std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to copy " << path.string()
                             << " to " << destination.string() << ": " << ec.message();
    throw StoreError("Local store: Failed to copy file: " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "Local store: Copied " << path.string() << " to " << destination.string();
}

void LocalStore::remove(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Removing file: " << path.string();

  std::error_code ec;
  if (std::filesystem::remove(path, ec)) {
    BOOST_LOG_TRIVIAL(info) << "Local store: Successfully removed file: " << path.string();
  } else if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to remove file: " << path.string() << ": " << ec.message();
    throw StoreError("Local store: Failed to remove file: " + ec.message());
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Local store: File already absent: " << path.string();
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool LocalStore::has(const std::filesystem::path& path) const {
  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(path, ec);
  BOOST_LOG_TRIVIAL(debug) << "Local store: " << path.string() << (exists ? " exists" : " not found");
  return exists;
}

std::uintmax_t LocalStore::get_file_size(const std::filesystem::path& path) const {
  verify_file_exists(path);
  return std::filesystem::file_size(path);
}


//==============================================
// NAMING
//==============================================

std::string LocalStore::generate_system_name(const std::string& original_name,
                                             const std::string& context_id) const {
  std::string extension = std::filesystem::path(original_name).extension().string();
  if (!extension.empty() && extension.front() == '.') {
    extension.erase(0, 1);
  }
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  std::string name = std::to_string(to_epoch_ms(clock_.now())) + "_" + crypto::random_token(6);
  if (!extension.empty()) {
    name += "." + extension;
  }

  if (!context_id.empty()) {
    std::string suffix = context_id.size() > 8 ? context_id.substr(context_id.size() - 8) : context_id;
    std::replace_if(suffix.begin(), suffix.end(),
                    [](unsigned char c) { return !std::isalnum(c); }, '_');
    name = "ctx_" + suffix + "_" + name;
  }

  return name;
}


//==============================================
// UTILITY METHODS
//==============================================

void LocalStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void LocalStore::validate_system_name(const std::string& system_name) const {
  if (system_name.empty() || system_name == "." || system_name == ".." ||
      system_name.find('/') != std::string::npos ||
      system_name.find('\\') != std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Rejected system name: " << system_name;
    throw ValidationError("invalid system name: '" + system_name + "'");
  }
}

void LocalStore::verify_file_exists(const std::filesystem::path& file_path) const {
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Local store: File not found: " << file_path.string();
    throw NotFoundError("local file " + file_path.string());
  }
}

} // namespace store
} // namespace docrep
