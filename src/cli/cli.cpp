#include "cli/cli.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace docrep {
namespace cli {

namespace {

bool has_flag(const std::vector<std::string>& args, std::size_t from, const std::string& flag) {
  return args.size() > from && std::find(args.begin() + from, args.end(), flag) != args.end();
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================
  
CLI::CLI(service::FileService& service, cache::DownloadCache& cache,
         replication::ReplicationWorker* worker, transfer::RsyncTransferClient* client)
  : running_(false)
  , service_(service)
  , cache_(cache)
  , worker_(worker)
  , client_(client) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================
void CLI::run() {
  running_ = true;
  std::string line;
  
  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  std::cout << "docrep> " << std::flush;
  
  while (running_ && std::getline(std::cin, line)) {
    std::istringstream iss(line);
    std::string command;
    std::vector<std::string> args;
    iss >> command;
    for (std::string arg; iss >> arg;) {
      args.push_back(arg);
    }

    if (command == "quit" || command == "exit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, args);
    }

    if (running_) {
      std::cout << "docrep> " << std::flush;
    }
  }
  
  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING 
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " argument(s)";

  if (command == "upload" && !args.empty()) {
    handle_upload_command(args);
  }
  else if (command == "read" && !args.empty()) {
    handle_read_command(args);
  }
  else if (command == "info" && args.size() == 1) {
    handle_info_command(args[0]);
  }
  else if (command == "sync" && !args.empty()) {
    handle_sync_command(args);
  }
  else if (command == "process" && args.empty()) {
    handle_process_command();
  }
  else if (command == "status" && args.empty()) {
    handle_status_command();
  }
  else if (command == "delete" && !args.empty()) {
    handle_delete_command(args);
  }
  else if (command == "cache") {
    handle_cache_command(args);
  }
  else if (command == "ping" && args.empty()) {
    handle_ping_command();
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    std::cout << "Unknown command or invalid arguments, type 'help'" << std::endl;
  }
}

void CLI::handle_upload_command(const std::vector<std::string>& args) {
  std::ifstream file(args[0], std::ios::binary);
  if (!file) {
    std::cout << "Error opening file: " << args[0] << std::endl;
    return;
  }

  try {
    service::UploadRequest request;
    request.original_name = std::filesystem::path(args[0]).filename().string();
    if (args.size() > 1) {
      request.context_id = args[1];
    }
    if (args.size() > 2) {
      request.priority = store::parse_priority(args[2]);
    }
    store::FileRecord record = service_.upload(request, file);
    std::cout << "Stored " << request.original_name << " as " << record.file_id
              << " (" << record.size << " bytes, " << store::to_string(record.sync_status) << ")" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error uploading file", e.what());
  }
}

void CLI::handle_read_command(const std::vector<std::string>& args) {
  try {
    service::ReadResult result = service_.read(args[0]);
    if (args.size() > 1) {
      std::filesystem::copy_file(result.path, args[1], std::filesystem::copy_options::overwrite_existing);
      std::cout << "Wrote " << result.record.size << " bytes to " << args[1];
    } else {
      std::ifstream in(result.path, std::ios::binary);
      std::cout << in.rdbuf() << std::endl;
    }
    std::cout << " [" << service::to_string(result.source) << ", "
              << cache::to_string(result.cache_outcome) << "]" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_info_command(const std::string& file_id) {
  auto record = service_.find(file_id);
  if (!record) {
    std::cout << "No such file: " << file_id << std::endl;
    return;
  }
  std::cout << "  id:        " << record->file_id << " (v" << record->version << ")" << std::endl
            << "  name:      " << record->original_name << " -> " << record->system_name << std::endl
            << "  size:      " << record->size << " bytes" << std::endl
            << "  checksum:  " << record->checksum << std::endl
            << "  local:     " << record->local_path << std::endl
            << "  remote:    " << record->remote_path << std::endl
            << "  status:    " << store::to_string(record->sync_status)
            << " (retries " << record->sync_retries << ", priority " << store::to_string(record->priority) << ")"
            << std::endl;
  if (!record->sync_error.empty()) {
    std::cout << "  error:     " << record->sync_error << std::endl;
  }
}

void CLI::handle_sync_command(const std::vector<std::string>& args) {
  try {
    replication::ResyncOptions options;
    options.reset_retries = has_flag(args, 1, "reset");
    for (std::size_t i = 1; i < args.size(); ++i) {
      if (args[i] != "reset") {
        options.priority = store::parse_priority(args[i]);
      }
    }
    store::FileRecord record = service_.resync(args[0], options);
    std::cout << "Queued " << record.file_id << " for replication (retries " << record.sync_retries << ")"
              << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error requesting re-sync", e.what());
  }
}

void CLI::handle_process_command() {
  if (!worker_) {
    std::cout << "Replication is disabled" << std::endl;
    return;
  }
  try {
    replication::BatchSummary summary = worker_->process_batch();
    std::cout << "Processed " << summary.processed << ": " << summary.successful << " succeeded, "
              << summary.failed << " failed (" << summary.success_rate << "%)" << std::endl;
    for (const auto& item : summary.results) {
      std::cout << "  " << item.file_id << " " << store::to_string(item.status);
      if (!item.error.empty()) {
        std::cout << " - " << item.error;
      }
      std::cout << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error processing queue", e.what());
  }
}

void CLI::handle_status_command() {
  store::QueueStatus status = service_.queue_status();
  std::cout << "Queue: " << status.total << " file(s), " << status.total_bytes << " bytes, average retries "
            << std::fixed << std::setprecision(2) << status.average_retries << std::endl;
  for (const auto& [sync_status, breakdown] : status.by_status) {
    std::cout << "  " << std::left << std::setw(8) << store::to_string(sync_status) << std::right
              << breakdown.count << " file(s), " << breakdown.total_bytes << " bytes, average retries "
              << breakdown.average_retries << std::endl;
  }
  std::cout.unsetf(std::ios::floatfield);
}

void CLI::handle_delete_command(const std::vector<std::string>& args) {
  try {
    service::RemoveOptions options;
    options.delete_local = has_flag(args, 1, "local");
    options.delete_remote = has_flag(args, 1, "remote");
    service_.remove(args[0], options);
    std::cout << "File deleted successfully" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting file", e.what());
  }
}

void CLI::handle_cache_command(const std::vector<std::string>& args) {
  try {
    if (args.empty()) {
      cache::CacheStats stats = cache_.stats();
      std::cout << "Cache: " << stats.entries << " entr" << (stats.entries == 1 ? "y" : "ies") << ", "
                << stats.total_bytes << " bytes, " << stats.active_locks << " download(s) in flight" << std::endl;
      for (const auto& entry : stats.top_entries) {
        std::cout << "  " << entry.cache_key << " " << entry.file_id << " v" << entry.version
                  << " hits " << entry.hit_count << std::endl;
      }
    } else if (args[0] == "sweep") {
      std::cout << "Removed " << cache_.sweep() << " expired entries" << std::endl;
    } else if (args[0] == "clear") {
      cache_.clear();
      std::cout << "Cache cleared" << std::endl;
    } else {
      std::cout << "Usage: cache [sweep|clear]" << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error accessing cache", e.what());
  }
}

void CLI::handle_ping_command() {
  if (!client_) {
    std::cout << "Replication is disabled" << std::endl;
    return;
  }
  transfer::ConnectionStatus status = client_->test_connection();
  if (status.connected) {
    std::cout << "Connected to " << status.remote_url << std::endl;
  } else {
    std::cout << "Connection failed: " << status.error << std::endl;
  }
}

void CLI::handle_help_command() {
  std::cout << "Available commands:" << std::endl;
  std::cout << "  help                              Display this help message" << std::endl;
  std::cout << "  upload <path> [context] [prio]    Store a local file and queue it for replication" << std::endl;
  std::cout << "  read <id> [out]                   Print a file or write it to <out>" << std::endl;
  std::cout << "  info <id>                         Show the metadata of a file" << std::endl;
  std::cout << "  sync <id> [reset] [prio]          Queue a file for replication again" << std::endl;
  std::cout << "  process                           Run one replication batch now" << std::endl;
  std::cout << "  status                            Show replication queue status" << std::endl;
  std::cout << "  delete <id> [local] [remote]      Delete a file" << std::endl;
  std::cout << "  cache [sweep|clear]               Show or maintain the download cache" << std::endl;
  std::cout << "  ping                              Test the connection to the replica" << std::endl;
  std::cout << "  quit                              Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  std::cout << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace docrep
