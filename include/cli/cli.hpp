#pragma once

#include <string>
#include <vector>
#include "cache/download_cache.hpp"
#include "replication/replication_worker.hpp"
#include "service/file_service.hpp"
#include "transfer/transfer_client.hpp"

namespace docrep {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    // worker and client are null when replication is disabled
    CLI(service::FileService& service, cache::DownloadCache& cache,
        replication::ReplicationWorker* worker, transfer::RsyncTransferClient* client);


    // ---- STARTUP ----
    void run();
    void stop() { running_ = false; }

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    service::FileService& service_;
    cache::DownloadCache& cache_;
    replication::ReplicationWorker* worker_;
    transfer::RsyncTransferClient* client_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_upload_command(const std::vector<std::string>& args);
    void handle_read_command(const std::vector<std::string>& args);
    void handle_info_command(const std::string& file_id);
    void handle_sync_command(const std::vector<std::string>& args);
    void handle_process_command();
    void handle_status_command();
    void handle_delete_command(const std::vector<std::string>& args);
    void handle_cache_command(const std::vector<std::string>& args);
    void handle_ping_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace docrep
