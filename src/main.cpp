#include "cache/download_cache.hpp"
#include "cli/cli.hpp"
#include "common/errors.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "replication/replication_queue.hpp"
#include "replication/replication_worker.hpp"
#include "service/file_service.hpp"
#include "store/file_record_store.hpp"
#include "store/local_store.hpp"
#include "transfer/credential_file.hpp"
#include "transfer/process_runner.hpp"
#include "transfer/transfer_client.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/core.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

struct ProgramOptions {
  std::string upload_root;
  std::string temp_dir;
  std::string log_file;
  bool run_worker{true};
  bool help{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  --upload-root <dir>  Directory for uploaded files (UPLOAD_PATH)\n"
        << "  --temp-dir <dir>     Scratch directory for transfers and cache (RSYNC_TEMP_DIR)\n"
        << "  --log-file <file>    Log file (LOG_FILE)\n"
        << "  --no-worker          Do not start the background replication worker\n"
        << "  --help               Show this message\n"
        << "Remaining settings are read from the environment, e.g. RSYNC_HOST, RSYNC_USER, RSYNC_MODULE.\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, std::string ProgramOptions::*> value_flags = {
    {"--upload-root", &ProgramOptions::upload_root},
    {"--temp-dir", &ProgramOptions::temp_dir},
    {"--log-file", &ProgramOptions::log_file}
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--help" || flag == "-h") {
      options.help = true;
      return options;
    }
    if (flag == "--no-worker") {
      options.run_worker = false;
      continue;
    }

    auto it = value_flags.find(flag);
    if (it == value_flags.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    options.*(it->second) = argv[++i];
  }

  options.valid = true;
  return options;
}

bool run_node(const ProgramOptions& options) {
  docrep::config::Config config;
  try {
    config = docrep::config::Config::from_environment();
    if (!options.upload_root.empty()) config.storage.upload_root = options.upload_root;
    if (!options.temp_dir.empty()) config.remote.temp_dir = options.temp_dir;
    if (!options.log_file.empty()) config.logging.file = options.log_file;
    config.validate();
  } catch (const docrep::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }

  docrep::logging::init_logging(config.logging.file, docrep::logging::parse_severity(config.logging.level), false);

  try {
    docrep::SystemClock clock;
    docrep::store::InMemoryFileRecordStore records;
    docrep::store::LocalStore local_store(config.storage.upload_root, clock);
    docrep::replication::ReplicationQueue queue(records, clock, config.replication);
    docrep::cache::DownloadCache cache(config.cache_directory(), clock, config.cache.ttl,
                                       config.cache.lock_wait_timeout);
    cache.reconcile();

    std::unique_ptr<docrep::transfer::RsyncTransferClient> client;
    std::unique_ptr<docrep::replication::ReplicationWorker> worker;
    if (config.replication.enabled) {
      client = std::make_unique<docrep::transfer::RsyncTransferClient>(
        config.remote, std::make_shared<docrep::transfer::PosixProcessRunner>());
      worker = std::make_unique<docrep::replication::ReplicationWorker>(queue, *client);
    }

    docrep::service::FileService service(config, records, local_store, queue, cache, client.get(), clock);
    docrep::cli::CLI cli(service, cache, worker.get(), client.get());

    // Interrupts remove credential files before the process goes away
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      BOOST_LOG_TRIVIAL(warning) << "Received signal " << signal_number << ", shutting down";
      docrep::transfer::CredentialFile::purge_all();
      boost::log::core::get()->flush();
      std::_Exit(128 + signal_number);
    });

    cache.start_sweeper(config.cache.sweep_interval);
    if (worker && options.run_worker) {
      worker->start(config.replication.poll_interval);
    }

    std::thread signal_thread([&signal_context]() { signal_context.run(); });
    auto shutdown = [&]() {
      if (worker) {
        worker->stop();
      }
      cache.stop_sweeper();
      signals.cancel();
      signal_context.stop();
      signal_thread.join();
      docrep::transfer::CredentialFile::purge_all();
    };

    try {
      cli.run();
    } catch (const std::exception&) {
      shutdown();
      throw;
    }
    shutdown();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Failed to start: " << e.what();
    std::cerr << "Error: Failed to start: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (options.help) {
    print_usage(argv[0]);
    return 0;
  }
  if (!options.valid) {
    return 1;
  } else if (!run_node(options)) {
    return 1;
  }
  return 0;
}
