#include "transfer/command_builder.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace docrep {
namespace transfer {

namespace {

const std::string kPasswordFlag = "--password-file=";

std::vector<std::string> split_segments(const std::string& path) {
  std::vector<std::string> segments;
  std::string current;
  for (char c : path) {
    if (c == '/' || c == '\\') {
      if (!current.empty()) segments.push_back(current);
      current.clear();
    } else {
      current += c;
    }
  }
  if (!current.empty()) segments.push_back(current);
  return segments;
}

// rsync filter patterns treat these characters as wildcards
std::string escape_filter_pattern(const std::string& name) {
  std::string escaped;
  for (char c : name) {
    if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
      escaped += '\\';
    }
    escaped += c;
  }
  return escaped;
}

} // namespace

TransferCommandBuilder::TransferCommandBuilder(config::RemoteConfig config)
  : config_(std::move(config)) {}


//==============================================
// COMMANDS
//==============================================

std::vector<std::string> TransferCommandBuilder::build_upload(const std::string& local_path,
                                                              const std::string& remote_key,
                                                              const std::optional<std::string>& password_file) const {
  auto argv = common_flags(password_file, true);
  argv.push_back(normalize_local_path(local_path));
  argv.push_back(remote_url(remote_key));
  return argv;
}

std::vector<std::string> TransferCommandBuilder::build_download(const std::string& remote_key,
                                                                const std::string& local_path,
                                                                const std::optional<std::string>& password_file) const {
  auto argv = common_flags(password_file, true);
  argv.push_back(remote_url(remote_key));
  argv.push_back(normalize_local_path(local_path));
  return argv;
}

std::vector<std::string> TransferCommandBuilder::build_delete(const std::string& empty_dir,
                                                              const std::string& remote_key,
                                                              const std::optional<std::string>& password_file) const {
  const std::string relative = remote_relative_path(remote_key);
  auto segments = split_segments(relative);
  if (segments.empty()) {
    throw ValidationError("remote key is empty");
  }
  const std::string name = segments.back();
  segments.pop_back();

  // Include/exclude lists from the configuration would interfere with the
  // single-entry filter below
  auto argv = common_flags(password_file, false);
  argv.push_back("--recursive");
  argv.push_back("--delete");
  argv.push_back("--include=" + escape_filter_pattern(name));
  argv.push_back("--exclude=*");

  std::string source = normalize_local_path(empty_dir);
  if (source.empty() || source.back() != '/') source += '/';
  argv.push_back(source);

  std::string parent = module_url(join_remote_path(segments));
  if (parent.back() != '/') parent += '/';
  argv.push_back(parent);
  return argv;
}

std::vector<std::string> TransferCommandBuilder::common_flags(const std::optional<std::string>& password_file,
                                                              bool with_filters) const {
  std::vector<std::string> argv;
  argv.push_back(config_.binary);
  argv.insert(argv.end(), config_.base_flags.begin(), config_.base_flags.end());

  auto has_flag = [&argv](const std::string& prefix) {
    return std::any_of(argv.begin(), argv.end(), [&prefix](const std::string& arg) {
      return arg.compare(0, prefix.size(), prefix) == 0;
    });
  };

  if (config_.io_timeout_seconds > 0 && !has_flag("--timeout")) {
    argv.push_back("--timeout=" + std::to_string(config_.io_timeout_seconds));
  }
  if (config_.compress && !has_flag("--compress") && !has_flag("-z")) {
    argv.push_back("--compress");
  }
  if (config_.verbose) argv.push_back("--verbose");
  if (config_.dry_run) argv.push_back("--dry-run");
  if (config_.port != 873) {
    argv.push_back("--port=" + std::to_string(config_.port));
  }
  if (password_file) {
    argv.push_back(kPasswordFlag + normalize_local_path(*password_file));
  }
  if (!config_.bandwidth_limit.empty()) {
    argv.push_back("--bwlimit=" + config_.bandwidth_limit);
  }
  if (with_filters) {
    if (!config_.exclude_from.empty()) {
      argv.push_back("--exclude-from=" + normalize_local_path(config_.exclude_from));
    }
    if (!config_.include_from.empty()) {
      argv.push_back("--include-from=" + normalize_local_path(config_.include_from));
    }
  }
  return argv;
}


//==============================================
// REMOTE PATHS
//==============================================

std::string TransferCommandBuilder::remote_relative_path(const std::string& remote_key) const {
  const std::string key = join_remote_path({remote_key});
  const std::string base = join_remote_path({config_.remote_base_path});
  if (base.empty()) {
    return key;
  }
  if (key == base || key.compare(0, base.size() + 1, base + "/") == 0) {
    return key;
  }
  return join_remote_path({base, key});
}

std::string TransferCommandBuilder::remote_url(const std::string& remote_key) const {
  return module_url(remote_relative_path(remote_key));
}

std::string TransferCommandBuilder::module_url(const std::string& relative_path) const {
  std::ostringstream url;
  url << "rsync://";
  if (!config_.user.empty()) {
    url << config_.user << "@";
  }
  url << config_.host << ":" << config_.port << "/" << config_.module << "/" << relative_path;
  return url.str();
}


//==============================================
// HELPERS
//==============================================

std::string TransferCommandBuilder::normalize_local_path(const std::string& path) {
  std::string normalized = path;
  std::replace(normalized.begin(), normalized.end(), '\\', '/');

  if (normalized.size() >= 2 && std::isalpha(static_cast<unsigned char>(normalized[0])) &&
      normalized[1] == ':' && (normalized.size() == 2 || normalized[2] == '/')) {
    char drive = static_cast<char>(std::tolower(static_cast<unsigned char>(normalized[0])));
    std::string rest = normalized.size() > 3 ? normalized.substr(3) : "";
    normalized = std::string("/cygdrive/") + drive + "/" + rest;
  }
  return normalized;
}

std::string TransferCommandBuilder::join_remote_path(const std::vector<std::string>& parts) {
  std::string joined;
  for (const auto& part : parts) {
    for (const auto& segment : split_segments(part)) {
      if (segment == "..") {
        throw ValidationError("remote path may not contain '..': " + part);
      }
      if (segment == ".") continue;
      if (!joined.empty()) joined += '/';
      joined += segment;
    }
  }
  return joined;
}

std::string TransferCommandBuilder::redact_for_logging(const std::vector<std::string>& argv) {
  std::ostringstream line;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) line << ' ';
    if (argv[i].compare(0, kPasswordFlag.size(), kPasswordFlag) == 0) {
      line << kPasswordFlag << "[PASSWORD-FILE]";
    } else {
      line << argv[i];
    }
  }
  return line.str();
}

} // namespace transfer
} // namespace docrep
