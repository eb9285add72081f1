// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../utils.hpp"
#include <fstream>
#include <stdexcept>

namespace stablemount {

Config Config::load_default() {
  Config config;
  // Try to load from default location if exists
  fs::path default_path = fs::path(CONFIG_DIR) / CONFIG_FILENAME;
  if (fs::exists(default_path)) {
    try {
      return from_file(default_path);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load default config, using defaults: " +
               std::string(e.what()));
    }
  }
  return config;
}

static std::string unquote(const std::string &raw) {
  std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

static int parse_int(const std::string &key, const std::string &value) {
  try {
    size_t used = 0;
    int n = std::stoi(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
    return n;
  } catch (const std::exception &) {
    throw std::runtime_error("Invalid integer for " + key + ": " + value);
  }
}

Config Config::from_file(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file " + path.string());
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string stripped = trim(line);
    if (stripped.empty() || stripped[0] == '#')
      continue;

    auto eq_pos = stripped.find('=');
    if (eq_pos == std::string::npos)
      continue;

    std::string key = trim(stripped.substr(0, eq_pos));
    std::string value = unquote(stripped.substr(eq_pos + 1));

    if (key == "mount_point")
      config.mount_point = value;
    else if (key == "share_name")
      config.share_name = value;
    else if (key == "local_host_1")
      config.local_host_1 = value;
    else if (key == "local_host_2")
      config.local_host_2 = value;
    else if (key == "vpn_peer")
      config.vpn_peer = value;
    else if (key == "vpn_fallback_ip")
      config.vpn_fallback_ip = value;
    else if (key == "vpn_cli")
      config.vpn_cli = value;
    else if (key == "port")
      config.port = parse_int(key, value);
    else if (key == "probe_timeout_ms")
      config.probe_timeout_ms = parse_int(key, value);
    else if (key == "poll_attempts")
      config.poll_attempts = parse_int(key, value);
    else if (key == "poll_interval_ms")
      config.poll_interval_ms = parse_int(key, value);
    else if (key == "settle_ms")
      config.settle_ms = parse_int(key, value);
    else if (key == "variant_count")
      config.variant_count = parse_int(key, value);
    else if (key == "lock_file")
      config.lock_file = value;
    else if (key == "lock_stale_seconds")
      config.lock_stale_seconds = parse_int(key, value);
    else if (key == "outage_marker")
      config.outage_marker = value;
    else if (key == "mounts_file")
      config.mounts_file = value;
    else if (key == "mount_list_command")
      config.mount_list_command = value;
    else if (key == "mount_command")
      config.mount_command = value;
    else if (key == "unmount_command")
      config.unmount_command = value;
    else if (key == "session_capture_command")
      config.session_capture_command = value;
    else if (key == "session_open_window_command")
      config.session_open_window_command = value;
    else if (key == "session_open_tab_command")
      config.session_open_tab_command = value;
    else if (key == "log_file")
      config.log_file = value;
    else if (key == "verbose")
      config.verbose = (value == "true");
    else
      LOG_WARN("Unknown config key: " + key);
  }

  if (config.mount_point.empty() || !config.mount_point.is_absolute()) {
    throw std::runtime_error("mount_point must be an absolute path");
  }
  if (config.share_name.empty()) {
    throw std::runtime_error("share_name must not be empty");
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# stablemount configuration\n";
  file << "mount_point = \"" << mount_point.string() << "\"\n";
  file << "share_name = \"" << share_name << "\"\n\n";

  file << "# Endpoints, most preferred first\n";
  file << "local_host_1 = \"" << local_host_1 << "\"\n";
  file << "local_host_2 = \"" << local_host_2 << "\"\n";
  file << "vpn_peer = \"" << vpn_peer << "\"\n";
  file << "vpn_fallback_ip = \"" << vpn_fallback_ip << "\"\n";
  file << "vpn_cli = \"" << vpn_cli << "\"\n";
  file << "port = " << port << "\n\n";

  file << "probe_timeout_ms = " << probe_timeout_ms << "\n";
  file << "poll_attempts = " << poll_attempts << "\n";
  file << "poll_interval_ms = " << poll_interval_ms << "\n";
  file << "settle_ms = " << settle_ms << "\n";
  file << "variant_count = " << variant_count << "\n\n";

  file << "lock_file = \"" << lock_file.string() << "\"\n";
  file << "lock_stale_seconds = " << lock_stale_seconds << "\n";
  file << "outage_marker = \"" << outage_marker.string() << "\"\n\n";

  file << "# Placeholders: {host} {share} {share_enc} {unc} {url} {path}\n";
  file << "mounts_file = \"" << mounts_file.string() << "\"\n";
  file << "mount_list_command = \"" << mount_list_command << "\"\n";
  file << "mount_command = \"" << mount_command << "\"\n";
  file << "unmount_command = \"" << unmount_command << "\"\n\n";

  file << "# Leave the capture command empty to disable session restore\n";
  file << "session_capture_command = \"" << session_capture_command << "\"\n";
  file << "session_open_window_command = \"" << session_open_window_command
       << "\"\n";
  file << "session_open_tab_command = \"" << session_open_tab_command
       << "\"\n\n";

  if (!log_file.empty()) {
    file << "log_file = \"" << log_file.string() << "\"\n";
  }
  file << "verbose = " << (verbose ? "true" : "false") << "\n";

  return file.good();
}

void Config::merge_with_cli(const fs::path &log_file_override,
                            bool verbose_override) {
  if (!log_file_override.empty()) {
    log_file = log_file_override;
  }
  if (verbose_override) {
    verbose = true;
  }
}

std::vector<fs::path> Config::candidate_paths() const {
  std::vector<fs::path> paths;
  paths.push_back(mount_point);
  for (int i = 1; i <= variant_count; ++i) {
    paths.emplace_back(mount_point.string() + "-" + std::to_string(i));
  }
  return paths;
}

} // namespace stablemount
