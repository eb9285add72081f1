// conf/config.hpp - Configuration management
#pragma once

#include "../defs.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace stablemount {

struct Config {
  // Share
  fs::path mount_point = DEFAULT_MOUNT_POINT;
  std::string share_name = DEFAULT_SHARE_NAME;

  // Endpoints, in preference order
  std::string local_host_1 = DEFAULT_LOCAL_HOST_1;
  std::string local_host_2 = DEFAULT_LOCAL_HOST_2;
  std::string vpn_peer = DEFAULT_VPN_PEER;
  std::string vpn_fallback_ip = DEFAULT_VPN_FALLBACK_IP;
  std::string vpn_cli = DEFAULT_VPN_CLI;
  int port = SMB_PORT;

  // Timing
  int probe_timeout_ms = PROBE_TIMEOUT_MS;
  int poll_attempts = MOUNT_POLL_ATTEMPTS;
  int poll_interval_ms = MOUNT_POLL_INTERVAL_MS;
  int settle_ms = UNMOUNT_SETTLE_MS;
  int variant_count = VARIANT_COUNT;

  // Markers
  fs::path lock_file = DEFAULT_LOCK_FILE;
  int lock_stale_seconds = LOCK_STALE_SECONDS;
  fs::path outage_marker = DEFAULT_OUTAGE_MARKER;

  // OS operations
  fs::path mounts_file = KERNEL_MOUNTS_FILE;
  std::string mount_list_command;
  std::string mount_command = DEFAULT_MOUNT_COMMAND;
  std::string unmount_command = DEFAULT_UNMOUNT_COMMAND;

  // Session preservation (off when the capture command is empty)
  std::string session_capture_command;
  std::string session_open_window_command = DEFAULT_OPEN_WINDOW_COMMAND;
  std::string session_open_tab_command = DEFAULT_OPEN_TAB_COMMAND;

  fs::path log_file;
  bool verbose = false;

  static Config load_default();
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  void merge_with_cli(const fs::path &log_file_override,
                      bool verbose_override);

  // Canonical path followed by its numbered variants
  std::vector<fs::path> candidate_paths() const;
};

} // namespace stablemount
