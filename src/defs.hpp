// Constants and definitions
#pragma once

namespace stablemount {

// Directories and files
constexpr const char *CONFIG_DIR = "/etc/stablemount/";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *DEFAULT_LOCK_FILE = "/tmp/stablemount.lock";
constexpr const char *DEFAULT_OUTAGE_MARKER = "/tmp/stablemount.unreachable";
constexpr const char *KERNEL_MOUNTS_FILE = "/proc/self/mounts";

// Share defaults
constexpr const char *DEFAULT_MOUNT_POINT = "/mnt/RAID Store";
constexpr const char *DEFAULT_SHARE_NAME = "RAID Store";
constexpr const char *DEFAULT_LOCAL_HOST_1 = "Mac-Server.local";
constexpr const char *DEFAULT_LOCAL_HOST_2 = "Mac Server._smb._tcp.local";
constexpr const char *DEFAULT_VPN_PEER = "mac-server";
constexpr const char *DEFAULT_VPN_FALLBACK_IP = "100.76.199.85";
constexpr const char *DEFAULT_VPN_CLI = "tailscale";

// SMB
constexpr int SMB_PORT = 445;

// Timing
constexpr int PROBE_TIMEOUT_MS = 1000;
constexpr int PROBE_RETRY_EXTRA_MS = 500;
constexpr int MOUNT_POLL_ATTEMPTS = 20;
constexpr int MOUNT_POLL_INTERVAL_MS = 1000;
constexpr int UNMOUNT_SETTLE_MS = 1000;
constexpr int LOCK_STALE_SECONDS = 120;

// Numbered variants the OS may create next to the canonical path
constexpr int VARIANT_COUNT = 3;

// Command templates
constexpr const char *DEFAULT_MOUNT_COMMAND =
    "mkdir -p {path} && mount -t cifs {unc} {path} -o guest";
constexpr const char *DEFAULT_UNMOUNT_COMMAND = "umount {path}";
constexpr const char *DEFAULT_OPEN_WINDOW_COMMAND = "xdg-open {path}";
constexpr const char *DEFAULT_OPEN_TAB_COMMAND = "xdg-open {path}";

} // namespace stablemount
