// core/session.cpp - Browser window preservation implementation
#include "session.hpp"
#include "../utils.hpp"
#include <sstream>

namespace stablemount {

CommandSessionChannel::CommandSessionChannel(const Config &config)
    : config_(config) {}

bool CommandSessionChannel::open_locations(std::vector<WindowGroup> &windows) {
  windows.clear();
  if (config_.session_capture_command.empty()) {
    return true;
  }

  std::string output;
  if (!run_command_capture(config_.session_capture_command + " 2>/dev/null",
                           output)) {
    return false;
  }
  windows = parse_window_groups(output);
  return true;
}

bool CommandSessionChannel::open_window(const std::string &path) {
  std::string cmd =
      expand_template(config_.session_open_window_command, {{"path", path}});
  return run_command(cmd + " >/dev/null 2>&1") == 0;
}

bool CommandSessionChannel::open_tab(const std::string &path) {
  std::string cmd =
      expand_template(config_.session_open_tab_command, {{"path", path}});
  return run_command(cmd + " >/dev/null 2>&1") == 0;
}

std::vector<WindowGroup> parse_window_groups(const std::string &text) {
  std::vector<WindowGroup> windows;
  WindowGroup current;

  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    std::string path = trim(line);
    if (path.empty()) {
      if (!current.empty()) {
        windows.push_back(current);
        current.clear();
      }
      continue;
    }
    current.push_back(path);
  }
  if (!current.empty()) {
    windows.push_back(current);
  }
  return windows;
}

std::string remap_path(const std::string &path, const std::string &old_prefix,
                       const std::string &new_prefix) {
  if (path == old_prefix) {
    return new_prefix;
  }
  // "/mnt/Share-1" must not match under "/mnt/Share"
  if (path.size() > old_prefix.size() &&
      path.compare(0, old_prefix.size(), old_prefix) == 0 &&
      path[old_prefix.size()] == '/') {
    return new_prefix + path.substr(old_prefix.size());
  }
  return "";
}

SessionPreserver::SessionPreserver(SessionChannel &channel)
    : channel_(channel) {}

SessionSnapshot SessionPreserver::capture(const fs::path &prefix) {
  SessionSnapshot snapshot;
  try {
    std::vector<WindowGroup> windows;
    if (!channel_.open_locations(windows)) {
      LOG_DEBUG("Could not read open browser windows");
      return snapshot;
    }

    for (const auto &window : windows) {
      WindowGroup kept;
      for (const auto &path : window) {
        if (!remap_path(path, prefix.string(), prefix.string()).empty())
          kept.push_back(path);
      }
      if (!kept.empty())
        snapshot.windows.push_back(kept);
    }
  } catch (const std::exception &e) {
    LOG_WARN("Session capture failed: " + std::string(e.what()));
    snapshot.windows.clear();
  }

  if (!snapshot.empty()) {
    LOG_DEBUG("Captured " + std::to_string(snapshot.windows.size()) +
              " browser window(s) under " + prefix.string());
  }
  return snapshot;
}

void SessionPreserver::restore(const SessionSnapshot &snapshot,
                               const fs::path &old_prefix,
                               const fs::path &new_prefix) {
  if (snapshot.empty()) {
    return;
  }

  int reopened = 0;
  try {
    for (const auto &window : snapshot.windows) {
      bool window_open = false;
      for (const auto &path : window) {
        std::string target =
            remap_path(path, old_prefix.string(), new_prefix.string());
        std::error_code ec;
        if (target.empty() || !fs::exists(target, ec)) {
          LOG_DEBUG("Skipping vanished location " + path);
          continue;
        }

        bool ok = window_open ? channel_.open_tab(target)
                              : channel_.open_window(target);
        if (!ok) {
          LOG_DEBUG("Could not reopen " + target);
          continue;
        }
        window_open = true;
        reopened++;
      }
    }
  } catch (const std::exception &e) {
    LOG_WARN("Session restore failed: " + std::string(e.what()));
    return;
  }

  if (reopened > 0) {
    LOG_INFO("Restored " + std::to_string(reopened) + " browser location(s)");
  }
}

} // namespace stablemount
