// core/session.hpp - Browser window preservation across remounts
#pragma once

#include "../conf/config.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace stablemount {

// One entry per window, each with its open locations in tab order
using WindowGroup = std::vector<std::string>;

struct SessionSnapshot {
  std::vector<WindowGroup> windows;

  bool empty() const { return windows.empty(); }
};

// Access to the file browser's open windows
class SessionChannel {
public:
  virtual ~SessionChannel() = default;

  virtual bool open_locations(std::vector<WindowGroup> &windows) = 0;
  virtual bool open_window(const std::string &path) = 0;
  virtual bool open_tab(const std::string &path) = 0;
};

class NullSessionChannel : public SessionChannel {
public:
  bool open_locations(std::vector<WindowGroup> &windows) override {
    windows.clear();
    return true;
  }
  bool open_window(const std::string &) override { return true; }
  bool open_tab(const std::string &) override { return true; }
};

// Capture command prints one path per line, windows separated by a blank
// line. Open commands take a {path} placeholder.
class CommandSessionChannel : public SessionChannel {
public:
  CommandSessionChannel(const Config &config);

  bool open_locations(std::vector<WindowGroup> &windows) override;
  bool open_window(const std::string &path) override;
  bool open_tab(const std::string &path) override;

private:
  const Config &config_;
};

std::vector<WindowGroup> parse_window_groups(const std::string &text);

// Rewrites path from old_prefix to new_prefix. Empty when path is not
// under old_prefix.
std::string remap_path(const std::string &path, const std::string &old_prefix,
                       const std::string &new_prefix);

class SessionPreserver {
public:
  SessionPreserver(SessionChannel &channel);

  // Best effort: any failure yields an empty snapshot
  SessionSnapshot capture(const fs::path &prefix);

  // Best effort: reopens surviving paths, never throws
  void restore(const SessionSnapshot &snapshot, const fs::path &old_prefix,
               const fs::path &new_prefix);

private:
  SessionChannel &channel_;
};

} // namespace stablemount
