// core/observer.hpp - Mount state observation
#pragma once

#include "../conf/config.hpp"
#include "../mount/backend.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace stablemount {

// All active mounts of the share, wherever they are
struct ShareMountSet {
  std::vector<MountEntry> entries;

  bool empty() const { return entries.empty(); }
  bool contains(const fs::path &path) const;
  std::vector<MountEntry> others_than(const fs::path &path) const;
};

// True when the last component of the remote path names the share,
// percent-encoded or plain.
bool source_matches_share(const std::string &source,
                          const std::string &share_name);

// //user@host/share -> host
std::string parse_remote_host(const std::string &source);

class MountObserver {
public:
  MountObserver(const Config &config, MountBackend &backend);

  // Reads the OS mount table afresh on every call
  ShareMountSet observe();
  bool is_mounted_at(const fs::path &path);
  std::string current_remote_host(const fs::path &path);

private:
  const Config &config_;
  MountBackend &backend_;
};

} // namespace stablemount
