// mount/backend.hpp - OS mount operations
#pragma once

#include "../conf/config.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace stablemount {

struct MountEntry {
  std::string source; // e.g. //guest@Mac-Server.local/RAID%20Store
  fs::path path;
};

// /proc/self/mounts format, octal escapes decoded
std::vector<MountEntry> parse_kernel_mounts(const std::string &text);

// mount(8) output: "src on path (opts)" or "src on path type fs (opts)"
std::vector<MountEntry> parse_mount_output(const std::string &text);

// The operations the engine needs from the OS. Mount requests may complete
// asynchronously and at a different path than requested.
class MountBackend {
public:
  virtual ~MountBackend() = default;

  virtual std::vector<MountEntry> list_mounts() = 0;
  virtual bool request_mount(const std::string &host, const fs::path &path) = 0;
  virtual bool unmount(const fs::path &path) = 0;
};

// Drives mount/unmount through the configured shell command templates and
// reads the mount table from the kernel (or a listing command).
class CommandMountBackend : public MountBackend {
public:
  CommandMountBackend(const Config &config);

  std::vector<MountEntry> list_mounts() override;
  bool request_mount(const std::string &host, const fs::path &path) override;
  bool unmount(const fs::path &path) override;

private:
  std::map<std::string, std::string> template_vars(const std::string &host,
                                                   const fs::path &path) const;

  const Config &config_;
};

} // namespace stablemount
