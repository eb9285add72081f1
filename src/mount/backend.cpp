// mount/backend.cpp - OS mount operations implementation
#include "backend.hpp"
#include "../utils.hpp"
#include <fstream>
#include <sstream>

namespace stablemount {

// Kernel escapes space, tab, newline and backslash as \ooo
static std::string decode_octal_escapes(const std::string &s) {
  std::string out;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size()) {
      const char a = s[i + 1], b = s[i + 2], c = s[i + 3];
      if (a >= '0' && a <= '3' && b >= '0' && b <= '7' && c >= '0' &&
          c <= '7') {
        out += static_cast<char>((a - '0') * 64 + (b - '0') * 8 + (c - '0'));
        i += 3;
        continue;
      }
    }
    out += s[i];
  }
  return out;
}

std::vector<MountEntry> parse_kernel_mounts(const std::string &text) {
  std::vector<MountEntry> entries;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream ls(line);
    std::string source, target;
    if (!(ls >> source >> target))
      continue;
    entries.push_back({decode_octal_escapes(source),
                       fs::path(decode_octal_escapes(target))});
  }
  return entries;
}

std::vector<MountEntry> parse_mount_output(const std::string &text) {
  std::vector<MountEntry> entries;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    auto on_pos = line.find(" on ");
    if (on_pos == std::string::npos)
      continue;

    std::string source = line.substr(0, on_pos);
    std::string rest = line.substr(on_pos + 4);

    auto opts_pos = rest.rfind(" (");
    if (opts_pos != std::string::npos)
      rest = rest.substr(0, opts_pos);

    // Linux mount(8) puts "type <fs>" between path and options
    auto type_pos = rest.rfind(" type ");
    if (type_pos != std::string::npos)
      rest = rest.substr(0, type_pos);

    if (source.empty() || rest.empty())
      continue;
    entries.push_back({source, fs::path(rest)});
  }
  return entries;
}

CommandMountBackend::CommandMountBackend(const Config &config)
    : config_(config) {}

std::vector<MountEntry> CommandMountBackend::list_mounts() {
  if (!config_.mount_list_command.empty()) {
    std::string output;
    if (!run_command_capture(config_.mount_list_command, output)) {
      LOG_WARN("Mount listing command failed: " + config_.mount_list_command);
      return {};
    }
    return parse_mount_output(output);
  }

  std::ifstream file(config_.mounts_file);
  if (!file.is_open()) {
    LOG_ERROR("Cannot read mount table " + config_.mounts_file.string());
    return {};
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_kernel_mounts(buffer.str());
}

std::map<std::string, std::string>
CommandMountBackend::template_vars(const std::string &host,
                                   const fs::path &path) const {
  std::string share_enc = url_encode(config_.share_name);
  return {
      {"host", host},
      {"share", config_.share_name},
      {"share_enc", share_enc},
      {"unc", "//" + url_decode(host) + "/" + config_.share_name},
      {"url", "smb://" + host + "/" + share_enc},
      {"path", path.string()},
  };
}

bool CommandMountBackend::request_mount(const std::string &host,
                                        const fs::path &path) {
  std::string cmd =
      expand_template(config_.mount_command, template_vars(host, path));
  int ret = run_command(cmd + " >/dev/null 2>&1");
  if (ret != 0) {
    LOG_WARN("Mount request for " + host + " exited with " +
             std::to_string(ret));
    return false;
  }
  return true;
}

bool CommandMountBackend::unmount(const fs::path &path) {
  std::string cmd =
      expand_template(config_.unmount_command, template_vars("", path));
  int ret = run_command(cmd + " >/dev/null 2>&1");
  if (ret != 0) {
    LOG_WARN("Unmount of " + path.string() + " exited with " +
             std::to_string(ret));
    return false;
  }
  return true;
}

} // namespace stablemount
