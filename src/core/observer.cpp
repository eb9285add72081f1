// core/observer.cpp - Mount state observation implementation
#include "observer.hpp"
#include "../utils.hpp"

namespace stablemount {

bool ShareMountSet::contains(const fs::path &path) const {
  for (const auto &entry : entries) {
    if (entry.path == path)
      return true;
  }
  return false;
}

std::vector<MountEntry> ShareMountSet::others_than(const fs::path &path) const {
  std::vector<MountEntry> result;
  for (const auto &entry : entries) {
    if (entry.path != path)
      result.push_back(entry);
  }
  return result;
}

bool source_matches_share(const std::string &source,
                          const std::string &share_name) {
  std::string remote = source;
  while (!remote.empty() && remote.back() == '/')
    remote.pop_back();

  auto slash = remote.rfind('/');
  if (slash == std::string::npos)
    return false;

  // Need a host part in front of the share component
  std::string head = remote.substr(0, slash);
  while (!head.empty() && head.back() == '/')
    head.pop_back();
  if (head.empty() || head.back() == ':')
    return false;

  std::string last = remote.substr(slash + 1);
  return last == url_encode(share_name) || url_decode(last) == share_name;
}

std::string parse_remote_host(const std::string &source) {
  std::string s = source;

  auto scheme = s.find("://");
  if (scheme != std::string::npos) {
    s = s.substr(scheme + 3);
  } else {
    while (!s.empty() && s.front() == '/')
      s.erase(0, 1);
  }

  auto slash = s.find('/');
  if (slash != std::string::npos)
    s = s.substr(0, slash);

  auto at = s.rfind('@');
  if (at != std::string::npos)
    s = s.substr(at + 1);

  return s;
}

MountObserver::MountObserver(const Config &config, MountBackend &backend)
    : config_(config), backend_(backend) {}

ShareMountSet MountObserver::observe() {
  ShareMountSet set;
  for (auto &entry : backend_.list_mounts()) {
    if (source_matches_share(entry.source, config_.share_name)) {
      set.entries.push_back(std::move(entry));
    }
  }
  return set;
}

bool MountObserver::is_mounted_at(const fs::path &path) {
  for (const auto &entry : backend_.list_mounts()) {
    if (entry.path == path)
      return true;
  }
  return false;
}

std::string MountObserver::current_remote_host(const fs::path &path) {
  for (const auto &entry : observe().entries) {
    if (entry.path == path)
      return parse_remote_host(entry.source);
  }
  return "";
}

} // namespace stablemount
