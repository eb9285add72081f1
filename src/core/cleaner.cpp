// core/cleaner.cpp - Stale mount directory cleanup implementation
#include "cleaner.hpp"
#include "../utils.hpp"

namespace stablemount {

StaleCleaner::StaleCleaner(MountObserver &observer) : observer_(observer) {}

void StaleCleaner::preclean(const std::vector<fs::path> &candidates) {
  for (const auto &path : candidates) {
    if (!is_dir_at(path) || observer_.is_mounted_at(path)) {
      continue;
    }
    if (remove_empty_dir(path)) {
      LOG_DEBUG("Removed leftover mount directory " + path.string());
    }
  }
}

StaleCheck StaleCleaner::check_stale_blocking(const fs::path &path) {
  StaleCheck check;
  if (!is_dir_at(path) || observer_.is_mounted_at(path)) {
    return check;
  }

  if (remove_empty_dir(path)) {
    LOG_INFO("Removed stale directory " + path.string());
    return check;
  }

  check.blocked = true;
  check.message = "Stale directory at " + path.string() +
                  " cannot be removed (needs sudo)";
  check.remedy = "Run: sudo rmdir \"" + path.string() + "\"";
  return check;
}

} // namespace stablemount
