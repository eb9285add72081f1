// core/cleaner.hpp - Stale mount directory cleanup
#pragma once

#include "observer.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace stablemount {

struct StaleCheck {
  bool blocked = false;
  std::string message;
  std::string remedy;
};

class StaleCleaner {
public:
  StaleCleaner(MountObserver &observer);

  // Opportunistic: removes empty, unmounted candidate directories and
  // ignores every failure.
  void preclean(const std::vector<fs::path> &candidates);

  // An unmounted directory at path would push the next mount to a numbered
  // variant. Blocked when it cannot be removed.
  StaleCheck check_stale_blocking(const fs::path &path);

private:
  MountObserver &observer_;
};

} // namespace stablemount
