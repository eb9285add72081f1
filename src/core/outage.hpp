// core/outage.hpp - Rate-limited outage reporting
#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace stablemount {

// The marker file survives across passes so a scheduler that runs every few
// seconds logs one line per outage instead of one per pass.
class OutageNotifier {
public:
  OutageNotifier(const fs::path &marker);

  void log_unreachable_once(const std::string &message);
  void clear();
  bool active() const;

private:
  fs::path marker_;
};

} // namespace stablemount
