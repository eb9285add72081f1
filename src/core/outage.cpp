// core/outage.cpp - Rate-limited outage reporting implementation
#include "outage.hpp"
#include "../utils.hpp"

namespace stablemount {

OutageNotifier::OutageNotifier(const fs::path &marker) : marker_(marker) {}

bool OutageNotifier::active() const {
  std::error_code ec;
  return fs::exists(marker_, ec);
}

void OutageNotifier::log_unreachable_once(const std::string &message) {
  if (active()) {
    LOG_DEBUG("Outage already reported: " + message);
    return;
  }

  LOG_ERROR(message);

  if (marker_.has_parent_path()) {
    ensure_dir_exists(marker_.parent_path());
  }
  std::ofstream file(marker_);
  if (!file.is_open()) {
    LOG_WARN("Cannot write outage marker " + marker_.string());
    return;
  }
  file << iso8601_now() << "\n";
}

void OutageNotifier::clear() {
  std::error_code ec;
  if (fs::remove(marker_, ec)) {
    LOG_INFO("Share reachable again");
  } else if (ec) {
    LOG_WARN("Cannot remove outage marker " + marker_.string() + ": " +
             ec.message());
  }
}

} // namespace stablemount
