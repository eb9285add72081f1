// core/executor.cpp - Mount execution implementation
#include "executor.hpp"
#include "../utils.hpp"

namespace stablemount {

MountExecutor::MountExecutor(const Config &config, MountBackend &backend,
                             MountObserver &observer, StaleCleaner &cleaner)
    : config_(config), backend_(backend), observer_(observer),
      cleaner_(cleaner) {}

// Instances present before a request say nothing about whether it worked
static ShareMountSet new_since(const ShareMountSet &now,
                               const ShareMountSet &before) {
  ShareMountSet fresh;
  for (const auto &entry : now.entries) {
    if (!before.contains(entry.path))
      fresh.entries.push_back(entry);
  }
  return fresh;
}

bool MountExecutor::request_and_poll(const Endpoint &endpoint,
                                     const ShareMountSet &before) {
  LOG_DEBUG("Requesting mount via " + endpoint.label + " (" +
            endpoint.mount_host + ")");
  if (!backend_.request_mount(endpoint.mount_host, config_.mount_point)) {
    return false;
  }

  for (int i = 0; i < config_.poll_attempts; ++i) {
    // Landing at a numbered variant still counts; a later pass moves it
    if (!new_since(observer_.observe(), before).empty()) {
      return true;
    }
    sleep_ms(config_.poll_interval_ms);
  }
  return false;
}

MountResult MountExecutor::mount_and_wait(const Endpoint &endpoint) {
  stale_ = StaleCheck{};
  ShareMountSet before = observer_.observe();

  if (request_and_poll(endpoint, before)) {
    return MountResult::Mounted;
  }

  ShareMountSet late = new_since(observer_.observe(), before);
  if (late.contains(config_.mount_point)) {
    return MountResult::Mounted;
  }
  if (late.empty()) {
    LOG_WARN("Mount via " + endpoint.label + " (" + endpoint.mount_host +
             ") did not appear in time");
    return MountResult::TimedOut;
  }

  // The OS finished the mount after the poll window, somewhere else
  LOG_WARN("Share landed late at " + late.entries.front().path.string() +
           ", retrying at " + config_.mount_point.string());
  for (const auto &entry : late.entries) {
    backend_.unmount(entry.path);
  }
  cleaner_.preclean(config_.candidate_paths());

  stale_ = cleaner_.check_stale_blocking(config_.mount_point);
  if (stale_.blocked) {
    return MountResult::Blocked;
  }

  if (request_and_poll(endpoint, observer_.observe())) {
    return MountResult::Mounted;
  }
  LOG_WARN("Retry via " + endpoint.label + " did not mount the share");
  return MountResult::TimedOut;
}

} // namespace stablemount
