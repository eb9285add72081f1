// core/executor.hpp - Mount execution
#pragma once

#include "../conf/config.hpp"
#include "../mount/backend.hpp"
#include "cleaner.hpp"
#include "endpoints.hpp"
#include "observer.hpp"
#include <string>

namespace stablemount {

enum class MountResult { Mounted, TimedOut, Blocked };

class MountExecutor {
public:
  MountExecutor(const Config &config, MountBackend &backend,
                MountObserver &observer, StaleCleaner &cleaner);

  // Requests the mount and polls until a new instance of the share shows up
  // anywhere. On
  // timeout, an instance that landed late at a non-canonical path is torn
  // down and the request is retried once.
  MountResult mount_and_wait(const Endpoint &endpoint);

  // Message of the last Blocked result
  const StaleCheck &last_stale_check() const { return stale_; }

private:
  bool request_and_poll(const Endpoint &endpoint, const ShareMountSet &before);

  const Config &config_;
  MountBackend &backend_;
  MountObserver &observer_;
  StaleCleaner &cleaner_;
  StaleCheck stale_;
};

} // namespace stablemount
