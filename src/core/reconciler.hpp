// core/reconciler.hpp - Mount reconciliation pass
#pragma once

#include "../conf/config.hpp"
#include "../mount/backend.hpp"
#include "../net/probe.hpp"
#include "../net/vpn.hpp"
#include "cleaner.hpp"
#include "endpoints.hpp"
#include "executor.hpp"
#include "observer.hpp"
#include "outage.hpp"
#include "session.hpp"
#include <string>
#include <vector>

namespace stablemount {

enum class PassOutcome {
  Unchanged,   // already correct, nothing done
  Mounted,     // was idle, now mounted
  Switched,    // moved from VPN to a local endpoint
  Remounted,   // moved back to the canonical path, or kept the old endpoint
  Busy,        // another pass holds the lock
  Unreachable, // no endpoint answered
  Blocked,     // stale directory needs manual removal
  Failed       // endpoints answered but no mount landed
};

std::string pass_outcome_to_string(PassOutcome outcome);
int exit_code_for(PassOutcome outcome);

class Reconciler {
public:
  Reconciler(const Config &config, MountBackend &backend, Prober &prober,
             VpnStatus &vpn, SessionChannel &session);

  // One pass against freshly observed state. Not locked; see run_pass().
  PassOutcome run();

private:
  PassOutcome reconcile_idle();
  PassOutcome reconcile_correct(const ShareMountSet &set);
  PassOutcome reconcile_misplaced(const ShareMountSet &set);

  PassOutcome mount_best(const std::vector<Endpoint> &ranked,
                         bool report_outage);
  PassOutcome fall_back_to(const Endpoint &original,
                           const std::vector<Endpoint> &ranked);
  bool check_blocked();
  void report_blocked(const StaleCheck &check);

  const Config &config_;
  MountBackend &backend_;
  Prober &prober_;
  VpnStatus &vpn_;
  MountObserver observer_;
  StaleCleaner cleaner_;
  MountExecutor executor_;
  SessionPreserver session_;
  OutageNotifier outage_;
};

// Wraps one pass in the run lock. Lock contention is a Busy no-op; a lock
// that cannot be created at all fails the pass.
PassOutcome run_pass(const Config &config, Reconciler &reconciler);

} // namespace stablemount
