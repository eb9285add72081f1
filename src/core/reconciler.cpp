// core/reconciler.cpp - Mount reconciliation pass implementation
#include "reconciler.hpp"
#include "../utils.hpp"
#include "lock.hpp"
#include <algorithm>

namespace stablemount {

std::string pass_outcome_to_string(PassOutcome outcome) {
  switch (outcome) {
  case PassOutcome::Unchanged:
    return "unchanged";
  case PassOutcome::Mounted:
    return "mounted";
  case PassOutcome::Switched:
    return "switched";
  case PassOutcome::Remounted:
    return "remounted";
  case PassOutcome::Busy:
    return "busy";
  case PassOutcome::Unreachable:
    return "unreachable";
  case PassOutcome::Blocked:
    return "blocked";
  case PassOutcome::Failed:
    return "failed";
  }
  return "unknown";
}

int exit_code_for(PassOutcome outcome) {
  switch (outcome) {
  case PassOutcome::Unreachable:
  case PassOutcome::Blocked:
  case PassOutcome::Failed:
    return 1;
  default:
    return 0;
  }
}

Reconciler::Reconciler(const Config &config, MountBackend &backend,
                       Prober &prober, VpnStatus &vpn, SessionChannel &session)
    : config_(config), backend_(backend), prober_(prober), vpn_(vpn),
      observer_(config, backend), cleaner_(observer_),
      executor_(config, backend, observer_, cleaner_), session_(session),
      outage_(config.outage_marker) {}

PassOutcome Reconciler::run() {
  ShareMountSet set = observer_.observe();

  if (set.empty()) {
    return reconcile_idle();
  }
  if (set.contains(config_.mount_point)) {
    return reconcile_correct(set);
  }
  return reconcile_misplaced(set);
}

void Reconciler::report_blocked(const StaleCheck &check) {
  LOG_ERROR(check.message);
  LOG_ERROR(check.remedy);
}

bool Reconciler::check_blocked() {
  StaleCheck check = cleaner_.check_stale_blocking(config_.mount_point);
  if (check.blocked) {
    report_blocked(check);
    return true;
  }
  return false;
}

PassOutcome Reconciler::mount_best(const std::vector<Endpoint> &ranked,
                                   bool report_outage) {
  std::vector<Endpoint> remaining = ranked;
  bool any_reachable = false;

  while (!remaining.empty()) {
    auto endpoint = select_reachable(remaining, prober_);
    if (!endpoint) {
      break;
    }
    any_reachable = true;

    MountResult result = executor_.mount_and_wait(*endpoint);
    if (result == MountResult::Mounted) {
      outage_.clear();
      LOG_INFO("Mounted " + config_.share_name + " via " + endpoint->label +
               " (" + endpoint->mount_host + ")");
      return PassOutcome::Mounted;
    }
    if (result == MountResult::Blocked) {
      report_blocked(executor_.last_stale_check());
      return PassOutcome::Blocked;
    }

    // Everything up to the failed endpoint has been tried
    int failed_rank = endpoint->rank;
    remaining.erase(std::remove_if(remaining.begin(), remaining.end(),
                                   [failed_rank](const Endpoint &ep) {
                                     return ep.rank <= failed_rank;
                                   }),
                    remaining.end());
  }

  if (!any_reachable) {
    std::string message = "Neither local nor VPN host reachable on port " +
                          std::to_string(config_.port);
    if (report_outage) {
      outage_.log_unreachable_once(message);
    } else {
      LOG_ERROR(message);
    }
    return PassOutcome::Unreachable;
  }

  LOG_ERROR("Failed to mount " + config_.share_name +
            " via any reachable endpoint");
  return PassOutcome::Failed;
}

PassOutcome Reconciler::reconcile_idle() {
  LOG_DEBUG(config_.share_name + " is not mounted");

  cleaner_.preclean(config_.candidate_paths());
  if (check_blocked()) {
    return PassOutcome::Blocked;
  }

  return mount_best(rank_endpoints(config_, vpn_), true);
}

PassOutcome Reconciler::fall_back_to(const Endpoint &original,
                                     const std::vector<Endpoint> &ranked) {
  LOG_WARN("Switch to local endpoint failed, remounting via " +
           original.mount_host);

  // The original may have gone away while we were switching
  if (prober_.reachable(original.probe_host)) {
    MountResult result = executor_.mount_and_wait(original);
    if (result == MountResult::Mounted) {
      outage_.clear();
      return PassOutcome::Remounted;
    }
    if (result == MountResult::Blocked) {
      report_blocked(executor_.last_stale_check());
      return PassOutcome::Blocked;
    }
  } else {
    LOG_WARN(original.mount_host + " is no longer reachable");
  }

  std::vector<Endpoint> rest;
  for (const auto &ep : ranked) {
    if (!ep.is_local() && !ep.matches_host(original.mount_host))
      rest.push_back(ep);
  }
  if (rest.empty()) {
    LOG_ERROR("Failed to remount " + config_.share_name + " at " +
              config_.mount_point.string());
    return PassOutcome::Failed;
  }

  PassOutcome outcome = mount_best(rest, false);
  if (outcome == PassOutcome::Mounted) {
    return PassOutcome::Remounted;
  }
  return outcome == PassOutcome::Unreachable ? PassOutcome::Failed : outcome;
}

PassOutcome Reconciler::reconcile_correct(const ShareMountSet &set) {
  const fs::path &canonical = config_.mount_point;

  // Duplicates next to a good canonical mount can go without disruption
  auto extras = set.others_than(canonical);
  for (const auto &entry : extras) {
    LOG_WARN("Unmounting duplicate mount at " + entry.path.string());
    backend_.unmount(entry.path);
  }
  if (!extras.empty()) {
    auto left = observer_.observe().others_than(canonical);
    if (!left.empty()) {
      LOG_ERROR("Could not unmount duplicate at " +
                left.front().path.string() + ", will retry on the next pass");
      return PassOutcome::Failed;
    }
    cleaner_.preclean(config_.candidate_paths());
  }

  std::string current = observer_.current_remote_host(canonical);
  std::vector<Endpoint> ranked = rank_endpoints(config_, vpn_);
  auto current_ep = find_endpoint(ranked, current);
  if (current_ep && current_ep->is_local()) {
    LOG_DEBUG(canonical.string() + " is mounted via " + current_ep->label);
    return PassOutcome::Unchanged;
  }

  auto preferred = select_reachable(local_endpoints(ranked), prober_);
  if (!preferred) {
    LOG_DEBUG(canonical.string() + " stays on " + current);
    return PassOutcome::Unchanged;
  }

  LOG_INFO("Local endpoint " + preferred->mount_host +
           " is reachable, switching " + canonical.string() + " from " +
           current);

  SessionSnapshot snapshot = session_.capture(canonical);
  if (!backend_.unmount(canonical)) {
    LOG_WARN("Cannot unmount " + canonical.string() +
             ", staying on " + current);
    return PassOutcome::Unchanged;
  }
  sleep_ms(config_.settle_ms);
  cleaner_.preclean(config_.candidate_paths());

  for (const auto &ep : local_endpoints(ranked)) {
    if (ep.rank < preferred->rank)
      continue;
    if (ep.rank != preferred->rank && !prober_.reachable(ep.probe_host))
      continue;

    MountResult result = executor_.mount_and_wait(ep);
    if (result == MountResult::Mounted) {
      outage_.clear();
      LOG_INFO("Switched " + canonical.string() + " to " + ep.mount_host);
      session_.restore(snapshot, canonical, canonical);
      return PassOutcome::Switched;
    }
    if (result == MountResult::Blocked) {
      report_blocked(executor_.last_stale_check());
      return PassOutcome::Blocked;
    }
  }

  Endpoint original;
  if (current_ep) {
    original = *current_ep;
  } else {
    original.label = "original";
    original.probe_host = url_decode(current);
    original.mount_host = current;
    original.kind = EndpointKind::VpnDynamic;
    original.rank = static_cast<int>(ranked.size());
  }

  PassOutcome outcome = fall_back_to(original, ranked);
  if (outcome == PassOutcome::Remounted) {
    session_.restore(snapshot, canonical, canonical);
  }
  return outcome;
}

PassOutcome Reconciler::reconcile_misplaced(const ShareMountSet &set) {
  const fs::path &canonical = config_.mount_point;
  fs::path old_prefix = set.entries.front().path;

  std::string paths;
  for (const auto &entry : set.entries) {
    if (!paths.empty())
      paths += ", ";
    paths += entry.path.string();
  }
  LOG_WARN("Found mount(s) at wrong path (" + paths +
           "), unmounting all and fixing to " + canonical.string());

  SessionSnapshot snapshot = session_.capture(old_prefix);

  // All variants go together; an existing one is never reused
  for (const auto &entry : set.entries) {
    backend_.unmount(entry.path);
  }
  sleep_ms(2 * config_.settle_ms);

  ShareMountSet left = observer_.observe();
  if (!left.empty()) {
    LOG_ERROR("Could not unmount " + left.entries.front().path.string() +
              ", will retry on the next pass");
    return PassOutcome::Failed;
  }

  cleaner_.preclean(config_.candidate_paths());
  if (check_blocked()) {
    return PassOutcome::Blocked;
  }

  PassOutcome outcome = mount_best(rank_endpoints(config_, vpn_), true);
  if (outcome != PassOutcome::Mounted) {
    if (outcome == PassOutcome::Failed) {
      LOG_ERROR("Failed to remount after fixing path");
    }
    return outcome;
  }

  LOG_INFO("Successfully remounted at " + canonical.string());
  session_.restore(snapshot, old_prefix, canonical);
  return PassOutcome::Remounted;
}

PassOutcome run_pass(const Config &config, Reconciler &reconciler) {
  RunGuard guard(config.lock_file, config.lock_stale_seconds);
  LockStatus status = guard.acquire();
  if (status == LockStatus::Contended) {
    LOG_DEBUG("Another reconciliation pass is running");
    return PassOutcome::Busy;
  }
  if (status == LockStatus::Error) {
    LOG_ERROR("Cannot take the run lock, skipping this pass");
    return PassOutcome::Failed;
  }
  return reconciler.run();
}

} // namespace stablemount
