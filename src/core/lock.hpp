// core/lock.hpp - Single-pass run lock
#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace stablemount {

enum class LockStatus {
  Acquired,
  Contended, // another pass holds a fresh marker
  Error      // the marker cannot be created at all
};

// Advisory lock marker. Held from a successful acquire() until destruction;
// a marker older than the staleness threshold belongs to a crashed run and
// is reclaimed. The marker records its owner so a guard whose marker was
// reclaimed never removes the new owner's.
class RunGuard {
public:
  RunGuard(const fs::path &lock_path, int stale_seconds);
  ~RunGuard();

  RunGuard(const RunGuard &) = delete;
  RunGuard &operator=(const RunGuard &) = delete;

  LockStatus acquire();
  void release();
  bool held() const { return held_; }

private:
  LockStatus try_create();
  bool still_owner() const;

  fs::path lock_path_;
  int stale_seconds_;
  std::string owner_;
  bool held_ = false;
};

} // namespace stablemount
