// core/lock.cpp - Single-pass run lock implementation
#include "lock.hpp"
#include "../utils.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>

namespace stablemount {

RunGuard::RunGuard(const fs::path &lock_path, int stale_seconds)
    : lock_path_(lock_path), stale_seconds_(stale_seconds) {}

RunGuard::~RunGuard() { release(); }

LockStatus RunGuard::try_create() {
  int fd = open(lock_path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC,
                0644);
  if (fd < 0) {
    if (errno == EEXIST) {
      return LockStatus::Contended;
    }
    LOG_ERROR("Cannot create lock " + lock_path_.string() + ": " +
              strerror(errno));
    return LockStatus::Error;
  }

  // pid, time and a per-process sequence number tell owners apart
  static std::atomic<unsigned> sequence{0};
  owner_ = std::to_string(getpid()) + " " + std::to_string(std::time(nullptr)) +
           " " + std::to_string(sequence.fetch_add(1));
  std::string content = owner_ + "\n";
  if (write(fd, content.data(), content.size()) < 0) {
    LOG_DEBUG("Cannot write lock owner: " + std::string(strerror(errno)));
  }
  close(fd);
  return LockStatus::Acquired;
}

LockStatus RunGuard::acquire() {
  if (held_) {
    return LockStatus::Acquired;
  }
  if (lock_path_.has_parent_path()) {
    ensure_dir_exists(lock_path_.parent_path());
  }

  LockStatus status = try_create();
  if (status != LockStatus::Contended) {
    held_ = status == LockStatus::Acquired;
    return status;
  }

  std::error_code ec;
  auto mtime = fs::last_write_time(lock_path_, ec);
  if (ec) {
    // Vanished between our create and stat; the owner just finished
    status = try_create();
    held_ = status == LockStatus::Acquired;
    return status;
  }

  auto age = std::chrono::duration_cast<std::chrono::seconds>(
                 fs::file_time_type::clock::now() - mtime)
                 .count();
  if (age <= stale_seconds_) {
    LOG_DEBUG("Another pass holds " + lock_path_.string() + " (age " +
              std::to_string(age) + "s)");
    return LockStatus::Contended;
  }

  LOG_WARN("Reclaiming stale lock " + lock_path_.string() + " (age " +
           std::to_string(age) + "s)");
  fs::remove(lock_path_, ec);
  status = try_create();
  held_ = status == LockStatus::Acquired;
  return status;
}

bool RunGuard::still_owner() const {
  std::ifstream file(lock_path_);
  std::string line;
  if (!file.is_open() || !std::getline(file, line)) {
    return false;
  }
  return trim(line) == owner_;
}

void RunGuard::release() {
  if (!held_) {
    return;
  }
  held_ = false;

  if (!still_owner()) {
    LOG_WARN("Lock " + lock_path_.string() +
             " was reclaimed by another pass, leaving it in place");
    return;
  }
  std::error_code ec;
  fs::remove(lock_path_, ec);
  if (ec) {
    LOG_WARN("Failed to remove lock " + lock_path_.string() + ": " +
             ec.message());
  }
}

} // namespace stablemount
