#pragma once

#include <sys/types.h>

#include <filesystem>
#include <optional>

namespace ledcast::scheduler {

enum class LockAcquisition {
  kAcquired,
  // The file named another process that no longer held the flock.
  kReclaimedStale,
};

/*
  Cross-process exclusive lock over conversion work.

  flock(LOCK_EX | LOCK_NB) on lock_path, with the owner's PID written
  inside. The kernel drops the flock when the owner dies, so a crash never
  wedges the lock; the PID only identifies the holder.
*/
class SchedulerLock {
 public:
  explicit SchedulerLock(std::filesystem::path path);
  ~SchedulerLock();

  SchedulerLock(const SchedulerLock&)            = delete;
  SchedulerLock& operator=(const SchedulerLock&) = delete;

  // Throws util::LockContention when another open file description holds
  // the flock. A recorded PID alone never blocks acquisition.
  LockAcquisition Acquire();

  // Truncates the PID and unlocks. No-op when not held.
  void Release();

  bool Held() const {
    return fd_ >= 0;
  }

  const std::filesystem::path& Path() const {
    return path_;
  }

  // PID recorded in the lock file, if any.
  std::optional<pid_t> RecordedOwner() const;

 private:
  std::filesystem::path path_;
  int                   fd_ = -1;
};

/*
  RAII guard: acquires on construction, releases on scope exit.
*/
class SchedulerLockGuard {
 public:
  explicit SchedulerLockGuard(SchedulerLock& lock) : lock_(lock), acquisition_(lock.Acquire()) {
  }
  ~SchedulerLockGuard() {
    lock_.Release();
  }

  SchedulerLockGuard(const SchedulerLockGuard&)            = delete;
  SchedulerLockGuard& operator=(const SchedulerLockGuard&) = delete;

  LockAcquisition Acquisition() const {
    return acquisition_;
  }

 private:
  SchedulerLock&  lock_;
  LockAcquisition acquisition_;
};

} // namespace ledcast::scheduler
