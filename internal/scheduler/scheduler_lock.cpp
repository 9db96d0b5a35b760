#include "scheduler_lock.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <string>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledcast::scheduler {

using observability::IntField;
using observability::StringField;

namespace {

std::optional<pid_t> ReadPid(int fd) {
  char    buf[32] = {};
  ssize_t n       = pread(fd, buf, sizeof(buf) - 1, 0);
  if (n <= 0) return std::nullopt;

  std::size_t len = static_cast<std::size_t>(n);
  while (len > 0 && (buf[len - 1] == '\n' || buf[len - 1] == ' ')) --len;

  pid_t pid = 0;
  auto [ptr, ec] = std::from_chars(buf, buf + len, pid);
  if (ec != std::errc() || ptr != buf + len || pid <= 0) return std::nullopt;
  return pid;
}

bool ProcessAlive(pid_t pid) {
  if (kill(pid, 0) == 0) return true;
  // EPERM: exists but owned by someone else
  return errno != ESRCH;
}

void WritePid(int fd, const std::filesystem::path& path) {
  const auto text = std::to_string(getpid()) + "\n";
  if (ftruncate(fd, 0) != 0 || pwrite(fd, text.data(), text.size(), 0) != static_cast<ssize_t>(text.size())) {
    throw std::system_error(errno, std::generic_category(), "write scheduler lock " + path.string());
  }
}

} // namespace

SchedulerLock::SchedulerLock(std::filesystem::path path) : path_(std::move(path)) {}

SchedulerLock::~SchedulerLock() {
  Release();
}

LockAcquisition SchedulerLock::Acquire() {
  if (Held()) {
    throw util::InvalidState("scheduler lock already held by this instance");
  }

  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path());
  }

  int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(), "open scheduler lock " + path_.string());
  }

  if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int  err   = errno;
    const auto owner = ReadPid(fd);
    close(fd);
    if (err == EWOULDBLOCK) {
      std::string holder = "unknown";
      if (owner) holder = std::to_string(*owner) + (ProcessAlive(*owner) ? "" : " (not running)");
      throw util::LockContention("scheduler lock " + path_.string() + " held by pid " + holder);
    }
    throw std::system_error(err, std::generic_category(), "flock " + path_.string());
  }

  // The flock is ours, so whoever the file names is gone. A live process
  // with that PID is an unrelated reuse.
  auto acquisition = LockAcquisition::kAcquired;
  if (const auto owner = ReadPid(fd); owner && *owner != getpid()) {
    LEDCAST_LOG_WARN("reclaimed stale scheduler lock", {StringField("path", path_.string()), IntField("previous_pid", *owner),
                                                        observability::BoolField("pid_reused", ProcessAlive(*owner))});
    acquisition = LockAcquisition::kReclaimedStale;
  }

  try {
    WritePid(fd, path_);
  } catch (...) {
    flock(fd, LOCK_UN);
    close(fd);
    throw;
  }

  fd_ = fd;
  return acquisition;
}

void SchedulerLock::Release() {
  if (fd_ < 0) return;
  if (ftruncate(fd_, 0) != 0) {
    LEDCAST_LOG_WARN("scheduler lock truncate failed", {StringField("path", path_.string()), IntField("errno", errno)});
  }
  flock(fd_, LOCK_UN);
  close(fd_);
  fd_ = -1;
}

std::optional<pid_t> SchedulerLock::RecordedOwner() const {
  if (fd_ >= 0) return ReadPid(fd_);

  int fd = open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) return std::nullopt;
  auto pid = ReadPid(fd);
  close(fd);
  return pid;
}

} // namespace ledcast::scheduler
