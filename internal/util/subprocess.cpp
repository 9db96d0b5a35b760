#include "subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <stdexcept>
#include <system_error>

namespace ledcast::util {
namespace {

constexpr std::size_t kStderrTailBytes = 4096;

class Pipe {
 public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC) != 0) {
      throw std::system_error(errno, std::generic_category(), "pipe2");
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  int Read() const {
    return fds_[0];
  }
  int Write() const {
    return fds_[1];
  }

  void CloseRead() {
    if (fds_[0] >= 0) ::close(fds_[0]);
    fds_[0] = -1;
  }
  void CloseWrite() {
    if (fds_[1] >= 0) ::close(fds_[1]);
    fds_[1] = -1;
  }

 private:
  int fds_[2] = {-1, -1};
};

int WaitForChild(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, std::size_t max_stdout_bytes) {
  if (argv.empty()) {
    throw std::invalid_argument("RunProcess: empty argv");
  }

  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  Pipe out;
  Pipe err;

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }

  if (pid == 0) {
    // child: only async-signal-safe calls from here on
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out.Write(), STDOUT_FILENO);
    ::dup2(err.Write(), STDERR_FILENO);
    ::execvp(c_argv[0], c_argv.data());
    ::_exit(kExecFailedExitCode);
  }

  out.CloseWrite();
  err.CloseWrite();

  ProcessResult result;
  std::array<char, 1 << 16> chunk{};
  bool                      out_open = true;
  bool                      err_open = true;

  while (out_open || err_open) {
    pollfd fds[2];
    nfds_t count = 0;
    if (out_open) fds[count++] = {out.Read(), POLLIN, 0};
    if (err_open) fds[count++] = {err.Read(), POLLIN, 0};

    if (::poll(fds, count, -1) < 0) {
      if (errno == EINTR) continue;
      ::kill(pid, SIGKILL);
      (void)WaitForChild(pid);
      throw std::system_error(errno, std::generic_category(), "poll");
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) continue;

      const ssize_t got = ::read(fds[i].fd, chunk.data(), chunk.size());
      if (got < 0 && errno == EINTR) continue;

      const bool is_out = fds[i].fd == out.Read();
      if (got <= 0) {
        if (is_out) {
          out_open = false;
        } else {
          err_open = false;
        }
        continue;
      }

      if (is_out) {
        if (result.stdout_data.size() + static_cast<std::size_t>(got) > max_stdout_bytes) {
          ::kill(pid, SIGKILL);
          (void)WaitForChild(pid);
          throw std::runtime_error(argv[0] + ": output exceeds " + std::to_string(max_stdout_bytes) + " bytes");
        }
        result.stdout_data.append(chunk.data(), static_cast<std::size_t>(got));
      } else {
        result.stderr_tail.append(chunk.data(), static_cast<std::size_t>(got));
        if (result.stderr_tail.size() > kStderrTailBytes) {
          result.stderr_tail.erase(0, result.stderr_tail.size() - kStderrTailBytes);
        }
      }
    }
  }

  result.exit_code = WaitForChild(pid);
  return result;
}

} // namespace ledcast::util
