#include "taskrunner/executor/process_supervisor.hpp"

#include "taskrunner/util/log.hpp"
#include "taskrunner/util/shell_words.hpp"

#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <optional>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace taskrunner {

namespace {

constexpr std::string_view kDefaultSearchPath = "/usr/local/bin:/usr/bin:/bin";

class ScopedFd {
public:
  explicit ScopedFd(int fd = -1) noexcept : fd_{fd} {
  }
  ~ScopedFd() {
    reset();
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  [[nodiscard]] auto get() const noexcept -> int {
    return fd_;
  }
  [[nodiscard]] auto valid() const noexcept -> bool {
    return fd_ >= 0;
  }

  auto reset(int fd = -1) noexcept -> void {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_;
};

enum class WaitState : std::uint8_t { Exited, TimedOut, Lost };

struct WaitResult {
  WaitState state{WaitState::Lost};
  int status{0};
};

auto pidfd_open(pid_t pid, unsigned int flags) -> int {
  return static_cast<int>(::syscall(SYS_pidfd_open, pid, flags));
}

[[nodiscard]] auto is_executable_file(const std::string& path) -> bool {
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
         ::access(path.c_str(), X_OK) == 0;
}

// PATH lookup against the child's environment rather than ours, so an
// overlaid PATH applies to the programs it launches.
[[nodiscard]] auto resolve_executable(const std::string& name,
                                      const Environment& env)
    -> std::optional<std::string> {
  if (name.find('/') != std::string::npos) {
    return name;
  }
  auto search = env.get("PATH").value_or(std::string{kDefaultSearchPath});
  std::string_view rest{search};
  while (true) {
    auto colon = rest.find(':');
    auto dir = rest.substr(0, colon);
    std::string candidate = dir.empty() ? name : std::string{dir} + "/" + name;
    if (is_executable_file(candidate)) {
      return candidate;
    }
    if (colon == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(colon + 1);
  }
  return std::nullopt;
}

auto wait_blocking(pid_t pid) -> WaitResult {
  int status = 0;
  while (true) {
    pid_t r = ::waitpid(pid, &status, 0);
    if (r == pid) {
      return {WaitState::Exited, status};
    }
    if (r < 0 && errno != EINTR) {
      log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      return {WaitState::Lost, 0};
    }
  }
}

// Blocks on the pidfd for at most the remaining budget. nullopt means the
// pidfd could not be polled and the caller should fall back.
auto wait_pidfd(pid_t pid, int pidfd,
                std::chrono::steady_clock::time_point start,
                std::chrono::seconds max_time) -> std::optional<WaitResult> {
  auto deadline = start + max_time;
  while (true) {
    int timeout_ms = -1;
    if (max_time.count() > 0) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        return WaitResult{WaitState::TimedOut, 0};
      }
      timeout_ms = static_cast<int>(
          std::min<std::int64_t>(remaining.count(), INT_MAX));
    }

    pollfd pfd{.fd = pidfd, .events = POLLIN, .revents = 0};
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::warn("poll on pidfd failed for pid {}: {}", pid,
                std::strerror(errno));
      return std::nullopt;
    }
    if (rc > 0) {
      return wait_blocking(pid);
    }
  }
}

auto wait_polling(pid_t pid, std::chrono::steady_clock::time_point start,
                  std::chrono::seconds max_time) -> WaitResult {
  while (true) {
    int status = 0;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      return {WaitState::Exited, status};
    }
    if (r < 0 && errno != EINTR) {
      log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
      return {WaitState::Lost, 0};
    }

    if (max_time.count() == 0) {
      std::this_thread::sleep_for(kUnboundedPollInterval);
    } else if (std::chrono::steady_clock::now() - start > max_time) {
      return {WaitState::TimedOut, 0};
    } else {
      std::this_thread::sleep_for(kBoundedPollInterval);
    }
  }
}

auto outcome_from_status(std::string_view name, int status) -> TaskOutcome {
  if (WIFEXITED(status)) {
    int code = WEXITSTATUS(status);
    log::trace("{}: exited with code {}", name, code);
    return outcome_from_exit_code(code);
  }
  if (WIFSIGNALED(status)) {
    log::debug("{}: killed by signal {}", name, WTERMSIG(status));
  }
  return TaskOutcome::Retry;
}

class ProcessSupervisor : public IProcessSupervisor {
public:
  explicit ProcessSupervisor(WaitMode mode) : mode_{mode} {
  }

  ~ProcessSupervisor() override {
    reap_abandoned();
  }

  auto run_once(std::span<const std::string> argv, const Environment& env,
                std::chrono::seconds max_time)
      -> Result<TaskOutcome> override {
    reap_abandoned();

    if (argv.empty()) {
      return fail(Error::InvalidArgument);
    }

    auto pid = spawn(argv, env);
    if (!pid) {
      return fail(pid.error());
    }
    auto start = std::chrono::steady_clock::now();

    std::optional<WaitResult> waited;
    if (mode_ == WaitMode::Pidfd) {
      ScopedFd pidfd{pidfd_open(*pid, 0)};
      if (pidfd.valid()) {
        waited = wait_pidfd(*pid, pidfd.get(), start, max_time);
      } else {
        log::debug("pidfd_open failed for pid {}, polling instead", *pid);
      }
    }
    if (!waited) {
      waited = wait_polling(*pid, start, max_time);
    }

    switch (waited->state) {
      case WaitState::Exited:
        return outcome_from_status(argv.front(), waited->status);
      case WaitState::TimedOut:
        log::warn("{}: exceeded max_time of {}s; terminating pid {}",
                  argv.front(), max_time.count(), *pid);
        if (::kill(*pid, SIGTERM) < 0) {
          log::warn("kill({}) failed: {}", *pid, std::strerror(errno));
        }
        abandoned_.push_back(*pid);
        return TaskOutcome::Retry;
      case WaitState::Lost:
        break;
    }
    return TaskOutcome::Retry;
  }

private:
  auto spawn(std::span<const std::string> argv, const Environment& env)
      -> Result<pid_t> {
    auto path = resolve_executable(argv.front(), env);
    if (!path) {
      log::error("{}: command not found", argv.front());
      return fail(Error::SpawnFailed);
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
      c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    auto env_strings = env.to_strings();
    std::vector<char*> c_envp;
    c_envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings) {
      c_envp.push_back(entry.data());
    }
    c_envp.push_back(nullptr);

    ScopedFd devnull{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
    if (!devnull.valid()) {
      log::error("open(/dev/null) failed: {}", std::strerror(errno));
      return fail(Error::SpawnFailed);
    }

    // The child reports a failed exec through this close-on-exec pipe
    int err_fds[2];
    if (::pipe2(err_fds, O_CLOEXEC) < 0) {
      log::error("pipe2 failed: {}", std::strerror(errno));
      return fail(Error::SpawnFailed);
    }
    ScopedFd err_read{err_fds[0]};
    ScopedFd err_write{err_fds[1]};

    pid_t pid = ::fork();
    if (pid < 0) {
      log::error("fork failed: {}", std::strerror(errno));
      return fail(Error::SpawnFailed);
    }

    if (pid == 0) {
      // Child process - async-signal-safe calls only
      if (::dup2(devnull.get(), STDIN_FILENO) >= 0) {
        ::execve(path->c_str(), c_argv.data(), c_envp.data());
      }
      int err = errno;
      [[maybe_unused]] auto n = ::write(err_write.get(), &err, sizeof(err));
      ::_exit(127);
    }

    err_write.reset();

    int child_errno = 0;
    ssize_t n = 0;
    do {
      n = ::read(err_read.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
      (void)wait_blocking(pid);
      log::error("{}: exec failed: {}", argv.front(),
                 std::strerror(child_errno));
      return fail(Error::SpawnFailed);
    }

    log::trace("spawned pid {}: {}", pid, join_shell_words(argv));
    return ok(pid);
  }

  auto reap_abandoned() -> void {
    std::erase_if(abandoned_, [](pid_t pid) {
      int status = 0;
      pid_t r = ::waitpid(pid, &status, WNOHANG);
      return r == pid || (r < 0 && errno == ECHILD);
    });
  }

  WaitMode mode_;
  // Children sent SIGTERM on timeout and not yet reaped
  std::vector<pid_t> abandoned_;
};

}  // namespace

auto create_process_supervisor(WaitMode mode)
    -> std::unique_ptr<IProcessSupervisor> {
  return std::make_unique<ProcessSupervisor>(mode);
}

}  // namespace taskrunner
