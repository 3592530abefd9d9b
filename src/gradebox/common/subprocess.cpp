#include "gradebox/common/subprocess.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstring>
#include <expected>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// POSIX headers
#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gradebox::common {

namespace {

using Clock = std::chrono::steady_clock;

// Upper bound on a single poll() sleep so the deadline and child state are
// re-checked regularly.
constexpr int kPollSliceMs = 50;

// How long to keep draining pipes after the direct child exited. Only
// descendants that escaped the process group can hold them open that long.
constexpr auto kDrainGrace = std::chrono::milliseconds(500);

// Reads per drain call, so a child producing output as fast as we consume it
// cannot starve the deadline check.
constexpr int kMaxReadsPerDrain = 64;

// RAII owner of a file descriptor
class ScopedFd {
 public:
  ScopedFd() = default;
  explicit ScopedFd(int fd) : fd_(fd) {
  }

  ScopedFd(const ScopedFd&) = delete;
  auto operator=(const ScopedFd&) -> ScopedFd& = delete;

  ScopedFd(ScopedFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {
  }
  auto operator=(ScopedFd&& other) noexcept -> ScopedFd& {
    if (this != &other) {
      Reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  ~ScopedFd() noexcept {
    Reset();
  }

  [[nodiscard]] auto Get() const -> int {
    return fd_;
  }
  [[nodiscard]] auto Valid() const -> bool {
    return fd_ >= 0;
  }

  void Reset() noexcept {
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_ = -1;
};

struct Pipe {
  ScopedFd read;
  ScopedFd write;
};

auto MakePipe() -> std::expected<Pipe, std::string> {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC) != 0) {
    return std::unexpected(
        std::format("pipe2() failed: {}", std::strerror(errno)));
  }
  return Pipe{.read = ScopedFd(fds[0]), .write = ScopedFd(fds[1])};
}

void SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags != -1) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

// A child that stops reading stdin must not take the grader down with it.
void IgnoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, [] {
    struct sigaction action{};
    action.sa_handler = SIG_IGN;
    sigemptyset(&action.sa_mask);
    sigaction(SIGPIPE, &action, nullptr);
  });
}

// Written by the child to the status pipe when it cannot reach exec.
enum class ChildStage : int { kChdir, kRlimit, kExec };

struct ChildFailure {
  ChildStage stage;
  int error;
};

auto ChildStageName(ChildStage stage) -> const char* {
  switch (stage) {
    case ChildStage::kChdir:
      return "chdir";
    case ChildStage::kRlimit:
      return "setrlimit";
    case ChildStage::kExec:
      return "exec";
  }
  return "exec";
}

// Only async-signal-safe calls from here until exec.
[[noreturn]] void ReportChildFailure(int status_fd, ChildStage stage) {
  ChildFailure failure{.stage = stage, .error = errno};
  ssize_t ignored = write(status_fd, &failure, sizeof(failure));
  (void)ignored;
  _exit(127);
}

auto ApplyLimit(int resource, uint64_t soft, uint64_t hard) -> bool {
  rlimit limit{};
  limit.rlim_cur = static_cast<rlim_t>(soft);
  limit.rlim_max = static_cast<rlim_t>(hard);
  return setrlimit(resource, &limit) == 0;
}

[[noreturn]] void RunChild(
    char* const* c_argv, const char* working_dir, const ResourceLimits& limits,
    int stdin_fd, int stdout_fd, int stderr_fd, int status_fd) {
  // Own process group so a timeout can kill every descendant at once
  setpgid(0, 0);

  // Undo the parent's SIGPIPE disposition; ignored signals survive exec
  struct sigaction action{};
  action.sa_handler = SIG_DFL;
  sigemptyset(&action.sa_mask);
  sigaction(SIGPIPE, &action, nullptr);

  dup2(stdin_fd, STDIN_FILENO);
  dup2(stdout_fd, STDOUT_FILENO);
  dup2(stderr_fd, STDERR_FILENO);

  if (working_dir != nullptr && chdir(working_dir) != 0) {
    ReportChildFailure(status_fd, ChildStage::kChdir);
  }

  if (limits.address_space_bytes != 0 &&
      !ApplyLimit(
          RLIMIT_AS, limits.address_space_bytes, limits.address_space_bytes)) {
    ReportChildFailure(status_fd, ChildStage::kRlimit);
  }
  // Hard limit one second above soft: SIGXCPU first, SIGKILL after
  if (limits.cpu_seconds != 0 &&
      !ApplyLimit(RLIMIT_CPU, limits.cpu_seconds, limits.cpu_seconds + 1)) {
    ReportChildFailure(status_fd, ChildStage::kRlimit);
  }
  if (limits.file_size_bytes != 0 &&
      !ApplyLimit(
          RLIMIT_FSIZE, limits.file_size_bytes, limits.file_size_bytes)) {
    ReportChildFailure(status_fd, ChildStage::kRlimit);
  }

  execvp(c_argv[0], c_argv);
  ReportChildFailure(status_fd, ChildStage::kExec);
}

// Byte-capped accumulator for one output stream
class StreamCapture {
 public:
  explicit StreamCapture(std::size_t cap) : cap_(cap) {
  }

  void Append(const char* data, std::size_t size) {
    if (cap_ == 0) {
      text_.append(data, size);
      return;
    }
    std::size_t room = cap_ > text_.size() ? cap_ - text_.size() : 0;
    std::size_t take = std::min(room, size);
    text_.append(data, take);
    if (take < size) {
      truncated_ = true;
    }
  }

  [[nodiscard]] auto Truncated() const -> bool {
    return truncated_;
  }
  auto TakeText() -> std::string {
    return std::move(text_);
  }

 private:
  std::size_t cap_;
  std::string text_;
  bool truncated_ = false;
};

// Read what is available. Returns false once the stream hit EOF or failed.
auto DrainReadable(int fd, StreamCapture& capture) -> bool {
  std::array<char, 4096> buffer{};
  for (int i = 0; i < kMaxReadsPerDrain; ++i) {
    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      capture.Append(buffer.data(), static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
  return true;
}

// Write as much pending input as the pipe accepts. Returns false once the
// write end should be closed (all input written, or the child hung up).
auto FeedStdin(int fd, std::string_view& pending) -> bool {
  while (!pending.empty()) {
    ssize_t n = write(fd, pending.data(), pending.size());
    if (n > 0) {
      pending.remove_prefix(static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    return n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
  }
  return false;
}

void KillGroup(pid_t pid) {
  kill(-pid, SIGKILL);
  // Covers the window where the child has not yet called setpgid
  kill(pid, SIGKILL);
}

// True once the child has terminated. Leaves it unreaped (WNOWAIT) so its pid,
// and with it the process group id, stays reserved for a follow-up kill.
auto ChildTerminated(pid_t pid) -> bool {
  siginfo_t info{};
  info.si_pid = 0;
  if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) !=
      0) {
    return errno == ECHILD;
  }
  return info.si_pid == pid;
}

auto Reap(pid_t pid) -> int {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return status;
}

auto ToPollTimeout(Clock::duration remaining) -> int {
  auto ms = std::chrono::ceil<std::chrono::milliseconds>(remaining).count();
  return static_cast<int>(std::clamp<int64_t>(ms, 0, kPollSliceMs));
}

}  // namespace

auto RunSubprocess(
    const std::vector<std::string>& argv, const SubprocessOptions& options)
    -> std::expected<SubprocessResult, std::string> {
  if (argv.empty()) {
    return std::unexpected("Empty argv");
  }

  IgnoreSigpipe();

  auto stdin_pipe = MakePipe();
  auto stdout_pipe = MakePipe();
  auto stderr_pipe = MakePipe();
  auto status_pipe = MakePipe();
  for (const auto* p : {&stdin_pipe, &stdout_pipe, &stderr_pipe, &status_pipe}) {
    if (!p->has_value()) {
      return std::unexpected(p->error());
    }
  }

  // Build argv array (must be null-terminated) before forking
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  std::string working_dir;
  if (options.working_dir.has_value()) {
    working_dir = options.working_dir->string();
  }

  auto start = Clock::now();
  pid_t pid = fork();
  if (pid == -1) {
    return std::unexpected(
        std::format("fork() failed: {}", std::strerror(errno)));
  }

  if (pid == 0) {
    RunChild(
        c_argv.data(), working_dir.empty() ? nullptr : working_dir.c_str(),
        options.limits, stdin_pipe->read.Get(), stdout_pipe->write.Get(),
        stderr_pipe->write.Get(), status_pipe->write.Get());
  }

  // Also set from the parent so a kill right after fork reaches the group
  setpgid(pid, pid);

  // Close child ends in parent
  stdin_pipe->read.Reset();
  stdout_pipe->write.Reset();
  stderr_pipe->write.Reset();
  status_pipe->write.Reset();

  // The status pipe closes on successful exec; data means the child failed
  ChildFailure failure{};
  ssize_t status_bytes = 0;
  do {
    status_bytes = read(status_pipe->read.Get(), &failure, sizeof(failure));
  } while (status_bytes == -1 && errno == EINTR);
  if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
    Reap(pid);
    return std::unexpected(
        std::format(
            "{} failed for '{}': {}", ChildStageName(failure.stage), argv[0],
            std::strerror(failure.error)));
  }

  ScopedFd stdin_fd = std::move(stdin_pipe->write);
  ScopedFd stdout_fd = std::move(stdout_pipe->read);
  ScopedFd stderr_fd = std::move(stderr_pipe->read);
  SetNonBlocking(stdin_fd.Get());
  SetNonBlocking(stdout_fd.Get());
  SetNonBlocking(stderr_fd.Get());

  std::string_view pending_input = options.stdin_data;
  if (pending_input.empty()) {
    stdin_fd.Reset();
  }

  StreamCapture stdout_capture(options.max_stdout_bytes);
  StreamCapture stderr_capture(options.max_stderr_bytes);

  std::optional<Clock::time_point> deadline;
  if (options.timeout.count() > 0) {
    deadline = start + options.timeout;
  }
  std::optional<Clock::time_point> drain_deadline;

  SubprocessResult result;
  bool child_terminated = false;

  while (!child_terminated || stdout_fd.Valid() || stderr_fd.Valid()) {
    auto now = Clock::now();
    if (deadline && now >= *deadline) {
      result.timed_out = true;
      break;
    }
    if (drain_deadline && now >= *drain_deadline) {
      break;
    }

    auto wake = now + std::chrono::milliseconds(kPollSliceMs);
    if (deadline) {
      wake = std::min(wake, *deadline);
    }
    if (drain_deadline) {
      wake = std::min(wake, *drain_deadline);
    }

    std::array<pollfd, 3> fds{};
    nfds_t count = 0;
    int stdin_slot = -1;
    int stdout_slot = -1;
    int stderr_slot = -1;
    if (stdin_fd.Valid()) {
      stdin_slot = static_cast<int>(count);
      fds[count++] = pollfd{.fd = stdin_fd.Get(), .events = POLLOUT, .revents = 0};
    }
    if (stdout_fd.Valid()) {
      stdout_slot = static_cast<int>(count);
      fds[count++] = pollfd{.fd = stdout_fd.Get(), .events = POLLIN, .revents = 0};
    }
    if (stderr_fd.Valid()) {
      stderr_slot = static_cast<int>(count);
      fds[count++] = pollfd{.fd = stderr_fd.Get(), .events = POLLIN, .revents = 0};
    }

    int ready = poll(fds.data(), count, ToPollTimeout(wake - now));
    if (ready < 0 && errno != EINTR) {
      int poll_errno = errno;
      KillGroup(pid);
      Reap(pid);
      return std::unexpected(
          std::format("poll() failed: {}", std::strerror(poll_errno)));
    }

    if (ready > 0) {
      if (stdin_slot >= 0 && fds[stdin_slot].revents != 0) {
        if ((fds[stdin_slot].revents & POLLOUT) == 0 ||
            !FeedStdin(stdin_fd.Get(), pending_input)) {
          stdin_fd.Reset();
        }
      }
      if (stdout_slot >= 0 && fds[stdout_slot].revents != 0 &&
          !DrainReadable(stdout_fd.Get(), stdout_capture)) {
        stdout_fd.Reset();
      }
      if (stderr_slot >= 0 && fds[stderr_slot].revents != 0 &&
          !DrainReadable(stderr_fd.Get(), stderr_capture)) {
        stderr_fd.Reset();
      }
    }

    if (!child_terminated && ChildTerminated(pid)) {
      child_terminated = true;
      // Session is over: descendants left in the group go with the child
      kill(-pid, SIGKILL);
      stdin_fd.Reset();
      drain_deadline = Clock::now() + kDrainGrace;
    }
  }

  if (result.timed_out) {
    KillGroup(pid);
  }

  int status = Reap(pid);
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - start);
  if (status == -1) {
    return std::unexpected(
        std::format("waitpid() failed: {}", std::strerror(errno)));
  }

  if (WIFEXITED(status)) {
    result.exited = true;
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.signaled = true;
    result.term_signal = WTERMSIG(status);
  }

  // Pick up anything still buffered in the pipes
  if (stdout_fd.Valid()) {
    DrainReadable(stdout_fd.Get(), stdout_capture);
  }
  if (stderr_fd.Valid()) {
    DrainReadable(stderr_fd.Get(), stderr_capture);
  }

  result.stdout_truncated = stdout_capture.Truncated();
  result.stderr_truncated = stderr_capture.Truncated();
  result.stdout_text = stdout_capture.TakeText();
  result.stderr_text = stderr_capture.TakeText();
  return result;
}

}  // namespace gradebox::common
