/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file process.hpp
 * @brief Linux child-process primitives: spawn, poll, terminate.
 *
 * Subprocess launches a program with an explicit argv, an optional working
 * directory, environment overrides and stdout/stderr pipe capture. A failed
 * chdir or exec in the child is written back over a close-on-exec pipe, so
 * Start() tells "program missing" apart from "program started and exited".
 *
 * Linux-only (fork/execvpe/waitpid).
 */

#ifndef RSB_PROCESS_HPP_
#define RSB_PROCESS_HPP_

#include "rsb/platform.hpp"

#if defined(RSB_PLATFORM_LINUX)

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

extern char** environ;

namespace rsb {

// ============================================================================
// Result codes
// ============================================================================

enum class ProcessResult : int8_t {
  kSuccess = 0,
  kNotFound = -1,   ///< No child to operate on
  kFailed = -2,     ///< Spawn or signal delivery failed
  kWaitError = -3,  ///< waitpid(2) error after SIGKILL
};

/// @brief Step of Subprocess::Start() that failed.
enum class SpawnStage : uint8_t {
  kNone = 0,
  kInvalidArgs,
  kPipe,
  kFork,
  kChdir,
  kExec,
};

inline const char* SpawnStageName(SpawnStage stage) noexcept {
  static constexpr const char* kNames[] = {"none", "invalid arguments", "pipe",
                                           "fork", "chdir",             "exec"};
  const auto idx = static_cast<size_t>(stage);
  return idx < sizeof(kNames) / sizeof(kNames[0]) ? kNames[idx] : "none";
}

namespace detail {

inline void SleepMs(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  while (::nanosleep(&ts, &ts) != 0 && errno == EINTR) {
  }
}

/// waitpid(2) that retries EINTR.
inline pid_t WaitPid(pid_t pid, int* status, int options) {
  pid_t w;
  do {
    w = ::waitpid(pid, status, options);
  } while (w < 0 && errno == EINTR);
  return w;
}

// ============================================================================
// UniqueFd - single owned descriptor
// ============================================================================

class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { Reset(); }

  UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) Reset(other.Release());
    return *this;
  }
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int Get() const { return fd_; }
  bool Valid() const { return fd_ >= 0; }

  int Release() { return std::exchange(fd_, -1); }

  void Reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }

 private:
  int fd_ = -1;
};

/// @brief pipe2(2) into two owned ends.
inline bool OpenPipe(UniqueFd& read_end, UniqueFd& write_end, int flags = 0) {
  int fds[2];
  if (::pipe2(fds, flags) != 0) return false;
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
  return true;
}

/// Written by the child when chdir or exec fails.
struct ChildFailure {
  int32_t stage;
  int32_t err;
};

/**
 * @brief Inherited environment with @p overrides applied.
 *
 * Inherited entries whose key is overridden are dropped; overrides are
 * appended in order.
 */
inline std::vector<std::string> MergeEnvironment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
  auto overridden = [&overrides](const char* entry) {
    const char* eq = std::strchr(entry, '=');
    const size_t len = eq != nullptr ? static_cast<size_t>(eq - entry)
                                     : std::strlen(entry);
    for (const auto& kv : overrides) {
      if (kv.first.compare(0, std::string::npos, entry, len) == 0) return true;
    }
    return false;
  };

  std::vector<std::string> merged;
  for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
    if (!overridden(*e)) merged.emplace_back(*e);
  }
  for (const auto& kv : overrides) merged.push_back(kv.first + '=' + kv.second);
  return merged;
}

/// @brief NUL-terminated pointer view over @p strings, valid while they live.
inline std::vector<char*> CStringArray(const std::vector<std::string>& strings) {
  std::vector<char*> out;
  out.reserve(strings.size() + 1U);
  for (const auto& s : strings) out.push_back(const_cast<char*>(s.c_str()));
  out.push_back(nullptr);
  return out;
}

}  // namespace detail

// ============================================================================
// Free functions
// ============================================================================

/**
 * @brief SIGKILL @p pid and reap it.
 * @param attempts How many times kill(2) is retried on transient failure.
 * @return kSuccess, kFailed or kWaitError.
 */
inline ProcessResult TerminateProcess(pid_t pid, uint32_t attempts = 3) {
  int status = 0;
  for (uint32_t i = 0; i < attempts; ++i) {
    if (::kill(pid, SIGKILL) != 0) {
      if (errno != ESRCH) continue;
      // Already gone; collect the zombie if it is ours.
      (void)::waitpid(pid, &status, WNOHANG);
      return ProcessResult::kSuccess;
    }
    if (detail::WaitPid(pid, &status, 0) >= 0 || errno == ECHILD) {
      return ProcessResult::kSuccess;
    }
    return ProcessResult::kWaitError;
  }
  return ProcessResult::kFailed;
}

inline bool IsProcessAlive(pid_t pid) { return ::kill(pid, 0) == 0; }

// ============================================================================
// Subprocess
// ============================================================================

struct SubprocessConfig {
  std::vector<std::string> argv;  ///< argv[0] is resolved through PATH
  std::string working_dir;        ///< Empty: inherit
  std::vector<std::pair<std::string, std::string>> env;  ///< Overrides
  bool capture_stdout = false;
  bool capture_stderr = false;
  bool merge_stderr = false;  ///< stderr goes into the stdout pipe
};

struct WaitResult {
  bool exited = false;
  int exit_code = -1;
  bool signaled = false;
  int term_signal = 0;
  bool timed_out = false;
};

enum class ExitPoll : uint8_t {
  kRunning = 0,
  kExited,
  kError,  ///< waitpid(2) failed; liveness unknown
};

/**
 * @brief Owned child process.
 *
 * Move-only. Destruction kills and reaps a live child and closes the
 * capture pipes.
 *
 * @code
 *   rsb::SubprocessConfig cfg;
 *   cfg.argv = {"python", "-m", "uvicorn", "app:app"};
 *   cfg.env = {{"PORT", "8000"}};
 *
 *   rsb::Subprocess proc;
 *   if (proc.Start(cfg) != rsb::ProcessResult::kSuccess) {
 *     std::printf("%s: %s\n", rsb::SpawnStageName(proc.FailedStage()),
 *                 std::strerror(proc.LastErrno()));
 *   }
 * @endcode
 */
class Subprocess {
 public:
  Subprocess() = default;
  ~Subprocess() { Reap(); }

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  Subprocess(Subprocess&& other) noexcept
      : pid_(std::exchange(other.pid_, -1)),
        out_(std::move(other.out_)),
        err_(std::move(other.err_)),
        stage_(other.stage_),
        errno_(other.errno_),
        last_wait_(other.last_wait_) {}

  Subprocess& operator=(Subprocess&& other) noexcept {
    if (this != &other) {
      Reap();
      pid_ = std::exchange(other.pid_, -1);
      out_ = std::move(other.out_);
      err_ = std::move(other.err_);
      stage_ = other.stage_;
      errno_ = other.errno_;
      last_wait_ = other.last_wait_;
    }
    return *this;
  }

  /**
   * @brief fork/exec @p cfg.argv.
   * @return kSuccess once the program image is running; kFailed otherwise,
   *         with FailedStage() and LastErrno() describing why.
   */
  ProcessResult Start(const SubprocessConfig& cfg) {
    stage_ = SpawnStage::kNone;
    errno_ = 0;
    if (pid_ > 0) return Fail(SpawnStage::kInvalidArgs, EBUSY);
    if (cfg.argv.empty() || cfg.argv[0].empty()) {
      return Fail(SpawnStage::kInvalidArgs, EINVAL);
    }

    // The child must not allocate, so everything is built before fork().
    const std::vector<std::string> env = detail::MergeEnvironment(cfg.env);
    ChildPlan plan;
    plan.argv = detail::CStringArray(cfg.argv);
    plan.envp = detail::CStringArray(env);
    plan.dir = cfg.working_dir.empty() ? nullptr : cfg.working_dir.c_str();

    const bool pipe_out = cfg.capture_stdout || cfg.merge_stderr;
    const bool pipe_err = cfg.capture_stderr && !cfg.merge_stderr;
    detail::UniqueFd out_r, out_w, err_r, err_w, fail_r, fail_w;
    if ((pipe_out && !detail::OpenPipe(out_r, out_w, O_CLOEXEC)) ||
        (pipe_err && !detail::OpenPipe(err_r, err_w, O_CLOEXEC)) ||
        !detail::OpenPipe(fail_r, fail_w, O_CLOEXEC)) {
      return Fail(SpawnStage::kPipe, errno);
    }
    plan.stdout_fd = out_w.Get();
    plan.stderr_fd = cfg.merge_stderr ? out_w.Get() : err_w.Get();
    plan.fail_fd = fail_w.Get();

    const pid_t child = ::fork();
    if (child < 0) return Fail(SpawnStage::kFork, errno);
    if (child == 0) RunChild(plan);

    fail_w.Reset();
    out_w.Reset();
    err_w.Reset();

    detail::ChildFailure report{};
    ssize_t n;
    do {
      n = ::read(fail_r.Get(), &report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(report))) {
      int status = 0;
      (void)detail::WaitPid(child, &status, 0);
      return Fail(static_cast<SpawnStage>(report.stage), report.err);
    }

    pid_ = child;
    out_ = std::move(out_r);
    err_ = std::move(err_r);
    for (const detail::UniqueFd* fd : {&out_, &err_}) {
      if (fd->Valid()) {
        (void)::fcntl(fd->Get(), F_SETFL,
                      ::fcntl(fd->Get(), F_GETFL, 0) | O_NONBLOCK);
      }
    }
    return ProcessResult::kSuccess;
  }

  /**
   * @brief Non-blocking read of captured stdout.
   * @return Bytes read; 0 when nothing is pending or the pipe closed; -1 on
   *         error or when stdout is not captured.
   */
  int ReadStdout(char* buf, size_t len) { return Drain(out_, buf, len); }

  /// @brief Same as ReadStdout() for captured stderr.
  int ReadStderr(char* buf, size_t len) { return Drain(err_, buf, len); }

  /// @brief Non-blocking exit check; a reaped child clears the PID.
  ExitPoll Poll() {
    if (pid_ <= 0) return ExitPoll::kExited;
    int status = 0;
    const pid_t w = ::waitpid(pid_, &status, WNOHANG);
    if (w == 0) return ExitPoll::kRunning;
    if (w < 0) return ExitPoll::kError;
    Record(status);
    return ExitPoll::kExited;
  }

  /**
   * @brief Block until the child exits.
   * @param timeout_ms 0 waits forever; otherwise the result has timed_out
   *        set when the child is still running at the deadline.
   */
  WaitResult Wait(uint32_t timeout_ms = 0) {
    if (pid_ <= 0) {
      WaitResult wr = last_wait_;
      if (!wr.signaled) wr.exited = true;
      return wr;
    }
    if (timeout_ms == 0) {
      int status = 0;
      if (detail::WaitPid(pid_, &status, 0) > 0) Record(status);
      return last_wait_;
    }

    constexpr uint32_t kPollStepMs = 5;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(timeout_ms);
    do {
      if (Poll() == ExitPoll::kExited) return last_wait_;
      detail::SleepMs(kPollStepMs);
    } while (std::chrono::steady_clock::now() < deadline);

    WaitResult wr;
    wr.timed_out = true;
    return wr;
  }

  /// @brief SIGKILL and reap. kNotFound without a live child.
  ProcessResult Kill() {
    if (pid_ <= 0) return ProcessResult::kNotFound;
    return TerminateProcess(std::exchange(pid_, -1));
  }

  /// -1 before Start() and after the child is reaped.
  pid_t GetPid() const { return pid_; }

  SpawnStage FailedStage() const { return stage_; }
  int LastErrno() const { return errno_; }

 private:
  struct ChildPlan {
    std::vector<char*> argv;
    std::vector<char*> envp;
    const char* dir = nullptr;
    int stdout_fd = -1;
    int stderr_fd = -1;
    int fail_fd = -1;
  };

  /// Runs between fork and exec; async-signal-safe calls only.
  [[noreturn]] static void RunChild(const ChildPlan& plan) {
    (void)::setsid();

    // Ignored dispositions and the blocked mask survive exec; reset both.
    struct sigaction dfl;
    std::memset(&dfl, 0, sizeof(dfl));
    dfl.sa_handler = SIG_DFL;
    for (int sig = 1; sig < NSIG; ++sig) (void)::sigaction(sig, &dfl, nullptr);
    sigset_t empty;
    ::sigemptyset(&empty);
    (void)::sigprocmask(SIG_SETMASK, &empty, nullptr);

    if (plan.dir != nullptr && ::chdir(plan.dir) != 0) {
      ChildAbort(plan.fail_fd, SpawnStage::kChdir);
    }
    if (plan.stdout_fd >= 0) (void)::dup2(plan.stdout_fd, STDOUT_FILENO);
    if (plan.stderr_fd >= 0) (void)::dup2(plan.stderr_fd, STDERR_FILENO);

    ::execvpe(plan.argv[0], plan.argv.data(), plan.envp.data());
    ChildAbort(plan.fail_fd, SpawnStage::kExec);
  }

  [[noreturn]] static void ChildAbort(int fd, SpawnStage stage) {
    const detail::ChildFailure report{static_cast<int32_t>(stage), errno};
    (void)::write(fd, &report, sizeof(report));
    ::_exit(127);
  }

  static int Drain(const detail::UniqueFd& fd, char* buf, size_t len) {
    if (!fd.Valid() || len == 0) return -1;
    const ssize_t n = ::read(fd.Get(), buf, len);
    if (n >= 0) return static_cast<int>(n);
    return (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) ? 0 : -1;
  }

  ProcessResult Fail(SpawnStage stage, int err) {
    stage_ = stage;
    errno_ = err;
    return ProcessResult::kFailed;
  }

  void Record(int status) {
    WaitResult wr;
    wr.exited = WIFEXITED(status);
    if (wr.exited) wr.exit_code = WEXITSTATUS(status);
    wr.signaled = WIFSIGNALED(status);
    if (wr.signaled) wr.term_signal = WTERMSIG(status);
    last_wait_ = wr;
    pid_ = -1;
  }

  void Reap() {
    out_.Reset();
    err_.Reset();
    if (pid_ > 0) (void)TerminateProcess(std::exchange(pid_, -1));
  }

  pid_t pid_ = -1;
  detail::UniqueFd out_;
  detail::UniqueFd err_;
  SpawnStage stage_ = SpawnStage::kNone;
  int errno_ = 0;
  WaitResult last_wait_;
};

}  // namespace rsb

#endif  // defined(RSB_PLATFORM_LINUX)

#endif  // RSB_PROCESS_HPP_
