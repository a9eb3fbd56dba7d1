/**
 * @file shutdown.hpp
 * @brief Graceful shutdown on SIGINT/SIGTERM with LIFO cleanup callbacks.
 *
 * The signal handler only stores the signal number and writes one byte to a
 * self-pipe; WaitForShutdown() sleeps on the read end and runs the cleanup
 * callbacks on the waiting thread. One active manager per process: a second
 * instance is inert (IsValid() == false) and rejects every call.
 *
 * Usage:
 * @code
 *   rsb::ShutdownManager mgr;
 *   mgr.Register(&StopServer, &server);
 *   mgr.InstallSignalHandlers();
 *   mgr.WaitForShutdown();   // runs StopServer(signo, &server)
 * @endcode
 */

#ifndef RSB_SHUTDOWN_HPP_
#define RSB_SHUTDOWN_HPP_

#include "rsb/platform.hpp"
#include "rsb/vocabulary.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <unistd.h>

namespace rsb {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// Cleanup callback. @p signo is the triggering signal, or the value passed
/// to Quit() (0 by default).
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

inline std::atomic<ShutdownManager*>& ActiveShutdownManager() {
  static std::atomic<ShutdownManager*> active{nullptr};
  return active;
}

}  // namespace detail

class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxCallbacks = 16;

  explicit ShutdownManager(uint32_t max_callbacks = kMaxCallbacks) noexcept
      : capacity_(max_callbacks < kMaxCallbacks ? max_callbacks : kMaxCallbacks) {
    ShutdownManager* none = nullptr;
    if (!detail::ActiveShutdownManager().compare_exchange_strong(none, this)) {
      return;
    }
    if (::pipe2(wake_, O_CLOEXEC) != 0) {
      wake_[0] = wake_[1] = -1;
      detail::ActiveShutdownManager().store(nullptr);
      return;
    }
    valid_ = true;
  }

  ~ShutdownManager() {
    ShutdownManager* self = this;
    (void)detail::ActiveShutdownManager().compare_exchange_strong(self, nullptr);
    for (int fd : wake_) {
      if (fd >= 0) ::close(fd);
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  bool IsValid() const noexcept { return valid_; }

  /**
   * @brief Add @p fn (called with @p ctx) to the cleanup stack.
   * @return kAlreadyInstantiated on an inert instance; kCallbacksFull for a
   *         null @p fn or a full stack.
   */
  expected<void, ShutdownError> Register(ShutdownFn fn,
                                         void* ctx = nullptr) noexcept {
    if (!valid_) return Fail(ShutdownError::kAlreadyInstantiated);
    if (fn == nullptr || depth_ >= capacity_) {
      return Fail(ShutdownError::kCallbacksFull);
    }
    stack_[depth_++] = Cleanup{fn, ctx};
    return expected<void, ShutdownError>::success();
  }

  /// @brief Route SIGINT and SIGTERM here (sigaction, SA_RESTART).
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) return Fail(ShutdownError::kAlreadyInstantiated);

    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::OnSignal;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    for (int signo : {SIGINT, SIGTERM}) {
      if (::sigaction(signo, &sa, nullptr) != 0) {
        return Fail(ShutdownError::kSignalInstallFailed);
      }
    }
    return expected<void, ShutdownError>::success();
  }

  /// @brief Request shutdown from code. Later requests are ignored.
  void Quit(int signo = 0) noexcept { Notify(signo); }

  /**
   * @brief Sleep until a signal or Quit(), then unwind the cleanup stack.
   *
   * The stack is unwound at most once; later calls return immediately.
   */
  void WaitForShutdown() noexcept {
    while (!requested_.load(std::memory_order_acquire) && wake_[0] >= 0) {
      uint8_t byte = 0;
      if (::read(wake_[0], &byte, 1) >= 0 || errno != EINTR) break;
    }
    if (unwound_.exchange(true, std::memory_order_acq_rel)) return;

    const int signo = Signal();
    while (depth_ > 0U) {
      const Cleanup c = stack_[--depth_];
      c.fn(signo, c.ctx);
    }
  }

  bool IsShutdownRequested() const noexcept {
    return requested_.load(std::memory_order_acquire);
  }

  /// @brief The signal (or Quit() argument) that started shutdown.
  int Signal() const noexcept { return signo_.load(std::memory_order_acquire); }

 private:
  struct Cleanup {
    ShutdownFn fn = nullptr;
    void* ctx = nullptr;
  };

  static expected<void, ShutdownError> Fail(ShutdownError e) noexcept {
    return expected<void, ShutdownError>::error(e);
  }

  static void OnSignal(int signo) {
    ShutdownManager* self = detail::ActiveShutdownManager().load();
    if (self != nullptr) self->Notify(signo);
  }

  /// Async-signal-safe: lock-free atomics and write(2) only.
  void Notify(int signo) noexcept {
    if (claimed_.exchange(true, std::memory_order_acq_rel)) return;
    signo_.store(signo, std::memory_order_relaxed);
    requested_.store(true, std::memory_order_release);
    if (wake_[1] >= 0) {
      const uint8_t byte = 1;
      (void)::write(wake_[1], &byte, 1);
    }
  }

  std::array<Cleanup, kMaxCallbacks> stack_{};
  uint32_t depth_ = 0;
  uint32_t capacity_;
  std::atomic<bool> claimed_{false};
  std::atomic<bool> requested_{false};
  std::atomic<bool> unwound_{false};
  std::atomic<int> signo_{0};
  int wake_[2] = {-1, -1};
  bool valid_ = false;
};

}  // namespace rsb

#endif  // RSB_SHUTDOWN_HPP_
