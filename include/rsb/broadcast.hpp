/**
 * @file broadcast.hpp
 * @brief Bounded multi-subscriber broadcast ring with drop-on-lag.
 *
 * One shared ring of `capacity` slots and a monotonically increasing
 * publish sequence. Each Subscription keeps its own cursor. Publishers
 * never wait: the oldest slot is overwritten, and a subscriber whose
 * cursor fell behind the retained window is told how many samples it
 * missed and continues from the oldest retained one.
 *
 * The channel must outlive its subscriptions.
 */

#ifndef RSB_BROADCAST_HPP_
#define RSB_BROADCAST_HPP_

#include "rsb/platform.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <vector>

namespace rsb {

static constexpr size_t kDefaultBroadcastCapacity = 1024U;

enum class RecvStatus : uint8_t {
  kOk = 0,
  kLagged,   ///< Samples were overwritten before this subscriber saw them
  kTimeout,
  kClosed,   ///< Channel closed and everything retained was delivered
};

struct RecvResult {
  RecvStatus status = RecvStatus::kTimeout;
  uint64_t skipped = 0U;  ///< Valid for kLagged
};

template <typename T>
class BroadcastChannel {
 public:
  class Subscription {
   public:
    Subscription(Subscription&& other) noexcept
        : channel_(other.channel_), next_(other.next_) {
      other.channel_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
      if (this != &other) {
        Release();
        channel_ = other.channel_;
        next_ = other.next_;
        other.channel_ = nullptr;
      }
      return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    ~Subscription() { Release(); }

    /**
     * @brief Wait up to @p timeout_ms for the next sample.
     *
     * On kOk the sample is copied into @p out. On kLagged the cursor has
     * moved to the oldest retained sample and the next call delivers it.
     */
    RecvResult Recv(T& out, uint32_t timeout_ms) {
      RecvResult r;
      if (channel_ == nullptr) {
        r.status = RecvStatus::kClosed;
        return r;
      }
      BroadcastChannel& ch = *channel_;
      std::unique_lock<std::mutex> lock(ch.mutex_);
      ch.cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                      [&] { return next_ < ch.head_ || ch.closed_; });

      const uint64_t oldest = ch.OldestLocked();
      if (next_ < oldest) {
        r.status = RecvStatus::kLagged;
        r.skipped = oldest - next_;
        next_ = oldest;
        return r;
      }
      if (next_ < ch.head_) {
        out = ch.slots_[next_ % ch.slots_.size()];
        ++next_;
        r.status = RecvStatus::kOk;
        return r;
      }
      r.status = ch.closed_ ? RecvStatus::kClosed : RecvStatus::kTimeout;
      return r;
    }

    /// @brief Samples published but not yet received (including lost ones).
    uint64_t Pending() const {
      if (channel_ == nullptr) return 0U;
      std::lock_guard<std::mutex> lock(channel_->mutex_);
      return channel_->head_ - next_;
    }

   private:
    friend class BroadcastChannel;

    Subscription(BroadcastChannel* ch, uint64_t next)
        : channel_(ch), next_(next) {}

    void Release() noexcept {
      if (channel_ != nullptr) {
        std::lock_guard<std::mutex> lock(channel_->mutex_);
        --channel_->subscribers_;
        channel_ = nullptr;
      }
    }

    BroadcastChannel* channel_;
    uint64_t next_;
  };

  explicit BroadcastChannel(size_t capacity = kDefaultBroadcastCapacity)
      : slots_(capacity == 0U ? 1U : capacity) {}

  BroadcastChannel(const BroadcastChannel&) = delete;
  BroadcastChannel& operator=(const BroadcastChannel&) = delete;

  /**
   * @brief Append @p value, overwriting the oldest slot when full.
   * @return Number of live subscribers at publish time (0 is not an error).
   */
  size_t Publish(const T& value) {
    size_t subs;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      slots_[head_ % slots_.size()] = value;
      ++head_;
      subs = subscribers_;
    }
    cv_.notify_all();
    return subs;
  }

  /// @brief New subscription positioned after the latest publish.
  Subscription Subscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++subscribers_;
    return Subscription(this, head_);
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t SubscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_;
  }

  size_t Capacity() const noexcept { return slots_.size(); }

  uint64_t Published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return head_;
  }

 private:
  uint64_t OldestLocked() const noexcept {
    return (head_ > slots_.size()) ? head_ - slots_.size() : 0U;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<T> slots_;
  uint64_t head_ = 0U;  ///< Sequence of the next publish
  size_t subscribers_ = 0U;
  bool closed_ = false;
};

}  // namespace rsb

#endif  // RSB_BROADCAST_HPP_
