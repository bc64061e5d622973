#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace detail {
struct CancellationState {
  std::atomic<bool> cancelled{false};
  std::mutex m;
  std::condition_variable cv;
};
} // namespace detail

// Observer side of a cancellation scope. A default-constructed token is never cancelled.
class CancellationToken {
public:
  CancellationToken() = default;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> s) : state_(std::move(s)) {}

  bool isCancellationRequested() const { return state_ && state_->cancelled.load(std::memory_order_acquire); }
  bool canBeCancelled() const { return static_cast<bool>(state_); }

  // Sleeps up to d; returns true early if cancellation was requested.
  template <class Rep, class Period>
  bool waitFor(std::chrono::duration<Rep, Period> d) const {
    if (!state_) return false;
    std::unique_lock<std::mutex> lk(state_->m);
    return state_->cv.wait_for(lk, d, [this] { return state_->cancelled.load(std::memory_order_acquire); });
  }

private:
  std::shared_ptr<detail::CancellationState> state_{};
};

// Owner side: hands out tokens and signals them.
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

  CancellationToken token() const { return CancellationToken(state_); }
  bool isCancellationRequested() const { return state_->cancelled.load(std::memory_order_acquire); }

  void cancel() {
    {
      std::lock_guard<std::mutex> lk(state_->m);
      state_->cancelled.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
  }

private:
  std::shared_ptr<detail::CancellationState> state_;
};
