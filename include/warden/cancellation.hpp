#pragma once

// warden/cancellation.hpp — Cooperative cancellation for running instances.
//
// The Resource Limiter owns the token and cancels it when the deadline
// passes. Instance backends poll cancelled() from their supervision loop and
// tear the instance down; they never cancel the token themselves.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace warden {

class CancellationToken {
 public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // Blocks until cancelled or `timeout` elapses. Returns cancelled().
  template <class Rep, class Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return cancelled(); });
    return cancelled();
  }

 private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::atomic<bool> cancelled_{false};
};

}  // namespace warden
