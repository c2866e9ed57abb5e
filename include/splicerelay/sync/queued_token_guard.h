#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace splicerelay::sync {

// Guard built as a single-slot token channel: Release() sends the token,
// Acquire() receives it. Parked receivers are served in arrival order and
// a released token goes to the oldest of them, never back to a newcomer.
//
// Kept as the reference the lock-based WriteGuard is measured against; each
// contended hand-off costs a wake-up of exactly the next waiter.
class QueuedTokenGuard {
public:
  QueuedTokenGuard() = default;
  QueuedTokenGuard(const QueuedTokenGuard&) = delete;
  QueuedTokenGuard& operator=(const QueuedTokenGuard&) = delete;

  void Acquire();
  [[nodiscard]] bool TryAcquire();
  void Release();

  // Receivers currently parked on the channel
  [[nodiscard]] uint64_t Waiting() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable token_sent_;
  bool token_in_slot_ = true;
  uint64_t next_ticket_ = 0;  // handed to each arriving receiver
  uint64_t serving_ = 0;      // ticket allowed to take the token next
};

} // namespace splicerelay::sync
