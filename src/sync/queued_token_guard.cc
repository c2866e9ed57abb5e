#include "splicerelay/sync/queued_token_guard.h"
#include <stdexcept>

namespace splicerelay::sync {

void QueuedTokenGuard::Acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  const uint64_t ticket = next_ticket_++;
  token_sent_.wait(lock, [&] { return token_in_slot_ && serving_ == ticket; });
  token_in_slot_ = false;
  ++serving_;
}

bool QueuedTokenGuard::TryAcquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!token_in_slot_ || serving_ != next_ticket_) {
    return false;
  }
  token_in_slot_ = false;
  ++next_ticket_;
  ++serving_;
  return true;
}

void QueuedTokenGuard::Release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token_in_slot_) {
      throw std::logic_error("QueuedTokenGuard::Release without matching Acquire");
    }
    token_in_slot_ = true;
  }
  // Every receiver re-checks its ticket; only the next one proceeds
  token_sent_.notify_all();
}

uint64_t QueuedTokenGuard::Waiting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_ticket_ - serving_;
}

} // namespace splicerelay::sync
