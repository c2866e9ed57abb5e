#include "splicerelay/sync/write_guard.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace splicerelay::sync {

void WriteGuard::Acquire() {
  mutex_.lock();
#ifndef NDEBUG
  holder_.store(std::this_thread::get_id(), std::memory_order_relaxed);
#endif
}

bool WriteGuard::TryAcquire() {
  if (!mutex_.try_lock()) {
    return false;
  }
#ifndef NDEBUG
  holder_.store(std::this_thread::get_id(), std::memory_order_relaxed);
#endif
  return true;
}

void WriteGuard::Release() {
#ifndef NDEBUG
  if (holder_.load(std::memory_order_relaxed) != std::this_thread::get_id()) {
    spdlog::critical("WriteGuard released by a thread that does not hold it");
    throw std::logic_error("WriteGuard::Release without matching Acquire");
  }
  holder_.store(std::thread::id(), std::memory_order_relaxed);
#endif
  mutex_.unlock();
}

} // namespace splicerelay::sync
