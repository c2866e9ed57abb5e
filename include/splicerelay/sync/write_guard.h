#pragma once

#include <spdlog/spdlog.h>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace splicerelay::sync {

// Serializes writers of a single logical write target.
//
// A plain mutex: uncontended Acquire/Release are a single atomic each and
// a contended Acquire parks in the kernel without handing the token through
// a queue. No FIFO guarantee.
//
// Unless NDEBUG is defined the guard also tracks its holder, and Release()
// from a thread that does not hold the token throws std::logic_error.
//
// Satisfies Lockable, so std::lock_guard / std::unique_lock work as well.
// Their destructors do not catch, so prefer ScopedWrite where the scope
// could release the guard by hand.
class WriteGuard {
public:
  WriteGuard() = default;
  WriteGuard(const WriteGuard&) = delete;
  WriteGuard& operator=(const WriteGuard&) = delete;

  void Acquire();
  [[nodiscard]] bool TryAcquire();
  void Release();

  void lock() { Acquire(); }
  bool try_lock() { return TryAcquire(); }
  void unlock() { Release(); }

  // Whether the holder is tracked (builds without NDEBUG)
  [[nodiscard]] static constexpr bool IsChecked() noexcept {
#ifdef NDEBUG
    return false;
#else
    return true;
#endif
  }

private:
  std::mutex mutex_;
#ifndef NDEBUG
  std::atomic<std::thread::id> holder_{};
#endif
};

// Holds a guard for the lifetime of the scope. A misuse reported by
// Release() is logged rather than escaping the destructor.
template <typename Guard>
class ScopedWrite {
public:
  explicit ScopedWrite(Guard& guard) : guard_(guard) { guard_.Acquire(); }
  ~ScopedWrite() {
    try {
      guard_.Release();
    } catch (const std::logic_error& e) {
      spdlog::error("ScopedWrite release failed: {}", e.what());
    }
  }

  ScopedWrite(const ScopedWrite&) = delete;
  ScopedWrite& operator=(const ScopedWrite&) = delete;

private:
  Guard& guard_;
};

} // namespace splicerelay::sync
