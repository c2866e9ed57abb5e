#pragma once

#include "splicerelay/io/endpoint.h"
#include "splicerelay/common/result.h"
#include <atomic>
#include <memory>
#include <mutex>

namespace splicerelay::io {

// Endpoint over POSIX descriptors: one stream socket, or a pair of pipes
// (one to read from, one to write to).
//
// Descriptors are switched to non-blocking mode and every blocking wait is a
// poll() that also watches an eventfd signalled by Close(), so Close() from
// another thread unblocks readers and writers promptly. The descriptors
// themselves are released once the last in-flight operation or lease is gone.
class FdEndpoint final : public Endpoint {
public:
  // Wrap a connected stream socket. Takes ownership of fd, also on failure.
  static common::Result<std::unique_ptr<FdEndpoint>> FromSocket(int fd);

  // Wrap a read pipe and a write pipe. Takes ownership of both, also on failure.
  static common::Result<std::unique_ptr<FdEndpoint>> FromPipes(int read_fd, int write_fd);

  // Wrap descriptors but report kGeneric and expose no native handles, which
  // keeps the endpoint off the splice path. read_fd may equal write_fd.
  static common::Result<std::unique_ptr<FdEndpoint>> MakeGeneric(int read_fd, int write_fd);

  ~FdEndpoint() override;

  FdEndpoint(const FdEndpoint&) = delete;
  FdEndpoint& operator=(const FdEndpoint&) = delete;

  [[nodiscard]] common::Result<size_t> Read(std::span<std::byte> buffer) override;
  [[nodiscard]] common::Result<size_t> Write(std::span<const std::byte> data) override;
  absl::Status CloseWrite() override;
  void Close() noexcept override;

  [[nodiscard]] bool IsClosed() const noexcept override { return closed_flag_.load(std::memory_order_acquire); }
  [[nodiscard]] EndpointKind Kind() const noexcept override { return kind_; }

  [[nodiscard]] int NativeReadHandle() const noexcept override { return expose_handles_ ? read_fd_ : -1; }
  [[nodiscard]] int NativeWriteHandle() const noexcept override {
    return expose_handles_ && !write_fd_released_.load(std::memory_order_acquire) ? write_fd_ : -1;
  }
  [[nodiscard]] int NativeWakeHandle() const noexcept override { return wake_fd_; }

  [[nodiscard]] common::Result<HandleLease> LeaseHandles() override;
  [[nodiscard]] absl::Status WaitReadable(const Endpoint* peer = nullptr) override;
  [[nodiscard]] absl::Status WaitWritable(const Endpoint* peer = nullptr) override;

  // Number of times Close() actually released resources (0 or 1)
  [[nodiscard]] int CloseCount() const noexcept { return close_count_.load(std::memory_order_acquire); }

protected:
  void ReturnHandles() noexcept override;

private:
  class OpScope;

  FdEndpoint(int read_fd, int write_fd, int wake_fd, EndpointKind kind, bool is_socket, bool expose_handles);

  static common::Result<std::unique_ptr<FdEndpoint>> Create(int read_fd, int write_fd, EndpointKind kind,
                                                            bool is_socket, bool expose_handles);

  // Register an in-flight operation; false once the endpoint is closed.
  // Write-side operations also pin the write pipe against CloseWrite().
  [[nodiscard]] bool EnterOp(bool write_side) noexcept;
  void LeaveOp(bool write_side) noexcept;

  [[nodiscard]] absl::Status PollFor(int fd, short events, const Endpoint* peer);
  void ReleaseDescriptorsLocked() noexcept;

  const int read_fd_;
  const int write_fd_;
  const int wake_fd_;
  const EndpointKind kind_;
  const bool is_socket_;
  const bool expose_handles_;

  std::mutex mutex_;
  bool closed_ = false;
  bool write_closed_ = false;
  bool descriptors_released_ = false;
  int in_flight_ = 0;
  int writes_in_flight_ = 0;
  std::atomic<bool> write_fd_released_{false};
  std::atomic<bool> closed_flag_{false};
  std::atomic<int> close_count_{0};
};

// Both descriptors of a connected socket pair; the caller owns them
struct SocketPair {
  int first = -1;
  int second = -1;
};

// Create a connected AF_UNIX stream socket pair
[[nodiscard]] common::Result<SocketPair> MakeSocketPair();

} // namespace splicerelay::io
