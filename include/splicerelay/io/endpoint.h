#pragma once

#include "splicerelay/common/result.h"
#include <absl/status/status.h>
#include <cstddef>
#include <span>
#include <string>

namespace splicerelay::io {

// Capability tag of an endpoint, computed once when the endpoint is created
enum class EndpointKind {
  kPipe = 0,       // anonymous pipe or FIFO
  kTcpSocket = 1,  // AF_INET / AF_INET6 stream socket
  kUnixSocket = 2, // AF_UNIX stream socket
  kGeneric = 3,    // anything else; never eligible for splice
};

inline constexpr size_t kEndpointKindCount = 4;

// Kernel-pipe-like kinds are the ones splice(2) can operate on
[[nodiscard]] constexpr bool IsKernelPipeLike(EndpointKind kind) noexcept {
  return kind == EndpointKind::kPipe || kind == EndpointKind::kTcpSocket || kind == EndpointKind::kUnixSocket;
}

// Parse "pipe", "tcp", "unix" or "generic"; returns kGeneric for unknown input
[[nodiscard]] EndpointKind ParseEndpointKind(const std::string& kind_str) noexcept;

[[nodiscard]] std::string ToString(EndpointKind kind);

class Endpoint;

// Keeps an endpoint's native descriptors open while held. Close() on the
// endpoint still wakes waiters, but the descriptors are only released once
// every lease is gone.
class HandleLease {
public:
  HandleLease() = default;
  explicit HandleLease(Endpoint* endpoint) noexcept : endpoint_(endpoint) {}
  ~HandleLease();

  HandleLease(HandleLease&& other) noexcept : endpoint_(other.endpoint_) { other.endpoint_ = nullptr; }
  HandleLease& operator=(HandleLease&& other) noexcept;
  HandleLease(const HandleLease&) = delete;
  HandleLease& operator=(const HandleLease&) = delete;

  explicit operator bool() const noexcept { return endpoint_ != nullptr; }

private:
  Endpoint* endpoint_ = nullptr;
};

// Duplex byte stream endpoint.
//
// Read and Write block until progress can be made. Close may be called from
// any thread and must make every in-flight or later Read/Write on this
// endpoint return a kShutdownInduced status. Close is idempotent.
class Endpoint {
public:
  virtual ~Endpoint() = default;

  // Read up to buffer.size() bytes. Returns 0 on clean end of stream.
  [[nodiscard]] virtual common::Result<size_t> Read(std::span<std::byte> buffer) = 0;

  // Write some prefix of data and return its length (short writes allowed)
  [[nodiscard]] virtual common::Result<size_t> Write(std::span<const std::byte> data) = 0;

  // Half-close: signal end of stream to the peer, reading stays possible
  virtual absl::Status CloseWrite() = 0;

  // Full close. Only the first call has an effect.
  virtual void Close() noexcept = 0;

  [[nodiscard]] virtual bool IsClosed() const noexcept = 0;

  [[nodiscard]] virtual EndpointKind Kind() const noexcept = 0;

  // Descriptor bytes are read from, or -1 when the endpoint exposes none
  [[nodiscard]] virtual int NativeReadHandle() const noexcept { return -1; }

  // Descriptor bytes are written to, or -1 when the endpoint exposes none
  [[nodiscard]] virtual int NativeWriteHandle() const noexcept { return -1; }

  // Descriptor that becomes readable once Close() was called, or -1
  [[nodiscard]] virtual int NativeWakeHandle() const noexcept { return -1; }

  // Pin the native descriptors for direct use (splice)
  [[nodiscard]] virtual common::Result<HandleLease> LeaseHandles() {
    return common::Error<HandleLease>(common::RelayErrorCode::kFastPathNotApplicable,
                                      "endpoint exposes no native handles");
  }

  // Block until a Read would make progress, or until this endpoint or peer
  // is closed. Endpoints without a readiness notion return immediately and
  // block inside Read instead.
  [[nodiscard]] virtual absl::Status WaitReadable(const Endpoint* peer = nullptr) {
    (void)peer;
    return absl::OkStatus();
  }

  // Block until a Write would make progress, or until this endpoint or peer is closed
  [[nodiscard]] virtual absl::Status WaitWritable(const Endpoint* peer = nullptr) {
    (void)peer;
    return absl::OkStatus();
  }

protected:
  friend class HandleLease;

  virtual void ReturnHandles() noexcept {}
};

} // namespace splicerelay::io
