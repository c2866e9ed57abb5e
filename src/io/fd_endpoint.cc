#include "splicerelay/io/fd_endpoint.h"
#include "splicerelay/common/status.h"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

namespace splicerelay::io {

using common::ErrnoStatus;
using common::MakeStatus;
using common::RelayErrorCode;
using common::Result;

namespace {

void CloseDescriptor(int fd) noexcept {
  if (fd >= 0 && ::close(fd) != 0) {
    spdlog::warn("close({}) failed: errno {}", fd, errno);
  }
}

absl::Status SetNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  if (flags < 0) {
    return ErrnoStatus(RelayErrorCode::kInvalidArgument, errno, "fcntl(F_GETFL)");
  }
  if ((flags & O_NONBLOCK) == 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    return ErrnoStatus(RelayErrorCode::kInvalidArgument, errno, "fcntl(F_SETFL)");
  }
  return absl::OkStatus();
}

bool IsSocket(int fd) noexcept {
  struct stat st {};
  return ::fstat(fd, &st) == 0 && S_ISSOCK(st.st_mode);
}

bool IsFifo(int fd) noexcept {
  struct stat st {};
  return ::fstat(fd, &st) == 0 && S_ISFIFO(st.st_mode);
}

absl::Status EndpointClosed() {
  return MakeStatus(RelayErrorCode::kShutdownInduced, "endpoint closed");
}

} // namespace

// Pins the endpoint for the duration of a single operation
class FdEndpoint::OpScope {
public:
  OpScope(FdEndpoint& endpoint, bool write_side) noexcept
    : endpoint_(endpoint), write_side_(write_side), entered_(endpoint.EnterOp(write_side)) {}

  ~OpScope() {
    if (entered_) {
      endpoint_.LeaveOp(write_side_);
    }
  }

  OpScope(const OpScope&) = delete;
  OpScope& operator=(const OpScope&) = delete;

  explicit operator bool() const noexcept { return entered_; }

private:
  FdEndpoint& endpoint_;
  bool write_side_;
  bool entered_;
};

FdEndpoint::FdEndpoint(int read_fd, int write_fd, int wake_fd, EndpointKind kind, bool is_socket,
                       bool expose_handles)
  : read_fd_(read_fd)
  , write_fd_(write_fd)
  , wake_fd_(wake_fd)
  , kind_(kind)
  , is_socket_(is_socket)
  , expose_handles_(expose_handles) {}

FdEndpoint::~FdEndpoint() {
  Close();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ReleaseDescriptorsLocked();
  }
  CloseDescriptor(wake_fd_);
}

Result<std::unique_ptr<FdEndpoint>> FdEndpoint::Create(int read_fd, int write_fd, EndpointKind kind,
                                                       bool is_socket, bool expose_handles) {
  auto fail = [&](absl::Status status) -> Result<std::unique_ptr<FdEndpoint>> {
    CloseDescriptor(read_fd);
    if (write_fd != read_fd) {
      CloseDescriptor(write_fd);
    }
    return status;
  };

  if (auto status = SetNonBlocking(read_fd); !status.ok()) {
    return fail(status);
  }
  if (write_fd != read_fd) {
    if (auto status = SetNonBlocking(write_fd); !status.ok()) {
      return fail(status);
    }
  }

  int wake_fd = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (wake_fd < 0) {
    return fail(ErrnoStatus(RelayErrorCode::kInternal, errno, "eventfd"));
  }

  return std::unique_ptr<FdEndpoint>(new FdEndpoint(read_fd, write_fd, wake_fd, kind, is_socket, expose_handles));
}

Result<std::unique_ptr<FdEndpoint>> FdEndpoint::FromSocket(int fd) {
  int type = 0;
  socklen_t len = sizeof(type);
  if (::getsockopt(fd, SOL_SOCKET, SO_TYPE, &type, &len) != 0) {
    int err = errno;
    CloseDescriptor(fd);
    return ErrnoStatus(RelayErrorCode::kInvalidArgument, err, "getsockopt(SO_TYPE)");
  }
  if (type != SOCK_STREAM) {
    CloseDescriptor(fd);
    return MakeStatus(RelayErrorCode::kInvalidArgument, "not a stream socket");
  }

  int domain = 0;
  len = sizeof(domain);
  EndpointKind kind = EndpointKind::kGeneric;
  if (::getsockopt(fd, SOL_SOCKET, SO_DOMAIN, &domain, &len) == 0) {
    if (domain == AF_UNIX) {
      kind = EndpointKind::kUnixSocket;
    } else if (domain == AF_INET || domain == AF_INET6) {
      kind = EndpointKind::kTcpSocket;
    }
  }

  return Create(fd, fd, kind, true, true);
}

Result<std::unique_ptr<FdEndpoint>> FdEndpoint::FromPipes(int read_fd, int write_fd) {
  if (read_fd == write_fd || !IsFifo(read_fd) || !IsFifo(write_fd)) {
    CloseDescriptor(read_fd);
    if (write_fd != read_fd) {
      CloseDescriptor(write_fd);
    }
    return MakeStatus(RelayErrorCode::kInvalidArgument, "descriptors are not two distinct pipes");
  }
  return Create(read_fd, write_fd, EndpointKind::kPipe, false, true);
}

Result<std::unique_ptr<FdEndpoint>> FdEndpoint::MakeGeneric(int read_fd, int write_fd) {
  if (read_fd < 0 || write_fd < 0) {
    return MakeStatus(RelayErrorCode::kInvalidArgument, "invalid descriptor");
  }
  bool is_socket = read_fd == write_fd && IsSocket(read_fd);
  return Create(read_fd, write_fd, EndpointKind::kGeneric, is_socket, false);
}

bool FdEndpoint::EnterOp(bool write_side) noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  ++in_flight_;
  if (write_side) {
    ++writes_in_flight_;
  }
  return true;
}

void FdEndpoint::LeaveOp(bool write_side) noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  --in_flight_;
  if (write_side) {
    --writes_in_flight_;
  }
  if (closed_ && in_flight_ == 0) {
    ReleaseDescriptorsLocked();
  }
}

void FdEndpoint::ReleaseDescriptorsLocked() noexcept {
  if (descriptors_released_) {
    return;
  }
  descriptors_released_ = true;
  if (write_fd_ != read_fd_ && !write_fd_released_.load(std::memory_order_acquire)) {
    write_fd_released_.store(true, std::memory_order_release);
    CloseDescriptor(write_fd_);
  }
  CloseDescriptor(read_fd_);
}

absl::Status FdEndpoint::PollFor(int fd, short events, const Endpoint* peer) {
  struct pollfd fds[3] = {};
  nfds_t count = 2;
  fds[0].fd = fd;
  fds[0].events = events;
  fds[1].fd = wake_fd_;
  fds[1].events = POLLIN;

  int peer_wake = peer != nullptr ? peer->NativeWakeHandle() : -1;
  if (peer_wake >= 0) {
    fds[2].fd = peer_wake;
    fds[2].events = POLLIN;
    count = 3;
  }

  for (;;) {
    int ready = ::poll(fds, count, -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return ErrnoStatus(RelayErrorCode::kInternal, errno, "poll");
    }
    if (fds[1].revents != 0) {
      return EndpointClosed();
    }
    if (count == 3 && fds[2].revents != 0) {
      return MakeStatus(RelayErrorCode::kShutdownInduced, "peer endpoint closed");
    }
    // POLLHUP / POLLERR surface through the following read or write
    if (fds[0].revents != 0) {
      return absl::OkStatus();
    }
  }
}

Result<size_t> FdEndpoint::Read(std::span<std::byte> buffer) {
  if (buffer.empty()) {
    return size_t{0};
  }
  OpScope op(*this, false);
  if (!op) {
    return EndpointClosed();
  }

  for (;;) {
    ssize_t n = ::read(read_fd_, buffer.data(), buffer.size());
    if (n > 0) {
      return static_cast<size_t>(n);
    }
    if (n == 0) {
      // shutdown() from Close() also reads as end of stream
      if (IsClosed()) {
        return EndpointClosed();
      }
      return size_t{0};
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      // Failures after our own Close() (shutdown) are its consequence
      return IsClosed() ? EndpointClosed() : ErrnoStatus(RelayErrorCode::kSourceReadFailure, errno, "read");
    }
    if (auto status = PollFor(read_fd_, POLLIN, nullptr); !status.ok()) {
      return status;
    }
  }
}

Result<size_t> FdEndpoint::Write(std::span<const std::byte> data) {
  if (data.empty()) {
    return size_t{0};
  }
  OpScope op(*this, true);
  if (!op) {
    return EndpointClosed();
  }
  if (write_fd_released_.load(std::memory_order_acquire)) {
    return MakeStatus(RelayErrorCode::kDestinationWriteFailure, "write side closed");
  }

  for (;;) {
    ssize_t n = is_socket_ ? ::send(write_fd_, data.data(), data.size(), MSG_NOSIGNAL)
                           : ::write(write_fd_, data.data(), data.size());
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      return IsClosed() ? EndpointClosed() : ErrnoStatus(RelayErrorCode::kDestinationWriteFailure, errno, "write");
    }
    if (auto status = PollFor(write_fd_, POLLOUT, nullptr); !status.ok()) {
      return status;
    }
  }
}

absl::Status FdEndpoint::CloseWrite() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return EndpointClosed();
  }
  if (write_closed_) {
    return absl::OkStatus();
  }

  if (is_socket_) {
    if (::shutdown(write_fd_, SHUT_WR) != 0) {
      return ErrnoStatus(RelayErrorCode::kDestinationWriteFailure, errno, "shutdown(SHUT_WR)");
    }
    write_closed_ = true;
    return absl::OkStatus();
  }

  if (writes_in_flight_ > 0) {
    return MakeStatus(RelayErrorCode::kInvalidArgument, "write in progress");
  }
  write_closed_ = true;
  write_fd_released_.store(true, std::memory_order_release);
  CloseDescriptor(write_fd_);
  return absl::OkStatus();
}

void FdEndpoint::Close() noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  closed_flag_.store(true, std::memory_order_release);
  close_count_.fetch_add(1, std::memory_order_acq_rel);

  // The eventfd is never drained, so every later poll wakes immediately
  uint64_t one = 1;
  if (::write(wake_fd_, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one))) {
    spdlog::error("Failed to signal endpoint wake descriptor: errno {}", errno);
  }

  if (is_socket_ && ::shutdown(read_fd_, SHUT_RDWR) != 0 && errno != ENOTCONN) {
    spdlog::debug("shutdown({}) failed: errno {}", read_fd_, errno);
  }

  if (in_flight_ == 0) {
    ReleaseDescriptorsLocked();
  }
}

Result<HandleLease> FdEndpoint::LeaseHandles() {
  if (!expose_handles_) {
    return common::Error<HandleLease>(RelayErrorCode::kFastPathNotApplicable, "endpoint exposes no native handles");
  }
  if (!EnterOp(true)) {
    return EndpointClosed();
  }
  return HandleLease(this);
}

void FdEndpoint::ReturnHandles() noexcept {
  LeaveOp(true);
}

absl::Status FdEndpoint::WaitReadable(const Endpoint* peer) {
  OpScope op(*this, false);
  if (!op) {
    return EndpointClosed();
  }
  return PollFor(read_fd_, POLLIN, peer);
}

absl::Status FdEndpoint::WaitWritable(const Endpoint* peer) {
  OpScope op(*this, true);
  if (!op) {
    return EndpointClosed();
  }
  if (write_fd_released_.load(std::memory_order_acquire)) {
    return MakeStatus(RelayErrorCode::kDestinationWriteFailure, "write side closed");
  }
  return PollFor(write_fd_, POLLOUT, peer);
}

Result<SocketPair> MakeSocketPair() {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
    return ErrnoStatus(RelayErrorCode::kInternal, errno, "socketpair");
  }
  return SocketPair{fds[0], fds[1]};
}

} // namespace splicerelay::io
