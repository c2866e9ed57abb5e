#include "splicerelay/relay/zero_copy.h"
#include "splicerelay/common/status.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <fcntl.h>
#include <span>
#include <unistd.h>

namespace splicerelay::relay {

using common::ErrnoStatus;
using common::MakeStatus;
using common::RelayErrorCode;

namespace {

constexpr unsigned int kSpliceFlags = SPLICE_F_MOVE | SPLICE_F_MORE | SPLICE_F_NONBLOCK;
constexpr size_t kDrainChunk = 16 * 1024;

// Anonymous pipe owned for the duration of one transfer
class IntermediatePipe {
public:
  IntermediatePipe() = default;
  ~IntermediatePipe() {
    for (int fd : fds_) {
      if (fd >= 0 && ::close(fd) != 0) {
        spdlog::warn("close({}) failed on intermediate pipe: errno {}", fd, errno);
      }
    }
  }

  IntermediatePipe(const IntermediatePipe&) = delete;
  IntermediatePipe& operator=(const IntermediatePipe&) = delete;

  [[nodiscard]] absl::Status Open() {
    if (::pipe2(fds_.data(), O_CLOEXEC | O_NONBLOCK) != 0) {
      return ErrnoStatus(RelayErrorCode::kInternal, errno, "pipe2");
    }
    return absl::OkStatus();
  }

  [[nodiscard]] int read_end() const noexcept { return fds_[0]; }
  [[nodiscard]] int write_end() const noexcept { return fds_[1]; }

private:
  std::array<int, 2> fds_{-1, -1};
};

// A wait failed because an endpoint was closed or poll broke; blame the
// side that is actually gone
TerminationCause BlameClosedSide(const io::Endpoint& source, const io::Endpoint& destination,
                                 TerminationCause waiting_side) noexcept {
  if (source.IsClosed()) {
    return TerminationCause::kSourceFailure;
  }
  if (destination.IsClosed()) {
    return TerminationCause::kDestinationFailure;
  }
  return waiting_side;
}

// splice() between a pipe and a socket failed. Pipes only ever fail with
// EPIPE on the write side, so anything else came from the socket.
TerminationCause DirectFailureSide(const io::Endpoint& source, const io::Endpoint& destination, int err) noexcept {
  if (source.IsClosed() || destination.IsClosed()) {
    return BlameClosedSide(source, destination, TerminationCause::kSourceFailure);
  }
  if (err == EPIPE) {
    return TerminationCause::kDestinationFailure;
  }
  return source.Kind() == io::EndpointKind::kPipe && destination.Kind() != io::EndpointKind::kPipe
             ? TerminationCause::kDestinationFailure
             : TerminationCause::kSourceFailure;
}

FastPathResult Fail(FastPathResult result, TerminationCause cause, const absl::Status& status) {
  result.state = FastPathState::kFailed;
  result.outcome.cause = cause;
  result.outcome.error = AttributeFailure(cause, status);
  return result;
}

FastPathResult NotApplicable(FastPathResult result, int err) {
  spdlog::debug("splice not applicable (errno {}) after {} bytes", err, result.outcome.bytes_transferred);
  result.state = FastPathState::kNotApplicable;
  return result;
}

// splice() returned 0. A shutdown() done by Close() looks the same as a
// clean end of stream, so consult the endpoint.
FastPathResult SourceEnded(FastPathResult result, const io::Endpoint& source) {
  if (source.IsClosed()) {
    return Fail(result, TerminationCause::kSourceFailure,
                MakeStatus(RelayErrorCode::kShutdownInduced, "endpoint closed"));
  }
  return result;
}

void Count(FastPathResult& result, uint64_t bytes) noexcept {
  result.outcome.bytes_transferred += bytes;
  result.outcome.zero_copy_bytes += bytes;
}

// Flush bytes left in the intermediate pipe through ordinary read/write
absl::Status DrainPipe(int pipe_read, size_t pending, io::Endpoint& destination, FastPathResult& result) {
  std::array<std::byte, kDrainChunk> chunk;
  while (pending > 0) {
    ssize_t n = ::read(pipe_read, chunk.data(), std::min(pending, chunk.size()));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return ErrnoStatus(RelayErrorCode::kInternal, errno, "read(intermediate pipe)");
    }
    if (n == 0) {
      return MakeStatus(RelayErrorCode::kInternal, "intermediate pipe drained early");
    }

    std::span<const std::byte> rest(chunk.data(), static_cast<size_t>(n));
    while (!rest.empty()) {
      auto written = destination.Write(rest);
      if (!written.ok()) {
        return written.status();
      }
      rest = rest.subspan(*written);
      result.outcome.bytes_transferred += *written;
      result.outcome.buffered_bytes += *written;
    }
    pending -= static_cast<size_t>(n);
  }
  return absl::OkStatus();
}

// One of the two descriptors is a pipe: splice straight across
FastPathResult SpliceDirect(io::Endpoint& source, io::Endpoint& destination, int in_fd, int out_fd, uint64_t limit,
                            const SpliceOptions& options, const SpliceSyscall& syscall) {
  FastPathResult result;
  while (result.outcome.bytes_transferred < limit) {
    size_t want = static_cast<size_t>(std::min<uint64_t>(options.chunk_size, limit - result.outcome.bytes_transferred));
    ssize_t n = syscall.Splice(in_fd, out_fd, want, kSpliceFlags);
    if (n > 0) {
      Count(result, static_cast<uint64_t>(n));
      continue;
    }
    if (n == 0) {
      return SourceEnded(result, source);
    }

    int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (ZeroCopy::IsNotApplicableErrno(err)) {
      return NotApplicable(result, err);
    }
    if (err != EAGAIN) {
      return Fail(result, DirectFailureSide(source, destination, err),
                  ErrnoStatus(RelayErrorCode::kInternal, err, "splice"));
    }

    // Either the source is empty or the destination is full; wait for both
    if (auto status = source.WaitReadable(&destination); !status.ok()) {
      return Fail(result, BlameClosedSide(source, destination, TerminationCause::kSourceFailure), status);
    }
    if (auto status = destination.WaitWritable(&source); !status.ok()) {
      return Fail(result, BlameClosedSide(source, destination, TerminationCause::kDestinationFailure), status);
    }
  }
  return result;
}

// Socket to socket: source -> intermediate pipe -> destination
FastPathResult SpliceViaPipe(io::Endpoint& source, io::Endpoint& destination, int in_fd, int out_fd, uint64_t limit,
                             const SpliceOptions& options, const SpliceSyscall& syscall) {
  FastPathResult result;
  IntermediatePipe pipe;
  if (auto status = pipe.Open(); !status.ok()) {
    spdlog::warn("No intermediate pipe for splice: {}", std::string(status.message()));
    result.state = FastPathState::kNotApplicable;
    return result;
  }

  uint64_t pulled = 0;
  size_t staged = 0;
  while (staged > 0 || pulled < limit) {
    if (staged == 0) {
      size_t want = static_cast<size_t>(std::min<uint64_t>(options.chunk_size, limit - pulled));
      ssize_t n = syscall.Splice(in_fd, pipe.write_end(), want, kSpliceFlags);
      if (n > 0) {
        staged = static_cast<size_t>(n);
        pulled += static_cast<uint64_t>(n);
        continue;
      }
      if (n == 0) {
        return SourceEnded(result, source);
      }

      int err = errno;
      if (err == EINTR) {
        continue;
      }
      if (ZeroCopy::IsNotApplicableErrno(err)) {
        return NotApplicable(result, err);
      }
      if (err != EAGAIN) {
        return Fail(result, BlameClosedSide(source, destination, TerminationCause::kSourceFailure),
                    ErrnoStatus(RelayErrorCode::kInternal, err, "splice(source)"));
      }
      // The pipe is empty, so EAGAIN means the source has nothing yet
      if (auto status = source.WaitReadable(&destination); !status.ok()) {
        return Fail(result, BlameClosedSide(source, destination, TerminationCause::kSourceFailure), status);
      }
      continue;
    }

    ssize_t n = syscall.Splice(pipe.read_end(), out_fd, staged, kSpliceFlags);
    if (n > 0) {
      staged -= static_cast<size_t>(n);
      Count(result, static_cast<uint64_t>(n));
      continue;
    }

    int err = n == 0 ? EPIPE : errno;
    if (err == EINTR) {
      continue;
    }
    if (ZeroCopy::IsNotApplicableErrno(err)) {
      if (auto status = DrainPipe(pipe.read_end(), staged, destination, result); !status.ok()) {
        return Fail(result, TerminationCause::kDestinationFailure, status);
      }
      return NotApplicable(result, err);
    }
    if (err != EAGAIN) {
      return Fail(result, BlameClosedSide(source, destination, TerminationCause::kDestinationFailure),
                  ErrnoStatus(RelayErrorCode::kInternal, err, "splice(destination)"));
    }
    if (auto status = destination.WaitWritable(&source); !status.ok()) {
      return Fail(result, BlameClosedSide(source, destination, TerminationCause::kDestinationFailure), status);
    }
  }
  return result;
}

} // namespace

ssize_t SpliceSyscall::Splice(int fd_in, int fd_out, size_t len, unsigned int flags) const noexcept {
  return ::splice(fd_in, nullptr, fd_out, nullptr, len, flags);
}

const SpliceSyscall& DefaultSpliceSyscall() noexcept {
  static const SpliceSyscall instance;
  return instance;
}

bool ZeroCopy::IsNotApplicableErrno(int err) noexcept {
  return err == EINVAL || err == ENOSYS || err == EOPNOTSUPP || err == EXDEV;
}

FastPathResult ZeroCopy::Splice(io::Endpoint& source, io::Endpoint& destination, uint64_t limit,
                                const SpliceOptions& options) {
  FastPathResult result;
  result.outcome.used_fast_path = true;

  // Pin both descriptor sets so a concurrent Close() cannot recycle them
  auto source_lease = source.LeaseHandles();
  if (!source_lease.ok()) {
    if (common::IsFastPathNotApplicable(source_lease.status())) {
      result.state = FastPathState::kNotApplicable;
      return result;
    }
    return Fail(result, TerminationCause::kSourceFailure, source_lease.status());
  }
  auto destination_lease = destination.LeaseHandles();
  if (!destination_lease.ok()) {
    if (common::IsFastPathNotApplicable(destination_lease.status())) {
      result.state = FastPathState::kNotApplicable;
      return result;
    }
    return Fail(result, TerminationCause::kDestinationFailure, destination_lease.status());
  }

  int in_fd = source.NativeReadHandle();
  int out_fd = destination.NativeWriteHandle();
  if (in_fd < 0 || out_fd < 0) {
    result.state = FastPathState::kNotApplicable;
    return result;
  }

  SpliceOptions effective = options;
  if (effective.chunk_size == 0) {
    effective.chunk_size = common::kDefaultSpliceChunkSize;
  }
  const SpliceSyscall& syscall = options.syscall != nullptr ? *options.syscall : DefaultSpliceSyscall();

  FastPathResult transfer;
  if (source.Kind() == io::EndpointKind::kPipe || destination.Kind() == io::EndpointKind::kPipe) {
    transfer = SpliceDirect(source, destination, in_fd, out_fd, limit, effective, syscall);
  } else {
    transfer = SpliceViaPipe(source, destination, in_fd, out_fd, limit, effective, syscall);
  }
  transfer.outcome.used_fast_path = true;
  return transfer;
}

} // namespace splicerelay::relay
