#pragma once

#include "splicerelay/common/config.h"
#include "splicerelay/io/endpoint.h"
#include "splicerelay/relay/transfer.h"
#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace splicerelay::relay {

// Seam over splice(2) so call-time rejection can be simulated
class SpliceSyscall {
public:
  virtual ~SpliceSyscall() = default;

  // Same contract as splice(2) with null offsets: bytes moved, 0 at EOF,
  // -1 with errno set on failure
  [[nodiscard]] virtual ssize_t Splice(int fd_in, int fd_out, size_t len, unsigned int flags) const noexcept;
};

// Process-wide instance calling the real syscall
[[nodiscard]] const SpliceSyscall& DefaultSpliceSyscall() noexcept;

// Outcome tag of the fast path. kNotApplicable is a control signal asking the
// caller to continue with the buffered path, never an error.
enum class FastPathState {
  kCompleted,
  kNotApplicable,
  kFailed,
};

struct FastPathResult {
  FastPathState state = FastPathState::kCompleted;
  TransferOutcome outcome;
};

struct SpliceOptions {
  size_t chunk_size = common::kDefaultSpliceChunkSize;
  const SpliceSyscall* syscall = nullptr;  // nullptr: DefaultSpliceSyscall()
};

// Zero-copy transfer between kernel-pipe-like endpoints
class ZeroCopy {
public:
  // Move up to limit bytes from source to destination inside the kernel.
  //
  // When neither side is a pipe the bytes go through a private intermediate
  // pipe, which is always empty again when this returns: if the kernel
  // rejects the pairing midway, bytes already staged in the pipe are flushed
  // to the destination with plain read/write before kNotApplicable is
  // reported. outcome.bytes_transferred counts bytes that reached the
  // destination, in every state.
  [[nodiscard]] static FastPathResult Splice(io::Endpoint& source, io::Endpoint& destination,
                                             uint64_t limit = kUnlimited, const SpliceOptions& options = {});

  // errno values meaning the kernel cannot splice this pair
  [[nodiscard]] static bool IsNotApplicableErrno(int err) noexcept;
};

} // namespace splicerelay::relay
