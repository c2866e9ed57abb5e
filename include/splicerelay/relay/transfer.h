#pragma once

#include <absl/status/status.h>
#include <cstdint>
#include <limits>
#include <string>

namespace splicerelay::relay {

// No byte limit for a transfer
inline constexpr uint64_t kUnlimited = std::numeric_limits<uint64_t>::max();

// Why a single direction stopped
enum class TerminationCause {
  kEof,
  kSourceFailure,
  kDestinationFailure,
};

// Result of moving bytes in one direction
struct TransferOutcome {
  uint64_t bytes_transferred = 0;
  absl::Status error;  // ok == terminated by clean EOF (or limit reached)
  TerminationCause cause = TerminationCause::kEof;

  // Split of bytes_transferred by path
  uint64_t zero_copy_bytes = 0;
  uint64_t buffered_bytes = 0;
  // User-space copy buffers allocated for this direction
  uint32_t buffer_allocations = 0;
  bool used_fast_path = false;
  bool fell_back = false;

  [[nodiscard]] bool ok() const noexcept { return error.ok(); }
};

enum class Direction {
  kNone,
  kForward,  // a -> b
  kReverse,  // b -> a
};

// Result of a duplex relay
struct RelayResult {
  absl::Status first_error;  // ok when the first direction to finish hit EOF
  Direction direction = Direction::kNone;

  TransferOutcome forward;
  TransferOutcome reverse;
  // Which direction finished second and was therefore stopped by the shutdown
  Direction shutdown_induced = Direction::kNone;
};

// Re-code a failure as kSourceReadFailure or kDestinationWriteFailure,
// keeping the underlying message
[[nodiscard]] absl::Status AttributeFailure(TerminationCause cause, const absl::Status& status);

[[nodiscard]] std::string ToString(TerminationCause cause);

[[nodiscard]] std::string ToString(Direction direction);

} // namespace splicerelay::relay
