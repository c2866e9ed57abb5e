#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <string>

namespace splicerelay::common {

// Error kinds produced by the relay engine
enum class RelayErrorCode {
  kOk = 0,
  kSourceReadFailure = 1,
  kDestinationWriteFailure = 2,
  kFastPathNotApplicable = 3,
  kShutdownInduced = 4,
  kInvalidArgument = 5,
  kInternal = 6,
};

// Payload key under which the RelayErrorCode is attached to a status
inline constexpr char kRelayErrorCodePayload[] = "type.splicerelay/RelayErrorCode";

// Convert relay error code to absl::StatusCode
absl::StatusCode ToAbslStatusCode(RelayErrorCode code) noexcept;

// Create status with custom error code (the code is also attached as payload)
absl::Status MakeStatus(RelayErrorCode code, const std::string& message = "");

// Create status for a failed syscall, carrying the strerror text of err
absl::Status ErrnoStatus(RelayErrorCode code, int err, const std::string& what);

// Recover the relay error code from a status; kInternal when it carries none
[[nodiscard]] RelayErrorCode GetRelayErrorCode(const absl::Status& status) noexcept;

[[nodiscard]] bool IsShutdownInduced(const absl::Status& status) noexcept;

[[nodiscard]] bool IsFastPathNotApplicable(const absl::Status& status) noexcept;

[[nodiscard]] std::string ToString(RelayErrorCode code);

} // namespace splicerelay::common
