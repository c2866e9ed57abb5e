#include "splicerelay/common/status.h"
#include <absl/strings/cord.h>
#include <cstring>

namespace splicerelay::common {

absl::StatusCode ToAbslStatusCode(RelayErrorCode code) noexcept {
  switch (code) {
  case RelayErrorCode::kOk:
    return absl::StatusCode::kOk;
  case RelayErrorCode::kSourceReadFailure:
    return absl::StatusCode::kUnavailable;
  case RelayErrorCode::kDestinationWriteFailure:
    return absl::StatusCode::kAborted;
  case RelayErrorCode::kFastPathNotApplicable:
    return absl::StatusCode::kUnimplemented;
  case RelayErrorCode::kShutdownInduced:
    return absl::StatusCode::kCancelled;
  case RelayErrorCode::kInvalidArgument:
    return absl::StatusCode::kInvalidArgument;
  case RelayErrorCode::kInternal:
    return absl::StatusCode::kInternal;
  default:
    return absl::StatusCode::kUnknown;
  }
}

absl::Status MakeStatus(RelayErrorCode code, const std::string& message) {
  if (code == RelayErrorCode::kOk) {
    return absl::OkStatus();
  }
  absl::Status status(ToAbslStatusCode(code), message);
  status.SetPayload(kRelayErrorCodePayload, absl::Cord(std::to_string(static_cast<int>(code))));
  return status;
}

absl::Status ErrnoStatus(RelayErrorCode code, int err, const std::string& what) {
  return MakeStatus(code, what + ": " + std::strerror(err));
}

RelayErrorCode GetRelayErrorCode(const absl::Status& status) noexcept {
  if (status.ok()) {
    return RelayErrorCode::kOk;
  }
  auto payload = status.GetPayload(kRelayErrorCodePayload);
  if (!payload.has_value()) {
    return RelayErrorCode::kInternal;
  }
  auto flat = std::string(*payload);
  if (flat.size() != 1 || flat[0] < '1' || flat[0] > '6') {
    return RelayErrorCode::kInternal;
  }
  return static_cast<RelayErrorCode>(flat[0] - '0');
}

bool IsShutdownInduced(const absl::Status& status) noexcept {
  return GetRelayErrorCode(status) == RelayErrorCode::kShutdownInduced;
}

bool IsFastPathNotApplicable(const absl::Status& status) noexcept {
  return GetRelayErrorCode(status) == RelayErrorCode::kFastPathNotApplicable;
}

std::string ToString(RelayErrorCode code) {
  switch (code) {
  case RelayErrorCode::kOk:
    return "ok";
  case RelayErrorCode::kSourceReadFailure:
    return "source-read-failure";
  case RelayErrorCode::kDestinationWriteFailure:
    return "destination-write-failure";
  case RelayErrorCode::kFastPathNotApplicable:
    return "fast-path-not-applicable";
  case RelayErrorCode::kShutdownInduced:
    return "shutdown-induced";
  case RelayErrorCode::kInvalidArgument:
    return "invalid-argument";
  default:
    return "internal";
  }
}

} // namespace splicerelay::common
