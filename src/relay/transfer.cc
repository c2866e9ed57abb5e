#include "splicerelay/relay/transfer.h"
#include "splicerelay/common/status.h"

namespace splicerelay::relay {

absl::Status AttributeFailure(TerminationCause cause, const absl::Status& status) {
  switch (cause) {
  case TerminationCause::kSourceFailure:
    return common::MakeStatus(common::RelayErrorCode::kSourceReadFailure, std::string(status.message()));
  case TerminationCause::kDestinationFailure:
    return common::MakeStatus(common::RelayErrorCode::kDestinationWriteFailure, std::string(status.message()));
  default:
    return status;
  }
}

std::string ToString(TerminationCause cause) {
  switch (cause) {
  case TerminationCause::kEof:
    return "eof";
  case TerminationCause::kSourceFailure:
    return "source-failure";
  case TerminationCause::kDestinationFailure:
    return "destination-failure";
  default:
    return "unknown";
  }
}

std::string ToString(Direction direction) {
  switch (direction) {
  case Direction::kForward:
    return "forward";
  case Direction::kReverse:
    return "reverse";
  default:
    return "none";
  }
}

} // namespace splicerelay::relay
