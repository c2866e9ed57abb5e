#pragma once

#include "splicerelay/common/config.h"
#include "splicerelay/common/result.h"
#include "splicerelay/io/endpoint.h"
#include "splicerelay/relay/negotiator.h"
#include "splicerelay/relay/pump.h"
#include "splicerelay/relay/transfer.h"

namespace splicerelay::relay {

// Bidirectional relay between two connected endpoints.
//
// Relay() pumps a -> b and b -> a on two threads. Whichever direction ends
// first, for any reason, decides the result; both endpoints are then closed,
// which stops the other direction. That second outcome is recorded in the
// result but its error is never reported as first_error. Both endpoints are
// closed on every return path.
//
// Closing a or b from another thread stops the relay; the direction reading
// from the closed endpoint is then reported with kSourceReadFailure.
class DuplexRelay {
public:
  explicit DuplexRelay(Negotiator negotiator, PumpOptions options = {});

  [[nodiscard]] static common::Result<DuplexRelay> FromConfig(const common::RelayConfig& config);

  // Blocks until both directions have stopped
  [[nodiscard]] RelayResult Relay(io::Endpoint& a, io::Endpoint& b) const;

  [[nodiscard]] const Negotiator& negotiator() const noexcept { return negotiator_; }

private:
  Negotiator negotiator_;
  PumpOptions options_;
};

} // namespace splicerelay::relay
