#pragma once

#include "splicerelay/common/config.h"
#include "splicerelay/io/endpoint.h"
#include "splicerelay/relay/negotiator.h"
#include "splicerelay/relay/transfer.h"
#include "splicerelay/relay/zero_copy.h"
#include <cstdint>

namespace splicerelay::relay {

struct PumpOptions {
  size_t buffer_size = common::kDefaultBufferSize;
  SpliceOptions splice;
  uint64_t max_bytes = 0;  // 0 = until EOF

  [[nodiscard]] static PumpOptions FromConfig(const common::RelayConfig& config) noexcept;
};

// Moves one direction of traffic: splice when the negotiator allows it,
// buffered copy otherwise or once splice turns out not to be applicable.
// Never closes either endpoint.
class DirectionalPump {
public:
  explicit DirectionalPump(const Negotiator& negotiator, PumpOptions options = {});

  [[nodiscard]] TransferOutcome Pump(io::Endpoint& source, io::Endpoint& destination) const;

  [[nodiscard]] const PumpOptions& options() const noexcept { return options_; }

private:
  const Negotiator& negotiator_;
  PumpOptions options_;
};

} // namespace splicerelay::relay
