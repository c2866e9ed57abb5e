#pragma once

#include "splicerelay/common/config.h"
#include "splicerelay/common/result.h"
#include "splicerelay/io/endpoint.h"
#include <array>
#include <string>
#include <utility>

namespace splicerelay::relay {

// Platform facts supplied by the embedding application at startup
struct PlatformCapabilities {
  bool splice_available = false;
};

// Decides whether the splice fast path may be attempted for a source and
// destination endpoint. Capability is directional: the matrix is indexed
// [source kind][destination kind] and disabling a -> b leaves b -> a alone.
//
// The matrix is configured before relaying starts; CanZeroCopy is const and
// safe to call from any number of pumps concurrently.
class Negotiator {
public:
  explicit Negotiator(PlatformCapabilities capabilities) noexcept;

  // Build from configuration; fails on a malformed disabled_pairs entry
  [[nodiscard]] static common::Result<Negotiator> FromConfig(const common::RelayConfig& config);

  // O(1), no I/O: only the cached kind tags and handle presence are inspected
  [[nodiscard]] bool CanZeroCopy(const io::Endpoint& source, const io::Endpoint& destination) const noexcept;

  [[nodiscard]] bool IsPairSupported(io::EndpointKind source, io::EndpointKind destination) const noexcept;

  void DisablePair(io::EndpointKind source, io::EndpointKind destination) noexcept;

  // Re-enable a pair; has no effect for kinds that are not kernel-pipe-like
  void EnablePair(io::EndpointKind source, io::EndpointKind destination) noexcept;

  [[nodiscard]] const PlatformCapabilities& capabilities() const noexcept { return capabilities_; }

private:
  PlatformCapabilities capabilities_;
  std::array<std::array<bool, io::kEndpointKindCount>, io::kEndpointKindCount> matrix_{};
};

// Parse "tcp->unix" into its two kinds
[[nodiscard]] common::Result<std::pair<io::EndpointKind, io::EndpointKind>> ParseKindPair(const std::string& pair);

} // namespace splicerelay::relay
