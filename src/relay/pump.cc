#include "splicerelay/relay/pump.h"
#include "splicerelay/relay/buffered_copy.h"
#include <spdlog/spdlog.h>
#include <memory>
#include <span>

namespace splicerelay::relay {

PumpOptions PumpOptions::FromConfig(const common::RelayConfig& config) noexcept {
  PumpOptions options;
  options.buffer_size = config.buffer_size_bytes;
  options.splice.chunk_size = config.splice_chunk_bytes;
  return options;
}

DirectionalPump::DirectionalPump(const Negotiator& negotiator, PumpOptions options)
  : negotiator_(negotiator), options_(options) {
  if (options_.buffer_size == 0) {
    options_.buffer_size = common::kDefaultBufferSize;
  }
}

TransferOutcome DirectionalPump::Pump(io::Endpoint& source, io::Endpoint& destination) const {
  const uint64_t limit = options_.max_bytes == 0 ? kUnlimited : options_.max_bytes;

  TransferOutcome total;
  if (negotiator_.CanZeroCopy(source, destination)) {
    auto fast = ZeroCopy::Splice(source, destination, limit, options_.splice);
    if (fast.state != FastPathState::kNotApplicable) {
      return fast.outcome;
    }
    // Capability is taken as stable for this pair: no second attempt
    total = fast.outcome;
    total.fell_back = true;
    spdlog::debug("Falling back to buffered copy ({} -> {}) after {} bytes", io::ToString(source.Kind()),
                  io::ToString(destination.Kind()), total.bytes_transferred);
  }

  if (total.bytes_transferred >= limit) {
    return total;
  }

  auto buffer = std::make_unique<std::byte[]>(options_.buffer_size);
  total.buffer_allocations += 1;

  auto rest = BufferedCopy::CopyLoop(source, destination, std::span<std::byte>(buffer.get(), options_.buffer_size),
                                     limit == kUnlimited ? kUnlimited : limit - total.bytes_transferred);
  total.bytes_transferred += rest.bytes_transferred;
  total.buffered_bytes += rest.buffered_bytes;
  total.error = rest.error;
  total.cause = rest.cause;
  return total;
}

} // namespace splicerelay::relay
