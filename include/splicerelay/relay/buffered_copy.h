#pragma once

#include "splicerelay/io/endpoint.h"
#include "splicerelay/relay/transfer.h"
#include <cstddef>
#include <cstdint>
#include <span>

namespace splicerelay::relay {

// Fallback transfer through a user-space buffer
class BufferedCopy {
public:
  // Read into buffer, write all of it out, repeat until EOF, failure or limit.
  // Short writes are retried. buffer must not be empty.
  [[nodiscard]] static TransferOutcome CopyLoop(io::Endpoint& source, io::Endpoint& destination,
                                                std::span<std::byte> buffer, uint64_t limit = kUnlimited);
};

} // namespace splicerelay::relay
