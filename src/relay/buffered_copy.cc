#include "splicerelay/relay/buffered_copy.h"
#include "splicerelay/common/status.h"
#include <algorithm>

namespace splicerelay::relay {

namespace {

TransferOutcome Fail(TransferOutcome outcome, TerminationCause cause, const absl::Status& status) {
  outcome.cause = cause;
  outcome.error = AttributeFailure(cause, status);
  return outcome;
}

// A failed wait or read on the source is the source's fault unless it was
// the destination that got closed underneath us
TerminationCause SourceSideCause(const io::Endpoint& source, const io::Endpoint& destination) noexcept {
  return destination.IsClosed() && !source.IsClosed() ? TerminationCause::kDestinationFailure
                                                      : TerminationCause::kSourceFailure;
}

TerminationCause DestinationSideCause(const io::Endpoint& source, const io::Endpoint& destination) noexcept {
  return source.IsClosed() && !destination.IsClosed() ? TerminationCause::kSourceFailure
                                                      : TerminationCause::kDestinationFailure;
}

} // namespace

TransferOutcome BufferedCopy::CopyLoop(io::Endpoint& source, io::Endpoint& destination, std::span<std::byte> buffer,
                                       uint64_t limit) {
  TransferOutcome outcome;
  if (buffer.empty()) {
    return Fail(outcome, TerminationCause::kSourceFailure,
                common::MakeStatus(common::RelayErrorCode::kInvalidArgument, "empty copy buffer"));
  }

  while (outcome.bytes_transferred < limit) {
    if (auto status = source.WaitReadable(&destination); !status.ok()) {
      return Fail(outcome, SourceSideCause(source, destination), status);
    }

    size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), limit - outcome.bytes_transferred));
    auto read = source.Read(buffer.first(want));
    if (!read.ok()) {
      return Fail(outcome, SourceSideCause(source, destination), read.status());
    }
    if (*read == 0) {
      return outcome;
    }

    std::span<const std::byte> pending(buffer.data(), *read);
    while (!pending.empty()) {
      if (auto status = destination.WaitWritable(&source); !status.ok()) {
        return Fail(outcome, DestinationSideCause(source, destination), status);
      }
      auto written = destination.Write(pending);
      if (!written.ok()) {
        return Fail(outcome, DestinationSideCause(source, destination), written.status());
      }
      if (*written == 0) {
        return Fail(outcome, TerminationCause::kDestinationFailure,
                    common::MakeStatus(common::RelayErrorCode::kDestinationWriteFailure, "write made no progress"));
      }
      pending = pending.subspan(*written);
      outcome.bytes_transferred += *written;
      outcome.buffered_bytes += *written;
    }
  }
  return outcome;
}

} // namespace splicerelay::relay
