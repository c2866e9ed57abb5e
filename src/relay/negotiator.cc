#include "splicerelay/relay/negotiator.h"
#include "splicerelay/common/status.h"
#include <absl/strings/ascii.h>
#include <spdlog/spdlog.h>
#include <string>

namespace splicerelay::relay {

using io::EndpointKind;

namespace {

size_t Index(EndpointKind kind) noexcept {
  return static_cast<size_t>(kind);
}

} // namespace

Negotiator::Negotiator(PlatformCapabilities capabilities) noexcept : capabilities_(capabilities) {
  for (size_t src = 0; src < io::kEndpointKindCount; ++src) {
    for (size_t dst = 0; dst < io::kEndpointKindCount; ++dst) {
      matrix_[src][dst] = io::IsKernelPipeLike(static_cast<EndpointKind>(src)) &&
                          io::IsKernelPipeLike(static_cast<EndpointKind>(dst));
    }
  }
}

common::Result<Negotiator> Negotiator::FromConfig(const common::RelayConfig& config) {
  Negotiator negotiator(PlatformCapabilities{config.splice_available});
  for (const auto& entry : config.disabled_pairs) {
    auto pair = ParseKindPair(entry);
    if (!pair.ok()) {
      return pair.status();
    }
    negotiator.DisablePair(pair->first, pair->second);
    spdlog::debug("Zero-copy disabled for {} -> {}", io::ToString(pair->first), io::ToString(pair->second));
  }
  return negotiator;
}

bool Negotiator::CanZeroCopy(const io::Endpoint& source, const io::Endpoint& destination) const noexcept {
  if (!capabilities_.splice_available) {
    return false;
  }
  if (!IsPairSupported(source.Kind(), destination.Kind())) {
    return false;
  }
  return source.NativeReadHandle() >= 0 && destination.NativeWriteHandle() >= 0;
}

bool Negotiator::IsPairSupported(EndpointKind source, EndpointKind destination) const noexcept {
  return matrix_[Index(source)][Index(destination)];
}

void Negotiator::DisablePair(EndpointKind source, EndpointKind destination) noexcept {
  matrix_[Index(source)][Index(destination)] = false;
}

void Negotiator::EnablePair(EndpointKind source, EndpointKind destination) noexcept {
  matrix_[Index(source)][Index(destination)] = io::IsKernelPipeLike(source) && io::IsKernelPipeLike(destination);
}

common::Result<std::pair<EndpointKind, EndpointKind>> ParseKindPair(const std::string& pair) {
  auto arrow = pair.find("->");
  if (arrow == std::string::npos) {
    return common::MakeStatus(common::RelayErrorCode::kInvalidArgument, "expected <source>-><destination>: " + pair);
  }

  auto source = io::ParseEndpointKind(std::string(absl::StripAsciiWhitespace(pair.substr(0, arrow))));
  auto destination = io::ParseEndpointKind(std::string(absl::StripAsciiWhitespace(pair.substr(arrow + 2))));
  if (source == EndpointKind::kGeneric || destination == EndpointKind::kGeneric) {
    return common::MakeStatus(common::RelayErrorCode::kInvalidArgument, "unknown endpoint kind in: " + pair);
  }
  return std::make_pair(source, destination);
}

} // namespace splicerelay::relay
