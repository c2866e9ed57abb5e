#include "splicerelay/relay/duplex_relay.h"
#include "splicerelay/common/status.h"
#include <spdlog/spdlog.h>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace splicerelay::relay {

namespace {

Direction Opposite(Direction direction) noexcept {
  return direction == Direction::kForward ? Direction::kReverse : Direction::kForward;
}

// Closes both endpoints when the relay scope is left, however it is left
class ScopedClose {
public:
  ScopedClose(io::Endpoint& a, io::Endpoint& b) noexcept : a_(a), b_(b) {}
  ~ScopedClose() {
    a_.Close();
    b_.Close();
  }

  ScopedClose(const ScopedClose&) = delete;
  ScopedClose& operator=(const ScopedClose&) = delete;

private:
  io::Endpoint& a_;
  io::Endpoint& b_;
};

// Shared between the two pump threads of one relay
class RelayState {
public:
  RelayState(io::Endpoint& a, io::Endpoint& b) noexcept : a_(a), b_(b) {}

  // Record a finished direction. The first one triggers the shutdown.
  void Finish(Direction direction, TransferOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = direction == Direction::kForward ? result_.forward : result_.reverse;
    slot = std::move(outcome);

    if (shutdown_) {
      // The blamed direction may be the one finishing second
      result_.shutdown_induced = result_.direction == direction ? Opposite(direction) : direction;
      spdlog::debug("{} direction stopped after {} bytes: {}", ToString(direction), slot.bytes_transferred,
                    slot.ok() ? "eof" : slot.error.ToString());
      return;
    }

    shutdown_ = true;
    if (a_.IsClosed() || b_.IsClosed()) {
      // Closed from outside the relay. Both pumps wake up, and the one that
      // wins the race may only be reporting its peer's close, so blame the
      // direction reading from the closed endpoint.
      result_.direction = a_.IsClosed() ? Direction::kForward : Direction::kReverse;
      result_.first_error = common::MakeStatus(common::RelayErrorCode::kSourceReadFailure, "endpoint closed");
      spdlog::warn("{} direction source endpoint closed", ToString(result_.direction));
    } else {
      result_.first_error = slot.error;
      result_.direction = slot.ok() ? Direction::kNone : direction;
      if (!slot.ok()) {
        spdlog::warn("{} direction failed after {} bytes ({}): {}", ToString(direction), slot.bytes_transferred,
                     ToString(slot.cause), slot.error.ToString());
      }
    }
    a_.Close();
    b_.Close();
  }

  [[nodiscard]] RelayResult TakeResult() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::move(result_);
  }

private:
  io::Endpoint& a_;
  io::Endpoint& b_;
  std::mutex mutex_;
  bool shutdown_ = false;
  RelayResult result_;
};

TransferOutcome RunPump(const DirectionalPump& pump, io::Endpoint& source, io::Endpoint& destination) {
  TransferOutcome outcome;
  try {
    outcome = pump.Pump(source, destination);
  } catch (const std::exception& e) {
    outcome.cause = TerminationCause::kSourceFailure;
    outcome.error = common::MakeStatus(common::RelayErrorCode::kInternal, std::string("pump failed: ") + e.what());
  } catch (...) {
    outcome.cause = TerminationCause::kSourceFailure;
    outcome.error = common::MakeStatus(common::RelayErrorCode::kInternal, "pump failed: unknown exception");
  }
  return outcome;
}

} // namespace

DuplexRelay::DuplexRelay(Negotiator negotiator, PumpOptions options)
  : negotiator_(std::move(negotiator)), options_(options) {}

common::Result<DuplexRelay> DuplexRelay::FromConfig(const common::RelayConfig& config) {
  auto negotiator = Negotiator::FromConfig(config);
  if (!negotiator.ok()) {
    return negotiator.status();
  }
  return DuplexRelay(std::move(*negotiator), PumpOptions::FromConfig(config));
}

RelayResult DuplexRelay::Relay(io::Endpoint& a, io::Endpoint& b) const {
  ScopedClose closer(a, b);
  RelayState state(a, b);
  DirectionalPump pump(negotiator_, options_);

  spdlog::info("Relay started: {} <-> {}", io::ToString(a.Kind()), io::ToString(b.Kind()));

  std::thread forward;
  try {
    forward = std::thread([&] { state.Finish(Direction::kForward, RunPump(pump, a, b)); });
  } catch (const std::system_error& e) {
    RelayResult result;
    result.first_error =
        common::MakeStatus(common::RelayErrorCode::kInternal, std::string("cannot start pump thread: ") + e.what());
    return result;
  }

  // The calling thread carries the reverse direction
  state.Finish(Direction::kReverse, RunPump(pump, b, a));
  forward.join();

  auto result = state.TakeResult();
  spdlog::info("Relay finished: forward {} bytes, reverse {} bytes, first error {} ({})",
               result.forward.bytes_transferred, result.reverse.bytes_transferred,
               result.first_error.ok() ? "none" : result.first_error.ToString(), ToString(result.direction));
  return result;
}

} // namespace splicerelay::relay
