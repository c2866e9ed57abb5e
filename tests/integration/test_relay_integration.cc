#include <gtest/gtest.h>
#include "splicerelay/common/logging.h"
#include "splicerelay/relay/duplex_relay.h"
#include "test_support.h"
#include <chrono>
#include <future>

namespace splicerelay::integration {
namespace {

using splicerelay::testing::ArmReset;
using splicerelay::testing::EndpointHarness;
using splicerelay::testing::MakePipeHarness;
using splicerelay::testing::MakeTcpHarness;
using splicerelay::testing::MakeUnixHarness;
using splicerelay::testing::RandomPayload;
using splicerelay::testing::ReadAll;
using splicerelay::testing::ReadExactly;
using splicerelay::testing::WriteAll;

constexpr auto kDeadline = std::chrono::seconds(30);
constexpr auto kPromptly = std::chrono::seconds(5);

struct RelayRun {
  relay::RelayResult result;
  std::string forward_received;
  std::string reverse_received;
};

class RelayIntegrationTest : public ::testing::Test {
protected:
  static void SetUpTestSuite() {
    common::Logging::Initialize("warn");
    splicerelay::testing::IgnoreSigpipe();
  }

  static relay::DuplexRelay MakeRelay(bool splice_available) {
    common::RelayConfig config;
    config.splice_available = splice_available;
    return splicerelay::testing::Unwrap(relay::DuplexRelay::FromConfig(config));
  }

  // reply travels b -> a first; then payload travels a -> b and a's far
  // side half-closes, which ends the relay with a clean EOF
  static RelayRun Run(const relay::DuplexRelay& duplex, EndpointHarness& a, EndpointHarness& b,
                      const std::string& payload, const std::string& reply) {
    auto running = std::async(std::launch::async, [&] { return duplex.Relay(*a.endpoint, *b.endpoint); });

    RelayRun run;
    WriteAll(b.outer_write, reply);
    run.reverse_received = ReadExactly(a.outer_read, reply.size());

    auto reader = std::async(std::launch::async, [&] { return ReadAll(b.outer_read); });
    WriteAll(a.outer_write, payload);
    a.CloseOuterWrite();
    run.forward_received = reader.get();

    EXPECT_EQ(running.wait_for(kDeadline), std::future_status::ready);
    run.result = running.get();
    EXPECT_TRUE(a.endpoint->IsClosed());
    EXPECT_TRUE(b.endpoint->IsClosed());
    return run;
  }
};

TEST_F(RelayIntegrationTest, TcpFastPathRelaysExactBytes) {
  auto duplex = MakeRelay(true);
  auto a = MakeTcpHarness();
  auto b = MakeTcpHarness();
  auto payload = RandomPayload(1024 * 1024);
  auto reply = RandomPayload(64 * 1024, 99);

  auto run = Run(duplex, a, b, payload, reply);

  EXPECT_TRUE(run.result.first_error.ok()) << run.result.first_error;
  EXPECT_EQ(run.result.direction, relay::Direction::kNone);
  EXPECT_EQ(run.forward_received, payload);
  EXPECT_EQ(run.reverse_received, reply);

  EXPECT_EQ(run.result.forward.bytes_transferred, payload.size());
  EXPECT_EQ(run.result.forward.zero_copy_bytes, payload.size());
  EXPECT_EQ(run.result.forward.buffer_allocations, 0u);
  EXPECT_EQ(run.result.reverse.bytes_transferred, reply.size());
  EXPECT_TRUE(run.result.reverse.used_fast_path);
}

TEST_F(RelayIntegrationTest, BufferedPathMatchesFastPath) {
  auto payload = RandomPayload(1024 * 1024, 17);
  auto reply = RandomPayload(64 * 1024, 18);

  auto fast_relay = MakeRelay(true);
  auto fast_a = MakeTcpHarness();
  auto fast_b = MakeTcpHarness();
  auto fast = Run(fast_relay, fast_a, fast_b, payload, reply);

  auto slow_relay = MakeRelay(false);
  auto slow_a = MakeTcpHarness();
  auto slow_b = MakeTcpHarness();
  auto slow = Run(slow_relay, slow_a, slow_b, payload, reply);

  EXPECT_TRUE(slow.result.first_error.ok()) << slow.result.first_error;
  EXPECT_EQ(slow.forward_received, payload);
  EXPECT_EQ(slow.reverse_received, reply);
  EXPECT_EQ(slow.forward_received, fast.forward_received);

  EXPECT_FALSE(slow.result.forward.used_fast_path);
  EXPECT_EQ(slow.result.forward.zero_copy_bytes, 0u);
  EXPECT_EQ(slow.result.forward.buffered_bytes, payload.size());
  EXPECT_GT(slow.result.forward.buffered_bytes, fast.result.forward.buffered_bytes);
  EXPECT_GT(slow.result.forward.buffer_allocations, fast.result.forward.buffer_allocations);
}

TEST_F(RelayIntegrationTest, SourceResetEndsRelayPromptly) {
  for (bool splice_available : {true, false}) {
    SCOPED_TRACE(splice_available ? "splice" : "buffered");
    auto duplex = MakeRelay(splice_available);
    auto a = MakeTcpHarness();
    auto b = MakeTcpHarness();
    auto running = std::async(std::launch::async, [&] { return duplex.Relay(*a.endpoint, *b.endpoint); });

    const std::string greeting = "before the reset";
    WriteAll(a.outer_write, greeting);
    EXPECT_EQ(ReadExactly(b.outer_read, greeting.size()), greeting);

    ArmReset(a.outer_write);
    a.CloseOuter();

    ASSERT_EQ(running.wait_for(kPromptly), std::future_status::ready);
    auto result = running.get();
    EXPECT_EQ(result.direction, relay::Direction::kForward);
    EXPECT_EQ(common::GetRelayErrorCode(result.first_error), common::RelayErrorCode::kSourceReadFailure);
    EXPECT_EQ(result.forward.cause, relay::TerminationCause::kSourceFailure);
    EXPECT_EQ(result.forward.bytes_transferred, greeting.size());
    EXPECT_EQ(result.shutdown_induced, relay::Direction::kReverse);

    EXPECT_TRUE(a.endpoint->IsClosed());
    EXPECT_TRUE(b.endpoint->IsClosed());
    EXPECT_EQ(ReadAll(b.outer_read), "");
  }
}

TEST_F(RelayIntegrationTest, ClosingAnEndpointStopsBothDirections) {
  for (int round = 0; round < 20; ++round) {
    SCOPED_TRACE(round);
    auto duplex = MakeRelay(true);
    auto a = MakeTcpHarness();
    auto b = MakeTcpHarness();
    auto running = std::async(std::launch::async, [&] { return duplex.Relay(*a.endpoint, *b.endpoint); });
    EXPECT_EQ(running.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);

    a.endpoint->Close();

    ASSERT_EQ(running.wait_for(kPromptly), std::future_status::ready);
    auto result = running.get();
    // Both pumps wake; the direction reading from a is the one reported
    EXPECT_EQ(result.direction, relay::Direction::kForward);
    EXPECT_EQ(common::GetRelayErrorCode(result.first_error), common::RelayErrorCode::kSourceReadFailure);
    EXPECT_EQ(result.shutdown_induced, relay::Direction::kReverse);
    EXPECT_TRUE(b.endpoint->IsClosed());
    EXPECT_EQ(a.endpoint->CloseCount(), 1);
    EXPECT_EQ(b.endpoint->CloseCount(), 1);
    EXPECT_EQ(ReadAll(b.outer_read), "");
  }
}

TEST_F(RelayIntegrationTest, PipeAndUnixSocket) {
  auto duplex = MakeRelay(true);
  auto a = MakePipeHarness();
  auto b = MakeUnixHarness();
  auto payload = RandomPayload(512 * 1024, 23);

  auto run = Run(duplex, a, b, payload, "ack");

  EXPECT_TRUE(run.result.first_error.ok()) << run.result.first_error;
  EXPECT_EQ(run.forward_received, payload);
  EXPECT_EQ(run.reverse_received, "ack");
  EXPECT_EQ(run.result.forward.zero_copy_bytes, payload.size());
  EXPECT_EQ(run.result.reverse.zero_copy_bytes, 3u);
}

TEST_F(RelayIntegrationTest, GenericEndpointsUseBufferedCopy) {
  auto duplex = MakeRelay(true);
  auto a = MakeUnixHarness(true);
  auto b = MakeUnixHarness(true);
  auto payload = RandomPayload(256 * 1024, 31);

  auto run = Run(duplex, a, b, payload, "hello");

  EXPECT_TRUE(run.result.first_error.ok()) << run.result.first_error;
  EXPECT_EQ(run.forward_received, payload);
  EXPECT_EQ(run.reverse_received, "hello");
  EXPECT_FALSE(run.result.forward.used_fast_path);
  EXPECT_EQ(run.result.forward.buffered_bytes, payload.size());
  EXPECT_EQ(run.result.forward.buffer_allocations, 1u);
}

}
}
